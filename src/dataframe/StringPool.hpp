#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace dataframe {

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * Dictionnaire des valeurs texte d'un dataset
 *
 * Les colonnes texte stockent des StringId. Toutes les frames dérivées
 * d'un même dataset (filtres, tris, jointures, pivots) partagent le pool
 * de la frame de base : l'égalité de deux cellules est une égalité d'IDs.
 *
 * Chaque entrée garde aussi sa forme en minuscules, utilisée par les
 * filtres texte insensibles à la casse (contains, starts_with...).
 *
 * Lu par le thread de contrôle (pages) et alimenté par les workers
 * (jointures) : verrou lecteurs/écrivain. Les entrées vivent dans une
 * deque, les références rendues par getString() restent donc valides.
 */
class StringPool {
public:
    using StringId = uint32_t;

    StringPool() {
        m_index.reserve(1024);
    }

    StringPool(const StringPool&) = delete;
    StringPool& operator=(const StringPool&) = delete;

    /**
     * ID de la valeur, ajoutée au pool si absente
     */
    StringId intern(const std::string& str) {
        if (auto id = find(str)) {
            return *id;
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_index.find(str);
        if (it != m_index.end()) {
            return it->second;
        }
        auto id = static_cast<StringId>(m_entries.size());
        m_entries.push_back(Entry{str, toLowerAscii(str)});
        m_index.emplace(str, id);
        return id;
    }

    /**
     * ID de la valeur sans l'ajouter ; utilisé par les filtres d'égalité
     */
    std::optional<StringId> find(const std::string& str) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_index.find(str);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Valeur d'origine ; chaîne vide pour un ID inconnu
    const std::string& getString(StringId id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return id < m_entries.size() ? m_entries[id].text : empty();
    }

    /// Valeur en minuscules ASCII ; chaîne vide pour un ID inconnu
    const std::string& folded(StringId id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return id < m_entries.size() ? m_entries[id].folded : empty();
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.size();
    }

    void reserve(size_t capacity) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_index.reserve(capacity);
    }

private:
    struct Entry {
        std::string text;
        std::string folded;
    };

    static const std::string& empty() {
        static const std::string value;
        return value;
    }

    mutable std::shared_mutex m_mutex;
    std::deque<Entry> m_entries;
    std::unordered_map<std::string, StringId> m_index;
};

} // namespace dataframe
