#pragma once

#include <stdexcept>
#include <string>

namespace dataframe {

/**
 * Catégorie d'erreur du moteur, distinguable par l'appelant
 */
enum class ErrorKind {
    TypeMismatch,
    ColumnNotFound,
    InvalidOperator,
    EngineInternal
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TypeMismatch:    return "TypeMismatch";
        case ErrorKind::ColumnNotFound:  return "ColumnNotFound";
        case ErrorKind::InvalidOperator: return "InvalidOperator";
        case ErrorKind::EngineInternal:  return "EngineInternal";
    }
    return "EngineInternal";
}

/**
 * Erreur levée par les opérations du DataFrame
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace dataframe
