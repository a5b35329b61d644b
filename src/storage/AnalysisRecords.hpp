#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace storage {

/**
 * A saved analysis: the non-undone operations of one dataset, in
 * application order, plus how many of them were executed at save time.
 */
struct SavedAnalysis {
    int64_t id = 0;                      // Auto-incremented
    std::string name;                    // Unique display name
    std::string description;             // Optional description
    std::string createdAt;               // ISO 8601 timestamp
    std::string modifiedAt;              // ISO 8601 timestamp
    int64_t operationCount = 0;
    int64_t executedCount = 0;           // Executed prefix length at save time
    std::string datasetPath;             // Source file of the dataset
    std::string mode;                    // "lazy" / "eager"
    nlohmann::json operations = nlohmann::json::array();   // [{"id", "kind", "params"}]
};

/**
 * A reusable operation sequence, not tied to one dataset
 */
struct Workflow {
    int64_t id = 0;
    std::string name;
    std::string description;
    std::string createdAt;
    std::string modifiedAt;
    int64_t operationCount = 0;
    nlohmann::json operations = nlohmann::json::array();
    nlohmann::json requiredSchema;       // {column: category}, null when unchecked
};

/**
 * Result of a save: id of the new row, and the name it was stored under
 * when the requested one was already taken.
 */
struct SaveResult {
    int64_t id = 0;
    std::optional<std::string> versionedName;
};

} // namespace storage
