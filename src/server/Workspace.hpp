#pragma once

#include "ops/DatasetSession.hpp"
#include "dataframe/DataFrame.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tablescope {
namespace server {

using json = nlohmann::json;

/**
 * Raised when adding a dataset to a workspace that is already full
 */
class WorkspaceFullError : public std::runtime_error {
public:
    explicit WorkspaceFullError(size_t maxDatasets)
        : std::runtime_error("Workspace is full (" + std::to_string(maxDatasets) + " datasets)") {}
};

/**
 * Outcome of adding a dataset. The warnings fire when two slots, then
 * one slot, remain free (8 and 9 datasets with the default limit of 10).
 */
enum class DatasetAddStatus {
    Success,
    Warning8,
    Warning9
};

std::string datasetAddStatusToString(DatasetAddStatus status);

struct WorkspaceOptions {
    size_t maxDatasets = 10;
    ops::SessionOptions session;
};

struct DatasetAddResult {
    ops::DatasetSessionPtr session;
    DatasetAddStatus status = DatasetAddStatus::Success;
};

/**
 * Set of loaded datasets, one DatasetSession each.
 *
 * Also resolves join right sides: a session asks the workspace for the
 * loaded (base) frame of another dataset by id. Operations applied to
 * that dataset never change what a join reads, so replaying a history
 * always joins against the same rows as the exported script does.
 */
class Workspace {
public:
    explicit Workspace(WorkspaceOptions options = {});

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /**
     * Worker pool and control executor handed to every session,
     * present and future
     */
    void setAsyncContext(boost::asio::thread_pool& workers, boost::asio::any_io_executor control);

    /**
     * Listener attached to every session
     */
    void setListener(ops::SessionCallback listener);

    /**
     * Add a dataset; a name already in use gets a "_1", "_2", ... suffix.
     * The first dataset becomes active. Throws WorkspaceFullError.
     */
    DatasetAddResult addDataset(const std::string& name,
                                dataframe::DataFramePtr frame,
                                const std::string& sourcePath = "");

    /**
     * Read a CSV file and add it under its file name (without extension)
     * unless a name is given
     */
    DatasetAddResult loadCsv(const std::string& path,
                             const std::optional<std::string>& name = std::nullopt);

    /**
     * Remove a dataset. If it was active, the first remaining one becomes active.
     * Returns false if the id is unknown.
     */
    bool removeDataset(const std::string& datasetId);

    /**
     * Returns nullptr if not found
     */
    ops::DatasetSessionPtr get(const std::string& datasetId) const;

    /**
     * Throws std::out_of_range if not found
     */
    ops::DatasetSessionPtr require(const std::string& datasetId) const;

    ops::DatasetSessionPtr active() const;
    void setActive(const std::string& datasetId);

    std::vector<ops::DatasetSessionPtr> datasets() const;
    size_t size() const;
    size_t maxDatasets() const { return m_options.maxDatasets; }
    const WorkspaceOptions& options() const { return m_options; }

    /**
     * Materialized frame of a dataset, or nullptr
     */
    dataframe::DataFramePtr resolveFrame(const std::string& datasetId) const;

    json toJson() const;

private:
    static std::string generateDatasetId();
    std::string uniqueName(const std::string& name) const;

    WorkspaceOptions m_options;
    std::vector<ops::DatasetSessionPtr> m_sessions;
    std::string m_activeId;
    ops::SessionCallback m_listener;
    boost::asio::thread_pool* m_workers = nullptr;
    std::optional<boost::asio::any_io_executor> m_control;
    mutable std::mutex m_mutex;
};

} // namespace server
} // namespace tablescope
