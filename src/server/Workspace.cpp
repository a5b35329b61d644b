#include "server/Workspace.hpp"
#include "server/Logger.hpp"
#include "dataframe/DataFrameIO.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace tablescope {
namespace server {

std::string datasetAddStatusToString(DatasetAddStatus status) {
    switch (status) {
        case DatasetAddStatus::Success:  return "success";
        case DatasetAddStatus::Warning8: return "warning_8";
        case DatasetAddStatus::Warning9: return "warning_9";
    }
    return "success";
}

Workspace::Workspace(WorkspaceOptions options)
    : m_options(options)
{
    if (m_options.maxDatasets == 0) {
        throw std::invalid_argument("Workspace must accept at least one dataset");
    }
}

std::string Workspace::generateDatasetId() {
    // Generate a random dataset ID: ds_<16 hex chars>
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t value = dis(gen);
    std::stringstream ss;
    ss << "ds_" << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

void Workspace::setAsyncContext(boost::asio::thread_pool& workers, boost::asio::any_io_executor control) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workers = &workers;
    m_control = control;
    for (auto& session : m_sessions) {
        session->setAsyncContext(workers, control);
    }
}

void Workspace::setListener(ops::SessionCallback listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
    for (auto& session : m_sessions) {
        session->setListener(m_listener);
    }
}

std::string Workspace::uniqueName(const std::string& name) const {
    auto taken = [this](const std::string& candidate) {
        return std::any_of(m_sessions.begin(), m_sessions.end(), [&](const ops::DatasetSessionPtr& s) {
            return s->name() == candidate;
        });
    };
    if (!taken(name)) return name;

    int counter = 1;
    while (taken(name + "_" + std::to_string(counter))) {
        ++counter;
    }
    return name + "_" + std::to_string(counter);
}

DatasetAddResult Workspace::addDataset(const std::string& name,
                                       dataframe::DataFramePtr frame,
                                       const std::string& sourcePath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_sessions.size() >= m_options.maxDatasets) {
        LOG_WARN("Rejecting dataset '" + name + "': workspace full");
        throw WorkspaceFullError(m_options.maxDatasets);
    }

    std::string id;
    do {
        id = generateDatasetId();
    } while (std::any_of(m_sessions.begin(), m_sessions.end(),
                         [&](const ops::DatasetSessionPtr& s) { return s->id() == id; }));

    auto session = std::make_shared<ops::DatasetSession>(id, uniqueName(name), std::move(frame),
                                                         m_options.session);
    session->setSourcePath(sourcePath);
    session->setFrameResolver([this](const std::string& datasetId) { return resolveFrame(datasetId); });
    if (m_listener) {
        session->setListener(m_listener);
    }
    if (m_workers && m_control) {
        session->setAsyncContext(*m_workers, *m_control);
    }

    m_sessions.push_back(session);
    if (m_activeId.empty()) {
        m_activeId = id;
    }

    LOG_INFO("Added dataset " + id + " '" + session->name() + "' ("
             + std::to_string(session->baseFrame()->rowCount()) + " rows)");

    DatasetAddResult result;
    result.session = session;
    const size_t count = m_sessions.size();
    if (m_options.maxDatasets >= 2 && count == m_options.maxDatasets - 2) {
        result.status = DatasetAddStatus::Warning8;
    } else if (count == m_options.maxDatasets - 1) {
        result.status = DatasetAddStatus::Warning9;
    }
    return result;
}

DatasetAddResult Workspace::loadCsv(const std::string& path, const std::optional<std::string>& name) {
    auto frame = dataframe::DataFrameIO::readCSV(path);
    std::string datasetName = name.value_or(std::filesystem::path(path).stem().string());
    return addDataset(datasetName, frame, path);
}

bool Workspace::removeDataset(const std::string& datasetId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
                           [&](const ops::DatasetSessionPtr& s) { return s->id() == datasetId; });
    if (it == m_sessions.end()) {
        return false;
    }

    (*it)->cancel();
    m_sessions.erase(it);
    LOG_INFO("Removed dataset " + datasetId);

    if (m_activeId == datasetId) {
        m_activeId = m_sessions.empty() ? "" : m_sessions.front()->id();
    }
    return true;
}

ops::DatasetSessionPtr Workspace::get(const std::string& datasetId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& session : m_sessions) {
        if (session->id() == datasetId) return session;
    }
    return nullptr;
}

ops::DatasetSessionPtr Workspace::require(const std::string& datasetId) const {
    auto session = get(datasetId);
    if (!session) {
        throw std::out_of_range("Dataset not found: " + datasetId);
    }
    return session;
}

ops::DatasetSessionPtr Workspace::active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& session : m_sessions) {
        if (session->id() == m_activeId) return session;
    }
    return nullptr;
}

void Workspace::setActive(const std::string& datasetId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool found = std::any_of(m_sessions.begin(), m_sessions.end(),
                             [&](const ops::DatasetSessionPtr& s) { return s->id() == datasetId; });
    if (!found) {
        throw std::out_of_range("Dataset not found: " + datasetId);
    }
    m_activeId = datasetId;
}

std::vector<ops::DatasetSessionPtr> Workspace::datasets() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions;
}

size_t Workspace::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

dataframe::DataFramePtr Workspace::resolveFrame(const std::string& datasetId) const {
    auto session = get(datasetId);
    return session ? session->baseFrame() : nullptr;
}

json Workspace::toJson() const {
    auto sessions = datasets();
    std::string activeId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        activeId = m_activeId;
    }

    json list = json::array();
    for (const auto& session : sessions) {
        auto snapshot = session->snapshot();
        list.push_back({
            {"id", session->id()},
            {"name", session->name()},
            {"source_path", session->sourcePath()},
            {"rows", snapshot.frame->rowCount()},
            {"columns", snapshot.frame->columnCount()},
            {"mode", ops::executionModeToString(session->mode())},
            {"busy", session->isBusy()},
            {"active", session->id() == activeId}
        });
    }

    return json{
        {"datasets", list},
        {"active_id", activeId.empty() ? json(nullptr) : json(activeId)},
        {"count", sessions.size()},
        {"max_datasets", m_options.maxDatasets}
    };
}

} // namespace server
} // namespace tablescope
