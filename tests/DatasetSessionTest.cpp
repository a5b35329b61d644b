#include <catch2/catch_test_macros.hpp>
#include "ops/DatasetSession.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameSerializer.hpp"
#include <boost/asio.hpp>
#include <algorithm>

using namespace ops;
using dataframe::DataFrame;
using dataframe::DataFramePtr;
using dataframe::FilterOperator;

namespace {

DataFramePtr numbers() {
    auto df = std::make_shared<DataFrame>();
    df->addIntColumn("n");
    df->addStringColumn("label");
    for (int i = 1; i <= 10; ++i) {
        df->addRow({std::to_string(i), i % 2 == 0 ? "even" : "odd"});
    }
    return df;
}

OperationParams greaterThan(int value) {
    return FilterParams{{{"n", FilterOperator::Greater, std::to_string(value)}}};
}

OperationParams sortBy(const std::string& column) {
    return SortParams{{{column, false}}};
}

std::shared_ptr<DatasetSession> makeSession(ExecutionMode mode = ExecutionMode::Lazy,
                                            size_t checkpointInterval = 10) {
    SessionOptions options;
    options.mode = mode;
    options.checkpointInterval = checkpointInterval;
    return std::make_shared<DatasetSession>("ds_test", "numbers", numbers(), options);
}

nlohmann::json frameJson(const DatasetSession& session) {
    return dataframe::DataFrameSerializer::toJson(*session.materializedFrame());
}

// Ids et paramètres des entrées actives, dans l'ordre
nlohmann::json activeJson(const DatasetSession& session) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& op : session.history().activeEntries()) {
        entries.push_back(op->toPersistJson());
    }
    return entries;
}

std::vector<OperationState> states(const DatasetSession& session) {
    std::vector<OperationState> result;
    for (const auto& op : session.history().entries()) {
        result.push_back(op->state());
    }
    return result;
}

} // namespace

// =============================================================================
// Submit
// =============================================================================

TEST_CASE("Lazy submit queues until execute", "[DatasetSession]") {
    auto session = makeSession();

    auto submitted = session->submit(greaterThan(5));

    REQUIRE(submitted.decision == ExecutionDecision::Defer);
    REQUIRE_FALSE(submitted.report.has_value());
    REQUIRE(submitted.operation->state() == OperationState::Queued);
    REQUIRE(session->materializedFrame()->rowCount() == 10);

    auto report = session->executeQueued();

    REQUIRE(report.executedCount == 1);
    REQUIRE(report.queuedCount == 0);
    REQUIRE(submitted.operation->state() == OperationState::Executed);
    REQUIRE(session->materializedFrame()->rowCount() == 5);
    // La frame de base n'est jamais modifiée
    REQUIRE(session->baseFrame()->rowCount() == 10);
}

TEST_CASE("Eager submit runs immediately", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);

    auto submitted = session->submit(greaterThan(7));

    REQUIRE(submitted.decision == ExecutionDecision::RunNow);
    REQUIRE(submitted.report.has_value());
    REQUIRE(submitted.report->executedCount == 1);
    REQUIRE(session->materializedFrame()->rowCount() == 3);
}

TEST_CASE("Submit validates against the current schema", "[DatasetSession]") {
    auto session = makeSession();

    OperationParams bad = FilterParams{{{"n", FilterOperator::Contains, "1"}}};

    REQUIRE_THROWS_AS(session->submit(bad), ValidationError);
    REQUIRE(session->history().empty());
}

TEST_CASE("Execute next runs a single queued entry", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(2));
    session->submit(greaterThan(4));

    auto report = session->executeQueued(ExecuteScope::Next);

    REQUIRE(report.executedCount == 1);
    REQUIRE(states(*session) == std::vector<OperationState>{OperationState::Executed, OperationState::Queued});
    REQUIRE(session->materializedFrame()->rowCount() == 8);
    REQUIRE(executeScopeFromString("all") == ExecuteScope::All);
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Execution halts at the first failure until it is edited", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(2));
    auto broken = session->submit(sortBy("missing")).operation;
    session->submit(greaterThan(8));

    auto report = session->executeQueued();

    REQUIRE(report.firstFailure.has_value());
    REQUIRE(report.firstFailure->operationId == broken->id());
    REQUIRE(states(*session) == std::vector<OperationState>{
        OperationState::Executed, OperationState::Failed, OperationState::Queued});
    REQUIRE(session->materializedFrame()->rowCount() == 8);

    SECTION("retry without change stays blocked") {
        auto retry = session->executeQueued();
        REQUIRE(retry.firstFailure.has_value());
        REQUIRE(retry.executedCount == 1);
    }

    SECTION("editing the failed entry unblocks it") {
        session->editOperation(broken->id(), sortBy("n"));
        auto rerun = session->executeQueued();

        REQUIRE_FALSE(rerun.firstFailure.has_value());
        REQUIRE(rerun.executedCount == 3);
        REQUIRE(session->materializedFrame()->rowCount() == 2);
        REQUIRE(session->history().find(broken->id())->displayLabel() == "Sort: n");
    }

    SECTION("removing the failed entry unblocks it") {
        session->removeOperation(broken->id());
        auto rerun = session->executeQueued();

        REQUIRE(rerun.executedCount == 2);
        REQUIRE(session->materializedFrame()->rowCount() == 2);
    }
}

TEST_CASE("Eager type mismatch keeps the previous frame", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    auto first = session->submit(greaterThan(3));
    auto afterFirst = frameJson(*session);

    auto second = session->submit(FilterParams{{{"n", FilterOperator::Less, "abc"}}});

    REQUIRE(first.operation->state() == OperationState::Executed);
    REQUIRE(second.operation->state() == OperationState::Failed);
    REQUIRE(second.operation->error()->kind == dataframe::ErrorKind::TypeMismatch);
    REQUIRE(second.report->firstFailure->operationId == second.operation->id());
    REQUIRE(frameJson(*session) == afterFirst);
    REQUIRE(session->materializedFrame()->rowCount() == 7);
}

// =============================================================================
// Undo / redo
// =============================================================================

TEST_CASE("Redo restores what undo removed", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    session->submit(greaterThan(2));
    session->submit(sortBy("label"));
    session->submit(greaterThan(6));
    auto entries = activeJson(*session);
    auto frame = frameJson(*session);

    REQUIRE(session->undo().ok());
    REQUIRE(session->undo().ok());
    REQUIRE(activeJson(*session).size() == 1);

    REQUIRE(session->redo().ok());
    REQUIRE(session->redo().ok());

    REQUIRE(activeJson(*session) == entries);
    REQUIRE(frameJson(*session) == frame);
}

TEST_CASE("Undo of an executed entry rebuilds the frame", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    session->submit(greaterThan(2));
    session->submit(greaterThan(6));
    REQUIRE(session->materializedFrame()->rowCount() == 4);

    auto undone = session->undo();

    REQUIRE(undone.ok());
    REQUIRE(session->materializedFrame()->rowCount() == 8);
    REQUIRE(session->history().executedCount() == 1);

    SECTION("redo in eager mode runs again") {
        auto redone = session->redo();
        REQUIRE(redone.ok());
        REQUIRE(redone.operation->state() == OperationState::Executed);
        REQUIRE(session->materializedFrame()->rowCount() == 4);
    }

    SECTION("redo in lazy mode only queues") {
        session->setMode(ExecutionMode::Lazy);
        auto redone = session->redo();
        REQUIRE(redone.operation->state() == OperationState::Queued);
        REQUIRE(session->materializedFrame()->rowCount() == 8);
    }
}

TEST_CASE("Undo of a queued entry leaves the frame", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(2));
    session->executeQueued();
    session->submit(greaterThan(6));

    session->undo();

    REQUIRE(session->materializedFrame()->rowCount() == 8);
    REQUIRE(session->history().size() == 1);
}

TEST_CASE("Undo and redo on empty history", "[DatasetSession]") {
    auto session = makeSession();

    REQUIRE(session->undo().error == HistoryError::NothingToUndo);
    REQUIRE(session->redo().error == HistoryError::NothingToRedo);
}

TEST_CASE("Submit after undo discards redo", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(2));
    session->undo();

    session->submit(greaterThan(3));

    REQUIRE_FALSE(session->history().canRedo());
}

// =============================================================================
// Edit / remove
// =============================================================================

TEST_CASE("Editing an executed entry replays the executed prefix", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Lazy);
    auto first = session->submit(greaterThan(2)).operation;
    session->submit(greaterThan(4));
    session->executeQueued();
    REQUIRE(session->materializedFrame()->rowCount() == 6);

    session->editOperation(first->id(), greaterThan(5));

    REQUIRE(session->materializedFrame()->rowCount() == 5);
    REQUIRE(session->history().executedCount() == 2);
    REQUIRE(session->history().entries()[0]->id() == first->id());
}

TEST_CASE("Removing an executed entry replays without it", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    auto first = session->submit(greaterThan(8)).operation;
    session->submit(sortBy("label"));

    session->removeOperation(first->id());

    REQUIRE(session->materializedFrame()->rowCount() == 10);
    REQUIRE(session->history().size() == 1);
    REQUIRE(session->history().executedCount() == 1);
}

TEST_CASE("Edit and remove unknown ids", "[DatasetSession]") {
    auto session = makeSession();

    REQUIRE_THROWS_AS(session->editOperation("op_missing", greaterThan(1)), std::out_of_range);
    REQUIRE_THROWS_AS(session->removeOperation("op_missing"), std::out_of_range);
}

TEST_CASE("Clear queued keeps executed entries", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(2));
    session->executeQueued();
    session->submit(greaterThan(4));
    session->submit(greaterThan(6));

    REQUIRE(session->clearQueued() == 2);
    REQUIRE(session->history().size() == 1);
    REQUIRE(session->materializedFrame()->rowCount() == 8);
}

// =============================================================================
// Restore, checkpoints, joins
// =============================================================================

TEST_CASE("Apply restored operations with an executed count", "[DatasetSession]") {
    auto session = makeSession();

    auto report = session->applyOperations({greaterThan(2), greaterThan(4), greaterThan(6)}, 2);

    REQUIRE(report.executedCount == 2);
    REQUIRE(report.queuedCount == 1);
    REQUIRE(session->materializedFrame()->rowCount() == 6);
}

TEST_CASE("Apply restored operations is all or nothing", "[DatasetSession]") {
    auto session = makeSession();

    OperationParams invalid = SortParams{};

    REQUIRE_THROWS_AS(session->applyOperations({greaterThan(2), invalid}), ValidationError);
    REQUIRE(session->history().empty());
}

TEST_CASE("Checkpoints limit replay on undo", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager, 2);
    for (int i = 1; i <= 5; ++i) {
        session->submit(greaterThan(i));
    }
    REQUIRE(session->checkpointCount() == 2);

    session->undo();
    REQUIRE(session->checkpointCount() == 2);
    REQUIRE(session->materializedFrame()->rowCount() == 6);

    session->undo();
    REQUIRE(session->checkpointCount() == 1);
    REQUIRE(session->materializedFrame()->rowCount() == 7);
}

TEST_CASE("Join resolves the right frame through the resolver", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    auto right = std::make_shared<DataFrame>();
    right->addStringColumn("label");
    right->addStringColumn("parity");
    right->addRow({"even", "pair"});

    session->setFrameResolver([right](const std::string& id) {
        return id == "parity" ? right : nullptr;
    });

    JoinParams join;
    join.rightDatasetId = "parity";
    join.spec.leftKey = "label";
    join.spec.rightKey = "label";

    auto submitted = session->submit(join);

    REQUIRE_FALSE(submitted.report->firstFailure.has_value());
    REQUIRE(session->materializedFrame()->rowCount() == 5);
    REQUIRE(session->schema().contains("parity"));
}

// =============================================================================
// Notifications and JSON
// =============================================================================

TEST_CASE("Session notifies its listener", "[DatasetSession]") {
    auto session = makeSession(ExecutionMode::Eager);
    std::vector<SessionEvent> events;
    session->setListener([&events](const SessionEvent& evt) { events.push_back(evt); });

    session->submit(greaterThan(3));

    REQUIRE(events.size() == 3);
    REQUIRE(events[0].type == SessionEventType::OperationChanged);
    REQUIRE(events[0].detail == "queued");
    REQUIRE(events[0].label == "Filter: n > 3");
    REQUIRE(events[1].detail == "executed");
    REQUIRE(events[1].label == "Filter: n > 3");
    REQUIRE_FALSE(events[1].error.has_value());
    REQUIRE(events[2].type == SessionEventType::FrameChanged);
    REQUIRE(events[2].frame == session->materializedFrame());
    REQUIRE(events[2].frame->rowCount() == 7);
    REQUIRE(events[2].schema == session->schema());
    REQUIRE(events[2].toJson()["rows"] == 7);

    SECTION("failures carry their error") {
        session->submit(sortBy("missing"));
        auto it = std::find_if(events.begin(), events.end(),
                               [](const SessionEvent& evt) { return evt.detail == "failed"; });
        REQUIRE(it != events.end());
        const auto& failed = *it;
        REQUIRE(failed.type == SessionEventType::OperationChanged);
        REQUIRE(failed.detail == "failed");
        REQUIRE(failed.label == "Sort: missing");
        REQUIRE(failed.error->kind == dataframe::ErrorKind::ColumnNotFound);
        REQUIRE(failed.toJson()["error"]["kind"] == "ColumnNotFound");
    }

    REQUIRE(session->setMode(ExecutionMode::Lazy));
    REQUIRE(events.back().type == SessionEventType::ModeChanged);
    REQUIRE_FALSE(session->setMode(ExecutionMode::Lazy));
}

TEST_CASE("Session JSON and paging", "[DatasetSession]") {
    auto session = makeSession();
    session->submit(greaterThan(3));

    auto j = session->toJson();

    REQUIRE(j["id"] == "ds_test");
    REQUIRE(j["mode"] == "lazy");
    REQUIRE(j["queued_count"] == 1);
    REQUIRE(j["operations"].size() == 1);
    REQUIRE(j["schema"][0]["type"] == "numeric");

    REQUIRE(session->page(8, 5)->rowCount() == 2);
}

// =============================================================================
// Async
// =============================================================================

TEST_CASE("Async execution commits on the control executor", "[DatasetSession]") {
    boost::asio::io_context ioc;
    boost::asio::thread_pool workers(1);
    auto guard = boost::asio::make_work_guard(ioc);

    auto session = makeSession();
    session->setAsyncContext(workers, ioc.get_executor());
    session->submit(greaterThan(4));
    session->submit(greaterThan(6));

    std::optional<ExecutionReport> report;
    session->executeQueuedAsync(ExecuteScope::All, [&](const ExecutionReport& done) {
        report = done;
        guard.reset();
    });

    REQUIRE(session->isBusy());
    REQUIRE_THROWS_AS(session->submit(greaterThan(1)), SessionBusyError);

    ioc.run();
    workers.join();

    REQUIRE(report.has_value());
    REQUIRE(report->executedCount == 2);
    REQUIRE_FALSE(session->isBusy());
    REQUIRE(session->materializedFrame()->rowCount() == 4);
}

TEST_CASE("Async execution requires a worker pool", "[DatasetSession]") {
    auto session = makeSession();

    REQUIRE_THROWS_AS(session->executeQueuedAsync(ExecuteScope::All, nullptr), std::logic_error);
}
