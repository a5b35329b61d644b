#include <catch2/catch_test_macros.hpp>
#include "ops/ExecutionEngine.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameSerializer.hpp"
#include "server/Logger.hpp"
#include <sstream>

using namespace ops;
using dataframe::DataFrame;
using dataframe::DataFramePtr;

namespace {

DataFramePtr numbers() {
    auto df = std::make_shared<DataFrame>();
    df->addIntColumn("n");
    for (int i = 1; i <= 10; ++i) {
        df->addRow({std::to_string(i)});
    }
    return df;
}

OperationPtr greaterThan(int value) {
    return Operation::create(FilterParams{{{"n", dataframe::FilterOperator::Greater, std::to_string(value)}}});
}

OperationPtr sortBy(const std::string& column) {
    return Operation::create(SortParams{{{column, true}}});
}

MaterializeRequest plan(std::vector<OperationPtr> operations) {
    MaterializeRequest request;
    request.baseFrame = numbers();
    for (auto& op : operations) {
        request.entries.push_back({op, op->state()});
    }
    return request;
}

} // namespace

TEST_CASE("Engine folds operations in order", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(3), greaterThan(6)});

    auto result = engine.materialize(request);

    REQUIRE(result.frame->rowCount() == 4);
    REQUIRE_FALSE(result.failedIndex.has_value());
    REQUIRE(result.outcomes[0].status == OutcomeStatus::Applied);
    REQUIRE(result.outcomes[1].status == OutcomeStatus::Applied);
    // La frame de base n'est pas modifiée
    REQUIRE(request.baseFrame->rowCount() == 10);
}

TEST_CASE("Engine empty plan returns base frame", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({});

    auto result = engine.materialize(request);

    REQUIRE(result.frame == request.baseFrame);
    REQUIRE(result.outcomes.empty());
}

TEST_CASE("Engine halts at the first failure", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(3), sortBy("missing"), greaterThan(6)});
    std::vector<ExecutionEvent> events;
    request.onEvent = [&events](const ExecutionEvent& evt) { events.push_back(evt); };

    auto result = engine.materialize(request);

    REQUIRE(result.failedIndex == 1u);
    REQUIRE(result.firstFailure()->error->kind == dataframe::ErrorKind::ColumnNotFound);
    REQUIRE(result.outcomes[2].status == OutcomeStatus::NotRun);
    // Frame du dernier succès
    REQUIRE(result.frame->rowCount() == 7);

    REQUIRE(events.size() == 5);
    REQUIRE(events[0].status == ExecutionStatus::Started);
    REQUIRE(events[1].status == ExecutionStatus::Completed);
    REQUIRE(events[3].status == ExecutionStatus::Failed);
    REQUIRE(events[4].status == ExecutionStatus::Skipped);
}

TEST_CASE("Engine blocks on an entry already Failed", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto failed = greaterThan(3);
    failed->markFailed({dataframe::ErrorKind::TypeMismatch, "earlier failure"});
    auto request = plan({failed, greaterThan(6)});

    auto result = engine.materialize(request);

    REQUIRE(result.failedIndex == 0u);
    REQUIRE(result.outcomes[0].error->message == "earlier failure");
    REQUIRE(result.outcomes[1].status == OutcomeStatus::NotRun);
    REQUIRE(result.frame == request.baseFrame);
}

TEST_CASE("Engine resumes from a cached prefix", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto first = greaterThan(3);
    auto second = greaterThan(8);
    first->setState(OperationState::Executed);

    auto request = plan({first, second});
    auto cached = std::make_shared<DataFrame>();
    cached->addIntColumn("n");
    cached->addRow({"9"});
    cached->addRow({"50"});
    request.prefix = CachedPrefix{cached, 1};

    auto result = engine.materialize(request);

    REQUIRE(result.outcomes[0].status == OutcomeStatus::Cached);
    REQUIRE(result.outcomes[1].status == OutcomeStatus::Applied);
    // Appliqué sur le préfixe, pas sur la base
    REQUIRE(result.frame->rowCount() == 2);
}

TEST_CASE("Engine full rebuild replays executed entries", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto first = greaterThan(3);
    first->setState(OperationState::Executed);

    auto request = plan({first});
    request.fullRebuild = true;

    auto result = engine.materialize(request);

    REQUIRE(result.outcomes[0].status == OutcomeStatus::Applied);
    REQUIRE(result.frame->rowCount() == 7);
}

TEST_CASE("Engine limit stops before a position", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(3), greaterThan(6)});
    request.limit = 1;

    auto result = engine.materialize(request);

    REQUIRE(result.frame->rowCount() == 7);
    REQUIRE(result.outcomes[1].status == OutcomeStatus::NotRun);
}

TEST_CASE("Engine cancellation", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(3), greaterThan(6)});
    request.cancel = std::make_shared<std::atomic<bool>>(false);
    request.onEvent = [cancel = request.cancel](const ExecutionEvent& evt) {
        if (evt.status == ExecutionStatus::Completed) cancel->store(true);
    };

    auto result = engine.materialize(request);

    REQUIRE(result.cancelled);
    REQUIRE(result.outcomes[0].status == OutcomeStatus::Applied);
    REQUIRE(result.outcomes[1].status == OutcomeStatus::NotRun);
    REQUIRE(result.frame->rowCount() == 7);
}

TEST_CASE("Engine records checkpoints at interval boundaries", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(1), greaterThan(2), greaterThan(3), greaterThan(4), greaterThan(5)});
    request.checkpointInterval = 2;

    auto result = engine.materialize(request);

    REQUIRE(result.checkpoints.size() == 2);
    REQUIRE(result.checkpoints.at(2)->rowCount() == 8);
    REQUIRE(result.checkpoints.at(4)->rowCount() == 6);
}

TEST_CASE("Outcome JSON", "[ExecutionEngine]") {
    OperationOutcome outcome;
    outcome.operationId = "op_1";
    outcome.status = OutcomeStatus::Cached;

    auto j = outcome.toJson();

    REQUIRE(j["status"] == "cached");
    REQUIRE(j["error"].is_null());
}

TEST_CASE("Engine replays the same plan to the same frame", "[ExecutionEngine]") {
    ExecutionEngine engine;
    auto request = plan({greaterThan(2), sortBy("n"), greaterThan(5)});

    auto first = engine.materialize(request);
    auto second = engine.materialize(request);

    REQUIRE(first.frame != second.frame);
    REQUIRE(dataframe::DataFrameSerializer::toJson(*first.frame)
            == dataframe::DataFrameSerializer::toJson(*second.frame));
    REQUIRE(first.frame->rowCount() == 5);
}

TEST_CASE("Engine logs internal failures as errors", "[ExecutionEngine]") {
    using tablescope::server::Logger;
    using tablescope::server::LogLevel;

    auto& logger = Logger::instance();
    auto previousLevel = logger.level();
    std::ostringstream out;
    logger.setLevel(LogLevel::WARN);
    logger.setOutputStream(&out);
    logger.resetCounts();

    ExecutionEngine engine;

    SECTION("missing join right side is EngineInternal") {
        JoinParams join;
        join.rightDatasetId = "ds_gone";
        join.spec.leftKey = "n";
        join.spec.rightKey = "n";
        auto result = engine.materialize(plan({Operation::create(join)}));

        REQUIRE(result.firstFailure()->error->kind == dataframe::ErrorKind::EngineInternal);
        REQUIRE(logger.counts()["error"] == 1);
        REQUIRE(logger.counts()["warn"] == 0);
    }

    SECTION("user errors stay warnings") {
        auto result = engine.materialize(plan({sortBy("missing")}));

        REQUIRE(result.firstFailure()->error->kind == dataframe::ErrorKind::ColumnNotFound);
        REQUIRE(logger.counts()["error"] == 0);
        REQUIRE(logger.counts()["warn"] == 1);
    }

    logger.setOutputStream(nullptr);
    logger.setLevel(previousLevel);
}
