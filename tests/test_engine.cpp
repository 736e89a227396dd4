// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/engine.h"
#include "core/serialization.h"
#include "sample_models.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>

using namespace funcmodel;
using namespace funcmodel::testing;

namespace {

constexpr const char* kNoConfig = "/nonexistent/funcmodel_config.json";

std::unique_ptr<FunctionModelEngine> load_engine(const std::string& config_path = kNoConfig) {
    auto engine = FunctionModelEngine::from_yaml(kOrderFulfilmentYaml, config_path, make_services());
    REQUIRE(engine.is_success());
    return std::move(engine).value();
}

ExecutionPlan step(FunctionModelEngine& engine, const ExecutionPlan& plan, const std::string& key,
                   ExecutionOutcome outcome) {
    auto next = engine.advance(plan, engine.node_id(key).value(), outcome);
    REQUIRE(next.is_success());
    return std::move(next).value();
}

ActionStatus status_of(const FunctionModelEngine& engine, const std::string& key) {
    return engine.model().find_action(engine.node_id(key).value())->status;
}

} // namespace

TEST_CASE("Live run writes action status back to the model", "[engine]") {
    auto engine = load_engine();
    REQUIRE(status_of(*engine, "validate") == ActionStatus::DRAFT);

    auto planned = engine->plan({{"total", 50}});
    REQUIRE(planned.is_success());
    ExecutionPlan plan = planned.value();
    REQUIRE_FALSE(plan.dry_run);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::ACTIVE);
    REQUIRE(status_of(*engine, "dispatch") == ActionStatus::ACTIVE);

    plan = step(*engine, plan, "validate", ExecutionOutcome::STARTED);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::EXECUTING);

    plan = step(*engine, plan, "validate", ExecutionOutcome::FAILED);
    REQUIRE(plan.status_of(engine->node_id("validate").value()) == RunStatus::RETRYING);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::RETRYING);

    plan = step(*engine, plan, "validate", ExecutionOutcome::COMPLETED);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::COMPLETED);
    plan = step(*engine, plan, "reserve", ExecutionOutcome::COMPLETED);

    // the guard skipped the review, dispatch is next in line
    REQUIRE(plan.status_of(engine->node_id("review").value()) == RunStatus::SKIPPED);
    REQUIRE(status_of(*engine, "review") == ActionStatus::ACTIVE);
    REQUIRE(engine->executor().next_ready(plan) == std::vector<NodeId>{engine->node_id("dispatch").value()});

    plan = step(*engine, plan, "dispatch", ExecutionOutcome::COMPLETED);
    auto summary = engine->summarize(plan);
    REQUIRE(summary.finished);
    REQUIRE(summary.completed == 3);
    REQUIRE(summary.skipped == 1);
    REQUIRE_FALSE(summary.partial_failure);
    REQUIRE(status_of(*engine, "dispatch") == ActionStatus::COMPLETED);

    SECTION("finished actions cannot be run again") {
        REQUIRE(engine->plan({{"total", 50}}).error_kind() == ErrorKind::CONFLICT);
    }
    SECTION("traces cover the run") {
        auto traces = engine->get_last_traces();
        REQUIRE_FALSE(traces.empty());
        REQUIRE(traces.front().mode == "live");
        nlohmann::json j = traces.front();
        REQUIRE(j.contains("traceId"));
    }
}

TEST_CASE("Stopping a live run fails what was in flight", "[engine]") {
    auto engine = load_engine();
    auto plan = engine->plan({{"total", 50}}).value();
    plan = step(*engine, plan, "validate", ExecutionOutcome::STARTED);

    auto stopped = engine->stop(plan);
    REQUIRE(stopped.is_success());
    REQUIRE(stopped.value().cancelled);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::FAILED);
    REQUIRE(status_of(*engine, "reserve") == ActionStatus::ACTIVE);
    REQUIRE(engine->advance(stopped.value(), engine->node_id("reserve").value(), ExecutionOutcome::COMPLETED)
                .error_kind() == ErrorKind::CONFLICT);
}

TEST_CASE("Dry runs leave the model untouched", "[engine]") {
    auto engine = load_engine();
    auto plan = engine->plan({{"total", 5000}}, true);
    REQUIRE(plan.is_success());
    REQUIRE(plan.value().dry_run);

    auto next = step(*engine, plan.value(), "validate", ExecutionOutcome::COMPLETED);
    REQUIRE(next.status_of(engine->node_id("validate").value()) == RunStatus::COMPLETED);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::DRAFT);

    auto simulated = engine->simulate({{"total", 5000}});
    REQUIRE(simulated.is_success());
    REQUIRE(simulated.value().completed == 4);
    // parallel stage takes its longest action, sequential stages add up
    REQUIRE(simulated.value().estimated_duration_sec == 180.0);
}

TEST_CASE("Inactive actions are skipped in live runs", "[engine]") {
    auto engine = load_engine();
    auto reserve = engine->node_id("reserve").value();
    REQUIRE(engine->model().update_action_status(reserve, ActionStatus::ACTIVE).is_success());
    REQUIRE(engine->model().update_action_status(reserve, ActionStatus::INACTIVE).is_success());

    auto plan = engine->plan({{"total", 50}});
    REQUIRE(plan.is_success());
    REQUIRE(plan.value().status_of(reserve) == RunStatus::SKIPPED);
    REQUIRE(status_of(*engine, "reserve") == ActionStatus::INACTIVE);
}

TEST_CASE("Live runs need a published model", "[engine]") {
    auto services = make_services();
    auto model = make_model(services);
    auto stage = add_stage(model, "process");
    auto action = add_tether(model, stage.header.id, "only");
    FunctionModelEngine engine(std::move(model));

    REQUIRE(engine.plan().error_kind() == ErrorKind::INVALID_STATE);
    REQUIRE(engine.model().find_action(action.header.id)->status == ActionStatus::DRAFT);
    REQUIRE(engine.plan(Context::object(), true).is_success());
    REQUIRE(engine.keys().empty());
    REQUIRE(engine.node_id("only").error_kind() == ErrorKind::NOT_FOUND);
}

TEST_CASE("A rejected live plan leaves action status alone", "[engine]") {
    auto services = make_services();
    auto model = make_model(services);
    auto stage = add_stage(model, "process");
    auto first = add_tether(model, stage.header.id, "first");
    ActionSpec unguarded{.parent_node_id = stage.header.id, .name = "unguarded",
                         .execution_mode = ExecutionMode::CONDITIONAL};
    auto conditional = model.add_action_node(unguarded).value();
    REQUIRE(model.publish().is_success());
    FunctionModelEngine engine(std::move(model));

    REQUIRE(engine.plan().error_kind() == ErrorKind::VALIDATION);
    REQUIRE(engine.model().find_action(first.header.id)->status == ActionStatus::DRAFT);
    REQUIRE(engine.model().find_action(conditional.header.id)->status == ActionStatus::DRAFT);
}

TEST_CASE("Context hierarchy mirrors the model", "[engine][context]") {
    auto engine = load_engine();
    REQUIRE(engine->sync_context_hierarchy().is_success());

    auto validate = engine->node_id("validate").value();
    auto process = engine->node_id("process").value();
    REQUIRE(engine->contexts().is_registered(validate));
    REQUIRE(engine->contexts().registration(validate)->parent_node_id == std::optional<NodeId>(process));

    auto stage_ctx = engine->contexts().build_context(process, {{"warehouse", "north"}}, ContextScope::EXECUTION);
    REQUIRE(stage_ctx.is_success());
    auto action_ctx = engine->contexts().build_context(validate, Context::object(), ContextScope::EXECUTION,
                                                       stage_ctx.value().context_id);
    REQUIRE(action_ctx.value().effective_data()["warehouse"] == "north");
}

TEST_CASE("Engine reads its configuration file", "[engine][config]") {
    auto path = std::filesystem::temp_directory_path() / "funcmodel_engine_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"dry_run": true, "max_context_depth": 1, "trace_enabled": false})";
    }
    auto engine = load_engine(path.string());
    std::filesystem::remove(path);

    REQUIRE(engine->config().dry_run);
    auto plan = engine->plan({{"total", 50}});
    REQUIRE(plan.is_success());
    REQUIRE(plan.value().dry_run);
    REQUIRE(status_of(*engine, "validate") == ActionStatus::DRAFT);
    REQUIRE(engine->get_last_traces().empty());

    REQUIRE(engine->sync_context_hierarchy().is_success());
    auto view = engine->contexts().get_hierarchical_context(engine->node_id("validate").value());
    REQUIRE(view.value().max_depth_reached);
}

TEST_CASE("Engine construction failures", "[engine]") {
    auto missing = FunctionModelEngine::from_file("/nonexistent/model.yaml", kNoConfig, make_services());
    REQUIRE(missing.error_kind() == ErrorKind::NOT_FOUND);

    auto broken = FunctionModelEngine::from_yaml("model: {name: ''}", kNoConfig, make_services());
    REQUIRE(broken.error_kind() == ErrorKind::VALIDATION);
}
