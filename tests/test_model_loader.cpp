// tests/test_model_loader.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/parser/model_loader.h"
#include "sample_models.h"
#include "test_support.h"

using namespace funcmodel;
using namespace funcmodel::testing;

TEST_CASE("YAML definition builds a published model", "[loader]") {
    ModelLoader loader(make_services());
    auto loaded = loader.parse_from_string(kOrderFulfilmentYaml);
    REQUIRE(loaded.is_success());

    const LoadedModel& result = loaded.value();
    const FunctionModel& model = result.model;
    REQUIRE(result.keys.size() == 8);
    REQUIRE(model.name().value() == "Order Fulfilment");
    REQUIRE(model.version().to_string() == "1.2.0");
    REQUIRE(model.status() == ModelStatus::PUBLISHED);
    REQUIRE(model.permissions().owner == "ana");
    REQUIRE(model.permissions().editors == std::vector<std::string>{"ben"});
    REQUIRE(model.metadata()["team"] == "logistics");
    REQUIRE(model.links().size() == 4);

    const auto* intake = model.find_container(result.keys.at("intake"));
    REQUIRE(intake->io()->is_required);
    REQUIRE(intake->io()->data_type == "order");
    REQUIRE(intake->header.position.y() == 100.0);

    const auto* process = model.find_container(result.keys.at("process"));
    REQUIRE(process->stage()->parallel_execution);
    REQUIRE(process->stage()->stage_goals.size() == 2);
    REQUIRE(process->action_ids.size() == 2);

    const auto* validate = model.find_action(result.keys.at("validate"));
    REQUIRE(validate->estimated_duration_sec == 30.0);
    REQUIRE(validate->retry_policy.max_retries == 2);
    REQUIRE(validate->retry_policy.backoff == BackoffStrategy::LINEAR);
    REQUIRE(validate->raci.has_role("ben", RaciRole::INFORMED));
    REQUIRE(std::get<TetherNodeData>(validate->data).tether_reference_id == "validator-v2");

    const auto* reserve = model.find_action(result.keys.at("reserve"));
    REQUIRE(reserve->type() == NodeType::KB_NODE);
    REQUIRE(reserve->estimated_duration_sec == 60.0);

    const auto* review = model.find_action(result.keys.at("review"));
    REQUIRE(review->header.execution_type == ExecutionMode::CONDITIONAL);
    REQUIRE(review->guard == std::optional<std::string>("{{ total > 1000 }}"));
    REQUIRE(review->execution_order == 1);
    REQUIRE(model.find_action(result.keys.at("dispatch"))->execution_order == 2);

    const auto* ship = model.find_container(result.keys.at("ship"));
    REQUIRE(ship->header.dependencies == std::vector<NodeId>{result.keys.at("process")});
}

TEST_CASE("Loader defaults come from configuration", "[loader]") {
    ModelLoader loader(make_services(), ModelLoader::Config{
                                            .default_action_duration_sec = 45.0,
                                            .default_escalation = Escalation::ERROR,
                                        });
    auto loaded = loader.parse_from_string(kOrderFulfilmentYaml);
    REQUIRE(loaded.is_success());
    const auto& keys = loaded.value().keys;
    const auto& model = loaded.value().model;

    REQUIRE(model.find_action(keys.at("reserve"))->estimated_duration_sec == 45.0);
    REQUIRE(model.find_action(keys.at("validate"))->estimated_duration_sec == 30.0);
    REQUIRE(model.find_action(keys.at("validate"))->retry_policy.escalation == Escalation::ERROR);
    REQUIRE(model.find_action(keys.at("dispatch"))->retry_policy.escalation == Escalation::ERROR);
}

TEST_CASE("Quoted scalars stay strings", "[loader]") {
    ModelLoader loader(make_services());
    auto loaded = loader.parse_from_string(R"(
model:
  name: "2024"
  metadata:
    code: "007"
    count: 7
nodes:
  - key: only
    type: stageNode
    name: "100"
)");
    REQUIRE(loaded.is_success());
    const auto& model = loaded.value().model;
    REQUIRE(model.name().value() == "2024");
    REQUIRE(model.metadata()["code"] == "007");
    REQUIRE(model.metadata()["count"] == 7);
    REQUIRE(model.status() == ModelStatus::DRAFT);
}

TEST_CASE("Broken definitions are rejected", "[loader]") {
    ModelLoader loader(make_services());

    SECTION("malformed YAML") {
        auto r = loader.parse_from_string("model: [unclosed");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("missing model section") {
        auto r = loader.parse_from_string("nodes: []");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("unknown parent key") {
        auto r = loader.parse_from_string(R"(
model: {name: M}
nodes:
  - {key: s, type: stageNode, name: S}
actions:
  - {key: a, parent: nowhere, name: A}
)");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
        REQUIRE(r.message().find("nowhere") != std::string::npos);
    }
    SECTION("duplicate keys") {
        auto r = loader.parse_from_string(R"(
model: {name: M}
nodes:
  - {key: s, type: stageNode, name: S}
  - {key: s, type: ioNode, name: T}
)");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("unknown node type") {
        auto r = loader.parse_from_string(R"(
model: {name: M}
nodes:
  - {key: s, type: blackHole, name: S}
)");
        REQUIRE(r.message() == "Invalid node type: 'blackHole'");
    }
    SECTION("wrongly typed field") {
        auto r = loader.parse_from_string(R"(
model: {name: M}
nodes:
  - {key: s, type: stageNode, name: S, timeout_ms: soon}
)");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("domain rules still apply") {
        auto r = loader.parse_from_string(R"(
model: {name: M}
nodes:
  - {key: a, type: stageNode, name: A}
links:
  - {source: a, target: a}
)");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("publishing an invalid workflow") {
        auto r = loader.parse_from_string("model: {name: M}\npublish: true\n");
        REQUIRE(r.error_kind() == ErrorKind::VALIDATION);
    }
}

TEST_CASE("Missing definition file", "[loader]") {
    ModelLoader loader(make_services());
    auto r = loader.parse_from_file("/nonexistent/definitely_missing.yaml");
    REQUIRE(r.error_kind() == ErrorKind::NOT_FOUND);
}
