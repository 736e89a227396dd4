// tests/test_value_objects.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/types/enums.h"
#include "core/types/value_objects.h"
#include <cmath>
#include <limits>

using namespace funcmodel;

TEST_CASE("Node ids must be UUID v4 and compare case-insensitively", "[value_objects]") {
    auto upper = NodeId::create("A1B2C3D4-E5F6-4A7B-8C9D-0E1F2A3B4C5D");
    auto lower = NodeId::create("a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d");
    REQUIRE(upper.is_success());
    REQUIRE(upper.value() == lower.value());
    REQUIRE(upper.value().value() == "a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d");

    REQUIRE(NodeId::create("not-a-uuid").error_kind() == ErrorKind::VALIDATION);
    // version 1 layout
    REQUIRE(NodeId::create("a1b2c3d4-e5f6-1a7b-8c9d-0e1f2a3b4c5d").is_failure());
    REQUIRE(ModelId::create("").is_failure());
}

TEST_CASE("Model names are trimmed and bounded", "[value_objects]") {
    REQUIRE(ModelName::create("  Intake  ").value().value() == "Intake");
    REQUIRE(ModelName::create("   ").is_failure());
    REQUIRE(ModelName::create(std::string(255, 'a')).is_success());
    REQUIRE(ModelName::create(std::string(256, 'a')).error_kind() == ErrorKind::VALIDATION);
}

TEST_CASE("Versions parse, compare and increment", "[value_objects]") {
    auto v = Version::create("1.2.3").value();
    REQUIRE(v.major_number() == 1);
    REQUIRE(v.minor_number() == 2);
    REQUIRE(v.patch_number() == 3);
    REQUIRE(v.to_string() == "1.2.3");

    REQUIRE(Version::create("1.2").is_failure());
    REQUIRE(Version::create("01.2.3").is_failure());
    REQUIRE(Version::create("v1.2.3").is_failure());

    REQUIRE(v.increment_major().to_string() == "2.0.0");
    REQUIRE(v.increment_minor().to_string() == "1.3.0");
    REQUIRE(v.increment_patch().to_string() == "1.2.4");
    REQUIRE(Version::create("1.10.0").value().is_greater_than(Version::create("1.9.9").value()));
    REQUIRE(Version::initial().is_less_than(v));
}

TEST_CASE("Positions are finite and non-negative", "[value_objects]") {
    auto p = Position::create(3.0, 4.0).value();
    REQUIRE_THAT(p.distance_to(Position::origin()), Catch::Matchers::WithinAbs(5.0, 1e-9));
    REQUIRE(Position::create(-1.0, 0.0).is_failure());
    REQUIRE(Position::create(std::numeric_limits<double>::quiet_NaN(), 0.0).is_failure());
    REQUIRE(Position::create(std::numeric_limits<double>::infinity(), 0.0).is_failure());

    REQUIRE(p.move_by(1.0, 1.0).value().x() == 4.0);
    REQUIRE(p.move_by(-10.0, 0.0).is_failure());
}

TEST_CASE("Link strength is within [0, 1]", "[value_objects]") {
    REQUIRE(LinkStrength::create(0.0).is_success());
    REQUIRE(LinkStrength::create(1.0).is_success());
    REQUIRE(LinkStrength::create(1.01).is_failure());
    REQUIRE(LinkStrength::create(-0.1).is_failure());
    REQUIRE(LinkStrength::full().value() == 1.0);
}

TEST_CASE("Retry policy bounds and backoff delays", "[value_objects]") {
    RetryPolicy policy;
    policy.max_retries = 3;
    REQUIRE(policy.validate().is_success());

    policy.max_retries = 11;
    REQUIRE(policy.validate().error_kind() == ErrorKind::VALIDATION);
    policy.max_retries = 3;

    policy.backoff = BackoffStrategy::EXPONENTIAL;
    REQUIRE(policy.calculate_delay(1) == 1000);
    REQUIRE(policy.calculate_delay(3) == 4000);
    REQUIRE(policy.calculate_delay(10) == 30000);

    policy.backoff = BackoffStrategy::LINEAR;
    REQUIRE(policy.calculate_delay(3) == 3000);

    policy.backoff = BackoffStrategy::CONSTANT;
    REQUIRE(policy.calculate_delay(5) == 1000);

    policy.max_delay_ms = 500;
    REQUIRE(policy.validate().is_failure());
}

TEST_CASE("RACI assignments are bounded per role", "[value_objects]") {
    RaciAssignment raci{.responsible = {"ana"}, .accountable = {"ben"}, .informed = {"ana", "cy"}};
    REQUIRE(raci.validate().is_success());
    REQUIRE(raci.has_role("ana", RaciRole::INFORMED));
    REQUIRE(raci.roles_of("ana") == std::vector<RaciRole>{RaciRole::RESPONSIBLE, RaciRole::INFORMED});

    raci.accountable = std::vector<std::string>(11, "x");
    REQUIRE(raci.validate().error_kind() == ErrorKind::VALIDATION);
    raci.accountable = {" "};
    REQUIRE(raci.validate().is_failure());
}

TEST_CASE("Enum literals round-trip and reject unknown values", "[enums]") {
    REQUIRE(parse_node_type("stageNode").value() == NodeType::STAGE_NODE);
    REQUIRE(to_string(NodeType::FUNCTION_MODEL_CONTAINER) == "functionModelContainer");
    REQUIRE(parse_merge_strategy("first-wins").value() == MergeStrategy::FIRST_WINS);
    REQUIRE(parse_access_level("read_write").value() == ContextAccessLevel::READ_WRITE);

    auto bad = parse_link_type("teleport");
    REQUIRE(bad.error_kind() == ErrorKind::VALIDATION);
    REQUIRE(bad.message() == "Invalid link type: 'teleport'");
}

TEST_CASE("Action status machine", "[enums]") {
    REQUIRE(can_transition(ActionStatus::DRAFT, ActionStatus::ACTIVE));
    REQUIRE(can_transition(ActionStatus::EXECUTING, ActionStatus::COMPLETED));
    REQUIRE(can_transition(ActionStatus::FAILED, ActionStatus::RETRYING));
    REQUIRE_FALSE(can_transition(ActionStatus::COMPLETED, ActionStatus::EXECUTING));
    REQUIRE_FALSE(can_transition(ActionStatus::ARCHIVED, ActionStatus::ACTIVE));

    REQUIRE(derive_node_status(ActionStatus::RETRYING) == NodeStatus::ACTIVE);
    REQUIRE(derive_node_status(ActionStatus::FAILED) == NodeStatus::ERROR);
    REQUIRE(derive_node_status(ActionStatus::CONFIGURED) == NodeStatus::CONFIGURED);
}
