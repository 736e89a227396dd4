// tests/test_context_access.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/serialization.h"
#include "modules/context/context_access_service.h"
#include "modules/context/context_merge.h"
#include "test_support.h"

using namespace funcmodel;
using namespace funcmodel::testing;

namespace {

const NodeId kRoot = node_id("00000000-0000-4000-8000-0000000000a0");
const NodeId kA = node_id("00000000-0000-4000-8000-0000000000a1");
const NodeId kB = node_id("00000000-0000-4000-8000-0000000000a2");
const NodeId kGrandchild = node_id("00000000-0000-4000-8000-0000000000a3");
const NodeId kStranger = node_id("00000000-0000-4000-8000-0000000000f0");

// root -> {a, b}, a -> grandchild, stranger on its own
ContextAccessService make_tree(const DomainServices& services, ContextAccessService::Config config = {}) {
    ContextAccessService service(services, config);
    REQUIRE(service.register_node(kRoot, NodeType::STAGE_NODE, std::nullopt, Context::object(), 0).is_success());
    REQUIRE(service.register_node(kA, NodeType::STAGE_NODE, kRoot, Context::object(), 1).is_success());
    REQUIRE(service.register_node(kB, NodeType::STAGE_NODE, kRoot, Context::object(), 1).is_success());
    REQUIRE(service.register_node(kGrandchild, NodeType::TETHER_NODE, kA, Context::object(), 2).is_success());
    REQUIRE(service.register_node(kStranger, NodeType::STAGE_NODE, std::nullopt, Context::object(), 0).is_success());
    return service;
}

ContextValidationResult check(const ContextAccessService& service, const NodeId& owner, const NodeId& requester,
                              ContextAccessLevel level) {
    auto result = service.validate_context_access(owner, requester, level);
    REQUIRE(result.is_success());
    return result.value();
}

} // namespace

TEST_CASE("Inherited properties can be locked against override", "[context]") {
    auto services = make_services();
    ContextAccessService service(services);

    auto a = service.build_context(kA, {{"x", 1}}, ContextScope::EXECUTION);
    REQUIRE(a.is_success());
    auto b = service.build_context(kB, {{"y", 2}}, ContextScope::EXECUTION, a.value().context_id,
                                   {ContextInheritanceRule{.property = "x", .inherit = true, .override_allowed = false}});
    REQUIRE(b.is_success());

    auto current = service.get_node_context(kB);
    REQUIRE(current.is_success());
    Context effective = current.value().effective_data();
    REQUIRE(effective["x"] == 1);
    REQUIRE(effective["y"] == 2);
    REQUIRE(current.value().is_locked("x"));

    auto overwrite = service.update_node_context(kB, {{"x", 5}});
    REQUIRE(overwrite.error_kind() == ErrorKind::ACCESS_DENIED);
    REQUIRE(service.get_node_context(kB).value().effective_data()["x"] == 1);
    REQUIRE(service.update_node_context(kB, {{"y", 3}}).is_success());

    SECTION("locks travel further down") {
        auto c = service.build_context(kGrandchild, {{"x", 9}}, ContextScope::EXECUTION, b.value().context_id);
        REQUIRE(c.error_kind() == ErrorKind::ACCESS_DENIED);
    }
    SECTION("implicit registration places the node under the parent context's node") {
        REQUIRE(service.registration(kB)->parent_node_id == std::optional<NodeId>(kA));
        REQUIRE(service.registration(kB)->hierarchy_level == 1);
    }
}

TEST_CASE("Isolated parents pass nothing down", "[context]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto parent = service.build_context(kA, {{"secret", "s"}}, ContextScope::ISOLATED).value();
    auto child = service.build_context(kGrandchild, Context::object(), ContextScope::EXECUTION, parent.context_id);
    REQUIRE(child.is_success());
    REQUIRE(child.value().inherited_data.empty());

    auto read = check(service, kA, kGrandchild, ContextAccessLevel::READ);
    REQUIRE_FALSE(read.granted);
    REQUIRE(read.relationship == "descendant");
}

TEST_CASE("Unknown nodes and contexts", "[context]") {
    auto services = make_services();
    auto service = make_tree(services);

    REQUIRE(service.get_node_context(kStranger).error_kind() == ErrorKind::NOT_FOUND);
    auto unregistered = node_id("00000000-0000-4000-8000-0000000000ff");
    REQUIRE(service.get_node_context(unregistered).error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(service.validate_context_access(unregistered, kA, ContextAccessLevel::READ).error_kind() ==
            ErrorKind::NOT_FOUND);
    REQUIRE(service.get_context("ctx-404").error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(service.build_context(kA, Context::object(), ContextScope::EXECUTION, std::string("ctx-404"))
                .error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(service.build_context(kA, Context::array(), ContextScope::EXECUTION).error_kind() ==
            ErrorKind::VALIDATION);
}

TEST_CASE("Node registration keeps the hierarchy consistent", "[context][registration]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto fresh = node_id("00000000-0000-4000-8000-0000000000b0");

    REQUIRE(service.register_node(fresh, std::nullopt, fresh, Context::object(), 1).error_kind() ==
            ErrorKind::VALIDATION);
    REQUIRE(service.register_node(fresh, std::nullopt, node_id("00000000-0000-4000-8000-0000000000b1"),
                                  Context::object(), 1)
                .error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(service.register_node(fresh, std::nullopt, kA, Context::object(), 1).error_kind() ==
            ErrorKind::VALIDATION);
    REQUIRE(service.register_node(kRoot, std::nullopt, kGrandchild, Context::object(), 3).error_kind() ==
            ErrorKind::VALIDATION);

    REQUIRE(service.registration(kRoot)->children == std::vector<NodeId>{kA, kB});

    SECTION("re-registration keeps children deeper than their parent") {
        REQUIRE(service.register_node(kA, NodeType::STAGE_NODE, kRoot, Context::object(), 2).error_kind() ==
                ErrorKind::VALIDATION);
        REQUIRE(service.registration(kA)->hierarchy_level == 1);
        REQUIRE(service.registration(kRoot)->children == std::vector<NodeId>{kA, kB});

        auto moved = service.register_node(kGrandchild, NodeType::TETHER_NODE, kB, Context::object(), 2);
        REQUIRE(moved.is_success());
        REQUIRE(service.registration(kA)->children.empty());
        REQUIRE(service.registration(kB)->children == std::vector<NodeId>{kGrandchild});
    }
}

TEST_CASE("Access depends on the relationship between nodes", "[context][access]") {
    auto services = make_services();
    auto service = make_tree(services);
    REQUIRE(service.build_context(kA, {{"a", 1}}, ContextScope::EXECUTION).is_success());

    SECTION("owner") {
        auto self = check(service, kA, kA, ContextAccessLevel::READ_WRITE);
        REQUIRE(self.granted);
        REQUIRE(self.relationship == "self");
        REQUIRE(self.accessible_properties == std::vector<std::string>{"a"});
    }
    SECTION("ancestors read") {
        REQUIRE(check(service, kA, kRoot, ContextAccessLevel::READ).granted);
        auto write = check(service, kA, kRoot, ContextAccessLevel::WRITE);
        REQUIRE_FALSE(write.granted);
        REQUIRE(write.relationship == "ancestor");
        REQUIRE(write.denial_reason.has_value());
    }
    SECTION("ancestors write when configured") {
        auto permissive = make_tree(services, ContextAccessService::Config{.ancestors_can_write = true});
        REQUIRE(permissive.build_context(kA, {{"a", 1}}, ContextScope::EXECUTION).is_success());
        REQUIRE(check(permissive, kA, kRoot, ContextAccessLevel::WRITE).granted);
    }
    SECTION("descendants read") {
        REQUIRE(check(service, kA, kGrandchild, ContextAccessLevel::READ).granted);
        REQUIRE_FALSE(check(service, kA, kGrandchild, ContextAccessLevel::READ_WRITE).granted);
    }
    SECTION("siblings need an explicit share") {
        auto before = check(service, kA, kB, ContextAccessLevel::READ);
        REQUIRE_FALSE(before.granted);
        REQUIRE(before.relationship == "sibling");

        REQUIRE(service.share_context(kA, kB).is_success());
        REQUIRE(check(service, kA, kB, ContextAccessLevel::READ).granted);
        REQUIRE_FALSE(check(service, kA, kB, ContextAccessLevel::WRITE).granted);
        REQUIRE(service.share_context(kA, kGrandchild).error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("shared scope opens siblings up") {
        REQUIRE(service.build_context(kA, {{"a", 2}}, ContextScope::SHARED).is_success());
        REQUIRE(check(service, kA, kB, ContextAccessLevel::READ_WRITE).granted);
    }
    SECTION("unrelated nodes see nothing") {
        auto stranger = check(service, kA, kStranger, ContextAccessLevel::READ);
        REQUIRE_FALSE(stranger.granted);
        REQUIRE(stranger.relationship == "unrelated");
        REQUIRE(stranger.restricted_properties == std::vector<std::string>{"a"});
    }
    SECTION("global scope is visible everywhere") {
        REQUIRE(service.build_context(kRoot, {{"tenant", "acme"}}, ContextScope::GLOBAL).is_success());
        REQUIRE(check(service, kRoot, kStranger, ContextAccessLevel::READ).granted);
        auto visible = service.get_accessible_contexts(kStranger).value();
        REQUIRE(visible.size() == 1);
        REQUIRE(visible.front().node_id == kRoot);
    }
}

TEST_CASE("Hierarchical view merges from the root down", "[context][hierarchy]") {
    auto services = make_services();
    auto service = make_tree(services);
    REQUIRE(service.build_context(kRoot, {{"region", "eu"}, {"tier", "basic"}}, ContextScope::EXECUTION).is_success());
    REQUIRE(service.build_context(kA, {{"tier", "gold"}}, ContextScope::EXECUTION).is_success());

    auto view = service.get_hierarchical_context(kGrandchild);
    REQUIRE(view.is_success());
    REQUIRE(view.value().total_levels == 3);
    REQUIRE(view.value().levels[1].node_id == kA);
    REQUIRE(view.value().merged_data == Context{{"region", "eu"}, {"tier", "gold"}});
    REQUIRE_FALSE(view.value().max_depth_reached);

    auto shallow = make_tree(services, ContextAccessService::Config{.max_context_depth = 2});
    auto truncated = shallow.get_hierarchical_context(kGrandchild).value();
    REQUIRE(truncated.total_levels == 2);
    REQUIRE(truncated.max_depth_reached);

    nlohmann::json j = view.value();
    REQUIRE(j["totalLevels"] == 3);
}

TEST_CASE("Clearing a node's context removes dependent contexts too", "[context][clear]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto parent = service.build_context(kA, {{"k", 1}}, ContextScope::EXECUTION).value();
    REQUIRE(service.build_context(kGrandchild, Context::object(), ContextScope::EXECUTION, parent.context_id)
                .is_success());
    REQUIRE(service.build_context(kB, {{"other", true}}, ContextScope::EXECUTION).is_success());
    REQUIRE(service.context_count() == 3);

    REQUIRE(service.clear_node_context(kA).is_success());
    REQUIRE(service.context_count() == 1);
    REQUIRE(service.get_context(parent.context_id).error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(service.get_node_context(kGrandchild).error_kind() == ErrorKind::NOT_FOUND);

    REQUIRE(service.clear_node_context(kA).is_success());
    REQUIRE(service.context_count() == 1);
}

TEST_CASE("Cloned contexts are independent copies", "[context][clone]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto source = service.build_context(kA, {{"order", {{"id", 7}}}, {"token", "abc"}, {"mode", "live"}},
                                        ContextScope::EXECUTION)
                      .value();

    CloneOptions options{.exclude_properties = {"token"}, .transform = {{"mode", "replay"}}};
    auto clone_id = service.clone_context_scope(source.context_id, kB, ContextScope::SESSION, options);
    REQUIRE(clone_id.is_success());

    auto clone = service.get_context(clone_id.value()).value();
    REQUIRE(clone.scope == ContextScope::SESSION);
    REQUIRE_FALSE(clone.data.contains("token"));
    REQUIRE(clone.data["mode"] == "replay");

    REQUIRE(service.update_context(clone_id.value(), {{"order", {{"id", 8}}}}).is_success());
    REQUIRE(service.get_context(source.context_id).value().data["order"]["id"] == 7);

    REQUIRE(service.update_context(source.context_id, {{"order", {{"id", 9}}}}).is_success());
    REQUIRE(service.get_context(source.context_id).value().data["order"]["id"] == 9);
    REQUIRE(service.get_context(clone_id.value()).value().data["order"]["id"] == 8);
}

TEST_CASE("Source changes after a clone leave the clone untouched", "[context][clone]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto source = service.build_context(kA, {{"order", {{"id", 7}}}}, ContextScope::EXECUTION).value();
    auto clone_id = service.clone_context_scope(source.context_id, kB, ContextScope::SESSION).value();

    REQUIRE(service.update_context(source.context_id, {{"order", {{"id", 9}}}}).is_success());
    REQUIRE(service.get_context(clone_id).value().data["order"]["id"] == 7);
}

TEST_CASE("Merging contexts honours the strategy", "[context][merge]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto first = service.build_context(kA, {{"k", 1}, {"cfg", {{"a", 1}}}}, ContextScope::EXECUTION).value();
    auto second = service.build_context(kB, {{"k", 2}, {"cfg", {{"b", 2}}}}, ContextScope::EXECUTION).value();
    std::vector<std::string> ids{first.context_id, second.context_id};

    auto merged_with = [&](std::optional<MergeStrategy> strategy) {
        auto id = service.merge_context_scopes(ids, kRoot, ContextScope::EXECUTION, MergeOptions{.strategy = strategy});
        REQUIRE(id.is_success());
        return service.get_context(id.value()).value().data;
    };

    REQUIRE(merged_with(std::nullopt)["k"] == 1);
    REQUIRE(merged_with(MergeStrategy::LAST_WINS)["k"] == 2);
    auto deep = merged_with(MergeStrategy::DEEP_MERGE);
    REQUIRE(deep["cfg"] == Context{{"a", 1}, {"b", 2}});

    auto conflict = service.merge_context_scopes(ids, kRoot, ContextScope::EXECUTION,
                                                 MergeOptions{.strategy = MergeStrategy::ERROR_ON_CONFLICT});
    REQUIRE(conflict.error_kind() == ErrorKind::CONFLICT);

    auto tagged = service.merge_context_scopes(ids, kRoot, ContextScope::EXECUTION,
                                               MergeOptions{.preserve_source_metadata = true});
    REQUIRE(service.get_context(tagged.value()).value().data["_sources"].size() == 2);
    REQUIRE(service.merge_context_scopes({}, kRoot, ContextScope::EXECUTION).error_kind() == ErrorKind::VALIDATION);
}

TEST_CASE("merge_context strategies on plain data", "[context][merge]") {
    Context target = {{"a", 1}, {"nested", {{"x", 1}}}};
    REQUIRE(merge_context(target, {{"a", 2}, {"b", 3}}, MergeStrategy::FIRST_WINS).is_success());
    REQUIRE(target["a"] == 1);
    REQUIRE(target["b"] == 3);

    auto conflict = merge_context(target, {{"nested", {{"x", 2}}}}, MergeStrategy::ERROR_ON_CONFLICT);
    REQUIRE(conflict.error_kind() == ErrorKind::CONFLICT);
    REQUIRE(conflict.message().find("nested.x") != std::string::npos);
    REQUIRE(merge_context(target, Context::array(), MergeStrategy::LAST_WINS).error_kind() == ErrorKind::VALIDATION);
}

TEST_CASE("Propagation copies selected properties", "[context][propagate]") {
    auto services = make_services();
    auto service = make_tree(services);
    auto source = service.build_context(kA, {{"customer", "c-1"}, {"internal", true}}, ContextScope::EXECUTION).value();

    std::vector<ContextInheritanceRule> rules{{.property = "customer"}};
    REQUIRE(service.propagate_context(source.context_id, kB, rules).is_success());
    auto target = service.get_node_context(kB).value();
    REQUIRE(target.data["customer"] == "c-1");
    REQUIRE_FALSE(target.data.contains("internal"));

    REQUIRE(service.propagate_context(source.context_id, kA, rules).error_kind() == ErrorKind::VALIDATION);

    auto sealed = service.build_context(kRoot, {{"customer", "c-2"}}, ContextScope::ISOLATED).value();
    REQUIRE(service.propagate_context(sealed.context_id, kB, rules).error_kind() == ErrorKind::ACCESS_DENIED);
}

TEST_CASE("A model's nodes can be registered in one call", "[context][registration]") {
    auto services = make_services();
    auto model = make_model(services);
    auto outer = add_stage(model, "outer");
    auto inner = add_stage(model, "inner", false, outer.header.id);
    auto step = add_tether(model, inner.header.id, "step");

    ContextAccessService service(services);
    REQUIRE(service.register_model(model).is_success());
    REQUIRE(service.registration(step.header.id)->hierarchy_level == 2);
    REQUIRE(service.registration(step.header.id)->parent_node_id == std::optional<NodeId>(inner.header.id));
    REQUIRE(service.registration(outer.header.id)->children == std::vector<NodeId>{inner.header.id});
}
