// main.cpp
#include <iostream>
#include <fstream>
#include <nlohmann/json.hpp>
#include "core/engine.h"
#include "core/serialization.h"

using namespace funcmodel;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <model.yaml> [funcmodel_config.json]\n";
        return 1;
    }
    const std::string config_path = argc == 3 ? argv[2] : "funcmodel_config.json";

    // 1. Load the model
    auto loaded = FunctionModelEngine::from_file(argv[1], config_path);
    if (!loaded) {
        std::cerr << "[ERROR] " << to_string(loaded.error_kind()) << ": " << loaded.message() << "\n";
        return 1;
    }
    auto engine = std::move(loaded).value();

    // 2. Plan with the order total as guard input
    nlohmann::json context = {{"total", 1500}};
    auto planned = engine->plan(context);
    if (!planned) {
        std::cerr << "[ERROR] " << planned.message() << "\n";
        return 1;
    }
    ExecutionPlan plan = planned.value();

    // 3. Drive the plan, failing the first validation attempt to exercise retry
    bool validate_failed_once = false;
    auto validate_id = engine->node_id("validate");
    for (auto ready = engine->executor().next_ready(plan); !ready.empty();
         ready = engine->executor().next_ready(plan)) {
        for (const auto& id : ready) {
            const auto* action = engine->model().find_action(id);
            std::string name = action ? action->header.name : id.value();

            auto started = engine->advance(plan, id, ExecutionOutcome::STARTED);
            if (!started) {
                std::cerr << "[ERROR] " << name << ": " << started.message() << "\n";
                return 1;
            }
            plan = started.value();

            ExecutionOutcome outcome = ExecutionOutcome::COMPLETED;
            if (validate_id && id == validate_id.value() && !validate_failed_once) {
                validate_failed_once = true;
                outcome = ExecutionOutcome::FAILED;
            }
            auto finished = engine->advance(plan, id, outcome);
            if (!finished) {
                std::cerr << "[ERROR] " << name << ": " << finished.message() << "\n";
                return 1;
            }
            plan = finished.value();
            std::cout << "  " << name << " -> " << to_string(plan.status_of(id)) << "\n";
        }
    }

    // 4. Report
    nlohmann::json summary = engine->summarize(plan);
    std::cout << "Summary:\n" << summary.dump(2) << "\n";
    nlohmann::json statistics = engine->model().calculate_statistics();
    std::cout << "Model statistics:\n" << statistics.dump(2) << "\n";

    // 5. Export traces
    auto traces = engine->get_last_traces();
    nlohmann::json trace_json = traces;
    std::ofstream trace_file("execution_trace.json");
    trace_file << trace_json.dump(2) << std::endl;
    std::cout << "Trace exported to execution_trace.json (" << traces.size() << " records)\n";

    return 0;
}
