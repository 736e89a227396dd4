// modules/execution/guard_evaluator.h
#ifndef FUNCMODEL_MODULES_EXECUTION_GUARD_EVALUATOR_H
#define FUNCMODEL_MODULES_EXECUTION_GUARD_EVALUATOR_H

#include "core/types/context.h"
#include "core/types/result.h"
#include <inja/inja.hpp>
#include <filesystem> // Required by Inja for set_include_callback
#include <string>
#include <string_view>

namespace funcmodel {

// Evaluates conditional-action guards written as inja expressions, e.g. "{{ amount > 100 }}".
// A bare expression without delimiters is wrapped in "{{ }}".
class GuardEvaluator {
public:
    GuardEvaluator();

    Result<bool> evaluate(std::string_view guard, const Context& context);
    Result<std::string> render(std::string_view template_str, const Context& context);

private:
    inja::Environment env_;
    void configure_security(); // no includes from guards
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_EXECUTION_GUARD_EVALUATOR_H
