// modules/execution/guard_evaluator.cpp
#include "modules/execution/guard_evaluator.h"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace funcmodel {

GuardEvaluator::GuardEvaluator() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_throw_at_missing_includes(true);

    configure_security();
}

void GuardEvaluator::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled in guards.", inja::SourceLocation{});
    });
}

Result<std::string> GuardEvaluator::render(std::string_view template_str, const Context& context) {
    try {
        return Result<std::string>::ok(env_.render(template_str, context));
    } catch (const inja::InjaError& e) {
        return validation_error("Guard render error: " + std::string(e.message));
    } catch (const nlohmann::json::exception& e) {
        return validation_error(std::string("Guard render error: ") + e.what());
    }
}

Result<bool> GuardEvaluator::evaluate(std::string_view guard, const Context& context) {
    std::string expr(guard);
    if (expr.find("{{") == std::string::npos && expr.find("{%") == std::string::npos) {
        expr = "{{ " + expr + " }}";
    }

    auto rendered = render(expr, context);
    if (rendered.is_failure()) return rendered.error();

    std::string out = rendered.value();
    out.erase(out.begin(), std::find_if_not(out.begin(), out.end(), [](unsigned char c) { return std::isspace(c); }));
    out.erase(std::find_if_not(out.rbegin(), out.rend(), [](unsigned char c) { return std::isspace(c); }).base(), out.end());

    if (out == "true") return Result<bool>::ok(true);
    if (out == "false") return Result<bool>::ok(false);

    double number = 0.0;
    auto [ptr, ec] = std::from_chars(out.data(), out.data() + out.size(), number);
    if (ec == std::errc() && ptr == out.data() + out.size() && !out.empty()) {
        return Result<bool>::ok(number != 0.0);
    }
    return validation_error("Guard '" + std::string(guard) + "' did not evaluate to a boolean (got '" + out + "')");
}

} // namespace funcmodel
