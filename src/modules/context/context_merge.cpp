// modules/context/context_merge.cpp
#include "modules/context/context_merge.h"
#include <string>

namespace funcmodel {

namespace {

VoidResult merge_recursive(Context& target, const Context& source, const std::string& path_prefix,
                           MergeStrategy strategy) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string current_path = path_prefix.empty() ? it.key() : path_prefix + "." + it.key();

        auto target_it = target.find(it.key());
        if (target_it == target.end()) {
            target[it.key()] = it.value();
            continue;
        }

        switch (strategy) {
            case MergeStrategy::FIRST_WINS:
                break;
            case MergeStrategy::LAST_WINS:
                *target_it = it.value();
                break;
            case MergeStrategy::DEEP_MERGE:
                if (target_it->is_object() && it.value().is_object()) {
                    auto nested = merge_recursive(*target_it, it.value(), current_path, strategy);
                    if (nested.is_failure()) return nested;
                } else {
                    *target_it = it.value();
                }
                break;
            case MergeStrategy::ERROR_ON_CONFLICT:
                if (target_it->is_object() && it.value().is_object()) {
                    auto nested = merge_recursive(*target_it, it.value(), current_path, strategy);
                    if (nested.is_failure()) return nested;
                } else if (*target_it != it.value()) {
                    return conflict_error("Context merge conflict for field '" + current_path + "': " +
                                          target_it->dump() + " vs " + it.value().dump());
                }
                break;
        }
    }
    return VoidResult::ok();
}

} // namespace

VoidResult merge_context(Context& target, const Context& source, MergeStrategy strategy) {
    if (source.is_null()) return VoidResult::ok();
    if (!source.is_object()) {
        return validation_error("Cannot merge non-object context data");
    }
    if (target.is_null()) target = Context::object();
    return merge_recursive(target, source, "", strategy);
}

} // namespace funcmodel
