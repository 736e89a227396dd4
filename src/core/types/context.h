// core/types/context.h
#ifndef FUNCMODEL_CORE_TYPES_CONTEXT_H
#define FUNCMODEL_CORE_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace funcmodel {

// nlohmann::json is the single payload type for metadata and context data
using Value = nlohmann::json;
using Context = nlohmann::json;

} // namespace funcmodel

#endif // FUNCMODEL_CORE_TYPES_CONTEXT_H
