// modules/context/context_merge.h
#ifndef FUNCMODEL_MODULES_CONTEXT_CONTEXT_MERGE_H
#define FUNCMODEL_MODULES_CONTEXT_CONTEXT_MERGE_H

#include "core/types/context.h"
#include "core/types/enums.h"
#include "core/types/result.h"

namespace funcmodel {

// Folds source into target.
// FIRST_WINS keeps existing keys, LAST_WINS overwrites them, DEEP_MERGE recurses into objects
// (arrays and scalars are replaced), ERROR_ON_CONFLICT fails on any differing value.
VoidResult merge_context(Context& target, const Context& source, MergeStrategy strategy);

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_CONTEXT_CONTEXT_MERGE_H
