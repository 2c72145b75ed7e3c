#pragma once

#include "core/types.hpp"
#include "core/value.hpp"

namespace sqlmemo {

/**
 * @brief Convert a fetched list into the shape a property expects
 *
 * LIST → the list itself. OBJECT → null for no rows, the row for one
 * row; more than one row throws ExecutorError(TOO_MANY_RESULTS).
 */
[[nodiscard]] Value extract_object_from_list(const ResultListPtr& list, TargetType target_type);

} // namespace sqlmemo
