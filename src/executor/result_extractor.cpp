#include "executor/result_extractor.hpp"
#include "core/error.hpp"

#include <format>

namespace sqlmemo {

Value extract_object_from_list(const ResultListPtr& list, TargetType target_type) {
    if (target_type == TargetType::LIST) {
        return list;
    }
    if (!list || list->empty()) {
        return {};
    }
    if (list->size() > 1) {
        throw ExecutorError(ErrorCode::TOO_MANY_RESULTS,
            std::format("Statement returned {} rows where no more than one was expected", list->size()));
    }
    return list->front();
}

} // namespace sqlmemo
