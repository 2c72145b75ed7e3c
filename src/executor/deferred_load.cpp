#include "executor/deferred_load.hpp"
#include "core/mapped_object.hpp"
#include "core/utils.hpp"
#include "executor/result_extractor.hpp"
#include "reflection/meta_object.hpp"

#include <format>

namespace sqlmemo {

// ============================================================================
// DeferredLoad
// ============================================================================

DeferredLoad::DeferredLoad(ObjectPtr target, std::string property, CacheKey key, TargetType target_type)
    : target_(std::move(target)),
      property_(std::move(property)),
      key_(std::move(key)),
      target_type_(target_type) {}

bool DeferredLoad::can_load(const ResultMemo& memo) const {
    return memo.is_resolved(key_);
}

void DeferredLoad::load(const ResultMemo& memo) const {
    const auto* list = memo.find_resolved(key_);
    if (!list) return;
    MetaObject(target_).set_value(property_, extract_object_from_list(*list, target_type_));
}

// ============================================================================
// DeferredLoadQueue
// ============================================================================

bool DeferredLoadQueue::register_load(DeferredLoad load, const ResultMemo& memo) {
    if (load.can_load(memo)) {
        load.load(memo);
        return true;
    }
    loads_.push_back(std::move(load));
    return false;
}

DeferredLoadQueue::DrainResult DeferredLoadQueue::drain_all(const ResultMemo& memo) {
    DrainResult result;
    std::deque<DeferredLoad> pending;
    pending.swap(loads_);

    for (const auto& load : pending) {
        if (!load.can_load(memo)) {
            // Fingerprint never resolved (cycle or failed fetch): leave the property unset
            ++result.unresolved;
            utils::log::warn(std::format("Deferred load of '{}' on {} left unset: fingerprint {} never resolved",
                                         load.property(),
                                         load.target() ? load.target()->type_name() : std::string("null"),
                                         load.key().hash()));
            continue;
        }
        load.load(memo);
        ++result.applied;
    }
    return result;
}

} // namespace sqlmemo
