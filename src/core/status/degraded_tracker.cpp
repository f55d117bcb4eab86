#include <operatorstatus/core/status/degraded_tracker.hpp>
#include <stdexcept>
#include <string>

namespace OperatorStatus {

size_t DegradedLevelTracker::indexOf(StatusLevel level) {
    const auto index = static_cast<size_t>(level);
    if (index >= STATUS_LEVEL_COUNT) {
        throw std::out_of_range("Invalid status level " + std::to_string(index));
    }
    return index;
}

void DegradedLevelTracker::setLevel(StatusLevel level, std::optional<Condition> condition) {
    failing_[indexOf(level)] = std::move(condition);
}

bool DegradedLevelTracker::isSet(StatusLevel level) const {
    return failing_[indexOf(level)].has_value();
}

Condition DegradedLevelTracker::resolve() const {
    for (const auto& slot : failing_) {
        if (slot) {
            return *slot;
        }
    }

    Condition notDegraded;
    notDegraded.type = ConditionType::Degraded;
    notDegraded.status = ConditionStatus::False;
    return notDegraded;
}

std::optional<StatusLevel> DegradedLevelTracker::activeLevel() const {
    for (size_t i = 0; i < STATUS_LEVEL_COUNT; ++i) {
        if (failing_[i]) {
            return static_cast<StatusLevel>(i);
        }
    }
    return std::nullopt;
}

} // namespace OperatorStatus
