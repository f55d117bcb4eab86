#pragma once

#include <operatorstatus/core/status/condition.hpp>
#include <operatorstatus/core/status/status_level.hpp>
#include <array>
#include <optional>

namespace OperatorStatus {

/**
 * @class DegradedLevelTracker
 * @brief Per-level Degraded conditions; the highest-priority one wins.
 *
 * One slot per StatusLevel. resolve() scans in priority order and returns
 * the first populated slot, or a synthetic Degraded=False when every slot
 * is empty.
 *
 * Not synchronized: StatusManager serializes access.
 */
class DegradedLevelTracker {
public:
    DegradedLevelTracker() = default;

    /**
     * @brief Write or clear a level's slot
     * @param condition Condition to store, or std::nullopt to clear
     * @throws std::out_of_range for a level outside StatusLevel
     */
    void setLevel(StatusLevel level, std::optional<Condition> condition);

    void clearLevel(StatusLevel level) {
        setLevel(level, std::nullopt);
    }

    bool isSet(StatusLevel level) const;

    /**
     * @return The condition of the lowest populated level, or Degraded=False
     */
    Condition resolve() const;

    /**
     * @return Level currently surfaced by resolve(), std::nullopt if none
     */
    std::optional<StatusLevel> activeLevel() const;

private:
    static size_t indexOf(StatusLevel level);

    std::array<std::optional<Condition>, STATUS_LEVEL_COUNT> failing_{};
};

} // namespace OperatorStatus
