#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace OperatorStatus {

/**
 * Condition types published on the ClusterOperator resource.
 * Values mirror the control plane vocabulary, so they keep its spelling.
 */
enum class ConditionType : uint8_t {
    Available = 0,
    Progressing = 1,
    Degraded = 2,
    Upgradeable = 3
};

enum class ConditionStatus : uint8_t {
    True = 0,
    False = 1,
    Unknown = 2
};

/**
 * @struct Condition
 * @brief One health signal, unique per type within a condition set.
 *
 * lastTransitionTime is owned by setStatusCondition(): it moves only when
 * the status flips, so re-merging an identical condition changes nothing.
 */
struct Condition {
    ConditionType type = ConditionType::Available;
    ConditionStatus status = ConditionStatus::Unknown;
    std::string reason;
    std::string message;
    std::chrono::system_clock::time_point lastTransitionTime{};
};

bool operator==(const Condition& lhs, const Condition& rhs);
bool operator!=(const Condition& lhs, const Condition& rhs);

const char* toString(ConditionType type);
const char* toString(ConditionStatus status);

std::optional<ConditionType> parseConditionType(std::string_view text);
std::optional<ConditionStatus> parseConditionStatus(std::string_view text);

/**
 * @brief Merge a condition into a set by type
 *
 * Replaces the condition of the same type if present, otherwise appends.
 * Conditions of other types are left untouched.
 */
void setStatusCondition(std::vector<Condition>& conditions, const Condition& condition);

/**
 * @return Pointer into conditions, or nullptr if no condition has that type
 */
const Condition* findStatusCondition(const std::vector<Condition>& conditions, ConditionType type);

/**
 * Type-keyed comparison: two sets are equal when they hold the same
 * conditions regardless of order.
 */
bool sameConditionSet(const std::vector<Condition>& lhs, const std::vector<Condition>& rhs);

// RFC 3339, second precision, UTC ("2026-10-19T18:46:00Z")
std::string formatTimestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

} // namespace OperatorStatus
