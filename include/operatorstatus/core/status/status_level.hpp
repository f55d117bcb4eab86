#pragma once
#include <cstddef>
#include <cstdint>

namespace OperatorStatus {

/**
 * Priority tiers for Degraded reporting. Lower value = higher priority:
 * a cluster configuration failure hides operator config and pod failures.
 */
enum class StatusLevel : uint8_t {
    CLUSTER_CONFIG = 0,
    OPERATOR_CONFIG = 1,
    POD_DEPLOYMENT = 2
};

constexpr size_t STATUS_LEVEL_COUNT = 3;

inline const char* toString(StatusLevel level) {
    switch (level) {
        case StatusLevel::CLUSTER_CONFIG:  return "CLUSTER_CONFIG";
        case StatusLevel::OPERATOR_CONFIG: return "OPERATOR_CONFIG";
        case StatusLevel::POD_DEPLOYMENT:  return "POD_DEPLOYMENT";
        default:                           return "UNKNOWN";
    }
}

} // namespace OperatorStatus
