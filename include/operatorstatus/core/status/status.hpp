#pragma once
#include <operatorstatus/core/status/condition.hpp>
#include <vector>

namespace OperatorStatus {

/**
 * @struct Status
 * @brief One unit of work for the publisher
 *
 * Built from in-memory state at enqueue time, consumed once by the
 * publisher worker, then discarded.
 */
struct Status {
    std::vector<Condition> conditions;

    // Gates publication of the operator version
    bool reachedAvailableLevel = false;
};

} // namespace OperatorStatus
