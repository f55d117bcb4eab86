#pragma once

#include <operatorstatus/core/status/condition.hpp>
#include <string>
#include <vector>

namespace OperatorStatus {

struct OperandVersion {
    std::string name;
    std::string version;
};

bool operator==(const OperandVersion& lhs, const OperandVersion& rhs);

/**
 * Reference to an auxiliary resource, attached for diagnostics.
 */
struct ObjectReference {
    std::string group;
    std::string resource;
    std::string ns;
    std::string name;
};

bool operator==(const ObjectReference& lhs, const ObjectReference& rhs);
bool operator<(const ObjectReference& lhs, const ObjectReference& rhs);

struct ClusterOperatorStatus {
    std::vector<Condition> conditions;
    std::vector<OperandVersion> versions;
    std::vector<ObjectReference> relatedObjects;
};

/**
 * Structural equality: conditions keyed by type, versions keyed by name,
 * related objects compared as a multiset. Element order never matters.
 */
bool operator==(const ClusterOperatorStatus& lhs, const ClusterOperatorStatus& rhs);
bool operator!=(const ClusterOperatorStatus& lhs, const ClusterOperatorStatus& rhs);

/**
 * @struct ClusterOperator
 * @brief The persisted resource the manager reports into
 */
struct ClusterOperator {
    std::string name;
    ClusterOperatorStatus status;
};

} // namespace OperatorStatus
