#include <operatorstatus/core/store/cluster_operator.hpp>
#include <algorithm>
#include <tuple>

namespace OperatorStatus {

bool operator==(const OperandVersion& lhs, const OperandVersion& rhs) {
    return lhs.name == rhs.name && lhs.version == rhs.version;
}

bool operator==(const ObjectReference& lhs, const ObjectReference& rhs) {
    return std::tie(lhs.group, lhs.resource, lhs.ns, lhs.name) ==
           std::tie(rhs.group, rhs.resource, rhs.ns, rhs.name);
}

bool operator<(const ObjectReference& lhs, const ObjectReference& rhs) {
    return std::tie(lhs.group, lhs.resource, lhs.ns, lhs.name) <
           std::tie(rhs.group, rhs.resource, rhs.ns, rhs.name);
}

namespace {

bool sameVersionSet(const std::vector<OperandVersion>& lhs, const std::vector<OperandVersion>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& v : lhs) {
        auto it = std::find_if(rhs.begin(), rhs.end(),
                               [&](const OperandVersion& o) { return o.name == v.name; });
        if (it == rhs.end() || it->version != v.version) {
            return false;
        }
    }
    return true;
}

bool sameReferenceSet(std::vector<ObjectReference> lhs, std::vector<ObjectReference> rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

} // namespace

bool operator==(const ClusterOperatorStatus& lhs, const ClusterOperatorStatus& rhs) {
    return sameConditionSet(lhs.conditions, rhs.conditions) &&
           sameVersionSet(lhs.versions, rhs.versions) &&
           sameReferenceSet(lhs.relatedObjects, rhs.relatedObjects);
}

bool operator!=(const ClusterOperatorStatus& lhs, const ClusterOperatorStatus& rhs) {
    return !(lhs == rhs);
}

} // namespace OperatorStatus
