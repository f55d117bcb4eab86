#include <operatorstatus/core/workload/inspector.hpp>

namespace OperatorStatus {

DaemonSetState StaticWorkloadInspector::getDaemonSet(const NamespacedName& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daemon_sets_.find(id);
    if (it == daemon_sets_.end()) {
        throw WorkloadFetchError("daemonset \"" + id.toString() + "\" not found");
    }
    return it->second;
}

DeploymentState StaticWorkloadInspector::getDeployment(const NamespacedName& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deployments_.find(id);
    if (it == deployments_.end()) {
        throw WorkloadFetchError("deployment \"" + id.toString() + "\" not found");
    }
    return it->second;
}

void StaticWorkloadInspector::setDaemonSet(const NamespacedName& id, const DaemonSetState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    daemon_sets_[id] = state;
}

void StaticWorkloadInspector::setDeployment(const NamespacedName& id, const DeploymentState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    deployments_[id] = state;
}

void StaticWorkloadInspector::remove(const WorkloadRef& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref.kind == WorkloadKind::DAEMON_SET) {
        daemon_sets_.erase(ref.id);
    } else {
        deployments_.erase(ref.id);
    }
}

} // namespace OperatorStatus
