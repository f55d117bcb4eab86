#pragma once

#include <operatorstatus/core/workload/workload.hpp>
#include <map>
#include <mutex>

namespace OperatorStatus {

/**
 * @class WorkloadInspector
 * @brief Reads the observed state of tracked workloads
 *
 * Both getters throw WorkloadFetchError when the workload cannot be read.
 */
class WorkloadInspector {
public:
    virtual ~WorkloadInspector() = default;

    virtual DaemonSetState getDaemonSet(const NamespacedName& id) = 0;
    virtual DeploymentState getDeployment(const NamespacedName& id) = 0;
};

/**
 * @class StaticWorkloadInspector
 * @brief Thread-safe in-memory inspector; unknown workloads fail to fetch
 */
class StaticWorkloadInspector : public WorkloadInspector {
public:
    DaemonSetState getDaemonSet(const NamespacedName& id) override;
    DeploymentState getDeployment(const NamespacedName& id) override;

    void setDaemonSet(const NamespacedName& id, const DaemonSetState& state);
    void setDeployment(const NamespacedName& id, const DeploymentState& state);
    void remove(const WorkloadRef& ref);

private:
    std::mutex mutex_;
    std::map<NamespacedName, DaemonSetState> daemon_sets_;
    std::map<NamespacedName, DeploymentState> deployments_;
};

} // namespace OperatorStatus
