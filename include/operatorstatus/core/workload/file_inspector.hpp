#pragma once

#include <operatorstatus/core/workload/inspector.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace OperatorStatus {

/**
 * @class FileWorkloadInspector
 * @brief Reads workload state from a YAML snapshot, re-read on every fetch
 *
 * Snapshot layout:
 *
 *   daemonsets:
 *     - name: openshift-sdn/sdn
 *       generation: 2
 *       observed_generation: 2
 *       desired: 3
 *       updated: 3
 *       available: 3
 *       unavailable: 0
 *       annotations: {release.openshift.io/version: 4.1.0}
 *   deployments:
 *     - name: openshift-network-operator/network-operator
 *       generation: 1
 *       observed_generation: 1
 *       replicas: 1
 *       updated_replicas: 1
 *       available_replicas: 1
 *       unavailable_replicas: 0
 */
class FileWorkloadInspector : public WorkloadInspector {
public:
    explicit FileWorkloadInspector(std::string snapshotPath);

    DaemonSetState getDaemonSet(const NamespacedName& id) override;
    DeploymentState getDeployment(const NamespacedName& id) override;

    const std::string& snapshotPath() const { return path_; }

private:
    YAML::Node findEntry(const WorkloadRef& ref) const;

    std::string path_;
};

} // namespace OperatorStatus
