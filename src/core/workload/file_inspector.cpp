#include <operatorstatus/core/workload/file_inspector.hpp>

namespace OperatorStatus {

namespace {

template<typename T>
T field(const YAML::Node& entry, const char* key) {
    return entry[key] ? entry[key].as<T>() : T{};
}

Annotations readAnnotations(const YAML::Node& entry) {
    if (!entry["annotations"]) {
        return {};
    }
    return entry["annotations"].as<Annotations>();
}

} // namespace

FileWorkloadInspector::FileWorkloadInspector(std::string snapshotPath)
    : path_(std::move(snapshotPath)) {}

YAML::Node FileWorkloadInspector::findEntry(const WorkloadRef& ref) const {
    const char* section = ref.kind == WorkloadKind::DAEMON_SET ? "daemonsets" : "deployments";
    const std::string wanted = ref.id.toString();

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_);
    } catch (const YAML::Exception& e) {
        throw WorkloadFetchError("failed to read workload snapshot " + path_ + ": " + e.what());
    }

    try {
        const YAML::Node entries = root[section];
        if (entries && entries.IsSequence()) {
            for (const auto& entry : entries) {
                // Entries that are not maps with a scalar name cannot match
                if (!entry.IsMap() || !entry["name"] || !entry["name"].IsScalar()) {
                    continue;
                }
                if (entry["name"].as<std::string>() == wanted) {
                    return entry;
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw WorkloadFetchError("malformed workload snapshot " + path_ + ": " + e.what());
    }
    throw WorkloadFetchError(std::string(toString(ref.kind)) + " \"" + wanted + "\" not found");
}

DaemonSetState FileWorkloadInspector::getDaemonSet(const NamespacedName& id) {
    const YAML::Node entry = findEntry(WorkloadRef{WorkloadKind::DAEMON_SET, id});
    try {
        DaemonSetState state;
        state.generation = field<int64_t>(entry, "generation");
        state.observedGeneration = field<int64_t>(entry, "observed_generation");
        state.desiredNumberScheduled = field<int32_t>(entry, "desired");
        state.updatedNumberScheduled = field<int32_t>(entry, "updated");
        state.numberAvailable = field<int32_t>(entry, "available");
        state.numberUnavailable = field<int32_t>(entry, "unavailable");
        state.annotations = readAnnotations(entry);
        return state;
    } catch (const YAML::Exception& e) {
        throw WorkloadFetchError("malformed DaemonSet \"" + id.toString() + "\": " + e.what());
    }
}

DeploymentState FileWorkloadInspector::getDeployment(const NamespacedName& id) {
    const YAML::Node entry = findEntry(WorkloadRef{WorkloadKind::DEPLOYMENT, id});
    try {
        DeploymentState state;
        state.generation = field<int64_t>(entry, "generation");
        state.observedGeneration = field<int64_t>(entry, "observed_generation");
        state.replicas = field<int32_t>(entry, "replicas");
        state.updatedReplicas = field<int32_t>(entry, "updated_replicas");
        state.availableReplicas = field<int32_t>(entry, "available_replicas");
        state.unavailableReplicas = field<int32_t>(entry, "unavailable_replicas");
        state.annotations = readAnnotations(entry);
        return state;
    } catch (const YAML::Exception& e) {
        throw WorkloadFetchError("malformed Deployment \"" + id.toString() + "\": " + e.what());
    }
}

} // namespace OperatorStatus
