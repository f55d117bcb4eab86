#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace OperatorStatus {

// Annotation carrying the release a workload was rolled out for
constexpr const char* VERSION_ANNOTATION = "release.openshift.io/version";

struct NamespacedName {
    std::string ns;
    std::string name;

    // "ns/name", or just "name" when there is no namespace
    std::string toString() const;

    /**
     * @brief Parse "ns/name" or "name"
     * @throws std::invalid_argument on empty parts or extra separators
     */
    static NamespacedName parse(const std::string& text);
};

bool operator==(const NamespacedName& lhs, const NamespacedName& rhs);
bool operator<(const NamespacedName& lhs, const NamespacedName& rhs);

enum class WorkloadKind : uint8_t {
    DAEMON_SET = 0,
    DEPLOYMENT = 1
};

// "DaemonSet" / "Deployment", as used in progressing messages
const char* toString(WorkloadKind kind);

struct WorkloadRef {
    WorkloadKind kind = WorkloadKind::DAEMON_SET;
    NamespacedName id;
};

using Annotations = std::map<std::string, std::string>;

struct DaemonSetState {
    int64_t generation = 0;
    int64_t observedGeneration = 0;
    int32_t desiredNumberScheduled = 0;
    int32_t updatedNumberScheduled = 0;
    int32_t numberAvailable = 0;
    int32_t numberUnavailable = 0;
    Annotations annotations;
};

struct DeploymentState {
    int64_t generation = 0;
    int64_t observedGeneration = 0;
    int32_t replicas = 0;
    int32_t updatedReplicas = 0;
    int32_t availableReplicas = 0;
    int32_t unavailableReplicas = 0;
    Annotations annotations;
};

// Empty string when the annotation is absent
std::string versionAnnotation(const Annotations& annotations);

/**
 * Raised by a WorkloadInspector when a workload cannot be read. The
 * evaluator treats it as "still progressing", never as degraded.
 */
class WorkloadFetchError : public std::runtime_error {
public:
    explicit WorkloadFetchError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace OperatorStatus
