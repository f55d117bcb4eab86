#include <operatorstatus/core/workload/workload.hpp>
#include <tuple>

namespace OperatorStatus {

std::string NamespacedName::toString() const {
    if (ns.empty()) {
        return name;
    }
    return ns + "/" + name;
}

NamespacedName NamespacedName::parse(const std::string& text) {
    const auto slash = text.find('/');
    if (slash == std::string::npos) {
        if (text.empty()) {
            throw std::invalid_argument("empty workload name");
        }
        return NamespacedName{"", text};
    }

    NamespacedName result{text.substr(0, slash), text.substr(slash + 1)};
    if (result.ns.empty() || result.name.empty() || result.name.find('/') != std::string::npos) {
        throw std::invalid_argument("invalid workload name \"" + text + "\", expected namespace/name");
    }
    return result;
}

bool operator==(const NamespacedName& lhs, const NamespacedName& rhs) {
    return lhs.ns == rhs.ns && lhs.name == rhs.name;
}

bool operator<(const NamespacedName& lhs, const NamespacedName& rhs) {
    return std::tie(lhs.ns, lhs.name) < std::tie(rhs.ns, rhs.name);
}

const char* toString(WorkloadKind kind) {
    switch (kind) {
        case WorkloadKind::DAEMON_SET: return "DaemonSet";
        case WorkloadKind::DEPLOYMENT: return "Deployment";
        default:                       return "Workload";
    }
}

std::string versionAnnotation(const Annotations& annotations) {
    auto it = annotations.find(VERSION_ANNOTATION);
    return it == annotations.end() ? std::string() : it->second;
}

} // namespace OperatorStatus
