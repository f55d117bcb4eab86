#include <operatorstatus/core/workload/status_evaluator.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace OperatorStatus {

namespace {

std::string waitingForCreation(WorkloadKind kind, const NamespacedName& id) {
    return fmt::format("Waiting for {} \"{}\" to be created", toString(kind), id.toString());
}

} // namespace

EvaluationResult WorkloadStatusEvaluator::evaluate(const std::vector<NamespacedName>& daemonSets,
                                                   const std::vector<NamespacedName>& deployments,
                                                   const std::string& targetVersion) const {
    EvaluationResult result;
    result.reachedAvailableLevel = (daemonSets.size() + deployments.size()) > 0;

    for (const auto& id : daemonSets) {
        evaluateDaemonSet(id, targetVersion, result);
    }
    for (const auto& id : deployments) {
        evaluateDeployment(id, targetVersion, result);
    }

    spdlog::debug("[WorkloadStatusEvaluator] {} daemonsets, {} deployments: reachedAvailableLevel={} progressing={}",
                  daemonSets.size(), deployments.size(), result.reachedAvailableLevel,
                  result.progressing.size());
    return result;
}

void WorkloadStatusEvaluator::evaluateDaemonSet(const NamespacedName& id, const std::string& targetVersion,
                                                EvaluationResult& result) const {
    const std::string name = id.toString();

    DaemonSetState ds;
    try {
        ds = inspector_.getDaemonSet(id);
    } catch (const WorkloadFetchError& e) {
        // The operator config reconciler is presumably still creating it;
        // it reports Degraded itself if that fails.
        spdlog::warn("[WorkloadStatusEvaluator] Error getting DaemonSet \"{}\": {}", name, e.what());
        result.progressing.push_back(waitingForCreation(WorkloadKind::DAEMON_SET, id));
        return;
    }

    if (ds.updatedNumberScheduled < ds.desiredNumberScheduled) {
        result.progressing.push_back(fmt::format(
            "DaemonSet \"{}\" update is rolling out ({} out of {} updated)",
            name, ds.updatedNumberScheduled, ds.desiredNumberScheduled));
    } else if (ds.numberUnavailable > 0) {
        result.progressing.push_back(fmt::format(
            "DaemonSet \"{}\" is not available (awaiting {} nodes)", name, ds.numberUnavailable));
    } else if (ds.numberAvailable == 0) {
        // An intentionally empty DaemonSet would be reported here as well
        result.progressing.push_back(fmt::format(
            "DaemonSet \"{}\" is not yet scheduled on any nodes", name));
    } else if (ds.generation > ds.observedGeneration) {
        result.progressing.push_back(fmt::format(
            "DaemonSet \"{}\" update is being processed (generation {}, observed generation {})",
            name, ds.generation, ds.observedGeneration));
    }

    const bool atLevel = ds.generation <= ds.observedGeneration &&
                         ds.updatedNumberScheduled == ds.desiredNumberScheduled &&
                         ds.numberUnavailable == 0 &&
                         versionAnnotation(ds.annotations) == targetVersion;
    if (!atLevel) {
        result.reachedAvailableLevel = false;
    }
}

void WorkloadStatusEvaluator::evaluateDeployment(const NamespacedName& id, const std::string& targetVersion,
                                                 EvaluationResult& result) const {
    const std::string name = id.toString();

    DeploymentState dep;
    try {
        dep = inspector_.getDeployment(id);
    } catch (const WorkloadFetchError& e) {
        spdlog::warn("[WorkloadStatusEvaluator] Error getting Deployment \"{}\": {}", name, e.what());
        result.progressing.push_back(waitingForCreation(WorkloadKind::DEPLOYMENT, id));
        return;
    }

    if (dep.unavailableReplicas > 0) {
        result.progressing.push_back(fmt::format(
            "Deployment \"{}\" is not available (awaiting {} nodes)", name, dep.unavailableReplicas));
    } else if (dep.availableReplicas == 0) {
        result.progressing.push_back(fmt::format(
            "Deployment \"{}\" is not yet scheduled on any nodes", name));
    } else if (dep.observedGeneration < dep.generation) {
        result.progressing.push_back(fmt::format(
            "Deployment \"{}\" update is being processed (generation {}, observed generation {})",
            name, dep.generation, dep.observedGeneration));
    }

    const bool atLevel = dep.generation <= dep.observedGeneration &&
                         dep.updatedReplicas == dep.replicas &&
                         dep.availableReplicas > 0 &&
                         versionAnnotation(dep.annotations) == targetVersion;
    if (!atLevel) {
        result.reachedAvailableLevel = false;
    }
}

} // namespace OperatorStatus
