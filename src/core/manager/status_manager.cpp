#include <operatorstatus/core/manager/status_manager.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace OperatorStatus {

namespace {

ObjectStore& requireStore(const StatusManager::Dependencies& deps) {
    if (deps.store == nullptr) {
        throw std::invalid_argument("StatusManager requires an object store");
    }
    return *deps.store;
}

WorkloadInspector& requireInspector(const StatusManager::Dependencies& deps) {
    if (deps.inspector == nullptr) {
        throw std::invalid_argument("StatusManager requires a workload inspector");
    }
    return *deps.inspector;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

} // namespace

StatusManager::StatusManager(std::string name, std::string releaseVersion, const Dependencies& deps)
    : publisher_(requireStore(deps), std::move(name), std::move(releaseVersion), deps.queue_capacity),
      evaluator_(requireInspector(deps)) {
    spdlog::info("[StatusManager] Initialized for clusteroperator \"{}\"", publisher_.name());
}

StatusManager::~StatusManager() noexcept {
    stop();
}

void StatusManager::start() {
    publisher_.start();
}

void StatusManager::stop() {
    publisher_.stop();
}

void StatusManager::syncDegradedLocked() {
    Status status;
    status.reachedAvailableLevel = false;
    status.conditions.push_back(tracker_.resolve());
    if (!publisher_.enqueue(std::move(status))) {
        spdlog::debug("[StatusManager] Degraded status not enqueued for \"{}\"", publisher_.name());
    }
}

void StatusManager::setDegraded(StatusLevel level, const std::string& reason, const std::string& message) {
    Condition degraded;
    degraded.type = ConditionType::Degraded;
    degraded.status = ConditionStatus::True;
    degraded.reason = reason;
    degraded.message = message;

    std::lock_guard<std::mutex> lock(state_mutex_);
    tracker_.setLevel(level, std::move(degraded));
    spdlog::warn("[StatusManager] Degraded at level {}: {} ({})", toString(level), reason, message);
    syncDegradedLocked();
}

void StatusManager::setNotDegraded(StatusLevel level) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (tracker_.isSet(level)) {
        spdlog::info("[StatusManager] Level {} no longer degraded", toString(level));
    }
    tracker_.clearLevel(level);
    syncDegradedLocked();
}

void StatusManager::setDaemonSets(std::vector<NamespacedName> daemonSets) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    daemon_sets_ = std::move(daemonSets);
}

void StatusManager::setDeployments(std::vector<NamespacedName> deployments) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    deployments_ = std::move(deployments);
}

void StatusManager::setRelatedObjects(std::vector<ObjectReference> relatedObjects) {
    publisher_.setRelatedObjects(std::move(relatedObjects));
}

void StatusManager::setFromPods() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    // Workloads that cannot be fetched count as progressing, not degraded
    tracker_.clearLevel(StatusLevel::POD_DEPLOYMENT);

    const EvaluationResult result = evaluator_.evaluate(daemon_sets_, deployments_, publisher_.releaseVersion());

    // One Status per call: the resolved Degraded condition travels with the
    // pod conditions, so versions are not cleared and re-set in between.
    Status status;
    status.reachedAvailableLevel = result.reachedAvailableLevel;
    status.conditions.push_back(tracker_.resolve());

    if (!result.progressing.empty()) {
        Condition progressing;
        progressing.type = ConditionType::Progressing;
        progressing.status = ConditionStatus::True;
        progressing.reason = "Deploying";
        progressing.message = joinLines(result.progressing);
        status.conditions.push_back(std::move(progressing));
    } else {
        Condition progressing;
        progressing.type = ConditionType::Progressing;
        progressing.status = ConditionStatus::False;

        Condition available;
        available.type = ConditionType::Available;
        available.status = ConditionStatus::True;

        status.conditions.push_back(std::move(progressing));
        status.conditions.push_back(std::move(available));
    }

    if (!publisher_.enqueue(std::move(status))) {
        spdlog::debug("[StatusManager] Pod status not enqueued for \"{}\"", publisher_.name());
    }
}

} // namespace OperatorStatus
