#pragma once

#include <operatorstatus/core/publisher/status_publisher.hpp>
#include <operatorstatus/core/status/degraded_tracker.hpp>
#include <operatorstatus/core/workload/status_evaluator.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace OperatorStatus {

/**
 * @class StatusManager
 * @brief Coordinates changes to one ClusterOperator's status
 *
 * Entry point for reconcilers. Degraded conditions are tracked per
 * StatusLevel; workload lists feed setFromPods(). Every resulting Status
 * goes through the StatusPublisher, so writes are serialized.
 *
 * All methods may be called concurrently. The tracker and workload lists
 * are guarded by one mutex that is held across resolve and enqueue, so
 * Status values are enqueued in the order the state changed.
 *
 * Call start() before reporting. Until then at most queue_capacity Status
 * values are held; later ones are dropped with a warning rather than
 * blocking the caller while it holds the mutex.
 */
class StatusManager {
public:
    /**
     * Dependencies and knobs. store and inspector must outlive the manager.
     */
    struct Dependencies {
        ObjectStore* store = nullptr;
        WorkloadInspector* inspector = nullptr;
        size_t queue_capacity = StatusPublisher::DEFAULT_QUEUE_CAPACITY;
    };

    /**
     * @param name ClusterOperator resource name
     * @param releaseVersion Target release; gates version publication
     * @throws std::invalid_argument if store or inspector is missing
     */
    StatusManager(std::string name, std::string releaseVersion, const Dependencies& deps);
    ~StatusManager() noexcept;

    StatusManager(const StatusManager&) = delete;
    StatusManager& operator=(const StatusManager&) = delete;

    void start();
    void stop();

    /**
     * @brief Mark the operator Degraded at level
     *
     * Surfaced unless a higher-priority (lower) level is already degraded.
     */
    void setDegraded(StatusLevel level, const std::string& reason, const std::string& message);

    /**
     * @brief Clear level; the next populated level, or Degraded=False, is published
     */
    void setNotDegraded(StatusLevel level);

    // Wholesale replacement, no publish
    void setDaemonSets(std::vector<NamespacedName> daemonSets);
    void setDeployments(std::vector<NamespacedName> deployments);
    void setRelatedObjects(std::vector<ObjectReference> relatedObjects);

    /**
     * @brief Derive Progressing/Available from the tracked workloads
     *
     * Clears the POD_DEPLOYMENT degraded level and enqueues exactly one
     * Status: the resolved Degraded condition plus either
     * Progressing=True (reason "Deploying", one line per workload) or
     * Progressing=False together with Available=True.
     */
    void setFromPods();

    bool waitIdle(std::chrono::milliseconds timeout) const {
        return publisher_.waitIdle(timeout);
    }

    const std::string& name() const { return publisher_.name(); }
    const std::string& releaseVersion() const { return publisher_.releaseVersion(); }

    const StatusPublisher& publisher() const { return publisher_; }

private:
    // Callers hold state_mutex_
    void syncDegradedLocked();

    StatusPublisher publisher_;
    WorkloadStatusEvaluator evaluator_;

    mutable std::mutex state_mutex_;
    DegradedLevelTracker tracker_;
    std::vector<NamespacedName> daemon_sets_;
    std::vector<NamespacedName> deployments_;
};

} // namespace OperatorStatus
