#include <operatorstatus/core/publisher/status_publisher.hpp>
#include <operatorstatus/core/store/yaml_codec.hpp>
#include <spdlog/spdlog.h>

namespace OperatorStatus {

StatusPublisher::StatusPublisher(ObjectStore& store, std::string name, std::string releaseVersion,
                                 size_t queueCapacity)
    : store_(store),
      name_(std::move(name)),
      release_version_(std::move(releaseVersion)),
      queue_(queueCapacity) {
    spdlog::info("[StatusPublisher] Initialized for clusteroperator \"{}\" (release: {}, queue capacity: {})",
                 name_, release_version_.empty() ? "<unset>" : release_version_, queueCapacity);
}

StatusPublisher::~StatusPublisher() noexcept {
    stop();
}

void StatusPublisher::start() {
    if (queue_.closed()) {
        spdlog::warn("[StatusPublisher] start() ignored: publisher stopped");
        return;
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        spdlog::warn("[StatusPublisher] start() ignored: already running");
        return;
    }
    worker_thread_ = std::thread(&StatusPublisher::runLoop, this);
    spdlog::info("[StatusPublisher] Started.");
}

void StatusPublisher::stop() {
    running_.store(false, std::memory_order_release);
    queue_.close();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[StatusPublisher] Stopped (published: {}, skipped: {}, failed: {})",
                     publishedCount(), skippedCount(), failedCount());
    }
}

bool StatusPublisher::enqueue(Status status) {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++pending_;
    }
    if (queue_.closed()) {
        spdlog::warn("[StatusPublisher] Publisher stopped, dropping status update");
        markDone();
        return false;
    }

    // Without a worker nothing drains the queue, so never wait for a slot
    if (!running_.load(std::memory_order_acquire)) {
        if (!queue_.tryPush(std::move(status))) {
            spdlog::warn("[StatusPublisher] Publisher not started and queue full, dropping status update");
            markDone();
            return false;
        }
        return true;
    }

    if (!queue_.push(std::move(status))) {
        spdlog::warn("[StatusPublisher] Publisher stopped, dropping status update");
        markDone();
        return false;
    }
    return true;
}

void StatusPublisher::setRelatedObjects(std::vector<ObjectReference> relatedObjects) {
    std::lock_guard<std::mutex> lock(related_mutex_);
    related_objects_ = std::move(relatedObjects);
}

std::vector<ObjectReference> StatusPublisher::relatedObjects() const {
    std::lock_guard<std::mutex> lock(related_mutex_);
    return related_objects_;
}

bool StatusPublisher::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [&]() { return pending_ == 0; });
}

void StatusPublisher::markDone() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --pending_;
    }
    idle_cv_.notify_all();
}

void StatusPublisher::runLoop() {
    spdlog::info("[StatusPublisher] Worker started.");

    // pop() keeps returning queued items after close(), so stop() drains
    while (auto status = queue_.pop()) {
        try {
            publish(*status);
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[StatusPublisher] Failed to publish status for \"{}\": {}", name_, e.what());
        }
        markDone();
    }

    spdlog::info("[StatusPublisher] Worker stopped.");
}

void StatusPublisher::publish(const Status& status) {
    ClusterOperator co;
    co.name = name_;

    bool isNotFound = false;
    try {
        co = store_.get(name_);
    } catch (const NotFoundError&) {
        isNotFound = true;
    } catch (const StoreError& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[StatusPublisher] Failed to get ClusterOperator \"{}\": {}", name_, e.what());
        return;
    }

    const ClusterOperatorStatus oldStatus = co.status;
    co.status.relatedObjects = relatedObjects();

    if (status.reachedAvailableLevel && !release_version_.empty()) {
        co.status.versions = {OperandVersion{OPERATOR_VERSION_NAME, release_version_}};
    } else {
        co.status.versions.clear();
    }

    for (const auto& condition : status.conditions) {
        setStatusCondition(co.status.conditions, condition);
    }

    // Never report Progressing before Available has been set at least once
    const Condition* progressing = findStatusCondition(co.status.conditions, ConditionType::Progressing);
    const Condition* available = findStatusCondition(co.status.conditions, ConditionType::Available);
    if (available == nullptr && progressing != nullptr && progressing->status == ConditionStatus::True) {
        Condition startup;
        startup.type = ConditionType::Available;
        startup.status = ConditionStatus::False;
        startup.reason = "Startup";
        startup.message = "The operator is starting up";
        setStatusCondition(co.status.conditions, startup);
    }

    Condition upgradeable;
    upgradeable.type = ConditionType::Upgradeable;
    upgradeable.status = ConditionStatus::True;
    setStatusCondition(co.status.conditions, upgradeable);

    if (co.status == oldStatus) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    const std::string rendered = renderConditions(co.status.conditions);
    if (isNotFound) {
        try {
            store_.create(co);
        } catch (const StoreError& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[StatusPublisher] Failed to create ClusterOperator \"{}\": {}", co.name, e.what());
            return;
        }
        published_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[StatusPublisher] Created ClusterOperator with conditions:\n{}", rendered);
    } else {
        try {
            store_.updateStatus(co);
        } catch (const StoreError& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[StatusPublisher] Failed to update ClusterOperator \"{}\": {}", co.name, e.what());
            return;
        }
        published_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[StatusPublisher] Updated ClusterOperator with conditions:\n{}", rendered);
    }
}

} // namespace OperatorStatus
