#pragma once

#include <operatorstatus/core/queues/bounded_queue.hpp>
#include <operatorstatus/core/status/status.hpp>
#include <operatorstatus/core/store/object_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace OperatorStatus {

/**
 * @class StatusPublisher
 * @brief Single writer for the ClusterOperator status
 *
 * Producers enqueue Status values; one worker thread drains them in FIFO
 * order and runs a full read-modify-write cycle for each:
 *
 *   get -> snapshot -> relatedObjects -> versions -> merge conditions
 *       -> Available "Startup" guard -> Upgradeable=True -> diff -> write
 *
 * An unchanged status is not written. Store failures are logged and the
 * Status is dropped; the next enqueued Status is the retry.
 */
class StatusPublisher {
public:
    static constexpr size_t DEFAULT_QUEUE_CAPACITY = 5;
    static constexpr const char* OPERATOR_VERSION_NAME = "operator";

    StatusPublisher(ObjectStore& store, std::string name, std::string releaseVersion,
                    size_t queueCapacity = DEFAULT_QUEUE_CAPACITY);
    ~StatusPublisher() noexcept;

    StatusPublisher(const StatusPublisher&) = delete;
    StatusPublisher& operator=(const StatusPublisher&) = delete;

    void start();

    /**
     * @brief Close the queue, drain what was already enqueued, join worker
     *
     * The publisher cannot be restarted afterwards.
     */
    void stop();

    /**
     * @brief Hand a Status to the worker, blocking while the queue is full
     *
     * Before start() the Status is queued only if a slot is free; a full
     * queue is refused instead of waiting on a worker that does not exist.
     *
     * @return false if the publisher has been stopped, or is not started
     *         and the queue is full
     */
    bool enqueue(Status status);

    void setRelatedObjects(std::vector<ObjectReference> relatedObjects);
    std::vector<ObjectReference> relatedObjects() const;

    /**
     * @brief Wait until every enqueued Status has been processed
     * @return false on timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout) const;

    const std::string& name() const { return name_; }
    const std::string& releaseVersion() const { return release_version_; }

    uint64_t publishedCount() const { return published_.load(std::memory_order_relaxed); }
    uint64_t skippedCount() const { return skipped_.load(std::memory_order_relaxed); }
    uint64_t failedCount() const { return failed_.load(std::memory_order_relaxed); }

private:
    void runLoop();
    void publish(const Status& status);
    void markDone();

    ObjectStore& store_;
    const std::string name_;
    const std::string release_version_;

    BoundedBlockingQueue<Status> queue_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex related_mutex_;
    std::vector<ObjectReference> related_objects_;

    // Enqueued but not yet fully processed
    mutable std::mutex idle_mutex_;
    mutable std::condition_variable idle_cv_;
    size_t pending_ = 0;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace OperatorStatus
