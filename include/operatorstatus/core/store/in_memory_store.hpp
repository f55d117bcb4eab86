#pragma once

#include <operatorstatus/core/store/object_store.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace OperatorStatus {

/**
 * @class InMemoryObjectStore
 * @brief Thread-safe map-backed ObjectStore
 *
 * Counts successful writes and can be told to fail the next get, create
 * or update, which is how the publisher's failure paths are exercised.
 */
class InMemoryObjectStore : public ObjectStore {
public:
    InMemoryObjectStore() = default;
    ~InMemoryObjectStore() override = default;

    ClusterOperator get(const std::string& name) override;
    void create(const ClusterOperator& co) override;
    void updateStatus(const ClusterOperator& co) override;

    // Seed or overwrite a resource without counting a write
    void put(const ClusterOperator& co);
    std::optional<ClusterOperator> find(const std::string& name) const;

    void failNextGet(const std::string& message);
    void failNextCreate(const std::string& message);
    void failNextUpdate(const std::string& message);

    uint64_t createCount() const { return creates_.load(std::memory_order_relaxed); }
    uint64_t updateCount() const { return updates_.load(std::memory_order_relaxed); }
    uint64_t writeCount() const { return createCount() + updateCount(); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ClusterOperator> objects_;

    std::optional<std::string> get_failure_;
    std::optional<std::string> create_failure_;
    std::optional<std::string> update_failure_;

    std::atomic<uint64_t> creates_{0};
    std::atomic<uint64_t> updates_{0};
};

} // namespace OperatorStatus
