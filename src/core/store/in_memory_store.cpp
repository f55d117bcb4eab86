#include <operatorstatus/core/store/in_memory_store.hpp>
#include <spdlog/spdlog.h>

namespace OperatorStatus {

namespace {

// Consumes a one-shot injected failure
void throwIfArmed(std::optional<std::string>& failure) {
    if (failure) {
        std::string message = std::move(*failure);
        failure.reset();
        throw StoreError(message);
    }
}

} // namespace

ClusterOperator InMemoryObjectStore::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfArmed(get_failure_);

    auto it = objects_.find(name);
    if (it == objects_.end()) {
        throw NotFoundError(name);
    }
    return it->second;
}

void InMemoryObjectStore::create(const ClusterOperator& co) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfArmed(create_failure_);

    if (objects_.count(co.name) != 0) {
        throw StoreError("clusteroperator \"" + co.name + "\" already exists");
    }
    objects_.emplace(co.name, co);
    creates_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[InMemoryObjectStore] Created {}", co.name);
}

void InMemoryObjectStore::updateStatus(const ClusterOperator& co) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfArmed(update_failure_);

    auto it = objects_.find(co.name);
    if (it == objects_.end()) {
        throw NotFoundError(co.name);
    }
    it->second.status = co.status;
    updates_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[InMemoryObjectStore] Updated status of {}", co.name);
}

void InMemoryObjectStore::put(const ClusterOperator& co) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[co.name] = co;
}

std::optional<ClusterOperator> InMemoryObjectStore::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryObjectStore::failNextGet(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    get_failure_ = message;
}

void InMemoryObjectStore::failNextCreate(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    create_failure_ = message;
}

void InMemoryObjectStore::failNextUpdate(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_failure_ = message;
}

} // namespace OperatorStatus
