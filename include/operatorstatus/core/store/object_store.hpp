#pragma once

#include <operatorstatus/core/store/cluster_operator.hpp>
#include <stdexcept>
#include <string>

namespace OperatorStatus {

/**
 * Store failure that is not "not found". Logged and dropped by the
 * publisher; the next enqueued Status is the recovery path.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Expected on first publish; routes the publisher to create()
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& name)
        : StoreError("clusteroperator \"" + name + "\" not found") {}
};

/**
 * @class ObjectStore
 * @brief Backing store for ClusterOperator resources
 *
 * Implementations must be safe to call from the publisher worker while
 * other threads read the store.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @throws NotFoundError when no resource has that name
     * @throws StoreError on any other failure
     */
    virtual ClusterOperator get(const std::string& name) = 0;

    /**
     * @throws StoreError, including when the resource already exists
     */
    virtual void create(const ClusterOperator& co) = 0;

    /**
     * @brief Replace the status of an existing resource
     * @throws NotFoundError when the resource vanished since get()
     * @throws StoreError on any other failure
     */
    virtual void updateStatus(const ClusterOperator& co) = 0;
};

} // namespace OperatorStatus
