#pragma once

#include <operatorstatus/core/store/object_store.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace OperatorStatus {

/**
 * @class FileObjectStore
 * @brief ObjectStore persisting each resource as <dir>/<name>.yaml
 *
 * Writes go to a temporary file first and are renamed into place, so a
 * reader never sees a half-written resource.
 */
class FileObjectStore : public ObjectStore {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit FileObjectStore(const std::string& directory);
    ~FileObjectStore() override = default;

    ClusterOperator get(const std::string& name) override;
    void create(const ClusterOperator& co) override;
    void updateStatus(const ClusterOperator& co) override;

    std::filesystem::path pathFor(const std::string& name) const;

private:
    ClusterOperator readLocked(const std::string& name) const;
    void writeLocked(const ClusterOperator& co);

    std::filesystem::path directory_;
    std::mutex mutex_;
};

} // namespace OperatorStatus
