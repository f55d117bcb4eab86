#include <operatorstatus/core/store/file_store.hpp>
#include <operatorstatus/core/store/yaml_codec.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace OperatorStatus {

FileObjectStore::FileObjectStore(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("[FileObjectStore] Failed to create store directory {}: {}", directory, ec.message());
        throw std::runtime_error("Failed to create store directory " + directory);
    }
    spdlog::info("[FileObjectStore] Using store directory {}", directory_.string());
}

std::filesystem::path FileObjectStore::pathFor(const std::string& name) const {
    return directory_ / (name + ".yaml");
}

ClusterOperator FileObjectStore::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return readLocked(name);
}

void FileObjectStore::create(const ClusterOperator& co) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::filesystem::exists(pathFor(co.name))) {
        throw StoreError("clusteroperator \"" + co.name + "\" already exists");
    }
    writeLocked(co);
}

void FileObjectStore::updateStatus(const ClusterOperator& co) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClusterOperator current = readLocked(co.name);
    current.status = co.status;
    writeLocked(current);
}

ClusterOperator FileObjectStore::readLocked(const std::string& name) const {
    const auto path = pathFor(name);
    if (!std::filesystem::exists(path)) {
        throw NotFoundError(name);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return node.as<ClusterOperator>();
    } catch (const YAML::Exception& e) {
        throw StoreError("failed to read " + path.string() + ": " + e.what());
    }
}

void FileObjectStore::writeLocked(const ClusterOperator& co) {
    const auto path = pathFor(co.name);
    auto tmp = path;
    tmp += ".tmp";

    YAML::Emitter out;
    out << YAML::Node(co);
    if (!out.good()) {
        throw StoreError("failed to encode " + co.name + ": " + out.GetLastError());
    }

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw StoreError("failed to open " + tmp.string());
        }
        file << out.c_str() << '\n';
        if (!file.good()) {
            throw StoreError("failed to write " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw StoreError("failed to replace " + path.string() + ": " + ec.message());
    }
}

} // namespace OperatorStatus
