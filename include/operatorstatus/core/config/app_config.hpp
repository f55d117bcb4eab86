#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct ClusterOperatorConfig {
    std::string name;
    // Overridden by RELEASE_VERSION when that variable is set
    std::string release_version;
};

struct PublisherConfig {
    size_t queue_capacity = 5;
};

struct LoggingConfig {
    std::string level = "info";
};

struct StoreConfig {
    std::string path;
};

struct WorkloadsConfig {
    std::string state_file;
    uint32_t sync_interval_ms = 2000;
    std::vector<std::string> daemonsets;
    std::vector<std::string> deployments;
};

struct RelatedObjectConfig {
    std::string group;
    std::string resource;
    std::string ns;
    std::string name;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    ClusterOperatorConfig cluster_operator;
    PublisherConfig publisher;
    LoggingConfig logging;
    StoreConfig store;
    WorkloadsConfig workloads;
    std::vector<RelatedObjectConfig> related_objects;
};

} // namespace AppConfig
