#include <operatorstatus/core/config/loader.hpp>
#include <operatorstatus/core/workload/workload.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdlib>
#include <stdexcept>

namespace {

constexpr uint32_t MIN_SYNC_INTERVAL_MS = 100;
constexpr std::array<const char*, 6> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "off"};

YAML::Node required(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template<typename T>
T read(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Invalid type for config field: " + path);
    }
}

std::vector<std::string> readWorkloadNames(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node) {
        return {};
    }
    auto names = read<std::vector<std::string>>(node, path);
    for (const auto& name : names) {
        try {
            OperatorStatus::NamespacedName::parse(name);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Invalid value for config field " + path + ": " + e.what());
        }
    }
    return names;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = root["app_name"] ? read<std::string>(root["app_name"], "app_name") : "OperatorStatusCore";
    config.version = root["version"] ? read<std::string>(root["version"], "version") : "1.0.0";

    // cluster_operator
    const YAML::Node co = required(root, "cluster_operator", "cluster_operator");
    config.cluster_operator.name = read<std::string>(required(co, "name", "cluster_operator.name"),
                                                     "cluster_operator.name");
    if (config.cluster_operator.name.empty()) {
        throw std::runtime_error("Invalid value for config field: cluster_operator.name must not be empty");
    }
    if (co["release_version"]) {
        config.cluster_operator.release_version =
            read<std::string>(co["release_version"], "cluster_operator.release_version");
    }
    if (const char* env = std::getenv("RELEASE_VERSION")) {
        spdlog::info("[ConfigLoader] RELEASE_VERSION overrides release version: {}", env);
        config.cluster_operator.release_version = env;
    }

    // publisher
    if (const YAML::Node publisher = root["publisher"]) {
        if (publisher["queue_capacity"]) {
            auto capacity = read<int64_t>(publisher["queue_capacity"], "publisher.queue_capacity");
            if (capacity < 1) {
                throw std::runtime_error("Invalid value for config field: publisher.queue_capacity must be >= 1");
            }
            config.publisher.queue_capacity = static_cast<size_t>(capacity);
        }
    }

    // logging
    if (const YAML::Node logging = root["logging"]) {
        if (logging["level"]) {
            config.logging.level = read<std::string>(logging["level"], "logging.level");
            bool known = false;
            for (const char* level : LOG_LEVELS) {
                known = known || config.logging.level == level;
            }
            if (!known) {
                throw std::runtime_error("Invalid value for config field: logging.level \"" +
                                         config.logging.level + "\"");
            }
        }
    }

    // store
    const YAML::Node store = required(root, "store", "store");
    config.store.path = read<std::string>(required(store, "path", "store.path"), "store.path");

    // workloads
    const YAML::Node workloads = required(root, "workloads", "workloads");
    config.workloads.state_file = read<std::string>(required(workloads, "state_file", "workloads.state_file"),
                                                    "workloads.state_file");
    if (workloads["sync_interval_ms"]) {
        auto interval = read<int64_t>(workloads["sync_interval_ms"], "workloads.sync_interval_ms");
        if (interval < MIN_SYNC_INTERVAL_MS) {
            throw std::runtime_error("Invalid value for config field: workloads.sync_interval_ms must be >= " +
                                     std::to_string(MIN_SYNC_INTERVAL_MS));
        }
        config.workloads.sync_interval_ms = static_cast<uint32_t>(interval);
    }
    config.workloads.daemonsets = readWorkloadNames(workloads, "daemonsets", "workloads.daemonsets");
    config.workloads.deployments = readWorkloadNames(workloads, "deployments", "workloads.deployments");

    // related_objects
    if (const YAML::Node related = root["related_objects"]) {
        if (!related.IsSequence()) {
            throw std::runtime_error("Invalid type for config field: related_objects");
        }
        for (size_t i = 0; i < related.size(); ++i) {
            const std::string path = "related_objects[" + std::to_string(i) + "]";
            const YAML::Node entry = related[i];
            AppConfig::RelatedObjectConfig ref;
            ref.group = entry["group"] ? read<std::string>(entry["group"], path + ".group") : "";
            ref.resource = read<std::string>(required(entry, "resource", path + ".resource"), path + ".resource");
            ref.ns = entry["namespace"] ? read<std::string>(entry["namespace"], path + ".namespace") : "";
            ref.name = read<std::string>(required(entry, "name", path + ".name"), path + ".name");
            config.related_objects.push_back(std::move(ref));
        }
    }

    return config;
}
