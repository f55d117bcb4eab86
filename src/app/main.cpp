#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <operatorstatus/core/config/loader.hpp>
#include <operatorstatus/core/manager/status_manager.hpp>
#include <operatorstatus/core/store/file_store.hpp>
#include <operatorstatus/core/workload/file_inspector.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("OperatorStatusCore v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static std::vector<OperatorStatus::NamespacedName> toNames(const std::vector<std::string>& names) {
    std::vector<OperatorStatus::NamespacedName> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(OperatorStatus::NamespacedName::parse(name));
    }
    return result;
}

static std::vector<OperatorStatus::ObjectReference> toReferences(
        const std::vector<AppConfig::RelatedObjectConfig>& related) {
    std::vector<OperatorStatus::ObjectReference> result;
    result.reserve(related.size());
    for (const auto& r : related) {
        result.push_back(OperatorStatus::ObjectReference{r.group, r.resource, r.ns, r.name});
    }
    return result;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: the manager references store and inspector
    std::unique_ptr<OperatorStatus::FileObjectStore> store;
    std::unique_ptr<OperatorStatus::FileWorkloadInspector> inspector;
    std::unique_ptr<OperatorStatus::StatusManager> statusManager;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.store = std::make_unique<OperatorStatus::FileObjectStore>(config.store.path);
    c.inspector = std::make_unique<OperatorStatus::FileWorkloadInspector>(config.workloads.state_file);

    OperatorStatus::StatusManager::Dependencies deps;
    deps.store = c.store.get();
    deps.inspector = c.inspector.get();
    deps.queue_capacity = config.publisher.queue_capacity;

    c.statusManager = std::make_unique<OperatorStatus::StatusManager>(
        config.cluster_operator.name, config.cluster_operator.release_version, deps);

    c.statusManager->setDaemonSets(toNames(config.workloads.daemonsets));
    c.statusManager->setDeployments(toNames(config.workloads.deployments));
    c.statusManager->setRelatedObjects(toReferences(config.related_objects));

    spdlog::info("Tracking {} daemonsets and {} deployments from {}",
                 config.workloads.daemonsets.size(), config.workloads.deployments.size(),
                 config.workloads.state_file);
    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");
    c.statusManager->start();

    // Configuration was loaded and applied; nothing is degraded at that level
    c.statusManager->setNotDegraded(OperatorStatus::StatusLevel::OPERATOR_CONFIG);
    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");
    if (c.statusManager) c.statusManager->stop();
    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config);
        startComponents(components);

        spdlog::info("OperatorStatusCore running. Press Ctrl+C to shutdown.");

        const auto interval = std::chrono::milliseconds(config.workloads.sync_interval_ms);
        auto nextSync = std::chrono::steady_clock::now();
        while (g_running.load(std::memory_order_acquire)) {
            if (std::chrono::steady_clock::now() >= nextSync) {
                components.statusManager->setFromPods();
                nextSync = std::chrono::steady_clock::now() + interval;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("Shutdown signal received");
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("OperatorStatusCore terminated gracefully");
    return EXIT_SUCCESS;
}
