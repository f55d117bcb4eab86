// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <operatorstatus/core/config/loader.hpp>
#include <operatorstatus/core/config/app_config.hpp>
#include <cstdlib>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    unsetenv("RELEASE_VERSION");
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "OperatorStatusCore");
    EXPECT_EQ(config.version, "1.0.0");

    EXPECT_EQ(config.cluster_operator.name, "network");
    EXPECT_EQ(config.cluster_operator.release_version, "4.1.0");
    EXPECT_EQ(config.publisher.queue_capacity, 5u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.store.path, "state/clusteroperators");

    // Verify workloads
    EXPECT_EQ(config.workloads.state_file, "config/workloads.yaml");
    EXPECT_EQ(config.workloads.sync_interval_ms, 2000u);
    ASSERT_EQ(config.workloads.daemonsets.size(), 2u);
    EXPECT_EQ(config.workloads.daemonsets[0], "openshift-sdn/sdn");
    ASSERT_EQ(config.workloads.deployments.size(), 1u);

    ASSERT_EQ(config.related_objects.size(), 2u);
    EXPECT_EQ(config.related_objects[0].group, "");
    EXPECT_EQ(config.related_objects[0].resource, "namespaces");
    EXPECT_EQ(config.related_objects[1].group, "operator.openshift.io");
    EXPECT_EQ(config.related_objects[1].name, "cluster");
}

TEST(ConfigLoader, ReleaseVersionEnvironmentOverride) {
    setenv("RELEASE_VERSION", "4.2.0-rc.1", 1);
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");
    unsetenv("RELEASE_VERSION");

    EXPECT_EQ(config.cluster_operator.release_version, "4.2.0-rc.1");
}

TEST(ConfigLoader, OptionalSectionsUseDefaults) {
    unsetenv("RELEASE_VERSION");
    // Only the required fields are present
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/validConfig/minimal.yaml");

    EXPECT_EQ(config.app_name, "OperatorStatusCore");
    EXPECT_TRUE(config.cluster_operator.release_version.empty());
    EXPECT_EQ(config.publisher.queue_capacity, 5u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.workloads.sync_interval_ms, 2000u);
    EXPECT_TRUE(config.workloads.daemonsets.empty());
    EXPECT_TRUE(config.related_objects.empty());
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownLogLevel) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_log_level.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMalformedWorkloadName) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_workload_name.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnTooShortSyncInterval) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_sync_interval.yaml"),
        std::runtime_error
    );
}
