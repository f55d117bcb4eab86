// ============================================================================
// WORKLOAD STATUS EVALUATOR UNIT TESTS
// ============================================================================
// Precedence of progressing messages and the reachedAvailableLevel fold
// ============================================================================

#include <gtest/gtest.h>
#include <operatorstatus/core/workload/status_evaluator.hpp>

using namespace OperatorStatus;

namespace {

const std::string TARGET = "4.1.0";

DaemonSetState readyDaemonSet() {
    DaemonSetState ds;
    ds.generation = 2;
    ds.observedGeneration = 2;
    ds.desiredNumberScheduled = 3;
    ds.updatedNumberScheduled = 3;
    ds.numberAvailable = 3;
    ds.numberUnavailable = 0;
    ds.annotations[VERSION_ANNOTATION] = TARGET;
    return ds;
}

DeploymentState readyDeployment() {
    DeploymentState dep;
    dep.generation = 1;
    dep.observedGeneration = 1;
    dep.replicas = 2;
    dep.updatedReplicas = 2;
    dep.availableReplicas = 2;
    dep.unavailableReplicas = 0;
    dep.annotations[VERSION_ANNOTATION] = TARGET;
    return dep;
}

class WorkloadStatusEvaluatorTest : public ::testing::Test {
protected:
    StaticWorkloadInspector inspector;
    WorkloadStatusEvaluator evaluator{inspector};

    const NamespacedName sdn{"openshift-sdn", "sdn"};
    const NamespacedName ovs{"openshift-sdn", "ovs"};
    const NamespacedName operatorDep{"openshift-network-operator", "network-operator"};
};

} // namespace

// ============================================================================
// BASELINE
// ============================================================================

TEST_F(WorkloadStatusEvaluatorTest, NoWorkloadsIsNotAvailable) {
    EvaluationResult result = evaluator.evaluate({}, {}, TARGET);
    EXPECT_FALSE(result.reachedAvailableLevel);
    EXPECT_TRUE(result.progressing.empty());
}

TEST_F(WorkloadStatusEvaluatorTest, FullyRolledOutDaemonSet) {
    inspector.setDaemonSet(sdn, readyDaemonSet());
    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);

    EXPECT_TRUE(result.reachedAvailableLevel);
    EXPECT_TRUE(result.progressing.empty());
}

TEST_F(WorkloadStatusEvaluatorTest, FullyRolledOutDeployment) {
    inspector.setDeployment(operatorDep, readyDeployment());
    EvaluationResult result = evaluator.evaluate({}, {operatorDep}, TARGET);

    EXPECT_TRUE(result.reachedAvailableLevel);
    EXPECT_TRUE(result.progressing.empty());
}

// ============================================================================
// DAEMONSET PRECEDENCE
// ============================================================================

TEST_F(WorkloadStatusEvaluatorTest, DaemonSetRolloutWinsOverOtherChecks) {
    DaemonSetState ds = readyDaemonSet();
    ds.updatedNumberScheduled = 1;
    ds.numberUnavailable = 2;
    ds.generation = 3;
    inspector.setDaemonSet(sdn, ds);

    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0], "DaemonSet \"openshift-sdn/sdn\" update is rolling out (1 out of 3 updated)");
    EXPECT_FALSE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, DaemonSetUnavailableNodes) {
    DaemonSetState ds = readyDaemonSet();
    ds.numberUnavailable = 2;
    ds.numberAvailable = 0;
    inspector.setDaemonSet(sdn, ds);

    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0], "DaemonSet \"openshift-sdn/sdn\" is not available (awaiting 2 nodes)");
    EXPECT_FALSE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, DaemonSetNotScheduled) {
    DaemonSetState ds = readyDaemonSet();
    ds.numberAvailable = 0;
    inspector.setDaemonSet(sdn, ds);

    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0], "DaemonSet \"openshift-sdn/sdn\" is not yet scheduled on any nodes");
    // Unscheduled does not by itself block the available level
    EXPECT_TRUE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, DaemonSetGenerationLag) {
    DaemonSetState ds = readyDaemonSet();
    ds.generation = 5;
    ds.observedGeneration = 4;
    inspector.setDaemonSet(sdn, ds);

    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0],
              "DaemonSet \"openshift-sdn/sdn\" update is being processed (generation 5, observed generation 4)");
    EXPECT_FALSE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, VersionMismatchBlocksLevelWithoutMessage) {
    DaemonSetState ds = readyDaemonSet();
    ds.annotations[VERSION_ANNOTATION] = "4.0.0";
    inspector.setDaemonSet(sdn, ds);

    EvaluationResult result = evaluator.evaluate({sdn}, {}, TARGET);
    EXPECT_TRUE(result.progressing.empty());
    EXPECT_FALSE(result.reachedAvailableLevel);
}

// ============================================================================
// DEPLOYMENT PRECEDENCE
// ============================================================================

TEST_F(WorkloadStatusEvaluatorTest, DeploymentUnavailableReplicas) {
    DeploymentState dep = readyDeployment();
    dep.unavailableReplicas = 1;
    dep.availableReplicas = 0;
    inspector.setDeployment(operatorDep, dep);

    EvaluationResult result = evaluator.evaluate({}, {operatorDep}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0],
              "Deployment \"openshift-network-operator/network-operator\" is not available (awaiting 1 nodes)");
    EXPECT_FALSE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, DeploymentNotScheduled) {
    DeploymentState dep = readyDeployment();
    dep.availableReplicas = 0;
    inspector.setDeployment(operatorDep, dep);

    EvaluationResult result = evaluator.evaluate({}, {operatorDep}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0],
              "Deployment \"openshift-network-operator/network-operator\" is not yet scheduled on any nodes");
    EXPECT_FALSE(result.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, DeploymentGenerationLag) {
    DeploymentState dep = readyDeployment();
    dep.generation = 4;
    dep.observedGeneration = 3;
    inspector.setDeployment(operatorDep, dep);

    EvaluationResult result = evaluator.evaluate({}, {operatorDep}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0],
              "Deployment \"openshift-network-operator/network-operator\" update is being processed "
              "(generation 4, observed generation 3)");
}

TEST_F(WorkloadStatusEvaluatorTest, DeploymentPartiallyUpdatedBlocksLevel) {
    DeploymentState dep = readyDeployment();
    dep.updatedReplicas = 1;
    inspector.setDeployment(operatorDep, dep);

    EvaluationResult result = evaluator.evaluate({}, {operatorDep}, TARGET);
    EXPECT_TRUE(result.progressing.empty());
    EXPECT_FALSE(result.reachedAvailableLevel);
}

// ============================================================================
// FETCH FAILURES AND FOLDING
// ============================================================================

TEST_F(WorkloadStatusEvaluatorTest, MissingWorkloadAddsWaitingMessage) {
    EvaluationResult result = evaluator.evaluate({sdn}, {operatorDep}, TARGET);

    ASSERT_EQ(result.progressing.size(), 2u);
    EXPECT_EQ(result.progressing[0], "Waiting for DaemonSet \"openshift-sdn/sdn\" to be created");
    EXPECT_EQ(result.progressing[1],
              "Waiting for Deployment \"openshift-network-operator/network-operator\" to be created");
}

TEST_F(WorkloadStatusEvaluatorTest, FetchFailureLeavesFoldUntouched) {
    // A failed fetch neither forces false nor excuses a later failure
    inspector.setDeployment(operatorDep, readyDeployment());
    EvaluationResult ok = evaluator.evaluate({sdn}, {operatorDep}, TARGET);
    EXPECT_TRUE(ok.reachedAvailableLevel);
    EXPECT_EQ(ok.progressing.size(), 1u);

    DeploymentState lagging = readyDeployment();
    lagging.updatedReplicas = 0;
    inspector.setDeployment(operatorDep, lagging);
    EvaluationResult blocked = evaluator.evaluate({sdn}, {operatorDep}, TARGET);
    EXPECT_FALSE(blocked.reachedAvailableLevel);
}

TEST_F(WorkloadStatusEvaluatorTest, EveryWorkloadInspectedAfterFoldReachesFalse) {
    DaemonSetState rolling = readyDaemonSet();
    rolling.updatedNumberScheduled = 2;
    inspector.setDaemonSet(sdn, rolling);

    DaemonSetState lagging = readyDaemonSet();
    lagging.generation = 7;
    lagging.observedGeneration = 6;
    inspector.setDaemonSet(ovs, lagging);

    DeploymentState unavailable = readyDeployment();
    unavailable.unavailableReplicas = 1;
    inspector.setDeployment(operatorDep, unavailable);

    EvaluationResult result = evaluator.evaluate({sdn, ovs}, {operatorDep}, TARGET);
    EXPECT_FALSE(result.reachedAvailableLevel);
    ASSERT_EQ(result.progressing.size(), 3u);
    EXPECT_NE(result.progressing[0].find("openshift-sdn/sdn\" update is rolling out"), std::string::npos);
    EXPECT_NE(result.progressing[1].find("openshift-sdn/ovs\" update is being processed"), std::string::npos);
    EXPECT_NE(result.progressing[2].find("is not available (awaiting 1 nodes)"), std::string::npos);
}

TEST_F(WorkloadStatusEvaluatorTest, DeletedWorkloadIsWaitingForCreation) {
    inspector.setDaemonSet(sdn, readyDaemonSet());
    inspector.setDeployment(operatorDep, readyDeployment());
    ASSERT_TRUE(evaluator.evaluate({sdn}, {operatorDep}, TARGET).progressing.empty());

    inspector.remove(WorkloadRef{WorkloadKind::DEPLOYMENT, operatorDep});
    EvaluationResult result = evaluator.evaluate({sdn}, {operatorDep}, TARGET);

    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0],
              "Waiting for Deployment \"openshift-network-operator/network-operator\" to be created");

    // Removing by kind leaves a same-named workload of the other kind alone
    inspector.remove(WorkloadRef{WorkloadKind::DEPLOYMENT, sdn});
    EXPECT_NO_THROW(inspector.getDaemonSet(sdn));
}

TEST_F(WorkloadStatusEvaluatorTest, NamespacelessNameRendersBare) {
    const NamespacedName bare{"", "cluster-dns"};
    EvaluationResult result = evaluator.evaluate({bare}, {}, TARGET);
    ASSERT_EQ(result.progressing.size(), 1u);
    EXPECT_EQ(result.progressing[0], "Waiting for DaemonSet \"cluster-dns\" to be created");
}
