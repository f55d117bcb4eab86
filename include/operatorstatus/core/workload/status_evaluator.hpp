#pragma once

#include <operatorstatus/core/workload/inspector.hpp>
#include <string>
#include <vector>

namespace OperatorStatus {

struct EvaluationResult {
    // True only if at least one workload is tracked and all are rolled out
    // at the target version
    bool reachedAvailableLevel = false;

    // One line per workload still rolling out, in iteration order
    std::vector<std::string> progressing;
};

/**
 * @class WorkloadStatusEvaluator
 * @brief Translates observed workload state into an availability verdict
 *
 * DaemonSets are inspected first, then Deployments. Each workload
 * contributes at most one progressing message (first matching check
 * wins) and may fold reachedAvailableLevel down to false. Every workload
 * is inspected even after the fold reaches false.
 *
 * A workload that cannot be fetched adds a "Waiting for ... to be
 * created" message and leaves the fold untouched.
 */
class WorkloadStatusEvaluator {
public:
    explicit WorkloadStatusEvaluator(WorkloadInspector& inspector)
        : inspector_(inspector) {}

    EvaluationResult evaluate(const std::vector<NamespacedName>& daemonSets,
                              const std::vector<NamespacedName>& deployments,
                              const std::string& targetVersion) const;

private:
    void evaluateDaemonSet(const NamespacedName& id, const std::string& targetVersion,
                           EvaluationResult& result) const;
    void evaluateDeployment(const NamespacedName& id, const std::string& targetVersion,
                            EvaluationResult& result) const;

    WorkloadInspector& inspector_;
};

} // namespace OperatorStatus
