#pragma once

#include <operatorstatus/core/store/cluster_operator.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace OperatorStatus {

/**
 * Render a condition set as a YAML block for log lines.
 */
std::string renderConditions(const std::vector<Condition>& conditions);

} // namespace OperatorStatus

// yaml-cpp conversions for the persisted resource. Empty reason/message
// fields are omitted on encode and optional on decode.
namespace YAML {

template<>
struct convert<OperatorStatus::Condition> {
    static Node encode(const OperatorStatus::Condition& rhs);
    static bool decode(const Node& node, OperatorStatus::Condition& rhs);
};

template<>
struct convert<OperatorStatus::OperandVersion> {
    static Node encode(const OperatorStatus::OperandVersion& rhs);
    static bool decode(const Node& node, OperatorStatus::OperandVersion& rhs);
};

template<>
struct convert<OperatorStatus::ObjectReference> {
    static Node encode(const OperatorStatus::ObjectReference& rhs);
    static bool decode(const Node& node, OperatorStatus::ObjectReference& rhs);
};

template<>
struct convert<OperatorStatus::ClusterOperator> {
    static Node encode(const OperatorStatus::ClusterOperator& rhs);
    static bool decode(const Node& node, OperatorStatus::ClusterOperator& rhs);
};

} // namespace YAML
