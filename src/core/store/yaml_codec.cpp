#include <operatorstatus/core/store/yaml_codec.hpp>

namespace OperatorStatus {

std::string renderConditions(const std::vector<Condition>& conditions) {
    YAML::Emitter out;
    out << YAML::Node(conditions);
    if (!out.good()) {
        return "(failed to convert to YAML: " + out.GetLastError() + ")";
    }
    return out.c_str();
}

} // namespace OperatorStatus

namespace YAML {

using OperatorStatus::ClusterOperator;
using OperatorStatus::Condition;
using OperatorStatus::ObjectReference;
using OperatorStatus::OperandVersion;

Node convert<Condition>::encode(const Condition& rhs) {
    Node node;
    node["type"] = OperatorStatus::toString(rhs.type);
    node["status"] = OperatorStatus::toString(rhs.status);
    node["lastTransitionTime"] = OperatorStatus::formatTimestamp(rhs.lastTransitionTime);
    if (!rhs.reason.empty()) {
        node["reason"] = rhs.reason;
    }
    if (!rhs.message.empty()) {
        node["message"] = rhs.message;
    }
    return node;
}

bool convert<Condition>::decode(const Node& node, Condition& rhs) {
    if (!node.IsMap() || !node["type"] || !node["status"]) {
        return false;
    }

    auto type = OperatorStatus::parseConditionType(node["type"].as<std::string>());
    auto status = OperatorStatus::parseConditionStatus(node["status"].as<std::string>());
    if (!type || !status) {
        return false;
    }

    rhs.type = *type;
    rhs.status = *status;
    rhs.reason = node["reason"] ? node["reason"].as<std::string>() : std::string();
    rhs.message = node["message"] ? node["message"].as<std::string>() : std::string();
    rhs.lastTransitionTime = {};

    if (node["lastTransitionTime"]) {
        auto tp = OperatorStatus::parseTimestamp(node["lastTransitionTime"].as<std::string>());
        if (!tp) {
            return false;
        }
        rhs.lastTransitionTime = *tp;
    }
    return true;
}

Node convert<OperandVersion>::encode(const OperandVersion& rhs) {
    Node node;
    node["name"] = rhs.name;
    node["version"] = rhs.version;
    return node;
}

bool convert<OperandVersion>::decode(const Node& node, OperandVersion& rhs) {
    if (!node.IsMap() || !node["name"] || !node["version"]) {
        return false;
    }
    rhs.name = node["name"].as<std::string>();
    rhs.version = node["version"].as<std::string>();
    return true;
}

Node convert<ObjectReference>::encode(const ObjectReference& rhs) {
    Node node;
    node["group"] = rhs.group;
    node["resource"] = rhs.resource;
    if (!rhs.ns.empty()) {
        node["namespace"] = rhs.ns;
    }
    node["name"] = rhs.name;
    return node;
}

bool convert<ObjectReference>::decode(const Node& node, ObjectReference& rhs) {
    if (!node.IsMap() || !node["resource"] || !node["name"]) {
        return false;
    }
    rhs.group = node["group"] ? node["group"].as<std::string>() : std::string();
    rhs.resource = node["resource"].as<std::string>();
    rhs.ns = node["namespace"] ? node["namespace"].as<std::string>() : std::string();
    rhs.name = node["name"].as<std::string>();
    return true;
}

Node convert<ClusterOperator>::encode(const ClusterOperator& rhs) {
    Node node;
    node["name"] = rhs.name;

    Node status(NodeType::Map);
    status["conditions"] = Node(NodeType::Sequence);
    for (const auto& c : rhs.status.conditions) {
        status["conditions"].push_back(c);
    }
    status["versions"] = Node(NodeType::Sequence);
    for (const auto& v : rhs.status.versions) {
        status["versions"].push_back(v);
    }
    status["relatedObjects"] = Node(NodeType::Sequence);
    for (const auto& r : rhs.status.relatedObjects) {
        status["relatedObjects"].push_back(r);
    }
    node["status"] = status;
    return node;
}

bool convert<ClusterOperator>::decode(const Node& node, ClusterOperator& rhs) {
    if (!node.IsMap() || !node["name"]) {
        return false;
    }
    rhs.name = node["name"].as<std::string>();
    rhs.status = {};

    const Node status = node["status"];
    if (!status) {
        return true;
    }
    if (!status.IsMap()) {
        return false;
    }
    if (status["conditions"]) {
        rhs.status.conditions = status["conditions"].as<std::vector<Condition>>();
    }
    if (status["versions"]) {
        rhs.status.versions = status["versions"].as<std::vector<OperandVersion>>();
    }
    if (status["relatedObjects"]) {
        rhs.status.relatedObjects = status["relatedObjects"].as<std::vector<ObjectReference>>();
    }
    return true;
}

} // namespace YAML
