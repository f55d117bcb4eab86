#include <operatorstatus/core/status/condition.hpp>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace OperatorStatus {

namespace {

std::chrono::system_clock::time_point nowSeconds() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace

bool operator==(const Condition& lhs, const Condition& rhs) {
    return lhs.type == rhs.type &&
           lhs.status == rhs.status &&
           lhs.reason == rhs.reason &&
           lhs.message == rhs.message &&
           lhs.lastTransitionTime == rhs.lastTransitionTime;
}

bool operator!=(const Condition& lhs, const Condition& rhs) {
    return !(lhs == rhs);
}

const char* toString(ConditionType type) {
    switch (type) {
        case ConditionType::Available:   return "Available";
        case ConditionType::Progressing: return "Progressing";
        case ConditionType::Degraded:    return "Degraded";
        case ConditionType::Upgradeable: return "Upgradeable";
        default:                         return "UNKNOWN";
    }
}

const char* toString(ConditionStatus status) {
    switch (status) {
        case ConditionStatus::True:    return "True";
        case ConditionStatus::False:   return "False";
        case ConditionStatus::Unknown: return "Unknown";
        default:                       return "Unknown";
    }
}

std::optional<ConditionType> parseConditionType(std::string_view text) {
    if (text == "Available")   return ConditionType::Available;
    if (text == "Progressing") return ConditionType::Progressing;
    if (text == "Degraded")    return ConditionType::Degraded;
    if (text == "Upgradeable") return ConditionType::Upgradeable;
    return std::nullopt;
}

std::optional<ConditionStatus> parseConditionStatus(std::string_view text) {
    if (text == "True")    return ConditionStatus::True;
    if (text == "False")   return ConditionStatus::False;
    if (text == "Unknown") return ConditionStatus::Unknown;
    return std::nullopt;
}

void setStatusCondition(std::vector<Condition>& conditions, const Condition& condition) {
    auto it = std::find_if(conditions.begin(), conditions.end(),
                           [&](const Condition& c) { return c.type == condition.type; });

    if (it == conditions.end()) {
        Condition added = condition;
        if (added.lastTransitionTime == std::chrono::system_clock::time_point{}) {
            added.lastTransitionTime = nowSeconds();
        }
        conditions.push_back(std::move(added));
        return;
    }

    if (it->status != condition.status) {
        it->status = condition.status;
        it->lastTransitionTime = condition.lastTransitionTime == std::chrono::system_clock::time_point{}
            ? nowSeconds()
            : condition.lastTransitionTime;
    }
    it->reason = condition.reason;
    it->message = condition.message;
}

const Condition* findStatusCondition(const std::vector<Condition>& conditions, ConditionType type) {
    for (const auto& c : conditions) {
        if (c.type == type) {
            return &c;
        }
    }
    return nullptr;
}

bool sameConditionSet(const std::vector<Condition>& lhs, const std::vector<Condition>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& c : lhs) {
        const Condition* other = findStatusCondition(rhs, c.type);
        if (other == nullptr || *other != c) {
            return false;
        }
    }
    return true;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::nullopt;
    }
    std::time_t t = timegm(&utc);
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace OperatorStatus
