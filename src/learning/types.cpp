/*
 * HiveMem C++ - Learning types Implementation
 */
#include <hivemem/learning/types.hpp>

namespace hivemem {

Json TaskState::to_json() const {
    Json j;
    j["taskComplexity"] = task_complexity;
    j["requiredCapabilities"] = required_capabilities;
    j["contextFeatures"] = context_features;
    j["previousAttempts"] = previous_attempts;
    j["availableResources"] = available_resources;
    return j;
}

// Missing fields keep their defaults; a wrongly typed field throws
// Json::type_error, which callers turn into a validation failure
TaskState TaskState::from_json(const Json& j) {
    TaskState s;
    if (!j.is_object()) return s;
    s.task_complexity = j.value("taskComplexity", s.task_complexity);
    if (j.contains("requiredCapabilities") && j["requiredCapabilities"].is_array()) {
        for (const auto& cap : j["requiredCapabilities"]) {
            s.required_capabilities.push_back(cap.get<std::string>());
        }
    }
    if (j.contains("contextFeatures") && j["contextFeatures"].is_object()) {
        s.context_features = j["contextFeatures"];
    }
    s.previous_attempts = j.value("previousAttempts", s.previous_attempts);
    s.available_resources = j.value("availableResources", s.available_resources);
    return s;
}

Json StrategyRecommendation::to_json() const {
    Json j;
    j["strategy"] = strategy;
    j["confidence"] = confidence;
    j["expectedValue"] = expected_value;
    j["reasoning"] = reasoning;
    j["alternatives"] = alternatives;
    return j;
}

} // namespace hivemem
