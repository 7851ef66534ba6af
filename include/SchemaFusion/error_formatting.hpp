#pragma once

#include <format>
#include <string>

#include "errors.hpp"
#include "construct_result.hpp"

namespace SchemaFusion {

inline std::string ConstructResultToString(const ConstructResult & res) {
    if(res) {
        return "OK";
    }
    const std::string path = res.errorPath().toString();
    std::string detail;
    switch(res.error()) {
    case ConstructionError::UNKNOWN_ARGUMENT:
        detail = std::format(": unexpected key with value {}", res.valueText());
        break;
    case ConstructionError::MISSING_REQUIRED_ARGUMENT:
        detail = std::format(": expected {}", res.expected());
        break;
    case ConstructionError::VALUE_NOT_AN_OPTION:
        detail = std::format(": {} is not one of {}", res.valueText(), res.expected());
        break;
    case ConstructionError::DEPTH_LIMIT_EXCEEDED:
        detail = std::format(": {}", res.expected());
        break;
    default:
        if(!res.valueText().empty() || !res.expected().empty()) {
            detail = std::format(": got {}, expected {}", res.valueText(), res.expected());
        }
        break;
    }
    return std::format("When constructing {} at {}, error '{}'{}",
                       res.recordName(), path, error_to_string(res.error()), detail);
}

inline std::string RegistrationResultToString(const RegistrationResult & res) {
    if(res) {
        return "OK";
    }
    if(res.fieldName().empty()) {
        return std::format("Registration error '{}': {}", error_to_string(res.error()), res.detail());
    }
    return std::format("When registering field '{}', error '{}': {}",
                       res.fieldName(), error_to_string(res.error()), res.detail());
}

} // namespace SchemaFusion
