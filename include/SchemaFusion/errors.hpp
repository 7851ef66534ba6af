#pragma once

#include <string_view>
namespace SchemaFusion {


// ============================================================================
// Registration Errors (schema build time, fatal to defining the record type)
// ============================================================================

enum class RegistrationError {
    NO_ERROR,

    UNTYPED_CONTAINER,
    INVALID_MAP_KEY,
    UNSUPPORTED_TYPE,

    INVALID_DEFAULT,
    DEFAULT_NOT_IN_OPTIONS,
    INVALID_OPTIONS,

    DUPLICATE_FIELD,
    DUPLICATE_ALIAS,
    REGISTRY_NAME_TAKEN
};

constexpr std::string_view error_to_string(RegistrationError e) {
    switch(e) {
    case RegistrationError::NO_ERROR: return "NO_ERROR"; break;
    case RegistrationError::UNTYPED_CONTAINER: return "UNTYPED_CONTAINER"; break;
    case RegistrationError::INVALID_MAP_KEY: return "INVALID_MAP_KEY"; break;
    case RegistrationError::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE"; break;
    case RegistrationError::INVALID_DEFAULT: return "INVALID_DEFAULT"; break;
    case RegistrationError::DEFAULT_NOT_IN_OPTIONS: return "DEFAULT_NOT_IN_OPTIONS"; break;
    case RegistrationError::INVALID_OPTIONS: return "INVALID_OPTIONS"; break;
    case RegistrationError::DUPLICATE_FIELD: return "DUPLICATE_FIELD"; break;
    case RegistrationError::DUPLICATE_ALIAS: return "DUPLICATE_ALIAS"; break;
    case RegistrationError::REGISTRY_NAME_TAKEN: return "REGISTRY_NAME_TAKEN"; break;
    }
    return "N/A";
}


// ============================================================================
// Construction Errors (per construction call, first error wins)
// ============================================================================

enum class ConstructionError {
    NO_ERROR,

    WRONG_TYPE,
    UNKNOWN_ARGUMENT,
    MISSING_REQUIRED_ARGUMENT,
    UNSUPPORTED_TYPE,
    VALUE_NOT_AN_OPTION,
    USAGE_ERROR,

    DEPTH_LIMIT_EXCEEDED
};

constexpr std::string_view error_to_string(ConstructionError e) {
    switch(e) {
    case ConstructionError::NO_ERROR: return "NO_ERROR"; break;
    case ConstructionError::WRONG_TYPE: return "WRONG_TYPE"; break;
    case ConstructionError::UNKNOWN_ARGUMENT: return "UNKNOWN_ARGUMENT"; break;
    case ConstructionError::MISSING_REQUIRED_ARGUMENT: return "MISSING_REQUIRED_ARGUMENT"; break;
    case ConstructionError::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE"; break;
    case ConstructionError::VALUE_NOT_AN_OPTION: return "VALUE_NOT_AN_OPTION"; break;
    case ConstructionError::USAGE_ERROR: return "USAGE_ERROR"; break;
    case ConstructionError::DEPTH_LIMIT_EXCEEDED: return "DEPTH_LIMIT_EXCEEDED"; break;
    }
    return "N/A";
}

} // namespace SchemaFusion
