#pragma once

#include <format>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "type_descriptor.hpp"
#include "schema.hpp"

namespace SchemaFusion {

struct DescriptorCheck {
    RegistrationError m_error = RegistrationError::NO_ERROR;
    std::string       detail;

    operator bool() const {
        return m_error == RegistrationError::NO_ERROR;
    }
    RegistrationError error() const {
        return m_error;
    }
};

namespace schema_validator_detail {

inline bool map_key_allowed(const TypeDescriptor & key) {
    switch(key.kind()) {
    case TypeKind::Integer:
    case TypeKind::Float:
    case TypeKind::String:
    case TypeKind::Any:
        return true;
    default:
        return false;
    }
}

} // namespace schema_validator_detail

// Rejects descriptors the resolver cannot check. Runs once per field at registration.
inline DescriptorCheck ValidateDescriptor(std::string_view fieldName, const TypeDescriptor & type) {
    switch(type.kind()) {
    case TypeKind::Integer:
    case TypeKind::Float:
    case TypeKind::String:
    case TypeKind::Boolean:
    case TypeKind::Any:
        return {};

    case TypeKind::UntypedList:
    case TypeKind::UntypedMap:
        return {RegistrationError::UNTYPED_CONTAINER,
                std::format("cannot use untyped '{}' for '{}', add element type(s)", type.toString(), fieldName)};

    case TypeKind::List:
        return ValidateDescriptor(fieldName, type.element());

    case TypeKind::Map:
        if(!schema_validator_detail::map_key_allowed(type.key())) {
            return {RegistrationError::INVALID_MAP_KEY,
                    std::format("map '{}' cannot use key type '{}', only integer, float, string or any are allowed",
                                fieldName, type.key().toString())};
        }
        return ValidateDescriptor(fieldName, type.value());

    case TypeKind::Nested:
        if(!type.schema()) {
            return {RegistrationError::UNSUPPORTED_TYPE,
                    std::format("nested record of '{}' refers to no schema", fieldName)};
        }
        return {};

    case TypeKind::None:
        break;
    }
    return {RegistrationError::UNSUPPORTED_TYPE,
            std::format("unsupported type '{}' of '{}'", type.toString(), fieldName)};
}

} // namespace SchemaFusion
