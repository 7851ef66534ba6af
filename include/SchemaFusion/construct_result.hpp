#pragma once

#include <memory>
#include <string>
#include <utility>

#include "errors.hpp"
#include "path.hpp"
#include "value.hpp"
#include "schema.hpp"

namespace SchemaFusion {


class ConstructResult {
    ConstructionError m_error = ConstructionError::NO_ERROR;
    path::Path        currentPath;
    std::string       m_valueText;
    std::string       m_expected;
    std::string       m_recordName;
    RecordRef         m_instance;

public:
    ConstructResult(ConstructionError err, path::Path errPath, std::string valueText,
                    std::string expected, std::string recordName, RecordRef instance):
        m_error(err), currentPath(std::move(errPath)), m_valueText(std::move(valueText)),
        m_expected(std::move(expected)), m_recordName(std::move(recordName)), m_instance(std::move(instance))
    {}
    operator bool() const {
        return m_error == ConstructionError::NO_ERROR;
    }

    ConstructionError error() const {
        return m_error;
    }
    const path::Path & errorPath() const {
        return currentPath;
    }
    // textual form of the offending value
    const std::string & valueText() const {
        return m_valueText;
    }
    // expected shape, or the allow-list for VALUE_NOT_AN_OPTION
    const std::string & expected() const {
        return m_expected;
    }
    // record being constructed when the error occurred
    const std::string & recordName() const {
        return m_recordName;
    }
    const RecordRef & instance() const {
        return m_instance;
    }
    const Instance & operator*() const {
        return *m_instance;
    }
    const Instance * operator->() const {
        return m_instance.get();
    }
};


class RegistrationResult {
    RegistrationError m_error = RegistrationError::NO_ERROR;
    std::string       m_fieldName;
    std::string       m_detail;
    SchemaPtr         m_schema;

public:
    RegistrationResult(SchemaPtr schema) : m_schema(std::move(schema)) {}

    RegistrationResult(RegistrationError err, std::string fieldName, std::string detail):
        m_error(err), m_fieldName(std::move(fieldName)), m_detail(std::move(detail))
    {}

    operator bool() const {
        return m_error == RegistrationError::NO_ERROR;
    }
    RegistrationError error() const {
        return m_error;
    }
    const std::string & fieldName() const {
        return m_fieldName;
    }
    const std::string & detail() const {
        return m_detail;
    }
    const SchemaPtr & schema() const {
        return m_schema;
    }
};


} // namespace SchemaFusion
