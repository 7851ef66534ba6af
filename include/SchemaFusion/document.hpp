#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "value.hpp"

#ifndef SCHEMAFUSION_MAX_DOCUMENT_DEPTH
#define SCHEMAFUSION_MAX_DOCUMENT_DEPTH 512
#endif

namespace SchemaFusion {

enum class DocumentError {
    NO_ERROR,
    ILLFORMED_DOCUMENT,
    UNSUPPORTED_YAML_FEATURE,   // anchors, aliases, tags, multi-doc
    NUMERIC_VALUE_IS_OUT_OF_RANGE
};

constexpr std::string_view error_to_string(DocumentError e) {
    switch(e) {
    case DocumentError::NO_ERROR: return "NO_ERROR"; break;
    case DocumentError::ILLFORMED_DOCUMENT: return "ILLFORMED_DOCUMENT"; break;
    case DocumentError::UNSUPPORTED_YAML_FEATURE: return "UNSUPPORTED_YAML_FEATURE"; break;
    case DocumentError::NUMERIC_VALUE_IS_OUT_OF_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_RANGE"; break;
    }
    return "N/A";
}

// Untyped tree handed to Construct(), or the reason the text could not be read.
class DocumentResult {
    DocumentError m_error = DocumentError::NO_ERROR;
    std::string   m_message;
    Value         m_value;

public:
    DocumentResult(Value v) : m_value(std::move(v)) {}
    DocumentResult(DocumentError err, std::string message)
        : m_error(err), m_message(std::move(message)) {}

    operator bool() const {
        return m_error == DocumentError::NO_ERROR;
    }
    DocumentError error() const {
        return m_error;
    }
    const std::string & message() const {
        return m_message;
    }
    const Value & value() const {
        return m_value;
    }
    const Value & operator*() const {
        return m_value;
    }
};

} // namespace SchemaFusion
