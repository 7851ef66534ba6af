#pragma once
#include <ryml.hpp>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "value.hpp"
#include "document.hpp"

namespace SchemaFusion {

namespace yaml_detail {

struct RymlError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// rapidyaml requires the error callback to not return
[[noreturn]] inline void throw_on_error(const char * msg, std::size_t len, ryml::Location, void *) {
    throw RymlError(std::string(msg, len));
}

// Routes rapidyaml errors through RymlError for the lifetime of the guard.
// rapidyaml callbacks are process-global: do not load concurrently.
class CallbacksGuard {
    ryml::Callbacks prev_;
public:
    CallbacksGuard() : prev_(ryml::get_callbacks()) {
        ryml::Callbacks cb = prev_;
        cb.m_error = &throw_on_error;
        ryml::set_callbacks(cb);
    }
    ~CallbacksGuard() {
        ryml::set_callbacks(prev_);
    }
    CallbacksGuard(const CallbacksGuard&) = delete;
    CallbacksGuard& operator=(const CallbacksGuard&) = delete;
};

inline std::string_view view(c4::csubstr s) {
    return std::string_view(s.str, s.len);
}

// Plain (unquoted) scalar typing: null, boolean, integer, float, else string.
inline DocumentError plain_scalar(std::string_view s, Value & out) {
    if(s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") {
        out = Value();
        return DocumentError::NO_ERROR;
    }
    if(s == "true" || s == "True" || s == "TRUE") {
        out = Value(true);
        return DocumentError::NO_ERROR;
    }
    if(s == "false" || s == "False" || s == "FALSE") {
        out = Value(false);
        return DocumentError::NO_ERROR;
    }
    if(s == ".inf" || s == "+.inf" || s == ".Inf" || s == "+.Inf") {
        out = Value(std::numeric_limits<double>::infinity());
        return DocumentError::NO_ERROR;
    }
    if(s == "-.inf" || s == "-.Inf") {
        out = Value(-std::numeric_limits<double>::infinity());
        return DocumentError::NO_ERROR;
    }
    if(s == ".nan" || s == ".NaN" || s == ".NAN") {
        out = Value(std::numeric_limits<double>::quiet_NaN());
        return DocumentError::NO_ERROR;
    }

    char first = s[0];
    if((first >= '0' && first <= '9') || first == '-' || first == '+' || first == '.') {
        std::string_view num = s;
        if(first == '+') {
            num.remove_prefix(1);
        }
        if(!num.empty() && !(first == '+' && (num[0] == '+' || num[0] == '-'))) {
            const char * end = num.data() + num.size();

            std::int64_t i{};
            auto [ptr, ec] = std::from_chars(num.data(), end, i);
            if(ptr == end) {
                if(ec == std::errc()) {
                    out = Value(i);
                    return DocumentError::NO_ERROR;
                }
                if(ec == std::errc::result_out_of_range) {
                    return DocumentError::NUMERIC_VALUE_IS_OUT_OF_RANGE;
                }
            }

            double d{};
            auto [ptr2, ec2] = std::from_chars(num.data(), end, d);
            if(ptr2 == end) {
                if(ec2 == std::errc()) {
                    out = Value(d);
                    return DocumentError::NO_ERROR;
                }
                if(ec2 == std::errc::result_out_of_range) {
                    return DocumentError::NUMERIC_VALUE_IS_OUT_OF_RANGE;
                }
            }
        }
    }
    out = Value(std::string(s));
    return DocumentError::NO_ERROR;
}

} // namespace yaml_detail


// Turns one YAML document into the untyped Value tree.
class RapidYamlLoader {
public:
    DocumentResult load(std::string_view text) {
        yaml_detail::CallbacksGuard guard;
        ryml::Tree tree;
        try {
            tree = ryml::parse_in_arena(c4::csubstr(text.data(), text.size()));
        } catch(const yaml_detail::RymlError & e) {
            return {DocumentError::ILLFORMED_DOCUMENT, e.what()};
        }

        ryml::ConstNodeRef root = tree.crootref();
        if(root.is_stream()) {
            if(root.num_children() > 1) {
                return {DocumentError::UNSUPPORTED_YAML_FEATURE, "multi-document streams are not supported"};
            }
            if(root.num_children() == 0) {
                return Value();
            }
            root = root.first_child();
        }

        Value out;
        if(!convert(root, out, 0)) {
            return {err_, message_};
        }
        return out;
    }

private:
    DocumentError err_ = DocumentError::NO_ERROR;
    std::string   message_;

    bool setError(DocumentError e, std::string message) {
        err_ = e;
        message_ = std::move(message);
        return false;
    }

    bool hasUnsupportedFeatures(ryml::ConstNodeRef node) const {
        if(node.has_anchor()) return true;
        if(node.is_ref()) return true;
        if(node.has_key_tag() || node.has_val_tag()) return true;
        return false;
    }

    bool scalar(c4::csubstr s, bool quoted, Value & out) {
        if(quoted) {
            out = Value(std::string(s.str, s.len));
            return true;
        }
        DocumentError e = yaml_detail::plain_scalar(yaml_detail::view(s), out);
        if(e != DocumentError::NO_ERROR) {
            return setError(e, "number does not fit: " + std::string(s.str, s.len));
        }
        return true;
    }

    bool convert(ryml::ConstNodeRef node, Value & out, std::size_t depth) {
        if(depth > SCHEMAFUSION_MAX_DOCUMENT_DEPTH) {
            return setError(DocumentError::ILLFORMED_DOCUMENT, "document nesting is too deep");
        }
        if(hasUnsupportedFeatures(node)) {
            return setError(DocumentError::UNSUPPORTED_YAML_FEATURE, "anchors, aliases and tags are not supported");
        }

        if(node.is_map()) {
            Mapping m;
            for(ryml::ConstNodeRef child : node.children()) {
                if(hasUnsupportedFeatures(child)) {
                    return setError(DocumentError::UNSUPPORTED_YAML_FEATURE, "anchors, aliases and tags are not supported");
                }
                Value key;
                if(!scalar(child.key(), child.is_key_quoted(), key)) {
                    return false;
                }
                Value v;
                if(!convert(child, v, depth + 1)) {
                    return false;
                }
                m.set(std::move(key), std::move(v));
            }
            out = Value(std::move(m));
            return true;
        }
        if(node.is_seq()) {
            Sequence seq;
            seq.reserve(node.num_children());
            for(ryml::ConstNodeRef child : node.children()) {
                Value v;
                if(!convert(child, v, depth + 1)) {
                    return false;
                }
                seq.push_back(std::move(v));
            }
            out = Value(std::move(seq));
            return true;
        }
        if(node.has_val()) {
            return scalar(node.val(), node.is_val_quoted(), out);
        }
        out = Value();
        return true;
    }
};


inline DocumentResult LoadYaml(std::string_view text) {
    RapidYamlLoader loader;
    return loader.load(text);
}

} // namespace SchemaFusion
