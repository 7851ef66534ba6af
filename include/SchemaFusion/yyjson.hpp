#pragma once
#include <yyjson.h>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "value.hpp"
#include "document.hpp"

namespace SchemaFusion {

namespace yyjson_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const noexcept {
        yyjson_doc_free(doc);
    }
};

using DocPtr = std::unique_ptr<yyjson_doc, DocDeleter>;

} // namespace yyjson_detail


// Turns one JSON document into the untyped Value tree. Object keys are strings.
class YyjsonLoader {
public:
    DocumentResult load(std::string_view text) {
        yyjson_read_err err;
        // without YYJSON_READ_INSITU the input buffer is only read
        yyjson_detail::DocPtr doc(yyjson_read_opts(const_cast<char*>(text.data()), text.size(), 0, nullptr, &err));
        if(!doc) {
            return {DocumentError::ILLFORMED_DOCUMENT,
                    std::string(err.msg ? err.msg : "unreadable document") + " at offset " + std::to_string(err.pos)};
        }
        Value out;
        if(!convert(yyjson_doc_get_root(doc.get()), out, 0)) {
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

    bool convert(yyjson_val * node, Value & out, std::size_t depth) {
        if(depth > SCHEMAFUSION_MAX_DOCUMENT_DEPTH) {
            return setError(DocumentError::ILLFORMED_DOCUMENT, "document nesting is too deep");
        }
        if(!node || yyjson_is_null(node)) {
            out = Value();
            return true;
        }
        if(yyjson_is_bool(node)) {
            out = Value(yyjson_get_bool(node) != 0);
            return true;
        }
        if(yyjson_is_sint(node)) {
            out = Value(static_cast<std::int64_t>(yyjson_get_sint(node)));
            return true;
        }
        if(yyjson_is_uint(node)) {
            std::uint64_t u = yyjson_get_uint(node);
            if(u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return setError(DocumentError::NUMERIC_VALUE_IS_OUT_OF_RANGE,
                                "number does not fit: " + std::to_string(u));
            }
            out = Value(static_cast<std::int64_t>(u));
            return true;
        }
        if(yyjson_is_real(node)) {
            out = Value(yyjson_get_real(node));
            return true;
        }
        if(yyjson_is_str(node)) {
            out = Value(std::string(yyjson_get_str(node), yyjson_get_len(node)));
            return true;
        }
        if(yyjson_is_arr(node)) {
            Sequence seq;
            seq.reserve(yyjson_arr_size(node));
            yyjson_arr_iter it = yyjson_arr_iter_with(node);
            yyjson_val * item;
            while((item = yyjson_arr_iter_next(&it))) {
                Value v;
                if(!convert(item, v, depth + 1)) {
                    return false;
                }
                seq.push_back(std::move(v));
            }
            out = Value(std::move(seq));
            return true;
        }
        if(yyjson_is_obj(node)) {
            Mapping m;
            yyjson_obj_iter it = yyjson_obj_iter_with(node);
            yyjson_val * key;
            while((key = yyjson_obj_iter_next(&it))) {
                yyjson_val * val = yyjson_obj_iter_get_val(key);
                Value v;
                if(!convert(val, v, depth + 1)) {
                    return false;
                }
                m.set(Value(std::string(yyjson_get_str(key), yyjson_get_len(key))), std::move(v));
            }
            out = Value(std::move(m));
            return true;
        }
        return setError(DocumentError::ILLFORMED_DOCUMENT, "unsupported JSON value");
    }
};


inline DocumentResult LoadJson(std::string_view text) {
    YyjsonLoader loader;
    return loader.load(text);
}

} // namespace SchemaFusion
