#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "value.hpp"

namespace SchemaFusion {

enum class BindError {
    NO_ERROR,
    TYPE_MISMATCH,
    VALUE_OUT_OF_RANGE
};

constexpr std::string_view error_to_string(BindError e) {
    switch(e) {
    case BindError::NO_ERROR: return "NO_ERROR"; break;
    case BindError::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case BindError::VALUE_OUT_OF_RANGE: return "VALUE_OUT_OF_RANGE"; break;
    }
    return "N/A";
}

class BindResult {
    BindError   m_error = BindError::NO_ERROR;
    std::string m_member;

public:
    BindResult() = default;
    BindResult(BindError err, std::string member) : m_error(err), m_member(std::move(member)) {}

    operator bool() const {
        return m_error == BindError::NO_ERROR;
    }
    BindError error() const {
        return m_error;
    }
    // dotted member path, `outer.items[1].name`
    const std::string & member() const {
        return m_member;
    }
};

template<class T>
BindResult BindRecord(const Instance & record, T & out);

namespace binding_detail {

template<class T> struct is_optional : std::false_type {};
template<class T> struct is_optional<std::optional<T>> : std::true_type {};

template<class T> struct is_vector : std::false_type {};
template<class T, class A> struct is_vector<std::vector<T, A>> : std::true_type {};

template<class T> struct is_map : std::false_type {};
template<class K, class V, class C, class A> struct is_map<std::map<K, V, C, A>> : std::true_type {};

template<class T>
concept BindableStruct = std::is_class_v<T> && std::is_aggregate_v<T>;

inline std::string join(std::string_view head, const std::string & tail) {
    if(tail.empty()) {
        return std::string(head);
    }
    if(tail.front() == '[') {
        return std::string(head) + tail;
    }
    return std::string(head) + "." + tail;
}

template<class T>
BindResult bind_value(const Value & v, T & out) {
    if constexpr (std::is_same_v<T, Value>) {
        out = v;
        return {};
    } else if constexpr (is_optional<T>::value) {
        if(v.isNull()) {
            out = std::nullopt;
            return {};
        }
        typename T::value_type inner{};
        BindResult r = bind_value(v, inner);
        if(r) {
            out = std::move(inner);
        }
        return r;
    } else if constexpr (std::is_same_v<T, bool>) {
        if(!v.isBoolean()) return {BindError::TYPE_MISMATCH, {}};
        out = v.asBoolean();
        return {};
    } else if constexpr (std::is_integral_v<T>) {
        if(!v.isInteger()) return {BindError::TYPE_MISMATCH, {}};
        if(!std::in_range<T>(v.asInteger())) return {BindError::VALUE_OUT_OF_RANGE, {}};
        out = static_cast<T>(v.asInteger());
        return {};
    } else if constexpr (std::is_floating_point_v<T>) {
        if(!v.isFloat()) return {BindError::TYPE_MISMATCH, {}};
        out = static_cast<T>(v.asFloat());
        return {};
    } else if constexpr (std::is_same_v<T, std::string>) {
        if(!v.isString()) return {BindError::TYPE_MISMATCH, {}};
        out = v.asString();
        return {};
    } else if constexpr (is_vector<T>::value) {
        if(!v.isSequence()) return {BindError::TYPE_MISMATCH, {}};
        const Sequence & items = v.asSequence();
        T result;
        result.reserve(items.size());
        for(std::size_t i = 0; i < items.size(); i ++) {
            typename T::value_type item{};
            BindResult r = bind_value(items[i], item);
            if(!r) {
                return {r.error(), join("[" + std::to_string(i) + "]", r.member())};
            }
            result.push_back(std::move(item));
        }
        out = std::move(result);
        return {};
    } else if constexpr (is_map<T>::value) {
        if(!v.isMapping()) return {BindError::TYPE_MISMATCH, {}};
        T result;
        for(const MapEntry & e : v.asMapping()) {
            const std::string where = "[" + e.key.toString() + "]";
            typename T::key_type key{};
            if(BindResult r = bind_value(e.key, key); !r) {
                return {r.error(), where};
            }
            typename T::mapped_type mapped{};
            if(BindResult r = bind_value(e.value, mapped); !r) {
                return {r.error(), join(where, r.member())};
            }
            result.insert_or_assign(std::move(key), std::move(mapped));
        }
        out = std::move(result);
        return {};
    } else if constexpr (BindableStruct<T>) {
        if(!v.isRecord() || !v.asRecord()) return {BindError::TYPE_MISMATCH, {}};
        return BindRecord(*v.asRecord(), out);
    } else {
        static_assert(!sizeof(T), "[[[ SchemaFusion ]]] BindRecord: unsupported member type");
    }
}

template<std::size_t I, class T>
bool bind_member(const Instance & record, T & out, BindResult & res) {
    constexpr std::string_view name = pfr::get_name<I, T>();
    auto & member = pfr::get<I>(out);
    using M = std::remove_cvref_t<decltype(member)>;

    const Value * v = record.get(name);
    if(v == nullptr) {
        if constexpr (is_optional<M>::value) {
            bool declared = false;
            for(const Instance::Slot & slot : record.slots()) {
                if(slot.name == name) {
                    declared = true;
                    break;
                }
            }
            if(declared) {
                member = std::nullopt;
            }
        }
        return true;
    }
    BindResult r = bind_value(*v, member);
    if(!r) {
        res = BindResult(r.error(), join(name, r.member()));
        return false;
    }
    return true;
}

template<class T, std::size_t... Is>
BindResult bind_members(const Instance & record, T & out, std::index_sequence<Is...>) {
    BindResult res;
    static_cast<void>((bind_member<Is>(record, out, res) && ...));
    return res;
}

} // namespace binding_detail

// Copies a constructed record into an aggregate by member name. Members with no
// set field keep their value; an optional member whose field is declared but unset
// becomes nullopt.
template<class T>
BindResult BindRecord(const Instance & record, T & out) {
    static_assert(binding_detail::BindableStruct<T>, "[[[ SchemaFusion ]]] BindRecord needs an aggregate struct");
    return binding_detail::bind_members(record, out, std::make_index_sequence<pfr::tuple_size_v<T>>{});
}

} // namespace SchemaFusion
