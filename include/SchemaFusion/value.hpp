#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace SchemaFusion {

enum class ValueKind {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Sequence,
    Mapping,
    Record
};

constexpr std::string_view kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::Null:     return "null"; break;
    case ValueKind::Boolean:  return "boolean"; break;
    case ValueKind::Integer:  return "integer"; break;
    case ValueKind::Float:    return "float"; break;
    case ValueKind::String:   return "string"; break;
    case ValueKind::Sequence: return "sequence"; break;
    case ValueKind::Mapping:  return "mapping"; break;
    case ValueKind::Record:   return "record"; break;
    }
    return "N/A";
}

class Value;
class Instance;
struct MapEntry;

using Sequence  = std::vector<Value>;
using RecordRef = std::shared_ptr<const Instance>;

// Ordered mapping. Keys are unique, the position of the first insertion is kept.
class Mapping {
public:
    using const_iterator = std::vector<MapEntry>::const_iterator;

    Mapping() = default;
    Mapping(std::initializer_list<MapEntry> entries);

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    const Value * find(const Value & key) const;
    const Value * find(std::string_view key) const;
    const Value * find(const char * key) const { return find(std::string_view(key)); }
    const Value * find(const std::string & key) const { return find(std::string_view(key)); }
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    void set(Value key, Value value);

    // Order-insensitive: same keys, equal values.
    bool operator==(const Mapping & other) const;

private:
    std::vector<MapEntry> entries_;
    // string key -> position in entries_
    std::map<std::string, std::size_t, std::less<>> stringIndex_;
};

// Untyped document node and typed construction result in one closed variant.
class Value {
public:
    using Storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        Sequence,
        Mapping,
        RecordRef
    >;

    Value() = default;
    Value(std::nullptr_t) {}
    // template so pointers and captureless lambdas do not decay into booleans
    template<class B>
        requires std::is_same_v<B, bool>
    Value(B b) : data_(b) {}

    // 64-bit unsigned types are left out, their upper half does not fit
    template<std::integral I>
        requires (!std::is_same_v<I, bool> && (std::is_signed_v<I> || sizeof(I) < sizeof(std::int64_t)))
    Value(I i) : data_(static_cast<std::int64_t>(i)) {}

    template<std::floating_point F>
    Value(F f) : data_(static_cast<double>(f)) {}

    Value(const char * s) : data_(std::string(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Sequence s) : data_(std::move(s)) {}
    Value(Mapping m) : data_(std::move(m)) {}
    Value(RecordRef r) : data_(std::move(r)) {}

    ValueKind kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    bool isNull()     const noexcept { return kind() == ValueKind::Null; }
    bool isBoolean()  const noexcept { return kind() == ValueKind::Boolean; }
    bool isInteger()  const noexcept { return kind() == ValueKind::Integer; }
    bool isFloat()    const noexcept { return kind() == ValueKind::Float; }
    bool isString()   const noexcept { return kind() == ValueKind::String; }
    bool isSequence() const noexcept { return kind() == ValueKind::Sequence; }
    bool isMapping()  const noexcept { return kind() == ValueKind::Mapping; }
    bool isRecord()   const noexcept { return kind() == ValueKind::Record; }

    bool                 asBoolean()  const { return std::get<bool>(data_); }
    std::int64_t         asInteger()  const { return std::get<std::int64_t>(data_); }
    double               asFloat()    const { return std::get<double>(data_); }
    const std::string &  asString()   const { return std::get<std::string>(data_); }
    const Sequence &     asSequence() const { return std::get<Sequence>(data_); }
    const Mapping &      asMapping()  const { return std::get<Mapping>(data_); }
    const RecordRef &    asRecord()   const { return std::get<RecordRef>(data_); }

    const Storage & storage() const noexcept { return data_; }

    bool operator==(const Value & other) const;

    std::string toString() const;

private:
    Storage data_;
};

struct MapEntry {
    Value key;
    Value value;
};

using Factory = std::function<Value()>;

// Typed record produced by construction. Slots keep declaration order.
class Instance {
public:
    struct Slot {
        std::string          name;
        bool                 required = true;
        std::optional<Value> value;
    };

    Instance(std::string recordName, std::vector<Slot> slots)
        : recordName_(std::move(recordName)), slots_(std::move(slots)) {}

    const std::string & recordName() const noexcept { return recordName_; }
    const std::vector<Slot> & slots() const noexcept { return slots_; }

    void set(std::size_t slotIndex, Value v) {
        slots_[slotIndex].value = std::move(v);
    }

    bool has(std::string_view name) const { return get(name) != nullptr; }

    const Value * get(std::string_view name) const {
        for(const Slot & s : slots_) {
            if(s.name == name) {
                return s.value ? &*s.value : nullptr;
            }
        }
        return nullptr;
    }

    template<class T>
    std::optional<T> getAs(std::string_view name) const;

    // Top-level flattening: nested records stay records.
    Mapping asMapping() const {
        Mapping m;
        for(const Slot & s : slots_) {
            if(s.value) {
                m.set(Value(s.name), *s.value);
            }
        }
        return m;
    }

    // Name(a=1, b="x"), required fields first, unset fields skipped
    std::string toString() const;

    bool operator==(const Instance & other) const {
        if(recordName_ != other.recordName_ || slots_.size() != other.slots_.size()) {
            return false;
        }
        for(std::size_t i = 0; i < slots_.size(); i ++) {
            if(slots_[i].name != other.slots_[i].name || slots_[i].value != other.slots_[i].value) {
                return false;
            }
        }
        return true;
    }

private:
    std::string       recordName_;
    std::vector<Slot> slots_;
};


/* #### Mapping #### */

inline Mapping::Mapping(std::initializer_list<MapEntry> entries) {
    for(const MapEntry & e : entries) {
        set(e.key, e.value);
    }
}

inline std::size_t Mapping::size() const noexcept { return entries_.size(); }
inline bool Mapping::empty() const noexcept { return entries_.empty(); }
inline Mapping::const_iterator Mapping::begin() const noexcept { return entries_.begin(); }
inline Mapping::const_iterator Mapping::end() const noexcept { return entries_.end(); }

inline const Value * Mapping::find(const Value & key) const {
    if(key.isString()) {
        return find(std::string_view(key.asString()));
    }
    for(const MapEntry & e : entries_) {
        if(e.key == key) {
            return &e.value;
        }
    }
    return nullptr;
}

inline const Value * Mapping::find(std::string_view key) const {
    auto it = stringIndex_.find(key);
    return it == stringIndex_.end() ? nullptr : &entries_[it->second].value;
}

// String keys are indexed, other key kinds are scanned.
inline void Mapping::set(Value key, Value value) {
    if(key.isString()) {
        auto it = stringIndex_.find(std::string_view(key.asString()));
        if(it != stringIndex_.end()) {
            entries_[it->second].value = std::move(value);
            return;
        }
        stringIndex_.emplace(key.asString(), entries_.size());
        entries_.push_back(MapEntry{std::move(key), std::move(value)});
        return;
    }
    for(MapEntry & e : entries_) {
        if(e.key == key) {
            e.value = std::move(value);
            return;
        }
    }
    entries_.push_back(MapEntry{std::move(key), std::move(value)});
}

inline bool Mapping::operator==(const Mapping & other) const {
    if(entries_.size() != other.entries_.size()) {
        return false;
    }
    for(const MapEntry & e : entries_) {
        const Value * v = other.find(e.key);
        if(v == nullptr || !(*v == e.value)) {
            return false;
        }
    }
    return true;
}


/* #### Value #### */

// No cross-kind equality: integer 1 and float 1.0 differ.
inline bool Value::operator==(const Value & other) const {
    if(kind() != other.kind()) {
        return false;
    }
    if(isRecord()) {
        const RecordRef & a = asRecord();
        const RecordRef & b = other.asRecord();
        if(a == b) return true;
        if(!a || !b) return false;
        return *a == *b;
    }
    return data_ == other.data_;
}

namespace value_details {

inline std::string quote(std::string_view s) {
    std::string out = "\"";
    for(char c : s) {
        if(c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

inline std::string float_to_string(double d) {
    std::string s = std::format("{}", d);
    if(s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

} // namespace value_details

inline std::string Value::toString() const {
    switch(kind()) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return asBoolean() ? "true" : "false";
    case ValueKind::Integer:
        return std::to_string(asInteger());
    case ValueKind::Float:
        return value_details::float_to_string(asFloat());
    case ValueKind::String:
        return value_details::quote(asString());
    case ValueKind::Sequence: {
        std::string s = "[";
        bool first = true;
        for(const Value & v : asSequence()) {
            if(!first) s += ", ";
            s += v.toString();
            first = false;
        }
        return s + "]";
    }
    case ValueKind::Mapping: {
        std::string s = "{";
        bool first = true;
        for(const MapEntry & e : asMapping()) {
            if(!first) s += ", ";
            s += e.key.toString() + ": " + e.value.toString();
            first = false;
        }
        return s + "}";
    }
    case ValueKind::Record:
        return asRecord() ? asRecord()->toString() : "null";
    }
    return "N/A";
}


/* #### Instance #### */

template<class T>
std::optional<T> Instance::getAs(std::string_view name) const {
    const Value * v = get(name);
    if(v == nullptr) {
        return std::nullopt;
    }
    if constexpr (std::is_same_v<T, bool>) {
        if(v->isBoolean()) return v->asBoolean();
    } else if constexpr (std::is_integral_v<T>) {
        if(v->isInteger() && std::in_range<T>(v->asInteger())) return static_cast<T>(v->asInteger());
    } else if constexpr (std::is_floating_point_v<T>) {
        if(v->isFloat()) return static_cast<T>(v->asFloat());
    } else if constexpr (std::is_same_v<T, std::string>) {
        if(v->isString()) return v->asString();
    } else if constexpr (std::is_same_v<T, Sequence>) {
        if(v->isSequence()) return v->asSequence();
    } else if constexpr (std::is_same_v<T, Mapping>) {
        if(v->isMapping()) return v->asMapping();
    } else if constexpr (std::is_same_v<T, RecordRef>) {
        if(v->isRecord()) return v->asRecord();
    } else if constexpr (std::is_same_v<T, Value>) {
        return *v;
    } else {
        static_assert(!sizeof(T), "[[[ SchemaFusion ]]] getAs<T>: unsupported target type");
    }
    return std::nullopt;
}

inline std::string Instance::toString() const {
    std::string s = recordName_ + "(";
    bool first = true;
    auto append = [&](bool required) {
        for(const Slot & slot : slots_) {
            if(slot.required != required || !slot.value) {
                continue;
            }
            if(!first) s += ", ";
            s += slot.name + "=" + slot.value->toString();
            first = false;
        }
    };
    append(true);
    append(false);
    return s + ")";
}

} // namespace SchemaFusion
