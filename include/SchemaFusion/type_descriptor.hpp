#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace SchemaFusion {

class Schema;

enum class TypeKind {
    Integer,
    Float,
    String,
    Boolean,
    Any,
    None,
    UntypedList,
    UntypedMap,
    List,
    Map,
    Nested
};

constexpr std::string_view type_kind_to_string(TypeKind k) {
    switch(k) {
    case TypeKind::Integer:     return "integer"; break;
    case TypeKind::Float:       return "float"; break;
    case TypeKind::String:      return "string"; break;
    case TypeKind::Boolean:     return "boolean"; break;
    case TypeKind::Any:         return "any"; break;
    case TypeKind::None:        return "none"; break;
    case TypeKind::UntypedList: return "list"; break;
    case TypeKind::UntypedMap:  return "map"; break;
    case TypeKind::List:        return "list"; break;
    case TypeKind::Map:         return "map"; break;
    case TypeKind::Nested:      return "nested"; break;
    }
    return "N/A";
}

// Immutable description of an expected value shape. Children are shared,
// which is safe because nothing mutates a descriptor after it is built.
class TypeDescriptor {
public:
    static TypeDescriptor Simple(TypeKind kind) {
        return TypeDescriptor(kind);
    }

    static TypeDescriptor ListOf(TypeDescriptor element) {
        TypeDescriptor d(TypeKind::List);
        d.first_ = std::make_shared<const TypeDescriptor>(std::move(element));
        return d;
    }

    static TypeDescriptor MapOf(TypeDescriptor key, TypeDescriptor value) {
        TypeDescriptor d(TypeKind::Map);
        d.first_  = std::make_shared<const TypeDescriptor>(std::move(key));
        d.second_ = std::make_shared<const TypeDescriptor>(std::move(value));
        return d;
    }

    static TypeDescriptor NestedRecord(std::shared_ptr<const Schema> schema, std::string schemaName) {
        TypeDescriptor d(TypeKind::Nested);
        d.schema_ = std::move(schema);
        d.schemaName_ = std::move(schemaName);
        return d;
    }

    TypeKind kind() const noexcept { return kind_; }

    bool isPrimitive() const noexcept {
        return kind_ == TypeKind::Integer || kind_ == TypeKind::Float
            || kind_ == TypeKind::String  || kind_ == TypeKind::Boolean;
    }

    const TypeDescriptor & element() const { return *first_; }
    const TypeDescriptor & key() const { return *first_; }
    const TypeDescriptor & value() const { return *second_; }

    const std::shared_ptr<const Schema> & schema() const noexcept { return schema_; }
    const std::string & schemaName() const noexcept { return schemaName_; }

    // list<map<string, integer>>
    std::string toString() const {
        switch(kind_) {
        case TypeKind::List:
            return "list<" + element().toString() + ">";
        case TypeKind::Map:
            return "map<" + key().toString() + ", " + value().toString() + ">";
        case TypeKind::Nested:
            return schemaName_.empty() ? std::string("<unnamed record>") : schemaName_;
        default:
            return std::string(type_kind_to_string(kind_));
        }
    }

    bool operator==(const TypeDescriptor & other) const {
        if(kind_ != other.kind_) return false;
        switch(kind_) {
        case TypeKind::List:
            return element() == other.element();
        case TypeKind::Map:
            return key() == other.key() && value() == other.value();
        case TypeKind::Nested:
            return schema_ == other.schema_;
        default:
            return true;
        }
    }

private:
    explicit TypeDescriptor(TypeKind kind) : kind_(kind) {}

    TypeKind kind_;
    std::shared_ptr<const TypeDescriptor> first_;
    std::shared_ptr<const TypeDescriptor> second_;
    std::shared_ptr<const Schema> schema_;
    std::string schemaName_;
};

namespace types {

inline TypeDescriptor Integer()     { return TypeDescriptor::Simple(TypeKind::Integer); }
inline TypeDescriptor Float()       { return TypeDescriptor::Simple(TypeKind::Float); }
inline TypeDescriptor String()      { return TypeDescriptor::Simple(TypeKind::String); }
inline TypeDescriptor Boolean()     { return TypeDescriptor::Simple(TypeKind::Boolean); }
inline TypeDescriptor Any()         { return TypeDescriptor::Simple(TypeKind::Any); }
inline TypeDescriptor None()        { return TypeDescriptor::Simple(TypeKind::None); }
inline TypeDescriptor UntypedList() { return TypeDescriptor::Simple(TypeKind::UntypedList); }
inline TypeDescriptor UntypedMap()  { return TypeDescriptor::Simple(TypeKind::UntypedMap); }

inline TypeDescriptor ListOf(TypeDescriptor element) {
    return TypeDescriptor::ListOf(std::move(element));
}

inline TypeDescriptor MapOf(TypeDescriptor key, TypeDescriptor value) {
    return TypeDescriptor::MapOf(std::move(key), std::move(value));
}

// types::Nested(schema) is declared in schema.hpp, it needs the complete Schema.

} // namespace types

} // namespace SchemaFusion
