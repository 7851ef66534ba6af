#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "value.hpp"
#include "type_descriptor.hpp"

namespace SchemaFusion {

// Literal default or zero-argument factory. Factories run at construction time only.
class FieldDefault {
public:
    template<class T>
        requires std::constructible_from<Value, T>
    FieldDefault(T && literal) : v_(Value(std::forward<T>(literal))) {}

    template<class F>
        requires (!std::constructible_from<Value, F>)
                 && std::invocable<F &>
                 && std::convertible_to<std::invoke_result_t<F &>, Value>
    FieldDefault(F && factory)
        : v_(Factory([f = std::forward<F>(factory)]() mutable -> Value { return Value(f()); })) {}

    bool isFactory() const noexcept { return std::holds_alternative<Factory>(v_); }

    const Value & literal() const { return std::get<Value>(v_); }
    const Factory & factory() const { return std::get<Factory>(v_); }

private:
    std::variant<Value, Factory> v_;
};

// Explicit field token: alternate external key, default, allow-list.
// No default, or a literal null default, keeps the field required.
struct FieldSpec {
    std::optional<std::string>  alias;
    std::optional<FieldDefault> defaultValue;
    std::optional<Sequence>     allowedValues;
};

// One declaration entry: (name, type, optional default-spec)
struct Field {
    Field(std::string name_, TypeDescriptor type_)
        : name(std::move(name_)), type(std::move(type_)) {}

    Field(std::string name_, TypeDescriptor type_, FieldDefault def)
        : name(std::move(name_)), type(std::move(type_)), plainDefault(std::move(def)) {}

    Field(std::string name_, TypeDescriptor type_, FieldSpec spec_)
        : name(std::move(name_)), type(std::move(type_)), spec(std::move(spec_)) {}

    std::string                 name;
    TypeDescriptor              type;
    std::optional<FieldDefault> plainDefault;
    std::optional<FieldSpec>    spec;
};

struct SchemaOptions {
    bool ignore_unknown_fields = false;   // tolerate unmapped input keys
    bool ignore_missing_fields = false;   // leave absent required fields unset
};

enum class FieldCategory {
    Required,
    Optional
};

struct SchemaField {
    std::string                 name;
    TypeDescriptor              type;
    FieldCategory               category = FieldCategory::Required;
    std::optional<FieldDefault> defaultValue;
    std::string                 alias;
    std::optional<Sequence>     allowedValues;

    bool isRequired() const noexcept { return category == FieldCategory::Required; }
};

namespace schema_builder_detail {
struct SchemaAccess;
}

// Built once by BuildSchema(), immutable afterwards and shared read-only
// by every construction call.
class Schema {
public:
    const std::string & name() const noexcept { return name_; }
    const SchemaOptions & options() const noexcept { return options_; }
    const std::vector<SchemaField> & fields() const noexcept { return fields_; }

    const SchemaField * findField(std::string_view fieldName) const {
        for(const SchemaField & f : fields_) {
            if(f.name == fieldName) {
                return &f;
            }
        }
        return nullptr;
    }

    // alias table: external key -> field index
    std::optional<std::size_t> fieldIndexForKey(std::string_view externalKey) const {
        auto it = aliasTable_.find(externalKey);
        if(it == aliasTable_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // options table: field index -> allowed values, for fields that declare one
    const Sequence * optionsFor(std::size_t fieldIndex) const {
        auto it = optionsTable_.find(fieldIndex);
        return it == optionsTable_.end() ? nullptr : &it->second;
    }

    const std::map<std::string, std::size_t, std::less<>> & aliasTable() const noexcept {
        return aliasTable_;
    }

private:
    friend struct schema_builder_detail::SchemaAccess;

    Schema() = default;

    std::string                                     name_;
    SchemaOptions                                   options_;
    std::vector<SchemaField>                        fields_;
    std::map<std::string, std::size_t, std::less<>> aliasTable_;
    std::map<std::size_t, Sequence>                 optionsTable_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

namespace types {

inline TypeDescriptor Nested(SchemaPtr schema) {
    std::string name = schema ? schema->name() : std::string();
    return TypeDescriptor::NestedRecord(std::move(schema), std::move(name));
}

} // namespace types

} // namespace SchemaFusion
