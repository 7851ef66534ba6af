#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "value.hpp"
#include "type_descriptor.hpp"
#include "schema.hpp"
#include "schema_validator.hpp"
#include "construct_result.hpp"
#include "resolver.hpp"

namespace SchemaFusion {

namespace schema_builder_detail {

struct SchemaAccess {
    static SchemaPtr make(std::string name, SchemaOptions options, std::vector<SchemaField> fields,
                          std::map<std::string, std::size_t, std::less<>> aliasTable,
                          std::map<std::size_t, Sequence> optionsTable) {
        std::shared_ptr<Schema> s(new Schema);
        s->name_ = std::move(name);
        s->options_ = options;
        s->fields_ = std::move(fields);
        s->aliasTable_ = std::move(aliasTable);
        s->optionsTable_ = std::move(optionsTable);
        return s;
    }
};

inline bool is_scalar_literal(const Value & v) {
    switch(v.kind()) {
    case ValueKind::Null:
    case ValueKind::Boolean:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
        return true;
    case ValueKind::Sequence:
    case ValueKind::Mapping:
    case ValueKind::Record:
        return false;
    }
    return false;
}

// A FieldSpec without a default, or with a literal null, keeps the field required.
inline SchemaField classify(const Field & decl) {
    SchemaField f{decl.name, decl.type, FieldCategory::Required, std::nullopt, decl.name, std::nullopt};

    if(decl.plainDefault) {
        f.category = FieldCategory::Optional;
        f.defaultValue = decl.plainDefault;
    } else if(decl.spec) {
        const FieldSpec & spec = *decl.spec;
        if(spec.alias) {
            f.alias = *spec.alias;
        }
        f.allowedValues = spec.allowedValues;
        const bool noDefault = !spec.defaultValue
            || (!spec.defaultValue->isFactory() && spec.defaultValue->literal().isNull());
        if(!noDefault) {
            f.category = FieldCategory::Optional;
            f.defaultValue = spec.defaultValue;
        }
    }
    return f;
}

inline std::string describe_failure(const resolver_details::ConstructionContext & ctx) {
    std::string where = ctx.errorPath().currentLength > 0 ? " at " + ctx.errorPath().toString() : std::string();
    return std::format("{} is not {}{}", ctx.errorValueText(), ctx.errorExpected(), where);
}

} // namespace schema_builder_detail


// Validates every declaration, classifies it and builds the lookup tables.
// Factories are never invoked here.
inline RegistrationResult BuildSchema(std::string name, const std::vector<Field> & declarations,
                                      SchemaOptions options = {}) {
    using namespace schema_builder_detail;

    std::vector<SchemaField> fields;
    fields.reserve(declarations.size());
    std::set<std::string, std::less<>> names;
    std::map<std::string, std::size_t, std::less<>> aliasTable;
    std::map<std::size_t, Sequence> optionsTable;

    for(const Field & decl : declarations) {
        if(!names.insert(decl.name).second) {
            return {RegistrationError::DUPLICATE_FIELD, decl.name,
                    std::format("field '{}' is declared twice in '{}'", decl.name, name)};
        }

        if(DescriptorCheck check = ValidateDescriptor(decl.name, decl.type); !check) {
            return {check.error(), decl.name, std::move(check.detail)};
        }

        SchemaField f = classify(decl);

        if(f.defaultValue && !f.defaultValue->isFactory()) {
            const Value & literal = f.defaultValue->literal();
            if(!is_scalar_literal(literal)) {
                return {RegistrationError::INVALID_DEFAULT, f.name,
                        std::format("default of '{}' must be a scalar or null, use a factory for {}",
                                    f.name, kind_to_string(literal.kind()))};
            }
            resolver_details::ConstructionContext ctx;
            Value resolved;
            if(!resolver_details::ResolveValue(literal, f.type, resolved, ctx)) {
                return {RegistrationError::INVALID_DEFAULT, f.name,
                        std::format("default of '{}': {}", f.name, describe_failure(ctx))};
            }
        }

        if(f.allowedValues) {
            for(std::size_t i = 0; i < f.allowedValues->size(); i ++) {
                resolver_details::ConstructionContext ctx;
                Value resolved;
                if(!resolver_details::ResolveValue((*f.allowedValues)[i], f.type, resolved, ctx)) {
                    return {RegistrationError::INVALID_OPTIONS, f.name,
                            std::format("option #{} of '{}': {}", i, f.name, describe_failure(ctx))};
                }
            }
            if(f.defaultValue && !f.defaultValue->isFactory()) {
                const Value & literal = f.defaultValue->literal();
                bool found = false;
                for(const Value & option : *f.allowedValues) {
                    if(option == literal) {
                        found = true;
                        break;
                    }
                }
                if(!found) {
                    return {RegistrationError::DEFAULT_NOT_IN_OPTIONS, f.name,
                            std::format("default {} of '{}' is not one of {}",
                                        literal.toString(), f.name, Value(*f.allowedValues).toString())};
                }
            }
        }

        const std::size_t index = fields.size();
        if(!aliasTable.emplace(f.alias, index).second) {
            return {RegistrationError::DUPLICATE_ALIAS, f.name,
                    std::format("key '{}' of '{}' is already used by another field", f.alias, f.name)};
        }
        if(f.allowedValues) {
            optionsTable.emplace(index, *f.allowedValues);
        }
        fields.push_back(std::move(f));
    }

    return SchemaAccess::make(std::move(name), options, std::move(fields),
                              std::move(aliasTable), std::move(optionsTable));
}


// Name -> schema lookup. Not synchronized; populate before sharing across threads.
class SchemaRegistry {
public:
    RegistrationResult Register(std::string name, const std::vector<Field> & declarations,
                                SchemaOptions options = {}) {
        if(schemas_.contains(name)) {
            return {RegistrationError::REGISTRY_NAME_TAKEN, std::string(),
                    std::format("record '{}' is already registered", name)};
        }
        RegistrationResult res = BuildSchema(name, declarations, options);
        if(res) {
            schemas_.emplace(std::move(name), res.schema());
        }
        return res;
    }

    SchemaPtr Find(std::string_view name) const {
        auto it = schemas_.find(name);
        return it == schemas_.end() ? SchemaPtr{} : it->second;
    }

    bool Contains(std::string_view name) const {
        return schemas_.find(name) != schemas_.end();
    }

    std::size_t size() const noexcept {
        return schemas_.size();
    }

private:
    std::map<std::string, SchemaPtr, std::less<>> schemas_;
};

} // namespace SchemaFusion
