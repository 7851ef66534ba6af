#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "path.hpp"
#include "value.hpp"
#include "type_descriptor.hpp"
#include "schema.hpp"
#include "construct_result.hpp"

#ifndef SCHEMAFUSION_MAX_RESOLVE_DEPTH
#define SCHEMAFUSION_MAX_RESOLVE_DEPTH 256
#endif

namespace SchemaFusion {

constexpr std::size_t max_resolve_depth() {
    return SCHEMAFUSION_MAX_RESOLVE_DEPTH;
}


namespace resolver_details {


class ConstructionContext {
    ConstructionError error = ConstructionError::NO_ERROR;
    path::Path  currentPath;
    std::string valueText;
    std::string expected;
    std::string recordName;
    std::size_t depth = 0;

public:
    // Path elements stay pushed once an error is set, so the result reports where it happened.
    struct PathGuard {
        ConstructionContext & ctx;

        ~PathGuard() {
            if(ctx.error == ConstructionError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    struct DepthGuard {
        ConstructionContext & ctx;

        ~DepthGuard() {
            ctx.depth --;
        }
    };

    struct RecordGuard {
        ConstructionContext & ctx;
        std::string outer;

        ~RecordGuard() {
            if(ctx.error == ConstructionError::NO_ERROR)
                ctx.recordName = std::move(outer);
        }
    };

    bool withError(ConstructionError err, const Value & offending, std::string expectedShape) {
        return withError(err, offending.toString(), std::move(expectedShape));
    }

    bool withError(ConstructionError err, std::string offendingText, std::string expectedShape) {
        error = err;
        valueText = std::move(offendingText);
        expected = std::move(expectedShape);
        return false;
    }

    ConstructionError currentError() const { return error; }
    const path::Path & errorPath() const { return currentPath; }
    const std::string & errorValueText() const { return valueText; }
    const std::string & errorExpected() const { return expected; }

    ConstructResult result(RecordRef instance) const {
        return ConstructResult(error, currentPath, valueText, expected, recordName,
                               error == ConstructionError::NO_ERROR ? std::move(instance) : RecordRef{});
    }

    PathGuard getFieldGuard(std::string_view key) {
        currentPath.push_field(key);
        return PathGuard{*this};
    }
    PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    PathGuard getMapItemGuard(const Value & key) {
        currentPath.push_field(key.isString() ? key.asString() : key.toString());
        return PathGuard{*this};
    }

    RecordGuard getRecordGuard(std::string_view name) {
        return RecordGuard{*this, std::exchange(recordName, std::string(name))};
    }

    bool descend() {
        if(depth >= max_resolve_depth()) {
            return withError(ConstructionError::DEPTH_LIMIT_EXCEEDED, std::string(),
                             "nesting depth <= " + std::to_string(max_resolve_depth()));
        }
        depth ++;
        return true;
    }
    DepthGuard getDepthGuard() {
        return DepthGuard{*this};
    }
};


constexpr bool is_supported_input_kind(ValueKind k) {
    switch(k) {
    case ValueKind::String:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::Boolean:
    case ValueKind::Sequence:
    case ValueKind::Mapping:
        return true;
    case ValueKind::Null:
    case ValueKind::Record:
        return false;
    }
    return false;
}

constexpr bool is_map_key_kind(ValueKind k) {
    return k == ValueKind::String || k == ValueKind::Integer || k == ValueKind::Float;
}


inline bool ConstructRecord(const Schema & schema, const Mapping & input, RecordRef & out, ConstructionContext & ctx);


inline bool ResolvePrimitive(const Value & value, ValueKind expectedKind, const TypeDescriptor & type,
                             Value & out, ConstructionContext & ctx) {
    // no implicit widening: an integer never satisfies a float descriptor
    if(value.kind() != expectedKind) {
        return ctx.withError(ConstructionError::WRONG_TYPE, value, type.toString());
    }
    out = value;
    return true;
}

// Single recursive core. Every composite descriptor funnels back through here.
inline bool ResolveValue(const Value & value, const TypeDescriptor & type, Value & out, ConstructionContext & ctx) {

    // absent marker passes for every descriptor; the record layer decides if absence is acceptable
    if(value.isNull()) {
        out = Value();
        return true;
    }

    switch(type.kind()) {
    case TypeKind::Any:
        out = value;
        return true;

    case TypeKind::Integer:
        return ResolvePrimitive(value, ValueKind::Integer, type, out, ctx);
    case TypeKind::Float:
        return ResolvePrimitive(value, ValueKind::Float, type, out, ctx);
    case TypeKind::String:
        return ResolvePrimitive(value, ValueKind::String, type, out, ctx);
    case TypeKind::Boolean:
        return ResolvePrimitive(value, ValueKind::Boolean, type, out, ctx);

    case TypeKind::Nested: {
        if(!value.isMapping() || !type.schema()) {
            return ctx.withError(ConstructionError::WRONG_TYPE, value, type.toString());
        }
        RecordRef record;
        if(!ConstructRecord(*type.schema(), value.asMapping(), record, ctx)) {
            return false;
        }
        out = Value(std::move(record));
        return true;
    }

    case TypeKind::List: {
        if(!value.isSequence()) {
            return ctx.withError(ConstructionError::WRONG_TYPE, value, type.toString());
        }
        if(!ctx.descend()) {
            return false;
        }
        ConstructionContext::DepthGuard depthGuard = ctx.getDepthGuard();

        const Sequence & items = value.asSequence();
        Sequence result;
        result.reserve(items.size());
        for(std::size_t i = 0; i < items.size(); i ++) {
            ConstructionContext::PathGuard guard = ctx.getArrayItemGuard(i);
            Value resolved;
            if(!ResolveValue(items[i], type.element(), resolved, ctx)) {
                return false;
            }
            result.push_back(std::move(resolved));
        }
        out = Value(std::move(result));
        return true;
    }

    case TypeKind::Map: {
        if(!value.isMapping()) {
            return ctx.withError(ConstructionError::WRONG_TYPE, value, type.toString());
        }
        if(!ctx.descend()) {
            return false;
        }
        ConstructionContext::DepthGuard depthGuard = ctx.getDepthGuard();

        Mapping result;
        for(const MapEntry & entry : value.asMapping()) {
            ConstructionContext::PathGuard guard = ctx.getMapItemGuard(entry.key);
            if(!is_map_key_kind(entry.key.kind())) {
                return ctx.withError(ConstructionError::WRONG_TYPE, entry.key, "string, integer or float key");
            }
            // the key is only checked, the original key is kept in the result
            Value checkedKey;
            if(!ResolveValue(entry.key, type.key(), checkedKey, ctx)) {
                return false;
            }
            Value resolved;
            if(!ResolveValue(entry.value, type.value(), resolved, ctx)) {
                return false;
            }
            result.set(entry.key, std::move(resolved));
        }
        out = Value(std::move(result));
        return true;
    }

    case TypeKind::None:
    case TypeKind::UntypedList:
    case TypeKind::UntypedMap:
        break;
    }
    return ctx.withError(ConstructionError::WRONG_TYPE, value, type.toString());
}


inline bool ConstructRecord(const Schema & schema, const Mapping & input, RecordRef & out, ConstructionContext & ctx) {
    ConstructionContext::RecordGuard recordGuard = ctx.getRecordGuard(schema.name());
    if(!ctx.descend()) {
        return false;
    }
    ConstructionContext::DepthGuard depthGuard = ctx.getDepthGuard();

    const std::vector<SchemaField> & fields = schema.fields();
    const SchemaOptions & opts = schema.options();

    std::vector<Instance::Slot> slots;
    slots.reserve(fields.size());
    for(const SchemaField & f : fields) {
        slots.push_back(Instance::Slot{f.name, f.isRequired(), std::nullopt});
    }
    std::vector<bool> seen(fields.size(), false);

    for(const MapEntry & entry : input) {
        std::optional<std::size_t> fieldIndex;
        if(entry.key.isString()) {
            fieldIndex = schema.fieldIndexForKey(entry.key.asString());
        }
        if(!fieldIndex) {
            if(opts.ignore_unknown_fields) {
                continue;
            }
            ConstructionContext::PathGuard guard = ctx.getMapItemGuard(entry.key);
            return ctx.withError(ConstructionError::UNKNOWN_ARGUMENT, entry.value, std::string());
        }

        const SchemaField & field = fields[*fieldIndex];
        seen[*fieldIndex] = true;
        ConstructionContext::PathGuard guard = ctx.getFieldGuard(entry.key.asString());

        if(!is_supported_input_kind(entry.value.kind())) {
            return ctx.withError(ConstructionError::UNSUPPORTED_TYPE, entry.value, field.type.toString());
        }

        // literal, pre-coercion comparison
        if(const Sequence * allowed = schema.optionsFor(*fieldIndex)) {
            if(std::find(allowed->begin(), allowed->end(), entry.value) == allowed->end()) {
                return ctx.withError(ConstructionError::VALUE_NOT_AN_OPTION, entry.value, Value(*allowed).toString());
            }
        }

        Value resolved;
        if(!ResolveValue(entry.value, field.type, resolved, ctx)) {
            return false;
        }
        slots[*fieldIndex].value = std::move(resolved);
    }

    for(std::size_t i = 0; i < fields.size(); i ++) {
        if(!fields[i].isRequired() || seen[i] || opts.ignore_missing_fields) {
            continue;
        }
        ConstructionContext::PathGuard guard = ctx.getFieldGuard(fields[i].alias);
        return ctx.withError(ConstructionError::MISSING_REQUIRED_ARGUMENT, std::string(), fields[i].type.toString());
    }

    for(std::size_t i = 0; i < fields.size(); i ++) {
        if(fields[i].isRequired() || seen[i]) {
            continue;
        }
        const FieldDefault & def = *fields[i].defaultValue;
        if(!def.isFactory()) {
            // literal defaults were resolved at registration
            slots[i].value = def.literal();
            continue;
        }
        ConstructionContext::PathGuard guard = ctx.getFieldGuard(fields[i].alias);
        Value produced = def.factory()();
        Value resolved;
        if(!ResolveValue(produced, fields[i].type, resolved, ctx)) {
            return false;
        }
        slots[i].value = std::move(resolved);
    }

    out = std::make_shared<const Instance>(schema.name(), std::move(slots));
    return true;
}


} // namespace resolver_details

} // namespace SchemaFusion
