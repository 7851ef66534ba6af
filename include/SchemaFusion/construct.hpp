#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "value.hpp"
#include "schema.hpp"
#include "construct_result.hpp"
#include "resolver.hpp"

namespace SchemaFusion {

struct NamedArgument {
    std::string name;
    Value       value;
};

// Exactly one of the two input forms may be supplied.
struct ConstructArgs {
    std::optional<Value>       mapping;
    std::vector<NamedArgument> named;
};


inline ConstructResult Construct(const Schema & schema, const Mapping & input) {
    resolver_details::ConstructionContext ctx;
    RecordRef instance;
    resolver_details::ConstructRecord(schema, input, instance, ctx);
    return ctx.result(std::move(instance));
}

inline ConstructResult Construct(const Schema & schema, const Value & input) {
    if(!input.isMapping()) {
        return ConstructResult(ConstructionError::USAGE_ERROR, path::Path(), input.toString(),
                               "mapping", schema.name(), RecordRef{});
    }
    return Construct(schema, input.asMapping());
}

inline ConstructResult ConstructFromFields(const Schema & schema, const std::vector<NamedArgument> & named) {
    Mapping input;
    for(const NamedArgument & arg : named) {
        if(input.contains(arg.name)) {
            return ConstructResult(ConstructionError::USAGE_ERROR, path::Path(arg.name), arg.value.toString(),
                                   "argument given once", schema.name(), RecordRef{});
        }
        input.set(Value(arg.name), arg.value);
    }
    return Construct(schema, input);
}

inline ConstructResult Construct(const Schema & schema, const ConstructArgs & args) {
    if(args.mapping && !args.named.empty()) {
        return ConstructResult(ConstructionError::USAGE_ERROR, path::Path(), std::string(),
                               "either a mapping or named arguments, not both", schema.name(), RecordRef{});
    }
    if(args.mapping) {
        return Construct(schema, *args.mapping);
    }
    return ConstructFromFields(schema, args.named);
}

inline ConstructResult Construct(const SchemaPtr & schema, const Value & input) {
    return Construct(*schema, input);
}

} // namespace SchemaFusion
