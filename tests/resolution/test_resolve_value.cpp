#include "../test_helpers.hpp"

using namespace TestHelpers;
using namespace SchemaFusion::types;
using SchemaFusion::resolver_details::ConstructionContext;
using SchemaFusion::resolver_details::ResolveValue;

namespace {

bool Resolves(const Value & in, const TypeDescriptor & type, const Value & expected) {
    ConstructionContext ctx;
    Value out;
    return ResolveValue(in, type, out, ctx) && out == expected;
}

bool ResolveFailsWith(const Value & in, const TypeDescriptor & type, ConstructionError expected,
                      std::string_view expectedPath = "$") {
    ConstructionContext ctx;
    Value out;
    return !ResolveValue(in, type, out, ctx)
        && ctx.currentError() == expected
        && ctx.errorPath().toString() == expectedPath;
}

bool test_null_passes_every_descriptor() {
    SchemaPtr inner = MakeSchema("Inner", {Field("a", Integer())});
    return Resolves(nullptr, Integer(), nullptr)
        && Resolves(nullptr, String(), nullptr)
        && Resolves(nullptr, ListOf(Integer()), nullptr)
        && Resolves(nullptr, MapOf(String(), Integer()), nullptr)
        && Resolves(nullptr, Nested(inner), nullptr);
}

bool test_any_passes_unchanged() {
    Mapping odd{{true, Sequence{1, "x"}}, {nullptr, 2.5}};
    return Resolves(0, Any(), 0)
        && Resolves("", Any(), "")
        && Resolves(Sequence{11111, 1111}, Any(), Sequence{11111, 1111})
        && Resolves(odd, Any(), odd);
}

bool test_primitive_exact_kind() {
    return Resolves(1, Integer(), 1)
        && Resolves(1.5, Float(), 1.5)
        && Resolves("1", String(), "1")
        && Resolves(false, Boolean(), false)
        && ResolveFailsWith("1", Integer(), ConstructionError::WRONG_TYPE)
        && ResolveFailsWith(1.0, Integer(), ConstructionError::WRONG_TYPE)
        && ResolveFailsWith(Sequence{1}, String(), ConstructionError::WRONG_TYPE);
}

bool test_no_widening() {
    return ResolveFailsWith(1, Float(), ConstructionError::WRONG_TYPE)
        && ResolveFailsWith(true, Integer(), ConstructionError::WRONG_TYPE)
        && ResolveFailsWith(0, Boolean(), ConstructionError::WRONG_TYPE);
}

bool test_list_of_list() {
    Value in = Sequence{Value(Sequence{1, 2, 3})};
    return Resolves(in, ListOf(ListOf(Integer())), in)
        && Resolves(Sequence{}, ListOf(ListOf(Integer())), Sequence{});
}

bool test_list_of_map() {
    Value in = Sequence{Value(Mapping{{1, 1}}), Value(Mapping{{2, 2}})};
    return Resolves(in, ListOf(MapOf(Integer(), Integer())), in);
}

bool test_list_element_failure_short_circuits() {
    return ResolveFailsWith(Sequence{1, "two", 3.0}, ListOf(Integer()), ConstructionError::WRONG_TYPE, "$[1]")
        && ResolveFailsWith(Mapping{{"a", 1}}, ListOf(Integer()), ConstructionError::WRONG_TYPE);
}

bool test_map_keeps_original_keys_and_order() {
    Mapping in{{"b", 2}, {"a", 1}, {"c", 3}};
    ConstructionContext ctx;
    Value out;
    if(!ResolveValue(in, MapOf(String(), Integer()), out, ctx)) return false;
    const Mapping & m = out.asMapping();
    auto it = m.begin();
    return m.size() == 3
        && (it ++)->key == Value("b")
        && (it ++)->key == Value("a")
        && (it ++)->key == Value("c");
}

bool test_map_with_any_key_keeps_float_key() {
    Mapping in{{1.5, "x"}, {2, "y"}};
    return Resolves(in, MapOf(Any(), String()), in);
}

bool test_map_key_failures() {
    return ResolveFailsWith(Mapping{{true, 1}}, MapOf(Any(), Integer()), ConstructionError::WRONG_TYPE, "$.true")
        && ResolveFailsWith(Mapping{{1, 1}}, MapOf(String(), Integer()), ConstructionError::WRONG_TYPE, "$.1")
        && ResolveFailsWith(Mapping{{"a", 1}}, MapOf(Integer(), Integer()), ConstructionError::WRONG_TYPE, "$.a");
}

bool test_map_value_failure_path() {
    Mapping in{{"a", Sequence{1, 2}}, {"b", Sequence{1, "x"}}};
    return ResolveFailsWith(in, MapOf(String(), ListOf(Integer())), ConstructionError::WRONG_TYPE, "$.b[1]")
        && ResolveFailsWith(Sequence{1}, MapOf(String(), Integer()), ConstructionError::WRONG_TYPE);
}

bool test_nested_requires_mapping() {
    SchemaPtr inner = MakeSchema("Inner", {Field("a", Integer())});
    ConstructionContext ctx;
    Value out;
    bool ok = ResolveValue(Mapping{{"a", 1}}, Nested(inner), out, ctx)
        && out.isRecord()
        && out.asRecord()->recordName() == "Inner";
    return ok
        && ResolveFailsWith(Sequence{1}, Nested(inner), ConstructionError::WRONG_TYPE)
        && ResolveFailsWith(Mapping{{"a", "x"}}, Nested(inner), ConstructionError::WRONG_TYPE, "$.a");
}

bool test_wrong_type_reports_expected_shape() {
    ConstructionContext ctx;
    Value out;
    return !ResolveValue(Sequence{Value(Mapping{{"k", "v"}})}, ListOf(MapOf(String(), Integer())), out, ctx)
        && ctx.errorExpected() == "integer"
        && ctx.errorValueText() == "\"v\""
        && ctx.errorPath().toString() == "$[0].k";
}

} // namespace

int main() {
    return RunTests("Type resolver", {
        {"null passes every descriptor", test_null_passes_every_descriptor},
        {"any passes unchanged", test_any_passes_unchanged},
        {"primitive exact kind", test_primitive_exact_kind},
        {"no widening", test_no_widening},
        {"list of list", test_list_of_list},
        {"list of map", test_list_of_map},
        {"list element failure short-circuits", test_list_element_failure_short_circuits},
        {"map keeps original keys and order", test_map_keeps_original_keys_and_order},
        {"map with any key keeps float key", test_map_with_any_key_keeps_float_key},
        {"map key failures", test_map_key_failures},
        {"map value failure path", test_map_value_failure_path},
        {"nested requires mapping", test_nested_requires_mapping},
        {"wrong type reports expected shape", test_wrong_type_reports_expected_shape},
    });
}
