#include "../test_helpers.hpp"
#include <SchemaFusion/yaml.hpp>

using namespace TestHelpers;
using namespace SchemaFusion::types;

namespace {

bool Loads(std::string_view yaml, const Value & expected) {
    DocumentResult doc = LoadYaml(yaml);
    if(!doc) {
        std::cerr << "    unexpected: " << error_to_string(doc.error()) << " " << doc.message() << "\n";
        return false;
    }
    if(!(doc.value() == expected)) {
        std::cerr << "    got " << doc.value().toString() << "\n";
        return false;
    }
    return true;
}

bool LoadFailsWith(std::string_view yaml, DocumentError expected) {
    DocumentResult doc = LoadYaml(yaml);
    return !doc && doc.error() == expected;
}

bool test_scalars() {
    return Loads(R"(
a: 1
b: "1"
c: 1.1
d: false
e: hello
)", Mapping{{"a", 1}, {"b", "1"}, {"c", 1.1}, {"d", false}, {"e", "hello"}});
}

bool test_null_forms() {
    return Loads("a: ~\nb: null\nc:\nd: ''\n", Mapping{{"a", nullptr}, {"b", nullptr}, {"c", nullptr}, {"d", ""}});
}

bool test_numbers() {
    return Loads("a: -12\nb: +5\nc: 1e3\nd: .5\ne: 12abc\nf: '7'\n",
                 Mapping{{"a", -12}, {"b", 5}, {"c", 1000.0}, {"d", 0.5}, {"e", "12abc"}, {"f", "7"}});
}

bool test_sequences_and_maps() {
    Value expected = Mapping{
        {"a", Sequence{Value(Sequence{1, 2, 3})}},
        {"b", Sequence{Value(Mapping{{1, 1}}), Value(Mapping{{2, 2}})}},
        {"c", Mapping{{"a", 1}, {"b", 2}}},
        {"d", Mapping{{"a", Sequence{1, 2}}}},
    };
    return Loads(R"(
a: [[1, 2, 3]]
b:
- 1: 1
- 2: 2
c:
    a: 1
    b: 2
d:
    a: [1, 2]
)", expected);
}

bool test_key_order_preserved() {
    DocumentResult doc = LoadYaml("z: 1\na: 2\nm: 3\n");
    if(!doc) return false;
    const Mapping & m = doc.value().asMapping();
    auto it = m.begin();
    return (it ++)->key == Value("z") && (it ++)->key == Value("a") && (it ++)->key == Value("m");
}

bool test_empty_document_is_null() {
    return Loads("", Value());
}

bool test_unsupported_features() {
    return LoadFailsWith("a: &x 1\nb: *x\n", DocumentError::UNSUPPORTED_YAML_FEATURE)
        && LoadFailsWith("a: !!str 1\n", DocumentError::UNSUPPORTED_YAML_FEATURE)
        && LoadFailsWith("--- 1\n--- 2\n", DocumentError::UNSUPPORTED_YAML_FEATURE);
}

bool test_illformed() {
    return LoadFailsWith("a: [1, 2\n", DocumentError::ILLFORMED_DOCUMENT);
}

bool test_out_of_range() {
    return LoadFailsWith("a: 99999999999999999999\n", DocumentError::NUMERIC_VALUE_IS_OUT_OF_RANGE)
        && Loads("a: 9223372036854775807\n", Mapping{{"a", std::int64_t(9223372036854775807)}});
}

bool test_construct_from_yaml() {
    SchemaPtr c = MakeSchema("C", {Field("a", Integer())});
    SchemaPtr b = MakeSchema("B", {Field("c", Nested(c))});
    SchemaPtr a = MakeSchema("A", {Field("b", Nested(b)), Field("name", String(), "none")});
    DocumentResult doc = LoadYaml(R"(
b:
    c:
        a: 1
)");
    RecordRef inst = doc ? ConstructOrNull(a, doc.value()) : nullptr;
    return inst && inst->toString() == "A(b=B(c=C(a=1)), name=\"none\")";
}

bool test_alias_key_from_yaml() {
    SchemaPtr s = MakeSchema("A", {Field("a", Integer(), FieldSpec{.alias = "a-b"})});
    DocumentResult doc = LoadYaml("a-b: 2\n");
    return doc && FieldEquals(ConstructOrNull(s, doc.value()), "a", 2);
}

bool test_quoted_number_is_wrong_type() {
    SchemaPtr s = MakeSchema("A", {Field("port", Integer())});
    DocumentResult doc = LoadYaml("port: \"8080\"\n");
    return doc && ConstructFailsAt(s, doc.value(), ConstructionError::WRONG_TYPE, "$.port");
}

} // namespace

int main() {
    return RunTests("rapidyaml loader", {
        {"scalars", test_scalars},
        {"null forms", test_null_forms},
        {"numbers", test_numbers},
        {"sequences and maps", test_sequences_and_maps},
        {"key order preserved", test_key_order_preserved},
        {"empty document is null", test_empty_document_is_null},
        {"unsupported features", test_unsupported_features},
        {"illformed", test_illformed},
        {"out of range", test_out_of_range},
        {"construct from yaml", test_construct_from_yaml},
        {"alias key from yaml", test_alias_key_from_yaml},
        {"quoted number is wrong type", test_quoted_number_is_wrong_type},
    });
}
