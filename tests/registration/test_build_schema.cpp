#include "../test_helpers.hpp"

using namespace TestHelpers;
using namespace SchemaFusion::types;

namespace {

bool test_classification() {
    SchemaPtr s = MakeSchema("T", {
        Field("required", Integer()),
        Field("plain_default", Integer(), 2),
        Field("null_default", Integer(), nullptr),
        Field("spec_no_default", Integer(), FieldSpec{.alias = "x"}),
        Field("spec_null_default", Integer(), FieldSpec{.defaultValue = nullptr}),
        Field("spec_default", Integer(), FieldSpec{.defaultValue = 222}),
        Field("factory", ListOf(Integer()), []{ return Sequence{1, 2}; }),
    });
    return s
        && s->findField("required")->isRequired()
        && !s->findField("plain_default")->isRequired()
        && !s->findField("null_default")->isRequired()
        && s->findField("spec_no_default")->isRequired()
        && s->findField("spec_null_default")->isRequired()
        && !s->findField("spec_default")->isRequired()
        && !s->findField("factory")->isRequired()
        && s->findField("factory")->defaultValue->isFactory();
}

bool test_fields_keep_declaration_order() {
    SchemaPtr s = MakeSchema("T", {Field("z", Integer()), Field("a", Integer()), Field("m", Integer())});
    return s && s->fields().size() == 3
        && s->fields()[0].name == "z"
        && s->fields()[1].name == "a"
        && s->fields()[2].name == "m";
}

bool test_alias_table() {
    SchemaPtr s = MakeSchema("T", {
        Field("a", Integer(), FieldSpec{.alias = "a-b"}),
        Field("c", Integer()),
    });
    return s
        && s->fieldIndexForKey("a-b") == std::optional<std::size_t>(0)
        && !s->fieldIndexForKey("a").has_value()
        && s->fieldIndexForKey("c") == std::optional<std::size_t>(1)
        && s->aliasTable().size() == 2;
}

bool test_options_table() {
    SchemaPtr s = MakeSchema("T", {
        Field("a", Integer(), FieldSpec{.allowedValues = Sequence{1, 2}}),
        Field("b", Integer()),
    });
    return s
        && s->optionsFor(0) != nullptr
        && *s->optionsFor(0) == Sequence{1, 2}
        && s->optionsFor(1) == nullptr;
}

bool test_container_literal_defaults_rejected() {
    return RegistrationFailsWith({Field("a", Integer(), Sequence{})}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", Integer(), Mapping{})}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", Any(), Sequence{1})}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", ListOf(Integer()), FieldSpec{.defaultValue = Sequence{1}})},
                                 RegistrationError::INVALID_DEFAULT);
}

bool test_mistyped_literal_defaults_rejected() {
    return RegistrationFailsWith({Field("a", Integer(), "")}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", Integer(), 2.2)}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", String(), 2)}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", String(), 2.2)}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", String(), true)}, RegistrationError::INVALID_DEFAULT)
        && RegistrationFailsWith({Field("a", Float(), 2)}, RegistrationError::INVALID_DEFAULT);
}

bool test_accepted_defaults() {
    return MakeSchema("T", {Field("a", Any(), 2)})
        && MakeSchema("T", {Field("a", Any(), "")})
        && MakeSchema("T", {Field("a", Any(), true)})
        && MakeSchema("T", {Field("a", Any(), 2.2)})
        && MakeSchema("T", {Field("a", Integer(), 2)})
        && MakeSchema("T", {Field("a", Float(), 2.2)})
        && MakeSchema("T", {Field("a", String(), "2")})
        && MakeSchema("T", {Field("a", Boolean(), false)})
        && MakeSchema("T", {Field("a", Integer(), nullptr)})
        && MakeSchema("T", {Field("a", MapOf(Any(), Any()), []{ return Mapping{}; })})
        && MakeSchema("T", {Field("a", MapOf(Integer(), Integer()), []{ return Mapping{{1, 2}}; })});
}

bool test_factories_not_invoked_at_registration() {
    int calls = 0;
    SchemaPtr s = MakeSchema("T", {
        Field("a", MapOf(Integer(), Integer()), [&calls]{ calls ++; return Mapping{{"a", "a"}}; }),
    });
    return s && calls == 0;
}

bool test_default_must_be_an_option() {
    return RegistrationFailsWith({Field("a", Integer(), FieldSpec{.defaultValue = 3, .allowedValues = Sequence{1, 2}})},
                                 RegistrationError::DEFAULT_NOT_IN_OPTIONS)
        && MakeSchema("T", {Field("a", Integer(), FieldSpec{.defaultValue = 2, .allowedValues = Sequence{1, 2}})});
}

bool test_options_must_match_type() {
    return RegistrationFailsWith({Field("a", Integer(), FieldSpec{.allowedValues = Sequence{"s", "b"}})},
                                 RegistrationError::INVALID_OPTIONS)
        && MakeSchema("T", {Field("a", ListOf(String()),
                                  FieldSpec{.allowedValues = Sequence{Value(Sequence{"s"}), Value(Sequence{"b"})}})})
        && MakeSchema("T", {Field("a", ListOf(Integer()),
                                  FieldSpec{.allowedValues = Sequence{Value(Sequence{1, 2})}})});
}

bool test_duplicate_field() {
    RegistrationResult res = BuildSchema("T", {Field("a", Integer()), Field("a", String())});
    return !res && res.error() == RegistrationError::DUPLICATE_FIELD && res.fieldName() == "a";
}

bool test_duplicate_alias() {
    return RegistrationFailsWith({Field("a", Integer(), FieldSpec{.alias = "b"}), Field("b", Integer())},
                                 RegistrationError::DUPLICATE_ALIAS)
        && RegistrationFailsWith({Field("a", Integer(), FieldSpec{.alias = "k"}),
                                  Field("b", Integer(), FieldSpec{.alias = "k"})},
                                 RegistrationError::DUPLICATE_ALIAS);
}

bool test_options_are_kept() {
    SchemaPtr s = MakeSchema("T", {Field("a", Integer())}, SchemaOptions{.ignore_unknown_fields = true});
    return s && s->name() == "T"
        && s->options().ignore_unknown_fields
        && !s->options().ignore_missing_fields;
}

bool test_registry() {
    SchemaRegistry registry;
    RegistrationResult first = registry.Register("Server", {Field("host", String())});
    RegistrationResult again = registry.Register("Server", {Field("port", Integer())});
    RegistrationResult bad = registry.Register("Bad", {Field("x", UntypedList())});
    return first
        && !again && again.error() == RegistrationError::REGISTRY_NAME_TAKEN
        && !bad && bad.error() == RegistrationError::UNTYPED_CONTAINER
        && registry.Contains("Server")
        && !registry.Contains("Bad")
        && registry.Find("Server") == first.schema()
        && registry.Find("Server")->findField("host") != nullptr
        && registry.Find("Missing") == nullptr
        && registry.size() == 1;
}

} // namespace

int main() {
    return RunTests("Schema builder", {
        {"classification", test_classification},
        {"fields keep declaration order", test_fields_keep_declaration_order},
        {"alias table", test_alias_table},
        {"options table", test_options_table},
        {"container literal defaults rejected", test_container_literal_defaults_rejected},
        {"mistyped literal defaults rejected", test_mistyped_literal_defaults_rejected},
        {"accepted defaults", test_accepted_defaults},
        {"factories not invoked at registration", test_factories_not_invoked_at_registration},
        {"default must be an option", test_default_must_be_an_option},
        {"options must match type", test_options_must_match_type},
        {"duplicate field", test_duplicate_field},
        {"duplicate alias", test_duplicate_alias},
        {"options are kept", test_options_are_kept},
        {"registry", test_registry},
    });
}
