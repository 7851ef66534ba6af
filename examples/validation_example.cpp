// SchemaFusion validation example
// Demonstrates:
//  - Aliases to decouple field names from input keys
//  - Allow-lists on fields
//  - Error paths through nested records and lists
// Compile: g++ -std=c++23 -I../include validation_example.cpp -o validation_example

#include <SchemaFusion/schemafusion.hpp>
#include <iostream>

using namespace SchemaFusion;
using namespace SchemaFusion::types;

int main() {
    // field "motor_id" is read from input key "id"
    auto motor = BuildSchema("Motor", {
        Field("motor_id", Integer(), FieldSpec{.alias = "id"}),
        Field("motor_name", String(), FieldSpec{.alias = "name"}),
        Field("mode", String(), FieldSpec{.defaultValue = FieldDefault("position"),
                                          .allowedValues = Sequence{"position", "velocity", "torque"}}),
    });
    if (!motor) {
        std::cout << RegistrationResultToString(motor) << std::endl;
        return 1;
    }

    auto config = BuildSchema("Config", {
        Field("motors", ListOf(Nested(motor.schema()))),
    });
    if (!config) {
        std::cout << RegistrationResultToString(config) << std::endl;
        return 1;
    }

    Mapping valid{
        {"motors", Sequence{
            Value(Mapping{{"id", 1}, {"name", "Motor1"}}),
            Value(Mapping{{"id", 2}, {"name", "Motor2"}, {"mode", "torque"}}),
        }},
    };

    auto result = Construct(*config.schema(), valid);
    if (result) {
        std::cout << "Valid input accepted: " << result.instance()->toString() << std::endl;
    } else {
        std::cout << ConstructResultToString(result) << std::endl;
    }

    // second motor asks for a mode that is not allowed
    Mapping invalid_mode{
        {"motors", Sequence{
            Value(Mapping{{"id", 1}, {"name", "Motor1"}}),
            Value(Mapping{{"id", 2}, {"name", "Motor2"}, {"mode", "speed"}}),
        }},
    };

    result = Construct(*config.schema(), invalid_mode);
    if (!result) {
        std::cout << "Invalid mode rejected (expected)" << std::endl;
        std::cout << "  " << ConstructResultToString(result) << std::endl;
    }

    // wrong element type deep inside the tree
    Mapping invalid_id{
        {"motors", Sequence{Value(Mapping{{"id", "one"}, {"name", "Motor1"}})}},
    };

    result = Construct(*config.schema(), invalid_id);
    if (!result) {
        std::cout << "Invalid id rejected (expected)" << std::endl;
        std::cout << "  error: " << error_to_string(result.error())
                  << " at " << result.errorPath().toString() << std::endl;
    }

    return 0;
}
