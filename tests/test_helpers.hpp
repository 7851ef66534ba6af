#pragma once

#include <SchemaFusion/schemafusion.hpp>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TestHelpers {

using namespace SchemaFusion;

// ============================================================================
// Schema Helpers
// ============================================================================

/// Build a schema that is expected to register; null on failure (printed).
inline SchemaPtr MakeSchema(std::string name, const std::vector<Field> & fields, SchemaOptions opts = {}) {
    RegistrationResult res = BuildSchema(std::move(name), fields, opts);
    if(!res) {
        std::cerr << "    unexpected: " << RegistrationResultToString(res) << "\n";
        return nullptr;
    }
    return res.schema();
}

/// Check that registration fails with a specific error code
inline bool RegistrationFailsWith(const std::vector<Field> & fields, RegistrationError expected,
                                  SchemaOptions opts = {}) {
    RegistrationResult res = BuildSchema("T", fields, opts);
    return !res && res.error() == expected;
}

// ============================================================================
// Construction Helpers
// ============================================================================

/// Check that construction succeeds
inline bool ConstructSucceeds(const SchemaPtr & schema, const Value & input) {
    if(!schema) return false;
    ConstructResult res = Construct(*schema, input);
    if(!res) {
        std::cerr << "    unexpected: " << ConstructResultToString(res) << "\n";
    }
    return static_cast<bool>(res);
}

/// Check that construction fails (any error)
inline bool ConstructFails(const SchemaPtr & schema, const Value & input) {
    return schema && !Construct(*schema, input);
}

/// Check that construction fails with specific error code
inline bool ConstructFailsWith(const SchemaPtr & schema, const Value & input, ConstructionError expected) {
    if(!schema) return false;
    ConstructResult res = Construct(*schema, input);
    return !res && res.error() == expected;
}

/// Check error code and rendered path, e.g. "$.outer.items[2]"
inline bool ConstructFailsAt(const SchemaPtr & schema, const Value & input,
                             ConstructionError expected, std::string_view expectedPath) {
    if(!schema) return false;
    ConstructResult res = Construct(*schema, input);
    if(res || res.error() != expected) return false;
    if(res.errorPath().toString() != expectedPath) {
        std::cerr << "    path was " << res.errorPath().toString() << "\n";
        return false;
    }
    return true;
}

/// Construct and return the instance, null on failure (printed)
inline RecordRef ConstructOrNull(const SchemaPtr & schema, const Value & input) {
    if(!schema) return nullptr;
    ConstructResult res = Construct(*schema, input);
    if(!res) {
        std::cerr << "    unexpected: " << ConstructResultToString(res) << "\n";
        return nullptr;
    }
    return res.instance();
}

/// Check that the field is set and equal to the expected value
inline bool FieldEquals(const RecordRef & inst, std::string_view name, const Value & expected) {
    if(!inst) return false;
    const Value * v = inst->get(name);
    return v != nullptr && *v == expected;
}

// ============================================================================
// Runner
// ============================================================================

struct TestCase {
    std::string_view      name;
    std::function<bool()> fn;
};

/// Runs every case, prints PASSED/FAILED per case and returns the process exit code
inline int RunTests(std::string_view suite, std::initializer_list<TestCase> cases) {
    std::cout << "=== " << suite << " ===\n";
    std::size_t failed = 0;
    for(const TestCase & c : cases) {
        std::cout << c.name << "... ";
        bool ok = c.fn();
        std::cout << (ok ? "PASSED" : "FAILED") << "\n";
        if(!ok) failed ++;
    }
    std::cout << (cases.size() - failed) << "/" << cases.size() << " passed\n";
    return failed == 0 ? 0 : 1;
}

} // namespace TestHelpers
