// Basic SchemaFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <SchemaFusion/schemafusion.hpp>
#include <cstdint>
#include <iostream>
#include <string>

using namespace SchemaFusion;
using namespace SchemaFusion::types;

int main() {
    SchemaRegistry registry;

    auto server = registry.Register("Server", {
        Field("host", String()),
        Field("port", Integer(), 8080),
    });
    if (!server) {
        std::cout << RegistrationResultToString(server) << std::endl;
        return 1;
    }

    auto config = registry.Register("Config", {
        Field("app_name", String()),
        Field("version", Integer()),
        Field("debug_mode", Boolean(), false),
        Field("server", Nested(registry.Find("Server"))),
        Field("tags", ListOf(String()), []{ return Sequence{}; }),
    });
    if (!config) {
        std::cout << RegistrationResultToString(config) << std::endl;
        return 1;
    }

    Mapping input{
        {"app_name", "MyApp"},
        {"version", 1},
        {"server", Mapping{{"host", "localhost"}}},
    };

    auto result = Construct(*registry.Find("Config"), input);
    if (!result) {
        std::cout << ConstructResultToString(result) << std::endl;
        return 1;
    }

    const Instance & cfg = *result.instance();
    std::cout << "Successfully constructed!" << std::endl;
    std::cout << cfg.toString() << std::endl;
    std::cout << "App: " << cfg.getAs<std::string>("app_name").value_or("?") << std::endl;
    std::cout << "Debug: " << (cfg.getAs<bool>("debug_mode").value_or(false) ? "ON" : "OFF") << std::endl;

    if (auto srv = cfg.getAs<RecordRef>("server"); srv && *srv) {
        std::cout << "Server: " << (*srv)->getAs<std::string>("host").value_or("?")
                  << ":" << (*srv)->getAs<std::int64_t>("port").value_or(0) << std::endl;
    }

    return 0;
}
