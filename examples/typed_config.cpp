// Loading a YAML document through a schema and copying it into a plain struct
// Compile: g++ -std=c++23 -I../include typed_config.cpp -lryml -o typed_config

#include <SchemaFusion/schemafusion.hpp>
#include <SchemaFusion/yaml.hpp>
#include <SchemaFusion/record_binding.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace SchemaFusion;
using namespace SchemaFusion::types;

struct Listener {
    std::string address;
    int port;
};

struct Service {
    std::string name;
    int workers = 1;
    std::vector<Listener> listeners;
    std::optional<std::string> log_file;
};

int main() {
    auto listener = BuildSchema("Listener", {
        Field("address", String(), "0.0.0.0"),
        Field("port", Integer()),
    });
    if (!listener) {
        std::cout << RegistrationResultToString(listener) << std::endl;
        return 1;
    }
    auto service = BuildSchema("Service", {
        Field("name", String()),
        Field("workers", Integer(), 4),
        Field("listeners", ListOf(Nested(listener.schema()))),
        Field("log_file", String(), nullptr),
    });
    if (!service) {
        std::cout << RegistrationResultToString(service) << std::endl;
        return 1;
    }

    const char * yaml = R"(
name: gateway
listeners:
  - port: 80
  - address: 127.0.0.1
    port: 9090
)";

    auto doc = LoadYaml(yaml);
    if (!doc) {
        std::cout << "YAML error " << error_to_string(doc.error()) << ": " << doc.message() << std::endl;
        return 1;
    }

    auto result = Construct(*service.schema(), *doc);
    if (!result) {
        std::cout << ConstructResultToString(result) << std::endl;
        return 1;
    }

    Service svc;
    auto bound = BindRecord(*result.instance(), svc);
    if (!bound) {
        std::cout << "bind error " << error_to_string(bound.error()) << " at " << bound.member() << std::endl;
        return 1;
    }

    std::cout << svc.name << " with " << svc.workers << " workers" << std::endl;
    for (const Listener & l : svc.listeners) {
        std::cout << "  listening on " << l.address << ":" << l.port << std::endl;
    }
    std::cout << "  log: " << svc.log_file.value_or("<stderr>") << std::endl;
    return 0;
}
