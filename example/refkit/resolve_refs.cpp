/*
 * resolve_refs.cpp
 *
 * Copyright (C) 2024 Max Q.
 *
 * Example usage of the refkit reference helpers
 */

#include <iostream>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "refkit/io/path.hpp"
#include "refkit/pointer/pointer.hpp"
#include "refkit/pointer/reference.hpp"
#include "refkit/type/tree.hpp"

using refkit::type::json;

int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();
    if (argc > 1 && std::string(argv[1]) == "-v") {
        spdlog::set_level(spdlog::level::trace);
    }

    std::cout << "=== Path Normalization ===\n";
    for (const auto* path : {"/a/b/../c", "a/b/../../c", "../a", "/../a",
                             "/a/b/", "dir/my%20file.yaml"}) {
        std::cout << "  " << path << " -> "
                  << refkit::io::normalize(path) << "\n";
    }

    std::cout << "\n=== Reference Parsing ===\n";
    const std::string base = "specs/api/openapi.yaml";
    for (const auto* ref :
         {"#/components/schemas/Pet", "models/pet.yaml#/Pet",
          "../common.yaml", "https://Example.com:443/s.yaml#/a"}) {
        const auto info = refkit::pointer::parseRef(ref, base);
        std::cout << "  " << ref << "\n"
                  << "    file:       " << info.file_path << "\n"
                  << "    pointer:    " << info.pointer << "\n"
                  << "    normalized: " << info.normalized << "\n";
    }

    std::cout << "\n=== Pointers ===\n";
    const std::vector<std::string> tokens = {"paths", "/pets/{id}", "get"};
    const auto pointer = refkit::pointer::buildPointer(tokens);
    std::cout << "  built:  " << pointer << "\n";
    std::cout << "  parsed:";
    for (const auto& token : refkit::pointer::parsePointer(pointer)) {
        std::cout << " [" << token << "]";
    }
    std::cout << "\n";

    std::cout << "\n=== Tree Access and allOf Merge ===\n";
    json doc = json::parse(R"({
        "components": {"schemas": {
            "Base": {"type": "object", "required": ["id"],
                     "properties": {"id": {"type": "integer"}}},
            "Named": {"required": ["name"],
                      "properties": {"name": {"type": "string"}}}
        }}
    })");

    const auto* baseSchema = refkit::type::getValueByPath(
        doc, refkit::pointer::toObjPath("/components/schemas/Base"));
    const auto* namedSchema = refkit::type::getValueByPath(
        doc, {"components", "schemas", "Named"});
    if (baseSchema == nullptr || namedSchema == nullptr) {
        std::cerr << "schemas not found\n";
        return 1;
    }

    const auto merged = refkit::type::mergeValues(*baseSchema, *namedSchema);
    refkit::type::setValueByPath(doc, {"components", "schemas", "Pet"},
                                 merged);
    std::cout << doc["components"]["schemas"]["Pet"].dump(2) << "\n";
    std::cout << "  ref: "
              << refkit::pointer::buildRef({"components", "schemas", "Pet"},
                                           base)
              << "\n";

    return 0;
}
