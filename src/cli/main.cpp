// jsonpatch — applies RFC 6902 JSON Patches to JSON or YAML documents.

#include "app.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    auto args = std::vector<std::string>(argv + 1, argv + argc);
    try {
        return jsonpatch_cpp::cli::testable_main(args, std::cout);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "jsonpatch: %s\n", e.what());
        return 1;
    }
}
