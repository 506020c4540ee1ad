#include "commands/strip.hpp"

#include "io/JsonIO.hpp"
#include "normalize/FenceStripper.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_strip(int argc, char** argv) {
    const std::string in_path = get_arg(argc, argv, "--in", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");

    try {
        io::write_text(out_path, normalize::strip(io::read_text(in_path)));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
