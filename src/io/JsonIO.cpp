#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

static bool is_std_stream(const std::string& path) {
    return path.empty() || path == "-";
}

std::string read_text(const std::string& path) {
    std::ostringstream ss;

    if (is_std_stream(path)) {
        ss << std::cin.rdbuf();
        return ss.str();
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open input file: " + path);
    }
    ss << in.rdbuf();
    return ss.str();
}

void write_text(const std::string& path, const std::string& text) {
    if (is_std_stream(path)) {
        std::cout << text;
        if (text.empty() || text.back() != '\n') std::cout << "\n";
        return;
    }

    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream out(p, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + p.string());

    out << text;
    if (text.empty() || text.back() != '\n') out << "\n";
}

void write_json(const std::string& path, const nlohmann::json& j) {
    write_text(path, j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

}  // namespace io
