#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace io {

// Reads a whole file; "" or "-" reads stdin. Throws std::runtime_error when the file can't be opened.
std::string read_text(const std::string& path);

// Writes text to a file (parent dirs created); "" or "-" writes stdout. Throws on open failure.
void write_text(const std::string& path, const std::string& text);

void write_json(const std::string& path, const nlohmann::json& j);

}  // namespace io
