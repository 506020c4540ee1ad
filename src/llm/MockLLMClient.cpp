#include "llm/MockLLMClient.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace llm {

MockLLMClient::MockLLMClient(const std::string& root_dir) : root_(root_dir) {}

fs::path MockLLMClient::path_for(const std::string& request_id) const {
    return root_ / (request_id + ".txt");
}

std::optional<std::string> MockLLMClient::complete(const std::string& request_id, const std::string&) {
    std::ifstream f(path_for(request_id), std::ios::in | std::ios::binary);
    if (!f) return std::nullopt;

    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace llm
