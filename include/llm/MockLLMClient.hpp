#pragma once

#include "llm/LLMClient.hpp"

#include <filesystem>
#include <string>

namespace llm {

// Replays canned model output: complete("abc", ...) returns <root>/abc.txt verbatim.
class MockLLMClient final : public LLMClient {
    std::filesystem::path root_;

public:
    explicit MockLLMClient(const std::string& root_dir);

    // prompt is ignored; request_id picks the file
    std::optional<std::string> complete(const std::string& request_id,
                                        const std::string& prompt) override;

    std::filesystem::path path_for(const std::string& request_id) const;
};

} // namespace llm
