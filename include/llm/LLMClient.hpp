#pragma once
#include <optional>
#include <string>

namespace llm {

// The model caller. Prompt building, model choice, retries and timeouts all
// live behind this interface; callers only ever see text or no text.
class LLMClient {
public:
    virtual ~LLMClient() = default;

    // std::nullopt means the transport failed (no response body at all).
    virtual std::optional<std::string> complete(const std::string& request_id,
                                                const std::string& prompt) = 0;
};

class NullLLMClient final : public LLMClient {
public:
    std::optional<std::string> complete(const std::string&, const std::string&) override { return std::nullopt; }
};

} // namespace llm
