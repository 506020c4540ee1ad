#pragma once

#include <string>

#include "llm/LLMClient.hpp"
#include "nlohmann/json.hpp"
#include "pipeline/Pipeline.hpp"

namespace agents {

enum class Feature {
    MatchScore,       // "match"
    JobFit,           // "fit"
    CompanyResearch,  // "research"
    InterviewPrep,    // "prep"
    ResumeEnhance,    // "resume"
    Document          // "document"
};

const char* feature_name(Feature f);
bool parse_feature(const std::string& name, Feature& out);

// Interview prep renders an empty kit rather than an error panel; every other
// feature reports "try again" when nothing could be recovered.
pipeline::OnStructuralFailure default_policy(Feature f);

pipeline::PipelineOptions default_options(Feature f);

// Runs the feature's pipeline over raw model text and serializes the typed record.
// Throws pipeline::StructuralFailure only under OnStructuralFailure::Propagate.
nlohmann::json run_feature(Feature f, const std::string& raw_text, const pipeline::PipelineOptions& opt);

class AgentRunner {
    llm::LLMClient& client_;

public:
    explicit AgentRunner(llm::LLMClient& client) : client_(client) {}

    // Missing model output is handled exactly like unparsable output.
    nlohmann::json run(Feature f, const std::string& request_id, const std::string& prompt,
                       const pipeline::PipelineOptions& opt);

    nlohmann::json run(Feature f, const std::string& request_id, const std::string& prompt) {
        return run(f, request_id, prompt, default_options(f));
    }
};

}  // namespace agents
