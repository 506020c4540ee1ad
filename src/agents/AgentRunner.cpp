#include "agents/AgentRunner.hpp"

#include <optional>

namespace agents {

const char* feature_name(Feature f) {
    switch (f) {
        case Feature::MatchScore: return "match";
        case Feature::JobFit: return "fit";
        case Feature::CompanyResearch: return "research";
        case Feature::InterviewPrep: return "prep";
        case Feature::ResumeEnhance: return "resume";
        case Feature::Document: return "document";
        default: return "unknown";
    }
}

bool parse_feature(const std::string& name, Feature& out) {
    static const Feature all[] = {
        Feature::MatchScore, Feature::JobFit, Feature::CompanyResearch,
        Feature::InterviewPrep, Feature::ResumeEnhance, Feature::Document,
    };
    for (Feature f : all) {
        if (name == feature_name(f)) {
            out = f;
            return true;
        }
    }
    return false;
}

pipeline::OnStructuralFailure default_policy(Feature f) {
    if (f == Feature::InterviewPrep) return pipeline::OnStructuralFailure::SubstituteDefault;
    return pipeline::OnStructuralFailure::Propagate;
}

pipeline::PipelineOptions default_options(Feature f) {
    pipeline::PipelineOptions opt;
    opt.on_failure = default_policy(f);
    return opt;
}

nlohmann::json run_feature(Feature f, const std::string& raw_text, const pipeline::PipelineOptions& opt) {
    switch (f) {
        case Feature::MatchScore: return pipeline::run_match_score(raw_text, opt).to_json();
        case Feature::JobFit: return pipeline::run_job_fit(raw_text, opt).to_json();
        case Feature::CompanyResearch: return pipeline::run_company_research(raw_text, opt).to_json();
        case Feature::InterviewPrep: return pipeline::run_interview_prep(raw_text, opt).to_json();
        case Feature::ResumeEnhance: return pipeline::run_resume(raw_text, opt).to_json();
        case Feature::Document: return pipeline::run_document(raw_text, opt).to_json();
        default: return pipeline::run_document(raw_text, opt).to_json();
    }
}

nlohmann::json AgentRunner::run(Feature f, const std::string& request_id, const std::string& prompt,
                                const pipeline::PipelineOptions& opt) {
    const std::optional<std::string> text = client_.complete(request_id, prompt);
    return run_feature(f, text.value_or(""), opt);
}

}  // namespace agents
