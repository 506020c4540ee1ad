#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "normalize/JsonLocator.hpp"
#include "records/CompanyResearch.hpp"
#include "records/Document.hpp"
#include "records/InterviewPrep.hpp"
#include "records/JobFit.hpp"
#include "records/MatchScore.hpp"
#include "records/Resume.hpp"
#include "records/ValidatorConfig.hpp"

namespace pipeline {

// What to do when no JSON object can be recovered from the model output.
enum class OnStructuralFailure {
    Propagate,          // throw StructuralFailure, the caller shows "try again"
    SubstituteDefault   // return the all-defaults record with a placeholder headline
};

extern const char* const kFailedPlaceholder;   // "Failed to generate."

class StructuralFailure : public std::runtime_error {
public:
    StructuralFailure(const std::string& what, normalize::ParseError error)
        : std::runtime_error(what), error_(error) {}

    normalize::ParseError error() const { return error_; }

private:
    normalize::ParseError error_;
};

struct PipelineOptions {
    OnStructuralFailure on_failure = OnStructuralFailure::Propagate;
    records::ValidatorConfig limits;
};

// locate + sanitize; value is the sanitized object when ok()
normalize::LocateResult prepare(const std::string& raw_text);

records::MatchScoreReport run_match_score(const std::string& raw_text, const PipelineOptions& opt);
records::JobFitAnalysis run_job_fit(const std::string& raw_text, const PipelineOptions& opt);
records::CompanyResearchReport run_company_research(const std::string& raw_text, const PipelineOptions& opt);
records::InterviewPrepKit run_interview_prep(const std::string& raw_text, const PipelineOptions& opt);

// also applies normalize_descriptions / normalize_skills before validating
records::ResumeRecord run_resume(const std::string& raw_text, const PipelineOptions& opt);

// Free text: a located {"content" | "text" | "document": ...} wrapper is unwrapped,
// otherwise the stripped text is the document. An empty result, wrapped or not,
// is a structural failure.
records::DocumentRecord run_document(const std::string& raw_text, const PipelineOptions& opt);

const char* policy_str(OnStructuralFailure p);
bool parse_policy(const std::string& s, OnStructuralFailure& out);

}  // namespace pipeline
