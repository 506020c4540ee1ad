#include "pipeline/Pipeline.hpp"

#include "normalize/DomainNormalizers.hpp"
#include "normalize/FenceStripper.hpp"
#include "normalize/Sanitizer.hpp"

using json = nlohmann::json;

namespace pipeline {

const char* const kFailedPlaceholder = "Failed to generate.";

normalize::LocateResult prepare(const std::string& raw_text) {
    normalize::LocateResult res = normalize::locate(raw_text);
    if (res.ok()) res.value = normalize::sanitize(res.value);
    return res;
}

// Runs one record shape through the shared stages. `reshape` is the domain
// normalizer step, `fallback` builds the record used under SubstituteDefault.
template <typename Record, typename Reshape, typename Validate, typename Fallback>
static Record run_shape(const std::string& raw_text, const PipelineOptions& opt, const char* what,
                        Reshape reshape, Validate validate, Fallback fallback) {
    normalize::LocateResult res = prepare(raw_text);
    if (!res.ok()) {
        if (opt.on_failure == OnStructuralFailure::Propagate) {
            throw StructuralFailure(std::string(what) + ": " + res.detail, res.error);
        }
        return fallback();
    }
    return validate(reshape(res.value));
}

static const json& as_is(const json& v) { return v; }

records::MatchScoreReport run_match_score(const std::string& raw_text, const PipelineOptions& opt) {
    return run_shape<records::MatchScoreReport>(
        raw_text, opt, "match score", as_is,
        [](const json& v) { return records::validate_match_score(v); },
        [] {
            records::MatchScoreReport r = records::validate_match_score(json());
            r.summary = kFailedPlaceholder;
            return r;
        });
}

records::JobFitAnalysis run_job_fit(const std::string& raw_text, const PipelineOptions& opt) {
    return run_shape<records::JobFitAnalysis>(
        raw_text, opt, "job fit analysis", as_is,
        [](const json& v) { return records::validate_job_fit(v); },
        [] {
            records::JobFitAnalysis r = records::validate_job_fit(json());
            r.recommendation.reason = kFailedPlaceholder;
            return r;
        });
}

records::CompanyResearchReport run_company_research(const std::string& raw_text, const PipelineOptions& opt) {
    return run_shape<records::CompanyResearchReport>(
        raw_text, opt, "company research", as_is,
        [&opt](const json& v) { return records::validate_company_research(v, opt.limits); },
        [&opt] {
            records::CompanyResearchReport r = records::validate_company_research(json(), opt.limits);
            r.summary.verdict = kFailedPlaceholder;
            return r;
        });
}

records::InterviewPrepKit run_interview_prep(const std::string& raw_text, const PipelineOptions& opt) {
    return run_shape<records::InterviewPrepKit>(
        raw_text, opt, "interview prep", as_is,
        [](const json& v) { return records::validate_interview_prep(v); },
        [] {
            records::InterviewPrepKit r = records::validate_interview_prep(json());
            r.company_research.mission = kFailedPlaceholder;
            r.company_research.culture = kFailedPlaceholder;
            return r;
        });
}

records::ResumeRecord run_resume(const std::string& raw_text, const PipelineOptions& opt) {
    return run_shape<records::ResumeRecord>(
        raw_text, opt, "resume",
        [](const json& v) { return normalize::normalize_skills(normalize::normalize_descriptions(v)); },
        [](const json& v) { return records::validate_resume(v); },
        [] {
            records::ResumeRecord r = records::validate_resume(json());
            r.summary = kFailedPlaceholder;
            return r;
        });
}

records::DocumentRecord run_document(const std::string& raw_text, const PipelineOptions& opt) {
    records::DocumentRecord doc;

    // An empty wrapper is the model's answer, not prose to fall back on.
    normalize::LocateResult res = prepare(raw_text);
    if (res.ok() && records::is_document_wrapper(res.value)) doc = records::validate_document(res.value);
    else doc.text = normalize::strip(raw_text);

    if (doc.text.empty()) {
        if (opt.on_failure == OnStructuralFailure::Propagate) {
            throw StructuralFailure("document: model returned no text", normalize::ParseError::Unparsable);
        }
        doc.text = kFailedPlaceholder;
    }
    return doc;
}

const char* policy_str(OnStructuralFailure p) {
    switch (p) {
        case OnStructuralFailure::Propagate: return "propagate";
        case OnStructuralFailure::SubstituteDefault: return "default";
        default: return "propagate";
    }
}

bool parse_policy(const std::string& s, OnStructuralFailure& out) {
    if (s == "propagate") {
        out = OnStructuralFailure::Propagate;
        return true;
    }
    if (s == "default") {
        out = OnStructuralFailure::SubstituteDefault;
        return true;
    }
    return false;
}

}  // namespace pipeline
