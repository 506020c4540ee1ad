#include "records/JobFit.hpp"
#include "records/FieldReaders.hpp"
#include "normalize/Coerce.hpp"

#include <optional>

using json = nlohmann::json;

namespace records {

static std::optional<TechnicalSkill> parse_technical_skill(const json& e) {
    TechnicalSkill s;
    if (e.is_object()) {
        s.name = str_at(e, "name");
        s.status = (str_at(e, "status") == "matched") ? SkillStatus::Matched : SkillStatus::Missing;
    } else {
        // a bare "SQL" carries a name but no verdict
        s.name = normalize::ensure_string(e);
    }
    if (s.name.empty()) return std::nullopt;
    return s;
}

static SubScore parse_sub_score(const json& v) {
    SubScore s;
    s.score = num_at(v, "score");
    s.reason = str_at(v, "reason");
    return s;
}

JobFitAnalysis validate_job_fit(const json& v) {
    JobFitAnalysis r;

    const json& ki = member(v, "keyInfo");
    r.key_info.role = str_at(ki, "role");
    r.key_info.company = str_at(ki, "company");
    r.key_info.location = str_at(ki, "location");
    r.key_info.salary = str_at(ki, "salary");
    r.key_info.work_mode = str_at(ki, "workMode");
    r.key_info.experience = str_at(ki, "experience");

    const json& sk = member(v, "skills");
    r.skills.technical = list_at<TechnicalSkill>(sk, "technical", parse_technical_skill);
    r.skills.soft = strs_at(sk, "soft");
    r.skills.nice_to_have = strs_at(sk, "niceToHave");

    const json& ma = member(v, "matchAnalysis");
    r.match_analysis.overall_score = num_at(ma, "overallScore");
    r.match_analysis.technical_match = parse_sub_score(member(ma, "technicalMatch"));
    r.match_analysis.experience_match = parse_sub_score(member(ma, "experienceMatch"));
    r.match_analysis.role_match = parse_sub_score(member(ma, "roleMatch"));

    r.red_flags = strs_at(v, "redFlags");

    const json& ca = member(v, "competitiveAnalysis");
    r.competitive_analysis.level = parse_level(str_at(ca, "level"));
    r.competitive_analysis.pool_size = str_at(ca, "poolSize");
    r.competitive_analysis.differentiators = strs_at(ca, "differentiators");

    const json& rec = member(v, "recommendation");
    r.recommendation.status = parse_recommendation(str_at(rec, "status"));
    r.recommendation.reason = str_at(rec, "reason");

    return r;
}

const char* skill_status_str(SkillStatus s) {
    switch (s) {
        case SkillStatus::Matched: return "matched";
        case SkillStatus::Missing: return "missing";
        default: return "missing";
    }
}

static json sub_score_to_json(const SubScore& s) {
    return {{"score", num_json(s.score)}, {"reason", s.reason}};
}

json JobFitAnalysis::to_json() const {
    json j;

    j["keyInfo"] = {
        {"role", key_info.role},
        {"company", key_info.company},
        {"location", key_info.location},
        {"salary", key_info.salary},
        {"workMode", key_info.work_mode},
        {"experience", key_info.experience}
    };

    json tech = json::array();
    for (const auto& s : skills.technical) {
        tech.push_back({{"name", s.name}, {"status", skill_status_str(s.status)}});
    }
    j["skills"] = {
        {"technical", tech},
        {"soft", skills.soft},
        {"niceToHave", skills.nice_to_have}
    };

    j["matchAnalysis"] = {
        {"overallScore", num_json(match_analysis.overall_score)},
        {"technicalMatch", sub_score_to_json(match_analysis.technical_match)},
        {"experienceMatch", sub_score_to_json(match_analysis.experience_match)},
        {"roleMatch", sub_score_to_json(match_analysis.role_match)}
    };

    j["redFlags"] = red_flags;

    j["competitiveAnalysis"] = {
        {"level", competitive_analysis.level.label},
        {"poolSize", competitive_analysis.pool_size},
        {"differentiators", competitive_analysis.differentiators}
    };

    j["recommendation"] = {
        {"status", recommendation.status.label},
        {"reason", recommendation.reason}
    };

    return j;
}

}  // namespace records
