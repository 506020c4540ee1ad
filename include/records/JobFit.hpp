#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "records/SoftEnum.hpp"

namespace records {

enum class SkillStatus {
    Matched,
    Missing
};

struct TechnicalSkill {
    std::string name;
    SkillStatus status = SkillStatus::Missing;   // anything but "matched" is missing
};

struct KeyInfo {
    std::string role;
    std::string company;
    std::string location;
    std::string salary;
    std::string work_mode;
    std::string experience;
};

struct SkillBreakdown {
    std::vector<TechnicalSkill> technical;
    std::vector<std::string> soft;
    std::vector<std::string> nice_to_have;
};

struct SubScore {
    double score = 0.0;
    std::string reason;
};

struct MatchAnalysis {
    double overall_score = 0.0;
    SubScore technical_match;
    SubScore experience_match;
    SubScore role_match;
};

struct CompetitiveAnalysis {
    LevelLabel level;
    std::string pool_size;
    std::vector<std::string> differentiators;
};

struct Recommendation {
    RecommendationLabel status;
    std::string reason;
};

struct JobFitAnalysis {
    KeyInfo key_info;
    SkillBreakdown skills;
    MatchAnalysis match_analysis;
    std::vector<std::string> red_flags;
    CompetitiveAnalysis competitive_analysis;
    Recommendation recommendation;

    nlohmann::json to_json() const;
};

JobFitAnalysis validate_job_fit(const nlohmann::json& v);

const char* skill_status_str(SkillStatus s);

}  // namespace records
