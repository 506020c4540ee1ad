#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "records/SoftEnum.hpp"
#include "records/ValidatorConfig.hpp"

namespace records {

struct ResearchSummary {
    std::string verdict;
    double opportunity_score = 0.0;   // 0..10 on the dashboard
    LevelLabel apply_priority;
    std::vector<std::string> next_steps;
};

struct CompanyIntelligence {
    std::string overview;
    std::string size_and_stage;
    std::string financial_health;
    std::vector<std::string> competitors;
};

struct MarketAnalysis {
    std::string market_position;
    std::vector<std::string> recent_news;
};

struct Culture {
    std::string work_environment;
    std::string engineering_culture;
};

struct SalaryBreakdown {
    std::string fresher;
    std::string mid;
    std::string senior;
};

struct Compensation {
    std::string salary_range;
    SalaryBreakdown breakdown;
    std::string comparison;
    std::vector<std::string> benefits;
};

struct Hiring {
    std::vector<std::string> process;
    std::string timeline;
    std::vector<std::string> tips;
};

struct Risks {
    LevelLabel level;
    std::vector<std::string> concerns;
};

struct Strategy {
    std::string positioning;
    std::vector<std::string> talking_points;
    std::vector<std::string> questions_to_ask;
};

struct GlassdoorReviews {
    double rating = 0.0;
    std::vector<std::string> pros;
    std::vector<std::string> cons;
};

struct RedditReviews {
    SentimentLabel sentiment;
    std::vector<std::string> key_discussions;
};

struct EmployeeVoice {
    std::string quote;
    SentimentLabel sentiment;
    std::string source;
};

struct Reviews {
    GlassdoorReviews glassdoor;
    RedditReviews reddit;
    std::vector<EmployeeVoice> employee_voices;   // capped by ValidatorConfig
};

struct Source {
    std::string title;
    std::string url;
};

struct CompanyResearchReport {
    std::string company_name;
    std::string role_title;
    ResearchSummary summary;
    CompanyIntelligence company_intelligence;
    MarketAnalysis market_analysis;
    Culture culture;
    Compensation compensation;
    Hiring hiring;
    Risks risks;
    Strategy strategy;
    Reviews reviews;
    std::vector<Source> sources;                  // capped by ValidatorConfig

    nlohmann::json to_json() const;
};

CompanyResearchReport validate_company_research(const nlohmann::json& v,
                                                const ValidatorConfig& cfg = ValidatorConfig{});

}  // namespace records
