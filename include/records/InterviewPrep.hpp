#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace records {

struct PrepCompanyResearch {
    std::string mission;
    std::string culture;
    std::vector<std::string> products;
    std::vector<std::string> recent_news;
};

struct TechnicalQuestion {
    std::string question;
    std::string answer;
};

struct BehavioralQuestion {
    std::string question;
    std::string star_guide;   // Situation / Task / Action / Result outline
};

struct TechnicalPrep {
    std::vector<std::string> topics;
    std::vector<TechnicalQuestion> questions;
};

struct BehavioralPrep {
    std::vector<std::string> competencies;
    std::vector<BehavioralQuestion> questions;
};

struct InterviewPrepKit {
    PrepCompanyResearch company_research;
    TechnicalPrep technical;
    BehavioralPrep behavioral;
    std::vector<std::string> questions_to_ask;

    nlohmann::json to_json() const;
};

InterviewPrepKit validate_interview_prep(const nlohmann::json& v);

}  // namespace records
