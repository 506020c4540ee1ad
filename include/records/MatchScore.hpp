#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace records {

struct MatchScoreReport {
    double score = 0.0;
    std::string summary;
    std::vector<std::string> strengths;
    std::vector<std::string> gaps;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

MatchScoreReport validate_match_score(const nlohmann::json& v);

}  // namespace records
