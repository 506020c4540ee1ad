#include "records/MatchScore.hpp"
#include "records/FieldReaders.hpp"

namespace records {

MatchScoreReport validate_match_score(const nlohmann::json& v) {
    MatchScoreReport r;
    r.score = num_at(v, "score");
    r.summary = str_at(v, "summary");
    r.strengths = strs_at(v, "strengths");
    r.gaps = strs_at(v, "gaps");
    r.recommendations = strs_at(v, "recommendations");
    return r;
}

nlohmann::json MatchScoreReport::to_json() const {
    nlohmann::json j;
    j["score"] = num_json(score);
    j["summary"] = summary;
    j["strengths"] = strengths;
    j["gaps"] = gaps;
    j["recommendations"] = recommendations;
    return j;
}

}  // namespace records
