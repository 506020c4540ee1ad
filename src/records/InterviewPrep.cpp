#include "records/InterviewPrep.hpp"
#include "records/FieldReaders.hpp"
#include "normalize/Coerce.hpp"

#include <optional>

using json = nlohmann::json;

namespace records {

static std::optional<TechnicalQuestion> parse_technical_question(const json& e) {
    TechnicalQuestion q;
    if (e.is_object()) {
        q.question = str_at(e, "question");
        q.answer = str_at(e, "answer");
    } else {
        q.question = normalize::ensure_string(e);
    }
    if (q.question.empty()) return std::nullopt;
    return q;
}

static std::optional<BehavioralQuestion> parse_behavioral_question(const json& e) {
    BehavioralQuestion q;
    if (e.is_object()) {
        q.question = str_at(e, "question");
        q.star_guide = str_at(e, "starGuide");
    } else {
        q.question = normalize::ensure_string(e);
    }
    if (q.question.empty()) return std::nullopt;
    return q;
}

InterviewPrepKit validate_interview_prep(const json& v) {
    InterviewPrepKit r;

    const json& cr = member(v, "companyResearch");
    r.company_research.mission = str_at(cr, "mission");
    r.company_research.culture = str_at(cr, "culture");
    r.company_research.products = strs_at(cr, "products");
    r.company_research.recent_news = strs_at(cr, "recentNews");

    const json& te = member(v, "technical");
    r.technical.topics = strs_at(te, "topics");
    r.technical.questions = list_at<TechnicalQuestion>(te, "questions", parse_technical_question);

    const json& be = member(v, "behavioral");
    r.behavioral.competencies = strs_at(be, "competencies");
    r.behavioral.questions = list_at<BehavioralQuestion>(be, "questions", parse_behavioral_question);

    r.questions_to_ask = strs_at(v, "questionsToAsk");

    return r;
}

json InterviewPrepKit::to_json() const {
    json j;

    j["companyResearch"] = {
        {"mission", company_research.mission},
        {"culture", company_research.culture},
        {"products", company_research.products},
        {"recentNews", company_research.recent_news}
    };

    json tq = json::array();
    for (const auto& q : technical.questions) tq.push_back({{"question", q.question}, {"answer", q.answer}});
    j["technical"] = {
        {"topics", technical.topics},
        {"questions", tq}
    };

    json bq = json::array();
    for (const auto& q : behavioral.questions) bq.push_back({{"question", q.question}, {"starGuide", q.star_guide}});
    j["behavioral"] = {
        {"competencies", behavioral.competencies},
        {"questions", bq}
    };

    j["questionsToAsk"] = questions_to_ask;

    return j;
}

}  // namespace records
