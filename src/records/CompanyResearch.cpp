#include "records/CompanyResearch.hpp"
#include "records/FieldReaders.hpp"

#include <optional>

using json = nlohmann::json;

namespace records {

static std::optional<EmployeeVoice> parse_employee_voice(const json& e) {
    if (!e.is_object()) return std::nullopt;

    EmployeeVoice ev;
    ev.quote = str_at(e, "quote");
    ev.sentiment = parse_sentiment(str_at(e, "sentiment"));
    ev.source = str_at(e, "source");
    if (ev.quote.empty()) return std::nullopt;
    return ev;
}

static std::optional<Source> parse_source(const json& e) {
    if (!e.is_object()) return std::nullopt;

    Source s;
    s.title = str_at(e, "title");
    s.url = str_at(e, "url");
    if (s.title.empty() && s.url.empty()) return std::nullopt;
    return s;
}

CompanyResearchReport validate_company_research(const json& v, const ValidatorConfig& cfg) {
    CompanyResearchReport r;

    r.company_name = str_at(v, "companyName");
    r.role_title = str_at(v, "roleTitle");

    const json& sum = member(v, "summary");
    r.summary.verdict = str_at(sum, "verdict");
    r.summary.opportunity_score = num_at(sum, "opportunityScore");
    r.summary.apply_priority = parse_level(str_at(sum, "applyPriority"));
    r.summary.next_steps = strs_at(sum, "nextSteps");

    const json& ci = member(v, "companyIntelligence");
    r.company_intelligence.overview = str_at(ci, "overview");
    r.company_intelligence.size_and_stage = str_at(ci, "sizeAndStage");
    r.company_intelligence.financial_health = str_at(ci, "financialHealth");
    r.company_intelligence.competitors = strs_at(ci, "competitors");

    const json& ma = member(v, "marketAnalysis");
    r.market_analysis.market_position = str_at(ma, "marketPosition");
    r.market_analysis.recent_news = strs_at(ma, "recentNews");

    const json& cu = member(v, "culture");
    r.culture.work_environment = str_at(cu, "workEnvironment");
    r.culture.engineering_culture = str_at(cu, "engineeringCulture");

    const json& co = member(v, "compensation");
    r.compensation.salary_range = str_at(co, "salaryRange");
    const json& bd = member(co, "breakdown");
    r.compensation.breakdown.fresher = str_at(bd, "fresher");
    r.compensation.breakdown.mid = str_at(bd, "mid");
    r.compensation.breakdown.senior = str_at(bd, "senior");
    r.compensation.comparison = str_at(co, "comparison");
    r.compensation.benefits = strs_at(co, "benefits");

    const json& hi = member(v, "hiring");
    r.hiring.process = strs_at(hi, "process");
    r.hiring.timeline = str_at(hi, "timeline");
    r.hiring.tips = strs_at(hi, "tips");

    const json& ri = member(v, "risks");
    r.risks.level = parse_level(str_at(ri, "level"));
    r.risks.concerns = strs_at(ri, "concerns");

    const json& st = member(v, "strategy");
    r.strategy.positioning = str_at(st, "positioning");
    r.strategy.talking_points = strs_at(st, "talkingPoints");
    r.strategy.questions_to_ask = strs_at(st, "questionsToAsk");

    const json& rv = member(v, "reviews");
    const json& gd = member(rv, "glassdoor");
    r.reviews.glassdoor.rating = num_at(gd, "rating");
    r.reviews.glassdoor.pros = strs_at(gd, "pros");
    r.reviews.glassdoor.cons = strs_at(gd, "cons");
    const json& rd = member(rv, "reddit");
    r.reviews.reddit.sentiment = parse_sentiment(str_at(rd, "sentiment"));
    r.reviews.reddit.key_discussions = strs_at(rd, "keyDiscussions");
    r.reviews.employee_voices =
        list_at<EmployeeVoice>(rv, "employeeVoices", parse_employee_voice, cfg.max_employee_voices);

    r.sources = list_at<Source>(v, "sources", parse_source, cfg.max_sources);

    return r;
}

json CompanyResearchReport::to_json() const {
    json j;

    j["companyName"] = company_name;
    j["roleTitle"] = role_title;

    j["summary"] = {
        {"verdict", summary.verdict},
        {"opportunityScore", num_json(summary.opportunity_score)},
        {"applyPriority", summary.apply_priority.label},
        {"nextSteps", summary.next_steps}
    };

    j["companyIntelligence"] = {
        {"overview", company_intelligence.overview},
        {"sizeAndStage", company_intelligence.size_and_stage},
        {"financialHealth", company_intelligence.financial_health},
        {"competitors", company_intelligence.competitors}
    };

    j["marketAnalysis"] = {
        {"marketPosition", market_analysis.market_position},
        {"recentNews", market_analysis.recent_news}
    };

    j["culture"] = {
        {"workEnvironment", culture.work_environment},
        {"engineeringCulture", culture.engineering_culture}
    };

    j["compensation"] = {
        {"salaryRange", compensation.salary_range},
        {"breakdown", {
            {"fresher", compensation.breakdown.fresher},
            {"mid", compensation.breakdown.mid},
            {"senior", compensation.breakdown.senior}
        }},
        {"comparison", compensation.comparison},
        {"benefits", compensation.benefits}
    };

    j["hiring"] = {
        {"process", hiring.process},
        {"timeline", hiring.timeline},
        {"tips", hiring.tips}
    };

    j["risks"] = {
        {"level", risks.level.label},
        {"concerns", risks.concerns}
    };

    j["strategy"] = {
        {"positioning", strategy.positioning},
        {"talkingPoints", strategy.talking_points},
        {"questionsToAsk", strategy.questions_to_ask}
    };

    json voices = json::array();
    for (const auto& ev : reviews.employee_voices) {
        voices.push_back({
            {"quote", ev.quote},
            {"sentiment", ev.sentiment.label},
            {"source", ev.source}
        });
    }
    j["reviews"] = {
        {"glassdoor", {
            {"rating", num_json(reviews.glassdoor.rating)},
            {"pros", reviews.glassdoor.pros},
            {"cons", reviews.glassdoor.cons}
        }},
        {"reddit", {
            {"sentiment", reviews.reddit.sentiment.label},
            {"keyDiscussions", reviews.reddit.key_discussions}
        }},
        {"employeeVoices", voices}
    };

    json src = json::array();
    for (const auto& s : sources) src.push_back({{"title", s.title}, {"url", s.url}});
    j["sources"] = src;

    return j;
}

}  // namespace records
