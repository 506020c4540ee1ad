#include <catch2/catch.hpp>

#include "records/CompanyResearch.hpp"
#include "records/Document.hpp"
#include "records/InterviewPrep.hpp"
#include "records/JobFit.hpp"
#include "records/MatchScore.hpp"
#include "records/Resume.hpp"
#include "records/SoftEnum.hpp"

#include <string>
#include <vector>

using nlohmann::json;
using namespace records;

static bool has_null(const json& v) {
    if (v.is_null()) return true;
    if (v.is_array() || v.is_object()) {
        for (const auto& e : v) {
            if (has_null(e)) return true;
        }
    }
    return false;
}

static std::vector<json> junk_inputs() {
    return {
        json(),
        json::object(),
        json::parse("[1, 2]"),
        json("str"),
        json(42),
        json::parse(R"({"unrelated": {"deeply": ["nested"]}, "score": "high"})"),
    };
}

TEST_CASE("validators are total and fill every field", "[validate]") {
    for (const auto& in : junk_inputs()) {
        INFO("input: " << in.dump());

        json ms = validate_match_score(in).to_json();
        json jf = validate_job_fit(in).to_json();
        json cr = validate_company_research(in).to_json();
        json ip = validate_interview_prep(in).to_json();
        json rs = validate_resume(in).to_json();

        REQUIRE_FALSE(has_null(ms));
        REQUIRE_FALSE(has_null(jf));
        REQUIRE_FALSE(has_null(cr));
        REQUIRE_FALSE(has_null(ip));
        REQUIRE_FALSE(has_null(rs));

        REQUIRE(jf == validate_job_fit(json()).to_json());
        REQUIRE(cr == validate_company_research(json()).to_json());
        REQUIRE(ip == validate_interview_prep(json()).to_json());
        REQUIRE(rs == validate_resume(json()).to_json());
    }
}

TEST_CASE("match score reads typed fields and coerces the rest", "[validate]") {
    auto r = validate_match_score(json::parse(R"({
        "score": 72, "summary": "Good fit",
        "strengths": ["Go", 3], "gaps": "not a list"
    })"));

    REQUIRE(r.score == 72);
    REQUIRE(r.summary == "Good fit");
    REQUIRE(r.strengths == std::vector<std::string>{"Go", "3"});
    REQUIRE(r.gaps.empty());
    REQUIRE(r.recommendations.empty());
}

TEST_CASE("numbers are never parsed out of text", "[validate]") {
    REQUIRE(validate_match_score(json::parse(R"({"score": "85"})")).score == 0);
    REQUIRE(validate_match_score(json::parse(R"({"score": 85.5})")).score == 85.5);

    auto cr = validate_company_research(json::parse(R"({"reviews": {"glassdoor": {"rating": "4.2"}}})"));
    REQUIRE(cr.reviews.glassdoor.rating == 0);
}

TEST_CASE("technical skills default to missing", "[validate]") {
    auto r = validate_job_fit(json::parse(R"({
        "skills": {"technical": [
            {"name": "SQL", "status": "unsure"},
            {"name": "Go", "status": "matched"},
            "Rust",
            {"name": "", "status": "matched"},
            {"status": "matched"}
        ]}
    })"));

    const auto& t = r.skills.technical;
    REQUIRE(t.size() == 3);
    REQUIRE(t[0].name == "SQL");
    REQUIRE(t[0].status == SkillStatus::Missing);
    REQUIRE(t[1].name == "Go");
    REQUIRE(t[1].status == SkillStatus::Matched);
    REQUIRE(t[2].name == "Rust");
    REQUIRE(t[2].status == SkillStatus::Missing);

    json j = r.to_json();
    REQUIRE(j["skills"]["technical"][0]["status"] == "missing");
    REQUIRE(j["skills"]["technical"][1]["status"] == "matched");
}

TEST_CASE("job fit reads nested sections", "[validate]") {
    auto r = validate_job_fit(json::parse(R"({
        "keyInfo": {"role": "Backend Engineer", "workMode": "Remote"},
        "matchAnalysis": {"overallScore": 81, "technicalMatch": {"score": 90, "reason": "Go"}},
        "competitiveAnalysis": {"level": "Medium", "poolSize": "~200"},
        "recommendation": {"status": "Strong Apply", "reason": "Good overlap"}
    })"));

    REQUIRE(r.key_info.role == "Backend Engineer");
    REQUIRE(r.key_info.work_mode == "Remote");
    REQUIRE(r.key_info.salary.empty());
    REQUIRE(r.match_analysis.overall_score == 81);
    REQUIRE(r.match_analysis.technical_match.score == 90);
    REQUIRE(r.match_analysis.role_match.reason.empty());
    REQUIRE(r.competitive_analysis.level.kind == Level::Medium);
    REQUIRE(r.recommendation.status.kind == RecommendationStatus::StrongApply);
    REQUIRE(r.to_json()["recommendation"]["status"] == "Strong Apply");
}

TEST_CASE("soft enums keep unknown labels", "[validate]") {
    REQUIRE(parse_level("High").kind == Level::High);
    REQUIRE(parse_level("high").kind == Level::Other);
    REQUIRE(parse_level("high").label == "high");
    REQUIRE(parse_level("").kind == Level::Other);

    REQUIRE(parse_sentiment("Mixed").kind == Sentiment::Mixed);
    REQUIRE(parse_sentiment("Ambivalent").kind == Sentiment::Other);
    REQUIRE(parse_sentiment("Ambivalent").label == "Ambivalent");

    REQUIRE(parse_recommendation("Conditional Apply").kind == RecommendationStatus::ConditionalApply);
    REQUIRE(parse_recommendation("Apply").kind == RecommendationStatus::Other);
}

TEST_CASE("employee voices are capped and projected", "[validate]") {
    json voices = json::array();
    for (int i = 0; i < 8; ++i) {
        voices.push_back({{"quote", "q" + std::to_string(i)}, {"sentiment", "Positive"},
                          {"source", "Glassdoor"}, {"rating", 5}});
    }
    json in = {{"reviews", {{"employeeVoices", voices}}}};

    auto r = validate_company_research(in);
    REQUIRE(r.reviews.employee_voices.size() == 5);
    REQUIRE(r.reviews.employee_voices[0].quote == "q0");
    REQUIRE(r.reviews.employee_voices[4].quote == "q4");

    json out = r.to_json()["reviews"]["employeeVoices"];
    REQUIRE(out.size() == 5);
    for (const auto& v : out) {
        REQUIRE(v.size() == 3);
        REQUIRE_FALSE(v.contains("rating"));
    }

    ValidatorConfig cfg;
    cfg.max_employee_voices = 2;
    REQUIRE(validate_company_research(in, cfg).reviews.employee_voices.size() == 2);
}

TEST_CASE("unusable voices and sources are dropped before the cap", "[validate]") {
    json in = json::parse(R"({
        "reviews": {"employeeVoices": ["loose", {"quote": ""}, {"quote": "ok", "sentiment": "Meh"}]},
        "sources": [
            {"title": "", "url": ""},
            {"url": "https://example.com"},
            "https://bare.example.com",
            {"title": "Blog"}
        ]
    })");

    auto r = validate_company_research(in);
    REQUIRE(r.reviews.employee_voices.size() == 1);
    REQUIRE(r.reviews.employee_voices[0].sentiment.kind == Sentiment::Other);
    REQUIRE(r.reviews.employee_voices[0].sentiment.label == "Meh");

    REQUIRE(r.sources.size() == 2);
    REQUIRE(r.sources[0].url == "https://example.com");
    REQUIRE(r.sources[1].title == "Blog");

    json many = json::object();
    many["sources"] = json::array();
    for (int i = 0; i < 14; ++i) many["sources"].push_back({{"title", "t" + std::to_string(i)}});
    REQUIRE(validate_company_research(many).sources.size() == 10);
}

TEST_CASE("company research fills nested sections", "[validate]") {
    auto r = validate_company_research(json::parse(R"({
        "companyName": "Acme",
        "summary": {"verdict": "Worth it", "opportunityScore": 8, "applyPriority": "High"},
        "compensation": {"salaryRange": "$120k-$150k", "breakdown": {"mid": "$135k"}},
        "risks": {"level": "Low", "concerns": ["None"]},
        "reviews": {"reddit": {"sentiment": "Neutral"}}
    })"));

    REQUIRE(r.company_name == "Acme");
    REQUIRE(r.summary.opportunity_score == 8);
    REQUIRE(r.summary.apply_priority.kind == Level::High);
    REQUIRE(r.compensation.breakdown.mid == "$135k");
    REQUIRE(r.compensation.breakdown.senior.empty());
    REQUIRE(r.risks.level.kind == Level::Low);
    REQUIRE(r.reviews.reddit.sentiment.kind == Sentiment::Neutral);
    REQUIRE(r.to_json()["compensation"]["salaryRange"] == "$120k-$150k");
}

TEST_CASE("interview prep accepts bare question strings", "[validate]") {
    auto r = validate_interview_prep(json::parse(R"({
        "companyResearch": {"mission": "Ship robots"},
        "technical": {"topics": ["Go"], "questions": ["What is a goroutine?", {"question": "Explain GC", "answer": "..."}, ""]},
        "behavioral": {"questions": [{"question": "Tell me about a conflict", "starGuide": "S/T/A/R"}, {"starGuide": "orphan"}]},
        "questionsToAsk": ["Team size?"]
    })"));

    REQUIRE(r.company_research.mission == "Ship robots");
    REQUIRE(r.technical.questions.size() == 2);
    REQUIRE(r.technical.questions[0].question == "What is a goroutine?");
    REQUIRE(r.technical.questions[0].answer.empty());
    REQUIRE(r.technical.questions[1].answer == "...");
    REQUIRE(r.behavioral.questions.size() == 1);
    REQUIRE(r.to_json()["behavioral"]["questions"][0]["starGuide"] == "S/T/A/R");
    REQUIRE(r.questions_to_ask.size() == 1);
}

TEST_CASE("resume drops non-object list entries", "[validate]") {
    auto r = validate_resume(json::parse(R"({
        "fullName": "Jane Doe",
        "skills": "C++, Go",
        "experience": [{"id": "e1", "role": "Eng", "startDate": "2020"}, "junk", 7],
        "projects": [{"id": "p1", "name": "Tool"}],
        "education": [null, {"degree": "BSc", "year": 2019}]
    })"));

    REQUIRE(r.full_name == "Jane Doe");
    REQUIRE(r.skills == "C++, Go");
    REQUIRE(r.experience.size() == 1);
    REQUIRE(r.experience[0].id == "e1");
    REQUIRE(r.experience[0].start_date == "2020");
    REQUIRE(r.projects.size() == 1);
    REQUIRE(r.education.size() == 1);
    REQUIRE(r.education[0].year == "2019");

    json j = r.to_json();
    REQUIRE(j["experience"][0]["startDate"] == "2020");
    REQUIRE(j["jobTitle"] == "");
}

TEST_CASE("document accepts strings and wrappers", "[validate]") {
    REQUIRE(validate_document(json("Dear team")).text == "Dear team");
    REQUIRE(validate_document(json::parse(R"({"content": "Body"})")).text == "Body");
    REQUIRE(validate_document(json::parse(R"({"content": null, "text": "T"})")).text == "T");
    REQUIRE(validate_document(json::parse(R"({"document": ["a", "b"]})")).text == "a b");
    REQUIRE(validate_document(json::parse(R"({"other": "x"})")).text.empty());
    REQUIRE(validate_document(json()).to_json() == json{{"text", ""}});
}

TEST_CASE("whole-number scores serialize as integers", "[validate]") {
    json ms = validate_match_score(json::parse(R"({"score": 72})")).to_json();
    REQUIRE(ms["score"].is_number_integer());
    REQUIRE(ms.dump().find("\"score\":72,") != std::string::npos);

    REQUIRE(validate_match_score(json::parse(R"({"score": 72.5})")).to_json()["score"] == 72.5);

    json jf = validate_job_fit(json::parse(R"({"matchAnalysis": {"overallScore": 81, "roleMatch": {"score": 60}}})")).to_json();
    REQUIRE(jf["matchAnalysis"]["overallScore"].is_number_integer());
    REQUIRE(jf["matchAnalysis"]["roleMatch"]["score"].is_number_integer());

    json cr = validate_company_research(json::parse(R"({"summary": {"opportunityScore": 7}, "reviews": {"glassdoor": {"rating": 4.1}}})")).to_json();
    REQUIRE(cr["summary"]["opportunityScore"].is_number_integer());
    REQUIRE(cr["reviews"]["glassdoor"]["rating"] == 4.1);
}
