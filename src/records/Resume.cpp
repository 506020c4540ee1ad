#include "records/Resume.hpp"
#include "records/FieldReaders.hpp"

#include <optional>

using json = nlohmann::json;

namespace records {

static std::optional<ExperienceEntry> parse_experience(const json& e) {
    if (!e.is_object()) return std::nullopt;

    ExperienceEntry x;
    x.id = str_at(e, "id");
    x.role = str_at(e, "role");
    x.company = str_at(e, "company");
    x.start_date = str_at(e, "startDate");
    x.end_date = str_at(e, "endDate");
    x.description = str_at(e, "description");
    return x;
}

static std::optional<ProjectEntry> parse_project(const json& e) {
    if (!e.is_object()) return std::nullopt;

    ProjectEntry p;
    p.id = str_at(e, "id");
    p.name = str_at(e, "name");
    p.technologies = str_at(e, "technologies");
    p.link = str_at(e, "link");
    p.description = str_at(e, "description");
    return p;
}

static std::optional<EducationEntry> parse_education(const json& e) {
    if (!e.is_object()) return std::nullopt;

    EducationEntry ed;
    ed.id = str_at(e, "id");
    ed.degree = str_at(e, "degree");
    ed.school = str_at(e, "school");
    ed.year = str_at(e, "year");
    return ed;
}

ResumeRecord validate_resume(const json& v) {
    ResumeRecord r;
    r.full_name = str_at(v, "fullName");
    r.email = str_at(v, "email");
    r.phone = str_at(v, "phone");
    r.linkedin = str_at(v, "linkedin");
    r.location = str_at(v, "location");
    r.summary = str_at(v, "summary");
    r.skills = str_at(v, "skills");
    r.job_title = str_at(v, "jobTitle");
    r.experience = list_at<ExperienceEntry>(v, "experience", parse_experience);
    r.projects = list_at<ProjectEntry>(v, "projects", parse_project);
    r.education = list_at<EducationEntry>(v, "education", parse_education);
    return r;
}

json ResumeRecord::to_json() const {
    json j;
    j["fullName"] = full_name;
    j["email"] = email;
    j["phone"] = phone;
    j["linkedin"] = linkedin;
    j["location"] = location;
    j["summary"] = summary;
    j["skills"] = skills;
    j["jobTitle"] = job_title;

    j["experience"] = json::array();
    for (const auto& x : experience) {
        j["experience"].push_back({
            {"id", x.id},
            {"role", x.role},
            {"company", x.company},
            {"startDate", x.start_date},
            {"endDate", x.end_date},
            {"description", x.description}
        });
    }

    j["projects"] = json::array();
    for (const auto& p : projects) {
        j["projects"].push_back({
            {"id", p.id},
            {"name", p.name},
            {"technologies", p.technologies},
            {"link", p.link},
            {"description", p.description}
        });
    }

    j["education"] = json::array();
    for (const auto& ed : education) {
        j["education"].push_back({
            {"id", ed.id},
            {"degree", ed.degree},
            {"school", ed.school},
            {"year", ed.year}
        });
    }

    return j;
}

}  // namespace records
