#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace records {

struct ExperienceEntry {
    std::string id;                  // preserved so the editor can merge by id
    std::string role;
    std::string company;
    std::string start_date;
    std::string end_date;
    std::string description;         // "• line\n• line" after normalization
};

struct ProjectEntry {
    std::string id;
    std::string name;
    std::string technologies;
    std::string link;
    std::string description;
};

struct EducationEntry {
    std::string id;
    std::string degree;
    std::string school;
    std::string year;
};

struct ResumeRecord {
    std::string full_name;
    std::string email;
    std::string phone;
    std::string linkedin;
    std::string location;
    std::string summary;
    std::string skills;              // comma separated
    std::string job_title;
    std::vector<ExperienceEntry> experience;
    std::vector<ProjectEntry> projects;
    std::vector<EducationEntry> education;

    nlohmann::json to_json() const;
};

ResumeRecord validate_resume(const nlohmann::json& v);

}  // namespace records
