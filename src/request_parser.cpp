#include "request_parser.hpp"
#include "skill_assessor.hpp"
#include <stdexcept>

namespace formcheck {

namespace {

bool isNonEmptyString(const json& body, const char* key) {
    return body.contains(key) && body[key].is_string() && !body[key].get<std::string>().empty();
}

std::string optionalString(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) {
        return "";
    }
    if (!body[key].is_string()) {
        throw std::invalid_argument(std::string(key) + " must be a string");
    }
    return body[key].get<std::string>();
}

} // namespace

VideoReference parseVideoReference(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }

    bool has_url = isNonEmptyString(body, "video_url");
    bool has_data = isNonEmptyString(body, "video_data");

    if (has_url && has_data) {
        throw std::invalid_argument("Provide either video_url or video_data, not both");
    }
    if (has_url) {
        std::string url = body["video_url"].get<std::string>();
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            throw std::invalid_argument("video_url must be an http or https URL");
        }
        return VideoReference::url(url);
    }
    if (has_data) {
        return VideoReference::data(body["video_data"].get<std::string>());
    }

    throw std::invalid_argument("Invalid request format. Required: video_url or video_data");
}

AnalysisRequest parseAnalysisRequest(const json& body, const AnalysisConfig& defaults) {
    AnalysisRequest request;

    std::string sport = optionalString(body, "sport_type");
    if (!sport.empty()) {
        if (!isKnownSportType(sport)) {
            throw std::invalid_argument("Unknown sport_type: " + sport);
        }
        request.sport_type = sportTypeFromString(sport);
    }

    std::string skill = optionalString(body, "skill_type");
    if (!skill.empty()) {
        if (!isKnownSkillType(skill)) {
            throw std::invalid_argument("Unknown skill_type: " + skill);
        }
        request.skill_type = skillTypeFromString(skill);
    }

    if (body.contains("skill_score") && !body["skill_score"].is_null()) {
        if (!body["skill_score"].is_number()) {
            throw std::invalid_argument("skill_score must be a number");
        }
        request.skill_score = body["skill_score"].get<float>();
    }

    request.config = parseIntegrityConfig(body, defaults);
    return request;
}

AnalysisConfig parseIntegrityConfig(const json& body, const AnalysisConfig& defaults) {
    if (!body.is_object() || !body.contains("config")) {
        return defaults;
    }
    return AnalysisConfig::fromJson(body["config"], defaults);
}

} // namespace formcheck
