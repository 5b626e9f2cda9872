#ifndef REQUEST_PARSER_HPP
#define REQUEST_PARSER_HPP

#include "analysis_config.hpp"
#include "analysis_pipeline.hpp"
#include "video_source.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace formcheck {

// All parsers throw std::invalid_argument with a client-facing message

// Exactly one of "video_url" (http/https) or "video_data" (base64 or data URL)
VideoReference parseVideoReference(const json& body);

// Optional sport_type, skill_type, skill_score and config over the service defaults
AnalysisRequest parseAnalysisRequest(const json& body, const AnalysisConfig& defaults);

// Optional config over the service defaults
AnalysisConfig parseIntegrityConfig(const json& body, const AnalysisConfig& defaults);

} // namespace formcheck

#endif // REQUEST_PARSER_HPP
