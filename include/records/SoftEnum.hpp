#pragma once
#include <string>

namespace records {

// A label the model writes freely but the UI styles by exact match.
// Unknown labels land in Kind::Other and keep their text, so renderers can
// switch on `kind` exhaustively and still print `label`.
template <typename Kind>
struct SoftEnum {
    Kind kind = Kind::Other;
    std::string label;   // as written by the model ("" when absent)
};

enum class Level {
    High,
    Medium,
    Low,
    Other
};

enum class Sentiment {
    Positive,
    Negative,
    Neutral,
    Mixed,
    Other
};

enum class RecommendationStatus {
    StrongApply,
    ConditionalApply,
    Other
};

using LevelLabel = SoftEnum<Level>;
using SentimentLabel = SoftEnum<Sentiment>;
using RecommendationLabel = SoftEnum<RecommendationStatus>;

// exact, case-sensitive match against the literals the dashboard knows
LevelLabel parse_level(const std::string& s);                     // "High" | "Medium" | "Low"
SentimentLabel parse_sentiment(const std::string& s);             // "Positive" | "Negative" | "Neutral" | "Mixed"
RecommendationLabel parse_recommendation(const std::string& s);   // "Strong Apply" | "Conditional Apply"

}  // namespace records
