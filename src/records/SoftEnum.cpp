#include "records/SoftEnum.hpp"

#include <utility>

namespace records {

template <typename Kind, size_t N>
static SoftEnum<Kind> match_label(const std::string& s, const std::pair<const char*, Kind> (&table)[N]) {
    SoftEnum<Kind> out;
    out.label = s;
    for (const auto& [literal, kind] : table) {
        if (s == literal) {
            out.kind = kind;
            break;
        }
    }
    return out;
}

LevelLabel parse_level(const std::string& s) {
    static const std::pair<const char*, Level> table[] = {
        {"High", Level::High},
        {"Medium", Level::Medium},
        {"Low", Level::Low},
    };
    return match_label(s, table);
}

SentimentLabel parse_sentiment(const std::string& s) {
    static const std::pair<const char*, Sentiment> table[] = {
        {"Positive", Sentiment::Positive},
        {"Negative", Sentiment::Negative},
        {"Neutral", Sentiment::Neutral},
        {"Mixed", Sentiment::Mixed},
    };
    return match_label(s, table);
}

RecommendationLabel parse_recommendation(const std::string& s) {
    static const std::pair<const char*, RecommendationStatus> table[] = {
        {"Strong Apply", RecommendationStatus::StrongApply},
        {"Conditional Apply", RecommendationStatus::ConditionalApply},
    };
    return match_label(s, table);
}

}  // namespace records
