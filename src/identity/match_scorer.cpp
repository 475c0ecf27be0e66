#include "match_scorer.hpp"

#include <utility>

const char* matchClassToString(MatchClass match_class) {
    switch (match_class) {
    case MatchClass::Known:
        return "known";
    case MatchClass::GreyZone:
        return "grey_zone";
    case MatchClass::Unknown:
    default:
        return "unknown";
    }
}

MatchClass ClassificationPolicy::classify(const MatchResult& result) const {
    if (result.identity_name && result.similarity >= known_threshold) {
        return MatchClass::Known;
    }
    if (result.similarity < unknown_threshold) {
        return MatchClass::Unknown;
    }
    return MatchClass::GreyZone;
}

MatchScorer::MatchScorer(const IdentityStore& store, SimilarityFunction similarity)
    : store_(store), similarity_(std::move(similarity)) {
    if (!similarity_) {
        similarity_ = cosineSimilarity;
    }
}

MatchResult MatchScorer::match(const std::vector<float>& embedding) const {
    MatchResult best;

    // The store lock is released before scoring starts.
    for (const Identity& identity : store_.snapshot()) {
        float similarity = similarity_(identity.embedding, embedding);
        if (!best.identity_name || similarity > best.similarity) {
            best.identity_name = identity.name;
            best.similarity = similarity;
        }
    }

    return best;
}
