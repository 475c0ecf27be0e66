#pragma once

#include <optional>
#include <string>
#include <vector>

#include "identity_store.hpp"
#include "similarity.hpp"

struct MatchResult {
    std::optional<std::string> identity_name;
    float similarity = 0.0f;
};

enum class MatchClass {
    Known,     // similarity >= known threshold
    GreyZone,  // matched, but neither promoted nor logged as unknown
    Unknown,   // similarity < unknown threshold
};

const char* matchClassToString(MatchClass match_class);

struct ClassificationPolicy {
    float known_threshold = 70.0f;
    float unknown_threshold = 60.0f;

    MatchClass classify(const MatchResult& result) const;
};

class MatchScorer {
    private:
        const IdentityStore& store_;
        SimilarityFunction similarity_;

    public:
        explicit MatchScorer(const IdentityStore& store, SimilarityFunction similarity = cosineSimilarity);

        // Best identity over the whole store; ties keep the earliest registration.
        MatchResult match(const std::vector<float>& embedding) const;
};
