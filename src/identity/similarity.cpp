#include "similarity.hpp"

#include <algorithm>
#include <cmath>

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return static_cast<float>(std::clamp(cosine, 0.0, 1.0) * 100.0);
}

float euclideanSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = static_cast<double>(a[i]) - b[i];
        sum += diff * diff;
    }
    double similarity = (1.0 - std::sqrt(sum)) * 100.0;
    return static_cast<float>(std::clamp(similarity, 0.0, 100.0));
}

SimilarityFunction similarityByName(const std::string& metric) {
    if (metric == "euclidean") {
        return euclideanSimilarity;
    }
    return cosineSimilarity;
}
