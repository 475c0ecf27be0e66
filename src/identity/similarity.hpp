#pragma once

#include <functional>
#include <string>
#include <vector>

// Scores two feature vectors on a [0,100] scale, higher is more similar.
using SimilarityFunction = std::function<float(const std::vector<float>&, const std::vector<float>&)>;

// max(0, cos(a, b)) * 100
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// (1 - ||a - b||) * 100, clamped to [0,100]
float euclideanSimilarity(const std::vector<float>& a, const std::vector<float>& b);

SimilarityFunction similarityByName(const std::string& metric);
