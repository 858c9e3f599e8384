#include "recognition/matcher.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>

namespace facevault {

double euclidean_distance(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

MatchResult match_embedding(const Embedding& probe,
                            const EmbeddingSnapshot& snapshot,
                            double tolerance)
{
    MatchResult result;

    double best_distance = std::numeric_limits<double>::infinity();
    const std::string* best_name = nullptr;

    for (const auto& identity : snapshot) {
        for (const auto& stored : identity.embeddings) {
            if (stored.size() != probe.size()) {
                spdlog::warn("Embedding de {} con dimension {} (esperado {}), ignorado",
                             identity.name, stored.size(), probe.size());
                continue;
            }

            double d = euclidean_distance(probe, stored);
            if (d < best_distance) {
                best_distance = d;
                best_name = &identity.name;
            }
        }
    }

    if (!best_name) {
        return result;
    }

    result.distance = best_distance;
    if (best_distance <= tolerance) {
        result.matched = true;
        result.identity = *best_name;
    }
    return result;
}

}  // namespace facevault
