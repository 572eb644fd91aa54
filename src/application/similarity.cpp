/**
 * @file similarity.cpp
 * @brief Implementation of the similarity evaluator
 */

#include "application/similarity.h"
#include "peripheral/logger.h"

#include <cmath>

SimilarityEvaluator::SimilarityEvaluator(const SimilarityConfig& config) : settings(config) {}

double SimilarityEvaluator::weightFor(size_t dimension) const {
    if (dimension < settings.dimensionWeights.size()) {
        return settings.dimensionWeights[dimension];
    }
    return 1.0;
}

double SimilarityEvaluator::distance(const std::vector<double>& a, const std::vector<double>& b,
                                     size_t sampleCount, size_t arity) const {
    size_t expected = sampleCount * arity;
    if (expected == 0 || a.size() != expected || b.size() != expected) {
        return NO_MATCH_DISTANCE;
    }

    double weightSum = 0.0;
    for (size_t d = 0; d < arity; d++) {
        weightSum += weightFor(d);
    }
    if (weightSum <= 0.0) {
        return NO_MATCH_DISTANCE;
    }

    double total = 0.0;
    for (size_t i = 0; i < sampleCount; i++) {
        for (size_t d = 0; d < arity; d++) {
            double w = weightFor(d);
            if (w == 0.0) {
                continue;
            }
            double diff = a[i * arity + d] - b[i * arity + d];
            if (settings.metric == DistanceMetric::ROOT_MEAN_SQUARE) {
                total += w * diff * diff;
            } else {
                total += w * std::fabs(diff);
            }
        }
    }

    double mean = total / ((double)sampleCount * weightSum);
    switch (settings.metric) {
        case DistanceMetric::ROOT_MEAN_SQUARE:
            return std::sqrt(mean) / settings.valueScale;
        case DistanceMetric::MEAN_ABSOLUTE:
            return mean / settings.valueScale;
    }
    return NO_MATCH_DISTANCE;
}

double SimilarityEvaluator::distance(const Window& window, const Exemplar& exemplar) const {
    if (window.sampleCount != exemplar.sampleCount || window.arity != exemplar.arity) {
        return NO_MATCH_DISTANCE;
    }
    return distance(window.values, exemplar.values, window.sampleCount, window.arity);
}

MatchResult SimilarityEvaluator::nearest(const Window& window, const ExemplarPool& pool) const {
    MatchResult best;
    for (const Exemplar* exemplar : pool.live()) {
        double d = distance(window, *exemplar);
        if (d < best.distance) {
            best.found = true;
            best.slotIndex = exemplar->slotIndex;
            best.distance = d;
        }
    }
    if (best.found) {
        LOG_DEBUG(LOG_TAG_SIMILAR, "[%s] window %llu nearest slot %u at %.6f",
                  window.deviceId.c_str(), (unsigned long long)window.index,
                  best.slotIndex, best.distance);
    }
    return best;
}
