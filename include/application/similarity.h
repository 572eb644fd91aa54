/**
 * @file similarity.h
 * @brief Window-to-exemplar dissimilarity and nearest-exemplar search
 *
 * Both metrics are weighted per dimension and divided by a constant scale,
 * so they stay symmetric and satisfy the triangle inequality:
 *
 *   MEAN_ABSOLUTE     d = sum_i sum_d w_d |a - b| / (n * sum_d w_d * scale)
 *   ROOT_MEAN_SQUARE  d = sqrt(sum_i sum_d w_d (a - b)^2 / (n * sum_d w_d)) / scale
 *
 * Windows of different length or arity are not comparable (distance +inf).
 */

#ifndef SIMILARITY_H
#define SIMILARITY_H

#include <stdint.h>
#include <limits>
#include <vector>

#include "application/engine_config.h"
#include "application/exemplar_pool.h"
#include "application/telemetry.h"

#define NO_MATCH_DISTANCE (std::numeric_limits<double>::infinity())

/**
 * @struct MatchResult
 * @brief Nearest exemplar of a window
 */
struct MatchResult {
    bool found = false;                 ///< false when the pool holds no comparable exemplar
    uint32_t slotIndex = 0;
    double distance = NO_MATCH_DISTANCE;
};

class SimilarityEvaluator {
public:
    explicit SimilarityEvaluator(const SimilarityConfig& config);

    /**
     * @brief Dissimilarity of two equal-shape value blocks
     *
     * @param a Row-major values, `sampleCount * arity` entries
     * @param b Row-major values, same shape as `a`
     * @param sampleCount Samples in each block
     * @param arity Values per sample
     * @return Non-negative distance, NO_MATCH_DISTANCE if the shapes differ
     */
    double distance(const std::vector<double>& a, const std::vector<double>& b,
                    size_t sampleCount, size_t arity) const;

    double distance(const Window& window, const Exemplar& exemplar) const;

    /**
     * @brief Nearest live exemplar, ties resolved to the lowest slot index
     */
    MatchResult nearest(const Window& window, const ExemplarPool& pool) const;

    const SimilarityConfig& config() const { return settings; }

private:
    double weightFor(size_t dimension) const;

    SimilarityConfig settings;
};

#endif // SIMILARITY_H
