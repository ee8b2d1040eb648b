// =============================================================================
// docrecon - One-Dimensional Two-Means Clustering Implementation
// =============================================================================

#include "docrecon/layout/two_means.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace docrecon::layout {

namespace {

/// @brief Squared error of values [begin, end) given prefix sums.
[[nodiscard]] double rangeSse(const std::vector<double>& sum, const std::vector<double>& sumSq,
                              std::size_t begin, std::size_t end) noexcept {
    const auto n = static_cast<double>(end - begin);
    if (n <= 0.0) {
        return 0.0;
    }
    const double s = sum[end] - sum[begin];
    const double sq = sumSq[end] - sumSq[begin];
    return std::max(0.0, sq - (s * s) / n);
}

}  // namespace

std::optional<TwoMeansResult> twoMeans(std::span<const double> values) {
    if (values.size() < 2) {
        return std::nullopt;
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::ranges::sort(sorted);
    if (sorted.front() == sorted.back()) {
        return std::nullopt;
    }

    const std::size_t n = sorted.size();
    std::vector<double> sum(n + 1, 0.0);
    std::vector<double> sumSq(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        sum[i + 1] = sum[i] + sorted[i];
        sumSq[i + 1] = sumSq[i] + sorted[i] * sorted[i];
    }

    // Splitting between equal values never helps; only boundaries where the
    // value changes are candidates.
    std::size_t bestSplit = 0;
    double bestSse = 0.0;
    for (std::size_t k = 1; k < n; ++k) {
        if (sorted[k - 1] == sorted[k]) {
            continue;
        }
        const double sse = rangeSse(sum, sumSq, 0, k) + rangeSse(sum, sumSq, k, n);
        if (bestSplit == 0 || sse < bestSse) {
            bestSplit = k;
            bestSse = sse;
        }
    }

    TwoMeansResult result;
    result.lowCount = bestSplit;
    result.highCount = n - bestSplit;
    result.lowCenter = sum[bestSplit] / static_cast<double>(bestSplit);
    result.highCenter = (sum[n] - sum[bestSplit]) / static_cast<double>(n - bestSplit);
    result.withinSse = bestSse;
    result.totalSse = rangeSse(sum, sumSq, 0, n);
    return result;
}

std::optional<TwoMeansResult> findTwoClusters(std::span<const double> values,
                                              double minSeparation) {
    auto result = twoMeans(values);
    if (!result) {
        return std::nullopt;
    }
    if (result->withinSse >= result->totalSse || result->separation() < minSeparation) {
        return std::nullopt;
    }
    return result;
}

double standardDeviation(std::span<const double> values) noexcept {
    return std::sqrt(variance(values));
}

double variance(std::span<const double> values) noexcept {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(values.size());

    double acc = 0.0;
    for (double v : values) {
        acc += (v - mean) * (v - mean);
    }
    return acc / static_cast<double>(values.size());
}

}  // namespace docrecon::layout
