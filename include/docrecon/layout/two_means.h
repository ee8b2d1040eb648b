// =============================================================================
// docrecon - One-Dimensional Two-Means Clustering
// =============================================================================
// Deterministic k=2 clustering of scalar values (anchor X-centers).
//
// On sorted data the optimal two-cluster partition is always a prefix/suffix
// split, so scanning every split point with prefix sums yields the exact
// optimum in O(n log n). No random initialisation is involved, which keeps
// column detection reproducible across runs.
// =============================================================================

#ifndef DOCRECON_LAYOUT_TWO_MEANS_H
#define DOCRECON_LAYOUT_TWO_MEANS_H

#include <cstddef>
#include <optional>
#include <span>

namespace docrecon::layout {

/// @brief Minimum distance between cluster centers for a two-cluster answer.
inline constexpr double kMinClusterSeparationPx = 50.0;

/// @brief Optimal split of a value set into two clusters.
struct TwoMeansResult {
    /// @brief Mean of the lower cluster.
    double lowCenter = 0.0;

    /// @brief Mean of the upper cluster.
    double highCenter = 0.0;

    /// @brief Number of values in the lower cluster.
    std::size_t lowCount = 0;

    /// @brief Number of values in the upper cluster.
    std::size_t highCount = 0;

    /// @brief Sum of squared distances to the assigned centers.
    double withinSse = 0.0;

    /// @brief Sum of squared distances to the global mean (k=1).
    double totalSse = 0.0;

    [[nodiscard]] double separation() const noexcept { return highCenter - lowCenter; }
};

/// @brief Exact two-means clustering of @p values.
/// @return std::nullopt when fewer than two distinct values are present.
[[nodiscard]] std::optional<TwoMeansResult> twoMeans(std::span<const double> values);

/// @brief Two-means result, kept only if it beats k=1 and the centers are at
///        least @p minSeparation apart.
[[nodiscard]] std::optional<TwoMeansResult> findTwoClusters(
    std::span<const double> values, double minSeparation = kMinClusterSeparationPx);

/// @brief Population standard deviation; 0 for fewer than two values.
[[nodiscard]] double standardDeviation(std::span<const double> values) noexcept;

/// @brief Population variance; 0 for fewer than two values.
[[nodiscard]] double variance(std::span<const double> values) noexcept;

}  // namespace docrecon::layout

#endif  // DOCRECON_LAYOUT_TWO_MEANS_H
