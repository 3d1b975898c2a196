#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {
/**
 * @brief Percentile of an ascending-sorted sample, linear interpolation between closest ranks.
 * @pre sorted is non-empty and ascending.
 * @details Position is q * (n - 1); q is clamped to [0,1].
 */
double percentileSorted(const std::vector<double>& sorted, double q);

size_t countDistinctSorted(const std::vector<double>& sorted);
}
