#include "StatsUtils.h"

#include <algorithm>
#include <cmath>

namespace StatsUtils {
double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const long double pos = static_cast<long double>(qq) * static_cast<long double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    if (hi == lo) return sorted[lo];

    const long double t = pos - static_cast<long double>(lo);
    const long double out = static_cast<long double>(sorted[lo]) * (1.0L - t) + static_cast<long double>(sorted[hi]) * t;
    return static_cast<double>(out);
}

size_t countDistinctSorted(const std::vector<double>& sorted) {
    if (sorted.empty()) return 0;
    size_t distinct = 1;
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i] != sorted[i - 1]) ++distinct;
    }
    return distinct;
}
}
