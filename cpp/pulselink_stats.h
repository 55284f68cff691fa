#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace pulselink {

template <typename It>
inline double meanOf(It first, It last) {
    double s = 0.0; size_t n = 0;
    for (It it = first; it != last; ++it) { s += *it; ++n; }
    return n ? s / static_cast<double>(n) : 0.0;
}

inline double mean(const std::vector<double>& v) {
    return meanOf(v.begin(), v.end());
}

// Population variance (n); 0 for an empty range
template <typename It>
inline double varianceOf(It first, It last) {
    const double m = meanOf(first, last);
    double acc = 0.0; size_t n = 0;
    for (It it = first; it != last; ++it) { acc += (*it - m) * (*it - m); ++n; }
    return n ? acc / static_cast<double>(n) : 0.0;
}

// Sample standard deviation (n-1); 0 for fewer than two values
inline double sampleStdDev(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(v.size() - 1));
}

} // namespace pulselink
