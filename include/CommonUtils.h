#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::vector<std::string> splitList(const std::string& s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

// Shortest readable rendering; integral values print without a fraction.
inline std::string formatNumber(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    return buf;
}

// Exact rendering, used where two values must compare equal only when identical.
inline std::string formatNumberExact(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    long double sum = 0.0L;
    for (double v : values) sum += v;
    return static_cast<double>(sum / static_cast<long double>(values.size()));
}

// Bessel-corrected; 0 for fewer than two values.
inline double sampleStddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    long double acc = 0.0L;
    for (double v : values) {
        const long double d = static_cast<long double>(v) - m;
        acc += d * d;
    }
    return static_cast<double>(std::sqrt(acc / static_cast<long double>(values.size() - 1)));
}

inline double medianByNth(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 0) {
        std::nth_element(values.begin(), values.begin() + (mid - 1), values.begin() + mid);
        const long double lo = static_cast<long double>(values[mid - 1]);
        const long double hi = static_cast<long double>(upper);
        return static_cast<double>((lo + hi) / 2.0L);
    }
    return upper;
}

// Linear interpolation between closest ranks.
inline double quantileByNth(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    if (q <= 0.0) return *std::min_element(values.begin(), values.end());
    if (q >= 1.0) return *std::max_element(values.begin(), values.end());

    const long double pos = static_cast<long double>(q) * static_cast<long double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));

    std::nth_element(values.begin(), values.begin() + lo, values.end());
    const double loVal = values[lo];
    if (hi == lo) return loVal;

    std::nth_element(values.begin(), values.begin() + hi, values.end());
    const double hiVal = values[hi];
    const long double frac = pos - static_cast<long double>(lo);
    const long double out = static_cast<long double>(loVal) * (1.0L - frac) + static_cast<long double>(hiVal) * frac;
    return static_cast<double>(out);
}

} // namespace CommonUtils
