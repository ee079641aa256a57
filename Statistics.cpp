#include "Statistics.h"
#include <numeric>   // For std::accumulate
#include <cmath>     // For std::sqrt, std::pow, std::round
#include <stdexcept> // For std::invalid_argument
#include <map>

namespace Statistics {

    double calculateMean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        long double sum = std::accumulate(data.begin(), data.end(), 0.0L);
        return static_cast<double>(sum / data.size());
    }

    double calculateVariance(const std::vector<double>& data, double mean) {
        if (data.size() < 2) return 0.0;
        long double squaredDiffSum = 0.0;
        for (const double val : data) {
            squaredDiffSum += (val - mean) * (val - mean);
        }
        return static_cast<double>(squaredDiffSum / data.size()); // Population variance
    }

    double calculateStdDev(double variance) {
        return std::sqrt(variance);
    }

    double roundTo(double value, int decimals) {
        if (decimals < 0 || decimals > 10) {
            throw std::invalid_argument("Decimal places must be between 0 and 10.");
        }
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

    double findTValue(double confidence_level, int df) {
        if (df < 1) {
            return std::nan("");
        }

        // Past 100 degrees of freedom the t-distribution is close enough to the normal one.
        if (df > 100) {
            if (confidence_level == 90.0) return 1.645;
            if (confidence_level == 95.0) return 1.960;
            if (confidence_level == 99.0) return 2.576;
            return std::nan("");
        }

        // Two-tailed critical values, {90%, 95%, 99%} per degrees of freedom.
        static const std::map<int, std::vector<double>> t_table = {
            {1,  {6.314, 12.706, 63.657}},
            {2,  {2.920, 4.303,  9.925}},
            {3,  {2.353, 3.182,  5.841}},
            {4,  {2.132, 2.776,  4.604}},
            {5,  {2.015, 2.571,  4.032}},
            {6,  {1.943, 2.447,  3.707}},
            {7,  {1.895, 2.365,  3.499}},
            {8,  {1.860, 2.306,  3.355}},
            {9,  {1.833, 2.262,  3.250}},
            {10, {1.812, 2.228,  3.169}},
            {15, {1.753, 2.131,  2.947}},
            {20, {1.725, 2.086,  2.845}},
            {25, {1.708, 2.060,  2.787}},
            {30, {1.697, 2.042,  2.750}},
            {40, {1.684, 2.021,  2.704}},
            {50, {1.676, 2.009,  2.678}},
            {60, {1.671, 2.000,  2.660}},
            {80, {1.664, 1.990,  2.639}},
            {100,{1.660, 1.984,  2.626}}
        };

        // Between table rows use the next larger df, which gives the slightly narrower interval.
        auto it = t_table.lower_bound(df);
        if (it == t_table.end()) {
            --it;
        }

        if (confidence_level == 90.0) return it->second[0];
        if (confidence_level == 95.0) return it->second[1];
        if (confidence_level == 99.0) return it->second[2];

        return std::nan("");
    }

} // namespace Statistics
