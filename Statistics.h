#ifndef STATISTICS_H
#define STATISTICS_H

#include <vector>

namespace Statistics {

    /**
     * @brief Calculates the mean (average) of a dataset.
     * @param data The vector of data points.
     * @return The mean of the data, 0 for an empty vector.
     */
    double calculateMean(const std::vector<double>& data);

    /**
     * @brief Calculates the population variance of a dataset.
     * @param data The vector of data points.
     * @param mean The pre-calculated mean of the data.
     * @return The variance of the data.
     */
    double calculateVariance(const std::vector<double>& data, double mean);

    double calculateStdDev(double variance);

    /**
     * @brief Rounds half away from zero to a fixed number of decimal places.
     * @param value The value to round.
     * @param decimals Number of decimal places, must be in [0, 10].
     */
    double roundTo(double value, int decimals);

    /**
     * @brief Finds the critical value from a Student's t-distribution.
     * @param confidence_level The two-tailed confidence level in percent. Accepts 90, 95, 99.
     * @param degrees_of_freedom Degrees of freedom. Above 100 the normal approximation is returned.
     * @return The critical value, NaN for an unsupported level or df < 1.
     */
    double findTValue(double confidence_level, int degrees_of_freedom);

} // namespace Statistics

#endif // STATISTICS_H
