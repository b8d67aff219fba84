#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hillmaker {

/// Descriptive statistics of one sample (pandas describe() conventions)
struct DescriptiveStatistics {
    size_t count;       ///< Number of values
    double mean;        ///< Arithmetic mean
    double min;         ///< Minimum value
    double max;         ///< Maximum value
    double stdev;       ///< Sample standard deviation (ddof = 1)
    double sem;         ///< Standard error of the mean
    double var;         ///< Sample variance (ddof = 1)
    double cv;          ///< stdev / mean, 0 when mean <= 0
    double skew;        ///< Adjusted Fisher-Pearson skewness
    double kurt;        ///< Excess kurtosis (unbiased)
    std::vector<double> percentiles;        ///< Requested quantiles, fractions in [0, 1]
    std::vector<double> percentile_values;  ///< Values matching `percentiles`

    DescriptiveStatistics();
};

/// Descriptive statistics engine
class StatisticsEngine {
public:
    StatisticsEngine() = delete;  // Static class, no instances

    /**
     * @brief Full set of descriptive statistics
     *
     * NaN is reported where pandas reports it: mean/min/max of an empty
     * sample, variance with fewer than 2 values, skew with fewer than 3,
     * kurtosis with fewer than 4. Samples of ARROW_THRESHOLD values or more
     * use Arrow Compute for mean, variance, min/max and quantiles when the
     * library is built with Arrow.
     *
     * @param data Sample values
     * @param percentiles Quantiles to compute, fractions in [0, 1]
     * @throws ValidationError if a percentile is outside [0, 1]
     */
    static DescriptiveStatistics describe(const std::vector<double>& data,
                                          const std::vector<double>& percentiles);

    /// Linear-interpolation quantile of sorted data, p in [0, 1]
    static double percentile_sorted(const std::vector<double>& sorted, double p);

    /// Column name of a quantile: "p" + round(100 * p), e.g. 0.95 -> "p95"
    static std::string percentile_name(double p);

    // ========== LOW-LEVEL STATISTICS ==========

    static double calculate_mean(const double* data, size_t length);

    /// Sample variance with ddof = 1
    static double calculate_variance(const double* data, size_t length, double mean);

    static void calculate_min_max(const double* data, size_t length, double& min, double& max);

    static double calculate_skew(const double* data, size_t length, double mean);

    static double calculate_kurtosis(const double* data, size_t length, double mean);

private:
    static void describe_native(const std::vector<double>& data, DescriptiveStatistics& stats);

    /// Arrow Compute path; false if Arrow is unavailable or a kernel failed
    static bool describe_arrow(const std::vector<double>& data, DescriptiveStatistics& stats);
};

} // namespace hillmaker
