#include "hillmaker/statistics/statistics_engine.hpp"
#include "hillmaker/core/types.hpp"
#include "hillmaker/statistics/arrow_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace hillmaker {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Round-off residue below this is treated as an exact zero moment
constexpr double FP_ZERO_TOLERANCE = 1e-14;

double zero_out_fperr(double v) { return std::fabs(v) < FP_ZERO_TOLERANCE ? 0.0 : v; }

} // namespace

DescriptiveStatistics::DescriptiveStatistics()
    : count(0), mean(NaN), min(NaN), max(NaN), stdev(NaN), sem(NaN),
      var(NaN), cv(0.0), skew(NaN), kurt(NaN) {}

// ============================================================================
// Low-level statistics
// ============================================================================

double StatisticsEngine::calculate_mean(const double *data, size_t length) {
  if (length == 0) {
    return NaN;
  }
  double sum = 0.0;
  for (size_t i = 0; i < length; ++i) {
    sum += data[i];
  }
  return sum / static_cast<double>(length);
}

double StatisticsEngine::calculate_variance(const double *data, size_t length,
                                            double mean) {
  if (length < 2) {
    return NaN;
  }
  double sum_sq = 0.0;
  for (size_t i = 0; i < length; ++i) {
    const double d = data[i] - mean;
    sum_sq += d * d;
  }
  return sum_sq / static_cast<double>(length - 1);
}

void StatisticsEngine::calculate_min_max(const double *data, size_t length,
                                         double &min, double &max) {
  if (length == 0) {
    min = max = NaN;
    return;
  }
  min = max = data[0];
  for (size_t i = 1; i < length; ++i) {
    min = std::min(min, data[i]);
    max = std::max(max, data[i]);
  }
}

double StatisticsEngine::calculate_skew(const double *data, size_t length,
                                        double mean) {
  if (length < 3) {
    return NaN;
  }
  double m2 = 0.0;
  double m3 = 0.0;
  for (size_t i = 0; i < length; ++i) {
    const double d = data[i] - mean;
    m2 += d * d;
    m3 += d * d * d;
  }
  m2 = zero_out_fperr(m2);
  m3 = zero_out_fperr(m3);
  if (m2 == 0.0) {
    return 0.0;
  }
  const double n = static_cast<double>(length);
  return (n * std::sqrt(n - 1.0) / (n - 2.0)) * (m3 / std::pow(m2, 1.5));
}

double StatisticsEngine::calculate_kurtosis(const double *data, size_t length,
                                            double mean) {
  if (length < 4) {
    return NaN;
  }
  double m2 = 0.0;
  double m4 = 0.0;
  for (size_t i = 0; i < length; ++i) {
    const double d2 = (data[i] - mean) * (data[i] - mean);
    m2 += d2;
    m4 += d2 * d2;
  }
  m2 = zero_out_fperr(m2);
  m4 = zero_out_fperr(m4);

  const double n = static_cast<double>(length);
  const double adj = 3.0 * (n - 1.0) * (n - 1.0) / ((n - 2.0) * (n - 3.0));
  const double numerator = n * (n + 1.0) * (n - 1.0) * m4;
  const double denominator = (n - 2.0) * (n - 3.0) * m2 * m2;
  if (zero_out_fperr(denominator) == 0.0) {
    return 0.0;
  }
  return numerator / denominator - adj;
}

double StatisticsEngine::percentile_sorted(const std::vector<double> &sorted,
                                           double p) {
  if (sorted.empty()) {
    return NaN;
  }
  const double pos = p * static_cast<double>(sorted.size() - 1);
  const size_t lo = static_cast<size_t>(std::floor(pos));
  const size_t hi = std::min(lo + 1, sorted.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

std::string StatisticsEngine::percentile_name(double p) {
  // Truncated like int(100 * p); the nudge keeps 0.29 at p29
  return "p" + std::to_string(static_cast<long>(std::floor(p * 100.0 + 1e-9)));
}

// ============================================================================
// describe()
// ============================================================================

DescriptiveStatistics
StatisticsEngine::describe(const std::vector<double> &data,
                           const std::vector<double> &percentiles) {
  for (double p : percentiles) {
    if (!(p >= 0.0 && p <= 1.0)) {
      throw ValidationError("Percentile " + std::to_string(p) +
                            " outside [0, 1]");
    }
  }

  DescriptiveStatistics stats;
  stats.count = data.size();
  stats.percentiles = percentiles;
  stats.percentile_values.assign(percentiles.size(), NaN);

  if (data.empty()) {
    return stats;
  }

  // Priority: Arrow Compute > Scalar
  bool done = false;
  if (data.size() >= arrow_utils::ARROW_THRESHOLD &&
      arrow_utils::is_arrow_available()) {
    done = describe_arrow(data, stats);
  }
  if (!done) {
    describe_native(data, stats);
  }

  // Shape statistics are always computed natively
  stats.skew = calculate_skew(data.data(), data.size(), stats.mean);
  stats.kurt = calculate_kurtosis(data.data(), data.size(), stats.mean);

  stats.stdev = std::isnan(stats.var) ? NaN : std::sqrt(stats.var);
  stats.sem = std::isnan(stats.stdev)
                  ? NaN
                  : stats.stdev / std::sqrt(static_cast<double>(stats.count));
  stats.cv = (stats.mean > 0.0 && !std::isnan(stats.stdev))
                 ? stats.stdev / stats.mean
                 : 0.0;

  return stats;
}

void StatisticsEngine::describe_native(const std::vector<double> &data,
                                       DescriptiveStatistics &stats) {
  stats.mean = calculate_mean(data.data(), data.size());
  stats.var = calculate_variance(data.data(), data.size(), stats.mean);
  calculate_min_max(data.data(), data.size(), stats.min, stats.max);

  if (!stats.percentiles.empty()) {
    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < stats.percentiles.size(); ++i) {
      stats.percentile_values[i] = percentile_sorted(sorted, stats.percentiles[i]);
    }
  }
}

bool StatisticsEngine::describe_arrow(const std::vector<double> &data,
                                      DescriptiveStatistics &stats) {
#ifdef HAVE_ARROW
  try {
    auto arrow_array = arrow_utils::wrap_vector_as_arrow(data);
    arrow::compute::ExecContext ctx;

    auto mean_result =
        arrow::compute::CallFunction("mean", {arrow_array}, &ctx);
    if (!mean_result.ok()) {
      return false;
    }
    stats.mean = mean_result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;

    if (data.size() >= 2) {
      arrow::compute::VarianceOptions var_options(/*ddof=*/1);
      auto var_result = arrow::compute::CallFunction("variance", {arrow_array},
                                                     &var_options, &ctx);
      if (!var_result.ok()) {
        return false;
      }
      stats.var = var_result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
    }

    auto minmax_result =
        arrow::compute::CallFunction("min_max", {arrow_array}, &ctx);
    if (!minmax_result.ok()) {
      return false;
    }
    auto minmax_scalar =
        minmax_result.ValueOrDie().scalar_as<arrow::StructScalar>();
    stats.min =
        std::static_pointer_cast<arrow::DoubleScalar>(minmax_scalar.value[0])
            ->value;
    stats.max =
        std::static_pointer_cast<arrow::DoubleScalar>(minmax_scalar.value[1])
            ->value;

    if (!stats.percentiles.empty()) {
      arrow::compute::QuantileOptions q_options(
          stats.percentiles, arrow::compute::QuantileOptions::LINEAR);
      auto q_result = arrow::compute::CallFunction("quantile", {arrow_array},
                                                   &q_options, &ctx);
      if (!q_result.ok()) {
        return false;
      }
      auto q_array = std::static_pointer_cast<arrow::DoubleArray>(
          q_result.ValueOrDie().make_array());
      for (int64_t i = 0; i < q_array->length(); ++i) {
        stats.percentile_values[static_cast<size_t>(i)] = q_array->Value(i);
      }
    }
    return true;

  } catch (const std::exception &e) {
    std::cerr << "[StatisticsEngine] Arrow compute failed: " << e.what()
              << ", falling back to native path" << std::endl;
    return false;
  }
#else
  (void)data;
  (void)stats;
  return false;
#endif
}

} // namespace hillmaker
