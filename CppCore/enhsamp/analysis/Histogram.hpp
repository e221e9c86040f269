#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Uniform one-dimensional histogram with density normalization.
 */

#include <cstddef>
#include <vector>

namespace enhsamp {
namespace analysis {

/**
 * @class Histogram
 * @brief Counts samples in @a n equal bins over @f$ [lo, hi) @f$.
 *
 * Samples outside the range are tallied separately and excluded from the
 * density.
 */
class Histogram {
public:
  /**
   * @brief Constructor for Histogram.
   * @param lo     Inclusive lower edge.
   * @param hi     Exclusive upper edge.
   * @param n_bins Number of bins, positive.
   *
   * @warning Throws @c std::runtime_error for an empty range or zero bins.
   */
  Histogram(double lo, double hi, size_t n_bins);

  void add(double sample);
  void add(const std::vector<double> &samples);

  /**
   * @brief Normalized probability density.
   * @return Per-bin density with @f$ \sum_i p_i \, w = 1 @f$ over in-range
   * samples; NaN in every bin when nothing was counted.
   */
  std::vector<double> density() const;

  /**
   * @brief Midpoints of the bins.
   * @return One center per bin.
   */
  std::vector<double> centers() const;

  const std::vector<size_t> &counts() const { return m_counts; }
  size_t bins() const { return m_counts.size(); }
  double width() const { return m_width; }
  double lower() const { return m_lo; }
  double upper() const { return m_hi; }
  size_t in_range() const { return m_in_range; }
  size_t out_of_range() const { return m_out_of_range; }

private:
  double m_lo;
  double m_hi;
  double m_width;
  std::vector<size_t> m_counts;
  size_t m_in_range{0};
  size_t m_out_of_range{0};
};

} // namespace analysis
} // namespace enhsamp
