#ifndef NAVL_CONTROL_VARIATE_WINDOW_HPP
#define NAVL_CONTROL_VARIATE_WINDOW_HPP

#include <cstddef>
#include <deque>
#include <vector>

namespace navl
{

/**
 * @brief Bounded FIFO of near-miss indicators Y in [0, 1].
 *
 * The oldest sample is evicted once capacity is reached. Statistics are
 * population statistics; below two samples the variance is 0.
 */
class ControlVariateWindow
{
public:
  static constexpr double DEFAULT_RESCALED_MEAN = 50.0;

  explicit ControlVariateWindow(std::size_t capacity = 100);

  void push(double y);

  void clear() { samples_.clear(); }

  std::size_t size() const { return samples_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return samples_.empty(); }

  std::vector<double> values() const;

  double mean() const;

  double variance() const;

  /// Mean of 50 + 50 * y; DEFAULT_RESCALED_MEAN when empty
  double rescaledMean() const;

  /// Population variance of 50 + 50 * y
  double rescaledVariance() const;

private:
  std::size_t capacity_;
  std::deque<double> samples_;
};

}  // namespace navl

#endif  // NAVL_CONTROL_VARIATE_WINDOW_HPP
