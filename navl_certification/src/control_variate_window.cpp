#include "control_variate_window.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace navl
{

namespace
{
double rescale(double y)
{
  return 50.0 + 50.0 * y;
}
}  // namespace

ControlVariateWindow::ControlVariateWindow(std::size_t capacity)
: capacity_(capacity)
{
  if (capacity_ == 0) {
    throw std::invalid_argument("ControlVariateWindow capacity must be > 0");
  }
}

void ControlVariateWindow::push(double y)
{
  if (!std::isfinite(y)) {
    throw std::invalid_argument("ControlVariateWindow sample must be finite");
  }
  samples_.push_back(std::clamp(y, 0.0, 1.0));
  while (samples_.size() > capacity_) {
    samples_.pop_front();
  }
}

std::vector<double> ControlVariateWindow::values() const
{
  return std::vector<double>(samples_.begin(), samples_.end());
}

double ControlVariateWindow::mean() const
{
  if (samples_.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (double y : samples_) {
    sum += y;
  }
  return sum / static_cast<double>(samples_.size());
}

double ControlVariateWindow::variance() const
{
  if (samples_.size() < 2) {
    return 0.0;
  }
  const double m = mean();
  double acc = 0.0;
  for (double y : samples_) {
    acc += (y - m) * (y - m);
  }
  return acc / static_cast<double>(samples_.size());
}

double ControlVariateWindow::rescaledMean() const
{
  if (samples_.empty()) {
    return DEFAULT_RESCALED_MEAN;
  }
  double sum = 0.0;
  for (double y : samples_) {
    sum += rescale(y);
  }
  return sum / static_cast<double>(samples_.size());
}

double ControlVariateWindow::rescaledVariance() const
{
  if (samples_.size() < 2) {
    return 0.0;
  }
  const double m = rescaledMean();
  double acc = 0.0;
  for (double y : samples_) {
    const double x = rescale(y);
    acc += (x - m) * (x - m);
  }
  return acc / static_cast<double>(samples_.size());
}

}  // namespace navl
