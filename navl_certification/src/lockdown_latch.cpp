#include "lockdown_latch.hpp"

#include <utility>

namespace navl
{

LockdownLatch::LockdownLatch(rclcpp::Logger logger)
: logger_(logger)
{
}

void LockdownLatch::assertLockdown(const std::string & reason)
{
  if (locked_) {
    return;
  }

  locked_ = true;
  reason_ = reason;
  ++activations_;

  RCLCPP_FATAL(logger_, "LOCKDOWN ENGAGED: %s", reason.c_str());

  if (listener_) {
    listener_(true, reason_);
  }
}

void LockdownLatch::releaseLockdown()
{
  if (!locked_) {
    return;
  }

  locked_ = false;
  RCLCPP_WARN(logger_, "Lockdown released (was: %s)", reason_.c_str());
  reason_.clear();

  if (listener_) {
    listener_(false, reason_);
  }
}

void LockdownLatch::setListener(Listener listener)
{
  listener_ = std::move(listener);
}

}  // namespace navl
