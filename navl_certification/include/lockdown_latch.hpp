#ifndef NAVL_LOCKDOWN_LATCH_HPP
#define NAVL_LOCKDOWN_LATCH_HPP

#include <cstdint>
#include <functional>
#include <string>

#include <rclcpp/rclcpp.hpp>

namespace navl
{

/**
 * @brief Receiver of hard-stop requests raised by the safety layers.
 */
class LockdownSink
{
public:
  virtual ~LockdownSink() = default;

  virtual void assertLockdown(const std::string & reason) = 0;

  virtual void releaseLockdown() = 0;

  virtual bool isLocked() const = 0;
};

/**
 * @brief Idempotent lockdown latch.
 *
 * Repeated assertions while locked have no side effects. State changes are
 * forwarded to an optional listener (e.g. a safety_stop publisher).
 */
class LockdownLatch : public LockdownSink
{
public:
  using Listener = std::function<void(bool locked, const std::string & reason)>;

  explicit LockdownLatch(rclcpp::Logger logger = rclcpp::get_logger("lockdown_latch"));

  void assertLockdown(const std::string & reason) override;

  void releaseLockdown() override;

  bool isLocked() const override { return locked_; }

  void setListener(Listener listener);

  uint64_t activationCount() const { return activations_; }

  const std::string & reason() const { return reason_; }

private:
  bool locked_{false};
  uint64_t activations_{0};
  std::string reason_;
  Listener listener_;
  rclcpp::Logger logger_;
};

}  // namespace navl

#endif  // NAVL_LOCKDOWN_LATCH_HPP
