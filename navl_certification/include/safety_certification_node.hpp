#ifndef NAVL_SAFETY_CERTIFICATION_NODE_HPP
#define NAVL_SAFETY_CERTIFICATION_NODE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <geometry_msgs/msg/pose_array.hpp>
#include <geometry_msgs/msg/pose_stamped.hpp>
#include <geometry_msgs/msg/twist.hpp>
#include <nav_msgs/msg/odometry.hpp>
#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_msgs/msg/float64.hpp>
#include <std_msgs/msg/string.hpp>

#include "certificate_log.hpp"
#include "certified_params_validator.hpp"
#include "safety_certification_core.hpp"

namespace navl
{

/**
 * @brief Lifecycle node driving the certification core
 *
 * configure: validates certified parameters and opens the certificate log.
 * activate: starts the tick timer; every tick pulls the latest odometry,
 * obstacle snapshot, goal, intent and fatigue inputs into the core.
 *
 * Commands on cmd_vel are forwarded to cmd_vel_safe, zeroed while the
 * lockdown is engaged. Fault events RESET/CLEAR/RECOVERED attempt to clear
 * a latched failure; any other event engages the lockdown.
 */
class SafetyCertificationNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  explicit SafetyCertificationNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;

  /// Run one certification cycle (timer callback, exposed for tests)
  void tick();

  const SafetyCertificationCore * core() const { return core_.get(); }
  const std::optional<CycleOutput> & lastOutput() const { return last_output_; }

private:
  void declareAndFetchParameters();
  bool loadConfiguration(SafetyCoreConfig & config);

  // ROS callbacks
  void odomCallback(const nav_msgs::msg::Odometry::SharedPtr msg);
  void obstaclesCallback(const geometry_msgs::msg::PoseArray::SharedPtr msg);
  void goalCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg);
  void intentCallback(const std_msgs::msg::Float64::SharedPtr msg);
  void fatigueCallback(const std_msgs::msg::Bool::SharedPtr msg);
  void cmdVelCallback(const geometry_msgs::msg::Twist::SharedPtr msg);
  void faultEventCallback(const std_msgs::msg::String::SharedPtr msg);
  void diagnosticTimerCallback();

  void publishSafetyStop(bool active);
  bool isActive();

  // Core
  std::unique_ptr<CertifiedParamsValidator> cert_validator_;
  std::unique_ptr<CertificateLog> certificate_log_;
  std::unique_ptr<SafetyCertificationCore> core_;
  std::optional<CycleOutput> last_output_;

  // ROS entities
  rclcpp_lifecycle::LifecyclePublisher<geometry_msgs::msg::Twist>::SharedPtr safe_cmd_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Bool>::SharedPtr safety_stop_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Bool>::SharedPtr certified_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Float64>::SharedPtr p_score_pub_;
  rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diagnostic_pub_;

  rclcpp::Subscription<nav_msgs::msg::Odometry>::SharedPtr odom_sub_;
  rclcpp::Subscription<geometry_msgs::msg::PoseArray>::SharedPtr obstacles_sub_;
  rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr goal_sub_;
  rclcpp::Subscription<std_msgs::msg::Float64>::SharedPtr intent_sub_;
  rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr fatigue_sub_;
  rclcpp::Subscription<geometry_msgs::msg::Twist>::SharedPtr cmd_vel_sub_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr fault_event_sub_;

  rclcpp::TimerBase::SharedPtr tick_timer_;
  rclcpp::TimerBase::SharedPtr diagnostic_timer_;

  // Parameters
  std::string certified_params_path_;
  std::string cert_key_path_;
  std::string certificate_log_path_{"navl_cert_chain.csv"};
  bool require_certified_params_{true};
  bool enable_fatigue_simulation_{true};
  double tick_rate_hz_{20.0};
  double compilation_rate_hz_{10.0};

  // Latest inputs
  bool odom_received_{false};
  Vec3 robot_position_;
  Vec3 robot_velocity_;
  std::vector<Vec3> obstacles_;
  std::optional<Vec3> goal_;
  std::optional<double> model_intent_;
  bool fatigue_trigger_{false};
  rclcpp::Time last_tick_time_;
  bool first_tick_{true};

  // Statistics for diagnostics
  uint64_t cmd_forwarded_count_{0};
  uint64_t cmd_blocked_count_{0};
};

}  // namespace navl

#endif  // NAVL_SAFETY_CERTIFICATION_NODE_HPP
