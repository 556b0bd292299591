#include "safety_certification_node.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>

#include <ament_index_cpp/get_package_share_directory.hpp>
#include <diagnostic_msgs/msg/diagnostic_status.hpp>
#include <diagnostic_msgs/msg/key_value.hpp>
#include <lifecycle_msgs/msg/state.hpp>
#include <tf2/LinearMath/Matrix3x3.h>
#include <tf2/LinearMath/Quaternion.h>
#include <tf2_geometry_msgs/tf2_geometry_msgs.hpp>

using namespace std::chrono_literals;

namespace navl
{

namespace
{
constexpr double kMinTickRate = 1.0;      // [Hz]
constexpr double kMaxTickRate = 1000.0;   // [Hz]
constexpr double kMaxTickDt = 1.0;        // [s] clamp after stalls
}  // namespace

SafetyCertificationNode::SafetyCertificationNode(const rclcpp::NodeOptions & options)
: rclcpp_lifecycle::LifecycleNode("safety_certification", options)
{
  declareAndFetchParameters();
  RCLCPP_DEBUG(get_logger(), "SafetyCertificationNode constructed");
}

void SafetyCertificationNode::declareAndFetchParameters()
{
  this->declare_parameter("certified_params_path", certified_params_path_);
  this->declare_parameter("cert_key_path", cert_key_path_);
  this->declare_parameter("certificate_log_path", certificate_log_path_);
  this->declare_parameter("require_certified_params", require_certified_params_);
  this->declare_parameter("enable_fatigue_simulation", enable_fatigue_simulation_);
  this->declare_parameter("tick_rate_hz", tick_rate_hz_);
  this->declare_parameter("compilation_rate_hz", compilation_rate_hz_);
}

bool SafetyCertificationNode::loadConfiguration(SafetyCoreConfig & config)
{
  this->get_parameter("certified_params_path", certified_params_path_);
  this->get_parameter("cert_key_path", cert_key_path_);
  this->get_parameter("certificate_log_path", certificate_log_path_);
  this->get_parameter("require_certified_params", require_certified_params_);
  this->get_parameter("enable_fatigue_simulation", enable_fatigue_simulation_);
  this->get_parameter("tick_rate_hz", tick_rate_hz_);
  this->get_parameter("compilation_rate_hz", compilation_rate_hz_);

  if (!std::isfinite(tick_rate_hz_) || tick_rate_hz_ < kMinTickRate || tick_rate_hz_ > kMaxTickRate) {
    RCLCPP_FATAL(get_logger(), "tick_rate_hz out of range [%.0f, %.0f] (got %.3f)",
      kMinTickRate, kMaxTickRate, tick_rate_hz_);
    return false;
  }

  if (certified_params_path_.empty() || cert_key_path_.empty()) {
    std::string package_share_dir;
    try {
      package_share_dir = ament_index_cpp::get_package_share_directory("navl_certification");
    } catch (const std::exception & e) {
      RCLCPP_FATAL(get_logger(), "Failed to find package 'navl_certification': %s", e.what());
      return false;
    }
    if (certified_params_path_.empty()) {
      certified_params_path_ = package_share_dir + "/config/certified_safety_params.yaml";
    }
    if (cert_key_path_.empty()) {
      cert_key_path_ = package_share_dir + "/config/cert.key";
    }
  }

  RCLCPP_INFO(get_logger(), "Certified parameters path: %s", certified_params_path_.c_str());

  cert_validator_ = std::make_unique<CertifiedParamsValidator>(
    certified_params_path_, cert_key_path_, get_logger().get_child("certified_params"));

  try {
    if (cert_validator_->loadAndValidate()) {
      config = SafetyCoreConfig::fromCertifiedParams(*cert_validator_);
      const auto cert_info = cert_validator_->getCertificationInfo();
      RCLCPP_INFO(get_logger(), "Certificate: %s (valid until %s)",
        cert_info.certificate_id.c_str(), cert_info.valid_until.c_str());
    } else if (require_certified_params_) {
      RCLCPP_FATAL(get_logger(), "CRITICAL: certified parameter validation FAILED - refusing to start");
      return false;
    } else {
      RCLCPP_WARN(get_logger(),
        "Certified parameters unavailable - running with built-in defaults (NOT CERTIFIED)");
      config = SafetyCoreConfig();
    }

    config.scorer.enable_fatigue_simulation = enable_fatigue_simulation_;
    config.compilation_rate_hz = compilation_rate_hz_;
    config.validate();
  } catch (const std::exception & e) {
    RCLCPP_FATAL(get_logger(), "Invalid safety configuration: %s", e.what());
    return false;
  }

  return true;
}

SafetyCertificationNode::CallbackReturn SafetyCertificationNode::on_configure(
  const rclcpp_lifecycle::State & state)
{
  (void)state;

  SafetyCoreConfig config;
  if (!loadConfiguration(config)) {
    return CallbackReturn::FAILURE;
  }

  try {
    certificate_log_ = std::make_unique<CertificateLog>(
      certificate_log_path_, get_logger().get_child("certificate_log"));
    core_ = std::make_unique<SafetyCertificationCore>(
      config, certificate_log_.get(), this->get_clock(), get_logger());
  } catch (const std::exception & e) {
    RCLCPP_FATAL(get_logger(), "Failed to construct certification core: %s", e.what());
    core_.reset();
    certificate_log_.reset();
    return CallbackReturn::FAILURE;
  }

  core_->lockdown().setListener([this](bool locked, const std::string & reason) {
    if (locked) {
      RCLCPP_ERROR(get_logger(), "Safety stop: %s", reason.c_str());
      // Zero the output now rather than waiting for the next cmd_vel
      if (safe_cmd_pub_ && safe_cmd_pub_->is_activated()) {
        safe_cmd_pub_->publish(geometry_msgs::msg::Twist());
      }
    }
    publishSafetyStop(locked);
  });

  safe_cmd_pub_ = this->create_publisher<geometry_msgs::msg::Twist>("cmd_vel_safe", rclcpp::QoS(10));
  safety_stop_pub_ = this->create_publisher<std_msgs::msg::Bool>("safety_stop", rclcpp::QoS(10));
  certified_pub_ = this->create_publisher<std_msgs::msg::Bool>("safety/certified", rclcpp::QoS(10));
  p_score_pub_ = this->create_publisher<std_msgs::msg::Float64>("safety/p_score", rclcpp::QoS(10));
  diagnostic_pub_ = this->create_publisher<diagnostic_msgs::msg::DiagnosticArray>(
    "/diagnostics", rclcpp::QoS(10));

  odom_received_ = false;
  obstacles_.clear();
  goal_.reset();
  model_intent_.reset();
  fatigue_trigger_ = false;
  first_tick_ = true;
  last_output_.reset();

  RCLCPP_INFO(get_logger(),
    "Safety certification configured (tick %.1f Hz, compile %.1f Hz, log %s)",
    tick_rate_hz_, compilation_rate_hz_, certificate_log_path_.c_str());

  return CallbackReturn::SUCCESS;
}

SafetyCertificationNode::CallbackReturn SafetyCertificationNode::on_activate(
  const rclcpp_lifecycle::State & state)
{
  (void)state;
  RCLCPP_INFO(get_logger(), "Activating safety certification");

  if (safe_cmd_pub_) {
    safe_cmd_pub_->on_activate();
  }
  if (safety_stop_pub_) {
    safety_stop_pub_->on_activate();
  }
  if (certified_pub_) {
    certified_pub_->on_activate();
  }
  if (p_score_pub_) {
    p_score_pub_->on_activate();
  }
  if (diagnostic_pub_) {
    diagnostic_pub_->on_activate();
  }

  auto qos = rclcpp::QoS(10);
  odom_sub_ = this->create_subscription<nav_msgs::msg::Odometry>(
    "odom", qos,
    std::bind(&SafetyCertificationNode::odomCallback, this, std::placeholders::_1));
  obstacles_sub_ = this->create_subscription<geometry_msgs::msg::PoseArray>(
    "obstacles", qos,
    std::bind(&SafetyCertificationNode::obstaclesCallback, this, std::placeholders::_1));
  goal_sub_ = this->create_subscription<geometry_msgs::msg::PoseStamped>(
    "goal_pose", qos,
    std::bind(&SafetyCertificationNode::goalCallback, this, std::placeholders::_1));
  intent_sub_ = this->create_subscription<std_msgs::msg::Float64>(
    "model_intent", qos,
    std::bind(&SafetyCertificationNode::intentCallback, this, std::placeholders::_1));
  fatigue_sub_ = this->create_subscription<std_msgs::msg::Bool>(
    "fatigue_trigger", qos,
    std::bind(&SafetyCertificationNode::fatigueCallback, this, std::placeholders::_1));
  cmd_vel_sub_ = this->create_subscription<geometry_msgs::msg::Twist>(
    "cmd_vel", qos,
    std::bind(&SafetyCertificationNode::cmdVelCallback, this, std::placeholders::_1));
  fault_event_sub_ = this->create_subscription<std_msgs::msg::String>(
    "safety/fault_events", qos,
    std::bind(&SafetyCertificationNode::faultEventCallback, this, std::placeholders::_1));

  const auto period = std::chrono::duration<double>(1.0 / tick_rate_hz_);
  tick_timer_ = this->create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(period),
    std::bind(&SafetyCertificationNode::tick, this));
  diagnostic_timer_ = this->create_wall_timer(
    1s, std::bind(&SafetyCertificationNode::diagnosticTimerCallback, this));

  first_tick_ = true;
  publishSafetyStop(core_ && core_->lockdown().isLocked());

  RCLCPP_INFO(get_logger(), "Safety certification active");
  return CallbackReturn::SUCCESS;
}

SafetyCertificationNode::CallbackReturn SafetyCertificationNode::on_deactivate(
  const rclcpp_lifecycle::State & state)
{
  (void)state;
  RCLCPP_INFO(get_logger(), "Deactivating safety certification");

  if (tick_timer_) {
    tick_timer_->cancel();
    tick_timer_.reset();
  }
  if (diagnostic_timer_) {
    diagnostic_timer_->cancel();
    diagnostic_timer_.reset();
  }

  odom_sub_.reset();
  obstacles_sub_.reset();
  goal_sub_.reset();
  intent_sub_.reset();
  fatigue_sub_.reset();
  cmd_vel_sub_.reset();
  fault_event_sub_.reset();

  // Leave the robot stopped
  if (safe_cmd_pub_ && safe_cmd_pub_->is_activated()) {
    safe_cmd_pub_->publish(geometry_msgs::msg::Twist());
  }
  publishSafetyStop(true);

  if (safe_cmd_pub_ && safe_cmd_pub_->is_activated()) {
    safe_cmd_pub_->on_deactivate();
  }
  if (safety_stop_pub_ && safety_stop_pub_->is_activated()) {
    safety_stop_pub_->on_deactivate();
  }
  if (certified_pub_ && certified_pub_->is_activated()) {
    certified_pub_->on_deactivate();
  }
  if (p_score_pub_ && p_score_pub_->is_activated()) {
    p_score_pub_->on_deactivate();
  }
  if (diagnostic_pub_ && diagnostic_pub_->is_activated()) {
    diagnostic_pub_->on_deactivate();
  }

  return CallbackReturn::SUCCESS;
}

SafetyCertificationNode::CallbackReturn SafetyCertificationNode::on_cleanup(
  const rclcpp_lifecycle::State & state)
{
  (void)state;
  RCLCPP_INFO(get_logger(), "Cleaning up safety certification");

  tick_timer_.reset();
  diagnostic_timer_.reset();

  safe_cmd_pub_.reset();
  safety_stop_pub_.reset();
  certified_pub_.reset();
  p_score_pub_.reset();
  diagnostic_pub_.reset();

  core_.reset();
  certificate_log_.reset();
  cert_validator_.reset();
  last_output_.reset();

  return CallbackReturn::SUCCESS;
}

SafetyCertificationNode::CallbackReturn SafetyCertificationNode::on_shutdown(
  const rclcpp_lifecycle::State & state)
{
  (void)state;
  RCLCPP_INFO(get_logger(), "Shutting down safety certification");

  if (tick_timer_) {
    tick_timer_->cancel();
  }
  if (safe_cmd_pub_ && safe_cmd_pub_->is_activated()) {
    safe_cmd_pub_->publish(geometry_msgs::msg::Twist());
    safe_cmd_pub_->on_deactivate();
  }
  if (safety_stop_pub_ && safety_stop_pub_->is_activated()) {
    safety_stop_pub_->on_deactivate();
  }
  if (certified_pub_ && certified_pub_->is_activated()) {
    certified_pub_->on_deactivate();
  }
  if (p_score_pub_ && p_score_pub_->is_activated()) {
    p_score_pub_->on_deactivate();
  }
  if (diagnostic_pub_ && diagnostic_pub_->is_activated()) {
    diagnostic_pub_->on_deactivate();
  }

  return CallbackReturn::SUCCESS;
}

bool SafetyCertificationNode::isActive()
{
  return this->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE;
}

void SafetyCertificationNode::tick()
{
  if (!core_) {
    return;
  }

  if (!odom_received_) {
    RCLCPP_WARN_THROTTLE(get_logger(), *this->get_clock(), 5000,
      "Waiting for odometry before certifying");
    return;
  }

  const rclcpp::Time now = this->now();
  double dt = 0.0;
  if (!first_tick_) {
    dt = std::clamp((now - last_tick_time_).seconds(), 0.0, kMaxTickDt);
  }
  first_tick_ = false;
  last_tick_time_ = now;

  CycleInput input;
  input.robot_position = robot_position_;
  input.robot_velocity = robot_velocity_;
  input.obstacles = obstacles_;
  input.goal = goal_;
  input.model_intent = model_intent_;
  input.fatigue_trigger = fatigue_trigger_;
  input.dt = dt;

  last_output_ = core_->tick(input);

  if (certified_pub_ && certified_pub_->is_activated()) {
    std_msgs::msg::Bool msg;
    msg.data = last_output_->certified;
    certified_pub_->publish(msg);
  }
  if (p_score_pub_ && p_score_pub_->is_activated()) {
    std_msgs::msg::Float64 msg;
    msg.data = last_output_->p_score;
    p_score_pub_->publish(msg);
  }

  if (!last_output_->barrier_certified) {
    RCLCPP_WARN_THROTTLE(get_logger(), *this->get_clock(), 1000,
      "CBF not certified: h=%.3f dh/dt=%.3f",
      last_output_->barrier_value, last_output_->barrier_derivative);
  }
}

void SafetyCertificationNode::odomCallback(const nav_msgs::msg::Odometry::SharedPtr msg)
{
  if (!msg) {
    return;
  }

  const auto & p = msg->pose.pose.position;
  robot_position_ = {p.x, p.y, p.z};

  // Twist is expressed in the child frame; rotate into the odom frame
  tf2::Quaternion q;
  tf2::fromMsg(msg->pose.pose.orientation, q);
  double roll = 0.0;
  double pitch = 0.0;
  double yaw = 0.0;
  tf2::Matrix3x3(q).getRPY(roll, pitch, yaw);

  const auto & v = msg->twist.twist.linear;
  robot_velocity_ = {
    v.x * std::cos(yaw) - v.y * std::sin(yaw),
    v.x * std::sin(yaw) + v.y * std::cos(yaw),
    v.z};

  odom_received_ = true;
}

void SafetyCertificationNode::obstaclesCallback(const geometry_msgs::msg::PoseArray::SharedPtr msg)
{
  if (!msg) {
    return;
  }

  obstacles_.clear();
  obstacles_.reserve(msg->poses.size());
  for (const auto & pose : msg->poses) {
    const Vec3 obstacle{pose.position.x, pose.position.y, pose.position.z};
    if (obstacle.isFinite()) {
      obstacles_.push_back(obstacle);
    }
  }
}

void SafetyCertificationNode::goalCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg)
{
  if (!msg) {
    return;
  }
  const auto & p = msg->pose.position;
  goal_ = Vec3{p.x, p.y, p.z};
}

void SafetyCertificationNode::intentCallback(const std_msgs::msg::Float64::SharedPtr msg)
{
  if (!msg) {
    return;
  }
  model_intent_ = msg->data;
}

void SafetyCertificationNode::fatigueCallback(const std_msgs::msg::Bool::SharedPtr msg)
{
  if (!msg) {
    return;
  }
  fatigue_trigger_ = msg->data;
}

void SafetyCertificationNode::cmdVelCallback(const geometry_msgs::msg::Twist::SharedPtr msg)
{
  if (!isActive() || !msg || !safe_cmd_pub_) {
    return;
  }

  const bool blocked = !core_ || core_->lockdown().isLocked() ||
    core_->scorer().isZeroVelocityRequested();

  if (blocked) {
    cmd_blocked_count_++;
    RCLCPP_WARN_THROTTLE(get_logger(), *this->get_clock(), 1000,
      "Command blocked - lockdown engaged");
    safe_cmd_pub_->publish(geometry_msgs::msg::Twist());
    return;
  }

  cmd_forwarded_count_++;
  safe_cmd_pub_->publish(*msg);
}

void SafetyCertificationNode::faultEventCallback(const std_msgs::msg::String::SharedPtr msg)
{
  if (!isActive() || !core_) {
    return;
  }

  if (!msg || msg->data.empty()) {
    RCLCPP_WARN(get_logger(), "Received empty fault event message");
    return;
  }

  auto trim = [](std::string & text) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(),
      [&](unsigned char c) { return !is_space(c); }));
    text.erase(std::find_if(text.rbegin(), text.rend(),
      [&](unsigned char c) { return !is_space(c); }).base(), text.end());
  };

  std::string payload = msg->data;
  trim(payload);
  if (payload.empty()) {
    RCLCPP_WARN(get_logger(), "Fault event message contained only whitespace");
    return;
  }

  std::string normalized = payload;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto matchesToken = [&](const std::string & token) {
    return normalized == token || normalized.rfind(token + ":", 0) == 0;
  };

  if (matchesToken("CLEAR") || matchesToken("RESET") || matchesToken("RECOVERED")) {
    if (!core_->resetFailure()) {
      RCLCPP_WARN(get_logger(), "Reset '%s' refused - P-score still below threshold",
        payload.c_str());
      return;
    }
    core_->lockdown().releaseLockdown();
    RCLCPP_INFO(get_logger(), "Lockdown cleared by fault event: %s", payload.c_str());
    return;
  }

  RCLCPP_ERROR(get_logger(), "Fault event received: %s", payload.c_str());
  core_->lockdown().assertLockdown("Fault event: " + payload);
}

void SafetyCertificationNode::publishSafetyStop(bool active)
{
  if (safety_stop_pub_ && safety_stop_pub_->is_activated()) {
    std_msgs::msg::Bool stop_msg;
    stop_msg.data = active;
    safety_stop_pub_->publish(stop_msg);
  }
}

void SafetyCertificationNode::diagnosticTimerCallback()
{
  if (!isActive() || !core_ || !diagnostic_pub_) {
    return;
  }

  diagnostic_msgs::msg::DiagnosticArray diag_array;
  diag_array.header.stamp = this->now();

  diagnostic_msgs::msg::DiagnosticStatus status;
  status.name = "NAVL Safety Certification";
  status.hardware_id = "navl_core";

  const bool locked = core_->lockdown().isLocked();
  const bool certified = last_output_ && last_output_->certified;

  if (locked) {
    status.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
    status.message = "LOCKDOWN: " + core_->lockdown().reason();
  } else if (!last_output_) {
    status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
    status.message = "No certification cycle yet";
  } else if (!certified) {
    status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
    status.message = "State not certified";
  } else {
    status.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
    status.message = "Certified safe";
  }

  const auto stats = core_->compiler().getStats();

  auto add = [&status](const std::string & key, const std::string & value) {
    diagnostic_msgs::msg::KeyValue kv;
    kv.key = key;
    kv.value = value;
    status.values.push_back(kv);
  };

  if (last_output_) {
    add("p_score", std::to_string(last_output_->p_score));
    add("h_safety", std::to_string(last_output_->sub_scores.h_safety));
    add("barrier_value", std::to_string(last_output_->barrier_value));
    add("barrier_certified", last_output_->barrier_certified ? "true" : "false");
    add("sim2val_estimate", std::to_string(last_output_->sim2val_estimate));
  }
  add("lockdown_active", locked ? "true" : "false");
  add("lockdown_activations", std::to_string(core_->lockdown().activationCount()));
  add("certificates_issued", std::to_string(stats.total_certificates));
  add("window_size", std::to_string(stats.window_size));
  add("historical_mean", std::to_string(stats.historical_mean));
  add("current_sigma", std::to_string(stats.current_sigma));
  add("persistence_failures", std::to_string(core_->compiler().persistenceFailures()));
  add("estimator_faults", std::to_string(core_->estimator().faultCount()));
  add("certainty", std::to_string(core_->estimator().getCertainty()));
  add("commands_forwarded", std::to_string(cmd_forwarded_count_));
  add("commands_blocked", std::to_string(cmd_blocked_count_));

  if (cert_validator_) {
    add("certificate_id", cert_validator_->getCertificationInfo().certificate_id);
  }

  diag_array.status.push_back(status);
  diagnostic_pub_->publish(diag_array);
}

}  // namespace navl
