#include <iostream>
#include <memory>
#include <vector>

#include <rclcpp/rclcpp.hpp>
#include <rclcpp/executors/multi_threaded_executor.hpp>
#include <lifecycle_msgs/msg/state.hpp>

#include "cli_options.hpp"
#include "safety_certification_node.hpp"


int main(int argc, char * argv[])
{
  std::vector<char *> filtered_args;
  navl::CliOptions options;

  try {
    options = navl::parse_cli_arguments(argc, argv, filtered_args);
  } catch (const std::exception & e) {
    std::cerr << "Failed to process command-line arguments: " << e.what() << std::endl;
    return 1;
  }

  int filtered_argc = static_cast<int>(filtered_args.size()) - 1;
  rclcpp::init(filtered_argc, filtered_args.data());

  const auto logger = rclcpp::get_logger("safety_certification");

  rclcpp::NodeOptions node_options;
  if (options.certificate_log_path) {
    node_options.append_parameter_override(
      "certificate_log_path", *options.certificate_log_path);
  }

  std::shared_ptr<navl::SafetyCertificationNode> node;
  try {
    node = std::make_shared<navl::SafetyCertificationNode>(node_options);
  } catch (const std::exception & e) {
    RCLCPP_FATAL(logger, "Failed to construct safety certification node: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::executors::MultiThreadedExecutor executor;
  executor.add_node(node->get_node_base_interface());

  if (options.autostart) {
    RCLCPP_WARN(logger, "Autostart enabled - configuring and activating immediately");

    if (node->configure().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
      RCLCPP_FATAL(logger, "Failed to configure safety certification node");
      rclcpp::shutdown();
      return 1;
    }

    if (node->activate().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
      RCLCPP_FATAL(logger, "Failed to activate safety certification node");
      rclcpp::shutdown();
      return 1;
    }
  } else {
    RCLCPP_INFO(logger, "Autostart disabled - waiting for external lifecycle transitions");
  }

  executor.spin();
  executor.remove_node(node->get_node_base_interface());

  int exit_code = 0;
  if (node->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
    if (node->deactivate().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
      RCLCPP_ERROR(logger, "Error deactivating safety certification node during shutdown");
      exit_code = 1;
    }
  }

  if (node->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
    if (node->cleanup().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_UNCONFIGURED) {
      RCLCPP_ERROR(logger, "Error cleaning up safety certification node during shutdown");
      exit_code = 1;
    }
  }

  rclcpp::shutdown();
  return exit_code;
}
