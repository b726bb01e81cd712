// hnav_step_executor_node.cpp
//
// Runs hnav::StepExecutor as the external controller of hnav_planner.

#include <memory>

#include "hnav/step_executor.hpp"
#include "rclcpp/rclcpp.hpp"

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    rclcpp::spin(std::make_shared<hnav::StepExecutor>());
    rclcpp::shutdown();
    return 0;
}
