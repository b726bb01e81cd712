// step_executor.hpp
//
// Stand-in for the external controller of hnav_planner: receives move tokens on
// the command topic, "executes" each after a configurable delay and answers
// with "<TOKEN> DONE" on the ack topic.

#ifndef HNAV_STEP_EXECUTOR_HPP_
#define HNAV_STEP_EXECUTOR_HPP_

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "hnav/types.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

namespace hnav {

// Parameters: command_topic, ack_topic, execution_delay_s, track_position, start.
//
// Acks are volatile, so one published before the ack writer has matched the
// planner's subscription would be lost and leave the planner waiting. Each ack
// is therefore held until the writer reports a matched subscriber, and later
// commands queue behind it. With no planner subscribed the ack is held
// indefinitely.
class StepExecutor : public rclcpp::Node {
   public:
    explicit StepExecutor(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

   private:
    void declare_parameters();
    void init_subscriptions();
    void init_publishers();

    void handle_command(const std_msgs::msg::String::SharedPtr msg);
    void start_next_execution();
    void finish_execution();
    // Publishes the held ack once a subscriber is matched, otherwise re-polls.
    void flush_ack();

    // --- Parameters ---------------------------------------------------------
    std::string command_topic_;
    std::string ack_topic_;
    double execution_delay_s_{0.0};  // Simulated time to carry out one move (s).
    bool track_position_{true};      // Dead-reckon the grid position from the commands.

    // --- ROS interfaces -----------------------------------------------------
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr command_sub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr ack_pub_;
    rclcpp::TimerBase::SharedPtr execution_timer_;
    rclcpp::TimerBase::SharedPtr match_timer_;

    // --- State --------------------------------------------------------------
    std::deque<Move> pending_;
    bool executing_{false};
    std::optional<std::string> held_ack_;
    std::size_t executed_{0};  // Commands acknowledged so far, GOAL included.
    Position position_{2, 2};
};

}  // namespace hnav

#endif  // HNAV_STEP_EXECUTOR_HPP_
