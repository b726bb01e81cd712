// step_executor.cpp
//
// Delayed, in-order acknowledgement of step commands.

#include "hnav/step_executor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace {
// Step topics: reliable, keep-last 10, matching the planner's step channel.
rclcpp::QoS step_qos() { return rclcpp::QoS(rclcpp::KeepLast(10)).reliable(); }

// Re-check interval while an ack waits for the planner's subscription to match.
constexpr std::chrono::milliseconds k_match_poll{50};
}  // namespace

namespace hnav {

StepExecutor::StepExecutor(const rclcpp::NodeOptions& options)
    : rclcpp::Node("hnav_step_executor", options) {
    declare_parameters();
    init_subscriptions();
    init_publishers();

    RCLCPP_INFO(get_logger(), "hnav_step_executor ready. command=%s -> ack=%s (delay %.2f s)",
                command_topic_.c_str(), ack_topic_.c_str(), execution_delay_s_);
}

// --- Parameter loading -----------------------------------------------------
void StepExecutor::declare_parameters() {
    // Topic wiring
    command_topic_ = declare_parameter<std::string>("command_topic", "/robot/controller/command");
    ack_topic_ = declare_parameter<std::string>("ack_topic", "/robot/controller/ack");

    // Execution model
    execution_delay_s_ = declare_parameter("execution_delay_s", 0.0);
    track_position_ = declare_parameter("track_position", true);
    const auto start = position_from_values(declare_parameter<std::vector<int64_t>>(
        "start", {static_cast<int64_t>(position_.row), static_cast<int64_t>(position_.col)}));
    if (start) {
        position_ = *start;
    } else {
        RCLCPP_WARN(get_logger(),
                    "start must be [row, col] with int-sized values; tracking from %s.",
                    to_string(position_).c_str());
    }

    if (execution_delay_s_ < 0.0) {
        RCLCPP_WARN(get_logger(), "execution_delay_s must be >= 0; using 0.");
        execution_delay_s_ = 0.0;
    }
}

// --- ROS interface wiring --------------------------------------------------
void StepExecutor::init_subscriptions() {
    command_sub_ = create_subscription<std_msgs::msg::String>(
        command_topic_, step_qos(),
        std::bind(&StepExecutor::handle_command, this, std::placeholders::_1));
}

void StepExecutor::init_publishers() {
    ack_pub_ = create_publisher<std_msgs::msg::String>(ack_topic_, step_qos());
}

// --- Subscription callbacks ------------------------------------------------
void StepExecutor::handle_command(const std_msgs::msg::String::SharedPtr msg) {
    const auto move = move_from_token(msg->data);
    if (!move) {
        RCLCPP_WARN(get_logger(), "Ignoring unknown command '%s'.", msg->data.c_str());
        return;
    }
    RCLCPP_INFO(get_logger(), "Data received: %s", msg->data.c_str());

    // The planner waits for each ack, so more than one pending move means a
    // second planner is talking to this executor.
    if (executing_) {
        RCLCPP_WARN(get_logger(), "Command %s queued behind %zu pending move(s).",
                    msg->data.c_str(), pending_.size());
    }
    pending_.push_back(*move);
    start_next_execution();
}

// --- Execution -------------------------------------------------------------
void StepExecutor::start_next_execution() {
    if (executing_ || pending_.empty()) return;
    executing_ = true;

    if (execution_delay_s_ <= 0.0) {
        finish_execution();
        return;
    }
    const std::chrono::duration<double> delay(execution_delay_s_);
    execution_timer_ = create_wall_timer(delay, std::bind(&StepExecutor::finish_execution, this));
}

void StepExecutor::finish_execution() {
    if (execution_timer_) execution_timer_->cancel();

    const Move move = pending_.front();
    pending_.pop_front();

    if (track_position_ && is_directional(move)) {
        position_ = apply(position_, move);
    }
    if (!is_directional(move)) {
        RCLCPP_INFO(get_logger(), "Goal reported by planner after %zu commands.", executed_ + 1);
    } else if (track_position_) {
        RCLCPP_INFO(get_logger(), "Executed %s, now at %s.", to_token(move),
                    to_string(position_).c_str());
    }

    held_ack_ = std::string(to_token(move)) + " DONE";
    flush_ack();
}

void StepExecutor::flush_ack() {
    if (!held_ack_) return;

    if (ack_pub_->get_subscription_count() == 0) {
        if (!match_timer_) {
            RCLCPP_WARN(get_logger(), "Holding '%s' until a planner subscribes to %s.",
                        held_ack_->c_str(), ack_topic_.c_str());
            match_timer_ =
                create_wall_timer(k_match_poll, std::bind(&StepExecutor::flush_ack, this));
        }
        return;
    }
    if (match_timer_) {
        match_timer_->cancel();
        match_timer_.reset();
    }

    std_msgs::msg::String ack;
    ack.data = *held_ack_;
    held_ack_.reset();
    ack_pub_->publish(ack);
    ++executed_;
    executing_ = false;

    start_next_execution();
}

}  // namespace hnav
