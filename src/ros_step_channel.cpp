// ros_step_channel.cpp
//
// Topic-based step exchange with the external executor.

#include "hnav/ros_step_channel.hpp"

#include <string>
#include <utility>

#include "hnav/errors.hpp"
#include "rclcpp/wait_for_message.hpp"

namespace {
// Reliable, ordered delivery; a handful of messages is plenty for a lock-step exchange.
rclcpp::QoS step_qos() { return rclcpp::QoS(rclcpp::KeepLast(10)).reliable(); }

// Sleep between graph polls while waiting for the executor to appear.
constexpr std::chrono::milliseconds k_connect_poll{100};
}  // namespace

namespace hnav {

RosStepChannel::RosStepChannel(rclcpp::Node& node, Options options)
    : options_(std::move(options)),
      logger_(node.get_logger().get_child("step_channel")),
      context_(node.get_node_base_interface()->get_context()) {
    ack_group_ = node.create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive, false);

    rclcpp::SubscriptionOptions sub_options;
    sub_options.callback_group = ack_group_;
    ack_sub_ = node.create_subscription<std_msgs::msg::String>(
        options_.ack_topic, step_qos(), [](const std_msgs::msg::String::SharedPtr) {},
        sub_options);
    command_pub_ = node.create_publisher<std_msgs::msg::String>(options_.command_topic, step_qos());

    const std::string timeout_text = options_.ack_timeout.count() > 0.0
                                         ? std::to_string(options_.ack_timeout.count()) + " s"
                                         : std::string("none");
    RCLCPP_INFO(logger_, "Step channel: commands -> %s, acks <- %s (ack timeout %s).",
                options_.command_topic.c_str(), options_.ack_topic.c_str(), timeout_text.c_str());
}

void RosStepChannel::connect(std::chrono::duration<double> timeout) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
    RCLCPP_INFO(logger_, "Waiting for executor on %s / %s ...", options_.command_topic.c_str(),
                options_.ack_topic.c_str());

    while (rclcpp::ok(context_)) {
        if (command_pub_->get_subscription_count() > 0 && ack_sub_->get_publisher_count() > 0) {
            RCLCPP_INFO(logger_, "Executor connected.");
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ControllerError("no executor connected to " + options_.command_topic + " / " +
                                  options_.ack_topic + " within " +
                                  std::to_string(timeout.count()) + " s");
        }
        rclcpp::sleep_for(k_connect_poll, context_);
    }
    throw ControllerError("shutdown requested while waiting for the executor");
}

StepAck RosStepChannel::send_and_await(Move move) {
    if (!rclcpp::ok(context_)) {
        throw ControllerError("ROS context is shut down");
    }
    if (command_pub_->get_subscription_count() == 0) {
        throw ControllerError("executor disconnected from " + options_.command_topic);
    }

    // An ack must answer the command sent below, never an earlier one.
    drain_stale_acks();

    std_msgs::msg::String command;
    command.data = to_token(move);
    try {
        command_pub_->publish(command);
    } catch (const rclcpp::exceptions::RCLError& e) {
        throw ControllerError(std::string("failed to publish ") + command.data + ": " + e.what());
    }

    using std::chrono::nanoseconds;
    const auto wait = options_.ack_timeout.count() > 0.0
                          ? std::chrono::duration_cast<nanoseconds>(options_.ack_timeout)
                          : nanoseconds(-1);
    std_msgs::msg::String reply;
    if (!rclcpp::wait_for_message(reply, ack_sub_, context_, wait)) {
        if (!rclcpp::ok(context_)) {
            throw ControllerError(std::string("shutdown while awaiting ack for ") + command.data);
        }
        throw ControllerError(std::string("no ack for ") + command.data + " within " +
                              std::to_string(options_.ack_timeout.count()) + " s");
    }

    RCLCPP_INFO(logger_, "Response: %s", reply.data.c_str());
    return {move, reply.data};
}

void RosStepChannel::drain_stale_acks() {
    std_msgs::msg::String stale;
    rclcpp::MessageInfo info;
    while (ack_sub_->take(stale, info)) {
        RCLCPP_WARN(logger_, "Discarding unsolicited ack '%s'.", stale.data.c_str());
    }
}

}  // namespace hnav
