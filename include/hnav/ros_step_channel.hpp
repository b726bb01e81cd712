// ros_step_channel.hpp
//
// StepChannel over two ROS 2 topics: move tokens go out as std_msgs/String on
// the command topic, and any std_msgs/String on the ack topic counts as the
// executor's confirmation.

#ifndef HNAV_ROS_STEP_CHANNEL_HPP_
#define HNAV_ROS_STEP_CHANNEL_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "hnav/step_channel.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

namespace hnav {

class RosStepChannel : public StepChannel {
   public:
    struct Options {
        std::string command_topic{"/robot/controller/command"};
        std::string ack_topic{"/robot/controller/ack"};
        // <= 0 waits forever for each acknowledgement.
        std::chrono::duration<double> ack_timeout{0.0};
    };

    // Creates the publisher and the acknowledgement subscription on `node`. The
    // subscription lives in a callback group no executor services, so
    // acknowledgements are only ever consumed by send_and_await().
    RosStepChannel(rclcpp::Node& node, Options options);

    // Block until the executor is matched on both topics. Throws ControllerError on timeout.
    // Matching is observed from this side only; the executor must not publish an
    // ack before its own writer has matched (hnav::StepExecutor holds it).
    void connect(std::chrono::duration<double> timeout);

    StepAck send_and_await(Move move) override;

   private:
    void drain_stale_acks();

    Options options_;
    rclcpp::Logger logger_;
    rclcpp::Context::SharedPtr context_;
    rclcpp::CallbackGroup::SharedPtr ack_group_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr command_pub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr ack_sub_;
};

}  // namespace hnav

#endif  // HNAV_ROS_STEP_CHANNEL_HPP_
