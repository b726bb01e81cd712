// test_ros_step_channel.cpp
//
// Topic exchange between RosStepChannel and an in-process StepExecutor.

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "hnav/errors.hpp"
#include "hnav/ros_step_channel.hpp"
#include "hnav/step_executor.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

using namespace std::chrono_literals;

namespace {
hnav::RosStepChannel::Options options_for(const std::string& suffix) {
    hnav::RosStepChannel::Options options;
    options.command_topic = "/hnav_test/" + suffix + "/command";
    options.ack_topic = "/hnav_test/" + suffix + "/ack";
    options.ack_timeout = 5s;
    return options;
}

std::shared_ptr<hnav::StepExecutor> make_executor(const hnav::RosStepChannel::Options& options) {
    rclcpp::NodeOptions node_options;
    node_options.parameter_overrides({
        {"command_topic", options.command_topic},
        {"ack_topic", options.ack_topic},
        {"start", std::vector<int64_t>{0, 0}},
    });
    return std::make_shared<hnav::StepExecutor>(node_options);
}

// Subscribes to commands and advertises the ack topic, but never answers.
class SilentController : public rclcpp::Node {
   public:
    explicit SilentController(const hnav::RosStepChannel::Options& options)
        : Node("hnav_test_silent_controller") {
        const auto qos = rclcpp::QoS(rclcpp::KeepLast(10)).reliable();
        ack_pub_ = create_publisher<std_msgs::msg::String>(options.ack_topic, qos);
        command_sub_ = create_subscription<std_msgs::msg::String>(
            options.command_topic, qos, [](const std_msgs::msg::String::SharedPtr) {});
    }

   private:
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr ack_pub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr command_sub_;
};

// Spins `node` on a background thread for the lifetime of the object.
class BackgroundSpinner {
   public:
    explicit BackgroundSpinner(const rclcpp::Node::SharedPtr& node) {
        executor_.add_node(node);
        thread_ = std::thread([this]() { executor_.spin(); });
    }
    ~BackgroundSpinner() {
        executor_.cancel();
        thread_.join();
    }

   private:
    rclcpp::executors::SingleThreadedExecutor executor_;
    std::thread thread_;
};
}  // namespace

class RosStepChannelTest : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
    static void TearDownTestSuite() { rclcpp::shutdown(); }
};

TEST_F(RosStepChannelTest, ConnectTimesOutWithoutExecutor) {
    auto node = std::make_shared<rclcpp::Node>("hnav_test_lonely_planner");
    hnav::RosStepChannel channel(*node, options_for("lonely"));
    EXPECT_THROW(channel.connect(300ms), hnav::ControllerError);
}

TEST_F(RosStepChannelTest, SendWithoutExecutorFails) {
    auto node = std::make_shared<rclcpp::Node>("hnav_test_unmatched_planner");
    hnav::RosStepChannel channel(*node, options_for("unmatched"));
    EXPECT_THROW(channel.send_and_await(hnav::Move::Up), hnav::ControllerError);
}

TEST_F(RosStepChannelTest, BoundedAckWaitFailsWhenControllerNeverAnswers) {
    auto options = options_for("silent");
    options.ack_timeout = 300ms;
    auto planner = std::make_shared<rclcpp::Node>("hnav_test_waiting_planner");
    auto controller = std::make_shared<SilentController>(options);
    BackgroundSpinner spinner(controller);

    hnav::RosStepChannel channel(*planner, options);
    channel.connect(5s);
    try {
        channel.send_and_await(hnav::Move::Up);
        FAIL() << "expected ControllerError";
    } catch (const hnav::ControllerError& e) {
        EXPECT_NE(std::string(e.what()).find("no ack for UP"), std::string::npos) << e.what();
    }
}

TEST_F(RosStepChannelTest, ExchangesCommandAndAck) {
    const auto options = options_for("paired");
    auto planner = std::make_shared<rclcpp::Node>("hnav_test_planner");
    auto executor = make_executor(options);
    BackgroundSpinner spinner(executor);

    hnav::RosStepChannel channel(*planner, options);
    channel.connect(5s);

    const auto first = channel.send_and_await(hnav::Move::Up);
    EXPECT_EQ(first.move, hnav::Move::Up);
    EXPECT_EQ(first.payload, "UP DONE");

    const auto second = channel.send_and_await(hnav::Move::ReachedGoal);
    EXPECT_EQ(second.payload, "GOAL DONE");
}

TEST_F(RosStepChannelTest, ExecutorStartedAfterConnectBeginsStillAnswersFirstStep) {
    const auto options = options_for("late");
    auto planner = std::make_shared<rclcpp::Node>("hnav_test_early_planner");
    hnav::RosStepChannel channel(*planner, options);

    auto connected = std::async(std::launch::async, [&channel]() { channel.connect(10s); });
    std::this_thread::sleep_for(200ms);
    auto executor = make_executor(options);
    BackgroundSpinner spinner(executor);
    connected.get();

    // Sent right after the planner side matched, before the executor's ack
    // writer is known to have matched the planner's subscription.
    const auto ack = channel.send_and_await(hnav::Move::Right);
    EXPECT_EQ(ack.payload, "RIGHT DONE");

    const auto goal = channel.send_and_await(hnav::Move::ReachedGoal);
    EXPECT_EQ(goal.payload, "GOAL DONE");
}
