// hnav_planner_node.cpp
//
// ROS 2 node that loads a CSV occupancy grid, walks it from start to goal with
// the greedy heuristic planner and, when enabled, streams every move to an
// external controller, waiting for its acknowledgement before the next step.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "geometry_msgs/msg/pose_stamped.hpp"
#include "hnav/errors.hpp"
#include "hnav/grid.hpp"
#include "hnav/grid_loader.hpp"
#include "hnav/heuristic_planner.hpp"
#include "hnav/msg/route_summary.hpp"
#include "hnav/ros_step_channel.hpp"
#include "hnav/route_driver.hpp"
#include "nav_msgs/msg/occupancy_grid.hpp"
#include "nav_msgs/msg/path.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/header.hpp"
#include "visualization_msgs/msg/marker_array.hpp"

namespace {
// Namespace string shared by every marker the planner publishes for RViz.
constexpr char k_marker_namespace[] = "hnav_planner";

// Occupancy values used when publishing the grid.
constexpr int8_t k_free_value = 0;
constexpr int8_t k_visited_value = 30;
constexpr int8_t k_occupied_value = 100;
}  // namespace

// ROS 2 node that hosts one heuristic planning run over a map file.
class HnavPlanner : public rclcpp::Node {
   public:
    // Declare parameters, wire publishers and the optional step channel.
    HnavPlanner() : rclcpp::Node("hnav_planner") {
        declare_parameters();
        init_publishers();
        init_driver();

        RCLCPP_INFO(get_logger(),
                    "hnav_planner ready. map:%s start:%s goal:%s fallback:%s controller:%s",
                    map_path_.c_str(), hnav::to_string(start_).c_str(),
                    hnav::to_string(goal_).c_str(), hnav::to_string(planner_->fallback_order()),
                    controller_enabled_ ? "enabled" : "disabled");
    }

    // Load the map, run the planner once and publish the outcome.
    // Returns true only when the goal was reached.
    bool run() {
        hnav::Grid grid;
        try {
            grid = hnav::load_grid_csv(map_path_);
            grid.set_endpoints(start_, goal_);
        } catch (const hnav::GridFormatError& e) {
            RCLCPP_ERROR(get_logger(), "Error loading map: %s", e.what());
            return false;
        } catch (const hnav::OutOfBoundsError& e) {
            RCLCPP_ERROR(get_logger(), "Error location out of the map: %s", e.what());
            return false;
        } catch (const hnav::InvalidTransitionError& e) {
            RCLCPP_ERROR(get_logger(), "Error location is not available: %s", e.what());
            return false;
        }

        RCLCPP_INFO(get_logger(), "Map %s: %dx%d cells, %zu occupied.", map_path_.c_str(),
                    grid.rows(), grid.cols(), grid.count(hnav::CellStatus::Occupied));
        RCLCPP_INFO(get_logger(), "Init coordinates: %s  Goal coordinates: %s",
                    hnav::to_string(start_).c_str(), hnav::to_string(goal_).c_str());
        if (log_map_) {
            RCLCPP_INFO(get_logger(), "Map:\n%s", grid.render().c_str());
        }
        publish_grid(grid);

        if (step_channel_) {
            try {
                step_channel_->connect(connect_timeout_);
            } catch (const hnav::ControllerError& e) {
                RCLCPP_ERROR(get_logger(), "Controller not available: %s", e.what());
                return false;
            }
        }

        const hnav::RouteResult result = driver_->plan(grid, start_, goal_);
        report(result);
        return result.ok();
    }

    bool keep_alive() const { return keep_alive_; }

   private:
    // --- Parameter loading -------------------------------------------------
    void declare_parameters() {
        // Map and endpoints
        const std::string map_dir = declare_parameter<std::string>("map_dir", "maps");
        const std::string map_name = declare_parameter<std::string>("map_name", "map11.csv");
        map_path_ = (std::filesystem::path(map_dir) / map_name).string();

        start_ = position_parameter("start", start_);
        goal_ = position_parameter("goal", goal_);

        const std::string order = declare_parameter<std::string>(
            "fallback_order", hnav::to_string(hnav::FallbackOrder::ReversePrimaryFirst));
        if (const auto parsed = hnav::fallback_order_from_string(order)) {
            fallback_order_ = *parsed;
        } else {
            RCLCPP_WARN(get_logger(), "Unknown fallback_order '%s'; using %s.", order.c_str(),
                        hnav::to_string(fallback_order_));
        }

        // Controller link
        controller_enabled_ = declare_parameter("controller_enabled", false);
        command_topic_ =
            declare_parameter<std::string>("command_topic", "/robot/controller/command");
        ack_topic_ = declare_parameter<std::string>("ack_topic", "/robot/controller/ack");
        connect_timeout_ =
            std::chrono::duration<double>(declare_parameter("connect_timeout_s", 10.0));
        ack_timeout_ = std::chrono::duration<double>(declare_parameter("ack_timeout_s", 0.0));

        // Outputs
        map_frame_ = declare_parameter<std::string>("map_frame", "map");
        cell_size_ = declare_parameter("cell_size", 1.0);
        map_topic_ = declare_parameter<std::string>("map_topic", "/hnav/map");
        path_topic_ = declare_parameter<std::string>("path_topic", "/hnav/path");
        summary_topic_ = declare_parameter<std::string>("summary_topic", "/hnav/route_summary");
        debug_markers_ = declare_parameter("debug_markers", true);
        marker_topic_ = declare_parameter<std::string>("marker_topic", "/hnav/path_markers");
        log_map_ = declare_parameter("log_map", false);
        keep_alive_ = declare_parameter("keep_alive", false);

        if (cell_size_ <= 0.0) {
            RCLCPP_WARN(get_logger(), "cell_size must be > 0; using 1.0.");
            cell_size_ = 1.0;
        }
    }

    // [row, col] list parameter; keeps `fallback` when the value is malformed.
    hnav::Position position_parameter(const std::string& name, const hnav::Position& fallback) {
        const auto values = declare_parameter<std::vector<int64_t>>(
            name, {static_cast<int64_t>(fallback.row), static_cast<int64_t>(fallback.col)});
        if (const auto position = hnav::position_from_values(values)) {
            return *position;
        }
        RCLCPP_WARN(get_logger(), "%s must be [row, col] with int-sized values; using %s.",
                    name.c_str(), hnav::to_string(fallback).c_str());
        return fallback;
    }

    // --- ROS interface wiring ----------------------------------------------
    void init_publishers() {
        grid_pub_ = create_publisher<nav_msgs::msg::OccupancyGrid>(
            map_topic_, rclcpp::QoS(1).transient_local());
        path_pub_ = create_publisher<nav_msgs::msg::Path>(path_topic_,
                                                          rclcpp::QoS(1).transient_local());
        summary_pub_ = create_publisher<hnav::msg::RouteSummary>(
            summary_topic_, rclcpp::QoS(1).transient_local());
        if (debug_markers_) {
            marker_pub_ = create_publisher<visualization_msgs::msg::MarkerArray>(
                marker_topic_, rclcpp::QoS(1).transient_local());
            RCLCPP_INFO(get_logger(), "Debug markers enabled on %s.", marker_topic_.c_str());
        }
    }

    void init_driver() {
        planner_ = std::make_shared<hnav::HeuristicPlanner>(fallback_order_);
        driver_ = std::make_unique<hnav::RouteDriver>(get_logger(), planner_);
        driver_->set_step_observer(
            [this](const hnav::RouteEntry& entry, std::size_t step, const hnav::Grid& grid) {
                on_step(entry, step, grid);
            });

        if (controller_enabled_) {
            hnav::RosStepChannel::Options options;
            options.command_topic = command_topic_;
            options.ack_topic = ack_topic_;
            options.ack_timeout = ack_timeout_;
            step_channel_ = std::make_shared<hnav::RosStepChannel>(*this, options);
            driver_->set_step_channel(step_channel_);
        }
    }

    // --- Progress / results -------------------------------------------------
    // Log the command of every step and refresh the published grid.
    void on_step(const hnav::RouteEntry& entry, std::size_t step, const hnav::Grid& grid) {
        if (entry.move == hnav::Move::ReachedGoal) {
            RCLCPP_INFO(get_logger(), "Goal achieved at %s.",
                        hnav::to_string(entry.position).c_str());
        } else {
            RCLCPP_INFO(get_logger(), "Step %zu: command %s -> %s", step,
                        hnav::to_token(entry.move), hnav::to_string(entry.position).c_str());
        }
        if (log_map_) {
            RCLCPP_INFO(get_logger(), "Map:\n%s", grid.render().c_str());
        }
        publish_grid(grid);
    }

    // Publish the final route and log the run summary.
    void report(const hnav::RouteResult& result) {
        publish_grid(result.grid);
        const nav_msgs::msg::Path path = route_to_path(result);
        path_pub_->publish(path);
        publish_summary(result);

        if (result.route.empty()) {
            clear_debug_markers();
        } else {
            publish_debug_markers(path);
        }

        const double ms = std::chrono::duration<double, std::milli>(result.elapsed).count();
        switch (result.status) {
            case hnav::RouteStatus::Completed:
                RCLCPP_INFO(get_logger(), "Goal achieved in %zu steps (%.3f ms).", result.steps,
                            ms);
                break;
            case hnav::RouteStatus::StepLimitReached:
                RCLCPP_WARN(get_logger(), "Goal not achieved, limit steps: %s.",
                            result.reason.c_str());
                break;
            default:
                RCLCPP_ERROR(get_logger(), "Planning %s after %zu steps at %s: %s",
                             hnav::to_string(result.status), result.steps,
                             hnav::to_string(result.final_position).c_str(),
                             result.reason.c_str());
                break;
        }
        RCLCPP_INFO(get_logger(), "Resume: status=%s steps=%zu elapsed=%.3f ms",
                    hnav::to_string(result.status), result.steps, ms);
    }

    // Convert the grid into an OccupancyGrid; row r is stored at y = r.
    void publish_grid(const hnav::Grid& grid) {
        nav_msgs::msg::OccupancyGrid msg;
        msg.header.stamp = now();
        msg.header.frame_id = map_frame_;
        msg.info.map_load_time = msg.header.stamp;
        msg.info.resolution = static_cast<float>(cell_size_);
        msg.info.width = static_cast<uint32_t>(grid.cols());
        msg.info.height = static_cast<uint32_t>(grid.rows());
        msg.info.origin.orientation.w = 1.0;
        msg.data.reserve(grid.size());
        for (int r = 0; r < grid.rows(); ++r) {
            for (int c = 0; c < grid.cols(); ++c) {
                switch (grid.status_at({r, c})) {
                    case hnav::CellStatus::Occupied:
                        msg.data.push_back(k_occupied_value);
                        break;
                    case hnav::CellStatus::Visited:
                        msg.data.push_back(k_visited_value);
                        break;
                    default:
                        msg.data.push_back(k_free_value);
                        break;
                }
            }
        }
        grid_pub_->publish(msg);
    }

    // Start pose followed by one pose per route entry, at cell centres.
    nav_msgs::msg::Path route_to_path(const hnav::RouteResult& result) const {
        nav_msgs::msg::Path path;
        path.header.stamp = now();
        path.header.frame_id = map_frame_;
        if (result.status == hnav::RouteStatus::OutOfBounds) return path;

        path.poses.reserve(result.route.size() + 1);
        path.poses.push_back(cell_pose(result.start, path.header));
        for (const auto& entry : result.route) {
            if (entry.move == hnav::Move::ReachedGoal) continue;
            path.poses.push_back(cell_pose(entry.position, path.header));
        }
        return path;
    }

    geometry_msgs::msg::PoseStamped cell_pose(const hnav::Position& p,
                                              const std_msgs::msg::Header& header) const {
        geometry_msgs::msg::PoseStamped pose;
        pose.header = header;
        pose.pose.position.x = (static_cast<double>(p.col) + 0.5) * cell_size_;
        pose.pose.position.y = (static_cast<double>(p.row) + 0.5) * cell_size_;
        pose.pose.orientation.w = 1.0;
        return pose;
    }

    void publish_summary(const hnav::RouteResult& result) {
        hnav::msg::RouteSummary msg;
        msg.status = hnav::to_string(result.status);
        msg.steps = static_cast<uint32_t>(result.steps);
        msg.elapsed_s = result.elapsed.count();
        msg.start_row = result.start.row;
        msg.start_col = result.start.col;
        msg.goal_row = result.goal.row;
        msg.goal_col = result.goal.col;
        msg.final_row = result.final_position.row;
        msg.final_col = result.final_position.col;
        msg.commands.reserve(result.route.size());
        for (const auto& entry : result.route) {
            msg.commands.emplace_back(hnav::to_token(entry.move));
        }
        msg.reason = result.reason;
        summary_pub_->publish(msg);
    }

    // --- Debug markers ---
    static visualization_msgs::msg::Marker make_marker(const std_msgs::msg::Header& header, int id,
                                                       int32_t type, float r, float g, float b,
                                                       float a) {
        visualization_msgs::msg::Marker m;
        m.header = header;
        m.ns = k_marker_namespace;
        m.id = id;
        m.type = type;
        m.action = visualization_msgs::msg::Marker::ADD;
        m.pose.orientation.w = 1.0;
        m.color.r = r;
        m.color.g = g;
        m.color.b = b;
        m.color.a = a;
        return m;
    }

    // Route as a line strip over cell tiles, with the first and last cell as spheres.
    void publish_debug_markers(const nav_msgs::msg::Path& path) {
        if (!marker_pub_ || path.poses.empty()) return;
        using visualization_msgs::msg::Marker;

        visualization_msgs::msg::MarkerArray arr;
        Marker clear;
        clear.header = path.header;
        clear.ns = k_marker_namespace;
        clear.action = Marker::DELETEALL;
        arr.markers.push_back(clear);

        auto line = make_marker(path.header, 1, Marker::LINE_STRIP, 0.0F, 1.0F, 0.3F, 1.0F);
        line.scale.x = 0.15 * cell_size_;
        auto tiles = make_marker(path.header, 2, Marker::CUBE_LIST, 0.2F, 0.8F, 1.0F, 0.6F);
        tiles.scale.x = tiles.scale.y = 0.6 * cell_size_;
        tiles.scale.z = 0.05 * cell_size_;
        for (const auto& pose : path.poses) {
            line.points.push_back(pose.pose.position);
            tiles.points.push_back(pose.pose.position);
        }
        arr.markers.push_back(line);
        arr.markers.push_back(tiles);

        auto first = make_marker(path.header, 3, Marker::SPHERE, 0.0F, 0.4F, 1.0F, 0.9F);
        first.pose.position = path.poses.front().pose.position;
        first.scale.x = first.scale.y = first.scale.z = 0.7 * cell_size_;
        arr.markers.push_back(first);

        // Goal on success, the stall point otherwise.
        auto last = make_marker(path.header, 4, Marker::SPHERE, 1.0F, 0.2F, 0.1F, 0.9F);
        last.pose.position = path.poses.back().pose.position;
        last.scale.x = last.scale.y = last.scale.z = 0.8 * cell_size_;
        arr.markers.push_back(last);

        marker_pub_->publish(arr);
    }

    void clear_debug_markers() {
        if (!marker_pub_) return;
        visualization_msgs::msg::MarkerArray arr;
        visualization_msgs::msg::Marker clear;
        clear.header.frame_id = map_frame_;
        clear.header.stamp = now();
        clear.ns = k_marker_namespace;
        clear.action = visualization_msgs::msg::Marker::DELETEALL;
        arr.markers.push_back(clear);
        marker_pub_->publish(arr);
    }

    // --- Members ---
    // Occupancy grid with the route drawn in, refreshed every step.
    rclcpp::Publisher<nav_msgs::msg::OccupancyGrid>::SharedPtr grid_pub_;
    // Publisher for the planned route.
    rclcpp::Publisher<nav_msgs::msg::Path>::SharedPtr path_pub_;
    // Run outcome.
    rclcpp::Publisher<hnav::msg::RouteSummary>::SharedPtr summary_pub_;
    // Optional publisher for RViz visualisation.
    rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr marker_pub_;

    std::shared_ptr<hnav::HeuristicPlanner> planner_;
    std::unique_ptr<hnav::RouteDriver> driver_;
    // Set only when controller_enabled is true.
    std::shared_ptr<hnav::RosStepChannel> step_channel_;

    // params
    std::string map_path_;                         // map_dir/map_name
    hnav::Position start_{2, 2};                   // (row, col)
    hnav::Position goal_{21, 19};                  // (row, col)
    hnav::FallbackOrder fallback_order_{hnav::FallbackOrder::ReversePrimaryFirst};
    bool controller_enabled_{false};               // Stream moves to the external controller.
    std::string command_topic_;                    // "to controller"
    std::string ack_topic_;                        // "from controller"
    std::chrono::duration<double> connect_timeout_{10.0};
    std::chrono::duration<double> ack_timeout_{0.0};  // <= 0 blocks until acknowledged.
    std::string map_frame_{"map"};                 // Output frame id.
    double cell_size_{1.0};                        // Metres per cell in published outputs.
    std::string map_topic_;
    std::string path_topic_;
    std::string summary_topic_;
    bool debug_markers_{true};                     // Whether to publish RViz markers.
    std::string marker_topic_;                     // MarkerArray output topic.
    bool log_map_{false};                          // Log the rendered map every step.
    bool keep_alive_{false};                       // Spin after the run.
};

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    auto node = std::make_shared<HnavPlanner>();
    const bool ok = node->run();
    if (node->keep_alive()) {
        rclcpp::spin(node);
    }
    rclcpp::shutdown();
    return ok ? 0 : 1;
}
