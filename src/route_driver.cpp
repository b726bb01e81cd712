// route_driver.cpp
//
// Step loop around the heuristic planner. Owns the route, the visited set and
// the per-run grid copy, and keeps the external executor in lock-step.

#include "hnav/route_driver.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "hnav/errors.hpp"
#include "rclcpp/logging.hpp"

namespace hnav {

const char* to_string(DriverState state) {
    switch (state) {
        case DriverState::Idle:
            return "idle";
        case DriverState::Stepping:
            return "stepping";
        case DriverState::AwaitingAck:
            return "awaiting_ack";
        case DriverState::Completed:
            return "completed";
        case DriverState::Deadlocked:
            return "deadlocked";
        case DriverState::ControllerFailed:
            return "controller_failed";
        case DriverState::OutOfBounds:
            return "out_of_bounds";
        case DriverState::StepLimitReached:
            return "step_limit_reached";
    }
    return "unknown";
}

const char* to_string(RouteStatus status) {
    switch (status) {
        case RouteStatus::Completed:
            return "completed";
        case RouteStatus::Deadlocked:
            return "deadlocked";
        case RouteStatus::ControllerFailed:
            return "controller_failed";
        case RouteStatus::OutOfBounds:
            return "out_of_bounds";
        case RouteStatus::StepLimitReached:
            return "step_limit_reached";
    }
    return "unknown";
}

RouteDriver::RouteDriver(const rclcpp::Logger& logger,
                         std::shared_ptr<const MovePlanner> planner)
    : logger_(logger), planner_(std::move(planner)) {
    if (!planner_) {
        throw std::invalid_argument("RouteDriver requires a planner");
    }
}

RouteResult RouteDriver::plan(const Grid& grid, const Position& start, const Position& goal) {
    const auto t0 = std::chrono::steady_clock::now();
    state_ = DriverState::Idle;

    RouteResult result;
    result.start = start;
    result.goal = goal;
    result.final_position = start;
    result.grid = grid;

    if (!grid.contains(start) || !grid.contains(goal)) {
        const Position& bad = grid.contains(start) ? goal : start;
        result.reason = OutOfBoundsError(bad, grid.rows(), grid.cols()).what();
        RCLCPP_WARN(logger_, "Cannot plan: %s.", result.reason.c_str());
        finish(result, RouteStatus::OutOfBounds, t0);
        return result;
    }

    Grid& work = result.grid;
    work.set_endpoints(start, goal);

    std::unordered_set<Position, PositionHash> visited{start};
    auto traversable = [&work, &visited](const Position& p) {
        return work.is_traversable(p) && visited.count(p) == 0;
    };

    Position current = start;
    // Every iteration either enters a new cell or terminates, so the cell count
    // bounds a healthy run.
    for (std::size_t iteration = 0; iteration < work.size(); ++iteration) {
        state_ = DriverState::Stepping;

        const auto move = planner_->next_move(current, goal, traversable);
        if (!move) {
            result.reason = "no traversable neighbour at " + to_string(current);
            RCLCPP_WARN(logger_, "Deadlock at %s after %zu steps.", to_string(current).c_str(),
                        result.steps);
            finish(result, RouteStatus::Deadlocked, t0);
            return result;
        }

        if (!is_directional(*move)) {
            result.route.push_back({current, Move::ReachedGoal});
            if (observer_) observer_(result.route.back(), result.steps, work);
            if (channel_ && !exchange(Move::ReachedGoal, result)) {
                finish(result, RouteStatus::ControllerFailed, t0);
                return result;
            }
            finish(result, RouteStatus::Completed, t0);
            return result;
        }

        const Position next = apply(current, *move);
        result.route.push_back({next, *move});
        work.mark_visited(next);
        visited.insert(next);
        current = next;
        result.final_position = current;
        ++result.steps;

        RCLCPP_DEBUG(logger_, "Step %zu: %s -> %s", result.steps, to_token(*move),
                     to_string(current).c_str());
        if (observer_) observer_(result.route.back(), result.steps, work);

        if (channel_ && !exchange(*move, result)) {
            finish(result, RouteStatus::ControllerFailed, t0);
            return result;
        }
    }

    result.reason = "step limit of " + std::to_string(work.size()) + " reached at " +
                    to_string(current);
    RCLCPP_WARN(logger_, "Goal not achieved: %s.", result.reason.c_str());
    finish(result, RouteStatus::StepLimitReached, t0);
    return result;
}

bool RouteDriver::exchange(Move move, RouteResult& result) {
    state_ = DriverState::AwaitingAck;
    try {
        const StepAck ack = channel_->send_and_await(move);
        RCLCPP_DEBUG(logger_, "Executor acknowledged %s: '%s'", to_token(move),
                     ack.payload.c_str());
    } catch (const ControllerError& e) {
        result.reason = std::string("controller failed on ") + to_token(move) + " at " +
                        to_string(result.final_position) + ": " + e.what();
        RCLCPP_ERROR(logger_, "%s", result.reason.c_str());
        return false;
    }
    return true;
}

void RouteDriver::finish(RouteResult& result, RouteStatus status,
                         std::chrono::steady_clock::time_point t0) {
    result.status = status;
    result.elapsed = std::chrono::steady_clock::now() - t0;
    switch (status) {
        case RouteStatus::Completed:
            state_ = DriverState::Completed;
            break;
        case RouteStatus::Deadlocked:
            state_ = DriverState::Deadlocked;
            break;
        case RouteStatus::ControllerFailed:
            state_ = DriverState::ControllerFailed;
            break;
        case RouteStatus::OutOfBounds:
            state_ = DriverState::OutOfBounds;
            break;
        case RouteStatus::StepLimitReached:
            state_ = DriverState::StepLimitReached;
            break;
    }
}

}  // namespace hnav
