// route_driver.hpp
//
// Step loop that repeatedly asks the heuristic planner for a move, records the
// route, marks cells visited and, when a step channel is attached, waits for
// the executor to confirm each move before planning the next one.

#ifndef HNAV_ROUTE_DRIVER_HPP_
#define HNAV_ROUTE_DRIVER_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hnav/grid.hpp"
#include "hnav/heuristic_planner.hpp"
#include "hnav/step_channel.hpp"
#include "hnav/types.hpp"
#include "rclcpp/logger.hpp"

namespace hnav {

// Driver life cycle. Idle until plan() is called; the last five are terminal.
enum class DriverState {
    Idle,
    Stepping,
    AwaitingAck,
    Completed,
    Deadlocked,
    ControllerFailed,
    OutOfBounds,
    StepLimitReached,
};

// How a planning run ended.
enum class RouteStatus { Completed, Deadlocked, ControllerFailed, OutOfBounds, StepLimitReached };

const char* to_string(DriverState state);
const char* to_string(RouteStatus status);

// Cell entered by the route and the move that entered it. The terminal entry
// holds the goal position and Move::ReachedGoal.
struct RouteEntry {
    Position position;
    Move move{Move::ReachedGoal};
};

using Route = std::vector<RouteEntry>;

struct RouteResult {
    RouteStatus status{RouteStatus::Completed};
    Route route;                  // start excluded, goal included on success
    Position start;
    Position goal;
    Position final_position;      // where the run stopped; the stalled cell on deadlock
    std::size_t steps{0};         // directional moves taken
    std::chrono::duration<double> elapsed{0.0};
    std::string reason;           // empty on success
    Grid grid;                    // the run's grid with its Visited marks

    bool ok() const { return status == RouteStatus::Completed; }
};

class RouteDriver {
   public:
    // Called after each route entry is appended, before any acknowledgement wait.
    using StepObserver =
        std::function<void(const RouteEntry& entry, std::size_t step, const Grid& grid)>;

    explicit RouteDriver(const rclcpp::Logger& logger,
                         std::shared_ptr<const MovePlanner> planner =
                             std::make_shared<HeuristicPlanner>());

    // nullptr disables the acknowledgement exchange.
    void set_step_channel(std::shared_ptr<StepChannel> channel) { channel_ = std::move(channel); }
    void set_step_observer(StepObserver observer) { observer_ = std::move(observer); }

    // Plan on a private copy of `grid`, so repeated calls with the same inputs are
    // independent and yield the same route. Deadlock, controller failure and
    // out-of-bounds endpoints are reported through RouteResult::status;
    // InvalidTransitionError (occupied endpoint) propagates.
    RouteResult plan(const Grid& grid, const Position& start, const Position& goal);

    DriverState state() const { return state_; }

   private:
    // Runs one acknowledgement exchange; records the failure in `result` and
    // returns false when the channel throws.
    bool exchange(Move move, RouteResult& result);
    void finish(RouteResult& result, RouteStatus status,
                std::chrono::steady_clock::time_point t0);

    rclcpp::Logger logger_;
    std::shared_ptr<const MovePlanner> planner_;
    std::shared_ptr<StepChannel> channel_;
    StepObserver observer_;
    DriverState state_{DriverState::Idle};
};

}  // namespace hnav

#endif  // HNAV_ROUTE_DRIVER_HPP_
