// heuristic_planner.hpp
//
// Greedy axis-priority decision rule. Each call looks only at the current cell,
// the goal and a traversability predicate; all route history lives in the
// predicate supplied by the caller.

#ifndef HNAV_HEURISTIC_PLANNER_HPP_
#define HNAV_HEURISTIC_PLANNER_HPP_

#include <array>
#include <functional>
#include <optional>
#include <string>

#include "hnav/types.hpp"

namespace hnav {

// Which reversal is tried first once both moves toward the goal are blocked.
enum class FallbackOrder {
    ReversePrimaryFirst,    // primary, secondary, -primary, -secondary
    ReverseSecondaryFirst,  // primary, secondary, -secondary, -primary
};

const char* to_string(FallbackOrder order);

// Accepts "reverse_primary_first" and "reverse_secondary_first".
std::optional<FallbackOrder> fallback_order_from_string(const std::string& name);

using CandidateMoves = std::array<Move, 4>;

// Ordered candidates for a remaining distance of (delta_row, delta_col). The row
// axis is primary when |delta_row| >= |delta_col|. A zero delta counts as
// positive (Down / Right).
CandidateMoves candidate_moves(int delta_row, int delta_col,
                               FallbackOrder order = FallbackOrder::ReversePrimaryFirst);

// Source of route decisions for the route driver.
class MovePlanner {
   public:
    using TraversableFn = std::function<bool(const Position&)>;

    virtual ~MovePlanner() = default;

    // ReachedGoal when current == goal, otherwise a directional move into a
    // traversable cell. Empty when no move is possible (deadlock).
    virtual std::optional<Move> next_move(const Position& current, const Position& goal,
                                          const TraversableFn& traversable) const = 0;
};

class HeuristicPlanner : public MovePlanner {
   public:
    explicit HeuristicPlanner(FallbackOrder order = FallbackOrder::ReversePrimaryFirst)
        : order_(order) {}

    // First candidate whose target cell is traversable.
    std::optional<Move> next_move(const Position& current, const Position& goal,
                                  const TraversableFn& traversable) const override;

    FallbackOrder fallback_order() const { return order_; }

   private:
    FallbackOrder order_;
};

}  // namespace hnav

#endif  // HNAV_HEURISTIC_PLANNER_HPP_
