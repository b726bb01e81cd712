// heuristic_planner.cpp
//
// Candidate ordering and move selection for the greedy grid planner.

#include "hnav/heuristic_planner.hpp"

#include <cstdlib>

namespace {
// Move along the row axis toward a target `delta` rows away (zero counts as positive).
hnav::Move row_move(int delta) { return delta < 0 ? hnav::Move::Up : hnav::Move::Down; }

// Move along the column axis toward a target `delta` columns away.
hnav::Move col_move(int delta) { return delta < 0 ? hnav::Move::Left : hnav::Move::Right; }

hnav::Move reverse_of(hnav::Move move) {
    switch (move) {
        case hnav::Move::Up:
            return hnav::Move::Down;
        case hnav::Move::Down:
            return hnav::Move::Up;
        case hnav::Move::Left:
            return hnav::Move::Right;
        case hnav::Move::Right:
            return hnav::Move::Left;
        case hnav::Move::ReachedGoal:
            break;
    }
    return move;
}
}  // namespace

namespace hnav {

const char* to_string(FallbackOrder order) {
    switch (order) {
        case FallbackOrder::ReversePrimaryFirst:
            return "reverse_primary_first";
        case FallbackOrder::ReverseSecondaryFirst:
            return "reverse_secondary_first";
    }
    return "reverse_primary_first";
}

std::optional<FallbackOrder> fallback_order_from_string(const std::string& name) {
    if (name == "reverse_primary_first") return FallbackOrder::ReversePrimaryFirst;
    if (name == "reverse_secondary_first") return FallbackOrder::ReverseSecondaryFirst;
    return std::nullopt;
}

CandidateMoves candidate_moves(int delta_row, int delta_col, FallbackOrder order) {
    // Vertical distance is checked first, so a tie keeps the row axis primary.
    const bool row_primary = std::abs(delta_row) >= std::abs(delta_col);
    const Move primary = row_primary ? row_move(delta_row) : col_move(delta_col);
    const Move secondary = row_primary ? col_move(delta_col) : row_move(delta_row);

    if (order == FallbackOrder::ReverseSecondaryFirst) {
        return {primary, secondary, reverse_of(secondary), reverse_of(primary)};
    }
    return {primary, secondary, reverse_of(primary), reverse_of(secondary)};
}

std::optional<Move> HeuristicPlanner::next_move(const Position& current, const Position& goal,
                                                const TraversableFn& traversable) const {
    if (current == goal) return Move::ReachedGoal;

    const int delta_row = goal.row - current.row;
    const int delta_col = goal.col - current.col;

    for (const Move candidate : candidate_moves(delta_row, delta_col, order_)) {
        if (traversable(apply(current, candidate))) return candidate;
    }
    return std::nullopt;
}

}  // namespace hnav
