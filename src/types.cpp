// types.cpp
//
// Move tokens and small helpers over positions and cell states.

#include "hnav/types.hpp"

#include <limits>

namespace hnav {

const char* to_token(Move move) {
    switch (move) {
        case Move::Up:
            return "UP";
        case Move::Down:
            return "DOWN";
        case Move::Left:
            return "LEFT";
        case Move::Right:
            return "RIGHT";
        case Move::ReachedGoal:
            return "GOAL";
    }
    return "GOAL";
}

std::optional<Move> move_from_token(const std::string& token) {
    if (token == "UP") return Move::Up;
    if (token == "DOWN") return Move::Down;
    if (token == "LEFT") return Move::Left;
    if (token == "RIGHT") return Move::Right;
    if (token == "GOAL") return Move::ReachedGoal;
    return std::nullopt;
}

Position apply(const Position& from, Move move) {
    switch (move) {
        case Move::Up:
            return {from.row - 1, from.col};
        case Move::Down:
            return {from.row + 1, from.col};
        case Move::Left:
            return {from.row, from.col - 1};
        case Move::Right:
            return {from.row, from.col + 1};
        case Move::ReachedGoal:
            break;
    }
    return from;
}

bool is_directional(Move move) { return move != Move::ReachedGoal; }

std::optional<Position> position_from_values(const std::vector<int64_t>& values) {
    if (values.size() != 2) return std::nullopt;
    for (const int64_t v : values) {
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }
    return Position{static_cast<int>(values[0]), static_cast<int>(values[1])};
}

const char* to_string(CellStatus status) {
    switch (status) {
        case CellStatus::Free:
            return "free";
        case CellStatus::Occupied:
            return "occupied";
        case CellStatus::Start:
            return "start";
        case CellStatus::Goal:
            return "goal";
        case CellStatus::Visited:
            return "visited";
    }
    return "unknown";
}

std::string to_string(const Position& position) {
    return "(" + std::to_string(position.row) + ", " + std::to_string(position.col) + ")";
}

}  // namespace hnav
