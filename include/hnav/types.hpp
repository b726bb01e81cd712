// types.hpp
//
// Grid coordinates, cell states and the move vocabulary shared by the planner,
// the route driver and the step channel.

#ifndef HNAV_TYPES_HPP_
#define HNAV_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hnav {

// Grid coordinate. `row` is the vertical axis ("X" in the map files), `col` the
// horizontal one ("Y").
struct Position {
    int row{0};
    int col{0};
};

inline bool operator==(const Position& a, const Position& b) {
    return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

// Hash used by the visited set and any Position-keyed container.
struct PositionHash {
    std::size_t operator()(const Position& p) const {
        return std::hash<int>()(p.row) ^ (std::hash<int>()(p.col) << 1);
    }
};

// Mutually exclusive state of a grid cell. Only Free cells ever become Visited.
enum class CellStatus { Free, Occupied, Start, Goal, Visited };

struct Cell {
    Position position;
    CellStatus status{CellStatus::Free};
};

// One planner decision. Up/Down change the row, Left/Right the column.
enum class Move { Up, Down, Left, Right, ReachedGoal };

// Command token sent to the external controller: UP, DOWN, LEFT, RIGHT, GOAL.
const char* to_token(Move move);

// Inverse of to_token(); empty for anything that is not an exact token.
std::optional<Move> move_from_token(const std::string& token);

// Position reached from `from` after `move`. ReachedGoal leaves it unchanged.
Position apply(const Position& from, Move move);

// False only for ReachedGoal.
bool is_directional(Move move);

// (row, col) from a two-element integer list such as a ROS parameter. Empty when
// the list has another length or a value does not fit in an int.
std::optional<Position> position_from_values(const std::vector<int64_t>& values);

const char* to_string(CellStatus status);

// "(row, col)"
std::string to_string(const Position& position);

}  // namespace hnav

#endif  // HNAV_TYPES_HPP_
