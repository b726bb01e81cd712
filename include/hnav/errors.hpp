// errors.hpp
//
// Exceptions raised by the grid model, the map loader and the step channel.
// Deadlock is not an error type: the planner simply has no move to offer and the
// route driver reports it as a run status.

#ifndef HNAV_ERRORS_HPP_
#define HNAV_ERRORS_HPP_

#include <stdexcept>
#include <string>

#include "hnav/types.hpp"

namespace hnav {

// Coordinate outside the grid.
class OutOfBoundsError : public std::out_of_range {
   public:
    OutOfBoundsError(const Position& position, int rows, int cols)
        : std::out_of_range("position " + to_string(position) + " is outside the " +
                            std::to_string(rows) + "x" + std::to_string(cols) + " grid"),
          position_(position) {}

    const Position& position() const noexcept { return position_; }

   private:
    Position position_;
};

// Status change the grid model does not allow, e.g. marking an obstacle visited.
class InvalidTransitionError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

// The external step executor could not be reached or did not acknowledge.
class ControllerError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Map file missing, unreadable or not a valid grid.
class GridFormatError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace hnav

#endif  // HNAV_ERRORS_HPP_
