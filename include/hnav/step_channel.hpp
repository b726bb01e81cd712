// step_channel.hpp
//
// Interface to the external executor that carries out each planned move.

#ifndef HNAV_STEP_CHANNEL_HPP_
#define HNAV_STEP_CHANNEL_HPP_

#include <string>

#include "hnav/types.hpp"

namespace hnav {

// Acknowledgement returned by the executor. The payload is kept for logging only.
struct StepAck {
    Move move{Move::ReachedGoal};
    std::string payload;
};

class StepChannel {
   public:
    virtual ~StepChannel() = default;

    // Send the token for `move`, then block until exactly one acknowledgement
    // arrives. Throws ControllerError when the exchange cannot complete.
    virtual StepAck send_and_await(Move move) = 0;
};

}  // namespace hnav

#endif  // HNAV_STEP_CHANNEL_HPP_
