#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/game_types.hpp"
#include "game/holdem/holdem_hand.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

// Everything a persistence layer needs about a finished hand: pot tiers, payouts,
// winners, and the action log when the hand was played out (not just a ledger).
std::string buildHandRecordJSON(
    const Seats& seats,
    SeatIndex buttonSeat,
    const HandResult& result,
    const std::optional<HoldemHand>& hand
);

// Returns the number of bytes written
Result<int> writeHandRecord(const std::string& handRecord, const std::string& filePath);

#endif // OUTPUT_HPP
