#ifndef TABLE_HPP
#define TABLE_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

struct SeatState {
    std::string name;
    int stack;
    int streetBet;
    bool isOccupied;
    bool hasFolded;
    bool isAllIn;
};

using Seats = SeatArray<SeatState>;

struct TableSettings {
    BettingStructure structure;
    int smallBlind;
    int bigBlind;
    int ante;
    ActionPolicy actionPolicy;
};

struct TablePositions {
    SeatIndex buttonSeat;
    SeatIndex smallBlindSeat;
    SeatIndex bigBlindSeat;

    bool operator==(const TablePositions&) const = default;
};

Result<TableSettings> validateTableSettings(const TableSettings& settings);

std::vector<SeatIndex> getOccupiedSeats(const Seats& seats);
SeatIndex getNextOccupiedSeat(const Seats& seats, SeatIndex seat);

// Heads-up the button posts the small blind, otherwise the blinds are the two seats after the button
Result<TablePositions> getTablePositions(const Seats& seats, SeatIndex buttonSeat);
Result<SeatIndex> getNextButtonSeat(const Seats& seats, SeatIndex buttonSeat);

int getFixedLimitBetSize(const TableSettings& settings, Street street);

#endif // TABLE_HPP
