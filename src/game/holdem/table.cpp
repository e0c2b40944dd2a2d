#include "game/holdem/table.hpp"

#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "util/result.hpp"

#include <cassert>
#include <string>
#include <vector>

Result<TableSettings> validateTableSettings(const TableSettings& settings) {
    if (settings.bigBlind <= 0) {
        return "Error in table settings: Big blind must be positive.";
    }
    if (settings.smallBlind < 0 || settings.smallBlind > settings.bigBlind) {
        return "Error in table settings: Small blind must be between 0 and the big blind.";
    }
    if (settings.ante < 0) {
        return "Error in table settings: Ante must be non-negative.";
    }
    if (settings.bigBlind > holdem::MaxChips || settings.ante > holdem::MaxChips) {
        return "Error in table settings: Blinds and ante can be at most " + std::to_string(holdem::MaxChips) + ".";
    }
    return settings;
}

std::vector<SeatIndex> getOccupiedSeats(const Seats& seats) {
    std::vector<SeatIndex> occupiedSeats;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (seats[seat].isOccupied) {
            occupiedSeats.push_back(seat);
        }
    }
    return occupiedSeats;
}

SeatIndex getNextOccupiedSeat(const Seats& seats, SeatIndex seat) {
    for (int offset = 1; offset <= MaxNumSeats; ++offset) {
        SeatIndex nextSeat = (seat + offset) % MaxNumSeats;
        if (seats[nextSeat].isOccupied) {
            return nextSeat;
        }
    }

    assert(false);
    return seat;
}

Result<TablePositions> getTablePositions(const Seats& seats, SeatIndex buttonSeat) {
    if (buttonSeat < 0 || buttonSeat >= MaxNumSeats) {
        return "Error finding positions: Button seat " + std::to_string(buttonSeat) + " does not exist.";
    }
    if (!seats[buttonSeat].isOccupied) {
        return "Error finding positions: Button seat " + std::to_string(buttonSeat) + " is empty.";
    }

    int numOccupied = static_cast<int>(getOccupiedSeats(seats).size());
    if (numOccupied < 2) {
        return "Error finding positions: At least two seated players are needed.";
    }

    if (numOccupied == 2) {
        SeatIndex otherSeat = getNextOccupiedSeat(seats, buttonSeat);
        return TablePositions{ .buttonSeat = buttonSeat, .smallBlindSeat = buttonSeat, .bigBlindSeat = otherSeat };
    }

    SeatIndex smallBlindSeat = getNextOccupiedSeat(seats, buttonSeat);
    SeatIndex bigBlindSeat = getNextOccupiedSeat(seats, smallBlindSeat);
    return TablePositions{ .buttonSeat = buttonSeat, .smallBlindSeat = smallBlindSeat, .bigBlindSeat = bigBlindSeat };
}

Result<SeatIndex> getNextButtonSeat(const Seats& seats, SeatIndex buttonSeat) {
    if (getOccupiedSeats(seats).empty()) {
        return "Error moving button: The table is empty.";
    }
    if (buttonSeat < 0 || buttonSeat >= MaxNumSeats) {
        return "Error moving button: Button seat " + std::to_string(buttonSeat) + " does not exist.";
    }
    return getNextOccupiedSeat(seats, buttonSeat);
}

int getFixedLimitBetSize(const TableSettings& settings, Street street) {
    switch (street) {
        case Street::Preflop:
        case Street::Flop:
            return settings.bigBlind;
        case Street::Turn:
        case Street::River:
            return settings.bigBlind * holdem::FixedLimitBigStreetMultiplier;
        default:
            assert(false);
            return settings.bigBlind;
    }
}
