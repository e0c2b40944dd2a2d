#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace holdem {
constexpr int DeckSize = 52;
constexpr int NumHoleCards = 2;
constexpr int BoardSize = 5;

// A hand is always the best five cards out of hole cards plus board
constexpr int HandSize = 5;
constexpr int MaxCardsToEvaluate = NumHoleCards + BoardSize;

// Full ring tables seat up to ten players
constexpr int MaxNumSeats = 10;

// Ceiling on any stack, blind or per seat contribution, so a full table's chips
// and every payout stay within an int
constexpr int MaxChips = 100'000'000;

// Fixed limit: one bet plus three raises per street
constexpr int FixedLimitMaxBetsPerStreet = 4;

// Fixed limit turn and river bets are double the preflop and flop size
constexpr int FixedLimitBigStreetMultiplier = 2;
} // namespace holdem

#endif // CONFIG_HPP
