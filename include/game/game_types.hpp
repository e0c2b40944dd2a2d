#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include "game/holdem/config.hpp"

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>

constexpr int StandardDeckSize = holdem::DeckSize;
constexpr int MaxNumSeats = holdem::MaxNumSeats;

using CardID = std::uint8_t;
using CardSet = std::uint64_t;
using HandRank = std::uint32_t;
using SeatIndex = int;

enum class Street : std::uint8_t {
    Preflop,
    Flop,
    Turn,
    River
};

enum class Value : std::uint8_t {
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

enum class Suit : std::uint8_t {
    Clubs,
    Diamonds,
    Hearts,
    Spades
};

enum class HandCategory : std::uint8_t {
    HighCard,
    Pair,
    TwoPair,
    ThreeOfAKind,
    Straight,
    Flush,
    FullHouse,
    FourOfAKind,
    StraightFlush,
    RoyalFlush
};

enum class ActionType : std::uint8_t {
    Fold,
    Check,
    Call,
    Raise,
    AllIn
};

enum class BettingStructure : std::uint8_t {
    NoLimit,
    FixedLimit
};

// What the betting round does with an action that breaks the betting rules
enum class ActionPolicy : std::uint8_t {
    Normalize,
    Strict
};

template <typename T>
class SeatArray {
public:
    constexpr SeatArray() = default;

    constexpr const T& operator[](SeatIndex seat) const {
        return m_array[getSeatID(seat)];
    }

    constexpr T& operator[](SeatIndex seat) {
        return m_array[getSeatID(seat)];
    }

    constexpr void fill(const T& value) {
        m_array.fill(value);
    }

    bool operator==(const SeatArray&) const = default;

private:
    constexpr std::size_t getSeatID(SeatIndex seat) const {
        assert(seat >= 0 && seat < MaxNumSeats);
        return static_cast<std::size_t>(seat);
    }

    std::array<T, MaxNumSeats> m_array{};
};

template <typename T>
class StreetArray {
public:
    constexpr StreetArray() = default;

    constexpr const T& operator[](Street street) const {
        return m_array[static_cast<std::size_t>(street)];
    }

    constexpr T& operator[](Street street) {
        return m_array[static_cast<std::size_t>(street)];
    }

private:
    std::array<T, 4> m_array{};
};

#endif // GAME_TYPES_HPP
