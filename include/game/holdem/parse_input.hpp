#ifndef PARSE_INPUT_HPP
#define PARSE_INPUT_HPP

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

// "As,Kd,7h". Cards may also be separated by spaces.
Result<std::vector<CardID>> buildCardListFromString(const std::string& cardListString);

// Like buildCardListFromString, but the size must be 0 (preflop), 3, 4, or 5
Result<std::vector<CardID>> buildBoardFromString(const std::string& boardString);

// "fold", "check", "call", "bet 40", "raise 120" or "all-in". Amounts are raise-to totals.
Result<PlayerDecision> parseDecision(const std::string& decisionString);

Result<BettingStructure> parseBettingStructure(const std::string& structureString);
Result<Street> parseStreet(const std::string& streetString);

#endif // PARSE_INPUT_HPP
