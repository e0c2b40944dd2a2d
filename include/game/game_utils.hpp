#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

// CardID functions
Value getCardValue(CardID cardID);
Suit getCardSuit(CardID cardID);
CardID getCardID(Value value, Suit suit);
std::string getNameFromCardID(CardID cardID);
Result<CardID> getCardIDFromName(const std::string& cardName);

// Value functions
int getValueRank(Value value);
int getLowAceRank(Value value);
std::string getValueName(Value value);
std::string getPluralValueName(Value value);

// CardSet functions
CardSet cardIDToSet(CardID cardID);
int getSetSize(CardSet cardSet);
bool setContainsCard(CardSet cardSet, CardID cardID);
CardID getLowestCardInSet(CardSet cardSet);
CardID popLowestCardFromSet(CardSet& cardSet);
CardSet cardListToSet(const std::vector<CardID>& cards);
std::vector<std::string> getCardSetNames(CardSet cardSet);
std::vector<std::string> getCardListNames(const std::vector<CardID>& cards);

// Street functions
Street nextStreet(Street street);
std::string getStreetName(Street street);

// Action and hand functions
std::string getActionTypeName(ActionType actionType);
std::string getHandCategoryName(HandCategory category);
std::string getBettingStructureName(BettingStructure structure);

#endif // GAME_UTILS_HPP
