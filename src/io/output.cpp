#include "io/output.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/holdem_hand.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

namespace {
json buildJSONSeatNames(const std::vector<SeatIndex>& seatList, const Seats& seats) {
    json j = json::array();
    for (SeatIndex seat : seatList) {
        j.push_back(seats[seat].name);
    }
    return j;
}

std::string getForcedBetTypeName(ForcedBetType type) {
    switch (type) {
        case ForcedBetType::Ante:
            return "ante";
        case ForcedBetType::SmallBlind:
            return "small blind";
        case ForcedBetType::BigBlind:
            return "big blind";
        default:
            assert(false);
            return "???";
    }
}

json buildJSONTable(const HoldemHand& hand) {
    const TableSettings& settings = hand.getSettings();
    const TablePositions& positions = hand.getPositions();

    json j;
    j["Structure"] = getBettingStructureName(settings.structure);
    j["Small Blind"] = settings.smallBlind;
    j["Big Blind"] = settings.bigBlind;
    j["Ante"] = settings.ante;
    j["Small Blind Seat"] = positions.smallBlindSeat;
    j["Big Blind Seat"] = positions.bigBlindSeat;
    j["Board"] = getCardListNames(hand.getBoard());
    return j;
}

json buildJSONForcedBets(const HoldemHand& hand) {
    json j = json::array();
    for (const ForcedBet& forcedBet : hand.getForcedBets()) {
        j.push_back({
            { "Player", hand.getSeats()[forcedBet.seat].name },
            { "Type", getForcedBetTypeName(forcedBet.type) },
            { "Amount", forcedBet.amount }
        });
    }
    return j;
}

json buildJSONActionLog(const HoldemHand& hand) {
    json j = json::array();
    for (const ActionRecord& record : hand.getActionLog()) {
        json action;
        action["Street"] = getStreetName(record.street);
        action["Player"] = hand.getSeats()[record.seat].name;
        action["Requested"] = getActionTypeName(record.requested.action);
        action["Action"] = getActionTypeName(record.action);
        action["Chips"] = record.chipsCommitted;
        action["Street Bet"] = record.streetBetAfter;
        action["Pot"] = record.potAfter;
        action["All In"] = record.isAllIn;
        if (record.wasNormalized) {
            action["Normalized"] = record.normalizationReason;
        }
        j.push_back(action);
    }
    return j;
}

json buildJSONPots(const std::vector<PotTier>& tiers, const Seats& seats) {
    json j = json::array();
    for (const PotTier& tier : tiers) {
        j.push_back({
            { "Amount", tier.amount },
            { "Level", tier.contributionLevel },
            { "Eligible", buildJSONSeatNames(tier.eligibleSeats, seats) }
        });
    }
    return j;
}

json buildJSONAwards(const PotDistribution& distribution, const Seats& seats) {
    json j = json::array();
    for (const PotAward& award : distribution.awards) {
        json awardJSON;
        awardJSON["Pot"] = award.tierIndex;
        awardJSON["Amount"] = award.amount;
        awardJSON["Winners"] = buildJSONSeatNames(award.winners, seats);
        if (award.winningHand) {
            awardJSON["Hand"] = describeHand(*award.winningHand);
        }
        j.push_back(awardJSON);
    }
    return j;
}
} // namespace

std::string buildHandRecordJSON(
    const Seats& seats,
    SeatIndex buttonSeat,
    const HandResult& result,
    const std::optional<HoldemHand>& hand
) {
    json j;
    j["Button"] = seats[buttonSeat].name;

    if (hand) {
        j["Table"] = buildJSONTable(*hand);
        j["Forced Bets"] = buildJSONForcedBets(*hand);
        j["Actions"] = buildJSONActionLog(*hand);
        j["Pot Total"] = hand->getPot().getTotal();
    }

    j["Uncontested"] = result.distribution.wasUncontested;
    j["Pots"] = buildJSONPots(result.tiers, seats);
    j["Awards"] = buildJSONAwards(result.distribution, seats);

    json& showdown = j["Showdown"];
    showdown = json::object();
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (result.showdownHands[seat]) {
            const Hand& showdownHand = *result.showdownHands[seat];
            std::vector<CardID> cards(showdownHand.cards.begin(), showdownHand.cards.end());
            showdown[seats[seat].name] = {
                { "Hand", describeHand(showdownHand) },
                { "Cards", getCardListNames(cards) }
            };
        }
    }

    json& payouts = j["Payouts"];
    payouts = json::object();
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (seats[seat].isOccupied) {
            payouts[seats[seat].name] = result.distribution.winnings[seat];
        }
    }

    return j.dump(4);
}

Result<int> writeHandRecord(const std::string& handRecord, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return "Error saving hand record: Could not open " + filePath + " for writing.";
    }

    file << handRecord << std::endl;
    if (!file) {
        return "Error saving hand record: Could not write to " + filePath + ".";
    }

    return static_cast<int>(handRecord.size()) + 1;
}
