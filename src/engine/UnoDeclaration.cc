#include "engine/UnoDeclaration.hh"

#include "engine/EngineFailure.hh"
#include "engine/TurnStateMachine.hh"
#include "Logging.hh"

namespace Uno {
namespace Engine {

void declareUno(PlayerSeat& seat)
{
    if (seat.hand.size() != 1) {
        throw EngineFailure {
            EngineFailure::Kind::INVALID_UNO_DECLARATION,
            "UNO can only be said with exactly one card in hand"};
    }
    if (seat.saidUno) {
        throw EngineFailure {
            EngineFailure::Kind::INVALID_UNO_DECLARATION,
            "UNO has already been said"};
    }
    seat.saidUno = true;
}

ChallengeResult resolveChallenge(
    GameState& state, const PlayerId& challenger, PlayerSeat& challenged)
{
    if (challenged.hand.size() != 1) {
        throw EngineFailure {
            EngineFailure::Kind::INVALID_CHALLENGE,
            "Only a player with exactly one card can be challenged"};
    }
    auto ret = ChallengeResult {
        !challenged.saidUno, challenger, challenged.playerId, {}};
    if (ret.successful) {
        ret.penaltyCards = drawPenaltyCards(state, UNO_PENALTY_CARDS);
        challenged.hand.insert(
            challenged.hand.end(), ret.penaltyCards.begin(),
            ret.penaltyCards.end());
        challenged.saidUno = false;
        log(LogLevel::INFO, "Game %s: %s caught %s not saying UNO",
            state.id, challenger, challenged.playerId);
    } else {
        log(LogLevel::INFO, "Game %s: %s said UNO on time",
            state.id, challenged.playerId);
    }
    return ret;
}

void clearStaleDeclaration(PlayerSeat& seat)
{
    if (seat.hand.size() != 1) {
        seat.saidUno = false;
    }
}

}
}
