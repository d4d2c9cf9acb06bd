#include "engine/EngineFailure.hh"

#include <ostream>

namespace Uno {
namespace Engine {

EngineFailure::EngineFailure(const Kind kind, const std::string& what) :
    std::runtime_error {what},
    kind {kind}
{
}

EngineFailure::Kind EngineFailure::getKind() const noexcept
{
    return kind;
}

std::ostream& operator<<(std::ostream& os, const EngineFailure::Kind kind)
{
    using Kind = EngineFailure::Kind;
    switch (kind) {
    case Kind::NOT_FOUND:
        return os << "not found";
    case Kind::NOT_STARTED:
        return os << "not started";
    case Kind::INVALID_GAME_STATE:
        return os << "invalid game state";
    case Kind::NOT_YOUR_TURN:
        return os << "not your turn";
    case Kind::CARD_NOT_IN_HAND:
        return os << "card not in hand";
    case Kind::ILLEGAL_CARD:
        return os << "illegal card";
    case Kind::MISSING_COLOR_CHOICE:
        return os << "missing color choice";
    case Kind::INVALID_COLOR_CHOICE:
        return os << "invalid color choice";
    case Kind::DECK_EXHAUSTED:
        return os << "deck exhausted";
    case Kind::INVALID_UNO_DECLARATION:
        return os << "invalid UNO declaration";
    case Kind::INVALID_CHALLENGE:
        return os << "invalid challenge";
    case Kind::INVALID_ACTION:
        return os << "invalid action";
    case Kind::TOO_FEW_PLAYERS:
        return os << "too few players";
    case Kind::GAME_FULL:
        return os << "game full";
    case Kind::ALREADY_SEATED:
        return os << "already seated";
    case Kind::NOT_READY:
        return os << "not ready";
    }
    return os;
}

}
}
