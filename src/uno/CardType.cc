#include "uno/CardType.hh"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace Uno {

namespace {

using namespace std::string_view_literals;

constexpr auto COLOR_NAMES = std::array {
    std::pair { Color::RED,    "Red"sv },
    std::pair { Color::BLUE,   "Blue"sv },
    std::pair { Color::GREEN,  "Green"sv },
    std::pair { Color::YELLOW, "Yellow"sv },
};

constexpr auto RANK_NAMES = std::array {
    std::pair { Rank::ZERO,           "0"sv },
    std::pair { Rank::ONE,            "1"sv },
    std::pair { Rank::TWO,            "2"sv },
    std::pair { Rank::THREE,          "3"sv },
    std::pair { Rank::FOUR,           "4"sv },
    std::pair { Rank::FIVE,           "5"sv },
    std::pair { Rank::SIX,            "6"sv },
    std::pair { Rank::SEVEN,          "7"sv },
    std::pair { Rank::EIGHT,          "8"sv },
    std::pair { Rank::NINE,           "9"sv },
    std::pair { Rank::SKIP,           "Skip"sv },
    std::pair { Rank::REVERSE,        "Reverse"sv },
    std::pair { Rank::DRAW_TWO,       "Draw Two"sv },
    std::pair { Rank::WILD,           "Wild"sv },
    std::pair { Rank::WILD_DRAW_FOUR, "Wild Draw Four"sv },
};

template<typename Names, typename Value>
std::string_view lookupName(const Names& names, const Value value)
{
    const auto iter = std::find_if(
        names.begin(), names.end(),
        [value](const auto& entry) { return entry.first == value; });
    if (iter == names.end()) {
        throw std::invalid_argument {"Invalid enumeration value"};
    }
    return iter->second;
}

template<typename Names>
auto lookupValue(const Names& names, const std::string_view name)
    -> std::optional<typename Names::value_type::first_type>
{
    const auto iter = std::find_if(
        names.begin(), names.end(),
        [name](const auto& entry) { return entry.second == name; });
    if (iter != names.end()) {
        return iter->first;
    }
    return std::nullopt;
}

}

bool operator==(const CardType& lhs, const CardType& rhs)
{
    return lhs.rank == rhs.rank && lhs.color == rhs.color;
}

std::string_view colorName(const Color color)
{
    return lookupName(COLOR_NAMES, color);
}

std::string_view rankName(const Rank rank)
{
    return lookupName(RANK_NAMES, rank);
}

std::optional<Color> colorFromString(const std::string_view name)
{
    return lookupValue(COLOR_NAMES, name);
}

std::optional<CardType> cardTypeFromString(const std::string_view text)
{
    if (const auto rank = lookupValue(RANK_NAMES, text)) {
        if (isWild(*rank)) {
            return CardType {*rank};
        }
        return std::nullopt;
    }
    const auto space = text.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }
    const auto color = colorFromString(text.substr(0, space));
    const auto rank = lookupValue(RANK_NAMES, text.substr(space + 1));
    if (!color || !rank || isWild(*rank)) {
        return std::nullopt;
    }
    return CardType {*color, *rank};
}

std::ostream& operator<<(std::ostream& os, const Color color)
{
    return os << colorName(color);
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << rankName(rank);
}

std::ostream& operator<<(std::ostream& os, const CardType& cardType)
{
    if (cardType.color) {
        os << *cardType.color << " ";
    }
    return os << cardType.rank;
}

}
