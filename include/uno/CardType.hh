/** \file
 *
 * \brief Definition of Uno::CardType struct and related concepts
 */

#ifndef CARDTYPE_HH_
#define CARDTYPE_HH_

#include <boost/operators.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace Uno {

/** \brief Color of a card
 *
 * Wild cards have no intrinsic color. Their color is represented by an empty
 * optional in CardType.
 */
enum class Color {
    RED,
    BLUE,
    GREEN,
    YELLOW,
};

/** \brief Array containing all colors in their canonical order
 */
inline constexpr std::array COLORS {
    Color::RED, Color::BLUE, Color::GREEN, Color::YELLOW,
};

/** \brief Rank of a card
 *
 * The numeric ranks are declared first, so that the numeric value of
 * Rank::ZERO … Rank::NINE is the number printed on the card.
 */
enum class Rank {
    ZERO,
    ONE,
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    SKIP,
    REVERSE,
    DRAW_TWO,
    WILD,
    WILD_DRAW_FOUR,
};

/** \brief Determine if a rank is one of 0–9
 */
constexpr bool isNumber(const Rank rank)
{
    return rank <= Rank::NINE;
}

/** \brief Determine if a rank belongs to the wild family
 */
constexpr bool isWild(const Rank rank)
{
    return rank == Rank::WILD || rank == Rank::WILD_DRAW_FOUR;
}

/** \brief Playing card type
 *
 * CardType objects are equality comparable. They compare equal when both rank
 * and color are equal. Cards are not individually identified: a deck contains
 * several cards of the same type.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct CardType : private boost::equality_comparable<CardType> {
    Rank rank;                   ///< \brief Rank of the card
    std::optional<Color> color;  ///< \brief Color of the card, none for wilds

    CardType() = default;

    /** \brief Create new colored card type
     *
     * \param color the color of the card
     * \param rank the rank of the card
     */
    constexpr CardType(Color color, Rank rank) :
        rank {rank},
        color {color}
    {
    }

    /** \brief Create new card type without color
     *
     * This constructor is meant for wild cards.
     *
     * \param rank the rank of the card
     */
    explicit constexpr CardType(Rank rank) :
        rank {rank},
        color {}
    {
    }
};

/** \brief Equality operator for card types
 *
 * \sa CardType
 */
bool operator==(const CardType&, const CardType&);

/** \brief Determine if a card belongs to the wild family
 */
inline bool isWild(const CardType& card)
{
    return isWild(card.rank);
}

/** \brief Name of a color
 *
 * \return “Red”, “Blue”, “Green” or “Yellow”
 */
std::string_view colorName(Color color);

/** \brief Name of a rank
 *
 * \return the digit for numeric ranks, otherwise “Skip”, “Reverse”, “Draw
 * Two”, “Wild” or “Wild Draw Four”
 */
std::string_view rankName(Rank rank);

/** \brief Parse color from its name
 *
 * \param name the name of the color, as returned by colorName()
 *
 * \return the color, or none if \p name is not a color name
 */
std::optional<Color> colorFromString(std::string_view name);

/** \brief Parse card type from its textual form
 *
 * The textual form of a colored card is the color name followed by a single
 * space and the rank name (“Red 5”, “Yellow Draw Two”). The textual form of a
 * wild card is its rank name (“Wild”, “Wild Draw Four”).
 *
 * \param text the textual form of the card
 *
 * \return the card type, or none if \p text does not describe a card
 */
std::optional<CardType> cardTypeFromString(std::string_view text);

/** \brief Output a Color to stream
 *
 * \param os the output stream
 * \param color the color to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Color color);

/** \brief Output a Rank to stream
 *
 * \param os the output stream
 * \param rank the rank to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Rank rank);

/** \brief Output a CardType to stream
 *
 * The card is output in the textual form understood by cardTypeFromString().
 *
 * \param os the output stream
 * \param cardType the card type to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const CardType& cardType);

}

#endif // CARDTYPE_HH_
