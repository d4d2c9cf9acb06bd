/** \file
 *
 * \brief Definition of Uno::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "uno/PlayerId.hh"
#include "uno/Random.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Uno {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. The following global variables are
 * read after the script has been run:
 *
 * - \c players: array of player names (default: “alice” and “bob”)
 * - \c cards_per_player: number of cards dealt to each player (default: 7)
 * - \c max_players: number of seats in the game (default: 4)
 * - \c seed: seed of the random number generator of the game (default: none)
 * - \c max_turns: maximum number of turns played (default: 10000)
 * - \c log_level: name of the logging level (default: none)
 *
 * A variable that has a value of a wrong type is ignored with a warning, and
 * the default is used instead.
 */
class Config {
public:

    /** \brief Vector of player names
     */
    using PlayerVector = std::vector<PlayerId>;

    /** \brief Create config with default values
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the players seated in the game, in turn order
     */
    const PlayerVector& getPlayers() const;

    /** \brief Get the number of cards dealt to each player
     */
    int getCardsPerPlayer() const;

    /** \brief Get the number of seats in the game
     */
    int getMaxPlayers() const;

    /** \brief Get the seed of the random number generator of the game
     *
     * \return the seed, or none if the generator should be seeded from the OS
     */
    std::optional<RngSeed> getSeed() const;

    /** \brief Get the maximum number of turns played before giving up
     */
    int getMaxTurns() const;

    /** \brief Get the logging level
     *
     * \return the logging level, or none if the level was not configured
     */
    std::optional<LogLevel> getLogLevel() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
