#include "engine/InMemoryGameStore.hh"
#include "engine/UnoEngine.hh"
#include "main/Config.hh"
#include "main/SelfPlay.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace Uno;

Main::GameSetup setupFromConfig(const Main::Config& config)
{
    auto setup = Main::GameSetup {};
    setup.players = config.getPlayers();
    setup.cardsPerPlayer = config.getCardsPerPlayer();
    setup.maxPlayers = config.getMaxPlayers();
    setup.seed = config.getSeed();
    setup.maxTurns = config.getMaxTurns();
    return setup;
}

void printSummary(const Main::SelfPlayResult& result, std::ostream& out)
{
    out << "Game " << result.gameId << " finished after " << result.turns
        << " turns\n";
    if (result.winner) {
        out << "Winner: " << *result.winner << '\n';
    } else {
        out << "No winner\n";
    }
    for (const auto& [player, score] : result.scores) {
        out << player << ": " << score << '\n';
    }
}

}

int main(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            return EXIT_FAILURE;
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    try {
        const auto config = Main::configFromPath(configPath);
        if (const auto level = config.getLogLevel()) {
            setupLogging(*level, std::cerr);
        }
        auto engine = Engine::UnoEngine {
            std::make_shared<Engine::InMemoryGameStore>()};
        const auto result = Main::playGame(
            engine, setupFromConfig(config), std::cout);
        printSummary(result, std::cout);
    } catch (const std::exception& e) {
        log(LogLevel::FATAL, "%s", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
