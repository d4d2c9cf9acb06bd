#include "main/Config.hh"

#include "uno/UnoConstants.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Uno {
namespace Main {

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

constexpr auto PLAYERS = "players"sv;
constexpr auto CARDS_PER_PLAYER = "cards_per_player"sv;
constexpr auto MAX_PLAYERS_KEY = "max_players"sv;
constexpr auto SEED = "seed"sv;
constexpr auto MAX_TURNS = "max_turns"sv;
constexpr auto LOG_LEVEL = "log_level"sv;

constexpr auto DEFAULT_MAX_TURNS = 10000;

const auto DEFAULT_PLAYERS = Config::PlayerVector {"alice"s, "bob"s};

// Restores the Lua stack to the height it had when the guard was created
class LuaStackGuard {
public:
    explicit LuaStackGuard(lua_State* lua) :
        lua {lua},
        top {lua_gettop(lua)}
    {
    }

    ~LuaStackGuard()
    {
        lua_settop(lua, top);
    }

private:
    lua_State* lua;
    int top;
};

struct ScriptSource {
    explicit ScriptSource(std::istream& in) : in {in} {}
    std::istream& in;
    std::array<char, 4096> chunk {};
};

extern "C"
const char* read_config_chunk(lua_State*, void* data, std::size_t* size)
{
    auto& source = *static_cast<ScriptSource*>(data);
    *size = 0;
    if (!source.in) {
        return nullptr;
    }
    errno = 0;
    source.in.read(source.chunk.data(), source.chunk.size());
    if (source.in.bad()) {
        // Lua is C, so the error is logged here and the chunk ends the script
        log(LogLevel::WARNING, "Reading config failed: %s",
            std::strerror(errno));
        return nullptr;
    }
    *size = static_cast<std::size_t>(source.in.gcount());
    return source.chunk.data();
}

void runScript(lua_State* lua, std::istream& in)
{
    const auto sentry = std::istream::sentry {in, true};
    if (!sentry) {
        log(LogLevel::ERROR, "Config stream is not readable: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    auto source = std::make_unique<ScriptSource>(in);
    auto status = lua_load(
        lua, read_config_chunk, source.get(), "config", nullptr);
    if (status == LUA_OK) {
        // Allocation failure inside the interpreter cannot be recovered from
        const auto previous = std::set_new_handler(std::terminate);
        status = lua_pcall(lua, 0, 0, 0);
        std::set_new_handler(previous);
    }
    if (status != LUA_OK) {
        log(LogLevel::ERROR, "Config script failed: %s",
            lua_tostring(lua, -1));
        throw std::runtime_error {"Could not process config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    const auto guard = LuaStackGuard {lua};
    lua_getglobal(lua, key.data());
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

std::optional<lua_Integer> getInteger(lua_State* lua, std::string_view key)
{
    const auto guard = LuaStackGuard {lua};
    lua_getglobal(lua, key.data());
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return ret;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

int getIntInRange(
    lua_State* lua, std::string_view key, const int min, const int max,
    const int defaultValue)
{
    if (const auto value = getInteger(lua, key)) {
        if (*value >= min && *value <= max) {
            return static_cast<int>(*value);
        }
        log(LogLevel::WARNING, "%s out of range: %d", key, *value);
    }
    return defaultValue;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    PlayerVector players {DEFAULT_PLAYERS};
    int cardsPerPlayer {DEFAULT_CARDS_PER_PLAYER};
    int maxPlayers {DEFAULT_MAX_PLAYERS};
    std::optional<RngSeed> seed {};
    int maxTurns {DEFAULT_MAX_TURNS};
    std::optional<LogLevel> logLevel {};

private:

    void createPlayersConfig(lua_State* lua);
    void createSeedConfig(lua_State* lua);
    void createLogLevelConfig(lua_State* lua);
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua.get());

    runScript(lua.get(), in);

    createPlayersConfig(lua.get());
    cardsPerPlayer = getIntInRange(
        lua.get(), CARDS_PER_PLAYER, 0, N_CARDS, DEFAULT_CARDS_PER_PLAYER);
    maxPlayers = getIntInRange(
        lua.get(), MAX_PLAYERS_KEY, MIN_PLAYERS, MAX_PLAYERS,
        DEFAULT_MAX_PLAYERS);
    createSeedConfig(lua.get());
    maxTurns = getIntInRange(
        lua.get(), MAX_TURNS, 1, std::numeric_limits<int>::max(),
        DEFAULT_MAX_TURNS);
    createLogLevelConfig(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createPlayersConfig(lua_State* lua)
{
    const auto guard = LuaStackGuard {lua};
    lua_getglobal(lua, PLAYERS.data());
    if (lua_isnoneornil(lua, -1)) {
        return;
    }
    if (!lua_istable(lua, -1)) {
        log(LogLevel::WARNING, "Expected table: %s", PLAYERS);
        return;
    }
    auto configured = PlayerVector {};
    for (auto i = 1;; ++i) {
        const auto element_guard = LuaStackGuard {lua};
        lua_rawgeti(lua, -1, i);
        if (lua_isnil(lua, -1)) {
            break;
        }
        if (lua_type(lua, -1) != LUA_TSTRING) {
            log(LogLevel::WARNING, "%s: expected player %d to be a string",
                PLAYERS, i);
            continue;
        }
        configured.emplace_back(lua_tostring(lua, -1));
    }
    players = std::move(configured);
}

void Config::Impl::createSeedConfig(lua_State* lua)
{
    if (const auto value = getInteger(lua, SEED)) {
        seed = static_cast<RngSeed>(*value);
    }
}

void Config::Impl::createLogLevelConfig(lua_State* lua)
{
    if (const auto name = getString(lua, LOG_LEVEL)) {
        logLevel = logLevelFromString(*name);
        if (!logLevel) {
            log(LogLevel::WARNING, "Unknown log level: %s", *name);
        }
    }
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

const Config::PlayerVector& Config::getPlayers() const
{
    assert(impl);
    return impl->players;
}

int Config::getCardsPerPlayer() const
{
    assert(impl);
    return impl->cardsPerPlayer;
}

int Config::getMaxPlayers() const
{
    assert(impl);
    return impl->maxPlayers;
}

std::optional<RngSeed> Config::getSeed() const
{
    assert(impl);
    return impl->seed;
}

int Config::getMaxTurns() const
{
    assert(impl);
    return impl->maxTurns;
}

std::optional<LogLevel> Config::getLogLevel() const
{
    assert(impl);
    return impl->logLevel;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
