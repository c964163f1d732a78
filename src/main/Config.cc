#include "main/Config.hh"

#include "wizard/WizardConstants.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <stdexcept>
#include <utility>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Wizard {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto BIND_ENDPOINT = "bind_endpoint"sv;
constexpr auto MIN_PLAYERS_KEY = "min_players"sv;
constexpr auto BOT_DELAY_MS = "bot_delay_ms"sv;
constexpr auto TRICK_DELAY_MS = "trick_delay_ms"sv;
constexpr auto ROUND_DELAY_MS = "round_delay_ms"sv;
constexpr auto INACTIVITY_TIMEOUT_S = "inactivity_timeout_s"sv;
constexpr auto INACTIVITY_CHECK_INTERVAL_S = "inactivity_check_interval_s"sv;
constexpr auto SEED = "seed"sv;

constexpr auto DEFAULT_BIND_ENDPOINT = "tcp://*:5555"sv;
constexpr auto LOWEST_MIN_PLAYERS = 2;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Cannot throw through the Lua runtime
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

std::optional<lua_Integer> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return ret;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

template<typename Duration>
void readDuration(
    lua_State* lua, std::string_view key, std::chrono::milliseconds& out,
    const lua_Integer minimum = 0)
{
    if (const auto value = getInt(lua, key)) {
        if (*value < minimum) {
            log(LogLevel::WARNING, "Expected value of at least %s: %s",
                minimum, key);
        } else {
            out = Duration(*value);
        }
    }
}

}

struct Config::Impl {
    Impl();
    Impl(std::istream& in);

    std::string bindEndpoint {DEFAULT_BIND_ENDPOINT};
    RoomConfig roomConfig {};
    std::optional<Rng::result_type> seed {};
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

    loadAndExecuteFromStream(lua.get(), in);

    if (auto endpoint = getString(lua.get(), BIND_ENDPOINT)) {
        bindEndpoint = std::move(*endpoint);
    }
    if (const auto min_players = getInt(lua.get(), MIN_PLAYERS_KEY)) {
        roomConfig.minPlayers = static_cast<int>(
            std::clamp<lua_Integer>(
                *min_players, LOWEST_MIN_PLAYERS, MAX_PLAYERS));
    }
    readDuration<std::chrono::milliseconds>(
        lua.get(), BOT_DELAY_MS, roomConfig.botDelay);
    readDuration<std::chrono::milliseconds>(
        lua.get(), TRICK_DELAY_MS, roomConfig.trickDelay);
    readDuration<std::chrono::milliseconds>(
        lua.get(), ROUND_DELAY_MS, roomConfig.roundDelay);
    readDuration<std::chrono::seconds>(
        lua.get(), INACTIVITY_TIMEOUT_S, roomConfig.inactivityTimeout);
    readDuration<std::chrono::seconds>(
        lua.get(), INACTIVITY_CHECK_INTERVAL_S,
        roomConfig.inactivityCheckInterval, 1);
    if (const auto seed_value = getInt(lua.get(), SEED)) {
        seed = static_cast<Rng::result_type>(*seed_value);
    }

    log(LogLevel::INFO, "Reading configs completed");
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

const std::string& Config::getBindEndpoint() const
{
    assert(impl);
    return impl->bindEndpoint;
}

const RoomConfig& Config::getRoomConfig() const
{
    assert(impl);
    return impl->roomConfig;
}

std::optional<Rng::result_type> Config::getSeed() const
{
    assert(impl);
    return impl->seed;
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
