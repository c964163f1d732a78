/** \file
 *
 * \brief Definition of Wizard::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "main/RoomConfig.hh"
#include "wizard/Random.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Wizard {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. After running it, the following
 * global variables are read:
 *
 * - \c bind_endpoint: the endpoint the server socket binds to (default
 *   “tcp://*:5555”)
 * - \c min_players: the number of players needed to start a match, clamped
 *   to 2–6 (default 3)
 * - \c bot_delay_ms, \c trick_delay_ms, \c round_delay_ms: the pacing delays
 *   in milliseconds
 * - \c inactivity_timeout_s, \c inactivity_check_interval_s: the inactivity
 *   threshold and the interval of the inactivity check in seconds
 * - \c seed: integer seed for the random number generator (optional)
 *
 * Variables that are not set keep their default values.
 */
class Config {
public:

    /** \brief Create default configs
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
    explicit Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the endpoint the server binds to
     */
    const std::string& getBindEndpoint() const;

    /** \brief Get the parameters of the session rooms
     */
    const RoomConfig& getRoomConfig() const;

    /** \brief Get the seed of the random number generator
     *
     * \return the seed, or none if the generator should be seeded from the
     * system
     */
    std::optional<Rng::result_type> getSeed() const;

private:

    struct Impl;
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
