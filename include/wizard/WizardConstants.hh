/** \file
 *
 * \brief Definition of fundamental constants of the Wizard card game
 */

#ifndef WIZARDCONSTANTS_HH_
#define WIZARDCONSTANTS_HH_

/** \brief Top level namespace of the Wizard game server
 *
 * The Wizard namespace directly contains the cards, the deck and the rules
 * that do not depend on the state of a match. The engine, the messaging
 * layer and the server application live in subnamespaces.
 */
namespace Wizard {

/** \brief Number of ordinary suits
 */
constexpr auto N_SUITS = 4;

/** \brief Number of ranks in each ordinary suit
 */
constexpr auto N_RANKS = 13;

/** \brief Number of wizards in the deck
 */
constexpr auto N_WIZARDS = 4;

/** \brief Number of jesters in the deck
 */
constexpr auto N_JESTERS = 4;

/** \brief Number of cards in the deck
 */
constexpr auto N_CARDS = N_SUITS * N_RANKS + N_WIZARDS + N_JESTERS; // 60

/** \brief Default minimum number of players needed to start a match
 */
constexpr auto MIN_PLAYERS = 3;

/** \brief Maximum number of players in a match
 */
constexpr auto MAX_PLAYERS = 6;

/** \brief Number of rounds in a match with \p nPlayers players
 *
 * In round \e n every player is dealt \e n cards, so the match ends when the
 * deck no longer suffices.
 */
constexpr int getMaxRounds(const int nPlayers)
{
    return nPlayers > 0 ? N_CARDS / nPlayers : 0;
}

}

#endif // WIZARDCONSTANTS_HH_
