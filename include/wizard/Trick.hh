/** \file
 *
 * \brief Definition of the rules for playing and resolving tricks
 */

#ifndef TRICK_HH_
#define TRICK_HH_

#include "wizard/Deck.hh"

#include <cstddef>
#include <optional>

namespace Wizard {

/** \brief Determine the lead suit of a trick
 *
 * \param trick the cards played to the trick so far
 *
 * \return the suit of the first ordinary card in \p trick, or none if it
 * contains only special cards
 */
std::optional<Suit> getLeadSuit(const Cards& trick);

/** \brief Determine if a card may be played to a trick
 *
 * A player must follow the lead suit if they hold an ordinary card of it.
 * Wizards and jesters can always be played.
 *
 * \param hand the hand of the player
 * \param n the index of the card in \p hand
 * \param leadSuit the lead suit of the trick, or none if not yet determined
 *
 * \return true if the card may be played, false otherwise (including when
 * \p n is out of range)
 */
bool canPlayCard(const Cards& hand, std::ptrdiff_t n, std::optional<Suit> leadSuit);

/** \brief Determine the winning card of a complete trick
 *
 * - If the trick contains wizards, the last wizard played wins.
 * - If every card is a jester, no card wins and the trick goes to its
 *   leader.
 * - Otherwise the best card is tracked in play order. A card replaces the
 *   best one if the best is a jester, if it is a trump and the best is not,
 *   or if it has the same suit and a higher rank.
 *
 * \param trick the cards in the order they were played
 * \param trumpSuit the trump suit of the round, if any
 *
 * \return the index of the winning card in \p trick, or none if \p trick is
 * empty or contains only jesters
 */
std::optional<std::size_t> getWinningCardIndex(
    const Cards& trick, std::optional<Suit> trumpSuit);

/** \brief Determine the player who wins a complete trick
 *
 * \param trick the cards in the order they were played
 * \param trumpSuit the trump suit of the round, if any
 * \param leader the player who led the trick
 *
 * \return the player who played the winning card, or \p leader if no card
 * wins, or none if the winning card does not record its player
 *
 * \sa getWinningCardIndex()
 */
std::optional<PlayerId> getTrickWinner(
    const Cards& trick, std::optional<Suit> trumpSuit, const PlayerId& leader);

}

#endif // TRICK_HH_
