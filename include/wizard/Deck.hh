/** \file
 *
 * \brief Definition of the deck and dealing
 */

#ifndef DECK_HH_
#define DECK_HH_

#include "wizard/CardType.hh"
#include "wizard/Random.hh"

#include <optional>
#include <vector>

namespace Wizard {

/** \brief Sequence of cards
 */
using Cards = std::vector<Card>;

/** \brief Build a new deck
 *
 * The deck contains the ranks 1–13 of hearts, diamonds, clubs and spades in
 * that order, followed by four wizard–jester pairs.
 *
 * \return the N_CARDS cards of a new deck in the fixed order
 */
Cards buildDeck();

/** \brief Shuffle cards
 *
 * Produces a uniformly random permutation of \p cards.
 *
 * \param cards the cards to shuffle
 * \param rng the source of randomness
 */
void shuffleCards(Cards& cards, Rng& rng);

/** \brief Outcome of dealing a round
 */
struct DealtCards {
    std::vector<Cards> hands;       ///< \brief Hands in turn order
    std::optional<Card> trumpCard;  ///< \brief Card revealed for trump
    Cards remaining;                ///< \brief Undealt cards
};

/** \brief Dealer of the rounds of a match
 *
 * Each deal shuffles a fresh deck with the random number generator given in
 * the constructor.
 */
class Dealer {
public:

    /** \brief Create dealer
     *
     * \param rng the random number generator. It must outlive the dealer.
     */
    explicit Dealer(Rng& rng);

    /** \brief Deal a round
     *
     * Shuffles a new deck and deals \p nCards cards to each of \p nPlayers
     * hands one card per pass, like a human dealer. The next card is
     * revealed as the trump card.
     *
     * If the deck runs out, dealing stops and no trump card is revealed.
     *
     * \param nPlayers the number of players
     * \param nCards the number of cards dealt to each player
     *
     * \return the hands, the trump card and the rest of the deck
     */
    DealtCards deal(int nPlayers, int nCards);

private:

    Rng& rng;
};

/** \brief Get the trump suit determined by the trump card
 *
 * \param trumpCard the trump card of the round
 *
 * \return the suit of \p trumpCard, or none if there is no trump card or
 * the trump card is a wizard or a jester
 */
std::optional<Suit> getTrumpSuit(const std::optional<Card>& trumpCard);

}

#endif // DECK_HH_
