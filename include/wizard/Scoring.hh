/** \file
 *
 * \brief Definition of round scoring
 */

#ifndef SCORING_HH_
#define SCORING_HH_

namespace Wizard {

/** \brief Calculate the score of a player for a round
 *
 * A player who took exactly as many tricks as they bid gets 10 points plus
 * 10 points for each trick. Otherwise they lose 10 points for each trick
 * they were off by.
 *
 * \param bid the bid of the player
 * \param tricks the number of tricks the player took
 *
 * \return the change of the score of the player
 */
int calculateRoundScore(int bid, int tricks);

}

#endif // SCORING_HH_
