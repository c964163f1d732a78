#include "wizard/Scoring.hh"

#include <cstdlib>

namespace Wizard {

int calculateRoundScore(const int bid, const int tricks)
{
    if (bid == tricks) {
        return 10 + 10 * bid;
    }
    return -10 * std::abs(bid - tricks);
}

}
