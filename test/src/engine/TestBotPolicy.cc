#include "engine/BotPolicy.hh"
#include "wizard/Trick.hh"

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <utility>

using Wizard::Card;
using Wizard::Cards;
using Wizard::Special;
using Wizard::Suit;
using Wizard::Engine::BotPolicy;
using Wizard::Engine::Phase;
using Wizard::Engine::Player;

namespace {

const auto BOT = Wizard::PlayerId {"bot"};
const auto OTHER = Wizard::PlayerId {"other"};
const auto THIRD = Wizard::PlayerId {"third"};

auto allowAll()
{
    return [](int) { return true; };
}

Card played(Card card, const Wizard::PlayerId& player)
{
    card.playedBy = player;
    return card;
}

}

class BotPolicyTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        state.players = {
            Player {OTHER, "Other", true, true, {}, 0, 0, 0},
            Player {BOT, "Bot 1", false, true, {}, 0, std::nullopt, 0},
            Player {THIRD, "Third", true, true, {}, 0, 0, 0},
        };
        state.currentRound = 1;
        state.phase = Phase::PLAYING;
        state.activePlayerId = BOT;
    }

    Player& bot()
    {
        return *state.getPlayer(BOT);
    }

    void setTrick(Cards trick)
    {
        state.currentTrick = std::move(trick);
        state.leadSuit = Wizard::getLeadSuit(state.currentTrick);
    }

    Wizard::Rng rng {Wizard::makeRng(7)};
    BotPolicy policy {rng};
    Wizard::Engine::MatchState state;
};

TEST_F(BotPolicyTest, testBidIsShareOfRound)
{
    state.currentRound = 5;
    state.phase = Phase::BIDDING;
    EXPECT_EQ(1, policy.chooseBid(state, BOT, allowAll()));
    state.currentRound = 7;
    EXPECT_EQ(2, policy.chooseBid(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testBidFallsBackWhenRejected)
{
    state.currentRound = 5;
    state.phase = Phase::BIDDING;
    EXPECT_EQ(
        2, policy.chooseBid(state, BOT, [](int bid) { return bid != 1; }));
    EXPECT_EQ(
        0, policy.chooseBid(state, BOT, [](int bid) { return bid == 0; }));
    EXPECT_FALSE(policy.chooseBid(state, BOT, [](int) { return false; }));
}

TEST_F(BotPolicyTest, testBidForUnknownPlayer)
{
    EXPECT_FALSE(policy.chooseBid(state, "unknown", allowAll()));
}

TEST_F(BotPolicyTest, testCardStrength)
{
    state.trumpCard = Card {Suit::CLUBS, 3};
    setTrick({played(Card {Suit::HEARTS, 2}, OTHER)});
    EXPECT_EQ(31, BotPolicy::getCardStrength(Card {Suit::CLUBS, 5}, state));
    EXPECT_EQ(18, BotPolicy::getCardStrength(Card {Suit::HEARTS, 5}, state));
    EXPECT_EQ(5, BotPolicy::getCardStrength(Card {Suit::SPADES, 5}, state));
    EXPECT_EQ(53, BotPolicy::getCardStrength(Card {Special::WIZARD}, state));
    EXPECT_EQ(0, BotPolicy::getCardStrength(Card {Special::JESTER}, state));
}

TEST_F(BotPolicyTest, testWizardOutranksTrumpOfLeadSuit)
{
    state.trumpCard = Card {Suit::HEARTS, 2};
    setTrick({played(Card {Suit::HEARTS, 5}, OTHER)});
    EXPECT_LT(
        BotPolicy::getCardStrength(Card {Suit::HEARTS, 13}, state),
        BotPolicy::getCardStrength(Card {Special::WIZARD}, state));
}

TEST_F(BotPolicyTest, testPlayWizardOverTrumpOfLeadSuit)
{
    state.currentRound = 2;
    state.trumpCard = Card {Suit::HEARTS, 2};
    bot().bid = 2;
    bot().hand = {Card {Special::WIZARD}, Card {Suit::HEARTS, 13}};
    setTrick({played(Card {Suit::HEARTS, 5}, OTHER)});
    EXPECT_EQ(0, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testCanWinTrick)
{
    setTrick({played(Card {Suit::HEARTS, 10}, OTHER)});
    EXPECT_TRUE(BotPolicy::canWinTrick(Card {Suit::HEARTS, 11}, state));
    EXPECT_FALSE(BotPolicy::canWinTrick(Card {Suit::HEARTS, 9}, state));
    EXPECT_FALSE(BotPolicy::canWinTrick(Card {Suit::SPADES, 13}, state));
    EXPECT_TRUE(BotPolicy::canWinTrick(Card {Special::WIZARD}, state));
    EXPECT_FALSE(BotPolicy::canWinTrick(Card {Special::JESTER}, state));
}

TEST_F(BotPolicyTest, testCannotBeatWizard)
{
    setTrick({played(Card {Special::WIZARD}, OTHER)});
    EXPECT_FALSE(BotPolicy::canWinTrick(Card {Suit::HEARTS, 13}, state));
    EXPECT_TRUE(BotPolicy::canWinTrick(Card {Special::WIZARD}, state));
}

TEST_F(BotPolicyTest, testPlayStrongestWinningCard)
{
    bot().bid = 1;
    bot().hand = {
        Card {Suit::HEARTS, 11}, Card {Suit::HEARTS, 12}, Card {Suit::SPADES, 2}};
    setTrick({played(Card {Suit::HEARTS, 10}, OTHER)});
    EXPECT_EQ(1, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testPlayWeakestCardWhenUnableToWin)
{
    bot().bid = 1;
    bot().hand = {
        Card {Suit::HEARTS, 3}, Card {Special::JESTER}, Card {Suit::SPADES, 9}};
    setTrick({played(Card {Special::WIZARD}, OTHER)});
    EXPECT_EQ(1, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testShedStrongestLosingCard)
{
    bot().bid = 0;
    bot().hand = {
        Card {Suit::HEARTS, 11}, Card {Suit::HEARTS, 4}, Card {Suit::HEARTS, 2}};
    setTrick({played(Card {Suit::HEARTS, 10}, OTHER)});
    EXPECT_EQ(1, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testLeadWeakestWhenNotTryingToWin)
{
    bot().bid = 0;
    bot().hand = {
        Card {Special::WIZARD}, Card {Suit::CLUBS, 7}, Card {Special::JESTER}};
    EXPECT_EQ(2, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testLeadStrongestWhenTryingToWin)
{
    bot().bid = 1;
    bot().hand = {Card {Suit::CLUBS, 7}, Card {Special::WIZARD}};
    EXPECT_EQ(1, policy.chooseCard(state, BOT, allowAll()));
}

TEST_F(BotPolicyTest, testOnlyLegalCardsAreChosen)
{
    bot().bid = 1;
    bot().hand = {
        Card {Suit::HEARTS, 11}, Card {Suit::HEARTS, 12}, Card {Suit::SPADES, 2}};
    setTrick({played(Card {Suit::HEARTS, 10}, OTHER)});
    EXPECT_EQ(
        0, policy.chooseCard(state, BOT, [](int n) { return n != 1; }));
    EXPECT_FALSE(policy.chooseCard(state, BOT, [](int) { return false; }));
}

TEST_F(BotPolicyTest, testProbabilisticDecisionPicksLegalCard)
{
    state.currentRound = 6;
    bot().bid = 1;
    bot().hand = {
        Card {Suit::HEARTS, 11}, Card {Suit::HEARTS, 4}, Card {Suit::DIAMONDS, 2}};
    setTrick({played(Card {Suit::HEARTS, 10}, OTHER)});
    auto chosen = std::set<int> {};
    for ([[maybe_unused]] const auto n : {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}) {
        const auto card = policy.chooseCard(
            state, BOT, [](int i) { return i != 2; });
        ASSERT_TRUE(card);
        chosen.insert(*card);
    }
    EXPECT_FALSE(chosen.contains(2));
}
