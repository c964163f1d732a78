#include "engine/WizardEngine.hh"
#include "wizard/Scoring.hh"
#include "MockObserver.hh"
#include "Utility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <iterator>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

using Wizard::Engine::Phase;
using Wizard::Engine::WizardEngine;
using Wizard::MockObserver;

using testing::Field;
using testing::NiceMock;

namespace {

const auto PLAYERS = std::array<Wizard::PlayerId, 3> {"p1", "p2", "p3"};

}

class WizardEngineTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        for (const auto& id : PLAYERS) {
            ASSERT_TRUE(engine.addPlayer(id, "name-" + id));
        }
    }

    const Wizard::Engine::MatchState& state() const
    {
        return engine.getState();
    }

    const Wizard::PlayerId& activePlayer() const
    {
        return Wizard::dereference(state().activePlayerId);
    }

    void placeAnyBid()
    {
        const auto id = activePlayer();
        for (const auto bid : Wizard::to(state().currentRound + 1)) {
            if (engine.placeBid(id, bid)) {
                return;
            }
        }
        FAIL() << "No legal bid for " << id;
    }

    void playAnyCard()
    {
        const auto id = activePlayer();
        const auto& hand = Wizard::dereference(state().getPlayer(id)).hand;
        for (const auto n : Wizard::to(static_cast<int>(hand.size()))) {
            if (engine.playCard(id, n)) {
                return;
            }
        }
        FAIL() << "No legal card for " << id;
    }

    void playRound()
    {
        while (engine.getPhase() == Phase::BIDDING) {
            ASSERT_NO_FATAL_FAILURE(placeAnyBid());
        }
        while (true) {
            while (engine.getPhase() == Phase::PLAYING) {
                ASSERT_NO_FATAL_FAILURE(playAnyCard());
            }
            ASSERT_EQ(Phase::SCORING, engine.getPhase());
            const auto result = engine.evaluateTrick();
            ASSERT_TRUE(result);
            if (result->roundComplete) {
                break;
            }
        }
        ASSERT_TRUE(engine.endRound());
    }

    Wizard::Rng rng {Wizard::makeRng(2024)};
    WizardEngine engine {rng};
};

TEST_F(WizardEngineTest, testInitialState)
{
    EXPECT_EQ(Phase::WAITING, engine.getPhase());
    EXPECT_EQ(3, state().getNumberOfPlayers());
    EXPECT_EQ(0, state().currentRound);
    EXPECT_FALSE(state().activePlayerId);
    EXPECT_EQ(20, engine.getMaxRounds());
    EXPECT_FALSE(engine.hasEnded());
}

TEST_F(WizardEngineTest, testAddPlayerRejectsDuplicates)
{
    EXPECT_FALSE(engine.addPlayer("p4", "name-p1"));
    EXPECT_FALSE(engine.addPlayer("p1", "other"));
    EXPECT_EQ(3, state().getNumberOfPlayers());
}

TEST_F(WizardEngineTest, testAddPlayerRejectsWhenFull)
{
    for (const auto n : Wizard::from_to(4, 7)) {
        EXPECT_TRUE(engine.addPlayer("p" + std::to_string(n), std::to_string(n)));
    }
    EXPECT_FALSE(engine.addPlayer("p7", "7"));
    EXPECT_EQ(6, state().getNumberOfPlayers());
    EXPECT_EQ(10, engine.getMaxRounds());
}

TEST_F(WizardEngineTest, testStartRequiresMinimumPlayers)
{
    auto engine2 = WizardEngine {rng};
    EXPECT_TRUE(engine2.addPlayer("a", "a"));
    EXPECT_TRUE(engine2.addPlayer("b", "b"));
    EXPECT_FALSE(engine2.startGame());
    EXPECT_EQ(Phase::WAITING, engine2.getPhase());
}

TEST_F(WizardEngineTest, testConfigurableMinimumPlayers)
{
    auto engine2 = WizardEngine {rng, 2};
    EXPECT_EQ(2, engine2.getMinPlayers());
    EXPECT_TRUE(engine2.addPlayer("a", "a"));
    EXPECT_TRUE(engine2.addPlayer("b", "b"));
    EXPECT_TRUE(engine2.startGame());
}

TEST_F(WizardEngineTest, testStartGame)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_EQ(Phase::BIDDING, engine.getPhase());
    EXPECT_EQ(1, state().currentRound);
    EXPECT_EQ(PLAYERS[0], state().leadingPlayerId);
    EXPECT_EQ(PLAYERS[0], state().activePlayerId);
    for (const auto& player : state().players) {
        EXPECT_EQ(1u, player.hand.size());
        EXPECT_FALSE(player.bid);
    }
    EXPECT_TRUE(state().trumpCard);
    EXPECT_FALSE(engine.startGame());
    EXPECT_FALSE(engine.addPlayer("p4", "late"));
}

TEST_F(WizardEngineTest, testBidOutOfTurn)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_FALSE(engine.canBid(PLAYERS[1], 0));
    EXPECT_FALSE(engine.placeBid(PLAYERS[1], 0));
    EXPECT_FALSE(engine.placeBid("unknown", 0));
}

TEST_F(WizardEngineTest, testBidOutOfRange)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_FALSE(engine.placeBid(PLAYERS[0], -1));
    EXPECT_FALSE(engine.placeBid(PLAYERS[0], 2));
}

TEST_F(WizardEngineTest, testBidBeforeStart)
{
    EXPECT_FALSE(engine.placeBid(PLAYERS[0], 0));
    EXPECT_FALSE(engine.playCard(PLAYERS[0], 0));
}

TEST_F(WizardEngineTest, testLastBidderConstraint)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_TRUE(engine.placeBid(PLAYERS[0], 0));
    EXPECT_EQ(PLAYERS[1], state().activePlayerId);
    EXPECT_TRUE(engine.placeBid(PLAYERS[1], 0));
    EXPECT_FALSE(engine.canBid(PLAYERS[2], 1));
    EXPECT_FALSE(engine.placeBid(PLAYERS[2], 1));
    EXPECT_TRUE(engine.placeBid(PLAYERS[2], 0));
    EXPECT_EQ(Phase::PLAYING, engine.getPhase());
    EXPECT_EQ(PLAYERS[0], state().activePlayerId);
}

TEST_F(WizardEngineTest, testPlayCardCompletesTrick)
{
    ASSERT_TRUE(engine.startGame());
    while (engine.getPhase() == Phase::BIDDING) {
        ASSERT_NO_FATAL_FAILURE(placeAnyBid());
    }
    EXPECT_FALSE(engine.playCard(PLAYERS[1], 0));
    EXPECT_FALSE(engine.playCard(PLAYERS[0], 1));
    EXPECT_TRUE(engine.playCard(PLAYERS[0], 0));
    EXPECT_EQ(1u, state().currentTrick.size());
    EXPECT_EQ(PLAYERS[0], state().currentTrick.front().playedBy);
    EXPECT_TRUE(state().getPlayer(PLAYERS[0])->hand.empty());
    EXPECT_EQ(PLAYERS[1], state().activePlayerId);
    EXPECT_FALSE(engine.evaluateTrick());
    ASSERT_NO_FATAL_FAILURE(playAnyCard());
    ASSERT_NO_FATAL_FAILURE(playAnyCard());
    EXPECT_EQ(Phase::SCORING, engine.getPhase());
    EXPECT_FALSE(engine.endRound());
}

TEST_F(WizardEngineTest, testEvaluateTrickAndEndRound)
{
    ASSERT_TRUE(engine.startGame());
    while (engine.getPhase() == Phase::BIDDING) {
        ASSERT_NO_FATAL_FAILURE(placeAnyBid());
    }
    while (engine.getPhase() == Phase::PLAYING) {
        ASSERT_NO_FATAL_FAILURE(playAnyCard());
    }
    const auto result = engine.evaluateTrick();
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->roundComplete);
    EXPECT_EQ(Phase::PLAYING, engine.getPhase());
    EXPECT_EQ(result->winner, state().leadingPlayerId);
    EXPECT_EQ(result->winner, state().activePlayerId);
    EXPECT_TRUE(state().currentTrick.empty());
    EXPECT_FALSE(state().leadSuit);
    EXPECT_EQ(1, state().getPlayer(result->winner)->tricks);

    auto expected_scores = std::vector<int> {};
    for (const auto& player : state().players) {
        expected_scores.push_back(
            Wizard::calculateRoundScore(*player.bid, player.tricks));
    }

    ASSERT_TRUE(engine.endRound());
    EXPECT_EQ(2, state().currentRound);
    EXPECT_EQ(Phase::BIDDING, engine.getPhase());
    EXPECT_EQ(PLAYERS[1], state().leadingPlayerId);
    EXPECT_EQ(PLAYERS[1], state().activePlayerId);
    for (const auto n : Wizard::to(PLAYERS.size())) {
        const auto& player = state().players[n];
        EXPECT_EQ(expected_scores[n], player.score);
        EXPECT_EQ(2u, player.hand.size());
        EXPECT_EQ(0, player.tricks);
        EXPECT_FALSE(player.bid);
    }
}

TEST_F(WizardEngineTest, testFullMatch)
{
    ASSERT_TRUE(engine.startGame());
    for (const auto round : Wizard::from_to(1, engine.getMaxRounds() + 1)) {
        ASSERT_EQ(round, state().currentRound);
        ASSERT_EQ(
            PLAYERS[(round - 1) % PLAYERS.size()], state().leadingPlayerId);
        ASSERT_NO_FATAL_FAILURE(playRound());
    }
    EXPECT_EQ(Phase::FINISHED, engine.getPhase());
    EXPECT_TRUE(engine.hasEnded());
    EXPECT_FALSE(engine.endRound());
    EXPECT_FALSE(engine.evaluateTrick());
}

TEST_F(WizardEngineTest, testMaxRoundsForFourPlayers)
{
    ASSERT_TRUE(engine.addPlayer("p4", "name-p4"));
    EXPECT_EQ(15, engine.getMaxRounds());
}

TEST_F(WizardEngineTest, testBidsNeverSumToRound)
{
    ASSERT_TRUE(engine.startGame());
    for ([[maybe_unused]] const auto round : Wizard::to(5)) {
        while (engine.getPhase() == Phase::BIDDING) {
            ASSERT_NO_FATAL_FAILURE(placeAnyBid());
        }
        const auto& players = state().players;
        const auto sum = std::accumulate(
            players.begin(), players.end(), 0,
            [](const auto s, const auto& p) { return s + *p.bid; });
        EXPECT_NE(state().currentRound, sum);
        while (true) {
            while (engine.getPhase() == Phase::PLAYING) {
                ASSERT_NO_FATAL_FAILURE(playAnyCard());
            }
            const auto result = engine.evaluateTrick();
            ASSERT_TRUE(result);
            if (result->roundComplete) {
                break;
            }
        }
        ASSERT_TRUE(engine.endRound());
    }
}

TEST_F(WizardEngineTest, testProjectionHidesOtherHands)
{
    ASSERT_TRUE(engine.addSpectator("s1", "watcher"));
    ASSERT_TRUE(engine.startGame());
    const auto projection = engine.getProjection(PLAYERS[1]);
    for (const auto& player : projection.players) {
        EXPECT_EQ(player.id == PLAYERS[1], !player.hand.empty());
    }
    for (const auto& player : engine.getProjection("s1").players) {
        EXPECT_TRUE(player.hand.empty());
    }
    for (const auto& player : state().players) {
        EXPECT_FALSE(player.hand.empty());
    }
}

TEST_F(WizardEngineTest, testSpectators)
{
    EXPECT_TRUE(engine.addSpectator("s1", "watcher"));
    EXPECT_FALSE(engine.addSpectator("s1", "watcher"));
    EXPECT_FALSE(engine.addSpectator(PLAYERS[0], "watcher"));
    ASSERT_TRUE(engine.startGame());
    EXPECT_TRUE(engine.addSpectator("s2", "late watcher"));
    EXPECT_EQ(2u, state().spectators.size());
    EXPECT_TRUE(engine.removePlayer("s1"));
    EXPECT_EQ(1u, state().spectators.size());
}

TEST_F(WizardEngineTest, testRemovePlayer)
{
    EXPECT_TRUE(engine.removePlayer(PLAYERS[1]));
    EXPECT_EQ(2, state().getNumberOfPlayers());
    EXPECT_FALSE(engine.removePlayer(PLAYERS[1]));
    EXPECT_FALSE(engine.removePlayer("unknown"));
}

TEST_F(WizardEngineTest, testRemovePlayerAfterStart)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_FALSE(engine.removePlayer(PLAYERS[1]));
    EXPECT_EQ(3, state().getNumberOfPlayers());
}

TEST_F(WizardEngineTest, testSetConnected)
{
    ASSERT_TRUE(engine.startGame());
    EXPECT_TRUE(engine.setConnected(PLAYERS[2], false));
    EXPECT_FALSE(state().getPlayer(PLAYERS[2])->connected);
    EXPECT_FALSE(engine.setConnected("unknown", false));
}

TEST_F(WizardEngineTest, testNotifications)
{
    auto game_started_observer =
        std::make_shared<MockObserver<WizardEngine::GameStarted>>();
    auto bid_placed_observer =
        std::make_shared<MockObserver<WizardEngine::BidPlaced>>();
    auto card_played_observer =
        std::make_shared<NiceMock<MockObserver<WizardEngine::CardPlayed>>>();
    auto trick_completed_observer = std::make_shared<
        NiceMock<MockObserver<WizardEngine::TrickCompleted>>>();
    auto round_ended_observer =
        std::make_shared<MockObserver<WizardEngine::RoundEnded>>();
    engine.subscribeToGameStarted(game_started_observer);
    engine.subscribeToBidPlaced(bid_placed_observer);
    engine.subscribeToCardPlayed(card_played_observer);
    engine.subscribeToTrickCompleted(trick_completed_observer);
    engine.subscribeToRoundEnded(round_ended_observer);

    EXPECT_CALL(
        *game_started_observer,
        handleNotify(WizardEngine::GameStarted {3}));
    EXPECT_CALL(
        *bid_placed_observer,
        handleNotify(WizardEngine::BidPlaced {PLAYERS[0], 1}));
    EXPECT_CALL(
        *bid_placed_observer,
        handleNotify(WizardEngine::BidPlaced {PLAYERS[1], 1}));
    EXPECT_CALL(
        *bid_placed_observer,
        handleNotify(WizardEngine::BidPlaced {PLAYERS[2], 1}));
    EXPECT_CALL(
        *card_played_observer,
        handleNotify(
            Field(&WizardEngine::CardPlayed::trickComplete, false)))
        .Times(2);
    EXPECT_CALL(
        *card_played_observer,
        handleNotify(
            Field(&WizardEngine::CardPlayed::trickComplete, true)));
    EXPECT_CALL(
        *trick_completed_observer,
        handleNotify(
            Field(&WizardEngine::TrickCompleted::roundComplete, true)));
    EXPECT_CALL(
        *round_ended_observer,
        handleNotify(
            Field(&WizardEngine::RoundEnded::round, 1)));

    ASSERT_TRUE(engine.startGame());
    ASSERT_TRUE(engine.placeBid(PLAYERS[0], 1));
    ASSERT_TRUE(engine.placeBid(PLAYERS[1], 1));
    ASSERT_TRUE(engine.placeBid(PLAYERS[2], 1));
    while (engine.getPhase() == Phase::PLAYING) {
        ASSERT_NO_FATAL_FAILURE(playAnyCard());
    }
    ASSERT_TRUE(engine.evaluateTrick());
    ASSERT_TRUE(engine.endRound());
}
