#include "MockObserver.hh"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using testing::Field;
using testing::InSequence;
using testing::InvokeWithoutArgs;

namespace {

struct ScoreChanged {
    std::string player;
    int score;
};

using MockScoreObserver = Wizard::MockObserver<ScoreChanged>;

auto scoreOf(const std::string& player, const int score)
{
    return testing::AllOf(
        Field(&ScoreChanged::player, player),
        Field(&ScoreChanged::score, score));
}

}

class ObserverTest : public testing::Test {
protected:
    std::shared_ptr<MockScoreObserver> first {
        std::make_shared<testing::StrictMock<MockScoreObserver>>()};
    std::shared_ptr<MockScoreObserver> second {
        std::make_shared<testing::StrictMock<MockScoreObserver>>()};
    Wizard::Observable<ScoreChanged> observable;
};

TEST_F(ObserverTest, testEveryObserverIsNotified)
{
    EXPECT_CALL(*first, handleNotify(scoreOf("alice", 30)));
    EXPECT_CALL(*second, handleNotify(scoreOf("alice", 30)));
    observable.subscribe(first);
    observable.subscribe(second);
    observable.notifyAll(ScoreChanged {"alice", 30});
}

TEST_F(ObserverTest, testExpiredObserverIsDropped)
{
    EXPECT_CALL(*second, handleNotify(scoreOf("bob", -10)));
    observable.subscribe(first);
    observable.subscribe(second);
    first.reset();
    observable.notifyAll(ScoreChanged {"bob", -10});
}

TEST_F(ObserverTest, testNotificationFromObserverIsDeferred)
{
    {
        InSequence sequence;
        EXPECT_CALL(*first, handleNotify(scoreOf("alice", 20)))
            .WillOnce(
                InvokeWithoutArgs(
                    [this]()
                    {
                        observable.notifyAll(ScoreChanged {"bob", 40});
                    }));
        EXPECT_CALL(*second, handleNotify(scoreOf("alice", 20)));
        EXPECT_CALL(*first, handleNotify(scoreOf("bob", 40)));
        EXPECT_CALL(*second, handleNotify(scoreOf("bob", 40)));
    }
    observable.subscribe(first);
    observable.subscribe(second);
    observable.notifyAll(ScoreChanged {"alice", 20});
}

TEST_F(ObserverTest, testObserverSubscribingDuringNotification)
{
    {
        InSequence sequence;
        EXPECT_CALL(*first, handleNotify(scoreOf("alice", 10)))
            .WillOnce(
                InvokeWithoutArgs(
                    [this]() { observable.subscribe(second); }));
        EXPECT_CALL(*first, handleNotify(scoreOf("alice", 50)));
        EXPECT_CALL(*second, handleNotify(scoreOf("alice", 50)));
    }
    observable.subscribe(first);
    observable.notifyAll(ScoreChanged {"alice", 10});
    observable.notifyAll(ScoreChanged {"alice", 50});
}
