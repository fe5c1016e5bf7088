#include <QtTest/QtTest>

#include <QThread>

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "common/errors.hpp"
#include "daemon/sync_rate_limiter.hpp"

using namespace std::chrono_literals;

namespace {

// Manually advanced clock shared with the limiter under test.
struct FakeClock {
    blastd::SyncRateLimiter::Clock::time_point now{std::chrono::hours(1000)};

    blastd::SyncRateLimiter::TimeSource source()
    {
        return [this] { return now; };
    }
};

bool refusesCheck(blastd::SyncRateLimiter &limiter)
{
    try {
        limiter.check();
    } catch (const blastd::RateLimited &) {
        return true;
    }
    return false;
}

} // namespace

class RateLimiterTests : public QObject
{
    Q_OBJECT
private slots:
    void testAdmitsUpToLimit();
    void testEleventhRefusedWithRetryAfter();
    void testReadmitsWhenOldestAgesOut();
    void testCheckDoesNotRecord();
    void testConcurrentAdmitNeverExceedsLimit();
};

void RateLimiterTests::testAdmitsUpToLimit()
{
    FakeClock clock;
    blastd::SyncRateLimiter limiter(10, 10min, clock.source());

    for (int i = 0; i < 10; ++i) {
        limiter.admit();
        clock.now += 1s;
    }
    QCOMPARE(limiter.recentCount(), 10);
}

void RateLimiterTests::testEleventhRefusedWithRetryAfter()
{
    FakeClock clock;
    blastd::SyncRateLimiter limiter(10, 10min, clock.source());

    for (int i = 0; i < 10; ++i) {
        limiter.admit();
    }
    clock.now += 1s;

    bool refused = false;
    try {
        limiter.admit();
    } catch (const blastd::RateLimited &ex) {
        refused = true;
        QCOMPARE(static_cast<int>(ex.retryAfter().count()), 599);
        QCOMPARE(QString::fromUtf8(ex.what()),
                 QStringLiteral("rate limited: try again in 9m59s"));
    }
    QVERIFY(refused);
    QCOMPARE(limiter.recentCount(), 10);
}

void RateLimiterTests::testReadmitsWhenOldestAgesOut()
{
    FakeClock clock;
    blastd::SyncRateLimiter limiter(10, 10min, clock.source());

    const auto start = clock.now;
    for (int i = 0; i < 10; ++i) {
        clock.now = start + std::chrono::seconds(i * 30);
        limiter.admit();
    }

    clock.now = start + 10min - 1s;
    QVERIFY(refusesCheck(limiter));

    clock.now = start + 10min + 1s;
    limiter.admit();
    QCOMPARE(limiter.recentCount(), 10);

    QVERIFY(refusesCheck(limiter));
}

void RateLimiterTests::testCheckDoesNotRecord()
{
    FakeClock clock;
    blastd::SyncRateLimiter limiter(2, 1min, clock.source());

    limiter.check();
    limiter.check();
    limiter.check();
    QCOMPARE(limiter.recentCount(), 0);

    limiter.record();
    limiter.record();
    QVERIFY(refusesCheck(limiter));
}

void RateLimiterTests::testConcurrentAdmitNeverExceedsLimit()
{
    blastd::SyncRateLimiter limiter(10, 10min);
    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};

    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < 32; ++i) {
        threads.emplace_back(QThread::create([&limiter, &admitted, &refused] {
            try {
                limiter.admit();
                ++admitted;
            } catch (const blastd::RateLimited &) {
                ++refused;
            }
        }));
    }
    for (auto &thread : threads) {
        thread->start();
    }
    for (auto &thread : threads) {
        QVERIFY(thread->wait(5000));
    }

    QCOMPARE(admitted.load(), 10);
    QCOMPARE(refused.load(), 22);
}

QTEST_MAIN(RateLimiterTests)
#include "test_rate_limiter.moc"
