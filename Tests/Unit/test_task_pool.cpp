#include <QtTest/QtTest>
#include "core/shared/task_pool.h"

#include <atomic>
#include <future>

class TestTaskPool : public QObject {
    Q_OBJECT

private slots:
    void testRunsTasks();
    void testRunReturnsValue();
    void testRunPropagatesException();
    void testQueueLimitRejects();
    void testExpiredTaskSkipped();
    void testStopRejectsNewWork();
};

void TestTaskPool::testRunsTasks()
{
    sl::TaskPool pool(QStringLiteral("test"), 3, 64);
    QCOMPARE(pool.workerCount(), 3);

    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        QVERIFY(pool.submit([&done]() { done.fetch_add(1); }));
    }
    QTRY_COMPARE(done.load(), 20);
    QTRY_COMPARE(pool.counters().completed, int64_t(20));
    QCOMPARE(pool.counters().submitted, int64_t(20));
}

void TestTaskPool::testRunReturnsValue()
{
    sl::TaskPool pool(QStringLiteral("test"), 1, 4);
    auto future = pool.run<int>([]() { return 42; });
    QVERIFY(future.has_value());
    QCOMPARE(future->get(), 42);
}

void TestTaskPool::testRunPropagatesException()
{
    sl::TaskPool pool(QStringLiteral("test"), 1, 4);
    auto future = pool.run<int>([]() -> int { throw std::runtime_error("boom"); });
    QVERIFY(future.has_value());
    bool threw = false;
    try {
        future->get();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    QVERIFY(threw);
}

void TestTaskPool::testQueueLimitRejects()
{
    sl::TaskPool pool(QStringLiteral("test"), 1, 2);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool> started{false};

    // Occupy the only worker so later submissions stay queued.
    QVERIFY(pool.submit([opened, &started]() {
        started.store(true);
        opened.wait();
    }));
    QTRY_VERIFY(started.load());

    QVERIFY(pool.submit([]() {}));
    QVERIFY(pool.submit([]() {}));
    QVERIFY(!pool.submit([]() {}));
    QCOMPARE(pool.queueDepth(), 2);
    QCOMPARE(pool.counters().rejected, int64_t(1));

    gate.set_value();
    QTRY_COMPARE(pool.counters().completed, int64_t(3));
}

void TestTaskPool::testExpiredTaskSkipped()
{
    sl::TaskPool pool(QStringLiteral("test"), 1, 4);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool> started{false};
    QVERIFY(pool.submit([opened, &started]() {
        started.store(true);
        opened.wait();
    }));
    QTRY_VERIFY(started.load());

    std::atomic<bool> ran{false};
    const auto deadline = sl::TaskPool::Clock::now() + std::chrono::milliseconds(20);
    auto future = pool.run<int>(
        [&ran]() {
            ran.store(true);
            return 1;
        },
        deadline);
    QVERIFY(future.has_value());

    QTest::qWait(60);
    gate.set_value();

    bool broken = false;
    try {
        future->get();
    } catch (const std::future_error& e) {
        broken = e.code() == std::future_errc::broken_promise;
    }
    QVERIFY(broken);
    QVERIFY(!ran.load());
    QCOMPARE(pool.counters().expired, int64_t(1));
}

void TestTaskPool::testStopRejectsNewWork()
{
    sl::TaskPool pool(QStringLiteral("test"), 2, 4);
    std::atomic<int> done{0};
    QVERIFY(pool.submit([&done]() { done.fetch_add(1); }));
    pool.stop();
    QCOMPARE(done.load(), 1);
    QVERIFY(!pool.submit([]() {}));
    QVERIFY(!pool.run<int>([]() { return 1; }).has_value());
    pool.stop();
}

QTEST_MAIN(TestTaskPool)
#include "test_task_pool.moc"
