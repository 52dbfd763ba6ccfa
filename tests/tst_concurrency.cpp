#include <QTest>

#include <Medgate/Errors.hpp>
#include <Medgate/FrameMailbox.hpp>
#include <Medgate/InferenceQueue.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace Medgate;
using namespace std::chrono_literals;

class ConcurrencyTest : public QObject
{
  Q_OBJECT

private:
  static bool waitFor(const std::function<bool()>& pred)
  {
    for (int i = 0; i < 500; i++)
    {
      if (pred())
        return true;
      std::this_thread::sleep_for(5ms);
    }
    return pred();
  }

private slots:
  void singleCallerRunsImmediately()
  {
    InferenceQueue queue{0};
    {
      auto ticket = queue.acquire();
      QVERIFY(ticket);
      QVERIFY(queue.active());
    }
    QVERIFY(!queue.active());
    auto again = queue.acquire();
    QVERIFY(again);
  }

  void fullQueueRejectsWithBusy()
  {
    InferenceQueue queue{1};
    auto first = queue.acquire();

    std::atomic_bool secondRan{};
    std::thread waiter{[&] {
      auto t = queue.acquire();
      secondRan = true;
    }};
    const bool queued = waitFor([&] { return queue.waiting() == 1; });

    int status = 0;
    std::string message;
    try
    {
      auto third = queue.acquire();
    }
    catch (const BusyError& e)
    {
      status = e.status();
      message = e.what();
    }

    const bool ranEarly = secondRan;
    first = InferenceQueue::Ticket{};
    waiter.join();

    QVERIFY(queued);
    QCOMPARE(status, 503);
    QCOMPARE(message, std::string("busy"));
    QVERIFY(!ranEarly);
    QVERIFY(secondRan);
    QCOMPARE(queue.waiting(), std::size_t(0));
    QVERIFY(!queue.active());
  }

  void waitersAreServedInArrivalOrder()
  {
    InferenceQueue queue{4};
    auto first = queue.acquire();

    std::mutex m;
    std::vector<int> order;
    std::vector<std::thread> threads;
    bool queued = true;
    for (int i = 0; i < 3; i++)
    {
      threads.emplace_back([&, i] {
        auto t = queue.acquire();
        std::lock_guard lock{m};
        order.push_back(i);
      });
      queued = queued && waitFor([&] { return queue.waiting() == std::size_t(i + 1); });
    }

    first = InferenceQueue::Ticket{};
    for (auto& t : threads)
      t.join();
    QVERIFY(queued);
    QCOMPARE(order, (std::vector<int>{0, 1, 2}));
  }

  void mailboxProcessesFirstFrameImmediately()
  {
    FrameMailbox box;
    auto now = box.offer("a");
    QVERIFY(now);
    QCOMPARE(*now, QByteArray("a"));
    QVERIFY(box.busy());
    QVERIFY(!box.finish());
    QVERIFY(!box.busy());
  }

  void mailboxKeepsOnlyTheLatestFrame()
  {
    FrameMailbox box;
    QVERIFY(box.offer("1"));
    QVERIFY(!box.offer("2"));
    QVERIFY(!box.offer("3"));
    QVERIFY(!box.offer("4"));
    QCOMPARE(box.dropped(), std::uint64_t(2));
    QVERIFY(box.hasPending());

    auto next = box.finish();
    QVERIFY(next);
    QCOMPARE(*next, QByteArray("4"));
    QVERIFY(box.busy());
    QVERIFY(!box.hasPending());

    QVERIFY(!box.finish());
    QVERIFY(!box.busy());
    QCOMPARE(box.dropped(), std::uint64_t(2));
  }
};

QTEST_GUILESS_MAIN(ConcurrencyTest)
#include "tst_concurrency.moc"
