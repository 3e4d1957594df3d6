#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "ftpd/event/event_loop.h"
#include "ftpd/event/libevent_dispatcher.h"
#include "../integration/real_io_test_base.h"

using namespace ftpd::event;
using namespace std::chrono_literals;

class DispatcherRealIoTest : public ftpd::test::RealIoTestBase {
 protected:
  void TearDown() override {
    if (dispatcher_) {
      executeInDispatcher([this]() { file_events_.clear(); });
    }
    RealIoTestBase::TearDown();
  }

  std::vector<FileEventPtr> file_events_;
};

TEST_F(DispatcherRealIoTest, BasicProperties) {
  EXPECT_EQ("integration_test", dispatcher_->name());
  EXPECT_EQ("libevent", factory_->backendName());

  EXPECT_TRUE(executeInDispatcher([this]() {
    return dispatcher_->isThreadSafe();
  }));
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST_F(DispatcherRealIoTest, PostFromManyThreadsRunsEveryCallback) {
  const int per_thread = 250;
  std::atomic<int> count{0};

  std::vector<std::thread> posters;
  for (int t = 0; t < 4; ++t) {
    posters.emplace_back([&]() {
      for (int i = 0; i < per_thread; ++i) {
        dispatcher_->post([&count]() { count++; });
      }
    });
  }
  for (auto& poster : posters) {
    poster.join();
  }

  EXPECT_TRUE(waitFor([&]() { return count.load() == 4 * per_thread; }, 2s));
}

TEST_F(DispatcherRealIoTest, PostsRunInOrderOnDispatcherThread) {
  std::vector<int> order;
  std::mutex order_mutex;
  std::atomic<bool> all_on_loop{true};

  for (int i = 0; i < 50; ++i) {
    dispatcher_->post([&, i]() {
      if (!dispatcher_->isThreadSafe()) {
        all_on_loop = false;
      }
      std::lock_guard<std::mutex> lock(order_mutex);
      order.push_back(i);
    });
  }

  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(order_mutex);
    return order.size() == 50;
  }));
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(order[i], i);
  }
  EXPECT_TRUE(all_on_loop);
}

TEST_F(DispatcherRealIoTest, PostDuringDrainIsNotLost) {
  std::atomic<bool> second_ran{false};

  dispatcher_->post([&]() {
    dispatcher_->post([&]() { second_ran = true; });
  });

  EXPECT_TRUE(waitFor([&]() { return second_ran.load(); }));
}

TEST_F(DispatcherRealIoTest, FileEventRead) {
  auto pipe_fds = createPipe();
  int read_fd = pipe_fds.first;
  int write_fd = pipe_fds.second;

  std::atomic<int> bytes_read{0};

  executeInDispatcher([&]() {
    file_events_.push_back(dispatcher_->createFileEvent(
        read_fd,
        [read_fd, &bytes_read](uint32_t events) {
          if (events & static_cast<uint32_t>(FileReadyType::Read)) {
            char buffer[256];
            ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
            if (n > 0) {
              bytes_read += static_cast<int>(n);
            }
          }
        },
        FileTriggerType::Level, static_cast<uint32_t>(FileReadyType::Read)));
  });

  const char data[] = "RETR file";
  ASSERT_EQ(static_cast<ssize_t>(sizeof(data)),
            write(write_fd, data, sizeof(data)));

  EXPECT_TRUE(waitFor([&]() {
    return bytes_read.load() == static_cast<int>(sizeof(data));
  }));
}

TEST_F(DispatcherRealIoTest, DisabledFileEventDoesNotFire) {
  auto pipe_fds = createPipe();
  int write_fd = pipe_fds.second;

  std::atomic<int> fired{0};

  executeInDispatcher([&]() {
    file_events_.push_back(dispatcher_->createFileEvent(
        write_fd, [&fired](uint32_t) { fired++; }, FileTriggerType::Level,
        0));
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(fired.load(), 0);

  executeInDispatcher([&]() {
    file_events_.back()->setEnabled(
        static_cast<uint32_t>(FileReadyType::Write));
  });
  EXPECT_TRUE(waitFor([&]() { return fired.load() > 0; }));

  executeInDispatcher([&]() { file_events_.back()->setEnabled(0); });
  int after_disable = fired.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(fired.load(), after_disable);
}

TEST(LibeventDispatcherTest, ExitBeforeRunIsHonored) {
  LibeventDispatcher dispatcher("early_exit");
  dispatcher.exit();

  std::atomic<bool> returned{false};
  std::thread runner([&]() {
    dispatcher.run(RunType::RunUntilExit);
    returned = true;
  });

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!returned && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  if (!returned) {
    dispatcher.exit();
  }
  runner.join();
  EXPECT_TRUE(returned);
}

TEST(LibeventDispatcherTest, NonBlockRunDrainsPosts) {
  LibeventDispatcher dispatcher("nonblock");
  int ran = 0;
  dispatcher.post([&ran]() { ran++; });
  dispatcher.post([&ran]() { ran++; });

  dispatcher.run(RunType::NonBlock);

  EXPECT_EQ(ran, 2);
}
