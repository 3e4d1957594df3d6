#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "ftpd/network/socket_interface.h"
#include "ftpd/server/connection_registry.h"
#include "../support/temp_directory.h"

namespace ftpd {
namespace server {
namespace {

class ConnectionRegistryTest : public ::testing::Test {
 protected:
  Connection makeControl() {
    auto root = fs::SessionRoot::create(dir_.path());
    return Connection(
        ControlChannel(nullptr, std::move(get<fs::SessionRoot>(root))));
  }

  Connection makeData(ConnectionId owner) {
    DataChannelActive data;
    data.owner = owner;
    return Connection(std::move(data));
  }

  test::TempDirectory dir_;
  ConnectionRegistry registry_;
};

TEST_F(ConnectionRegistryTest, IdsAreUniqueAndIncreasing) {
  ConnectionId first = registry_.insert(makeControl());
  ConnectionId second = registry_.insert(makeData(first));
  ConnectionId third = registry_.insert(makeControl());

  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
  EXPECT_EQ(registry_.size(), 3u);
}

TEST_F(ConnectionRegistryTest, IdsAreNotReusedAfterRemove) {
  ConnectionId first = registry_.insert(makeControl());
  ASSERT_TRUE(registry_.remove(first).has_value());

  ConnectionId second = registry_.insert(makeControl());
  EXPECT_NE(first, second);
}

TEST_F(ConnectionRegistryTest, ControlChannelCount) {
  ConnectionId control = registry_.insert(makeControl());
  registry_.insert(makeData(control));
  registry_.insert(makeControl());
  EXPECT_EQ(registry_.controlChannelCount(), 2u);

  registry_.remove(control);
  EXPECT_EQ(registry_.controlChannelCount(), 1u);
  EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(ConnectionRegistryTest, WithConnectionMutatesInPlace) {
  ConnectionId control = registry_.insert(makeControl());

  bool found = registry_.withConnection(control, [](Connection& connection) {
    get<ControlChannel>(connection).linked_data = 42;
  });
  EXPECT_TRUE(found);

  auto linked = registry_.withConnection(control, [](Connection& connection) {
    return get<ControlChannel>(connection).linked_data;
  });
  ASSERT_TRUE(linked.has_value());
  ASSERT_TRUE(linked->has_value());
  EXPECT_EQ(**linked, 42u);
}

TEST_F(ConnectionRegistryTest, MissingIdReportsAbsence) {
  bool ran = false;
  EXPECT_FALSE(registry_.withConnection(999, [&](Connection&) { ran = true; }));
  EXPECT_FALSE(ran);

  auto value = registry_.withConnection(999, [](Connection&) { return 1; });
  EXPECT_FALSE(value.has_value());

  EXPECT_FALSE(registry_.remove(999).has_value());
  EXPECT_FALSE(registry_.contains(999));
}

TEST_F(ConnectionRegistryTest, RemoveReturnsConnection) {
  ConnectionId control = registry_.insert(makeControl());
  ConnectionId data = registry_.insert(makeData(control));

  auto removed = registry_.remove(data);
  ASSERT_TRUE(removed.has_value());
  EXPECT_STREQ(connectionRoleToString(*removed), "data-active");
  EXPECT_EQ(connectionOwner(*removed), optional<ConnectionId>(control));
  EXPECT_FALSE(registry_.contains(data));

  auto ids = registry_.ids();
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], control);
}

TEST_F(ConnectionRegistryTest, ConcurrentAccessIsSerializedPerEntry) {
  ConnectionId control = registry_.insert(makeControl());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 1000; ++i) {
        registry_.withConnection(control, [](Connection& connection) {
          auto& channel = get<ControlChannel>(connection);
          channel.linked_data = channel.linked_data.value_or(0) + 1;
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto count = registry_.withConnection(control, [](Connection& connection) {
    return *get<ControlChannel>(connection).linked_data;
  });
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 4000u);
}

TEST_F(ConnectionRegistryTest, ConcurrentInsertsGetDistinctIds) {
  std::vector<std::vector<ConnectionId>> per_thread(4);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 100; ++i) {
        per_thread[t].push_back(registry_.insert(makeData(1)));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry_.size(), 400u);
}

TEST(ConnectionTest, LinkDataReturnsReplacedConnection) {
  test::TempDirectory dir;
  auto root = fs::SessionRoot::create(dir.path());
  ControlChannel control(nullptr, std::move(get<fs::SessionRoot>(root)));

  EXPECT_FALSE(linkData(control, 5).has_value());
  EXPECT_EQ(control.linked_data, optional<ConnectionId>(5));

  auto replaced = linkData(control, 7);
  ASSERT_TRUE(replaced.has_value());
  EXPECT_EQ(*replaced, 5u);

  // Relinking the same connection replaces nothing
  EXPECT_FALSE(linkData(control, 7).has_value());
}

TEST(ConnectionTest, RolesAndOwners) {
  PassiveListener listener;
  listener.owner = 3;
  Connection as_listener(std::move(listener));
  EXPECT_STREQ(connectionRoleToString(as_listener), "passive-listener");
  EXPECT_EQ(connectionOwner(as_listener), optional<ConnectionId>(3));

  DataChannelPassive passive;
  passive.owner = 4;
  Connection as_passive(std::move(passive));
  EXPECT_STREQ(connectionRoleToString(as_passive), "data-passive");
  EXPECT_EQ(connectionOwner(as_passive), optional<ConnectionId>(4));
}

}  // namespace
}  // namespace server
}  // namespace ftpd
