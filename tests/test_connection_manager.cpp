//
//  test_connection_manager.cpp
//  speech-io
//

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "speech-io/net/connection_manager.hpp"
#include "speech-io/net/wss_connector.hpp"
#include "test_util.hpp"

using namespace sio::net;
using namespace sio::test;
using namespace std::chrono_literals;

namespace {

struct ManagerFixture : public ::testing::Test {
  void SetUp() override {
    connector = std::make_shared<FakeConnector>();
  }

  std::shared_ptr<ConnectionManager> make(std::chrono::milliseconds interval = 20ms) {
    return std::make_shared<ConnectionManager>(io.get_executor(), connector, interval, "test-conn");
  }

  boost::asio::io_context io;
  std::shared_ptr<FakeConnector> connector;
};

}  // namespace

TEST_F(ManagerFixture, NullConnectorThrows) {
  EXPECT_THROW(ConnectionManager(io.get_executor(), nullptr, 1s), std::invalid_argument);
}

TEST_F(ManagerFixture, StartConnects) {
  auto mgr = make();
  mgr->start();

  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));
  EXPECT_EQ(connector->attempts, 1);
  EXPECT_EQ(mgr->connections(), 1u);
  EXPECT_EQ(mgr->handle(), connector->last());

  mgr->close();
}

TEST_F(ManagerFixture, ConnectIsNoOpWhenAlive) {
  auto mgr = make();
  mgr->start();
  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));

  std::shared_ptr<Connection> got;
  mgr->connect([&](std::shared_ptr<Connection> c) { got = c; });

  EXPECT_EQ(got, mgr->handle());
  EXPECT_EQ(connector->attempts, 1);

  mgr->close();
}

TEST_F(ManagerFixture, ConcurrentConnectsShareOneAttempt) {
  connector->defer = true;
  auto mgr = make(10s);

  int done = 0;
  mgr->connect([&](std::shared_ptr<Connection> c) { done += c ? 1 : 0; });
  mgr->connect([&](std::shared_ptr<Connection> c) { done += c ? 1 : 0; });

  EXPECT_TRUE(mgr->is_connecting());
  EXPECT_EQ(connector->attempts, 1);

  connector->complete();
  ASSERT_TRUE(run_until(io, [&] { return done == 2; }));
  EXPECT_FALSE(mgr->is_connecting());
  EXPECT_EQ(mgr->connections(), 1u);

  mgr->close();
}

TEST_F(ManagerFixture, SupervisorReconnectsDeadConnection) {
  auto mgr = make();
  mgr->start();
  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));

  auto first = connector->last();
  first->alive = false;

  ASSERT_TRUE(run_until(io, [&] { return mgr->connections() == 2; }));
  EXPECT_TRUE(mgr->is_alive());
  EXPECT_NE(mgr->handle(), first);
  // the replaced handle was closed
  EXPECT_GE(first->close_calls, 1);

  mgr->close();
}

TEST_F(ManagerFixture, FailedAttemptIsRetried) {
  connector->fail = true;
  auto mgr = make();
  mgr->start();

  ASSERT_TRUE(run_until(io, [&] { return connector->attempts >= 2; }));
  EXPECT_FALSE(mgr->is_alive());

  connector->fail = false;
  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));

  mgr->close();
}

TEST_F(ManagerFixture, ConnectorExceptionReportsNoHandle) {
  connector->throw_on_connect = true;
  auto mgr = make(10s);

  bool called = false;
  std::shared_ptr<Connection> got = connector->last();
  mgr->connect([&](std::shared_ptr<Connection> c) {
    called = true;
    got = c;
  });

  EXPECT_TRUE(called);
  EXPECT_EQ(got, nullptr);
  EXPECT_FALSE(mgr->is_connecting());

  mgr->close();
}

TEST_F(ManagerFixture, InboundFramesFromOtherThreads) {
  auto mgr = make();
  mgr->start();
  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));

  std::thread t([conn = connector->last()] {
    conn->inject("one");
    conn->inject("two");
  });
  t.join();

  std::vector<std::string> got;
  auto pull = [&]() {
    mgr->async_receive([&](boost::system::error_code ec, std::string msg) {
      if (!ec) {
        got.push_back(msg);
      }
    });
  };
  pull();
  ASSERT_TRUE(run_until(io, [&] { return got.size() == 1; }));
  pull();
  ASSERT_TRUE(run_until(io, [&] { return got.size() == 2; }));

  EXPECT_EQ(got[0], "one");
  EXPECT_EQ(got[1], "two");

  mgr->close();
}

TEST_F(ManagerFixture, CloseIsIdempotent) {
  auto mgr = make();
  mgr->start();
  ASSERT_TRUE(run_until(io, [&] { return mgr->is_alive(); }));

  auto conn = connector->last();
  mgr->close();
  mgr->close();

  EXPECT_TRUE(mgr->is_closed());
  EXPECT_FALSE(mgr->is_alive());
  EXPECT_EQ(mgr->handle(), nullptr);
  EXPECT_EQ(conn->close_calls, 1);

  boost::system::error_code ec;
  mgr->async_receive([&](boost::system::error_code e, std::string) { ec = e; });
  drain(io);
  EXPECT_EQ(ec, boost::asio::error::operation_aborted);

  // nothing left to supervise
  drain(io);
  EXPECT_EQ(connector->attempts, 1);
}

TEST_F(ManagerFixture, ConnectionReadyAfterCloseIsDropped) {
  connector->defer = true;
  auto mgr = make(10s);
  mgr->connect();
  mgr->close();

  connector->complete();
  drain(io);

  EXPECT_EQ(mgr->handle(), nullptr);
  EXPECT_EQ(connector->last()->close_calls, 1);
}

// =============================================================================
// WSS CONNECTION
// =============================================================================

namespace {

WSSEndpoint local_endpoint() {
  WSSEndpoint ep;
  ep.host = "127.0.0.1";
  // nothing listens on port 1
  ep.port = "1";
  ep.target = "/";
  ep.connect_timeout = std::chrono::seconds(1);
  return ep;
}

}  // namespace

TEST(WSSConnection, RefusedConnectReportsNoConnection) {
  boost::asio::io_context io;
  WSSConnector connector(io, local_endpoint());

  bool ready = false;
  std::shared_ptr<Connection> got;
  connector.async_connect([](std::string&&) { },
                          [&](std::shared_ptr<Connection> conn) {
                            ready = true;
                            got = std::move(conn);
                          });

  ASSERT_TRUE(run_until(io, [&] { return ready; }, 3s));
  EXPECT_EQ(got, nullptr);
}

TEST(WSSConnection, CloseBeforeOpenReportsOnce) {
  boost::asio::io_context io;
  int reports = 0;
  std::shared_ptr<Connection> got;

  auto conn = std::make_shared<WSSConnection>(
      io, WSSConnector::default_ssl_context(), local_endpoint(),
      [](std::string&&) { },
      [&](std::shared_ptr<Connection> c) {
        ++reports;
        got = std::move(c);
      });
  conn->start();
  conn->close();
  conn->send("late");

  ASSERT_TRUE(run_until(io, [&] { return reports > 0; }));
  drain(io);

  EXPECT_EQ(reports, 1);
  EXPECT_EQ(got, nullptr);
  EXPECT_FALSE(conn->is_alive());
}
