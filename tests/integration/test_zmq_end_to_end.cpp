#include "../test_utils/FakeChannels.hpp"
#include "service-base/Errors.hpp"
#include "service-base/ipc/ControlProtocol.hpp"
#include "service-base/ipc/ZmqChannels.hpp"
#include "service-base/service/ServiceRunner.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <zmq.hpp>

using namespace svcbase;
using namespace svcbase::test;

namespace {

constexpr const char *kHeartbeatAddr = "inproc://monitor-heartbeat";
constexpr const char *kControlAddr = "inproc://monitor-control";

/// Monitor side of both channels, bound on the shared context
class FakeMonitor {
public:
  explicit FakeMonitor(zmq::context_t &context)
      : rep_(context, zmq::socket_type::rep),
        pub_(context, zmq::socket_type::pub) {
    rep_.set(zmq::sockopt::linger, 0);
    rep_.set(zmq::sockopt::rcvtimeo, 2000);
    pub_.set(zmq::sockopt::linger, 0);
    rep_.bind(kHeartbeatAddr);
    pub_.bind(kControlAddr);
  }

  /// Receive one heartbeat and acknowledge it; null JSON on timeout
  nlohmann::json next_heartbeat() {
    zmq::message_t msg;
    if (!rep_.recv(msg, zmq::recv_flags::none)) {
      return nullptr;
    }
    static_cast<void>(
        rep_.send(zmq::str_buffer("ack"), zmq::send_flags::none));
    return nlohmann::json::parse(msg.to_string());
  }

  void publish(const std::string &sid, const std::string &action) {
    std::string payload = ipc::serialize_control(sid, action);
    static_cast<void>(pub_.send(zmq::buffer(payload), zmq::send_flags::none));
  }

private:
  zmq::socket_t rep_;
  zmq::socket_t pub_;
};

class ZmqEndToEndTest : public ::testing::Test {
protected:
  zmq::context_t context_;
  FakeMonitor monitor_{context_};
  ipc::ZmqHeartbeatChannel heartbeat_channel_{context_, kHeartbeatAddr};
  ipc::ZmqControlChannel control_channel_{context_, kControlAddr};

  RecordingWorkerBody body_;
  ServiceBase service_{"e2e", "w1", body_};
  HeartbeatReporter reporter_{"e2e",
                              "w1",
                              service_.state_cell(),
                              heartbeat_channel_,
                              {{"host", "test-host"}},
                              std::chrono::milliseconds(20)};
  ControlListener listener_{"e2e", "w1", service_, control_channel_};
  ServiceRunner runner_{service_, reporter_, listener_, heartbeat_channel_,
                        control_channel_};
};

} // namespace

TEST_F(ZmqEndToEndTest, HeartbeatReportsStartedAfterBoot) {
  runner_.launch();

  nlohmann::json hb;
  for (int i = 0; i < 50; i++) {
    hb = monitor_.next_heartbeat();
    ASSERT_FALSE(hb.is_null()) << "monitor received no heartbeat";
    if (hb["state"] == "started")
      break;
  }

  EXPECT_EQ(hb["state"], "started");
  EXPECT_EQ(hb["sid"], "w1");
  EXPECT_EQ(hb["type"], "heartbeat");
  EXPECT_EQ(hb["host"], "test-host");
  EXPECT_EQ(body_.run_count(), 1);

  runner_.shutdown();
}

TEST_F(ZmqEndToEndTest, RemoteStopReachesWorker) {
  runner_.launch();

  // Wait for the worker to report started
  bool started = false;
  for (int i = 0; i < 50 && !started; i++) {
    auto hb = monitor_.next_heartbeat();
    ASSERT_FALSE(hb.is_null());
    started = hb["state"] == "started";
  }
  ASSERT_TRUE(started);

  // PUB drops messages until the subscription is in place, so repeat
  bool stopped = false;
  for (int i = 0; i < 100 && !stopped; i++) {
    monitor_.publish("w1", "stop");
    auto hb = monitor_.next_heartbeat();
    ASSERT_FALSE(hb.is_null());
    stopped = hb["state"] == "stopped";
  }

  EXPECT_TRUE(stopped);
  EXPECT_EQ(service_.state(), ServiceState::Stopped);

  runner_.shutdown();
  EXPECT_FALSE(runner_.has_failed());
}

TEST_F(ZmqEndToEndTest, ForeignStopLeavesWorkerStarted) {
  runner_.launch();

  bool started = false;
  for (int i = 0; i < 50 && !started; i++) {
    auto hb = monitor_.next_heartbeat();
    ASSERT_FALSE(hb.is_null());
    started = hb["state"] == "started";
  }
  ASSERT_TRUE(started);

  for (int i = 0; i < 10; i++) {
    monitor_.publish("w2", "stop");
    auto hb = monitor_.next_heartbeat();
    ASSERT_FALSE(hb.is_null());
    EXPECT_EQ(hb["state"], "started");
  }

  runner_.shutdown();
}

TEST(ZmqChannels, ShutdownUnblocksReceive) {
  zmq::context_t context;
  ipc::ZmqControlChannel channel(context, kControlAddr);

  std::atomic<bool> unblocked{false};
  std::thread reader([&]() {
    try {
      channel.receive();
    } catch (const TransportError &) {
      unblocked = true;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  channel.interrupt();
  reader.join();
  EXPECT_TRUE(unblocked);
}
