#include "../test_utils/FakeChannels.hpp"
#include "service-base/Errors.hpp"
#include "service-base/ipc/ControlProtocol.hpp"
#include "service-base/service/ControlListener.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace svcbase;
using namespace svcbase::test;

TEST(ControlListener, ForeignSidIsIgnored) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  listener.handle_message(ipc::serialize_control("w2", "stop"));
  listener.handle_message(ipc::serialize_control("w2", "start"));

  EXPECT_EQ(control.stops.load(), 0);
  EXPECT_EQ(control.runs.load(), 0);
  EXPECT_EQ(control.starts.load(), 0);
  EXPECT_EQ(listener.commands_applied(), 0u);
}

TEST(ControlListener, StopCallsStopOnce) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  listener.handle_message(R"({"sid": "w1", "action": "stop"})");

  EXPECT_EQ(control.stops.load(), 1);
  EXPECT_EQ(control.runs.load(), 0);
  EXPECT_EQ(control.starts.load(), 0);
}

TEST(ControlListener, StartCallsRunNotStart) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  listener.handle_message(R"({"sid": "w1", "action": "start"})");

  EXPECT_EQ(control.runs.load(), 1);
  EXPECT_EQ(control.starts.load(), 0);
  EXPECT_EQ(control.stops.load(), 0);
}

TEST(ControlListener, OtherActionsAreIgnored) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  listener.handle_message(R"({"sid": "w1", "action": "pause"})");

  EXPECT_EQ(control.runs + control.starts + control.stops, 0);
  EXPECT_EQ(listener.commands_applied(), 0u);
}

TEST(ControlListener, MalformedMessageThrows) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  channel.push("{broken");
  EXPECT_THROW(listener.poll_once(), ProtocolError);
  EXPECT_EQ(control.runs + control.starts + control.stops, 0);
}

TEST(ControlListener, LoopDiesOnMalformedMessage) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  channel.push(ipc::serialize_control("w1", "stop"));
  channel.push(R"({"action": "stop"})");
  channel.push(ipc::serialize_control("w1", "start"));

  EXPECT_THROW(listener.run_loop(), ProtocolError);
  EXPECT_EQ(control.stops.load(), 1);
  // The message after the malformed one is never applied
  EXPECT_EQ(control.runs.load(), 0);
}

TEST(ControlListener, IncompleteMessageForOtherWorkerIsIgnored) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  std::atomic<bool> interrupted{false};
  std::thread loop([&]() {
    try {
      listener.run_loop();
    } catch (const TransportError &) {
      interrupted = true;
    }
  });

  channel.push(R"({"sid": "w2"})");
  channel.push(R"({"sid": "w2", "action": 7})");
  channel.push(R"({"sid": null, "action": "stop"})");
  channel.push(R"({"sid": 42, "action": "stop"})");
  channel.push(ipc::serialize_control("w1", "stop"));

  EXPECT_TRUE(wait_until([&]() { return control.stops == 1; },
                         std::chrono::seconds(2)));

  channel.interrupt();
  loop.join();
  EXPECT_TRUE(interrupted);
  EXPECT_EQ(listener.commands_applied(), 1u);
}

TEST(ControlListener, NonStringActionForThisWorkerIsIgnored) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  listener.handle_message(R"({"sid": "w1", "action": 7})");
  EXPECT_EQ(control.runs + control.starts + control.stops, 0);

  EXPECT_THROW(listener.handle_message(R"({"sid": "w1"})"), ProtocolError);
}

TEST(ControlListener, StopDrivesServiceToStopped) {
  RecordingWorkerBody body;
  ServiceBase service("test", "w1", body);
  FakeControlChannel channel;
  ControlListener listener("test", "w1", service, channel);

  service.start();
  ASSERT_EQ(service.state(), ServiceState::Started);

  channel.push(ipc::serialize_control("w1", "stop"));
  listener.poll_once();
  EXPECT_EQ(service.state(), ServiceState::Stopped);

  channel.push(ipc::serialize_control("w1", "start"));
  listener.poll_once();
  EXPECT_EQ(service.state(), ServiceState::Started);
  EXPECT_EQ(body.run_count(), 2);

  // Already started: the guard keeps the body from running again
  channel.push(ipc::serialize_control("w1", "start"));
  listener.poll_once();
  EXPECT_EQ(body.run_count(), 2);
}

TEST(ControlListener, LoopAppliesCommandsUntilInterrupted) {
  RecordingControl control;
  FakeControlChannel channel;
  ControlListener listener("test", "w1", control, channel);

  std::atomic<bool> interrupted{false};
  std::thread loop([&]() {
    try {
      listener.run_loop();
    } catch (const TransportError &) {
      interrupted = true;
    }
  });

  channel.push(ipc::serialize_control("w1", "stop"));
  channel.push(ipc::serialize_control("w3", "stop"));
  channel.push(ipc::serialize_control("w1", "start"));

  EXPECT_TRUE(wait_until([&]() { return control.runs == 1; },
                         std::chrono::seconds(2)));
  EXPECT_EQ(control.stops.load(), 1);

  listener.request_stop();
  channel.interrupt();
  loop.join();
  EXPECT_TRUE(interrupted);
}
