#include "service-base/Errors.hpp"
#include "service-base/ServiceState.hpp"

#include <gtest/gtest.h>

using namespace svcbase;

TEST(ServiceState, ExternalNames) {
  EXPECT_EQ(to_string(ServiceState::Init), "init");
  EXPECT_EQ(to_string(ServiceState::Starting), "starting");
  EXPECT_EQ(to_string(ServiceState::Started), "started");
  EXPECT_EQ(to_string(ServiceState::Stopping), "stopping");
  EXPECT_EQ(to_string(ServiceState::Stopped), "stopped");
}

TEST(ServiceState, ParseKnownNames) {
  for (auto state : {ServiceState::Init, ServiceState::Starting,
                     ServiceState::Started, ServiceState::Stopping,
                     ServiceState::Stopped}) {
    auto parsed = state_from_string(to_string(state));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, state);
  }
}

TEST(ServiceState, ParseRejectsUnknownNames) {
  EXPECT_FALSE(state_from_string("running").has_value());
  EXPECT_FALSE(state_from_string("Started").has_value());
  EXPECT_FALSE(state_from_string("").has_value());
}

TEST(ServiceState, OutOfRangeValue) {
  auto bogus = static_cast<ServiceState>(42);
  EXPECT_FALSE(is_valid_state(bogus));
  EXPECT_THROW(to_string(bogus), InvalidStateError);
}

TEST(StateCell, StartsInInit) {
  StateCell cell;
  EXPECT_EQ(cell.load(), ServiceState::Init);
}

TEST(StateCell, ExchangeReturnsPrevious) {
  StateCell cell(ServiceState::Stopped);
  EXPECT_EQ(cell.exchange(ServiceState::Started), ServiceState::Stopped);
  EXPECT_EQ(cell.exchange(ServiceState::Started), ServiceState::Started);
  EXPECT_EQ(cell.load(), ServiceState::Started);
}
