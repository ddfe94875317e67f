#pragma once
#include "service-base/export.h"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace svcbase {

/// Coarse-grained lifecycle status of a worker.
/// `Stopping` is declared for a future graceful drain; no transition
/// method reaches it.
enum class ServiceState : uint8_t {
  Init = 0,
  Starting = 1,
  Started = 2,
  Stopping = 3,
  Stopped = 4
};

/// True if `state` is one of the enumerators above
bool is_valid_state(ServiceState state);

/// External representation ("init", "starting", ...).
/// Throws InvalidStateError for values outside the enumeration.
std::string to_string(ServiceState state);

/// Parse the external representation; nullopt if unknown
std::optional<ServiceState> state_from_string(const std::string &name);

/// The single shared state value of a worker process.
/// Written only through ServiceBase transitions, read by every loop.
class SERVICE_BASE_API StateCell {
public:
  StateCell() = default;
  explicit StateCell(ServiceState initial) : state_(initial) {}

  StateCell(const StateCell &) = delete;
  StateCell &operator=(const StateCell &) = delete;

  ServiceState load() const { return state_.load(std::memory_order_acquire); }

  void store(ServiceState state) {
    state_.store(state, std::memory_order_release);
  }

  /// Atomically replace the state, returning the previous value
  ServiceState exchange(ServiceState state) {
    return state_.exchange(state, std::memory_order_acq_rel);
  }

private:
  std::atomic<ServiceState> state_{ServiceState::Init};
};

} // namespace svcbase
