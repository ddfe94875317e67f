#pragma once
#include "service-base/export.h"

namespace svcbase {

/// Domain logic of a concrete worker. The service core holds a reference
/// to this interface and calls run() each time it enters `started`.
///
/// run() executes on the caller's thread (the boot thread, or the control
/// listener after a remote start). It should return once the service
/// leaves `started`; until it returns, no further control command is
/// processed.
class SERVICE_BASE_API WorkerBody {
public:
  virtual ~WorkerBody() = default;

  /// Default job: publish, then subscribe
  virtual void run() {
    publish();
    subscribe();
  }

  /// Publish domain messages (PUB workers)
  virtual void publish() {}

  /// Consume domain messages from subscribed publishers (SUB workers)
  virtual void subscribe() {}
};

} // namespace svcbase
