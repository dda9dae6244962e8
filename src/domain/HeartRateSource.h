// HeartRateSource.h
// What the watchdog needs from a heart rate connection: the Reading stream,
// a blocking reconnect and the disposed flag.

#pragma once

#include <stdint.h>

#include <string>

#include "src/domain/DeviceTarget.h"
#include "src/domain/ReadingBroadcast.h"

enum class ConnectError {
  None = 0,
  DiscoveryFailed,      // no eligible device found
  ConnectionFailed,     // session, service or characteristic resolution failed
  ConfigurationFailed,  // notify subscription not acknowledged as success
  Disposed,             // attempted after teardown
};

inline const char* connectErrorName(ConnectError e) {
  switch (e) {
    case ConnectError::None: return "None";
    case ConnectError::DiscoveryFailed: return "DiscoveryFailed";
    case ConnectError::ConnectionFailed: return "ConnectionFailed";
    case ConnectError::ConfigurationFailed: return "ConfigurationFailed";
    case ConnectError::Disposed: return "Disposed";
  }
  return "Unknown";
}

struct ConnectResult {
  ConnectError error = ConnectError::None;
  std::string message;

  bool ok() const { return error == ConnectError::None; }

  static ConnectResult success() { return ConnectResult(); }

  static ConnectResult failure(ConnectError e, const std::string& msg) {
    ConnectResult r;
    r.error = e;
    r.message = msg;
    return r;
  }
};

class HeartRateSource {
 public:
  virtual ~HeartRateSource() = default;

  virtual bool isDisposed() const = 0;

  // Connects, retrying until success or disposal. Blocks.
  virtual ConnectResult initiateDefault(const DeviceTarget& target) = 0;

  virtual uint32_t subscribe(ReadingBroadcast::Callback cb, void* ctx) = 0;
  virtual bool unsubscribe(uint32_t id) = 0;
};
