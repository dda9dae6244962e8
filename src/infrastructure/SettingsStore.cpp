// SettingsStore.cpp

#include "SettingsStore.h"
// Implementation notes
// - Uses Arduino Preferences (ESP32 NVS) under the namespace `heartrate`.
// - The address is stored as text ("AA:BB:CC:DD:EE:FF", or empty for any
//   device) so it can be provisioned from a serial console.
#include <Preferences.h>

#include "src/infrastructure/Logger.h"

static const char* kNs = "heartrate";
static const uint16_t kSchemaV = 1;

bool SettingsStore::load(HeartRateSettings &settingsOut) {
  Preferences pref;
  if (!pref.begin(kNs, true)) return false;
  bool ok = false;
  uint16_t v = pref.getUShort("cfg_v", 0);
  if (v == kSchemaV) {
    HeartRateSettings s = settingsOut;
    String addr = pref.getString("bt_addr", String());
    if (!DeviceTarget::parse(addr.c_str(), s.target)) {
      Logger::warn("Settings: ignoring malformed bt_addr '%s'", addr.c_str());
      s.target = DeviceTarget::any();
    }
    s.disconnectedTimeoutMs = pref.getULong("dc_to_ms", s.disconnectedTimeoutMs);
    s.watchdogPollMs = pref.getULong("wd_poll_ms", s.watchdogPollMs);
    s.logLevel = pref.getUChar("log_lvl", s.logLevel);
    s.normalize();
    settingsOut = s;
    ok = true;
  }
  pref.end();
  return ok;
}

bool SettingsStore::save(const HeartRateSettings &settingsIn) {
  Preferences pref;
  if (!pref.begin(kNs, false)) return false;

  pref.putUShort("cfg_v", kSchemaV);
  const std::string addr = settingsIn.target.hasAddress
                               ? DeviceTarget::format(settingsIn.target.address)
                               : std::string();
  pref.putString("bt_addr", addr.c_str());
  pref.putULong("dc_to_ms", settingsIn.disconnectedTimeoutMs);
  pref.putULong("wd_poll_ms", settingsIn.watchdogPollMs);
  pref.putUChar("log_lvl", settingsIn.logLevel);

  pref.end();
  return true;
}
