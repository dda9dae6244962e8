// DeviceTarget.cpp

#include "DeviceTarget.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

const uint64_t DeviceTarget::kAddressMask;

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool parseColonHex(const std::string& s, uint64_t& out) {
  // Exactly six two-digit octets separated by ':'
  if (s.size() != 17) return false;
  uint64_t value = 0;
  for (size_t octet = 0; octet < 6; ++octet) {
    const size_t i = octet * 3;
    int hi = hexValue(s[i]);
    int lo = hexValue(s[i + 1]);
    if (hi < 0 || lo < 0) return false;
    if (octet < 5 && s[i + 2] != ':') return false;
    value = (value << 8) | (uint64_t)(hi * 16 + lo);
  }
  out = value;
  return true;
}

static bool parseDecimal(const std::string& s, uint64_t& out) {
  if (s.empty() || s.size() > 15) return false;
  uint64_t value = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (!isdigit((unsigned char)s[i])) return false;
    value = value * 10 + (uint64_t)(s[i] - '0');
  }
  if (value > DeviceTarget::kAddressMask) return false;
  out = value;
  return true;
}

bool DeviceTarget::parse(const char* text, DeviceTarget& outTarget) {
  if (!text) {
    outTarget = any();
    return true;
  }

  // Trim surrounding whitespace
  const char* begin = text;
  while (*begin && isspace((unsigned char)*begin)) ++begin;
  const char* end = begin + strlen(begin);
  while (end > begin && isspace((unsigned char)end[-1])) --end;
  const std::string s(begin, end);

  if (s.empty()) {
    outTarget = any();
    return true;
  }

  uint64_t address = 0;
  if (s.find(':') != std::string::npos) {
    if (!parseColonHex(s, address)) return false;
  } else if (!parseDecimal(s, address)) {
    return false;
  }
  outTarget = forAddress(address);
  return true;
}

std::string DeviceTarget::format(uint64_t address) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
           (unsigned)((address >> 40) & 0xFF), (unsigned)((address >> 32) & 0xFF),
           (unsigned)((address >> 24) & 0xFF), (unsigned)((address >> 16) & 0xFF),
           (unsigned)((address >> 8) & 0xFF), (unsigned)(address & 0xFF));
  return std::string(buf);
}
