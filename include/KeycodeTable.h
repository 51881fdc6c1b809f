#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

// Linux evdev key codes and the names a layout may use for them. Built once
// from <linux/input-event-codes.h>; read-only afterwards.
class KeycodeTable
{
  std::unordered_map<uint32_t, std::string> names;
  std::unordered_map<std::string, uint32_t> codes;

  KeycodeTable();
  void add(const std::string& name, uint32_t code, bool canonical);

public:
  KeycodeTable(const KeycodeTable&) = delete;
  KeycodeTable& operator=(const KeycodeTable&) = delete;

  // Throws std::runtime_error the first time if the table cannot be built.
  static const KeycodeTable& instance();

  // Canonical symbolic name for a raw code, e.g. 42 -> "leftshift".
  std::optional<std::string> resolve(uint32_t code) const;

  // Name or alias to code. Throws std::invalid_argument for unknown and
  // ambiguous names.
  uint32_t lookup(const std::string& name) const;

  // Lowercases, drops '_' and drops '-' when the name contains a letter.
  static std::string normalize(const std::string& name);

  size_t size() const { return names.size(); }
};
