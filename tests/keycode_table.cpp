#include <gtest/gtest.h>
#include <linux/input-event-codes.h>
#include <stdexcept>
#include <string>

#include "KeycodeTable.h"

static std::string
lookupError(const std::string& name)
{
  try {
    KeycodeTable::instance().lookup(name);
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return "";
}

TEST(KEYCODES, resolvesCanonicalNames) {
  const auto& table = KeycodeTable::instance();
  ASSERT_EQ(table.resolve(KEY_A), "a");
  ASSERT_EQ(table.resolve(KEY_LEFTSHIFT), "leftshift");
  ASSERT_EQ(table.resolve(KEY_FN_ESC), "fnesc");
  ASSERT_EQ(table.resolve(KEY_1), "1");
  ASSERT_GT(table.size(), 200u);
}

TEST(KEYCODES, unknownCodeHasNoName) {
  ASSERT_FALSE(KeycodeTable::instance().resolve(0xFFFF).has_value());
}

TEST(KEYCODES, normalize) {
  ASSERT_EQ(KeycodeTable::normalize("Left_Shift"), "leftshift");
  ASSERT_EQ(KeycodeTable::normalize("volume-down"), "volumedown");
  ASSERT_EQ(KeycodeTable::normalize("-"), "-");
  ASSERT_EQ(KeycodeTable::normalize("KP_Enter"), "kpenter");
}

TEST(KEYCODES, lookupAcceptsAliases) {
  const auto& table = KeycodeTable::instance();
  ASSERT_EQ(table.lookup("Esc"), KEY_ESC);
  ASSERT_EQ(table.lookup("escape"), KEY_ESC);
  ASSERT_EQ(table.lookup("-"), KEY_MINUS);
  ASSERT_EQ(table.lookup("["), KEY_LEFTBRACE);
  ASSERT_EQ(table.lookup("lshift"), KEY_LEFTSHIFT);
  ASSERT_EQ(table.lookup("altgr"), KEY_RIGHTALT);
  ASSERT_EQ(table.lookup("lwin"), KEY_LEFTMETA);
  ASSERT_EQ(table.lookup("PgUp"), KEY_PAGEUP);
  ASSERT_EQ(table.lookup("volume-down"), KEY_VOLUMEDOWN);
  ASSERT_EQ(table.lookup("Left_Shift"), KEY_LEFTSHIFT);
}

TEST(KEYCODES, ambiguousNamesAreRejected) {
  ASSERT_EQ(lookupError("Shift"),
            "Ambiguous key name 'shift'. Please specify 'leftshift' or "
            "'rightshift'.");
  ASSERT_EQ(lookupError("control"),
            "Ambiguous key name 'ctrl' or 'control'. Please specify "
            "'leftctrl' or 'rightctrl'.");
  ASSERT_EQ(lookupError("alt"),
            "Ambiguous key name 'alt'. Please specify 'leftalt' or 'rightalt' "
            "(or 'altgr' for Right Alt / AltGr).");
  ASSERT_EQ(lookupError("super"),
            "Ambiguous key name like 'meta', 'win', 'super'. Please specify "
            "'leftmeta' (or 'lwin', 'lsuper') or 'rightmeta' (or 'rwin', "
            "'rsuper').");
}

TEST(KEYCODES, unknownNameIsRejected) {
  ASSERT_EQ(lookupError("NotAKey"), "Unknown key name: 'NotAKey'");
}
