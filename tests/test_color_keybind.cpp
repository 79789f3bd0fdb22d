#include <gtest/gtest.h>

#include "hud/color.hpp"
#include "hud/keybind.hpp"
#include "mo_types.hpp"

using namespace mo;

TEST(Color, AcceptsAllPrefixes) {
  const Rgb8 expected{0xFF, 0x80, 0x00};
  EXPECT_EQ(parse_color("FF8000"), expected);
  EXPECT_EQ(parse_color("#ff8000"), expected);
  EXPECT_EQ(parse_color("0xFf8000"), expected);
  EXPECT_EQ(format_color(expected), "FF8000");
}

TEST(Color, RejectsMalformed) {
  EXPECT_THROW(parse_color("FFF"), ConfigError);
  EXPECT_THROW(parse_color("GG0000"), ConfigError);
  EXPECT_THROW(parse_color(""), ConfigError);
  try {
    parse_color("#12345");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.code(), ConfigErrc::InvalidValue);
  }
}

TEST(Keybind, ParsesModifiersAndKey) {
  Keybind kb = parse_keybind("Shift_R+F12");
  ASSERT_EQ(kb.modifiers.size(), 1u);
  EXPECT_EQ(kb.modifiers[0], KeyModifier::ShiftR);
  EXPECT_EQ(kb.key, "F12");
  EXPECT_EQ(format_keybind(kb), "Shift_R+F12");
}

TEST(Keybind, NormalizesAliases) {
  Keybind kb = parse_keybind("ctrl + shift + f1");
  ASSERT_EQ(kb.modifiers.size(), 2u);
  EXPECT_EQ(kb.modifiers[0], KeyModifier::ControlL);
  EXPECT_EQ(kb.modifiers[1], KeyModifier::ShiftL);
  EXPECT_EQ(kb.key, "F1");
  EXPECT_EQ(format_keybind(kb), "Control_L+Shift_L+F1");
}

TEST(Keybind, RejectsMalformed) {
  EXPECT_THROW(parse_keybind(""), ConfigError);
  EXPECT_THROW(parse_keybind("Shift_L"), ConfigError);
  EXPECT_THROW(parse_keybind("Shift_L+"), ConfigError);
  EXPECT_THROW(parse_keybind("Shift_L+F12+F11"), ConfigError);
  EXPECT_THROW(parse_keybind("Shift_L+F25"), ConfigError);
}

TEST(Keybind, KnownKeyNames) {
  EXPECT_TRUE(is_known_key_name("Home"));
  EXPECT_TRUE(is_known_key_name("a"));
  EXPECT_TRUE(is_known_key_name("F24"));
  EXPECT_TRUE(is_known_key_name("KP_Add"));
  EXPECT_FALSE(is_known_key_name("Foo"));
  EXPECT_FALSE(is_known_key_name("F0"));
}

TEST(Keybind, NamedKeysIgnoreCase) {
  Keybind kb = parse_keybind("Shift_R+home");
  EXPECT_EQ(kb.key, "Home");
  EXPECT_EQ(format_keybind(kb), "Shift_R+Home");
  EXPECT_EQ(parse_keybind("ctrl+kp_add").key, "KP_Add");
  EXPECT_EQ(parse_keybind("alt+BACKSPACE").key, "BackSpace");
  EXPECT_EQ(parse_keybind("shift+f9").key, "F9");
  EXPECT_TRUE(is_known_key_name("page_down"));
}
