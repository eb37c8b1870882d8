// This file is part of sc2remap - See LICENSE.md and README.md
#include "keynames.h"

#include <QHash>

#include <utility>
#include <vector>

namespace {
// -------------------------------------------------------------------------------------------------
using KeyNameEntry = std::pair<uint16_t, const char*>;

// First entry for a code is its canonical name, following entries are aliases.
const std::vector<KeyNameEntry>& keyNameTable()
{
  static const std::vector<KeyNameEntry> table = {
    {KEY_ESC, "esc"}, {KEY_ESC, "escape"},
    {KEY_1, "1"}, {KEY_2, "2"}, {KEY_3, "3"}, {KEY_4, "4"}, {KEY_5, "5"},
    {KEY_6, "6"}, {KEY_7, "7"}, {KEY_8, "8"}, {KEY_9, "9"}, {KEY_0, "0"},
    {KEY_MINUS, "minus"}, {KEY_MINUS, "-"},
    {KEY_EQUAL, "equal"}, {KEY_EQUAL, "="},
    {KEY_BACKSPACE, "backspace"},
    {KEY_TAB, "tab"},
    {KEY_Q, "q"}, {KEY_W, "w"}, {KEY_E, "e"}, {KEY_R, "r"}, {KEY_T, "t"},
    {KEY_Y, "y"}, {KEY_U, "u"}, {KEY_I, "i"}, {KEY_O, "o"}, {KEY_P, "p"},
    {KEY_LEFTBRACE, "leftbrace"}, {KEY_LEFTBRACE, "["},
    {KEY_RIGHTBRACE, "rightbrace"}, {KEY_RIGHTBRACE, "]"},
    {KEY_ENTER, "enter"}, {KEY_ENTER, "return"},
    {KEY_LEFTCTRL, "leftctrl"}, {KEY_LEFTCTRL, "leftcontrol"},
    {KEY_A, "a"}, {KEY_S, "s"}, {KEY_D, "d"}, {KEY_F, "f"}, {KEY_G, "g"},
    {KEY_H, "h"}, {KEY_J, "j"}, {KEY_K, "k"}, {KEY_L, "l"},
    {KEY_SEMICOLON, "semicolon"}, {KEY_SEMICOLON, ";"},
    {KEY_APOSTROPHE, "apostrophe"}, {KEY_APOSTROPHE, "'"},
    {KEY_GRAVE, "grave"}, {KEY_GRAVE, "`"},
    {KEY_LEFTSHIFT, "leftshift"},
    {KEY_BACKSLASH, "backslash"}, {KEY_BACKSLASH, "\\"},
    {KEY_Z, "z"}, {KEY_X, "x"}, {KEY_C, "c"}, {KEY_V, "v"}, {KEY_B, "b"},
    {KEY_N, "n"}, {KEY_M, "m"},
    {KEY_COMMA, "comma"}, {KEY_COMMA, ","},
    {KEY_DOT, "dot"}, {KEY_DOT, "."},
    {KEY_SLASH, "slash"}, {KEY_SLASH, "/"},
    {KEY_RIGHTSHIFT, "rightshift"},
    {KEY_KPASTERISK, "kpasterisk"},
    {KEY_LEFTALT, "leftalt"},
    {KEY_SPACE, "space"},
    {KEY_CAPSLOCK, "capslock"},
    {KEY_F1, "f1"}, {KEY_F2, "f2"}, {KEY_F3, "f3"}, {KEY_F4, "f4"}, {KEY_F5, "f5"},
    {KEY_F6, "f6"}, {KEY_F7, "f7"}, {KEY_F8, "f8"}, {KEY_F9, "f9"}, {KEY_F10, "f10"},
    {KEY_F11, "f11"}, {KEY_F12, "f12"}, {KEY_F13, "f13"}, {KEY_F14, "f14"},
    {KEY_F15, "f15"}, {KEY_F16, "f16"}, {KEY_F17, "f17"}, {KEY_F18, "f18"},
    {KEY_F19, "f19"}, {KEY_F20, "f20"}, {KEY_F21, "f21"}, {KEY_F22, "f22"},
    {KEY_F23, "f23"}, {KEY_F24, "f24"},
    {KEY_NUMLOCK, "numlock"},
    {KEY_SCROLLLOCK, "scrolllock"},
    {KEY_KP7, "kp7"}, {KEY_KP8, "kp8"}, {KEY_KP9, "kp9"}, {KEY_KPMINUS, "kpminus"},
    {KEY_KP4, "kp4"}, {KEY_KP5, "kp5"}, {KEY_KP6, "kp6"}, {KEY_KPPLUS, "kpplus"},
    {KEY_KP1, "kp1"}, {KEY_KP2, "kp2"}, {KEY_KP3, "kp3"}, {KEY_KP0, "kp0"},
    {KEY_KPDOT, "kpdot"}, {KEY_KPENTER, "kpenter"}, {KEY_KPSLASH, "kpslash"},
    {KEY_102ND, "102nd"},
    {KEY_RIGHTCTRL, "rightctrl"}, {KEY_RIGHTCTRL, "rightcontrol"},
    {KEY_SYSRQ, "sysrq"}, {KEY_SYSRQ, "print"},
    {KEY_RIGHTALT, "rightalt"}, {KEY_RIGHTALT, "altgr"},
    {KEY_HOME, "home"},
    {KEY_UP, "up"},
    {KEY_PAGEUP, "pageup"},
    {KEY_LEFT, "left"},
    {KEY_RIGHT, "right"},
    {KEY_END, "end"},
    {KEY_DOWN, "down"},
    {KEY_PAGEDOWN, "pagedown"},
    {KEY_INSERT, "insert"},
    {KEY_DELETE, "delete"},
    {KEY_PAUSE, "pause"},
    {KEY_LEFTMETA, "leftmeta"}, {KEY_LEFTMETA, "super"},
    {KEY_RIGHTMETA, "rightmeta"},
    {KEY_COMPOSE, "compose"}, {KEY_COMPOSE, "menu"},
    {BTN_LEFT, "btn_left"},
    {BTN_RIGHT, "btn_right"},
    {BTN_MIDDLE, "btn_middle"},
    {BTN_SIDE, "btn_side"}, {BTN_SIDE, "side"},
    {BTN_EXTRA, "btn_extra"}, {BTN_EXTRA, "extra"},
    {BTN_FORWARD, "btn_forward"},
    {BTN_BACK, "btn_back"},
  };
  return table;
}

// -------------------------------------------------------------------------------------------------
const QHash<QString, uint16_t>& nameToCode()
{
  static const QHash<QString, uint16_t> map = [](){
    QHash<QString, uint16_t> map;
    for (const auto& entry : keyNameTable()) {
      map.insert(QString::fromLatin1(entry.second), entry.first);
    }
    return map;
  }();
  return map;
}

// -------------------------------------------------------------------------------------------------
const QHash<uint16_t, QString>& codeToName()
{
  static const QHash<uint16_t, QString> map = [](){
    QHash<uint16_t, QString> map;
    for (const auto& entry : keyNameTable()) {
      if (!map.contains(entry.first)) {
        map.insert(entry.first, QString::fromLatin1(entry.second));
      }
    }
    return map;
  }();
  return map;
}
} // end anonymous namespace

namespace KeyName
{
// -------------------------------------------------------------------------------------------------
Key fromString(const QString& name)
{
  const auto lookupName = name.trimmed().toLower();
  if (lookupName.isEmpty()) { return Key::None; }

  const auto it = nameToCode().find(lookupName);
  if (it != nameToCode().cend()) {
    return toKey(it.value());
  }

  // Numeric key code, decimal or hex with 0x prefix
  bool ok = false;
  const uint code = lookupName.toUInt(&ok, 0);
  if (ok && code > 0 && code < KEY_CNT) {
    return toKey(static_cast<uint16_t>(code));
  }

  return Key::None;
}

// -------------------------------------------------------------------------------------------------
QString toString(Key key)
{
  const auto it = codeToName().find(toCode(key));
  if (it != codeToName().cend()) {
    return it.value();
  }
  return QString("0x%1").arg(toCode(key), 0, 16);
}
} // end namespace KeyName
