#include "KeycodeTable.h"

#include <algorithm>
#include <cctype>
#include <linux/input-event-codes.h>
#include <stdexcept>
#include <vector>

using namespace std;

#define KBDOSD_KEYCODES(X)                                                    \
  X(ESC) X(1) X(2) X(3) X(4) X(5) X(6) X(7) X(8) X(9) X(0) X(MINUS) X(EQUAL)  \
  X(BACKSPACE) X(TAB) X(Q) X(W) X(E) X(R) X(T) X(Y) X(U) X(I) X(O) X(P)       \
  X(LEFTBRACE) X(RIGHTBRACE) X(ENTER) X(LEFTCTRL) X(A) X(S) X(D) X(F) X(G)    \
  X(H) X(J) X(K) X(L) X(SEMICOLON) X(APOSTROPHE) X(GRAVE) X(LEFTSHIFT)        \
  X(BACKSLASH) X(Z) X(X) X(C) X(V) X(B) X(N) X(M) X(COMMA) X(DOT) X(SLASH)    \
  X(RIGHTSHIFT) X(KPASTERISK) X(LEFTALT) X(SPACE) X(CAPSLOCK) X(F1) X(F2)     \
  X(F3) X(F4) X(F5) X(F6) X(F7) X(F8) X(F9) X(F10) X(NUMLOCK) X(SCROLLLOCK)   \
  X(KP7) X(KP8) X(KP9) X(KPMINUS) X(KP4) X(KP5) X(KP6) X(KPPLUS) X(KP1)       \
  X(KP2) X(KP3) X(KP0) X(KPDOT) X(ZENKAKUHANKAKU) X(102ND) X(F11) X(F12)      \
  X(RO) X(KATAKANA) X(HIRAGANA) X(HENKAN) X(KATAKANAHIRAGANA) X(MUHENKAN)     \
  X(KPJPCOMMA) X(KPENTER) X(RIGHTCTRL) X(KPSLASH) X(SYSRQ) X(RIGHTALT)        \
  X(LINEFEED) X(HOME) X(UP) X(PAGEUP) X(LEFT) X(RIGHT) X(END) X(DOWN)         \
  X(PAGEDOWN) X(INSERT) X(DELETE) X(MACRO) X(MUTE) X(VOLUMEDOWN) X(VOLUMEUP)  \
  X(POWER) X(KPEQUAL) X(KPPLUSMINUS) X(PAUSE) X(SCALE) X(KPCOMMA) X(HANGEUL)  \
  X(HANJA) X(YEN) X(LEFTMETA) X(RIGHTMETA) X(COMPOSE) X(STOP) X(AGAIN)        \
  X(PROPS) X(UNDO) X(FRONT) X(COPY) X(OPEN) X(PASTE) X(FIND) X(CUT) X(HELP)   \
  X(MENU) X(CALC) X(SETUP) X(SLEEP) X(WAKEUP) X(FILE) X(SENDFILE)             \
  X(DELETEFILE) X(XFER) X(PROG1) X(PROG2) X(WWW) X(MSDOS) X(SCREENLOCK)       \
  X(CYCLEWINDOWS) X(MAIL) X(BOOKMARKS) X(COMPUTER) X(BACK) X(FORWARD)         \
  X(CLOSECD) X(EJECTCD) X(EJECTCLOSECD) X(NEXTSONG) X(PLAYPAUSE)              \
  X(PREVIOUSSONG) X(STOPCD) X(RECORD) X(REWIND) X(PHONE) X(ISO) X(CONFIG)     \
  X(HOMEPAGE) X(REFRESH) X(EXIT) X(MOVE) X(EDIT) X(SCROLLUP) X(SCROLLDOWN)    \
  X(KPLEFTPAREN) X(KPRIGHTPAREN) X(NEW) X(REDO) X(F13) X(F14) X(F15) X(F16)   \
  X(F17) X(F18) X(F19) X(F20) X(F21) X(F22) X(F23) X(F24) X(PLAYCD)           \
  X(PAUSECD) X(PROG3) X(PROG4) X(DASHBOARD) X(SUSPEND) X(CLOSE) X(PLAY)       \
  X(FASTFORWARD) X(BASSBOOST) X(PRINT) X(HP) X(CAMERA) X(SOUND) X(QUESTION)   \
  X(EMAIL) X(CHAT) X(SEARCH) X(CONNECT) X(FINANCE) X(SPORT) X(SHOP)           \
  X(ALTERASE) X(CANCEL) X(BRIGHTNESSDOWN) X(BRIGHTNESSUP) X(MEDIA)            \
  X(SWITCHVIDEOMODE) X(KBDILLUMTOGGLE) X(KBDILLUMDOWN) X(KBDILLUMUP) X(SEND)  \
  X(REPLY) X(FORWARDMAIL) X(SAVE) X(DOCUMENTS) X(BATTERY) X(BLUETOOTH)        \
  X(WLAN) X(UWB) X(UNKNOWN) X(VIDEO_NEXT) X(VIDEO_PREV) X(BRIGHTNESS_CYCLE)   \
  X(DISPLAY_OFF) X(WWAN) X(RFKILL) X(MICMUTE) X(FN) X(FN_ESC) X(FN_F1)        \
  X(FN_F2) X(FN_F3) X(FN_F4) X(FN_F5) X(FN_F6) X(FN_F7) X(FN_F8) X(FN_F9)     \
  X(FN_F10) X(FN_F11) X(FN_F12)

struct KeyAlias {
  const char* name;
  uint32_t code;
};

static const KeyAlias aliases[] = {
  { "escape", KEY_ESC },
  { "-", KEY_MINUS },
  { "=", KEY_EQUAL },
  { "bksp", KEY_BACKSPACE },
  { "[", KEY_LEFTBRACE },
  { "lbracket", KEY_LEFTBRACE },
  { "]", KEY_RIGHTBRACE },
  { "rbracket", KEY_RIGHTBRACE },
  { "return", KEY_ENTER },
  { "lctrl", KEY_LEFTCTRL },
  { ";", KEY_SEMICOLON },
  { "'", KEY_APOSTROPHE },
  { "quote", KEY_APOSTROPHE },
  { "`", KEY_GRAVE },
  { "tilde", KEY_GRAVE },
  { "lshift", KEY_LEFTSHIFT },
  { "\\", KEY_BACKSLASH },
  { ",", KEY_COMMA },
  { ".", KEY_DOT },
  { "period", KEY_DOT },
  { "/", KEY_SLASH },
  { "rshift", KEY_RIGHTSHIFT },
  { "keypadasterisk", KEY_KPASTERISK },
  { "kpmultiply", KEY_KPASTERISK },
  { "kpmul", KEY_KPASTERISK },
  { "lalt", KEY_LEFTALT },
  { "caps", KEY_CAPSLOCK },
  { "num", KEY_NUMLOCK },
  { "scroll", KEY_SCROLLLOCK },
  { "keypad0", KEY_KP0 },
  { "keypad1", KEY_KP1 },
  { "keypad2", KEY_KP2 },
  { "keypad3", KEY_KP3 },
  { "keypad4", KEY_KP4 },
  { "keypad5", KEY_KP5 },
  { "keypad6", KEY_KP6 },
  { "keypad7", KEY_KP7 },
  { "keypad8", KEY_KP8 },
  { "keypad9", KEY_KP9 },
  { "keypadminus", KEY_KPMINUS },
  { "kpsubtract", KEY_KPMINUS },
  { "kpsub", KEY_KPMINUS },
  { "keypadplus", KEY_KPPLUS },
  { "kpadd", KEY_KPPLUS },
  { "keypaddot", KEY_KPDOT },
  { "kpdecimal", KEY_KPDOT },
  { "kpperiod", KEY_KPDOT },
  { "keypadjpcomma", KEY_KPJPCOMMA },
  { "keypadenter", KEY_KPENTER },
  { "rctrl", KEY_RIGHTCTRL },
  { "keypadslash", KEY_KPSLASH },
  { "kpdivide", KEY_KPSLASH },
  { "kpdiv", KEY_KPSLASH },
  { "printscreen", KEY_SYSRQ },
  { "prtscr", KEY_SYSRQ },
  { "ralt", KEY_RIGHTALT },
  { "altgr", KEY_RIGHTALT },
  { "uparrow", KEY_UP },
  { "pgup", KEY_PAGEUP },
  { "leftarrow", KEY_LEFT },
  { "rightarrow", KEY_RIGHT },
  { "downarrow", KEY_DOWN },
  { "pgdn", KEY_PAGEDOWN },
  { "ins", KEY_INSERT },
  { "del", KEY_DELETE },
  { "keypadequal", KEY_KPEQUAL },
  { "keypadplusminus", KEY_KPPLUSMINUS },
  { "pausebreak", KEY_PAUSE },
  { "keypadcomma", KEY_KPCOMMA },
  { "lmeta", KEY_LEFTMETA },
  { "leftwindows", KEY_LEFTMETA },
  { "lwin", KEY_LEFTMETA },
  { "leftsuper", KEY_LEFTMETA },
  { "lsuper", KEY_LEFTMETA },
  { "rmeta", KEY_RIGHTMETA },
  { "rightwindows", KEY_RIGHTMETA },
  { "rwin", KEY_RIGHTMETA },
  { "rightsuper", KEY_RIGHTMETA },
  { "rsuper", KEY_RIGHTMETA },
  { "appmenu", KEY_MENU },
  { "calculator", KEY_CALC },
  { "eject", KEY_EJECTCD },
  { "keypadleftparen", KEY_KPLEFTPAREN },
  { "keypadrightparen", KEY_KPRIGHTPAREN },
  { "keyboardilluminationtoggle", KEY_KBDILLUMTOGGLE },
  { "keyboardilluminationdown", KEY_KBDILLUMDOWN },
  { "keyboardilluminationup", KEY_KBDILLUMUP },
};

KeycodeTable::KeycodeTable()
{
#define X(key) add(normalize(#key), KEY_##key, true);
  KBDOSD_KEYCODES(X)
#undef X

  for (const auto& alias : aliases) {
    add(normalize(alias.name), alias.code, false);
  }

  if (names.empty()) {
    throw runtime_error("keycode table is empty");
  }
}

const KeycodeTable&
KeycodeTable::instance()
{
  static const KeycodeTable table;
  return table;
}

void
KeycodeTable::add(const string& name, uint32_t code, bool canonical)
{
  auto existing = codes.find(name);
  if (existing != codes.end() && existing->second != code) {
    throw runtime_error("keycode table binds '" + name + "' to both " +
                        to_string(existing->second) + " and " +
                        to_string(code));
  }
  codes[name] = code;
  if (canonical && !names.contains(code)) {
    names[code] = name;
  }
}

string
KeycodeTable::normalize(const string& name)
{
  string normalized;
  normalized.reserve(name.size());
  for (unsigned char c : name) {
    if (c != '_') {
      normalized.push_back(static_cast<char>(tolower(c)));
    }
  }

  bool hasLetter = any_of(normalized.begin(), normalized.end(), [](unsigned char c) {
    return isalpha(c) != 0;
  });
  if (hasLetter) {
    normalized.erase(remove(normalized.begin(), normalized.end(), '-'),
                     normalized.end());
  }
  return normalized;
}

optional<string>
KeycodeTable::resolve(uint32_t code) const
{
  auto it = names.find(code);
  if (it == names.end()) {
    return nullopt;
  }
  return it->second;
}

uint32_t
KeycodeTable::lookup(const string& name) const
{
  string key = normalize(name);

  if (key == "shift") {
    throw invalid_argument(
      "Ambiguous key name 'shift'. Please specify 'leftshift' or 'rightshift'.");
  }
  if (key == "ctrl" || key == "control") {
    throw invalid_argument("Ambiguous key name 'ctrl' or 'control'. Please "
                           "specify 'leftctrl' or 'rightctrl'.");
  }
  if (key == "alt") {
    throw invalid_argument("Ambiguous key name 'alt'. Please specify 'leftalt' "
                           "or 'rightalt' (or 'altgr' for Right Alt / AltGr).");
  }
  if (key == "meta" || key == "win" || key == "windows" || key == "super") {
    throw invalid_argument(
      "Ambiguous key name like 'meta', 'win', 'super'. Please specify "
      "'leftmeta' (or 'lwin', 'lsuper') or 'rightmeta' (or 'rwin', 'rsuper').");
  }

  auto it = codes.find(key);
  if (it == codes.end()) {
    throw invalid_argument("Unknown key name: '" + name + "'");
  }
  return it->second;
}
