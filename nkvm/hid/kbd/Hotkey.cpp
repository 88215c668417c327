// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/kbd/Hotkey.h"

#include "nkvm/Error.h"
#include "nkvm/log.h"

#include <array>
#include <cctype>
#include <string>

using nkvm::hid::Key;

namespace nkvm::kbd {

namespace {

struct KeyName {
  std::string_view name;
  Key key;
};

constexpr std::array kNamedKeys{
    KeyName{"enter", Key::Enter},
    KeyName{"return", Key::Enter},
    KeyName{"esc", Key::Escape},
    KeyName{"escape", Key::Escape},
    KeyName{"backspace", Key::Backspace},
    KeyName{"tab", Key::Tab},
    KeyName{"space", Key::Space},
    KeyName{"minus", Key::Minus},
    KeyName{"equal", Key::Equal},
    KeyName{"grave", Key::Grave},
    KeyName{"capslock", Key::CapsLock},
    KeyName{"printscreen", Key::PrintScreen},
    KeyName{"prtsc", Key::PrintScreen},
    KeyName{"sysrq", Key::PrintScreen},
    KeyName{"scrolllock", Key::ScrollLock},
    KeyName{"pause", Key::Pause},
    KeyName{"break", Key::Pause},
    KeyName{"insert", Key::Insert},
    KeyName{"ins", Key::Insert},
    KeyName{"home", Key::Home},
    KeyName{"pageup", Key::PageUp},
    KeyName{"pgup", Key::PageUp},
    KeyName{"delete", Key::Delete},
    KeyName{"del", Key::Delete},
    KeyName{"end", Key::End},
    KeyName{"pagedown", Key::PageDown},
    KeyName{"pgdn", Key::PageDown},
    KeyName{"right", Key::Right},
    KeyName{"left", Key::Left},
    KeyName{"down", Key::Down},
    KeyName{"up", Key::Up},
    KeyName{"numlock", Key::NumLock},
    KeyName{"menu", Key::Application},
    KeyName{"application", Key::Application},
    KeyName{"power", Key::Power},
    KeyName{"ctrl", Key::LeftControl},
    KeyName{"control", Key::LeftControl},
    KeyName{"lctrl", Key::LeftControl},
    KeyName{"shift", Key::LeftShift},
    KeyName{"lshift", Key::LeftShift},
    KeyName{"alt", Key::LeftAlt},
    KeyName{"lalt", Key::LeftAlt},
    KeyName{"meta", Key::LeftGui},
    KeyName{"super", Key::LeftGui},
    KeyName{"win", Key::LeftGui},
    KeyName{"gui", Key::LeftGui},
    KeyName{"rctrl", Key::RightControl},
    KeyName{"rshift", Key::RightShift},
    KeyName{"ralt", Key::RightAlt},
    KeyName{"altgr", Key::RightAlt},
    KeyName{"rmeta", Key::RightGui},
    KeyName{"rsuper", Key::RightGui},
};

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

} // namespace

std::optional<Key> key_from_name(std::string_view name) {
  std::string lower;
  lower.reserve(name.size());
  for (const char c : trim(name)) {
    lower.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return std::nullopt;
  }

  if (lower.size() == 1) {
    const char c = lower[0];
    if (c >= 'a' && c <= 'z') {
      return static_cast<Key>(static_cast<uint8_t>(Key::A) + (c - 'a'));
    }
    if (c == '0') {
      return Key::Num0;
    }
    if (c >= '1' && c <= '9') {
      return static_cast<Key>(static_cast<uint8_t>(Key::Num1) + (c - '1'));
    }
  }

  // F1 through F24
  if (lower.size() >= 2 && lower.size() <= 3 && lower[0] == 'f') {
    int n = 0;
    for (size_t i = 1; i < lower.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(lower[i]))) {
        n = 0;
        break;
      }
      n = n * 10 + (lower[i] - '0');
    }
    if (n >= 1 && n <= 12) {
      return static_cast<Key>(static_cast<uint8_t>(Key::F1) + (n - 1));
    }
    if (n >= 13 && n <= 24) {
      return static_cast<Key>(static_cast<uint8_t>(Key::F13) + (n - 13));
    }
  }

  for (const auto &entry : kNamedKeys) {
    if (entry.name == lower) {
      return entry.key;
    }
  }
  return std::nullopt;
}

std::error_code parse_hotkey(std::string_view combo, BootReport &report) {
  BootReport result;
  while (true) {
    const auto sep = combo.find('+');
    const auto token = combo.substr(0, sep);
    const auto key = key_from_name(token);
    if (!key) {
      NKVM_LOGE("unknown key name \"%.*s\"",
                static_cast<int>(token.size()),
                token.data());
      return make_error_code(ErrorCode::UnknownKeyName);
    }
    result.add_key(*key);
    if (sep == std::string_view::npos) {
      break;
    }
    combo.remove_prefix(sep + 1);
  }

  report = result;
  return {};
}

} // namespace nkvm::kbd
