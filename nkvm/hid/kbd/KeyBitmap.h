// Copyright (c) 2024, Adam Simpkins
#pragma once

#include "nkvm/hid/usage/keys.h"

#include <asel/array.h>

#include <cstddef>
#include <cstdint>

namespace nkvm::kbd {

/**
 * A bitmap tracking which HID keys are currently pressed.
 *
 * One bit per key usage in the 0x00-0xff range.  Iteration visits keys in
 * ascending usage order.
 */
class KeyBitmap {
public:
  static constexpr size_t kNumKeys = 256;
  static constexpr size_t kNumWords = kNumKeys / 32;

  class Changes;
  class Iterator;

  constexpr KeyBitmap() = default;

  bool get(hid::Key key) const {
    const auto idx = static_cast<size_t>(key);
    return (words_[idx / 32] >> (idx % 32)) & 1;
  }
  void set(hid::Key key, bool value) {
    const auto idx = static_cast<size_t>(key);
    const auto mask = static_cast<uint32_t>(1) << (idx % 32);
    if (value) {
      words_[idx / 32] |= mask;
    } else {
      words_[idx / 32] &= ~mask;
    }
  }

  void add_key(hid::Key key) {
    set(key, true);
  }
  void clear() {
    words_ = {};
  }

  /**
   * Iterate over the keys whose state differs between this bitmap and other.
   * Iterator::is_press() is true for keys set here but not in other.
   */
  Changes changes_from(const KeyBitmap &other) const;
  bool has_changes(const KeyBitmap &other) const {
    return words_ != other.words_;
  }

  // Iterate over all keys set in this bitmap.
  Changes pressed_keys() const;
  bool any_pressed() const;
  size_t count() const;

  bool operator==(const KeyBitmap &other) const {
    return words_ == other.words_;
  }

private:
  // Returns the first position >= start where new_kb and old_kb differ, or
  // kNumKeys if there is none.  old_kb may be null, meaning all keys released.
  static size_t next_difference(const KeyBitmap *new_kb,
                                const KeyBitmap *old_kb,
                                size_t start);

  asel::array<uint32_t, kNumWords> words_ = {};
};

class KeyBitmap::Changes {
public:
  Changes(const KeyBitmap *new_kb, const KeyBitmap *old_kb)
      : new_(new_kb), old_(old_kb) {}

  Iterator begin() const;
  Iterator end() const;

private:
  const KeyBitmap *new_;
  const KeyBitmap *old_;
};

class KeyBitmap::Iterator {
public:
  Iterator(const KeyBitmap *new_kb, const KeyBitmap *old_kb, size_t position)
      : new_(new_kb), old_(old_kb), position_(position) {}

  bool operator==(const Iterator &other) const = default;
  bool operator!=(const Iterator &other) const = default;

  Iterator &operator++() {
    position_ = next_difference(new_, old_, position_ + 1);
    return *this;
  }
  Iterator operator++(int) {
    Iterator tmp = *this;
    ++*this;
    return tmp;
  }

  const Iterator &operator*() const {
    return *this;
  }

  hid::Key key() const {
    return static_cast<hid::Key>(position_);
  }
  bool is_press() const {
    return new_->get(key());
  }

private:
  const KeyBitmap *new_ = nullptr;
  const KeyBitmap *old_ = nullptr;
  size_t position_ = 0;
};

inline KeyBitmap::Iterator KeyBitmap::Changes::begin() const {
  return Iterator(new_, old_, next_difference(new_, old_, 0));
}
inline KeyBitmap::Iterator KeyBitmap::Changes::end() const {
  return Iterator(new_, old_, kNumKeys);
}

inline KeyBitmap::Changes
KeyBitmap::changes_from(const KeyBitmap &other) const {
  return Changes(this, &other);
}
inline KeyBitmap::Changes KeyBitmap::pressed_keys() const {
  return Changes(this, nullptr);
}

} // namespace nkvm::kbd
