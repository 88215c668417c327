// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/kbd/KeyBitmap.h"

#include <bit>

namespace nkvm::kbd {

size_t KeyBitmap::next_difference(const KeyBitmap *new_kb,
                                  const KeyBitmap *old_kb,
                                  size_t start) {
  // Most of the time only a handful of keys differ, so compare a word at a
  // time and only look at individual bits within words that differ.
  size_t word_idx = start / 32;
  if (word_idx >= kNumWords) {
    return kNumKeys;
  }

  auto word_diff = [&](size_t idx) -> uint32_t {
    const uint32_t old_word = old_kb ? old_kb->words_[idx] : 0;
    return new_kb->words_[idx] ^ old_word;
  };

  // Mask off the bits below the start position in the first word.
  uint32_t diff = word_diff(word_idx) & (~static_cast<uint32_t>(0) << (start % 32));
  while (true) {
    if (diff != 0) [[unlikely]] {
      return (word_idx * 32) + static_cast<size_t>(std::countr_zero(diff));
    }
    ++word_idx;
    if (word_idx >= kNumWords) {
      return kNumKeys;
    }
    diff = word_diff(word_idx);
  }
}

bool KeyBitmap::any_pressed() const {
  for (size_t n = 0; n < words_.size(); ++n) {
    if (words_[n] != 0) {
      return true;
    }
  }
  return false;
}

size_t KeyBitmap::count() const {
  size_t total = 0;
  for (size_t n = 0; n < words_.size(); ++n) {
    total += static_cast<size_t>(std::popcount(words_[n]));
  }
  return total;
}

} // namespace nkvm::kbd
