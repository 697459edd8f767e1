#include <array>
#include <string>
#include <string_view>
#include <utility>
using namespace std::literals; // enables "sv" literal

#include "lensbridge/errors.hpp"

#ifndef __LENSBRIDGE_ENUM_TRANSLATOR_HPP
#define __LENSBRIDGE_ENUM_TRANSLATOR_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Ordered (token, native value) tables. The index of a token in its table is
// part of the calling convention: keep the order.
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

template <typename T, std::size_t N>
using Vocabulary = std::array<std::pair<std::string_view, T>, N>;

// Exact match only (no prefix, no case folding).
template <typename T, std::size_t N>
int translate(const Vocabulary<T,N>& dictionary, std::string_view option)
{
  for (int i=0; i<static_cast<int>(N); i++) {
    if (dictionary[i].first == option) {
      return i;
    }
  }
  return -1;
}

template <typename T, std::size_t N>
T translate_or_throw(
    const Vocabulary<T,N>& dictionary, 
    const std::string& option,
    const std::string& key = std::string()
  )
{
  const int i = translate(dictionary, option);
  if (-1 == i) {
    throw UnrecognizedOption(key, option);
  }
  return dictionary[i].second;
}

template <typename T, std::size_t N>
std::string_view to_string(const Vocabulary<T,N>& dictionary, const T value)
{
  for (const auto& entry : dictionary) {
    if (entry.second == value) {
      return entry.first;
    }
  }
  return "unknown"sv;
}

}  // namespace lensbridge_interface
#endif // HEADER GUARD
