#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workshop::spoken {

enum class Direction { LeftToRight, RightToLeft };

// Enumerators are declared in code order so ordered containers keyed by Code
// iterate lexicographically.
enum class Code {
  ar, bg, bn, cs, da, de, el, en, es, et,
  fa, fi, fr, gu, he, hi, hr, hu, id, it,
  ja, kn, ko, lt, lv, ml, mr, ms, my, nl,
  no, or_, pa, pl, pt, ro, ru, sk, sl, sr,
  sv, sw, ta, te, th, tr, uk, ur, vi, zh,
};

constexpr Code kDefault = Code::en;

struct Language {
  Code code = kDefault;
  std::string name;
  std::string native_name;
  Direction direction = Direction::LeftToRight;
};

std::string to_string(Code code);
std::string_view name_in_english(Code code);
std::string_view name_in_native(Code code);
Direction text_direction(Code code);
Language language(Code code);

// Case-insensitive two-letter code.
std::optional<Code> from_code(std::string_view code);
// Exact English name, e.g. "German".
std::optional<Code> from_name(std::string_view english_name);
// Code first, then name; throws Error(InvalidLanguageCode).
Code parse(std::string_view value);

const std::vector<Code>& all();

} // namespace workshop::spoken
