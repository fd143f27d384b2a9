#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workshop::programming {

enum class Code {
  cl, cp, cs, el, er, fs, go, hs, ja, js,
  kt, lu, pe, ph, py, rb, rs, sc, sw, ts,
};

constexpr Code kDefault = Code::rs;

struct Language {
  Code code = kDefault;
  std::string extension;
  std::string name;
};

std::string to_string(Code code);
std::string_view display_name(Code code);
std::string_view extension(Code code);
Language language(Code code);

std::optional<Code> from_code(std::string_view code);
std::optional<Code> from_name(std::string_view name);
Code parse(std::string_view value);

const std::vector<Code>& all();

} // namespace workshop::programming
