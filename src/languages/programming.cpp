#include "languages/programming.hpp"

#include "languages/languages.hpp"
#include "workshop/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>

namespace workshop {
namespace programming {
namespace {

struct Entry {
  Code code;
  const char* tag;
  const char* name;
  const char* extension;
};

constexpr std::array<Entry, 20> kTable = {{
    {Code::cl, "cl", "Clojure", "clj"},
    {Code::cp, "cp", "C++", "cpp"},
    {Code::cs, "cs", ".Net", "cs"},
    {Code::el, "el", "Elixir", "ex"},
    {Code::er, "er", "Erlang", "erl"},
    {Code::fs, "fs", "F#", "fs"},
    {Code::go, "go", "Go", "go"},
    {Code::hs, "hs", "Haskell", "hs"},
    {Code::ja, "ja", "Java", "java"},
    {Code::js, "js", "JavaScript", "js"},
    {Code::kt, "kt", "Kotlin", "kt"},
    {Code::lu, "lu", "Lua", "lua"},
    {Code::pe, "pe", "Perl", "pl"},
    {Code::ph, "ph", "PHP", "php"},
    {Code::py, "py", "Python", "py"},
    {Code::rb, "rb", "Ruby", "rb"},
    {Code::rs, "rs", "Rust", "rs"},
    {Code::sc, "sc", "Scala", "scala"},
    {Code::sw, "sw", "Swift", "swift"},
    {Code::ts, "ts", "TypeScript", "ts"},
}};

const Entry& entry(Code code) {
  return kTable[static_cast<std::size_t>(code)];
}

} // namespace

std::string to_string(Code code) { return entry(code).tag; }

std::string_view display_name(Code code) { return entry(code).name; }

std::string_view extension(Code code) { return entry(code).extension; }

Language language(Code code) {
  Language lang;
  lang.code = code;
  lang.extension = entry(code).extension;
  lang.name = entry(code).name;
  return lang;
}

std::optional<Code> from_code(std::string_view code) {
  if (code.size() != 2) {
    return std::nullopt;
  }
  std::string lower;
  for (unsigned char ch : code) {
    lower.push_back(static_cast<char>(std::tolower(ch)));
  }
  const auto it = std::find_if(kTable.begin(), kTable.end(),
                               [&lower](const Entry& e) { return lower == e.tag; });
  if (it == kTable.end()) {
    return std::nullopt;
  }
  return it->code;
}

std::optional<Code> from_name(std::string_view name) {
  const auto it = std::find_if(kTable.begin(), kTable.end(),
                               [name](const Entry& e) { return name == e.name; });
  if (it == kTable.end()) {
    return std::nullopt;
  }
  return it->code;
}

Code parse(std::string_view value) {
  if (auto code = from_code(value)) {
    return *code;
  }
  if (auto code = from_name(value)) {
    return *code;
  }
  throw Error(ErrorKind::InvalidLanguageCode, std::string(value));
}

const std::vector<Code>& all() {
  static const std::vector<Code> codes = [] {
    std::vector<Code> out;
    out.reserve(kTable.size());
    for (const auto& e : kTable) {
      out.push_back(e.code);
    }
    return out;
  }();
  return codes;
}

} // namespace programming

std::string spoken_name(std::optional<spoken::Code> code) {
  if (!code) {
    return "Any";
  }
  return std::string(spoken::name_in_english(*code));
}

std::string programming_name(std::optional<programming::Code> code) {
  if (!code) {
    return "Any";
  }
  return std::string(programming::display_name(*code));
}

} // namespace workshop
