#include "languages/spoken.hpp"

#include "workshop/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>

namespace workshop::spoken {
namespace {

struct Entry {
  Code code;
  const char* tag;
  const char* english;
  const char* native;
  Direction direction;
};

constexpr Direction LTR = Direction::LeftToRight;
constexpr Direction RTL = Direction::RightToLeft;

// Indexed by static_cast<std::size_t>(Code).
constexpr std::array<Entry, 50> kTable = {{
    {Code::ar, "ar", "Arabic", "العربية", RTL},
    {Code::bg, "bg", "Bulgarian", "Български", LTR},
    {Code::bn, "bn", "Bengali", "বাংলা", LTR},
    {Code::cs, "cs", "Czech", "Čeština", LTR},
    {Code::da, "da", "Danish", "Dansk", LTR},
    {Code::de, "de", "German", "Deutsch", LTR},
    {Code::el, "el", "Greek", "Ελληνικά", LTR},
    {Code::en, "en", "English", "English", LTR},
    {Code::es, "es", "Spanish", "Español", LTR},
    {Code::et, "et", "Estonian", "Eesti", LTR},
    {Code::fa, "fa", "Persian", "فارسی", RTL},
    {Code::fi, "fi", "Finnish", "Suomi", LTR},
    {Code::fr, "fr", "French", "Français", LTR},
    {Code::gu, "gu", "Gujarati", "ગુજરાતી", LTR},
    {Code::he, "he", "Hebrew", "עברית", RTL},
    {Code::hi, "hi", "Hindi", "हिन्दी", LTR},
    {Code::hr, "hr", "Croatian", "Hrvatski", LTR},
    {Code::hu, "hu", "Hungarian", "Magyar", LTR},
    {Code::id, "id", "Indonesian", "Bahasa Indonesia", LTR},
    {Code::it, "it", "Italian", "Italiano", LTR},
    {Code::ja, "ja", "Japanese", "日本語", LTR},
    {Code::kn, "kn", "Kannada", "ಕನ್ನಡ", LTR},
    {Code::ko, "ko", "Korean", "한국어", LTR},
    {Code::lt, "lt", "Lithuanian", "Lietuvių", LTR},
    {Code::lv, "lv", "Latvian", "Latviešu", LTR},
    {Code::ml, "ml", "Malayalam", "മലയാളം", LTR},
    {Code::mr, "mr", "Marathi", "मराठी", LTR},
    {Code::ms, "ms", "Malay", "Bahasa Melayu", LTR},
    {Code::my, "my", "Burmese", "မြန်မာ", LTR},
    {Code::nl, "nl", "Dutch", "Nederlands", LTR},
    {Code::no, "no", "Norwegian", "Norsk", LTR},
    {Code::or_, "or", "Odia", "ଓଡ଼ିଆ", LTR},
    {Code::pa, "pa", "Punjabi", "ਪੰਜਾਬੀ", LTR},
    {Code::pl, "pl", "Polish", "Polski", LTR},
    {Code::pt, "pt", "Portuguese", "Português", LTR},
    {Code::ro, "ro", "Romanian", "Română", LTR},
    {Code::ru, "ru", "Russian", "Русский", LTR},
    {Code::sk, "sk", "Slovak", "Slovenčina", LTR},
    {Code::sl, "sl", "Slovenian", "Slovenščina", LTR},
    {Code::sr, "sr", "Serbian", "Српски", LTR},
    {Code::sv, "sv", "Swedish", "Svenska", LTR},
    {Code::sw, "sw", "Swahili", "Kiswahili", LTR},
    {Code::ta, "ta", "Tamil", "தமிழ்", LTR},
    {Code::te, "te", "Telugu", "తెలుగు", LTR},
    {Code::th, "th", "Thai", "ไทย", LTR},
    {Code::tr, "tr", "Turkish", "Türkçe", LTR},
    {Code::uk, "uk", "Ukrainian", "Українська", LTR},
    {Code::ur, "ur", "Urdu", "اردو", RTL},
    {Code::vi, "vi", "Vietnamese", "Tiếng Việt", LTR},
    {Code::zh, "zh", "Chinese", "中文", LTR},
}};

const Entry& entry(Code code) {
  return kTable[static_cast<std::size_t>(code)];
}

} // namespace

std::string to_string(Code code) { return entry(code).tag; }

std::string_view name_in_english(Code code) { return entry(code).english; }

std::string_view name_in_native(Code code) { return entry(code).native; }

Direction text_direction(Code code) { return entry(code).direction; }

Language language(Code code) {
  Language lang;
  lang.code = code;
  lang.name = entry(code).english;
  lang.native_name = entry(code).native;
  lang.direction = entry(code).direction;
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

std::optional<Code> from_name(std::string_view english_name) {
  const auto it = std::find_if(kTable.begin(), kTable.end(), [english_name](const Entry& e) {
    return english_name == e.english;
  });
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

} // namespace workshop::spoken
