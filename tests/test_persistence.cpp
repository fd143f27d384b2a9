#include "workshop/config.hpp"
#include "workshop/error.hpp"
#include "workshop/status.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <string>

namespace {

using workshop::Config;
using workshop::ErrorKind;
using workshop::Status;
using workshop::testing::read_file;
using workshop::testing::TempDir;
using workshop::testing::TestSuite;
using workshop::testing::write_file;
namespace spoken = workshop::spoken;
namespace programming = workshop::programming;

void test_config_created_when_missing(TestSuite& suite) {
  TempDir tmp;
  const auto path = tmp.path() / "config" / "config.json";
  const auto config = Config::load(path);
  suite.require(!config.spoken_language && !config.programming_language,
                "Fresh config should have no preferences");
  suite.require(std::filesystem::exists(path), "Loading should create config.json");
}

void test_config_round_trip(TestSuite& suite) {
  TempDir tmp;
  const auto path = tmp.path() / "config.json";
  Config config;
  config.spoken_language = spoken::Code::fr;
  config.programming_language = programming::Code::go;
  config.save(path);

  const auto loaded = Config::load(path);
  suite.require(loaded.spoken_language == spoken::Code::fr, "Spoken preference should persist");
  suite.require(loaded.programming_language == programming::Code::go,
                "Programming preference should persist");
  suite.require(read_file(path).find("\"fr\"") != std::string::npos,
                "Languages should be stored as two-letter codes");
}

void test_config_errors(TestSuite& suite) {
  TempDir tmp;
  const auto bad_json = tmp.path() / "bad.json";
  write_file(bad_json, "{ \"spoken_language\": ");
  suite.require_error(ErrorKind::JsonParsing, [&bad_json] { Config::load(bad_json); },
                      "Malformed JSON should fail");

  const auto bad_code = tmp.path() / "code.json";
  write_file(bad_code, "{ \"spoken_language\": \"xx\" }");
  suite.require_error(ErrorKind::InvalidLanguageCode, [&bad_code] { Config::load(bad_code); },
                      "Unknown language code should fail");

  const auto bad_type = tmp.path() / "type.json";
  write_file(bad_type, "{ \"programming_language\": 7 }");
  suite.require_error(ErrorKind::JsonParsing, [&bad_type] { Config::load(bad_type); },
                      "Non-string language should fail");

  const auto nulls = tmp.path() / "nulls.json";
  write_file(nulls, "{ \"spoken_language\": null }");
  suite.require(!Config::load(nulls).spoken_language.has_value(), "null means no preference");
}

void test_status_seeded_from_config(TestSuite& suite) {
  TempDir tmp;
  const auto config_path = tmp.path() / "config.json";
  const auto status_path = tmp.path() / "data" / "status.json";
  Config config;
  config.spoken_language = spoken::Code::it;
  config.programming_language = programming::Code::py;
  config.save(config_path);

  const auto status = Status::load(status_path, config_path);
  suite.require(status.spoken_language() == spoken::Code::it, "Status should seed spoken");
  suite.require(status.programming_language() == programming::Code::py,
                "Status should seed programming");
  suite.require(!status.workshop() && !status.lesson(), "No workshop or lesson selected yet");
  suite.require(!std::filesystem::exists(status_path), "Seeding should not write status.json");
}

void test_status_round_trip(TestSuite& suite) {
  TempDir tmp;
  const auto config_path = tmp.path() / "config.json";
  const auto status_path = tmp.path() / "data" / "status.json";

  auto status = Status::load(status_path, config_path);
  status.set_spoken_language(spoken::Code::ja, false);
  status.set_programming_language(programming::Code::rs, true);
  status.set_workshop(std::string("intro"));
  status.set_lesson(std::string("01-hello"));
  status.save();

  const auto reloaded = Status::load(status_path, config_path);
  suite.require(reloaded.spoken_language() == spoken::Code::ja, "Spoken selection persists");
  suite.require(reloaded.programming_language() == programming::Code::rs,
                "Programming selection persists");
  suite.require(reloaded.workshop() == std::string("intro"), "Workshop selection persists");
  suite.require(reloaded.lesson() == std::string("01-hello"), "Lesson selection persists");

  const auto config = Config::load(config_path);
  suite.require(!config.spoken_language, "Non-default choice should not reach the config");
  suite.require(config.programming_language == programming::Code::rs,
                "Default choice should be saved to the config");

  status.set_workshop(std::nullopt);
  status.save();
  suite.require(!Status::load(status_path, config_path).workshop(),
                "Cleared workshop should persist as absent");
}

void test_status_errors(TestSuite& suite) {
  TempDir tmp;
  const auto config_path = tmp.path() / "config.json";
  const auto status_path = tmp.path() / "status.json";
  write_file(status_path, "[1, 2, 3]");
  suite.require_error(ErrorKind::JsonParsing,
                      [&] { Status::load(status_path, config_path); },
                      "Status that is not an object should fail");

  write_file(status_path, "{ \"programming_language\": \"zz\" }");
  suite.require_error(ErrorKind::InvalidLanguageCode,
                      [&] { Status::load(status_path, config_path); },
                      "Unknown code in status should fail");
}

} // namespace

int main() {
  TestSuite suite;
  test_config_created_when_missing(suite);
  test_config_round_trip(suite);
  test_config_errors(suite);
  test_status_seeded_from_config(suite);
  test_status_round_trip(suite);
  test_status_errors(suite);
  return suite.finish("Persistence");
}
