#include "command/command_runner.hpp"
#include "languages/languages.hpp"
#include "workshop/error.hpp"
#include "workshop/log.hpp"
#include "workshop/status.hpp"
#include "workshop/workshop_data.hpp"
#include "workshop/workshops.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void on_interrupt(int) { g_cancel.store(true); }

const workshop::application::PythonVersion kMinPython{3, 8, 0};

void print_usage() {
  std::cout <<
      "NAME\n"
      "        workshop - interactive programming workshops\n"
      "\n"
      "SYNOPSIS\n"
      "        workshop [ options... ] function\n"
      "\n"
      "FUNCTIONS\n"
      "        --help | -?\n"
      "            Print this help text.\n"
      "\n"
      "        --list [ --spoken=<code> ] [ --programming=<code> ]\n"
      "            List the workshops offering the selected languages.\n"
      "\n"
      "        --show=<workshop>\n"
      "            Print the metadata, description and setup instructions.\n"
      "\n"
      "        --lessons=<workshop>\n"
      "            List the lessons and their status.\n"
      "\n"
      "        --lesson=<workshop>/<lesson>\n"
      "            Print the lesson text.\n"
      "\n"
      "        --set-status=<workshop>/<lesson>:<NotStarted|InProgress|Completed>\n"
      "            Record the lesson status.\n"
      "\n"
      "        --check-deps=<workshop>\n"
      "            Run the workshop dependency check.\n"
      "\n"
      "        --check=<workshop>/<lesson>\n"
      "            Run the lesson solution check.\n"
      "\n"
      "        --init=<workshop>\n"
      "            Copy a workshop from the application data dir into ./.workshops.\n"
      "\n"
      "OPTIONS\n"
      "        -C <path>\n"
      "            Run as if started in <path>.\n"
      "\n"
      "        --spoken=<code> | --programming=<code>\n"
      "            Override the selected languages.\n"
      "\n"
      "ENVIRONMENT\n"
      "        WORKSHOP_LOG\n"
      "            Enable debug and info log lines on standard error.\n";
}

// ---------------------------------------------------------------------------

struct Context {
  std::filesystem::path data_dir;
  workshop::Status status;
  std::optional<workshop::spoken::Code> spoken;
  std::optional<workshop::programming::Code> programming;
};

class MainFunction {
public:
  virtual ~MainFunction() = default;
  virtual void execute(Context& context) = 0;
};

workshop::WorkshopData require_workshop(const Context& context, const std::string& name) {
  return workshop::WorkshopLoader(name).path(context.data_dir).load();
}

workshop::LessonEntry require_lesson(const Context& context,
                                     const workshop::WorkshopData& data,
                                     const std::string& lesson) {
  auto lessons = data.lessons(context.spoken, context.programming);
  const auto it = lessons.find(lesson);
  if (it == lessons.end()) {
    throw workshop::Error(workshop::ErrorKind::LessonDataDirNotFound,
                          data.name() + "/" + lesson);
  }
  return it->second;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += separator;
    }
    out += item;
  }
  return out;
}

std::string language_summary(const workshop::WorkshopData& data) {
  std::vector<std::string> parts;
  for (const auto& [spoken, codes] : data.languages()) {
    std::vector<std::string> programming;
    for (const auto code : codes) {
      programming.push_back(workshop::programming::to_string(code));
    }
    parts.push_back(workshop::spoken::to_string(spoken) + ":" + join(programming, ","));
  }
  return join(parts, " ");
}

namespace oper {

class List : public MainFunction {
public:
  void execute(Context& context) override {
    const auto all = workshop::workshops::load_all_filtered(context.data_dir, context.spoken,
                                                            context.programming);
    std::cout << "Workshops (" << workshop::spoken_name(context.spoken) << ", "
              << workshop::programming_name(context.programming) << "):\n";
    for (const auto& data : all) {
      const auto metadata = data.metadata(context.spoken);
      std::cout << "  " << data.name() << " - " << metadata.title << " ["
                << language_summary(data) << "]\n";
    }
  }
};

class Show : public MainFunction {
public:
  explicit Show(std::string name) : name_(std::move(name)) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, name_);
    const auto metadata = data.metadata(context.spoken);
    std::cout << metadata.title << "\n"
              << "Authors:    " << join(metadata.authors, ", ") << "\n"
              << "Copyright:  " << metadata.copyright << "\n"
              << "License:    " << metadata.license << "\n"
              << "Homepage:   " << metadata.homepage << "\n"
              << "Difficulty: " << metadata.difficulty << "\n\n"
              << data.description(context.spoken) << "\n"
              << data.setup_instructions(context.spoken, context.programming) << std::endl;
  }

private:
  std::string name_;
};

class Lessons : public MainFunction {
public:
  explicit Lessons(std::string name) : name_(std::move(name)) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, name_);
    const auto [spoken, programming] = data.resolve_languages(context.spoken, context.programming);
    std::cout << data.name() << " (" << workshop::spoken::to_string(spoken) << ", "
              << workshop::programming::to_string(programming) << "):\n";
    for (const auto& [name, lesson] : data.lessons(spoken, programming)) {
      const auto metadata = lesson.metadata();
      std::cout << "  " << name << " - " << metadata.title << " ["
                << workshop::display_name(metadata.status) << "]\n";
    }
  }

private:
  std::string name_;
};

class ShowLesson : public MainFunction {
public:
  ShowLesson(std::string workshop_name, std::string lesson)
      : workshop_(std::move(workshop_name)), lesson_(std::move(lesson)) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, workshop_);
    const auto lesson = require_lesson(context, data, lesson_);
    std::cout << lesson.text() << std::endl;

    context.status.set_workshop(workshop_);
    context.status.set_lesson(lesson_);
    context.status.save();
  }

private:
  std::string workshop_;
  std::string lesson_;
};

class SetStatus : public MainFunction {
public:
  SetStatus(std::string workshop_name, std::string lesson, workshop::LessonStatus status)
      : workshop_(std::move(workshop_name)), lesson_(std::move(lesson)), status_(status) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, workshop_);
    auto lesson = require_lesson(context, data, lesson_);
    const auto updated = lesson.update_status(status_);
    std::cout << lesson.name() << ": " << workshop::display_name(updated.status) << std::endl;
  }

private:
  std::string workshop_;
  std::string lesson_;
  workshop::LessonStatus status_;
};

workshop::command::CommandRunner make_runner() {
  workshop::command::CommandRunner::Programs programs;
  programs.python = workshop::application::find_python_executable(kMinPython);
  return workshop::command::CommandRunner(
      [](const std::string& line) { std::cout << line << std::endl; }, programs);
}

class CheckDeps : public MainFunction {
public:
  explicit CheckDeps(std::string name) : name_(std::move(name)) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, name_);
    const auto [spoken, programming] = data.resolve_languages(context.spoken, context.programming);
    const auto runner = make_runner();
    const auto result = runner.check_dependencies(data.deps_script_path(spoken, programming),
                                                  g_cancel);
    if (!result.success) {
      throw std::runtime_error("dependency check failed with exit code " +
                               std::to_string(result.exit_code));
    }
    std::cout << "All dependencies satisfied" << std::endl;
  }

private:
  std::string name_;
};

class Check : public MainFunction {
public:
  Check(std::string workshop_name, std::string lesson)
      : workshop_(std::move(workshop_name)), lesson_(std::move(lesson)) {}

  void execute(Context& context) override {
    const auto data = require_workshop(context, workshop_);
    const auto [spoken, programming] = data.resolve_languages(context.spoken, context.programming);
    auto lesson = require_lesson(context, data, lesson_);
    const auto runner = make_runner();
    const auto result =
        runner.check_solution(data.lesson_dir_path(lesson_, spoken, programming), g_cancel);
    if (!result.success) {
      lesson.update_status(workshop::LessonStatus::InProgress);
      throw std::runtime_error("solution check failed with exit code " +
                               std::to_string(result.exit_code));
    }
    lesson.update_status(workshop::LessonStatus::Completed);
    std::cout << lesson_ << ": " << workshop::display_name(workshop::LessonStatus::Completed)
              << std::endl;
  }

private:
  std::string workshop_;
  std::string lesson_;
};

class Init : public MainFunction {
public:
  explicit Init(std::string name) : name_(std::move(name)) {}

  void execute(Context& context) override {
    const auto target = workshop::workshops::init_data_dir(
        name_, workshop::application::data_dir(), std::filesystem::current_path());
    context.data_dir = target;
    std::cout << "Copied " << name_ << " into " << target.string() << std::endl;
  }

private:
  std::string name_;
};

} // namespace oper

// ---------------------------------------------------------------------------

bool long_arg_matches(const std::string& arg, const std::string& option, bool needs_value) {
  if (arg.compare(0, option.size(), option) != 0) {
    return false;
  }
  if (arg.size() == option.size()) {
    if (needs_value) {
      throw std::runtime_error("missing value for argument '" + option + "'");
    }
    return true;
  }
  if (arg[option.size()] != '=') {
    return false;
  }
  if (!needs_value) {
    throw std::runtime_error("excess value for argument '" + option + "'");
  }
  return true;
}

std::string arg_value(const std::string& arg, const std::string& option) {
  auto value = arg.substr(option.size() + 1);
  if (value.empty()) {
    throw std::runtime_error("missing value for argument '" + option + "'");
  }
  return value;
}

// "<workshop>/<lesson>"
std::pair<std::string, std::string> split_lesson(const std::string& value) {
  const auto slash = value.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == value.size()) {
    throw std::runtime_error("expected <workshop>/<lesson>, got '" + value + "'");
  }
  return {value.substr(0, slash), value.substr(slash + 1)};
}

struct Arguments {
  std::unique_ptr<MainFunction> main_function;
  std::optional<workshop::spoken::Code> spoken;
  std::optional<workshop::programming::Code> programming;
};

void set_main_function(Arguments& parsed, std::unique_ptr<MainFunction> function,
                       const std::string& arg) {
  if (parsed.main_function) {
    throw std::runtime_error("second argument declaring main function: " + arg);
  }
  parsed.main_function = std::move(function);
}

Arguments parse_arguments(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg == "-?" || arg == "--help") {
      print_usage();
      std::exit(0);
    }
  }

  Arguments parsed;
  for (auto iter = args.begin(); iter != args.end(); ++iter) {
    const auto& arg = *iter;
    if (arg == "-C") {
      if (++iter == args.end()) {
        throw std::runtime_error("missing argument after -C");
      }
      if (::chdir(iter->c_str()) != 0) {
        throw std::runtime_error("failed to chdir() to " + *iter);
      }
    } else if (long_arg_matches(arg, "--spoken", true)) {
      parsed.spoken = workshop::spoken::parse(arg_value(arg, "--spoken"));
    } else if (long_arg_matches(arg, "--programming", true)) {
      parsed.programming = workshop::programming::parse(arg_value(arg, "--programming"));
    } else if (long_arg_matches(arg, "--list", false)) {
      set_main_function(parsed, std::make_unique<oper::List>(), arg);
    } else if (long_arg_matches(arg, "--show", true)) {
      set_main_function(parsed, std::make_unique<oper::Show>(arg_value(arg, "--show")), arg);
    } else if (long_arg_matches(arg, "--lessons", true)) {
      set_main_function(parsed, std::make_unique<oper::Lessons>(arg_value(arg, "--lessons")), arg);
    } else if (long_arg_matches(arg, "--lesson", true)) {
      auto [name, lesson] = split_lesson(arg_value(arg, "--lesson"));
      set_main_function(parsed, std::make_unique<oper::ShowLesson>(name, lesson), arg);
    } else if (long_arg_matches(arg, "--set-status", true)) {
      const auto value = arg_value(arg, "--set-status");
      const auto colon = value.rfind(':');
      if (colon == std::string::npos) {
        throw std::runtime_error("expected <workshop>/<lesson>:<status>, got '" + value + "'");
      }
      const auto status = workshop::lesson_status_from_string(value.substr(colon + 1));
      if (!status) {
        throw std::runtime_error("unknown lesson status '" + value.substr(colon + 1) + "'");
      }
      auto [name, lesson] = split_lesson(value.substr(0, colon));
      set_main_function(parsed, std::make_unique<oper::SetStatus>(name, lesson, *status), arg);
    } else if (long_arg_matches(arg, "--check-deps", true)) {
      set_main_function(parsed, std::make_unique<oper::CheckDeps>(arg_value(arg, "--check-deps")),
                        arg);
    } else if (long_arg_matches(arg, "--check", true)) {
      auto [name, lesson] = split_lesson(arg_value(arg, "--check"));
      set_main_function(parsed, std::make_unique<oper::Check>(name, lesson), arg);
    } else if (long_arg_matches(arg, "--init", true)) {
      set_main_function(parsed, std::make_unique<oper::Init>(arg_value(arg, "--init")), arg);
    } else {
      throw std::runtime_error("invalid argument '" + arg + "'");
    }
  }

  if (!parsed.main_function) {
    throw std::runtime_error("no function given, see --help");
  }
  return parsed;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto args = parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
    std::signal(SIGINT, on_interrupt);

    const auto cwd = std::filesystem::current_path();
    const auto local = workshop::workshops::find_data_dir(cwd);
    const auto data_dir = local ? *local : workshop::application::data_dir();
    workshop::log::debug("main", "data dir " + data_dir.string());

    Context context{data_dir,
                    workshop::Status::load(data_dir / "status.json",
                                           workshop::application::config_dir() / "config.json"),
                    std::nullopt, std::nullopt};
    context.spoken = args.spoken ? args.spoken : context.status.spoken_language();
    context.programming =
        args.programming ? args.programming : context.status.programming_language();

    args.main_function->execute(context);
  } catch (const workshop::Error& e) {
    std::cerr << "workshop: " << workshop::error_kind_name(e.kind()) << ": " << e.what()
              << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "workshop: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
