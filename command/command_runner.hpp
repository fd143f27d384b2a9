#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace workshop::command {

struct CommandResult {
  bool success = false;
  int exit_code = -1;
};

class CommandRunner {
public:
  using OutputHandler = std::function<void(const std::string&)>;

  struct Programs {
    std::string python = "python";
    std::string docker_compose = "docker-compose";
  };

  explicit CommandRunner(OutputHandler on_output);
  CommandRunner(OutputHandler on_output, Programs programs);

  // Throws Error(CommandFailed) when the process cannot be started and
  // Error(CommandCancelled) when cancel is raised before it exits.
  CommandResult run(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::optional<std::filesystem::path>& working_dir,
                    const std::atomic<bool>& cancel) const;

  // {python} {deps_script}, run in the script's directory.
  CommandResult check_dependencies(const std::filesystem::path& deps_script,
                                   const std::atomic<bool>& cancel) const;

  // {docker_compose} up -d, then {python} check.py, both in lesson_dir.
  CommandResult check_solution(const std::filesystem::path& lesson_dir,
                               const std::atomic<bool>& cancel) const;

  const Programs& programs() const { return programs_; }

private:
  OutputHandler on_output_;
  Programs programs_;
};

} // namespace workshop::command
