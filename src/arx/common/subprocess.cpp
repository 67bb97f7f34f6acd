#include "arx/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace arx::common {

auto RunSubprocess(const std::vector<std::string>& argv) -> ProcessResult {
  if (argv.empty()) {
    return {.exit_code = -1, .output = "empty command line"};
  }

  std::array<int, 2> pipe_fds{};
  if (pipe(pipe_fds.data()) != 0) {
    return {
        .exit_code = -1,
        .output = "pipe() failed: " + std::string(strerror(errno))};
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);

  pid_t pid = 0;
  int spawn_result = posix_spawnp(
      &pid, c_argv[0], &actions, nullptr, c_argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  close(pipe_fds[1]);

  if (spawn_result != 0) {
    close(pipe_fds[0]);
    return {
        .exit_code = -1,
        .output = "cannot start '" + argv.front() +
                  "': " + std::string(strerror(spawn_result))};
  }

  std::string output;
  std::array<char, 4096> buffer{};
  ssize_t bytes_read = 0;
  while ((bytes_read = read(pipe_fds[0], buffer.data(), buffer.size())) > 0) {
    output.append(buffer.data(), static_cast<size_t>(bytes_read));
  }
  close(pipe_fds[0]);

  int status = 0;
  if (waitpid(pid, &status, 0) == -1) {
    return {
        .exit_code = -1,
        .output = "waitpid() failed: " + std::string(strerror(errno))};
  }

  int exit_code = -1;
  if (WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
  }
  return {.exit_code = exit_code, .output = std::move(output)};
}

}  // namespace arx::common
