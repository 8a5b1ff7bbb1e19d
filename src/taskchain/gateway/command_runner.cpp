#include "taskchain/gateway/command_runner.hpp"

#include "taskchain/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace taskchain {

namespace {

inline constexpr std::size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;
inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr std::size_t INITIAL_OUTPUT_RESERVE = 8192;

// Only the parent's read end is non-blocking. The child writes to a
// blocking descriptor and waits when the pipe is full.
auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  int flags = fcntl(fds[0], F_GETFL);
  if (flags < 0 || fcntl(fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
    close(fds[0]);
    close(fds[1]);
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

// Everything the child needs is built before fork(); the child only calls
// async-signal-safe functions.
struct ExecImage {
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;
};

auto build_image(const std::vector<std::string>& args,
                 const CommandOptions& options) -> ExecImage {
  ExecImage image;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string_view entry{*e};
    auto name = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const auto& [key, value] : options.env) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      image.env_storage.emplace_back(entry);
    }
  }
  for (const auto& [key, value] : options.env) {
    image.env_storage.push_back(key + "=" + value);
  }

  for (auto& entry : image.env_storage) {
    image.envp.push_back(entry.data());
  }
  image.envp.push_back(nullptr);

  for (const auto& arg : args) {
    image.argv.push_back(const_cast<char*>(arg.c_str()));
  }
  image.argv.push_back(nullptr);
  return image;
}

auto fork_and_exec(ExecImage& image, const std::string& working_dir,
                   int stdout_write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(stdout_write_fd, STDOUT_FILENO);
    dup2(stdout_write_fd, STDERR_FILENO);
    close(stdout_write_fd);

    if (!working_dir.empty()) {
      if (chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
    }

    execvpe(image.argv[0], image.argv.data(), image.envp.data());
    _exit(127);
  }

  close(stdout_write_fd);
  setpgid(pid, pid);
  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Returns the collected output and whether the deadline passed first.
auto read_output(int fd, std::chrono::steady_clock::time_point deadline)
    -> std::pair<std::string, bool> {
  std::string output;
  output.reserve(INITIAL_OUTPUT_RESERVE);
  std::array<char, READ_BUFFER_SIZE> buffer;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return {std::move(output), true};
    }

    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc == 0) {
      return {std::move(output), true};
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      break;
    }
    if (bytes_read == 0) {
      break;
    }

    output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
    if (output.size() >= MAX_OUTPUT_SIZE) {
      output.resize(MAX_OUTPUT_SIZE);
      break;
    }
  }

  return {std::move(output), false};
}

auto wait_process(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
      return -1;
    }
  }
  return get_exit_code(status);
}

}  // namespace

auto run_command(const std::vector<std::string>& argv,
                 const CommandOptions& options) -> Result<CommandResult> {
  if (argv.empty() || argv.front().empty()) {
    return fail(Error::InvalidArgument);
  }

  auto image = build_image(argv, options);

  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    log::error("Failed to create pipe: {}", strerror(errno));
    return fail(Error::CommandFailed);
  }

  auto start = std::chrono::steady_clock::now();

  pid_t pid = fork_and_exec(image, options.working_dir, write_fd);
  if (pid < 0) {
    log::error("Failed to fork for {}: {}", argv.front(), strerror(errno));
    close(read_fd);
    close(write_fd);
    return fail(Error::CommandFailed);
  }

  auto [output, timed_out] = read_output(read_fd, start + options.timeout);
  close(read_fd);

  if (timed_out) {
    log::warn("{} timed out after {}s, killing process group {}",
              argv.front(), options.timeout.count(), pid);
    kill(-pid, SIGKILL);
  }

  CommandResult result;
  result.exit_code = wait_process(pid);
  result.output = std::move(output);
  result.timed_out = timed_out;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return ok(std::move(result));
}

auto run_shell(std::string_view cmd, const CommandOptions& options)
    -> Result<CommandResult> {
  return run_command({"/bin/sh", "-c", std::string(cmd)}, options);
}

}  // namespace taskchain
