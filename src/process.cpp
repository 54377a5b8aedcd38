#include "changeview/process.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept {
    if (fd_ != -1) {
      // best effort; no throw in destructor
      ::close(fd_);
      fd_ = -1;
    }
  }
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

[[nodiscard]] auto make_pipe() -> Pipe {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");
  return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

[[nodiscard]] auto join_command(const std::vector<std::string> &argv) -> std::string {
  std::string out;
  for (const auto &a : argv) {
    if (!out.empty())
      out += ' ';
    out += a;
  }
  return out;
}

// Drain both pipes until EOF on each.
void drain(UniqueFd &out_fd, UniqueFd &err_fd, std::string &out, std::string &err) {
  std::array<char, 4096> buf{};
  while (out_fd.valid() || err_fd.valid()) {
    std::array<pollfd, 2> pfds{};
    nfds_t n = 0;
    UniqueFd *owners[2] = {nullptr, nullptr};
    std::string *sinks[2] = {nullptr, nullptr};
    if (out_fd.valid()) {
      pfds[n] = pollfd{.fd = out_fd.get(), .events = POLLIN, .revents = 0};
      owners[n] = &out_fd;
      sinks[n++] = &out;
    }
    if (err_fd.valid()) {
      pfds[n] = pollfd{.fd = err_fd.get(), .events = POLLIN, .revents = 0};
      owners[n] = &err_fd;
      sinks[n++] = &err;
    }

    if (::poll(pfds.data(), n, -1) < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (nfds_t i = 0; i < n; ++i) {
      if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
        continue;
      const ssize_t got = ::read(pfds[i].fd, buf.data(), buf.size());
      if (got > 0) {
        sinks[i]->append(buf.data(), static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        owners[i]->reset();
      }
    }
  }
}

} // namespace

namespace changeview::process {

bool trace_enabled() { return std::getenv("CHANGEVIEW_TRACE") != nullptr; }

Result run(const std::vector<std::string> &argv, const std::filesystem::path &cwd) {
  if (argv.empty())
    throw std::invalid_argument("process::run: empty argv");

  if (trace_enabled())
    std::cerr << "changeview: + " << join_command(argv) << "\n";

  // Build argv before fork; only async-signal-safe calls in the child.
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);
  const std::string dir = cwd.string();

  Pipe out_pipe = make_pipe();
  Pipe err_pipe = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "fork");

  if (pid == 0) {
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
    ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
    if (!dir.empty() && ::chdir(dir.c_str()) != 0)
      ::_exit(127);
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }

  out_pipe.write_end.reset();
  err_pipe.write_end.reset();

  Result result;
  drain(out_pipe.read_end, err_pipe.read_end, result.out, result.err);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);
  return result;
}

} // namespace changeview::process
