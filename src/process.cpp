#include "gitstage/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace gitstage {

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

  void reset() noexcept { close_if_open(); }

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
  UniqueFd read;
  UniqueFd write;
};

[[nodiscard]] auto make_pipe() -> Pipe {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe2");
  return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

// A child that exits before reading its stdin must not kill us.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char *const *argv, const char *cwd, int in, int out, int err) {
  ::dup2(in, STDIN_FILENO);
  ::dup2(out, STDOUT_FILENO);
  ::dup2(err, STDERR_FILENO);
  if (::chdir(cwd) != 0)
    ::_exit(127);
  ::execvp(argv[0], argv);
  ::_exit(127);
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                          const std::string &input) {
  if (argv.empty())
    throw std::invalid_argument("run_process: empty argv");

  ignore_sigpipe();

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);
  const std::string dir = cwd.string();

  Pipe in = make_pipe();
  Pipe out = make_pipe();
  Pipe err = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "fork");
  if (pid == 0)
    exec_child(args.data(), dir.c_str(), in.read.get(), out.write.get(), err.write.get());

  in.read.reset();
  out.write.reset();
  err.write.reset();

  ProcessResult res;
  std::size_t written = 0;
  if (input.empty())
    in.write.reset();

  std::array<char, 4096> buf{};
  while (out.read.valid() || err.read.valid()) {
    std::vector<pollfd> fds;
    if (in.write.valid())
      fds.push_back(pollfd{in.write.get(), POLLOUT, 0});
    if (out.read.valid())
      fds.push_back(pollfd{out.read.get(), POLLIN, 0});
    if (err.read.valid())
      fds.push_back(pollfd{err.read.get(), POLLIN, 0});

    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (const auto &p : fds) {
      if (p.revents == 0)
        continue;
      if (in.write.valid() && p.fd == in.write.get()) {
        const ssize_t n = ::write(p.fd, input.data() + written, input.size() - written);
        if (n > 0)
          written += static_cast<std::size_t>(n);
        if (n < 0 || written == input.size())
          in.write.reset();
        continue;
      }
      UniqueFd &src = (out.read.valid() && p.fd == out.read.get()) ? out.read : err.read;
      std::string &dst = (&src == &out.read) ? res.out : res.err;
      const ssize_t n = ::read(p.fd, buf.data(), buf.size());
      if (n > 0)
        dst.append(buf.data(), static_cast<std::size_t>(n));
      else if (n == 0 || errno != EINTR)
        src.reset();
    }
  }
  in.write.reset();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return res;
}

} // namespace gitstage
