#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "logger.hpp"

namespace utils {

namespace {

// 管道描述符的 RAII 包装
class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

 private:
  int fd_;
};

void makePipe(FdGuard& read_end, FdGuard& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
}

// 读到 EOF 返回 false
bool drain(int fd, std::string& sink) {
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      sink.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const std::function<bool()>& shouldAbort) {
  if (argv.empty()) {
    throw std::invalid_argument("RunProcess: empty argv");
  }

  FdGuard out_r, out_w, err_r, err_w;
  makePipe(out_r, out_w);
  makePipe(err_r, err_w);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ::dup2(out_w.get(), STDOUT_FILENO);
    ::dup2(err_w.get(), STDERR_FILENO);
    ::execvp(args[0], args.data());
    const char* msg = std::strerror(errno);
    ssize_t ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
    (void)ignored;
    ::_exit(127);
  }

  out_w.reset();
  err_w.reset();
  ::fcntl(out_r.get(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_r.get(), F_SETFL, O_NONBLOCK);

  ProcessResult result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool out_open = true;
  bool err_open = true;
  bool killed = false;
  std::chrono::steady_clock::time_point kill_time;

  while (out_open || err_open) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = {out_r.get(), POLLIN, 0};
    if (err_open) fds[count++] = {err_r.get(), POLLIN, 0};

    int rc = ::poll(fds, count, 100);
    if (rc < 0 && errno != EINTR) {
      LOG(ERROR) << "[Process] poll failed: " << std::strerror(errno);
      if (!killed) ::kill(pid, SIGKILL);
      break;
    }
    if (out_open) out_open = drain(out_r.get(), result.out);
    if (err_open) err_open = drain(err_r.get(), result.err);

    // 孙进程可能继承了管道，kill 之后最多再等 1 秒
    if (killed &&
        std::chrono::steady_clock::now() - kill_time > std::chrono::seconds(1)) {
      break;
    }
    if (!killed) {
      if (shouldAbort && shouldAbort()) {
        result.aborted = true;
      } else if (std::chrono::steady_clock::now() >= deadline) {
        result.timedOut = true;
      }
      if (result.aborted || result.timedOut) {
        LOG(INFO) << "[Process] Killing " << argv[0] << " (pid " << pid << ", "
                  << (result.aborted ? "aborted" : "timed out") << ")";
        ::kill(pid, SIGKILL);
        killed = true;
        kill_time = std::chrono::steady_clock::now();
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

}  // namespace utils
