#include "util/subprocess.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <mutex>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

// Closes the file descriptor, if still open, when it goes out of scope.
class Fd {
 public:
  Fd() = default;
  ~Fd() { Close(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const { return fd_; }
  void Set(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ != -1) close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  Fd read;
  Fd write;
};

void MakePipe(Pipe* p) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw util::subprocess_error(ErrnoMessage("pipe2", errno));
  }
  p->read.Set(fds[0]);
  p->write.Set(fds[1]);
}

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void Child(const std::string& executable,
                        const std::vector<std::string>& args, Pipe* in,
                        Pipe* out, Pipe* err, Pipe* status) {
  auto die = [status](const char* prefix, int error) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    char msg[kStrErrorBufSize] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, mystrerror(error, msg, kStrErrorBufSize), kStrErrorBufSize);
    int len = strlen(buf);
    if (write(status->write.Get(), &len, sizeof(len)) == sizeof(len)) {
      ssize_t unused = write(status->write.Get(), buf, len);
      (void)unused;
    }
    _Exit(127);
  };

  signal(SIGPIPE, SIG_DFL);
  if (dup2(in->read.Get(), STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(out->write.Get(), STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(err->write.Get(), STDERR_FILENO) == -1) die("redir stderr", errno);

  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : args) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> argv;
  for (std::vector<char>& arg : vec_args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  execv(executable.c_str(), argv.data());
  die("exec", errno);
  _Exit(127);
}

}  // namespace

namespace util {

SubprocessResult Subprocess::Run(const std::vector<std::string>& args,
                                 const std::string& input,
                                 std::chrono::milliseconds timeout) {
  if (args.empty()) throw subprocess_error("No command given");
  std::string executable = which(args[0]);
  if (executable.empty()) {
    throw subprocess_error("exec: " + args[0] + " not found in PATH");
  }
  IgnoreSigpipe();

  Pipe in, out, err, status;
  MakePipe(&in);
  MakePipe(&out);
  MakePipe(&err);
  MakePipe(&status);

  int child_pid = fork();
  if (child_pid == -1) {
    throw subprocess_error(ErrnoMessage("fork", errno));
  }
  if (child_pid == 0) {
    Child(executable, args, &in, &out, &err, &status);
  }

  in.read.Close();
  out.write.Close();
  err.write.Close();
  status.write.Close();

  int error_len = 0;
  if (read(status.read.Get(), &error_len, sizeof(error_len)) ==
      sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    ssize_t unused = read(status.read.Get(), error,
                          std::min<size_t>(error_len, PIPE_BUF - 1));
    (void)unused;
    waitpid(child_pid, nullptr, 0);
    throw subprocess_error(error);
  }
  status.read.Close();

  if (input.empty()) in.write.Close();
  if (in.write.Get() != -1) {
    fcntl(in.write.Get(), F_SETFL, O_NONBLOCK);
  }

  auto start = std::chrono::steady_clock::now();
  auto remaining_millis = [&start, &timeout]() -> int {
    if (timeout.count() == 0) return -1;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed >= timeout) return 0;
    return static_cast<int>((timeout - elapsed).count());
  };

  SubprocessResult result;
  size_t written = 0;
  char buf[kChunkSize];
  while (out.read.Get() != -1 || err.read.Get() != -1) {
    struct pollfd fds[3] = {{out.read.Get(), POLLIN, 0},
                            {err.read.Get(), POLLIN, 0},
                            {in.write.Get(), POLLOUT, 0}};
    int wait = remaining_millis();
    if (wait == 0) {
      kill(child_pid, SIGKILL);
      result.killed = true;
      break;
    }
    int ret = poll(fds, 3, wait);
    if (ret == -1) {
      if (errno == EINTR) continue;
      int error = errno;
      kill(child_pid, SIGKILL);
      waitpid(child_pid, nullptr, 0);
      throw subprocess_error(ErrnoMessage("poll", error));
    }
    if (fds[2].revents & (POLLOUT | POLLERR | POLLHUP)) {
      ssize_t amount = write(in.write.Get(), input.data() + written,
                             input.size() - written);
      if (amount == -1 && errno != EAGAIN && errno != EINTR) {
        // The child closed its stdin early; the rest of the input is dropped.
        in.write.Close();
      } else if (amount > 0) {
        written += amount;
        if (written == input.size()) in.write.Close();
      }
    }
    Fd* readers[2] = {&out.read, &err.read};
    std::string* sinks[2] = {&result.output, &result.error};
    for (int i = 0; i < 2; i++) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t amount = read(readers[i]->Get(), buf, sizeof(buf));
      if (amount == -1 && errno == EINTR) continue;
      if (amount <= 0) {
        readers[i]->Close();
      } else {
        sinks[i]->append(buf, amount);
      }
    }
  }
  in.write.Close();

  int child_status = 0;
  while (waitpid(child_pid, &child_status, 0) == -1) {
    if (errno != EINTR) {
      throw subprocess_error(ErrnoMessage("waitpid", errno));
    }
  }
  result.status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  result.signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  VLOG(2) << args[0] << " exited with status " << result.status_code
          << " signal " << result.signal;
  return result;
}

}  // namespace util
