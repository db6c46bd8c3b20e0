#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace util {

class subprocess_error : public std::runtime_error {
 public:
  explicit subprocess_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Outcome of a finished child process.
struct SubprocessResult {
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;  // Killed because the timeout expired.
  std::string output;
  std::string error;
};

class Subprocess {
 public:
  // Runs args[0], looked up in PATH, with the given arguments. input is fed
  // to the child's stdin, which is then closed; stdout and stderr are
  // collected separately. If timeout is non-zero the child is killed once it
  // expires. Throws subprocess_error if the child could not be started.
  static SubprocessResult Run(
      const std::vector<std::string>& args, const std::string& input = "",
      std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
};

}  // namespace util

#endif
