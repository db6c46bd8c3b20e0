#ifndef BACKEND_API_ERROR_HPP
#define BACKEND_API_ERROR_HPP

#include <stdexcept>
#include <string>

namespace backend {

// A backend rejected a request or could not be reached. status is the HTTP
// status of the answer, or 0 if there was no answer at all.
class api_error : public std::runtime_error {
 public:
  api_error(int status, const std::string& msg)
      : std::runtime_error(msg), status_(status) {}
  int Status() const { return status_; }

 private:
  int status_;
};

// The object the request refers to does not exist.
class not_found : public api_error {
 public:
  explicit not_found(const std::string& msg) : api_error(404, msg) {}
};

}  // namespace backend

#endif
