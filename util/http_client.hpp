#ifndef UTIL_HTTP_CLIENT_HPP
#define UTIL_HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace util {

class http_error : public std::runtime_error {
 public:
  explicit http_error(const std::string& msg) : std::runtime_error(msg) {}
};

// The peer did not answer before the request deadline.
class http_timeout : public http_error {
 public:
  explicit http_timeout(const std::string& msg) : http_error(msg) {}
};

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // Keys are lowercase.
  std::string body;
};

// Minimal HTTP/1.1 client for local APIs such as the Docker Engine. Every
// request uses its own connection (Connection: close), so a client can be
// shared between threads.
class HttpClient {
 public:
  // endpoint is unix:///path/to/socket, tcp://host:port or http://host:port.
  explicit HttpClient(const std::string& endpoint);

  HttpResponse Post(const std::string& path, const std::string& body,
                    std::chrono::milliseconds timeout);

  // Sends a request and reads the whole response. Throws http_timeout if the
  // response is not complete within timeout, http_error on any other failure.
  HttpResponse Request(const std::string& method, const std::string& path,
                       const std::string& body,
                       std::chrono::milliseconds timeout);

  const std::string& Endpoint() const { return endpoint_; }

 private:
  int Connect() const;

  std::string endpoint_;
  bool is_unix_ = false;
  std::string socket_path_;
  std::string host_;
  std::string port_;
};

// Parses raw as an HTTP response. Returns false if more data is needed; eof
// tells whether the peer closed the connection. Throws http_error if raw is
// malformed, or truncated at eof. Chunked bodies are decoded.
bool ParseHttpResponse(const std::string& raw, bool eof,
                       HttpResponse* response);

// Percent-encodes s for use in a URL path or query.
std::string UrlEncode(const std::string& s);

}  // namespace util

#endif
