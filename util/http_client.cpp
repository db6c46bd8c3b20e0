#include "util/http_client.hpp"

#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace {

static const constexpr size_t kReadSize = 32 * 1024;

std::string ErrnoMessage(const std::string& prefix, int err) {
  return prefix + ": " + strerror(err);
}

class Socket {
 public:
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ != -1) close(fd_);
  }
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  int Get() const { return fd_; }

 private:
  int fd_;
};

int RemainingMillis(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void SendAll(int fd, const std::string& data,
             std::chrono::steady_clock::time_point deadline) {
  size_t pos = 0;
  while (pos < data.size()) {
    struct pollfd pfd = {fd, POLLOUT, 0};
    int ret = poll(&pfd, 1, RemainingMillis(deadline));
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) throw util::http_error(ErrnoMessage("poll", errno));
    if (ret == 0) throw util::http_timeout("Timed out sending request");
    ssize_t sent = send(fd, data.data() + pos, data.size() - pos,
                        MSG_NOSIGNAL);
    if (sent == -1 && (errno == EINTR || errno == EAGAIN)) continue;
    if (sent == -1) throw util::http_error(ErrnoMessage("send", errno));
    pos += sent;
  }
}

// Decodes a chunked body. Returns false if the terminating chunk has not been
// received yet.
bool DecodeChunked(const std::string& data, std::string* body) {
  body->clear();
  size_t pos = 0;
  while (true) {
    size_t line_end = data.find("\r\n", pos);
    if (line_end == std::string::npos) return false;
    std::string size_str = data.substr(pos, line_end - pos);
    size_t ext = size_str.find(';');
    if (ext != std::string::npos) size_str.resize(ext);
    size_str = std::string(absl::StripAsciiWhitespace(size_str));
    char* end = nullptr;
    unsigned long size = strtoul(size_str.c_str(), &end, 16);
    if (size_str.empty() || *end != '\0') {
      throw util::http_error("Invalid chunk size: " + size_str);
    }
    if (size == 0) return true;
    size_t chunk_start = line_end + 2;
    if (data.size() < chunk_start + size + 2) return false;
    body->append(data, chunk_start, size);
    pos = chunk_start + size + 2;
  }
}

}  // namespace

namespace util {

bool ParseHttpResponse(const std::string& raw, bool eof,
                       HttpResponse* response) {
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    if (eof) throw http_error("Connection closed before response headers");
    return false;
  }
  std::vector<std::string> lines =
      absl::StrSplit(raw.substr(0, header_end), "\r\n");
  std::vector<std::string> status_line =
      absl::StrSplit(lines[0], absl::MaxSplits(' ', 2));
  int status = 0;
  if (status_line.size() < 2 || !absl::StartsWith(status_line[0], "HTTP/") ||
      !absl::SimpleAtoi(status_line[1], &status)) {
    throw http_error("Malformed status line: " + lines[0]);
  }
  response->status = status;
  response->headers.clear();
  for (size_t i = 1; i < lines.size(); i++) {
    size_t colon = lines[i].find(':');
    if (colon == std::string::npos) continue;
    std::string key = absl::AsciiStrToLower(lines[i].substr(0, colon));
    response->headers[key] =
        std::string(absl::StripAsciiWhitespace(lines[i].substr(colon + 1)));
  }

  std::string data = raw.substr(header_end + 4);
  if (status / 100 == 1 || status == 204 || status == 304) {
    response->body.clear();
    return true;
  }
  auto te = response->headers.find("transfer-encoding");
  if (te != response->headers.end() &&
      absl::StrContains(absl::AsciiStrToLower(te->second), "chunked")) {
    if (DecodeChunked(data, &response->body)) return true;
    if (eof) throw http_error("Connection closed in the middle of a chunk");
    return false;
  }
  auto cl = response->headers.find("content-length");
  if (cl != response->headers.end()) {
    size_t length = 0;
    if (!absl::SimpleAtoi(cl->second, &length)) {
      throw http_error("Invalid Content-Length: " + cl->second);
    }
    if (data.size() < length) {
      if (eof) throw http_error("Connection closed before the end of body");
      return false;
    }
    data.resize(length);
    response->body = std::move(data);
    return true;
  }
  if (!eof) return false;
  response->body = std::move(data);
  return true;
}

std::string UrlEncode(const std::string& s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += c;
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 15];
    }
  }
  return out;
}

HttpClient::HttpClient(const std::string& endpoint) : endpoint_(endpoint) {
  if (absl::StartsWith(endpoint, "unix://")) {
    is_unix_ = true;
    socket_path_ = endpoint.substr(strlen("unix://"));
    host_ = "localhost";
    if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
      throw http_error("Socket path too long: " + socket_path_);
    }
    return;
  }
  std::string rest;
  if (absl::StartsWith(endpoint, "tcp://")) {
    rest = endpoint.substr(strlen("tcp://"));
  } else if (absl::StartsWith(endpoint, "http://")) {
    rest = endpoint.substr(strlen("http://"));
  } else {
    throw http_error("Unsupported endpoint: " + endpoint);
  }
  while (!rest.empty() && rest.back() == '/') rest.pop_back();
  size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw http_error("Endpoint needs host:port: " + endpoint);
  }
  host_ = rest.substr(0, colon);
  port_ = rest.substr(colon + 1);
}

int HttpClient::Connect() const {
  if (is_unix_) {
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1) throw http_error(ErrnoMessage("socket", errno));
    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) <
        0) {
      int error = errno;
      close(fd);
      throw http_error(ErrnoMessage("connect " + socket_path_, error));
    }
    return fd;
  }

  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* result = nullptr;
  int ret = getaddrinfo(host_.c_str(), port_.c_str(), &hints, &result);
  if (ret != 0) {
    throw http_error("getaddrinfo " + host_ + ": " + gai_strerror(ret));
  }
  std::string last_error = "no address for " + host_;
  int fd = -1;
  for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd == -1) {
      last_error = ErrnoMessage("socket", errno);
      continue;
    }
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    last_error = ErrnoMessage("connect " + host_ + ":" + port_, errno);
    close(fd);
    fd = -1;
  }
  freeaddrinfo(result);
  if (fd == -1) throw http_error(last_error);
  return fd;
}

HttpResponse HttpClient::Post(const std::string& path, const std::string& body,
                              std::chrono::milliseconds timeout) {
  return Request("POST", path, body, timeout);
}

HttpResponse HttpClient::Request(const std::string& method,
                                 const std::string& path,
                                 const std::string& body,
                                 std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  Socket sock(Connect());

  std::string request = absl::StrCat(method, " ", path, " HTTP/1.1\r\n",
                                     "Host: ", host_, "\r\n",
                                     "User-Agent: codebox\r\n",
                                     "Connection: close\r\n");
  if (!body.empty() || method == "POST") {
    absl::StrAppend(&request, "Content-Type: application/json\r\n",
                    "Content-Length: ", body.size(), "\r\n");
  }
  absl::StrAppend(&request, "\r\n", body);
  VLOG(2) << method << " " << endpoint_ << path;
  SendAll(sock.Get(), request, deadline);

  std::string raw;
  char buf[kReadSize];
  HttpResponse response;
  while (true) {
    struct pollfd pfd = {sock.Get(), POLLIN, 0};
    int ret = poll(&pfd, 1, RemainingMillis(deadline));
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) throw http_error(ErrnoMessage("poll", errno));
    if (ret == 0) {
      throw http_timeout(absl::StrCat(method, " ", path, " timed out after ",
                                      timeout.count(), "ms"));
    }
    ssize_t amount = recv(sock.Get(), buf, sizeof(buf), 0);
    if (amount == -1 && (errno == EINTR || errno == EAGAIN)) continue;
    if (amount == -1) throw http_error(ErrnoMessage("recv", errno));
    raw.append(buf, amount);
    if (ParseHttpResponse(raw, amount == 0, &response)) break;
  }
  VLOG(2) << method << " " << path << " -> " << response.status;
  return response;
}

}  // namespace util
