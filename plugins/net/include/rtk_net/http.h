#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtk::net {

struct BasicAuth {
  std::string username;
  std::string password;
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  std::optional<BasicAuth> basic_auth;
};

struct HttpResponse {
  int status = 0;
  std::string body;
  // Transport failure (DNS, TLS, timeout). Empty when a status was received.
  std::string error;

  bool transport_ok() const { return error.empty(); }
  bool success() const { return error.empty() && status >= 200 && status < 300; }
};

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse send(const HttpRequest& request) = 0;
};

// Query string from ordered key/value pairs, values percent-encoded.
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);
std::string url_encode(const std::string& text);

std::unique_ptr<IHttpTransport> make_curl_transport(const std::string& user_agent, int timeout_seconds);

} // namespace rtk::net
