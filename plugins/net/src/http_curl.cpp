#include "rtk_net/http.h"

#include "rtk/log.h"

#include <curl/curl.h>

#include <cctype>
#include <utility>

namespace rtk::net {

namespace {
size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// One easy handle for the whole run so the cookie engine keeps the session
// cookies the VRChat API hands out at login.
class CurlHttpTransport final : public IHttpTransport {
 public:
  CurlHttpTransport(std::string user_agent, int timeout_seconds)
      : user_agent_(std::move(user_agent)), timeout_seconds_(timeout_seconds) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (curl_) {
      curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
    } else {
      rtk::log::error("curl init failed");
    }
  }

  ~CurlHttpTransport() override {
    if (curl_) {
      curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
  }

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse send(const HttpRequest& request) override {
    HttpResponse response;
    if (!curl_) {
      response.error = "curl init failed";
      return response;
    }

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

    if (request.method == "GET") {
      curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
      curl_easy_setopt(curl_, CURLOPT_POST, 1L);
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
      curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    const std::string userpwd =
        request.basic_auth ? request.basic_auth->username + ":" + request.basic_auth->password : std::string();
    if (request.basic_auth) {
      curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
      curl_easy_setopt(curl_, CURLOPT_USERPWD, userpwd.c_str());
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
      headers = curl_slist_append(headers, header.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    const CURLcode res = curl_easy_perform(curl_);
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

    // Options persist on the handle; drop the per-request ones.
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl_, CURLOPT_USERPWD, nullptr);
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, nullptr);
    curl_slist_free_all(headers);

    response.status = static_cast<int>(status);
    if (res != CURLE_OK) {
      response.error = std::string("curl error: ") + curl_easy_strerror(res);
    }
    return response;
  }

 private:
  std::string user_agent_;
  int timeout_seconds_ = 30;
  CURL* curl_ = nullptr;
};
} // namespace

std::string url_encode(const std::string& text) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[(c >> 4) & 0xF]);
      out.push_back(kHex[c & 0xF]);
    }
  }
  return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  for (const auto& [key, value] : params) {
    out += out.empty() ? "?" : "&";
    out += url_encode(key) + "=" + url_encode(value);
  }
  return out;
}

std::unique_ptr<IHttpTransport> make_curl_transport(const std::string& user_agent, int timeout_seconds) {
  return std::make_unique<CurlHttpTransport>(user_agent, timeout_seconds);
}

} // namespace rtk::net
