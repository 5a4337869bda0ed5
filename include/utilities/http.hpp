#pragma once
#ifndef ARLOADER_HTTP_HPP
#define ARLOADER_HTTP_HPP

#include <string>
#include <unordered_map>

namespace arloader {

std::string trim(const std::string &str);

namespace HTTP {

enum class HttpMethod { GET, POST, INVALID };

HttpMethod StringToHttpMethod(const std::string &methodStr);
std::string HttpMethodToString(HttpMethod method);

/// Split form of an absolute http(s) URL.
struct URL {
  std::string scheme; ///< "http" or "https"
  std::string host;
  std::string port; ///< explicit port or the scheme default
  std::string target; ///< path and query, always starts with '/'

  /// Resolves @p relative against this URL's path the way a browser would.
  URL join(const std::string &relative) const;
  std::string str() const;
};

/**
 * @brief Parses an absolute http(s) URL.
 * @throws Error(Http) on any other scheme or a missing host.
 */
URL ParseURL(const std::string &url);

struct HTTPREQUEST {
  HttpMethod method = HttpMethod::GET;
  std::string uri;
  std::string protocol = "HTTP/1.1";
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct HTTPRESPONSE {
  std::string protocol;
  int statusCodeNumber = 0;
  std::string reasonPhrase;
  std::string contentType;
  std::unordered_map<std::string, std::string> headers; ///< lower-case names
  std::string body;
};

std::string GenerateHttpRequestString(const HTTPREQUEST &request);

/**
 * @brief Parses a complete raw HTTP/1.1 response.
 *
 * Bodies sent with Transfer-Encoding: chunked are reassembled.
 * @throws Error(Http) on a malformed status line or chunk framing.
 */
HTTPRESPONSE ParseHttpResponse(const std::string &responseStr);

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio.
 *
 * Every call opens its own connection (TLS for https) and sends
 * "Connection: close", so one client may be shared across threads.
 */
class HttpClient {
public:
  explicit HttpClient(std::string userAgent) : userAgent_(std::move(userAgent)) {}

  HTTPRESPONSE get(const URL &url) const;
  HTTPRESPONSE postJson(const URL &url, const std::string &body) const;
  HTTPRESPONSE send(const URL &url, HTTPREQUEST request) const;

private:
  std::string userAgent_;
};

} // namespace HTTP

} // namespace arloader

#endif
