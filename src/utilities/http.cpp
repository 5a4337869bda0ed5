#include "utilities/http.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <cctype>
#include <sstream>

namespace arloader {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);

  if (start == std::string::npos)
    return "";

  return str.substr(start, end - start + 1);
}

namespace HTTP {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "POST")
    return HttpMethod::POST;
  else
    return HttpMethod::INVALID;
}

std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  default:
    return "INVALID";
  }
}

URL ParseURL(const std::string &url) {
  URL out;
  size_t schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos)
    throwError(ErrorKind::Http, "not an absolute url: " + url);
  out.scheme = url.substr(0, schemeEnd);
  std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (out.scheme != "http" && out.scheme != "https")
    throwError(ErrorKind::Http, "unsupported scheme in " + url);

  size_t hostStart = schemeEnd + 3;
  size_t pathStart = url.find('/', hostStart);
  std::string authority = url.substr(
      hostStart, pathStart == std::string::npos ? std::string::npos
                                                : pathStart - hostStart);
  out.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
    out.port = out.scheme == "https" ? "443" : "80";
  }
  if (out.host.empty())
    throwError(ErrorKind::Http, "missing host in " + url);
  return out;
}

URL URL::join(const std::string &relative) const {
  URL out = *this;
  if (!relative.empty() && relative.front() == '/') {
    out.target = relative;
    return out;
  }
  std::string base = target.substr(0, target.find('?'));
  base = base.substr(0, base.rfind('/') + 1);
  out.target = base + relative;
  return out;
}

std::string URL::str() const {
  bool defaultPort = (scheme == "https" && port == "443") ||
                     (scheme == "http" && port == "80");
  return scheme + "://" + host + (defaultPort ? "" : ":" + port) + target;
}

std::string GenerateHttpRequestString(const HTTPREQUEST &request) {
  std::ostringstream requestStream;
  requestStream << HttpMethodToString(request.method) << " " << request.uri
                << " " << request.protocol << "\r\n";
  for (const auto &header : request.headers) {
    requestStream << header.first << ": " << header.second << "\r\n";
  }
  requestStream << "\r\n";
  requestStream << request.body;
  return requestStream.str();
}

static std::string dechunk(const std::string &body) {
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t lineEnd = body.find("\r\n", pos);
    if (lineEnd == std::string::npos)
      throwError(ErrorKind::Http, "truncated chunked body");
    std::string sizeLine = body.substr(pos, lineEnd - pos);
    sizeLine = sizeLine.substr(0, sizeLine.find(';'));
    size_t chunkSize = 0;
    try {
      chunkSize = std::stoul(trim(sizeLine), nullptr, 16);
    } catch (const std::exception &) {
      throwError(ErrorKind::Http, "bad chunk size '" + sizeLine + "'");
    }
    pos = lineEnd + 2;
    if (chunkSize == 0)
      break;
    if (pos + chunkSize > body.size())
      throwError(ErrorKind::Http, "truncated chunked body");
    out.append(body, pos, chunkSize);
    pos += chunkSize + 2;
  }
  return out;
}

HTTPRESPONSE ParseHttpResponse(const std::string &responseStr) {
  HTTPRESPONSE response;
  size_t headerEnd = responseStr.find("\r\n\r\n");
  if (headerEnd == std::string::npos)
    throwError(ErrorKind::Http, "response has no header terminator");

  std::istringstream headerStream(responseStr.substr(0, headerEnd));
  std::string statusLine;
  std::getline(headerStream, statusLine);
  if (!statusLine.empty() && statusLine.back() == '\r')
    statusLine.pop_back();

  std::istringstream statusLineStream(statusLine);
  if (!(statusLineStream >> response.protocol >> response.statusCodeNumber))
    throwError(ErrorKind::Http, "malformed status line '" + statusLine + "'");
  std::getline(statusLineStream, response.reasonPhrase);
  response.reasonPhrase = trim(response.reasonPhrase);

  std::string line;
  while (std::getline(headerStream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      std::string headerName = trim(line.substr(0, delimiterPos));
      std::transform(headerName.begin(), headerName.end(), headerName.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      std::string headerValue = trim(line.substr(delimiterPos + 1));
      if (headerName == "content-type")
        response.contentType = headerValue;
      response.headers[headerName] = headerValue;
    }
  }

  response.body = responseStr.substr(headerEnd + 4);
  auto te = response.headers.find("transfer-encoding");
  if (te != response.headers.end() &&
      te->second.find("chunked") != std::string::npos) {
    response.body = dechunk(response.body);
  } else if (auto cl = response.headers.find("content-length");
             cl != response.headers.end()) {
    size_t length = 0;
    try {
      length = std::stoul(cl->second);
    } catch (const std::exception &) {
      throwError(ErrorKind::Http, "bad content-length '" + cl->second + "'");
    }
    if (response.body.size() > length)
      response.body.resize(length);
  }
  return response;
}

namespace {

template <typename Stream>
std::string exchange(Stream &stream, const std::string &raw) {
  asio::write(stream, asio::buffer(raw));
  asio::streambuf buffer;
  boost::system::error_code ec;
  asio::read(stream, buffer, ec);
  if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
    throw boost::system::system_error(ec);
  }
  return std::string(asio::buffers_begin(buffer.data()),
                     asio::buffers_end(buffer.data()));
}

} // namespace

HTTPRESPONSE HttpClient::send(const URL &url, HTTPREQUEST request) const {
  request.uri = url.target;
  request.headers["Host"] = url.host;
  request.headers["User-Agent"] = userAgent_;
  request.headers["Connection"] = "close";
  if (request.method == HttpMethod::POST)
    request.headers["Content-Length"] = std::to_string(request.body.size());
  const std::string raw = GenerateHttpRequestString(request);

  Logger::getInstance().log(LogLevel::DEBUG,
                            HttpMethodToString(request.method) + " " +
                                url.str());
  std::string rawResponse;
  try {
    asio::io_context io;
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(url.host, url.port);
    if (url.scheme == "https") {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ssl::stream<tcp::socket> stream(io, ctx);
      stream.set_verify_mode(ssl::verify_peer);
      stream.set_verify_callback(ssl::host_name_verification(url.host));
      if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throwError(ErrorKind::Http, "failed to set SNI host " + url.host);
      }
      asio::connect(stream.next_layer(), endpoints);
      stream.handshake(ssl::stream_base::client);
      rawResponse = exchange(stream, raw);
    } else {
      tcp::socket socket(io);
      asio::connect(socket, endpoints);
      rawResponse = exchange(socket, raw);
    }
  } catch (const boost::system::system_error &e) {
    throwError(ErrorKind::Http, url.str() + ": " + e.what());
  }

  HTTPRESPONSE response = ParseHttpResponse(rawResponse);
  Logger::getInstance().log(LogLevel::DEBUG,
                            url.str() + " -> " +
                                std::to_string(response.statusCodeNumber));
  return response;
}

HTTPRESPONSE HttpClient::get(const URL &url) const {
  HTTPREQUEST request;
  request.method = HttpMethod::GET;
  request.headers["Accept"] = "application/json";
  return send(url, std::move(request));
}

HTTPRESPONSE HttpClient::postJson(const URL &url, const std::string &body) const {
  HTTPREQUEST request;
  request.method = HttpMethod::POST;
  request.headers["Accept"] = "application/json";
  request.headers["Content-Type"] = "application/json";
  request.body = body;
  return send(url, std::move(request));
}

} // namespace HTTP

} // namespace arloader
