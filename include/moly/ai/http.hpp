#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace moly::ai {

enum class ErrorKind {
  None,
  Network,      // Connect failure, timeout, DNS, TLS
  Unauthorized, // 401
  Forbidden,    // 403
  RateLimited,  // 429
  Http,         // Any other non-2xx status
  Parse,        // Malformed response body
  Cancelled,
};

struct ClientError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  long status = 0;
};

std::string_view error_kind_name(ErrorKind kind) noexcept;
ErrorKind classify_status(long status) noexcept;
// Human readable text for a failed status: "Invalid API key", "Access
// denied", "Rate limited" or "HTTP <code>: <body>".
std::string describe_status(long status, const std::string &body);
ClientError status_error(long status, const std::string &body);

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  long timeout_seconds = 60;
  long connect_timeout_seconds = 10;
  // When positive the total timeout is lifted and the transfer only fails
  // after this many seconds without receiving data.
  long idle_timeout_seconds = 0;
  // Receives 2xx body bytes as they arrive instead of HttpResponse::body.
  // Returning false aborts the transfer. Bodies of other statuses are
  // still collected in HttpResponse::body.
  std::function<bool(std::string_view chunk)> on_data;
  // Polled while the transfer runs, also when no data arrives. Returning
  // true aborts it.
  std::function<bool()> should_abort;
};

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Returns false when no HTTP status was obtained (transport failure or
// aborted transfer) and fills error_message. An aborted transfer reports
// kTransferAborted.
using HttpTransport = std::function<bool(
    const HttpRequest &request, HttpResponse &response,
    std::string *error_message)>;

inline constexpr std::string_view kTransferAborted = "Transfer aborted";

bool curl_transport(const HttpRequest &request, HttpResponse &response,
                    std::string *error_message);

std::string url_encode(std::string_view input);
// Joins base and path with exactly one '/', trimming trailing slashes.
std::string join_url(std::string_view base, std::string_view path);
std::string bearer_header(std::string_view api_key);

} // namespace moly::ai
