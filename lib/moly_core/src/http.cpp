#include "moly/ai/http.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace moly::ai {

namespace {
void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::atexit([] { curl_global_cleanup(); });
  });
}

struct TransferContext {
  CURL *curl = nullptr;
  const HttpRequest *request = nullptr;
  HttpResponse *response = nullptr;
  bool aborted = false;
};

size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total_size = size * nmemb;
  auto *context = static_cast<TransferContext *>(userp);
  std::string_view chunk(static_cast<const char *>(contents), total_size);

  long status = 0;
  curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);

  if (context->request->on_data && status >= 200 && status < 300) {
    if (!context->request->on_data(chunk)) {
      context->aborted = true;
      return 0;
    }
    return total_size;
  }

  context->response->body.append(chunk);
  return total_size;
}

int ProgressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  auto *context = static_cast<TransferContext *>(clientp);
  if (context->request->should_abort && context->request->should_abort()) {
    context->aborted = true;
    return 1;
  }
  return 0;
}
} // namespace

std::string_view error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Network:
    return "network";
  case ErrorKind::Unauthorized:
    return "unauthorized";
  case ErrorKind::Forbidden:
    return "forbidden";
  case ErrorKind::RateLimited:
    return "rate-limited";
  case ErrorKind::Http:
    return "http";
  case ErrorKind::Parse:
    return "parse";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "none";
}

ErrorKind classify_status(long status) noexcept {
  if (status >= 200 && status < 300)
    return ErrorKind::None;
  switch (status) {
  case 401:
    return ErrorKind::Unauthorized;
  case 403:
    return ErrorKind::Forbidden;
  case 429:
    return ErrorKind::RateLimited;
  default:
    return ErrorKind::Http;
  }
}

std::string describe_status(long status, const std::string &body) {
  switch (status) {
  case 401:
    return "Invalid API key";
  case 403:
    return "Access denied";
  case 429:
    return "Rate limited";
  default:
    return "HTTP " + std::to_string(status) + ": " + body;
  }
}

ClientError status_error(long status, const std::string &body) {
  return ClientError{classify_status(status), describe_status(status, body),
                     status};
}

bool curl_transport(const HttpRequest &request, HttpResponse &response,
                    std::string *error_message) {
  ensure_curl_initialized();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                           curl_easy_cleanup);
  if (!curl) {
    if (error_message)
      *error_message = "Failed to initialize CURL";
    return false;
  }

  curl_slist *raw_headers = nullptr;
  for (const auto &header : request.headers)
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      raw_headers, curl_slist_free_all);

  response.status = 0;
  response.body.clear();
  TransferContext context{curl.get(), &request, &response, false};

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (headers)
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

  if (request.method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else if (request.method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }
  }

  if (request.should_abort) {
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);
  }

  if (request.idle_timeout_seconds > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                     request.idle_timeout_seconds);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
  }
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   request.connect_timeout_seconds);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "moly/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res = curl_easy_perform(curl.get());

  long response_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
  response.status = response_code;

  if (context.aborted) {
    if (error_message)
      *error_message = std::string(kTransferAborted);
    return false;
  }

  if (res != CURLE_OK) {
    if (error_message) {
      if (res == CURLE_OPERATION_TIMEDOUT) {
        *error_message = "Connection timed out";
      } else if (res == CURLE_COULDNT_CONNECT ||
                 res == CURLE_COULDNT_RESOLVE_HOST) {
        *error_message = "Failed to connect to server";
      } else {
        const char *curl_error = curl_easy_strerror(res);
        *error_message = std::string("Request failed: ") +
                         (curl_error ? curl_error : "unknown curl error");
      }
    }
    return false;
  }

  return true;
}

std::string url_encode(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (unsigned char c : input) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      result.push_back(static_cast<char>(c));
    } else if (c == ' ') {
      result.append("%20");
    } else {
      char buffer[4];
      std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
      result.append(buffer);
    }
  }
  return result;
}

std::string join_url(std::string_view base, std::string_view path) {
  while (!base.empty() && base.back() == '/')
    base.remove_suffix(1);
  while (!path.empty() && path.front() == '/')
    path.remove_prefix(1);

  std::string url(base);
  if (!path.empty()) {
    url.push_back('/');
    url.append(path);
  }
  return url;
}

std::string bearer_header(std::string_view api_key) {
  return "Authorization: Bearer " + std::string(api_key);
}

} // namespace moly::ai
