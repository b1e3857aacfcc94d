#include "core/sync/remote_connector.hpp"

#include <mutex>
#include <utility>

#include <curl/curl.h>

#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

constexpr const char* kUserAgent = "rowkeep-mirror/1";

std::shared_ptr<spdlog::logger> sync_log() {
  return util::component_logger("sync");
}

void ensure_curl_global() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t collect_body(char* data, std::size_t size, std::size_t count, void* user) {
  auto* out = static_cast<std::string*>(user);
  out->append(data, size * count);
  return size * count;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

bool is_disconnect(CURLcode code) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_SSL_CONNECT_ERROR:
      return true;
    default:
      return false;
  }
}

}  // namespace

std::string_view remote_status_name(RemoteStatus status) {
  switch (status) {
    case RemoteStatus::Ok:
      return "ok";
    case RemoteStatus::Throttled:
      return "throttled";
    case RemoteStatus::Timeout:
      return "timeout";
    case RemoteStatus::Disconnected:
      return "disconnected";
    case RemoteStatus::Rejected:
      return "rejected";
  }
  return "rejected";
}

HttpMirrorConnector::HttpMirrorConnector(RemoteConfig config) : config_(std::move(config)) {
  ensure_curl_global();
  while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
    config_.endpoint.pop_back();
  }
}

bool HttpMirrorConnector::is_connected() const {
  return connected_.load();
}

std::string HttpMirrorConnector::resource_url(std::string_view key) const {
  return config_.endpoint + "/resources/" + std::string{key};
}

HttpMirrorConnector::Response HttpMirrorConnector::perform(std::string_view method,
                                                           const std::string& url,
                                                           const std::string& body) {
  Response response;
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "curl init failed";
    return response;
  }

  curl_slist* raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
  if (!config_.token.empty()) {
    const std::string auth = "Authorization: Bearer " + config_.token;
    raw_headers = curl_slist_append(raw_headers, auth.c_str());
  }
  std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

  const std::string method_text{method};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_seconds);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.timeout_seconds);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  if (method_text == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method_text.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    response.timed_out = code == CURLE_OPERATION_TIMEDOUT;
    response.error = curl_easy_strerror(code);
    if (is_disconnect(code)) {
      connected_.store(false);
    }
    return response;
  }

  response.transport_ok = true;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_status);
  connected_.store(true);
  return response;
}

RemoteStatus HttpMirrorConnector::classify(const Response& response) {
  if (!response.transport_ok) {
    if (response.timed_out) {
      return RemoteStatus::Timeout;
    }
    sync_log()->warn("mirror unreachable: {}", response.error);
    return RemoteStatus::Disconnected;
  }

  const long status = response.http_status;
  if (status >= 200 && status < 300) {
    return RemoteStatus::Ok;
  }
  if (status == 408) {
    return RemoteStatus::Timeout;
  }
  if (status == 429 || status == 500 || status == 502 || status == 503 || status == 504) {
    return RemoteStatus::Throttled;
  }
  sync_log()->warn("mirror rejected request with HTTP {}", status);
  return RemoteStatus::Rejected;
}

RemoteStatus HttpMirrorConnector::push(std::string_view key, const Document& value) {
  const Document body = {{"key", std::string{key}}, {"rows", tabular_rows(value)}, {"value", value}};
  return classify(perform("PUT", resource_url(key),
                          body.dump(-1, ' ', false, Document::error_handler_t::replace)));
}

RemoteStatus HttpMirrorConnector::push_batch(std::string_view key, const Document& rows,
                                             std::size_t batch_index, std::size_t batch_count) {
  const std::string url = resource_url(key) + "/batches?index=" + std::to_string(batch_index) +
                          "&count=" + std::to_string(batch_count);
  const Document body = {
      {"key", std::string{key}}, {"index", batch_index}, {"count", batch_count}, {"rows", rows}};
  return classify(
      perform("POST", url, body.dump(-1, ' ', false, Document::error_handler_t::replace)));
}

std::optional<Document> HttpMirrorConnector::pull(std::string_view key) {
  const Response response = perform("GET", resource_url(key), {});
  if (!response.transport_ok || response.http_status != 200) {
    return std::nullopt;
  }

  Document parsed = Document::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    sync_log()->warn("mirror returned unparseable body for {}", key);
    return std::nullopt;
  }
  if (parsed.is_object() && parsed.contains("value")) {
    return parsed["value"];
  }
  return parsed;
}

std::unique_ptr<IRemoteConnector> make_remote_connector(const RemoteConfig& config) {
  if (config.endpoint.empty()) {
    return nullptr;
  }
  return std::make_unique<HttpMirrorConnector>(config);
}

Document tabular_rows(const Document& value) {
  Document rows = Document::array();
  if (value.is_object()) {
    for (auto it = value.begin(); it != value.end(); ++it) {
      rows.push_back(Document::array({it.key(), it.value()}));
    }
  } else if (value.is_array()) {
    for (const auto& element : value) {
      rows.push_back(element.is_array() ? element : Document::array({element}));
    }
  } else {
    rows.push_back(Document::array({value}));
  }
  return rows;
}

}  // namespace rowkeep
