#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace rowkeep {

enum class RemoteStatus {
  Ok,
  Throttled,
  Timeout,
  Disconnected,
  Rejected,
};

std::string_view remote_status_name(RemoteStatus status);

// Remote tabular mirror. Failures are transient from the caller's view;
// the sync engine decides whether to retry, requeue or drop.
class IRemoteConnector {
public:
  virtual ~IRemoteConnector() = default;

  [[nodiscard]] virtual bool is_connected() const = 0;
  virtual RemoteStatus push(std::string_view key, const Document& value) = 0;
  virtual RemoteStatus push_batch(std::string_view key, const Document& rows,
                                  std::size_t batch_index, std::size_t batch_count) = 0;
  virtual std::optional<Document> pull(std::string_view key) = 0;
};

class HttpMirrorConnector final : public IRemoteConnector {
public:
  explicit HttpMirrorConnector(RemoteConfig config);

  [[nodiscard]] bool is_connected() const override;
  RemoteStatus push(std::string_view key, const Document& value) override;
  RemoteStatus push_batch(std::string_view key, const Document& rows, std::size_t batch_index,
                          std::size_t batch_count) override;
  std::optional<Document> pull(std::string_view key) override;

private:
  struct Response {
    bool transport_ok = false;
    bool timed_out = false;
    long http_status = 0;
    std::string body;
    std::string error;
  };

  RemoteConfig config_;
  std::atomic<bool> connected_{true};

  Response perform(std::string_view method, const std::string& url, const std::string& body);
  RemoteStatus classify(const Response& response);
  [[nodiscard]] std::string resource_url(std::string_view key) const;
};

// nullptr when no endpoint is configured.
std::unique_ptr<IRemoteConnector> make_remote_connector(const RemoteConfig& config);

// Rows for the tabular mirror: object -> [key, value], array -> one row per
// element, scalar -> a single row.
Document tabular_rows(const Document& value);

}  // namespace rowkeep
