#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/resource_store.hpp"
#include "core/sync/remote_connector.hpp"

namespace rowkeep {

// Mirrors local resources to the remote connector from one worker thread.
// The local store stays authoritative; remote failures never reach callers.
class SyncEngine {
public:
  SyncEngine(IRemoteConnector& connector, SyncPolicy policy = {});
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Queues a snapshot. A pending task for the same key is replaced in place.
  bool enqueue(std::string key, Document snapshot);

  void start();
  void stop();

  // Waits until nothing is pending or in flight.
  bool flush(std::chrono::milliseconds timeout);

  // Pulls keys that are missing locally and saves them without mirroring
  // them back. Returns how many were restored.
  std::size_t bootstrap(ResourceStore& store, const std::vector<std::string>& keys);

  [[nodiscard]] SyncStats stats() const;

private:
  enum class TaskOutcome {
    Done,
    Requeue,
  };

  IRemoteConnector& connector_;
  SyncPolicy policy_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::deque<SyncTask> queue_;
  std::thread worker_;
  bool running_ = false;
  bool stopping_ = false;
  std::string in_flight_key_;
  std::int64_t last_call_ms_ = 0;

  std::uint64_t enqueued_ = 0;
  std::uint64_t coalesced_ = 0;
  std::uint64_t pushed_ = 0;
  std::uint64_t dropped_ = 0;
  std::uint64_t retries_ = 0;
  std::uint64_t throttled_ = 0;
  std::string last_error_;

  void run();
  TaskOutcome process(const SyncTask& task);
  // nullopt when a stop was requested before the next call.
  std::optional<RemoteStatus> push_from(const SyncTask& task, std::size_t& next_batch);
  bool pace();
  bool wait_for_stop(std::int64_t delay_ms);
  [[nodiscard]] std::int64_t backoff_ms(std::size_t attempt) const;
  void note_error(std::string message);
};

}  // namespace rowkeep
