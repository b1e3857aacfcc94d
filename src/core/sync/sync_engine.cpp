#include "core/sync/sync_engine.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

std::shared_ptr<spdlog::logger> sync_log() {
  return util::component_logger("sync");
}

}  // namespace

SyncEngine::SyncEngine(IRemoteConnector& connector, SyncPolicy policy)
    : connector_(connector), policy_(std::move(policy)) {}

SyncEngine::~SyncEngine() {
  stop();
}

bool SyncEngine::enqueue(std::string key, Document snapshot) {
  {
    std::lock_guard lock(mutex_);
    const auto pending = std::ranges::find(queue_, key, &SyncTask::key);
    if (pending != queue_.end()) {
      pending->snapshot = std::move(snapshot);
      pending->enqueued_at = std::chrono::system_clock::now();
      ++coalesced_;
      return true;
    }

    if (queue_.size() >= policy_.max_pending) {
      ++dropped_;
      last_error_ = "queue full, dropped update for " + key;
      sync_log()->error("sync queue full ({} pending); dropped update for {}", queue_.size(), key);
      return false;
    }

    queue_.push_back({
        .key = std::move(key),
        .snapshot = std::move(snapshot),
        .enqueued_at = std::chrono::system_clock::now(),
    });
    ++enqueued_;
  }
  wake_.notify_all();
  return true;
}

void SyncEngine::start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  stopping_ = false;
  running_ = true;
  worker_ = std::thread(&SyncEngine::run, this);
  sync_log()->info("sync worker started");
}

void SyncEngine::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }

  std::lock_guard lock(mutex_);
  running_ = false;
  idle_.notify_all();
  if (!queue_.empty()) {
    sync_log()->warn("sync worker stopped with {} pending update(s)", queue_.size());
  } else {
    sync_log()->info("sync worker stopped");
  }
}

bool SyncEngine::flush(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_.wait_for(lock, timeout, [this] { return queue_.empty() && in_flight_key_.empty(); });
}

std::size_t SyncEngine::bootstrap(ResourceStore& store, const std::vector<std::string>& keys) {
  if (!connector_.is_connected()) {
    sync_log()->warn("mirror not connected; skipping bootstrap");
    return 0;
  }

  std::size_t restored = 0;
  for (const auto& key : keys) {
    if (store.exists(key)) {
      continue;
    }
    (void)pace();
    auto pulled = connector_.pull(key);
    if (!pulled.has_value()) {
      continue;
    }

    const Result saved = store.save(key, *pulled, SyncMode::Suppress);
    if (saved.ok) {
      ++restored;
      sync_log()->info("bootstrapped {} from mirror", key);
    } else {
      sync_log()->warn("could not save mirrored {}: {}", key, saved.message);
    }
  }
  return restored;
}

SyncStats SyncEngine::stats() const {
  SyncStats out;
  out.connected = connector_.is_connected();
  std::lock_guard lock(mutex_);
  out.running = running_;
  out.pending = queue_.size();
  out.in_flight_key = in_flight_key_;
  out.enqueued = enqueued_;
  out.coalesced = coalesced_;
  out.pushed = pushed_;
  out.dropped = dropped_;
  out.retries = retries_;
  out.throttled = throttled_;
  out.last_error = last_error_;
  return out;
}

void SyncEngine::run() {
  while (true) {
    SyncTask task;
    {
      std::unique_lock lock(mutex_);
      wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      in_flight_key_ = task.key;
    }

    const TaskOutcome outcome = process(task);

    {
      std::lock_guard lock(mutex_);
      in_flight_key_.clear();
      if (outcome == TaskOutcome::Requeue) {
        // A newer snapshot for the key supersedes this one.
        if (std::ranges::find(queue_, task.key, &SyncTask::key) == queue_.end()) {
          queue_.push_front(std::move(task));
        }
      }
      if (queue_.empty()) {
        idle_.notify_all();
      }
    }
  }
}

SyncEngine::TaskOutcome SyncEngine::process(const SyncTask& task) {
  std::size_t attempt = 0;
  std::size_t next_batch = 0;

  while (true) {
    const std::optional<RemoteStatus> pushed = push_from(task, next_batch);
    if (!pushed.has_value()) {
      return TaskOutcome::Requeue;
    }
    const RemoteStatus status = *pushed;
    switch (status) {
      case RemoteStatus::Ok: {
        std::lock_guard lock(mutex_);
        ++pushed_;
        sync_log()->debug("mirrored {}", task.key);
        return TaskOutcome::Done;
      }
      case RemoteStatus::Rejected: {
        {
          std::lock_guard lock(mutex_);
          ++dropped_;
        }
        note_error("mirror rejected " + task.key + "; update dropped");
        return TaskOutcome::Done;
      }
      case RemoteStatus::Disconnected: {
        note_error("mirror disconnected while pushing " + task.key);
        (void)wait_for_stop(policy_.reconnect_poll_ms);
        return TaskOutcome::Requeue;
      }
      case RemoteStatus::Throttled:
      case RemoteStatus::Timeout: {
        if (attempt >= policy_.max_retries) {
          {
            std::lock_guard lock(mutex_);
            ++dropped_;
          }
          note_error("gave up on " + task.key + " after " + std::to_string(attempt) + " retries (" +
                     std::string{remote_status_name(status)} + ")");
          return TaskOutcome::Done;
        }

        const std::int64_t delay = backoff_ms(attempt);
        {
          std::lock_guard lock(mutex_);
          ++retries_;
          if (status == RemoteStatus::Throttled) {
            ++throttled_;
          }
        }
        ++attempt;
        sync_log()->warn("{} pushing {}; retry {} in {} ms", remote_status_name(status), task.key,
                         attempt, delay);
        if (wait_for_stop(delay)) {
          return TaskOutcome::Requeue;
        }
        break;
      }
    }
  }
}

std::optional<RemoteStatus> SyncEngine::push_from(const SyncTask& task, std::size_t& next_batch) {
  const std::string serialized =
      task.snapshot.dump(-1, ' ', false, Document::error_handler_t::replace);

  if (serialized.size() <= policy_.chunk_threshold_bytes) {
    if (!pace()) {
      return std::nullopt;
    }
    return connector_.push(task.key, task.snapshot);
  }

  const Document rows = tabular_rows(task.snapshot);
  const std::size_t per_batch = std::max<std::size_t>(1, policy_.batch_rows);
  const std::size_t batch_count = std::max<std::size_t>(1, (rows.size() + per_batch - 1) / per_batch);

  for (; next_batch < batch_count; ++next_batch) {
    Document batch = Document::array();
    const std::size_t begin = next_batch * per_batch;
    const std::size_t end = std::min(rows.size(), begin + per_batch);
    for (std::size_t i = begin; i < end; ++i) {
      batch.push_back(rows[i]);
    }

    if (!pace()) {
      return std::nullopt;
    }
    const RemoteStatus status = connector_.push_batch(task.key, batch, next_batch, batch_count);
    if (status != RemoteStatus::Ok) {
      return status;
    }
  }
  return RemoteStatus::Ok;
}

// Holds the worker until min_interval_ms has passed since the previous
// remote call. Returns false when a stop was requested meanwhile.
bool SyncEngine::pace() {
  std::unique_lock lock(mutex_);
  const std::int64_t due = last_call_ms_ + policy_.min_interval_ms;
  const std::int64_t now = util::steady_now_ms();
  if (last_call_ms_ != 0 && now < due) {
    if (wake_.wait_for(lock, std::chrono::milliseconds(due - now), [this] { return stopping_; })) {
      return false;
    }
  }
  last_call_ms_ = util::steady_now_ms();
  return true;
}

bool SyncEngine::wait_for_stop(std::int64_t delay_ms) {
  std::unique_lock lock(mutex_);
  return wake_.wait_for(lock, std::chrono::milliseconds(std::max<std::int64_t>(0, delay_ms)),
                        [this] { return stopping_; });
}

std::int64_t SyncEngine::backoff_ms(std::size_t attempt) const {
  const std::size_t shift = std::min<std::size_t>(attempt, 20);
  const std::int64_t exponential = policy_.base_backoff_ms * (std::int64_t{1} << shift);
  std::int64_t jitter = 0;
  if (policy_.max_jitter_ms > 0) {
    const auto bound = static_cast<std::uint32_t>(policy_.max_jitter_ms) + 1U;
    jitter = static_cast<std::int64_t>(util::random_below(bound));
  }
  return std::min(exponential + jitter, policy_.max_backoff_ms);
}

void SyncEngine::note_error(std::string message) {
  sync_log()->error("{}", message);
  std::lock_guard lock(mutex_);
  last_error_ = std::move(message);
}

}  // namespace rowkeep
