#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <ranges>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include "app/command_line.hpp"
#include "core/admission/admission_controller.hpp"
#include "core/api/core_api.hpp"
#include "core/backup/backup_manager.hpp"
#include "core/config/settings.hpp"
#include "core/integrity/integrity_validator.hpp"
#include "core/storage/resource_catalog.hpp"
#include "core/storage/resource_store.hpp"
#include "core/sync/sync_engine.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "rowkeep-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  out << text;
}

std::string read_text(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::size_t count_files_with(const std::filesystem::path& dir, const std::string& fragment) {
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().filename().string().find(fragment) != std::string::npos) {
      ++count;
    }
  }
  return count;
}

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
  return std::ranges::any_of(lines, [&](const std::string& line) {
    return line.find(needle) != std::string::npos;
  });
}

class FakeConnector final : public rowkeep::IRemoteConnector {
public:
  struct Call {
    std::string key;
    rowkeep::Document payload;
    std::size_t batch_index = 0;
    std::size_t batch_count = 0;
    rowkeep::RemoteStatus status = rowkeep::RemoteStatus::Ok;
  };

  std::atomic<bool> connected{true};

  [[nodiscard]] bool is_connected() const override { return connected.load(); }

  rowkeep::RemoteStatus push(std::string_view key, const rowkeep::Document& value) override {
    return record({.key = std::string{key}, .payload = value});
  }

  rowkeep::RemoteStatus push_batch(std::string_view key, const rowkeep::Document& rows,
                                   std::size_t batch_index, std::size_t batch_count) override {
    return record({.key = std::string{key},
                   .payload = rows,
                   .batch_index = batch_index,
                   .batch_count = batch_count});
  }

  std::optional<rowkeep::Document> pull(std::string_view key) override {
    std::lock_guard lock(mutex_);
    pulled_.emplace_back(key);
    const auto it = remote_.find(std::string{key});
    if (it == remote_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void script(std::initializer_list<rowkeep::RemoteStatus> statuses) {
    std::lock_guard lock(mutex_);
    script_.insert(script_.end(), statuses.begin(), statuses.end());
  }

  void put_remote(const std::string& key, rowkeep::Document value) {
    std::lock_guard lock(mutex_);
    remote_[key] = std::move(value);
  }

  std::vector<Call> calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  std::vector<Call> delivered() const {
    std::lock_guard lock(mutex_);
    std::vector<Call> out;
    for (const auto& call : calls_) {
      if (call.status == rowkeep::RemoteStatus::Ok) {
        out.push_back(call);
      }
    }
    return out;
  }

  std::vector<std::string> pulled() const {
    std::lock_guard lock(mutex_);
    return pulled_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<rowkeep::RemoteStatus> script_;
  std::vector<Call> calls_;
  std::vector<std::string> pulled_;
  std::map<std::string, rowkeep::Document> remote_;

  rowkeep::RemoteStatus record(Call call) {
    std::lock_guard lock(mutex_);
    if (!connected.load()) {
      call.status = rowkeep::RemoteStatus::Disconnected;
    } else if (!script_.empty()) {
      call.status = script_.front();
      script_.pop_front();
    }
    calls_.push_back(call);
    return call.status;
  }
};

rowkeep::SyncPolicy fast_sync_policy() {
  return {
      .min_interval_ms = 0,
      .base_backoff_ms = 1,
      .max_backoff_ms = 5,
      .max_jitter_ms = 0,
      .max_retries = 2,
      .chunk_threshold_bytes = 32U * 1024U,
      .batch_rows = 100,
      .reconnect_poll_ms = 5,
      .max_pending = 16,
  };
}

void test_catalog_rules() {
  rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();
  assert(catalog.schemas().size() == 10);
  assert(catalog.find(rowkeep::resource::kEvents) != nullptr);
  assert(catalog.find("unknown") == nullptr);

  const rowkeep::Document events = catalog.default_for(rowkeep::resource::kEvents);
  assert(events.is_object());
  assert(events["main_team"].is_array());
  assert(events["team_2"].is_array());
  assert(events["team_3"].is_array());
  assert(catalog.default_for(rowkeep::resource::kSignupLock) == false);
  assert(catalog.default_for(rowkeep::resource::kEventTimes)["main_team"] == "20:00 UTC Sunday");

  assert(!catalog.override_default(rowkeep::resource::kSignupLock, "yes").ok);
  assert(catalog.override_default(rowkeep::resource::kSignupLock, true).ok);
  assert(catalog.default_for(rowkeep::resource::kSignupLock) == true);
  assert(!catalog.override_default("nope", rowkeep::Document::object()).ok);

  assert(rowkeep::is_valid_resource_key("event-times"));
  assert(rowkeep::is_valid_resource_key("player_stats2"));
  assert(!rowkeep::is_valid_resource_key(""));
  assert(!rowkeep::is_valid_resource_key("../etc"));
  assert(!rowkeep::is_valid_resource_key("-leading"));
  assert(!rowkeep::is_valid_resource_key("Upper"));
}

void test_store_read_your_writes() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-basic");

  assert(!store.save("events", rowkeep::Document::object()).ok);
  assert(store.open(dir.string()).ok);
  assert(!std::filesystem::exists(dir / ".rowkeep-write-check"));

  assert(store.read("events").status == rowkeep::ReadStatus::Missing);
  assert(store.load("events", rowkeep::Document::array()) == rowkeep::Document::array());

  const rowkeep::Document first = {{"main_team", {"Alice", "Bob"}}};
  assert(store.save("events", first).ok);
  assert(store.load("events", {}) == first);
  assert(read_text(dir / "events.json") == rowkeep::serialize_document(first));
  assert(!std::filesystem::exists(dir / "events.json.bak"));

  const rowkeep::Document second = {{"main_team", {"Carol"}}};
  assert(store.save("events", second).ok);
  assert(store.load("events", {}) == second);
  assert(read_text(dir / "events.json.bak") == rowkeep::serialize_document(first));
  assert(count_files_with(dir, ".tmp.") == 0);

  assert(!store.save("../escape", first).ok);

  const auto health = store.health_report();
  assert(health.healthy);
  assert(health.resource_count == 1);
  assert(health.save_count == 2);
  assert(health.failed_save_count == 0);
}

void test_store_quarantines_corrupt_documents() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-corrupt");
  assert(store.open(dir.string()).ok);

  write_text(dir / "results.json", "{\"total_wins\": 3,");
  const rowkeep::ReadOutcome outcome = store.read("results");
  assert(outcome.status == rowkeep::ReadStatus::Corrupt);
  assert(!outcome.quarantined_path.empty());
  assert(std::filesystem::exists(outcome.quarantined_path));
  assert(outcome.quarantined_path.ends_with(".corrupt"));
  assert(read_text(outcome.quarantined_path) == "{\"total_wins\": 3,");
  assert(!std::filesystem::exists(dir / "results.json"));

  // Second corruption in the same directory keeps both quarantined copies.
  write_text(dir / "results.json", "not json");
  assert(store.load("results", rowkeep::Document::object()) == rowkeep::Document::object());
  assert(count_files_with(dir, ".corrupt") == 2);
  assert(store.health_report().quarantine_count == 2);
}

void test_store_concurrent_updates() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-concurrent");
  assert(store.open(dir.string()).ok);

  constexpr int kThreads = 8;
  constexpr int kIncrements = 40;
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&store, &failures] {
      for (int i = 0; i < kIncrements; ++i) {
        const rowkeep::Result saved =
            store.update("player-stats", rowkeep::Document::object(), [](rowkeep::Document& value) {
              value["counter"] = value.value("counter", 0) + 1;
            });
        if (!saved.ok) {
          ++failures;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(failures.load() == 0);
  const rowkeep::Document stats = store.load("player-stats", {});
  assert(stats["counter"] == kThreads * kIncrements);
  assert(count_files_with(dir, ".tmp.") == 0);
}

void test_store_change_listener_modes() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-listener");
  assert(store.open(dir.string()).ok);

  std::vector<std::string> notified;
  store.set_change_listener([&notified](const std::string& key, const rowkeep::Document&) {
    notified.push_back(key);
  });

  assert(store.save("signup-lock", true).ok);
  assert(store.save("event-history", rowkeep::Document::array(), rowkeep::SyncMode::Suppress).ok);
  assert(!store.restore_bytes("results", "{broken", rowkeep::SyncMode::Mirror).ok);
  assert(store.restore_bytes("results", "{\"total_wins\": 1}\n", rowkeep::SyncMode::Mirror).ok);
  assert(read_text(dir / "results.json") == "{\"total_wins\": 1}\n");

  assert(notified.size() == 2);
  assert(notified[0] == "signup-lock");
  assert(notified[1] == "results");
}

void test_store_listener_follows_disk_order() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-listener-order");
  assert(store.open(dir.string()).ok);

  std::mutex seen_mutex;
  std::vector<int> seen;
  store.set_change_listener([&](const std::string&, const rowkeep::Document& value) {
    if (value == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::lock_guard lock(seen_mutex);
    seen.push_back(value.get<int>());
  });

  std::thread first([&store] { assert(store.save("results", 1).ok); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  std::thread second([&store] { assert(store.save("results", 2).ok); });
  first.join();
  second.join();

  assert(seen.size() == 2);
  assert(seen.back() == 2);
  assert(store.load("results", {}) == 2);
}

void test_store_concurrent_whole_document_saves() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-concurrent-saves");
  assert(store.open(dir.string()).ok);

  const rowkeep::Document small = {{"main_team", {"Alice"}}};
  rowkeep::Document large = {{"main_team", rowkeep::Document::array()}};
  for (int i = 0; i < 2000; ++i) {
    large["main_team"].push_back("Player_" + std::to_string(i));
  }

  std::mutex last_mutex;
  rowkeep::Document last_notified;
  store.set_change_listener([&](const std::string&, const rowkeep::Document& value) {
    std::lock_guard lock(last_mutex);
    last_notified = value;
  });
  assert(store.save("events", small).ok);

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::thread reader([&] {
    while (!done.load()) {
      const rowkeep::Document seen =
          rowkeep::Document::parse(read_text(dir / "events.json"), nullptr, false);
      if (seen != small && seen != large) {
        ++torn;
      }
    }
  });

  const auto writer = [&store](const rowkeep::Document& value) {
    return [&store, &value] {
      for (int i = 0; i < 50; ++i) {
        assert(store.save("events", value).ok);
      }
    };
  };
  std::thread small_writer(writer(small));
  std::thread large_writer(writer(large));
  small_writer.join();
  large_writer.join();
  done = true;
  reader.join();

  assert(torn.load() == 0);
  assert(last_notified == store.load("events", {}));
  assert(count_files_with(dir, ".tmp.") == 0);
}

void test_store_file_mode() {
  const mode_t previous = ::umask(022);
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("store-mode");
  assert(store.open(dir.string()).ok);

  using std::filesystem::perms;
  const auto path = dir / "signup-lock.json";
  assert(store.save("signup-lock", true).ok);
  const perms created = std::filesystem::status(path).permissions();
  assert(created == (perms::owner_read | perms::owner_write | perms::group_read | perms::others_read));

  std::filesystem::permissions(path, perms::owner_read | perms::owner_write,
                               std::filesystem::perm_options::replace);
  assert(store.save("signup-lock", false).ok);
  assert(std::filesystem::status(path).permissions() == (perms::owner_read | perms::owner_write));
  ::umask(previous);
}

void test_integrity_repairs_and_is_idempotent() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("integrity");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();

  write_text(dir / "alias-map.json", R"({"123": "Bob", "7": 42, "8": [1]})");
  write_text(dir / "events.json",
             R"({"main_team": [123, "  Alice ", "x", {"bad": 1}, 999, 555], "team_2": "nope"})");
  write_text(dir / "results.json", R"({"total_wins": "5", "total_losses": 2.0})");
  write_text(dir / "signup-lock.json", "[true]");
  write_text(dir / "event-history.json", "{corrupt");

  rowkeep::IntegrityValidator validator(store, catalog, [](std::int64_t id) -> std::optional<std::string> {
    if (id == 999) {
      return std::string{"Carol"};
    }
    return std::nullopt;
  });

  const rowkeep::FixReport first = validator.run();
  assert(!first.fixes.empty());
  assert(first.failures.empty());
  assert(contains(first.fixes, "created with default"));
  assert(contains(first.fixes, "event-history: reset corrupted document"));
  assert(contains(first.fixes, "signup-lock: expected boolean"));

  const rowkeep::Document events = store.load("events", {});
  const rowkeep::Document expected_team = {"Bob", "Alice", "Carol", "User_555"};
  assert(events["main_team"] == expected_team);
  assert(events["team_2"] == rowkeep::Document::array());
  assert(events["team_3"] == rowkeep::Document::array());

  const rowkeep::Document aliases = store.load("alias-map", {});
  assert(aliases["7"] == "42");
  assert(!aliases.contains("8"));
  assert(aliases["999"] == "Carol");

  const rowkeep::Document results = store.load("results", {});
  assert(results["total_wins"] == 5);
  assert(results["total_losses"] == 2);
  assert(results["history"] == rowkeep::Document::array());

  assert(store.load("signup-lock", {}) == false);
  assert(store.load("event-history", {}) == rowkeep::Document::array());
  assert(count_files_with(dir, ".corrupt") == 1);

  for (const auto& schema : catalog.schemas()) {
    assert(store.exists(schema.key));
  }

  rowkeep::IntegrityValidator again(store, catalog);
  const rowkeep::FixReport second = again.run();
  assert(second.empty());
}

void test_integrity_resets_out_of_range_integers() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("integrity-range");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();

  write_text(dir / "results.json", R"({"total_wins": 1e300, "total_losses": -1e300, "history": []})");
  rowkeep::IntegrityValidator validator(store, catalog);
  const rowkeep::FixReport report = validator.run();
  assert(contains(report.fixes, "results.total_wins: expected integer"));
  assert(contains(report.fixes, "results.total_losses: expected integer"));

  const rowkeep::Document results = store.load("results", {});
  assert(results["total_wins"] == 0);
  assert(results["total_losses"] == 0);
}

void test_admission_windows_and_cooldowns() {
  std::int64_t now = 1'000'000;
  rowkeep::AdmissionPolicy policy;
  policy.commands_per_minute = 3;
  policy.commands_per_hour = 5;
  policy.cooldown_seconds = {{"win", 60}};
  rowkeep::AdmissionController admission(policy, [&now] { return now; });

  assert(admission.check("alice", "ping").allowed);
  assert(admission.check("alice", "ping").allowed);
  assert(admission.check("alice", "ping").allowed);
  rowkeep::AdmissionDecision denied = admission.check("alice", "ping");
  assert(!denied.allowed);
  assert(denied.reason == "Rate limit: max 3 commands per minute");
  assert(denied.retry_after_seconds == 60);
  assert(admission.is_rate_limited("alice"));
  assert(!admission.is_rate_limited("bob"));

  now += 59'000;
  assert(!admission.check("alice", "ping").allowed);
  now += 1'000;
  assert(admission.check("alice", "ping").allowed);
  assert(admission.check("alice", "ping").allowed);

  now += 60'000;
  denied = admission.check("alice", "ping");
  assert(!denied.allowed);
  assert(denied.reason == "Rate limit: max 5 commands per hour");
  assert(denied.retry_after_seconds == 60 * 60 - 120);

  assert(admission.check("bob", "WIN").allowed);
  now += 1'000;
  denied = admission.check("bob", "win");
  assert(!denied.allowed);
  assert(denied.reason == "Command cooldown: 59s remaining");
  assert(denied.retry_after_seconds == 59);
  assert(admission.check("bob", "ping").allowed);

  const rowkeep::AdmissionStats bob = admission.stats("bob");
  assert(bob.commands_last_minute == 2);
  assert(bob.active_cooldowns.size() == 1);
  assert(bob.active_cooldowns.at("win") == 59);
  assert(!bob.rate_limited);

  now += 59'000;
  assert(admission.check("bob", "win").allowed);

  const rowkeep::AdmissionGlobalStats global = admission.global_stats();
  assert(global.active_actors_last_hour == 2);
  assert(global.commands_last_hour == 8);
  assert(global.active_cooldowns == 1);

  admission.reset("alice");
  const rowkeep::AdmissionStats cleared = admission.stats("alice");
  assert(cleared.commands_last_hour == 0);
  assert(admission.check("alice", "ping").allowed);
}

void test_admission_button_burst() {
  std::int64_t now = 5'000'000;
  rowkeep::AdmissionPolicy policy;
  policy.buttons_per_minute = 5;
  policy.button_burst_limit = 3;
  policy.button_burst_window_ms = 2'000;
  rowkeep::AdmissionController admission(policy, [&now] { return now; });

  assert(admission.record_button_trigger("carol").allowed);
  assert(admission.record_button_trigger("carol").allowed);
  assert(admission.record_button_trigger("carol").allowed);
  const rowkeep::AdmissionDecision burst = admission.record_button_trigger("carol");
  assert(!burst.allowed);
  assert(burst.reason == "Button spam detected: slow down!");

  now += 2'000;
  assert(admission.record_button_trigger("carol").allowed);
  now += 2'000;
  assert(admission.record_button_trigger("carol").allowed);
  now += 2'000;
  const rowkeep::AdmissionDecision minute = admission.record_button_trigger("carol");
  assert(!minute.allowed);
  assert(minute.reason == "Button rate limit: max 5 clicks per minute");
  assert(admission.stats("carol").buttons_last_minute == 5);

  now += 60'000;
  assert(admission.record_button_trigger("carol").allowed);
}

void test_sync_survives_disconnection() {
  FakeConnector connector;
  connector.connected = false;
  rowkeep::SyncEngine engine(connector, fast_sync_policy());
  engine.start();

  const rowkeep::Document value = {{"main_team", {"Alice"}}};
  assert(engine.enqueue("events", value));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(connector.delivered().empty());
  assert(!engine.flush(std::chrono::milliseconds(10)));
  assert(engine.stats().dropped == 0);
  assert(!engine.stats().connected);

  connector.connected = true;
  assert(engine.flush(std::chrono::seconds(2)));
  const auto delivered = connector.delivered();
  assert(delivered.size() == 1);
  assert(delivered[0].key == "events");
  assert(delivered[0].payload == value);

  const rowkeep::SyncStats stats = engine.stats();
  assert(stats.pushed == 1);
  assert(stats.dropped == 0);
  assert(stats.pending == 0);
  engine.stop();
  assert(!engine.stats().running);
}

void test_sync_retries_and_drops() {
  FakeConnector connector;
  rowkeep::SyncEngine engine(connector, fast_sync_policy());
  connector.script({rowkeep::RemoteStatus::Throttled, rowkeep::RemoteStatus::Throttled});
  engine.start();

  assert(engine.enqueue("results", {{"total_wins", 1}}));
  assert(engine.flush(std::chrono::seconds(2)));
  rowkeep::SyncStats stats = engine.stats();
  assert(stats.pushed == 1);
  assert(stats.retries == 2);
  assert(stats.throttled == 2);
  assert(connector.calls().size() == 3);

  connector.script({rowkeep::RemoteStatus::Timeout, rowkeep::RemoteStatus::Timeout,
                    rowkeep::RemoteStatus::Timeout});
  assert(engine.enqueue("results", {{"total_wins", 2}}));
  assert(engine.flush(std::chrono::seconds(2)));
  stats = engine.stats();
  assert(stats.pushed == 1);
  assert(stats.dropped == 1);
  assert(connector.calls().size() == 6);
  assert(!stats.last_error.empty());

  connector.script({rowkeep::RemoteStatus::Rejected});
  assert(engine.enqueue("signup-lock", true));
  assert(engine.flush(std::chrono::seconds(2)));
  stats = engine.stats();
  assert(stats.dropped == 2);
  assert(connector.calls().size() == 7);
}

void test_sync_chunks_large_documents() {
  FakeConnector connector;
  rowkeep::SyncPolicy policy = fast_sync_policy();
  policy.chunk_threshold_bytes = 64;
  policy.batch_rows = 2;
  rowkeep::SyncEngine engine(connector, policy);

  rowkeep::Document stats = rowkeep::Document::object();
  for (int i = 0; i < 5; ++i) {
    stats["player_" + std::to_string(i)] = {{"wins", i}, {"note", std::string(20, 'x')}};
  }

  connector.script({rowkeep::RemoteStatus::Ok, rowkeep::RemoteStatus::Throttled});
  engine.start();
  assert(engine.enqueue("player-stats", stats));
  assert(engine.flush(std::chrono::seconds(2)));

  const auto calls = connector.calls();
  assert(calls.size() == 4);
  const std::vector<std::size_t> indices = {0, 1, 1, 2};
  for (std::size_t i = 0; i < calls.size(); ++i) {
    assert(calls[i].key == "player-stats");
    assert(calls[i].batch_index == indices[i]);
    assert(calls[i].batch_count == 3);
  }
  assert(calls[0].payload.size() == 2);
  assert(calls[3].payload.size() == 1);
  assert(engine.stats().pushed == 1);
}

void test_sync_coalesces_pending_updates() {
  FakeConnector connector;
  rowkeep::SyncPolicy policy = fast_sync_policy();
  policy.max_pending = 2;
  rowkeep::SyncEngine engine(connector, policy);

  assert(engine.enqueue("events", {{"main_team", {"A1"}}}));
  assert(engine.enqueue("results", {{"total_wins", 1}}));
  assert(engine.enqueue("events", {{"main_team", {"A2"}}}));
  assert(!engine.enqueue("signup-lock", true));

  rowkeep::SyncStats stats = engine.stats();
  assert(stats.pending == 2);
  assert(stats.coalesced == 1);
  assert(stats.dropped == 1);

  engine.start();
  assert(engine.flush(std::chrono::seconds(2)));
  const auto delivered = connector.delivered();
  assert(delivered.size() == 2);
  assert(delivered[0].key == "events");
  assert(delivered[0].payload["main_team"][0] == "A2");
  assert(delivered[1].key == "results");
}

void test_sync_bootstrap_fills_missing_keys() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("sync-bootstrap");
  assert(store.open(dir.string()).ok);
  assert(store.save("results", {{"total_wins", 9}}).ok);

  int notifications = 0;
  store.set_change_listener([&notifications](const std::string&, const rowkeep::Document&) {
    ++notifications;
  });

  FakeConnector connector;
  connector.put_remote("events", {{"main_team", {"Remote"}}});
  connector.put_remote("results", {{"total_wins", 1}});
  rowkeep::SyncEngine engine(connector, fast_sync_policy());

  const std::size_t restored = engine.bootstrap(store, {"events", "results", "signup-lock"});
  assert(restored == 1);
  assert(store.load("events", {})["main_team"][0] == "Remote");
  assert(store.load("results", {})["total_wins"] == 9);
  assert(notifications == 0);

  const auto pulled = connector.pulled();
  assert(pulled.size() == 2);
  assert(std::ranges::find(pulled, std::string{"results"}) == pulled.end());

  connector.connected = false;
  assert(engine.bootstrap(store, {"event-history"}) == 0);
}

void test_backup_snapshot_and_restore() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("backup-restore");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();

  assert(store.save("events", {{"main_team", {"Alice", "Bob"}}, {"team_2", {}}, {"team_3", {}}}).ok);
  assert(store.save("signup-lock", true).ok);
  const auto original_events = store.read_bytes("events");
  assert(original_events.has_value());

  rowkeep::BackupPolicy policy;
  policy.backup_dir = (dir / "backups").string();
  policy.interval_seconds = 0;
  rowkeep::BackupManager backups(store, catalog, policy);

  const rowkeep::Result snapshot = backups.create_snapshot("Manual Test");
  assert(snapshot.ok);
  const std::filesystem::path archive{snapshot.data};
  assert(std::filesystem::exists(archive));
  assert(archive.filename().string().starts_with("backup_manual-test_"));
  assert(archive.filename().string().ends_with(".json.zst"));

  const auto bundle = rowkeep::read_backup_bundle(archive);
  assert(bundle.has_value());
  assert(bundle->metadata.trigger == "manual-test");
  assert(bundle->metadata.files.size() == 2);
  assert(bundle->entries.size() == 2);

  assert(store.save("events", {{"main_team", {"Mallory"}}}).ok);
  assert(store.save("results", {{"total_wins", 3}}).ok);

  const rowkeep::Result refused = backups.restore(archive.filename().string(), false);
  assert(!refused.ok);
  assert(store.load("events", {})["main_team"][0] == "Mallory");

  const rowkeep::Result restored = backups.restore(archive.filename().string(), true);
  assert(restored.ok);
  assert(store.read_bytes("events") == original_events);
  assert(store.load("signup-lock", {}) == true);
  // Keys absent from the archive are left as they are.
  assert(store.load("results", {})["total_wins"] == 3);

  const std::filesystem::path safety{restored.data};
  assert(std::filesystem::exists(safety));
  assert(safety.filename().string().starts_with("backup_pre-restore_"));
  const auto safety_bundle = rowkeep::read_backup_bundle(safety);
  assert(safety_bundle.has_value());
  assert(safety_bundle->metadata.files.size() == 3);

  const rowkeep::BackupStats stats = backups.stats();
  assert(stats.total_backups == 2);
  assert(stats.backups_by_trigger.at("pre-restore") == 1);
  assert(stats.backups_by_trigger.at("manual-test") == 1);

  assert(!backups.restore("backup_missing_20200101T000000000Z.json.zst", true).ok);
  write_text(dir / "backups" / "backup_junk_20200101T000000000Z.json.zst", "not zstd");
  assert(!backups.restore("backup_junk_20200101T000000000Z.json.zst", true).ok);
  assert(backups.stats().total_backups == 3);
}

void test_backup_rotation() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("backup-rotation");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();
  assert(store.save("signup-lock", false).ok);

  rowkeep::BackupPolicy policy;
  policy.backup_dir = (dir / "backups").string();
  policy.max_backups = 2;
  policy.interval_seconds = 0;
  rowkeep::BackupManager backups(store, catalog, policy);

  std::string newest;
  for (int i = 0; i < 4; ++i) {
    const rowkeep::Result created = backups.create_snapshot("manual");
    assert(created.ok);
    newest = created.data;
  }

  const auto listed = backups.list_backups();
  assert(listed.size() == 2);
  assert(listed.front().path == newest);
  assert(listed.front().metadata.has_value());
  assert(listed.front().metadata->app_version == "1.0.2");
  assert(!backups.has_changes_since_last_snapshot());
}

void test_backup_age_and_size_limits() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("backup-limits");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();
  assert(store.save("signup-lock", false).ok);

  rowkeep::BackupPolicy aged;
  aged.backup_dir = (dir / "aged").string();
  aged.max_age_days = 1;
  aged.interval_seconds = 0;
  rowkeep::BackupManager by_age(store, catalog, aged);
  const rowkeep::Result old_snapshot = by_age.create_snapshot("manual");
  assert(old_snapshot.ok);
  std::filesystem::last_write_time(
      old_snapshot.data, std::filesystem::file_time_type::clock::now() - std::chrono::hours(72));
  const rowkeep::Result fresh_snapshot = by_age.create_snapshot("manual");
  assert(fresh_snapshot.ok);
  const auto aged_list = by_age.list_backups();
  assert(aged_list.size() == 1);
  assert(aged_list.front().path == fresh_snapshot.data);
  assert(!std::filesystem::exists(old_snapshot.data));

  rowkeep::BackupPolicy sized;
  sized.backup_dir = (dir / "sized").string();
  sized.max_backups = 0;
  sized.max_total_bytes = 1;
  sized.interval_seconds = 0;
  rowkeep::BackupManager by_size(store, catalog, sized);
  std::string newest;
  for (int i = 0; i < 3; ++i) {
    const rowkeep::Result created = by_size.create_snapshot("manual");
    assert(created.ok);
    newest = created.data;
  }
  const auto sized_list = by_size.list_backups();
  assert(sized_list.size() == 1);
  assert(sized_list.front().path == newest);
}

void test_backup_scheduler_skips_unchanged_data() {
  rowkeep::ResourceStore store;
  const auto dir = temp_dir("backup-scheduled");
  assert(store.open(dir.string()).ok);
  const rowkeep::ResourceCatalog catalog = rowkeep::ResourceCatalog::standard();
  assert(store.save("signup-lock", false).ok);

  rowkeep::BackupPolicy policy;
  policy.backup_dir = (dir / "backups").string();
  policy.interval_seconds = 0;
  rowkeep::BackupManager backups(store, catalog, policy);

  assert(backups.run_scheduled().ok);
  assert(backups.list_backups().size() == 1);
  assert(backups.run_scheduled().ok);
  assert(backups.list_backups().size() == 1);

  assert(store.save("signup-lock", true).ok);
  assert(backups.has_changes_since_last_snapshot());
  // Keeps the archive mtime clear of the coarse file clock tick of the save.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(backups.run_scheduled().ok);
  assert(backups.list_backups().size() == 2);
  assert(backups.stats().backups_by_trigger.at("automatic") == 2);

  // A later manager sees only the archives on disk.
  rowkeep::BackupManager restarted(store, catalog, policy);
  assert(!restarted.has_changes_since_last_snapshot());
}

void test_settings_file_and_environment() {
  const auto dir = temp_dir("settings");
  const auto file = dir / "rowkeep.conf";
  write_text(file,
             "# rowkeep settings\n"
             "data_dir = /var/lib/rowkeep\n"
             "commands_per_minute=7\n"
             "cooldown_win=30\n"
             "default_signup_lock=true\n"
             "backup_max_total_mb=2\n"
             "backup_interval_hours=3\n"
             "log_level=WARNING\n");

  rowkeep::config::SettingsMap settings;
  assert(rowkeep::config::read_settings_file(file.string(), settings).ok);
  assert(settings.at("data_dir") == "/var/lib/rowkeep");

  rowkeep::InitConfig config;
  assert(rowkeep::config::apply_settings(config, settings).ok);
  assert(config.data_dir == "/var/lib/rowkeep");
  assert(config.admission.commands_per_minute == 7);
  assert(config.admission.cooldown_seconds.at("win") == 30);
  assert(config.admission.cooldown_seconds.at("startevent") == 300);
  assert(config.default_overrides.at("signup-lock") == true);
  assert(config.backup.max_total_bytes == 2U * 1024U * 1024U);
  assert(config.backup.interval_seconds == 3 * 60 * 60);
  assert(config.log_level == "warn");

  rowkeep::InitConfig bad;
  const rowkeep::Result invalid = rowkeep::config::apply_settings(bad, {{"commands_per_minute", "zero"}});
  assert(!invalid.ok);
  assert(invalid.message.find("ROWKEEP_COMMANDS_PER_MINUTE") != std::string::npos);
  assert(!rowkeep::config::apply_settings(bad, {{"default_events", "{oops"}}).ok);
  assert(!rowkeep::config::apply_settings(bad, {{"log_level", "loud"}}).ok);
  assert(!rowkeep::config::read_settings_file((dir / "missing.conf").string(), settings).ok);

  ::setenv("ROWKEEP_CONFIG_FILE", file.string().c_str(), 1);
  ::setenv("ROWKEEP_COMMANDS_PER_MINUTE", "9", 1);
  rowkeep::InitConfig layered;
  const rowkeep::Result loaded = rowkeep::config::load_from_environment(layered);
  ::unsetenv("ROWKEEP_CONFIG_FILE");
  ::unsetenv("ROWKEEP_COMMANDS_PER_MINUTE");
  assert(loaded.ok);
  assert(layered.data_dir == "/var/lib/rowkeep");
  assert(layered.admission.commands_per_minute == 9);
}

void test_core_api_local_flow() {
  const auto dir = temp_dir("api-local");
  rowkeep::InitConfig config;
  config.data_dir = (dir / "data").string();
  config.admission.commands_per_minute = 2;
  config.default_overrides["signup-lock"] = true;
  config.start_background_workers = false;

  rowkeep::CoreApi api;
  assert(api.load("events") == rowkeep::ResourceCatalog::standard().default_for("events"));
  assert(!api.update("events", [](rowkeep::Document&) {}).ok);

  const rowkeep::Result init = api.init(config);
  assert(init.ok);
  assert(api.last_fix_report().fixes.size() == 10);
  assert(api.load("signup-lock") == true);

  const auto add_player = [](const std::string& name) {
    return [name](rowkeep::Document& events) { events["main_team"].push_back(name); };
  };
  assert(api.mutate("alice", "join", "events", add_player("Alice")).ok());
  assert(api.mutate("alice", "join", "events", add_player("Ann")).ok());
  const rowkeep::MutationResult throttled = api.mutate("alice", "join", "events", add_player("Eve"));
  assert(!throttled.ok());
  assert(!throttled.admission.allowed);
  assert(!throttled.saved.ok);
  const rowkeep::Document team = {"Alice", "Ann"};
  assert(api.load("events")["main_team"] == team);

  assert(!api.update("not-declared", [](rowkeep::Document&) {}).ok);
  assert(api.update("results", [](rowkeep::Document& results) { results["total_wins"] = 4; }).ok);

  assert(api.reset_admission("alice").ok);
  assert(api.admission_stats("alice").commands_last_minute == 0);

  const rowkeep::Result backup = api.create_backup("manual");
  assert(backup.ok);
  assert(api.list_backups().size() == 1);
  assert(api.update("results", [](rowkeep::Document& results) { results["total_wins"] = 0; }).ok);
  assert(api.restore_backup(std::filesystem::path{backup.data}.filename().string(), true).ok);
  assert(api.load("results")["total_wins"] == 4);
  assert(api.backup_stats().total_backups == 2);

  assert(api.run_validation().empty());
  const rowkeep::HealthReport health = api.health();
  assert(health.store.healthy);
  assert(health.store.resource_count == 10);
  assert(!health.remote_configured);

  api.shutdown();
  api.shutdown();
}

void test_core_api_mirrors_writes() {
  const auto dir = temp_dir("api-mirror");
  rowkeep::InitConfig config;
  config.data_dir = (dir / "data").string();
  config.sync = fast_sync_policy();
  config.sync.max_pending = 64;
  config.backup.interval_seconds = 0;

  auto connector = std::make_unique<FakeConnector>();
  FakeConnector* remote = connector.get();
  remote->put_remote("alias-map", {{"42", "Zed"}});

  rowkeep::CoreApi api;
  assert(api.init(config, std::move(connector)).ok);
  assert(api.load("alias-map")["42"] == "Zed");
  assert(api.health().remote_configured);

  assert(api.update("signup-lock", [](rowkeep::Document& value) { value = true; }).ok);
  api.shutdown();

  const auto delivered = remote->delivered();
  assert(!delivered.empty());
  assert(std::ranges::none_of(delivered, [](const FakeConnector::Call& call) {
    return call.key == "alias-map";
  }));
  const auto last_lock = std::ranges::find_if(delivered.rbegin(), delivered.rend(),
                                              [](const FakeConnector::Call& call) {
                                                return call.key == "signup-lock";
                                              });
  assert(last_lock != delivered.rend());
  assert(last_lock->payload == true);
}

void test_core_api_reinit_without_mirror() {
  const auto dir = temp_dir("api-reinit");
  rowkeep::InitConfig config;
  config.data_dir = (dir / "data").string();
  config.sync = fast_sync_policy();
  config.start_background_workers = false;

  rowkeep::CoreApi api;
  assert(api.init(config, std::make_unique<FakeConnector>()).ok);
  assert(api.health().remote_configured);
  api.shutdown();

  assert(api.init(config).ok);
  const rowkeep::HealthReport health = api.health();
  assert(!health.remote_configured);
  assert(health.sync.pushed == 0);
  assert(health.store.healthy);
  assert(api.update("signup-lock", [](rowkeep::Document& value) { value = true; }).ok);
  assert(api.load("signup-lock") == true);
  api.shutdown();
}

void test_command_line_parsing() {
  using rowkeep::app::parse_command;
  const auto check = parse_command({});
  assert(check.has_value());
  assert(check->name == "check");
  assert(!check->needs_workers());

  const auto backup = parse_command({"backup"});
  assert(backup.has_value());
  assert(backup->trigger == "manual");
  assert(parse_command({"backup", "nightly"})->trigger == "nightly");

  const auto restore = parse_command({"restore", "backup_manual_x.json.zst", "--confirm"});
  assert(restore.has_value());
  assert(restore->archive == "backup_manual_x.json.zst");
  assert(restore->confirm);
  assert(restore->needs_workers());
  assert(!parse_command({"restore", "backup_manual_x.json.zst"})->confirm);

  assert(!parse_command({"restore"}).has_value());
  assert(!parse_command({"bogus"}).has_value());
  assert(!parse_command({"--help"}).has_value());
  assert(parse_command({"serve"})->needs_workers());
}

}  // namespace

int main() {
  test_catalog_rules();
  test_store_read_your_writes();
  test_store_quarantines_corrupt_documents();
  test_store_concurrent_updates();
  test_store_change_listener_modes();
  test_store_listener_follows_disk_order();
  test_store_concurrent_whole_document_saves();
  test_store_file_mode();
  test_integrity_repairs_and_is_idempotent();
  test_integrity_resets_out_of_range_integers();
  test_admission_windows_and_cooldowns();
  test_admission_button_burst();
  test_sync_survives_disconnection();
  test_sync_retries_and_drops();
  test_sync_chunks_large_documents();
  test_sync_coalesces_pending_updates();
  test_sync_bootstrap_fills_missing_keys();
  test_backup_snapshot_and_restore();
  test_backup_rotation();
  test_backup_age_and_size_limits();
  test_backup_scheduler_skips_unchanged_data();
  test_settings_file_and_environment();
  test_core_api_local_flow();
  test_core_api_mirrors_writes();
  test_core_api_reinit_without_mirror();
  test_command_line_parsing();

  std::cout << "rowkeep_core_tests passed\n";
  return 0;
}
