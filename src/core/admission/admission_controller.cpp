#include "core/admission/admission_controller.hpp"

#include <algorithm>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

constexpr std::int64_t kMinuteMs = 60 * 1000;
constexpr std::int64_t kHourMs = 60 * kMinuteMs;

std::shared_ptr<spdlog::logger> admission_log() {
  return util::component_logger("admission");
}

std::size_t count_since(const std::deque<std::int64_t>& stamps, std::int64_t now, std::int64_t window) {
  return static_cast<std::size_t>(
      std::ranges::count_if(stamps, [now, window](std::int64_t t) { return now - t < window; }));
}

// Seconds until the oldest stamp inside the window leaves it.
std::int64_t seconds_until_expiry(const std::deque<std::int64_t>& stamps, std::int64_t now,
                                  std::int64_t window) {
  for (const std::int64_t t : stamps) {
    if (now - t < window) {
      const std::int64_t remaining_ms = t + window - now;
      return std::max<std::int64_t>(1, (remaining_ms + 999) / 1000);
    }
  }
  return 0;
}

AdmissionDecision deny(std::string reason, std::int64_t retry_after) {
  return {.allowed = false, .reason = std::move(reason), .retry_after_seconds = retry_after};
}

}  // namespace

AdmissionController::AdmissionController(AdmissionPolicy policy, Clock now_ms)
    : policy_(std::move(policy)), now_ms_(now_ms ? std::move(now_ms) : Clock{util::steady_now_ms}) {}

void AdmissionController::prune(ActorRecord& record, std::int64_t now) const {
  while (!record.commands.empty() && now - record.commands.front() >= kHourMs) {
    record.commands.pop_front();
  }
  while (!record.buttons.empty() && now - record.buttons.front() >= kMinuteMs) {
    record.buttons.pop_front();
  }
  std::erase_if(record.last_used, [this, now](const auto& entry) {
    return now - entry.second >= cooldown_ms(entry.first);
  });
}

std::int64_t AdmissionController::cooldown_ms(const std::string& action) const {
  const auto it = policy_.cooldown_seconds.find(action);
  return it == policy_.cooldown_seconds.end() ? 0 : it->second * 1000;
}

AdmissionDecision AdmissionController::check(std::string_view actor, std::string_view action) {
  const std::int64_t now = now_ms_();
  const std::string action_name = util::lowercase_copy(action);

  std::lock_guard lock(mutex_);
  ActorRecord& record = actors_[std::string{actor}];
  prune(record, now);

  if (count_since(record.commands, now, kMinuteMs) >= policy_.commands_per_minute) {
    admission_log()->debug("denied {} for {}: minute budget", action_name, actor);
    return deny("Rate limit: max " + std::to_string(policy_.commands_per_minute) +
                    " commands per minute",
                seconds_until_expiry(record.commands, now, kMinuteMs));
  }

  if (record.commands.size() >= policy_.commands_per_hour) {
    admission_log()->debug("denied {} for {}: hour budget", action_name, actor);
    return deny("Rate limit: max " + std::to_string(policy_.commands_per_hour) +
                    " commands per hour",
                seconds_until_expiry(record.commands, now, kHourMs));
  }

  const std::int64_t cooldown = cooldown_ms(action_name);
  if (cooldown > 0) {
    const auto last = record.last_used.find(action_name);
    if (last != record.last_used.end() && now - last->second < cooldown) {
      const std::int64_t left = (last->second + cooldown - now + 999) / 1000;
      admission_log()->debug("denied {} for {}: cooldown {}s", action_name, actor, left);
      return deny("Command cooldown: " + std::to_string(left) + "s remaining", left);
    }
  }

  record.commands.push_back(now);
  if (cooldown > 0) {
    record.last_used[action_name] = now;
  }
  return {.allowed = true, .reason = {}, .retry_after_seconds = 0};
}

AdmissionDecision AdmissionController::record_button_trigger(std::string_view actor) {
  const std::int64_t now = now_ms_();

  std::lock_guard lock(mutex_);
  ActorRecord& record = actors_[std::string{actor}];
  prune(record, now);

  if (record.buttons.size() >= policy_.buttons_per_minute) {
    admission_log()->debug("denied control trigger for {}: minute budget", actor);
    return deny("Button rate limit: max " + std::to_string(policy_.buttons_per_minute) +
                    " clicks per minute",
                seconds_until_expiry(record.buttons, now, kMinuteMs));
  }

  if (count_since(record.buttons, now, policy_.button_burst_window_ms) >=
      policy_.button_burst_limit) {
    admission_log()->debug("denied control trigger for {}: burst", actor);
    return deny("Button spam detected: slow down!",
                seconds_until_expiry(record.buttons, now, policy_.button_burst_window_ms));
  }

  record.buttons.push_back(now);
  return {.allowed = true, .reason = {}, .retry_after_seconds = 0};
}

std::map<std::string, std::int64_t> AdmissionController::active_cooldowns(const ActorRecord& record,
                                                                         std::int64_t now) const {
  std::map<std::string, std::int64_t> out;
  for (const auto& [action, last] : record.last_used) {
    const std::int64_t remaining_ms = last + cooldown_ms(action) - now;
    if (remaining_ms > 0) {
      out[action] = (remaining_ms + 999) / 1000;
    }
  }
  return out;
}

AdmissionStats AdmissionController::stats(std::string_view actor) {
  const std::int64_t now = now_ms_();
  AdmissionStats out;

  std::lock_guard lock(mutex_);
  const auto it = actors_.find(std::string{actor});
  if (it == actors_.end()) {
    return out;
  }
  prune(it->second, now);
  const ActorRecord& record = it->second;
  out.commands_last_minute = count_since(record.commands, now, kMinuteMs);
  out.commands_last_hour = record.commands.size();
  out.buttons_last_minute = record.buttons.size();
  out.active_cooldowns = active_cooldowns(record, now);
  out.rate_limited = out.commands_last_minute >= policy_.commands_per_minute;
  return out;
}

bool AdmissionController::is_rate_limited(std::string_view actor) {
  const std::int64_t now = now_ms_();
  std::lock_guard lock(mutex_);
  const auto it = actors_.find(std::string{actor});
  if (it == actors_.end()) {
    return false;
  }
  return count_since(it->second.commands, now, kMinuteMs) >= policy_.commands_per_minute;
}

AdmissionGlobalStats AdmissionController::global_stats() {
  const std::int64_t now = now_ms_();
  AdmissionGlobalStats out;

  std::lock_guard lock(mutex_);
  for (auto& [actor, record] : actors_) {
    prune(record, now);
    if (!record.commands.empty()) {
      ++out.active_actors_last_hour;
    }
    if (count_since(record.commands, now, kMinuteMs) >= policy_.commands_per_minute) {
      ++out.rate_limited_actors;
    }
    out.commands_last_hour += record.commands.size();
    out.active_cooldowns += active_cooldowns(record, now).size();
  }
  return out;
}

void AdmissionController::reset(std::string_view actor) {
  std::lock_guard lock(mutex_);
  actors_.erase(std::string{actor});
  admission_log()->info("reset admission counters for {}", actor);
}

}  // namespace rowkeep
