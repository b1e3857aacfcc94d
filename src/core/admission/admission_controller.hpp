#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/model/types.hpp"

namespace rowkeep {

// In-memory per-actor throttling. Never touches storage; state is lost on
// restart. An action is recorded only when it is allowed.
class AdmissionController {
public:
  using Clock = std::function<std::int64_t()>;

  explicit AdmissionController(AdmissionPolicy policy = {}, Clock now_ms = {});

  AdmissionDecision check(std::string_view actor, std::string_view action);
  AdmissionDecision record_button_trigger(std::string_view actor);

  [[nodiscard]] AdmissionStats stats(std::string_view actor);
  [[nodiscard]] bool is_rate_limited(std::string_view actor);
  [[nodiscard]] AdmissionGlobalStats global_stats();
  void reset(std::string_view actor);

  [[nodiscard]] const AdmissionPolicy& policy() const { return policy_; }

private:
  struct ActorRecord {
    std::deque<std::int64_t> commands;
    std::deque<std::int64_t> buttons;
    std::map<std::string, std::int64_t> last_used;
  };

  AdmissionPolicy policy_;
  Clock now_ms_;
  std::mutex mutex_;
  std::unordered_map<std::string, ActorRecord> actors_;

  void prune(ActorRecord& record, std::int64_t now) const;
  [[nodiscard]] std::int64_t cooldown_ms(const std::string& action) const;
  [[nodiscard]] std::map<std::string, std::int64_t> active_cooldowns(const ActorRecord& record,
                                                                    std::int64_t now) const;
};

}  // namespace rowkeep
