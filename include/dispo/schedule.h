#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "dispo/types.h"

namespace dispo {

struct stop {
  std::string_view track() const { return track_.empty() ? plan_ : track_; }

  std::string plan_;
  std::string track_;
  std::optional<minutes_after_midnight_t> arr_, dep_;
  std::optional<duration_t> min_dwell_;
  std::optional<target_type> type_;
  std::string flags_;
};

struct train {
  train_id_t id_{0};
  std::string name_;
  vector<stop> stops_;

  // Already inside the network: no entry target is synthesized.
  bool visible_{false};

  std::optional<std::string> entry_, exit_;
};

using train_directory = hash_map<train_id_t, train>;

// Operational markers of a stop, e.g. "DL" or "K1(4711)W".
struct stop_flags {
  bool pass_through_{false};
  bool run_around_{false};
  bool direction_change_{false};
  bool engine_change_{false};
  std::optional<train_id_t> replacement_, coupling_, splitting_;
};

stop_flags parse_flags(std::string_view);

}  // namespace dispo
