#pragma once

#include <sstream>
#include <string>

#include "dispo/engine.h"
#include "dispo/event_graph.h"
#include "dispo/ingest.h"
#include "dispo/schedule.h"
#include "dispo/types.h"

namespace dispo::test {

inline minutes_after_midnight_t hm(int const h, int const m) {
  return minutes_after_midnight_t{h * 60 + m};
}

inline stop make_stop(std::string plan,
                      std::optional<minutes_after_midnight_t> arr,
                      std::optional<minutes_after_midnight_t> dep,
                      std::string flags = "",
                      std::optional<duration_t> min_dwell = std::nullopt) {
  return stop{.plan_ = std::move(plan),
              .arr_ = arr,
              .dep_ = dep,
              .min_dwell_ = min_dwell,
              .flags_ = std::move(flags)};
}

inline train make_train(train_id_t const id,
                        std::initializer_list<stop> stops,
                        bool const visible = true) {
  auto t = train{.id_ = id, .name_ = std::to_string(id)};
  for (auto const& s : stops) {
    t.stops_.push_back(s);
  }
  t.visible_ = visible;
  return t;
}

inline occurrence occ(train_id_t const t,
                      occurrence_kind const k,
                      minutes_after_midnight_t const time,
                      std::string location = "",
                      bool const at_platform = false) {
  return occurrence{.train_ = t,
                    .kind_ = k,
                    .time_ = time,
                    .location_ = std::move(location),
                    .at_platform_ = at_platform};
}

// Event of a train at a stop given by its key time and planned location.
inline std::optional<event_idx_t> get_event(engine const& e,
                                            train_id_t const t,
                                            minutes_after_midnight_t const time,
                                            std::string const& plan,
                                            event_kind const k) {
  auto const target = e.tg_.find(target_key{t, time, plan});
  return target.has_value() ? e.eg_.find(t, *target, k) : std::nullopt;
}

inline std::size_t count_edges(event_graph const& eg,
                               std::optional<event_edge_type> const type =
                                   std::nullopt) {
  auto n = std::size_t{0U};
  for (auto const& out : eg.out_) {
    for (auto const e : out) {
      if (!type.has_value() || eg.edges_[e].type_ == *type) {
        ++n;
      }
    }
  }
  return n;
}

inline std::size_t count_events(event_graph const& eg, event_kind const k) {
  auto n = std::size_t{0U};
  for (auto const& x : eg.nodes_) {
    if (!x.detached_ && x.kind_ == k) {
      ++n;
    }
  }
  return n;
}

inline std::string to_string(printable_path const& p) {
  auto ss = std::stringstream{};
  ss << p;
  return ss.str();
}

}  // namespace dispo::test
