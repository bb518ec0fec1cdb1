#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include "dispo/types.h"

namespace dispo {

struct event_node {
  // measured > predicted > planned
  std::optional<minutes_after_midnight_t> effective() const {
    if (measured_.has_value()) {
      return measured_;
    }
    return predicted_.has_value() ? predicted_ : planned_;
  }

  train_id_t train_{0};
  seq_t seq_{0U};
  event_kind kind_{event_kind::kArrival};
  std::optional<target_idx_t> target_;
  std::string plan_, track_;
  std::optional<minutes_after_midnight_t> planned_, predicted_, measured_;

  // Dropped by a later translation, kept for stable indices.
  bool detached_{false};
};

// The predicted time of `to_` is bounded by the effective time of `from_`:
//   from + dt_min + max(0, dt_fdl) <= to <= from + dt_max + min(0, dt_fdl)
// dt_fdl is a dispatcher correction (wait for connection / depart early).
struct event_edge {
  event_edge_type type_{event_edge_type::kPlanned};
  event_idx_t from_, to_;
  duration_t dt_min_{0};
  std::optional<duration_t> dt_max_, dt_fdl_;
};

struct event_graph {
  std::optional<event_idx_t> find(train_id_t, seq_t) const;
  std::optional<event_idx_t> find(train_id_t, target_idx_t, event_kind) const;
  std::optional<event_idx_t> start(train_id_t const t) const {
    return find(t, 0U);
  }

  event_idx_t add_node(event_node, bool train_start);

  // Moves sequence number 0 of the train to this event.
  void make_start(event_idx_t);

  // Removes all edges and the target reference of a node.
  void detach(event_idx_t);
  bool is_detached(event_idx_t const e) const { return nodes_[e].detached_; }

  std::optional<event_edge_idx_t> find_edge(event_idx_t from,
                                            event_idx_t to) const;
  event_edge_idx_t add_edge(event_edge);
  void remove_edge(event_edge_idx_t);

  // Next/previous event of the same train. With follow_links, the walk
  // continues into the successor train at replacement and coupling events.
  std::optional<event_idx_t> successor(event_idx_t, bool follow_links) const;
  std::optional<event_idx_t> predecessor(event_idx_t, bool follow_links) const;

  std::optional<event_idx_t> next_event(
      event_idx_t,
      std::optional<event_kind> = std::nullopt,
      bool follow_links = true) const;
  std::optional<event_idx_t> prev_event(
      event_idx_t,
      std::optional<event_kind> = std::nullopt,
      bool follow_links = true) const;

  // Search forward from (and including) start.
  template <typename Fn>
  std::optional<event_idx_t> find_in_path(event_idx_t start, Fn&& pred) const {
    auto curr = std::optional{start};
    for (auto i = 0U; curr.has_value() && i != nodes_.size(); ++i) {
      if (pred(nodes_[*curr])) {
        return curr;
      }
      curr = successor(*curr, true);
    }
    return std::nullopt;
  }

  vector<event_idx_t> train_path(train_id_t, bool follow_links = false) const;

  std::string node_info(event_idx_t) const;
  std::string edge_info(event_edge_idx_t) const;

  std::size_t n_nodes() const { return nodes_.size(); }

  void reset();

  vector_map<event_idx_t, event_node> nodes_;
  vector_map<event_edge_idx_t, event_edge> edges_;
  vector_map<event_idx_t, vector<event_edge_idx_t>> out_, in_;
  std::map<std::pair<train_id_t, seq_t>, event_idx_t> key_to_node_;
  std::map<std::tuple<train_id_t, target_idx_t, event_kind>, event_idx_t>
      target_to_node_;
  seq_t next_seq_{1U};
};

// One line per event of the train, for logs and tests.
struct printable_path {
  friend std::ostream& operator<<(std::ostream&, printable_path const&);

  event_graph const& eg_;
  train_id_t train_;
  bool follow_links_{false};
};

}  // namespace dispo
