#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "dispo/planning_params.h"
#include "dispo/problems.h"
#include "dispo/schedule.h"
#include "dispo/types.h"

namespace dispo {

// Identifies a planned stop: train + planned time + planned location.
// Entry and exit targets use kMinMinutes / kMaxMinutes as time.
struct target_key {
  auto operator<=>(target_key const&) const = default;

  train_id_t train_{0};
  minutes_after_midnight_t time_{0};
  std::string plan_;
};

struct target_node {
  train_id_t train() const { return key_.train_; }

  target_key key_;
  target_type type_{target_type::kHalt};
  std::string plan_, track_;
  std::optional<minutes_after_midnight_t> p_arr_, p_dep_;
  duration_t min_dwell_{0};
  std::string flags_;

  // Written back from the event graph.
  std::optional<duration_t> delay_arr_, delay_dep_;
};

struct target_edge {
  target_edge_type type_;
  target_idx_t from_, to_;
};

// Operational link whose partner train is known
// but has not been imported into the target graph yet.
struct pending_link {
  target_edge_type type_;
  target_idx_t from_;
  train_id_t partner_;
  std::string plan_;
  std::optional<minutes_after_midnight_t> time_;
};

struct train_link {
  auto operator<=>(train_link const&) const = default;

  target_edge_type type_;
  train_id_t from_, to_;
};

struct target_graph {
  std::optional<target_idx_t> find(target_key const&) const;

  // Returns the node index and whether it was created.
  // An existing node is left unchanged.
  std::pair<target_idx_t, bool> add_node(target_node);

  std::optional<target_edge_idx_t> find_edge(target_idx_t from,
                                             target_idx_t to) const;

  // Returns false for self loops and already existing edges.
  bool add_edge(target_edge_type, target_idx_t from, target_idx_t to);

  std::optional<target_idx_t> first(train_id_t) const;
  std::optional<target_idx_t> last(train_id_t) const;

  // Targets of the train in planned order.
  vector<target_idx_t> train_targets(train_id_t) const;

  vector<pending_link> const& pending_links() const { return pending_; }

  std::size_t n_nodes() const { return nodes_.size(); }
  std::size_t n_edges() const { return edges_.size(); }

  void reset();

  vector_map<target_idx_t, target_node> nodes_;
  vector_map<target_edge_idx_t, target_edge> edges_;
  vector_map<target_idx_t, vector<target_edge_idx_t>> out_, in_;
  std::map<target_key, target_idx_t> key_to_node_;
  hash_map<train_id_t, target_idx_t> train_first_, train_last_;
  vector<pending_link> pending_;
};

// Creates the targets of one train and its links to other trains.
// Links to trains missing from the directory are skipped and reported.
// Returns the operational links originating from this train.
vector<train_link> import_train(target_graph&,
                                train const&,
                                std::optional<std::string_view> entry,
                                std::optional<std::string_view> exit,
                                train_directory const& other_trains,
                                planning_params const&,
                                problems&);

std::ostream& operator<<(std::ostream&, target_node const&);

}  // namespace dispo
