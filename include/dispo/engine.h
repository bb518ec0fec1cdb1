#pragma once

#include <span>

#include "dispo/event_graph.h"
#include "dispo/event_graph_builder.h"
#include "dispo/ingest.h"
#include "dispo/planning_params.h"
#include "dispo/problems.h"
#include "dispo/prognosis.h"
#include "dispo/schedule.h"
#include "dispo/target_graph.h"

namespace dispo {

// Owns both graphs. Every public operation runs to completion
// before the next one starts; failures end up in problems_.
struct engine {
  explicit engine(planning_params = {});

  // Adds (or updates) a train in the directory and the target graph.
  vector<train_link> import_train(train const&);

  // Registers all trains first so links between them resolve.
  void import(std::span<train const>);

  build_stats build(bool clean = false);

  // Applies the occurrences in order, then runs the prognosis.
  ingest_stats ingest(std::span<occurrence const>);

  prognosis_stats prognose();
  std::uint32_t write_back();

  // Drops all state except the parameters.
  void reset();

  planning_params params_;
  train_directory trains_;
  target_graph tg_;
  event_graph eg_;
  ingester ingester_;
  problems problems_;
};

}  // namespace dispo
