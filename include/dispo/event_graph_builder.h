#pragma once

#include <cinttypes>
#include <iosfwd>

#include "dispo/event_graph.h"
#include "dispo/planning_params.h"
#include "dispo/problems.h"
#include "dispo/target_graph.h"

namespace dispo {

struct build_stats {
  friend std::ostream& operator<<(std::ostream&, build_stats const&);
  build_stats& operator+=(build_stats const&);

  std::uint32_t builders_{0U};
  std::uint32_t new_events_{0U};
  std::uint32_t updated_events_{0U};
  std::uint32_t detached_events_{0U};
  std::uint32_t new_edges_{0U};
  std::uint32_t removed_edges_{0U};
  std::uint32_t skipped_links_{0U};
};

// Translates every target into events:
//   Halt, pass-through, stop: An -H-> Ab
//   entry: Ab
//   exit: An
// Replacement, coupling and splitting links rewrite this default pattern
// before anything is committed. Existing events are matched by train,
// target and kind and keep their measured times and dispatcher edges.
// With `clean`, the event graph is rebuilt from scratch.
build_stats build_event_graph(target_graph const&,
                              event_graph&,
                              planning_params const&,
                              problems&,
                              bool clean = false);

}  // namespace dispo
