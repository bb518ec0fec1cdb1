#pragma once

#include <cinttypes>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "dispo/event_graph.h"
#include "dispo/problems.h"
#include "dispo/types.h"

namespace dispo {

enum class occurrence_kind : std::uint8_t {
  kEntry,
  kArrival,
  kDeparture,
  kExit,
  kRedSignal,
  kCleared,
  kReplacement,
  kCoupling,
  kSplitting
};

std::string_view to_str(occurrence_kind);
std::optional<occurrence_kind> parse_occurrence_kind(std::string_view);

// Something the simulator reported about a train.
struct occurrence {
  train_id_t train_{0};
  occurrence_kind kind_{occurrence_kind::kArrival};
  minutes_after_midnight_t time_{0};
  std::string location_;
  std::string plan_;
  bool at_platform_{false};
};

struct ingest_stats {
  friend std::ostream& operator<<(std::ostream&, ingest_stats const&);
  ingest_stats& operator+=(ingest_stats const&);

  std::uint32_t total_{0U};
  std::uint32_t ignored_{0U};
  std::uint32_t applied_{0U};
  std::uint32_t dropped_{0U};
  std::uint32_t measured_{0U};
};

// Maps occurrences onto events. Keeps a cursor per train pointing to
// the next expected event, so that searches start where the last one ended.
// Measured times are set once and never overwritten.
struct ingester {
  struct train_state {
    std::optional<event_idx_t> next_;
    std::optional<event_idx_t> last_;
    std::string plan_;
  };

  ingest_stats ingest(event_graph&, occurrence const&, problems&);
  ingest_stats ingest(event_graph&, std::span<occurrence const>, problems&);

  std::optional<event_idx_t> cursor(train_id_t) const;
  train_state const* state(train_id_t) const;

  void reset();

private:
  bool apply(event_graph&, occurrence const&, problems&);

  void set_cursor(train_id_t, std::optional<event_idx_t>);
  bool measure(event_graph&, event_idx_t, minutes_after_midnight_t);

  std::optional<event_idx_t> search_start(event_graph const&,
                                          train_id_t) const;
  std::optional<event_idx_t> find(event_graph const&,
                                  occurrence const&,
                                  std::optional<event_kind>,
                                  std::string_view plan) const;

  hash_map<train_id_t, train_state> trains_;
  std::uint32_t measured_{0U};
};

}  // namespace dispo
