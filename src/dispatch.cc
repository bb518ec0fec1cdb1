#include "dispo/dispatch.h"

#include <algorithm>

#include "fmt/ostream.h"

#include "dispo/logging.h"

namespace dispo {

namespace {

bool is_departure(event_graph const& eg,
                  event_idx_t const e,
                  problems& pb,
                  char const* ctx) {
  if (eg.nodes_[e].kind_ != event_kind::kDeparture) {
    pb.add(problem_kind::kNotFound, ctx, "{} is not a departure",
           eg.node_info(e));
    return false;
  }
  return true;
}

}  // namespace

bool wait_for(event_graph& eg,
              event_idx_t const departure,
              event_idx_t const awaited,
              duration_t const wait,
              problems& pb) {
  if (!is_departure(eg, departure, pb, "dispatch.wait_for")) {
    return false;
  }
  if (departure == awaited) {
    pb.add(problem_kind::kNotFound, "dispatch.wait_for",
           "{} cannot wait for itself", eg.node_info(departure));
    return false;
  }

  if (auto const e = eg.find_edge(awaited, departure); e.has_value()) {
    eg.edges_[*e].dt_fdl_ = wait;
  } else {
    eg.add_edge(event_edge{.type_ = event_edge_type::kDependency,
                           .from_ = awaited,
                           .to_ = departure,
                           .dt_min_ = duration_t{0},
                           .dt_fdl_ = wait});
  }

  log(log_lvl::info, "dispatch.wait_for", "{} waits {} min for {}",
      eg.node_info(departure), wait.count(), eg.node_info(awaited));
  return true;
}

bool change_wait(event_graph& eg,
                 event_idx_t const departure,
                 duration_t const wait,
                 bool const relative,
                 problems& pb) {
  if (!is_departure(eg, departure, pb, "dispatch.change_wait")) {
    return false;
  }

  auto changed = false;
  for (auto const in : eg.in_[departure]) {
    auto& edge = eg.edges_[in];
    if (edge.type_ != event_edge_type::kDependency) {
      continue;
    }
    edge.dt_fdl_ = relative ? edge.dt_fdl_.value_or(duration_t{0}) + wait : wait;
    changed = true;
  }

  if (!changed) {
    pb.add(problem_kind::kNotFound, "dispatch.change_wait",
           "{} has no dependencies", eg.node_info(departure));
  }
  return changed;
}

bool depart_early(event_graph& eg,
                  event_idx_t const departure,
                  duration_t const earlier,
                  problems& pb) {
  if (!is_departure(eg, departure, pb, "dispatch.depart_early")) {
    return false;
  }

  for (auto const in : eg.in_[departure]) {
    auto& edge = eg.edges_[in];
    if (edge.type_ != event_edge_type::kHold) {
      continue;
    }

    auto const& from = eg.nodes_[edge.from_].planned_;
    auto const& to = eg.nodes_[departure].planned_;
    if (!from.has_value() || !to.has_value()) {
      pb.add(problem_kind::kIncompleteData, "dispatch.depart_early",
             "{}: no planned dwell time", eg.node_info(departure));
      return false;
    }

    edge.dt_max_ = std::max(edge.dt_min_, *to - *from);
    edge.dt_fdl_ = -earlier;
    return true;
  }

  pb.add(problem_kind::kNotFound, "dispatch.depart_early",
         "{} has no hold edge", eg.node_info(departure));
  return false;
}

bool add_dependency(target_graph& tg,
                    target_idx_t const waiting,
                    target_idx_t const awaited,
                    problems& pb) {
  if (waiting == awaited || tg.nodes_[waiting].type_ == target_type::kExit) {
    pb.add(problem_kind::kNotFound, "dispatch.add_dependency",
           "{} has no departure waiting for {}",
           fmt::streamed(tg.nodes_[waiting]),
           fmt::streamed(tg.nodes_[awaited]));
    return false;
  }

  if (tg.add_edge(target_edge_type::kDependency, awaited, waiting)) {
    log(log_lvl::info, "dispatch.add_dependency", "{} waits for {}",
        fmt::streamed(tg.nodes_[waiting]), fmt::streamed(tg.nodes_[awaited]));
  }
  return true;
}

void reset_corrections(event_graph& eg, event_idx_t const departure) {
  auto dependencies = vector<event_edge_idx_t>{};
  for (auto const in : eg.in_[departure]) {
    auto& edge = eg.edges_[in];
    if (edge.type_ == event_edge_type::kDependency) {
      dependencies.push_back(in);
    } else {
      edge.dt_max_ = std::nullopt;
      edge.dt_fdl_ = std::nullopt;
    }
  }
  for (auto const e : dependencies) {
    eg.remove_edge(e);
  }
  eg.nodes_[departure].predicted_ = std::nullopt;
}

}  // namespace dispo
