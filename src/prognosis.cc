#include "dispo/prognosis.h"

#include <algorithm>
#include <functional>
#include <ostream>
#include <queue>

#include "utl/helpers/algorithm.h"

#include "dispo/logging.h"
#include "dispo/scoped_timer.h"

namespace dispo {

std::ostream& operator<<(std::ostream& out, prognosis_stats const& s) {
  return out << "broken cycles: " << s.broken_cycles_
             << "\nmeasured: " << s.measured_
             << "\npredicted: " << s.predicted_
             << "\nunavailable: " << s.unavailable_ << "\n";
}

namespace {

enum class color : std::uint8_t { kWhite, kGrey, kBlack };

// Iterative DFS. Returns the edges of the first cycle found, in order.
vector<event_edge_idx_t> find_cycle(event_graph const& eg) {
  auto state = vector_map<event_idx_t, color>{};
  state.resize(eg.nodes_.size(), color::kWhite);

  struct frame {
    event_idx_t node_;
    std::uint32_t next_out_{0U};
  };

  auto stack = vector<frame>{};
  auto via = vector<event_edge_idx_t>{};

  for (auto i = 0U; i != eg.nodes_.size(); ++i) {
    auto const root = event_idx_t{i};
    if (state[root] != color::kWhite) {
      continue;
    }

    state[root] = color::kGrey;
    stack.push_back(frame{root});
    while (!stack.empty()) {
      auto& f = stack.back();
      auto const& out = eg.out_[f.node_];
      if (f.next_out_ == out.size()) {
        state[f.node_] = color::kBlack;
        stack.pop_back();
        if (!via.empty()) {
          via.pop_back();
        }
        continue;
      }

      auto const e = out[f.next_out_++];
      auto const to = eg.edges_[e].to_;
      if (state[to] == color::kGrey) {
        auto cycle = vector<event_edge_idx_t>{};
        auto const start = utl::find_if(stack, [&](frame const& x) {
          return x.node_ == to;
        });
        auto const offset =
            static_cast<std::size_t>(std::distance(begin(stack), start));
        for (auto j = offset; j < via.size(); ++j) {
          cycle.push_back(via[j]);
        }
        cycle.push_back(e);
        return cycle;
      } else if (state[to] == color::kWhite) {
        state[to] = color::kGrey;
        via.push_back(e);
        stack.push_back(frame{to});
      }
    }
  }

  return {};
}

}  // namespace

std::uint32_t break_cycles(event_graph& eg, problems& pb) {
  auto n = 0U;
  for (auto cycle = find_cycle(eg); !cycle.empty(); cycle = find_cycle(eg)) {
    auto const crossing = utl::find_if(cycle, [&](event_edge_idx_t const e) {
      auto const& edge = eg.edges_[e];
      return eg.nodes_[edge.from_].train_ != eg.nodes_[edge.to_].train_;
    });
    auto const victim = crossing != end(cycle) ? *crossing : cycle.back();

    auto path = std::string{};
    for (auto const e : cycle) {
      path += eg.node_info(eg.edges_[e].from_);
      path += " -> ";
    }
    path += eg.node_info(eg.edges_[cycle.back()].to_);

    pb.add(problem_kind::kCycleDetected, "prognose",
           "cycle [{}], removing {}", path, eg.edge_info(victim));
    eg.remove_edge(victim);
    ++n;
  }
  return n;
}

vector<event_idx_t> topological_order(event_graph const& eg) {
  auto in_degree = vector_map<event_idx_t, std::uint32_t>{};
  in_degree.resize(eg.nodes_.size());
  for (auto i = 0U; i != eg.nodes_.size(); ++i) {
    in_degree[event_idx_t{i}] =
        static_cast<std::uint32_t>(eg.in_[event_idx_t{i}].size());
  }

  auto pq = std::priority_queue<std::uint32_t, std::vector<std::uint32_t>,
                                std::greater<>>{};
  for (auto i = 0U; i != eg.nodes_.size(); ++i) {
    if (in_degree[event_idx_t{i}] == 0U) {
      pq.push(i);
    }
  }

  auto order = vector<event_idx_t>{};
  order.reserve(eg.nodes_.size());
  while (!pq.empty()) {
    auto const e = event_idx_t{pq.top()};
    pq.pop();
    order.push_back(e);
    for (auto const out : eg.out_[e]) {
      auto const to = eg.edges_[out].to_;
      if (--in_degree[to] == 0U) {
        pq.push(to_idx(to));
      }
    }
  }
  return order;
}

prognosis_stats prognose(event_graph& eg, problems& pb) {
  auto const timer = scoped_timer{"prognose"};

  auto stats = prognosis_stats{};
  stats.broken_cycles_ = break_cycles(eg, pb);

  for (auto const e : topological_order(eg)) {
    auto& n = eg.nodes_[e];
    if (eg.is_detached(e)) {
      continue;
    }
    if (n.measured_.has_value()) {
      ++stats.measured_;
      continue;
    }

    auto zeit_min = std::optional<minutes_after_midnight_t>{};
    auto zeit_max = std::optional<minutes_after_midnight_t>{};
    for (auto const in : eg.in_[e]) {
      auto const& edge = eg.edges_[in];
      auto const pred = eg.nodes_[edge.from_].effective();
      if (!pred.has_value()) {
        continue;
      }

      auto const fdl = edge.dt_fdl_.value_or(duration_t{0});
      auto const lower =
          *pred + edge.dt_min_ + std::max(duration_t{0}, fdl);
      zeit_min = zeit_min.has_value() ? std::max(*zeit_min, lower) : lower;

      if (edge.dt_max_.has_value()) {
        auto const upper =
            *pred + *edge.dt_max_ + std::min(duration_t{0}, fdl);
        zeit_max = zeit_max.has_value() ? std::min(*zeit_max, upper) : upper;
      }
    }

    auto t = std::optional<minutes_after_midnight_t>{};
    if (n.seq_ == 0U && eg.in_[e].empty()) {
      t = n.effective();
    } else if (n.kind_ == event_kind::kDeparture) {
      t = n.planned_;
    }
    if (t.has_value() && zeit_max.has_value()) {
      t = std::min(*t, *zeit_max);
    }
    if (zeit_min.has_value()) {
      t = t.has_value() ? std::max(*t, *zeit_min) : *zeit_min;
    }

    if (t.has_value()) {
      n.predicted_ = t;
      ++stats.predicted_;
    } else {
      pb.add(problem_kind::kPrognosisUnavailable, "prognose",
             "no prognosis possible for {}", eg.node_info(e));
      ++stats.unavailable_;
    }
  }

  log(log_lvl::info, "prognose", "{} predicted, {} measured, {} unavailable",
      stats.predicted_, stats.measured_, stats.unavailable_);
  return stats;
}

}  // namespace dispo
