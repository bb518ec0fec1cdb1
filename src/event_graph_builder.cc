#include "dispo/event_graph_builder.h"

#include <algorithm>
#include <ostream>
#include <map>
#include <set>
#include <tuple>

#include "cista/reflection/to_tuple.h"

#include "utl/enumerate.h"
#include "utl/erase_if.h"
#include "utl/helpers/algorithm.h"

#include "dispo/logging.h"
#include "dispo/scoped_timer.h"

namespace dispo {

std::ostream& operator<<(std::ostream& out, build_stats const& s) {
  return out << "builders: " << s.builders_
             << "\nnew events: " << s.new_events_
             << "\nupdated events: " << s.updated_events_
             << "\ndetached events: " << s.detached_events_
             << "\nnew edges: " << s.new_edges_
             << "\nremoved edges: " << s.removed_edges_
             << "\nskipped links: " << s.skipped_links_ << "\n";
}

build_stats& build_stats::operator+=(build_stats const& o) {
  auto const x = cista::to_tuple(*this);
  auto const y = cista::to_tuple(o);
  auto const add = [](auto& a, auto const b) { a += b; };
  std::apply(
      [&](auto&... a) {
        std::apply([&](auto const&... b) { (add(a, b), ...); }, y);
      },
      x);
  return *this;
}

namespace {

using pending_idx_t = cista::strong<std::uint32_t, struct _pending_idx>;

struct pending_node {
  train_id_t train_;
  event_kind kind_;
  target_idx_t target_;
  std::string plan_, track_;
  std::optional<minutes_after_midnight_t> planned_;
};

struct pending_edge {
  event_edge_type type_;
  pending_idx_t from_, to_;
  duration_t dt_min_{0};
};

// Events of one target in chain order, not yet committed.
struct node_builder {
  std::optional<pending_idx_t> find(
      vector_map<pending_idx_t, pending_node> const& nodes,
      event_kind const k) const {
    auto const it = utl::find_if(
        nodes_, [&](pending_idx_t const p) { return nodes[p].kind_ == k; });
    return it == end(nodes_) ? std::nullopt : std::optional{*it};
  }

  bool train_start_{false};
  vector<pending_idx_t> nodes_;
};

struct translation {
  translation(target_graph const& tg,
              planning_params const& params,
              problems& pb)
      : tg_{tg}, params_{params}, pb_{pb} {}

  pending_idx_t add_node(pending_node n) {
    auto const idx = pending_idx_t{nodes_.size()};
    nodes_.emplace_back(std::move(n));
    return idx;
  }

  void add_edge(event_edge_type const type,
                pending_idx_t const from,
                pending_idx_t const to,
                duration_t const dt_min) {
    edges_.push_back(pending_edge{type, from, to, dt_min});
  }

  void remove_edge(pending_idx_t const from, pending_idx_t const to) {
    utl::erase_if(edges_, [&](pending_edge const& e) {
      return e.from_ == from && e.to_ == to;
    });
  }

  void remove_node(node_builder& b, pending_idx_t const n) {
    utl::erase_if(b.nodes_, [&](pending_idx_t const p) { return p == n; });
    utl::erase_if(edges_, [&](pending_edge const& e) {
      return e.from_ == n || e.to_ == n;
    });
  }

  std::optional<pending_idx_t> get(target_idx_t const t, event_kind const k) {
    return builders_[t].find(nodes_, k);
  }

  void create_builders() {
    for (auto i = 0U; i != tg_.nodes_.size(); ++i) {
      auto const t = target_idx_t{i};
      auto const& n = tg_.nodes_[t];
      auto& b = builders_.emplace_back();
      b.train_start_ = utl::none_of(tg_.in_[t], [&](target_edge_idx_t const e) {
        auto const& edge = tg_.edges_[e];
        return (edge.type_ == target_edge_type::kPlanned ||
                edge.type_ == target_edge_type::kShunt) &&
               tg_.nodes_[edge.from_].train() == n.train();
      });

      auto const make = [&](event_kind const k) {
        auto const planned = k == event_kind::kArrival
                                 ? (n.p_arr_.has_value() ? n.p_arr_ : n.p_dep_)
                                 : (n.p_dep_.has_value() ? n.p_dep_ : n.p_arr_);
        return add_node(pending_node{n.train(), k, t, n.plan_, n.track_, planned});
      };

      switch (n.type_) {
        case target_type::kEntry:
          b.nodes_.push_back(make(event_kind::kDeparture));
          break;
        case target_type::kExit:
          b.nodes_.push_back(make(event_kind::kArrival));
          break;
        default: {
          auto const arr = make(event_kind::kArrival);
          auto const dep = make(event_kind::kDeparture);
          b.nodes_.push_back(arr);
          b.nodes_.push_back(dep);
          add_edge(event_edge_type::kHold, arr, dep, n.min_dwell_);
        }
      }
    }
  }

  void skip(target_edge const& e, std::string_view reason) {
    ++stats_.skipped_links_;
    pb_.add(problem_kind::kIncompleteData, "event_graph.build",
            "{} link {} -> {}: {}", to_str(e.type_),
            tg_.nodes_[e.from_].train(), tg_.nodes_[e.to_].train(), reason);
  }

  // An1 -E-> E -H-> Ab2, Ab1 and An2 are dropped.
  void replace(target_edge const& e) {
    auto const an1 = get(e.from_, event_kind::kArrival);
    auto const ab2 = get(e.to_, event_kind::kDeparture);
    if (!an1.has_value() || !ab2.has_value()) {
      skip(e, "no arrival/departure");
      return;
    }

    auto& b1 = builders_[e.from_];
    auto& b2 = builders_[e.to_];
    if (auto const ab1 = get(e.from_, event_kind::kDeparture); ab1.has_value()) {
      remove_node(b1, *ab1);
    }
    if (auto const an2 = get(e.to_, event_kind::kArrival); an2.has_value()) {
      remove_node(b2, *an2);
    }

    auto const& t1 = tg_.nodes_[e.from_];
    auto const x = add_node(pending_node{t1.train(), event_kind::kReplacement,
                                         e.from_, t1.plan_, t1.track_,
                                         nodes_[*ab2].planned_});
    b1.nodes_.push_back(x);
    add_edge(event_edge_type::kReplacement, *an1, x, t1.min_dwell_);
    add_edge(event_edge_type::kHold, x, *ab2, duration_t{0});
  }

  // An1 -F-> F -H-> Ab1, F -H-> Ab2, An2 is dropped.
  void split(target_edge const& e) {
    auto const an1 = get(e.from_, event_kind::kArrival);
    auto const ab2 = get(e.to_, event_kind::kDeparture);
    if (!an1.has_value() || !ab2.has_value()) {
      skip(e, "no arrival/departure");
      return;
    }

    auto& b1 = builders_[e.from_];
    auto const& t1 = tg_.nodes_[e.from_];
    auto f = get(e.from_, event_kind::kSplitting);
    if (!f.has_value()) {
      auto const planned =
          nodes_[*an1].planned_.has_value()
              ? std::optional{*nodes_[*an1].planned_ + t1.min_dwell_}
              : std::nullopt;
      f = add_node(pending_node{t1.train(), event_kind::kSplitting, e.from_,
                                t1.plan_, t1.track_, planned});
      auto nodes = vector<pending_idx_t>{};
      for (auto const p : b1.nodes_) {
        nodes.push_back(p);
        if (p == *an1) {
          nodes.push_back(*f);
        }
      }
      b1.nodes_ = std::move(nodes);
      add_edge(event_edge_type::kSplitting, *an1, *f, t1.min_dwell_);
      if (auto const ab1 = get(e.from_, event_kind::kDeparture);
          ab1.has_value()) {
        remove_edge(*an1, *ab1);
        add_edge(event_edge_type::kHold, *f, *ab1, duration_t{0});
      }
    }

    if (auto const an2 = get(e.to_, event_kind::kArrival); an2.has_value()) {
      remove_node(builders_[e.to_], *an2);
    }
    add_edge(event_edge_type::kHold, *f, *ab2, duration_t{0});
  }

  // An1 -K-> K, An2 -H-> K -H-> Ab2, Ab1 is dropped.
  // Several trains coupling to the same train are chained by planned time.
  void couple(target_idx_t const t2, vector<target_edge> const& edges) {
    auto& b2 = builders_[t2];
    auto const& n2 = tg_.nodes_[t2];
    auto const an2 = get(t2, event_kind::kArrival);
    auto const ab2 = get(t2, event_kind::kDeparture);
    auto const an2_dwell =
        an2.has_value() && nodes_[*an2].planned_.has_value()
            ? std::optional{*nodes_[*an2].planned_ + n2.min_dwell_}
            : std::nullopt;

    auto ks = vector<pending_idx_t>{};
    for (auto const& e : edges) {
      auto const an1 = get(e.from_, event_kind::kArrival);
      if (!an1.has_value()) {
        skip(e, "no arrival");
        continue;
      }
      if (auto const ab1 = get(e.from_, event_kind::kDeparture);
          ab1.has_value()) {
        remove_node(builders_[e.from_], *ab1);
      }

      auto const& t1 = tg_.nodes_[e.from_];
      auto const an1_dwell =
          nodes_[*an1].planned_.has_value()
              ? std::optional{*nodes_[*an1].planned_ + t1.min_dwell_}
              : std::nullopt;
      auto const planned =
          an1_dwell.has_value() && an2_dwell.has_value()
              ? std::optional{std::max(*an1_dwell, *an2_dwell)}
              : (an1_dwell.has_value() ? an1_dwell : an2_dwell);

      auto const k = add_node(pending_node{n2.train(), event_kind::kCoupling,
                                           e.from_, n2.plan_, n2.track_,
                                           planned});
      add_edge(event_edge_type::kCoupling, *an1, k, t1.min_dwell_);
      ks.push_back(k);
    }

    if (ks.empty()) {
      return;
    }

    utl::sort(ks, [&](pending_idx_t const a, pending_idx_t const b) {
      return nodes_[a].planned_ < nodes_[b].planned_;
    });

    if (an2.has_value() && ab2.has_value()) {
      remove_edge(*an2, *ab2);
    }
    if (an2.has_value()) {
      add_edge(event_edge_type::kHold, *an2, ks.front(), n2.min_dwell_);
    }
    for (auto i = 1U; i < ks.size(); ++i) {
      add_edge(event_edge_type::kHold, ks[i - 1U], ks[i], duration_t{0});
    }
    if (ab2.has_value()) {
      add_edge(event_edge_type::kHold, ks.back(), *ab2, duration_t{0});
    }

    auto nodes = vector<pending_idx_t>{};
    auto const append_ks = [&]() {
      for (auto const k : ks) {
        nodes.push_back(k);
      }
    };
    for (auto const p : b2.nodes_) {
      if (ab2.has_value() && p == *ab2) {
        append_ks();
      }
      nodes.push_back(p);
    }
    if (!ab2.has_value()) {
      append_ks();
    }
    b2.nodes_ = std::move(nodes);
  }

  void apply_operations() {
    auto couplings = std::map<target_idx_t, vector<target_edge>>{};
    for (auto const& e : tg_.edges_) {
      switch (e.type_) {
        case target_edge_type::kReplacement: replace(e); break;
        case target_edge_type::kSplitting: split(e); break;
        case target_edge_type::kCoupling:
          couplings[e.to_].push_back(e);
          break;
        default: break;
      }
    }
    for (auto const& [t2, edges] : couplings) {
      couple(t2, edges);
    }
  }

  void connect() {
    for (auto const& e : tg_.edges_) {
      auto const& b1 = builders_[e.from_];
      auto const& b2 = builders_[e.to_];
      if (b1.nodes_.empty() || b2.nodes_.empty()) {
        continue;
      }

      switch (e.type_) {
        case target_edge_type::kPlanned: [[fallthrough]];
        case target_edge_type::kShunt: {
          auto const from = b1.nodes_.back();
          auto const to = b2.nodes_.front();
          auto const& t0 = nodes_[from].planned_;
          auto const& t1 = nodes_[to].planned_;
          add_edge(event_edge_type::kPlanned, from, to,
                   t0.has_value() && t1.has_value()
                       ? std::max(duration_t{0}, *t1 - *t0)
                       : params_.default_travel_);
          break;
        }

        case target_edge_type::kDependency:
          if (auto const to = get(e.to_, event_kind::kDeparture);
              to.has_value()) {
            add_edge(event_edge_type::kDependency, b1.nodes_.back(), *to,
                     duration_t{0});
          }
          break;

        default: break;
      }
    }
  }

  void commit(event_graph& eg) {
    auto mapping = vector_map<pending_idx_t, std::optional<event_idx_t>>{};
    mapping.resize(nodes_.size());

    for (auto const [i, b] : utl::enumerate(builders_)) {
      auto const t = target_idx_t{i};
      auto const& target = tg_.nodes_[t];
      ++stats_.builders_;

      for (auto const [j, p] : utl::enumerate(b.nodes_)) {
        auto const& n = nodes_[p];
        auto const is_start = b.train_start_ && j == 0U;
        auto const delay = n.kind_ == event_kind::kArrival
                               ? target.delay_arr_
                               : target.delay_dep_;
        auto const predicted =
            !is_operation(n.kind_) && n.planned_.has_value() &&
                    delay.has_value()
                ? std::optional{*n.planned_ + *delay}
                : std::nullopt;
        auto const existing = eg.find(n.train_, n.target_, n.kind_);
        if (existing.has_value()) {
          auto& x = eg.nodes_[*existing];
          x.plan_ = n.plan_;
          x.track_ = n.track_;
          x.planned_ = n.planned_;
          if (predicted.has_value()) {
            x.predicted_ = predicted;
          }
          if (is_start) {
            eg.make_start(*existing);
          }
          mapping[p] = *existing;
          ++stats_.updated_events_;
        } else {
          mapping[p] = eg.add_node(
              event_node{.train_ = n.train_,
                         .kind_ = n.kind_,
                         .target_ = n.target_,
                         .plan_ = n.plan_,
                         .track_ = n.track_,
                         .planned_ = n.planned_,
                         .predicted_ = predicted},
              is_start);
          ++stats_.new_events_;
        }
      }

      for (auto const k : {event_kind::kArrival, event_kind::kDeparture,
                           event_kind::kReplacement, event_kind::kSplitting}) {
        auto const stale = eg.find(target.train(), t, k);
        if (stale.has_value() &&
            utl::none_of(b.nodes_, [&](pending_idx_t const p) {
              return mapping[p] == stale;
            })) {
          log(log_lvl::debug, "event_graph.build", "detach {}",
              eg.node_info(*stale));
          eg.detach(*stale);
          ++stats_.detached_events_;
        }
      }
    }

    auto wanted = std::set<std::pair<event_idx_t, event_idx_t>>{};
    for (auto const& e : edges_) {
      if (mapping[e.from_].has_value() && mapping[e.to_].has_value()) {
        wanted.emplace(*mapping[e.from_], *mapping[e.to_]);
      }
    }

    for (auto const& m : mapping) {
      if (!m.has_value()) {
        continue;
      }
      auto const outgoing = eg.out_[*m];
      for (auto const out : outgoing) {
        auto const& edge = eg.edges_[out];
        if (edge.type_ != event_edge_type::kDependency &&
            !wanted.contains({edge.from_, edge.to_})) {
          eg.remove_edge(out);
          ++stats_.removed_edges_;
        }
      }
    }

    for (auto const& e : edges_) {
      if (!mapping[e.from_].has_value() || !mapping[e.to_].has_value()) {
        continue;
      }
      auto const from = *mapping[e.from_];
      auto const to = *mapping[e.to_];
      if (auto const existing = eg.find_edge(from, to); existing.has_value()) {
        auto& x = eg.edges_[*existing];
        x.type_ = e.type_;
        x.dt_min_ = e.dt_min_;
      } else {
        eg.add_edge(event_edge{.type_ = e.type_,
                               .from_ = from,
                               .to_ = to,
                               .dt_min_ = e.dt_min_});
        ++stats_.new_edges_;
      }
    }
  }

  target_graph const& tg_;
  planning_params const& params_;
  problems& pb_;
  build_stats stats_;

  vector_map<pending_idx_t, pending_node> nodes_;
  vector<pending_edge> edges_;
  vector_map<target_idx_t, node_builder> builders_;
};

}  // namespace

build_stats build_event_graph(target_graph const& tg,
                              event_graph& eg,
                              planning_params const& params,
                              problems& pb,
                              bool const clean) {
  auto const timer = scoped_timer{"event_graph.build"};

  if (clean) {
    eg.reset();
  }

  auto t = translation{tg, params, pb};
  t.create_builders();
  t.apply_operations();
  t.connect();
  t.commit(eg);

  log(log_lvl::info, "event_graph.build",
      "{} targets -> {} events ({} new, {} detached)", tg.n_nodes(),
      eg.n_nodes(), t.stats_.new_events_, t.stats_.detached_events_);
  return t.stats_;
}

}  // namespace dispo
