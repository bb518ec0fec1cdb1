#include "dispo/event_graph.h"

#include <ostream>
#include <sstream>

#include "fmt/format.h"
#include "fmt/ostream.h"

#include "utl/erase_if.h"
#include "utl/helpers/algorithm.h"
#include "utl/verify.h"

namespace dispo {

namespace {

std::string fmt_time(std::optional<minutes_after_midnight_t> const& t) {
  if (!t.has_value()) {
    return "-";
  }
  auto ss = std::stringstream{};
  ss << *t;
  return ss.str();
}

bool is_link(event_edge_type const t) {
  return t != event_edge_type::kDependency;
}

}  // namespace

std::optional<event_idx_t> event_graph::find(train_id_t const t,
                                             seq_t const seq) const {
  auto const it = key_to_node_.find({t, seq});
  return it == end(key_to_node_) ? std::nullopt : std::optional{it->second};
}

std::optional<event_idx_t> event_graph::find(train_id_t const t,
                                             target_idx_t const target,
                                             event_kind const k) const {
  auto const it = target_to_node_.find({t, target, k});
  return it == end(target_to_node_) ? std::nullopt
                                    : std::optional{it->second};
}

event_idx_t event_graph::add_node(event_node n, bool const train_start) {
  auto const idx = event_idx_t{nodes_.size()};
  n.seq_ = next_seq_++;
  key_to_node_.emplace(std::pair{n.train_, n.seq_}, idx);
  if (n.target_.has_value()) {
    target_to_node_.emplace(std::tuple{n.train_, *n.target_, n.kind_}, idx);
  }
  nodes_.emplace_back(std::move(n));
  out_.emplace_back();
  in_.emplace_back();
  if (train_start) {
    make_start(idx);
  }
  return idx;
}

void event_graph::make_start(event_idx_t const e) {
  auto& n = nodes_[e];
  if (n.seq_ == 0U) {
    return;
  }

  if (auto const prev = start(n.train_); prev.has_value()) {
    auto const seq = next_seq_++;
    nodes_[*prev].seq_ = seq;
    key_to_node_[{n.train_, seq}] = *prev;
  }

  key_to_node_.erase({n.train_, n.seq_});
  n.seq_ = 0U;
  key_to_node_[{n.train_, 0U}] = e;
}

void event_graph::detach(event_idx_t const e) {
  while (!out_[e].empty()) {
    remove_edge(out_[e].back());
  }
  while (!in_[e].empty()) {
    remove_edge(in_[e].back());
  }

  auto& n = nodes_[e];
  if (n.target_.has_value()) {
    target_to_node_.erase({n.train_, *n.target_, n.kind_});
    n.target_ = std::nullopt;
  }
  n.detached_ = true;
}

std::optional<event_edge_idx_t> event_graph::find_edge(
    event_idx_t const from, event_idx_t const to) const {
  auto const it = utl::find_if(
      out_[from], [&](event_edge_idx_t const e) { return edges_[e].to_ == to; });
  return it == end(out_[from]) ? std::nullopt : std::optional{*it};
}

event_edge_idx_t event_graph::add_edge(event_edge e) {
  utl::verify(e.from_ != e.to_, "event_graph: self loop at {}",
              node_info(e.from_));
  auto const idx = event_edge_idx_t{edges_.size()};
  out_[e.from_].push_back(idx);
  in_[e.to_].push_back(idx);
  edges_.emplace_back(e);
  return idx;
}

void event_graph::remove_edge(event_edge_idx_t const e) {
  auto const& edge = edges_[e];
  auto const is_e = [&](event_edge_idx_t const x) { return x == e; };
  utl::erase_if(out_[edge.from_], is_e);
  utl::erase_if(in_[edge.to_], is_e);
}

std::optional<event_idx_t> event_graph::successor(
    event_idx_t const e, bool const follow_links) const {
  auto const t = nodes_[e].train_;
  auto link = std::optional<event_idx_t>{};
  for (auto const out : out_[e]) {
    auto const& edge = edges_[out];
    if (!is_link(edge.type_)) {
      continue;
    }
    if (nodes_[edge.to_].train_ == t) {
      return edge.to_;
    }
    if (!link.has_value()) {
      link = edge.to_;
    }
  }
  return follow_links ? link : std::nullopt;
}

std::optional<event_idx_t> event_graph::predecessor(
    event_idx_t const e, bool const follow_links) const {
  auto const t = nodes_[e].train_;
  auto link = std::optional<event_idx_t>{};
  for (auto const in : in_[e]) {
    auto const& edge = edges_[in];
    if (!is_link(edge.type_)) {
      continue;
    }
    if (nodes_[edge.from_].train_ == t) {
      return edge.from_;
    }
    if (!link.has_value()) {
      link = edge.from_;
    }
  }
  return follow_links ? link : std::nullopt;
}

std::optional<event_idx_t> event_graph::next_event(
    event_idx_t const e,
    std::optional<event_kind> const kind,
    bool const follow_links) const {
  auto curr = successor(e, follow_links);
  for (auto i = 0U; curr.has_value() && i != nodes_.size(); ++i) {
    if (!kind.has_value() || nodes_[*curr].kind_ == *kind) {
      return curr;
    }
    curr = successor(*curr, follow_links);
  }
  return std::nullopt;
}

std::optional<event_idx_t> event_graph::prev_event(
    event_idx_t const e,
    std::optional<event_kind> const kind,
    bool const follow_links) const {
  auto curr = predecessor(e, follow_links);
  for (auto i = 0U; curr.has_value() && i != nodes_.size(); ++i) {
    if (!kind.has_value() || nodes_[*curr].kind_ == *kind) {
      return curr;
    }
    curr = predecessor(*curr, follow_links);
  }
  return std::nullopt;
}

vector<event_idx_t> event_graph::train_path(train_id_t const t,
                                            bool const follow_links) const {
  auto path = vector<event_idx_t>{};
  auto curr = start(t);
  while (curr.has_value() && path.size() != nodes_.size()) {
    path.push_back(*curr);
    curr = successor(*curr, follow_links);
  }
  return path;
}

std::string event_graph::node_info(event_idx_t const e) const {
  auto const& n = nodes_[e];
  return fmt::format("{}/{} {} {} {}", n.train_, n.seq_, to_str(n.kind_),
                     n.plan_, fmt_time(n.planned_));
}

std::string event_graph::edge_info(event_edge_idx_t const e) const {
  auto const& edge = edges_[e];
  return fmt::format(
      "{} -{}({}{}{})-> {}", node_info(edge.from_), to_str(edge.type_),
      edge.dt_min_.count(),
      edge.dt_max_.has_value() ? fmt::format("..{}", edge.dt_max_->count())
                               : "",
      edge.dt_fdl_.has_value() ? fmt::format(" fdl={}", edge.dt_fdl_->count())
                               : "",
      node_info(edge.to_));
}

void event_graph::reset() {
  nodes_.clear();
  edges_.clear();
  out_.clear();
  in_.clear();
  key_to_node_.clear();
  target_to_node_.clear();
  next_seq_ = 1U;
}

std::ostream& operator<<(std::ostream& out, printable_path const& p) {
  for (auto const e : p.eg_.train_path(p.train_, p.follow_links_)) {
    auto const& n = p.eg_.nodes_[e];
    out << fmt::format("{:>4}/{:<3} {:<2} {:<10} plan={} pred={} meas={}\n",
                       n.train_, n.seq_, to_str(n.kind_), n.plan_,
                       fmt_time(n.planned_), fmt_time(n.predicted_),
                       fmt_time(n.measured_));
  }
  return out;
}

}  // namespace dispo
