#include "dispo/target_graph.h"

#include <ostream>

#include "boost/algorithm/string/predicate.hpp"

#include "utl/erase_if.h"
#include "utl/helpers/algorithm.h"

namespace dispo {

namespace {

std::optional<minutes_after_midnight_t> stop_time(stop const& s) {
  return s.arr_.has_value() ? s.arr_ : s.dep_;
}

target_type get_type(stop const& s, stop_flags const& f) {
  if (s.type_.has_value()) {
    return *s.type_;
  }
  return f.pass_through_ ? target_type::kPassThrough : target_type::kHalt;
}

// Replacement and splitting continue at the first stop of the partner.
// Coupling looks for the partner stop at the same location, preferably
// the one that is occupied at the given time.
std::optional<target_key> partner_key(
    target_edge_type const type,
    train const& partner,
    std::string_view plan,
    std::optional<minutes_after_midnight_t> const t) {
  auto const key = [&](stop const& s) -> std::optional<target_key> {
    auto const time = stop_time(s);
    if (!time.has_value()) {
      return std::nullopt;
    }
    return target_key{partner.id_, *time, s.plan_};
  };

  if (type != target_edge_type::kCoupling) {
    return partner.stops_.empty() ? std::nullopt : key(partner.stops_.front());
  }

  auto best = static_cast<stop const*>(nullptr);
  auto best_dist = duration_t::max();
  for (auto const& s : partner.stops_) {
    if (!boost::algorithm::iequals(s.plan_, plan)) {
      continue;
    }
    if (!t.has_value()) {
      return key(s);
    }

    auto const from = s.arr_.has_value() ? s.arr_ : s.dep_;
    auto const to = s.dep_.has_value() ? s.dep_ : s.arr_;
    if (from.has_value() && *from <= *t && *t <= *to) {
      return key(s);
    }

    if (from.has_value()) {
      auto const dist = *from > *t ? *from - *t : *t - *from;
      if (dist < best_dist) {
        best = &s;
        best_dist = dist;
      }
    }
  }

  return best == nullptr ? std::nullopt : key(*best);
}

}  // namespace

std::optional<target_idx_t> target_graph::find(target_key const& k) const {
  auto const it = key_to_node_.find(k);
  return it == end(key_to_node_) ? std::nullopt : std::optional{it->second};
}

std::pair<target_idx_t, bool> target_graph::add_node(target_node n) {
  if (auto const existing = find(n.key_); existing.has_value()) {
    return {*existing, false};
  }

  auto const idx = target_idx_t{nodes_.size()};
  key_to_node_.emplace(n.key_, idx);
  nodes_.emplace_back(std::move(n));
  out_.emplace_back();
  in_.emplace_back();
  return {idx, true};
}

std::optional<target_edge_idx_t> target_graph::find_edge(
    target_idx_t const from, target_idx_t const to) const {
  auto const it = utl::find_if(
      out_[from], [&](target_edge_idx_t const e) { return edges_[e].to_ == to; });
  return it == end(out_[from]) ? std::nullopt : std::optional{*it};
}

bool target_graph::add_edge(target_edge_type const type,
                            target_idx_t const from,
                            target_idx_t const to) {
  if (from == to || find_edge(from, to).has_value()) {
    return false;
  }
  auto const idx = target_edge_idx_t{edges_.size()};
  edges_.emplace_back(target_edge{type, from, to});
  out_[from].push_back(idx);
  in_[to].push_back(idx);
  return true;
}

std::optional<target_idx_t> target_graph::first(train_id_t const t) const {
  auto const it = train_first_.find(t);
  return it == end(train_first_) ? std::nullopt : std::optional{it->second};
}

std::optional<target_idx_t> target_graph::last(train_id_t const t) const {
  auto const it = train_last_.find(t);
  return it == end(train_last_) ? std::nullopt : std::optional{it->second};
}

vector<target_idx_t> target_graph::train_targets(train_id_t const t) const {
  auto ret = vector<target_idx_t>{};
  auto curr = first(t);
  while (curr.has_value() && ret.size() < nodes_.size()) {
    ret.push_back(*curr);
    auto const next = utl::find_if(out_[*curr], [&](target_edge_idx_t const e) {
      return edges_[e].type_ == target_edge_type::kPlanned &&
             nodes_[edges_[e].to_].train() == t;
    });
    curr = next == end(out_[*curr]) ? std::nullopt
                                    : std::optional{edges_[*next].to_};
  }
  return ret;
}

void target_graph::reset() {
  nodes_.clear();
  edges_.clear();
  out_.clear();
  in_.clear();
  key_to_node_.clear();
  train_first_.clear();
  train_last_.clear();
  pending_.clear();
}

vector<train_link> import_train(target_graph& tg,
                                train const& tr,
                                std::optional<std::string_view> entry,
                                std::optional<std::string_view> exit,
                                train_directory const& other_trains,
                                planning_params const& params,
                                problems& pb) {
  auto links = vector<train_link>{};
  auto chain = vector<target_idx_t>{};

  auto const add_link = [&](target_edge_type const type, target_idx_t const from,
                            train_id_t const partner, std::string_view plan,
                            std::optional<minutes_after_midnight_t> const t) {
    auto const it = other_trains.find(partner);
    if (it == end(other_trains)) {
      pb.add(problem_kind::kNotFound, "target_graph.import",
             "train {}: {} partner {} unknown", tr.id_, to_str(type), partner);
      return;
    }

    auto const k = partner_key(type, it->second, plan, t);
    auto const to = k.has_value() ? tg.find(*k) : std::nullopt;
    if (!to.has_value()) {
      log(log_lvl::debug, "target_graph.import",
          "train {}: {} link to {} pending", tr.id_, to_str(type), partner);
      if (utl::none_of(tg.pending_, [&](pending_link const& l) {
            return l.type_ == type && l.from_ == from && l.partner_ == partner;
          })) {
        tg.pending_.push_back(
            pending_link{type, from, partner, std::string{plan}, t});
      }
    } else {
      tg.add_edge(type, from, *to);
    }
    links.push_back(train_link{type, tr.id_, partner});
  };

  auto const first_time = [&]() -> std::optional<minutes_after_midnight_t> {
    for (auto const& s : tr.stops_) {
      if (auto const t = s.arr_.has_value() ? s.arr_ : s.dep_; t.has_value()) {
        return t;
      }
    }
    return std::nullopt;
  }();
  auto const last_time = [&]() -> std::optional<minutes_after_midnight_t> {
    for (auto it = tr.stops_.rbegin(); it != tr.stops_.rend(); ++it) {
      if (auto const t = it->dep_.has_value() ? it->dep_ : it->arr_;
          t.has_value()) {
        return t;
      }
    }
    return std::nullopt;
  }();

  if (entry.has_value() && !tr.visible_ && first_time.has_value()) {
    auto const t = *first_time - 1_minutes;
    chain.push_back(tg.add_node(target_node{.key_ = {tr.id_, kMinMinutes,
                                                     std::string{*entry}},
                                            .type_ = target_type::kEntry,
                                            .plan_ = std::string{*entry},
                                            .track_ = std::string{*entry},
                                            .p_arr_ = t,
                                            .p_dep_ = t})
                        .first);
  }

  for (auto const& s : tr.stops_) {
    auto const t = stop_time(s);
    if (!t.has_value()) {
      pb.add(problem_kind::kIncompleteData, "target_graph.import",
             "train {}: stop {} without planned time", tr.id_, s.plan_);
      continue;
    }

    auto const flags = parse_flags(s.flags_);
    auto const type = get_type(s, flags);
    auto const [idx, created] = tg.add_node(target_node{
        .key_ = {tr.id_, *t, s.plan_},
        .type_ = type,
        .plan_ = s.plan_,
        .track_ = std::string{s.track()},
        .p_arr_ = s.arr_,
        .p_dep_ = s.dep_,
        .min_dwell_ = s.min_dwell_.value_or(min_dwell(params, type, flags)),
        .flags_ = s.flags_});
    if (!created) {
      auto& n = tg.nodes_[idx];
      n.type_ = type;
      n.track_ = s.track();
      n.min_dwell_ = s.min_dwell_.value_or(min_dwell(params, type, flags));
      n.flags_ = s.flags_;
    }
    chain.push_back(idx);

    if (flags.replacement_.has_value()) {
      add_link(target_edge_type::kReplacement, idx, *flags.replacement_,
               s.plan_, s.arr_);
    }
    if (flags.coupling_.has_value()) {
      add_link(target_edge_type::kCoupling, idx, *flags.coupling_, s.plan_,
               s.arr_);
    }
    if (flags.splitting_.has_value()) {
      add_link(target_edge_type::kSplitting, idx, *flags.splitting_, s.plan_,
               s.arr_);
    }
  }

  if (exit.has_value() && last_time.has_value()) {
    auto const t = *last_time + 1_minutes;
    chain.push_back(tg.add_node(target_node{.key_ = {tr.id_, kMaxMinutes,
                                                     std::string{*exit}},
                                            .type_ = target_type::kExit,
                                            .plan_ = std::string{*exit},
                                            .track_ = std::string{*exit},
                                            .p_arr_ = t,
                                            .p_dep_ = t})
                        .first);
  }

  for (auto i = 1U; i < chain.size(); ++i) {
    tg.add_edge(target_edge_type::kPlanned, chain[i - 1U], chain[i]);
  }

  if (!chain.empty()) {
    tg.train_first_[tr.id_] = chain.front();
    tg.train_last_[tr.id_] = chain.back();
  }

  utl::erase_if(tg.pending_, [&](pending_link const& l) {
    if (l.partner_ != tr.id_) {
      return false;
    }
    auto const k = partner_key(l.type_, tr, l.plan_, l.time_);
    auto const to = k.has_value() ? tg.find(*k) : std::nullopt;
    if (to.has_value()) {
      tg.add_edge(l.type_, l.from_, *to);
    } else {
      pb.add(problem_kind::kNotFound, "target_graph.import",
             "train {}: no {} target at {} for train {}", tr.id_,
             to_str(l.type_), l.plan_, tg.nodes_[l.from_].train());
    }
    return true;
  });

  return links;
}

std::ostream& operator<<(std::ostream& out, target_node const& n) {
  auto const opt = [&](std::optional<minutes_after_midnight_t> const& t) {
    if (t.has_value()) {
      out << *t;
    } else {
      out << "-";
    }
  };
  out << n.train() << " " << to_str(n.type_) << " " << n.plan_ << " ";
  opt(n.p_arr_);
  out << "/";
  opt(n.p_dep_);
  if (n.delay_arr_.has_value() || n.delay_dep_.has_value()) {
    out << " delay=" << n.delay_arr_.value_or(duration_t{0}).count() << "/"
        << n.delay_dep_.value_or(duration_t{0}).count();
  }
  return out;
}

}  // namespace dispo
