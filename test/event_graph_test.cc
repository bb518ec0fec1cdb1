#include "gtest/gtest.h"

#include "dispo/engine.h"
#include "dispo/event_graph_builder.h"

#include "./util.h"

using namespace dispo;
using namespace dispo::test;

TEST(event_graph, chain_of_halts) {
  auto e = engine{};
  auto const trains = std::vector<train>{
      make_train(1, {make_stop("A", hm(8, 0), hm(8, 1)),
                     make_stop("B", hm(8, 10), hm(8, 11)),
                     make_stop("C", hm(8, 20), hm(8, 21))})};
  e.import(trains);
  e.build();

  EXPECT_TRUE(e.problems_.empty());
  EXPECT_EQ(6U, e.eg_.n_nodes());
  EXPECT_EQ(2U, count_edges(e.eg_, event_edge_type::kPlanned));
  EXPECT_EQ(3U, count_edges(e.eg_, event_edge_type::kHold));
  EXPECT_EQ(5U, count_edges(e.eg_));

  auto const path = e.eg_.train_path(1);
  ASSERT_EQ(6U, path.size());
  EXPECT_EQ(0U, e.eg_.nodes_[path[0]].seq_);
  for (auto i = 0U; i != path.size(); ++i) {
    EXPECT_EQ(i % 2 == 0 ? event_kind::kArrival : event_kind::kDeparture,
              e.eg_.nodes_[path[i]].kind_);
  }

  // Travel time from planned times.
  auto const p = e.eg_.find_edge(path[1], path[2]);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(duration_t{9}, e.eg_.edges_[*p].dt_min_);
  EXPECT_FALSE(e.eg_.edges_[*p].dt_max_.has_value());
}

TEST(event_graph, entry_and_exit) {
  auto e = engine{};
  auto t = make_train(1, {make_stop("A", hm(8, 0), hm(8, 1)),
                          make_stop("B", hm(8, 10), hm(8, 11))},
                      false);
  t.entry_ = "West";
  t.exit_ = "Ost";
  e.import(std::vector<train>{t});
  e.build();

  auto const path = e.eg_.train_path(1);
  ASSERT_EQ(6U, path.size());
  EXPECT_EQ(event_kind::kDeparture, e.eg_.nodes_[path.front()].kind_);
  EXPECT_EQ("West", e.eg_.nodes_[path.front()].plan_);
  EXPECT_EQ(hm(7, 59), e.eg_.nodes_[path.front()].planned_);
  EXPECT_EQ(event_kind::kArrival, e.eg_.nodes_[path.back()].kind_);
  EXPECT_EQ("Ost", e.eg_.nodes_[path.back()].plan_);
  EXPECT_EQ(hm(8, 12), e.eg_.nodes_[path.back()].planned_);
  EXPECT_EQ(3U, count_edges(e.eg_, event_edge_type::kPlanned));
  EXPECT_EQ(2U, count_edges(e.eg_, event_edge_type::kHold));
}

TEST(event_graph, rebuild_keeps_events) {
  auto e = engine{};
  auto const trains = std::vector<train>{
      make_train(1, {make_stop("A", hm(8, 0), hm(8, 1)),
                     make_stop("B", hm(8, 10), hm(8, 11))})};
  e.import(trains);
  e.build();

  auto const an = get_event(e, 1, hm(8, 10), "B", event_kind::kArrival);
  ASSERT_TRUE(an.has_value());
  e.eg_.nodes_[*an].measured_ = hm(8, 12);

  auto const stats = e.build();
  EXPECT_EQ(0U, stats.new_events_);
  EXPECT_EQ(4U, stats.updated_events_);
  EXPECT_EQ(0U, stats.new_edges_);
  EXPECT_EQ(4U, e.eg_.n_nodes());
  EXPECT_EQ(3U, count_edges(e.eg_));
  EXPECT_EQ(hm(8, 12), e.eg_.nodes_[*an].measured_);

  e.build(true);
  EXPECT_EQ(4U, e.eg_.n_nodes());
  auto const fresh = get_event(e, 1, hm(8, 10), "B", event_kind::kArrival);
  ASSERT_TRUE(fresh.has_value());
  EXPECT_FALSE(e.eg_.nodes_[*fresh].measured_.has_value());
}

TEST(event_graph, replacement) {
  auto e = engine{};
  auto const trains = std::vector<train>{
      make_train(1, {make_stop("A", hm(8, 0), hm(8, 2)),
                     make_stop("B", hm(8, 10), hm(8, 15), "E(2)")}),
      make_train(2, {make_stop("B", std::nullopt, hm(8, 15)),
                     make_stop("C", hm(8, 25), hm(8, 26))})};
  e.import(trains);
  e.build();
  EXPECT_TRUE(e.problems_.empty());

  ASSERT_EQ(1U, count_events(e.eg_, event_kind::kReplacement));
  auto const an1 = get_event(e, 1, hm(8, 10), "B", event_kind::kArrival);
  auto const x = get_event(e, 1, hm(8, 10), "B", event_kind::kReplacement);
  auto const ab2 = get_event(e, 2, hm(8, 15), "B", event_kind::kDeparture);
  ASSERT_TRUE(an1.has_value());
  ASSERT_TRUE(x.has_value());
  ASSERT_TRUE(ab2.has_value());

  EXPECT_FALSE(
      get_event(e, 1, hm(8, 10), "B", event_kind::kDeparture).has_value());
  EXPECT_FALSE(
      get_event(e, 2, hm(8, 15), "B", event_kind::kArrival).has_value());

  ASSERT_EQ(1U, e.eg_.in_[*x].size());
  ASSERT_EQ(1U, e.eg_.out_[*x].size());
  auto const& in = e.eg_.edges_[e.eg_.in_[*x].front()];
  auto const& out = e.eg_.edges_[e.eg_.out_[*x].front()];
  EXPECT_EQ(*an1, in.from_);
  EXPECT_EQ(event_edge_type::kReplacement, in.type_);
  EXPECT_EQ(duration_t{1}, in.dt_min_);
  EXPECT_EQ(*ab2, out.to_);
  EXPECT_EQ(event_edge_type::kHold, out.type_);

  EXPECT_EQ(hm(8, 15), e.eg_.nodes_[*x].planned_);
  EXPECT_EQ(1, e.eg_.nodes_[*x].train_);
  EXPECT_EQ(0U, e.eg_.nodes_[*ab2].seq_);

  EXPECT_EQ(4U, e.eg_.train_path(1).size());
  EXPECT_EQ(3U, e.eg_.train_path(2).size());
  EXPECT_EQ(7U, e.eg_.train_path(1, true).size());

  // Walking backwards from the successor train.
  EXPECT_FALSE(e.eg_.prev_event(*ab2, event_kind::kArrival, false).has_value());
  EXPECT_EQ(*an1, e.eg_.prev_event(*ab2, event_kind::kArrival, true));
  EXPECT_EQ(*x, e.eg_.prev_event(*ab2, std::nullopt, true));
  EXPECT_EQ(*ab2, e.eg_.next_event(*an1, event_kind::kDeparture, true));
  EXPECT_FALSE(
      e.eg_.next_event(*an1, event_kind::kDeparture, false).has_value());
}

TEST(event_graph, coupling) {
  auto e = engine{};
  auto const trains = std::vector<train>{
      make_train(4, {make_stop("1", hm(11, 0), hm(11, 2)),
                     make_stop("3", hm(11, 10), std::nullopt, "K(5)",
                               duration_t{0})}),
      make_train(5, {make_stop("2", hm(11, 4), hm(11, 6)),
                     make_stop("3", hm(11, 14), hm(11, 18), "", duration_t{2}),
                     make_stop("4", hm(11, 30), hm(11, 31))})};
  e.import(trains);
  e.build();
  EXPECT_TRUE(e.problems_.empty());

  ASSERT_EQ(1U, count_events(e.eg_, event_kind::kCoupling));
  // Owned by the continuing train, keyed by the target of the ending one.
  auto const t4 = e.tg_.find(target_key{4, hm(11, 10), "3"});
  ASSERT_TRUE(t4.has_value());
  auto const k = e.eg_.find(5, *t4, event_kind::kCoupling);
  ASSERT_TRUE(k.has_value());

  auto const an4 = get_event(e, 4, hm(11, 10), "3", event_kind::kArrival);
  auto const an5 = get_event(e, 5, hm(11, 14), "3", event_kind::kArrival);
  auto const ab5 = get_event(e, 5, hm(11, 14), "3", event_kind::kDeparture);
  ASSERT_TRUE(an4.has_value());
  ASSERT_TRUE(an5.has_value());
  ASSERT_TRUE(ab5.has_value());
  EXPECT_FALSE(
      get_event(e, 4, hm(11, 10), "3", event_kind::kDeparture).has_value());

  auto const next = e.eg_.successor(*an4, true);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*k, *next);
  auto const& coupling = e.eg_.nodes_[*next];
  EXPECT_EQ(event_kind::kCoupling, coupling.kind_);
  EXPECT_EQ(5, coupling.train_);
  EXPECT_EQ(hm(11, 16), coupling.planned_);
  EXPECT_EQ(2U, e.eg_.in_[*next].size());
  EXPECT_EQ(1U, e.eg_.out_[*next].size());
  EXPECT_EQ(*next, e.eg_.successor(*an5, false));
  EXPECT_EQ(*ab5, e.eg_.successor(*next, false));
  EXPECT_FALSE(e.eg_.find_edge(*an5, *ab5).has_value());

  // Train 4 ends before the coupling.
  EXPECT_EQ(3U, e.eg_.train_path(4).size());
  EXPECT_EQ(7U, e.eg_.train_path(5).size());

  // The own train wins over the coupled one.
  EXPECT_EQ(*an5, e.eg_.prev_event(*ab5, event_kind::kArrival, false));
  EXPECT_EQ(*an5, e.eg_.prev_event(*ab5, event_kind::kArrival, true));
  EXPECT_EQ(*an5, e.eg_.prev_event(*k, std::nullopt, false));
  EXPECT_FALSE(
      e.eg_.next_event(*an4, event_kind::kDeparture, false).has_value());
  EXPECT_EQ(*ab5, e.eg_.next_event(*an4, event_kind::kDeparture, true));
  EXPECT_FALSE(e.eg_.prev_event(*an4, event_kind::kCoupling, true).has_value());
}

TEST(event_graph, splitting) {
  auto e = engine{};
  auto const trains = std::vector<train>{
      make_train(7, {make_stop("1", hm(12, 0), hm(12, 2)),
                     make_stop("5", hm(12, 10), hm(12, 20), "F(8)",
                               duration_t{3}),
                     make_stop("6", hm(12, 30), hm(12, 31))}),
      make_train(8, {make_stop("5", std::nullopt, hm(12, 22)),
                     make_stop("7", hm(12, 40), std::nullopt)})};
  e.import(trains);
  e.build();
  EXPECT_TRUE(e.problems_.empty());

  auto const f = get_event(e, 7, hm(12, 10), "5", event_kind::kSplitting);
  auto const ab7 = get_event(e, 7, hm(12, 10), "5", event_kind::kDeparture);
  auto const ab8 = get_event(e, 8, hm(12, 22), "5", event_kind::kDeparture);
  ASSERT_TRUE(f.has_value());
  ASSERT_TRUE(ab7.has_value());
  ASSERT_TRUE(ab8.has_value());
  EXPECT_FALSE(
      get_event(e, 8, hm(12, 22), "5", event_kind::kArrival).has_value());

  EXPECT_EQ(hm(12, 13), e.eg_.nodes_[*f].planned_);
  EXPECT_EQ(1U, e.eg_.in_[*f].size());
  EXPECT_EQ(2U, e.eg_.out_[*f].size());
  EXPECT_TRUE(e.eg_.find_edge(*f, *ab7).has_value());
  EXPECT_TRUE(e.eg_.find_edge(*f, *ab8).has_value());
  EXPECT_EQ(0U, e.eg_.nodes_[*ab8].seq_);

  // An Ab An F Ab An Ab
  EXPECT_EQ(7U, e.eg_.train_path(7).size());
  EXPECT_EQ(3U, e.eg_.train_path(8).size());
}

TEST(event_graph, replacement_added_later) {
  auto e = engine{};
  auto t1 = make_train(1, {make_stop("A", hm(8, 0), hm(8, 2)),
                           make_stop("B", hm(8, 10), hm(8, 15))});
  auto const t2 = make_train(2, {make_stop("B", std::nullopt, hm(8, 15)),
                                 make_stop("C", hm(8, 25), hm(8, 26))});
  e.import(std::vector<train>{t1, t2});
  e.build();
  EXPECT_EQ(8U, count_events(e.eg_, event_kind::kArrival) +
                    count_events(e.eg_, event_kind::kDeparture));

  t1.stops_.back().flags_ = "E(2)";
  e.import_train(t1);
  auto const stats = e.build();

  EXPECT_EQ(2U, stats.detached_events_);
  EXPECT_EQ(1U, count_events(e.eg_, event_kind::kReplacement));
  EXPECT_EQ(6U, count_events(e.eg_, event_kind::kArrival) +
                    count_events(e.eg_, event_kind::kDeparture));
  EXPECT_EQ(7U, e.eg_.train_path(1, true).size());
  auto const ab2 = get_event(e, 2, hm(8, 15), "B", event_kind::kDeparture);
  ASSERT_TRUE(ab2.has_value());
  EXPECT_EQ(ab2, e.eg_.start(2));
}

TEST(event_graph, shunting_movement) {
  auto e = engine{};
  e.import(std::vector<train>{
      make_train(1, {make_stop("A", hm(8, 30), hm(8, 31)),
                     make_stop("S", hm(9, 0), std::nullopt)}),
      make_train(2, {make_stop("S", std::nullopt, hm(9, 10)),
                     make_stop("B", hm(9, 20), hm(9, 21))})});
  auto const last = e.tg_.last(1);
  auto const first = e.tg_.first(2);
  ASSERT_TRUE(last.has_value());
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(e.tg_.add_edge(target_edge_type::kShunt, *last, *first));
  e.build();
  EXPECT_TRUE(e.problems_.empty());

  auto const ab1 = get_event(e, 1, hm(9, 0), "S", event_kind::kDeparture);
  auto const an2 = get_event(e, 2, hm(9, 10), "S", event_kind::kArrival);
  ASSERT_TRUE(ab1.has_value());
  ASSERT_TRUE(an2.has_value());
  auto const p = e.eg_.find_edge(*ab1, *an2);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(event_edge_type::kPlanned, e.eg_.edges_[*p].type_);
  EXPECT_EQ(duration_t{10}, e.eg_.edges_[*p].dt_min_);

  // Separate trains with their own starts.
  EXPECT_EQ(0U, e.eg_.nodes_[*an2].seq_);
  EXPECT_EQ(an2, e.eg_.start(2));
  EXPECT_EQ(*an2, e.eg_.next_event(*ab1, std::nullopt, true));
}

TEST(event_graph, sort_helper_has_no_events) {
  auto e = engine{};
  e.import(std::vector<train>{
      make_train(1, {make_stop("A", hm(8, 0), hm(8, 1))}),
      make_train(2, {make_stop("A", hm(8, 20), hm(8, 21))})});
  auto const a1 = e.tg_.last(1);
  auto const a2 = e.tg_.first(2);
  ASSERT_TRUE(a1.has_value());
  ASSERT_TRUE(a2.has_value());
  ASSERT_TRUE(e.tg_.add_edge(target_edge_type::kSortHelper, *a1, *a2));
  e.build();

  EXPECT_TRUE(e.problems_.empty());
  EXPECT_EQ(4U, e.eg_.n_nodes());
  EXPECT_EQ(2U, count_edges(e.eg_));
  EXPECT_EQ(2U, count_edges(e.eg_, event_edge_type::kHold));
  EXPECT_TRUE(e.eg_.start(2).has_value());
  EXPECT_EQ(0U, e.eg_.nodes_[*e.eg_.start(2)].seq_);
}
