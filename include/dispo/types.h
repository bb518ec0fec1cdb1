#pragma once

#include <chrono>
#include <cinttypes>
#include <iomanip>
#include <ostream>
#include <string_view>

#include "date/date.h"

#include "cista/containers/hash_map.h"
#include "cista/containers/hash_set.h"
#include "cista/containers/vector.h"
#include "cista/strong.h"

namespace dispo {

template <typename K, typename V>
using vector_map = cista::raw::vector_map<K, V>;

template <typename T>
using vector = cista::raw::vector<T>;

template <typename K,
          typename V,
          typename Hash = cista::hash_all,
          typename Equality = cista::equals_all>
using hash_map = cista::raw::hash_map<K, V, Hash, Equality>;

template <typename K,
          typename Hash = cista::hash_all,
          typename Equality = cista::equals_all>
using hash_set = cista::raw::hash_set<K, Hash, Equality>;

// External train number as delivered by the simulator.
// Values <= 0 denote shunting movements without a timetable.
using train_id_t = std::int32_t;

using i32_minutes = std::chrono::duration<std::int32_t, std::ratio<60>>;
using duration_t = i32_minutes;
using minutes_after_midnight_t = duration_t;

constexpr duration_t operator""_minutes(unsigned long long n) {
  return duration_t{n};
}

constexpr duration_t operator""_hours(unsigned long long n) {
  return duration_t{n * 60U};
}

// Sort keys of synthesized entry/exit targets.
constexpr auto const kMinMinutes = minutes_after_midnight_t{0};
constexpr auto const kMaxMinutes = minutes_after_midnight_t{1440};

using target_idx_t = cista::strong<std::uint32_t, struct _target_idx>;
using target_edge_idx_t =
    cista::strong<std::uint32_t, struct _target_edge_idx>;
using event_idx_t = cista::strong<std::uint32_t, struct _event_idx>;
using event_edge_idx_t = cista::strong<std::uint32_t, struct _event_edge_idx>;

// Sequence number of an event, unique within its train.
// 0 is reserved for the first event of the train.
using seq_t = std::uint32_t;

enum class target_type : std::uint8_t {
  kHalt,
  kPassThrough,
  kEntry,
  kExit,
  kOperationalStop,
  kSignalStop
};

enum class target_edge_type : std::uint8_t {
  kPlanned,
  kReplacement,
  kCoupling,
  kSplitting,
  kShunt,
  kDependency,
  kSortHelper  // ordering only, no timing
};

enum class event_kind : std::uint8_t {
  kArrival,
  kDeparture,
  kReplacement,
  kCoupling,
  kSplitting
};

enum class event_edge_type : std::uint8_t {
  kPlanned,
  kHold,
  kReplacement,
  kCoupling,
  kSplitting,
  kDependency
};

constexpr std::string_view to_str(target_type const t) {
  switch (t) {
    case target_type::kHalt: return "H";
    case target_type::kPassThrough: return "D";
    case target_type::kEntry: return "E";
    case target_type::kExit: return "A";
    case target_type::kOperationalStop: return "B";
    case target_type::kSignalStop: return "S";
  }
  return "";
}

constexpr std::string_view to_str(target_edge_type const t) {
  switch (t) {
    case target_edge_type::kPlanned: return "P";
    case target_edge_type::kReplacement: return "E";
    case target_edge_type::kCoupling: return "K";
    case target_edge_type::kSplitting: return "F";
    case target_edge_type::kShunt: return "R";
    case target_edge_type::kDependency: return "A";
    case target_edge_type::kSortHelper: return "O";
  }
  return "";
}

constexpr std::string_view to_str(event_kind const k) {
  switch (k) {
    case event_kind::kArrival: return "An";
    case event_kind::kDeparture: return "Ab";
    case event_kind::kReplacement: return "E";
    case event_kind::kCoupling: return "K";
    case event_kind::kSplitting: return "F";
  }
  return "";
}

constexpr std::string_view to_str(event_edge_type const t) {
  switch (t) {
    case event_edge_type::kPlanned: return "P";
    case event_edge_type::kHold: return "H";
    case event_edge_type::kReplacement: return "E";
    case event_edge_type::kCoupling: return "K";
    case event_edge_type::kSplitting: return "F";
    case event_edge_type::kDependency: return "A";
  }
  return "";
}

constexpr bool is_operation(event_kind const k) {
  return k == event_kind::kReplacement || k == event_kind::kCoupling ||
         k == event_kind::kSplitting;
}

}  // namespace dispo

namespace std::chrono {

inline std::ostream& operator<<(std::ostream& out,
                                dispo::i32_minutes const& t) {
  auto const day = date::floor<date::days>(t);
  auto const time = date::hh_mm_ss<dispo::i32_minutes>{t - day};
  out << std::setw(2) << std::setfill('0') << time.hours().count() << ':'  //
      << std::setw(2) << std::setfill('0') << time.minutes().count();
  if (day.count() != 0) {
    out << '+' << day.count();
  }
  return out;
}

}  // namespace std::chrono
