#pragma once

#include <array>
#include <cinttypes>
#include <iosfwd>
#include <string>

#include "fmt/core.h"

#include "dispo/logging.h"
#include "dispo/types.h"

namespace dispo {

enum class problem_kind : std::uint8_t {
  kNotFound,
  kIncompleteData,
  kCycleDetected,
  kPrognosisUnavailable,
  kNumKinds
};

constexpr char const* to_str(problem_kind const k) {
  switch (k) {
    case problem_kind::kNotFound: return "not found";
    case problem_kind::kIncompleteData: return "incomplete data";
    case problem_kind::kCycleDetected: return "cycle detected";
    case problem_kind::kPrognosisUnavailable: return "prognosis unavailable";
    case problem_kind::kNumKinds: break;
  }
  return "";
}

constexpr log_lvl severity(problem_kind const k) {
  switch (k) {
    case problem_kind::kCycleDetected: [[fallthrough]];
    case problem_kind::kNotFound: return log_lvl::error;
    default: return log_lvl::warn;
  }
}

struct problem {
  problem_kind kind_;
  std::string ctx_;
  std::string msg_;
};

// Recoverable failures of one or more operations.
// Every entry is logged when it is added. Nothing here aborts the caller.
struct problems {
  template <typename... Args>
  void add(problem_kind const kind,
           char const* ctx,
           fmt::format_string<Args...> fmt_str,
           Args&&... args) {
    auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);
    log(severity(kind), ctx, "{}: {}", to_str(kind), msg);
    ++counts_[static_cast<std::size_t>(kind)];
    entries_.push_back(problem{kind, ctx, std::move(msg)});
  }

  std::uint32_t count(problem_kind) const;
  std::uint32_t total() const;
  bool empty() const { return entries_.empty(); }
  void clear();

  friend std::ostream& operator<<(std::ostream&, problems const&);

  vector<problem> entries_;
  std::array<std::uint32_t, static_cast<std::size_t>(problem_kind::kNumKinds)>
      counts_{};
};

}  // namespace dispo
