#include "dispo/problems.h"

#include <numeric>
#include <ostream>

namespace dispo {

std::uint32_t problems::count(problem_kind const k) const {
  return counts_[static_cast<std::size_t>(k)];
}

std::uint32_t problems::total() const {
  return std::accumulate(begin(counts_), end(counts_), 0U);
}

void problems::clear() {
  entries_.clear();
  counts_ = {};
}

std::ostream& operator<<(std::ostream& out, problems const& p) {
  for (auto i = 0U; i != p.counts_.size(); ++i) {
    out << to_str(static_cast<problem_kind>(i)) << ": " << p.counts_[i]
        << "\n";
  }
  return out;
}

}  // namespace dispo
