//
// ... Standard header files
//
#include <numeric>
#include <span>
#include <stdexcept>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/permutation.hpp>

namespace edgekit::data::detail {

  bool
  is_valid_permutation(std::span<std::int64_t const> perm)
  {
    auto n = static_cast<std::int64_t>(perm.size());
    std::vector<bool> seen(static_cast<std::size_t>(n), false);
    for (auto val : perm) {
      if (val < 0 || val >= n) {
        return false;
      }
      if (seen[static_cast<std::size_t>(val)]) {
        return false;
      }
      seen[static_cast<std::size_t>(val)] = true;
    }
    return true;
  }

  bool
  is_identity_permutation(std::span<std::int64_t const> perm)
  {
    for (std::size_t k = 0; k < perm.size(); ++k) {
      if (perm[k] != static_cast<std::int64_t>(k)) { return false; }
    }
    return true;
  }

  Permutation
  identity_permutation(config::size_type n)
  {
    Permutation perm(static_cast<std::size_t>(n));
    std::iota(perm.begin(), perm.end(), std::int64_t{0});
    return perm;
  }

  Permutation
  inverse_permutation(std::span<std::int64_t const> perm)
  {
    auto n = perm.size();
    Permutation inv(n);
    for (std::size_t new_idx = 0; new_idx < n; ++new_idx) {
      inv[static_cast<std::size_t>(perm[new_idx])] =
        static_cast<std::int64_t>(new_idx);
    }
    return inv;
  }

  Permutation
  compose_permutation(
    std::span<std::int64_t const> first,
    std::span<std::int64_t const> second)
  {
    if (first.size() != second.size()) {
      throw std::invalid_argument("compose_permutation: permutations of different lengths");
    }
    return apply_permutation(first, second);
  }

} // end of namespace edgekit::data::detail
