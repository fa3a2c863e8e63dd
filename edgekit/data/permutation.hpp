#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <span>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>

namespace edgekit::data::detail {

  // A permutation in gather form: position k of the permuted sequence
  // holds element perm[k] of the original.

  using Permutation = std::vector<std::int64_t>;

  // -- Permutation utilities (implemented in permutation.cpp) --

  bool
  is_valid_permutation(std::span<std::int64_t const> perm);

  bool
  is_identity_permutation(std::span<std::int64_t const> perm);

  Permutation
  identity_permutation(config::size_type n);

  Permutation
  inverse_permutation(std::span<std::int64_t const> perm);

  /// The single permutation equivalent to applying @p first, then @p second.
  Permutation
  compose_permutation(
    std::span<std::int64_t const> first,
    std::span<std::int64_t const> second);

  // -- Gather (template, header-only) --

  template <typename T>
  std::vector<T>
  apply_permutation(std::span<T const> values, std::span<std::int64_t const> perm) {
    std::vector<T> out;
    out.reserve(perm.size());
    for (auto k : perm) {
      out.push_back(values[static_cast<std::size_t>(k)]);
    }
    return out;
  }

} // end of namespace edgekit::data::detail
