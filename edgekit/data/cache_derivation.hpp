#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Sort_order.hpp>
#include <edgekit/data/errors.hpp>
#include <edgekit/data/permutation.hpp>

namespace edgekit::data::detail {

  // Pure functions: they read the coordinate arrays and return new
  // vectors, leaving every cached field to the caller.

  /**
   * @brief Compressed pointer array of @p values over an axis of
   *        @p axis_size entries.
   *
   * Counts entries per bucket, then converts the counts to offsets with an
   * exclusive prefix sum. For non-decreasing input, entry k and k + 1
   * delimit the run of value k.
   *
   * @throws Validation_error (bounds) if a value lies outside
   *         [0, axis_size).
   */
  template <typename I>
  std::vector<I>
  compute_indptr(std::span<I const> values, config::size_type axis_size)
  {
    std::vector<I> indptr(static_cast<std::size_t>(axis_size + 1), I{0});
    for (auto value : values) {
      if (value < 0 || value >= axis_size) {
        throw Validation_error(
          Validation_reason::bounds,
          "index " + std::to_string(value) + " lies outside [0, " + std::to_string(axis_size)
            + ") while building a compressed pointer array");
      }
      ++indptr[static_cast<std::size_t>(value) + 1];
    }
    for (std::size_t k = 1; k < indptr.size(); ++k) {
      indptr[k] += indptr[k - 1];
    }
    return indptr;
  }

  template <typename I>
  bool
  is_non_decreasing(std::span<I const> values)
  {
    return std::is_sorted(values.begin(), values.end());
  }

  template <typename I>
  bool
  is_lexicographically_sorted(std::span<I const> primary, std::span<I const> secondary)
  {
    for (std::size_t k = 1; k < primary.size(); ++k) {
      if (primary[k] < primary[k - 1]) { return false; }
      if (primary[k] == primary[k - 1] && secondary[k] < secondary[k - 1]) { return false; }
    }
    return true;
  }

  /**
   * @brief Stable permutation ordering edges by (primary, secondary).
   *
   * Equal keys keep their original relative order. Already sorted input
   * returns the identity after a single scan.
   */
  template <typename I>
  Permutation
  sort_permutation(std::span<I const> primary, std::span<I const> secondary)
  {
    auto perm = identity_permutation(static_cast<config::size_type>(primary.size()));
    if (is_lexicographically_sorted(primary, secondary)) { return perm; }

    std::stable_sort(perm.begin(), perm.end(), [&](std::int64_t a, std::int64_t b) {
      auto ua = static_cast<std::size_t>(a);
      auto ub = static_cast<std::size_t>(b);
      return primary[ua] != primary[ub] ? primary[ua] < primary[ub] : secondary[ua] < secondary[ub];
    });
    return perm;
  }

  /**
   * @brief The edge list reordered by the other axis.
   */
  template <typename I>
  struct Transpose {
    Permutation perm;
    std::vector<I> row;
    std::vector<I> col;
    std::optional<std::vector<I>> indptr;
  };

  /**
   * @brief Transpose structure of an edge list sorted by @p order.
   *
   * The permutation is keyed on the other axis first and on the current
   * axis second. The pointer array of the transposed order is derived only
   * when @p other_axis_size is known and the edge list is not undirected;
   * an undirected list shares its forward pointer array.
   */
  template <typename I>
  Transpose<I>
  compute_transpose(
    std::span<I const> row,
    std::span<I const> col,
    Sort_order order,
    std::optional<config::size_type> other_axis_size = std::nullopt,
    bool is_undirected = false)
  {
    Transpose<I> out;
    out.perm = order == Sort_order::row ? sort_permutation(col, row) : sort_permutation(row, col);
    out.row = apply_permutation<I>(row, out.perm);
    out.col = apply_permutation<I>(col, out.perm);
    if (other_axis_size && !is_undirected) {
      auto const& primary = order == Sort_order::row ? out.col : out.row;
      out.indptr = compute_indptr<I>(primary, *other_axis_size);
    }
    return out;
  }

} // end of namespace edgekit::data::detail
