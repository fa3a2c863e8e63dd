#pragma once

//
// ... Standard header files
//
#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Lexicographic key of an edge list: (row, col) or (col, row).
   */
  enum class Sort_order { row, col };

  char const*
  to_string(Sort_order order);

  /// "row" or "col"; anything else is std::invalid_argument.
  Sort_order
  sort_order_from_string(std::string_view name);

  std::ostream&
  operator<<(std::ostream& os, Sort_order order);

  /// The order keyed on the other coordinate.
  Sort_order
  transposed(Sort_order order);

  /// 0 for row, 1 for col.
  int
  primary_axis(Sort_order order);

  /**
   * @brief Declared or inferred matrix bounds; an empty entry is unknown.
   */
  using Sparse_size = std::array<std::optional<config::size_type>, 2>;

  /// "(3, 4)", "(None, 4)"
  std::string
  to_string(Sparse_size const& size);

} // end of namespace edgekit::data::detail
