#include <edgekit/data/Sort_order.hpp>

//
// ... Standard header files
//
#include <stdexcept>

namespace edgekit::data::detail {

  char const*
  to_string(Sort_order order)
  {
    switch (order) {
      case Sort_order::row: return "row";
      case Sort_order::col: return "col";
    }
    return "unknown";
  }

  Sort_order
  sort_order_from_string(std::string_view name)
  {
    if (name == "row") { return Sort_order::row; }
    if (name == "col") { return Sort_order::col; }
    throw std::invalid_argument("invalid sort order '" + std::string(name) + "' (expected 'row' or 'col')");
  }

  std::ostream&
  operator<<(std::ostream& os, Sort_order order)
  {
    return os << to_string(order);
  }

  Sort_order
  transposed(Sort_order order)
  {
    return order == Sort_order::row ? Sort_order::col : Sort_order::row;
  }

  int
  primary_axis(Sort_order order)
  {
    return order == Sort_order::row ? 0 : 1;
  }

  std::string
  to_string(Sparse_size const& size)
  {
    auto entry = [](std::optional<config::size_type> const& n) {
      return n ? std::to_string(*n) : std::string("None");
    };
    return "(" + entry(size[0]) + ", " + entry(size[1]) + ")";
  }

} // end of namespace edgekit::data::detail
