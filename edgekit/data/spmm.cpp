#include <edgekit/data/spmm.hpp>

//
// ... Standard header files
//
#include <stdexcept>
#include <string>

namespace edgekit::data::detail {

  char const*
  to_string(Reduce reduce)
  {
    switch (reduce) {
      case Reduce::sum: return "sum";
      case Reduce::mean: return "mean";
      case Reduce::min: return "min";
      case Reduce::max: return "max";
    }
    return "unknown";
  }

  Reduce
  reduce_from_string(std::string_view name)
  {
    if (name == "sum" || name == "add") { return Reduce::sum; }
    if (name == "mean") { return Reduce::mean; }
    if (name == "min" || name == "amin") { return Reduce::min; }
    if (name == "max" || name == "amax") { return Reduce::max; }
    throw std::invalid_argument("invalid reduction '" + std::string(name) + "'");
  }

  std::ostream&
  operator<<(std::ostream& os, Reduce reduce)
  {
    return os << to_string(reduce);
  }

  char const*
  to_string(Spmm_backend backend)
  {
    switch (backend) {
      case Spmm_backend::library: return "library";
      case Spmm_backend::native: return "native";
      case Spmm_backend::generic: return "generic";
    }
    return "unknown";
  }

  std::ostream&
  operator<<(std::ostream& os, Spmm_backend backend)
  {
    return os << to_string(backend);
  }

} // end of namespace edgekit::data::detail
