#include <edgekit/data/Dtype.hpp>

namespace edgekit::data::detail {

  char const*
  to_string(Dtype dtype)
  {
    switch (dtype) {
      case Dtype::uint8: return "uint8";
      case Dtype::int8: return "int8";
      case Dtype::int16: return "int16";
      case Dtype::int32: return "int32";
      case Dtype::int64: return "int64";
      case Dtype::float32: return "float32";
      case Dtype::float64: return "float64";
    }
    return "unknown";
  }

  std::ostream&
  operator<<(std::ostream& os, Dtype dtype)
  {
    return os << to_string(dtype);
  }

  bool
  is_index_dtype(Dtype dtype)
  {
    return dtype == Dtype::int32 || dtype == Dtype::int64;
  }

  bool
  is_floating_dtype(Dtype dtype)
  {
    return dtype == Dtype::float32 || dtype == Dtype::float64;
  }

} // end of namespace edgekit::data::detail
