#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail {

  char const*
  to_string(Validation_reason reason)
  {
    switch (reason) {
      case Validation_reason::bounds: return "bounds";
      case Validation_reason::order: return "order";
      case Validation_reason::symmetry: return "symmetry";
      case Validation_reason::indptr: return "indptr";
      case Validation_reason::transpose: return "transpose";
      case Validation_reason::size: return "size";
    }
    return "unknown";
  }

  Validation_error::Validation_error(
    Validation_reason reason,
    std::string const& message)
    : std::invalid_argument(message)
    , reason_(reason)
  {}

  Validation_reason
  Validation_error::reason() const noexcept
  {
    return reason_;
  }

} // end of namespace edgekit::data::detail
