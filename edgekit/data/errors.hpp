#pragma once

//
// ... Standard header files
//
#include <stdexcept>
#include <string>

namespace edgekit::data::detail {

  /**
   * @brief Input has the wrong rank or the wrong extent along a dimension.
   */
  class Shape_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /**
   * @brief Element type is outside the supported set or does not match
   *        the requested index type.
   */
  class Dtype_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /**
   * @brief Input storage is not contiguous.
   */
  class Layout_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /// Which invariant a failed validation refers to.
  enum class Validation_reason {
    bounds,
    order,
    symmetry,
    indptr,
    transpose,
    size
  };

  char const*
  to_string(Validation_reason reason);

  /**
   * @brief A semantic invariant of an edge index does not hold.
   *
   * reason() names the invariant; what() carries the expected and actual
   * values.
   */
  class Validation_error : public std::invalid_argument {
  public:
    Validation_error(Validation_reason reason, std::string const& message);

    Validation_reason
    reason() const noexcept;

  private:
    Validation_reason reason_;
  };

  /**
   * @brief The operation needs a property that is not currently tracked,
   *        such as a known sort order.
   */
  class State_error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
  };

  /**
   * @brief The requested combination of reduction and gradient is not
   *        defined.
   */
  class Not_implemented_error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
  };

} // end of namespace edgekit::data::detail
