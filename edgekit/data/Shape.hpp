#pragma once

//
// ... Standard header files
//
#include <ostream>
#include <string>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Extents of a dense view: rows and columns of the matrix an
   *        edge list describes, or of a dense operand.
   *
   * Either extent may be zero; an edge list without edges has an empty
   * dense view.
   */
  class Shape final {
  public:
    using size_type = config::size_type;

    /// @throws Shape_error if either extent is negative.
    Shape(size_type row, size_type column);
    Shape(const Shape& input) = default;
    Shape&
    operator=(const Shape& input) = default;
    Shape(Shape&& input) = default;
    Shape&
    operator=(Shape&& input) = default;
    ~Shape() = default;
    Shape() = default;

    size_type
    row() const;

    size_type
    column() const;

    /// Number of entries of the dense view.
    size_type
    size() const;

    bool
    is_square() const;

    /// The shape of the transposed matrix.
    Shape
    transposed() const;

    friend bool
    operator==(const Shape& shape1, const Shape& shape2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Shape

  /// "3 x 4"
  std::string
  to_string(Shape const& shape);

  std::ostream&
  operator<<(std::ostream& os, Shape const& shape);

  /// [rows, columns]
  void
  to_json(nlohmann::json& j, Shape const& shape);

  /// @throws Shape_error unless @p j holds two extents.
  void
  from_json(nlohmann::json const& j, Shape& shape);

} // end of namespace edgekit::data::detail
