#include <edgekit/data/Shape.hpp>

//
// ... edgekit header files
//
#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail
{

  Shape::Shape(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {
      if (row_ < 0 || column_ < 0) {
        throw Shape_error("negative matrix extent in shape " + std::to_string(row_) + " x " + std::to_string(column_));
      }
    }

  config::size_type
  Shape::row() const { return row_; }

  config::size_type
  Shape::column() const { return column_; }

  config::size_type
  Shape::size() const { return row_ * column_; }

  bool
  Shape::is_square() const { return row_ == column_; }

  Shape
  Shape::transposed() const { return Shape{column_, row_}; }

  bool
  operator==(const Shape& shape1, const Shape& shape2){
    return shape1.row_ == shape2.row_ && shape1.column_ == shape2.column_;
  }

  std::string
  to_string(Shape const& shape)
  {
    return std::to_string(shape.row()) + " x " + std::to_string(shape.column());
  }

  std::ostream&
  operator<<(std::ostream& os, Shape const& shape)
  {
    return os << to_string(shape);
  }

  void
  to_json(nlohmann::json& j, Shape const& shape)
  {
    j = nlohmann::json::array({shape.row(), shape.column()});
  }

  void
  from_json(nlohmann::json const& j, Shape& shape){
    if (!j.is_array() || j.size() != 2) {
      throw Shape_error("a shape is stored as [rows, columns], got " + j.dump());
    }
    shape = Shape(j[0].get<config::size_type>(), j[1].get<config::size_type>());
  }

} // end of namespace edgekit::data::detail
