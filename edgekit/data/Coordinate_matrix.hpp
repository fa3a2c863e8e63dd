#pragma once

//
// ... Standard header files
//
#include <span>
#include <string>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Shape.hpp>
#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Coordinate-list sparse matrix: parallel row, column and value
   *        arrays. Duplicate coordinates are kept and add up.
   */
  template <typename I, typename T = config::value_type>
  class Coordinate_matrix final {
  public:
    using size_type = config::size_type;

    Coordinate_matrix(Shape shape, std::vector<I> row, std::vector<I> col, std::vector<T> values)
        : shape_(shape)
        , row_(std::move(row))
        , col_(std::move(col))
        , values_(std::move(values)) {
      if (row_.size() != col_.size() || row_.size() != values_.size()) {
        throw Shape_error("Coordinate_matrix: row, column and value arrays of lengths "
                          + std::to_string(row_.size()) + ", " + std::to_string(col_.size()) + " and "
                          + std::to_string(values_.size()));
      }
    }

    size_type
    size() const {
      return static_cast<size_type>(values_.size());
    }

    Shape
    shape() const {
      return shape_;
    }

    std::span<I const>
    row() const {
      return row_;
    }

    std::span<I const>
    col() const {
      return col_;
    }

    std::span<T const>
    values() const {
      return values_;
    }

    T
    operator()(size_type row, size_type col) const {
      T sum{0};
      for (std::size_t k = 0; k < values_.size(); ++k) {
        if (row_[k] == row && col_[k] == col) { sum += values_[k]; }
      }
      return sum;
    }

  private:
    Shape shape_;
    std::vector<I> row_;
    std::vector<I> col_;
    std::vector<T> values_;

  }; // end of class Coordinate_matrix

} // end of namespace edgekit::data::detail
