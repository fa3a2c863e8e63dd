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
   * @brief Compressed sparse row matrix over index type I.
   *
   * Entries of row r occupy [row_ptr[r], row_ptr[r + 1]) of col_ind and
   * values. Duplicate coordinates add up.
   */
  template <typename I, typename T = config::value_type>
  class Compressed_row_matrix final {
  public:
    using size_type = config::size_type;

    Compressed_row_matrix(Shape shape, std::vector<I> row_ptr, std::vector<I> col_ind, std::vector<T> values)
        : shape_(shape)
        , row_ptr_(std::move(row_ptr))
        , col_ind_(std::move(col_ind))
        , values_(std::move(values)) {
      if (static_cast<size_type>(row_ptr_.size()) != shape_.row() + 1) {
        throw Shape_error("Compressed_row_matrix: expected " + std::to_string(shape_.row() + 1)
                          + " row pointers (got " + std::to_string(row_ptr_.size()) + ")");
      }
      if (col_ind_.size() != values_.size()) {
        throw Shape_error("Compressed_row_matrix: column and value arrays of lengths "
                          + std::to_string(col_ind_.size()) + " and " + std::to_string(values_.size()));
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
    row_ptr() const {
      return row_ptr_;
    }

    std::span<I const>
    col_ind() const {
      return col_ind_;
    }

    std::span<T const>
    values() const {
      return values_;
    }

    T
    operator()(size_type row, size_type col) const {
      T sum{0};
      for (auto j = row_ptr_[static_cast<std::size_t>(row)]; j < row_ptr_[static_cast<std::size_t>(row + 1)]; ++j) {
        if (col_ind_[static_cast<std::size_t>(j)] == col) { sum += values_[static_cast<std::size_t>(j)]; }
      }
      return sum;
    }

  private:
    Shape shape_;
    std::vector<I> row_ptr_;
    std::vector<I> col_ind_;
    std::vector<T> values_;

  }; // end of class Compressed_row_matrix

} // end of namespace edgekit::data::detail
