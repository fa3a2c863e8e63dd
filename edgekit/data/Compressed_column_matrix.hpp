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

  template<typename I, typename T = config::value_type>
  class Compressed_column_matrix final
  {
  public:
    using size_type = config::size_type;

    Compressed_column_matrix(
      Shape shape,
      std::vector<I> col_ptr,
      std::vector<I> row_ind,
      std::vector<T> values)
      : shape_(shape)
      , col_ptr_(std::move(col_ptr))
      , row_ind_(std::move(row_ind))
      , values_(std::move(values))
    {
      if (static_cast<size_type>(col_ptr_.size()) != shape_.column() + 1) {
        throw Shape_error(
          "Compressed_column_matrix: expected " + std::to_string(shape_.column() + 1)
          + " column pointers (got " + std::to_string(col_ptr_.size()) + ")");
      }
      if (row_ind_.size() != values_.size()) {
        throw Shape_error(
          "Compressed_column_matrix: row and value arrays of lengths "
          + std::to_string(row_ind_.size()) + " and " + std::to_string(values_.size()));
      }
    }

    size_type
    size() const
    {
      return static_cast<size_type>(values_.size());
    }

    Shape
    shape() const
    {
      return shape_;
    }

    std::span<I const>
    col_ptr() const
    {
      return col_ptr_;
    }

    std::span<I const>
    row_ind() const
    {
      return row_ind_;
    }

    std::span<T const>
    values() const
    {
      return values_;
    }

    T
    operator()(size_type row, size_type col) const
    {
      T sum{0};
      for (auto j = col_ptr_[static_cast<std::size_t>(col)]; j < col_ptr_[static_cast<std::size_t>(col + 1)]; ++j) {
        if (row_ind_[static_cast<std::size_t>(j)] == row) {
          sum += values_[static_cast<std::size_t>(j)];
        }
      }
      return sum;
    }

  private:
    Shape shape_;
    std::vector<I> col_ptr_;
    std::vector<I> row_ind_;
    std::vector<T> values_;

  }; // end of class Compressed_column_matrix

} // end of namespace edgekit::data::detail
