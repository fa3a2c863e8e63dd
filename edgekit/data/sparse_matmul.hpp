#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <span>
#include <string>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Structure and values of a sparse-sparse product.
   */
  template <typename I, typename T>
  struct Sparse_product {
    Edge_index<I> index;
    std::vector<T> values;
  };

  /**
   * @brief Sparse product A B with edge values @p a_values and @p b_values.
   *
   * Row-by-row accumulation over the row pointer arrays of both operands.
   * The result is sorted by row (columns ascending within a row), has
   * sparse size (rows of A, columns of B) and carries its row pointer
   * array.
   *
   * @throws State_error if either operand is not sorted by row,
   *         Shape_error if the inner dimensions differ or a value array
   *         does not hold one entry per edge.
   */
  template <typename I, typename T>
  Sparse_product<I, T>
  matmul(
    Edge_index<I>& A,
    Edge_index<I>& B,
    std::vector<T> const& a_values,
    std::vector<T> const& b_values)
  {
    if (!A.is_sorted_by_row() || !B.is_sorted_by_row()) {
      throw State_error("sparse matmul: both operands need to be sorted by row indices; call sort_by(Sort_order::row) first");
    }
    if (static_cast<config::size_type>(a_values.size()) != A.num_edges()
        || static_cast<config::size_type>(b_values.size()) != B.num_edges()) {
      throw Shape_error("sparse matmul: expected one value per edge");
    }
    if (A.num_cols() && B.num_rows() && *A.num_cols() != *B.num_rows()) {
      throw Shape_error("sparse matmul: inner dimensions " + std::to_string(*A.num_cols()) + " and "
                        + std::to_string(*B.num_rows()) + " differ");
    }
    if (A.get_num_cols() > B.get_num_rows()) {
      throw Shape_error("sparse matmul: left operand has " + std::to_string(A.get_num_cols())
                        + " columns but the right operand only " + std::to_string(B.get_num_rows()) + " rows");
    }

    auto rows = A.get_num_rows();
    auto inner = B.get_num_rows();
    auto cols = B.get_num_cols();
    auto a_ptr = A.get_indptr().view();
    auto b_ptr = B.get_indptr().view();
    auto a_col = A.col();
    auto b_col = B.col();

    std::vector<I> out_row;
    std::vector<I> out_col;
    std::vector<T> out_values;
    std::vector<I> out_ptr(static_cast<std::size_t>(rows + 1), I{0});

    // marker[j] is the position of column j in the current output row, or -1.
    std::vector<config::size_type> marker(static_cast<std::size_t>(cols), -1);
    std::vector<I> row_cols;
    std::vector<T> row_sums;

    for (config::size_type i = 0; i < rows; ++i) {
      row_cols.clear();
      row_sums.clear();
      for (auto ka = a_ptr[static_cast<std::size_t>(i)]; ka < a_ptr[static_cast<std::size_t>(i + 1)]; ++ka) {
        auto k = static_cast<std::size_t>(a_col[static_cast<std::size_t>(ka)]);
        if (static_cast<config::size_type>(k) >= inner) {
          throw Validation_error(Validation_reason::bounds, "sparse matmul: column index of the left operand exceeds "
                                 + std::to_string(inner) + " rows of the right operand");
        }
        auto a = a_values[static_cast<std::size_t>(ka)];
        for (auto kb = b_ptr[k]; kb < b_ptr[k + 1]; ++kb) {
          auto j = b_col[static_cast<std::size_t>(kb)];
          if (j < 0 || j >= cols) {
            throw Validation_error(Validation_reason::bounds, "sparse matmul: column index " + std::to_string(j)
                                   + " exceeds " + std::to_string(cols) + " columns of the right operand");
          }
          auto& slot = marker[static_cast<std::size_t>(j)];
          if (slot < 0) {
            slot = static_cast<config::size_type>(row_cols.size());
            row_cols.push_back(j);
            row_sums.push_back(a * b_values[static_cast<std::size_t>(kb)]);
          }
          else {
            row_sums[static_cast<std::size_t>(slot)] += a * b_values[static_cast<std::size_t>(kb)];
          }
        }
      }

      std::vector<std::size_t> order(row_cols.size());
      for (std::size_t n = 0; n < order.size(); ++n) { order[n] = n; }
      std::sort(order.begin(), order.end(), [&](std::size_t x, std::size_t y) { return row_cols[x] < row_cols[y]; });

      for (auto n : order) {
        out_row.push_back(static_cast<I>(i));
        out_col.push_back(row_cols[n]);
        out_values.push_back(row_sums[n]);
        marker[static_cast<std::size_t>(row_cols[n])] = -1;
      }
      out_ptr[static_cast<std::size_t>(i + 1)] = static_cast<I>(out_row.size());
    }

    auto device = A.device();
    out_row.insert(out_row.end(), out_col.begin(), out_col.end());
    typename Edge_index<I>::Cache cache;
    cache.indptr = Buffer<I>{std::move(out_ptr), device};

    return {
      Edge_index<I>::from_buffer(
        Buffer<I>{std::move(out_row), device}, Sparse_size{rows, cols}, Sort_order::row, false, std::move(cache)),
      std::move(out_values)};
  }

  /// Structural product; every edge weighs one.
  template <typename I>
  Sparse_product<I, config::value_type>
  matmul(Edge_index<I>& A, Edge_index<I>& B)
  {
    std::vector<config::value_type> a_values(static_cast<std::size_t>(A.num_edges()), 1);
    std::vector<config::value_type> b_values(static_cast<std::size_t>(B.num_edges()), 1);
    return matmul(A, B, a_values, b_values);
  }

} // end of namespace edgekit::data::detail
