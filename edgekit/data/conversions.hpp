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
#include <edgekit/data/Compressed_column_matrix.hpp>
#include <edgekit/data/Compressed_row_matrix.hpp>
#include <edgekit/data/Coordinate_matrix.hpp>
#include <edgekit/data/Dense_matrix.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail {

  namespace conversions_detail {

    template <typename I, typename T>
    std::vector<T>
    edge_values(Edge_index<I> const& A, std::span<T const> values)
    {
      if (static_cast<config::size_type>(values.size()) != A.num_edges()) {
        throw Shape_error("expected one value per edge (" + std::to_string(A.num_edges()) + "), got "
                          + std::to_string(values.size()));
      }
      return {values.begin(), values.end()};
    }

  } // end of namespace conversions_detail

  // -- Dense --

  /// Dense matrix holding @p values at the edge coordinates; duplicates add up.
  template <typename T, typename I>
  Dense_matrix<T>
  to_dense(Edge_index<I>& A, std::span<T const> values)
  {
    auto value = conversions_detail::edge_values(A, values);
    Dense_matrix<T> out(A.get_num_rows(), A.get_num_cols());
    auto row = A.row();
    auto col = A.col();
    for (std::size_t k = 0; k < value.size(); ++k) {
      if (row[k] < 0 || row[k] >= out.rows() || col[k] < 0 || col[k] >= out.cols()) {
        throw Validation_error(
          Validation_reason::bounds,
          "edge (" + std::to_string(row[k]) + ", " + std::to_string(col[k]) + ") lies outside the "
            + std::to_string(out.rows()) + " x " + std::to_string(out.cols()) + " matrix");
      }
      out(row[k], col[k]) += value[k];
    }
    return out;
  }

  /**
   * @brief Dense M x N x F array from one row of @p values per edge.
   *
   * Slice @c out[m] is the N x F matrix of row @c m; the features of
   * duplicate edges add up.
   *
   * @throws Shape_error if @p values does not have one row per edge.
   */
  template <typename T, typename I>
  std::vector<Dense_matrix<T>>
  to_dense(Edge_index<I>& A, Dense_matrix<T> const& values)
  {
    if (values.rows() != A.num_edges()) {
      throw Shape_error("expected one value row per edge (" + std::to_string(A.num_edges()) + "), got "
                        + std::to_string(values.rows()));
    }
    auto num_rows = A.get_num_rows();
    auto num_cols = A.get_num_cols();
    std::vector<Dense_matrix<T>> out(static_cast<std::size_t>(num_rows), Dense_matrix<T>(num_cols, values.cols()));
    auto row = A.row();
    auto col = A.col();
    for (std::size_t k = 0; k < row.size(); ++k) {
      if (row[k] < 0 || row[k] >= num_rows || col[k] < 0 || col[k] >= num_cols) {
        throw Validation_error(
          Validation_reason::bounds,
          "edge (" + std::to_string(row[k]) + ", " + std::to_string(col[k]) + ") lies outside the "
            + std::to_string(num_rows) + " x " + std::to_string(num_cols) + " matrix");
      }
      auto& slice = out[static_cast<std::size_t>(row[k])];
      for (config::size_type f = 0; f < values.cols(); ++f) {
        slice(col[k], f) += values(static_cast<config::size_type>(k), f);
      }
    }
    return out;
  }

  /// Dense matrix with a one at every edge coordinate (duplicates add up).
  template <typename T = config::value_type, typename I>
  Dense_matrix<T>
  to_dense(Edge_index<I>& A)
  {
    std::vector<T> ones(static_cast<std::size_t>(A.num_edges()), T{1});
    return to_dense<T>(A, std::span<T const>{ones});
  }

  // -- COO --

  template <typename T, typename I>
  Coordinate_matrix<I, T>
  to_sparse_coo(Edge_index<I>& A, std::span<T const> values)
  {
    auto row = A.row();
    auto col = A.col();
    return Coordinate_matrix<I, T>{
      Shape{A.get_num_rows(), A.get_num_cols()},
      std::vector<I>(row.begin(), row.end()),
      std::vector<I>(col.begin(), col.end()),
      conversions_detail::edge_values(A, values)};
  }

  template <typename T = config::value_type, typename I>
  Coordinate_matrix<I, T>
  to_sparse_coo(Edge_index<I>& A)
  {
    std::vector<T> ones(static_cast<std::size_t>(A.num_edges()), T{1});
    return to_sparse_coo<T>(A, std::span<T const>{ones});
  }

  // -- CSR --

  /**
   * @brief Compressed row form sharing the cached row pointer array.
   *
   * @throws State_error if @p A is not sorted by row.
   */
  template <typename T, typename I>
  Compressed_row_matrix<I, T>
  to_sparse_csr(Edge_index<I>& A, std::span<T const> values)
  {
    if (!A.is_sorted_by_row()) {
      throw State_error("'Edge_index' is not sorted by row indices; call sort_by(Sort_order::row) first");
    }
    auto value = conversions_detail::edge_values(A, values);
    auto col = A.col();
    return Compressed_row_matrix<I, T>{
      Shape{A.get_num_rows(), A.get_num_cols()},
      A.get_indptr().to_vector(),
      std::vector<I>(col.begin(), col.end()),
      std::move(value)};
  }

  template <typename T = config::value_type, typename I>
  Compressed_row_matrix<I, T>
  to_sparse_csr(Edge_index<I>& A)
  {
    std::vector<T> ones(static_cast<std::size_t>(A.num_edges()), T{1});
    return to_sparse_csr<T>(A, std::span<T const>{ones});
  }

  // -- CSC --

  /**
   * @brief Compressed column form sharing the cached column pointer array.
   *
   * @throws State_error if @p A is not sorted by column.
   */
  template <typename T, typename I>
  Compressed_column_matrix<I, T>
  to_sparse_csc(Edge_index<I>& A, std::span<T const> values)
  {
    if (!A.is_sorted_by_col()) {
      throw State_error("'Edge_index' is not sorted by column indices; call sort_by(Sort_order::col) first");
    }
    auto value = conversions_detail::edge_values(A, values);
    auto row = A.row();
    return Compressed_column_matrix<I, T>{
      Shape{A.get_num_rows(), A.get_num_cols()},
      A.get_indptr().to_vector(),
      std::vector<I>(row.begin(), row.end()),
      std::move(value)};
  }

  template <typename T = config::value_type, typename I>
  Compressed_column_matrix<I, T>
  to_sparse_csc(Edge_index<I>& A)
  {
    std::vector<T> ones(static_cast<std::size_t>(A.num_edges()), T{1});
    return to_sparse_csc<T>(A, std::span<T const>{ones});
  }

} // end of namespace edgekit::data::detail
