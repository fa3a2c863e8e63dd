#pragma once

//
// ... Standard header files
//
#include <initializer_list>
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
   * @brief Row-major dense matrix: the right-hand operand and the output of
   *        sparse-dense multiplication, and the target of to_dense.
   */
  template <typename T = config::value_type>
  class Dense_matrix final {
  public:
    using size_type = config::size_type;
    using value_type = T;

    Dense_matrix(size_type rows, size_type cols, T fill = T{0})
        : shape_(rows, cols)
        , values_(static_cast<std::size_t>(rows * cols), fill) {}

    Dense_matrix(size_type rows, size_type cols, std::vector<T> values)
        : shape_(rows, cols)
        , values_(std::move(values)) {
      if (static_cast<size_type>(values_.size()) != rows * cols) {
        throw Shape_error("Dense_matrix: " + std::to_string(values_.size()) + " values do not fill a "
                          + std::to_string(rows) + " x " + std::to_string(cols) + " matrix");
      }
    }

    /// @throws Shape_error if the rows have different lengths.
    Dense_matrix(std::initializer_list<std::initializer_list<T>> rows)
        : Dense_matrix(
            static_cast<size_type>(rows.size()),
            rows.size() == 0 ? size_type{0} : static_cast<size_type>(rows.begin()->size())) {
      size_type r = 0;
      for (auto const& row : rows) {
        if (static_cast<size_type>(row.size()) != shape_.column()) {
          throw Shape_error("Dense_matrix: ragged rows");
        }
        size_type c = 0;
        for (auto value : row) {
          (*this)(r, c++) = value;
        }
        ++r;
      }
    }

    /// A column vector holding @p values.
    static Dense_matrix
    column(std::vector<T> values) {
      auto rows = static_cast<size_type>(values.size());
      return Dense_matrix{rows, 1, std::move(values)};
    }

    Shape
    shape() const {
      return shape_;
    }

    size_type
    rows() const {
      return shape_.row();
    }

    size_type
    cols() const {
      return shape_.column();
    }

    T&
    operator()(size_type row, size_type col) {
      return values_[static_cast<std::size_t>(row * shape_.column() + col)];
    }

    T
    operator()(size_type row, size_type col) const {
      return values_[static_cast<std::size_t>(row * shape_.column() + col)];
    }

    std::span<T const>
    row(size_type r) const {
      return std::span<T const>{values_}.subspan(
        static_cast<std::size_t>(r * shape_.column()), static_cast<std::size_t>(shape_.column()));
    }

    std::span<T const>
    values() const {
      return values_;
    }

    friend bool
    operator==(Dense_matrix const& a, Dense_matrix const& b) {
      return a.shape_ == b.shape_ && a.values_ == b.values_;
    }

  private:
    Shape shape_;
    std::vector<T> values_;

  }; // end of class Dense_matrix

  /// Dense product A B.
  template <typename T>
  Dense_matrix<T>
  multiply(Dense_matrix<T> const& A, Dense_matrix<T> const& B)
  {
    if (A.cols() != B.rows()) {
      throw Shape_error("multiply: inner dimensions " + std::to_string(A.cols()) + " and "
                        + std::to_string(B.rows()) + " differ");
    }
    Dense_matrix<T> C(A.rows(), B.cols());
    for (config::size_type i = 0; i < A.rows(); ++i) {
      for (config::size_type k = 0; k < A.cols(); ++k) {
        auto a = A(i, k);
        for (config::size_type j = 0; j < B.cols(); ++j) {
          C(i, j) += a * B(k, j);
        }
      }
    }
    return C;
  }

  template <typename T>
  Dense_matrix<T>
  transpose(Dense_matrix<T> const& A)
  {
    Dense_matrix<T> out(A.cols(), A.rows());
    for (config::size_type i = 0; i < A.rows(); ++i) {
      for (config::size_type j = 0; j < A.cols(); ++j) {
        out(j, i) = A(i, j);
      }
    }
    return out;
  }

} // end of namespace edgekit::data::detail
