#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Dense_matrix.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/Shape.hpp>
#include <edgekit/data/Spmm_library.hpp>
#include <edgekit/data/errors.hpp>
#include <edgekit/data/log.hpp>

namespace edgekit::data::detail {

  enum class Spmm_backend { library, native, generic };

  char const*
  to_string(Spmm_backend backend);

  std::ostream&
  operator<<(std::ostream& os, Spmm_backend backend);

  /**
   * @brief Pick the backend for a sparse-dense product.
   *
   * An installed library kernel that supports the combination wins; a sum
   * over an edge list sorted by the reduced axis runs the compressed
   * pointer kernel; everything else takes the generic grouped reduction.
   */
  template <typename T, typename I>
  Spmm_backend
  select_spmm_backend(Edge_index<I> const& A, Reduce reduce, bool transpose)
  {
    auto backend = Spmm_backend::generic;
    if (Spmm_library<I, T>::instance().supports(reduce, transpose)) {
      backend = Spmm_backend::library;
    }
    else if (reduce == Reduce::sum && A.sort_order() == (transpose ? Sort_order::col : Sort_order::row)) {
      backend = Spmm_backend::native;
    }
    EDGEKIT_LOG_DEBUG("spmm: reduce=" << reduce << " transpose=" << transpose << " -> " << backend << " backend");
    return backend;
  }

  /**
   * @brief A sparse-dense product together with what its backward pass
   *        needs.
   *
   * Without transpose, out[r] reduces v * X[c] over the edges (r, c) and
   * has one row per sparse row; with transpose the roles of rows and
   * columns swap. Rows without edges are zero.
   *
   * Construction runs the forward pass.
   */
  template <typename I, typename T>
  class Spmm_context final {
  public:
    using size_type = config::size_type;

    /**
     * @throws Shape_error if @p other has fewer rows than the gathered
     *         axis or @p value does not hold one entry per edge
     */
    Spmm_context(
      Edge_index<I>& index,
      Dense_matrix<T> other,
      std::optional<std::vector<T>> value,
      Reduce reduce,
      bool transpose)
        : index_(index)
        , value_(std::move(value))
        , other_(std::move(other))
        , reduce_(reduce)
        , transpose_(transpose)
        , backend_(select_spmm_backend<T>(index, reduce, transpose))
        , output_(0, 0) {
      auto rows = index.get_num_rows();
      auto cols = index.get_num_cols();
      auto gathered = transpose_ ? rows : cols;
      auto reduced = transpose_ ? cols : rows;

      if (value_ && static_cast<size_type>(value_->size()) != index.num_edges()) {
        throw Shape_error("spmm: expected one value per edge (" + std::to_string(index.num_edges()) + "), got "
                          + std::to_string(value_->size()));
      }
      if (other_.rows() < gathered) {
        throw Shape_error("spmm: the dense operand has " + std::to_string(other_.rows())
                          + " rows, expected at least " + std::to_string(gathered));
      }
      check_bounds(index, reduced);

      switch (backend_) {
        case Spmm_backend::library:
          output_ = Spmm_library<I, T>::instance().forward(operands(index));
          if (auto expected = Shape{reduced, other_.cols()}; !(output_.shape() == expected)) {
            throw Shape_error("spmm: library kernel returned a " + to_string(output_.shape()) + " result, expected "
                              + to_string(expected));
          }
          break;
        case Spmm_backend::native:
          output_ = native_forward(index, reduced);
          break;
        case Spmm_backend::generic:
          output_ = generic_forward(index, reduced);
          break;
      }
      index_ = index;
    }

    Dense_matrix<T> const&
    output() const {
      return output_;
    }

    Spmm_backend
    backend() const {
      return backend_;
    }

    Reduce
    reduce() const {
      return reduce_;
    }

    bool
    transpose() const {
      return transpose_;
    }

    /**
     * @brief Gradients of a scalar loss given its gradient @p grad_output
     *        with respect to output().
     *
     * The gradient with respect to the dense operand exists for every
     * reduction: min and max route it to the selected edge, mean divides
     * it by the group size. The gradient with respect to the edge values
     * exists for sum only.
     *
     * @throws Shape_error if @p grad_output does not match output(),
     *         Not_implemented_error for a value gradient of a non-sum
     *         reduction or a library kernel without backward
     */
    Spmm_gradients<T>
    backward(Dense_matrix<T> const& grad_output, Requires_grad requires_grad = {}) const {
      if (!(grad_output.shape() == output_.shape())) {
        throw Shape_error("spmm backward: gradient of shape " + to_string(grad_output.shape())
                          + " does not match the " + to_string(output_.shape()) + " output");
      }
      if (requires_grad.value) {
        if (reduce_ != Reduce::sum) {
          throw Not_implemented_error(
            std::string("spmm backward: the gradient with respect to the edge values is only defined for "
                        "reduce='sum' (got '") + to_string(reduce_) + "')");
        }
        if (!value_) {
          throw std::invalid_argument("spmm backward: no edge values to differentiate");
        }
      }
      if (backend_ == Spmm_backend::library) {
        return Spmm_library<I, T>::instance().backward(operands(index_), grad_output, requires_grad);
      }

      Spmm_gradients<T> out;
      if (requires_grad.other) { out.other = other_gradient(grad_output); }
      if (requires_grad.value) { out.value = value_gradient(grad_output); }
      return out;
    }

  private:
    std::span<I const>
    gather_axis(Edge_index<I> const& index) const {
      return transpose_ ? index.row() : index.col();
    }

    std::span<I const>
    group_axis(Edge_index<I> const& index) const {
      return transpose_ ? index.col() : index.row();
    }

    T
    weight(std::size_t k) const {
      return value_ ? (*value_)[k] : T{1};
    }

    Spmm_operands<I, T>
    operands(Edge_index<I> const& index) const {
      std::optional<std::span<T const>> value;
      if (value_) { value = std::span<T const>{*value_}; }
      return {index.row(),
              index.col(),
              value,
              Shape{*index.num_rows(), *index.num_cols()},
              other_,
              reduce_,
              transpose_};
    }

    void
    check_bounds(Edge_index<I> const& index, size_type reduced) const {
      auto gather = gather_axis(index);
      auto group = group_axis(index);
      for (std::size_t k = 0; k < gather.size(); ++k) {
        if (group[k] < 0 || group[k] >= reduced || gather[k] < 0 || gather[k] >= other_.rows()) {
          throw Validation_error(
            Validation_reason::bounds,
            "spmm: edge (" + std::to_string(index.row()[k]) + ", " + std::to_string(index.col()[k])
              + ") lies outside the operands");
        }
      }
    }

    // Sum over the compressed pointer array of the reduced axis.
    Dense_matrix<T>
    native_forward(Edge_index<I>& index, size_type reduced) const {
      auto indptr = index.get_indptr().view();
      auto gather = gather_axis(index);
      auto features = other_.cols();

      Dense_matrix<T> out(reduced, features);
      for (size_type g = 0; g < reduced; ++g) {
        for (auto k = indptr[static_cast<std::size_t>(g)]; k < indptr[static_cast<std::size_t>(g + 1)]; ++k) {
          auto w = weight(static_cast<std::size_t>(k));
          auto x = other_.row(gather[static_cast<std::size_t>(k)]);
          for (size_type f = 0; f < features; ++f) {
            out(g, f) += w * x[static_cast<std::size_t>(f)];
          }
        }
      }
      return out;
    }

    // Grouped reduction: walks the pointer array when the edges are sorted
    // by the reduced axis, otherwise scatters edge by edge.
    Dense_matrix<T>
    generic_forward(Edge_index<I>& index, size_type reduced) {
      auto gather = gather_axis(index);
      auto group = group_axis(index);
      auto features = other_.cols();
      auto edges = gather.size();

      Dense_matrix<T> out(reduced, features);
      count_.assign(static_cast<std::size_t>(reduced), 0);
      for (auto g : group) { ++count_[static_cast<std::size_t>(g)]; }

      bool extremum = reduce_ == Reduce::min || reduce_ == Reduce::max;
      if (extremum) { arg_.assign(static_cast<std::size_t>(reduced * features), -1); }

      auto accumulate = [&](std::size_t k) {
        auto g = static_cast<size_type>(group[k]);
        auto w = weight(k);
        auto x = other_.row(gather[k]);
        for (size_type f = 0; f < features; ++f) {
          auto candidate = w * x[static_cast<std::size_t>(f)];
          if (!extremum) {
            out(g, f) += candidate;
            continue;
          }
          auto& arg = arg_[static_cast<std::size_t>(g * features + f)];
          bool better = reduce_ == Reduce::min ? candidate < out(g, f) : candidate > out(g, f);
          if (arg < 0 || better) {
            out(g, f) = candidate;
            arg = static_cast<std::int64_t>(k);
          }
        }
      };

      if (index.sort_order() == (transpose_ ? Sort_order::col : Sort_order::row)) {
        auto indptr = index.get_indptr().view();
        for (size_type g = 0; g < reduced; ++g) {
          for (auto k = indptr[static_cast<std::size_t>(g)]; k < indptr[static_cast<std::size_t>(g + 1)]; ++k) {
            accumulate(static_cast<std::size_t>(k));
          }
        }
      }
      else {
        for (std::size_t k = 0; k < edges; ++k) { accumulate(k); }
      }

      if (reduce_ == Reduce::mean) {
        for (size_type g = 0; g < reduced; ++g) {
          auto n = count_[static_cast<std::size_t>(g)];
          if (n == 0) { continue; }
          for (size_type f = 0; f < features; ++f) {
            out(g, f) /= static_cast<T>(n);
          }
        }
      }
      return out;
    }

    Dense_matrix<T>
    other_gradient(Dense_matrix<T> const& grad_output) const {
      auto gather = gather_axis(index_);
      auto group = group_axis(index_);
      auto features = other_.cols();
      Dense_matrix<T> grad(other_.rows(), features);

      if (reduce_ == Reduce::min || reduce_ == Reduce::max) {
        for (size_type g = 0; g < output_.rows(); ++g) {
          for (size_type f = 0; f < features; ++f) {
            auto k = arg_[static_cast<std::size_t>(g * features + f)];
            if (k < 0) { continue; }
            auto uk = static_cast<std::size_t>(k);
            grad(gather[uk], f) += weight(uk) * grad_output(g, f);
          }
        }
        return grad;
      }

      for (std::size_t k = 0; k < gather.size(); ++k) {
        auto g = static_cast<size_type>(group[k]);
        auto w = weight(k);
        if (reduce_ == Reduce::mean) { w /= static_cast<T>(count_[static_cast<std::size_t>(g)]); }
        for (size_type f = 0; f < features; ++f) {
          grad(gather[k], f) += w * grad_output(g, f);
        }
      }
      return grad;
    }

    std::vector<T>
    value_gradient(Dense_matrix<T> const& grad_output) const {
      auto gather = gather_axis(index_);
      auto group = group_axis(index_);
      auto features = other_.cols();
      std::vector<T> grad(gather.size(), T{0});
      for (std::size_t k = 0; k < gather.size(); ++k) {
        auto g = static_cast<size_type>(group[k]);
        auto s = static_cast<size_type>(gather[k]);
        for (size_type f = 0; f < features; ++f) {
          grad[k] += grad_output(g, f) * other_(s, f);
        }
      }
      return grad;
    }

    Edge_index<I> index_;
    std::optional<std::vector<T>> value_;
    Dense_matrix<T> other_;
    Reduce reduce_;
    bool transpose_;
    Spmm_backend backend_;
    Dense_matrix<T> output_;
    std::vector<std::int64_t> arg_;
    std::vector<size_type> count_;

  }; // end of class Spmm_context

  /**
   * @brief Sparse-dense product of @p A (optionally weighted by @p value)
   *        and @p other, reduced by @p reduce.
   */
  template <typename I, typename T>
  Spmm_context<I, T>
  spmm(
    Edge_index<I>& A,
    Dense_matrix<T> const& other,
    std::type_identity_t<std::optional<std::vector<T>>> value = std::nullopt,
    Reduce reduce = Reduce::sum,
    bool transpose = false)
  {
    return Spmm_context<I, T>{A, other, std::move(value), reduce, transpose};
  }

  template <typename I, typename T>
  Dense_matrix<T>
  matmul(
    Edge_index<I>& A,
    Dense_matrix<T> const& other,
    std::type_identity_t<std::optional<std::vector<T>>> value = std::nullopt,
    Reduce reduce = Reduce::sum,
    bool transpose = false)
  {
    return spmm(A, other, std::move(value), reduce, transpose).output();
  }

  /// Product with a vector, treated as a single-column matrix.
  template <typename I, typename T>
  std::vector<T>
  matmul(
    Edge_index<I>& A,
    std::vector<T> const& other,
    std::type_identity_t<std::optional<std::vector<T>>> value = std::nullopt,
    Reduce reduce = Reduce::sum,
    bool transpose = false)
  {
    auto out = matmul(A, Dense_matrix<T>::column(other), std::move(value), reduce, transpose);
    auto values = out.values();
    return {values.begin(), values.end()};
  }

} // end of namespace edgekit::data::detail
