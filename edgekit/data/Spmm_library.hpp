#pragma once

//
// ... Standard header files
//
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/Dense_matrix.hpp>
#include <edgekit/data/Shape.hpp>
#include <edgekit/data/errors.hpp>
#include <edgekit/data/log.hpp>

namespace edgekit::data::detail {

  /// Reduction applied to the edges that share an output row.
  enum class Reduce { sum, mean, min, max };

  char const*
  to_string(Reduce reduce);

  /// "sum", "mean", "min" or "max"; anything else is std::invalid_argument.
  Reduce
  reduce_from_string(std::string_view name);

  std::ostream&
  operator<<(std::ostream& os, Reduce reduce);

  /// Which inputs of a sparse-dense product need a gradient.
  struct Requires_grad {
    bool other = true;
    bool value = false;
  };

  /// Gradients of a sparse-dense product; a field is set when it was requested.
  template <typename T>
  struct Spmm_gradients {
    std::optional<Dense_matrix<T>> other;
    std::optional<std::vector<T>> value;
  };

  /**
   * @brief Everything a sparse-dense kernel sees: coordinates, optional
   *        edge values, the M x N shape of the sparse operand, the dense
   *        operand, and the reduction.
   */
  template <typename I, typename T>
  struct Spmm_operands {
    std::span<I const> row;
    std::span<I const> col;
    std::optional<std::span<T const>> value;
    Shape shape;
    Dense_matrix<T> const& other;
    Reduce reduce;
    bool transpose;
  };

  /**
   * @brief Process-wide slot for an accelerated sparse-dense kernel.
   *
   * A kernel announces which reduce/transpose combinations it handles;
   * the multiplication engine asks before every call and falls back to
   * the built-in backends otherwise. A kernel without a backward function
   * cannot propagate gradients.
   */
  template <typename I, typename T>
  class Spmm_library final {
  public:
    using Supports = std::function<bool(Reduce reduce, bool transpose)>;
    using Forward = std::function<Dense_matrix<T>(Spmm_operands<I, T> const& operands)>;
    using Backward = std::function<Spmm_gradients<T>(
      Spmm_operands<I, T> const& operands,
      Dense_matrix<T> const& grad_output,
      Requires_grad requires_grad)>;

    struct Kernel {
      std::string name;
      Supports supports;
      Forward forward;
      Backward backward;
    };

    static Spmm_library&
    instance() {
      static Spmm_library library;
      return library;
    }

    Spmm_library(Spmm_library const&) = delete;
    Spmm_library&
    operator=(Spmm_library const&) = delete;

    /// Replace the installed kernel. @throws std::invalid_argument if supports or forward is empty.
    void
    install(Kernel kernel) {
      if (!kernel.supports || !kernel.forward) {
        throw std::invalid_argument("Spmm_library: kernel '" + kernel.name + "' needs supports and forward functions");
      }
      EDGEKIT_LOG_INFO("Spmm_library: installing kernel '" << kernel.name << "'");
      std::lock_guard<std::mutex> lock(mutex_);
      kernel_ = std::move(kernel);
    }

    void
    uninstall() {
      std::lock_guard<std::mutex> lock(mutex_);
      kernel_.reset();
    }

    bool
    installed() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return kernel_.has_value();
    }

    std::optional<std::string>
    name() const {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!kernel_) { return std::nullopt; }
      return kernel_->name;
    }

    bool
    supports(Reduce reduce, bool transpose) const {
      auto kernel = snapshot();
      return kernel && kernel->supports(reduce, transpose);
    }

    /// @throws State_error if no kernel is installed.
    Dense_matrix<T>
    forward(Spmm_operands<I, T> const& operands) const {
      auto kernel = snapshot();
      if (!kernel) {
        throw State_error("Spmm_library: no kernel installed");
      }
      return kernel->forward(operands);
    }

    /// @throws Not_implemented_error if the kernel has no backward function.
    Spmm_gradients<T>
    backward(
      Spmm_operands<I, T> const& operands,
      Dense_matrix<T> const& grad_output,
      Requires_grad requires_grad) const {
      auto kernel = snapshot();
      if (!kernel || !kernel->backward) {
        throw Not_implemented_error(
          "Spmm_library: kernel '" + (kernel ? kernel->name : std::string("<none>")) + "' has no backward");
      }
      return kernel->backward(operands, grad_output, requires_grad);
    }

  private:
    Spmm_library() = default;

    std::optional<Kernel>
    snapshot() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return kernel_;
    }

    mutable std::mutex mutex_;
    std::optional<Kernel> kernel_;

  }; // end of class Spmm_library

} // end of namespace edgekit::data::detail
