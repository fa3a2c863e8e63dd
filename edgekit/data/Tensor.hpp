#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Buffer.hpp>
#include <edgekit/data/Device.hpp>
#include <edgekit/data/Dtype.hpp>
#include <edgekit/data/errors.hpp>

namespace edgekit::data::detail {

  /**
   * @brief A plain strided array with a runtime element type.
   *
   * Tensor is what an Edge_index degrades to when an operation cannot keep
   * the edge-index metadata: selecting along the coordinate axis,
   * stacking edge lists, casting to a non-index type, or arithmetic. It is
   * also the checked input of Edge_index construction.
   *
   * Views (select, narrow, transpose) alias the storage; every other
   * operation returns a contiguous result.
   */
  class Tensor final {
  public:
    using size_type = config::size_type;
    using Storage = std::variant<
      Buffer<std::uint8_t>,
      Buffer<std::int8_t>,
      Buffer<std::int16_t>,
      Buffer<std::int32_t>,
      Buffer<std::int64_t>,
      Buffer<float>,
      Buffer<double>>;

    template <typename T>
    Tensor(Buffer<T> buffer, std::vector<size_type> shape)
        : Tensor(Storage{std::move(buffer)}, std::move(shape)) {}

    template <typename T>
    Tensor(std::vector<T> values, std::vector<size_type> shape, Device device = Device{})
        : Tensor(Buffer<T>{std::move(values), device}, std::move(shape)) {}

    /**
     * @brief Build a rank-2 tensor from nested rows.
     *
     * @throws Shape_error if the rows have different lengths.
     */
    template <typename T>
    static Tensor
    from_rows(std::initializer_list<std::initializer_list<T>> rows, Device device = Device{}) {
      auto nrow = static_cast<size_type>(rows.size());
      auto ncol = nrow == 0 ? size_type{0} : static_cast<size_type>(rows.begin()->size());

      std::vector<T> values;
      values.reserve(static_cast<std::size_t>(nrow * ncol));
      for (auto const& row : rows) {
        if (static_cast<size_type>(row.size()) != ncol) {
          throw Shape_error("ragged rows: expected every row to hold " + std::to_string(ncol)
                            + " values (got " + std::to_string(row.size()) + ")");
        }
        values.insert(values.end(), row.begin(), row.end());
      }
      return Tensor{std::move(values), {nrow, ncol}, device};
    }

    Dtype
    dtype() const;

    Device
    device() const;

    size_type
    dim() const;

    std::vector<size_type> const&
    shape() const;

    size_type
    size(size_type dim) const;

    size_type
    numel() const;

    std::vector<size_type> const&
    strides() const;

    size_type
    offset() const;

    bool
    is_contiguous() const;

    Tensor
    contiguous() const;

    Tensor
    transpose(size_type dim0, size_type dim1) const;

    /// View with @p dim removed, fixed at @p index.
    Tensor
    select(size_type dim, size_type index) const;

    Tensor
    narrow(size_type dim, size_type start, size_type length) const;

    Tensor
    index_select(size_type dim, std::span<std::int64_t const> index) const;

    Tensor
    to(Dtype dtype) const;

    Tensor
    to(Device device) const;

    Tensor&
    share_memory_();

    bool
    is_shared() const;

    /**
     * @brief Concatenate along @p dim.
     *
     * @throws Dtype_error on mixed element types, Shape_error on
     *         mismatched extents outside @p dim.
     */
    static Tensor
    cat(std::vector<Tensor> const& tensors, size_type dim);

    /// Values in logical row-major order, converted to T.
    template <typename T>
    std::vector<T>
    to_vector() const {
      auto offsets = storage_offsets();
      std::vector<T> out;
      out.reserve(offsets.size());
      std::visit(
        [&](auto const& buffer) {
          auto values = buffer.view();
          for (auto k : offsets) {
            out.push_back(static_cast<T>(values[static_cast<std::size_t>(k)]));
          }
        },
        storage_);
      return out;
    }

    /// The underlying storage. Throws Dtype_error if T is not the dtype.
    template <typename T>
    Buffer<T> const&
    buffer() const {
      if (auto const* buffer = std::get_if<Buffer<T>>(&storage_)) { return *buffer; }
      throw Dtype_error(std::string("tensor holds '") + to_string(dtype()) + "' values, not '"
                        + to_string(dtype_v<T>) + "'");
    }

    template <typename T>
    T
    item(std::initializer_list<size_type> index) const {
      if (static_cast<size_type>(index.size()) != dim()) {
        throw Shape_error("item: expected " + std::to_string(dim()) + " indices");
      }
      size_type k = offset_;
      size_type d = 0;
      for (auto i : index) {
        if (i < 0 || i >= shape_[static_cast<std::size_t>(d)]) {
          throw std::out_of_range("item: index out of range");
        }
        k += i * strides_[static_cast<std::size_t>(d)];
        ++d;
      }
      return std::visit(
        [k](auto const& buffer) { return static_cast<T>(buffer[k]); }, storage_);
    }

    /// Elementwise addition of a scalar; the dtype is kept.
    template <typename U>
    friend Tensor
    operator+(Tensor const& tensor, U scalar) {
      return std::visit(
        [&](auto const& buffer) -> Tensor {
          using T = typename std::decay_t<decltype(buffer)>::value_type;
          auto values = tensor.to_vector<T>();
          for (auto& value : values) {
            value = static_cast<T>(value + scalar);
          }
          return Tensor{std::move(values), tensor.shape_, tensor.device()};
        },
        tensor.storage_);
    }

    /// Same shape and same values, compared after numeric promotion.
    friend bool
    equal(Tensor const& tensor1, Tensor const& tensor2);

  private:
    Tensor(Storage storage, std::vector<size_type> shape);

    Tensor(
      Storage storage,
      std::vector<size_type> shape,
      std::vector<size_type> strides,
      size_type offset);

    size_type
    storage_size() const;

    std::vector<size_type>
    storage_offsets() const;

    void
    check_dim(size_type dim) const;

    Storage storage_;
    std::vector<size_type> shape_;
    std::vector<size_type> strides_;
    size_type offset_{};

  }; // end of class Tensor

  /// "(2, 4)"
  std::string
  shape_to_string(std::vector<config::size_type> const& shape);

} // end of namespace edgekit::data::detail
