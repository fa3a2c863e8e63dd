#include <edgekit/data/Tensor.hpp>

//
// ... Standard header files
//
#include <functional>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace edgekit::data::detail {

  namespace {

    using size_type = config::size_type;

    std::vector<size_type>
    contiguous_strides(std::vector<size_type> const& shape)
    {
      std::vector<size_type> strides(shape.size());
      size_type step = 1;
      for (auto d = static_cast<std::ptrdiff_t>(shape.size()) - 1; d >= 0; --d) {
        strides[static_cast<std::size_t>(d)] = step;
        step *= shape[static_cast<std::size_t>(d)];
      }
      return strides;
    }

    size_type
    product(std::vector<size_type> const& shape, std::size_t first, std::size_t last)
    {
      return std::accumulate(
        shape.begin() + static_cast<std::ptrdiff_t>(first),
        shape.begin() + static_cast<std::ptrdiff_t>(last),
        size_type{1},
        std::multiplies<size_type>{});
    }

  } // end of anonymous namespace

  Tensor::Tensor(Storage storage, std::vector<size_type> shape)
    : storage_(std::move(storage))
    , shape_(std::move(shape))
    , strides_(contiguous_strides(shape_))
    , offset_(0)
  {
    for (auto extent : shape_) {
      if (extent < 0) {
        throw Shape_error("negative extent in shape " + shape_to_string(shape_));
      }
    }
    if (numel() != storage_size()) {
      throw Shape_error("shape " + shape_to_string(shape_) + " does not match "
                        + std::to_string(storage_size()) + " stored values");
    }
  }

  Tensor::Tensor(
    Storage storage,
    std::vector<size_type> shape,
    std::vector<size_type> strides,
    size_type offset)
    : storage_(std::move(storage))
    , shape_(std::move(shape))
    , strides_(std::move(strides))
    , offset_(offset)
  {}

  Dtype
  Tensor::dtype() const
  {
    return std::visit(
      [](auto const& buffer) {
        using T = typename std::decay_t<decltype(buffer)>::value_type;
        return dtype_v<T>;
      },
      storage_);
  }

  Device
  Tensor::device() const
  {
    return std::visit([](auto const& buffer) { return buffer.device(); }, storage_);
  }

  size_type
  Tensor::dim() const { return static_cast<size_type>(shape_.size()); }

  std::vector<size_type> const&
  Tensor::shape() const { return shape_; }

  size_type
  Tensor::size(size_type dim) const
  {
    check_dim(dim);
    return shape_[static_cast<std::size_t>(dim)];
  }

  size_type
  Tensor::numel() const { return product(shape_, 0, shape_.size()); }

  std::vector<size_type> const&
  Tensor::strides() const { return strides_; }

  size_type
  Tensor::offset() const { return offset_; }

  size_type
  Tensor::storage_size() const
  {
    return std::visit([](auto const& buffer) { return buffer.size(); }, storage_);
  }

  void
  Tensor::check_dim(size_type dim) const
  {
    if (dim < 0 || dim >= this->dim()) {
      throw std::out_of_range("dimension " + std::to_string(dim) + " out of range for a tensor of rank "
                              + std::to_string(this->dim()));
    }
  }

  bool
  Tensor::is_contiguous() const
  {
    auto expected = contiguous_strides(shape_);
    for (std::size_t d = 0; d < shape_.size(); ++d) {
      if (shape_[d] > 1 && strides_[d] != expected[d]) { return false; }
    }
    return true;
  }

  std::vector<size_type>
  Tensor::storage_offsets() const
  {
    std::vector<size_type> offsets;
    auto n = numel();
    offsets.reserve(static_cast<std::size_t>(n));
    if (n == 0) { return offsets; }

    std::vector<size_type> counter(shape_.size(), 0);
    for (size_type k = 0; k < n; ++k) {
      size_type position = offset_;
      for (std::size_t d = 0; d < shape_.size(); ++d) {
        position += counter[d] * strides_[d];
      }
      offsets.push_back(position);

      for (auto d = static_cast<std::ptrdiff_t>(shape_.size()) - 1; d >= 0; --d) {
        auto ud = static_cast<std::size_t>(d);
        if (++counter[ud] < shape_[ud]) { break; }
        counter[ud] = 0;
      }
    }
    return offsets;
  }

  Tensor
  Tensor::contiguous() const
  {
    if (is_contiguous() && offset_ == 0 && numel() == storage_size()) { return *this; }
    return std::visit(
      [&](auto const& buffer) -> Tensor {
        using T = typename std::decay_t<decltype(buffer)>::value_type;
        return Tensor{to_vector<T>(), shape_, buffer.device()};
      },
      storage_);
  }

  Tensor
  Tensor::transpose(size_type dim0, size_type dim1) const
  {
    check_dim(dim0);
    check_dim(dim1);
    auto shape = shape_;
    auto strides = strides_;
    std::swap(shape[static_cast<std::size_t>(dim0)], shape[static_cast<std::size_t>(dim1)]);
    std::swap(strides[static_cast<std::size_t>(dim0)], strides[static_cast<std::size_t>(dim1)]);
    return Tensor{storage_, std::move(shape), std::move(strides), offset_};
  }

  Tensor
  Tensor::select(size_type dim, size_type index) const
  {
    check_dim(dim);
    auto ud = static_cast<std::size_t>(dim);
    if (index < 0 || index >= shape_[ud]) {
      throw std::out_of_range("select: index " + std::to_string(index) + " out of range for dimension of size "
                              + std::to_string(shape_[ud]));
    }
    auto shape = shape_;
    auto strides = strides_;
    auto offset = offset_ + index * strides_[ud];
    shape.erase(shape.begin() + dim);
    strides.erase(strides.begin() + dim);
    return Tensor{storage_, std::move(shape), std::move(strides), offset};
  }

  Tensor
  Tensor::narrow(size_type dim, size_type start, size_type length) const
  {
    check_dim(dim);
    auto ud = static_cast<std::size_t>(dim);
    if (start < 0 || length < 0 || start + length > shape_[ud]) {
      throw std::out_of_range("narrow: range [" + std::to_string(start) + ", "
                              + std::to_string(start + length) + ") exceeds dimension of size "
                              + std::to_string(shape_[ud]));
    }
    auto shape = shape_;
    shape[ud] = length;
    return Tensor{storage_, std::move(shape), strides_, offset_ + start * strides_[ud]};
  }

  Tensor
  Tensor::index_select(size_type dim, std::span<std::int64_t const> index) const
  {
    check_dim(dim);
    auto ud = static_cast<std::size_t>(dim);
    auto extent = shape_[ud];
    for (auto i : index) {
      if (i < 0 || i >= extent) {
        throw std::out_of_range("index_select: index " + std::to_string(i)
                                + " out of range for dimension of size " + std::to_string(extent));
      }
    }

    auto outer = product(shape_, 0, ud);
    auto inner = product(shape_, ud + 1, shape_.size());
    auto shape = shape_;
    shape[ud] = static_cast<size_type>(index.size());

    return std::visit(
      [&](auto const& buffer) -> Tensor {
        using T = typename std::decay_t<decltype(buffer)>::value_type;
        auto values = to_vector<T>();
        std::vector<T> out;
        out.reserve(static_cast<std::size_t>(outer * inner) * index.size());
        for (size_type o = 0; o < outer; ++o) {
          for (auto i : index) {
            auto first = values.begin() + (o * extent + i) * inner;
            out.insert(out.end(), first, first + inner);
          }
        }
        return Tensor{std::move(out), std::move(shape), buffer.device()};
      },
      storage_);
  }

  Tensor
  Tensor::to(Dtype dtype) const
  {
    auto device = this->device();
    switch (dtype) {
      case Dtype::uint8: return Tensor{to_vector<std::uint8_t>(), shape_, device};
      case Dtype::int8: return Tensor{to_vector<std::int8_t>(), shape_, device};
      case Dtype::int16: return Tensor{to_vector<std::int16_t>(), shape_, device};
      case Dtype::int32: return Tensor{to_vector<std::int32_t>(), shape_, device};
      case Dtype::int64: return Tensor{to_vector<std::int64_t>(), shape_, device};
      case Dtype::float32: return Tensor{to_vector<float>(), shape_, device};
      case Dtype::float64: return Tensor{to_vector<double>(), shape_, device};
    }
    throw Dtype_error("unknown dtype");
  }

  Tensor
  Tensor::to(Device device) const
  {
    return std::visit(
      [&](auto const& buffer) -> Tensor {
        return Tensor{Storage{buffer.to(device)}, shape_, strides_, offset_};
      },
      storage_);
  }

  Tensor&
  Tensor::share_memory_()
  {
    std::visit([](auto& buffer) { buffer.share_memory_(); }, storage_);
    return *this;
  }

  bool
  Tensor::is_shared() const
  {
    return std::visit([](auto const& buffer) { return buffer.is_shared(); }, storage_);
  }

  Tensor
  Tensor::cat(std::vector<Tensor> const& tensors, size_type dim)
  {
    if (tensors.empty()) {
      throw std::invalid_argument("cat: expected at least one tensor");
    }

    auto const& first = tensors.front();
    first.check_dim(dim);
    auto ud = static_cast<std::size_t>(dim);
    auto shape = first.shape_;
    shape[ud] = 0;

    for (auto const& tensor : tensors) {
      if (tensor.dtype() != first.dtype()) {
        throw Dtype_error(std::string("cat: mixed element types '") + to_string(first.dtype())
                          + "' and '" + to_string(tensor.dtype()) + "'");
      }
      if (!(tensor.device() == first.device())) {
        throw std::invalid_argument("cat: tensors live on different devices");
      }
      if (tensor.dim() != first.dim()) {
        throw Shape_error("cat: tensors of rank " + std::to_string(first.dim()) + " and "
                          + std::to_string(tensor.dim()));
      }
      for (std::size_t d = 0; d < shape.size(); ++d) {
        if (d != ud && tensor.shape_[d] != first.shape_[d]) {
          throw Shape_error("cat: shapes " + shape_to_string(first.shape_) + " and "
                            + shape_to_string(tensor.shape_) + " differ outside dimension "
                            + std::to_string(dim));
        }
      }
      shape[ud] += tensor.shape_[ud];
    }

    auto outer = product(shape, 0, ud);
    auto inner = product(shape, ud + 1, shape.size());

    return std::visit(
      [&](auto const& buffer) -> Tensor {
        using T = typename std::decay_t<decltype(buffer)>::value_type;
        std::vector<std::vector<T>> parts;
        parts.reserve(tensors.size());
        for (auto const& tensor : tensors) {
          parts.push_back(tensor.to_vector<T>());
        }

        std::vector<T> out;
        out.reserve(static_cast<std::size_t>(product(shape, 0, shape.size())));
        for (size_type o = 0; o < outer; ++o) {
          for (std::size_t t = 0; t < tensors.size(); ++t) {
            auto block = tensors[t].shape_[ud] * inner;
            auto start = parts[t].begin() + o * block;
            out.insert(out.end(), start, start + block);
          }
        }
        return Tensor{std::move(out), std::move(shape), buffer.device()};
      },
      first.storage_);
  }

  bool
  equal(Tensor const& tensor1, Tensor const& tensor2)
  {
    if (tensor1.shape_ != tensor2.shape_) { return false; }
    if (is_floating_dtype(tensor1.dtype()) || is_floating_dtype(tensor2.dtype())) {
      return tensor1.to_vector<double>() == tensor2.to_vector<double>();
    }
    return tensor1.to_vector<std::int64_t>() == tensor2.to_vector<std::int64_t>();
  }

  std::string
  shape_to_string(std::vector<config::size_type> const& shape)
  {
    std::ostringstream os;
    os << '(';
    for (std::size_t d = 0; d < shape.size(); ++d) {
      if (d > 0) { os << ", "; }
      os << shape[d];
    }
    os << ')';
    return os.str();
  }

} // end of namespace edgekit::data::detail
