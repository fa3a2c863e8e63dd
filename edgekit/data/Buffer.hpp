#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <memory>
#include <span>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Device.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Reference-counted, device-tagged contiguous storage.
   *
   * Copies of a Buffer alias the same values; clone() and a move to
   * another device produce independent storage. The shared-memory flag
   * lives with the storage, so every alias observes share_memory_().
   */
  template <typename T>
  class Buffer final {
  public:
    using size_type = config::size_type;
    using value_type = T;

    Buffer()
        : Buffer(std::vector<T>{}) {}

    explicit Buffer(std::vector<T> values, Device device = Device{})
        : block_(std::make_shared<Block>(Block{std::move(values), false}))
        , device_(device) {}

    size_type
    size() const {
      return static_cast<size_type>(block_->values.size());
    }

    bool
    empty() const {
      return block_->values.empty();
    }

    std::span<T const>
    view() const {
      return block_->values;
    }

    T
    operator[](size_type k) const {
      return block_->values[static_cast<std::size_t>(k)];
    }

    std::vector<T>
    to_vector() const {
      return block_->values;
    }

    Device
    device() const {
      return device_;
    }

    bool
    is_shared() const {
      return block_->shared;
    }

    /// Mark the storage as living in shared memory.
    void
    share_memory_() {
      block_->shared = true;
    }

    bool
    aliases(Buffer const& other) const {
      return block_ == other.block_;
    }

    Buffer
    clone() const {
      return Buffer{block_->values, device_};
    }

    Buffer
    to(Device device) const {
      if (device == device_) { return *this; }
      return Buffer{block_->values, device};
    }

    template <typename U>
    Buffer<U>
    cast() const {
      std::vector<U> values(block_->values.size());
      std::transform(
        block_->values.begin(), block_->values.end(), values.begin(),
        [](T value) { return static_cast<U>(value); });
      return Buffer<U>{std::move(values), device_};
    }

    friend bool
    operator==(Buffer const& buffer1, Buffer const& buffer2) {
      return buffer1.block_->values == buffer2.block_->values;
    }

  private:
    struct Block {
      std::vector<T> values;
      bool shared;
    };

    std::shared_ptr<Block> block_;
    Device device_;

  }; // end of class Buffer

} // end of namespace edgekit::data::detail
