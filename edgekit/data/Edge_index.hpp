#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <array>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Buffer.hpp>
#include <edgekit/data/Device.hpp>
#include <edgekit/data/Dtype.hpp>
#include <edgekit/data/Edge_index_cache.hpp>
#include <edgekit/data/Sort_order.hpp>
#include <edgekit/data/Tensor.hpp>
#include <edgekit/data/cache_derivation.hpp>
#include <edgekit/data/errors.hpp>
#include <edgekit/data/log.hpp>
#include <edgekit/data/permutation.hpp>

namespace edgekit::data::detail {

  template <typename I>
  class Edge_index;

  /**
   * @brief Result of Edge_index::sort_by: the sorted container and the
   *        gather permutation from the original order.
   */
  template <typename I>
  struct Sort_result {
    Edge_index<I> values;
    Permutation indices;
  };

  /**
   * @brief A 2 x E edge list (row = data[0], col = data[1]) with cached
   *        derived structures.
   *
   * The container tracks its sparse size, an optional sort order and a
   * symmetry flag, and lazily caches the compressed pointer array of the
   * sort axis, the transpose permutation with the transposed coordinates,
   * and the compressed pointer array of the transposed order. Declared
   * metadata is trusted until validate() is called.
   *
   * Copies share the underlying buffers; clone() produces independent
   * storage. Structural operations return new containers and leave this
   * one untouched, except for lazy cache fills.
   */
  template <typename I = config::index_type>
  class Edge_index final {
    static_assert(is_index_type_v<I>, "Edge_index holds 32- or 64-bit signed indices");

  public:
    using size_type = config::size_type;
    using index_type = I;
    using Cache = Edge_index_cache<I>;

    /**
     * @brief Wrap a 2 x E tensor.
     *
     * @throws Shape_error if @p data is not 2 x E,
     *         Dtype_error if its element type is not I,
     *         Layout_error if it is not contiguous.
     */
    explicit Edge_index(
      Tensor const& data,
      Sparse_size sparse_size = {},
      std::optional<Sort_order> sort_order = std::nullopt,
      bool is_undirected = false)
        : Edge_index(
            checked_buffer(data),
            sparse_size,
            sort_order,
            is_undirected,
            Cache{}) {}

    Edge_index(
      std::initializer_list<std::initializer_list<I>> data,
      Sparse_size sparse_size = {},
      std::optional<Sort_order> sort_order = std::nullopt,
      bool is_undirected = false,
      Device device = Device{})
        : Edge_index(
            Tensor::from_rows<I>(data, device),
            sparse_size,
            sort_order,
            is_undirected) {}

    /// @throws Shape_error if @p row and @p col differ in length.
    Edge_index(
      std::vector<I> const& row,
      std::vector<I> const& col,
      Sparse_size sparse_size = {},
      std::optional<Sort_order> sort_order = std::nullopt,
      bool is_undirected = false,
      Device device = Device{})
        : Edge_index(
            joined_buffer(row, col, device),
            sparse_size,
            sort_order,
            is_undirected,
            Cache{}) {}

    /**
     * @brief Assemble a container from its parts without any checks.
     *
     * @p data holds the row array followed by the column array.
     */
    static Edge_index
    from_buffer(
      Buffer<I> data,
      Sparse_size sparse_size,
      std::optional<Sort_order> sort_order,
      bool is_undirected,
      Cache cache = {}) {
      return Edge_index{std::move(data), sparse_size, sort_order, is_undirected, std::move(cache)};
    }

    // -- Metadata --

    size_type
    num_edges() const {
      return num_edges_;
    }

    /// {2, E}
    std::array<size_type, 2>
    size() const {
      return {2, num_edges_};
    }

    Dtype
    dtype() const {
      return dtype_v<I>;
    }

    Device
    device() const {
      return data_.device();
    }

    bool
    is_contiguous() const {
      return true;
    }

    bool
    is_shared() const {
      return data_.is_shared() && cache_.is_shared();
    }

    std::span<I const>
    row() const {
      return data_.view().first(static_cast<std::size_t>(num_edges_));
    }

    std::span<I const>
    col() const {
      return data_.view().subspan(static_cast<std::size_t>(num_edges_));
    }

    Sparse_size const&
    sparse_size() const {
      return sparse_size_;
    }

    std::optional<size_type>
    num_rows() const {
      return sparse_size_[0];
    }

    std::optional<size_type>
    num_cols() const {
      return sparse_size_[1];
    }

    /// Declared number of rows, else inferred and stored.
    size_type
    get_num_rows() {
      return infer_axis(0);
    }

    /// Declared number of columns, else inferred and stored.
    size_type
    get_num_cols() {
      return infer_axis(1);
    }

    Sparse_size
    get_sparse_size() {
      infer_axis(0);
      infer_axis(1);
      return sparse_size_;
    }

    std::optional<Sort_order>
    sort_order() const {
      return sort_order_;
    }

    bool
    is_sorted() const {
      return sort_order_.has_value();
    }

    bool
    is_sorted_by_row() const {
      return sort_order_ == Sort_order::row;
    }

    bool
    is_sorted_by_col() const {
      return sort_order_ == Sort_order::col;
    }

    bool
    is_undirected() const {
      return is_undirected_;
    }

    // -- Cache peeks --

    std::optional<Buffer<I>> const&
    indptr() const {
      return cache_.indptr;
    }

    std::optional<Buffer<std::int64_t>> const&
    T_perm() const {
      return cache_.T_perm;
    }

    std::optional<Coordinate_pair<I>> const&
    T_index() const {
      return cache_.T_index;
    }

    std::optional<Buffer<I>> const&
    T_indptr() const {
      return cache_.T_indptr;
    }

    Cache const&
    cache() const {
      return cache_;
    }

    // -- Lazy cache accessors --

    /**
     * @brief Compressed pointer array of the sort axis.
     *
     * @throws State_error if the sort order is unknown.
     */
    Buffer<I> const&
    get_indptr() {
      auto order = require_sorted("get_indptr");
      if (!cache_.indptr) {
        auto axis_size = primary_axis(order) == 0 ? get_num_rows() : get_num_cols();
        EDGEKIT_LOG_DEBUG("Edge_index: building indptr over " << axis_size << " " << order << "s");
        cache_.indptr = Buffer<I>{compute_indptr<I>(primary_values(order), axis_size), device()};
      }
      return *cache_.indptr;
    }

    /// Permutation from the current order to the order sorted by the other axis.
    Buffer<std::int64_t> const&
    get_T_perm() {
      fill_transpose("get_T_perm");
      return *cache_.T_perm;
    }

    /// Row and column arrays sorted by the other axis.
    Coordinate_pair<I> const&
    get_T_index() {
      fill_transpose("get_T_index");
      return *cache_.T_index;
    }

    /**
     * @brief Compressed pointer array of the transposed order.
     *
     * An undirected container answers with its forward pointer array and
     * never stores a transposed one.
     */
    Buffer<I> const&
    get_T_indptr() {
      auto order = require_sorted("get_T_indptr");
      if (is_undirected_) { return get_indptr(); }
      if (!cache_.T_indptr) {
        auto const& t_index = get_T_index();
        auto other = transposed(order);
        auto axis_size = primary_axis(other) == 0 ? get_num_rows() : get_num_cols();
        auto values = primary_axis(other) == 0 ? t_index.row.view() : t_index.col.view();
        cache_.T_indptr = Buffer<I>{compute_indptr<I>(values, axis_size), device()};
      }
      return *cache_.T_indptr;
    }

    /**
     * @brief Materialize indptr, the transpose permutation and indices,
     *        and (unless undirected) the transposed pointer array.
     *
     * Either every field is stored or, on failure, none is.
     *
     * @throws State_error if the sort order is unknown.
     */
    Edge_index&
    fill_cache_() {
      auto order = require_sorted("fill_cache_");
      auto sparse_size = inferred_sparse_size();
      auto cache = cache_;

      auto size_of = [&](int axis) { return *sparse_size[static_cast<std::size_t>(axis)]; };
      auto other = transposed(order);

      if (!cache.indptr) {
        cache.indptr = Buffer<I>{compute_indptr<I>(primary_values(order), size_of(primary_axis(order))), device()};
      }
      if (!cache.T_perm || !cache.T_index) {
        auto t = compute_transpose<I>(row(), col(), order, size_of(primary_axis(other)), is_undirected_);
        cache.T_perm = Buffer<std::int64_t>{std::move(t.perm), device()};
        cache.T_index = Coordinate_pair<I>{Buffer<I>{std::move(t.row), device()}, Buffer<I>{std::move(t.col), device()}};
        if (t.indptr && !cache.T_indptr) {
          cache.T_indptr = Buffer<I>{std::move(*t.indptr), device()};
        }
      }
      if (!is_undirected_ && !cache.T_indptr) {
        auto values = primary_axis(other) == 0 ? cache.T_index->row.view() : cache.T_index->col.view();
        cache.T_indptr = Buffer<I>{compute_indptr<I>(values, size_of(primary_axis(other))), device()};
      }

      EDGEKIT_LOG_DEBUG("Edge_index: filled cache for " << num_edges_ << " edges sorted by " << order);
      sparse_size_ = sparse_size;
      cache_ = std::move(cache);
      return *this;
    }

    // -- Validation --

    /**
     * @brief Check every invariant against the data.
     *
     * @returns *this
     * @throws Validation_error naming the violated invariant
     */
    Edge_index const&
    validate() const {
      auto r = row();
      auto c = col();

      for (std::size_t axis = 0; axis < 2; ++axis) {
        auto values = axis == 0 ? r : c;
        auto name = axis == 0 ? "row" : "column";
        if (values.empty()) { continue; }
        auto [min, max] = std::minmax_element(values.begin(), values.end());
        if (*min < 0) {
          fail(Validation_reason::bounds,
               std::string("'Edge_index' contains negative ") + name + " indices (got " + std::to_string(*min) + ")");
        }
        if (sparse_size_[axis] && *max >= *sparse_size_[axis]) {
          fail(Validation_reason::bounds,
               std::string("'Edge_index' contains larger ") + name + " indices than its number of "
                 + name + "s (got " + std::to_string(*max) + ", but expected values smaller than "
                 + std::to_string(*sparse_size_[axis]) + ")");
        }
      }

      if (sort_order_ && !is_non_decreasing(primary_values(*sort_order_))) {
        fail(Validation_reason::order,
             std::string("'Edge_index' is not sorted by ") + (is_sorted_by_row() ? "row" : "column") + " indices");
      }

      if (is_undirected_) {
        if (sparse_size_[0] && sparse_size_[1] && *sparse_size_[0] != *sparse_size_[1]) {
          fail(Validation_reason::size,
               "'Edge_index' is undirected but its sparse size " + to_string(sparse_size_) + " is not square");
        }
        auto forward = sort_permutation(r, c);
        auto backward = sort_permutation(c, r);
        for (std::size_t k = 0; k < forward.size(); ++k) {
          auto f = static_cast<std::size_t>(forward[k]);
          auto b = static_cast<std::size_t>(backward[k]);
          if (r[f] != c[b] || c[f] != r[b]) {
            fail(Validation_reason::symmetry, "'Edge_index' is not undirected");
          }
        }
        if (cache_.T_indptr) {
          fail(Validation_reason::transpose, "'Edge_index' is undirected but caches a transposed pointer array");
        }
      }

      if (cache_.indptr) {
        if (!sort_order_) {
          fail(Validation_reason::indptr, "'Edge_index' caches a pointer array without a sort order");
        }
        check_indptr(*cache_.indptr, primary_axis(*sort_order_), "indptr");
      }

      if (cache_.T_perm || cache_.T_index) {
        if (!sort_order_ || !cache_.T_perm || !cache_.T_index) {
          fail(Validation_reason::transpose, "'Edge_index' caches an incomplete transpose");
        }
        auto perm = cache_.T_perm->view();
        if (static_cast<size_type>(perm.size()) != num_edges_ || !is_valid_permutation(perm)) {
          fail(Validation_reason::transpose, "'Edge_index' caches an invalid transpose permutation");
        }
        auto t_row = apply_permutation<I>(r, perm);
        auto t_col = apply_permutation<I>(c, perm);
        if (!std::ranges::equal(t_row, cache_.T_index->row.view())
            || !std::ranges::equal(t_col, cache_.T_index->col.view())) {
          fail(Validation_reason::transpose, "'Edge_index' caches transposed indices that do not match its data");
        }
        auto other = transposed(*sort_order_);
        auto const& t_primary = primary_axis(other) == 0 ? t_row : t_col;
        if (!std::is_sorted(t_primary.begin(), t_primary.end())) {
          fail(Validation_reason::transpose,
               std::string("'Edge_index' caches transposed indices that are not sorted by ") + to_string(other));
        }
      }

      if (cache_.T_indptr) {
        if (!sort_order_) {
          fail(Validation_reason::indptr, "'Edge_index' caches a transposed pointer array without a sort order");
        }
        check_indptr(*cache_.T_indptr, primary_axis(transposed(*sort_order_)), "T_indptr");
      }

      return *this;
    }

    // -- Conversion --

    /// Deep copy of the data and every cached field.
    Edge_index
    clone() const {
      return Edge_index{data_.clone(), sparse_size_, sort_order_, is_undirected_, cache_.clone()};
    }

    /**
     * @brief Convert the element type.
     *
     * To another index type the metadata and every cache survive (the
     * transpose permutation stays 64-bit); to any other type the result is
     * a plain Tensor.
     *
     * @throws Dtype_error if an index does not fit into J.
     */
    template <typename J>
    auto
    to() const {
      if constexpr (is_index_type_v<J>) {
        if constexpr (sizeof(J) < sizeof(I)) {
          auto values = data_.view();
          auto limit = static_cast<I>(std::numeric_limits<J>::max());
          if (num_edges_ > limit || std::any_of(values.begin(), values.end(), [limit](I v) { return v > limit; })) {
            throw Dtype_error(std::string("'Edge_index' holds indices that do not fit into '")
                              + to_string(dtype_v<J>) + "'");
          }
        }
        return Edge_index<J>::from_buffer(
          data_.template cast<J>(), sparse_size_, sort_order_, is_undirected_, cache_.template cast<J>());
      }
      else {
        EDGEKIT_LOG_DEBUG("Edge_index: conversion to '" << to_string(dtype_v<J>) << "' drops index metadata");
        return as_tensor().to(dtype_v<J>);
      }
    }

    /// Move the data and every present cache to @p device.
    Edge_index
    to(Device device) const {
      return Edge_index{data_.to(device), sparse_size_, sort_order_, is_undirected_, cache_.to(device)};
    }

    Edge_index
    contiguous() const {
      return *this;
    }

    /// Move the data and every cache to shared memory as a unit.
    Edge_index&
    share_memory_() {
      data_.share_memory_();
      cache_.share_memory_();
      return *this;
    }

    /// A 2 x E tensor aliasing the data; all metadata is dropped.
    Tensor
    as_tensor() const {
      return Tensor{data_, {2, num_edges_}};
    }

    /// Row (0) or column (1) array as a plain tensor.
    Tensor
    operator[](size_type axis) const {
      return as_tensor().select(0, axis);
    }

    Tensor
    select(size_type dim, size_type index) const {
      return as_tensor().select(dim, index);
    }

    // -- Selection along the edge axis --

    /**
     * @brief Edges at @p index, in that order.
     *
     * Sort order, symmetry and caches are dropped.
     */
    Edge_index
    index_select(std::span<std::int64_t const> index) const {
      for (auto k : index) {
        if (k < 0 || k >= num_edges_) {
          throw std::out_of_range("index_select: edge " + std::to_string(k) + " out of range for "
                                  + std::to_string(num_edges_) + " edges");
        }
      }
      return gather(index, std::nullopt);
    }

    /// Edges [start, start + length); the sort order is kept.
    Edge_index
    narrow(size_type start, size_type length) const {
      if (start < 0 || length < 0 || start + length > num_edges_) {
        throw std::out_of_range("narrow: range [" + std::to_string(start) + ", " + std::to_string(start + length)
                                + ") exceeds " + std::to_string(num_edges_) + " edges");
      }
      return slice(start, start + length);
    }

    /**
     * @brief Edges start, start + step, ... below stop; the sort order is
     *        kept.
     *
     * Negative bounds count from the end; bounds are clamped to the edges.
     */
    Edge_index
    slice(size_type start, size_type stop, size_type step = 1) const {
      if (step <= 0) {
        throw std::invalid_argument("slice: step must be positive (got " + std::to_string(step) + ")");
      }
      auto clamp = [this](size_type k) {
        if (k < 0) { k += num_edges_; }
        return std::clamp(k, size_type{0}, num_edges_);
      };
      start = clamp(start);
      stop = clamp(stop);

      Permutation index;
      for (auto k = start; k < stop; k += step) {
        index.push_back(static_cast<std::int64_t>(k));
      }
      return gather(index, sort_order_);
    }

    /**
     * @brief Edges whose mask entry is set; the sort order is kept.
     *
     * @throws Shape_error if the mask length is not E.
     */
    Edge_index
    mask(std::vector<bool> const& mask) const {
      if (static_cast<size_type>(mask.size()) != num_edges_) {
        throw Shape_error("mask: expected " + std::to_string(num_edges_) + " entries (got "
                          + std::to_string(mask.size()) + ")");
      }
      Permutation index;
      for (std::size_t k = 0; k < mask.size(); ++k) {
        if (mask[k]) { index.push_back(static_cast<std::int64_t>(k)); }
      }
      return gather(index, sort_order_);
    }

    // -- Reordering --

    /**
     * @brief Reverse along the given dimensions.
     *
     * Dimension 0 swaps rows and columns, dimension 1 reverses the edge
     * order; negative dimensions count from the end.
     */
    Edge_index
    flip(std::vector<int> const& dims) const {
      bool swap_axes = false;
      bool reverse_edges = false;
      for (auto dim : dims) {
        auto d = dim < 0 ? dim + 2 : dim;
        if (d != 0 && d != 1) {
          throw std::out_of_range("flip: dimension " + std::to_string(dim) + " out of range for 'Edge_index'");
        }
        auto& flag = d == 0 ? swap_axes : reverse_edges;
        if (flag) {
          throw std::invalid_argument("flip: dimension " + std::to_string(d) + " appears more than once");
        }
        flag = true;
      }
      if (!swap_axes && !reverse_edges) { return *this; }

      auto r = row();
      auto c = col();
      std::vector<I> values;
      values.reserve(static_cast<std::size_t>(2 * num_edges_));
      auto append = [&](std::span<I const> axis) {
        if (reverse_edges) {
          values.insert(values.end(), axis.rbegin(), axis.rend());
        }
        else {
          values.insert(values.end(), axis.begin(), axis.end());
        }
      };
      append(swap_axes ? c : r);
      append(swap_axes ? r : c);

      auto sparse_size = sparse_size_;
      if (swap_axes) { std::swap(sparse_size[0], sparse_size[1]); }

      std::optional<Sort_order> sort_order;
      Cache cache;
      // Swapping the coordinate rows moves the sort key along with the
      // values, so every cached field still describes the same numbers.
      if (swap_axes && !reverse_edges && sort_order_) {
        sort_order = transposed(*sort_order_);
        cache.indptr = cache_.indptr;
        cache.T_indptr = cache_.T_indptr;
        cache.T_perm = cache_.T_perm;
        if (cache_.T_index) {
          cache.T_index = Coordinate_pair<I>{cache_.T_index->col, cache_.T_index->row};
        }
      }

      return Edge_index{Buffer<I>{std::move(values), device()}, sparse_size, sort_order, is_undirected_,
                        std::move(cache)};
    }

    /**
     * @brief Sort lexicographically by @p order.
     *
     * A container already sorted by @p order is returned as is with the
     * identity permutation. A container sorted by the other axis reuses
     * (and fills) its transpose cache.
     */
    Sort_result<I>
    sort_by(Sort_order order) {
      if (sort_order_ == order) {
        return {*this, identity_permutation(num_edges_)};
      }

      std::vector<I> values;
      Permutation perm;
      if (sort_order_) {
        auto const& t_index = get_T_index();
        perm = get_T_perm().to_vector();
        values = t_index.row.to_vector();
        auto t_col = t_index.col.view();
        values.insert(values.end(), t_col.begin(), t_col.end());
      }
      else {
        EDGEKIT_LOG_DEBUG("Edge_index: sorting " << num_edges_ << " unsorted edges by " << order);
        auto r = row();
        auto c = col();
        perm = order == Sort_order::row ? sort_permutation(r, c) : sort_permutation(c, r);
        values = apply_permutation<I>(r, perm);
        auto sorted_col = apply_permutation<I>(c, perm);
        values.insert(values.end(), sorted_col.begin(), sorted_col.end());
      }

      Cache cache;
      if (is_undirected_) {
        cache.indptr = cache_.indptr;
      }
      else {
        cache.indptr = cache_.T_indptr;
        cache.T_indptr = cache_.indptr;
      }

      return {
        Edge_index{Buffer<I>{std::move(values), device()}, sparse_size_, order, is_undirected_, std::move(cache)},
        std::move(perm)};
    }

    // -- Comparison and output --

    /// Same edges in the same order; metadata is not compared.
    friend bool
    equal(Edge_index const& index1, Edge_index const& index2) {
      return index1.num_edges_ == index2.num_edges_ && std::ranges::equal(index1.data_.view(), index2.data_.view());
    }

    friend bool
    operator==(Edge_index const& index1, Edge_index const& index2) {
      return equal(index1, index2);
    }

    /// Edge_index([[0, 1], [1, 0]], sparse_size=(2, 2), nnz=2, sort_order=row)
    friend std::ostream&
    operator<<(std::ostream& os, Edge_index const& index) {
      auto print = [&os](std::span<I const> values) {
        os << '[';
        for (std::size_t k = 0; k < values.size(); ++k) {
          if (k > 0) { os << ", "; }
          os << values[k];
        }
        os << ']';
      };
      os << "Edge_index([";
      print(index.row());
      os << ", ";
      print(index.col());
      os << "], sparse_size=" << to_string(index.sparse_size_) << ", nnz=" << index.num_edges_;
      if (index.sort_order_) { os << ", sort_order=" << *index.sort_order_; }
      if (index.is_undirected_) { os << ", is_undirected=True"; }
      if (!index.device().is_cpu()) { os << ", device='" << index.device() << "'"; }
      return os << ')';
    }

    /// Arithmetic falls back to the plain tensor; every metadata field is dropped.
    template <typename U>
    friend Tensor
    operator+(Edge_index const& index, U scalar) {
      EDGEKIT_LOG_DEBUG("Edge_index: arithmetic falls back to a plain tensor");
      return index.as_tensor() + scalar;
    }

  private:
    template <typename>
    friend class Edge_index;

    Edge_index(
      Buffer<I> data,
      Sparse_size sparse_size,
      std::optional<Sort_order> sort_order,
      bool is_undirected,
      Cache cache)
        : data_(std::move(data))
        , num_edges_(data_.size() / 2)
        , sparse_size_(square_if_undirected(sparse_size, is_undirected))
        , sort_order_(sort_order)
        , is_undirected_(is_undirected)
        , cache_(std::move(cache)) {
      if (is_undirected_) { cache_.T_indptr.reset(); }
    }

    static Buffer<I>
    checked_buffer(Tensor const& data) {
      if (data.dim() != 2) {
        throw Shape_error("'Edge_index' needs to be two-dimensional (got " + std::to_string(data.dim())
                          + " dimensions)");
      }
      if (data.size(0) != 2) {
        throw Shape_error("'Edge_index' needs to have a shape of [2, *] (got " + shape_to_string(data.shape()) + ")");
      }
      if (!is_index_dtype(data.dtype())) {
        throw Dtype_error(std::string("'Edge_index' holds an unsupported integer type (got '")
                          + to_string(data.dtype()) + "')");
      }
      if (data.dtype() != dtype_v<I>) {
        throw Dtype_error(std::string("'Edge_index' of type '") + to_string(dtype_v<I>)
                          + "' cannot hold '" + to_string(data.dtype()) + "' values");
      }
      if (!data.is_contiguous()) {
        throw Layout_error("'Edge_index' needs to be contiguous");
      }

      auto const& buffer = data.buffer<I>();
      if (data.offset() == 0 && buffer.size() == data.numel()) { return buffer; }
      return Buffer<I>{data.to_vector<I>(), data.device()};
    }

    static Buffer<I>
    joined_buffer(std::vector<I> const& row, std::vector<I> const& col, Device device) {
      if (row.size() != col.size()) {
        throw Shape_error("'Edge_index' needs row and column arrays of equal length (got "
                          + std::to_string(row.size()) + " and " + std::to_string(col.size()) + ")");
      }
      std::vector<I> values(row);
      values.insert(values.end(), col.begin(), col.end());
      return Buffer<I>{std::move(values), device};
    }

    static Sparse_size
    square_if_undirected(Sparse_size sparse_size, bool is_undirected) {
      if (!is_undirected) { return sparse_size; }
      if (sparse_size[0] && sparse_size[1] && *sparse_size[0] != *sparse_size[1]) {
        throw Validation_error(
          Validation_reason::size,
          "'Edge_index' is undirected but its sparse size " + to_string(sparse_size) + " is not square");
      }
      if (!sparse_size[0]) { sparse_size[0] = sparse_size[1]; }
      if (!sparse_size[1]) { sparse_size[1] = sparse_size[0]; }
      return sparse_size;
    }

    std::span<I const>
    primary_values(Sort_order order) const {
      return order == Sort_order::row ? row() : col();
    }

    Sort_order
    require_sorted(char const* operation) const {
      if (!sort_order_) {
        throw State_error(std::string(operation) + ": 'Edge_index' is not sorted; call sort_by first");
      }
      return *sort_order_;
    }

    // The sparse size with unknown entries replaced by max + 1 (0 when
    // there are no edges). Undirected containers use the maximum over both
    // axes.
    Sparse_size
    inferred_sparse_size() const {
      auto bound = [](std::span<I const> values) {
        return values.empty() ? size_type{0} : static_cast<size_type>(*std::max_element(values.begin(), values.end())) + 1;
      };
      auto out = sparse_size_;
      if (is_undirected_) {
        if (!out[0]) {
          out[0] = std::max(bound(row()), bound(col()));
          out[1] = out[0];
        }
        return out;
      }
      if (!out[0]) { out[0] = bound(row()); }
      if (!out[1]) { out[1] = bound(col()); }
      return out;
    }

    // An undirected container stores both bounds at once.
    size_type
    infer_axis(std::size_t axis) {
      if (!sparse_size_[axis]) {
        auto inferred = inferred_sparse_size();
        if (is_undirected_) { sparse_size_ = inferred; }
        else { sparse_size_[axis] = inferred[axis]; }
      }
      return *sparse_size_[axis];
    }

    void
    fill_transpose(char const* operation) {
      auto order = require_sorted(operation);
      if (cache_.T_perm && cache_.T_index) { return; }
      EDGEKIT_LOG_DEBUG("Edge_index: building transpose of " << num_edges_ << " edges sorted by " << order);
      auto t = compute_transpose<I>(row(), col(), order);
      auto perm = Buffer<std::int64_t>{std::move(t.perm), device()};
      auto index = Coordinate_pair<I>{Buffer<I>{std::move(t.row), device()}, Buffer<I>{std::move(t.col), device()}};
      cache_.T_perm = std::move(perm);
      cache_.T_index = std::move(index);
    }

    Edge_index
    gather(std::span<std::int64_t const> index, std::optional<Sort_order> sort_order) const {
      auto values = apply_permutation<I>(row(), index);
      auto sub_col = apply_permutation<I>(col(), index);
      values.insert(values.end(), sub_col.begin(), sub_col.end());
      return Edge_index{Buffer<I>{std::move(values), device()}, sparse_size_, sort_order, false, Cache{}};
    }

    void
    check_indptr(Buffer<I> const& buffer, int axis, char const* name) const {
      auto indptr = buffer.view();
      auto values = axis == 0 ? row() : col();
      auto axis_size = sparse_size_[static_cast<std::size_t>(axis)]
        ? *sparse_size_[static_cast<std::size_t>(axis)]
        : *inferred_sparse_size()[static_cast<std::size_t>(axis)];

      if (static_cast<size_type>(indptr.size()) != axis_size + 1) {
        fail(Validation_reason::indptr,
             std::string("'") + name + "' has " + std::to_string(indptr.size()) + " entries, expected "
               + std::to_string(axis_size + 1));
      }
      if (indptr.front() != 0 || indptr.back() != num_edges_) {
        fail(Validation_reason::indptr,
             std::string("'") + name + "' spans [" + std::to_string(indptr.front()) + ", "
               + std::to_string(indptr.back()) + "], expected [0, " + std::to_string(num_edges_) + "]");
      }
      if (!std::is_sorted(indptr.begin(), indptr.end())) {
        fail(Validation_reason::indptr, std::string("'") + name + "' is not non-decreasing");
      }
      if (!std::ranges::equal(indptr, compute_indptr<I>(values, axis_size))) {
        fail(Validation_reason::indptr, std::string("'") + name + "' does not match the per-axis counts of the data");
      }
    }

    [[noreturn]] void
    fail(Validation_reason reason, std::string const& message) const {
      EDGEKIT_LOG_INFO("Edge_index: validation failed (" << to_string(reason) << "): " << message);
      throw Validation_error(reason, message);
    }

    Buffer<I> data_;
    size_type num_edges_;
    Sparse_size sparse_size_;
    std::optional<Sort_order> sort_order_;
    bool is_undirected_;
    Cache cache_;

  }; // end of class Edge_index

  /**
   * @brief Concatenate along the edge axis.
   *
   * The sparse size is the element-wise maximum (unknown if any input's is
   * unknown). The sort order survives only when every input shares it and
   * each input starts at or after the previous one's last primary index.
   * The result is undirected when every input is.
   */
  template <typename I>
  Edge_index<I>
  cat(std::vector<Edge_index<I>> const& indices)
  {
    if (indices.empty()) {
      throw std::invalid_argument("cat: expected at least one 'Edge_index'");
    }

    auto const& first = indices.front();
    Sparse_size sparse_size = first.sparse_size();
    auto sort_order = first.sort_order();
    bool is_undirected = true;
    std::optional<I> last_primary;

    std::vector<I> rows;
    std::vector<I> cols;
    for (auto const& index : indices) {
      if (!(index.device() == first.device())) {
        throw std::invalid_argument("cat: 'Edge_index' inputs live on different devices");
      }
      for (std::size_t axis = 0; axis < 2; ++axis) {
        auto n = index.sparse_size()[axis];
        sparse_size[axis] = sparse_size[axis] && n ? std::optional{std::max(*sparse_size[axis], *n)} : std::nullopt;
      }
      is_undirected = is_undirected && index.is_undirected();

      if (sort_order && index.sort_order() == sort_order && index.num_edges() > 0) {
        auto primary = primary_axis(*sort_order) == 0 ? index.row() : index.col();
        if (last_primary && primary.front() < *last_primary) { sort_order.reset(); }
        last_primary = primary.back();
      }
      else if (index.sort_order() != sort_order) {
        sort_order.reset();
      }

      rows.insert(rows.end(), index.row().begin(), index.row().end());
      cols.insert(cols.end(), index.col().begin(), index.col().end());
    }

    rows.insert(rows.end(), cols.begin(), cols.end());
    return Edge_index<I>::from_buffer(
      Buffer<I>{std::move(rows), first.device()}, sparse_size, sort_order, is_undirected);
  }

  /// Concatenate along the coordinate axis; the result is a plain 2k x E tensor.
  template <typename I>
  Tensor
  stack(std::vector<Edge_index<I>> const& indices)
  {
    std::vector<Tensor> tensors;
    tensors.reserve(indices.size());
    for (auto const& index : indices) {
      tensors.push_back(index.as_tensor());
    }
    return Tensor::cat(tensors, 0);
  }

} // end of namespace edgekit::data::detail
