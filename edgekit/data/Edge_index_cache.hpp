#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <optional>

//
// ... edgekit header files
//
#include <edgekit/data/Buffer.hpp>
#include <edgekit/data/Device.hpp>

namespace edgekit::data::detail {

  /**
   * @brief Row and column arrays of an edge list.
   */
  template <typename I>
  struct Coordinate_pair {
    Buffer<I> row;
    Buffer<I> col;
  };

  /**
   * @brief Derived structures attached to an Edge_index.
   *
   * Every field is optional: an empty field is unknown, never stale. The
   * transpose permutation is always 64-bit, whatever the index type.
   */
  template <typename I>
  struct Edge_index_cache {
    std::optional<Buffer<I>> indptr;
    std::optional<Buffer<std::int64_t>> T_perm;
    std::optional<Coordinate_pair<I>> T_index;
    std::optional<Buffer<I>> T_indptr;

    bool
    empty() const {
      return !indptr && !T_perm && !T_index && !T_indptr;
    }

    void
    clear_transpose() {
      T_perm.reset();
      T_index.reset();
    }

    Edge_index_cache
    clone() const {
      return transform([](auto const& buffer) { return buffer.clone(); });
    }

    Edge_index_cache
    to(Device device) const {
      return transform([device](auto const& buffer) { return buffer.to(device); });
    }

    template <typename J>
    Edge_index_cache<J>
    cast() const {
      Edge_index_cache<J> out;
      if (indptr) { out.indptr = indptr->template cast<J>(); }
      out.T_perm = T_perm;
      if (T_index) {
        out.T_index = Coordinate_pair<J>{T_index->row.template cast<J>(), T_index->col.template cast<J>()};
      }
      if (T_indptr) { out.T_indptr = T_indptr->template cast<J>(); }
      return out;
    }

    void
    share_memory_() {
      if (indptr) { indptr->share_memory_(); }
      if (T_perm) { T_perm->share_memory_(); }
      if (T_index) {
        T_index->row.share_memory_();
        T_index->col.share_memory_();
      }
      if (T_indptr) { T_indptr->share_memory_(); }
    }

    bool
    is_shared() const {
      return (!indptr || indptr->is_shared())
        && (!T_perm || T_perm->is_shared())
        && (!T_index || (T_index->row.is_shared() && T_index->col.is_shared()))
        && (!T_indptr || T_indptr->is_shared());
    }

  private:
    // f is applied to every present buffer, index and permutation alike.
    template <typename F>
    Edge_index_cache
    transform(F f) const {
      Edge_index_cache out;
      if (indptr) { out.indptr = f(*indptr); }
      if (T_perm) { out.T_perm = f(*T_perm); }
      if (T_index) { out.T_index = Coordinate_pair<I>{f(T_index->row), f(T_index->col)}; }
      if (T_indptr) { out.T_indptr = f(*T_indptr); }
      return out;
    }

  }; // end of struct Edge_index_cache

} // end of namespace edgekit::data::detail
