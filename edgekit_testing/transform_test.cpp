//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/permutation.hpp>

namespace edgekit::testing {

  using edgekit::data::detail::Device;
  using edgekit::data::detail::Edge_index;
  using edgekit::data::detail::Permutation;
  using edgekit::data::detail::Shape_error;
  using edgekit::data::detail::Sort_order;
  using edgekit::data::detail::Sparse_size;

  using edgekit::data::detail::apply_permutation;
  using edgekit::data::detail::cat;
  using edgekit::data::detail::compose_permutation;
  using edgekit::data::detail::stack;

  using index_vector = std::vector<std::int64_t>;
  using shape_vector = std::vector<edgekit::config::size_type>;

  static index_vector
  rows_of(Edge_index<> const& index) {
    return {index.row().begin(), index.row().end()};
  }

  static index_vector
  cols_of(Edge_index<> const& index) {
    return {index.col().begin(), index.col().end()};
  }

  static Edge_index<>
  make_index(bool is_undirected = false) {
    return Edge_index<>{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, Sort_order::row, is_undirected};
  }

  // ================================================================
  // Selection along the edge axis
  // ================================================================

  TEST_CASE("transform - mask keeps the sort order", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      auto index = make_index(is_undirected);
      index.fill_cache_();

      auto out = index.mask({false, true, false, true});
      CHECK(rows_of(out) == index_vector{1, 2});
      CHECK(cols_of(out) == index_vector{0, 1});
      CHECK(out.is_sorted_by_row());
      CHECK_FALSE(out.is_undirected());
      CHECK(out.sparse_size() == Sparse_size{3, 3});
      CHECK(out.cache().empty());
      out.validate();
    }
  }

  TEST_CASE("transform - mask of the wrong length", "[transform]")
  {
    auto index = make_index();
    CHECK_THROWS_AS(index.mask({true, false}), Shape_error);
  }

  TEST_CASE("transform - index_select drops the sort order", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      auto index = make_index(is_undirected);
      index_vector positions{1, 3};

      auto out = index.index_select(positions);
      CHECK(rows_of(out) == index_vector{1, 2});
      CHECK(cols_of(out) == index_vector{0, 1});
      CHECK_FALSE(out.is_sorted());
      CHECK_FALSE(out.is_undirected());
      CHECK(out.sparse_size() == Sparse_size{3, 3});
    }
  }

  TEST_CASE("transform - index_select out of range", "[transform]")
  {
    auto index = make_index();
    index_vector positions{0, 4};
    CHECK_THROWS_AS(index.index_select(positions), std::out_of_range);
  }

  TEST_CASE("transform - slice with a step", "[transform]")
  {
    auto index = make_index(true);
    auto out = index.slice(1, 4, 2);
    CHECK(rows_of(out) == index_vector{1, 2});
    CHECK(cols_of(out) == index_vector{0, 1});
    CHECK(out.is_sorted_by_row());
    CHECK_FALSE(out.is_undirected());
  }

  TEST_CASE("transform - slice bounds", "[transform]")
  {
    auto index = make_index();
    CHECK(rows_of(index.slice(-2, 100)) == index_vector{1, 2});
    CHECK(index.slice(3, 1).num_edges() == 0);
    CHECK_THROWS_AS(index.slice(0, 4, 0), std::invalid_argument);
  }

  TEST_CASE("transform - narrow", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      auto index = make_index(is_undirected);
      index.fill_cache_();

      auto out = index.narrow(1, 2);
      CHECK(rows_of(out) == index_vector{1, 1});
      CHECK(cols_of(out) == index_vector{0, 2});
      CHECK(out.is_sorted_by_row());
      CHECK_FALSE(out.is_undirected());
      CHECK(out.cache().empty());
      CHECK(out.get_indptr().to_vector() == index_vector{0, 0, 2, 2});
    }

    auto index = make_index();
    CHECK_THROWS_AS(index.narrow(3, 2), std::out_of_range);
  }

  // ================================================================
  // flip
  // ================================================================

  TEST_CASE("transform - flip rows and columns", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      auto index = make_index(is_undirected);
      index.fill_cache_();

      auto out = index.flip({0});
      CHECK(rows_of(out) == index_vector{1, 0, 2, 1});
      CHECK(cols_of(out) == index_vector{0, 1, 1, 2});
      CHECK(out.is_sorted_by_col());
      CHECK(out.is_undirected() == is_undirected);
      CHECK(out.indptr()->aliases(*index.indptr()));
      if (is_undirected) {
        CHECK_FALSE(out.T_indptr().has_value());
        CHECK(out.get_T_indptr().to_vector() == index_vector{0, 1, 3, 4});
      }
      else {
        CHECK(out.T_indptr()->to_vector() == index_vector{0, 1, 3, 4});
      }
      out.validate();
    }
  }

  TEST_CASE("transform - flip keeps every cache consistent", "[transform]")
  {
    // 2 x 3 matrix [[0, 1, 1], [1, 0, 0]]
    Edge_index<> index{{{0, 0, 1}, {1, 2, 0}}, {2, 3}, Sort_order::row};
    index.fill_cache_();
    CHECK(index.indptr()->to_vector() == index_vector{0, 2, 3});
    CHECK(index.T_indptr()->to_vector() == index_vector{0, 1, 2, 3});

    auto out = index.flip({-2});
    CHECK(rows_of(out) == index_vector{1, 2, 0});
    CHECK(cols_of(out) == index_vector{0, 0, 1});
    CHECK(out.sparse_size() == Sparse_size{3, 2});
    CHECK(out.is_sorted_by_col());
    CHECK(out.indptr()->to_vector() == index_vector{0, 2, 3});
    CHECK(out.T_indptr()->to_vector() == index_vector{0, 1, 2, 3});
    CHECK(out.T_perm()->to_vector() == index_vector{2, 0, 1});
    CHECK(out.T_index()->row.to_vector() == index_vector{0, 1, 2});
    CHECK(out.T_index()->col.to_vector() == index_vector{1, 0, 0});
    out.validate();
  }

  TEST_CASE("transform - flip both dimensions", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      auto index = make_index(is_undirected);
      index.fill_cache_();

      auto out = index.flip({0, 1});
      CHECK(rows_of(out) == index_vector{1, 2, 0, 1});
      CHECK(cols_of(out) == index_vector{2, 1, 1, 0});
      CHECK_FALSE(out.is_sorted());
      CHECK(out.is_undirected() == is_undirected);
      CHECK(out.cache().empty());
    }
  }

  TEST_CASE("transform - flip the edge order", "[transform]")
  {
    Edge_index<> index{{{0, 0, 1}, {1, 2, 0}}, {2, 3}, Sort_order::row};
    auto out = index.flip({1});
    CHECK(rows_of(out) == index_vector{1, 0, 0});
    CHECK(cols_of(out) == index_vector{0, 2, 1});
    CHECK(out.sparse_size() == Sparse_size{2, 3});
    CHECK_FALSE(out.is_sorted());
  }

  TEST_CASE("transform - flip with no dimensions", "[transform]")
  {
    auto index = make_index();
    index.fill_cache_();

    auto out = index.flip({});
    CHECK(out == index);
    CHECK(out.is_sorted_by_row());
    CHECK(out.sparse_size() == Sparse_size{3, 3});
    CHECK(out.indptr()->aliases(*index.indptr()));
    CHECK(out.T_perm()->aliases(*index.T_perm()));
  }

  TEST_CASE("transform - flip invalid dimensions", "[transform]")
  {
    auto index = make_index();
    CHECK_THROWS_AS(index.flip({2}), std::out_of_range);
    CHECK_THROWS_AS(index.flip({0, -2}), std::invalid_argument);
  }

  // ================================================================
  // sort_by
  // ================================================================

  TEST_CASE("transform - sort_by the current order", "[transform]")
  {
    auto index = make_index();
    auto [values, indices] = index.sort_by(Sort_order::row);
    CHECK(values == index);
    CHECK(values.is_sorted_by_row());
    CHECK(indices == Permutation{0, 1, 2, 3});
  }

  TEST_CASE("transform - sort_by unsorted input", "[transform]")
  {
    Edge_index<> index{{0, 1, 2, 1}, {1, 0, 1, 2}};
    auto [values, indices] = index.sort_by(Sort_order::row);
    CHECK(rows_of(values) == index_vector{0, 1, 1, 2});
    CHECK(cols_of(values) == index_vector{1, 0, 2, 1});
    CHECK(indices == Permutation{0, 1, 3, 2});
    CHECK(values.is_sorted_by_row());
    values.validate();
  }

  TEST_CASE("transform - sort_by the other axis", "[transform]")
  {
    auto index = make_index();

    auto [out, perm] = index.sort_by(Sort_order::col);
    CHECK(index.T_perm().has_value());
    CHECK(index.T_index().has_value());
    CHECK(rows_of(out) == index_vector{1, 0, 2, 1});
    CHECK(cols_of(out) == index_vector{0, 1, 1, 2});
    CHECK(perm == Permutation{1, 0, 3, 2});
    CHECK(out.is_sorted_by_col());
    CHECK_FALSE(out.T_perm().has_value());
    CHECK_FALSE(out.T_index().has_value());

    auto [back, back_perm] = out.sort_by(Sort_order::row);
    CHECK(rows_of(back) == index_vector{0, 1, 1, 2});
    CHECK(cols_of(back) == index_vector{1, 0, 2, 1});
    CHECK(back_perm == Permutation{1, 0, 3, 2});
    CHECK_FALSE(back.T_perm().has_value());
  }

  TEST_CASE("transform - sort_by swaps the pointer arrays", "[transform]")
  {
    Edge_index<> index{{{0, 0, 1}, {1, 2, 0}}, {2, 3}, Sort_order::row};
    index.fill_cache_();

    auto out = index.sort_by(Sort_order::col).values;
    REQUIRE(out.indptr().has_value());
    REQUIRE(out.T_indptr().has_value());
    CHECK(out.indptr()->aliases(*index.T_indptr()));
    CHECK(out.T_indptr()->aliases(*index.indptr()));
    out.validate();
  }

  TEST_CASE("transform - sort_by undirected keeps one pointer array", "[transform]")
  {
    auto index = make_index(true);
    index.fill_cache_();

    auto out = index.sort_by(Sort_order::col).values;
    CHECK(out.is_undirected());
    CHECK(out.indptr()->aliases(*index.indptr()));
    CHECK_FALSE(out.T_indptr().has_value());
    out.validate();
  }

  TEST_CASE("transform - sort_by permutations compose", "[transform]")
  {
    Edge_index<> index{{2, 0, 1, 0}, {0, 1, 2, 2}};
    auto [by_row, p1] = index.sort_by(Sort_order::row);
    auto [by_col, p2] = by_row.sort_by(Sort_order::col);
    auto [again, p3] = by_col.sort_by(Sort_order::row);

    CHECK(rows_of(by_row) == index_vector{0, 0, 1, 2});
    CHECK(cols_of(by_col) == index_vector{0, 1, 2, 2});

    auto total = compose_permutation(p1, p2);
    CHECK(apply_permutation<std::int64_t>(index.row(), total) == rows_of(by_col));
    CHECK(apply_permutation<std::int64_t>(index.col(), total) == cols_of(by_col));

    CHECK(again == by_row);
    CHECK(compose_permutation(p2, p3) == Permutation{0, 1, 2, 3});
  }

  // ================================================================
  // cat / stack
  // ================================================================

  TEST_CASE("transform - cat along the edge axis", "[transform]")
  {
    for (bool is_undirected : {false, true}) {
      Edge_index<> index1{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, std::nullopt, is_undirected};
      Edge_index<> index2{{{1, 2, 2, 3}, {2, 1, 3, 2}}, {4, 4}, std::nullopt, is_undirected};

      auto out = cat(std::vector<Edge_index<>>{index1, index2});
      CHECK(out.num_edges() == 8);
      CHECK(out.sparse_size() == Sparse_size{4, 4});
      CHECK_FALSE(out.is_sorted());
      CHECK(out.is_undirected() == is_undirected);
      CHECK(rows_of(out) == index_vector{0, 1, 1, 2, 1, 2, 2, 3});
      out.validate();
    }
  }

  TEST_CASE("transform - cat of overlapping sorted inputs", "[transform]")
  {
    Edge_index<> index1{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, Sort_order::row};
    Edge_index<> index2{{{1, 2, 2, 3}, {2, 1, 3, 2}}, {4, 4}, Sort_order::row};
    auto out = cat(std::vector<Edge_index<>>{index1, index2});
    CHECK_FALSE(out.is_sorted());
    CHECK(out.cache().empty());
  }

  TEST_CASE("transform - cat of consecutive sorted inputs", "[transform]")
  {
    Edge_index<> index1{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, Sort_order::row};
    Edge_index<> index2{{{2, 3}, {0, 1}}, {4, 4}, Sort_order::row};
    Edge_index<> index3{{{3, 3}, {0, 1}}, {4, 2}, Sort_order::col};

    auto out = cat(std::vector<Edge_index<>>{index1, index2});
    CHECK(out.is_sorted_by_row());
    out.validate();

    CHECK_FALSE(cat(std::vector<Edge_index<>>{index1, index3}).is_sorted());
  }

  TEST_CASE("transform - cat with unknown bounds", "[transform]")
  {
    Edge_index<> index1{{{0, 1}, {1, 0}}, {2, 2}};
    Edge_index<> index2{{{2}, {0}}, {3, std::nullopt}};
    Edge_index<> index3{{{0}, {1}}, {2, 2}, std::nullopt, true};

    auto out = cat(std::vector<Edge_index<>>{index1, index2, index3});
    CHECK(out.sparse_size() == Sparse_size{3, std::nullopt});
    CHECK_FALSE(out.is_undirected());
  }

  TEST_CASE("transform - cat errors", "[transform]")
  {
    CHECK_THROWS_AS(cat(std::vector<Edge_index<>>{}), std::invalid_argument);

    auto index = make_index();
    auto moved = index.to(Device::accelerator());
    CHECK_THROWS_AS(cat(std::vector<Edge_index<>>{index, moved}), std::invalid_argument);
  }

  TEST_CASE("transform - stack degrades to a tensor", "[transform]")
  {
    auto index1 = make_index();
    Edge_index<> index2{{{1, 2, 2, 3}, {2, 1, 3, 2}}, {4, 4}};

    auto out = stack(std::vector<Edge_index<>>{index1, index2});
    CHECK(out.shape() == shape_vector{4, 4});
    CHECK(out.to_vector<std::int64_t>()
          == index_vector{0, 1, 1, 2, 1, 0, 2, 1, 1, 2, 2, 3, 2, 1, 3, 2});
  }

} // end of namespace edgekit::testing
