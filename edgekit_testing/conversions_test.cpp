//
// ... Test header files
//
#include <gtest/gtest.h>

//
// ... Standard header files
//
#include <cstdint>
#include <span>
#include <string>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/Dense_matrix.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/conversions.hpp>

using edgekit::data::detail::Dense_matrix;
using edgekit::data::detail::Edge_index;
using edgekit::data::detail::Shape;
using edgekit::data::detail::Shape_error;
using edgekit::data::detail::Sort_order;
using edgekit::data::detail::State_error;
using edgekit::data::detail::Validation_error;

using edgekit::data::detail::to_dense;
using edgekit::data::detail::to_sparse_coo;
using edgekit::data::detail::to_sparse_csc;
using edgekit::data::detail::to_sparse_csr;

using index_vector = std::vector<std::int64_t>;
using value_vector = std::vector<double>;

template <typename T>
static std::vector<T>
to_vector(std::span<T const> values)
{
  return {values.begin(), values.end()};
}

static Edge_index<>
make_index()
{
  return Edge_index<>{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, Sort_order::row};
}

TEST(conversions, to_dense)
{
  auto index = make_index();
  auto dense = to_dense(index);
  EXPECT_EQ(dense, (Dense_matrix<double>{{0, 1, 0}, {1, 0, 1}, {0, 1, 0}}));

  value_vector values{1, 2, 3, 4};
  auto weighted = to_dense<double>(index, values);
  EXPECT_DOUBLE_EQ(weighted(0, 1), 1);
  EXPECT_DOUBLE_EQ(weighted(1, 0), 2);
  EXPECT_DOUBLE_EQ(weighted(1, 2), 3);
  EXPECT_DOUBLE_EQ(weighted(2, 1), 4);
  EXPECT_DOUBLE_EQ(weighted(0, 0), 0);
}

TEST(conversions, to_dense_duplicates_add_up)
{
  Edge_index<> index{{{0, 0}, {1, 1}}, {2, 2}};
  auto dense = to_dense(index);
  EXPECT_DOUBLE_EQ(dense(0, 1), 2);
}

TEST(conversions, to_dense_infers_the_size)
{
  Edge_index<> index{{0, 3}, {1, 0}};
  auto dense = to_dense(index);
  EXPECT_EQ(dense.shape(), Shape(4, 2));
}

TEST(conversions, to_dense_errors)
{
  auto index = make_index();
  EXPECT_THROW(to_dense<double>(index, value_vector{1, 2}), Shape_error);

  Edge_index<> outside{{{0, 3}, {1, 0}}, {2, 2}};
  EXPECT_THROW(to_dense(outside), Validation_error);
}

TEST(conversions, to_dense_with_feature_columns)
{
  Edge_index<> index{{{1, 0, 2, 1}, {0, 1, 1, 2}}, {3, 3}};
  auto dense = to_dense(index, Dense_matrix<double>::column({1, 2, 3, 4}));

  ASSERT_EQ(dense.size(), 3u);
  EXPECT_EQ(dense[0], Dense_matrix<double>::column({0, 2, 0}));
  EXPECT_EQ(dense[1], Dense_matrix<double>::column({1, 0, 4}));
  EXPECT_EQ(dense[2], Dense_matrix<double>::column({0, 3, 0}));

  auto pairs = to_dense(index, Dense_matrix<double>{{1, -1}, {2, -2}, {3, -3}, {4, -4}});
  EXPECT_EQ(pairs[1], (Dense_matrix<double>{{1, -1}, {0, 0}, {4, -4}}));

  EXPECT_THROW(to_dense(index, Dense_matrix<double>::column({1, 2})), Shape_error);

  Edge_index<> outside{{{0, 3}, {1, 0}}, {2, 2}};
  EXPECT_THROW(to_dense(outside, Dense_matrix<double>::column({1, 2})), Validation_error);
}

TEST(conversions, to_sparse_coo)
{
  Edge_index<> index{{2, 0, 1}, {0, 1, 2}};
  value_vector values{5, 6, 7};
  auto coo = to_sparse_coo<double>(index, values);

  EXPECT_EQ(coo.shape(), Shape(3, 3));
  EXPECT_EQ(coo.size(), 3);
  EXPECT_EQ(to_vector(coo.row()), (index_vector{2, 0, 1}));
  EXPECT_EQ(to_vector(coo.col()), (index_vector{0, 1, 2}));
  EXPECT_EQ(to_vector(coo.values()), values);
  EXPECT_DOUBLE_EQ(coo(2, 0), 5);
  EXPECT_DOUBLE_EQ(coo(0, 0), 0);
}

TEST(conversions, to_sparse_csr)
{
  auto index = make_index();
  auto csr = to_sparse_csr(index);

  EXPECT_EQ(csr.shape(), Shape(3, 3));
  EXPECT_EQ(to_vector(csr.row_ptr()), index.get_indptr().to_vector());
  EXPECT_EQ(to_vector(csr.row_ptr()), (index_vector{0, 1, 3, 4}));
  EXPECT_EQ(to_vector(csr.col_ind()), (index_vector{1, 0, 2, 1}));
  EXPECT_EQ(to_vector(csr.values()), (value_vector{1, 1, 1, 1}));
  EXPECT_DOUBLE_EQ(csr(1, 2), 1);
  EXPECT_DOUBLE_EQ(csr(2, 2), 0);
}

TEST(conversions, to_sparse_csr_needs_the_row_order)
{
  Edge_index<> index{{1, 0}, {0, 1}};
  try {
    to_sparse_csr(index);
    FAIL() << "expected State_error";
  }
  catch (State_error const& e) {
    EXPECT_NE(std::string(e.what()).find("not sorted by row indices"), std::string::npos);
  }

  auto sorted = index.sort_by(Sort_order::row).values;
  EXPECT_EQ(to_vector(to_sparse_csr(sorted).col_ind()), (index_vector{1, 0}));
}

TEST(conversions, to_sparse_csc)
{
  auto index = make_index().sort_by(Sort_order::col).values;
  value_vector values{1, 2, 3, 4};
  auto csc = to_sparse_csc<double>(index, values);

  EXPECT_EQ(csc.shape(), Shape(3, 3));
  EXPECT_EQ(to_vector(csc.col_ptr()), (index_vector{0, 1, 3, 4}));
  EXPECT_EQ(to_vector(csc.row_ind()), (index_vector{1, 0, 2, 1}));
  EXPECT_DOUBLE_EQ(csc(2, 1), 3);
  EXPECT_DOUBLE_EQ(csc(1, 2), 4);
}

TEST(conversions, to_sparse_csc_needs_the_column_order)
{
  auto index = make_index();
  EXPECT_THROW(to_sparse_csc(index), State_error);
}
