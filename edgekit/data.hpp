#pragma once

//
// ... edgekit header files
//
#include <edgekit/data/Dense_matrix.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/Shape.hpp>
#include <edgekit/data/Sort_order.hpp>
#include <edgekit/data/Tensor.hpp>
#include <edgekit/data/conversions.hpp>
#include <edgekit/data/errors.hpp>
#include <edgekit/data/json_serialization.hpp>
#include <edgekit/data/sparse_matmul.hpp>
#include <edgekit/data/spmm.hpp>

namespace edgekit::data {
  using ::edgekit::data::detail::Dense_matrix;
  using ::edgekit::data::detail::Device;
  using ::edgekit::data::detail::Dtype;
  using ::edgekit::data::detail::Edge_index;
  using ::edgekit::data::detail::Reduce;
  using ::edgekit::data::detail::Requires_grad;
  using ::edgekit::data::detail::Shape;
  using ::edgekit::data::detail::Sort_order;
  using ::edgekit::data::detail::Sparse_size;
  using ::edgekit::data::detail::Spmm_backend;
  using ::edgekit::data::detail::Spmm_library;
  using ::edgekit::data::detail::Tensor;

  using ::edgekit::data::detail::Dtype_error;
  using ::edgekit::data::detail::Layout_error;
  using ::edgekit::data::detail::Not_implemented_error;
  using ::edgekit::data::detail::Shape_error;
  using ::edgekit::data::detail::State_error;
  using ::edgekit::data::detail::Validation_error;
  using ::edgekit::data::detail::Validation_reason;

  using ::edgekit::data::detail::cat;
  using ::edgekit::data::detail::load;
  using ::edgekit::data::detail::matmul;
  using ::edgekit::data::detail::save;
  using ::edgekit::data::detail::spmm;
  using ::edgekit::data::detail::stack;
  using ::edgekit::data::detail::to_dense;
  using ::edgekit::data::detail::to_sparse_coo;
  using ::edgekit::data::detail::to_sparse_csc;
  using ::edgekit::data::detail::to_sparse_csr;

} // end of namespace edgekit::data
