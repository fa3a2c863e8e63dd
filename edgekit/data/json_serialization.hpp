#pragma once

//
// ... Standard header files
//
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/Sort_order.hpp>
#include <edgekit/data/errors.hpp>

// adl_serializer specialization for Edge_index, which has no default
// constructor. The document holds the coordinates, the sparse size, the
// sort order, the symmetry flag, the element type and, when cached, the
// compressed pointer array:
//
//   {"data": [[0, 1, 1, 2], [1, 0, 2, 1]], "sparse_size": [3, 3],
//    "sort_order": "row", "is_undirected": true, "dtype": "int64",
//    "indptr": [0, 1, 3, 4]}

namespace nlohmann {

  template <typename I>
  struct adl_serializer<edgekit::data::detail::Edge_index<I>> {
    using Edge_index = edgekit::data::detail::Edge_index<I>;

    static Edge_index
    from_json(json const& j) {
      namespace ek = edgekit::data::detail;

      auto dtype = j.at("dtype").get<std::string>();
      if (dtype != ek::to_string(ek::dtype_v<I>)) {
        throw ek::Dtype_error("cannot load an 'Edge_index' of type '" + dtype + "' as '"
                                  + ek::to_string(ek::dtype_v<I>) + "'");
      }

      auto const& data = j.at("data");
      if (!data.is_array() || data.size() != 2) {
        throw ek::Shape_error("'Edge_index' data needs to hold a row and a column array");
      }
      auto values = data[0].get<std::vector<I>>();
      auto col = data[1].get<std::vector<I>>();
      if (values.size() != col.size()) {
        throw ek::Shape_error("'Edge_index' data holds row and column arrays of different lengths");
      }
      values.insert(values.end(), col.begin(), col.end());

      ek::Sparse_size sparse_size;
      auto const& size = j.at("sparse_size");
      for (std::size_t axis = 0; axis < 2; ++axis) {
        if (!size.at(axis).is_null()) {
          sparse_size[axis] = size.at(axis).get<edgekit::config::size_type>();
        }
      }

      std::optional<ek::Sort_order> sort_order;
      if (auto const& order = j.at("sort_order"); !order.is_null()) {
        sort_order = ek::sort_order_from_string(order.get<std::string>());
      }

      typename Edge_index::Cache cache;
      if (j.contains("indptr")) {
        cache.indptr = ek::Buffer<I>{j.at("indptr").get<std::vector<I>>()};
      }

      return Edge_index::from_buffer(
        ek::Buffer<I>{std::move(values)},
        sparse_size,
        sort_order,
        j.at("is_undirected").get<bool>(),
        std::move(cache));
    }

    static void
    to_json(json& j, Edge_index const& index) {
      namespace ek = edgekit::data::detail;

      auto row = index.row();
      auto col = index.col();
      j["data"] = json::array({std::vector<I>(row.begin(), row.end()), std::vector<I>(col.begin(), col.end())});

      auto size = json::array();
      for (auto const& n : index.sparse_size()) {
        if (n) { size.push_back(*n); }
        else { size.push_back(nullptr); }
      }
      j["sparse_size"] = size;

      if (auto order = index.sort_order()) { j["sort_order"] = ek::to_string(*order); }
      else { j["sort_order"] = nullptr; }

      j["is_undirected"] = index.is_undirected();
      j["dtype"] = ek::to_string(index.dtype());

      if (auto const& indptr = index.indptr()) {
        j["indptr"] = indptr->to_vector();
      }
    }
  };

} // end of namespace nlohmann

namespace edgekit::data::detail {

  /// @throws std::runtime_error if the file cannot be written.
  template <typename I>
  void
  save(Edge_index<I> const& index, std::filesystem::path const& path)
  {
    std::ofstream out(path);
    if (!out) {
      throw std::runtime_error("cannot open '" + path.string() + "' for writing");
    }
    out << nlohmann::json(index).dump();
    if (!out) {
      throw std::runtime_error("failed to write 'Edge_index' to '" + path.string() + "'");
    }
  }

  /// @throws std::runtime_error if the file cannot be read, Dtype_error if it holds another index type.
  template <typename I>
  Edge_index<I>
  load(std::filesystem::path const& path)
  {
    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("cannot open '" + path.string() + "' for reading");
    }
    auto j = nlohmann::json::parse(in);
    return j.get<Edge_index<I>>();
  }

} // end of namespace edgekit::data::detail
