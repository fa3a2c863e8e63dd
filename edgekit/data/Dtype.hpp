#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <ostream>
#include <type_traits>

namespace edgekit::data::detail {

  /**
   * @brief Runtime element type of a Tensor.
   */
  enum class Dtype { uint8, int8, int16, int32, int64, float32, float64 };

  char const*
  to_string(Dtype dtype);

  std::ostream&
  operator<<(std::ostream& os, Dtype dtype);

  /// True for the element types an Edge_index can hold.
  bool
  is_index_dtype(Dtype dtype);

  bool
  is_floating_dtype(Dtype dtype);

  template <typename T>
  struct dtype_of;

  template <>
  struct dtype_of<std::uint8_t> : std::integral_constant<Dtype, Dtype::uint8> {};

  template <>
  struct dtype_of<std::int8_t> : std::integral_constant<Dtype, Dtype::int8> {};

  template <>
  struct dtype_of<std::int16_t> : std::integral_constant<Dtype, Dtype::int16> {};

  template <>
  struct dtype_of<std::int32_t> : std::integral_constant<Dtype, Dtype::int32> {};

  template <>
  struct dtype_of<std::int64_t> : std::integral_constant<Dtype, Dtype::int64> {};

  template <>
  struct dtype_of<float> : std::integral_constant<Dtype, Dtype::float32> {};

  template <>
  struct dtype_of<double> : std::integral_constant<Dtype, Dtype::float64> {};

  template <typename T>
  inline constexpr Dtype dtype_v = dtype_of<T>::value;

  template <typename T>
  inline constexpr bool is_index_type_v =
    std::is_same_v<T, std::int32_t> || std::is_same_v<T, std::int64_t>;

} // end of namespace edgekit::data::detail
