//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <cstdint>
#include <stdexcept>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/permutation.hpp>

namespace edgekit::testing {

  using edgekit::data::detail::Permutation;
  using edgekit::data::detail::apply_permutation;
  using edgekit::data::detail::compose_permutation;
  using edgekit::data::detail::identity_permutation;
  using edgekit::data::detail::inverse_permutation;
  using edgekit::data::detail::is_identity_permutation;
  using edgekit::data::detail::is_valid_permutation;

  // ================================================================
  // is_valid_permutation
  // ================================================================

  TEST_CASE("permutation - is_valid_permutation valid", "[permutation]")
  {
    Permutation p{2, 0, 1};
    CHECK(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation empty", "[permutation]")
  {
    Permutation p{};
    CHECK(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation duplicate", "[permutation]")
  {
    Permutation p{0, 0, 1};
    CHECK_FALSE(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation out of range", "[permutation]")
  {
    Permutation p{0, 3, 1};
    CHECK_FALSE(is_valid_permutation(p));
  }

  // ================================================================
  // identity_permutation
  // ================================================================

  TEST_CASE("permutation - identity_permutation", "[permutation]")
  {
    auto p = identity_permutation(4);
    CHECK(p == Permutation{0, 1, 2, 3});
    CHECK(is_identity_permutation(p));
    CHECK_FALSE(is_identity_permutation(Permutation{1, 0}));
  }

  // ================================================================
  // inverse_permutation
  // ================================================================

  TEST_CASE("permutation - inverse_permutation identity", "[permutation]")
  {
    Permutation p{0, 1, 2};
    auto inv = inverse_permutation(p);

    REQUIRE(std::ssize(inv) == 3);
    CHECK(inv[0] == 0);
    CHECK(inv[1] == 1);
    CHECK(inv[2] == 2);
  }

  TEST_CASE("permutation - inverse_permutation known", "[permutation]")
  {
    // position 0 takes element 2, 1 takes 0, 2 takes 1
    Permutation p{2, 0, 1};
    auto inv = inverse_permutation(p);

    CHECK(inv == Permutation{1, 2, 0});
    CHECK(is_identity_permutation(compose_permutation(p, inv)));
  }

  // ================================================================
  // apply / compose
  // ================================================================

  TEST_CASE("permutation - apply_permutation gathers", "[permutation]")
  {
    std::vector<std::int32_t> values{10, 20, 30, 40};
    Permutation p{3, 0, 2, 1};
    auto out = apply_permutation<std::int32_t>(values, p);
    CHECK(out == std::vector<std::int32_t>{40, 10, 30, 20});
  }

  TEST_CASE("permutation - compose matches successive application", "[permutation]")
  {
    std::vector<std::int64_t> values{5, 6, 7, 8};
    Permutation first{1, 0, 3, 2};
    Permutation second{3, 2, 0, 1};

    auto twice = apply_permutation<std::int64_t>(apply_permutation<std::int64_t>(values, first), second);
    auto once = apply_permutation<std::int64_t>(values, compose_permutation(first, second));
    CHECK(once == twice);
  }

  TEST_CASE("permutation - compose length mismatch", "[permutation]")
  {
    CHECK_THROWS_AS(compose_permutation(Permutation{0, 1}, Permutation{0}), std::invalid_argument);
  }

} // end of namespace edgekit::testing
