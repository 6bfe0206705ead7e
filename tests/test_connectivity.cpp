#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <fmt/format.h>

#include <basalt/data/connectivity.hpp>

using basalt::InvalidShapeError;
using basalt::data::Connectivity;
using basalt::data::PolytopeShape;
using basalt::data::connect;

TEST_CASE("connect infers the shape from the index count") {
  CHECK(connect({4, 7}).shape() == PolytopeShape::Segment);
  CHECK(connect({0, 1, 2}).shape() == PolytopeShape::Triangle);
  CHECK(connect({0, 1, 2, 3}).shape() == PolytopeShape::Quadrangle);
  CHECK(connect({0, 1, 2, 3, 4}).shape() == PolytopeShape::Ngon);

  const Connectivity pentagon = connect({9, 8, 7, 6, 5});
  CHECK(pentagon.size() == 5);
  CHECK(pentagon.paramdim() == 2);
  CHECK(pentagon[0] == 9);
  CHECK(pentagon[4] == 5);
  CHECK(connect({4, 7}).paramdim() == 1);
}

TEST_CASE("Connectivity rejects counts that do not fit the shape") {
  CHECK_THROWS_AS(connect({3}), InvalidShapeError);
  CHECK_THROWS_AS(Connectivity(PolytopeShape::Segment, {0, 1, 2}), InvalidShapeError);
  CHECK_THROWS_AS(Connectivity(PolytopeShape::Triangle, {0, 1}), InvalidShapeError);
  CHECK_THROWS_AS(Connectivity(PolytopeShape::Quadrangle, {0, 1, 2}), InvalidShapeError);
  CHECK_THROWS_AS(Connectivity(PolytopeShape::Ngon, {0, 1}), InvalidShapeError);
  CHECK_THROWS_AS(connect({0, 1, 2}, PolytopeShape::Segment), InvalidShapeError);
}

TEST_CASE("short Ngon tuples are stored as triangles and quadrangles") {
  const Connectivity tri = connect({0, 1, 2}, PolytopeShape::Ngon);
  const Connectivity quad = connect({0, 1, 2, 3}, PolytopeShape::Ngon);
  CHECK(tri.shape() == PolytopeShape::Triangle);
  CHECK(quad.shape() == PolytopeShape::Quadrangle);
  CHECK(tri == connect({0, 1, 2}));
  CHECK(quad == connect({0, 1, 2, 3}));
  CHECK_FALSE(tri == connect({0, 2, 1}));
}

TEST_CASE("Connectivity formats as shape and indices") {
  CHECK(fmt::format("{}", connect({0, 1, 2})) == "Triangle(0, 1, 2)");
  CHECK(fmt::format("{}", connect({3, 5})) == "Segment(3, 5)");
  CHECK(fmt::format("{}", connect({0, 1, 2, 3, 4})) == "Ngon(0, 1, 2, 3, 4)");
}
