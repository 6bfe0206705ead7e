#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <vector>

#include <basalt/data/element_list.hpp>
#include <basalt/data/halfedge.hpp>
#include <basalt/data/structure.hpp>

#include "support/synthetic_meshes.hpp"
#include "support/test_env.hpp"

using basalt::data::Connectivity;
using basalt::data::ElementListStructure;
using basalt::data::HalfEdgeStructure;
using basalt::data::connect;
using basalt::data::convert;

namespace {

void check_round_trip(const std::vector<Connectivity> &faces) {
  const ElementListStructure list(faces);
  const HalfEdgeStructure half = convert<HalfEdgeStructure>(list);
  const ElementListStructure back = convert<ElementListStructure>(half);

  CHECK(half.num_elements() == list.num_elements());
  CHECK(half.num_vertices() == list.num_vertices());
  CHECK(back == list);
  CHECK(basalt::data::elements(back) == faces);
}

} // namespace

TEST_CASE("conversion preserves elements and their vertex order") {
  basalt::test_support::configure_deterministic_test_env();
  check_round_trip(basalt::test_support::two_triangles());
  check_round_trip(basalt::test_support::mixed_patch());
  check_round_trip(basalt::test_support::cube_faces());
  check_round_trip(basalt::test_support::grid_triangles(5));
  check_round_trip(basalt::test_support::grid_quadrangles(5));
  check_round_trip({connect({0, 1, 2, 3, 4}), connect({1, 0, 5}), connect({5, 0, 6, 7})});
}

TEST_CASE("converting a half-edge structure to itself rebuilds the same topology") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::mixed_patch());
  const HalfEdgeStructure copy = convert<HalfEdgeStructure>(s);

  CHECK(copy.num_facets() == s.num_facets());
  CHECK(copy.num_border_halfedges() == s.num_border_halfedges());
  for (uint32_t v = 0; v < s.num_vertices(); ++v) {
    CHECK(copy.adjacent_vertices(v) == s.adjacent_vertices(v));
    CHECK(copy.incident_elements(v) == s.incident_elements(v));
  }
}

TEST_CASE("conversion reports construction errors") {
  const ElementListStructure list(
      std::vector<Connectivity>{connect({0, 1, 2}), connect({1, 0, 3}), connect({0, 1, 4})});
  CHECK_THROWS_AS(convert<HalfEdgeStructure>(list), basalt::NonManifoldInputError);

  const ElementListStructure empty;
  CHECK(convert<HalfEdgeStructure>(empty).num_elements() == 0);
}
