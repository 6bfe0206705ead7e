#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

#include <basalt/data/relations.hpp>

#include "support/synthetic_meshes.hpp"
#include "support/test_env.hpp"

using basalt::data::Adjacency;
using basalt::data::Boundary;
using basalt::data::Coboundary;
using basalt::data::HalfEdgeStructure;
using basalt::data::RelationKind;
using basalt::data::RelationTable;
using basalt::data::RelationType;
using basalt::data::TopologicalRelation;
using Ids = std::vector<uint32_t>;

namespace {

Ids row_ids(const RelationTable &table, uint32_t i) {
  const auto row = table.row(i);
  return {row.begin(), row.end()};
}

template <typename R> void check_table_matches(const R &relation, const RelationTable &table) {
  REQUIRE(table.size() == relation.domain_size());
  for (uint32_t i = 0; i < table.size(); ++i) {
    if (relation.is_defined(i)) {
      CHECK(row_ids(table, i) == relation(i));
    } else {
      CHECK(table.row(i).empty());
    }
  }
}

} // namespace

TEST_CASE("static relations on the mixed patch") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::mixed_patch());

  const Boundary<2, 0> face_vertices(s);
  const Boundary<2, 1> face_edges(s);
  const Boundary<1, 0> edge_vertices(s);
  const Coboundary<0, 1> vertex_edges(s);
  const Coboundary<0, 2> vertex_faces(s);
  const Coboundary<1, 2> edge_faces(s);
  const Adjacency<0> neighbors(s);

  CHECK(face_vertices(0) == Ids{0, 1, 5, 4});
  CHECK(face_vertices(3) == Ids{0, 4, 2});
  CHECK(face_edges(2) == Ids{6, 7, 2, 5});
  CHECK(edge_vertices(1) == Ids{1, 5});
  CHECK(edge_vertices(8) == Ids{2, 0});
  CHECK(vertex_edges(5) == Ids{1, 5, 2});
  CHECK(vertex_faces(5) == Ids{1, 0, 2});
  CHECK(vertex_faces(4) == Ids{2, 0, 3});
  CHECK(edge_faces(3) == Ids{0, 3});
  CHECK(edge_faces(7) == Ids{2, 3});
  CHECK(neighbors(4) == Ids{5, 2, 0});

  CHECK(face_vertices.domain_size() == 4);
  CHECK(edge_faces.domain_size() == 9);
  CHECK(neighbors.domain_size() == 6);
  CHECK_FALSE(face_vertices.is_defined(4));
  CHECK(neighbors.is_defined(5));
}

TEST_CASE("boundary of boundary closes up") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::mixed_patch());
  const Boundary<2, 0> face_vertices(s);
  const Boundary<2, 1> face_edges(s);
  const Boundary<1, 0> edge_vertices(s);

  for (uint32_t f = 0; f < s.num_elements(); ++f) {
    const Ids cycle = face_vertices(f);
    const Ids edges = face_edges(f);
    REQUIRE(cycle.size() == edges.size());
    for (size_t i = 0; i < edges.size(); ++i) {
      const Ids ends = edge_vertices(edges[i]);
      const uint32_t a = cycle[i];
      const uint32_t b = cycle[(i + 1) % cycle.size()];
      CHECK(((ends[0] == a && ends[1] == b) || (ends[0] == b && ends[1] == a)));
    }
  }
}

TEST_CASE("coboundary is the transpose of boundary") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::cube_faces());
  const Boundary<2, 0> face_vertices(s);
  const Boundary<2, 1> face_edges(s);
  const Coboundary<0, 2> vertex_faces(s);
  const Coboundary<1, 2> edge_faces(s);

  const auto contains = [](const Ids &ids, uint32_t x) {
    return std::find(ids.begin(), ids.end(), x) != ids.end();
  };

  for (uint32_t f = 0; f < s.num_elements(); ++f) {
    for (uint32_t v : face_vertices(f)) {
      CHECK(contains(vertex_faces(v), f));
    }
    for (uint32_t k : face_edges(f)) {
      CHECK(contains(edge_faces(k), f));
    }
  }
  for (uint32_t v = 0; v < s.num_vertices(); ++v) {
    for (uint32_t f : vertex_faces(v)) {
      CHECK(contains(face_vertices(f), v));
    }
  }
  for (uint32_t k = 0; k < s.num_facets(); ++k) {
    for (uint32_t f : edge_faces(k)) {
      CHECK(contains(face_edges(f), k));
    }
  }
}

TEST_CASE("runtime relations dispatch to the same queries") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::two_triangles());

  const TopologicalRelation face_vertices(s, RelationType::Boundary, 2, 0);
  const TopologicalRelation vertex_faces(s, RelationType::Coboundary, 0, 2);
  const TopologicalRelation edge_faces(s, RelationType::Coboundary, 1, 2);
  const TopologicalRelation neighbors(s, RelationType::Adjacency, 0, 0);

  CHECK(face_vertices.kind() == RelationKind::Boundary20);
  CHECK(face_vertices(1) == Ids{3, 2, 1});
  CHECK(vertex_faces(1) == Ids{1, 0});
  CHECK(vertex_faces(2) == Ids{0, 1});
  CHECK(edge_faces(1) == Ids{0, 1});
  CHECK(neighbors(1) == Ids{3, 2, 0});
  CHECK(neighbors(2) == Ids{0, 1, 3});
}

TEST_CASE("unsupported rank pairs are rejected") {
  const HalfEdgeStructure s(basalt::test_support::two_triangles());

  CHECK_THROWS_AS(TopologicalRelation(s, RelationType::Boundary, 0, 2),
                  basalt::UnsupportedRelationError);
  CHECK_THROWS_AS(TopologicalRelation(s, RelationType::Coboundary, 2, 0),
                  basalt::UnsupportedRelationError);
  CHECK_THROWS_AS(TopologicalRelation(s, RelationType::Adjacency, 1, 1),
                  basalt::UnsupportedRelationError);
  CHECK_THROWS_AS(TopologicalRelation(s, RelationType::Adjacency, 2, 2),
                  basalt::UnsupportedRelationError);

  try {
    const TopologicalRelation relation(s, RelationType::Boundary, 0, 1);
    static_cast<void>(relation);
    FAIL("expected UnsupportedRelationError");
  } catch (const basalt::UnsupportedRelationError &e) {
    CHECK(std::string(e.what()).find("Boundary{0,1}") != std::string::npos);
  }
}

TEST_CASE("relation errors propagate from the structure") {
  const HalfEdgeStructure s(basalt::test_support::two_triangles());
  const Boundary<2, 0> face_vertices(s);
  const Coboundary<1, 2> edge_faces(s);

  CHECK_THROWS_AS(face_vertices(2), basalt::IndexOutOfRangeError);
  CHECK_THROWS_AS(edge_faces(9), basalt::IndexOutOfRangeError);
}

TEST_CASE("relation tables match row-by-row evaluation") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::grid_triangles(6));

  const Adjacency<0> neighbors(s);
  const Coboundary<0, 2> vertex_faces(s);
  const Boundary<2, 1> face_edges(s);

  const RelationTable neighbor_table = basalt::data::build_relation_table(neighbors);
  check_table_matches(neighbors, neighbor_table);
  check_table_matches(vertex_faces, basalt::data::build_relation_table(vertex_faces));
  check_table_matches(face_edges, basalt::data::build_relation_table(face_edges));

  CHECK(neighbor_table.data.size() == 2 * s.num_facets());
  CHECK(face_edges.domain_size() == s.num_elements());
}

TEST_CASE("unreferenced vertices get empty table rows") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(
      std::vector<basalt::data::Connectivity>{basalt::data::connect({0, 1, 3})});
  const Adjacency<0> neighbors(s);

  CHECK_FALSE(neighbors.is_defined(2));
  const RelationTable table = basalt::data::build_relation_table(neighbors);
  CHECK(table.size() == 4);
  CHECK(table.row(2).empty());
  CHECK(table.row(3).size() == 2);
  CHECK(table.row(4).empty());
}

TEST_CASE("parallel relation tables equal serial ones") {
  basalt::test_support::configure_deterministic_test_env();
  const HalfEdgeStructure s(basalt::test_support::grid_quadrangles(40));
  const Adjacency<0> neighbors(s);
  const Coboundary<0, 2> vertex_faces(s);

  const RelationTable serial_neighbors = basalt::data::build_relation_table(neighbors);
  const RelationTable serial_faces = basalt::data::build_relation_table(vertex_faces);

  basalt::test_support::configure_parallel_test_env(4);
  const RelationTable parallel_neighbors = basalt::data::build_relation_table(neighbors);
  const RelationTable parallel_faces = basalt::data::build_relation_table(vertex_faces);
  basalt::test_support::configure_deterministic_test_env();

  CHECK(parallel_neighbors.offsets == serial_neighbors.offsets);
  CHECK(parallel_neighbors.data == serial_neighbors.data);
  CHECK(parallel_faces.offsets == serial_faces.offsets);
  CHECK(parallel_faces.data == serial_faces.data);
}
