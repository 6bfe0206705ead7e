#include <cmath>
#include <cstdlib>
#include <vector>

#include <fmt/core.h>

#include <basalt/basalt.hpp>

using namespace basalt;
using Mesh = data::Mesh<data::HalfEdgeStructure>;

static Mesh make_torus(int rings, int segments) {
  constexpr float kR = 2.0f;
  constexpr float kr = 0.7f;
  Mesh mesh;
  mesh.name = "torus";
  mesh.reserve(static_cast<size_t>(rings * segments));

  for (int i = 0; i < rings; ++i) {
    const float u = 6.283185f * static_cast<float>(i) / static_cast<float>(rings);
    for (int j = 0; j < segments; ++j) {
      const float v = 6.283185f * static_cast<float>(j) / static_cast<float>(segments);
      mesh.push_point({(kR + kr * std::cos(v)) * std::cos(u),
                       (kR + kr * std::cos(v)) * std::sin(u), kr * std::sin(v)});
    }
  }

  std::vector<data::Connectivity> faces;
  faces.reserve(static_cast<size_t>(rings * segments * 2));
  for (int i = 0; i < rings; ++i) {
    for (int j = 0; j < segments; ++j) {
      const auto id = [&](int a, int b) {
        return static_cast<uint32_t>(((a % rings) * segments) + (b % segments));
      };
      const uint32_t i0 = id(i, j);
      const uint32_t i1 = id(i + 1, j);
      const uint32_t i2 = id(i, j + 1);
      const uint32_t i3 = id(i + 1, j + 1);
      faces.push_back({data::PolytopeShape::Triangle, {i0, i1, i2}});
      faces.push_back({data::PolytopeShape::Triangle, {i1, i3, i2}});
    }
  }

  mesh.topology = data::HalfEdgeStructure(faces);
  return mesh;
}

int main() {
  const bool bench_mode = core::bench_mode_from_env();
  const int rings = bench_mode ? 32 : 256;
  const int segments = bench_mode ? 16 : 128;

  const Mesh mesh = make_torus(rings, segments);
  if (!mesh.is_valid()) {
    fmt::print(stderr, "[Demo] Generated mesh '{}' is invalid\n", mesh.name);
    return EXIT_FAILURE;
  }

  const auto &topo = mesh.topology;
  const long euler = static_cast<long>(topo.num_vertices()) -
                     static_cast<long>(topo.num_facets()) +
                     static_cast<long>(topo.num_elements());
  core::log_status("[Demo] {}: V={} E={} F={} chi={} border arcs={}", mesh.name,
                   topo.num_vertices(), topo.num_facets(), topo.num_elements(), euler,
                   topo.num_border_halfedges());

  const data::RelationTable ring = data::build_relation_table(data::Adjacency<0>(topo));
  const data::RelationTable star = data::build_relation_table(data::Coboundary<0, 2>(topo));
  core::log_status("[Demo] 1-ring table: {} entries, vertex star table: {} entries",
                   ring.data.size(), star.data.size());

  const auto L = ops::laplacian_matrix(mesh, ops::LaplacianWeights::Cotangent);
  core::log_status("[Demo] Cotangent Laplacian trace: {:.4f}", Eigen::VectorXf(L.diagonal()).sum());

  return EXIT_SUCCESS;
}
