#include <benchmark/benchmark.h>

#include <cmath>
#include <cstdlib>
#include <vector>

#include <basalt/data/element_list.hpp>
#include <basalt/data/halfedge.hpp>
#include <basalt/data/mesh.hpp>
#include <basalt/data/relations.hpp>
#include <basalt/ops/laplacian.hpp>

using SurfaceMesh = basalt::data::Mesh<basalt::data::HalfEdgeStructure>;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() { setenv("BASALT_BENCH_MODE", "1", 1); }
} kBenchEnvSetup;
} // namespace

static std::vector<basalt::data::Connectivity> make_grid_faces(int side_length) {
  std::vector<basalt::data::Connectivity> faces;
  faces.reserve(static_cast<size_t>((side_length - 1) * (side_length - 1) * 2));

  for (int y = 0; y < side_length - 1; ++y) {
    for (int x = 0; x < side_length - 1; ++x) {
      const uint32_t i0 = static_cast<uint32_t>(y * side_length + x);
      const uint32_t i1 = static_cast<uint32_t>(y * side_length + x + 1);
      const uint32_t i2 = static_cast<uint32_t>((y + 1) * side_length + x);
      const uint32_t i3 = static_cast<uint32_t>((y + 1) * side_length + x + 1);

      faces.push_back({basalt::data::PolytopeShape::Triangle, {i0, i1, i2}});
      faces.push_back({basalt::data::PolytopeShape::Triangle, {i1, i3, i2}});
    }
  }
  return faces;
}

static SurfaceMesh make_grid_mesh(int side_length) {
  SurfaceMesh mesh;
  mesh.reserve(static_cast<size_t>(side_length * side_length));

  const float scale = 10.0f / static_cast<float>(side_length);
  for (int y = 0; y < side_length; ++y) {
    for (int x = 0; x < side_length; ++x) {
      const float px = x * scale;
      const float py = y * scale;
      const float pz = std::sin(px) + std::cos(py);
      mesh.push_point({px, py, pz});
    }
  }

  mesh.topology = basalt::data::HalfEdgeStructure(make_grid_faces(side_length));
  return mesh;
}

static void bench_halfedge_build(benchmark::State &state) {
  const auto faces = make_grid_faces(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    basalt::data::HalfEdgeStructure s(faces);
    benchmark::DoNotOptimize(s.halfedges().data());
  }
}

static void bench_convert_round_trip(benchmark::State &state) {
  const basalt::data::ElementListStructure list(make_grid_faces(static_cast<int>(state.range(0))));
  for (auto _ : state) {
    const auto half = basalt::data::convert<basalt::data::HalfEdgeStructure>(list);
    const auto back = basalt::data::convert<basalt::data::ElementListStructure>(half);
    benchmark::DoNotOptimize(back.num_elements());
  }
}

static void bench_adjacency_table(benchmark::State &state) {
  const basalt::data::HalfEdgeStructure s(make_grid_faces(static_cast<int>(state.range(0))));
  const basalt::data::Adjacency<0> neighbors(s);
  for (auto _ : state) {
    const auto table = basalt::data::build_relation_table(neighbors);
    benchmark::DoNotOptimize(table.data.data());
  }
}

static void bench_vertex_star_table(benchmark::State &state) {
  const basalt::data::HalfEdgeStructure s(make_grid_faces(static_cast<int>(state.range(0))));
  const basalt::data::Coboundary<0, 2> star(s);
  for (auto _ : state) {
    const auto table = basalt::data::build_relation_table(star);
    benchmark::DoNotOptimize(table.data.data());
  }
}

static void bench_cotangent_laplacian(benchmark::State &state) {
  const SurfaceMesh mesh = make_grid_mesh(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    const auto L =
        basalt::ops::laplacian_matrix(mesh, basalt::ops::LaplacianWeights::Cotangent);
    benchmark::DoNotOptimize(L.nonZeros());
  }
}

BENCHMARK(bench_halfedge_build)->Arg(100)->Arg(400);
BENCHMARK(bench_convert_round_trip)->Arg(100);
BENCHMARK(bench_adjacency_table)->Arg(400);
BENCHMARK(bench_vertex_star_table)->Arg(400);
BENCHMARK(bench_cotangent_laplacian)->Arg(400);

BENCHMARK_MAIN();
