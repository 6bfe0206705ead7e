#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <Eigen/Sparse>
#include <algorithm>
#include <cstdint>
#include <vector>

#include <fmt/format.h>

#include <basalt/core/errors.hpp>
#include <basalt/core/logging.hpp>
#include <basalt/core/parallel.hpp>
#include <basalt/data/halfedge.hpp>
#include <basalt/data/mesh.hpp>

namespace basalt::ops {

/// \brief Edge weighting of the Laplace-Beltrami discretization.
enum class LaplacianWeights {
  Uniform,
  Cotangent
};

namespace detail {

inline float cotangent_at(const Eigen::Vector3f &apex, const Eigen::Vector3f &a,
                          const Eigen::Vector3f &b) {
  const Eigen::Vector3f u = a - apex;
  const Eigen::Vector3f v = b - apex;
  return u.dot(v) / std::max(u.cross(v).norm(), 1e-12f);
}

template <typename RowFn>
Eigen::SparseMatrix<float> assemble_rows(const data::HalfEdgeStructure &s, RowFn &&row_fn) {
  const size_t n = s.num_vertices();
  std::vector<std::vector<Eigen::Triplet<float>>> rows(n);

  core::parallel_for_index(
      0, static_cast<int>(n),
      [&](int row_idx) {
        const uint32_t i = static_cast<uint32_t>(row_idx);
        if (!s.has_vertex(i)) {
          return;
        }
        const std::vector<uint32_t> ring = s.adjacent_vertices(i);
        const bool closed = !s.is_boundary_vertex(i);

        auto &row = rows[i];
        row.reserve(ring.size() + 1);
        float diagonal = 0.0f;
        for (size_t k = 0; k < ring.size(); ++k) {
          const float w = row_fn(i, ring, k, closed);
          row.emplace_back(static_cast<int>(i), static_cast<int>(ring[k]), w);
          diagonal -= w;
        }
        row.emplace_back(static_cast<int>(i), static_cast<int>(i), diagonal);
      },
      128);

  size_t nnz = 0;
  for (const auto &row : rows) {
    nnz += row.size();
  }
  std::vector<Eigen::Triplet<float>> triplets;
  triplets.reserve(nnz);
  for (const auto &row : rows) {
    triplets.insert(triplets.end(), row.begin(), row.end());
  }

  Eigen::SparseMatrix<float> L(static_cast<int>(n), static_cast<int>(n));
  L.setFromTriplets(triplets.begin(), triplets.end());
  L.makeCompressed();
  return L;
}

} // namespace detail

/**
 * \brief Uniform graph Laplacian of a half-edge structure.
 *
 * `L(i, j) = 1` for every `j` in `Adjacency<0>(i)` and `L(i, i) = -deg(i)`.
 * Vertex ids never referenced by an element get empty rows.
 * \param s Half-edge structure.
 * \return `num_vertices() x num_vertices()` sparse matrix.
 */
inline Eigen::SparseMatrix<float> laplacian_matrix(const data::HalfEdgeStructure &s) {
  Eigen::SparseMatrix<float> L = detail::assemble_rows(
      s, [](uint32_t, const std::vector<uint32_t> &, size_t, bool) { return 1.0f; });
  core::log_status("[Laplacian] Assembled {}x{} uniform matrix ({} non-zeros).", L.rows(),
                   L.cols(), L.nonZeros());
  return L;
}

/**
 * \brief Laplace-Beltrami matrix of a mesh.
 *
 * Cotangent weights are `cot(alpha_ij) + cot(beta_ij)`, where the angles sit
 * at the ring neighbors before and after `j` around `i`. On border vertices
 * the open ring has no neighbor beyond its ends and that side contributes
 * nothing. The cotangent scheme assumes triangular elements.
 * \param mesh Coordinates and topology.
 * \param weights Weighting scheme.
 * \return `num_vertices() x num_vertices()` sparse matrix.
 * \throws IndexOutOfRangeError for cotangent weights when a vertex id has no
 *         coordinate.
 */
inline Eigen::SparseMatrix<float>
laplacian_matrix(const data::Mesh<data::HalfEdgeStructure> &mesh,
                 LaplacianWeights weights = LaplacianWeights::Uniform) {
  if (weights == LaplacianWeights::Uniform) {
    return laplacian_matrix(mesh.topology);
  }
  if (mesh.y.size() != mesh.x.size() || mesh.z.size() != mesh.x.size() ||
      mesh.num_points() < mesh.topology.num_vertices()) {
    throw IndexOutOfRangeError(fmt::format(
        "mesh has {}/{}/{} x/y/z coordinates but its topology references {} vertices",
        mesh.x.size(), mesh.y.size(), mesh.z.size(), mesh.topology.num_vertices()));
  }

  const auto cotangent_weight = [&](uint32_t i, const std::vector<uint32_t> &ring, size_t k,
                                    bool closed) {
    const size_t n = ring.size();
    const Eigen::Vector3f vi = mesh.get_vec3(i);
    const Eigen::Vector3f vj = mesh.get_vec3(ring[k]);

    float w = 0.0f;
    if (k > 0 || closed) {
      const uint32_t before = ring[(k + n - 1) % n];
      w += detail::cotangent_at(mesh.get_vec3(before), vj, vi);
    }
    if (k + 1 < n || closed) {
      const uint32_t after = ring[(k + 1) % n];
      w += detail::cotangent_at(mesh.get_vec3(after), vi, vj);
    }
    return w;
  };

  Eigen::SparseMatrix<float> L = detail::assemble_rows(mesh.topology, cotangent_weight);
  core::log_status("[Laplacian] Assembled {}x{} cotangent matrix ({} non-zeros).", L.rows(),
                   L.cols(), L.nonZeros());
  return L;
}

} // namespace basalt::ops
