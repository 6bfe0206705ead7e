#pragma once

#include <span>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <basalt/data/halfedge.hpp>
#include <basalt/data/structure.hpp>

namespace basalt::data {

/**
 * \brief Vertex coordinates paired with a topological structure.
 *
 * `Mesh` owns:
 * - flattened SoA coordinates (`x`, `y`, `z`), indexed by vertex id
 * - one topology instance (`topology`)
 * - optional user-facing name (`name`)
 *
 * The topology is purely combinatorial; coordinates only matter to
 * geometric operators such as the cotangent Laplacian.
 */
template <TopologicalStructure TopologyT = HalfEdgeStructure> struct Mesh {
  using TopologyType = TopologyT;

  /// \brief X coordinates for all vertices.
  std::vector<float> x;
  /// \brief Y coordinates for all vertices.
  std::vector<float> y;
  /// \brief Z coordinates for all vertices.
  std::vector<float> z;

  TopologyT topology;
  std::string name;

  [[nodiscard]] size_t num_points() const { return x.size(); }

  void reserve(size_t vertices) {
    x.reserve(vertices);
    y.reserve(vertices);
    z.reserve(vertices);
  }

  [[nodiscard]] Eigen::Vector3f get_vec3(size_t i) const { return {x[i], y[i], z[i]}; }

  void push_point(const Eigen::Vector3f &p) {
    x.push_back(p.x());
    y.push_back(p.y());
    z.push_back(p.z());
  }

  [[nodiscard]] std::span<const float> x_span() const { return x; }
  [[nodiscard]] std::span<const float> y_span() const { return y; }
  [[nodiscard]] std::span<const float> z_span() const { return z; }

  /**
   * \brief Minimal consistency check.
   *
   * Requires at least one element and a coordinate for every vertex id the
   * topology references.
   */
  [[nodiscard]] bool is_valid() const {
    return topology.num_elements() > 0 && num_points() >= topology.num_vertices() &&
           y.size() == x.size() && z.size() == x.size();
  }

  void clear() {
    x.clear();
    y.clear();
    z.clear();
    topology = TopologyT();
    name.clear();
  }
};

} // namespace basalt::data
