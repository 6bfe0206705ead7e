#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <span>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <basalt/core/errors.hpp>
#include <basalt/core/logging.hpp>
#include <basalt/data/connectivity.hpp>
#include <basalt/data/structure.hpp>

namespace basalt::data {

/// \brief Sentinel for "no element" (border arcs) and undefined links.
inline constexpr uint32_t kNone = UINT32_MAX;

/**
 * \brief One directed arc of a face boundary.
 *
 * `head` is the vertex the arc leaves from in its face cycle; the next arc
 * of the cycle starts at the vertex where this one ends. `prev`, `next` and
 * `half` are positions in the owning structure's arena. Border arcs carry
 * `elem == kNone` and have no `prev`/`next`.
 */
struct HalfEdge {
  uint32_t head = kNone;
  uint32_t elem = kNone;
  uint32_t prev = kNone;
  uint32_t next = kNone;
  uint32_t half = kNone;

  [[nodiscard]] bool is_border() const { return elem == kNone; }
};

/**
 * \brief Half-edge structure for orientable 2-manifolds with optional border.
 *
 * The structure is built once from a sequence of polygons and is immutable
 * afterwards, so any number of threads may query a shared instance.
 *
 * Arena layout: facet `k` owns positions `2k` (an interior arc) and `2k+1`
 * (its twin, interior or border). Facets are numbered in order of first
 * appearance while walking the input faces arc by arc.
 *
 * Representatives: `half4elem(f)` is the arc leaving the first vertex of
 * face `f`, so `element(f)` reproduces the input cycle exactly.
 * `half4vert(v)` is the first interior arc in arena order leaving `v`.
 *
 * ## References
 *
 * * Kettner, L. (1999). Using generic programming for designing a data
 *   structure for polyhedral surfaces.
 */
class HalfEdgeStructure {
public:
  static constexpr int DIMENSION = 2;

  HalfEdgeStructure() = default;

  /**
   * \brief Build the structure from polygonal elements.
   * \param elems Polygons over a shared vertex id space.
   * \throws InvalidShapeError for non-polygon elements or elements that visit
   *         a vertex twice.
   * \throws NonManifoldInputError if two faces claim the same oriented edge or
   *         the faces around a vertex do not form a single fan.
   */
  explicit HalfEdgeStructure(std::span<const Connectivity> elems) { build(elems); }

  explicit HalfEdgeStructure(const std::vector<Connectivity> &elems)
      : HalfEdgeStructure(std::span<const Connectivity>(elems)) {}

  // --------------------------------------------------------------------------
  // Counts and raw access
  // --------------------------------------------------------------------------

  [[nodiscard]] size_t num_elements() const { return edge_of_face_.size(); }
  [[nodiscard]] size_t num_facets() const { return halfedges_.size() / 2; }
  [[nodiscard]] size_t num_vertices() const { return edge_of_vertex_.size(); }
  [[nodiscard]] size_t num_halfedges() const { return halfedges_.size(); }
  [[nodiscard]] size_t num_border_halfedges() const { return num_border_; }

  [[nodiscard]] std::span<const HalfEdge> halfedges() const { return halfedges_; }

  [[nodiscard]] const HalfEdge &halfedge(uint32_t i) const {
    check_range(i, halfedges_.size(), "half-edge");
    return halfedges_[i];
  }

  /// \brief Arena position of the representative arc of element `f`.
  [[nodiscard]] uint32_t half4elem(uint32_t f) const {
    check_range(f, edge_of_face_.size(), "element");
    return edge_of_face_[f];
  }

  /// \brief Arena position of the representative arc leaving vertex `v`.
  [[nodiscard]] uint32_t half4vert(uint32_t v) const {
    check_vertex(v);
    return edge_of_vertex_[v];
  }

  /// \brief Whether vertex `v` is referenced by at least one element.
  [[nodiscard]] bool has_vertex(uint32_t v) const {
    return v < edge_of_vertex_.size() && edge_of_vertex_[v] != kNone;
  }

  // --------------------------------------------------------------------------
  // Elements and facets
  // --------------------------------------------------------------------------

  /// \brief Polygon of element `f`, reconstructed from its face cycle.
  [[nodiscard]] Connectivity element(uint32_t f) const {
    return connect(element_vertices(f));
  }

  /// \brief Segment of facet `k`, oriented as its interior arc.
  [[nodiscard]] Connectivity facet(uint32_t k) const {
    check_range(k, num_facets(), "facet");
    const HalfEdge &e = halfedges_[2 * static_cast<size_t>(k)];
    return {PolytopeShape::Segment, {e.head, halfedges_[e.half].head}};
  }

  /// \brief Vertex cycle of element `f` (boundary, rank 0).
  [[nodiscard]] std::vector<uint32_t> element_vertices(uint32_t f) const {
    std::vector<uint32_t> out;
    walk_face(half4elem(f), [&](uint32_t e) { out.push_back(halfedges_[e].head); });
    return out;
  }

  /// \brief Facet cycle of element `f` (boundary, rank 1).
  ///
  /// Entry `i` is the edge between entries `i` and `i+1` of
  /// `element_vertices(f)`.
  [[nodiscard]] std::vector<uint32_t> element_facets(uint32_t f) const {
    std::vector<uint32_t> out;
    walk_face(half4elem(f), [&](uint32_t e) { out.push_back(e / 2); });
    return out;
  }

  /// \brief Endpoints of a segment (boundary of an edge, rank 0).
  [[nodiscard]] static std::vector<uint32_t> segment_vertices(const Connectivity &segment) {
    check_segment(segment);
    return {segment[0], segment[1]};
  }

  // --------------------------------------------------------------------------
  // Vertex stars
  // --------------------------------------------------------------------------

  /// \brief Neighbors of `v` in counter-clockwise order (adjacency, rank 0).
  ///
  /// For a border vertex the ring is open and starts and ends at the two
  /// border neighbors.
  [[nodiscard]] std::vector<uint32_t> adjacent_vertices(uint32_t v) const {
    const std::vector<uint32_t> arms = vertex_star(v);
    std::vector<uint32_t> out;
    out.reserve(arms.size());
    for (uint32_t a : arms) {
      out.push_back(halfedges_[halfedges_[a].half].head);
    }
    return out;
  }

  /// \brief Segments `(v, u)` for every `u` in `adjacent_vertices(v)`.
  [[nodiscard]] std::vector<Connectivity> incident_segments(uint32_t v) const {
    std::vector<Connectivity> out;
    for (uint32_t u : adjacent_vertices(v)) {
      out.push_back({PolytopeShape::Segment, {v, u}});
    }
    return out;
  }

  /// \brief Facet ids incident to `v`, in `adjacent_vertices(v)` order.
  [[nodiscard]] std::vector<uint32_t> incident_facets(uint32_t v) const {
    std::vector<uint32_t> out = vertex_star(v);
    for (uint32_t &a : out) {
      a /= 2;
    }
    return out;
  }

  /**
   * \brief Element ids incident to `v` (coboundary, rank 2).
   *
   * Open stars are listed counter-clockwise from the border. Closed stars are
   * listed clockwise starting at the element of `half4vert(v)`.
   */
  [[nodiscard]] std::vector<uint32_t> incident_elements(uint32_t v) const {
    const std::vector<uint32_t> arms = vertex_star(v);
    std::vector<uint32_t> out;
    out.reserve(arms.size());
    if (halfedges_[arms.back()].is_border()) {
      for (size_t i = 0; i + 1 < arms.size(); ++i) {
        out.push_back(halfedges_[arms[i]].elem);
      }
      return out;
    }

    out.push_back(halfedges_[arms.front()].elem);
    for (size_t i = arms.size() - 1; i > 0; --i) {
      out.push_back(halfedges_[arms[i]].elem);
    }
    return out;
  }

  /// \brief Whether the star of `v` is open (`v` lies on the mesh border).
  [[nodiscard]] bool is_boundary_vertex(uint32_t v) const {
    return halfedges_[vertex_star(v).back()].is_border();
  }

  // --------------------------------------------------------------------------
  // Edge coboundary
  // --------------------------------------------------------------------------

  /**
   * \brief Elements sharing the edge between `u` and `v` (either direction).
   * \return One id for a border edge, otherwise the element on the `u -> v`
   *         side followed by the element on the `v -> u` side.
   * \throws NoSuchEdgeError if `u` and `v` are not joined by an edge.
   */
  [[nodiscard]] std::vector<uint32_t> edge_elements(uint32_t u, uint32_t v) const {
    const HalfEdge &e = halfedges_[find_arc(u, v)];
    const HalfEdge &h = halfedges_[e.half];
    if (e.is_border()) {
      return {h.elem};
    }
    if (h.is_border()) {
      return {e.elem};
    }
    return {e.elem, h.elem};
  }

  /// \brief Polygons sharing `segment` (coboundary of an edge, rank 2).
  [[nodiscard]] std::vector<Connectivity> adjacent_elements(const Connectivity &segment) const {
    check_segment(segment);
    std::vector<Connectivity> out;
    for (uint32_t f : edge_elements(segment[0], segment[1])) {
      out.push_back(element(f));
    }
    return out;
  }

  /// \brief Element ids sharing facet `k`.
  [[nodiscard]] std::vector<uint32_t> facet_elements(uint32_t k) const {
    check_range(k, num_facets(), "facet");
    const HalfEdge &e = halfedges_[2 * static_cast<size_t>(k)];
    return edge_elements(e.head, halfedges_[e.half].head);
  }

private:
  struct PairKey {
    uint32_t u, v;
    bool operator==(const PairKey &o) const { return u == o.u && v == o.v; }
  };

  struct PairHash {
    std::size_t operator()(const PairKey &k) const {
      return std::hash<uint64_t>()((static_cast<uint64_t>(k.u) << 32) | k.v);
    }
  };

  void build(std::span<const Connectivity> elems) {
    const size_t n_faces = elems.size();

    size_t n_arcs = 0;
    size_t n_vertices = 0;
    for (size_t f = 0; f < n_faces; ++f) {
      const Connectivity &c = elems[f];
      if (c.paramdim() != 2) {
        throw InvalidShapeError(
            fmt::format("element {} is a {}, half-edge structures need polygons", f, c));
      }
      const size_t n = c.size();
      std::vector<uint32_t> sorted(c.indices().begin(), c.indices().end());
      std::sort(sorted.begin(), sorted.end());
      const auto repeated = std::adjacent_find(sorted.begin(), sorted.end());
      if (repeated != sorted.end()) {
        throw InvalidShapeError(
            fmt::format("element {} = {} visits vertex {} twice", f, c, *repeated));
      }
      n_vertices = std::max<size_t>(n_vertices, static_cast<size_t>(sorted.back()) + 1);
      n_arcs += n;
    }

    // Pass 1: one interior arc per oriented pair, in construction order.
    std::vector<uint32_t> face_start(n_faces + 1, 0);
    std::vector<HalfEdge> arcs;
    arcs.reserve(n_arcs);
    std::unordered_map<PairKey, uint32_t, PairHash> arc4pair;
    arc4pair.reserve(n_arcs);

    for (size_t f = 0; f < n_faces; ++f) {
      const Connectivity &c = elems[f];
      const size_t n = c.size();
      face_start[f] = static_cast<uint32_t>(arcs.size());
      for (size_t i = 0; i < n; ++i) {
        const PairKey key{c[i], c[(i + 1) % n]};
        const auto [it, inserted] =
            arc4pair.emplace(key, static_cast<uint32_t>(arcs.size()));
        if (!inserted) {
          throw NonManifoldInputError(fmt::format(
              "oriented edge ({}, {}) is claimed by element {} and element {}", key.u,
              key.v, arcs[it->second].elem, f));
        }
        arcs.push_back({c[i], static_cast<uint32_t>(f)});
      }
    }
    face_start[n_faces] = static_cast<uint32_t>(arcs.size());

    // Pass 2: prev/next within the face cycle, twins across faces.
    std::vector<uint32_t> twin(arcs.size(), kNone);
    for (size_t f = 0; f < n_faces; ++f) {
      const uint32_t begin = face_start[f];
      const uint32_t n = face_start[f + 1] - begin;
      for (uint32_t i = 0; i < n; ++i) {
        HalfEdge &he = arcs[begin + i];
        he.prev = begin + (i + n - 1) % n;
        he.next = begin + (i + 1) % n;

        const auto it = arc4pair.find({arcs[he.next].head, he.head});
        if (it != arc4pair.end()) {
          twin[begin + i] = it->second;
        }
      }
    }
    arc4pair.clear();

    // Finalize: place each arc next to its twin (or a new border arc).
    std::vector<uint32_t> slot(arcs.size(), kNone);
    halfedges_.clear();
    halfedges_.reserve(2 * arcs.size());
    num_border_ = 0;
    for (uint32_t a = 0; a < arcs.size(); ++a) {
      if (slot[a] != kNone) {
        continue;
      }
      slot[a] = static_cast<uint32_t>(halfedges_.size());
      halfedges_.push_back(arcs[a]);
      if (twin[a] != kNone) {
        slot[twin[a]] = static_cast<uint32_t>(halfedges_.size());
        halfedges_.push_back(arcs[twin[a]]);
      } else {
        halfedges_.push_back({arcs[arcs[a].next].head, kNone});
        ++num_border_;
      }
    }

    for (uint32_t pos = 0; pos < halfedges_.size(); ++pos) {
      HalfEdge &he = halfedges_[pos];
      he.half = pos ^ 1u;
      if (!he.is_border()) {
        he.prev = slot[he.prev];
        he.next = slot[he.next];
      }
    }

    edge_of_face_.resize(n_faces);
    for (size_t f = 0; f < n_faces; ++f) {
      edge_of_face_[f] = slot[face_start[f]];
    }

    edge_of_vertex_.assign(n_vertices, kNone);
    for (uint32_t pos = 0; pos < halfedges_.size(); ++pos) {
      const HalfEdge &he = halfedges_[pos];
      if (!he.is_border() && edge_of_vertex_[he.head] == kNone) {
        edge_of_vertex_[he.head] = pos;
      }
    }

    // Every arc leaving a vertex must lie in the single fan its star walk visits.
    std::vector<uint32_t> out_arcs(n_vertices, 0);
    for (const HalfEdge &he : halfedges_) {
      if (!he.is_border()) {
        ++out_arcs[he.head];
      }
    }
    for (uint32_t v = 0; v < n_vertices; ++v) {
      if (edge_of_vertex_[v] == kNone) {
        continue;
      }
      const std::vector<uint32_t> arms = vertex_star(v);
      const size_t reached = arms.size() - (halfedges_[arms.back()].is_border() ? 1 : 0);
      if (reached != out_arcs[v]) {
        throw NonManifoldInputError(fmt::format(
            "vertex {} joins separate element fans ({} of its {} edges reachable from one)", v,
            reached, out_arcs[v]));
      }
    }

    core::log_status("[HalfEdge] Built {} elements, {} facets ({} on the border) over {} "
                     "vertices.",
                     num_elements(), num_facets(), num_border_, num_vertices());
  }

  template <typename Fn> void walk_face(uint32_t start, Fn &&fn) const {
    uint32_t e = start;
    do {
      fn(e);
      e = halfedges_[e].next;
    } while (e != start);
  }

  /**
   * \brief Arms of the star of `v` in counter-clockwise order.
   *
   * Every arm leaves `v`. A closed star starts at `half4vert(v)`. An open
   * star starts at its clockwise-most interior arm and ends with the border
   * arc that closes it on the other side.
   */
  [[nodiscard]] std::vector<uint32_t> vertex_star(uint32_t v) const {
    uint32_t e = half4vert(v);

    // Rotate clockwise to the first arm; a closed star comes back to `e`.
    uint32_t h = halfedges_[e].half;
    if (!halfedges_[h].is_border()) {
      uint32_t n = halfedges_[h].next;
      h = halfedges_[n].half;
      while (!halfedges_[h].is_border() && n != e) {
        n = halfedges_[h].next;
        h = halfedges_[n].half;
      }
      e = n;
    }

    std::vector<uint32_t> arms{e};
    uint32_t o = halfedges_[halfedges_[e].prev].half;
    while (!halfedges_[o].is_border() && o != e) {
      arms.push_back(o);
      o = halfedges_[halfedges_[o].prev].half;
    }
    if (halfedges_[o].is_border()) {
      arms.push_back(o);
    }
    return arms;
  }

  /// \brief Arc leaving `u` whose twin leaves `v`, searching both rotations.
  [[nodiscard]] uint32_t find_arc(uint32_t u, uint32_t v) const {
    check_vertex(v);
    const uint32_t start = half4vert(u);

    uint32_t e = start;
    do {
      if (halfedges_[halfedges_[e].half].head == v) {
        return e;
      }
      if (halfedges_[e].is_border()) {
        break;
      }
      e = halfedges_[halfedges_[e].prev].half;
    } while (e != start);

    e = start;
    while (true) {
      const uint32_t h = halfedges_[e].half;
      if (halfedges_[h].head == v) {
        return e;
      }
      if (halfedges_[h].is_border()) {
        break;
      }
      e = halfedges_[h].next;
      if (e == start) {
        break;
      }
    }

    throw NoSuchEdgeError(fmt::format("no edge between vertex {} and vertex {}", u, v));
  }

  static void check_range(uint32_t i, size_t count, const char *what) {
    if (i >= count) {
      throw IndexOutOfRangeError(fmt::format("{} {} out of range ({} total)", what, i, count));
    }
  }

  void check_vertex(uint32_t v) const {
    check_range(v, edge_of_vertex_.size(), "vertex");
    if (edge_of_vertex_[v] == kNone) {
      throw NoSuchVertexError(fmt::format("vertex {} is not referenced by any element", v));
    }
  }

  static void check_segment(const Connectivity &segment) {
    if (segment.shape() != PolytopeShape::Segment) {
      throw InvalidShapeError(fmt::format("expected a Segment, got {}", segment));
    }
  }

  std::vector<HalfEdge> halfedges_;
  std::vector<uint32_t> edge_of_face_;
  std::vector<uint32_t> edge_of_vertex_;
  size_t num_border_ = 0;
};

static_assert(TopologicalStructure<HalfEdgeStructure>);

} // namespace basalt::data
