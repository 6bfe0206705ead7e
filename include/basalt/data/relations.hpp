#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <fmt/format.h>

#include <basalt/core/errors.hpp>
#include <basalt/core/parallel.hpp>
#include <basalt/data/halfedge.hpp>

namespace basalt::data {

/// \brief Family of a topological relation.
enum class RelationType {
  Boundary,
  Coboundary,
  Adjacency
};

/// \brief The closed set of `(type, from, to)` relations the half-edge
/// structure answers.
enum class RelationKind {
  Boundary20,
  Boundary21,
  Boundary10,
  Coboundary01,
  Coboundary02,
  Coboundary12,
  Adjacency00
};

namespace detail {

constexpr std::optional<RelationKind> find_relation_kind(RelationType type, int from, int to) {
  switch (type) {
  case RelationType::Boundary:
    if (from == 2 && to == 0)
      return RelationKind::Boundary20;
    if (from == 2 && to == 1)
      return RelationKind::Boundary21;
    if (from == 1 && to == 0)
      return RelationKind::Boundary10;
    break;
  case RelationType::Coboundary:
    if (from == 0 && to == 1)
      return RelationKind::Coboundary01;
    if (from == 0 && to == 2)
      return RelationKind::Coboundary02;
    if (from == 1 && to == 2)
      return RelationKind::Coboundary12;
    break;
  case RelationType::Adjacency:
    if (from == 0 && to == 0)
      return RelationKind::Adjacency00;
    break;
  }
  return std::nullopt;
}

constexpr int source_rank(RelationKind kind) {
  switch (kind) {
  case RelationKind::Boundary20:
  case RelationKind::Boundary21:
    return 2;
  case RelationKind::Boundary10:
  case RelationKind::Coboundary12:
    return 1;
  default:
    return 0;
  }
}

constexpr const char *relation_name(RelationType type) {
  switch (type) {
  case RelationType::Boundary:
    return "Boundary";
  case RelationType::Coboundary:
    return "Coboundary";
  default:
    return "Adjacency";
  }
}

inline std::vector<uint32_t> evaluate(RelationKind kind, const HalfEdgeStructure &s,
                                      uint32_t ind) {
  switch (kind) {
  case RelationKind::Boundary20:
    return s.element_vertices(ind);
  case RelationKind::Boundary21:
    return s.element_facets(ind);
  case RelationKind::Boundary10:
    return HalfEdgeStructure::segment_vertices(s.facet(ind));
  case RelationKind::Coboundary01:
    return s.incident_facets(ind);
  case RelationKind::Coboundary02:
    return s.incident_elements(ind);
  case RelationKind::Coboundary12:
    return s.facet_elements(ind);
  case RelationKind::Adjacency00:
    return s.adjacent_vertices(ind);
  }
  return {};
}

inline size_t domain_size(RelationKind kind, const HalfEdgeStructure &s) {
  switch (source_rank(kind)) {
  case 2:
    return s.num_elements();
  case 1:
    return s.num_facets();
  default:
    return s.num_vertices();
  }
}

inline bool is_defined(RelationKind kind, const HalfEdgeStructure &s, uint32_t ind) {
  if (source_rank(kind) == 0) {
    return s.has_vertex(ind);
  }
  return ind < domain_size(kind, s);
}

} // namespace detail

/**
 * \brief Concept for a callable relation over a structure's entity ids.
 */
template <typename R>
concept Relation = requires(const R &r, uint32_t ind) {
  { r(ind) } -> std::convertible_to<std::vector<uint32_t>>;
  { r.domain_size() } -> std::convertible_to<size_t>;
  { r.is_defined(ind) } -> std::convertible_to<bool>;
};

/**
 * \brief Relation with its rank pair fixed at compile time.
 *
 * Unsupported pairs are rejected by `static_assert`. The structure must
 * outlive the relation.
 */
template <RelationType Type, int From, int To> class StaticRelation {
  static constexpr std::optional<RelationKind> kKind =
      detail::find_relation_kind(Type, From, To);
  static_assert(kKind.has_value(), "unsupported topological relation for half-edge structures");

public:
  explicit StaticRelation(const HalfEdgeStructure &structure) : structure_(&structure) {}

  /// \brief Related entity ids of entity `ind`.
  [[nodiscard]] std::vector<uint32_t> operator()(uint32_t ind) const {
    return detail::evaluate(*kKind, *structure_, ind);
  }

  /// \brief Number of source entities (vertices, facets or elements).
  [[nodiscard]] size_t domain_size() const { return detail::domain_size(*kKind, *structure_); }

  /// \brief Whether `ind` can be queried without error.
  [[nodiscard]] bool is_defined(uint32_t ind) const {
    return detail::is_defined(*kKind, *structure_, ind);
  }

private:
  const HalfEdgeStructure *structure_;
};

/// \brief Lower-rank entities bounding an entity (e.g. vertices of a face).
template <int From, int To> using Boundary = StaticRelation<RelationType::Boundary, From, To>;

/// \brief Higher-rank entities incident to an entity (e.g. faces around a vertex).
template <int From, int To>
using Coboundary = StaticRelation<RelationType::Coboundary, From, To>;

/// \brief Same-rank entities sharing a higher-rank entity (e.g. the 1-ring).
template <int Rank> using Adjacency = StaticRelation<RelationType::Adjacency, Rank, Rank>;

/**
 * \brief Relation selected at runtime from a type and rank pair.
 *
 * The structure must outlive the relation.
 */
class TopologicalRelation {
public:
  /**
   * \throws UnsupportedRelationError if `(type, from, to)` is not one of
   *         the supported relations.
   */
  TopologicalRelation(const HalfEdgeStructure &structure, RelationType type, int from, int to)
      : structure_(&structure), kind_(require_kind(type, from, to)) {}

  [[nodiscard]] std::vector<uint32_t> operator()(uint32_t ind) const {
    return detail::evaluate(kind_, *structure_, ind);
  }

  [[nodiscard]] size_t domain_size() const { return detail::domain_size(kind_, *structure_); }

  [[nodiscard]] bool is_defined(uint32_t ind) const {
    return detail::is_defined(kind_, *structure_, ind);
  }

  [[nodiscard]] RelationKind kind() const { return kind_; }

private:
  static RelationKind require_kind(RelationType type, int from, int to) {
    const auto kind = detail::find_relation_kind(type, from, to);
    if (!kind) {
      throw UnsupportedRelationError(fmt::format(
          "{}{{{},{}}} is not supported by half-edge structures", detail::relation_name(type),
          from, to));
    }
    return *kind;
  }

  const HalfEdgeStructure *structure_;
  RelationKind kind_;
};

static_assert(Relation<Boundary<2, 0>>);
static_assert(Relation<Adjacency<0>>);
static_assert(Relation<TopologicalRelation>);

/**
 * \brief CSR table of a relation evaluated over its whole domain.
 *
 * Range for entity `i` is `[offsets[i], offsets[i+1])` in `data`.
 */
struct RelationTable {
  std::vector<uint32_t> offsets;
  std::vector<uint32_t> data;

  [[nodiscard]] size_t size() const { return offsets.empty() ? 0 : offsets.size() - 1; }

  [[nodiscard]] std::span<const uint32_t> row(uint32_t i) const {
    if (static_cast<size_t>(i) + 1 >= offsets.size()) {
      return {};
    }
    const uint32_t begin = offsets[i];
    const uint32_t end = offsets[i + 1];
    return {data.data() + begin, end - begin};
  }
};

/**
 * \brief Evaluate `relation` for every id of its domain.
 *
 * Rows are computed concurrently; ids for which the relation is undefined
 * (unreferenced vertices) get empty rows.
 * \param relation Relation to tabulate.
 * \return CSR table with one row per domain id.
 */
template <Relation R> RelationTable build_relation_table(const R &relation) {
  const size_t n = relation.domain_size();
  std::vector<std::vector<uint32_t>> rows(n);

  core::parallel_for_index(
      0, static_cast<int>(n),
      [&](int row_idx) {
        const uint32_t ind = static_cast<uint32_t>(row_idx);
        if (relation.is_defined(ind)) {
          rows[ind] = relation(ind);
        }
      },
      256);

  RelationTable table;
  table.offsets.assign(n + 1, 0);
  for (size_t i = 0; i < n; ++i) {
    table.offsets[i + 1] = table.offsets[i] + static_cast<uint32_t>(rows[i].size());
  }
  table.data.resize(table.offsets[n]);

  core::parallel_for_index(
      0, static_cast<int>(n),
      [&](int row_idx) {
        const size_t i = static_cast<size_t>(row_idx);
        std::copy(rows[i].begin(), rows[i].end(), table.data.begin() + table.offsets[i]);
      },
      256);

  return table;
}

} // namespace basalt::data
