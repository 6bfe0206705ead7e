#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

#include <fmt/format.h>

#include <basalt/core/errors.hpp>
#include <basalt/data/connectivity.hpp>
#include <basalt/data/structure.hpp>

namespace basalt::data {

/**
 * \brief Flat list of polygonal elements; element id = position.
 *
 * This is the reference representation built directly from user input. It
 * answers no topological queries; convert it to a `HalfEdgeStructure` for
 * boundary, coboundary and adjacency relations.
 */
class ElementListStructure {
public:
  static constexpr int DIMENSION = 2;

  ElementListStructure() = default;

  /**
   * \brief Construct from polygon connectivities (mixed shapes allowed).
   * \throws InvalidShapeError if an element is not a polygon.
   */
  explicit ElementListStructure(std::span<const Connectivity> elems)
      : elements_(elems.begin(), elems.end()) {
    for (size_t i = 0; i < elements_.size(); ++i) {
      const Connectivity &c = elements_[i];
      if (c.paramdim() != 2) {
        throw InvalidShapeError(
            fmt::format("element {} is a {}, expected a polygon", i, c));
      }
      for (uint32_t v : c.indices()) {
        num_vertices_ = std::max<size_t>(num_vertices_, static_cast<size_t>(v) + 1);
      }
    }
  }

  explicit ElementListStructure(const std::vector<Connectivity> &elems)
      : ElementListStructure(std::span<const Connectivity>(elems)) {}

  [[nodiscard]] size_t num_elements() const { return elements_.size(); }

  /// \brief One past the largest referenced vertex id.
  [[nodiscard]] size_t num_vertices() const { return num_vertices_; }

  [[nodiscard]] const Connectivity &element(uint32_t i) const {
    if (i >= elements_.size()) {
      throw IndexOutOfRangeError(
          fmt::format("element {} out of range ({} elements)", i, elements_.size()));
    }
    return elements_[i];
  }

  [[nodiscard]] std::span<const Connectivity> elements() const { return elements_; }

  bool operator==(const ElementListStructure &other) const {
    return elements_ == other.elements_;
  }

private:
  std::vector<Connectivity> elements_;
  size_t num_vertices_ = 0;
};

static_assert(TopologicalStructure<ElementListStructure>);

} // namespace basalt::data
