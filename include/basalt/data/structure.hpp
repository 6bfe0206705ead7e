#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <vector>

#include <basalt/data/connectivity.hpp>

namespace basalt::data {

/**
 * \brief Concept for a topological structure over polygonal elements.
 *
 * A valid structure type must define:
 * - a topological dimension (`T::DIMENSION`)
 * - element and vertex counts (`num_elements`, `num_vertices`)
 * - indexed element retrieval (`element`)
 * - construction from an element sequence
 */
template <typename T>
concept TopologicalStructure =
    std::constructible_from<T, std::span<const Connectivity>> &&
    requires(const T &ct, uint32_t idx) {
      { T::DIMENSION } -> std::convertible_to<int>;
      { ct.num_elements() } -> std::convertible_to<size_t>;
      { ct.num_vertices() } -> std::convertible_to<size_t>;
      { ct.element(idx) } -> std::convertible_to<Connectivity>;
    };

/**
 * \brief Collect every element of `s` in element-id order.
 * \param s Source structure.
 * \return Element connectivities.
 */
template <TopologicalStructure S> std::vector<Connectivity> elements(const S &s) {
  const size_t n = s.num_elements();
  std::vector<Connectivity> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(s.element(static_cast<uint32_t>(i)));
  }
  return out;
}

/**
 * \brief Rebuild the topology held by `s` as a structure of type `To`.
 * \param s Source structure.
 * \return New structure over the same elements, in the same order.
 */
template <TopologicalStructure To, TopologicalStructure From> To convert(const From &s) {
  const std::vector<Connectivity> elems = elements(s);
  return To(std::span<const Connectivity>(elems));
}

} // namespace basalt::data
