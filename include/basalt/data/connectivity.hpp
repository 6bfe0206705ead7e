#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <basalt/core/errors.hpp>

namespace basalt::data {

/// \brief Polytope tag carried by a connectivity.
enum class PolytopeShape : uint8_t {
  Segment,
  Triangle,
  Quadrangle,
  Ngon
};

/**
 * \brief Parametric dimension of a shape (1 for segments, 2 for polygons).
 * \param shape Shape tag.
 * \return Parametric dimension.
 */
[[nodiscard]] constexpr int paramdim(PolytopeShape shape) {
  return shape == PolytopeShape::Segment ? 1 : 2;
}

/**
 * \brief Human-readable shape name used in logs and error messages.
 * \param shape Shape tag.
 * \return Static name string.
 */
[[nodiscard]] constexpr std::string_view shape_name(PolytopeShape shape) {
  switch (shape) {
  case PolytopeShape::Segment:
    return "Segment";
  case PolytopeShape::Triangle:
    return "Triangle";
  case PolytopeShape::Quadrangle:
    return "Quadrangle";
  default:
    return "Ngon";
  }
}

/**
 * \brief Ordered vertex-index tuple labeled with a polytope shape.
 *
 * For polygon shapes consecutive indices (cyclically) are the edges of the
 * polygon boundary. `Ngon` tuples of length 3 and 4 are stored as
 * `Triangle` and `Quadrangle`, so two connectivities are equal exactly when
 * their indices are equal and their index counts agree.
 */
class Connectivity {
public:
  /**
   * \brief Construct and validate a connectivity.
   * \param shape Shape tag.
   * \param indices Vertex ids in order.
   * \throws InvalidShapeError if `indices.size()` does not fit `shape`.
   */
  Connectivity(PolytopeShape shape, std::vector<uint32_t> indices)
      : shape_(shape), indices_(std::move(indices)) {
    const size_t n = indices_.size();
    bool valid = false;
    switch (shape_) {
    case PolytopeShape::Segment:
      valid = n == 2;
      break;
    case PolytopeShape::Triangle:
      valid = n == 3;
      break;
    case PolytopeShape::Quadrangle:
      valid = n == 4;
      break;
    case PolytopeShape::Ngon:
      valid = n >= 3;
      if (n == 3) {
        shape_ = PolytopeShape::Triangle;
      } else if (n == 4) {
        shape_ = PolytopeShape::Quadrangle;
      }
      break;
    }

    if (!valid) {
      throw InvalidShapeError(fmt::format("{} cannot have {} vertex indices ({})",
                                          shape_name(shape), n,
                                          fmt::join(indices_, ", ")));
    }
  }

  Connectivity(PolytopeShape shape, std::initializer_list<uint32_t> indices)
      : Connectivity(shape, std::vector<uint32_t>(indices)) {}

  [[nodiscard]] PolytopeShape shape() const { return shape_; }
  [[nodiscard]] int paramdim() const { return data::paramdim(shape_); }
  [[nodiscard]] size_t size() const { return indices_.size(); }
  [[nodiscard]] std::span<const uint32_t> indices() const { return indices_; }
  [[nodiscard]] uint32_t operator[](size_t i) const { return indices_[i]; }

  bool operator==(const Connectivity &other) const = default;

private:
  PolytopeShape shape_;
  std::vector<uint32_t> indices_;
};

/**
 * \brief Build a connectivity whose shape is inferred from the index count.
 *
 * 2 indices give a segment, 3 a triangle, 4 a quadrangle, more an n-gon.
 * \throws InvalidShapeError for fewer than 2 indices.
 */
inline Connectivity connect(std::vector<uint32_t> indices) {
  switch (indices.size()) {
  case 0:
  case 1:
    throw InvalidShapeError(
        fmt::format("cannot infer a shape from {} vertex indices", indices.size()));
  case 2:
    return {PolytopeShape::Segment, std::move(indices)};
  case 3:
    return {PolytopeShape::Triangle, std::move(indices)};
  case 4:
    return {PolytopeShape::Quadrangle, std::move(indices)};
  default:
    return {PolytopeShape::Ngon, std::move(indices)};
  }
}

inline Connectivity connect(std::initializer_list<uint32_t> indices) {
  return connect(std::vector<uint32_t>(indices));
}

inline Connectivity connect(std::initializer_list<uint32_t> indices, PolytopeShape shape) {
  return {shape, std::vector<uint32_t>(indices)};
}

} // namespace basalt::data

template <>
struct fmt::formatter<basalt::data::Connectivity> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const basalt::data::Connectivity &c, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}({})", basalt::data::shape_name(c.shape()),
                          fmt::join(c.indices(), ", "));
  }
};
