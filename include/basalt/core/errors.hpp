#pragma once

#include <stdexcept>
#include <string>

namespace basalt {

/// \brief Connectivity index count does not match its shape tag, or a
/// polygon was required and something else was supplied.
class InvalidShapeError : public std::invalid_argument {
public:
  explicit InvalidShapeError(const std::string &what) : std::invalid_argument(what) {}
};

/// \brief Two faces claim the same oriented edge.
class NonManifoldInputError : public std::runtime_error {
public:
  explicit NonManifoldInputError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Element, facet, vertex or half-edge id outside the valid range.
class IndexOutOfRangeError : public std::out_of_range {
public:
  explicit IndexOutOfRangeError(const std::string &what) : std::out_of_range(what) {}
};

/// \brief Vertex id in range but not referenced by any face.
class NoSuchVertexError : public std::out_of_range {
public:
  explicit NoSuchVertexError(const std::string &what) : std::out_of_range(what) {}
};

/// \brief Segment whose endpoints are not joined by an edge of the mesh.
class NoSuchEdgeError : public std::out_of_range {
public:
  explicit NoSuchEdgeError(const std::string &what) : std::out_of_range(what) {}
};

/// \brief Relation rank pair outside the supported set.
class UnsupportedRelationError : public std::invalid_argument {
public:
  explicit UnsupportedRelationError(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace basalt
