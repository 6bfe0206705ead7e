#pragma once

/// \file
/// \brief Umbrella header for the public basalt API.

#include <basalt/core/errors.hpp>
#include <basalt/core/logging.hpp>
#include <basalt/core/parallel.hpp>

#include <basalt/data/connectivity.hpp>
#include <basalt/data/element_list.hpp>
#include <basalt/data/halfedge.hpp>
#include <basalt/data/mesh.hpp>
#include <basalt/data/relations.hpp>
#include <basalt/data/structure.hpp>

#include <basalt/ops/laplacian.hpp>
