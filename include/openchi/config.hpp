#pragma once

#include <stdexcept>
#include <string>

#include <boost/math/special_functions/pow.hpp>
#include <gftools.hpp>

#define OPENCHI_VERSION_MAJOR 0
#define OPENCHI_VERSION_MINOR 1

namespace open_chi {

using namespace gftools;
using boost::math::pow;

/// A mesh is degenerate or lacks the structure needed by the transforms (negation, reflection)
struct invalid_mesh : std::logic_error {
    explicit invalid_mesh(std::string const& what) : std::logic_error(what) {}
};

/// Two meshes that must be conjugate disagree in beta, size or statistics
struct domain_mismatch : std::logic_error {
    explicit domain_mismatch(std::string const& what) : std::logic_error(what) {}
};

/// The result left the representable range (e.g. beta -> infinity at perfect nesting)
struct numeric_overflow : std::overflow_error {
    explicit numeric_overflow(std::string const& what) : std::overflow_error(what) {}
};

} // end of namespace open_chi
