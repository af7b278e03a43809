#pragma once

#include <cmath>

#include <openchi/config.hpp>
#include <openchi/meshes.hpp>

namespace open_chi {

/// A point of the D-dimensional Brillouin zone mesh
template <size_t D>
using BZPoint = std::array<kmesh::point, D>;

/// Dispersion e(k) of a lattice with D momentum components.
/// Derived lattices provide energy(momentum) and second_moment().
template <size_t D, class Derived>
struct lattice_base {
    static constexpr size_t NDim = D;
    typedef BZPoint<D> bz_point;
    typedef std::array<real_type, D> momentum;

    real_type dispersion(momentum const& k) const { return static_cast<Derived const*>(this)->energy(k); }
    real_type dispersion(bz_point const& k) const {
        momentum p;
        for (size_t d=0; d<D; ++d) p[d] = real_type(k[d]);
        return dispersion(p);
    }
    /// e(k) on every point of the zone, in the order of zone_points
    std::vector<real_type> dispersion_table(kmesh const& kgrid) const {
        std::vector<bz_point> pts = zone_points(kgrid);
        std::vector<real_type> out(pts.size());
        for (size_t i=0; i<pts.size(); ++i) out[i] = dispersion(pts[i]);
        return out;
    }
    /// All points of the zone, last axis running fastest
    static std::vector<bz_point> zone_points(kmesh const& kgrid) { return mesh_points<D>(kgrid); }
};

/// Nearest neighbour hopping on a hypercubic lattice, e(k) = -2t sum_d cos(k_d)
template <size_t D>
struct cubic_traits : lattice_base<D, cubic_traits<D>> {
    typedef lattice_base<D, cubic_traits<D>> base;
    using base::dispersion;

    explicit cubic_traits(real_type t):t_(t){}

    real_type energy(typename base::momentum const& k) const {
        real_type e = 0.0;
        for (size_t d=0; d<D; ++d) e -= 2.0*t_*std::cos(k[d]);
        return e;
    }
    /// Zone average of e(k)^2
    real_type second_moment() const { return 2.0*t_*t_*D; }
    /// (pi,...,pi) : e(k+Q) = -e(k) for every k
    static BZPoint<D> nesting_vector(kmesh const& kgrid);

    real_type t_;
};

/// Triangular lattice, drawn as a square lattice with hopping t' along one diagonal
struct triangular_traits : lattice_base<2, triangular_traits> {
    using lattice_base<2, triangular_traits>::dispersion;

    triangular_traits(real_type t, real_type tp):t_(t),tp_(tp){}

    real_type energy(momentum const& k) const
        { return -2.0*t_*(std::cos(k[0]) + std::cos(k[1])) - 2.0*tp_*std::cos(k[0] - k[1]); }
    real_type second_moment() const { return 4.0*t_*t_ + 2.0*tp_*tp_; }

    real_type t_, tp_;
};

/// Square lattice with next-nearest neighbour hopping t'
struct square_nnn_traits : lattice_base<2, square_nnn_traits> {
    using lattice_base<2, square_nnn_traits>::dispersion;

    square_nnn_traits(real_type t, real_type tp):t_(t),tp_(tp){}

    real_type energy(momentum const& k) const {
        real_type cx = std::cos(k[0]), cy = std::cos(k[1]);
        return -2.0*t_*(cx + cy) - 4.0*tp_*cx*cy;
    }
    real_type second_moment() const { return 4.0*t_*t_ + 4.0*tp_*tp_; }

    real_type t_, tp_;
};

/// Explicit instantiation of a lattice-dependent class for every supported lattice
#define OPENCHI_INSTANTIATE_LATTICE_OBJECT(OBJ1) \
    template class OBJ1<cubic_traits<1>>; \
    template class OBJ1<cubic_traits<2>>; \
    template class OBJ1<cubic_traits<3>>; \
    template class OBJ1<triangular_traits>; \
    template class OBJ1<square_nnn_traits>;

template <size_t D>
inline BZPoint<D> cubic_traits<D>::nesting_vector(kmesh const& kgrid)
{
    if (kgrid.size() % 2) {
        ERROR("No (pi,...,pi) on a mesh of " << kgrid.size() << " points");
        throw invalid_mesh("nesting vector (pi,...,pi) is not on a mesh with an odd number of points");
        }
    return tuple_tools::repeater<kmesh::point, D>::get_array(kgrid[kgrid.size()/2]);
}

} // end of namespace open_chi
