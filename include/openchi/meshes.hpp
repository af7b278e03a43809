#pragma once

#include <array>
#include <iostream>
#include <utility>
#include <vector>

#include <openchi/config.hpp>

namespace open_chi {

/// Boundary condition in imaginary time : fermions are antiperiodic, bosons periodic in beta
enum class statistics { fermion, boson };

std::ostream& operator<<(std::ostream& out, statistics s);

/// Statistics of a Matsubara grid
template <bool F>
inline statistics grid_statistics(matsubara_grid<F> const&) { return F ? statistics::fermion : statistics::boson; }

/// Imaginary time mesh tau_j = beta*j/M, j = 0..M-1.
/// The statistics defines how values outside of [0, beta) are related to the stored ones.
class itime_mesh {
public:
    /// A mesh point together with the sign picked up on the way there through the boundary
    typedef std::pair<enum_grid::point, real_type> wrapped_point;

    itime_mesh(real_type beta, int npoints, statistics s);

    real_type beta() const { return beta_; }
    int size() const { return npoints_; }
    statistics stats() const { return stats_; }
    enum_grid const& grid() const { return grid_; }
    real_type value(int j) const { return beta_ * j / npoints_; }
    real_type value(enum_grid::point t) const { return value(int(t.index())); }
    real_type step() const { return beta_ / npoints_; }
    /// G(tau + beta) = sign() * G(tau)
    real_type sign() const { return stats_ == statistics::fermion ? -1.0 : 1.0; }

    /// Map an arbitrary integer index onto [0, M), accumulating the sign of the boundary condition
    wrapped_point wrap(int j) const;
    /// The mesh point beta - tau_t. For t = 0 this is beta itself, i.e. sign() * tau_0
    wrapped_point reflect(enum_grid::point t) const { return wrap(npoints_ - int(t.index())); }
    /// A mesh with the same beta and number of points for another statistics
    itime_mesh conjugate(statistics s) const { return itime_mesh(beta_, npoints_, s); }

    bool operator==(itime_mesh const& rhs) const;
    bool operator!=(itime_mesh const& rhs) const { return !(*this == rhs); }
    friend std::ostream& operator<<(std::ostream& out, itime_mesh const& m);

private:
    real_type beta_;
    int npoints_;
    statistics stats_;
    enum_grid grid_;
};

/// Throws domain_mismatch unless "other" shares beta and size with "reference" and has the expected statistics
void check_conjugate(itime_mesh const& reference, itime_mesh const& other, statistics expected);

/// Cyclic mesh of lattice displacements r = 0..N-1 along one axis, dual to a kmesh of N points
class lattice_mesh {
public:
    explicit lattice_mesh(int npoints);
    /// The real space mesh of a given Brillouin zone mesh. Throws invalid_mesh, if kgrid is not a uniform mesh over [0, 2pi)
    static lattice_mesh dual(kmesh const& kgrid);

    int size() const { return npoints_; }
    enum_grid const& grid() const { return grid_; }
    /// -r mod N
    enum_grid::point negate(enum_grid::point r) const { return grid_[(npoints_ - int(r.index())) % npoints_]; }
    template <size_t D>
    std::array<enum_grid::point, D> negate(std::array<enum_grid::point, D> r) const
        { for (size_t i=0; i<D; ++i) r[i] = negate(r[i]); return r; }

    bool operator==(lattice_mesh const& rhs) const { return npoints_ == rhs.npoints_; }
    bool operator!=(lattice_mesh const& rhs) const { return !(*this == rhs); }

private:
    int npoints_;
    enum_grid grid_;
};

/// Throws invalid_mesh unless the grid is a non-empty set of consecutive Matsubara frequencies at positive beta
template <bool F>
void check_matsubara_grid(matsubara_grid<F> const& grid)
{
    if (!grid.size()) { ERROR("Empty Matsubara grid"); throw invalid_mesh("Matsubara grid has no points"); };
    if (!(grid.beta() > 0)) { ERROR("beta = " << grid.beta()); throw invalid_mesh("Matsubara grid with non-positive beta"); };
    complex_type step(0.0, 2.0*PI/grid.beta());
    for (size_t i=1; i<grid.size(); ++i) {
        if (!is_float_equal(grid[i].value() - grid[i-1].value(), step, 1e-8)) {
            ERROR("Matsubara frequencies " << grid[i-1].value() << " and " << grid[i].value() << " are not neighbours");
            throw invalid_mesh("Matsubara grid has missing frequencies");
            }
        }
}

/// All points of the D-fold product of a grid with itself. The last axis runs fastest.
template <size_t D, typename Grid>
std::vector<std::array<typename Grid::point, D>> mesh_points(Grid const& grid)
{
    typedef std::array<typename Grid::point, D> point_array;
    size_t n = grid.size();
    if (!n) return std::vector<point_array>();
    size_t total = boost::math::pow<D>(n);
    std::vector<point_array> out(total, tuple_tools::repeater<typename Grid::point, D>::get_array(grid[0]));
    for (size_t i=0; i<total; ++i) {
        size_t rest = i;
        for (size_t d=0; d<D; ++d) { out[i][D-1-d] = grid[rest % n]; rest /= n; }
        }
    return out;
}

/// Row-major position of a point of a D-fold product grid with n points per axis
template <size_t D, typename Point>
inline size_t flat_index(std::array<Point, D> const& p, size_t n)
{
    size_t out = 0;
    for (size_t d=0; d<D; ++d) out = out*n + p[d].index();
    return out;
}

/// Row-major position of p + q, taken modulo n on every axis
template <size_t D, typename Point>
inline size_t flat_index(std::array<Point, D> const& p, std::array<Point, D> const& q, size_t n)
{
    size_t out = 0;
    for (size_t d=0; d<D; ++d) out = out*n + (p[d].index() + q[d].index()) % n;
    return out;
}

} // end of namespace open_chi
