#pragma once

#include <cmath>

#include <openchi/config.hpp>
#include <openchi/meshes.hpp>

namespace open_chi {

/// A function of imaginary time and lattice displacement, f(tau, r_1, ..., r_D).
/// Values are stored on the mesh points; lookups outside of [0, beta) follow the statistics of the time mesh.
template <typename ValueT, size_t D>
class itime_object {
public:
    typedef ValueT value_type;
    typedef typename ValueT::value_type real_t;
    static constexpr size_t NDim = D;
    typedef typename tools::ArgBackGenerator<D,enum_grid,grid_object,value_type,enum_grid>::type data_type;
    typedef std::array<enum_grid::point, D> r_point;

    itime_object(itime_mesh const& tmesh, lattice_mesh const& rmesh):
        tmesh_(tmesh),
        rmesh_(rmesh),
        data_(std::tuple_cat(std::make_tuple(tmesh.grid()), tuple_tools::repeater<enum_grid,D>::get_array(rmesh.grid())))
    {
        data_ = value_type(0);
    }

    itime_mesh const& tmesh() const { return tmesh_; }
    lattice_mesh const& rmesh() const { return rmesh_; }
    data_type const& data() const { return data_; }
    data_type& data() { return data_; }
    /// All displacements of the lattice, last axis running fastest
    std::vector<r_point> r_points() const { return mesh_points<D>(rmesh_.grid()); }

    value_type& get(enum_grid::point t, r_point const& r) { return data_.get(std::tuple_cat(std::make_tuple(t), r)); }
    value_type operator()(enum_grid::point t, r_point const& r) const { return data_(std::tuple_cat(std::make_tuple(t), r)); }

    /// Value at (r, beta - tau_t). t = 0 gives the value at beta, continued from tau = 0 by the boundary condition.
    value_type eval_reflected(r_point const& r, enum_grid::point t) const {
        itime_mesh::wrapped_point p = tmesh_.reflect(t);
        return real_t(p.second) * (*this)(p.first, r);
    }

    /// Value at (r, tau) for any finite tau. Between mesh points the value is interpolated linearly.
    value_type eval(r_point const& r, real_type tau) const;

    /// Fill with f(t, r) on every mesh point
    template <typename F>
    void fill(F f) {
        std::vector<r_point> rpts = r_points();
        for (auto t : tmesh_.grid().points())
            for (r_point const& r : rpts) this->get(t, r) = f(t, r);
    }

    /// True if no value is inf or nan
    bool is_finite() const;

private:
    itime_mesh tmesh_;
    lattice_mesh rmesh_;
    data_type data_;
};

template <typename ValueT, size_t D>
typename itime_object<ValueT,D>::value_type itime_object<ValueT,D>::eval(r_point const& r, real_type tau) const
{
    static const real_type eps = 1e-10;
    if (!std::isfinite(tau)) {
        ERROR("tau = " << tau);
        throw domain_mismatch("imaginary time is not finite");
        }
    // every function here is periodic in 2 beta, which keeps the index within (-2M, 2M)
    real_type x = std::fmod(tau, 2.0*tmesh_.beta()) / tmesh_.step();
    int j = int(std::floor(x + eps));
    real_type frac = x - j;
    itime_mesh::wrapped_point p0 = tmesh_.wrap(j);
    value_type v0 = real_t(p0.second) * (*this)(p0.first, r);
    if (frac < eps) return v0;
    // the right neighbour of tau_{M-1} is beta, i.e. tau_0 continued through the boundary
    itime_mesh::wrapped_point p1 = tmesh_.wrap(j+1);
    value_type v1 = real_t(p1.second) * (*this)(p1.first, r);
    return v0 + real_t(frac) * (v1 - v0);
}

template <typename ValueT, size_t D>
bool itime_object<ValueT,D>::is_finite() const
{
    std::vector<r_point> rpts = r_points();
    for (auto t : tmesh_.grid().points())
        for (r_point const& r : rpts) {
            value_type v = (*this)(t, r);
            if (!std::isfinite(v.real()) || !std::isfinite(v.imag())) return false;
            }
    return true;
}

} // end of namespace open_chi
