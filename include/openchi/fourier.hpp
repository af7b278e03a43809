#pragma once

#include <openchi/config.hpp>
#include <openchi/meshes.hpp>
#include <openchi/itime_object.hpp>
#include <openchi/fftw_plan.hpp>

namespace open_chi {

namespace detail {

/// Copy f(w, k_1, ..., k_D) into a row-major buffer [w][k]
template <size_t D, typename MObject, typename MGrid, typename V>
void gather(MObject const& in, MGrid const& wgrid, std::vector<std::array<kmesh::point,D>> const& kpts, std::vector<V>& buf)
{
    size_t nk = kpts.size();
    buf.resize(wgrid.size() * nk);
    for (auto w : wgrid.points())
        for (size_t k=0; k<nk; ++k)
            buf[w.index()*nk + k] = in(std::tuple_cat(std::make_tuple(w), kpts[k]));
}

/// D-dimensional transforms over the momentum (or displacement) axes of each of the "howmany" rows of the buffer
template <typename V>
void fft_space(std::vector<V>& buf, size_t D, size_t n, size_t howmany, int sign)
{
    size_t nk = buf.size() / howmany;
    fft_plan<typename V::value_type> plan(std::vector<int>(D, int(n)), int(howmany), 1, int(nk), sign, buf.data());
    plan();
}

/// 1d transforms of length M along the first (frequency or time) axis of an [M][nk] buffer
template <typename V>
void fft_time(std::vector<V>& buf, size_t M, size_t nk, int sign)
{
    fft_plan<typename V::value_type> plan(std::vector<int>(1, int(M)), int(nk), int(nk), 1, sign, buf.data());
    plan();
}

} // end of namespace detail

/// Transforms between the (Matsubara frequency, momentum) and the (imaginary time, lattice displacement) representations
///   G(tau_j, r) = 1/(beta N_k) sum_{w,k} exp(i k r - i w tau_j) G(w, k)
///   G(w, k)     = beta/M sum_{j,r} exp(-i k r + i w tau_j) G(tau_j, r)
/// with M frequencies <-> M time points tau_j = beta j / M and N points per axis in momentum and real space.
template <size_t D, typename ValueT = complex_type>
struct fourier {
    typedef ValueT value_type;
    typedef typename ValueT::value_type real_t;
    static constexpr size_t NDim = D;
    typedef typename tools::ArgBackGenerator<D,kmesh,grid_object,value_type,fmatsubara_grid>::type gk_type;
    typedef typename tools::ArgBackGenerator<D,kmesh,grid_object,value_type,bmatsubara_grid>::type chik_type;
    typedef itime_object<value_type, D> gr_type;
    typedef std::array<kmesh::point, D> bz_point;
    typedef std::array<enum_grid::point, D> r_point;

    /// G(w, k) -> G(tau, r) for a fermionic function decaying as tail/(i w) at large frequency
    static gr_type to_itime(gk_type const& gk, real_t tail = 1)
        { return to_itime_(gk, std::get<0>(gk.grids()), std::get<1>(gk.grids()), statistics::fermion, tail); }
    /// chi(W, q) -> chi(tau, r) for a bosonic function
    static gr_type to_itime(chik_type const& chik)
        { return to_itime_(chik, std::get<0>(chik.grids()), std::get<1>(chik.grids()), statistics::boson, 0); }
    /// G(tau, r) -> G(w, k) on the fermionic grid fgrid
    static gk_type to_matsubara(gr_type const& gr, fmatsubara_grid const& fgrid, kmesh const& kgrid, real_t tail = 1)
        { return to_matsubara_<gk_type>(gr, fgrid, kgrid, tail); }
    /// chi(tau, r) -> chi(W, q) on the bosonic grid bgrid
    static chik_type to_matsubara(gr_type const& chir, bmatsubara_grid const& bgrid, kmesh const& kgrid)
        { return to_matsubara_<chik_type>(chir, bgrid, kgrid, 0); }

    /// The Matsubara grid with as many frequencies as the time mesh has points, indices [-M/2, M - M/2)
    template <bool F>
    static matsubara_grid<F> conjugate_grid(itime_mesh const& tmesh)
        { int nmin = -tmesh.size()/2; return matsubara_grid<F>(nmin, nmin + tmesh.size(), tmesh.beta()); }

private:
    template <typename MObject, typename MGrid>
    static gr_type to_itime_(MObject const& in, MGrid const& wgrid, kmesh const& kgrid, statistics s, real_t tail);
    template <typename MObject, typename MGrid>
    static MObject to_matsubara_(gr_type const& in, MGrid const& wgrid, kmesh const& kgrid, real_t tail);
};

template <size_t D, typename ValueT>
template <typename MObject, typename MGrid>
typename fourier<D,ValueT>::gr_type fourier<D,ValueT>::to_itime_(MObject const& in, MGrid const& wgrid, kmesh const& kgrid, statistics s, real_t tail)
{
    check_matsubara_grid(wgrid);
    lattice_mesh rmesh = lattice_mesh::dual(kgrid);
    itime_mesh tmesh(wgrid.beta(), wgrid.size(), s);
    size_t M = wgrid.size();
    real_t beta = wgrid.beta();
    std::vector<bz_point> kpts = mesh_points<D>(kgrid);
    size_t nk = kpts.size();
    bool fermion = (s == statistics::fermion);

    std::vector<value_type> buf;
    detail::gather<D>(in, wgrid, kpts, buf);
    // remove tail/(iw), its transform is -tail/2 at r = 0
    if (fermion && tail != 0) {
        for (auto w : wgrid.points()) {
            value_type tail_w = tail / value_type(w.value());
            for (size_t k=0; k<nk; ++k) buf[w.index()*nk + k] -= tail_w;
            }
        }

    detail::fft_space(buf, D, kgrid.size(), M, FFTW_BACKWARD);
    detail::fft_time(buf, M, nk, FFTW_FORWARD);

    // exp(-i w_0 tau_j) is left over from shifting the frequency index to start at 0
    real_t w0 = std::imag(wgrid[0].value());
    for (size_t j=0; j<M; ++j) {
        real_t tau = tmesh.value(int(j));
        value_type phase = std::exp(value_type(0, -w0*tau)) / (beta * real_t(nk));
        for (size_t r=0; r<nk; ++r) buf[j*nk + r] *= phase;
        if (fermion) buf[j*nk] -= tail / real_t(2);
        }

    gr_type out(tmesh, rmesh);
    std::vector<r_point> rpts = out.r_points();
    for (auto t : tmesh.grid().points())
        for (size_t r=0; r<nk; ++r) out.get(t, rpts[r]) = buf[t.index()*nk + r];
    return out;
}

template <size_t D, typename ValueT>
template <typename MObject, typename MGrid>
MObject fourier<D,ValueT>::to_matsubara_(gr_type const& in, MGrid const& wgrid, kmesh const& kgrid, real_t tail)
{
    check_matsubara_grid(wgrid);
    itime_mesh const& tmesh = in.tmesh();
    if (int(wgrid.size()) != tmesh.size() || !is_float_equal(wgrid.beta(), tmesh.beta(), 1e-12) || grid_statistics(wgrid) != tmesh.stats()) {
        ERROR("Can't transform " << tmesh << " to a " << grid_statistics(wgrid) << " grid of " << wgrid.size() << " frequencies at beta = " << wgrid.beta());
        throw domain_mismatch("Matsubara grid is not conjugate to the time mesh");
        }
    if (lattice_mesh::dual(kgrid) != in.rmesh()) {
        ERROR("kmesh of " << kgrid.size() << " points is not dual to the lattice of " << in.rmesh().size() << " points");
        throw domain_mismatch("kmesh is not dual to the lattice mesh");
        }
    size_t M = wgrid.size();
    real_t beta = wgrid.beta();
    std::vector<r_point> rpts = in.r_points();
    size_t nk = rpts.size();
    bool fermion = (tmesh.stats() == statistics::fermion);

    std::vector<value_type> buf(M*nk);
    real_t w0 = std::imag(wgrid[0].value());
    for (auto t : tmesh.grid().points()) {
        size_t j = t.index();
        real_t tau = tmesh.value(t);
        value_type phase = std::exp(value_type(0, w0*tau)) * beta / real_t(M);
        for (size_t r=0; r<nk; ++r) buf[j*nk + r] = in(t, rpts[r]);
        if (fermion) buf[j*nk] += tail / real_t(2);
        for (size_t r=0; r<nk; ++r) buf[j*nk + r] *= phase;
        }

    detail::fft_time(buf, M, nk, FFTW_BACKWARD);
    detail::fft_space(buf, D, kgrid.size(), M, FFTW_FORWARD);

    MObject out(std::tuple_cat(std::make_tuple(wgrid), tuple_tools::repeater<kmesh,D>::get_array(kgrid)));
    std::vector<bz_point> kpts = mesh_points<D>(kgrid);
    for (auto w : wgrid.points()) {
        value_type tail_w = fermion ? value_type(tail) / value_type(w.value()) : value_type(0);
        for (size_t k=0; k<nk; ++k)
            out.get(std::tuple_cat(std::make_tuple(w), kpts[k])) = buf[w.index()*nk + k] + tail_w;
        }
    return out;
}

} // end of namespace open_chi
