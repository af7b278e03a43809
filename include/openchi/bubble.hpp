#pragma once

#include <algorithm>
#include <cmath>

#include <openchi/config.hpp>
#include <openchi/fourier.hpp>

namespace open_chi {

/// Bare particle-hole bubble of a spin-degenerate Green's function
///   chi0(q, W) = -2/(beta N_k) sum_{w,k} G(k, w) G(k+q, w+W)
/// evaluated as a product in imaginary time and real space:
///   chi0(r, tau) = 2 G(-r, beta-tau) G(r, tau)
template <size_t D, typename ValueT = complex_type>
struct bubble {
    typedef fourier<D, ValueT> fourier_t;
    typedef ValueT value_type;
    typedef typename ValueT::value_type real_t;
    typedef typename fourier_t::gk_type gk_type;
    typedef typename fourier_t::chik_type chik_type;
    typedef typename fourier_t::gr_type gr_type;
    typedef typename fourier_t::bz_point bz_point;
    typedef typename fourier_t::r_point r_point;

    /// Spin degeneracy
    static constexpr int spin_factor = 2;

    /// chi0(q, W) on the bosonic grid with as many frequencies as g0 has. Throws numeric_overflow if the result is not finite
    static chik_type calc_bubble(gk_type const& g0, real_t tail = 1);
    /// chi0(r, tau) on the bosonic time mesh bmesh from G(r, tau)
    static gr_type form_bubble(gr_type const& grt, itime_mesh const& bmesh);
    /// Straightforward frequency summation of G(k, w) G(k+q, w+W). Frequencies w+W outside of the grid of g0 are dropped
    static chik_type calc_bubble_direct(gk_type const& g0, bmatsubara_grid const& bgrid);
};

template <size_t D, typename ValueT>
typename bubble<D,ValueT>::chik_type bubble<D,ValueT>::calc_bubble(gk_type const& g0, real_t tail)
{
    fmatsubara_grid const& fgrid = std::get<0>(g0.grids());
    kmesh const& kgrid = std::get<1>(g0.grids());
    INFO("Calculating bubble : " << fgrid.size() << " Matsubara frequencies, " << kgrid.size() << "^" << D << " k-points, beta = " << fgrid.beta());

    gr_type grt = fourier_t::to_itime(g0, tail);
    itime_mesh bmesh = grt.tmesh().conjugate(statistics::boson);
    gr_type chi_rt = form_bubble(grt, bmesh);
    if (!chi_rt.is_finite()) {
        ERROR("Bubble in imaginary time is not finite");
        throw numeric_overflow("non-finite values in the bubble");
        }

    bmatsubara_grid bgrid = fourier_t::template conjugate_grid<false>(bmesh);
    chik_type out = fourier_t::to_matsubara(chi_rt, bgrid, kgrid);
    std::vector<bz_point> qpts = mesh_points<D>(kgrid);
    for (auto W : bgrid.points())
        for (bz_point const& q : qpts) {
            value_type v = out(std::tuple_cat(std::make_tuple(W), q));
            if (!std::isfinite(v.real()) || !std::isfinite(v.imag())) {
                ERROR("Bubble at W = " << W.value() << " is " << v);
                throw numeric_overflow("non-finite values in the bubble");
                }
            }
    return out;
}

template <size_t D, typename ValueT>
typename bubble<D,ValueT>::gr_type bubble<D,ValueT>::form_bubble(gr_type const& grt, itime_mesh const& bmesh)
{
    if (grt.tmesh().stats() != statistics::fermion) {
        ERROR("Bubble of a function on " << grt.tmesh());
        throw domain_mismatch("bubble is formed from a fermionic function");
        }
    check_conjugate(grt.tmesh(), bmesh, statistics::boson);

    lattice_mesh const& rmesh = grt.rmesh();
    gr_type out(bmesh, rmesh);
    out.fill([&](enum_grid::point t, r_point const& r) {
        return real_t(spin_factor) * grt.eval_reflected(rmesh.negate(r), t) * grt(t, r);
        });
    return out;
}

template <size_t D, typename ValueT>
typename bubble<D,ValueT>::chik_type bubble<D,ValueT>::calc_bubble_direct(gk_type const& g0, bmatsubara_grid const& bgrid)
{
    fmatsubara_grid const& fgrid = std::get<0>(g0.grids());
    kmesh const& kgrid = std::get<1>(g0.grids());
    check_matsubara_grid(fgrid);
    check_matsubara_grid(bgrid);
    lattice_mesh::dual(kgrid);
    real_type beta = fgrid.beta();
    if (!is_float_equal(bgrid.beta(), beta, 1e-12)) {
        ERROR("beta mismatch : " << fgrid.beta() << " vs " << bgrid.beta());
        throw domain_mismatch("fermionic and bosonic grids have different beta");
        }

    std::vector<bz_point> kpts = mesh_points<D>(kgrid);
    size_t nk = kpts.size(), M = fgrid.size(), n = kgrid.size();

    // sum_k G1(k) G2(k+q) = FFT_fwd[FFT_fwd(G1) * FFT_bwd(G2)](q) / N_k
    std::vector<value_type> g_fwd, g_bwd;
    detail::gather<D>(g0, fgrid, kpts, g_fwd);
    g_bwd = g_fwd;
    detail::fft_space(g_fwd, D, n, M, FFTW_FORWARD);
    detail::fft_space(g_bwd, D, n, M, FFTW_BACKWARD);

    chik_type out(std::tuple_cat(std::make_tuple(bgrid), tuple_tools::repeater<kmesh,D>::get_array(kgrid)));
    std::vector<value_type> conv(nk);
    fft_plan<real_t> conv_plan(std::vector<int>(D, int(n)), 1, 1, int(nk), FFTW_FORWARD, conv.data());
    real_t norm = -real_t(spin_factor) / (real_t(beta) * nk * nk);

    for (auto W : bgrid.points()) {
        int Wn = BMatsubaraIndex(W.value(), beta);
        std::fill(conv.begin(), conv.end(), value_type(0));
        for (size_t p=0; p<M; ++p) {
            int p2 = int(p) + Wn;
            if (p2 < 0 || p2 >= int(M)) continue;
            for (size_t r=0; r<nk; ++r) conv[r] += g_fwd[p*nk + r] * g_bwd[p2*nk + r];
            }
        conv_plan();
        for (size_t k=0; k<nk; ++k)
            out.get(std::tuple_cat(std::make_tuple(W), kpts[k])) = norm * conv[k];
        }
    return out;
}

} // end of namespace open_chi
