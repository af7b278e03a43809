#include <gtest/gtest.h>

#include "openchi/lattice_traits.hpp"
#include "openchi/fourier.hpp"

using namespace open_chi;

/// G(k, w) = 1/(iw - e_k) for a hypercubic lattice
template <size_t D, typename V>
typename fourier<D,V>::gk_type free_gf(fmatsubara_grid const& fgrid, kmesh const& kgrid, cubic_traits<D> lattice)
{
    typename fourier<D,V>::gk_type g(std::tuple_cat(std::forward_as_tuple(fgrid), tuple_tools::repeater<kmesh,D>::get_array(kgrid)));
    for (auto w : fgrid.points())
        for (BZPoint<D> k : mesh_points<D>(kgrid))
            g.get(std::tuple_cat(std::make_tuple(w), k)) = V(1) / (V(w.value()) - V(lattice.dispersion(k)));
    return g;
}

/// -exp(-e tau) / (1 + exp(-beta e)) for 0 <= tau < beta, the tau = 0 value being the 0+ limit
double single_pole_itime(double e, double tau, double beta)
{
    return -std::exp(-e*tau) / (1.0 + std::exp(-beta*e));
}

template <size_t D>
void test_free_gf(int kpts, int nfreq, double beta, double tol)
{
    typedef fourier<D> fourier_t;
    kmesh kgrid(kpts);
    fmatsubara_grid fgrid(-nfreq/2, nfreq - nfreq/2, beta);
    cubic_traits<D> lattice(1.0);
    auto gk = free_gf<D, complex_type>(fgrid, kgrid, lattice);

    typename fourier_t::gr_type gr = fourier_t::to_itime(gk);
    EXPECT_EQ(gr.tmesh().size(), nfreq);
    EXPECT_EQ(gr.tmesh().stats(), statistics::fermion);
    EXPECT_EQ(gr.rmesh().size(), kpts);

    std::vector<BZPoint<D>> kpoints = mesh_points<D>(kgrid);
    double max_diff = 0.0;
    for (auto t : gr.tmesh().grid().points()) {
        double tau = gr.tmesh().value(t);
        for (auto r : gr.r_points()) {
            complex_type ref = 0.0;
            for (BZPoint<D> k : kpoints) {
                double kr = 0.0;
                for (size_t d=0; d<D; ++d) kr += real_type(k[d]) * double(r[d].index());
                ref += std::exp(complex_type(0.0, kr)) * single_pole_itime(lattice.dispersion(k), tau, beta);
                }
            ref /= double(kpoints.size());
            max_diff = std::max(max_diff, std::abs(gr(t, r) - ref));
            }
        }
    std::cout << "max deviation from the exact G(tau, r) = " << max_diff << std::endl;
    EXPECT_LT(max_diff, tol);
}

TEST(fourier_test, free_gf_1d) { test_free_gf<1>(8, 1024, 2.0, 2e-3); }
TEST(fourier_test, free_gf_2d) { test_free_gf<2>(4, 512, 1.0, 2e-3); }

TEST(fourier_test, free_gf_half_filling)
{
    // G(0+, r = 0) = -(1 - n) = -1/2 at half filling
    typedef fourier<1> fourier_t;
    kmesh kgrid(16);
    fmatsubara_grid fgrid(-2048, 2048, 20.0);
    auto gk = free_gf<1, complex_type>(fgrid, kgrid, cubic_traits<1>(1.0));
    fourier_t::gr_type gr = fourier_t::to_itime(gk);
    fourier_t::r_point r0 = {{ gr.rmesh().grid()[0] }};
    EXPECT_NEAR(std::real(gr(gr.tmesh().grid()[0], r0)), -0.5, 1e-2);
    EXPECT_NEAR(std::real(gr.eval_reflected(r0, gr.tmesh().grid()[0])), 0.5, 1e-2);
}

TEST(fourier_test, fermionic_round_trip)
{
    typedef fourier<2> fourier_t;
    kmesh kgrid(6);
    fmatsubara_grid fgrid(-16, 16, 3.0);
    auto gk = free_gf<2, complex_type>(fgrid, kgrid, cubic_traits<2>(0.7));

    fourier_t::gr_type gr = fourier_t::to_itime(gk);
    fourier_t::gk_type gk2 = fourier_t::to_matsubara(gr, fgrid, kgrid);
    EXPECT_NEAR(gk2.diff(gk), 0.0, 1e-10);

    // the tail is removed and restored consistently, whatever its value
    fourier_t::gr_type gr_notail = fourier_t::to_itime(gk, 0.0);
    fourier_t::gk_type gk3 = fourier_t::to_matsubara(gr_notail, fgrid, kgrid, 0.0);
    EXPECT_NEAR(gk3.diff(gk), 0.0, 1e-10);
}

TEST(fourier_test, bosonic_round_trip)
{
    typedef fourier<1> fourier_t;
    kmesh kgrid(5);
    bmatsubara_grid bgrid(-8, 8, 2.0);
    fourier_t::chik_type chik(std::make_tuple(bgrid, kgrid));
    for (auto W : bgrid.points())
        for (auto k : kgrid.points())
            chik.get(std::make_tuple(W, k)) = 1.0 / (std::abs(W.value()) + 1.0 + std::cos(real_type(k)));

    fourier_t::gr_type chir = fourier_t::to_itime(chik);
    EXPECT_EQ(chir.tmesh().stats(), statistics::boson);
    fourier_t::chik_type chik2 = fourier_t::to_matsubara(chir, bgrid, kgrid);
    EXPECT_NEAR(chik2.diff(chik), 0.0, 1e-10);
}

TEST(fourier_test, long_double_round_trip)
{
    typedef std::complex<long double> ld_complex;
    typedef fourier<1, ld_complex> fourier_t;
    kmesh kgrid(8);
    fmatsubara_grid fgrid(-32, 32, 5.0);
    auto gk = free_gf<1, ld_complex>(fgrid, kgrid, cubic_traits<1>(1.0));
    fourier_t::gr_type gr = fourier_t::to_itime(gk);
    fourier_t::gk_type gk2 = fourier_t::to_matsubara(gr, fgrid, kgrid);
    long double max_diff = 0.0;
    for (auto w : fgrid.points())
        for (auto k : kgrid.points())
            max_diff = std::max(max_diff, std::abs(gk2(std::make_tuple(w, k)) - gk(std::make_tuple(w, k))));
    EXPECT_LT(max_diff, 1e-14);
}

TEST(fourier_test, conjugate_grid)
{
    itime_mesh tmesh(4.0, 10, statistics::boson);
    bmatsubara_grid bgrid = fourier<1>::conjugate_grid<false>(tmesh);
    EXPECT_EQ(bgrid.size(), 10);
    EXPECT_NEAR(bgrid.beta(), 4.0, 1e-14);
    EXPECT_NEAR(std::imag(bgrid[0].value()), -5 * 2.0 * PI / 4.0, 1e-12);
    bmatsubara_grid::point W0 = bgrid.find_nearest(0.0);
    EXPECT_NEAR(std::abs(W0.value()), 0.0, 1e-14);
}

TEST(fourier_test, mesh_mismatch)
{
    typedef fourier<1> fourier_t;
    kmesh kgrid(8);
    fmatsubara_grid fgrid(-8, 8, 2.0);
    auto gk = free_gf<1, complex_type>(fgrid, kgrid, cubic_traits<1>(1.0));
    fourier_t::gr_type gr = fourier_t::to_itime(gk);

    // different number of frequencies, different beta
    EXPECT_THROW(fourier_t::to_matsubara(gr, fmatsubara_grid(-4, 4, 2.0), kgrid), domain_mismatch);
    EXPECT_THROW(fourier_t::to_matsubara(gr, fmatsubara_grid(-8, 8, 3.0), kgrid), domain_mismatch);
    // fermionic function on a bosonic grid
    EXPECT_THROW(fourier_t::to_matsubara(gr, bmatsubara_grid(-8, 8, 2.0), kgrid), domain_mismatch);
    // kmesh of another size
    EXPECT_THROW(fourier_t::to_matsubara(gr, fgrid, kmesh(6)), domain_mismatch);
}
