#pragma once
#include <alps/params.hpp>

#include <openchi/config.hpp>
#include <openchi/lattice_traits.hpp>
#include <openchi/bubble.hpp>

namespace open_chi {

/// Non-interacting spin-degenerate electrons on a lattice at inverse temperature beta and chemical potential mu
template <typename LatticeT>
class lindhard {
public:
    typedef LatticeT lattice_t;
    static constexpr size_t NDim = lattice_t::NDim;
    typedef bubble<NDim> bubble_t;
    typedef typename bubble_t::gk_type gk_type;
    typedef typename bubble_t::chik_type chik_type;
    typedef typename tools::ArgBackGenerator<NDim,kmesh,grid_object,complex_type>::type disp_type;
    typedef BZPoint<NDim> bz_point;

    /// Constructor
    /// \param[in] lattice A LatticeTraits class that defines the lattice
    /// \param[in] kgrid A grid of kpoints that samples one dimension of reciprocal space
    /// \param[in] beta Inverse temperature
    /// \param[in] mu Chemical potential
    lindhard(lattice_t lattice, kmesh kgrid, real_type beta, real_type mu);

    static alps::params& define_parameters(alps::params& p);

    /// Return lattice dispersion
    disp_type const& dispersion() const { return disp_; }
    kmesh const& kgrid() const { return kgrid_; }
    real_type beta() const { return beta_; }
    real_type mu() const { return mu_; }

    /// Fermi function 1/(exp(beta(e - mu)) + 1), finite for any e
    real_type fermi(real_type e) const;
    /// Bare lattice Green's function 1/(iw + mu - e_k)
    gk_type g0(fmatsubara_grid const& fgrid) const;
    /// chi0(q, W) = -2/N_k sum_k (f(e_k) - f(e_{k+q})) / (iW + e_k - e_{k+q})
    chik_type chi0_exact(bmatsubara_grid const& bgrid) const;
    /// Average occupation per spin
    real_type density() const;

protected:
    /// Lattice to evaluate k-dependent integrals
    lattice_t lattice_;
    /// Mesh in k-space
    kmesh kgrid_;
    real_type beta_;
    real_type mu_;
    /// Lattice dispersion
    disp_type disp_;
    /// All k-points, last axis running fastest, and the dispersion at them
    std::vector<bz_point> kpts_;
    std::vector<real_type> energies_;
};

} // end of namespace open_chi
