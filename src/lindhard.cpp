#include "openchi/lindhard.hpp"

namespace open_chi {

template <typename LatticeT>
lindhard<LatticeT>::lindhard(lattice_t lattice, kmesh kgrid, real_type beta, real_type mu):
    lattice_(lattice),
    kgrid_(kgrid),
    beta_(beta),
    mu_(mu),
    disp_(gftools::tuple_tools::repeater<kmesh,NDim>::get_tuple(kgrid_)),
    kpts_(lattice_t::zone_points(kgrid_)),
    energies_(lattice_.dispersion_table(kgrid_))
{
    lattice_mesh::dual(kgrid_);
    if (!(beta_ > 0)) { ERROR("beta = " << beta_); throw invalid_mesh("non-positive beta"); };
    for (size_t k=0; k<kpts_.size(); ++k) disp_.get(std::tuple_cat(kpts_[k])) = energies_[k];
}

template <typename LatticeT>
alps::params& lindhard<LatticeT>::define_parameters(alps::params& p)
{
    p.define<double>("beta",         10.0,  "inverse temperature")
     .define<double>("mu",           0.0,   "chemical potential")
     .define<int>("kpts",           16,     "number of points on a single axis in Brilloin zone")
     .define<int>("nfermionic",     512,    "number of fermionic Matsubara frequencies (= number of imaginary time points)")
     .define<double>("tail",         1.0,   "coefficient of the 1/(iw) decay of G0");
    return p;
}

template <typename LatticeT>
real_type lindhard<LatticeT>::fermi(real_type e) const
{
    return 0.5 * (1.0 - std::tanh(0.5 * beta_ * (e - mu_)));
}

template <typename LatticeT>
typename lindhard<LatticeT>::gk_type lindhard<LatticeT>::g0(fmatsubara_grid const& fgrid) const
{
    check_matsubara_grid(fgrid);
    if (!is_float_equal(fgrid.beta(), beta_, 1e-12)) {
        ERROR("Matsubara grid at beta = " << fgrid.beta() << ", model at beta = " << beta_);
        throw domain_mismatch("Matsubara grid and model have different beta");
        }
    gk_type out(std::tuple_cat(std::forward_as_tuple(fgrid), gftools::tuple_tools::repeater<kmesh,NDim>::get_array(kgrid_)));
    for (auto w : fgrid.points()) {
        out[w] = 1.0 / (w.value() + mu_ - disp_.data());
        }
    return out;
}

template <typename LatticeT>
typename lindhard<LatticeT>::chik_type lindhard<LatticeT>::chi0_exact(bmatsubara_grid const& bgrid) const
{
    check_matsubara_grid(bgrid);
    if (!is_float_equal(bgrid.beta(), beta_, 1e-12)) {
        ERROR("Matsubara grid at beta = " << bgrid.beta() << ", model at beta = " << beta_);
        throw domain_mismatch("Matsubara grid and model have different beta");
        }
    chik_type out(std::tuple_cat(std::forward_as_tuple(bgrid), gftools::tuple_tools::repeater<kmesh,NDim>::get_array(kgrid_)));
    size_t nk = kpts_.size(), n = kgrid_.size();
    std::vector<real_type> f(nk);
    for (size_t k=0; k<nk; ++k) f[k] = fermi(energies_[k]);

    for (auto W : bgrid.points()) {
        complex_type iW = W.value();
        bool static_W = is_float_equal(iW, 0, 1e-12);
        for (size_t q=0; q<nk; ++q) {
            complex_type sum = 0.0;
            for (size_t k=0; k<nk; ++k) {
                size_t kq = flat_index(kpts_[k], kpts_[q], n);
                real_type de = energies_[k] - energies_[kq];
                if (static_W && std::abs(de) < 1e-8) {
                    // (f(e_k) - f(e_kq)) / (e_k - e_kq) -> f'(e) = -beta f (1-f)
                    real_type fm = fermi(0.5 * (energies_[k] + energies_[kq]));
                    sum -= beta_ * fm * (1.0 - fm);
                    }
                else
                    sum += (f[k] - f[kq]) / (iW + de);
                }
            out.get(std::tuple_cat(std::make_tuple(W), kpts_[q])) = -2.0 * sum / real_type(nk);
            }
        }
    return out;
}

template <typename LatticeT>
real_type lindhard<LatticeT>::density() const
{
    real_type n = 0.0;
    for (real_type e : energies_) n += fermi(e);
    return n / energies_.size();
}

OPENCHI_INSTANTIATE_LATTICE_OBJECT(lindhard);

} // end of namespace open_chi
