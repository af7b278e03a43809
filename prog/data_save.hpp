#pragma once

#include <alps/params.hpp>
#include <alps/hdf5/archive.hpp>

#include <openchi/hdf5.hpp>

namespace open_chi {

inline alps::params& save_define_parameters(alps::params& p)
{
     p.define<int>("plaintext",    0,      "save additionally to plaintext files (2 = verbose, 1 = save essential, 0 = no plaintext)");
     p.define<bool>("exact",        1,      "evaluate and save the closed-form Lindhard function for comparison");
     p.define<bool>("save_itime",   0,      "save the bubble in imaginary time and real space");
    return p;
}

template <typename ModelT>
void save_data(ModelT const& model, typename ModelT::gk_type const& g0, typename ModelT::chik_type const& chi0, alps::params p)
{
    typedef typename ModelT::chik_type chik_type;
    typedef typename ModelT::disp_type disp_type;
    typedef typename ModelT::bubble_t bubble_t;
    typedef grid_object<complex_type, bmatsubara_grid> chiw_type;

    static constexpr int D = ModelT::NDim;
    int plaintext = p["plaintext"];
    bmatsubara_grid const& bgrid = chi0.template grid<0>();
    kmesh const& kgrid = model.kgrid();
    double knorm = pow<D>(kgrid.size());

    bmatsubara_grid::point W0 = bgrid.find_nearest(0.0);

    std::string output_file = p["output"];
    std::string top = "/chi0";

    std::cout << "Saving data to " << output_file << top << std::endl;
    alps::hdf5::archive ar(output_file, "w");

    // save parameters
    ar[top + "/parameters"] << p;
    ar[top + "/density"] << model.density();

    save_grid_object(ar, top + "/g0", g0, plaintext > 1);
    save_grid_object(ar, top + "/chi0_k", chi0, plaintext > 1);

    // static cut over the Brillouin zone
    disp_type chi0_W0(tuple_tools::repeater<kmesh,D>::get_tuple(kgrid));
    chi0_W0.data() = chi0[W0];
    save_grid_object(ar, top + "/chi0_W0_k", chi0_W0, plaintext > 0);

    // local part
    chiw_type chi0_loc(bgrid);
    for (auto W : bgrid.points()) { chi0_loc[W] = chi0[W].sum() / knorm; }
    save_grid_object(ar, top + "/chi0_loc", chi0_loc, plaintext > 0);

    if (p["exact"].as<bool>()) {
        chik_type chi0_exact = model.chi0_exact(bgrid);
        std::cout << "Difference to the closed form : " << chi0.diff(chi0_exact) << std::endl;
        save_grid_object(ar, top + "/chi0_exact", chi0_exact, plaintext > 1);
        }

    if (p["save_itime"].as<bool>()) {
        auto grt = bubble_t::fourier_t::to_itime(g0, p["tail"].as<double>());
        auto chi0_rt = bubble_t::form_bubble(grt, grt.tmesh().conjugate(statistics::boson));
        save_itime_object(ar, top + "/chi0_rt", chi0_rt, plaintext > 1);
        }
}

} // end of namespace open_chi
