#include <openchi/config.hpp>

#include <chrono>
#include <alps/params.hpp>

#include <openchi/lattice_traits.hpp>
#include <openchi/lindhard.hpp>

#include "data_save.hpp"

using namespace open_chi;

/// Hopping parameters of a lattice and how to build it from them
template <typename LatticeT> struct lattice_options;

template <size_t D> struct lattice_options<cubic_traits<D>> {
    static std::string name() { return std::to_string(D) + "d hypercubic lattice"; }
    static void define(alps::params& p) { p.define<double>("t", 1.0, "nearest neighbour hopping"); }
    static cubic_traits<D> make(alps::params& p) { return cubic_traits<D>(p["t"].as<double>()); }
};

template <> struct lattice_options<triangular_traits> {
    static std::string name() { return "triangular lattice"; }
    static void define(alps::params& p) {
        p.define<double>("t", 1.0, "hopping along the square axes");
        p.define<double>("tp", 0.0, "hopping along the diagonal");
    }
    static triangular_traits make(alps::params& p) { return triangular_traits(p["t"].as<double>(), p["tp"].as<double>()); }
};

template <> struct lattice_options<square_nnn_traits> {
    static std::string name() { return "square lattice with next-nearest neighbour hopping"; }
    static void define(alps::params& p) {
        p.define<double>("t", 1.0, "nearest neighbour hopping");
        p.define<double>("tp", 0.0, "next-nearest neighbour hopping");
    }
    static square_nnn_traits make(alps::params& p) { return square_nnn_traits(p["t"].as<double>(), p["tp"].as<double>()); }
};

#if defined(LATTICE_cubic1d)
typedef cubic_traits<1> lattice_type;
#elif defined(LATTICE_cubic2d)
typedef cubic_traits<2> lattice_type;
#elif defined(LATTICE_cubic3d)
typedef cubic_traits<3> lattice_type;
#elif defined(LATTICE_triangular)
typedef triangular_traits lattice_type;
#elif defined(LATTICE_square_nnn)
typedef square_nnn_traits lattice_type;
#else
#error Undefined lattice
#endif

typedef lindhard<lattice_type> model_type;
typedef lattice_options<lattice_type> options_type;

int main(int argc, char *argv[])
{
    try {
        alps::params p(argc, argv);
        p.description("Bare (Lindhard) susceptibility of free electrons on a " + options_type::name());
        model_type::define_parameters(p);
        options_type::define(p);
        save_define_parameters(p);
        p.define<std::string>("output", "output.h5", "output file");
        if (p.help_requested(std::cerr)) return 0;

        INFO(p);
        real_type beta = p["beta"];
        int nfermionic = p["nfermionic"];
        model_type model(options_type::make(p), kmesh(p["kpts"].as<int>()), beta, p["mu"].as<double>());
        INFO("T = " << 1.0/beta << ", density per spin = " << model.density());

        // nfermionic consecutive frequencies around zero
        fmatsubara_grid fgrid(-nfermionic/2, nfermionic - nfermionic/2, beta);
        model_type::gk_type g0 = model.g0(fgrid);

        std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
        model_type::chik_type chi0 = model_type::bubble_t::calc_bubble(g0, p["tail"].as<double>());
        int elapsed = int(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
        INFO("bubble : " << elapsed << " ms");
        p["run_time"] = elapsed;

        save_data(model, g0, chi0, p);
        }
    catch (std::exception& e) {
        ERROR(e.what());
        return 1;
        }
    return 0;
}
