#pragma once

#include <string>
#include <type_traits>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-variable"
    #include <alps/hdf5.hpp>
#pragma GCC diagnostic pop

#include <openchi/config.hpp>
#include <openchi/meshes.hpp>
#include <openchi/itime_object.hpp>

namespace open_chi {

namespace detail {

// A grid is stored by its kind and the few numbers it is built from : all meshes here are uniform.

inline void save_grid(alps::hdf5::archive& ar, std::string const& path, kmesh const& g)
{
    ar[path + "/kind"] << std::string("kmesh");
    ar[path + "/size"] << int(g.size());
}

inline void save_grid(alps::hdf5::archive& ar, std::string const& path, enum_grid const& g)
{
    ar[path + "/kind"] << std::string("enum");
    ar[path + "/size"] << int(g.size());
}

template <bool F>
inline void save_grid(alps::hdf5::archive& ar, std::string const& path, matsubara_grid<F> const& g)
{
    ar[path + "/kind"] << std::string(F ? "fermionic" : "bosonic");
    ar[path + "/beta"] << g.beta();
    ar[path + "/min_n"] << g.min_n();
    ar[path + "/max_n"] << g.max_n();
}

inline void check_kind(alps::hdf5::archive& ar, std::string const& path, std::string const& expected)
{
    std::string kind;
    ar[path + "/kind"] >> kind;
    if (kind != expected) {
        ERROR("Grid at " << path << " is " << kind << ", expected " << expected);
        throw domain_mismatch("stored grid is of another kind");
        }
}

template <typename Grid> struct grid_reader;

template <> struct grid_reader<kmesh> {
    static kmesh read(alps::hdf5::archive& ar, std::string const& path)
        { check_kind(ar, path, "kmesh"); int n; ar[path + "/size"] >> n; return kmesh(n); }
};

template <> struct grid_reader<enum_grid> {
    static enum_grid read(alps::hdf5::archive& ar, std::string const& path)
        { check_kind(ar, path, "enum"); int n; ar[path + "/size"] >> n; return enum_grid(0, n, false); }
};

template <bool F> struct grid_reader<matsubara_grid<F>> {
    static matsubara_grid<F> read(alps::hdf5::archive& ar, std::string const& path) {
        check_kind(ar, path, F ? "fermionic" : "bosonic");
        real_type beta;
        int min_n, max_n;
        ar[path + "/beta"] >> beta;
        ar[path + "/min_n"] >> min_n;
        ar[path + "/max_n"] >> max_n;
        return matsubara_grid<F>(min_n, max_n, beta);
    }
};

template <typename> struct container_reader;

template <typename V, size_t N> struct container_reader<container<V,N>> {
    static container<V,N> read(alps::hdf5::archive& ar, std::string const& path)
        { typename container<V,N>::boost_t values; ar >> alps::make_pvp(path, values); return container_ref<V,N>(values); }
};

template <size_t N, typename Tuple>
typename std::enable_if<N == std::tuple_size<Tuple>::value>::type
    save_grids(alps::hdf5::archive&, std::string const&, Tuple const&) {}

template <size_t N, typename Tuple>
typename std::enable_if<(N < std::tuple_size<Tuple>::value)>::type
    save_grids(alps::hdf5::archive& ar, std::string const& path, Tuple const& grids)
{
    save_grid(ar, path + "/" + std::to_string(N), std::get<N>(grids));
    save_grids<N+1>(ar, path, grids);
}

} // end of namespace detail

/// Stores the grids under path/grids/0, path/grids/1, ... and the values under path/data.
/// With plaintext the object is also written to <last path component>.dat
template <typename T>
void save_grid_object(alps::hdf5::archive& ar, std::string const& path, T const& c, bool plaintext = false)
{
    INFO("hdf5 : saving " << path);
    detail::save_grids<0>(ar, path + "/grids", c.grids());
    ar << alps::make_pvp(path + "/data", c.data().boost_container_());
    if (plaintext) c.savetxt(path.substr(path.find_last_of('/') + 1) + ".dat");
}

/// Loads a grid object defined over a frequency or time grid times D copies of one axis,
/// which is how every Green's function and susceptibility here is laid out
template <typename T>
T load_grid_object(alps::hdf5::archive& ar, std::string const& path)
{
    typedef typename T::grid_tuple grid_tuple;
    typedef typename std::tuple_element<0, grid_tuple>::type leading_grid;
    typedef typename std::tuple_element<1, grid_tuple>::type axis_grid;
    static constexpr size_t D = std::tuple_size<grid_tuple>::value - 1;

    INFO("hdf5 : loading " << path);
    leading_grid g0 = detail::grid_reader<leading_grid>::read(ar, path + "/grids/0");
    axis_grid axis = detail::grid_reader<axis_grid>::read(ar, path + "/grids/1");
    auto data = detail::container_reader<typename T::container_type>::read(ar, path + "/data");
    return T(std::tuple_cat(std::make_tuple(g0), tuple_tools::repeater<axis_grid, D>::get_tuple(axis)), data);
}

/// A grid object in imaginary time keeps the statistics of its mesh next to the values
template <typename ValueT, size_t D>
void save_itime_object(alps::hdf5::archive& ar, std::string const& path, itime_object<ValueT,D> const& f, bool plaintext = false)
{
    itime_mesh const& tmesh = f.tmesh();
    ar[path + "/beta"] << tmesh.beta();
    ar[path + "/statistics"] << std::string(tmesh.stats() == statistics::fermion ? "fermion" : "boson");
    save_grid_object(ar, path, f.data(), plaintext);
}

template <typename T>
T load_itime_object(alps::hdf5::archive& ar, std::string const& path)
{
    real_type beta;
    std::string stats;
    ar[path + "/beta"] >> beta;
    ar[path + "/statistics"] >> stats;
    if (stats != "fermion" && stats != "boson") {
        ERROR("Unknown statistics '" << stats << "' in " << path);
        throw invalid_mesh("unknown statistics of an imaginary time mesh");
        }
    typename T::data_type data = load_grid_object<typename T::data_type>(ar, path);
    itime_mesh tmesh(beta, std::get<0>(data.grids()).size(), stats == "fermion" ? statistics::fermion : statistics::boson);
    T out(tmesh, lattice_mesh(std::get<1>(data.grids()).size()));
    out.data() = data;
    return out;
}

} // end of namespace open_chi
