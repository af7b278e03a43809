#include "openchi/meshes.hpp"

namespace open_chi {

namespace {
int checked_size(int npoints, const char* what)
{
    if (npoints < 1) { ERROR(what << " with " << npoints << " points"); throw invalid_mesh(std::string(what) + " has no points"); }
    return npoints;
}
} // end of anonymous namespace

std::ostream& operator<<(std::ostream& out, statistics s)
{
    return out << (s == statistics::fermion ? "fermion" : "boson");
}

//
// itime_mesh
//

itime_mesh::itime_mesh(real_type beta, int npoints, statistics s):
    beta_(beta),
    npoints_(checked_size(npoints, "imaginary time mesh")),
    stats_(s),
    grid_(0, npoints_, false)
{
    if (!(beta_ > 0)) { ERROR("beta = " << beta_); throw invalid_mesh("imaginary time mesh with non-positive beta"); };
}

itime_mesh::wrapped_point itime_mesh::wrap(int j) const
{
    // floor division, so that j = -1 lands on M-1 after one crossing
    int crossings = j >= 0 ? j / npoints_ : -((npoints_ - 1 - j) / npoints_);
    int index = j - crossings * npoints_;
    real_type s = (stats_ == statistics::fermion && crossings % 2 != 0) ? -1.0 : 1.0;
    return std::make_pair(grid_[index], s);
}

bool itime_mesh::operator==(itime_mesh const& rhs) const
{
    return npoints_ == rhs.npoints_ && stats_ == rhs.stats_ && is_float_equal(beta_, rhs.beta_, 1e-12);
}

std::ostream& operator<<(std::ostream& out, itime_mesh const& m)
{
    return out << "{tau in [0, " << m.beta_ << "), " << m.npoints_ << " points, " << m.stats_ << "}";
}

void check_conjugate(itime_mesh const& reference, itime_mesh const& other, statistics expected)
{
    if (reference.size() != other.size()) {
        ERROR("time mesh size mismatch : " << reference << " vs " << other);
        throw domain_mismatch("imaginary time meshes have different number of points");
        }
    if (!is_float_equal(reference.beta(), other.beta(), 1e-12)) {
        ERROR("time mesh beta mismatch : " << reference << " vs " << other);
        throw domain_mismatch("imaginary time meshes have different beta");
        }
    if (other.stats() != expected) {
        ERROR("time mesh " << other << " is expected to be " << expected);
        throw domain_mismatch("imaginary time mesh has wrong statistics");
        }
}

//
// lattice_mesh
//

lattice_mesh::lattice_mesh(int npoints):
    npoints_(checked_size(npoints, "lattice mesh")),
    grid_(0, npoints_, false)
{
}

lattice_mesh lattice_mesh::dual(kmesh const& kgrid)
{
    int n = kgrid.size();
    if (!n) { ERROR("Empty Brillouin zone mesh"); throw invalid_mesh("Brillouin zone mesh has no points"); };
    // -k is a mesh point for every k only on the uniform mesh 2 pi j / N
    for (int j=0; j<n; ++j) {
        if (!is_float_equal(real_type(kgrid[j]), 2.0*PI*j/n, 1e-10)) {
            ERROR("k point " << j << " = " << real_type(kgrid[j]) << " is off the uniform mesh");
            throw invalid_mesh("Brillouin zone mesh is not closed under negation");
            }
        }
    return lattice_mesh(n);
}

} // end of namespace open_chi
