#include <gtest/gtest.h>

#include "openchi/meshes.hpp"

using namespace open_chi;

TEST(meshes_test, itime_values)
{
    itime_mesh tmesh(2.0, 8, statistics::fermion);
    EXPECT_EQ(tmesh.size(), 8);
    EXPECT_NEAR(tmesh.step(), 0.25, 1e-14);
    EXPECT_NEAR(tmesh.value(0), 0.0, 1e-14);
    EXPECT_NEAR(tmesh.value(3), 0.75, 1e-14);
    EXPECT_NEAR(tmesh.value(tmesh.grid()[7]), 1.75, 1e-14);
    EXPECT_EQ(tmesh.sign(), -1.0);
    EXPECT_EQ(tmesh.conjugate(statistics::boson).sign(), 1.0);
}

TEST(meshes_test, fermionic_wrap)
{
    itime_mesh tmesh(1.0, 4, statistics::fermion);
    itime_mesh::wrapped_point p;

    p = tmesh.wrap(2);
    EXPECT_EQ(p.first.index(), 2);
    EXPECT_EQ(p.second, 1.0);
    // tau = beta is tau = 0 with a sign
    p = tmesh.wrap(4);
    EXPECT_EQ(p.first.index(), 0);
    EXPECT_EQ(p.second, -1.0);
    p = tmesh.wrap(9);
    EXPECT_EQ(p.first.index(), 1);
    EXPECT_EQ(p.second, 1.0);
    p = tmesh.wrap(-1);
    EXPECT_EQ(p.first.index(), 3);
    EXPECT_EQ(p.second, -1.0);
    p = tmesh.wrap(-5);
    EXPECT_EQ(p.first.index(), 3);
    EXPECT_EQ(p.second, 1.0);
}

TEST(meshes_test, bosonic_wrap)
{
    itime_mesh tmesh(1.0, 4, statistics::boson);
    for (int j = -9; j < 9; ++j) {
        itime_mesh::wrapped_point p = tmesh.wrap(j);
        EXPECT_EQ(int(p.first.index()), ((j % 4) + 4) % 4);
        EXPECT_EQ(p.second, 1.0);
        }
}

TEST(meshes_test, reflect)
{
    itime_mesh tmesh(3.0, 6, statistics::fermion);
    // beta - tau_0 = beta
    itime_mesh::wrapped_point p = tmesh.reflect(tmesh.grid()[0]);
    EXPECT_EQ(p.first.index(), 0);
    EXPECT_EQ(p.second, -1.0);
    for (int j = 1; j < 6; ++j) {
        p = tmesh.reflect(tmesh.grid()[j]);
        EXPECT_EQ(int(p.first.index()), 6 - j);
        EXPECT_EQ(p.second, 1.0);
        EXPECT_NEAR(tmesh.value(p.first), 3.0 - tmesh.value(j), 1e-14);
        }
}

TEST(meshes_test, invalid_itime)
{
    EXPECT_THROW(itime_mesh(1.0, 0, statistics::fermion), invalid_mesh);
    EXPECT_THROW(itime_mesh(0.0, 4, statistics::fermion), invalid_mesh);
    EXPECT_THROW(itime_mesh(-1.0, 4, statistics::boson), invalid_mesh);
}

TEST(meshes_test, check_conjugate)
{
    itime_mesh f(2.0, 16, statistics::fermion);
    EXPECT_NO_THROW(check_conjugate(f, f.conjugate(statistics::boson), statistics::boson));
    EXPECT_THROW(check_conjugate(f, itime_mesh(2.0, 8, statistics::boson), statistics::boson), domain_mismatch);
    EXPECT_THROW(check_conjugate(f, itime_mesh(2.5, 16, statistics::boson), statistics::boson), domain_mismatch);
    EXPECT_THROW(check_conjugate(f, f, statistics::boson), domain_mismatch);
    EXPECT_TRUE(f == itime_mesh(2.0, 16, statistics::fermion));
    EXPECT_TRUE(f != f.conjugate(statistics::boson));
}

TEST(meshes_test, lattice_negate)
{
    lattice_mesh rmesh(5);
    EXPECT_EQ(rmesh.negate(rmesh.grid()[0]).index(), 0);
    EXPECT_EQ(rmesh.negate(rmesh.grid()[1]).index(), 4);
    EXPECT_EQ(rmesh.negate(rmesh.grid()[4]).index(), 1);

    std::array<enum_grid::point, 2> r = {{ rmesh.grid()[2], rmesh.grid()[0] }};
    std::array<enum_grid::point, 2> mr = rmesh.negate(r);
    EXPECT_EQ(mr[0].index(), 3);
    EXPECT_EQ(mr[1].index(), 0);
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(rmesh.negate(rmesh.negate(rmesh.grid()[i])).index(), i);
}

TEST(meshes_test, lattice_dual)
{
    lattice_mesh rmesh = lattice_mesh::dual(kmesh(12));
    EXPECT_EQ(rmesh.size(), 12);
    EXPECT_TRUE(rmesh == lattice_mesh(12));
    EXPECT_THROW(lattice_mesh(0), invalid_mesh);
    EXPECT_THROW(lattice_mesh::dual(kmesh(0)), invalid_mesh);
    // -k of 1.0 is not on the mesh
    std::vector<kmesh::value_type> skewed = { 0.0, 1.0, 2.0, 3.0 };
    EXPECT_THROW(lattice_mesh::dual(kmesh(skewed)), invalid_mesh);
}

TEST(meshes_test, matsubara_grid_check)
{
    EXPECT_NO_THROW(check_matsubara_grid(fmatsubara_grid(-4, 4, 10.0)));
    EXPECT_NO_THROW(check_matsubara_grid(bmatsubara_grid(-3, 4, 10.0)));
    EXPECT_THROW(check_matsubara_grid(fmatsubara_grid(0, 0, 10.0)), invalid_mesh);
    // w_0 and w_2 without w_1
    std::vector<fmatsubara_grid::value_type> gap = { complex_type(0.0, PI/10.0), complex_type(0.0, 5.0*PI/10.0) };
    EXPECT_THROW(check_matsubara_grid(fmatsubara_grid(gap)), invalid_mesh);
    EXPECT_EQ(grid_statistics(fmatsubara_grid(-4, 4, 10.0)), statistics::fermion);
    EXPECT_EQ(grid_statistics(bmatsubara_grid(-4, 4, 10.0)), statistics::boson);
}

TEST(meshes_test, mesh_points)
{
    kmesh kgrid(4);
    std::vector<std::array<kmesh::point, 2>> pts = mesh_points<2>(kgrid);
    ASSERT_EQ(pts.size(), 16);
    // last axis runs fastest
    EXPECT_EQ(pts[1][0].index(), 0);
    EXPECT_EQ(pts[1][1].index(), 1);
    EXPECT_EQ(pts[4][0].index(), 1);
    EXPECT_EQ(pts[4][1].index(), 0);
    for (size_t i = 0; i < pts.size(); ++i) EXPECT_EQ(flat_index(pts[i], 4), i);
    // (3,1) + (2,3) = (1,0)
    EXPECT_EQ(flat_index(pts[13], pts[11], 4), 4);
    for (size_t i = 0; i < pts.size(); ++i) EXPECT_EQ(flat_index(pts[i], pts[0], 4), i);
}
