#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <dendra/math.hpp>

#include "conductances.hpp"
#include "topology.hpp"

#include "common.hpp"

using namespace dendra;

using vvec = std::vector<fvm_value_type>;

namespace {
    // [cm²] from [µm²]
    double area_cm2(double r, double l) {
        return math::area_cylinder(r, l)*1e-8;
    }
}

TEST(conductances, identical_neighbours) {
    // One compartment length of cable between the two centres:
    // G = π r²/(ρ l) with r, l in cm gives S; in [mS] from µm and Ω·cm
    // that is 0.1·π r²/(ρ l).
    const double r = 2, l = 10, ra = 100;
    auto g = coupling_conductance(r, r, ra, ra, l, l);

    EXPECT_DOUBLE_EQ(1000., g);
    EXPECT_TRUE(testing::near_relative(0.1*math::pi<double>()*r*r/(ra*l), g*area_cm2(r, l), 1e-12));
}

TEST(conductances, conservation) {
    // The absolute conductance is the same seen from either side.
    const double r1 = 0.5, r2 = 3, l1 = 7, l2 = 20, ra1 = 80, ra2 = 250;
    auto g12 = coupling_conductance(r1, r2, ra1, ra2, l1, l2);
    auto g21 = coupling_conductance(r2, r1, ra2, ra1, l2, l1);

    EXPECT_TRUE(testing::near_relative(g12*area_cm2(r1, l1), g21*area_cm2(r2, l2), 1e-12));
    EXPECT_GT(g12, g21);
}

TEST(conductances, branch) {
    const unsigned nseg = 3;
    vvec ra = {100, 100, 100};
    vvec r = {1, 2, 3};
    vvec l = {10, 10, 10};
    vvec fwd(nseg-1), bwd(nseg-1), summed(nseg);

    init_branch_conds(nseg, ra.data(), r.data(), l.data(), fwd.data(), bwd.data(), summed.data());

    EXPECT_DOUBLE_EQ(coupling_conductance(2, 1, 100, 100, 10, 10), fwd[0]);
    EXPECT_DOUBLE_EQ(coupling_conductance(1, 2, 100, 100, 10, 10), bwd[0]);
    EXPECT_DOUBLE_EQ(coupling_conductance(3, 2, 100, 100, 10, 10), fwd[1]);
    EXPECT_DOUBLE_EQ(coupling_conductance(2, 3, 100, 100, 10, 10), bwd[1]);

    EXPECT_DOUBLE_EQ(bwd[0], summed[0]);
    EXPECT_DOUBLE_EQ(fwd[0]+bwd[1], summed[1]);
    EXPECT_DOUBLE_EQ(fwd[1], summed[2]);
}

TEST(conductances, single_segment_branch) {
    vvec ra = {100}, r = {1}, l = {10};
    vvec summed = {42};

    init_branch_conds(1, ra.data(), r.data(), l.data(), nullptr, nullptr, summed.data());
    EXPECT_EQ(0., summed[0]);
}

TEST(conductances, tree) {
    //     0
    //    / \.
    //   1   2
    const unsigned nseg = 2;
    std::vector<fvm_index_type> parents = {-1, 0, 0};
    vvec r  = {1, 1.5,  0.5, 0.7,  2, 2};
    vvec l  = {10, 12,  8, 9,      20, 20};
    vvec ra = {100, 100,  150, 150,  90, 90};

    auto g = compute_cable_conductances(nseg, parents, r.data(), l.data(), ra.data());

    ASSERT_EQ(3u, g.coupling_fwd.size());
    ASSERT_EQ(3u, g.branch_fwd.size());
    ASSERT_EQ(6u, g.summed.size());

    // Roots carry no junction conductance.
    EXPECT_EQ(0., g.branch_fwd[0]);
    EXPECT_EQ(0., g.branch_bwd[0]);

    // Junctions join the parent's last compartment (1) with each child's
    // first compartment (2 and 4).
    for (auto [child, first]: {std::pair{1, 2}, std::pair{2, 4}}) {
        EXPECT_DOUBLE_EQ(coupling_conductance(r[1], r[first], ra[1], ra[first], l[1], l[first]), g.branch_fwd[child]);
        EXPECT_DOUBLE_EQ(coupling_conductance(r[first], r[1], ra[first], ra[1], l[first], l[1]), g.branch_bwd[child]);
        EXPECT_TRUE(testing::near_relative(
            g.branch_fwd[child]*area_cm2(r[1], l[1]),
            g.branch_bwd[child]*area_cm2(r[first], l[first]), 1e-12));
    }

    // Summed conductances accumulate every neighbour.
    EXPECT_DOUBLE_EQ(g.coupling_bwd[0], g.summed[0]);
    EXPECT_DOUBLE_EQ(g.coupling_fwd[0] + g.branch_fwd[1] + g.branch_fwd[2], g.summed[1]);
    EXPECT_DOUBLE_EQ(g.branch_bwd[1] + g.coupling_bwd[1], g.summed[2]);
    EXPECT_DOUBLE_EQ(g.coupling_fwd[1], g.summed[3]);
    EXPECT_DOUBLE_EQ(g.branch_bwd[2] + g.coupling_bwd[2], g.summed[4]);
    EXPECT_DOUBLE_EQ(g.coupling_fwd[2], g.summed[5]);
}

TEST(conductances, summed_scatter_add) {
    // Three children on one parent, nseg = 1.
    branch_edge_table edges = make_branch_edges({-1, 0, 0, 0});
    vvec summed(4, 0.);
    vvec fwd = {0, 1, 2, 4};
    vvec bwd = {0, 10, 20, 40};

    update_summed_coupling_conds(summed, 1, edges, fwd, bwd);
    EXPECT_EQ(vvec({7, 10, 20, 40}), summed);
}
