#include <vector>

#include <gtest/gtest.h>

#include <dendra/cell_description.hpp>
#include <dendra/dendraexcept.hpp>

#include "topology.hpp"

#include "common.hpp"

using namespace dendra;

using ivec = std::vector<fvm_index_type>;

TEST(topology, branch_levels) {
    {
        auto levels = branch_levels({-1});
        ASSERT_EQ(1u, levels.size());
        EXPECT_EQ(ivec({0}), levels[0]);
    }
    {
        //        0
        //       / \.
        //      1   2
        //      |
        //      3
        auto levels = branch_levels({-1, 0, 0, 1});
        ASSERT_EQ(3u, levels.size());
        EXPECT_EQ(ivec({0}), levels[0]);
        EXPECT_EQ(ivec({1, 2}), levels[1]);
        EXPECT_EQ(ivec({3}), levels[2]);
    }
    {
        // Children may precede their parents in the parent vector.
        auto levels = branch_levels({2, -1, 1});
        ASSERT_EQ(3u, levels.size());
        EXPECT_EQ(ivec({1}), levels[0]);
        EXPECT_EQ(ivec({2}), levels[1]);
        EXPECT_EQ(ivec({0}), levels[2]);
    }
}

TEST(topology, level_after_parent) {
    ivec parents = {-1, 0, 0, 1, 1, 4, 2, 6, 6};
    auto levels = branch_levels(parents);

    std::vector<int> level_of(parents.size(), -1);
    for (unsigned k = 0; k<levels.size(); ++k) {
        for (auto b: levels[k]) {
            EXPECT_EQ(-1, level_of[b]) << "branch " << b << " in more than one level";
            level_of[b] = k;
        }
    }
    for (unsigned b = 0; b<parents.size(); ++b) {
        ASSERT_NE(-1, level_of[b]);
        if (parents[b]!=no_parent) {
            EXPECT_GT(level_of[b], level_of[parents[b]]);
        }
    }
}

TEST(topology, merge_parents) {
    ivec a = {-1, 0, 0};
    ivec b = {-1, 0};
    ivec c = {-1};
    ivec offsets = {0, 3, 5, 6};

    auto merged = merge_parents({&a, &b, &c}, offsets);
    EXPECT_EQ(ivec({-1, 0, 0, -1, 3, -1}), merged);
}

TEST(topology, merge_levels) {
    std::vector<level_list> levels = {
        branch_levels({-1, 0, 0, 1}),
        branch_levels({-1, 0}),
    };
    ivec offsets = {0, 4, 6};

    auto merged = merge_levels(levels, offsets);
    ASSERT_EQ(3u, merged.size());
    EXPECT_EQ(ivec({0, 4}), merged[0]);
    EXPECT_EQ(ivec({1, 2, 5}), merged[1]);
    EXPECT_EQ(ivec({3}), merged[2]);
}

TEST(topology, branch_edges) {
    auto edges = make_branch_edges({-1, 0, 0, -1, 3});
    ASSERT_EQ(3u, edges.size());
    EXPECT_EQ(ivec({0, 0, 3}), edges.parent_branch_index);
    EXPECT_EQ(ivec({1, 2, 4}), edges.child_branch_index);

    EXPECT_EQ(0u, make_branch_edges({-1}).size());
}

TEST(topology, validate_cell) {
    EXPECT_NO_THROW(validate_cell(cell_description(2, {-1, 0, 0}), 0));
    EXPECT_NO_THROW(validate_cell(chain_cell(5, 3), 0));

    // No root, two roots.
    EXPECT_THROW(validate_cell(cell_description(1, {}), 0), bad_topology);
    EXPECT_THROW(validate_cell(cell_description(1, {-1, -1}), 0), bad_topology);

    // Parent out of range, or self.
    EXPECT_THROW(validate_cell(cell_description(1, {-1, 2}), 0), bad_parent_index);
    EXPECT_THROW(validate_cell(cell_description(1, {-1, -3}), 0), bad_parent_index);
    EXPECT_THROW(validate_cell(cell_description(1, {-1, 1}), 0), bad_parent_index);

    // Cycle detached from the root.
    EXPECT_THROW(validate_cell(cell_description(1, {-1, 2, 1}), 0), bad_topology);

    // No compartments.
    EXPECT_THROW(validate_cell(cell_description(0, {-1}), 0), bad_topology);
}

TEST(topology, validate_cell_columns) {
    cell_description cell(2, {-1, 0});
    cell.radius = {1, 1, 1};
    EXPECT_THROW(validate_cell(cell, 0), table_size_mismatch);
    cell.radius = {1, 1, 1, 1};
    EXPECT_NO_THROW(validate_cell(cell, 0));

    try {
        cell.length = {1.};
        validate_cell(cell, 3);
        FAIL() << "expected table_size_mismatch";
    }
    catch (table_size_mismatch& e) {
        EXPECT_EQ("length", e.field);
        EXPECT_EQ(1u, e.size);
        EXPECT_EQ(4u, e.expected);
    }
}

TEST(topology, bad_parent_index_fields) {
    try {
        validate_cell(cell_description(1, {-1, 0, 7}), 4);
        FAIL() << "expected bad_parent_index";
    }
    catch (bad_parent_index& e) {
        EXPECT_EQ(4u, e.gid);
        EXPECT_EQ(2, e.branch);
        EXPECT_EQ(7, e.parent);
    }
}
