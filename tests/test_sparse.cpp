/*
 * NEWT: A Sparse Cache for Regridding Weight Files
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

// https://github.com/google/googletest/blob/master/googletest/docs/Primer.md

#include <gtest/gtest.h>
#include <newt/sparse.hpp>
#include <newt/WeightFile.hpp>
#include <newt/error.hpp>
#include "test_util.hpp"

using namespace newt;
using namespace newt_test;

class SparseTest : public ::testing::Test {
protected:
    float const fill;
    std::vector<float> lats;
    std::vector<float> lons;

    // Called at start of each test
    SparseTest() : fill(-9999.f)
    {
        lats = {10.f, 20.f};
        lons = {100.f, 110.f};
    }

    // Called at end of each test
    virtual ~SparseTest() {}
};

TEST_F(SparseTest, extract_region)
{
    blitz::Array<float,2> grid(2,2);
    grid(0,0) = fill;  grid(0,1) = 5.f;
    grid(1,0) = 3.f;   grid(1,1) = fill;

    RegionEntry entry(extract_region(grid, fill, lats, lons));
    ASSERT_EQ(2, entry.size());
    EXPECT_EQ(SparsePoint(0, 1, 10.f, 110.f, 5.f), entry.points[0]);
    EXPECT_EQ(SparsePoint(1, 0, 20.f, 100.f, 3.f), entry.points[1]);
}

TEST_F(SparseTest, extract_empty)
{
    blitz::Array<float,2> grid(2,2);
    grid = fill;
    EXPECT_EQ(0, extract_region(grid, fill, lats, lons).size());
}

TEST_F(SparseTest, extract_row_major)
{
    blitz::Array<float,2> grid(2,2);
    grid = 1.f;
    RegionEntry entry(extract_region(grid, fill, lats, lons));
    ASSERT_EQ(4, entry.size());
    for (size_t k=0; k<4; ++k) {
        EXPECT_EQ(k / 2, entry.points[k].row);
        EXPECT_EQ(k % 2, entry.points[k].col);
    }
}

TEST_F(SparseTest, extract_keeps_zero_and_near_fill)
{
    // Only exact equality with the fill value drops a cell
    blitz::Array<float,2> grid(2,2);
    grid(0,0) = 0.f;           grid(0,1) = fill;
    grid(1,0) = fill + 1.f;    grid(1,1) = fill;

    RegionEntry entry(extract_region(grid, fill, lats, lons));
    ASSERT_EQ(2, entry.size());
    EXPECT_EQ(0.f, entry.points[0].weight);
    EXPECT_EQ(fill + 1.f, entry.points[1].weight);
}

TEST_F(SparseTest, extract_base_index)
{
    // Indices in the output are zero-based whatever the array's base
    blitz::Array<float,2> grid(blitz::Range(1,2), blitz::Range(1,2));
    grid = fill;
    grid(2,2) = 0.5f;

    RegionEntry entry(extract_region(grid, fill, lats, lons));
    ASSERT_EQ(1, entry.size());
    EXPECT_EQ(SparsePoint(1, 1, 20.f, 110.f, 0.5f), entry.points[0]);
}

TEST_F(SparseTest, extract_shape_mismatch)
{
    blitz::Array<float,2> grid(3,2);
    grid = 1.f;
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH,
        error_code([&]{ extract_region(grid, fill, lats, lons); }));
}

TEST_F(SparseTest, lookup_table)
{
    std::vector<RegionEntry> entries(4);
    entries[0].add_point(0, 1, 10.f, 110.f, 5.f);
    entries[0].add_point(1, 0, 20.f, 100.f, 3.f);
    entries[2].add_point(1, 1, 20.f, 110.f, 1.f);
    entries[3].add_point(0, 0, 10.f, 100.f, 1.f);

    LookupTable lookup(build_lookup_table(entries));
    ASSERT_EQ(4, lookup.size());
    EXPECT_EQ(LookupEntry(0, 2), lookup[0]);
    EXPECT_EQ(LookupEntry(2, 0), lookup[1]);
    EXPECT_EQ(LookupEntry(2, 1), lookup[2]);
    EXPECT_EQ(LookupEntry(3, 1), lookup[3]);

    EXPECT_EQ(0, build_lookup_table(std::vector<RegionEntry>()).size());
}

TEST_F(SparseTest, weight_file)
{
    WeightFile wf(make_test_weights());
    EXPECT_EQ(3, wf.nregions());
    EXPECT_EQ(3, wf.npoints());
    EXPECT_EQ(3, wf.dimensions()[0]);
    EXPECT_EQ(4, wf.dimensions()[1]);

    // offset[i] + count[i] = offset[i+1]
    auto &lookup(wf.lookup_table());
    ASSERT_EQ(3, lookup.size());
    EXPECT_EQ(0, lookup[0].offset);
    for (size_t i=0; i+1<lookup.size(); ++i)
        EXPECT_EQ(lookup[i].offset + lookup[i].count, lookup[i+1].offset);
    for (size_t i=0; i<lookup.size(); ++i)
        EXPECT_EQ(wf.region_points(i).size(), lookup[i].count);

    EXPECT_EQ(0, wf.region_points(1).size());
    EXPECT_EQ(ErrorCode::NOT_FOUND, error_code([&]{ wf.region_points(3); }));

    std::vector<SparsePoint> raw(wf.raw_gridpoints());
    ASSERT_EQ(3, raw.size());
    EXPECT_EQ(wf.region_points(0)[0], raw[0]);
    EXPECT_EQ(wf.region_points(0)[1], raw[1]);
    EXPECT_EQ(wf.region_points(2)[0], raw[2]);

    EXPECT_EQ("test weights", wf.meta().get_global_attr("title"));
    ASSERT_NE(nullptr, wf.var_attrs("lat"));
    EXPECT_EQ(nullptr, wf.var_attrs("nothing"));
}

TEST_F(SparseTest, builder)
{
    WeightFileBuilder wfb;
    wfb.meta.add_polyid("a");
    wfb.meta.add_polyid("b");
    wfb.set_dimensions(2, 2);
    wfb.add_region(RegionEntry());

    // One region short of the polyids
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH, error_code([&]{ wfb.build(); }));

    WeightFileBuilder wfb2;
    wfb2.meta.add_polyid("a");
    wfb2.set_dimensions(2, 2);
    RegionEntry entry;
    entry.add_point(1, 1, 20.f, 110.f, 0.5f);
    wfb2.add_region(std::move(entry));

    WeightFile wf(wfb2.build());
    EXPECT_EQ(1, wf.nregions());
    EXPECT_EQ(1, wf.npoints());
    EXPECT_EQ(LookupEntry(0, 1), wf.lookup_table()[0]);

    // Builder is left empty
    EXPECT_EQ(0, wfb2.entries.size());
    EXPECT_EQ(0, wfb2.meta.polyids().size());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
