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

#include <algorithm>
#include <map>
#include <gtest/gtest.h>
#include <newt/ingest.hpp>
#include <newt/nwt.hpp>
#include <newt/error.hpp>
#include "test_util.hpp"

using namespace newt;
using namespace newt_test;

/** Dense source held in memory, laid out like a NetCDF weight file. */
class MemDenseSource : public DenseSource {
public:
    std::vector<SourceAttr> gattrs;
    std::vector<std::string> vnames;
    std::map<std::string, std::vector<SourceAttr>> vattrs;
    std::map<std::string, size_t> dims;
    std::map<std::string, std::vector<float>> coords;
    std::map<std::string, std::vector<std::string>> strings;
    std::map<std::string, float> fills;

    std::string weights_vname;
    std::vector<size_t> weights_shape;
    std::vector<float> weights;     // Flattened (polyid, row, col)

    std::vector<SourceAttr> global_attrs() { return gattrs; }
    std::vector<std::string> variables() { return vnames; }
    std::vector<SourceAttr> variable_attrs(std::string const &vname)
        { return vattrs[vname]; }

    bool has_variable(std::string const &vname)
        { return std::find(vnames.begin(), vnames.end(), vname) != vnames.end(); }
    bool has_dimension(std::string const &dname)
        { return dims.find(dname) != dims.end(); }
    bool has_fill_value(std::string const &vname)
        { return fills.find(vname) != fills.end(); }

    size_t dimension_len(std::string const &dname) { return dims.at(dname); }
    std::vector<size_t> variable_shape(std::string const &vname)
        { return (vname == weights_vname) ? weights_shape : std::vector<size_t>(); }
    float fill_value(std::string const &vname) { return fills.at(vname); }
    std::vector<float> coordinate(std::string const &vname) { return coords.at(vname); }
    std::vector<std::string> string_values(std::string const &vname)
        { return strings.at(vname); }

    void read_slice(std::string const &vname, size_t iregion,
        blitz::Array<float,2> &slice)
    {
        int const nrow = weights_shape[1];
        int const ncol = weights_shape[2];
        for (int i=0; i<nrow; ++i)
        for (int j=0; j<ncol; ++j)
            slice(i,j) = weights[(iregion*nrow + i)*ncol + j];
    }
};

static SourceAttr str_attr(std::string const &name, std::string const &value)
    { return SourceAttr(name, SourceAttr::Kind::STRING, {value}, "char"); }

class IngestTest : public ::testing::Test {
protected:
    MemDenseSource src;

    // Two regions on a 2x2 grid; the second region is all fill.
    IngestTest()
    {
        src.gattrs.push_back(str_attr("Conventions", "CF-1.6"));
        src.gattrs.push_back(SourceAttr("history", SourceAttr::Kind::STRINGS,
            {"first", "second"}, "string"));

        src.vnames = {"lat", "lon", "polyid", "regridweights"};
        src.vattrs["lat"].push_back(str_attr("units", "degrees_north"));
        src.vattrs["lon"].push_back(str_attr("units", "degrees_east"));
        src.vattrs["regridweights"].push_back(SourceAttr(
            "_FillValue", SourceAttr::Kind::OTHER, {}, "float"));
        src.vattrs["regridweights"].push_back(str_attr("long_name", "weights"));

        src.dims["lat"] = 2;
        src.dims["lon"] = 2;
        src.dims["polyid"] = 2;
        src.coords["lat"] = {10.f, 20.f};
        src.coords["lon"] = {100.f, 110.f};
        src.strings["polyid"] = {"R0", "R1"};
        src.fills["regridweights"] = -9999.f;

        src.weights_vname = "regridweights";
        src.weights_shape = {2, 2, 2};
        src.weights = {
            -9999.f, 5.f,
            3.f, -9999.f,

            -9999.f, -9999.f,
            -9999.f, -9999.f};
    }

    virtual ~IngestTest() {}
};

TEST_F(IngestTest, scenario)
{
    WeightFile wf(ingest_dense(src));

    ASSERT_EQ(2, wf.nregions());
    EXPECT_EQ((std::vector<std::string>{"R0", "R1"}), wf.polyids());
    EXPECT_EQ(2, wf.dimensions()[0]);
    EXPECT_EQ(2, wf.dimensions()[1]);

    auto &r0(wf.region_points(0));
    ASSERT_EQ(2, r0.size());
    EXPECT_EQ(SparsePoint(0, 1, 10.f, 110.f, 5.f), r0[0]);
    EXPECT_EQ(SparsePoint(1, 0, 20.f, 100.f, 3.f), r0[1]);
    EXPECT_EQ(0, wf.region_points(1).size());

    ASSERT_EQ(2, wf.lookup_table().size());
    EXPECT_EQ(LookupEntry(0, 2), wf.lookup_table()[0]);
    EXPECT_EQ(LookupEntry(2, 0), wf.lookup_table()[1]);

    // Survives the trip through a NEWT buffer
    expect_eq(wf, decode_nwt(encode_nwt(wf)));
}

TEST_F(IngestTest, attributes)
{
    WeightFile wf(ingest_dense(src));
    WeightMeta const &meta(wf.meta());

    EXPECT_EQ("CF-1.6", meta.get_global_attr("Conventions"));
    // Only the first of a list of strings is kept
    EXPECT_EQ("first", meta.get_global_attr("history"));

    EXPECT_EQ("degrees_north", meta.get_var_attr("lat", "units"));
    EXPECT_EQ("weights", meta.get_var_attr("regridweights", "long_name"));

    // _FillValue is not carried over from variables...
    EXPECT_EQ(1, meta.var_attrs("regridweights")->size());
    EXPECT_EQ(ErrorCode::NOT_FOUND, error_code(
        [&]{ meta.get_var_attr("regridweights", "_FillValue"); }));

    // ...and variables without attributes are still listed
    ASSERT_NE(nullptr, meta.var_attrs("polyid"));
    EXPECT_EQ(0, meta.var_attrs("polyid")->size());
    EXPECT_EQ(4, meta.variables().size());
}

TEST_F(IngestTest, unsupported_attribute)
{
    src.vattrs["lat"].push_back(SourceAttr(
        "valid_max", SourceAttr::Kind::OTHER, {}, "double"));
    EXPECT_EQ(ErrorCode::UNSUPPORTED_ATTRIBUTE_TYPE,
        error_code([&]{ ingest_dense(src); }));
}

TEST_F(IngestTest, unsupported_global_attribute)
{
    src.gattrs.push_back(SourceAttr("version", SourceAttr::Kind::OTHER, {}, "int"));
    EXPECT_EQ(ErrorCode::UNSUPPORTED_ATTRIBUTE_TYPE,
        error_code([&]{ ingest_dense(src); }));

    // An empty list of strings has no value to keep
    src.gattrs.pop_back();
    src.gattrs.push_back(SourceAttr("empty", SourceAttr::Kind::STRINGS, {}, "string"));
    EXPECT_EQ(ErrorCode::UNSUPPORTED_ATTRIBUTE_TYPE,
        error_code([&]{ ingest_dense(src); }));
}

TEST_F(IngestTest, missing_fields)
{
    {MemDenseSource s2(src);
        s2.vnames.pop_back();   // regridweights
        EXPECT_EQ(ErrorCode::MISSING_REQUIRED_FIELD,
            error_code([&]{ ingest_dense(s2); }));
    }
    {MemDenseSource s2(src);
        s2.vnames.erase(s2.vnames.begin() + 2);     // polyid
        EXPECT_EQ(ErrorCode::MISSING_REQUIRED_FIELD,
            error_code([&]{ ingest_dense(s2); }));
    }
    {MemDenseSource s2(src);
        s2.dims.erase("lon");
        EXPECT_EQ(ErrorCode::MISSING_REQUIRED_FIELD,
            error_code([&]{ ingest_dense(s2); }));
    }
    {MemDenseSource s2(src);
        s2.fills.clear();
        EXPECT_EQ(ErrorCode::MISSING_REQUIRED_FIELD,
            error_code([&]{ ingest_dense(s2); }));
    }
}

TEST_F(IngestTest, shape_mismatch)
{
    src.weights_shape = {3, 2, 2};
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH, error_code([&]{ ingest_dense(src); }));

    src.weights_shape = {2, 2, 2};
    src.coords["lon"] = {100.f, 110.f, 120.f};
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH, error_code([&]{ ingest_dense(src); }));
}

TEST_F(IngestTest, coordinates_checked_without_regions)
{
    // No regions to extract, so nothing else would look at the coordinates
    src.dims["polyid"] = 0;
    src.strings["polyid"].clear();
    src.weights_shape = {0, 2, 2};
    src.weights.clear();

    EXPECT_EQ(0, ingest_dense(src).nregions());

    src.coords["lat"] = {10.f, 20.f, 30.f};
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH, error_code([&]{ ingest_dense(src); }));

    src.coords["lat"] = {10.f, 20.f};
    src.coords["lon"] = {100.f};
    EXPECT_EQ(ErrorCode::SHAPE_MISMATCH, error_code([&]{ ingest_dense(src); }));
}

TEST_F(IngestTest, schema)
{
    // Same data under other names
    src.vnames = {"y", "x", "region", "w"};
    src.vattrs.clear();
    src.dims.clear();
    src.dims["y"] = 2;
    src.dims["x"] = 2;
    src.coords.clear();
    src.coords["y"] = {10.f, 20.f};
    src.coords["x"] = {100.f, 110.f};
    src.strings.clear();
    src.strings["region"] = {"R0", "R1"};
    src.fills.clear();
    src.fills["w"] = -9999.f;
    src.weights_vname = "w";

    EXPECT_EQ(ErrorCode::MISSING_REQUIRED_FIELD,
        error_code([&]{ ingest_dense(src); }));

    DenseSchema schema;
    schema.polyid_var = "region";
    schema.weights_var = "w";
    schema.row_var = schema.row_dim = "y";
    schema.col_var = schema.col_dim = "x";

    WeightFile wf(ingest_dense(src, schema));
    EXPECT_EQ(2, wf.nregions());
    EXPECT_EQ(2, wf.npoints());
    EXPECT_EQ(SparsePoint(0, 1, 10.f, 110.f, 5.f), wf.region_points(0)[0]);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
