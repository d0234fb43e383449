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

#include <newt/ingest.hpp>
#include <newt/error.hpp>

namespace newt {

std::string const FILL_VALUE_ATTR("_FillValue");

/** Single strings are taken as-is; of a list of strings, only the
first is kept. */
static std::string const &attr_value(SourceAttr const &attr, std::string const &owner)
{
    switch(attr.kind) {
        case SourceAttr::Kind::STRING :
        case SourceAttr::Kind::STRINGS :
            if (attr.values.size() > 0) return attr.values[0];
        break;
        default : break;
    }
    (*newt_error)(ErrorCode::UNSUPPORTED_ATTRIBUTE_TYPE,
        "Unexpected attribute type %s for %s:%s", attr.type_name.c_str(),
        owner.c_str(), attr.name.c_str());
    return attr.name;   // not reached
}

static void require_variable(DenseSource &src, std::string const &vname)
{
    if (!src.has_variable(vname)) (*newt_error)(ErrorCode::MISSING_REQUIRED_FIELD,
        "Required variable %s is missing from the weight file", vname.c_str());
}

static void require_dimension(DenseSource &src, std::string const &dname)
{
    if (!src.has_dimension(dname)) (*newt_error)(ErrorCode::MISSING_REQUIRED_FIELD,
        "Required dimension %s is missing from the weight file", dname.c_str());
}

WeightFile ingest_dense(DenseSource &src, DenseSchema const &schema)
{
    WeightFileBuilder wfb;

    // ------ Attributes
    for (auto &attr : src.global_attrs()) {
        wfb.meta.add_global_attr(attr.name, attr_value(attr, ""));
    }

    for (auto &vname : src.variables()) {
        wfb.meta.add_variable(vname);
        for (auto &attr : src.variable_attrs(vname)) {
            if (attr.name == FILL_VALUE_ATTR) continue;
            wfb.meta.add_variable_attr(vname, attr.name, attr_value(attr, vname));
        }
    }

    // ------ Everything we need to extract weights
    require_variable(src, schema.polyid_var);
    require_variable(src, schema.weights_var);
    require_variable(src, schema.row_var);
    require_variable(src, schema.col_var);
    require_dimension(src, schema.row_dim);
    require_dimension(src, schema.col_dim);
    if (!src.has_fill_value(schema.weights_var)) (*newt_error)(
        ErrorCode::MISSING_REQUIRED_FIELD,
        "Variable %s has no %s", schema.weights_var.c_str(), FILL_VALUE_ATTR.c_str());

    std::vector<std::string> const polyids(src.string_values(schema.polyid_var));
    for (auto &polyid : polyids) wfb.meta.add_polyid(polyid);

    std::vector<float> const row_coords(src.coordinate(schema.row_var));
    std::vector<float> const col_coords(src.coordinate(schema.col_var));
    size_t const nrow = src.dimension_len(schema.row_dim);
    size_t const ncol = src.dimension_len(schema.col_dim);
    float const fill = src.fill_value(schema.weights_var);
    wfb.set_dimensions(nrow, ncol);

    if (row_coords.size() != nrow || col_coords.size() != ncol) {
        (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Coordinates %s and %s have %ld and %ld values, dimensions are %ld and %ld",
            schema.row_var.c_str(), schema.col_var.c_str(),
            (long)row_coords.size(), (long)col_coords.size(), (long)nrow, (long)ncol);
    }

    std::vector<size_t> const shape(src.variable_shape(schema.weights_var));
    if (shape.size() != 3 || shape[0] != polyids.size()
        || shape[1] != nrow || shape[2] != ncol)
    {
        (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Variable %s must be dimensioned (%ld, %ld, %ld)",
            schema.weights_var.c_str(), (long)polyids.size(), (long)nrow, (long)ncol);
    }

    // ------ Extract each region.  Regions are independent of each
    // other; the lookup table is built once they are all done.
    blitz::Array<float,2> slice((int)nrow, (int)ncol);
    for (size_t ip=0; ip < polyids.size(); ++ip) {
        src.read_slice(schema.weights_var, ip, slice);
        wfb.add_region(extract_region(slice, fill, row_coords, col_coords));
    }

    return wfb.build();
}

}   // namespace newt
