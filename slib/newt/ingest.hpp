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

#pragma once

#include <string>
#include <newt/DenseSource.hpp>
#include <newt/WeightFile.hpp>

namespace newt {

/** Names of the things we read out of a dense weight file. */
struct DenseSchema {
    std::string polyid_var;     // 1-D strings: region ids
    std::string weights_var;    // (polyid, row, col) weights with _FillValue
    std::string row_var;        // 1-D row coordinates
    std::string col_var;        // 1-D column coordinates
    std::string row_dim;
    std::string col_dim;

    DenseSchema() :
        polyid_var("polyid"), weights_var("regridweights"),
        row_var("lat"), col_var("lon"),
        row_dim("lat"), col_dim("lon") {}
};

/** Attribute name never copied from variables into the metadata */
extern std::string const FILL_VALUE_ATTR;

/** Converts a dense weight file into a WeightFile: harvests the
attributes, then extracts the sparse points of each region.

Raises UNSUPPORTED_ATTRIBUTE_TYPE for attributes that are not strings,
MISSING_REQUIRED_FIELD if something named in schema is missing, and
SHAPE_MISMATCH if the weights do not match the coordinates.  Nothing
is returned on failure. */
WeightFile ingest_dense(DenseSource &src,
    DenseSchema const &schema = DenseSchema());

}   // namespace newt
