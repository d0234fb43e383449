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
#include <vector>
#include <blitz/array.h>

namespace newt {

/** An attribute as found in a dense source.  Only string-valued
attributes can be carried into a NEWT file. */
struct SourceAttr {
    enum class Kind {STRING, STRINGS, OTHER};

    std::string name;
    Kind kind;
    /** STRING: one value; STRINGS: all values; OTHER: empty */
    std::vector<std::string> values;
    /** Name of the underlying type, for error messages */
    std::string type_name;

    SourceAttr() : kind(Kind::OTHER) {}
    SourceAttr(std::string const &_name, Kind _kind,
        std::vector<std::string> const &_values,
        std::string const &_type_name) :
        name(_name), kind(_kind), values(_values), type_name(_type_name) {}
};

/** Read access to a dense (scientific array) weight file.  Region
slices are 2-D float arrays, dimensioned (row, col). */
class DenseSource {
public:
    virtual ~DenseSource() {}

    virtual std::vector<SourceAttr> global_attrs() = 0;
    virtual std::vector<std::string> variables() = 0;
    virtual std::vector<SourceAttr> variable_attrs(std::string const &vname) = 0;

    virtual bool has_variable(std::string const &vname) = 0;
    virtual bool has_dimension(std::string const &dname) = 0;
    /** @return true if the variable declares a _FillValue */
    virtual bool has_fill_value(std::string const &vname) = 0;

    virtual size_t dimension_len(std::string const &dname) = 0;
    /** Extent of each dimension of a variable */
    virtual std::vector<size_t> variable_shape(std::string const &vname) = 0;
    virtual float fill_value(std::string const &vname) = 0;

    /** Values of a 1-D numeric variable, converted to float */
    virtual std::vector<float> coordinate(std::string const &vname) = 0;

    /** Values of a 1-D string variable */
    virtual std::vector<std::string> string_values(std::string const &vname) = 0;

    /** Reads vname(iregion, :, :) into slice, which is already
    allocated to (nrow, ncol). */
    virtual void read_slice(std::string const &vname, size_t iregion,
        blitz::Array<float,2> &slice) = 0;
};

}   // namespace newt
