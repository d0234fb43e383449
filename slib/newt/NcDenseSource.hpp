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

#include <memory>
#include <ibmisc/netcdf.hpp>
#include <newt/DenseSource.hpp>

namespace newt {

/** DenseSource backed by a NetCDF file.  The file stays open for the
life of the object.

Any NetCDF failure is reported as IO_ERROR. */
class NcDenseSource : public DenseSource {
    std::string const fname;
    std::unique_ptr<ibmisc::NcIO> ncio;

public:
    /** Opens fname read-only.  Raises IO_ERROR if it cannot be opened. */
    NcDenseSource(std::string const &_fname);
    ~NcDenseSource();

    std::vector<SourceAttr> global_attrs();
    std::vector<std::string> variables();
    std::vector<SourceAttr> variable_attrs(std::string const &vname);

    bool has_variable(std::string const &vname);
    bool has_dimension(std::string const &dname);
    bool has_fill_value(std::string const &vname);

    size_t dimension_len(std::string const &dname);
    std::vector<size_t> variable_shape(std::string const &vname);
    float fill_value(std::string const &vname);

    std::vector<float> coordinate(std::string const &vname);
    std::vector<std::string> string_values(std::string const &vname);

    void read_slice(std::string const &vname, size_t iregion,
        blitz::Array<float,2> &slice);

private:
    netCDF::NcVar get_var(std::string const &vname);
};

}   // namespace newt
