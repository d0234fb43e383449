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

#include <netcdf>
#include <netcdf.h>
#include <newt/NcDenseSource.hpp>
#include <newt/error.hpp>

using namespace netCDF;

namespace newt {

/** Runs fn(), turning NetCDF exceptions into IO_ERROR. */
template<class FnT>
static auto nc_guard(std::string const &fname, char const *what, FnT fn)
    -> decltype(fn())
{
    try {
        return fn();
    } catch(exceptions::NcException const &ex) {
        (*newt_error)(ErrorCode::IO_ERROR,
            "NetCDF error %s in %s: %s", what, fname.c_str(), ex.what());
    }
}

static SourceAttr to_source_attr(NcAtt const &att)
{
    std::string const name(att.getName());
    NcType const type(att.getType());

    switch(type.getTypeClass()) {
        case NcType::nc_CHAR : {
            std::string val;
            att.getValues(val);
            // Some writers count the C string terminator in the length
            size_t const end = val.find('\0');
            if (end != std::string::npos) val.resize(end);
            return SourceAttr(name, SourceAttr::Kind::STRING,
                std::vector<std::string>{val}, type.getName());
        }
        case NcType::nc_STRING : {
            size_t const n = att.getAttLength();
            std::vector<char *> cvals(n);
            att.getValues(cvals.data());
            std::vector<std::string> vals;
            for (char *cval : cvals) vals.push_back(std::string(cval ? cval : ""));
            nc_free_string(n, cvals.data());
            return SourceAttr(name, SourceAttr::Kind::STRINGS, vals, type.getName());
        }
        default :
            return SourceAttr(name, SourceAttr::Kind::OTHER,
                std::vector<std::string>(), type.getName());
    }
}

/** Attribute names of a variable (or NC_GLOBAL) in the order they
were written.  NcGroup::getAtts() and NcVar::getAtts() sort by name. */
static std::vector<std::string> att_names(int ncid, int varid)
{
    int natts;
    if (varid == NC_GLOBAL) ncCheck(nc_inq_natts(ncid, &natts), __FILE__, __LINE__);
    else ncCheck(nc_inq_varnatts(ncid, varid, &natts), __FILE__, __LINE__);

    std::vector<std::string> ret;
    char name[NC_MAX_NAME+1];
    for (int i=0; i<natts; ++i) {
        ncCheck(nc_inq_attname(ncid, varid, i, name), __FILE__, __LINE__);
        ret.push_back(std::string(name));
    }
    return ret;
}

// -----------------------------------------------------------------
NcDenseSource::NcDenseSource(std::string const &_fname) : fname(_fname)
{
    try {
        ncio.reset(new ibmisc::NcIO(fname, 'r'));
    } catch(exceptions::NcException const &ex) {
        (*newt_error)(ErrorCode::IO_ERROR,
            "Cannot open NetCDF file %s: %s", fname.c_str(), ex.what());
    }
}

NcDenseSource::~NcDenseSource() {}

NcVar NcDenseSource::get_var(std::string const &vname)
{
    NcVar var(ncio->nc->getVar(vname));
    if (var.isNull()) (*newt_error)(ErrorCode::MISSING_REQUIRED_FIELD,
        "Variable %s not found in %s", vname.c_str(), fname.c_str());
    return var;
}

std::vector<SourceAttr> NcDenseSource::global_attrs()
{
    return nc_guard(fname, "reading global attributes", [&]() -> std::vector<SourceAttr> {
        std::vector<SourceAttr> ret;
        for (auto &name : att_names(ncio->nc->getId(), NC_GLOBAL))
            ret.push_back(to_source_attr(ncio->nc->getAtt(name)));
        return ret;
    });
}

std::vector<std::string> NcDenseSource::variables()
{
    return nc_guard(fname, "listing variables", [&]() -> std::vector<std::string> {
        std::vector<std::string> ret;
        auto vars(ncio->nc->getVars());
        for (auto ii=vars.begin(); ii != vars.end(); ++ii)
            ret.push_back(ii->first);
        return ret;
    });
}

std::vector<SourceAttr> NcDenseSource::variable_attrs(std::string const &vname)
{
    return nc_guard(fname, "reading variable attributes", [&]() -> std::vector<SourceAttr> {
        std::vector<SourceAttr> ret;
        NcVar var(get_var(vname));
        for (auto &name : att_names(ncio->nc->getId(), var.getId()))
            ret.push_back(to_source_attr(var.getAtt(name)));
        return ret;
    });
}

bool NcDenseSource::has_variable(std::string const &vname)
{
    return nc_guard(fname, "looking up variable", [&]() -> bool {
        return !ncio->nc->getVar(vname).isNull();
    });
}

bool NcDenseSource::has_dimension(std::string const &dname)
{
    return nc_guard(fname, "looking up dimension", [&]() -> bool {
        return !ncio->nc->getDim(dname).isNull();
    });
}

bool NcDenseSource::has_fill_value(std::string const &vname)
{
    return nc_guard(fname, "looking up _FillValue", [&]() -> bool {
        auto atts(get_var(vname).getAtts());
        return atts.find("_FillValue") != atts.end();
    });
}

size_t NcDenseSource::dimension_len(std::string const &dname)
{
    return nc_guard(fname, "reading dimension", [&]() -> size_t {
        NcDim dim(ncio->nc->getDim(dname));
        if (dim.isNull()) (*newt_error)(ErrorCode::MISSING_REQUIRED_FIELD,
            "Dimension %s not found in %s", dname.c_str(), fname.c_str());
        return dim.getSize();
    });
}

std::vector<size_t> NcDenseSource::variable_shape(std::string const &vname)
{
    return nc_guard(fname, "reading variable shape", [&]() -> std::vector<size_t> {
        std::vector<size_t> ret;
        for (auto &dim : get_var(vname).getDims()) ret.push_back(dim.getSize());
        return ret;
    });
}

float NcDenseSource::fill_value(std::string const &vname)
{
    return nc_guard(fname, "reading _FillValue", [&]() -> float {
        auto atts(get_var(vname).getAtts());
        auto ii(atts.find("_FillValue"));
        if (ii == atts.end()) (*newt_error)(ErrorCode::MISSING_REQUIRED_FIELD,
            "Variable %s in %s has no _FillValue", vname.c_str(), fname.c_str());
        if (ii->second.getAttLength() != 1) (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "_FillValue of %s in %s has %ld values, expected 1",
            vname.c_str(), fname.c_str(), (long)ii->second.getAttLength());
        float fill;
        ii->second.getValues(&fill);
        return fill;
    });
}

std::vector<float> NcDenseSource::coordinate(std::string const &vname)
{
    return nc_guard(fname, "reading coordinate", [&]() -> std::vector<float> {
        NcVar var(get_var(vname));
        if (var.getDimCount() != 1) (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Coordinate variable %s in %s must be 1-D", vname.c_str(), fname.c_str());

        std::vector<float> ret(var.getDim(0).getSize());
        if (ret.size() > 0) var.getVar(ret.data());
        return ret;
    });
}

std::vector<std::string> NcDenseSource::string_values(std::string const &vname)
{
    return nc_guard(fname, "reading strings", [&]() -> std::vector<std::string> {
        NcVar var(get_var(vname));
        std::vector<std::string> ret;
        NcType::ncType const type_class = var.getType().getTypeClass();

        if (type_class == NcType::nc_STRING && var.getDimCount() == 1) {
            size_t const n = var.getDim(0).getSize();
            if (n == 0) return ret;
            std::vector<char *> cvals(n);
            var.getVar(cvals.data());
            for (char *cval : cvals) ret.push_back(std::string(cval ? cval : ""));
            nc_free_string(n, cvals.data());

        } else if (type_class == NcType::nc_CHAR && var.getDimCount() == 2) {
            // Classic-format string arrays: (n, strlen) of char
            size_t const n = var.getDim(0).getSize();
            size_t const slen = var.getDim(1).getSize();
            if (n == 0 || slen == 0) return std::vector<std::string>(n);
            std::vector<char> buf(n * slen);
            var.getVar(buf.data());
            for (size_t i=0; i<n; ++i) {
                char const *s = &buf[i*slen];
                size_t len = 0;
                while (len < slen && s[len] != '\0') ++len;
                ret.push_back(std::string(s, len));
            }

        } else {
            (*newt_error)(ErrorCode::SHAPE_MISMATCH,
                "Variable %s in %s is not a 1-D array of strings",
                vname.c_str(), fname.c_str());
        }
        return ret;
    });
}

void NcDenseSource::read_slice(std::string const &vname, size_t iregion,
    blitz::Array<float,2> &slice)
{
    nc_guard(fname, "reading weights", [&]() {
        NcVar var(get_var(vname));
        if (var.getDimCount() != 3) (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Weights variable %s in %s must be 3-D", vname.c_str(), fname.c_str());

        std::vector<size_t> startp = {iregion, 0, 0};
        std::vector<size_t> countp = {1, (size_t)slice.extent(0), (size_t)slice.extent(1)};
        if (slice.size() > 0) var.getVar(startp, countp, slice.data());
    });
}

}   // namespace newt
