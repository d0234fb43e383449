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

#include <newt/WeightFile.hpp>
#include <newt/error.hpp>

namespace newt {

WeightFile::WeightFile(WeightMeta &&meta, uint64_t nrow, uint64_t ncol,
    std::vector<RegionEntry> &&entries) :
    _meta(std::move(meta)), _nrow(nrow), _ncol(ncol),
    _lookup_table(build_lookup_table(entries)),
    _entries(std::move(entries))
{
    check_sizes();
}

WeightFile::WeightFile(WeightMeta &&meta, uint64_t nrow, uint64_t ncol,
    LookupTable &&lookup_table,
    std::vector<RegionEntry> &&entries) :
    _meta(std::move(meta)), _nrow(nrow), _ncol(ncol),
    _lookup_table(std::move(lookup_table)),
    _entries(std::move(entries))
{
    check_sizes();
}

void WeightFile::check_sizes() const
{
    size_t const npolyid = _meta.polyids().size();
    if (_lookup_table.size() != npolyid || _entries.size() != npolyid) {
        (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Weight file has %ld polyids, %ld lookup entries and %ld regions",
            (long)npolyid, (long)_lookup_table.size(), (long)_entries.size());
    }
}

uint64_t WeightFile::npoints() const
{
    uint64_t n = 0;
    for (auto &entry : _entries) n += entry.size();
    return n;
}

std::vector<SparsePoint> const &WeightFile::region_points(size_t iregion) const
{
    if (iregion >= _entries.size()) (*newt_error)(ErrorCode::NOT_FOUND,
        "Region index %ld out of range [0, %ld)",
        (long)iregion, (long)_entries.size());
    return _entries[iregion].points;
}

std::vector<SparsePoint> WeightFile::raw_gridpoints() const
{
    std::vector<SparsePoint> ret;
    ret.reserve(npoints());
    for (auto &entry : _entries) {
        ret.insert(ret.end(), entry.points.begin(), entry.points.end());
    }
    return ret;
}

bool WeightFile::operator==(WeightFile const &other) const
{
    return (_meta == other._meta)
        && (_nrow == other._nrow) && (_ncol == other._ncol)
        && (_lookup_table == other._lookup_table)
        && (_entries == other._entries);
}

// ----------------------------------------------------------------
WeightFile WeightFileBuilder::build()
{
    WeightFile ret(std::move(meta), nrow, ncol, std::move(entries));

    meta = WeightMeta();
    entries.clear();
    nrow = ncol = 0;
    return ret;
}

}   // namespace newt
