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

#include <newt/sparse.hpp>
#include <newt/error.hpp>

namespace newt {

RegionEntry extract_region(
    blitz::Array<float,2> const &grid,
    float fill,
    std::vector<float> const &row_coords,
    std::vector<float> const &col_coords)
{
    int const nrow = grid.extent(0);
    int const ncol = grid.extent(1);
    if ((int)row_coords.size() != nrow || (int)col_coords.size() != ncol) {
        (*newt_error)(ErrorCode::SHAPE_MISMATCH,
            "Grid is %dx%d but there are %ld row and %ld column coordinates",
            nrow, ncol, (long)row_coords.size(), (long)col_coords.size());
    }

    RegionEntry ret;
    for (int i=0; i<nrow; ++i) {
    for (int j=0; j<ncol; ++j) {
        float const val = grid(i + grid.lbound(0), j + grid.lbound(1));
        if (val != fill) {
            ret.add_point(i, j, row_coords[i], col_coords[j], val);
        }
    }}
    return ret;
}

LookupTable build_lookup_table(std::vector<RegionEntry> const &entries)
{
    LookupTable ret;
    ret.reserve(entries.size());

    uint64_t running_total = 0;
    for (auto ii=entries.begin(); ii != entries.end(); ++ii) {
        ret.push_back(LookupEntry(running_total, ii->size()));
        running_total += ii->size();
    }
    return ret;
}

}   // namespace newt
