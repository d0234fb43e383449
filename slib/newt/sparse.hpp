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

#ifndef NEWT_SPARSE_HPP
#define NEWT_SPARSE_HPP

#include <cstdint>
#include <vector>
#include <blitz/array.h>

namespace newt {

/** One non-fill cell of a region's dense weight grid. */
struct SparsePoint {
    uint32_t row;       // Index into the row (lat) dimension
    uint32_t col;       // Index into the column (lon) dimension
    float row_coord;    // Coordinate value of the row, eg latitude
    float col_coord;    // Coordinate value of the column, eg longitude
    float weight;

    SparsePoint() : row(0), col(0), row_coord(0), col_coord(0), weight(0) {}

    SparsePoint(uint32_t _row, uint32_t _col,
        float _row_coord, float _col_coord, float _weight) :
        row(_row), col(_col), row_coord(_row_coord), col_coord(_col_coord),
        weight(_weight) {}

    bool operator==(SparsePoint const &rhs) const
    {
        return (row == rhs.row) && (col == rhs.col)
            && (row_coord == rhs.row_coord) && (col_coord == rhs.col_coord)
            && (weight == rhs.weight);
    }
};

/** The sparse points of one region, in row-major order of the
dense grid they came from. */
struct RegionEntry {
    std::vector<SparsePoint> points;

    size_t size() const { return points.size(); }

    void add_point(uint32_t row, uint32_t col,
        float row_coord, float col_coord, float weight)
        { points.push_back(SparsePoint(row, col, row_coord, col_coord, weight)); }

    bool operator==(RegionEntry const &rhs) const
        { return points == rhs.points; }
};

/** Locates one region's points in the flattened point array. */
struct LookupEntry {
    uint64_t offset;    // Number of points in all previous regions
    uint64_t count;     // Number of points in this region

    LookupEntry() : offset(0), count(0) {}
    LookupEntry(uint64_t _offset, uint64_t _count) :
        offset(_offset), count(_count) {}

    bool operator==(LookupEntry const &rhs) const
        { return (offset == rhs.offset) && (count == rhs.count); }
};

typedef std::vector<LookupEntry> LookupTable;

/** Keeps the cells of a dense grid that differ from the fill value.
@param grid Dense weights, dimensions (row, col)
@param fill Cells exactly equal to this are dropped
@param row_coords Coordinate value for each row (grid.extent(0) of them)
@param col_coords Coordinate value for each column (grid.extent(1) of them)
@return Points in row-major order; may be empty. */
RegionEntry extract_region(
    blitz::Array<float,2> const &grid,
    float fill,
    std::vector<float> const &row_coords,
    std::vector<float> const &col_coords);

/** offset[i] = sum(count[j], j<i) */
LookupTable build_lookup_table(std::vector<RegionEntry> const &entries);

}   // namespace newt

#endif
