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

#include <array>
#include <newt/WeightMeta.hpp>
#include <newt/sparse.hpp>

namespace newt {

/** In-memory form of a regridding weight file: metadata, the shape of
the dense source grid, and the sparse weights of each region.

Built either by ingesting a dense source (via WeightFileBuilder) or by
decoding a NEWT file.  Read-only once constructed. */
class WeightFile {
    WeightMeta _meta;
    uint64_t _nrow;         // Rows (lat) in the source grid
    uint64_t _ncol;         // Columns (lon) in the source grid
    LookupTable _lookup_table;
    std::vector<RegionEntry> _entries;

public:
    /** Derives the lookup table from the entries. */
    WeightFile(WeightMeta &&meta, uint64_t nrow, uint64_t ncol,
        std::vector<RegionEntry> &&entries);

    /** Takes the lookup table as given (as read from a NEWT file). */
    WeightFile(WeightMeta &&meta, uint64_t nrow, uint64_t ncol,
        LookupTable &&lookup_table,
        std::vector<RegionEntry> &&entries);

    WeightMeta const &meta() const { return _meta; }

    AttrList const &global_attrs() const
        { return _meta.global_attrs(); }

    /** @return nullptr if the variable is not in the file. */
    AttrList const *var_attrs(std::string const &var_name) const
        { return _meta.var_attrs(var_name); }

    std::vector<std::string> const &polyids() const
        { return _meta.polyids(); }

    std::vector<RegionEntry> const &gridpoints() const
        { return _entries; }

    LookupTable const &lookup_table() const
        { return _lookup_table; }

    /** @return {nrow, ncol} of the dense source grid */
    std::array<uint64_t,2> dimensions() const
        { return {{_nrow, _ncol}}; }

    size_t nregions() const { return _entries.size(); }

    /** Total number of points over all regions */
    uint64_t npoints() const;

    /** Points of region iregion.  Raises NOT_FOUND if out of range. */
    std::vector<SparsePoint> const &region_points(size_t iregion) const;

    /** All points, region by region, in one vector.  This is the order
    in which they are laid out in a NEWT file. */
    std::vector<SparsePoint> raw_gridpoints() const;

    bool operator==(WeightFile const &other) const;

private:
    void check_sizes() const;
};

// ----------------------------------------------------------------
/** Accumulates the pieces of a WeightFile while a dense source is
being read.  Nothing is visible to the outside until build(). */
class WeightFileBuilder {
public:
    WeightMeta meta;
    uint64_t nrow;
    uint64_t ncol;
    std::vector<RegionEntry> entries;

    WeightFileBuilder() : nrow(0), ncol(0) {}

    void set_dimensions(uint64_t _nrow, uint64_t _ncol)
        { nrow = _nrow; ncol = _ncol; }

    void add_region(RegionEntry &&entry)
        { entries.push_back(std::move(entry)); }

    /** Moves everything into a new WeightFile, leaving the builder
    empty.  Raises SHAPE_MISMATCH if there is not exactly one region
    entry per polyid. */
    WeightFile build();
};

}   // namespace newt
