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
#include <newt/ingest.hpp>
#include <newt/WeightFile.hpp>

namespace newt {

struct OpenParams {
    /** Appended to the name of a dense file to name its NEWT cache */
    std::string cache_suffix;

    /** Write the NEWT cache after ingesting a dense file? */
    bool write_cache;

    DenseSchema schema;

    OpenParams() : cache_suffix(".nwt"), write_cache(true) {}
};

/** Opens a weight file of either kind.  NEWT files (recognized by
their magic token) are decoded directly.  Anything else is ingested
as a NetCDF dense weight file; the result is then written to
fname + params.cache_suffix so the next open can skip the extraction.
Failing to write the cache (for any reason, including an exception
thrown by a replacement error handler) is logged but does not fail
the open.

Raises IO_ERROR if fname cannot be read, otherwise whatever
read_nwt() or ingest_dense() raise. */
WeightFile open_weight_file(std::string const &fname,
    OpenParams const &params = OpenParams());

}   // namespace newt
