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

#include <cstdio>
#include <exception>
#include <fstream>
#include <newt/open.hpp>
#include <newt/nwt.hpp>
#include <newt/NcDenseSource.hpp>
#include <newt/error.hpp>

namespace newt {

static WeightFile ingest_netcdf(std::string const &fname, DenseSchema const &schema)
{
    NcDenseSource src(fname);
    return ingest_dense(src, schema);
}

WeightFile open_weight_file(std::string const &fname, OpenParams const &params)
{
    // Sniff the magic token; the file is closed again before parsing
    unsigned char magic[NwtHeader::MAGIC_LEN];
    size_t nread;
    {std::ifstream in(fname, std::ios::binary);
        if (!in) (*newt_error)(ErrorCode::IO_ERROR,
            "Failed to open weight file %s", fname.c_str());
        in.read(reinterpret_cast<char *>(magic), NwtHeader::MAGIC_LEN);
        if (in.bad()) (*newt_error)(ErrorCode::IO_ERROR,
            "Failed reading weight file %s", fname.c_str());
        nread = in.gcount();
    }

    if (is_nwt(magic, nread)) return read_nwt(fname);

    // Dense file: extract, then cache
    WeightFile wf(ingest_netcdf(fname, params.schema));
    printf("[newt] Read %ld regions (%llu points) from %s\n",
        (long)wf.nregions(), (unsigned long long)wf.npoints(), fname.c_str());

    if (params.write_cache) {
        std::string const cache_fname(fname + params.cache_suffix);
        try {
            write_nwt(wf, cache_fname);
            printf("[newt] Serialized new weight file to %s. "
                "Use this next time to avoid precomputation step\n", cache_fname.c_str());
        } catch(newt::Exception const &ex) {
            fprintf(stderr, "[newt] Could not write cache %s: %s\n",
                cache_fname.c_str(), ex.what());
        } catch(std::exception const &ex) {
            fprintf(stderr, "[newt] Could not write cache %s: %s\n",
                cache_fname.c_str(), ex.what());
        }
    }

    return wf;
}

}   // namespace newt
