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

#include <cstddef>
#include <string>
#include <vector>
#include <newt/WeightFile.hpp>

namespace newt {

typedef std::vector<unsigned char> ByteBuffer;

/** Layout of a NEWT file.  All multi-byte fields are little-endian.
<pre>
offset  size            field
0       4               magic "NEWT"
4       8               metadata blob length (u64)
12      8               number of regions (u64)
20      8               rows in source grid (u64)
28      8               columns in source grid (u64)
36      8               metadata blob offset (u64, always 52)
44      8               lookup table offset (u64, = 52 + blob length)
52      blob length     metadata, JSON in UTF-8 (see WeightMeta::to_json())
lookup  16*nregions     (offset u64, count u64) per region
...     20*npoints      (row u32, col u32, row_coord f32, col_coord f32, weight f32)
</pre>
All offset arithmetic for the format is done here. */
struct NwtHeader {
    static char const MAGIC[4];

    static const size_t MAGIC_LEN = 4;
    static const size_t HEADER_LEN = MAGIC_LEN + 6*8;      // 52
    static const size_t LOOKUP_REC_LEN = 2*8;
    static const size_t POINT_REC_LEN = 5*4;

    uint64_t meta_len;
    uint64_t nregions;
    uint64_t nrow;
    uint64_t ncol;
    uint64_t meta_offset;
    uint64_t lookup_offset;

    NwtHeader() : meta_len(0), nregions(0), nrow(0), ncol(0),
        meta_offset(HEADER_LEN), lookup_offset(HEADER_LEN) {}

    /** Header for a file with the given metadata blob length. */
    NwtHeader(uint64_t _meta_len, uint64_t _nregions,
        uint64_t _nrow, uint64_t _ncol) :
        meta_len(_meta_len), nregions(_nregions), nrow(_nrow), ncol(_ncol),
        meta_offset(HEADER_LEN), lookup_offset(HEADER_LEN + _meta_len) {}

    /** Offset of the first point record */
    uint64_t points_offset() const
        { return lookup_offset + nregions * LOOKUP_REC_LEN; }
};

/** @return true if buf starts with the NEWT magic token. */
bool is_nwt(unsigned char const *buf, size_t len);

/** Serializes a WeightFile into the NEWT layout. */
ByteBuffer encode_nwt(WeightFile const &wf);

/** Parses a NEWT buffer.  Raises FORMAT_MISMATCH, TRUNCATED_DATA,
ENCODING_ERROR or METADATA_DECODE_ERROR. */
WeightFile decode_nwt(unsigned char const *buf, size_t len);

inline WeightFile decode_nwt(ByteBuffer const &buf)
    { return decode_nwt(buf.data(), buf.size()); }

/** Name written to by write_nwt() when no file name is given. */
extern std::string const DEFAULT_NWT_FNAME;

/** Writes a NEWT file.  The data goes to a temporary file next to
fname, which is renamed to fname once complete; on failure, fname is
left as it was.  Raises IO_ERROR.
@param fname Output file; if empty, DEFAULT_NWT_FNAME. */
void write_nwt(WeightFile const &wf, std::string const &fname);

/** Reads a whole NEWT file.  Raises IO_ERROR if it cannot be read,
otherwise as decode_nwt(). */
WeightFile read_nwt(std::string const &fname);

}   // namespace newt
