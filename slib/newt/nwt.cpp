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

#include <cstdint>
#include <cstring>
#include <fstream>
#include <boost/endian/conversion.hpp>
#include <boost/filesystem.hpp>
#include <newt/nwt.hpp>
#include <newt/error.hpp>

namespace newt {

char const NwtHeader::MAGIC[4] = {'N', 'E', 'W', 'T'};
const size_t NwtHeader::MAGIC_LEN;
const size_t NwtHeader::HEADER_LEN;
const size_t NwtHeader::LOOKUP_REC_LEN;
const size_t NwtHeader::POINT_REC_LEN;

std::string const DEFAULT_NWT_FNAME("test.nwt");

bool is_nwt(unsigned char const *buf, size_t len)
{
    return (len >= NwtHeader::MAGIC_LEN)
        && (std::memcmp(buf, NwtHeader::MAGIC, NwtHeader::MAGIC_LEN) == 0);
}

// ================================================================
// Encoding

namespace {

class NwtWriter {
    ByteBuffer &buf;
public:
    NwtWriter(ByteBuffer &_buf) : buf(_buf) {}

    void bytes(void const *data, size_t n)
    {
        auto p = static_cast<unsigned char const *>(data);
        buf.insert(buf.end(), p, p+n);
    }

    void u32(uint32_t val)
    {
        unsigned char b[4];
        boost::endian::store_little_u32(b, val);
        bytes(b, 4);
    }

    void u64(uint64_t val)
    {
        unsigned char b[8];
        boost::endian::store_little_u64(b, val);
        bytes(b, 8);
    }

    void f32(float val)
    {
        uint32_t bits;
        std::memcpy(&bits, &val, 4);
        u32(bits);
    }
};

}

ByteBuffer encode_nwt(WeightFile const &wf)
{
    std::string const meta_text(wf.meta().to_json());
    auto const dims(wf.dimensions());
    NwtHeader const hdr(meta_text.size(), wf.nregions(), dims[0], dims[1]);

    ByteBuffer buf;
    buf.reserve(hdr.points_offset() + wf.npoints() * NwtHeader::POINT_REC_LEN);
    NwtWriter out(buf);

    // ------ Header
    out.bytes(NwtHeader::MAGIC, NwtHeader::MAGIC_LEN);
    out.u64(hdr.meta_len);
    out.u64(hdr.nregions);
    out.u64(hdr.nrow);
    out.u64(hdr.ncol);
    out.u64(hdr.meta_offset);
    out.u64(hdr.lookup_offset);

    // ------ Metadata
    out.bytes(meta_text.data(), meta_text.size());

    // ------ Lookup table
    for (auto &lu : wf.lookup_table()) {
        out.u64(lu.offset);
        out.u64(lu.count);
    }

    // ------ Points, region-major
    for (auto &entry : wf.gridpoints()) {
        for (auto &pt : entry.points) {
            out.u32(pt.row);
            out.u32(pt.col);
            out.f32(pt.row_coord);
            out.f32(pt.col_coord);
            out.f32(pt.weight);
        }
    }

    return buf;
}

// ================================================================
// Decoding

namespace {

/** Cursor over a NEWT buffer.  Every read is checked against the end
of the buffer. */
class NwtReader {
    unsigned char const * const buf;
    size_t const len;
    size_t pos;

public:
    NwtReader(unsigned char const *_buf, size_t _len, size_t _pos) :
        buf(_buf), len(_len), pos(_pos) {}

    size_t remaining() const { return len - pos; }

    /** Checks there are nrec records of reclen bytes left, without
    overflowing on huge nrec. */
    void require(uint64_t nrec, size_t reclen, char const *what)
    {
        if (nrec > remaining() / reclen) (*newt_error)(ErrorCode::TRUNCATED_DATA,
            "NEWT buffer truncated reading %s: need %llu x %ld bytes at offset %ld, "
            "have %ld", what, (unsigned long long)nrec, (long)reclen,
            (long)pos, (long)remaining());
    }

    void seek(uint64_t offset, char const *what)
    {
        if (offset > len) (*newt_error)(ErrorCode::TRUNCATED_DATA,
            "NEWT buffer truncated: %s starts at offset %llu, buffer is %ld bytes",
            what, (unsigned long long)offset, (long)len);
        pos = offset;
    }

    unsigned char const *bytes(uint64_t n, char const *what)
    {
        require(n, 1, what);
        unsigned char const *ret = buf + pos;
        pos += n;
        return ret;
    }

    uint32_t u32(char const *what)
        { return boost::endian::load_little_u32(bytes(4, what)); }

    uint64_t u64(char const *what)
        { return boost::endian::load_little_u64(bytes(8, what)); }

    float f32(char const *what)
    {
        uint32_t bits = u32(what);
        float val;
        std::memcpy(&val, &bits, 4);
        return val;
    }
};

}

WeightFile decode_nwt(unsigned char const *buf, size_t len)
{
    // ------ Magic comes first, before anything else is looked at
    if (len < NwtHeader::MAGIC_LEN) {
        if (len == 0 || std::memcmp(buf, NwtHeader::MAGIC, len) == 0) {
            (*newt_error)(ErrorCode::TRUNCATED_DATA,
                "NEWT buffer truncated inside the magic token (%ld bytes)", (long)len);
        } else {
            (*newt_error)(ErrorCode::FORMAT_MISMATCH,
                "Buffer is not a NEWT file: bad magic token");
        }
    }
    if (!is_nwt(buf, len)) (*newt_error)(ErrorCode::FORMAT_MISMATCH,
        "Buffer is not a NEWT file: bad magic token");

    NwtReader in(buf, len, NwtHeader::MAGIC_LEN);

    // ------ Header
    NwtHeader hdr;
    hdr.meta_len = in.u64("metadata length");
    hdr.nregions = in.u64("region count");
    hdr.nrow = in.u64("row count");
    hdr.ncol = in.u64("column count");
    hdr.meta_offset = in.u64("metadata offset");
    hdr.lookup_offset = in.u64("lookup table offset");

    // ------ Metadata
    in.seek(hdr.meta_offset, "metadata");
    auto meta_bytes = in.bytes(hdr.meta_len, "metadata");
    char const *meta_chars = reinterpret_cast<char const *>(meta_bytes);
    if (!valid_utf8(meta_chars, hdr.meta_len)) (*newt_error)(ErrorCode::ENCODING_ERROR,
        "NEWT metadata is not valid UTF-8");
    WeightMeta meta(WeightMeta::from_json(std::string(meta_chars, hdr.meta_len)));

    if (meta.polyids().size() != hdr.nregions) (*newt_error)(
        ErrorCode::METADATA_DECODE_ERROR,
        "NEWT metadata lists %ld polyids, but the header says %llu regions",
        (long)meta.polyids().size(), (unsigned long long)hdr.nregions);

    // ------ Lookup table
    in.seek(hdr.lookup_offset, "lookup table");
    in.require(hdr.nregions, NwtHeader::LOOKUP_REC_LEN, "lookup table");
    LookupTable lookup_table;
    lookup_table.reserve(hdr.nregions);
    for (uint64_t i=0; i<hdr.nregions; ++i) {
        uint64_t offset = in.u64("lookup offset");
        uint64_t count = in.u64("lookup count");
        lookup_table.push_back(LookupEntry(offset, count));
    }

    // ------ Points: the lookup counts say how many to read per region
    std::vector<RegionEntry> entries(hdr.nregions);
    for (uint64_t i=0; i<hdr.nregions; ++i) {
        uint64_t const count = lookup_table[i].count;
        in.require(count, NwtHeader::POINT_REC_LEN, "points");

        RegionEntry &entry(entries[i]);
        entry.points.reserve(count);
        for (uint64_t j=0; j<count; ++j) {
            uint32_t row = in.u32("point row");
            uint32_t col = in.u32("point column");
            float row_coord = in.f32("point row coordinate");
            float col_coord = in.f32("point column coordinate");
            float weight = in.f32("point weight");
            entry.add_point(row, col, row_coord, col_coord, weight);
        }
    }

    return WeightFile(std::move(meta), hdr.nrow, hdr.ncol,
        std::move(lookup_table), std::move(entries));
}

// ================================================================
// Files

void write_nwt(WeightFile const &wf, std::string const &_fname)
{
    std::string const fname(_fname.empty() ? DEFAULT_NWT_FNAME : _fname);
    ByteBuffer const buf(encode_nwt(wf));

    boost::filesystem::path const opath(fname);
    boost::filesystem::path const tmppath(fname + ".tmp");
    boost::system::error_code ec;

    {std::ofstream out(tmppath.string(), std::ios::binary | std::ios::trunc);
        if (!out) (*newt_error)(ErrorCode::IO_ERROR,
            "Failed to open %s for writing", tmppath.string().c_str());

        out.write(reinterpret_cast<char const *>(buf.data()), buf.size());
        out.close();
        if (!out) {
            boost::filesystem::remove(tmppath, ec);
            (*newt_error)(ErrorCode::IO_ERROR,
                "Failed writing %ld bytes to %s", (long)buf.size(),
                tmppath.string().c_str());
        }
    }

    boost::filesystem::rename(tmppath, opath, ec);
    if (ec) {
        std::string const msg(ec.message());
        boost::filesystem::remove(tmppath, ec);
        (*newt_error)(ErrorCode::IO_ERROR,
            "Failed to rename %s to %s: %s", tmppath.string().c_str(),
            fname.c_str(), msg.c_str());
    }
}

WeightFile read_nwt(std::string const &fname)
{
    boost::system::error_code ec;
    uintmax_t const size = boost::filesystem::file_size(fname, ec);
    if (ec) (*newt_error)(ErrorCode::IO_ERROR,
        "Cannot read %s: %s", fname.c_str(), ec.message().c_str());

    ByteBuffer buf(size);
    {std::ifstream in(fname, std::ios::binary);
        if (!in) (*newt_error)(ErrorCode::IO_ERROR,
            "Failed to open %s", fname.c_str());
        in.read(reinterpret_cast<char *>(buf.data()), size);
        if (!in) (*newt_error)(ErrorCode::IO_ERROR,
            "Failed reading %ld bytes from %s", (long)size, fname.c_str());
    }

    return decode_nwt(buf);
}

}   // namespace newt
