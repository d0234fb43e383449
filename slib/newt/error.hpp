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

#ifndef NEWT_ERROR_HPP
#define NEWT_ERROR_HPP

#include <string>
#include <everytrace.hpp>

/** @defgroup newt newt.hpp
@brief Basic stuff common to all of NEWT */
namespace newt {

/** Return codes passed to newt_error().  Callers can tell failures
apart through Exception::code. */
struct ErrorCode {
    static const int FORMAT_MISMATCH            = 1;    // Bad magic token
    static const int TRUNCATED_DATA             = 2;    // Buffer shorter than the header says
    static const int ENCODING_ERROR             = 3;    // Metadata blob is not valid UTF-8
    static const int METADATA_DECODE_ERROR      = 4;    // Metadata blob is not the JSON we expect
    static const int UNSUPPORTED_ATTRIBUTE_TYPE = 5;
    static const int MISSING_REQUIRED_FIELD     = 6;
    static const int IO_ERROR                   = 7;
    static const int NOT_FOUND                  = 8;    // Metadata lookup miss
    static const int SHAPE_MISMATCH             = 9;

    static char const *str(int code);
};

/** Thrown by the default error handler. */
class Exception : public everytrace::Exception {
public:
    int const code;
    std::string const msg;

    Exception(int _code, std::string const &_msg) :
        code(_code), msg(_msg) {}

    virtual ~Exception() {}

    virtual const char *what() const noexcept
        { return msg.c_str(); }
};

typedef void (*error_ptr) (int retcode, char const *format, ...);

/** Use the NEWT error handler by default; user or other library can
    change if needed.  The handler must not return. */
extern error_ptr newt_error;

}   // namespace
/** @} */

#endif // Guard
