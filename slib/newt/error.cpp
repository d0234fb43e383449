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
#include <cstdarg>
#include <exception>
#include <newt/error.hpp>
#ifdef USE_EVERYTRACE
#include <everytrace.h>
#endif

namespace newt {

const int ErrorCode::FORMAT_MISMATCH;
const int ErrorCode::TRUNCATED_DATA;
const int ErrorCode::ENCODING_ERROR;
const int ErrorCode::METADATA_DECODE_ERROR;
const int ErrorCode::UNSUPPORTED_ATTRIBUTE_TYPE;
const int ErrorCode::MISSING_REQUIRED_FIELD;
const int ErrorCode::IO_ERROR;
const int ErrorCode::NOT_FOUND;
const int ErrorCode::SHAPE_MISMATCH;

char const *ErrorCode::str(int code)
{
    switch(code) {
        case FORMAT_MISMATCH : return "FORMAT_MISMATCH";
        case TRUNCATED_DATA : return "TRUNCATED_DATA";
        case ENCODING_ERROR : return "ENCODING_ERROR";
        case METADATA_DECODE_ERROR : return "METADATA_DECODE_ERROR";
        case UNSUPPORTED_ATTRIBUTE_TYPE : return "UNSUPPORTED_ATTRIBUTE_TYPE";
        case MISSING_REQUIRED_FIELD : return "MISSING_REQUIRED_FIELD";
        case IO_ERROR : return "IO_ERROR";
        case NOT_FOUND : return "NOT_FOUND";
        case SHAPE_MISMATCH : return "SHAPE_MISMATCH";
        default : return "UNKNOWN";
    }
}

void default_error(int retcode, const char *format, ...)
{
    char buf[1024];
    va_list arglist;

    va_start(arglist, format);
    vsnprintf(buf, sizeof(buf), format, arglist);
    va_end(arglist);
    fprintf(stderr, "[newt] %s: %s\n", ErrorCode::str(retcode), buf);

#ifdef USE_EVERYTRACE
    everytrace_dump();
#endif
    throw newt::Exception(retcode, buf);
}

error_ptr newt_error = &default_error;

}   // Namespace
