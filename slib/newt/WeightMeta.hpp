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

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace newt {

typedef std::pair<std::string, std::string> Attr;
typedef std::vector<Attr> AttrList;

/** Descriptive metadata carried along with the weights: global
attributes, per-variable attributes and the list of region ids
(polyids).  The index of a polyid in polyids() is the region index
used everywhere else in a WeightFile.

Attribute names need not be unique; lookups return the first match. */
class WeightMeta {
    AttrList _global_attrs;
    std::map<std::string, AttrList> _var_attrs;
    std::vector<std::string> _polyids;

public:
    WeightMeta() {}

    void add_global_attr(std::string const &name, std::string const &value)
        { _global_attrs.push_back(std::make_pair(name, value)); }

    /** Registers a variable with no attributes.  Does nothing if the
    variable is already known. */
    void add_variable(std::string const &var_name);

    /** Adds an attribute to a variable, registering the variable first
    if needed. */
    void add_variable_attr(std::string const &var_name,
        std::string const &name, std::string const &value);

    void add_polyid(std::string const &polyid)
        { _polyids.push_back(polyid); }

    /** @return Value of the first global attribute called name.
    Raises NOT_FOUND if there is none. */
    std::string const &get_global_attr(std::string const &name) const;

    /** Raises NOT_FOUND if the variable is unknown, or it has no
    attribute called name. */
    std::string const &get_var_attr(
        std::string const &var_name, std::string const &name) const;

    AttrList const &global_attrs() const { return _global_attrs; }

    /** @return The variable's attributes, or nullptr if the variable
    was never registered. */
    AttrList const *var_attrs(std::string const &var_name) const;

    std::map<std::string, AttrList> const &variables() const
        { return _var_attrs; }

    std::vector<std::string> const &polyids() const { return _polyids; }

    bool operator==(WeightMeta const &other) const;
    bool operator!=(WeightMeta const &other) const
        { return !(*this == other); }

    // ------------- Text encoding of the metadata blob
    /** Encodes to the JSON document stored in NEWT files:
    <pre>{"global_attrs": [[name,value],...],
 "per_variable_attrs": {var: [[name,value],...], ...},
 "polyids": [id,...]}</pre>
    Raises ENCODING_ERROR if a string is not valid UTF-8. */
    std::string to_json() const;

    /** Inverse of to_json().  Raises METADATA_DECODE_ERROR on anything
    that is not a document of that shape. */
    static WeightMeta from_json(std::string const &text);
};

/** @return true if str is well-formed UTF-8 (no overlongs, no
surrogates, nothing past U+10FFFF). */
bool valid_utf8(char const *str, size_t len);

inline bool valid_utf8(std::string const &str)
    { return valid_utf8(str.data(), str.size()); }

}   // namespace newt
