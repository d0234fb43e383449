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
#include <nlohmann/json.hpp>
#include <newt/WeightMeta.hpp>
#include <newt/error.hpp>

using json = nlohmann::json;

namespace newt {

void WeightMeta::add_variable(std::string const &var_name)
{
    // insert() leaves an existing entry alone
    _var_attrs.insert(std::make_pair(var_name, AttrList()));
}

void WeightMeta::add_variable_attr(std::string const &var_name,
    std::string const &name, std::string const &value)
{
    _var_attrs[var_name].push_back(std::make_pair(name, value));
}

static Attr const *find_attr(AttrList const &attrs, std::string const &name)
{
    for (auto ii=attrs.begin(); ii != attrs.end(); ++ii) {
        if (ii->first == name) return &*ii;
    }
    return nullptr;
}

std::string const &WeightMeta::get_global_attr(std::string const &name) const
{
    Attr const *attr = find_attr(_global_attrs, name);
    if (!attr) (*newt_error)(ErrorCode::NOT_FOUND,
        "Global attribute %s not found", name.c_str());
    return attr->second;
}

std::string const &WeightMeta::get_var_attr(
    std::string const &var_name, std::string const &name) const
{
    auto ii(_var_attrs.find(var_name));
    if (ii == _var_attrs.end()) (*newt_error)(ErrorCode::NOT_FOUND,
        "Variable %s not found in the weight file", var_name.c_str());

    Attr const *attr = find_attr(ii->second, name);
    if (!attr) (*newt_error)(ErrorCode::NOT_FOUND,
        "Attribute %s not found for variable %s", name.c_str(), var_name.c_str());
    return attr->second;
}

AttrList const *WeightMeta::var_attrs(std::string const &var_name) const
{
    auto ii(_var_attrs.find(var_name));
    if (ii == _var_attrs.end()) return nullptr;
    return &ii->second;
}

bool WeightMeta::operator==(WeightMeta const &other) const
{
    return (_global_attrs == other._global_attrs)
        && (_var_attrs == other._var_attrs)
        && (_polyids == other._polyids);
}

// ---------------------------------------------------------------
std::string WeightMeta::to_json() const
{
    json doc;
    doc["global_attrs"] = _global_attrs;
    doc["per_variable_attrs"] = _var_attrs;
    doc["polyids"] = _polyids;

    std::string text;
    try {
        text = doc.dump();
    } catch(json::type_error const &ex) {
        (*newt_error)(ErrorCode::ENCODING_ERROR,
            "Cannot encode weight file metadata: %s", ex.what());
    }
    return text;
}

/** Checks list is an array of [name, value] pairs.  get<Attr>() would
silently drop anything past the second element. */
static void check_attr_list(json const &list, char const *what)
{
    if (!list.is_array()) (*newt_error)(ErrorCode::METADATA_DECODE_ERROR,
        "Weight file metadata: %s is not an array", what);
    for (auto &item : list) {
        if (!item.is_array() || item.size() != 2) (*newt_error)(
            ErrorCode::METADATA_DECODE_ERROR,
            "Weight file metadata: %s has an entry that is not a [name, value] pair",
            what);
    }
}

WeightMeta WeightMeta::from_json(std::string const &text)
{
    WeightMeta meta;
    try {
        json doc(json::parse(text));
        if (!doc.is_object()) (*newt_error)(ErrorCode::METADATA_DECODE_ERROR,
            "Weight file metadata is not a JSON object");

        json const &gattrs(doc.at("global_attrs"));
        check_attr_list(gattrs, "global_attrs");
        meta._global_attrs = gattrs.get<AttrList>();

        json const &vattrs(doc.at("per_variable_attrs"));
        if (!vattrs.is_object()) (*newt_error)(ErrorCode::METADATA_DECODE_ERROR,
            "Weight file metadata: per_variable_attrs is not an object");
        for (auto ii=vattrs.begin(); ii != vattrs.end(); ++ii)
            check_attr_list(ii.value(), ii.key().c_str());
        meta._var_attrs = vattrs.get<std::map<std::string, AttrList>>();
        meta._polyids = doc.at("polyids").get<std::vector<std::string>>();
    } catch(json::exception const &ex) {
        (*newt_error)(ErrorCode::METADATA_DECODE_ERROR,
            "Malformed weight file metadata: %s", ex.what());
    }
    return meta;
}

// ---------------------------------------------------------------
bool valid_utf8(char const *str, size_t len)
{
    auto s = reinterpret_cast<unsigned char const *>(str);
    size_t i = 0;
    while (i < len) {
        unsigned char c = s[i];
        size_t n;
        uint32_t cp;

        if (c < 0x80) { ++i; continue; }
        else if ((c >> 5) == 0x6) { n = 1; cp = c & 0x1F; }
        else if ((c >> 4) == 0xE) { n = 2; cp = c & 0x0F; }
        else if ((c >> 3) == 0x1E) { n = 3; cp = c & 0x07; }
        else return false;      // Stray continuation byte, or 0xF8-0xFF

        if (len - i <= n) return false;
        for (size_t j=1; j <= n; ++j) {
            unsigned char cc = s[i+j];
            if ((cc >> 6) != 0x2) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and out-of-range code points
        static const uint32_t min_cp[4] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_cp[n]) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += n+1;
    }
    return true;
}

}   // namespace newt
