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

// Converts a NetCDF weight file to NEWT, or prints what is in one.

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <tclap/CmdLine.h>
#include <boost/format.hpp>
#include <newt/open.hpp>
#include <newt/nwt.hpp>
#include <newt/error.hpp>

using namespace newt;

struct ParseArgs {
    std::string ifname;
    std::string ofname;
    OpenParams params;
    bool info;
    bool dump;

    ParseArgs(int argc, char **argv);
};

ParseArgs::ParseArgs(int argc, char **argv)
{
    try {
        TCLAP::CmdLine cmd("Converts dense NetCDF regridding weight files "
            "to the sparse NEWT format", ' ', "1.0");

        TCLAP::UnlabeledValueArg<std::string> ifname_a(
            "ifname", "IN: NetCDF or NEWT weight file", true, "", "input filename", cmd);

        TCLAP::ValueArg<std::string> ofname_a("o", "output",
            "OUT: Also write the weights to this NEWT file",
            false, "", "output filename", cmd);

        TCLAP::ValueArg<std::string> suffix_a("s", "suffix",
            "Suffix appended to a NetCDF file name to name its NEWT cache",
            false, params.cache_suffix, "suffix", cmd);

        TCLAP::SwitchArg no_cache_a("n", "no-cache",
            "Do not write a NEWT cache next to a NetCDF input", cmd, false);

        TCLAP::ValueArg<std::string> polyid_a("", "polyid-var",
            "Name of the region id variable", false,
            params.schema.polyid_var, "variable", cmd);
        TCLAP::ValueArg<std::string> weights_a("", "weights-var",
            "Name of the (polyid, row, col) weights variable", false,
            params.schema.weights_var, "variable", cmd);
        TCLAP::ValueArg<std::string> row_a("", "row-var",
            "Name of the row coordinate variable and dimension", false,
            params.schema.row_var, "variable", cmd);
        TCLAP::ValueArg<std::string> col_a("", "col-var",
            "Name of the column coordinate variable and dimension", false,
            params.schema.col_var, "variable", cmd);

        TCLAP::SwitchArg info_a("i", "info", "Print a summary of the weights", cmd, false);
        TCLAP::SwitchArg dump_a("d", "dump", "Print every sparse point", cmd, false);

        cmd.parse(argc, argv);

        ifname = ifname_a.getValue();
        ofname = ofname_a.getValue();
        params.cache_suffix = suffix_a.getValue();
        params.write_cache = !no_cache_a.getValue();
        params.schema.polyid_var = polyid_a.getValue();
        params.schema.weights_var = weights_a.getValue();
        params.schema.row_var = row_a.getValue();
        params.schema.row_dim = row_a.getValue();
        params.schema.col_var = col_a.getValue();
        params.schema.col_dim = col_a.getValue();
        info = info_a.getValue();
        dump = dump_a.getValue();
    } catch (TCLAP::ArgException &e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(1);
    }
}

static void print_info(WeightFile const &wf)
{
    auto dims(wf.dimensions());
    std::cout << boost::format("Source grid: %d x %d\n") % dims[0] % dims[1];
    std::cout << boost::format("Regions: %d\n") % wf.nregions();
    std::cout << boost::format("Points: %d\n") % wf.npoints();

    std::cout << "Global attributes:" << std::endl;
    for (auto &attr : wf.global_attrs())
        std::cout << boost::format("    %s = %s\n") % attr.first % attr.second;

    std::cout << "Variables:" << std::endl;
    for (auto &var : wf.meta().variables()) {
        std::cout << "    " << var.first << std::endl;
        for (auto &attr : var.second)
            std::cout << boost::format("        %s = %s\n") % attr.first % attr.second;
    }
}

static void print_points(WeightFile const &wf)
{
    auto &polyids(wf.polyids());
    auto &lookup(wf.lookup_table());
    for (size_t i=0; i<wf.nregions(); ++i) {
        std::cout << boost::format("%s: offset=%d count=%d\n")
            % polyids[i] % lookup[i].offset % lookup[i].count;
        for (auto &pt : wf.region_points(i)) {
            std::cout << boost::format("    (%d, %d) [%g, %g] %g\n")
                % pt.row % pt.col % pt.row_coord % pt.col_coord % pt.weight;
        }
    }
}

int main(int argc, char **argv)
{
    ParseArgs args(argc, argv);

    try {
        WeightFile wf(open_weight_file(args.ifname, args.params));

        if (args.ofname.size() > 0) {
            write_nwt(wf, args.ofname);
            printf("Wrote %s\n", args.ofname.c_str());
        }
        if (args.info) print_info(wf);
        if (args.dump) print_points(wf);
    } catch(newt::Exception const &ex) {
        // The error handler already printed the details
        return ex.code;
    }

    return 0;
}
