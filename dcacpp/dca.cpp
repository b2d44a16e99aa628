#include <iostream>
#include <fstream>
#include <string>
#include <iomanip>
#include <stdio.h>
#include <stdlib.h>
#include "api.hpp"
#include "cmd.hpp"
#include "cepnames.hpp"
#include "biplot.hpp"

enum Format {format_invalid, format_ascii, format_hdf5};

void usage() {
    std::cout << "usage: dca -i <table> -o <out> [--format ascii|hdf5] [--iweigh] [--iresc cycles] [--ira]" << std::endl;
    std::cout << "    [--mk segments] [--short length] [--dseg segments] [--axes n] [--tol tolerance]" << std::endl;
    std::cout << "    [--max-iter n] [--filter-empty] [--cepnames] [--second-item] [--verbose]" << std::endl;
    std::cout << "    [--plot <out.svg>] [--xax n] [--yax n] [--xlim lo,hi] [--ylim lo,hi]" << std::endl;
    std::cout << std::endl;
    std::cout << "    -i\t\tThe input table, BIOM 2.x (HDF5) or comma/tab delimited text with" << std::endl;
    std::cout << "    \t\tsites as rows and species as columns." << std::endl;
    std::cout << "    -o\t\tThe output scores." << std::endl;
    std::cout << "    --format\t[OPTIONAL] Output format:" << std::endl;
    std::cout << "    \t\t    ascii : [DEFAULT] Tab separated text." << std::endl;
    std::cout << "    \t\t    hdf5 : HDF5 format." << std::endl;
    std::cout << "    --iweigh\t[OPTIONAL] Downweight rare species." << std::endl;
    std::cout << "    --iresc\t[OPTIONAL] Number of rescaling cycles, default is 0." << std::endl;
    std::cout << "    --ira\t[OPTIONAL] Basic reciprocal averaging instead of DCA." << std::endl;
    std::cout << "    --mk\t[OPTIONAL] Rescaling segments, 10..46, default is 26." << std::endl;
    std::cout << "    --short\t[OPTIONAL] Shortest gradient to rescale, default is 0." << std::endl;
    std::cout << "    --dseg\t[OPTIONAL] Detrending segments, 2..46, default is 26." << std::endl;
    std::cout << "    --axes\t[OPTIONAL] Number of axes, 1..4, default is 4." << std::endl;
    std::cout << "    --tol\t[OPTIONAL] Convergence tolerance, default is 1e-6." << std::endl;
    std::cout << "    --max-iter\t[OPTIONAL] Iteration limit per axis, default is 999." << std::endl;
    std::cout << "    --filter-empty\t[OPTIONAL] Drop empty sites and species before the analysis." << std::endl;
    std::cout << "    --cepnames\t[OPTIONAL] Abbreviate species names to eight characters." << std::endl;
    std::cout << "    --second-item\t[OPTIONAL] With --cepnames, use the second word of a name." << std::endl;
    std::cout << "    --verbose\t[OPTIONAL] Report the run parameters." << std::endl;
    std::cout << "    --plot\t[OPTIONAL] Draw a biplot as SVG." << std::endl;
    std::cout << "    --xax\t[OPTIONAL] Biplot horizontal axis, default is 1." << std::endl;
    std::cout << "    --yax\t[OPTIONAL] Biplot vertical axis, default is 2." << std::endl;
    std::cout << "    --xlim\t[OPTIONAL] Biplot horizontal limits." << std::endl;
    std::cout << "    --ylim\t[OPTIONAL] Biplot vertical limits." << std::endl;
    std::cout << std::endl;
    std::cout << "Citations: " << std::endl;
    std::cout << "    For DCA, please see:" << std::endl;
    std::cout << "        Hill and Gauch Vegetatio 1980; DOI: 10.1007/BF00048870" << std::endl;
    std::cout << "        Hill DECORANA, Cornell University 1979" << std::endl;
    std::cout << std::endl;
}

const char* compute_status_messages[8] = {"No error.",
                                          "The table file cannot be found.",
                                          "The table file cannot be parsed.",
                                          "The table file contains an empty table.",
                                          "The parameters are invalid.",
                                          "The table cannot be ordinated.",
                                          "An axis did not converge.",
                                          "Error creating the output."};

const char* plot_status_messages[4] = {"No error.",
                                       "The biplot axes are not axes of the ordination.",
                                       "The biplot limits must be increasing pairs.",
                                       "Error creating the biplot."};

void err(std::string msg) {
    std::cerr << "ERROR: " << msg << std::endl << std::endl;
    usage();
}

Format get_format(const std::string &format_string) {
    if(format_string.empty() || format_string == "ascii")
        return format_ascii;
    else if(format_string == "hdf5")
        return format_hdf5;
    return format_invalid;
}

bool parse_limits(const std::string &arg, double limits[2]) {
    char trailing;
    return sscanf(arg.c_str(), "%lf,%lf%c", &limits[0], &limits[1], &trailing) == 2;
}

void report_parameters(const std::string &table_filename, const dca_params_t &params) {
    std::cout << "Table: " << table_filename << std::endl;
    std::cout << "Analysis: " << (params.basic_ra ? "reciprocal averaging" : "detrended correspondence analysis") << std::endl;
    std::cout << "Downweight rare species: " << (params.downweight_rare ? "yes" : "no") << std::endl;
    std::cout << "Rescaling cycles: " << params.rescaling_cycles << std::endl;
    std::cout << "Rescaling segments: " << (params.segments == 0 ? dca::DEFAULT_SEGMENTS : params.segments) << std::endl;
    std::cout << "Shortest gradient: " << params.shortest_gradient << std::endl;
    std::cout << "Detrending segments: " << (params.detrending_segments == 0 ? dca::DEFAULT_SEGMENTS : params.detrending_segments) << std::endl;
    std::cout << "Axes: " << params.n_axes << std::endl;
    std::cout << "Tolerance: " << params.tolerance << std::endl;
    std::cout << "Iteration limit: " << params.max_iterations << std::endl;
    std::cout << std::endl;
}

void report_summary(const dca::ordination &ord) {
    const char* prefix = ord.analysis == dca::detrended ? "DCA" : "RA";

    std::cout << "Sites: " << ord.n_sites << "  Species: " << ord.n_species << std::endl;
    std::cout << std::setw(16) << " ";
    for(unsigned int k = 0; k < ord.n_axes; k++)
        std::cout << std::setw(10) << (prefix + std::to_string(k + 1));
    std::cout << std::endl;

    std::cout << std::fixed << std::setprecision(4);
    std::cout << std::left << std::setw(16) << "Eigenvalues" << std::right;
    for(unsigned int k = 0; k < ord.n_axes; k++)
        std::cout << std::setw(10) << ord.eigenvalues[k];
    std::cout << std::endl;
    std::cout << std::left << std::setw(16) << "Axis lengths" << std::right;
    for(unsigned int k = 0; k < ord.n_axes; k++)
        std::cout << std::setw(10) << ord.axis_lengths[k];
    std::cout << std::endl;
    std::cout << std::left << std::setw(16) << "Iterations" << std::right;
    for(unsigned int k = 0; k < ord.n_axes; k++)
        std::cout << std::setw(10) << ord.iterations[k];
    std::cout << std::endl;
    std::cout << std::left << std::setw(16) << "Rescaled" << std::right;
    for(unsigned int k = 0; k < ord.n_axes; k++)
        std::cout << std::setw(10) << (ord.rescaled[k] ? "yes" : "no");
    std::cout << std::endl;
    std::cout << "Total inertia: " << ord.total_inertia << std::endl;
    std::cout.unsetf(std::ios::fixed);
}

int mode_one_off(const std::string &table_filename, const std::string &output_filename,
                 Format format_val, const dca_params_t &params, bool verbose,
                 bool cepnames, bool second_item,
                 const std::string &plot_filename, const dca::biplot_options &plot_opts) {
    if(table_filename.empty()) {
        err("table filename missing");
        return EXIT_FAILURE;
    }

    if(output_filename.empty()) {
        err("output filename missing");
        return EXIT_FAILURE;
    }

    if(verbose)
        report_parameters(table_filename, params);

    dca::ordination ord;
    dca_error_t error;
    error.message[0] = '\0';
    ComputeStatus status = decorana_table(table_filename.c_str(), &params, ord, &error);
    if(status != okay) {
        fprintf(stderr, "Compute failed in decorana_table: %s\n", compute_status_messages[status]);
        if(error.message[0] != '\0')
            fprintf(stderr, "%s\n", error.message);
        return EXIT_FAILURE;
    }

    std::vector<std::string> species_labels = ord.species_ids;
    if(cepnames)
        species_labels = dca::make_cepnames(ord.species_ids, second_item);

    ord_result_t *result = NULL;
    initialize_ord_result(result, ord, &species_labels);

    IOStatus err_cond;
    if(format_val == format_hdf5)
        err_cond = write_ord_result_hdf5(output_filename.c_str(), result);
    else
        err_cond = write_ord_result(output_filename.c_str(), result);
    destroy_ord_result(&result);

    if(err_cond != write_okay) {
        fprintf(stderr, "Write failed: %s\n", compute_status_messages[output_error]);
        return EXIT_FAILURE;
    }

    report_summary(ord);

    if(!plot_filename.empty()) {
        dca::PlotStatus plot_status = dca::write_biplot_svg(plot_filename, ord, ord.site_ids,
                                                            species_labels, plot_opts);
        if(plot_status != dca::plot_okay) {
            fprintf(stderr, "Plot failed: %s\n", plot_status_messages[plot_status]);
            return EXIT_FAILURE;
        }
    }

    return EXIT_SUCCESS;
}

int main(int argc, char **argv){
    InputParser input(argc, argv);
    if(input.cmdOptionExists("-h") || input.cmdOptionExists("--help") || argc == 1) {
        usage();
        return EXIT_SUCCESS;
    }

    std::string table_filename = input.getCmdOption("-i");
    std::string output_filename = input.getCmdOption("-o");
    std::string format_arg = input.getCmdOption("--format");
    std::string iresc_arg = input.getCmdOption("--iresc");
    std::string mk_arg = input.getCmdOption("--mk");
    std::string short_arg = input.getCmdOption("--short");
    std::string dseg_arg = input.getCmdOption("--dseg");
    std::string axes_arg = input.getCmdOption("--axes");
    std::string tol_arg = input.getCmdOption("--tol");
    std::string maxiter_arg = input.getCmdOption("--max-iter");
    std::string plot_arg = input.getCmdOption("--plot");
    std::string xax_arg = input.getCmdOption("--xax");
    std::string yax_arg = input.getCmdOption("--yax");
    std::string xlim_arg = input.getCmdOption("--xlim");
    std::string ylim_arg = input.getCmdOption("--ylim");

    dca_params_t params;
    default_params(&params);
    params.downweight_rare = input.cmdOptionExists("--iweigh");
    params.basic_ra = input.cmdOptionExists("--ira");
    params.filter_empty = input.cmdOptionExists("--filter-empty");

    if(!iresc_arg.empty())
        params.rescaling_cycles = atoi(iresc_arg.c_str());
    if(!mk_arg.empty())
        params.segments = atoi(mk_arg.c_str());
    if(!short_arg.empty())
        params.shortest_gradient = atof(short_arg.c_str());
    if(!dseg_arg.empty())
        params.detrending_segments = atoi(dseg_arg.c_str());
    if(!axes_arg.empty())
        params.n_axes = atoi(axes_arg.c_str());
    if(!tol_arg.empty())
        params.tolerance = atof(tol_arg.c_str());
    if(!maxiter_arg.empty())
        params.max_iterations = atoi(maxiter_arg.c_str());

    bool verbose = input.cmdOptionExists("--verbose");
    bool cepnames = input.cmdOptionExists("--cepnames");
    bool second_item = input.cmdOptionExists("--second-item");

    Format format_val = get_format(format_arg);
    if(format_val == format_invalid) {
        err("Invalid format, must be one of ascii|hdf5");
        return EXIT_FAILURE;
    }

    dca::biplot_options plot_opts;
    if(!xax_arg.empty())
        plot_opts.xax = atoi(xax_arg.c_str());
    if(!yax_arg.empty())
        plot_opts.yax = atoi(yax_arg.c_str());
    if(!xlim_arg.empty()) {
        if(!parse_limits(xlim_arg, plot_opts.xlim)) {
            err("--xlim must be a pair lo,hi");
            return EXIT_FAILURE;
        }
        plot_opts.has_xlim = true;
    }
    if(!ylim_arg.empty()) {
        if(!parse_limits(ylim_arg, plot_opts.ylim)) {
            err("--ylim must be a pair lo,hi");
            return EXIT_FAILURE;
        }
        plot_opts.has_ylim = true;
    }

    return mode_one_off(table_filename, output_filename, format_val, params, verbose,
                        cepnames, second_item, plot_arg, plot_opts);
}
