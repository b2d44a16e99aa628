/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __DCA_DECORANA
#define __DCA_DECORANA 1

#include <stdint.h>
#include <string>
#include <vector>

#include "abundance.hpp"

namespace dca {
    enum Analysis {detrended, basic_reciprocal_averaging};
    enum Status {ok=0, invalid_config, degenerate_input, convergence_error};

    // largest number of axes extracted
    const int MAX_AXES = 4;
    // the number of segments used when 0 is requested
    const int DEFAULT_SEGMENTS = 26;
    // eigenvalues below this end axis extraction
    const double TRIVIAL_EIGENVALUE = 1e-8;

    /* ordination parameters, fixed for one run
     *
     * downweight_rare <bool> downweight rare species (iweigh)
     * rescaling_cycles <int> number of rescaling cycles, 0 for none (iresc)
     * analysis <Analysis> detrended or basic reciprocal averaging (ira)
     * segments <int> rescaling segments, 10..46, 0 for 26 (mk)
     * shortest_gradient <double> axes shorter than this are not rescaled (short)
     * detrending_segments <int> detrending segments, 2..46, 0 for 26
     * n_axes <int> the number of axes to extract, 1..4
     * tolerance <double> convergence tolerance on species scores
     * max_iterations <int> iteration limit per axis
     */
    struct parameters {
        bool downweight_rare;
        int rescaling_cycles;
        Analysis analysis;
        int segments;
        double shortest_gradient;
        int detrending_segments;
        int n_axes;
        double tolerance;
        int max_iterations;

        parameters() : downweight_rare(false), rescaling_cycles(0), analysis(detrended),
                       segments(0), shortest_gradient(0.0), detrending_segments(0),
                       n_axes(MAX_AXES), tolerance(1e-6), max_iterations(999) {}
    };

    /* where and why a run stopped
     *
     * axis and iteration are 1-based, 0 if not applicable. index is the
     * offending site or species, -1 if not applicable.
     */
    struct diagnostic {
        Status status;
        int axis;
        int iteration;
        int64_t index;
        std::string message;

        diagnostic() : status(ok), axis(0), iteration(0), index(-1) {}
    };

    /* the result of an ordination
     *
     * Scores are row-major: site_scores is n_sites x n_axes and
     * species_scores is n_species x n_axes. Axes are ordered by decreasing
     * eigenvalue.
     */
    struct ordination {
        Analysis analysis;
        uint32_t n_sites;
        uint32_t n_species;
        uint32_t n_axes;

        std::vector<std::string> site_ids;
        std::vector<std::string> species_ids;

        std::vector<double> site_scores;
        std::vector<double> species_scores;
        std::vector<double> eigenvalues;
        std::vector<double> axis_lengths;   // in turnover (SD) units
        std::vector<uint32_t> iterations;
        std::vector<bool> rescaled;
        double total_inertia;

        ordination() : analysis(detrended), n_sites(0), n_species(0), n_axes(0), total_inertia(0.0) {}

        inline double site_score(uint32_t site, uint32_t axis) const {
            return site_scores[uint64_t(site) * n_axes + axis];
        }
        inline double species_score(uint32_t species, uint32_t axis) const {
            return species_scores[uint64_t(species) * n_axes + axis];
        }
    };

    /* check parameters for consistency, status ok or invalid_config */
    Status validate_parameters(const parameters &params, diagnostic &diag);

    /* check a table can be ordinated, status ok or degenerate_input
     *
     * Requires at least 2 sites and 2 species, finite non-negative values and
     * no empty site or species; the offending index is reported.
     */
    Status check_abundance(const abundance &table, diagnostic &diag);

    /* Detrended Correspondence Analysis or reciprocal averaging
     *
     * @param table The sites x species abundances
     * @param params The run parameters
     * @param result Output, replaced on success
     * @param diag Output, details on why a run failed
     *
     * Returns ok, invalid_config, degenerate_input or convergence_error.
     */
    Status decorana(const abundance &table, const parameters &params,
                    ordination &result, diagnostic &diag);
}

#endif
