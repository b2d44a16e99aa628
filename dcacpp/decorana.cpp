/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cmath>
#include <sstream>
#include <algorithm>
#include "decorana.hpp"
#include "ra_internal.hpp"
#include "segments.hpp"

using namespace dca;

/* removes previous axes from trial site scores
 *
 * The forward projection centers, detrends against every previous axis and
 * orthogonalizes; the adjoint applies the same steps in reverse order with
 * each detrending replaced by its adjoint. Previous axes are swept first to
 * last and back again, so the sweep is its own reverse.
 */
class axis_projector {
    public:
        axis_projector(const abundance &_table, bool _detrend, uint32_t _n_segments)
            : table(_table), detrend_axes(_detrend), n_segments(_n_segments), n_axes(0) {}

        void add_axis(const double *site_scores) {
            const uint32_t n = table.n_sites;
            std::vector<double> centered(site_scores, site_scores + n);
            weighted_center(centered.data(), table.row_totals.data(), n, table.total);
            axes.insert(axes.end(), centered.begin(), centered.end());
            segments.resize(uint64_t(n) * (n_axes + 1));
            cut_segments(site_scores, n, n_segments, segments.data() + uint64_t(n) * n_axes);
            n_axes++;
        }

        void project(double *x) const {
            const uint32_t n = table.n_sites;
            const double *w = table.row_totals.data();

            weighted_center(x, w, n, table.total);
            if(detrend_axes) {
                std::vector<uint32_t> order = sweep();
                for(unsigned int p = 0; p < order.size(); p++)
                    detrend(x, segments.data() + uint64_t(n) * order[p], w, n, n_segments);
            }
            weighted_orthogonalize(x, axes.data(), n_axes, w, n);
            weighted_center(x, w, n, table.total);
        }

        void project_adjoint(double *x) const {
            const uint32_t n = table.n_sites;
            const double *w = table.row_totals.data();

            weighted_center(x, w, n, table.total);
            weighted_orthogonalize(x, axes.data(), n_axes, w, n);
            if(detrend_axes) {
                std::vector<uint32_t> order = sweep();
                for(unsigned int p = 0; p < order.size(); p++)
                    detrend_adjoint(x, segments.data() + uint64_t(n) * order[p], w, n, n_segments);
            }
            weighted_center(x, w, n, table.total);
        }

    private:
        const abundance &table;
        const bool detrend_axes;
        const uint32_t n_segments;
        uint32_t n_axes;

        std::vector<double> axes;        // n_axes x n_sites
        std::vector<uint32_t> segments;  // n_axes x n_sites

        std::vector<uint32_t> sweep() const {
            std::vector<uint32_t> order;
            for(uint32_t k = 0; k < n_axes; k++)
                order.push_back(k);
            for(int k = int(n_axes) - 2; k >= 0; k--)
                order.push_back(k);
            return order;
        }
};

/* one extracted axis before reordering */
struct axis_result {
    std::vector<double> sites;
    std::vector<double> species;
    double eigenvalue;
    double length;
    uint32_t iterations;
    bool rescaled;
};

static bool by_eigenvalue(const axis_result &a, const axis_result &b) {
    return a.eigenvalue > b.eigenvalue;
}

Status dca::validate_parameters(const parameters &params, diagnostic &diag) {
    std::ostringstream msg;

    if(params.n_axes < 1 || params.n_axes > MAX_AXES)
        msg << "the number of axes must be within 1.." << MAX_AXES << ", got " << params.n_axes;
    else if(!(params.tolerance > 0.0) || !std::isfinite(params.tolerance))
        msg << "the tolerance must be positive, got " << params.tolerance;
    else if(params.max_iterations < 1)
        msg << "the iteration limit must be positive, got " << params.max_iterations;
    else if(params.rescaling_cycles < 0)
        msg << "the number of rescaling cycles cannot be negative, got " << params.rescaling_cycles;
    else if(!(params.shortest_gradient >= 0.0))
        msg << "the shortest gradient cannot be negative, got " << params.shortest_gradient;
    else if(params.rescaling_cycles > 0 && params.segments != 0 &&
            (params.segments < 10 || params.segments > 46))
        msg << "the number of rescaling segments must be within 10..46, got " << params.segments;
    else if(params.analysis == detrended && params.detrending_segments != 0 &&
            (params.detrending_segments < 2 || params.detrending_segments > 46))
        msg << "the number of detrending segments must be within 2..46, got " << params.detrending_segments;

    if(msg.str().empty())
        return ok;

    diag.status = invalid_config;
    diag.message = msg.str();
    return invalid_config;
}

Status dca::check_abundance(const abundance &table, diagnostic &diag) {
    std::ostringstream msg;

    if(table.n_sites < 2 || table.n_species < 2) {
        msg << "at least 2 sites and 2 species are required, got "
            << table.n_sites << " x " << table.n_species;
        diag.status = degenerate_input;
        diag.message = msg.str();
        return degenerate_input;
    }

    for(uint32_t j = 0; j < table.n_species; j++) {
        const double *column = table.species_column(j);
        for(uint32_t i = 0; i < table.n_sites; i++) {
            if(!std::isfinite(column[i]) || column[i] < 0.0) {
                msg << "site " << table.site_ids[i] << " has an invalid abundance of "
                    << column[i] << " for species " << table.species_ids[j];
                diag.status = degenerate_input;
                diag.index = i;
                diag.message = msg.str();
                return degenerate_input;
            }
        }
    }

    for(uint32_t i = 0; i < table.n_sites; i++) {
        if(table.row_totals[i] <= 0.0) {
            msg << "site " << table.site_ids[i] << " (row " << i << ") is empty";
            diag.status = degenerate_input;
            diag.index = i;
            diag.message = msg.str();
            return degenerate_input;
        }
    }
    for(uint32_t j = 0; j < table.n_species; j++) {
        if(table.col_totals[j] <= 0.0) {
            msg << "species " << table.species_ids[j] << " (column " << j << ") is empty";
            diag.status = degenerate_input;
            diag.index = j;
            diag.message = msg.str();
            return degenerate_input;
        }
    }

    return ok;
}

Status dca::decorana(const abundance &input, const parameters &params,
                     ordination &result, diagnostic &diag) {
    diag = diagnostic();

    Status status = validate_parameters(params, diag);
    if(status != ok)
        return status;
    status = check_abundance(input, diag);
    if(status != ok)
        return status;

    abundance table(input);
    if(params.downweight_rare)
        downweight_species(table);

    const uint32_t n_sites = table.n_sites;
    const uint32_t n_species = table.n_species;
    const double total = table.total;
    const double *r = table.row_totals.data();
    const double *c = table.col_totals.data();

    const bool is_detrended = params.analysis == detrended;
    // at least two sites per detrending segment on average
    const uint32_t detrend_segments = std::min<uint32_t>(params.detrending_segments == 0 ? DEFAULT_SEGMENTS
                                                                                          : params.detrending_segments,
                                                         std::max<uint32_t>(2, n_sites / 2));
    const uint32_t rescale_segments = params.segments == 0 ? DEFAULT_SEGMENTS : params.segments;
    const uint32_t max_axes = std::min<uint32_t>(params.n_axes, std::min(n_sites, n_species) - 1);
    const uint32_t required_axes = std::min<uint32_t>(2, params.n_axes);

    axis_projector projector(table, is_detrended, detrend_segments);
    std::vector<axis_result> axes;

    std::vector<double> x(n_sites);
    std::vector<double> x_adj(n_sites);
    std::vector<double> y(n_species);
    std::vector<double> y_next(n_species);

    for(uint32_t axis = 0; axis < max_axes; axis++) {
        // start from the species order
        for(uint32_t j = 0; j < n_species; j++)
            y[j] = j + 1;
        weighted_center(y.data(), c, n_species, total);
        double norm = std::sqrt(weighted_variance(y.data(), c, n_species, total));
        for(uint32_t j = 0; j < n_species; j++)
            y[j] /= norm;

        bool converged = false;
        bool trivial = false;
        double eigenvalue = 0.0;
        int iteration;
        for(iteration = 1; iteration <= params.max_iterations; iteration++) {
            site_averages(table, y.data(), x.data());
            projector.project(x.data());

            x_adj = x;
            projector.project_adjoint(x_adj.data());
            species_averages(table, x_adj.data(), y_next.data());
            weighted_center(y_next.data(), c, n_species, total);

            eigenvalue = std::sqrt(weighted_variance(y_next.data(), c, n_species, total));
            if(!(eigenvalue >= TRIVIAL_EIGENVALUE)) {
                trivial = true;
                break;
            }
            for(uint32_t j = 0; j < n_species; j++)
                y_next[j] /= eigenvalue;

            // scores are defined up to sign
            double change = std::min(weighted_rms_difference(y_next.data(), y.data(), c, n_species, total, false),
                                     weighted_rms_difference(y_next.data(), y.data(), c, n_species, total, true));
            y.swap(y_next);
            if(change < params.tolerance) {
                converged = true;
                break;
            }
        }

        if(!trivial && !converged) {
            std::ostringstream msg;
            msg << "axis " << (axis + 1) << " did not converge within " << params.max_iterations << " iterations";
            diag.status = convergence_error;
            diag.axis = axis + 1;
            diag.iteration = params.max_iterations;
            diag.message = msg.str();
            return convergence_error;
        }

        axis_result current;
        if(!trivial) {
            site_averages(table, y.data(), x.data());
            projector.project(x.data());
            double spread = std::sqrt(weighted_variance(x.data(), r, n_sites, total));
            if(!(spread >= TRIVIAL_EIGENVALUE))
                trivial = true;
            else
                for(uint32_t i = 0; i < n_sites; i++)
                    x[i] /= spread;
        }
        if(trivial) {
            diag.axis = axis + 1;
            diag.iteration = iteration;
            break;
        }

        current.sites = x;
        current.species = y;
        current.eigenvalue = eigenvalue;
        current.iterations = iteration;
        current.rescaled = false;

        if(is_detrended && params.rescaling_cycles > 0) {
            std::vector<double> species(y);
            std::vector<double> sites(n_sites);
            double initial_length;
            if(rescale_axis(table, species.data(), sites.data(), rescale_segments,
                            params.rescaling_cycles, params.shortest_gradient, initial_length)) {
                // the stretched axis is detrended against the earlier axes like a trial axis,
                // then sites and species share the origin at the lowest site
                const double mean = weighted_mean(sites.data(), r, n_sites, total);
                projector.project(sites.data());
                const double lo = *std::min_element(sites.begin(), sites.end());
                for(uint32_t i = 0; i < n_sites; i++)
                    sites[i] -= lo;
                for(uint32_t j = 0; j < n_species; j++)
                    species[j] -= mean + lo;
                current.sites.swap(sites);
                current.species.swap(species);
                current.rescaled = true;
            }
        }
        current.length = gradient_length(table, current.species.data());

        // later axes are detrended against the axis as reported
        projector.add_axis(current.sites.data());
        axes.push_back(current);
    }

    if(axes.size() < required_axes) {
        std::ostringstream msg;
        msg << "only " << axes.size() << " of " << required_axes
            << " required axes have a non-trivial eigenvalue";
        diag.status = degenerate_input;
        diag.axis = axes.size() + 1;
        diag.message = msg.str();
        return degenerate_input;
    }
    diag = diagnostic();

    std::stable_sort(axes.begin(), axes.end(), by_eigenvalue);

    const uint32_t n_axes = axes.size();
    result = ordination();
    result.analysis = params.analysis;
    result.n_sites = n_sites;
    result.n_species = n_species;
    result.n_axes = n_axes;
    result.site_ids = table.site_ids;
    result.species_ids = table.species_ids;
    result.site_scores.resize(uint64_t(n_sites) * n_axes);
    result.species_scores.resize(uint64_t(n_species) * n_axes);

    for(uint32_t k = 0; k < n_axes; k++) {
        const axis_result &current = axes[k];
        for(uint32_t i = 0; i < n_sites; i++)
            result.site_scores[uint64_t(i) * n_axes + k] = current.sites[i];
        for(uint32_t j = 0; j < n_species; j++)
            result.species_scores[uint64_t(j) * n_axes + k] = current.species[j];
        result.eigenvalues.push_back(current.eigenvalue);
        result.axis_lengths.push_back(current.length);
        result.iterations.push_back(current.iterations);
        result.rescaled.push_back(current.rescaled);
    }
    result.total_inertia = total_inertia(table);

    return ok;
}
