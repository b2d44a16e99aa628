/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cmath>
#include <algorithm>
#include "segments.hpp"
#include "ra_internal.hpp"

using namespace dca;

// floor on pooled segment variance, relative to the mean within-site variance
static const double MIN_SEGMENT_VARIANCE = 1e-3;

void dca::cut_segments(const double *scores, uint32_t n, uint32_t n_segments, uint32_t *segment) {
    const double lo = *std::min_element(scores, scores + n);
    const double hi = *std::max_element(scores, scores + n);
    const double range = hi - lo;

    for(uint32_t i = 0; i < n; i++) {
        if(!(range > 0.0)) {
            segment[i] = 0;
            continue;
        }
        double pos = n_segments * (scores[i] - lo) / range;
        uint32_t k = pos <= 0.0 ? 0 : uint32_t(std::floor(pos));
        segment[i] = std::min(k, n_segments - 1);
    }
}

// weighted sums of values and of weights per segment
static void pool_segments(const double *values, const uint32_t *segment, const double *weights,
                          uint32_t n, uint32_t n_segments,
                          std::vector<double> &sums, std::vector<double> &mass) {
    sums.assign(n_segments, 0.0);
    mass.assign(n_segments, 0.0);
    for(uint32_t i = 0; i < n; i++) {
        sums[segment[i]] += weights[i] * values[i];
        mass[segment[i]] += weights[i];
    }
}

// total weight of a segment and its neighbours
static void neighbour_mass(const std::vector<double> &mass, std::vector<double> &pooled) {
    const uint32_t n_segments = mass.size();
    pooled.assign(n_segments, 0.0);
    for(uint32_t k = 0; k < n_segments; k++) {
        pooled[k] = mass[k];
        if(k > 0)
            pooled[k] += mass[k - 1];
        if(k + 1 < n_segments)
            pooled[k] += mass[k + 1];
    }
}

void dca::detrend(double *values, const uint32_t *segment, const double *weights,
                  uint32_t n, uint32_t n_segments) {
    std::vector<double> sums, mass, pooled;
    pool_segments(values, segment, weights, n, n_segments, sums, mass);
    neighbour_mass(mass, pooled);

    std::vector<double> trend(n_segments, 0.0);
    for(uint32_t k = 0; k < n_segments; k++) {
        if(pooled[k] <= 0.0)
            continue;
        double s = sums[k];
        if(k > 0)
            s += sums[k - 1];
        if(k + 1 < n_segments)
            s += sums[k + 1];
        trend[k] = s / pooled[k];
    }

    for(uint32_t i = 0; i < n; i++)
        values[i] -= trend[segment[i]];
}

void dca::detrend_adjoint(double *values, const uint32_t *segment, const double *weights,
                          uint32_t n, uint32_t n_segments) {
    std::vector<double> sums, mass, pooled;
    pool_segments(values, segment, weights, n, n_segments, sums, mass);
    neighbour_mass(mass, pooled);

    // each segment hands its share to the trends of its neighbourhood
    std::vector<double> share(n_segments, 0.0);
    for(uint32_t k = 0; k < n_segments; k++) {
        if(pooled[k] > 0.0)
            share[k] = sums[k] / pooled[k];
    }

    std::vector<double> trend(n_segments, 0.0);
    for(uint32_t k = 0; k < n_segments; k++) {
        trend[k] = share[k];
        if(k > 0)
            trend[k] += share[k - 1];
        if(k + 1 < n_segments)
            trend[k] += share[k + 1];
    }

    for(uint32_t i = 0; i < n; i++)
        values[i] -= trend[segment[i]];
}

void dca::fill_empty_segments(std::vector<double> &values, const std::vector<bool> &occupied) {
    const int n_segments = values.size();
    std::vector<double> filled(values);

    for(int k = 0; k < n_segments; k++) {
        if(occupied[k])
            continue;

        int left = k - 1;
        while(left >= 0 && !occupied[left])
            left--;
        int right = k + 1;
        while(right < n_segments && !occupied[right])
            right++;

        double sum = 0.0;
        unsigned int count = 0;
        if(left >= 0) {
            sum += values[left];
            count++;
        }
        if(right < n_segments) {
            sum += values[right];
            count++;
        }
        filled[k] = count > 0 ? sum / count : 0.0;
    }

    values.swap(filled);
}

void dca::smooth_segments(std::vector<double> &values, unsigned int passes) {
    const uint32_t n_segments = values.size();
    if(n_segments < 2)
        return;

    std::vector<double> next(n_segments);
    for(unsigned int p = 0; p < passes; p++) {
        for(uint32_t k = 0; k < n_segments; k++) {
            double left = k > 0 ? values[k - 1] : values[k];
            double right = k + 1 < n_segments ? values[k + 1] : values[k];
            next[k] = 0.25 * left + 0.5 * values[k] + 0.25 * right;
        }
        values.swap(next);
    }
}

bool dca::rescale_axis(const abundance &table, double *species_scores, double *site_scores,
                       uint32_t n_segments, uint32_t cycles, double shortest, double &initial_length) {
    const uint32_t n_sites = table.n_sites;
    const uint32_t n_species = table.n_species;
    const double *row_totals = table.row_totals.data();

    std::vector<double> sites(n_sites);
    std::vector<double> variance(n_sites);
    std::vector<uint32_t> segment(n_sites);

    site_averages(table, species_scores, sites.data());
    within_site_variance(table, species_scores, sites.data(), variance.data());
    double mean_var = mean_within_variance(table, variance.data());

    double lo = *std::min_element(sites.begin(), sites.end());
    double hi = *std::max_element(sites.begin(), sites.end());

    initial_length = mean_var > 0.0 ? (hi - lo) / std::sqrt(mean_var) : 0.0;
    if(!(mean_var > 0.0) || !(hi > lo) || initial_length < shortest)
        return false;

    for(uint32_t cycle = 0; cycle < cycles; cycle++) {
        const double width = (hi - lo) / n_segments;
        cut_segments(sites.data(), n_sites, n_segments, segment.data());

        // pool within-site variance by segment
        std::vector<double> seg_var(n_segments, 0.0);
        std::vector<double> seg_mass(n_segments, 0.0);
        for(uint32_t i = 0; i < n_sites; i++) {
            seg_var[segment[i]] += row_totals[i] * variance[i];
            seg_mass[segment[i]] += row_totals[i];
        }
        std::vector<bool> occupied(n_segments);
        for(uint32_t k = 0; k < n_segments; k++) {
            occupied[k] = seg_mass[k] > 0.0;
            if(occupied[k])
                seg_var[k] /= seg_mass[k];
        }
        fill_empty_segments(seg_var, occupied);
        smooth_segments(seg_var, 3);

        // stretch each segment by the inverse of its turnover SD
        std::vector<double> breaks(n_segments + 1, 0.0);
        const double floor_var = MIN_SEGMENT_VARIANCE * mean_var;
        for(uint32_t k = 0; k < n_segments; k++)
            breaks[k + 1] = breaks[k] + width / std::sqrt(std::max(seg_var[k], floor_var));

        for(uint32_t j = 0; j < n_species; j++) {
            double pos = (species_scores[j] - lo) / width;
            int k = int(std::floor(pos));
            k = std::max(0, std::min(int(n_segments) - 1, k));
            species_scores[j] = breaks[k] + (pos - k) * (breaks[k + 1] - breaks[k]);
        }

        // unit mean within-site SD
        site_averages(table, species_scores, sites.data());
        within_site_variance(table, species_scores, sites.data(), variance.data());
        mean_var = mean_within_variance(table, variance.data());
        if(!(mean_var > 0.0))
            break;

        const double scale = 1.0 / std::sqrt(mean_var);
        for(uint32_t j = 0; j < n_species; j++)
            species_scores[j] *= scale;

        site_averages(table, species_scores, sites.data());
        within_site_variance(table, species_scores, sites.data(), variance.data());
        mean_var = mean_within_variance(table, variance.data());
        lo = *std::min_element(sites.begin(), sites.end());
        hi = *std::max_element(sites.begin(), sites.end());
        if(!(hi > lo) || !(mean_var > 0.0))
            break;
    }

    // origin at the lowest site
    site_averages(table, species_scores, sites.data());
    lo = *std::min_element(sites.begin(), sites.end());
    for(uint32_t j = 0; j < n_species; j++)
        species_scores[j] -= lo;
    for(uint32_t i = 0; i < n_sites; i++)
        site_scores[i] = sites[i] - lo;

    return true;
}
