/*
 * Weighted averaging and moment functions behind reciprocal averaging
 */

#ifndef __DCA_RA_INTERNAL
#define __DCA_RA_INTERNAL 1

#include <stdint.h>
#include "abundance.hpp"

namespace dca {

// Site scores as abundance-weighted averages of species scores
// x_i = sum_j a_ij y_j / r_i
// species_scores - in, n_species
// site_scores    - out, pre-allocated, n_sites
void site_averages(const abundance &table, const double * species_scores, double * site_scores);

// Species scores as abundance-weighted averages of site scores
// y_j = sum_i a_ij x_i / c_j
// site_scores    - in, n_sites
// species_scores - out, pre-allocated, n_species
void species_averages(const abundance &table, const double * site_scores, double * species_scores);

// Weighted mean of n values, total must be the sum of the weights
double weighted_mean(const double * values, const double * weights, const uint32_t n, const double total);

// Subtract the weighted mean in-place
void weighted_center(double * values, const double * weights, const uint32_t n, const double total);

// Weighted mean square about zero, the variance of centered values
double weighted_variance(const double * values, const double * weights, const uint32_t n, const double total);

// Weighted mean cross product about zero, the covariance of centered values
double weighted_covariance(const double * a, const double * b, const double * weights, const uint32_t n, const double total);

// Weighted root mean square of (a - b), or of (a + b) if flip is set
double weighted_rms_difference(const double * a, const double * b, const double * weights, const uint32_t n,
                               const double total, const bool flip);

// Weighted Gram-Schmidt of values against n_basis vectors
// basis - n_basis consecutive vectors of n values, mutually orthogonal
void weighted_orthogonalize(double * values, const double * basis, const uint32_t n_basis,
                            const double * weights, const uint32_t n);

// Hill's downweighting of rare species, in-place, totals refreshed
// Species whose N2 diversity falls below a fifth of the largest N2 are
// scaled down in proportion.
void downweight_species(abundance &table);

// Within-site variance of species scores about the site scores
// out_variance - out, pre-allocated, n_sites
void within_site_variance(const abundance &table, const double * species_scores, const double * site_scores,
                          double * out_variance);

// Mean within-site variance weighted by site totals
double mean_within_variance(const abundance &table, const double * within_variance);

// Gradient length: range of site averages in within-site SD units
// Returns 0 if there is no within-site variance.
double gradient_length(const abundance &table, const double * species_scores);

// Total inertia, the chi-square statistic divided by the grand total
double total_inertia(const abundance &table);

}

#endif
