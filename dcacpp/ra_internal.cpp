/*
 * Weighted averaging and moment functions behind reciprocal averaging
 */

#include "ra_internal.hpp"
#include <cmath>
#include <vector>
#include <algorithm>

#include <cblas.h>

using namespace dca;

void dca::site_averages(const abundance &table, const double * species_scores, double * site_scores) {
  const uint32_t n_sites = table.n_sites;

  // x = A y
  cblas_dgemv(CblasColMajor, CblasNoTrans, n_sites, table.n_species, 1.0,
              table.data.data(), n_sites, species_scores, 1, 0.0, site_scores, 1);

  const double * row_totals = table.row_totals.data();
#pragma omp parallel for
  for (uint32_t i=0; i<n_sites; i++) {
    site_scores[i] /= row_totals[i];
  }
}

void dca::species_averages(const abundance &table, const double * site_scores, double * species_scores) {
  const uint32_t n_species = table.n_species;

  // y = A' x
  cblas_dgemv(CblasColMajor, CblasTrans, table.n_sites, n_species, 1.0,
              table.data.data(), table.n_sites, site_scores, 1, 0.0, species_scores, 1);

  const double * col_totals = table.col_totals.data();
#pragma omp parallel for
  for (uint32_t j=0; j<n_species; j++) {
    species_scores[j] /= col_totals[j];
  }
}

double dca::weighted_mean(const double * values, const double * weights, const uint32_t n, const double total) {
  double sum = 0.0;
#pragma omp parallel for reduction(+: sum)
  for (uint32_t i=0; i<n; i++) {
    sum += weights[i]*values[i];
  }
  return sum/total;
}

void dca::weighted_center(double * values, const double * weights, const uint32_t n, const double total) {
  const double mean = weighted_mean(values, weights, n, total);
  for (uint32_t i=0; i<n; i++) {
    values[i] -= mean;
  }
}

double dca::weighted_variance(const double * values, const double * weights, const uint32_t n, const double total) {
  double sum = 0.0;
#pragma omp parallel for reduction(+: sum)
  for (uint32_t i=0; i<n; i++) {
    sum += weights[i]*values[i]*values[i];
  }
  return sum/total;
}

double dca::weighted_covariance(const double * a, const double * b, const double * weights, const uint32_t n, const double total) {
  double sum = 0.0;
#pragma omp parallel for reduction(+: sum)
  for (uint32_t i=0; i<n; i++) {
    sum += weights[i]*a[i]*b[i];
  }
  return sum/total;
}

double dca::weighted_rms_difference(const double * a, const double * b, const double * weights, const uint32_t n,
                                    const double total, const bool flip) {
  const double sign = flip ? -1.0 : 1.0;
  double sum = 0.0;
#pragma omp parallel for reduction(+: sum)
  for (uint32_t i=0; i<n; i++) {
    const double d = a[i] - sign*b[i];
    sum += weights[i]*d*d;
  }
  return std::sqrt(sum/total);
}

void dca::weighted_orthogonalize(double * values, const double * basis, const uint32_t n_basis,
                                 const double * weights, const uint32_t n) {
  for (uint32_t k=0; k<n_basis; k++) {
    const double * axis = basis + uint64_t(n)*k;

    double cross = 0.0;
    double norm = 0.0;
#pragma omp parallel for reduction(+: cross, norm)
    for (uint32_t i=0; i<n; i++) {
      cross += weights[i]*values[i]*axis[i];
      norm  += weights[i]*axis[i]*axis[i];
    }

    if (norm<=0.0) continue;

    const double coef = cross/norm;
    // values -= coef * axis
    cblas_daxpy(n, -coef, axis, 1, values, 1);
  }
}

void dca::downweight_species(abundance &table) {
  const uint32_t n_sites = table.n_sites;
  const uint32_t n_species = table.n_species;

  std::vector<double> n2(n_species);
  double n2_max = 0.0;

  for (uint32_t j=0; j<n_species; j++) {
    const double * column = table.species_column(j);
    double sum = 0.0;
    double sum_sq = 0.0;
    for (uint32_t i=0; i<n_sites; i++) {
      sum    += column[i];
      sum_sq += column[i]*column[i];
    }
    n2[j] = (sum*sum)/(sum_sq + 1e-10);
    n2_max = std::max(n2_max, n2[j]);
  }

  const double threshold = n2_max/5.0;
  if (threshold<=0.0) return;

  for (uint32_t j=0; j<n_species; j++) {
    if (n2[j]<threshold) {
      double * column = table.data.data() + uint64_t(j)*n_sites;
      cblas_dscal(n_sites, n2[j]/threshold, column, 1);
    }
  }

  table.update_totals();
}

void dca::within_site_variance(const abundance &table, const double * species_scores, const double * site_scores,
                               double * out_variance) {
  const uint32_t n_sites = table.n_sites;
  const uint32_t n_species = table.n_species;

  for (uint32_t i=0; i<n_sites; i++) out_variance[i] = 0.0;

  // walk the columns in storage order
  for (uint32_t j=0; j<n_species; j++) {
    const double * column = table.species_column(j);
    const double y = species_scores[j];
    for (uint32_t i=0; i<n_sites; i++) {
      const double d = y - site_scores[i];
      out_variance[i] += column[i]*d*d;
    }
  }

  const double * row_totals = table.row_totals.data();
  for (uint32_t i=0; i<n_sites; i++) {
    out_variance[i] /= row_totals[i];
  }
}

double dca::mean_within_variance(const abundance &table, const double * within_variance) {
  return weighted_mean(within_variance, table.row_totals.data(), table.n_sites, table.total);
}

double dca::gradient_length(const abundance &table, const double * species_scores) {
  const uint32_t n_sites = table.n_sites;

  std::vector<double> sites(n_sites);
  std::vector<double> variance(n_sites);
  site_averages(table, species_scores, sites.data());
  within_site_variance(table, species_scores, sites.data(), variance.data());

  const double mean_var = mean_within_variance(table, variance.data());
  if (!(mean_var>0.0)) return 0.0;

  const double lo = *std::min_element(sites.begin(), sites.end());
  const double hi = *std::max_element(sites.begin(), sites.end());
  return (hi-lo)/std::sqrt(mean_var);
}

double dca::total_inertia(const abundance &table) {
  const uint32_t n_sites = table.n_sites;
  const uint32_t n_species = table.n_species;
  const double total = table.total;
  const double * row_totals = table.row_totals.data();
  const double * col_totals = table.col_totals.data();

  double chi2 = 0.0;
#pragma omp parallel for reduction(+: chi2)
  for (uint32_t j=0; j<n_species; j++) {
    const double * column = table.species_column(j);
    double col_sum = 0.0;
    for (uint32_t i=0; i<n_sites; i++) {
      const double expected = row_totals[i]*col_totals[j]/total;
      const double d = column[i] - expected;
      col_sum += d*d/expected;
    }
    chi2 += col_sum;
  }

  return chi2/total;
}
