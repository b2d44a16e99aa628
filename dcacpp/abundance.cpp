/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <sstream>
#include <stdexcept>
#include "abundance.hpp"

using namespace dca;

abundance::abundance(const biom_interface &table) : site_ids(table.sample_ids),
                                                    species_ids(table.obs_ids),
                                                    n_sites(table.n_samples),
                                                    n_species(table.n_obs),
                                                    total(0.0) {
    data.assign(uint64_t(n_sites) * n_species, 0.0);
    for(uint32_t j = 0; j < n_species; j++)
        table.get_obs_data(j, data.data() + uint64_t(j) * n_sites);

    update_totals();
}

abundance::abundance(const double *values, uint32_t n_sites_, uint32_t n_species_,
                     const std::vector<std::string> &site_ids_,
                     const std::vector<std::string> &species_ids_) : site_ids(site_ids_),
                                                                     species_ids(species_ids_),
                                                                     n_sites(n_sites_),
                                                                     n_species(n_species_),
                                                                     total(0.0) {
    if(site_ids.empty())
        number_ids(site_ids, n_sites);
    if(species_ids.empty())
        number_ids(species_ids, n_species);
    if(site_ids.size() != n_sites || species_ids.size() != n_species)
        throw std::invalid_argument("the number of labels does not match the matrix shape");

    data.assign(uint64_t(n_sites) * n_species, 0.0);
    for(uint32_t i = 0; i < n_sites; i++) {
        const double *row = values + uint64_t(i) * n_species;
        for(uint32_t j = 0; j < n_species; j++)
            data[uint64_t(j) * n_sites + i] = row[j];
    }

    update_totals();
}

void abundance::number_ids(std::vector<std::string> &ids, uint32_t n) {
    ids.clear();
    ids.reserve(n);
    for(uint32_t i = 0; i < n; i++) {
        std::ostringstream label;
        label << (i + 1);
        ids.push_back(label.str());
    }
}

void abundance::update_totals() {
    row_totals.assign(n_sites, 0.0);
    col_totals.assign(n_species, 0.0);

#pragma omp parallel for
    for(uint32_t j = 0; j < n_species; j++) {
        const double *column = species_column(j);
        double sum = 0.0;
        for(uint32_t i = 0; i < n_sites; i++)
            sum += column[i];
        col_totals[j] = sum;
    }

    // rows span columns, keep this one sequential
    for(uint32_t j = 0; j < n_species; j++) {
        const double *column = species_column(j);
        for(uint32_t i = 0; i < n_sites; i++)
            row_totals[i] += column[i];
    }

    total = 0.0;
    for(uint32_t j = 0; j < n_species; j++)
        total += col_totals[j];
}

uint32_t abundance::drop_empty() {
    std::vector<uint32_t> keep_sites;
    std::vector<uint32_t> keep_species;

    // test for any nonzero entry rather than the totals, which could cancel
    for(uint32_t i = 0; i < n_sites; i++) {
        for(uint32_t j = 0; j < n_species; j++) {
            if(at(i, j) != 0.0) {
                keep_sites.push_back(i);
                break;
            }
        }
    }
    for(uint32_t j = 0; j < n_species; j++) {
        const double *column = species_column(j);
        for(uint32_t i = 0; i < n_sites; i++) {
            if(column[i] != 0.0) {
                keep_species.push_back(j);
                break;
            }
        }
    }

    uint32_t removed = (n_sites - keep_sites.size()) + (n_species - keep_species.size());
    if(removed == 0)
        return 0;

    std::vector<double> kept(uint64_t(keep_sites.size()) * keep_species.size());
    std::vector<std::string> kept_site_ids;
    std::vector<std::string> kept_species_ids;

    for(uint32_t jj = 0; jj < keep_species.size(); jj++) {
        const double *column = species_column(keep_species[jj]);
        for(uint32_t ii = 0; ii < keep_sites.size(); ii++)
            kept[uint64_t(jj) * keep_sites.size() + ii] = column[keep_sites[ii]];
        kept_species_ids.push_back(species_ids[keep_species[jj]]);
    }
    for(uint32_t ii = 0; ii < keep_sites.size(); ii++)
        kept_site_ids.push_back(site_ids[keep_sites[ii]]);

    data.swap(kept);
    site_ids.swap(kept_site_ids);
    species_ids.swap(kept_species_ids);
    n_sites = keep_sites.size();
    n_species = keep_species.size();

    update_totals();
    return removed;
}
