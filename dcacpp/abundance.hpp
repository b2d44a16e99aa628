/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _DCA_ABUNDANCE_H
#define _DCA_ABUNDANCE_H

#include <stdint.h>
#include <vector>
#include <string>

#include "biom_interface.hpp"

namespace dca {
    /* a dense sites x species abundance matrix
     *
     * Values are stored column-major, one contiguous column of n_sites values
     * per species, which is the layout the BLAS kernels consume directly.
     * Row totals, column totals and the grand total are cached and must be
     * refreshed through update_totals() after the values change.
     */
    class abundance {
        public:
            std::vector<std::string> site_ids;
            std::vector<std::string> species_ids;

            uint32_t n_sites;
            uint32_t n_species;

            std::vector<double> data;        // n_sites x n_species, column-major
            std::vector<double> row_totals;  // n_sites
            std::vector<double> col_totals;  // n_species
            double total;

            /* gather a table read from disk, samples become sites */
            abundance(const biom_interface &table);

            /* copy a row-major in-memory matrix
             *
             * @param values n_sites * n_species values, row-major
             * @param site_ids Site labels; if empty, sites are numbered from 1
             * @param species_ids Species labels; if empty, numbered from 1
             */
            abundance(const double *values, uint32_t n_sites, uint32_t n_species,
                      const std::vector<std::string> &site_ids = std::vector<std::string>(),
                      const std::vector<std::string> &species_ids = std::vector<std::string>());

            inline double at(uint32_t site, uint32_t species) const {
                return data[uint64_t(species) * n_sites + site];
            }

            inline const double* species_column(uint32_t species) const {
                return data.data() + uint64_t(species) * n_sites;
            }

            /* recompute the cached totals from data */
            void update_totals();

            /* remove sites and species without any abundance
             *
             * Returns the number of sites and species removed. Removing empty
             * species cannot empty a site and vice versa, so a single pass
             * suffices.
             */
            uint32_t drop_empty();

        private:
            void number_ids(std::vector<std::string> &ids, uint32_t n);
    };
}

#endif /* _DCA_ABUNDANCE_H */
