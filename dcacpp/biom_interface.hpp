/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _DCA_BIOM_INTERFACE_H
#define _DCA_BIOM_INTERFACE_H

#include <stdint.h>
#include <vector>
#include <string>

namespace dca {
    /* a community table, samples (sites) x observations (species)
     *
     * Readers for the concrete on-disk formats derive from this class and
     * fill the ID caches and shape in their constructors.
     */
    class biom_interface {
        public:
            // cache the IDs contained within the table
            std::vector<std::string> sample_ids;
            std::vector<std::string> obs_ids;

            uint32_t n_samples;  // the number of samples
            uint32_t n_obs;      // the number of observations
            uint32_t nnz;        // the total number of nonzero entries

            biom_interface() : n_samples(0), n_obs(0), nnz(0) {}

            virtual ~biom_interface() {}

            /* get a dense vector of observation data
             *
             * @param idx The observation index, [0, n_obs)
             * @param out An allocated array of at least size n_samples.
             *      Values of an index position [0, n_samples) which do not
             *      have data will be zero'd.
             */
            virtual void get_obs_data(uint32_t idx, double* out) const = 0;

            /* get a dense vector of observation data
             *
             * @param id The observation ID to fetch
             * @param out An allocated array of at least size n_samples.
             */
            virtual void get_obs_data(const std::string &id, double* out) const = 0;
    };
}

#endif /* _DCA_BIOM_INTERFACE_H */
