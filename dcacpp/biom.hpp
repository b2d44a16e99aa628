/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _DCA_BIOM_H
#define _DCA_BIOM_H

#include <H5Cpp.h>
#include <H5Dpublic.h>
#include <vector>
#include <unordered_map>

#include "biom_interface.hpp"

namespace dca {
    class biom : public biom_interface {
        public:
            /* default constructor
             *
             * @param filename The path to the BIOM table to read
             *
             * Throws H5::Exception if the file is not a BIOM 2.x table, and
             * std::runtime_error if the sparse structure is inconsistent.
             */
            biom(const std::string &filename);

            virtual ~biom();

            /* test whether a file carries the HDF5 signature */
            static bool is_hdf5(const std::string &filename);

            void get_obs_data(uint32_t idx, double* out) const;
            void get_obs_data(const std::string &id, double* out) const;

            /* the index pointer of the observation (CSR) representation */
            std::vector<uint32_t> obs_indptr;

        private:
            H5::H5File file;

            /* observation-major sparse data, resident after construction */
            std::vector<uint32_t> obs_indices;
            std::vector<double> obs_data;

            /* At construction, lookups mapping IDs -> index position within an
             * axis are defined
             */
            std::unordered_map<std::string, uint32_t> obs_id_index;

            /* load ids from an axis
             *
             * @param path The dataset path to the ID dataset to load
             * @param ids The variable representing the IDs to load into
             */
            void load_ids(const char *path, std::vector<std::string> &ids);

            /* load a one dimensional unsigned dataset
             *
             * @param path The dataset path to load
             * @param out The vector to load the data into
             */
            void load_uint32(const char *path, std::vector<uint32_t> &out);

            /* load the observation values */
            void load_obs_data();

            /* create an index mapping an ID to its corresponding index
             * position.
             *
             * @param ids A vector of IDs to index
             * @param map A hash table to populate
             */
            void create_id_index(const std::vector<std::string> &ids,
                                 std::unordered_map<std::string, uint32_t> &map);
    };
}

#endif /* _DCA_BIOM_H */
