/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _DCA_TEXT_TABLE_H
#define _DCA_TEXT_TABLE_H

#include <istream>
#include <vector>
#include <unordered_map>

#include "biom_interface.hpp"

namespace dca {
    /* a delimited text table with sites as rows and species as columns
     *
     * The first line holds the species names, preceded by a (possibly empty)
     * corner cell. Every following line holds a site name and one value per
     * species. The delimiter is a comma unless the header contains a tab.
     * Fields may be enclosed in double quotes; empty cells read as zero.
     */
    class text_table : public biom_interface {
        public:
            /* read a table from a file
             *
             * @param filename The path to the table to read
             */
            text_table(const std::string &filename);

            /* read a table from a stream */
            text_table(std::istream &input);

            virtual ~text_table() {}

            void get_obs_data(uint32_t idx, double* out) const;
            void get_obs_data(const std::string &id, double* out) const;

            /* false if the table could not be opened or parsed */
            bool good() const { return error.empty(); }

            /* description of the first problem encountered, empty if good() */
            std::string error;

        private:
            // species-major dense values, n_obs x n_samples
            std::vector<double> values;
            std::unordered_map<std::string, uint32_t> obs_id_index;

            void parse(std::istream &input);
    };

    /* split a delimited line, honoring double quotes */
    std::vector<std::string> split_fields(const std::string &line, char delim);
}

#endif /* _DCA_TEXT_TABLE_H */
