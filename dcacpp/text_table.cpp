/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include "text_table.hpp"

using namespace dca;

static std::string strip(const std::string &s) {
    size_t start = s.find_first_not_of(" \r\n");
    if(start == std::string::npos)
        return std::string();
    size_t stop = s.find_last_not_of(" \r\n");
    return s.substr(start, stop - start + 1);
}

std::vector<std::string> dca::split_fields(const std::string &line, char delim) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for(size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if(quoted) {
            if(c == '"') {
                // a doubled quote is a literal quote
                if(i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    i++;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if(c == '"') {
            quoted = true;
        } else if(c == delim) {
            fields.push_back(strip(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(strip(current));
    return fields;
}

text_table::text_table(const std::string &filename) {
    std::ifstream input(filename.c_str());
    if(!input.good()) {
        error = "cannot open " + filename;
        return;
    }
    parse(input);
}

text_table::text_table(std::istream &input) {
    parse(input);
}

void text_table::parse(std::istream &input) {
    std::string line;

    // skip leading blank lines
    do {
        if(!std::getline(input, line)) {
            error = "the table has no header";
            return;
        }
    } while(strip(line).empty());

    char delim = line.find('\t') != std::string::npos ? '\t' : ',';
    std::vector<std::string> header = split_fields(line, delim);
    if(header.size() < 2) {
        error = "the header names no species";
        return;
    }
    obs_ids.assign(header.begin() + 1, header.end());
    n_obs = obs_ids.size();

    // read row-major, transpose once the number of sites is known
    std::vector<double> rows;
    unsigned int line_no = 1;
    while(std::getline(input, line)) {
        line_no++;
        if(strip(line).empty())
            continue;

        std::vector<std::string> fields = split_fields(line, delim);
        if(fields.size() != n_obs + 1) {
            std::ostringstream msg;
            msg << "line " << line_no << " has " << fields.size() - 1
                << " values, expected " << n_obs;
            error = msg.str();
            return;
        }

        sample_ids.push_back(fields[0]);
        for(uint32_t j = 0; j < n_obs; j++) {
            const std::string &field = fields[j + 1];
            double v = 0.0;
            if(!field.empty()) {
                char *end = NULL;
                errno = 0;
                v = strtod(field.c_str(), &end);
                if(errno != 0 || end == field.c_str() || *end != '\0' || !std::isfinite(v)) {
                    std::ostringstream msg;
                    msg << "line " << line_no << ": '" << field << "' is not a number";
                    error = msg.str();
                    return;
                }
            }
            rows.push_back(v);
        }
    }
    n_samples = sample_ids.size();

    values.assign(uint64_t(n_obs) * n_samples, 0.0);
    nnz = 0;
    for(uint32_t i = 0; i < n_samples; i++) {
        for(uint32_t j = 0; j < n_obs; j++) {
            double v = rows[uint64_t(i) * n_obs + j];
            values[uint64_t(j) * n_samples + i] = v;
            if(v != 0.0)
                nnz++;
        }
    }

    uint32_t count = 0;
    obs_id_index.reserve(n_obs);
    for(auto i = obs_ids.begin(); i != obs_ids.end(); i++, count++) {
        obs_id_index[*i] = count;
    }
}

void text_table::get_obs_data(uint32_t idx, double* out) const {
    const double *column = values.data() + uint64_t(idx) * n_samples;
    for(uint32_t i = 0; i < n_samples; i++)
        out[i] = column[i];
}

void text_table::get_obs_data(const std::string &id, double* out) const {
    get_obs_data(obs_id_index.at(id), out);
}
