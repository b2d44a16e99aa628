/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <sstream>
#include <unordered_set>
#include "cepnames.hpp"

static std::vector<std::string> tokenize(const std::string &name) {
    std::istringstream input(name);
    std::vector<std::string> tokens;
    std::string token;
    while(input >> token)
        tokens.push_back(token);
    return tokens;
}

std::vector<std::string> dca::make_cepnames(const std::vector<std::string> &names, bool second_item) {
    std::vector<std::string> cepnames;
    std::unordered_set<std::string> seen;
    unsigned int count = 1;

    cepnames.reserve(names.size());
    for(auto name = names.begin(); name != names.end(); name++) {
        std::vector<std::string> tokens = tokenize(*name);
        std::string cep;

        if(!tokens.empty()) {
            size_t n = second_item ? 2 : tokens.size();
            const std::string &first = tokens[0];
            const std::string &other = n - 1 < tokens.size() ? tokens[n - 1] : first;

            if(first != other) {
                std::string tail = other.substr(0, 4);
                size_t stop = tail.find_last_not_of('.');
                tail = stop == std::string::npos ? std::string() : tail.substr(0, stop + 1);
                cep = first.substr(0, 4) + tail;
            } else {
                cep = first.substr(0, 8);
            }
        }

        if(seen.count(cep)) {
            std::ostringstream numbered;
            numbered << cep.substr(0, 7) << count;
            cep = numbered.str();
            count++;
        }
        seen.insert(cep);
        cepnames.push_back(cep);
    }

    return cepnames;
}
