/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _DCA_CEPNAMES_H
#define _DCA_CEPNAMES_H

#include <vector>
#include <string>

namespace dca {
    /* abbreviate Latin names to eight character CEP names
     *
     * @param names The names to abbreviate, tokens separated by whitespace
     * @param second_item Use the second token instead of the last one
     *
     * The abbreviation is four letters of the first token followed by four
     * letters of the last (or second) token, without a trailing '.'. A name
     * of a single token keeps its first eight letters. A duplicate keeps its
     * first seven characters and gets a counter appended, the counter is
     * shared by all duplicates. Blank names stay blank.
     */
    std::vector<std::string> make_cepnames(const std::vector<std::string> &names, bool second_item = false);
}

#endif /* _DCA_CEPNAMES_H */
