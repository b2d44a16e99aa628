/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _DCA_SEGMENTS_H
#define _DCA_SEGMENTS_H

#include <stdint.h>
#include <vector>

#include "abundance.hpp"

namespace dca {
    /* assign scores to equal-width segments over [min, max]
     *
     * @param scores The scores to cut, n values
     * @param n The number of scores
     * @param n_segments The number of segments, > 0
     * @param segment Output, pre-allocated n values in [0, n_segments)
     *
     * A score exactly on an interior boundary belongs to the upper segment,
     * the maximum belongs to the last segment. If all scores are equal, every
     * score is placed in segment 0.
     */
    void cut_segments(const double *scores, uint32_t n, uint32_t n_segments, uint32_t *segment);

    /* subtract local trends in-place
     *
     * The trend of a segment is the weighted mean of the values in that
     * segment and its two neighbours. Segments without weight have no trend.
     */
    void detrend(double *values, const uint32_t *segment, const double *weights,
                 uint32_t n, uint32_t n_segments);

    /* the adjoint of detrend under the inner product weighted by weights */
    void detrend_adjoint(double *values, const uint32_t *segment, const double *weights,
                         uint32_t n, uint32_t n_segments);

    /* replace unoccupied segments by the mean of the nearest occupied segment
     * on either side
     *
     * At least one segment must be occupied.
     */
    void fill_empty_segments(std::vector<double> &values, const std::vector<bool> &occupied);

    /* running 1-2-1 smoother, end values replicated */
    void smooth_segments(std::vector<double> &values, unsigned int passes);

    /* rescale an axis so species turnover is even along it
     *
     * @param table The abundance table the axis was derived from
     * @param species_scores In/out, n_species scores of the axis
     * @param site_scores Output, pre-allocated n_sites, weighted averages of
     *      the rescaled species scores
     * @param n_segments The number of segments to pool within-site variance in
     * @param cycles The number of rescaling cycles
     * @param shortest Axes shorter than this are left unrescaled
     * @param initial_length Output, the axis length before rescaling
     *
     * Returns true if the axis was rescaled. Rescaled scores are in SD units
     * with the lowest site score at 0; an unrescaled axis is left untouched
     * and site_scores is not written.
     */
    bool rescale_axis(const abundance &table, double *species_scores, double *site_scores,
                      uint32_t n_segments, uint32_t cycles, double shortest, double &initial_length);
}

#endif /* _DCA_SEGMENTS_H */
