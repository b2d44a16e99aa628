/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _DCA_BIPLOT_H
#define _DCA_BIPLOT_H

#include <string>
#include <vector>

#include "decorana.hpp"

namespace dca {
    enum PlotStatus {plot_okay=0, invalid_axes, invalid_limits, plot_write_error};

    /* biplot appearance
     *
     * xax, yax <int> 1-based axes to draw
     * show_species, show_sites <bool> draw the score sets
     * species_color, site_color <string> a single letter color code (r, g,
     *      b, c, m, y, k, w) or any SVG color
     * species_label_size, site_label_size <double> label font sizes
     * marker_size <double> marker radius in pixels
     * xlim, ylim <double[2]> axis limits, used if has_xlim / has_ylim
     */
    struct biplot_options {
        int xax;
        int yax;
        bool show_species;
        bool show_sites;
        std::string species_color;
        std::string site_color;
        double species_label_size;
        double site_label_size;
        double marker_size;
        bool has_xlim;
        bool has_ylim;
        double xlim[2];
        double ylim[2];
        unsigned int width;
        unsigned int height;

        biplot_options() : xax(1), yax(2), show_species(true), show_sites(true),
                           species_color("r"), site_color("k"),
                           species_label_size(6), site_label_size(6), marker_size(4),
                           has_xlim(false), has_ylim(false), width(640), height(480) {
            xlim[0] = xlim[1] = 0.0;
            ylim[0] = ylim[1] = 0.0;
        }
    };

    /* the plotted range of both score sets on one axis
     *
     * Without a limit override, the joint min and max of the shown scores
     * are pushed outwards by 15%.
     */
    void biplot_limits(const ordination &ord, const biplot_options &opts, int axis, double limits[2]);

    /* draw a biplot of site and species scores as SVG
     *
     * @param filename The SVG file to create
     * @param ord The ordination to draw
     * @param site_labels Labels drawn next to sites, none if empty
     * @param species_labels Labels drawn next to species, none if empty
     * @param opts Appearance
     *
     * Returns invalid_axes if xax or yax is not an axis of ord, and
     * invalid_limits if a limit override is not an increasing pair.
     */
    PlotStatus write_biplot_svg(const std::string &filename, const ordination &ord,
                                const std::vector<std::string> &site_labels,
                                const std::vector<std::string> &species_labels,
                                const biplot_options &opts);

    /* translate a single letter color code into an SVG color */
    std::string svg_color(const std::string &code);
}

#endif /* _DCA_BIPLOT_H */
