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
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <limits>
#include "biplot.hpp"

using namespace dca;

static const double MARGIN_LEFT = 70.0;
static const double MARGIN_RIGHT = 20.0;
static const double MARGIN_TOP = 20.0;
static const double MARGIN_BOTTOM = 50.0;
static const unsigned int N_TICKS = 5;

std::string dca::svg_color(const std::string &code) {
    if(code.size() != 1)
        return code;

    switch(code[0]) {
        case 'r': return "red";
        case 'g': return "green";
        case 'b': return "blue";
        case 'c': return "cyan";
        case 'm': return "magenta";
        case 'y': return "gold";
        case 'k': return "black";
        case 'w': return "white";
        default:  return code;
    }
}

static std::string tick_label(double value) {
    std::ostringstream label;
    label << std::setprecision(3) << value;
    return label.str();
}

static std::string escape_xml(const std::string &text) {
    std::string out;
    for(size_t i = 0; i < text.size(); i++) {
        switch(text[i]) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            default:   out += text[i];
        }
    }
    return out;
}

void dca::biplot_limits(const ordination &ord, const biplot_options &opts, int axis, double limits[2]) {
    double lo = std::numeric_limits<double>::max();
    double hi = -std::numeric_limits<double>::max();
    const uint32_t k = axis - 1;

    if(opts.show_sites) {
        for(uint32_t i = 0; i < ord.n_sites; i++) {
            lo = std::min(lo, ord.site_score(i, k));
            hi = std::max(hi, ord.site_score(i, k));
        }
    }
    if(opts.show_species) {
        for(uint32_t j = 0; j < ord.n_species; j++) {
            lo = std::min(lo, ord.species_score(j, k));
            hi = std::max(hi, ord.species_score(j, k));
        }
    }
    if(lo > hi) {
        // nothing shown
        lo = -1.0;
        hi = 1.0;
    }

    limits[0] = lo - 0.15 * std::fabs(lo);
    limits[1] = hi + 0.15 * std::fabs(hi);
    if(!(limits[1] > limits[0])) {
        limits[0] -= 1.0;
        limits[1] += 1.0;
    }
}

/* maps scores onto the plotting area */
class plot_frame {
    public:
        plot_frame(const double *_xlim, const double *_ylim, unsigned int width, unsigned int height)
            : left(MARGIN_LEFT), right(width - MARGIN_RIGHT),
              top(MARGIN_TOP), bottom(height - MARGIN_BOTTOM) {
            xlim[0] = _xlim[0]; xlim[1] = _xlim[1];
            ylim[0] = _ylim[0]; ylim[1] = _ylim[1];
        }

        double px(double x) const { return left + (x - xlim[0]) / (xlim[1] - xlim[0]) * (right - left); }
        double py(double y) const { return bottom - (y - ylim[0]) / (ylim[1] - ylim[0]) * (bottom - top); }

        const double left, right, top, bottom;
        double xlim[2];
        double ylim[2];
};

static void draw_axes(std::ostream &out, const plot_frame &frame, const std::string &xtitle,
                      const std::string &ytitle) {
    out << "<rect x=\"" << frame.left << "\" y=\"" << frame.top
        << "\" width=\"" << frame.right - frame.left << "\" height=\"" << frame.bottom - frame.top
        << "\" fill=\"none\" stroke=\"black\"/>\n";

    for(unsigned int t = 0; t <= N_TICKS; t++) {
        double x = frame.xlim[0] + t * (frame.xlim[1] - frame.xlim[0]) / N_TICKS;
        double y = frame.ylim[0] + t * (frame.ylim[1] - frame.ylim[0]) / N_TICKS;

        out << "<line x1=\"" << frame.px(x) << "\" y1=\"" << frame.bottom << "\" x2=\"" << frame.px(x)
            << "\" y2=\"" << frame.bottom + 5 << "\" stroke=\"black\"/>\n";
        out << "<text x=\"" << frame.px(x) << "\" y=\"" << frame.bottom + 18
            << "\" font-size=\"10\" text-anchor=\"middle\">" << tick_label(x) << "</text>\n";

        out << "<line x1=\"" << frame.left - 5 << "\" y1=\"" << frame.py(y) << "\" x2=\"" << frame.left
            << "\" y2=\"" << frame.py(y) << "\" stroke=\"black\"/>\n";
        out << "<text x=\"" << frame.left - 8 << "\" y=\"" << frame.py(y) + 3
            << "\" font-size=\"10\" text-anchor=\"end\">" << tick_label(y) << "</text>\n";
    }

    // origin lines
    if(frame.xlim[0] < 0.0 && frame.xlim[1] > 0.0)
        out << "<line x1=\"" << frame.px(0.0) << "\" y1=\"" << frame.top << "\" x2=\"" << frame.px(0.0)
            << "\" y2=\"" << frame.bottom << "\" stroke=\"grey\" stroke-dasharray=\"4,4\"/>\n";
    if(frame.ylim[0] < 0.0 && frame.ylim[1] > 0.0)
        out << "<line x1=\"" << frame.left << "\" y1=\"" << frame.py(0.0) << "\" x2=\"" << frame.right
            << "\" y2=\"" << frame.py(0.0) << "\" stroke=\"grey\" stroke-dasharray=\"4,4\"/>\n";

    out << "<text x=\"" << (frame.left + frame.right) / 2 << "\" y=\"" << frame.bottom + 40
        << "\" font-size=\"12\" text-anchor=\"middle\">" << xtitle << "</text>\n";
    out << "<text x=\"18\" y=\"" << (frame.top + frame.bottom) / 2
        << "\" font-size=\"12\" text-anchor=\"middle\" transform=\"rotate(-90 18 "
        << (frame.top + frame.bottom) / 2 << ")\">" << ytitle << "</text>\n";
}

static void draw_marker(std::ostream &out, double x, double y, double size, bool triangle,
                        const std::string &color) {
    if(triangle) {
        out << "<polygon points=\""
            << x << "," << y - size << " "
            << x - size << "," << y + size << " "
            << x + size << "," << y + size
            << "\" fill=\"" << color << "\"/>\n";
    } else {
        out << "<circle cx=\"" << x << "\" cy=\"" << y << "\" r=\"" << size
            << "\" fill=\"" << color << "\"/>\n";
    }
}

static void draw_label(std::ostream &out, double x, double y, double size, const std::string &color,
                       const std::string &label) {
    out << "<text x=\"" << x << "\" y=\"" << y << "\" font-size=\"" << size
        << "\" fill=\"" << color << "\" text-anchor=\"middle\">" << escape_xml(label) << "</text>\n";
}

PlotStatus dca::write_biplot_svg(const std::string &filename, const ordination &ord,
                                 const std::vector<std::string> &site_labels,
                                 const std::vector<std::string> &species_labels,
                                 const biplot_options &opts) {
    if(opts.xax < 1 || opts.yax < 1 || uint32_t(opts.xax) > ord.n_axes || uint32_t(opts.yax) > ord.n_axes)
        return invalid_axes;
    if(opts.has_xlim && !(opts.xlim[1] > opts.xlim[0]))
        return invalid_limits;
    if(opts.has_ylim && !(opts.ylim[1] > opts.ylim[0]))
        return invalid_limits;

    double xlim[2], ylim[2];
    if(opts.has_xlim) {
        xlim[0] = opts.xlim[0];
        xlim[1] = opts.xlim[1];
    } else {
        biplot_limits(ord, opts, opts.xax, xlim);
    }
    if(opts.has_ylim) {
        ylim[0] = opts.ylim[0];
        ylim[1] = opts.ylim[1];
    } else {
        biplot_limits(ord, opts, opts.yax, ylim);
    }

    std::ofstream out(filename.c_str());
    if(!out.good())
        return plot_write_error;

    const plot_frame frame(xlim, ylim, opts.width, opts.height);
    const std::string prefix = ord.analysis == detrended ? "DCA Axis " : "CA Axis ";
    const std::string site_color = svg_color(opts.site_color);
    const std::string species_color = svg_color(opts.species_color);
    const uint32_t kx = opts.xax - 1;
    const uint32_t ky = opts.yax - 1;

    out << std::fixed << std::setprecision(2);
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << opts.width
        << "\" height=\"" << opts.height << "\" viewBox=\"0 0 " << opts.width << " " << opts.height << "\">\n";
    out << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    out << "<defs><clipPath id=\"frame\"><rect x=\"" << frame.left << "\" y=\"" << frame.top
        << "\" width=\"" << frame.right - frame.left << "\" height=\"" << frame.bottom - frame.top
        << "\"/></clipPath></defs>\n";

    std::ostringstream xtitle, ytitle;
    xtitle << prefix << opts.xax;
    ytitle << prefix << opts.yax;
    draw_axes(out, frame, xtitle.str(), ytitle.str());

    out << "<g clip-path=\"url(#frame)\">\n";
    if(opts.show_sites) {
        out << "<g class=\"sites\">\n";
        for(uint32_t i = 0; i < ord.n_sites; i++) {
            double x = frame.px(ord.site_score(i, kx));
            double y = frame.py(ord.site_score(i, ky));
            draw_marker(out, x, y, opts.marker_size, false, site_color);
            if(i < site_labels.size())
                draw_label(out, x, y - opts.marker_size - 1, opts.site_label_size, site_color, site_labels[i]);
        }
        out << "</g>\n";
    }
    if(opts.show_species) {
        out << "<g class=\"species\">\n";
        for(uint32_t j = 0; j < ord.n_species; j++) {
            double x = frame.px(ord.species_score(j, kx));
            double y = frame.py(ord.species_score(j, ky));
            draw_marker(out, x, y, opts.marker_size, true, species_color);
            if(j < species_labels.size())
                draw_label(out, x, y - opts.marker_size - 1, opts.species_label_size, species_color,
                           species_labels[j]);
        }
        out << "</g>\n";
    }
    out << "</g>\n";

    // legend
    double lx = frame.right - 110;
    double ly = frame.top + 15;
    if(opts.show_sites) {
        draw_marker(out, lx, ly, 4, false, site_color);
        out << "<text x=\"" << lx + 10 << "\" y=\"" << ly + 4 << "\" font-size=\"11\">Site Scores</text>\n";
        ly += 16;
    }
    if(opts.show_species) {
        draw_marker(out, lx, ly, 4, true, species_color);
        out << "<text x=\"" << lx + 10 << "\" y=\"" << ly + 4 << "\" font-size=\"11\">Species Scores</text>\n";
    }

    out << "</svg>\n";
    out.close();

    return out.fail() ? plot_write_error : plot_okay;
}
