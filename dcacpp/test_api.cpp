#include <iostream>
#include <fstream>
#include <sstream>
#include <cmath>
#include <algorithm>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <H5Cpp.h>
#include "api.hpp"
#include "biom.hpp"
#include "text_table.hpp"
#include "abundance.hpp"
#include "biplot.hpp"

/*
 * test harness adapted from
 * https://github.com/noporpoise/BitArray/blob/master/dev/bit_array_test.c
 */
const char *suite_name;
char suite_pass;
int suites_run = 0, suites_failed = 0, suites_empty = 0;
int tests_in_suite = 0, tests_run = 0, tests_failed = 0;

#define QUOTE(str) #str
#define ASSERT(x) {tests_run++; tests_in_suite++; if(!(x)) \
    { fprintf(stderr, "failed assert [%s:%i] %s\n", __FILE__, __LINE__, QUOTE(x)); \
      suite_pass = 0; tests_failed++; }}

void SUITE_START(const char *name) {
  suite_pass = 1;
  suite_name = name;
  suites_run++;
  tests_in_suite = 0;
}

void SUITE_END() {
  printf("Testing %s ", suite_name);
  size_t suite_i;
  for(suite_i = strlen(suite_name); suite_i < 80-8-5; suite_i++) printf(".");
  printf("%s\n", suite_pass ? " pass" : " fail");
  if(!suite_pass) suites_failed++;
  if(!tests_in_suite) suites_empty++;
}
/*
 *  End adapted code
 */

const unsigned int GRADIENT_SITES = 10;
const unsigned int GRADIENT_SPECIES = 8;
const double GRADIENT[] = {9, 6, 2, 0, 0, 0, 0, 0,
                           7, 9, 5, 2, 0, 0, 0, 0,
                           4, 8, 9, 5, 1, 0, 0, 0,
                           1, 5, 9, 8, 4, 1, 0, 0,
                           0, 2, 5, 9, 7, 3, 1, 0,
                           0, 0, 2, 6, 9, 6, 2, 0,
                           0, 0, 1, 3, 7, 9, 5, 2,
                           0, 0, 0, 1, 4, 8, 9, 5,
                           0, 0, 0, 0, 1, 5, 9, 8,
                           0, 0, 0, 0, 0, 2, 5, 9};

std::string site_name(unsigned int i) {
    std::ostringstream name;
    name << "site" << (i + 1);
    return name.str();
}

std::string species_name(unsigned int j) {
    std::ostringstream name;
    name << "sp" << (j + 1);
    return name.str();
}

void write_text(const char *filename, const std::string &content) {
    std::ofstream out(filename);
    out << content;
    out.close();
}

std::vector<std::string> read_lines(const char *filename) {
    std::ifstream in(filename);
    std::vector<std::string> lines;
    std::string line;
    while(std::getline(in, line))
        lines.push_back(line);
    return lines;
}

std::string read_all(const char *filename) {
    std::ifstream in(filename);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// the gradient as a comma separated table, sites as rows
void write_gradient_csv(const char *filename) {
    std::ostringstream out;
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
        out << "," << species_name(j);
    out << "\n";
    for(unsigned int i = 0; i < GRADIENT_SITES; i++) {
        out << site_name(i);
        for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
            out << "," << GRADIENT[i * GRADIENT_SPECIES + j];
        out << "\n";
    }
    write_text(filename, out.str());
}

void write_string_ids(H5::H5File &file, const char *path, const std::vector<std::string> &ids) {
    std::vector<const char*> ptrs;
    for(unsigned int i = 0; i < ids.size(); i++)
        ptrs.push_back(ids[i].c_str());

    hsize_t dims[1] = {ids.size()};
    H5::DataSpace space(1, dims);
    H5::StrType vls(H5::PredType::C_S1, H5T_VARIABLE);
    H5::DataSet ds = file.createDataSet(path, vls, space);
    ds.write(ptrs.data(), vls);
}

template<class T>
void write_vector(H5::H5File &file, const char *path, const std::vector<T> &values, const H5::PredType &type) {
    hsize_t dims[1] = {values.size()};
    H5::DataSpace space(1, dims);
    H5::DataSet ds = file.createDataSet(path, type, space);
    ds.write(values.data(), type);
}

// the gradient as a BIOM 2.x table, species as observations
void write_gradient_biom(const char *filename) {
    std::vector<std::string> obs_ids, sample_ids;
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
        obs_ids.push_back(species_name(j));
    for(unsigned int i = 0; i < GRADIENT_SITES; i++)
        sample_ids.push_back(site_name(i));

    std::vector<uint32_t> indptr(1, 0);
    std::vector<uint32_t> indices;
    std::vector<double> data;
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++) {
        for(unsigned int i = 0; i < GRADIENT_SITES; i++) {
            double v = GRADIENT[i * GRADIENT_SPECIES + j];
            if(v != 0.0) {
                indices.push_back(i);
                data.push_back(v);
            }
        }
        indptr.push_back(indices.size());
    }

    H5::H5File file(filename, H5F_ACC_TRUNC);
    file.createGroup("/observation");
    file.createGroup("/observation/matrix");
    file.createGroup("/sample");
    write_string_ids(file, "/observation/ids", obs_ids);
    write_string_ids(file, "/sample/ids", sample_ids);
    write_vector(file, "/observation/matrix/indptr", indptr, H5::PredType::NATIVE_UINT32);
    write_vector(file, "/observation/matrix/indices", indices, H5::PredType::NATIVE_UINT32);
    write_vector(file, "/observation/matrix/data", data, H5::PredType::NATIVE_DOUBLE);
    file.close();
}

void test_split_fields() {
    SUITE_START("test split fields");

    std::vector<std::string> exp = {"a", "b c", "", "d"};
    ASSERT(dca::split_fields("a, b c ,,d", ',') == exp);

    std::vector<std::string> quoted = dca::split_fields("\"x,y\",\"say \"\"hi\"\"\",z", ',');
    ASSERT(quoted.size() == 3);
    ASSERT(quoted[0] == "x,y");
    ASSERT(quoted[1] == "say \"hi\"");
    ASSERT(quoted[2] == "z");

    std::vector<std::string> tabs = dca::split_fields("a,b\tc", '\t');
    ASSERT(tabs.size() == 2);
    ASSERT(tabs[0] == "a,b");

    SUITE_END();
}

void test_text_table_csv() {
    SUITE_START("test text table csv");

    std::istringstream input(",sp a,sp b,\"Carex, sp.\"\n"
                             "s1,1,0,2\n"
                             "\n"
                             "s2,,3,1.5\r\n");
    dca::text_table table(input);
    ASSERT(table.good());
    ASSERT(table.n_samples == 2);
    ASSERT(table.n_obs == 3);
    ASSERT(table.nnz == 4);
    ASSERT(table.sample_ids[0] == "s1");
    ASSERT(table.sample_ids[1] == "s2");
    ASSERT(table.obs_ids[0] == "sp a");
    ASSERT(table.obs_ids[2] == "Carex, sp.");

    double out[2];
    table.get_obs_data(0, out);
    ASSERT(out[0] == 1.0);
    ASSERT(out[1] == 0.0);
    table.get_obs_data("Carex, sp.", out);
    ASSERT(out[0] == 2.0);
    ASSERT(out[1] == 1.5);

    // samples become sites
    dca::abundance data(table);
    ASSERT(data.n_sites == 2);
    ASSERT(data.n_species == 3);
    ASSERT(data.site_ids[1] == "s2");
    ASSERT(data.at(1, 1) == 3.0);
    ASSERT(data.row_totals[1] == 4.5);

    SUITE_END();
}

void test_text_table_tsv() {
    SUITE_START("test text table tsv");

    std::istringstream input("site\tQuercus robur\tSalix, caprea\n"
                             "plot 1\t5\t0\n"
                             "plot 2\t1e1\t2\n");
    dca::text_table table(input);
    ASSERT(table.good());
    ASSERT(table.n_samples == 2);
    ASSERT(table.n_obs == 2);
    ASSERT(table.obs_ids[1] == "Salix, caprea");
    ASSERT(table.sample_ids[0] == "plot 1");

    double out[2];
    table.get_obs_data("Quercus robur", out);
    ASSERT(out[0] == 5.0);
    ASSERT(out[1] == 10.0);

    SUITE_END();
}

void test_text_table_errors() {
    SUITE_START("test text table errors");

    std::istringstream empty("");
    dca::text_table no_header(empty);
    ASSERT(!no_header.good());

    std::istringstream lonely("site\n");
    dca::text_table no_species(lonely);
    ASSERT(!no_species.good());

    std::istringstream ragged(",a,b,c\ns1,1,2\n");
    dca::text_table short_row(ragged);
    ASSERT(!short_row.good());
    ASSERT(short_row.error.find("line 2") != std::string::npos);

    std::istringstream words(",a,b\ns1,1,2\ns2,1,many\n");
    dca::text_table not_number(words);
    ASSERT(!not_number.good());
    ASSERT(not_number.error.find("line 3") != std::string::npos);
    ASSERT(not_number.error.find("many") != std::string::npos);

    std::istringstream trailing(",a,b\ns1,1,2x\n");
    dca::text_table suffix(trailing);
    ASSERT(!suffix.good());

    dca::text_table missing("/tmp/dca_test_does_not_exist.csv");
    ASSERT(!missing.good());

    SUITE_END();
}

void test_biom() {
    SUITE_START("test biom");

    const char *filename = "/tmp/dca_test_gradient.biom";
    write_gradient_biom(filename);

    ASSERT(dca::biom::is_hdf5(filename));

    dca::biom table(filename);
    ASSERT(table.n_samples == GRADIENT_SITES);
    ASSERT(table.n_obs == GRADIENT_SPECIES);
    ASSERT(table.obs_ids[2] == "sp3");
    ASSERT(table.sample_ids[9] == "site10");
    ASSERT(table.obs_indptr.size() == GRADIENT_SPECIES + 1);

    double out[GRADIENT_SITES];
    table.get_obs_data("sp3", out);
    for(unsigned int i = 0; i < GRADIENT_SITES; i++)
        ASSERT(out[i] == GRADIENT[i * GRADIENT_SPECIES + 2]);

    dca::abundance data(table);
    dca::abundance expected(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES);
    ASSERT(data.data == expected.data);
    ASSERT(data.site_ids[0] == "site1");
    ASSERT(data.species_ids[7] == "sp8");

    // a text table is not HDF5
    write_gradient_csv("/tmp/dca_test_gradient.csv");
    ASSERT(!dca::biom::is_hdf5("/tmp/dca_test_gradient.csv"));

    SUITE_END();
}

void test_default_params() {
    SUITE_START("test default params");

    dca_params_t params;
    default_params(&params);
    ASSERT(params.downweight_rare == false);
    ASSERT(params.rescaling_cycles == 0);
    ASSERT(params.basic_ra == false);
    ASSERT(params.segments == 0);
    ASSERT(params.shortest_gradient == 0.0);
    ASSERT(params.detrending_segments == 0);
    ASSERT(params.n_axes == 4);
    ASSERT(params.tolerance == 1e-6);
    ASSERT(params.max_iterations == 999);
    ASSERT(params.filter_empty == false);

    SUITE_END();
}

void test_decorana_from_matrix() {
    SUITE_START("test decorana from matrix");

    dca_params_t params;
    default_params(&params);
    ord_result_t *result = NULL;
    dca_error_t error;

    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == okay);
    ASSERT(result != NULL);
    ASSERT(result->n_sites == GRADIENT_SITES);
    ASSERT(result->n_species == GRADIENT_SPECIES);
    ASSERT(result->n_axes == 4);
    ASSERT(result->detrended);
    ASSERT(strcmp(result->site_ids[0], "1") == 0);
    ASSERT(strcmp(result->species_ids[7], "8") == 0);
    ASSERT(fabs(result->eigenvalues[0] - 0.774472) < 1e-5);
    ASSERT(fabs(result->eigenvalues[1] - 0.248820) < 1e-5);
    ASSERT(result->total_inertia > result->eigenvalues[0]);
    for(unsigned int k = 0; k < result->n_axes; k++)
        ASSERT(!result->rescaled[k]);
    destroy_ord_result(&result);
    ASSERT(result == NULL);

    const char *sites[] = {"a", "b", "c", "d", "e", "f", "g", "h", "i", "j"};
    params.basic_ra = true;
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, sites, NULL,
                                &params, &result, &error) == okay);
    ASSERT(!result->detrended);
    ASSERT(strcmp(result->site_ids[9], "j") == 0);
    ASSERT(fabs(result->eigenvalues[1] - 0.383477) < 1e-5);
    destroy_ord_result(&result);

    SUITE_END();
}

void test_decorana_from_matrix_errors() {
    SUITE_START("test decorana from matrix errors");

    dca_params_t params;
    default_params(&params);
    ord_result_t *result = NULL;
    dca_error_t error;

    ASSERT(decorana_from_matrix(GRADIENT, 0, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == table_empty);

    params.n_axes = 7;
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == invalid_config);
    ASSERT(strlen(error.message) > 0);
    ASSERT(result == NULL);

    default_params(&params);
    params.max_iterations = 3;
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == convergence_error);
    ASSERT(error.axis == 1);
    ASSERT(error.iteration == 3);
    ASSERT(result == NULL);

    std::vector<double> values(GRADIENT, GRADIENT + GRADIENT_SITES * GRADIENT_SPECIES);
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
        values[3 * GRADIENT_SPECIES + j] = 0.0;
    default_params(&params);
    ASSERT(decorana_from_matrix(values.data(), GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == degenerate_input);
    ASSERT(error.index == 3);
    ASSERT(result == NULL);

    // the same table is fine once empty sites are dropped
    params.filter_empty = true;
    ASSERT(decorana_from_matrix(values.data(), GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == okay);
    ASSERT(result->n_sites == GRADIENT_SITES - 1);
    ASSERT(strcmp(result->site_ids[3], "5") == 0);
    destroy_ord_result(&result);

    SUITE_END();
}

void test_decorana_one_off() {
    SUITE_START("test decorana one off");

    dca_params_t params;
    default_params(&params);
    ord_result_t *from_csv = NULL;
    ord_result_t *from_biom = NULL;
    ord_result_t *from_matrix = NULL;
    dca_error_t error;

    write_gradient_csv("/tmp/dca_test_gradient.csv");
    write_gradient_biom("/tmp/dca_test_gradient.biom");

    ASSERT(decorana_one_off("/tmp/dca_test_gradient.csv", &params, &from_csv, &error) == okay);
    ASSERT(decorana_one_off("/tmp/dca_test_gradient.biom", &params, &from_biom, &error) == okay);
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &from_matrix, &error) == okay);

    ASSERT(strcmp(from_csv->site_ids[4], "site5") == 0);
    ASSERT(strcmp(from_biom->species_ids[4], "sp5") == 0);
    for(unsigned int k = 0; k < from_matrix->n_axes; k++) {
        ASSERT(fabs(from_csv->eigenvalues[k] - from_matrix->eigenvalues[k]) < 1e-12);
        ASSERT(fabs(from_biom->eigenvalues[k] - from_matrix->eigenvalues[k]) < 1e-12);
    }
    for(unsigned int i = 0; i < GRADIENT_SITES * from_matrix->n_axes; i++) {
        ASSERT(fabs(from_csv->site_scores[i] - from_matrix->site_scores[i]) < 1e-9);
        ASSERT(fabs(from_biom->site_scores[i] - from_matrix->site_scores[i]) < 1e-9);
    }

    destroy_ord_result(&from_csv);
    destroy_ord_result(&from_biom);
    destroy_ord_result(&from_matrix);

    SUITE_END();
}

void test_decorana_one_off_errors() {
    SUITE_START("test decorana one off errors");

    dca_params_t params;
    default_params(&params);
    ord_result_t *result = NULL;
    dca_error_t error;

    ASSERT(decorana_one_off("/tmp/dca_test_does_not_exist.csv", &params, &result, &error) == table_missing);

    write_text("/tmp/dca_test_malformed.csv", ",a,b\ns1,1,2\ns2,3\n");
    ASSERT(decorana_one_off("/tmp/dca_test_malformed.csv", &params, &result, &error) == table_malformed);
    ASSERT(strstr(error.message, "line 3") != NULL);

    write_text("/tmp/dca_test_header_only.csv", ",a,b\n");
    ASSERT(decorana_one_off("/tmp/dca_test_header_only.csv", &params, &result, &error) == table_empty);

    // HDF5, but not a BIOM table
    H5::H5File file("/tmp/dca_test_not_biom.h5", H5F_ACC_TRUNC);
    file.createGroup("/sample");
    file.close();
    ASSERT(decorana_one_off("/tmp/dca_test_not_biom.h5", &params, &result, &error) == table_malformed);
    ASSERT(result == NULL);

    SUITE_END();
}

void test_write_ord_result() {
    SUITE_START("test write ord result");

    dca_params_t params;
    default_params(&params);
    ord_result_t *result = NULL;
    dca_error_t error;
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == okay);

    const char *filename = "/tmp/dca_test_scores.tsv";
    ASSERT(write_ord_result(filename, result) == write_okay);

    std::vector<std::string> lines = read_lines(filename);
    // 3 summary lines, a blank, header + sites, a blank, header + species
    ASSERT(lines.size() == 4 + 1 + GRADIENT_SITES + 1 + 1 + GRADIENT_SPECIES);
    ASSERT(lines[0].find("eigenvalues\t") == 0);
    ASSERT(lines[1].find("axis_lengths\t") == 0);
    ASSERT(lines[2].find("iterations\t") == 0);
    ASSERT(lines[3].empty());
    ASSERT(lines[4] == "site\tAxis1\tAxis2\tAxis3\tAxis4");
    ASSERT(lines[5 + GRADIENT_SITES].empty());
    ASSERT(lines[6 + GRADIENT_SITES] == "species\tAxis1\tAxis2\tAxis3\tAxis4");

    std::vector<std::string> eig = dca::split_fields(lines[0], '\t');
    ASSERT(eig.size() == 5);
    for(unsigned int k = 0; k < 4; k++)
        ASSERT(fabs(atof(eig[k + 1].c_str()) - result->eigenvalues[k]) < 1e-14);

    std::vector<std::string> site = dca::split_fields(lines[5], '\t');
    ASSERT(site[0] == "1");
    ASSERT(fabs(atof(site[1].c_str()) - result->site_scores[0]) < 1e-14);

    std::vector<std::string> last = dca::split_fields(lines.back(), '\t');
    ASSERT(last[0] == "8");
    ASSERT(fabs(atof(last[4].c_str()) - result->species_scores[GRADIENT_SPECIES * 4 - 1]) < 1e-14);

    ASSERT(write_ord_result("/tmp/dca_test_no_such_dir/scores.tsv", result) == open_error);

    destroy_ord_result(&result);

    SUITE_END();
}

void test_write_ord_result_hdf5() {
    SUITE_START("test write ord result hdf5");

    dca_params_t params;
    default_params(&params);
    params.rescaling_cycles = 4;
    ord_result_t *result = NULL;
    dca_error_t error;
    ASSERT(decorana_from_matrix(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES, NULL, NULL,
                                &params, &result, &error) == okay);

    const char *filename = "/tmp/dca_test_scores.h5";
    ASSERT(write_ord_result_hdf5(filename, result) == write_okay);

    H5::H5File file(filename, H5F_ACC_RDONLY);

    H5::DataSet method = file.openDataSet("method");
    H5::StrType method_type(H5::PredType::C_S1, 4);
    char method_buf[4];
    method.read(method_buf, method_type);
    ASSERT(strncmp(method_buf, "DCA", 3) == 0);

    H5::DataSet scores = file.openDataSet("site_scores");
    hsize_t dims[2];
    ASSERT(scores.getSpace().getSimpleExtentNdims() == 2);
    scores.getSpace().getSimpleExtentDims(dims, NULL);
    ASSERT(dims[0] == GRADIENT_SITES);
    ASSERT(dims[1] == result->n_axes);

    std::vector<double> site_scores(GRADIENT_SITES * result->n_axes);
    scores.read(site_scores.data(), H5::PredType::NATIVE_DOUBLE);
    for(unsigned int i = 0; i < site_scores.size(); i++)
        ASSERT(site_scores[i] == result->site_scores[i]);

    std::vector<unsigned int> iterations(result->n_axes);
    file.openDataSet("iterations").read(iterations.data(), H5::PredType::NATIVE_UINT);
    for(unsigned int k = 0; k < result->n_axes; k++)
        ASSERT(iterations[k] == result->iterations[k]);

    double inertia;
    file.openDataSet("total_inertia").read(&inertia, H5::PredType::NATIVE_DOUBLE);
    ASSERT(inertia == result->total_inertia);

    H5::DataSet ids = file.openDataSet("species_ids");
    H5::DataType id_type = ids.getDataType();
    char **id_buf = (char**)malloc(sizeof(char*) * GRADIENT_SPECIES);
    ids.read((void*)id_buf, id_type);
    ASSERT(strcmp(id_buf[0], "1") == 0);
    ASSERT(strcmp(id_buf[7], "8") == 0);
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
        free(id_buf[j]);
    free(id_buf);

    file.close();
    destroy_ord_result(&result);

    SUITE_END();
}

void test_initialize_ord_result_labels() {
    SUITE_START("test initialize ord result labels");

    dca::abundance table(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES);
    dca::parameters params;
    dca::ordination ord;
    dca::diagnostic diag;
    ASSERT(dca::decorana(table, params, ord, diag) == dca::ok);

    std::vector<std::string> labels;
    for(unsigned int j = 0; j < GRADIENT_SPECIES; j++)
        labels.push_back(species_name(j));

    ord_result_t *result = NULL;
    initialize_ord_result(result, ord, &labels);
    ASSERT(strcmp(result->species_ids[2], "sp3") == 0);
    ASSERT(strcmp(result->site_ids[2], "3") == 0);
    ASSERT(result->site_scores[5] == ord.site_scores[5]);
    destroy_ord_result(&result);

    SUITE_END();
}

void test_biplot() {
    SUITE_START("test biplot");

    dca::abundance table(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES);
    dca::parameters params;
    dca::ordination ord;
    dca::diagnostic diag;
    ASSERT(dca::decorana(table, params, ord, diag) == dca::ok);

    std::vector<std::string> species_labels = ord.species_ids;
    species_labels[0] = "A&B";

    dca::biplot_options opts;
    const char *filename = "/tmp/dca_test_biplot.svg";
    ASSERT(dca::write_biplot_svg(filename, ord, ord.site_ids, species_labels, opts) == dca::plot_okay);

    std::string svg = read_all(filename);
    ASSERT(svg.find("<svg") != std::string::npos);
    ASSERT(svg.find("DCA Axis 1") != std::string::npos);
    ASSERT(svg.find("DCA Axis 2") != std::string::npos);
    ASSERT(svg.find("Site Scores") != std::string::npos);
    ASSERT(svg.find("Species Scores") != std::string::npos);
    ASSERT(svg.find("A&amp;B") != std::string::npos);
    ASSERT(svg.find("fill=\"red\"") != std::string::npos);

    opts.show_species = false;
    opts.xax = 3;
    ASSERT(dca::write_biplot_svg(filename, ord, ord.site_ids, species_labels, opts) == dca::plot_okay);
    svg = read_all(filename);
    ASSERT(svg.find("DCA Axis 3") != std::string::npos);
    ASSERT(svg.find("Species Scores") == std::string::npos);

    params.analysis = dca::basic_reciprocal_averaging;
    ASSERT(dca::decorana(table, params, ord, diag) == dca::ok);
    ASSERT(dca::write_biplot_svg(filename, ord, ord.site_ids, ord.species_ids,
                                 dca::biplot_options()) == dca::plot_okay);
    svg = read_all(filename);
    ASSERT(svg.find("CA Axis 2") != std::string::npos);

    SUITE_END();
}

void test_biplot_errors() {
    SUITE_START("test biplot errors");

    dca::abundance table(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES);
    dca::parameters params;
    dca::ordination ord;
    dca::diagnostic diag;
    ASSERT(dca::decorana(table, params, ord, diag) == dca::ok);

    std::vector<std::string> none;
    dca::biplot_options opts;
    const char *filename = "/tmp/dca_test_biplot_errors.svg";

    opts.xax = 5;
    ASSERT(dca::write_biplot_svg(filename, ord, none, none, opts) == dca::invalid_axes);
    opts.xax = 0;
    ASSERT(dca::write_biplot_svg(filename, ord, none, none, opts) == dca::invalid_axes);

    opts = dca::biplot_options();
    opts.has_xlim = true;
    opts.xlim[0] = 1.0;
    opts.xlim[1] = -1.0;
    ASSERT(dca::write_biplot_svg(filename, ord, none, none, opts) == dca::invalid_limits);

    opts = dca::biplot_options();
    opts.has_ylim = true;
    opts.ylim[0] = 2.0;
    opts.ylim[1] = 2.0;
    ASSERT(dca::write_biplot_svg(filename, ord, none, none, opts) == dca::invalid_limits);

    opts = dca::biplot_options();
    ASSERT(dca::write_biplot_svg("/tmp/dca_test_no_such_dir/plot.svg", ord, none, none, opts) ==
           dca::plot_write_error);

    SUITE_END();
}

void test_biplot_limits() {
    SUITE_START("test biplot limits");

    dca::abundance table(GRADIENT, GRADIENT_SITES, GRADIENT_SPECIES);
    dca::parameters params;
    dca::ordination ord;
    dca::diagnostic diag;
    ASSERT(dca::decorana(table, params, ord, diag) == dca::ok);

    double lo = 1e300, hi = -1e300;
    for(uint32_t i = 0; i < ord.n_sites; i++) {
        lo = std::min(lo, ord.site_score(i, 0));
        hi = std::max(hi, ord.site_score(i, 0));
    }
    for(uint32_t j = 0; j < ord.n_species; j++) {
        lo = std::min(lo, ord.species_score(j, 0));
        hi = std::max(hi, ord.species_score(j, 0));
    }
    ASSERT(lo < 0.0 && hi > 0.0);

    double limits[2];
    dca::biplot_options opts;
    dca::biplot_limits(ord, opts, 1, limits);
    ASSERT(fabs(limits[0] - 1.15 * lo) < 1e-12);
    ASSERT(fabs(limits[1] - 1.15 * hi) < 1e-12);

    // sites alone never need wider limits
    double site_limits[2];
    opts.show_species = false;
    dca::biplot_limits(ord, opts, 1, site_limits);
    ASSERT(site_limits[0] >= limits[0]);
    ASSERT(site_limits[1] <= limits[1]);

    ASSERT(dca::svg_color("r") == "red");
    ASSERT(dca::svg_color("k") == "black");
    ASSERT(dca::svg_color("#336699") == "#336699");

    SUITE_END();
}

int main(int argc, char** argv) {
    test_split_fields();
    test_text_table_csv();
    test_text_table_tsv();
    test_text_table_errors();
    test_biom();
    test_default_params();
    test_decorana_from_matrix();
    test_decorana_from_matrix_errors();
    test_decorana_one_off();
    test_decorana_one_off_errors();
    test_write_ord_result();
    test_write_ord_result_hdf5();
    test_initialize_ord_result_labels();
    test_biplot();
    test_biplot_errors();
    test_biplot_limits();

    printf("\n");
    printf(" %i / %i suites failed\n", suites_failed, suites_run);
    printf(" %i / %i suites empty\n", suites_empty, suites_run);
    printf(" %i / %i tests failed\n", tests_failed, tests_run);

    printf("\n THE END.\n");

    return tests_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
