#include "api.hpp"
#include "biom.hpp"
#include "text_table.hpp"
#include "abundance.hpp"
#include "decorana.hpp"
#include <fstream>
#include <iomanip>
#include <cstring>
#include <stdexcept>
#include <stdlib.h>

#include <hdf5.h>


#define CHECK_FILE(filename, err) if(!is_file_exists(filename)) { \
                                      return err;                 \
                                  }

// https://stackoverflow.com/a/19841704/19741
static bool is_file_exists(const char *fileName) {
    std::ifstream infile(fileName);
        return infile.good();
}

static char* copy_string(const std::string &s) {
    size_t len = s.length();
    char* out = (char*)malloc(sizeof(char) * len + 1);
    s.copy(out, len);
    out[len] = '\0';
    return out;
}

static void set_error(dca_error_t* error, int axis, int iteration, int64_t index, const std::string &message) {
    if(error == NULL)
        return;
    error->axis = axis;
    error->iteration = iteration;
    error->index = index;
    strncpy(error->message, message.c_str(), sizeof(error->message) - 1);
    error->message[sizeof(error->message) - 1] = '\0';
}

static void to_parameters(const dca_params_t* params, dca::parameters &out) {
    out.downweight_rare = params->downweight_rare;
    out.rescaling_cycles = params->rescaling_cycles;
    out.analysis = params->basic_ra ? dca::basic_reciprocal_averaging : dca::detrended;
    out.segments = params->segments;
    out.shortest_gradient = params->shortest_gradient;
    out.detrending_segments = params->detrending_segments;
    out.n_axes = params->n_axes;
    out.tolerance = params->tolerance;
    out.max_iterations = params->max_iterations;
}

static ComputeStatus to_compute_status(dca::Status status) {
    switch(status) {
        case dca::ok:                return okay;
        case dca::invalid_config:    return invalid_config;
        case dca::degenerate_input:  return degenerate_input;
        case dca::convergence_error: return convergence_error;
    }
    return degenerate_input;
}

static ComputeStatus run_decorana(dca::abundance &table, const dca_params_t* params,
                                  dca::ordination &result, dca_error_t* error) {
    if(params->filter_empty)
        table.drop_empty();

    dca::parameters run_params;
    to_parameters(params, run_params);

    dca::diagnostic diag;
    dca::Status status = dca::decorana(table, run_params, result, diag);
    if(status != dca::ok)
        set_error(error, diag.axis, diag.iteration, diag.index, diag.message);
    return to_compute_status(status);
}

void default_params(dca_params_t* params) {
    dca::parameters defaults;
    params->downweight_rare = defaults.downweight_rare;
    params->rescaling_cycles = defaults.rescaling_cycles;
    params->basic_ra = defaults.analysis == dca::basic_reciprocal_averaging;
    params->segments = defaults.segments;
    params->shortest_gradient = defaults.shortest_gradient;
    params->detrending_segments = defaults.detrending_segments;
    params->n_axes = defaults.n_axes;
    params->tolerance = defaults.tolerance;
    params->max_iterations = defaults.max_iterations;
    params->filter_empty = false;
}

void initialize_ord_result(ord_result_t* &result, const dca::ordination &ord,
                           const std::vector<std::string>* species_ids) {
    const uint64_t n_axes = ord.n_axes;

    result = (ord_result_t*)malloc(sizeof(ord_result));
    result->n_sites = ord.n_sites;
    result->n_species = ord.n_species;
    result->n_axes = ord.n_axes;
    result->detrended = ord.analysis == dca::detrended;
    result->total_inertia = ord.total_inertia;

    result->site_scores = (double*)malloc(sizeof(double) * ord.n_sites * n_axes);
    result->species_scores = (double*)malloc(sizeof(double) * ord.n_species * n_axes);
    result->eigenvalues = (double*)malloc(sizeof(double) * n_axes);
    result->axis_lengths = (double*)malloc(sizeof(double) * n_axes);
    result->iterations = (unsigned int*)malloc(sizeof(unsigned int) * n_axes);
    result->rescaled = (bool*)malloc(sizeof(bool) * n_axes);
    result->site_ids = (char**)malloc(sizeof(char*) * ord.n_sites);
    result->species_ids = (char**)malloc(sizeof(char*) * ord.n_species);

    for(uint64_t i = 0; i < ord.site_scores.size(); i++)
        result->site_scores[i] = ord.site_scores[i];
    for(uint64_t i = 0; i < ord.species_scores.size(); i++)
        result->species_scores[i] = ord.species_scores[i];
    for(unsigned int k = 0; k < ord.n_axes; k++) {
        result->eigenvalues[k] = ord.eigenvalues[k];
        result->axis_lengths[k] = ord.axis_lengths[k];
        result->iterations[k] = ord.iterations[k];
        result->rescaled[k] = ord.rescaled[k];
    }

    const std::vector<std::string> &species = species_ids != NULL ? *species_ids : ord.species_ids;
    for(unsigned int i = 0; i < ord.n_sites; i++)
        result->site_ids[i] = copy_string(ord.site_ids[i]);
    for(unsigned int j = 0; j < ord.n_species; j++)
        result->species_ids[j] = copy_string(species[j]);
}

void destroy_ord_result(ord_result_t** result) {
    for(unsigned int i = 0; i < (*result)->n_sites; i++) {
        free((*result)->site_ids[i]);
    };
    for(unsigned int j = 0; j < (*result)->n_species; j++) {
        free((*result)->species_ids[j]);
    };
    free((*result)->site_ids);
    free((*result)->species_ids);
    free((*result)->site_scores);
    free((*result)->species_scores);
    free((*result)->eigenvalues);
    free((*result)->axis_lengths);
    free((*result)->iterations);
    free((*result)->rescaled);
    free(*result);
    *result = NULL;
}

ComputeStatus decorana_table(const char* table_filename, const dca_params_t* params,
                             dca::ordination &result, dca_error_t* error) {
    CHECK_FILE(table_filename, table_missing)

    if(dca::biom::is_hdf5(table_filename)) {
        try {
            dca::biom table(table_filename);
            if(table.n_samples == 0 || table.n_obs == 0)
                return table_empty;

            dca::abundance data(table);
            return run_decorana(data, params, result, error);
        } catch(const H5::Exception &e) {
            set_error(error, 0, 0, -1, e.getDetailMsg());
            return table_malformed;
        } catch(const std::runtime_error &e) {
            set_error(error, 0, 0, -1, e.what());
            return table_malformed;
        }
    }

    dca::text_table table(table_filename);
    if(!table.good()) {
        set_error(error, 0, 0, -1, table.error);
        return table_malformed;
    }
    if(table.n_samples == 0 || table.n_obs == 0)
        return table_empty;

    dca::abundance data(table);
    return run_decorana(data, params, result, error);
}

ComputeStatus decorana_one_off(const char* table_filename, const dca_params_t* params,
                               ord_result_t** result, dca_error_t* error) {
    dca::ordination ord;
    ComputeStatus rc = decorana_table(table_filename, params, ord, error);
    if(rc != okay)
        return rc;

    initialize_ord_result(*result, ord);
    return okay;
}

ComputeStatus decorana_from_matrix(const double* values, unsigned int n_sites, unsigned int n_species,
                                   const char* const* site_ids, const char* const* species_ids,
                                   const dca_params_t* params,
                                   ord_result_t** result, dca_error_t* error) {
    if(n_sites == 0 || n_species == 0)
        return table_empty;

    std::vector<std::string> sites;
    std::vector<std::string> species;
    if(site_ids != NULL)
        sites.assign(site_ids, site_ids + n_sites);
    if(species_ids != NULL)
        species.assign(species_ids, species_ids + n_species);

    dca::abundance table(values, n_sites, n_species, sites, species);

    dca::ordination ord;
    ComputeStatus rc = run_decorana(table, params, ord, error);
    if(rc != okay)
        return rc;

    initialize_ord_result(*result, ord);
    return okay;
}

static void write_scores(std::ofstream &output, const char* header, unsigned int n_axes,
                         unsigned int n, char** ids, const double* scores) {
    output << header;
    for(unsigned int k = 0; k < n_axes; k++)
        output << "\tAxis" << (k + 1);
    output << std::endl;

    for(unsigned int i = 0; i < n; i++) {
        output << ids[i];
        for(unsigned int k = 0; k < n_axes; k++)
            output << std::setprecision(16) << "\t" << scores[uint64_t(i) * n_axes + k];
        output << std::endl;
    }
}

IOStatus write_ord_result(const char* output_filename, const ord_result_t* result) {
    std::ofstream output;
    output.open(output_filename);
    if(!output.good())
        return open_error;

    output << "eigenvalues";
    for(unsigned int k = 0; k < result->n_axes; k++)
        output << std::setprecision(16) << "\t" << result->eigenvalues[k];
    output << std::endl;
    output << "axis_lengths";
    for(unsigned int k = 0; k < result->n_axes; k++)
        output << std::setprecision(16) << "\t" << result->axis_lengths[k];
    output << std::endl;
    output << "iterations";
    for(unsigned int k = 0; k < result->n_axes; k++)
        output << "\t" << result->iterations[k];
    output << std::endl;
    output << std::endl;

    write_scores(output, "site", result->n_axes, result->n_sites, result->site_ids, result->site_scores);
    output << std::endl;
    write_scores(output, "species", result->n_axes, result->n_species, result->species_ids, result->species_scores);

    output.close();
    return output.fail() ? write_error : write_okay;
}

herr_t write_hdf5_string(hid_t output_file_id,const char *dname, const char *str)
{
  // this is the convoluted way to store a string
  // Will use the FORTRAN forma, so we do not depend on null termination
  hid_t filetype_id = H5Tcopy (H5T_FORTRAN_S1);
  H5Tset_size(filetype_id, strlen(str));
  hid_t memtype_id = H5Tcopy (H5T_C_S1);
  H5Tset_size(memtype_id, strlen(str)+1);

  hsize_t  dims[1] = {1};
  hid_t dataspace_id = H5Screate_simple (1, dims, NULL);

  hid_t dataset_id = H5Dcreate2(output_file_id,dname, filetype_id, dataspace_id, H5P_DEFAULT, H5P_DEFAULT,
                                H5P_DEFAULT);
  herr_t status = H5Dwrite(dataset_id, memtype_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, str);

  H5Dclose(dataset_id);
  H5Sclose(dataspace_id);
  H5Tclose(memtype_id);
  H5Tclose(filetype_id);

  return status;
}

// array of variable length strings
static herr_t write_hdf5_ids(hid_t output_file_id, const char *dname, unsigned int n, char** ids)
{
  hsize_t     dims[1];
  dims[0] = n;
  hid_t dataspace_id = H5Screate_simple(1, dims, NULL);

  hid_t datatype_id = H5Tcopy(H5T_C_S1);
  H5Tset_size(datatype_id,H5T_VARIABLE);

  hid_t dataset_id = H5Dcreate2(output_file_id, dname, datatype_id, dataspace_id,
                                H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  herr_t status = H5Dwrite(dataset_id, datatype_id, H5S_ALL, H5S_ALL,
                           H5P_DEFAULT, ids);

  H5Dclose(dataset_id);
  H5Tclose(datatype_id);
  H5Sclose(dataspace_id);

  return status;
}

static herr_t write_hdf5_array(hid_t output_file_id, const char *dname, hid_t type_id,
                               int rank, const hsize_t *dims, const void *data)
{
  hid_t dataspace_id = H5Screate_simple(rank, dims, NULL);

  hid_t dcpl_id = H5Pcreate (H5P_DATASET_CREATE);

  hid_t dataset_id = H5Dcreate2(output_file_id, dname, type_id, dataspace_id,
                                H5P_DEFAULT, dcpl_id, H5P_DEFAULT);
  herr_t status = H5Dwrite(dataset_id, type_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, data);

  H5Pclose(dcpl_id);
  H5Dclose(dataset_id);
  H5Sclose(dataspace_id);

  return status;
}

IOStatus write_ord_result_hdf5(const char* output_filename, const ord_result_t* result) {
   /* Create a new file using default properties. */
   hid_t output_file_id = H5Fcreate(output_filename, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
   if (output_file_id<0) return write_error;

   // simple header
   if (write_hdf5_string(output_file_id,"format",ORD_FORMAT)<0) {
       H5Fclose (output_file_id);
       return write_error;
   }
   if (write_hdf5_string(output_file_id,"version",ORD_VERSION)<0) {
       H5Fclose (output_file_id);
       return write_error;
   }
   if (write_hdf5_string(output_file_id,"method",result->detrended ? "DCA" : "RA")<0) {
       H5Fclose (output_file_id);
       return write_error;
   }

   if (write_hdf5_ids(output_file_id, "site_ids", result->n_sites, result->site_ids)<0 ||
       write_hdf5_ids(output_file_id, "species_ids", result->n_species, result->species_ids)<0) {
       H5Fclose (output_file_id);
       return write_error;
   }

   hsize_t site_dims[2] = {result->n_sites, result->n_axes};
   hsize_t species_dims[2] = {result->n_species, result->n_axes};
   hsize_t axis_dims[1] = {result->n_axes};
   hsize_t scalar_dims[1] = {1};

   if (write_hdf5_array(output_file_id, "site_scores", H5T_NATIVE_DOUBLE, 2, site_dims, result->site_scores)<0 ||
       write_hdf5_array(output_file_id, "species_scores", H5T_NATIVE_DOUBLE, 2, species_dims, result->species_scores)<0 ||
       write_hdf5_array(output_file_id, "eigenvalues", H5T_NATIVE_DOUBLE, 1, axis_dims, result->eigenvalues)<0 ||
       write_hdf5_array(output_file_id, "axis_lengths", H5T_NATIVE_DOUBLE, 1, axis_dims, result->axis_lengths)<0 ||
       write_hdf5_array(output_file_id, "iterations", H5T_NATIVE_UINT, 1, axis_dims, result->iterations)<0 ||
       write_hdf5_array(output_file_id, "total_inertia", H5T_NATIVE_DOUBLE, 1, scalar_dims, &result->total_inertia)<0) {
       H5Fclose (output_file_id);
       return write_error;
   }

   H5Fclose (output_file_id);
   return write_okay;
}
