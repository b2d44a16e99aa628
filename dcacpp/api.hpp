#ifdef __cplusplus
#include <stdint.h>
#include "decorana.hpp"
#define EXTERN extern "C"


#else
#include <stdint.h>
#include <stdbool.h>
#define EXTERN
#endif

#define ORD_FORMAT "DCA-SCORES"
#define ORD_VERSION "2026.10"


typedef enum compute_status {okay=0, table_missing, table_malformed, table_empty, invalid_config, degenerate_input, convergence_error, output_error} ComputeStatus;
typedef enum io_status {read_okay=0, write_okay, open_error, read_error, write_error} IOStatus;

/* ordination parameters
 *
 * downweight_rare <bool> downweight rare species (iweigh).
 * rescaling_cycles <int> number of rescaling cycles, 0 for none (iresc).
 * basic_ra <bool> basic reciprocal averaging instead of DCA (ira).
 * segments <int> rescaling segments, 10..46, 0 for 26 (mk).
 * shortest_gradient <double> axes shorter than this are not rescaled (short).
 * detrending_segments <int> detrending segments, 2..46, 0 for 26.
 * n_axes <int> the number of axes to extract, 1..4.
 * tolerance <double> convergence tolerance.
 * max_iterations <int> iteration limit per axis.
 * filter_empty <bool> drop empty sites and species before the analysis.
 */
typedef struct dca_params {
    bool downweight_rare;
    int rescaling_cycles;
    bool basic_ra;
    int segments;
    double shortest_gradient;
    int detrending_segments;
    int n_axes;
    double tolerance;
    int max_iterations;
    bool filter_empty;
} dca_params_t;

/* details of a failed computation
 *
 * axis <int> the 1-based axis being extracted, 0 if not applicable.
 * iteration <int> the iteration reached, 0 if not applicable.
 * index <int64_t> the offending site or species, -1 if not applicable.
 * message <char[]> a human readable description.
 */
typedef struct dca_error {
    int axis;
    int iteration;
    int64_t index;
    char message[256];
} dca_error_t;

/* an ordination result
 *
 * n_sites <uint> the number of sites.
 * n_species <uint> the number of species.
 * n_axes <uint> the number of axes, ordered by decreasing eigenvalue.
 * detrended <bool> true for DCA, false for basic reciprocal averaging.
 * site_scores <double*> n_sites x n_axes, row-major.
 * species_scores <double*> n_species x n_axes, row-major.
 * eigenvalues <double*> of length n_axes.
 * axis_lengths <double*> gradient lengths in SD units, of length n_axes.
 * iterations <uint*> iterations used per axis, of length n_axes.
 * rescaled <bool*> whether an axis was rescaled, of length n_axes.
 * total_inertia <double> total inertia of the analysed table.
 * site_ids <char**> the site IDs of length n_sites.
 * species_ids <char**> the species IDs of length n_species.
 */
typedef struct ord_result {
    unsigned int n_sites;
    unsigned int n_species;
    unsigned int n_axes;
    bool detrended;
    double* site_scores;
    double* species_scores;
    double* eigenvalues;
    double* axis_lengths;
    unsigned int* iterations;
    bool* rescaled;
    double total_inertia;
    char** site_ids;
    char** species_ids;
} ord_result_t;


/* fill params with the DECORANA defaults */
EXTERN void default_params(dca_params_t* params);

EXTERN void destroy_ord_result(ord_result_t** result);

/* Compute an ordination from a table on disk
 *
 * table_filename <const char*> a BIOM 2.x table or a delimited text table.
 * params <const dca_params_t*> the run parameters.
 * result <ord_result_t**> the resulting ordination, this is initialized within the method so using **
 * error <dca_error_t*> if not NULL, receives details on failure
 *
 * decorana_one_off returns the following error codes:
 *
 * okay              : no problems encountered
 * table_missing     : the filename for the table does not exist
 * table_malformed   : the table could not be parsed
 * table_empty       : the table does not have any entries
 * invalid_config    : the parameters are inconsistent
 * degenerate_input  : the table cannot be ordinated
 * convergence_error : an axis did not converge
 */
EXTERN ComputeStatus decorana_one_off(const char* table_filename, const dca_params_t* params,
                                      ord_result_t** result, dca_error_t* error);

/* Compute an ordination from an in-memory matrix
 *
 * values <const double*> n_sites x n_species abundances, row-major.
 * n_sites <uint> the number of rows.
 * n_species <uint> the number of columns.
 * site_ids <const char**> n_sites labels, or NULL to number the sites.
 * species_ids <const char**> n_species labels, or NULL to number the species.
 * params <const dca_params_t*> the run parameters.
 * result <ord_result_t**> the resulting ordination, this is initialized within the method so using **
 * error <dca_error_t*> if not NULL, receives details on failure
 *
 * decorana_from_matrix returns the same error codes as decorana_one_off,
 * table_empty if either dimension is 0.
 */
EXTERN ComputeStatus decorana_from_matrix(const double* values, unsigned int n_sites, unsigned int n_species,
                                          const char* const* site_ids, const char* const* species_ids,
                                          const dca_params_t* params,
                                          ord_result_t** result, dca_error_t* error);

/* Write an ordination as tab separated text
 *
 * output_filename <const char*> the file to write into.
 * result <ord_result_t*> the results object.
 *
 * The file holds the eigenvalue, length and iteration lines, the site
 * block, a blank line and the species block.
 *
 * The following error codes are returned:
 *
 * write_okay : no problems
 * open_error : the file could not be created
 * write_error: the data could not be written
 */
EXTERN IOStatus write_ord_result(const char* output_filename, const ord_result_t* result);

/* Write an ordination as HDF5
 *
 * output_filename <const char*> the file to write into.
 * result <ord_result_t*> the results object.
 *
 * The following error codes are returned:
 *
 * write_okay : no problems
 * write_error: the file could not be created or written
 */
EXTERN IOStatus write_ord_result_hdf5(const char* output_filename, const ord_result_t* result);

#ifdef __cplusplus
/* Compute an ordination from a table on disk, keeping the C++ result
 *
 * Same as decorana_one_off; used where the scores are processed further,
 * e.g. for plotting.
 */
ComputeStatus decorana_table(const char* table_filename, const dca_params_t* params,
                             dca::ordination &result, dca_error_t* error);

/* Copy a C++ ordination into a newly allocated result
 *
 * species_ids <const std::vector<std::string>*> if not NULL, replaces the
 *      species labels, e.g. with abbreviated names.
 */
void initialize_ord_result(ord_result_t* &result, const dca::ordination &ord,
                           const std::vector<std::string>* species_ids = NULL);
#endif
