/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2026, DCA development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <stdexcept>
#include "biom.hpp"

using namespace H5;
using namespace dca;

/* datasets defined by the BIOM 2.x format, only the observation axis is needed */
const std::string OBS_INDPTR = std::string("/observation/matrix/indptr");
const std::string OBS_INDICES = std::string("/observation/matrix/indices");
const std::string OBS_DATA = std::string("/observation/matrix/data");
const std::string OBS_IDS = std::string("/observation/ids");
const std::string SAMPLE_IDS = std::string("/sample/ids");

bool biom::is_hdf5(const std::string &filename) {
    // isHdf5 prints through the HDF5 error stack when the file is not HDF5
    Exception::dontPrint();
    try {
        return H5File::isHdf5(filename.c_str());
    } catch(const Exception &e) {
        return false;
    }
}

biom::biom(const std::string &filename) {
    file = H5File(filename.c_str(), H5F_ACC_RDONLY);

    load_ids(OBS_IDS.c_str(), obs_ids);
    load_ids(SAMPLE_IDS.c_str(), sample_ids);
    load_uint32(OBS_INDPTR.c_str(), obs_indptr);
    load_uint32(OBS_INDICES.c_str(), obs_indices);
    load_obs_data();

    /* cache shape and nnz info */
    n_samples = sample_ids.size();
    n_obs = obs_ids.size();
    nnz = obs_data.size();

    if(obs_indptr.size() != n_obs + 1 || obs_indices.size() != nnz)
        throw std::runtime_error("BIOM observation matrix does not match the observation IDs");
    if(obs_indptr[0] != 0 || obs_indptr[n_obs] != nnz)
        throw std::runtime_error("BIOM observation index pointer is out of range");
    for(uint32_t i = 0; i < n_obs; i++) {
        if(obs_indptr[i] > obs_indptr[i + 1])
            throw std::runtime_error("BIOM observation index pointer is not monotone");
    }
    for(uint32_t k = 0; k < nnz; k++) {
        if(obs_indices[k] >= n_samples)
            throw std::runtime_error("BIOM observation matrix references an unknown sample");
    }

    create_id_index(obs_ids, obs_id_index);
}

biom::~biom() {
    file.close();
}

void biom::load_ids(const char *path, std::vector<std::string> &ids) {
    DataSet ds_ids = file.openDataSet(path);
    DataType dtype = ds_ids.getDataType();
    DataSpace space = ds_ids.getSpace();

    hsize_t n_ids = 0;
    space.getSimpleExtentDims(&n_ids, NULL);

    ids.clear();
    if(n_ids == 0)
        return;

    // variable length strings, the library allocates each one
    std::vector<char*> buffer(n_ids, NULL);
    ds_ids.read((void*)buffer.data(), dtype);

    ids.reserve(n_ids);
    for(hsize_t i = 0; i < n_ids; i++)
        ids.push_back(buffer[i] != NULL ? buffer[i] : "");

    DataSet::vlenReclaim((void*)buffer.data(), dtype, space);
}

void biom::load_uint32(const char *path, std::vector<uint32_t> &out) {
    DataSet ds = file.openDataSet(path);
    DataSpace dataspace = ds.getSpace();

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);

    out.assign(dims[0], 0);
    if(dims[0] > 0)
        ds.read((void*)out.data(), PredType::NATIVE_UINT32);
}

void biom::load_obs_data() {
    DataSet ds = file.openDataSet(OBS_DATA.c_str());
    DataSpace dataspace = ds.getSpace();

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);

    obs_data.assign(dims[0], 0.0);
    if(dims[0] > 0)
        ds.read((void*)obs_data.data(), PredType::NATIVE_DOUBLE);
}

void biom::create_id_index(const std::vector<std::string> &ids,
                           std::unordered_map<std::string, uint32_t> &map) {
    uint32_t count = 0;
    map.reserve(ids.size());
    for(auto i = ids.begin(); i != ids.end(); i++, count++) {
        map[*i] = count;
    }
}

void biom::get_obs_data(uint32_t idx, double* out) const {
    // reset our output buffer
    for(unsigned int i = 0; i < n_samples; i++)
        out[i] = 0.0;

    for(uint32_t k = obs_indptr[idx]; k < obs_indptr[idx + 1]; k++) {
        out[obs_indices[k]] = obs_data[k];
    }
}

void biom::get_obs_data(const std::string &id, double* out) const {
    get_obs_data(obs_id_index.at(id), out);
}
