//
//  checkpoint_store.cpp
//  dmft-scf
//

#include <fstream>
#include <sstream>
#include <stdexcept>
#include "checkpoint_store.hpp"
#include "errors.hpp"


static void checkStatus(const herr_t status, const std::string& what) {
    if (status < 0) throw ArchiveError("HDF5 failed to " + what);
}

static hid_t checkId(const hid_t id, const std::string& what) {
    if (id < 0) throw ArchiveError("HDF5 failed to " + what);
    return id;
}


CheckpointStore::CheckpointStore(const std::string& filename, const bool readonly) : m_filename(filename), m_readonly(readonly), m_file(-1), m_complex(-1) {
    // Errors are reported through exceptions below, so turn off the automatic error stack printing
    H5Eset_auto2(H5E_DEFAULT, NULL, NULL);

    const bool present = std::ifstream(filename).good();
    if (readonly) {
        if (!present) throw ArchiveError("Archive " + filename + " does not exist!");
        m_file = checkId(H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), "open " + filename);
    }
    else if (present) m_file = checkId(H5Fopen(filename.c_str(), H5F_ACC_RDWR, H5P_DEFAULT), "open " + filename);
    else m_file = checkId(H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT), "create " + filename);

    // Complex type compatible with h5py
    m_complex = H5Tcreate(H5T_COMPOUND, sizeof(std::complex<double>));
    checkStatus(H5Tinsert(m_complex, "r", 0, H5T_NATIVE_DOUBLE), "build complex type");
    checkStatus(H5Tinsert(m_complex, "i", sizeof(double), H5T_NATIVE_DOUBLE), "build complex type");

    if (!readonly) removeStaleGroups();
}

CheckpointStore::~CheckpointStore() {
    if (m_complex >= 0) H5Tclose(m_complex);
    if (m_file >= 0) {
        if (!m_readonly) H5Fflush(m_file, H5F_SCOPE_GLOBAL);
        H5Fclose(m_file);
    }
}

bool CheckpointStore::exists(const std::string& path) const {
    // Every intermediate link must be checked, H5Lexists fails on a missing parent
    std::istringstream ss(path);
    std::string item, partial;
    while (std::getline(ss, item, '/')) {
        if (item.empty()) continue;
        partial += "/" + item;
        if (H5Lexists(m_file, partial.c_str(), H5P_DEFAULT) <= 0) return false;
        // A dangling soft link exists as a link but cannot be traversed
        if (H5Oexists_by_name(m_file, partial.c_str(), H5P_DEFAULT) <= 0) return false;
    }
    return !partial.empty();
}

void CheckpointStore::createGroup(const std::string& path) {
    if (exists(path)) return;
    const hid_t lcpl = H5Pcreate(H5P_LINK_CREATE);
    H5Pset_create_intermediate_group(lcpl, 1);
    const hid_t grp = H5Gcreate2(m_file, absPath(path).c_str(), lcpl, H5P_DEFAULT, H5P_DEFAULT);
    H5Pclose(lcpl);
    checkId(grp, "create group " + path);
    H5Gclose(grp);
}

void CheckpointStore::remove(const std::string& path) {
    if (H5Lexists(m_file, absPath(path).c_str(), H5P_DEFAULT) <= 0) return;
    checkStatus(H5Ldelete(m_file, absPath(path).c_str(), H5P_DEFAULT), "delete " + path);
}

std::vector<std::string> CheckpointStore::children(const std::string& path) const {
    std::vector<std::string> names;
    if (!exists(path)) return names;
    const hid_t grp = checkId(H5Gopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open group " + path);
    H5G_info_t info;
    if (H5Gget_info(grp, &info) < 0) {
        H5Gclose(grp);
        throw ArchiveError("HDF5 failed to query group " + path);
    }
    for (hsize_t i = 0; i < info.nlinks; ++i) {
        const ssize_t len = H5Lget_name_by_idx(grp, ".", H5_INDEX_NAME, H5_ITER_INC, i, NULL, 0, H5P_DEFAULT);
        if (len < 0) continue;
        std::vector<char> buf(len + 1, '\0');
        H5Lget_name_by_idx(grp, ".", H5_INDEX_NAME, H5_ITER_INC, i, buf.data(), len + 1, H5P_DEFAULT);
        names.emplace_back(buf.data());
    }
    H5Gclose(grp);
    return names;
}

void CheckpointStore::flush() {
    if (!m_readonly) checkStatus(H5Fflush(m_file, H5F_SCOPE_GLOBAL), "flush " + m_filename);
}

void CheckpointStore::removeStaleGroups() {
    for (const auto& name : children("DMFT_results")) {
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0) {
            std::cout << "Removing incomplete iteration record " << name << " from " << m_filename << std::endl;
            remove("DMFT_results/" + name);
        }
    }
}

hid_t CheckpointStore::createDataset(const std::string& path, const hid_t type, const hid_t space) {
    if (m_readonly) throw ArchiveError("Archive " + m_filename + " is opened read-only!");
    remove(path);
    const hid_t lcpl = H5Pcreate(H5P_LINK_CREATE);
    H5Pset_create_intermediate_group(lcpl, 1);
    const hid_t dset = H5Dcreate2(m_file, absPath(path).c_str(), type, space, lcpl, H5P_DEFAULT, H5P_DEFAULT);
    H5Pclose(lcpl);
    return dset;
}

void CheckpointStore::writeComplexData(const std::string& path, const std::complex<double>* data, const hsize_t n0, const hsize_t n1) {
    hsize_t dims[2] = {n0, n1};
    const hid_t space = (n0 * n1 > 0) ? H5Screate_simple(2, dims, NULL) : H5Screate(H5S_NULL);
    const hid_t dset = createDataset(path, m_complex, space);
    H5Sclose(space);
    checkId(dset, "create dataset " + path);
    herr_t status = 0;
    if (n0 * n1 > 0) status = H5Dwrite(dset, m_complex, H5S_ALL, H5S_ALL, H5P_DEFAULT, data);
    H5Dclose(dset);
    checkStatus(status, "write dataset " + path);
}

void CheckpointStore::writeScalar(const std::string& path, const double x) {
    const hid_t space = H5Screate(H5S_SCALAR);
    const hid_t dset = createDataset(path, H5T_NATIVE_DOUBLE, space);
    H5Sclose(space);
    checkId(dset, "create dataset " + path);
    const herr_t status = H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &x);
    H5Dclose(dset);
    checkStatus(status, "write dataset " + path);
}

void CheckpointStore::writeInt(const std::string& path, const long x) {
    const hid_t space = H5Screate(H5S_SCALAR);
    const hid_t dset = createDataset(path, H5T_NATIVE_LONG, space);
    H5Sclose(space);
    checkId(dset, "create dataset " + path);
    const herr_t status = H5Dwrite(dset, H5T_NATIVE_LONG, H5S_ALL, H5S_ALL, H5P_DEFAULT, &x);
    H5Dclose(dset);
    checkStatus(status, "write dataset " + path);
}

void CheckpointStore::writeString(const std::string& path, const std::string& s) {
    const hid_t type = H5Tcopy(H5T_C_S1);
    H5Tset_size(type, s.empty() ? 1 : s.size());
    H5Tset_strpad(type, H5T_STR_NULLPAD);
    const hid_t space = H5Screate(H5S_SCALAR);
    const hid_t dset = createDataset(path, type, space);
    H5Sclose(space);
    if (dset < 0) {
        H5Tclose(type);
        throw ArchiveError("HDF5 failed to create dataset " + path);
    }
    const std::string buf = s.empty() ? std::string(1, '\0') : s;
    const herr_t status = H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data());
    H5Dclose(dset);
    H5Tclose(type);
    checkStatus(status, "write dataset " + path);
}

void CheckpointStore::writeVector(const std::string& path, const std::vector<double>& v) {
    hsize_t dims[1] = {v.size()};
    const hid_t space = v.empty() ? H5Screate(H5S_NULL) : H5Screate_simple(1, dims, NULL);
    const hid_t dset = createDataset(path, H5T_NATIVE_DOUBLE, space);
    H5Sclose(space);
    checkId(dset, "create dataset " + path);
    herr_t status = 0;
    if (!v.empty()) status = H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data());
    H5Dclose(dset);
    checkStatus(status, "write dataset " + path);
}

void CheckpointStore::writeMatrix(const std::string& path, const Eigen::MatrixXcd& m) {
    // Eigen is column major, so the slowest index in the file is the column
    writeComplexData(path, m.data(), m.cols(), m.rows());
}

void CheckpointStore::writeBlockMatrix(const std::string& path, const BlockMatrix& m) {
    remove(path);
    createGroup(path);
    for (const auto& [label, mat] : m) writeMatrix(path + "/" + label, mat);
}

void CheckpointStore::writeBlockGf(const std::string& path, const BlockGf& g) {
    remove(path);
    createGroup(path);
    for (const auto& [label, arr] : g) writeComplexData(path + "/" + label, arr().data(), arr().cols(), arr().rows());
}

void CheckpointStore::writeMesh(const std::string& path, const FrequencyMesh& mesh) {
    remove(path);
    createGroup(path);
    writeInt(path + "/kind", static_cast<long>(mesh.kind()));
    if (mesh.kind() == MeshKind::Matsubara) {
        writeScalar(path + "/beta", mesh.beta());
        writeInt(path + "/n_iw", mesh.nIw());
    }
    else {
        writeScalar(path + "/w_min", mesh.wMin());
        writeScalar(path + "/w_max", mesh.wMax());
        writeInt(path + "/n_w", mesh.size());
        writeScalar(path + "/eta", mesh.eta());
    }
}


double CheckpointStore::readScalar(const std::string& path) const {
    double x = 0.0;
    const hid_t dset = checkId(H5Dopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open dataset " + path);
    const herr_t status = H5Dread(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &x);
    H5Dclose(dset);
    checkStatus(status, "read dataset " + path);
    return x;
}

long CheckpointStore::readInt(const std::string& path) const {
    long x = 0;
    const hid_t dset = checkId(H5Dopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open dataset " + path);
    const herr_t status = H5Dread(dset, H5T_NATIVE_LONG, H5S_ALL, H5S_ALL, H5P_DEFAULT, &x);
    H5Dclose(dset);
    checkStatus(status, "read dataset " + path);
    return x;
}

std::string CheckpointStore::readString(const std::string& path) const {
    const hid_t dset = checkId(H5Dopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open dataset " + path);
    const hid_t type = H5Dget_type(dset);
    const std::size_t len = H5Tget_size(type);
    std::vector<char> buf(len + 1, '\0');
    const herr_t status = H5Dread(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data());
    H5Tclose(type);
    H5Dclose(dset);
    checkStatus(status, "read dataset " + path);
    return std::string(buf.data());
}

std::vector<double> CheckpointStore::readVector(const std::string& path) const {
    const hid_t dset = checkId(H5Dopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open dataset " + path);
    const hid_t space = H5Dget_space(dset);
    const hssize_t n = H5Sget_simple_extent_npoints(space);
    H5Sclose(space);
    std::vector<double> v(n > 0 ? n : 0);
    herr_t status = 0;
    if (n > 0) status = H5Dread(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data());
    H5Dclose(dset);
    checkStatus(status, "read dataset " + path);
    return v;
}

Eigen::MatrixXcd CheckpointStore::readMatrix(const std::string& path) const {
    const hid_t dset = checkId(H5Dopen2(m_file, absPath(path).c_str(), H5P_DEFAULT), "open dataset " + path);
    const hid_t space = H5Dget_space(dset);
    Eigen::MatrixXcd m;
    herr_t status = 0;
    if (H5Sget_simple_extent_type(space) == H5S_SIMPLE && H5Sget_simple_extent_ndims(space) == 2) {
        hsize_t dims[2];
        H5Sget_simple_extent_dims(space, dims, NULL);
        m.resize(dims[1], dims[0]);
        status = H5Dread(dset, m_complex, H5S_ALL, H5S_ALL, H5P_DEFAULT, m.data());
    }
    else if (H5Sget_simple_extent_type(space) != H5S_NULL) status = -1;
    H5Sclose(space);
    H5Dclose(dset);
    checkStatus(status, "read complex matrix " + path);
    return m;
}

BlockMatrix CheckpointStore::readBlockMatrix(const std::string& path) const {
    if (!exists(path)) throw ArchiveError("Archive " + m_filename + " has no entry " + path);
    BlockMatrix m;
    for (const auto& label : children(path)) m[label] = readMatrix(path + "/" + label);
    return m;
}

BlockGf CheckpointStore::readBlockGf(const std::string& path, std::shared_ptr<const FrequencyMesh> mesh) const {
    if (!exists(path)) throw ArchiveError("Archive " + m_filename + " has no entry " + path);
    std::map<std::string, Eigen::MatrixXcd> raw;
    std::vector<std::pair<std::string, Eigen::Index> > dims;
    for (const auto& label : children(path)) {
        raw[label] = readMatrix(path + "/" + label);
        const Eigen::Index dim = raw[label].rows();
        if (dim == 0 || raw[label].cols() != mesh->size() * dim)
            throw InconsistentStateError("Stored " + path + "/" + label + " does not fit the frequency mesh " + mesh->description());
        dims.emplace_back(label, dim);
    }
    BlockGf g(mesh, dims);
    for (auto& [label, arr] : g) arr() = raw[label];
    return g;
}

FrequencyMesh CheckpointStore::readMesh(const std::string& path) const {
    const MeshKind kind = static_cast<MeshKind>(readInt(path + "/kind"));
    if (kind == MeshKind::Matsubara) return FrequencyMesh::matsubara(readScalar(path + "/beta"), readInt(path + "/n_iw"));
    return FrequencyMesh::realFreq(readScalar(path + "/w_min"), readScalar(path + "/w_max"), readInt(path + "/n_w"), readScalar(path + "/eta"));
}


std::string CheckpointStore::beginIteration(const int it) {
    const std::string tmp = iterationGroup(it) + ".tmp";
    remove(tmp);
    createGroup(tmp);
    return tmp;
}

void CheckpointStore::commitIteration(const int it) {
    const std::string tmp = absPath(iterationGroup(it) + ".tmp");
    const std::string dest = absPath(iterationGroup(it));
    // A record beyond iteration_count is left over from an interrupted run and is superseded
    remove(dest);
    checkStatus(H5Lmove(m_file, tmp.c_str(), m_file, dest.c_str(), H5P_DEFAULT, H5P_DEFAULT), "commit iteration " + std::to_string(it));
    remove(lastIterGroup());
    checkStatus(H5Lcreate_soft(dest.c_str(), m_file, absPath(lastIterGroup()).c_str(), H5P_DEFAULT, H5P_DEFAULT), "link last_iter");
    writeInt("DMFT_results/iteration_count", it);
    flush();
}

int CheckpointStore::iterationCount() const {
    if (!exists("DMFT_results/iteration_count")) return 0;
    return static_cast<int>(readInt("DMFT_results/iteration_count"));
}
