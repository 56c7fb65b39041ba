//
//  checkpoint_store.hpp
//  dmft-scf
//

#ifndef checkpoint_store_hpp
#define checkpoint_store_hpp

#include <memory>
#include <string>
#include <vector>
#include "hdf5.h"
#include "gf_data_wrapper.hpp"


// Hierarchical HDF5 archive holding the run input and the per-iteration records. Paths are relative to the file root,
// e.g. "DMFT_results/it_3/Sigma_freq_0". Only the coordinator process opens it.
//
// An iteration record is first written into the group it_<N>.tmp and only renamed to it_<N> when complete; then
// last_iter is relinked and iteration_count updated. A crash therefore leaves at most a stale .tmp group, which is
// removed the next time the archive is opened for writing.
class CheckpointStore {
public:
    explicit CheckpointStore(const std::string& filename, const bool readonly = false);
    ~CheckpointStore();
    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;

    const std::string& filename() const {return m_filename;}
    bool readOnly() const {return m_readonly;}

    bool exists(const std::string& path) const;
    void createGroup(const std::string& path);
    void remove(const std::string& path);
    std::vector<std::string> children(const std::string& path) const;
    void flush();

    // Existing datasets at path are replaced
    void writeScalar(const std::string& path, const double x);
    void writeInt(const std::string& path, const long x);
    void writeString(const std::string& path, const std::string& s);
    void writeVector(const std::string& path, const std::vector<double>& v);
    void writeMatrix(const std::string& path, const Eigen::MatrixXcd& m);
    void writeBlockMatrix(const std::string& path, const BlockMatrix& m);
    void writeBlockGf(const std::string& path, const BlockGf& g);
    void writeMesh(const std::string& path, const FrequencyMesh& mesh);

    double readScalar(const std::string& path) const;
    long readInt(const std::string& path) const;
    std::string readString(const std::string& path) const;
    std::vector<double> readVector(const std::string& path) const;
    Eigen::MatrixXcd readMatrix(const std::string& path) const;
    BlockMatrix readBlockMatrix(const std::string& path) const;
    BlockGf readBlockGf(const std::string& path, std::shared_ptr<const FrequencyMesh> mesh) const;
    FrequencyMesh readMesh(const std::string& path) const;

    // Returns the temporary group to write iteration it into
    std::string beginIteration(const int it);
    void commitIteration(const int it);
    // Number of the last completely written iteration; 0 for a fresh archive
    int iterationCount() const;
    static std::string iterationGroup(const int it) {return "DMFT_results/it_" + std::to_string(it);}
    static std::string lastIterGroup() {return "DMFT_results/last_iter";}

private:
    std::string m_filename;
    bool m_readonly;
    hid_t m_file, m_complex;

    static std::string absPath(const std::string& path) {return path.empty() || path[0] != '/' ? "/" + path : path;}
    void removeStaleGroups();
    hid_t createDataset(const std::string& path, const hid_t type, const hid_t space);
    void writeComplexData(const std::string& path, const std::complex<double>* data, const hsize_t n0, const hsize_t n1);
};

#endif /* checkpoint_store_hpp */
