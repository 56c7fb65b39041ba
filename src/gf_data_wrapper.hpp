//
//  gf_data_wrapper.hpp
//  dmft-scf
//

#ifndef gf_data_wrapper_hpp
#define gf_data_wrapper_hpp

#include <cassert>
#include <complex>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <iostream>
#include <Eigen/Core>
#include <Eigen/LU>
#include <mpi.h>
#include "freq_mesh.hpp"


// Helper function for obtaining partition size and start; residual is distributed from the front
inline void mostEvenPart(const Eigen::Index size, const int psize, const int prank, Eigen::Index& partsize, Eigen::Index& partstart) {
    const Eigen::Index r0 = size % psize;
    const Eigen::Index bbsize = size / psize;
    if (prank < r0) {
        partsize = bbsize + 1;
        partstart = prank * (bbsize + 1);
    }
    else {
        partsize = bbsize;
        partstart = prank * bbsize + r0;
    }
}


// Sequence of nfreq square complex matrices of dimension dim. Storage is one dim x (nfreq * dim) matrix, so
// that the i-th unit matrix is a contiguous column block.
class MatFreqArray {
public:
    typedef typename Eigen::DenseBase<Eigen::MatrixXcd>::ColsBlockXpr ColsBlockXpr;
    typedef typename Eigen::DenseBase<Eigen::MatrixXcd>::ConstColsBlockXpr ConstColsBlockXpr;

    MatFreqArray() : m_nfreq(0), m_dim(0) {}
    MatFreqArray(const Eigen::Index nfreq, const Eigen::Index dim) : m_data(Eigen::MatrixXcd::Zero(dim, nfreq * dim)), m_nfreq(nfreq), m_dim(dim) {}
    MatFreqArray(const MatFreqArray&) = default;
    MatFreqArray(MatFreqArray&&) = default;
    MatFreqArray& operator=(const MatFreqArray&) = default;
    MatFreqArray& operator=(MatFreqArray&&) = default;
    ~MatFreqArray() = default;

    Eigen::Index nfreq() const {return m_nfreq;}
    Eigen::Index dim() const {return m_dim;}

    ColsBlockXpr operator[](const Eigen::Index i) {
        assert(i < m_nfreq);
        return m_data.middleCols(i * m_dim, m_dim);
    }
    ConstColsBlockXpr operator[](const Eigen::Index i) const {
        assert(i < m_nfreq);
        return m_data.middleCols(i * m_dim, m_dim);
    }
    std::complex<double>& operator()(const Eigen::Index i, const Eigen::Index im0, const Eigen::Index im1) {
        return m_data(im0, i * m_dim + im1);
    }
    std::complex<double> operator()(const Eigen::Index i, const Eigen::Index im0, const Eigen::Index im1) const {
        return m_data(im0, i * m_dim + im1);
    }

    // Whole underlying data; never resize through it
    Eigen::MatrixXcd& operator()() {return m_data;}
    const Eigen::MatrixXcd& operator()() const {return m_data;}

    void setZero() {m_data.setZero();}

    void allSum(const MPI_Comm& comm);
    void broadcast(const int root, const MPI_Comm& comm);
    // Every process computed the unit matrices [localstart, localstart + localsize); gather them to all processes
    void allGather(const Eigen::Index localstart, const Eigen::Index localsize, const MPI_Comm& comm);

private:
    Eigen::MatrixXcd m_data;
    Eigen::Index m_nfreq, m_dim;
};

// Tail-corrected density matrix 1/2 + (1/beta) sum_n G(iw_n) on the symmetric Matsubara mesh
Eigen::MatrixXcd matsubaraDensity(const MatFreqArray& g, const FrequencyMesh& mesh);
// Zero-temperature density matrix from the spectral function on a real-frequency mesh
Eigen::MatrixXcd realFreqDensity(const MatFreqArray& g, const FrequencyMesh& mesh);


// Static block matrices (density matrices, double-counting potentials, static self-energies)
typedef std::map<std::string, Eigen::MatrixXcd> BlockMatrix;

double blockTrace(const BlockMatrix& m);
double maxAbsDiff(const BlockMatrix& a, const BlockMatrix& b);
void makeHermitian(BlockMatrix& m);


// Block-diagonal matrix-valued function of frequency. All blocks live on one shared immutable mesh.
class BlockGf {
public:
    BlockGf() = default;
    BlockGf(std::shared_ptr<const FrequencyMesh> mesh, const std::vector<std::pair<std::string, Eigen::Index> >& blocks);
    BlockGf(const BlockGf&) = default;
    BlockGf(BlockGf&&) = default;
    BlockGf& operator=(const BlockGf&) = default;
    BlockGf& operator=(BlockGf&&) = default;
    ~BlockGf() = default;

    const FrequencyMesh& mesh() const {return *m_mesh;}
    std::shared_ptr<const FrequencyMesh> meshPtr() const {return m_mesh;}
    bool empty() const {return m_blocks.empty();}
    Eigen::Index nBlocks() const {return static_cast<Eigen::Index>(m_blocks.size());}
    std::vector<std::string> labels() const;
    std::vector<std::pair<std::string, Eigen::Index> > blockDims() const;
    bool hasBlock(const std::string& label) const {return m_blocks.count(label) > 0;}

    MatFreqArray& operator[](const std::string& label);
    const MatFreqArray& operator[](const std::string& label) const;

    std::map<std::string, MatFreqArray>::iterator begin() {return m_blocks.begin();}
    std::map<std::string, MatFreqArray>::iterator end() {return m_blocks.end();}
    std::map<std::string, MatFreqArray>::const_iterator begin() const {return m_blocks.begin();}
    std::map<std::string, MatFreqArray>::const_iterator end() const {return m_blocks.end();}

    bool sameStructure(const BlockGf& other) const;
    void checkSameStructure(const BlockGf& other) const;

    void setZero();
    BlockGf zeroLike() const;

    BlockGf& operator+=(const BlockGf& other);
    BlockGf& operator-=(const BlockGf& other);
    BlockGf& operator*=(const double a);
    // Add factor * m[block] at every frequency
    BlockGf& addStatic(const BlockMatrix& m, const double factor = 1.0);
    // Set every frequency to m[block]
    void setStatic(const BlockMatrix& m);

    void invert();
    BlockGf inverse() const;

    BlockMatrix density() const;
    // G(iw_n) <- (G(iw_n) + G(iw_{-n-1})^dagger) / 2 on the Matsubara mesh
    void makeHermitian();
    // Hermitian part at the largest frequency
    BlockMatrix tailValue() const;

    // Root-mean-square Frobenius norm over frequencies, summed over blocks
    double norm() const;

    // Real and imaginary parts of all blocks flattened in block order
    Eigen::VectorXd toRealVector() const;
    void fromRealVector(const Eigen::VectorXd& v);
    Eigen::Index realSize() const;

    void broadcast(const int root, const MPI_Comm& comm);

private:
    std::shared_ptr<const FrequencyMesh> m_mesh;
    std::map<std::string, MatFreqArray> m_blocks;
};

BlockGf operator-(const BlockGf& a, const BlockGf& b);
BlockGf operator+(const BlockGf& a, const BlockGf& b);


std::ostream& operator<<(std::ostream& os, const BlockMatrix& m);

#endif /* gf_data_wrapper_hpp */
