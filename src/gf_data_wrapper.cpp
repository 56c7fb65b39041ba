//
//  gf_data_wrapper.cpp
//  dmft-scf
//

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <iomanip>
#include "gf_data_wrapper.hpp"


void MatFreqArray::allSum(const MPI_Comm& comm) {
    int is_inter;
    MPI_Comm_test_inter(comm, &is_inter);
    if (is_inter) throw std::invalid_argument("MPI communicator is an intercommunicator prohibiting in-place Allreduce!");
    MPI_Allreduce(MPI_IN_PLACE, m_data.data(), static_cast<int>(m_data.size()), MPI_CXX_DOUBLE_COMPLEX, MPI_SUM, comm);
}

void MatFreqArray::broadcast(const int root, const MPI_Comm& comm) {
    MPI_Bcast(m_data.data(), static_cast<int>(m_data.size()), MPI_CXX_DOUBLE_COMPLEX, root, comm);
}

void MatFreqArray::allGather(const Eigen::Index localstart, const Eigen::Index localsize, const MPI_Comm& comm) {
    int psize, prank;
    MPI_Comm_size(comm, &psize);
    MPI_Comm_rank(comm, &prank);
    const int nmsq = static_cast<int>(m_dim * m_dim);
    std::vector<int> recvcounts(psize), displs(psize);
    recvcounts[prank] = static_cast<int>(localsize) * nmsq;
    displs[prank] = static_cast<int>(localstart) * nmsq;
    MPI_Allgather(MPI_IN_PLACE, 1, MPI_INT, recvcounts.data(), 1, MPI_INT, comm);
    MPI_Allgather(MPI_IN_PLACE, 1, MPI_INT, displs.data(), 1, MPI_INT, comm);
    MPI_Allgatherv(MPI_IN_PLACE, recvcounts[prank], MPI_CXX_DOUBLE_COMPLEX, m_data.data(), recvcounts.data(), displs.data(),
                   MPI_CXX_DOUBLE_COMPLEX, comm);
}


Eigen::MatrixXcd matsubaraDensity(const MatFreqArray& g, const FrequencyMesh& mesh) {
    if (mesh.kind() != MeshKind::Matsubara) throw std::invalid_argument("matsubaraDensity: mesh is not a Matsubara mesh!");
    if (g.nfreq() != mesh.size()) throw std::invalid_argument("matsubaraDensity: data size does not match mesh size!");
    const Eigen::Index nm = g.dim();
    const Eigen::Index last = mesh.size() - 1;
    const double wlast = mesh(last).imag();
    // Second moment estimated from the largest frequency, G ~ 1 / iw + M2 / (iw)^2
    const Eigen::MatrixXcd M2 = -wlast * wlast * 0.5 * (g[last] + g[last].adjoint());
    Eigen::MatrixXcd dens = Eigen::MatrixXcd::Zero(nm, nm);
    double w;
    for (Eigen::Index i = 0; i < mesh.size(); ++i) {
        w = mesh(i).imag();
        dens += g[i] + M2 / (w * w);
    }
    dens /= mesh.beta();
    dens += 0.5 * Eigen::MatrixXcd::Identity(nm, nm) - (mesh.beta() / 4.0) * M2;
    return 0.5 * (dens + dens.adjoint());
}

Eigen::MatrixXcd realFreqDensity(const MatFreqArray& g, const FrequencyMesh& mesh) {
    if (mesh.kind() != MeshKind::RealFreq) throw std::invalid_argument("realFreqDensity: mesh is not a real-frequency mesh!");
    if (g.nfreq() != mesh.size()) throw std::invalid_argument("realFreqDensity: data size does not match mesh size!");
    const Eigen::Index nm = g.dim();
    const double dw = (mesh.wMax() - mesh.wMin()) / (mesh.size() - 1);
    Eigen::MatrixXcd dens = Eigen::MatrixXcd::Zero(nm, nm);
    for (Eigen::Index i = 0; i < mesh.size() && mesh(i).real() <= 0.0; ++i) {
        // Trapezoidal weights at the lower end of the window and at the Fermi level
        const double wt = (i == 0 || mesh(i).real() + dw > 0.0) ? 0.5 : 1.0;
        dens += wt * dw * (g[i] - g[i].adjoint()) * std::complex<double>(0.0, 0.5 / M_PI);
    }
    return 0.5 * (dens + dens.adjoint());
}


double blockTrace(const BlockMatrix& m) {
    double tr = 0.0;
    for (const auto& [label, mat] : m) tr += mat.trace().real();
    return tr;
}

double maxAbsDiff(const BlockMatrix& a, const BlockMatrix& b) {
    if (a.size() != b.size()) throw std::invalid_argument("maxAbsDiff: block matrices have different numbers of blocks!");
    double d = 0.0;
    for (const auto& [label, mat] : a) {
        const auto it = b.find(label);
        if (it == b.end() || it->second.rows() != mat.rows()) throw std::invalid_argument("maxAbsDiff: block " + label + " does not match!");
        if (mat.size() > 0) d = std::max(d, (mat - it->second).cwiseAbs().maxCoeff());
    }
    return d;
}

void makeHermitian(BlockMatrix& m) {
    for (auto& [label, mat] : m) mat = (0.5 * (mat + mat.adjoint())).eval();
}

std::ostream& operator<<(std::ostream& os, const BlockMatrix& m) {
    for (const auto& [label, mat] : m) os << "  " << label << ":" << std::endl << mat << std::endl;
    return os;
}


BlockGf::BlockGf(std::shared_ptr<const FrequencyMesh> mesh, const std::vector<std::pair<std::string, Eigen::Index> >& blocks) : m_mesh(mesh) {
    if (!m_mesh) throw std::invalid_argument("BlockGf needs a frequency mesh!");
    for (const auto& [label, dim] : blocks) {
        if (m_blocks.count(label)) throw std::invalid_argument("BlockGf: duplicate block label " + label);
        m_blocks.emplace(label, MatFreqArray(m_mesh->size(), dim));
    }
}

std::vector<std::string> BlockGf::labels() const {
    std::vector<std::string> ls;
    ls.reserve(m_blocks.size());
    for (const auto& kv : m_blocks) ls.push_back(kv.first);
    return ls;
}

std::vector<std::pair<std::string, Eigen::Index> > BlockGf::blockDims() const {
    std::vector<std::pair<std::string, Eigen::Index> > bd;
    for (const auto& [label, arr] : m_blocks) bd.emplace_back(label, arr.dim());
    return bd;
}

MatFreqArray& BlockGf::operator[](const std::string& label) {
    auto it = m_blocks.find(label);
    if (it == m_blocks.end()) throw std::out_of_range("BlockGf has no block " + label);
    return it->second;
}

const MatFreqArray& BlockGf::operator[](const std::string& label) const {
    auto it = m_blocks.find(label);
    if (it == m_blocks.end()) throw std::out_of_range("BlockGf has no block " + label);
    return it->second;
}

bool BlockGf::sameStructure(const BlockGf& other) const {
    if (!m_mesh || !other.m_mesh || *m_mesh != *other.m_mesh || m_blocks.size() != other.m_blocks.size()) return false;
    for (const auto& [label, arr] : m_blocks) {
        const auto it = other.m_blocks.find(label);
        if (it == other.m_blocks.end() || it->second.dim() != arr.dim()) return false;
    }
    return true;
}

void BlockGf::checkSameStructure(const BlockGf& other) const {
    if (!sameStructure(other)) throw std::invalid_argument("Block Green's functions have different block structures or meshes!");
}

void BlockGf::setZero() {
    for (auto& kv : m_blocks) kv.second.setZero();
}

BlockGf BlockGf::zeroLike() const {
    BlockGf g(*this);
    g.setZero();
    return g;
}

BlockGf& BlockGf::operator+=(const BlockGf& other) {
    checkSameStructure(other);
    for (auto& [label, arr] : m_blocks) arr() += other[label]();
    return *this;
}

BlockGf& BlockGf::operator-=(const BlockGf& other) {
    checkSameStructure(other);
    for (auto& [label, arr] : m_blocks) arr() -= other[label]();
    return *this;
}

BlockGf& BlockGf::operator*=(const double a) {
    for (auto& kv : m_blocks) kv.second() *= a;
    return *this;
}

BlockGf operator-(const BlockGf& a, const BlockGf& b) {
    BlockGf c(a);
    c -= b;
    return c;
}

BlockGf operator+(const BlockGf& a, const BlockGf& b) {
    BlockGf c(a);
    c += b;
    return c;
}

BlockGf& BlockGf::addStatic(const BlockMatrix& m, const double factor) {
    for (auto& [label, arr] : m_blocks) {
        const auto it = m.find(label);
        if (it == m.end()) throw std::invalid_argument("addStatic: no static matrix for block " + label);
        if (it->second.rows() != arr.dim() || it->second.cols() != arr.dim()) throw std::invalid_argument("addStatic: dimension mismatch in block " + label);
        for (Eigen::Index i = 0; i < arr.nfreq(); ++i) arr[i] += factor * it->second;
    }
    return *this;
}

void BlockGf::setStatic(const BlockMatrix& m) {
    setZero();
    addStatic(m);
}

void BlockGf::invert() {
    Eigen::MatrixXcd tmp;
    for (auto& kv : m_blocks) {
        MatFreqArray& arr = kv.second;
        for (Eigen::Index i = 0; i < arr.nfreq(); ++i) {
            tmp = arr[i];
            arr[i] = tmp.partialPivLu().inverse();
        }
    }
}

BlockGf BlockGf::inverse() const {
    BlockGf g(*this);
    g.invert();
    return g;
}

BlockMatrix BlockGf::density() const {
    BlockMatrix dens;
    for (const auto& [label, arr] : m_blocks) {
        if (m_mesh->kind() == MeshKind::Matsubara) dens[label] = matsubaraDensity(arr, *m_mesh);
        else dens[label] = realFreqDensity(arr, *m_mesh);
    }
    return dens;
}

void BlockGf::makeHermitian() {
    if (m_mesh->kind() != MeshKind::Matsubara) return;
    Eigen::MatrixXcd sym;
    Eigen::Index j;
    for (auto& kv : m_blocks) {
        MatFreqArray& arr = kv.second;
        for (Eigen::Index i = m_mesh->zeroIndex(); i < arr.nfreq(); ++i) {
            j = m_mesh->mirrorIndex(i);
            sym = 0.5 * (arr[i] + arr[j].adjoint());
            arr[i] = sym;
            arr[j] = sym.adjoint();
        }
    }
}

BlockMatrix BlockGf::tailValue() const {
    BlockMatrix tail;
    for (const auto& [label, arr] : m_blocks) {
        const Eigen::Index last = arr.nfreq() - 1;
        tail[label] = 0.5 * (arr[last] + arr[last].adjoint());
    }
    return tail;
}

double BlockGf::norm() const {
    double sq = 0.0;
    for (const auto& kv : m_blocks) sq += kv.second().squaredNorm();
    return m_mesh && m_mesh->size() > 0 ? std::sqrt(sq / m_mesh->size()) : 0.0;
}

Eigen::Index BlockGf::realSize() const {
    Eigen::Index n = 0;
    for (const auto& kv : m_blocks) n += 2 * kv.second().size();
    return n;
}

Eigen::VectorXd BlockGf::toRealVector() const {
    Eigen::VectorXd v(realSize());
    Eigen::Index pos = 0, n;
    for (const auto& kv : m_blocks) {
        n = kv.second().size();
        v.segment(pos, n) = kv.second().reshaped().real();
        v.segment(pos + n, n) = kv.second().reshaped().imag();
        pos += 2 * n;
    }
    return v;
}

void BlockGf::fromRealVector(const Eigen::VectorXd& v) {
    if (v.size() != realSize()) throw std::invalid_argument("fromRealVector: vector size does not match the block structure!");
    Eigen::Index pos = 0, n;
    for (auto& kv : m_blocks) {
        n = kv.second().size();
        kv.second().reshaped() = v.segment(pos, n).cast<std::complex<double> >() + 1i * v.segment(pos + n, n).cast<std::complex<double> >();
        pos += 2 * n;
    }
}

void BlockGf::broadcast(const int root, const MPI_Comm& comm) {
    for (auto& kv : m_blocks) kv.second.broadcast(root, comm);
}
