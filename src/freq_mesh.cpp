//
//  freq_mesh.cpp
//  dmft-scf
//

#include <cmath>
#include <sstream>
#include <stdexcept>
#include "freq_mesh.hpp"


FrequencyMesh FrequencyMesh::matsubara(const double beta, const Eigen::Index n_iw) {
    if (beta <= 0.0) throw std::invalid_argument("Inverse temperature of Matsubara mesh must be positive!");
    if (n_iw < 1) throw std::invalid_argument("Number of Matsubara frequencies must be positive!");
    FrequencyMesh mesh(MeshKind::Matsubara);
    mesh.m_beta = beta;
    mesh.m_points.resize(2 * n_iw);
    for (Eigen::Index i = 0; i < 2 * n_iw; ++i) mesh.m_points(i) = std::complex<double>(0.0, (2 * (i - n_iw) + 1) * M_PI / beta);
    return mesh;
}

FrequencyMesh FrequencyMesh::realFreq(const double wmin, const double wmax, const Eigen::Index nw, const double eta) {
    if (nw < 2 || wmax <= wmin) throw std::invalid_argument("Real-frequency mesh needs at least two points in an increasing window!");
    if (eta <= 0.0) throw std::invalid_argument("Broadening of real-frequency mesh must be positive!");
    FrequencyMesh mesh(MeshKind::RealFreq);
    mesh.m_wmin = wmin;
    mesh.m_wmax = wmax;
    mesh.m_eta = eta;
    mesh.m_points = Eigen::ArrayXd::LinSpaced(nw, wmin, wmax).cast<std::complex<double> >() + 1i * eta;
    return mesh;
}

bool FrequencyMesh::operator==(const FrequencyMesh& other) const {
    if (m_kind != other.m_kind || m_points.size() != other.m_points.size()) return false;
    if (m_kind == MeshKind::Matsubara) return m_beta == other.m_beta;
    return m_wmin == other.m_wmin && m_wmax == other.m_wmax && m_eta == other.m_eta;
}

void FrequencyMesh::checkCompatible(const FrequencyMesh& other) const {
    if (*this != other) throw std::invalid_argument("Incompatible frequency meshes: " + description() + " vs " + other.description());
}

std::string FrequencyMesh::description() const {
    std::ostringstream ss;
    if (m_kind == MeshKind::Matsubara) ss << "Matsubara(beta = " << m_beta << ", n_iw = " << nIw() << ")";
    else ss << "RealFreq([" << m_wmin << ", " << m_wmax << "], n_w = " << size() << ", eta = " << m_eta << ")";
    return ss.str();
}
