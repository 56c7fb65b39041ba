//
//  freq_mesh.hpp
//  dmft-scf
//

#ifndef freq_mesh_hpp
#define freq_mesh_hpp

#include <complex>
#include <string>
#include <Eigen/Core>

using namespace std::complex_literals;


enum class MeshKind : int {Matsubara = 0, RealFreq = 1};

// Immutable frequency grid shared by all frequency dependent quantities of a run. The Matsubara mesh is
// symmetric, holding i * (2n + 1) * pi / beta for n = -n_iw, ..., n_iw - 1.
class FrequencyMesh {
public:
    static FrequencyMesh matsubara(const double beta, const Eigen::Index n_iw);
    static FrequencyMesh realFreq(const double wmin, const double wmax, const Eigen::Index nw, const double eta);

    MeshKind kind() const {return m_kind;}
    double beta() const {return m_beta;}
    Eigen::Index nIw() const {return m_kind == MeshKind::Matsubara ? m_points.size() / 2 : 0;}
    double wMin() const {return m_wmin;}
    double wMax() const {return m_wmax;}
    double eta() const {return m_eta;}

    Eigen::Index size() const {return m_points.size();}
    const Eigen::ArrayXcd& points() const {return m_points;}
    std::complex<double> operator()(const Eigen::Index i) const {return m_points(i);}

    // Index of the mirrored point, i.e., -w_n - 1 for Matsubara frequencies
    Eigen::Index mirrorIndex(const Eigen::Index i) const {return m_points.size() - 1 - i;}
    // First non-negative Matsubara frequency
    Eigen::Index zeroIndex() const {return m_kind == MeshKind::Matsubara ? m_points.size() / 2 : 0;}

    bool operator==(const FrequencyMesh& other) const;
    bool operator!=(const FrequencyMesh& other) const {return !(*this == other);}

    // Throws std::invalid_argument if quantities on the two meshes cannot be combined
    void checkCompatible(const FrequencyMesh& other) const;

    std::string description() const;

private:
    FrequencyMesh(const MeshKind kind) : m_kind(kind), m_beta(0.0), m_wmin(0.0), m_wmax(0.0), m_eta(0.0) {}

    MeshKind m_kind;
    double m_beta, m_wmin, m_wmax, m_eta;
    Eigen::ArrayXcd m_points;
};

#endif /* freq_mesh_hpp */
