//
//  test_common.hpp
//  dmft-scf
//

#ifndef test_common_hpp
#define test_common_hpp

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "bare_hamiltonian.hpp"


// Empty directory under the system temporary directory, removed again with the object
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) : m_path(std::filesystem::temp_directory_path() / ("dmft_scf_test_" + name)) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string file(const std::string& name) const {return (m_path / name).string();}

private:
    std::filesystem::path m_path;
};


inline std::shared_ptr<const FrequencyMesh> matsubaraMesh(const double beta, const Eigen::Index niw) {
    return std::make_shared<const FrequencyMesh>(FrequencyMesh::matsubara(beta, niw));
}

// Ring of nsites single-orbital sites per unit cell with nearest-neighbour hopping -t; for one site the band is -2t cos(k)
inline std::shared_ptr<TightBindingLattice> makeChain(const Eigen::Index nsites, const double beta, const Eigen::Index niw, const Eigen::Index nk,
                                                      const double t = 1.0) {
    std::vector<CorrelatedShell> shells;
    for (Eigen::Index s = 0; s < nsites; ++s) shells.push_back({1, s});
    const BlockStructure blocks(std::vector<Eigen::Index>(nsites, 1), false);
    auto lattice = std::make_shared<TightBindingLattice>(matsubaraMesh(beta, niw), blocks, shells);
    lattice->kGridSizes(std::vector<Eigen::Index>{nk});

    const Eigen::VectorXi home = Eigen::VectorXi::Zero(1);
    const Eigen::VectorXi next = Eigen::VectorXi::Ones(1);
    for (Eigen::Index s = 0; s + 1 < nsites; ++s) lattice->addHopping({home, s, s + 1, -t});
    lattice->addHopping({next, nsites - 1, 0, -t});
    return lattice;
}

// Static matrix v * identity on every block of g
inline void fillStatic(BlockGf& g, const std::complex<double> v) {
    for (auto& [label, arr] : g) {
        for (Eigen::Index i = 0; i < arr.nfreq(); ++i) arr[i] = v * Eigen::MatrixXcd::Identity(arr.dim(), arr.dim());
    }
}

inline double maxAbsDiff(const BlockGf& a, const BlockGf& b) {
    a.checkSameStructure(b);
    double d = 0.0;
    for (const auto& [label, arr] : a) d = std::max(d, (arr() - b[label]()).cwiseAbs().maxCoeff());
    return d;
}

#endif /* test_common_hpp */
