//
//  lattice_embedding.hpp
//  dmft-scf
//

#ifndef lattice_embedding_hpp
#define lattice_embedding_hpp

#include <memory>
#include <string>
#include <vector>
#include <mpi.h>
#include "block_structure.hpp"
#include "double_counting.hpp"


enum class MuMethod : int {Dichotomy = 0, Secant = 1};

MuMethod muMethodFromString(const std::string& s);

struct DensityCorrection {
    std::vector<BlockMatrix> correction;   // Per site, lattice space
    double totalDensity = 0.0;
    double bandEnergy = 0.0;
};


// Boundary to the lattice model: holds the per-site self-energies (lattice space, global frame), the double countings and
// the chemical potential, and computes local quantities from them. Methods computing lattice sums are collective over
// the communicator.
class LatticeEmbedding {
public:
    LatticeEmbedding(std::shared_ptr<const FrequencyMesh> mesh, const BlockStructure& blocks, const MPI_Comm& comm = MPI_COMM_WORLD);
    virtual ~LatticeEmbedding() {}

    Eigen::Index nSites() const {return m_blocks.nSites();}
    const FrequencyMesh& mesh() const {return *m_mesh;}
    std::shared_ptr<const FrequencyMesh> meshPtr() const {return m_mesh;}
    const MPI_Comm& comm() const {return m_comm;}

    // Resets self-energies and double countings to zero
    void setBlockStructure(const BlockStructure& blocks);
    const BlockStructure& blockStructure() const {return m_blocks;}

    void setSelfEnergy(const Eigen::Index isite, const BlockGf& sigma);
    const BlockGf& selfEnergy(const Eigen::Index isite) const {return m_sigma.at(isite);}
    void setDoubleCounting(const Eigen::Index isite, const DoubleCountingState& dc);
    const DoubleCountingState& doubleCounting(const Eigen::Index isite) const {return m_dc.at(isite);}
    double totalDCEnergy() const;

    double chemicalPotential() const {return m_mu;}
    void setChemicalPotential(const double mu) {m_mu = mu;}
    double hField() const {return m_hfield;}
    void setHField(const double h) {m_hfield = h;}

    // Per site local Green's function in lattice space and global frame; broadening > 0 replaces the mesh broadening
    virtual std::vector<BlockGf> extractLocalGreenFunction(const double broadening = 0.0) const = 0;
    virtual double totalDensity(const double mu) const = 0;
    virtual DensityCorrection densityCorrection(const std::string& dmType) const = 0;

    // Root search of totalDensity(mu) = target starting from the current mu; sets and returns the result. Throws
    // NumericalDivergenceWarning, leaving mu unchanged, if the precision is not reached.
    double solveChemicalPotential(const double target, const double precision, const MuMethod method, const double delta = 0.5,
                                  const int maxiter = 100);

    // sigma += sign * DC of the site (lattice space)
    void addDoubleCounting(BlockGf& sigma, const Eigen::Index isite, const double sign) const;

    // Local one-body levels minus mu in the local frame of the site. Cached; recomputed when mu, h_field or the rotation
    // changed since the last evaluation.
    const BlockMatrix& effectiveAtomicLevels(const Eigen::Index isite) const;
    void invalidateAtomicLevels() const;

protected:
    std::shared_ptr<const FrequencyMesh> m_mesh;
    BlockStructure m_blocks;
    MPI_Comm m_comm;
    int m_psize, m_prank;
    double m_mu, m_hfield;
    std::vector<BlockGf> m_sigma;
    std::vector<DoubleCountingState> m_dc;

    // Sigma - DC of a site, lattice space
    BlockGf embeddedSelfEnergy(const Eigen::Index isite) const;
    // 1/Nk sum_k H(k) projected on the site, lattice blocks, global frame, without mu
    virtual BlockMatrix localHamiltonian(const Eigen::Index isite) const = 0;

private:
    struct LevelCache {
        bool valid = false;
        double mu = 0.0, hfield = 0.0;
        Eigen::MatrixXcd rotation;
        BlockMatrix levels;
    };
    mutable std::vector<LevelCache> m_levelCache;
};

#endif /* lattice_embedding_hpp */
