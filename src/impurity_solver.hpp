//
//  impurity_solver.hpp
//  dmft-scf
//

#ifndef impurity_solver_hpp
#define impurity_solver_hpp

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "block_structure.hpp"
#include "site.hpp"


// Impurity problem of one inequivalent site in solver space. Quantities handed in or out are copies.
class ImpuritySolver {
public:
    ImpuritySolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh);
    virtual ~ImpuritySolver() {}

    virtual std::string name() const = 0;
    // Computes Sigma_freq and G_freq from the current input
    virtual void solve(const int it) = 0;

    // The solver folds its own double counting into Sigma
    virtual bool ownsDoubleCounting() const {return false;}
    // The solver takes Delta and Hloc0 instead of the Weiss field
    virtual bool needsHybridization() const {return false;}
    virtual bool supportsChiMeasurement() const {return false;}
    virtual bool needsInitialGuess() const {return false;}
    // Double-counting energy of solvers owning the double counting
    virtual double dcEnergy() const {return 0.0;}

    const Site& site() const {return m_site;}
    Eigen::Index siteIndex() const {return m_site.index;}

    void setWeissField(const BlockGf& g0);
    void setHybridization(const BlockGf& delta, const BlockMatrix& hloc0);
    void setInitialGuess(const BlockGf& sigma);
    // Overwrites the solver output, e.g. after mixing or when copied from an equivalent site
    void setSelfEnergy(const BlockGf& sigma);
    void setGreenFunction(const BlockGf& g);
    void requestChiMeasurement(const bool measure);
    // Results of a solve done on process root only
    virtual void broadcastResults(const int root, const MPI_Comm& comm);
    bool chiRequested() const {return m_measureChi;}

    const BlockGf& weissField() const {return m_G0;}
    const BlockGf& selfEnergy() const {return m_Sigma;}
    const BlockGf& greenFunction() const {return m_G;}
    const BlockGf& greenFunctionUnsym() const {return m_Gunsym;}
    const std::optional<BlockGf>& hybridization() const {return m_Delta;}
    const std::optional<BlockMatrix>& localLevels() const {return m_Hloc0;}

    std::map<std::string, std::any> parameters;

protected:
    Site m_site;
    BlockStructure m_blocks;
    std::shared_ptr<const FrequencyMesh> m_mesh;
    BlockGf m_G0, m_Sigma, m_G, m_Gunsym;
    std::optional<BlockGf> m_Delta;
    std::optional<BlockMatrix> m_Hloc0;
    bool m_measureChi;

    // G = (G0^-1 - Sigma)^-1
    BlockGf dyson(const BlockGf& g0, const BlockGf& sigma) const;
};


// Static mean-field solution of the density-density Kanamori interaction, iterated with its own Dyson equation. The
// FLL double counting is subtracted inside the solver.
class HartreeSolver : public ImpuritySolver {
public:
    HartreeSolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh);

    std::string name() const override {return "hartree";}
    void solve(const int it) override;

    bool ownsDoubleCounting() const override {return true;}
    bool needsInitialGuess() const override {return true;}
    double dcEnergy() const override {return m_dcEnergy;}

    int iterationsUsed() const {return m_nit;}
    void broadcastResults(const int root, const MPI_Comm& comm) override;

private:
    std::map<std::string, std::vector<OrbitalRef> > m_orbitals;
    double m_dcEnergy;
    int m_nit;

    // Static self-energy of the given solver-space occupations (diagonal entries are used)
    BlockMatrix meanField(const BlockMatrix& dens, double& edc) const;
};


// Input handed to a sampling backend; optional members are null when not used
struct SamplingInput {
    int iteration;
    Eigen::Index site;
    double U, J;
    const BlockGf* weissField;
    const BlockGf* hybridization;
    const BlockMatrix* localLevels;
    const BlockGf* initialGuess;
    bool measureChi;
    const std::map<std::string, std::any>* parameters;
};

struct SamplingOutput {
    BlockGf selfEnergy;
    // Left empty if the backend only measures Sigma; G then follows from the Dyson equation
    BlockGf greenFunction;
};

// Sampling algorithm supplied by the embedding application. May be collective over all processes.
class SamplingBackend {
public:
    virtual ~SamplingBackend() {}
    virtual bool needsHybridization() const {return false;}
    virtual bool supportsChiMeasurement() const {return false;}
    virtual SamplingOutput run(const SamplingInput& in) = 0;
};


class SamplingSolver : public ImpuritySolver {
public:
    SamplingSolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh, std::shared_ptr<SamplingBackend> backend);

    std::string name() const override {return "sampling";}
    void solve(const int it) override;

    bool needsHybridization() const override {return m_backend->needsHybridization();}
    bool supportsChiMeasurement() const override {return m_backend->supportsChiMeasurement();}

private:
    std::shared_ptr<SamplingBackend> m_backend;
};


std::unique_ptr<ImpuritySolver> makeImpuritySolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh,
                                                   std::shared_ptr<SamplingBackend> backend = nullptr);

#endif /* impurity_solver_hpp */
