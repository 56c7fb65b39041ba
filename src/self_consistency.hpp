//
//  self_consistency.hpp
//  dmft-scf
//

#ifndef self_consistency_hpp
#define self_consistency_hpp

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "afm_mapping.hpp"
#include "chemical_potential.hpp"
#include "checkpoint_store.hpp"
#include "convergence.hpp"
#include "double_counting.hpp"
#include "impurity_solver.hpp"
#include "initial_sigma.hpp"
#include "lattice_embedding.hpp"
#include "mixer.hpp"
#include "run_config.hpp"


enum class EngineState : int {Setup = 0, Iterating = 1, Converged = 2, Exhausted = 3, Sampling = 4, Done = 5};

std::string engineStateName(const EngineState st);

struct RunSummary {
    int iterations = 0;        // Iterations done by this run, sampling ones included
    int lastIteration = 0;     // Archive index of the last iteration
    bool converged = false;
    double mu = 0.0;
};


// DMFT loop: lattice -> Weiss field -> impurity solvers -> self-energy -> double counting and chemical potential ->
// convergence -> archive. Every process runs the same control flow; archive I/O and global decisions happen on the
// coordinator and are broadcast.
class SelfConsistencyEngine {
public:
    SelfConsistencyEngine(const RunConfig& cfg, std::shared_ptr<LatticeEmbedding> lattice, const Coordinator& coord,
                          std::shared_ptr<SamplingBackend> backend = nullptr);
    SelfConsistencyEngine(const SelfConsistencyEngine&) = delete;
    SelfConsistencyEngine& operator=(const SelfConsistencyEngine&) = delete;

    // Per site kernels for the screened-interaction double countings; set before setup()
    void setScreenedInteraction(const std::vector<ScreenedInteractionKernel>& kernels);

    // Block structure, solvers, mixers, initial self-energy; persists the run input on a fresh archive
    void setup();
    // Main loop followed by the sampling phase if converged; calls setup() if not done yet
    RunSummary run();
    // One iteration with archive index it; returns the sticky converged flag
    bool iterate(const int it, const bool sampling = false);

    EngineState state() const {return m_state;}
    bool converged() const {return m_converged;}
    int iterationOffset() const {return m_offset;}
    InitialSigmaSource initialSource() const {return m_source;}
    const RunConfig& config() const {return m_cfg;}
    const BlockStructure& blockStructure() const {return m_lattice->blockStructure();}
    const std::vector<Site>& sites() const {return m_sites;}
    const ImpuritySolver& solver(const Eigen::Index isite) const {return *m_solvers.at(isite);}
    ImpuritySolver& solver(const Eigen::Index isite) {return *m_solvers.at(isite);}
    const ConvergenceMonitor& monitor() const {return *m_monitor;}
    const Mixer& g0Mixer(const Eigen::Index isite) const {return *m_g0Mixers.at(isite);}
    const AFMShortcut& afm() const {return m_afm;}
    const LatticeEmbedding& lattice() const {return *m_lattice;}
    // Solver-space self-energy after mixing of the last iteration
    const BlockGf& selfEnergy(const Eigen::Index isite) const {return m_sigma.at(isite);}
    const BlockGf& weissField(const Eigen::Index isite) const {return m_weiss.at(isite);}
    const BlockMatrix& impurityDensity(const Eigen::Index isite) const {return m_densPost.at(isite);}
    double totalDensity() const {return m_ntot;}

private:
    RunConfig m_cfg;
    std::shared_ptr<LatticeEmbedding> m_lattice;
    const Coordinator& m_coord;
    std::shared_ptr<SamplingBackend> m_backend;
    std::shared_ptr<const FrequencyMesh> m_mesh;

    std::unique_ptr<CheckpointStore> m_store;   // Coordinator only
    std::vector<Site> m_sites;
    std::unique_ptr<DoubleCountingCalculator> m_dcCalc;
    std::vector<ScreenedInteractionKernel> m_kernels;
    std::unique_ptr<ChemicalPotentialSolver> m_muSolver;
    std::vector<std::unique_ptr<ImpuritySolver> > m_solvers;
    std::vector<std::unique_ptr<Mixer> > m_g0Mixers, m_sigmaMixers;
    std::unique_ptr<ConvergenceMonitor> m_monitor;
    AFMShortcut m_afm;

    EngineState m_state;
    InitialSigmaSource m_source;
    int m_offset;                 // Iterations in the archive when the run started
    int m_phaseEnd;               // Last iteration of the current phase
    bool m_converged;
    double m_ntot;

    // Solver space, per site: values of the last completed iteration
    std::vector<BlockGf> m_sigma, m_weiss;
    std::vector<BlockMatrix> m_densPost;
    bool m_havePrevious;          // m_weiss and m_densPost hold an earlier iteration
    // Running observables for the archive, coordinator only
    std::map<std::string, std::vector<double> > m_observables;

    bool mixesWeissField() const;
    DoubleCountingState computeDC(const Eigen::Index isite, const BlockMatrix& latticeDens) const;
    std::vector<BlockMatrix> referenceDensity() const;
    void setRotations(BlockStructure& blocks, const std::vector<BlockMatrix>& refdens) const;
    BlockStructure chooseBlockStructure(const std::vector<BlockMatrix>& refdens);
    void createSolvers();
    void createMixers();
    // Convergence and Broyden histories and running observables of a resumed run
    void loadHistories();
    void initializeState(const std::vector<BlockMatrix>& refdens);
    void writeInput();

    // Local Green's function per site in solver space
    std::vector<BlockGf> localGreenFunction() const;
    BlockGf computeWeissField(const Eigen::Index isite, const BlockGf& gloc) const;
    // Delta = z - G0^-1 - Hloc0 with Hloc0 the local levels minus mu in solver space
    void passHybridization(const Eigen::Index isite, const BlockGf& g0);
    void solveImpurities(const int it);
    void pushSelfEnergy(const Eigen::Index isite);
    void updateDoubleCounting(const std::vector<BlockMatrix>& densPost);
    void recordObservables(const int it, const bool sampling, const double mupre, const std::vector<BlockGf>& gloc, const std::vector<BlockGf>& g0,
                           const std::vector<BlockGf>& sigmaPrev, const std::vector<BlockMatrix>& densPost, const double eband);
    bool savesAt(const int it, const bool sampling, const bool last) const;
    void persistIteration(const int it, const bool sampling, const double mupre, const std::vector<BlockGf>& g0,
                          const std::vector<BlockMatrix>& densPre, const std::vector<BlockMatrix>& densPost);
    std::string tablePath() const;
    void writeTableHeader() const;
    void appendTableRow(const int it) const;
};

#endif /* self_consistency_hpp */
