//
//  initial_sigma.hpp
//  dmft-scf
//

#ifndef initial_sigma_hpp
#define initial_sigma_hpp

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "checkpoint_store.hpp"
#include "coordinator.hpp"
#include "lattice_embedding.hpp"


enum class InitialSigmaSource : int {Resume = 0, LoadExternal = 1, ColdStartWithDC = 2, ColdStartNoDC = 3};

std::string initialSigmaSourceName(const InitialSigmaSource src);
// Priority: previous iterations in the own archive, then an external archive, then a cold start
InitialSigmaSource selectInitialSigmaSource(const int iterationCount, const std::string& loadSigma, const bool dc);


struct InitialSigmaOptions {
    bool dc = true;
    bool dcDmft = false;
    bool magnetic = false;
    std::vector<double> magmom;   // Per site; empty for no bias
    double noiseLevel = 0.0;
    unsigned int noiseSeed = 0;
    std::string loadSigma;
    int loadSigmaIter = -1;       // -1 for last_iter
};

// Complete iteration record as needed for starting from it
struct IterationSnapshot {
    std::vector<BlockGf> sigma;              // Solver space
    std::vector<BlockGf> weiss;              // Solver space
    std::vector<BlockMatrix> densityPost;    // Solver space
    std::vector<DoubleCountingState> dc;     // Lattice space
    double mu = 0.0;
};

struct InitialState {
    InitialSigmaSource source = InitialSigmaSource::ColdStartNoDC;
    std::vector<BlockGf> sigma;              // Solver space
    std::vector<DoubleCountingState> dc;
    std::vector<BlockGf> lastWeiss;          // Resume only
    std::vector<BlockMatrix> lastDensity;    // Resume only, solver space
    std::optional<double> mu;                // Resume only
};

// Double counting of a site from its lattice-space density matrix
typedef std::function<DoubleCountingState(const Eigen::Index, const BlockMatrix&)> DCFunction;


// Replace dc on every process by the coordinator's, including the presence of a dynamic part
void broadcastDoubleCounting(DoubleCountingState& dc, const Eigen::Index isite, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh,
                             const Coordinator& coord);

IterationSnapshot readIterationSnapshot(const CheckpointStore& store, const std::string& group, const BlockStructure& blocks,
                                        std::shared_ptr<const FrequencyMesh> mesh);

// sigma - (oldDC - newDC) for every site, in solver space, through the lattice double-counting primitive. Sites whose
// potentials agree within atol are left untouched. Returns whether any site was corrected.
bool correctLoadedSigma(std::vector<BlockGf>& sigma, const std::vector<DoubleCountingState>& oldDC, const std::vector<DoubleCountingState>& newDC,
                        LatticeEmbedding& lattice, const double atol = 1e-4);

// -magmom on the diagonal of up blocks and +magmom on down blocks; a positive moment favours the up channel
void addMagneticBias(BlockGf& sigma, const Eigen::Index isite, const double magmom, const BlockStructure& blocks);


// Initial self-energy and double counting of a run. Archive reads and the double counting are done on the
// coordinator only (store may be null elsewhere) and the results broadcast.
InitialState determineInitialSigma(const InitialSigmaOptions& opts, const int iterationCount, CheckpointStore* store, const std::vector<BlockMatrix>& refdens,
                                   const DCFunction& computeDC, LatticeEmbedding& lattice, const Coordinator& coord);

#endif /* initial_sigma_hpp */
