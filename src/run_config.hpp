//
//  run_config.hpp
//  dmft-scf
//

#ifndef run_config_hpp
#define run_config_hpp

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "pugixml.hpp"
#include "bare_hamiltonian.hpp"
#include "block_structure.hpp"
#include "chemical_potential.hpp"
#include "convergence.hpp"
#include "coordinator.hpp"
#include "double_counting.hpp"
#include "initial_sigma.hpp"
#include "mixer.hpp"
#include "site.hpp"


struct LatticeConfig {
    int dim = 1;
    std::vector<long> nk;
    std::vector<long> norb;          // Per correlated shell
    std::vector<long> shellSite;     // Inequivalent site of each correlated shell; defaults to one site per shell
    std::vector<double> onsite;      // Per Hamiltonian orbital
    std::vector<HoppingTerm> hoppings;
    double broadening = 0.0;
    bool spinOrbit = false;
};


// Complete parameter set of a run, identical on every process
struct RunConfig {
    // general
    std::string seedname = "dmft";
    double beta = 40.0;
    long nIw = 1025;
    int nIter = 10;
    int samplingIterations = 0;
    int samplingSaveFreq = 5;
    MuOptions mu;
    bool magnetic = false;
    std::vector<double> magmom;
    bool afmOrder = false;
    double noiseLevel = 0.0;
    int noiseSeed = 0;
    std::string loadSigma;
    int loadSigmaIter = -1;
    double blockThreshold = 1e-5;
    std::string setRot = "none";
    // Sites kept in one full block per lattice block
    PerSite<bool> enforceOffDiag = PerSite<bool>::single(false);
    BlockSelection pickSolverStruct;
    DegeneracyMap solverStructDegeneracies;
    double hField = 0.0;
    int hFieldIt = 0;
    bool dc = true;
    PerSite<std::string> dcType = PerSite<std::string>::single("fll");
    bool dcDmft = false;
    PerSite<double> dcU, dcJ;            // Empty: the solver U and J
    std::optional<double> dcFixedValue;
    PerSite<double> dcFixedOcc;
    bool dcNominal = false;
    double dcFactor = 1.0;
    std::vector<double> dcOrbShift;
    bool calcEnergies = false;
    int saveFreq = 1;
    bool storeSolver = false;

    // mixing
    double g0Mix = 1.0;
    std::string g0MixType = "linear";
    double sigmaMix = 1.0;
    int broyMaxIt = 5;

    // convergence
    std::optional<double> occConvCrit, impOccConvCrit, gimpConvCrit, g0ConvCrit, sigmaConvCrit, muConvCrit;
    int convWindow = 3;
    std::string convMode = "absolute";

    // solver
    PerSite<std::string> solverType = PerSite<std::string>::single("hartree");
    PerSite<double> U = PerSite<double>::single(0.0);
    PerSite<double> J = PerSite<double>::single(0.0);
    int hartreeMaxIter = 100;
    double hartreeTol = 1e-6;
    bool measureChi = false;

    LatticeConfig lattice;

    // Input document as read, kept for the archive (coordinator only)
    std::string inputText;

    static RunConfig load(const std::string& filename, const Coordinator& coord);
    static RunConfig fromString(const std::string& xml, const Coordinator& coord);

    Eigen::Index nSites() const;
    // Per-site parameters expanded to one value per site
    std::vector<Site> sites() const;
    std::vector<CorrelatedShell> shells() const;
    DCOptions dcOptions() const;
    ConvOptions convOptions() const;
    InitialSigmaOptions initialSigmaOptions() const;
    std::string archiveName() const {return seedname + ".h5";}

    // Throws ConfigurationError for impossible parameter combinations
    void validate() const;

private:
    static RunConfig parse(const pugi::xml_document& doc, const std::string& text, const Coordinator& coord);
};


// Tight-binding lattice described by the lattice section, with trivial block structure and the configured Zeeman field
std::shared_ptr<TightBindingLattice> makeLattice(const RunConfig& cfg, const MPI_Comm& comm = MPI_COMM_WORLD);

#endif /* run_config_hpp */
