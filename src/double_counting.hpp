//
//  double_counting.hpp
//  dmft-scf
//

#ifndef double_counting_hpp
#define double_counting_hpp

#include <optional>
#include <string>
#include <vector>
#include "block_structure.hpp"
#include "site.hpp"


// Numbering of the standard formulas follows the dc_type input values
enum DCFormula : int {FLL = 0, Held = 1, AMF = 2, FLLeg = 3, CrpaStatic = 10, CrpaStaticQp = 11, CrpaDynamic = 12};

DCFormula dcFormulaFromString(const std::string& s);
std::string dcFormulaName(const DCFormula f);
inline bool isDynamicFormula(const DCFormula f) {return f == CrpaStatic || f == CrpaStaticQp || f == CrpaDynamic;}

// Lattice-space double counting of one site
struct DoubleCountingState {
    BlockMatrix potential;
    double energy = 0.0;
    // Frequency dependent remainder of a fully dynamic double counting
    std::optional<BlockGf> dynamic;
};

// Precomputed screened-interaction double-counting self-energy of one site, lattice space: the static Hartree and
// exchange parts and the frequency dependent remainder vanishing at large frequencies
struct ScreenedInteractionKernel {
    BlockMatrix hartree;
    BlockMatrix exchange;
    BlockGf dynamic;
};

struct DCOptions {
    std::vector<DCFormula> formula;   // Per site
    std::vector<double> U, J;         // Per site
    std::optional<double> fixedValue;
    std::vector<std::optional<double> > fixedOcc;   // Per site, empty when not used
    bool nominal = false;
    double factor = 1.0;
    // One shift per orbital of every site in site order
    std::vector<double> orbShift;
};


class DoubleCountingCalculator {
public:
    // Checks option combinations; throws NotImplementedCombinationError or ShiftCountMismatchError
    DoubleCountingCalculator(const DCOptions& opts, const std::vector<Site>& sites, const bool spinOrbit);

    const DCOptions& options() const {return m_opts;}

    // Full evaluation for one site including all hooks, from the lattice-space density matrix
    DoubleCountingState compute(const Eigen::Index isite, const BlockMatrix& dens, const bool solverOwnsDC,
                                const ScreenedInteractionKernel* kernel = nullptr) const;

    // V and E of a standard functional with N_s the trace of each spin block (N / 2 each with spin-orbit coupling)
    static void standardFormula(const DCFormula f, const double U, const double J, const Eigen::Index norb, const BlockMatrix& dens,
                                BlockMatrix& pot, double& energy);

    static void dynamicFormula(const DCFormula f, const ScreenedInteractionKernel& kernel, const BlockMatrix& dens, DoubleCountingState& dc);

private:
    DCOptions m_opts;
    std::vector<Site> m_sites;
    bool m_spinOrbit;
    // Position of each site's orbital shifts in the flat shift list
    std::vector<Eigen::Index> m_shiftOffsets;
};

#endif /* double_counting_hpp */
