//
//  chemical_potential.hpp
//  dmft-scf
//

#ifndef chemical_potential_hpp
#define chemical_potential_hpp

#include <optional>
#include "coordinator.hpp"
#include "lattice_embedding.hpp"


struct MuOptions {
    std::optional<double> fixedValue;   // mu is never searched when given
    std::optional<double> initialGuess;
    int updateFreq = 1;
    MuMethod method = MuMethod::Dichotomy;
    double precision = 0.01;
    double target = 0.0;
    double delta = 0.5;
    int maxIter = 100;
};


// Invocation policy of the chemical potential search; the search itself is done by the lattice embedding
class ChemicalPotentialSolver {
public:
    ChemicalPotentialSolver(const MuOptions& opts, const Coordinator& coord);

    const MuOptions& options() const {return m_opts;}

    // Whether mu is searched after iteration it
    bool updatesAt(const int it) const;

    // Start value of a fresh run: the fixed value, otherwise the guess (if any) refined by one search
    double initialize(LatticeEmbedding& lattice) const;
    // Search after iteration it if the policy asks for it; on failure the last valid mu is kept. Returns the new mu.
    double update(LatticeEmbedding& lattice, const int it) const;

private:
    MuOptions m_opts;
    const Coordinator& m_coord;

    double search(LatticeEmbedding& lattice) const;
};

#endif /* chemical_potential_hpp */
