//
//  chemical_potential.cpp
//  dmft-scf
//

#include <sstream>
#include "chemical_potential.hpp"


ChemicalPotentialSolver::ChemicalPotentialSolver(const MuOptions& opts, const Coordinator& coord) : m_opts(opts), m_coord(coord) {
    if (m_opts.updateFreq < 1) throw ConfigurationError("mu_update_freq must be a positive integer");
    if (m_opts.precision <= 0.0) throw ConfigurationError("prec_mu must be positive");
    if (!m_opts.fixedValue && m_opts.target <= 0.0) throw ConfigurationError("density_target must be positive when the chemical potential is searched");
}

bool ChemicalPotentialSolver::updatesAt(const int it) const {
    return !m_opts.fixedValue && it % m_opts.updateFreq == 0;
}

double ChemicalPotentialSolver::initialize(LatticeEmbedding& lattice) const {
    if (m_opts.fixedValue) {
        lattice.setChemicalPotential(*m_opts.fixedValue);
        m_coord.report("Chemical potential fixed to " + std::to_string(*m_opts.fixedValue));
        return *m_opts.fixedValue;
    }
    if (m_opts.initialGuess) lattice.setChemicalPotential(*m_opts.initialGuess);
    return search(lattice);
}

double ChemicalPotentialSolver::update(LatticeEmbedding& lattice, const int it) const {
    if (m_opts.fixedValue) {
        lattice.setChemicalPotential(*m_opts.fixedValue);
        return *m_opts.fixedValue;
    }
    if (!updatesAt(it)) return lattice.chemicalPotential();
    return search(lattice);
}

double ChemicalPotentialSolver::search(LatticeEmbedding& lattice) const {
    const double muold = lattice.chemicalPotential();
    double mu = muold;
    try {
        mu = lattice.solveChemicalPotential(m_opts.target, m_opts.precision, m_opts.method, m_opts.delta, m_opts.maxIter);
    }
    catch (const NumericalDivergenceWarning& e) {
        m_coord.warn(std::string(e.what()) + "; keeping mu = " + std::to_string(muold));
        mu = muold;
    }
    // Every process continues with the coordinator's value
    m_coord.broadcast(mu);
    lattice.setChemicalPotential(mu);
    std::ostringstream ss;
    ss << "    Adjusted chemical potential by " << mu - muold << " to " << mu;
    m_coord.report(ss.str());
    return mu;
}
