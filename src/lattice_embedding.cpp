//
//  lattice_embedding.cpp
//  dmft-scf
//

#include <cmath>
#include <sstream>
#include "lattice_embedding.hpp"


MuMethod muMethodFromString(const std::string& s) {
    if (s == "dichotomy") return MuMethod::Dichotomy;
    else if (s == "secant") return MuMethod::Secant;
    throw ConfigurationError("Unknown chemical potential method " + s + "; allowed methods are dichotomy and secant");
}


LatticeEmbedding::LatticeEmbedding(std::shared_ptr<const FrequencyMesh> mesh, const BlockStructure& blocks, const MPI_Comm& comm)
: m_mesh(mesh), m_comm(comm), m_mu(0.0), m_hfield(0.0) {
    if (!m_mesh) throw std::invalid_argument("Lattice embedding needs a frequency mesh!");
    MPI_Comm_size(comm, &m_psize);
    MPI_Comm_rank(comm, &m_prank);
    setBlockStructure(blocks);
}

void LatticeEmbedding::setBlockStructure(const BlockStructure& blocks) {
    m_blocks = blocks;
    m_sigma.clear();
    m_dc.clear();
    for (Eigen::Index s = 0; s < m_blocks.nSites(); ++s) {
        m_sigma.push_back(m_blocks.createGf(s, GfSpace::Lattice, m_mesh));
        DoubleCountingState dc;
        dc.potential = m_blocks.createMatrix(s, GfSpace::Lattice);
        m_dc.push_back(dc);
    }
    m_levelCache.assign(m_blocks.nSites(), LevelCache());
}

void LatticeEmbedding::setSelfEnergy(const Eigen::Index isite, const BlockGf& sigma) {
    if (!sigma.sameStructure(m_sigma.at(isite))) throw std::invalid_argument("setSelfEnergy: self-energy is not in the lattice structure of site " + std::to_string(isite));
    m_sigma[isite] = sigma;
}

void LatticeEmbedding::setDoubleCounting(const Eigen::Index isite, const DoubleCountingState& dc) {
    const BlockMatrix& ref = m_dc.at(isite).potential;
    for (const auto& [label, v] : ref) {
        const auto it = dc.potential.find(label);
        if (it == dc.potential.end() || it->second.rows() != v.rows()) throw std::invalid_argument("setDoubleCounting: potential does not match block " + label);
    }
    if (dc.dynamic && !dc.dynamic->sameStructure(m_sigma[isite])) throw std::invalid_argument("setDoubleCounting: dynamic part is not in the lattice structure");
    m_dc[isite] = dc;
}

double LatticeEmbedding::totalDCEnergy() const {
    double e = 0.0;
    for (Eigen::Index s = 0; s < nSites(); ++s) e += m_dc[s].energy;
    return e;
}

BlockGf LatticeEmbedding::embeddedSelfEnergy(const Eigen::Index isite) const {
    BlockGf sig(m_sigma.at(isite));
    addDoubleCounting(sig, isite, -1.0);
    return sig;
}

void LatticeEmbedding::addDoubleCounting(BlockGf& sigma, const Eigen::Index isite, const double sign) const {
    const DoubleCountingState& dc = m_dc.at(isite);
    sigma.addStatic(dc.potential, sign);
    if (dc.dynamic) {
        BlockGf dyn(*dc.dynamic);
        dyn *= sign;
        sigma += dyn;
    }
}

double LatticeEmbedding::solveChemicalPotential(const double target, const double precision, const MuMethod method, const double delta, const int maxiter) {
    if (precision <= 0.0 || delta <= 0.0) throw std::invalid_argument("Chemical potential search needs positive precision and step!");
    const double mu0 = m_mu;
    double mu = m_mu;
    double n = totalDensity(mu);
    int it = 0;

    if (method == MuMethod::Secant) {
        double muold = mu, nold = n;
        double dmu = n < target ? delta : -delta;
        mu += dmu;
        while (it < maxiter) {
            n = totalDensity(mu);
            if (std::abs(n - target) < precision) break;
            if (n == nold) break;
            // Secant iteration for finding root of n(mu) - n_goal = 0
            dmu = (mu - muold) * (-(n - target) / (n - nold));
            muold = mu;
            nold = n;
            mu += dmu;
            ++it;
        }
    }
    else {
        // Expand the bracket by delta, then bisect; density is non-decreasing in mu
        double lo = mu, hi = mu, nlo = n, nhi = n;
        while (nhi < target && it < maxiter) {
            lo = hi;
            nlo = nhi;
            hi += delta;
            nhi = totalDensity(hi);
            ++it;
        }
        while (nlo > target && it < maxiter) {
            hi = lo;
            nhi = nlo;
            lo -= delta;
            nlo = totalDensity(lo);
            ++it;
        }
        mu = 0.5 * (lo + hi);
        n = totalDensity(mu);
        while (std::abs(n - target) >= precision && it < maxiter) {
            if (n < target) lo = mu;
            else hi = mu;
            mu = 0.5 * (lo + hi);
            n = totalDensity(mu);
            ++it;
        }
    }

    if (std::abs(n - target) >= precision) {
        m_mu = mu0;
        std::ostringstream ss;
        ss << "Chemical potential search did not reach the density " << target << " within " << precision << " (last mu = " << mu << ", density = " << n << ")";
        throw NumericalDivergenceWarning(ss.str());
    }
    m_mu = mu;
    return m_mu;
}

const BlockMatrix& LatticeEmbedding::effectiveAtomicLevels(const Eigen::Index isite) const {
    LevelCache& c = m_levelCache.at(isite);
    const Eigen::MatrixXcd& rot = m_blocks.site(isite).rotation;
    if (!c.valid || c.mu != m_mu || c.hfield != m_hfield || c.rotation.rows() != rot.rows() || c.rotation != rot) {
        BlockMatrix h = localHamiltonian(isite);
        for (auto& [label, m] : h) m.diagonal().array() -= m_mu;
        c.levels = m_blocks.rotate(h, isite, RotDirection::ToLocal);
        c.mu = m_mu;
        c.hfield = m_hfield;
        c.rotation = rot;
        c.valid = true;
    }
    return c.levels;
}

void LatticeEmbedding::invalidateAtomicLevels() const {
    for (auto& c : m_levelCache) c.valid = false;
}
