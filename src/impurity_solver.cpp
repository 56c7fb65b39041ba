//
//  impurity_solver.cpp
//  dmft-scf
//

#include <cmath>
#include <sstream>
#include "impurity_solver.hpp"


ImpuritySolver::ImpuritySolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh)
: m_site(site), m_blocks(blocks), m_mesh(mesh), m_measureChi(false) {
    if (site.index < 0 || site.index >= blocks.nSites()) throw std::invalid_argument("Impurity solver site is not in the block structure!");
    if (blocks.site(site.index).norb != site.norb) throw std::invalid_argument("Impurity solver site and block structure disagree on the orbital dimension!");
    m_G0 = blocks.createGf(site.index, GfSpace::Solver, mesh);
    m_Sigma = m_G0;
    m_G = m_G0;
    m_Gunsym = m_G0;
}

void ImpuritySolver::setWeissField(const BlockGf& g0) {
    m_G0.checkSameStructure(g0);
    m_G0 = g0;
}

void ImpuritySolver::setHybridization(const BlockGf& delta, const BlockMatrix& hloc0) {
    m_G0.checkSameStructure(delta);
    for (const auto& [label, arr] : m_G0) {
        const auto it = hloc0.find(label);
        if (it == hloc0.end() || it->second.rows() != arr.dim()) throw std::invalid_argument("setHybridization: Hloc0 does not match block " + label);
    }
    m_Delta = delta;
    m_Hloc0 = hloc0;
}

void ImpuritySolver::setInitialGuess(const BlockGf& sigma) {
    m_Sigma.checkSameStructure(sigma);
    m_Sigma = sigma;
}

void ImpuritySolver::setSelfEnergy(const BlockGf& sigma) {
    m_Sigma.checkSameStructure(sigma);
    m_Sigma = sigma;
}

void ImpuritySolver::setGreenFunction(const BlockGf& g) {
    m_G.checkSameStructure(g);
    m_G = g;
    m_Gunsym = g;
}

void ImpuritySolver::requestChiMeasurement(const bool measure) {
    if (measure && !supportsChiMeasurement()) throw ConfigurationError("Solver " + name() + " of site " + std::to_string(m_site.index) + " cannot measure chi");
    m_measureChi = measure;
}

void ImpuritySolver::broadcastResults(const int root, const MPI_Comm& comm) {
    m_Sigma.broadcast(root, comm);
    m_G.broadcast(root, comm);
    m_Gunsym.broadcast(root, comm);
}

BlockGf ImpuritySolver::dyson(const BlockGf& g0, const BlockGf& sigma) const {
    BlockGf g = g0.inverse();
    g -= sigma;
    g.invert();
    return g;
}



HartreeSolver::HartreeSolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh)
: ImpuritySolver(site, blocks, mesh), m_orbitals(blocks.orbitalMap(site.index)), m_dcEnergy(0.0), m_nit(0) {
    if (mesh->kind() != MeshKind::Matsubara) throw ConfigurationError("The hartree solver works on a Matsubara mesh only");
    // Default the solver parameters; std::map just adds the element if it does not exist
    parameters["max iterations"] = 100;
    parameters["tolerance"] = 1e-6;
    parameters["density mixing"] = 0.5;
}

BlockMatrix HartreeSolver::meanField(const BlockMatrix& dens, double& edc) const {
    const double U = m_site.U, J = m_site.J;
    double N = 0.0, Nup = 0.0, Ndn = 0.0;
    for (const auto& [label, n] : dens) {
        const auto& refs = m_orbitals.at(label);
        for (Eigen::Index i = 0; i < n.rows(); ++i) {
            N += n(i, i).real();
            if (refs[i].spin == SpinChannel::Up) Nup += n(i, i).real();
            else Ndn += n(i, i).real();
        }
    }
    // Kanamori density-density: U same orbital, U - 2J other orbital opposite spin, U - 3J other orbital same spin
    BlockMatrix sig;
    for (const auto& [la, na] : dens) {
        const auto& ra = m_orbitals.at(la);
        sig[la] = Eigen::MatrixXcd::Zero(na.rows(), na.cols());
        for (Eigen::Index i = 0; i < na.rows(); ++i) {
            double s = 0.0;
            for (const auto& [lb, nb] : dens) {
                const auto& rb = m_orbitals.at(lb);
                for (Eigen::Index j = 0; j < nb.rows(); ++j) {
                    if (la == lb && i == j) continue;
                    const double occ = nb(j, j).real();
                    if (ra[i].orbital == rb[j].orbital) s += ra[i].spin != rb[j].spin ? U * occ : 0.0;
                    else s += (ra[i].spin != rb[j].spin ? U - 2.0 * J : U - 3.0 * J) * occ;
                }
            }
            // FLL double counting of the spin channel
            const double Ns = ra[i].spin == SpinChannel::Up ? Nup : Ndn;
            s -= U * (N - 0.5) - J * (Ns - 0.5);
            sig[la](i, i) = s;
        }
    }
    edc = 0.5 * U * N * (N - 1.0) - 0.5 * J * (Nup * (Nup - 1.0) + Ndn * (Ndn - 1.0));
    return sig;
}

void HartreeSolver::solve(const int it) {
    const int maxit = std::any_cast<int>(parameters.at("max iterations"));
    const double tol = std::any_cast<double>(parameters.at("tolerance"));
    const double mix = std::any_cast<double>(parameters.at("density mixing"));
    if (maxit < 1 || tol <= 0.0 || mix <= 0.0 || mix > 1.0) throw std::invalid_argument("Invalid hartree solver parameters!");

    BlockMatrix dens = dyson(m_G0, m_Sigma).density();
    BlockMatrix sig, newdens;
    BlockGf sigma = m_Sigma.zeroLike();
    double diff = 0.0;
    for (m_nit = 1; m_nit <= maxit; ++m_nit) {
        sig = meanField(dens, m_dcEnergy);
        sigma.setStatic(sig);
        newdens = dyson(m_G0, sigma).density();
        diff = maxAbsDiff(newdens, dens);
        for (auto& [label, n] : dens) n = mix * newdens.at(label) + (1.0 - mix) * n;
        if (diff < tol) break;
    }
    if (diff >= tol) {
        std::ostringstream ss;
        ss << "Hartree solver of site " << m_site.index << " did not converge in iteration " << it << " (density change " << diff << ")";
        throw SolverFailure(ss.str());
    }

    sig = meanField(dens, m_dcEnergy);
    m_Sigma.setStatic(sig);
    m_Gunsym = dyson(m_G0, m_Sigma);
    m_G = m_Gunsym;
    m_blocks.symmetrize(m_G, m_site.index);
}


void HartreeSolver::broadcastResults(const int root, const MPI_Comm& comm) {
    ImpuritySolver::broadcastResults(root, comm);
    MPI_Bcast(&m_dcEnergy, 1, MPI_DOUBLE, root, comm);
    MPI_Bcast(&m_nit, 1, MPI_INT, root, comm);
}



SamplingSolver::SamplingSolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh,
                               std::shared_ptr<SamplingBackend> backend) : ImpuritySolver(site, blocks, mesh), m_backend(backend) {
    if (!m_backend) throw ConfigurationError("Site " + std::to_string(site.index) + " uses the sampling solver but no sampling backend is available");
}

void SamplingSolver::solve(const int it) {
    if (needsHybridization() && (!m_Delta || !m_Hloc0))
        throw SolverFailure("Sampling solver of site " + std::to_string(m_site.index) + " needs the hybridization function and local levels");

    SamplingInput in;
    in.iteration = it;
    in.site = m_site.index;
    in.U = m_site.U;
    in.J = m_site.J;
    in.weissField = &m_G0;
    in.hybridization = m_Delta ? &*m_Delta : nullptr;
    in.localLevels = m_Hloc0 ? &*m_Hloc0 : nullptr;
    in.initialGuess = &m_Sigma;
    in.measureChi = m_measureChi;
    in.parameters = &parameters;

    SamplingOutput out;
    try {
        out = m_backend->run(in);
    }
    catch (const std::exception& e) {
        throw SolverFailure("Sampling solver of site " + std::to_string(m_site.index) + " failed in iteration " + std::to_string(it) + ": " + e.what());
    }
    if (!out.selfEnergy.sameStructure(m_Sigma))
        throw SolverFailure("Sampling solver of site " + std::to_string(m_site.index) + " returned a self-energy in a wrong block structure");
    m_Sigma = out.selfEnergy;

    if (out.greenFunction.empty()) m_Gunsym = dyson(m_G0, m_Sigma);
    else if (!out.greenFunction.sameStructure(m_G))
        throw SolverFailure("Sampling solver of site " + std::to_string(m_site.index) + " returned a Green's function in a wrong block structure");
    else m_Gunsym = out.greenFunction;
    m_G = m_Gunsym;
    m_blocks.symmetrize(m_G, m_site.index);
}



std::unique_ptr<ImpuritySolver> makeImpuritySolver(const Site& site, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh,
                                                   std::shared_ptr<SamplingBackend> backend) {
    switch (site.solver) {
        case SolverKind::Hartree: return std::make_unique<HartreeSolver>(site, blocks, mesh);
        case SolverKind::Sampling: return std::make_unique<SamplingSolver>(site, blocks, mesh, backend);
        default: throw ConfigurationError("Unknown solver kind for site " + std::to_string(site.index));
    }
}
