//
//  self_consistency.cpp
//  dmft-scf
//

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include "self_consistency.hpp"

#ifndef DMFT_SCF_VERSION
#define DMFT_SCF_VERSION "unknown"
#endif

// Layout version of the archive
static const long archiveFormat = 1;


std::string engineStateName(const EngineState st) {
    switch (st) {
        case EngineState::Setup: return "setup";
        case EngineState::Iterating: return "iterating";
        case EngineState::Converged: return "converged";
        case EngineState::Exhausted: return "exhausted";
        case EngineState::Sampling: return "sampling";
        default: return "done";
    }
}


SelfConsistencyEngine::SelfConsistencyEngine(const RunConfig& cfg, std::shared_ptr<LatticeEmbedding> lattice, const Coordinator& coord,
                                             std::shared_ptr<SamplingBackend> backend)
: m_cfg(cfg), m_lattice(lattice), m_coord(coord), m_backend(backend), m_state(EngineState::Setup), m_source(InitialSigmaSource::ColdStartNoDC),
  m_offset(0), m_phaseEnd(0), m_converged(false), m_ntot(0.0), m_havePrevious(false) {
    if (!m_lattice) throw std::invalid_argument("Self-consistency engine needs a lattice embedding!");
    m_mesh = m_lattice->meshPtr();
}

void SelfConsistencyEngine::setScreenedInteraction(const std::vector<ScreenedInteractionKernel>& kernels) {
    if (m_state != EngineState::Setup) throw std::logic_error("Screened interaction kernels must be set before setup!");
    m_kernels = kernels;
}

bool SelfConsistencyEngine::mixesWeissField() const {
    return mixTypeFromString(m_cfg.g0MixType) == MixType::Broyden || m_cfg.g0Mix != 1.0;
}

DoubleCountingState SelfConsistencyEngine::computeDC(const Eigen::Index isite, const BlockMatrix& latticeDens) const {
    const ScreenedInteractionKernel* kernel = m_kernels.empty() ? nullptr : &m_kernels.at(isite);
    return m_dcCalc->compute(isite, latticeDens, m_solvers.at(isite)->ownsDoubleCounting(), kernel);
}


// Density matrices of the non-interacting lattice, lattice space, global frame
std::vector<BlockMatrix> SelfConsistencyEngine::referenceDensity() const {
    const std::vector<BlockGf> gloc = m_lattice->extractLocalGreenFunction(m_cfg.lattice.broadening);
    std::vector<BlockMatrix> dens;
    for (const auto& g : gloc) dens.push_back(g.density());
    return dens;
}

void SelfConsistencyEngine::setRotations(BlockStructure& blocks, const std::vector<BlockMatrix>& refdens) const {
    if (m_cfg.setRot == "none") return;
    for (Eigen::Index s = 0; s < blocks.nSites(); ++s) {
        // Spin blocks are averaged so that both channels share one local frame
        const BlockMatrix& q = m_cfg.setRot == "den" ? refdens.at(s) : m_lattice->effectiveAtomicLevels(s);
        Eigen::MatrixXcd herm = q.begin()->second;
        for (auto it = std::next(q.begin()); it != q.end(); ++it) herm += it->second;
        herm /= static_cast<double>(q.size());
        blocks.setRotation(s, BlockStructure::calculateRotation(0.5 * (herm + herm.adjoint())));
    }
}

BlockStructure SelfConsistencyEngine::chooseBlockStructure(const std::vector<BlockMatrix>& refdens) {
    const std::string path = "DMFT_input/block_structure";
    BlockStructure chosen = m_lattice->blockStructure();
    m_coord.broadcastStatus([&]() {
        BlockStructure fresh = m_lattice->blockStructure();
        setRotations(fresh, refdens);
        const std::vector<bool> enforce = m_cfg.enforceOffDiag.expand(fresh.nSites(), "general/enforce_off_diag");
        std::vector<bool> include(fresh.nSites());
        for (Eigen::Index s = 0; s < fresh.nSites(); ++s) include[s] = !enforce[s];
        fresh.determine(refdens, m_cfg.blockThreshold, include);
        try {
            if (!m_cfg.pickSolverStruct.empty()) fresh.applyManualOverride(m_cfg.pickSolverStruct);
            if (!m_cfg.solverStructDegeneracies.empty()) fresh.applyDegeneracyMap(m_cfg.solverStructDegeneracies);
        }
        catch (const std::out_of_range& e) {
            throw ConfigurationError(std::string("Manual block structure names an unknown solver block: ") + e.what());
        }
        fresh.stripDegeneracies(m_cfg.magnetic);
        chosen = fresh;

        if (m_store->exists(path)) {
            const BlockStructure stored = BlockStructure::read(*m_store, path);
            try {
                fresh.compare(stored);
            }
            catch (const RotationMismatch& e) {
                std::cout << "Warning: " << e.what() << "; continuing with the stored rotations" << std::endl;
            }
            chosen = stored;
            std::cout << "Block structure loaded from " << m_store->filename() << std::endl;
        }
        else if (m_offset == 0 && !m_cfg.loadSigma.empty()) {
            const CheckpointStore ext(m_cfg.loadSigma, true);
            BlockStructure loaded = BlockStructure::read(ext, path);
            loaded.stripDegeneracies(m_cfg.magnetic);
            try {
                fresh.compare(loaded);
            }
            catch (const RotationMismatch& e) {
                std::cout << "Warning: " << e.what() << "; using the rotations of " << m_cfg.loadSigma << std::endl;
            }
            catch (const InconsistentStateError& e) {
                std::cout << "Warning: " << e.what() << "; using the block structure of " << m_cfg.loadSigma << std::endl;
            }
            chosen = loaded;
            std::cout << "Block structure loaded from " << m_cfg.loadSigma << std::endl;
        }
    });
    chosen.broadcast(m_coord);
    return chosen;
}

void SelfConsistencyEngine::createSolvers() {
    const BlockStructure& blocks = m_lattice->blockStructure();
    m_solvers.clear();
    for (const auto& site : m_sites) {
        m_solvers.push_back(makeImpuritySolver(site, blocks, m_mesh, m_backend));
        ImpuritySolver& solver = *m_solvers.back();
        if (site.solver == SolverKind::Hartree) {
            solver.parameters["max iterations"] = m_cfg.hartreeMaxIter;
            solver.parameters["tolerance"] = m_cfg.hartreeTol;
        }
        if (m_cfg.measureChi) solver.requestChiMeasurement(true);
    }
}

void SelfConsistencyEngine::createMixers() {
    const MixType type = mixTypeFromString(m_cfg.g0MixType);
    m_g0Mixers.clear();
    m_sigmaMixers.clear();
    for (std::size_t s = 0; s < m_sites.size(); ++s) {
        m_g0Mixers.push_back(makeMixer(type, m_cfg.g0Mix, static_cast<std::size_t>(m_cfg.broyMaxIt)));
        m_sigmaMixers.push_back(makeMixer(MixType::Linear, m_cfg.sigmaMix, 0));
    }
}

void SelfConsistencyEngine::loadHistories() {
    if (m_offset == 0) return;
    const std::string group = CheckpointStore::lastIterGroup();
    m_coord.broadcastStatus([&]() {
        if (m_store->exists(group + "/convergence_obs")) m_monitor->load(*m_store, group + "/convergence_obs");
        for (std::size_t s = 0; s < m_g0Mixers.size(); ++s) m_g0Mixers[s]->loadHistory(*m_store, group + "/broyden/site_" + std::to_string(s));
        for (const auto& name : m_store->children("DMFT_results/observables")) {
            m_observables[name] = m_store->readVector("DMFT_results/observables/" + name);
        }
    });
    m_monitor->broadcast(m_coord);
    for (auto& mixer : m_g0Mixers) mixer->broadcastHistory(m_coord);
}

void SelfConsistencyEngine::initializeState(const std::vector<BlockMatrix>& refdens) {
    const BlockStructure& blocks = m_lattice->blockStructure();
    const Eigen::Index nsites = blocks.nSites();
    const DCFunction dcfn = [this](const Eigen::Index s, const BlockMatrix& dens) {return computeDC(s, dens);};
    InitialState st = determineInitialSigma(m_cfg.initialSigmaOptions(), m_offset, m_store.get(), refdens, dcfn, *m_lattice, m_coord);
    m_source = st.source;

    m_sigma = st.sigma;
    for (Eigen::Index s = 0; s < nsites; ++s) {
        m_lattice->setDoubleCounting(s, st.dc[s]);
        if (m_solvers[s]->needsInitialGuess()) m_solvers[s]->setInitialGuess(m_sigma[s]);
        else m_solvers[s]->setSelfEnergy(m_sigma[s]);
        pushSelfEnergy(s);
    }

    if (st.source == InitialSigmaSource::Resume) {
        m_lattice->setChemicalPotential(*st.mu);
        m_weiss = st.lastWeiss;
        m_densPost = st.lastDensity;
        m_havePrevious = true;
        std::ostringstream ss;
        ss << "Resuming after iteration " << m_offset << " with mu = " << *st.mu;
        m_coord.report(ss.str());
    }
    else {
        m_weiss.clear();
        m_densPost.clear();
        for (Eigen::Index s = 0; s < nsites; ++s) {
            m_weiss.push_back(blocks.createGf(s, GfSpace::Solver, m_mesh));
            m_densPost.push_back(blocks.createMatrix(s, GfSpace::Solver));
        }
        m_havePrevious = false;
        // Readjusted to the initial self-energy
        m_muSolver->update(*m_lattice, 0);
    }
}

void SelfConsistencyEngine::writeInput() {
    if (m_offset > 0) return;
    m_coord.broadcastStatus([&]() {
        CheckpointStore& store = *m_store;
        store.createGroup("DMFT_input");
        store.writeString("DMFT_input/params/input_xml", m_cfg.inputText);
        store.writeScalar("DMFT_input/params/beta", m_cfg.beta);
        store.writeInt("DMFT_input/params/n_iw", m_cfg.nIw);
        store.writeInt("DMFT_input/params/n_iter_dmft", m_cfg.nIter);
        store.writeInt("DMFT_input/params/magnetic", m_cfg.magnetic);
        store.writeString("DMFT_input/params/initial_sigma", initialSigmaSourceName(m_source));

        std::vector<double> us, js, mult;
        for (const auto& site : m_sites) {
            us.push_back(site.U);
            js.push_back(site.J);
            mult.push_back(static_cast<double>(site.multiplicity));
            store.writeString("DMFT_input/interaction/solver_type_" + std::to_string(site.index), solverKindName(site.solver));
        }
        store.writeVector("DMFT_input/interaction/U", us);
        store.writeVector("DMFT_input/interaction/J", js);
        store.writeVector("DMFT_input/multiplicity", mult);

        store.writeString("DMFT_input/version/dmft_scf_version", DMFT_SCF_VERSION);
        store.writeInt("DMFT_input/version/format", archiveFormat);
        store.writeMesh("DMFT_input/mesh", *m_mesh);
        m_lattice->blockStructure().write(store, "DMFT_input/block_structure");
        store.flush();
    });
}


void SelfConsistencyEngine::setup() {
    if (m_state != EngineState::Setup) throw std::logic_error("Self-consistency engine is already set up!");
    m_cfg.validate();
    m_coord.report("\n*** Setting up the DMFT self-consistency ***");

    int count = 0;
    m_coord.broadcastStatus([&]() {
        m_store = std::make_unique<CheckpointStore>(m_cfg.archiveName());
        count = m_store->iterationCount();
    });
    m_coord.broadcast(count);
    m_offset = count;
    if (m_offset > 0) m_coord.report("Archive " + m_cfg.archiveName() + " holds " + std::to_string(m_offset) + " iterations");

    m_sites = m_cfg.sites();
    if (m_lattice->nSites() != static_cast<Eigen::Index>(m_sites.size()))
        throw ConfigurationError("Lattice embedding has " + std::to_string(m_lattice->nSites()) + " sites but the input describes "
                                 + std::to_string(m_sites.size()));
    if (!m_kernels.empty() && m_kernels.size() != m_sites.size()) throw ConfigurationError("Screened interaction kernels need one entry per site");
    m_dcCalc = std::make_unique<DoubleCountingCalculator>(m_cfg.dcOptions(), m_sites, m_lattice->blockStructure().spinOrbit());
    m_muSolver = std::make_unique<ChemicalPotentialSolver>(m_cfg.mu, m_coord);

    // Non-interacting reference
    m_muSolver->initialize(*m_lattice);
    const std::vector<BlockMatrix> refdens = referenceDensity();

    const BlockStructure blocks = chooseBlockStructure(refdens);
    m_lattice->setBlockStructure(blocks);
    m_lattice->invalidateAtomicLevels();
    if (m_coord.isCoordinator()) std::cout << blocks;

    createSolvers();
    if (m_cfg.magnetic && m_cfg.afmOrder) {
        m_afm = AFMShortcut(m_cfg.magmom);
        for (Eigen::Index s = 0; s < static_cast<Eigen::Index>(m_sites.size()); ++s) {
            if (!m_afm.isMapped(s)) continue;
            std::ostringstream ss;
            ss << "Site " << s << " copies the solution of site " << m_afm.at(s).source << (m_afm.at(s).flip ? " with spin flip" : "");
            m_coord.report(ss.str());
        }
    }
    createMixers();
    m_monitor = std::make_unique<ConvergenceMonitor>(m_cfg.convOptions(), static_cast<Eigen::Index>(m_sites.size()));
    loadHistories();

    initializeState(refdens);
    writeInput();
    if (m_offset == 0) writeTableHeader();

    m_phaseEnd = m_offset + m_cfg.nIter;
    m_state = EngineState::Iterating;
}


std::vector<BlockGf> SelfConsistencyEngine::localGreenFunction() const {
    const BlockStructure& blocks = m_lattice->blockStructure();
    std::vector<BlockGf> gloc = m_lattice->extractLocalGreenFunction(m_cfg.lattice.broadening);
    for (Eigen::Index s = 0; s < blocks.nSites(); ++s) gloc[s] = blocks.convert(gloc[s], GfSpace::Lattice, GfSpace::Solver, s);
    return gloc;
}

// G0 = (Sigma + G_loc^-1)^-1
BlockGf SelfConsistencyEngine::computeWeissField(const Eigen::Index isite, const BlockGf& gloc) const {
    BlockGf g0 = gloc.inverse();
    g0 += m_sigma.at(isite);
    g0.invert();
    return g0;
}

void SelfConsistencyEngine::passHybridization(const Eigen::Index isite, const BlockGf& g0) {
    const BlockStructure& blocks = m_lattice->blockStructure();
    const BlockMatrix hloc0 = blocks.convert(blocks.rotate(m_lattice->effectiveAtomicLevels(isite), isite, RotDirection::ToGlobal),
                                             GfSpace::Lattice, GfSpace::Solver, isite);
    BlockGf delta = g0.inverse();
    delta *= -1.0;
    for (auto& [label, arr] : delta) {
        for (Eigen::Index i = 0; i < arr.nfreq(); ++i) arr[i].diagonal().array() += (*m_mesh)(i);
    }
    delta.addStatic(hloc0, -1.0);
    m_solvers[isite]->setHybridization(delta, hloc0);
}

void SelfConsistencyEngine::solveImpurities(const int it) {
    const Eigen::Index nsites = static_cast<Eigen::Index>(m_sites.size());
    for (Eigen::Index s = 0; s < nsites; ++s) {
        if (m_afm.isMapped(s)) continue;
        m_coord.report("    Solving impurity " + std::to_string(s) + " with the " + m_solvers[s]->name() + " solver");
    }

    // Mean-field sites are spread over the processes, one process per site
    m_coord.allStatus([&]() {
        for (Eigen::Index s = 0; s < nsites; ++s) {
            if (m_afm.isMapped(s) || m_sites[s].solver != SolverKind::Hartree) continue;
            if (m_coord.siteOwner(s, nsites) == m_coord.rank()) m_solvers[s]->solve(it);
        }
    });
    for (Eigen::Index s = 0; s < nsites; ++s) {
        if (m_afm.isMapped(s) || m_sites[s].solver != SolverKind::Hartree) continue;
        m_solvers[s]->broadcastResults(m_coord.siteOwner(s, nsites), m_coord.comm());
    }

    // Sampling backends run on all processes together
    for (Eigen::Index s = 0; s < nsites; ++s) {
        if (m_afm.isMapped(s) || m_sites[s].solver != SolverKind::Sampling) continue;
        m_coord.allStatus([&]() {m_solvers[s]->solve(it);});
    }

    const BlockStructure& blocks = m_lattice->blockStructure();
    for (Eigen::Index s = 0; s < nsites; ++s) {
        if (!m_afm.isMapped(s)) continue;
        const AFMMap& map = m_afm.at(s);
        AFMShortcut::apply(*m_solvers[s], *m_solvers[map.source], map.flip, blocks);
        m_coord.report("    Copied the solution of impurity " + std::to_string(map.source) + " to impurity " + std::to_string(s));
    }
}

void SelfConsistencyEngine::pushSelfEnergy(const Eigen::Index isite) {
    const BlockStructure& blocks = m_lattice->blockStructure();
    m_lattice->setSelfEnergy(isite, blocks.convert(m_sigma.at(isite), GfSpace::Solver, GfSpace::Lattice, isite));
}

void SelfConsistencyEngine::updateDoubleCounting(const std::vector<BlockMatrix>& densPost) {
    const BlockStructure& blocks = m_lattice->blockStructure();
    const Eigen::Index nsites = blocks.nSites();
    std::vector<DoubleCountingState> dcs(nsites);
    if (m_cfg.dc && m_cfg.dcDmft) {
        for (Eigen::Index s = 0; s < nsites; ++s) dcs[s].potential = blocks.createMatrix(s, GfSpace::Lattice);
        m_coord.broadcastStatus([&]() {
            for (Eigen::Index s = 0; s < nsites; ++s) dcs[s] = computeDC(s, blocks.convert(densPost[s], GfSpace::Solver, GfSpace::Lattice, s));
        });
        for (Eigen::Index s = 0; s < nsites; ++s) broadcastDoubleCounting(dcs[s], s, blocks, m_mesh, m_coord);
    }
    else {
        for (Eigen::Index s = 0; s < nsites; ++s) dcs[s] = m_lattice->doubleCounting(s);
    }
    for (Eigen::Index s = 0; s < nsites; ++s) {
        if (m_solvers[s]->ownsDoubleCounting()) dcs[s].energy = m_solvers[s]->dcEnergy();
        m_lattice->setDoubleCounting(s, dcs[s]);
    }
}

// Largest change of an orbital occupation, and the largest occupation
static void orbitalOccupationChange(const BlockMatrix& now, const BlockMatrix& before, double& delta, double& magnitude) {
    delta = 0.0;
    magnitude = 0.0;
    for (const auto& [label, n] : now) {
        const Eigen::VectorXd occ = n.diagonal().real();
        const auto it = before.find(label);
        if (it == before.end() || it->second.rows() != n.rows()) throw InconsistentStateError("Density matrices of block " + label + " do not match");
        delta = std::max(delta, (occ - it->second.diagonal().real()).cwiseAbs().maxCoeff());
        magnitude = std::max(magnitude, occ.cwiseAbs().maxCoeff());
    }
}

void SelfConsistencyEngine::recordObservables(const int it, const bool sampling, const double mupre, const std::vector<BlockGf>& gloc,
                                              const std::vector<BlockGf>& g0, const std::vector<BlockGf>& sigmaPrev,
                                              const std::vector<BlockMatrix>& densPost, const double eband) {
    const double mu = m_lattice->chemicalPotential();
    for (Eigen::Index s = 0; s < static_cast<Eigen::Index>(m_sites.size()); ++s) {
        const BlockGf& gimp = m_solvers[s]->greenFunction();
        m_monitor->record(s, "d_mu", std::abs(mu - mupre), std::abs(mu));
        m_monitor->record(s, "d_Gimp", (gimp - gloc[s]).norm(), gimp.norm());
        m_monitor->record(s, "d_Sigma", (m_sigma[s] - sigmaPrev[s]).norm(), m_sigma[s].norm());
        // The remaining changes need an earlier iteration
        if (!m_havePrevious) continue;
        m_monitor->record(s, "d_G0", (g0[s] - m_weiss[s]).norm(), g0[s].norm());
        double dorb, norb;
        orbitalOccupationChange(densPost[s], m_densPost[s], dorb, norb);
        m_monitor->record(s, "d_orb_occ", dorb, norb);
        const double nimp = blockTrace(densPost[s]);
        m_monitor->record(s, "d_imp_occ", std::abs(nimp - blockTrace(m_densPost[s])), nimp);
    }

    if (!m_coord.isCoordinator()) return;
    m_observables["iteration"].push_back(it);
    m_observables["is_sampling"].push_back(sampling ? 1.0 : 0.0);
    m_observables["mu"].push_back(mu);
    m_observables["total_density"].push_back(m_ntot);
    m_observables["E_DC"].push_back(m_lattice->totalDCEnergy());
    if (m_cfg.calcEnergies) m_observables["E_band"].push_back(eband);
    for (Eigen::Index s = 0; s < static_cast<Eigen::Index>(m_sites.size()); ++s) {
        m_observables["imp_occ_" + std::to_string(s)].push_back(blockTrace(densPost[s]));
    }
}

bool SelfConsistencyEngine::savesAt(const int it, const bool sampling, const bool last) const {
    return last || it % (sampling ? m_cfg.samplingSaveFreq : m_cfg.saveFreq) == 0;
}

void SelfConsistencyEngine::persistIteration(const int it, const bool sampling, const double mupre, const std::vector<BlockGf>& g0,
                                             const std::vector<BlockMatrix>& densPre, const std::vector<BlockMatrix>& densPost) {
    m_coord.broadcastStatus([&]() {
        CheckpointStore& store = *m_store;
        const std::string grp = store.beginIteration(it);
        store.writeScalar(grp + "/chemical_potential_pre", mupre);
        store.writeScalar(grp + "/chemical_potential_post", m_lattice->chemicalPotential());
        store.writeScalar(grp + "/total_density", m_ntot);
        store.writeInt(grp + "/is_sampling", sampling);
        for (Eigen::Index s = 0; s < static_cast<Eigen::Index>(m_sites.size()); ++s) {
            const std::string is = std::to_string(s);
            const DoubleCountingState& dc = m_lattice->doubleCounting(s);
            store.writeBlockGf(grp + "/Sigma_freq_" + is, m_sigma[s]);
            store.writeBlockGf(grp + "/G0_freq_" + is, g0[s]);
            store.writeBlockGf(grp + "/Gimp_freq_" + is, m_solvers[s]->greenFunction());
            store.writeBlockMatrix(grp + "/DC_pot_" + is, dc.potential);
            store.writeScalar(grp + "/DC_energ_" + is, dc.energy);
            if (dc.dynamic) store.writeBlockGf(grp + "/DC_dyn_" + is, *dc.dynamic);
            store.writeBlockMatrix(grp + "/dens_mat_pre_" + is, densPre[s]);
            store.writeBlockMatrix(grp + "/dens_mat_post_" + is, densPost[s]);
            if (m_cfg.storeSolver) {
                const ImpuritySolver& solver = *m_solvers[s];
                const std::string sgrp = grp + "/solver_" + is;
                store.writeString(sgrp + "/name", solver.name());
                store.writeBlockGf(sgrp + "/Gimp_unsym", solver.greenFunctionUnsym());
                if (solver.hybridization()) store.writeBlockGf(sgrp + "/Delta", *solver.hybridization());
                if (solver.localLevels()) store.writeBlockMatrix(sgrp + "/Hloc0", *solver.localLevels());
            }
            // Inside the record so that a resume continues with exactly these histories
            m_g0Mixers[s]->saveHistory(store, grp + "/broyden/site_" + is);
        }
        m_monitor->write(store, grp + "/convergence_obs");
        store.commitIteration(it);

        for (const auto& [name, values] : m_observables) store.writeVector("DMFT_results/observables/" + name, values);
        m_monitor->write(store, "DMFT_results/convergence_obs");
        store.flush();
    });
}


bool SelfConsistencyEngine::iterate(const int it, const bool sampling) {
    if (m_state == EngineState::Setup) throw std::logic_error("Self-consistency engine is not set up!");
    const BlockStructure& blocks = m_lattice->blockStructure();
    const Eigen::Index nsites = blocks.nSites();
    m_coord.report("\nIteration " + std::to_string(it) + (sampling ? " (sampling)" : "") + ":");

    if (m_cfg.hFieldIt > 0 && it > m_cfg.hFieldIt && m_lattice->hField() != 0.0) {
        m_lattice->setHField(0.0);
        m_lattice->invalidateAtomicLevels();
        m_coord.report("    Removed the magnetic field h_field");
    }

    const double mupre = m_lattice->chemicalPotential();
    const std::vector<BlockGf> gloc = localGreenFunction();
    std::vector<BlockMatrix> densPre;
    for (const auto& g : gloc) densPre.push_back(g.density());

    std::vector<BlockGf> g0(nsites);
    const std::vector<BlockGf> sigmaPrev(m_sigma);
    for (Eigen::Index s = 0; s < nsites; ++s) {
        BlockGf g = computeWeissField(s, gloc[s]);
        if (m_mesh->kind() == MeshKind::Matsubara) g.makeHermitian();
        if (m_havePrevious && mixesWeissField()) g = m_g0Mixers[s]->mix(m_weiss[s], g);
        blocks.symmetrize(g, s);
        g0[s] = g;
        if (m_afm.isMapped(s)) continue;
        m_solvers[s]->setWeissField(g);
        if (m_solvers[s]->needsHybridization()) passHybridization(s, g);
    }

    solveImpurities(it);

    std::vector<BlockMatrix> densPost;
    for (Eigen::Index s = 0; s < nsites; ++s) {
        BlockGf sig = m_solvers[s]->selfEnergy();
        if (m_havePrevious && m_cfg.sigmaMix != 1.0) sig = m_sigmaMixers[s]->mix(sigmaPrev[s], sig);
        blocks.symmetrize(sig, s);
        m_sigma[s] = sig;
        m_solvers[s]->setSelfEnergy(sig);
        densPost.push_back(m_solvers[s]->greenFunction().density());
    }

    updateDoubleCounting(densPost);
    for (Eigen::Index s = 0; s < nsites; ++s) pushSelfEnergy(s);
    m_muSolver->update(*m_lattice, it);

    double eband = 0.0;
    if (m_cfg.calcEnergies) {
        const DensityCorrection corr = m_lattice->densityCorrection("model");
        m_ntot = corr.totalDensity;
        eband = corr.bandEnergy;
    }
    else m_ntot = m_lattice->totalDensity(m_lattice->chemicalPotential());
    {
        std::ostringstream ss;
        ss << "    Total density " << m_ntot << " at mu = " << m_lattice->chemicalPotential();
        m_coord.report(ss.str());
    }

    recordObservables(it, sampling, mupre, gloc, g0, sigmaPrev, densPost, eband);
    // Convergence is decided on the coordinator; sampling iterations cannot change it
    if (!sampling) {
        bool now = false;
        if (m_coord.isCoordinator()) now = m_monitor->checkConverged().value_or(false);
        m_coord.broadcast(now);
        m_converged = m_converged || now;
    }

    const bool last = it >= m_phaseEnd || (!sampling && m_converged);
    if (savesAt(it, sampling, last)) persistIteration(it, sampling, mupre, g0, densPre, densPost);

    m_weiss = g0;
    m_densPost = densPost;
    m_havePrevious = true;
    appendTableRow(it);
    return m_converged;
}


RunSummary SelfConsistencyEngine::run() {
    if (m_state == EngineState::Setup) setup();
    if (m_state != EngineState::Iterating) throw std::logic_error("Self-consistency engine has already run!");

    RunSummary summary;
    int it = m_offset;
    m_phaseEnd = m_offset + m_cfg.nIter;
    while (it < m_phaseEnd && !m_converged) {
        ++it;
        iterate(it, false);
        ++summary.iterations;
    }

    if (m_converged) {
        m_state = EngineState::Converged;
        m_coord.report("\n*** Required convergence reached after iteration " + std::to_string(it) + " ***");
        if (m_cfg.samplingIterations > 0) {
            m_state = EngineState::Sampling;
            m_phaseEnd = it + m_cfg.samplingIterations;
            m_coord.report("*** Sampling " + std::to_string(m_cfg.samplingIterations) + " more iterations ***");
            while (it < m_phaseEnd) {
                ++it;
                iterate(it, true);
                ++summary.iterations;
            }
        }
    }
    else {
        m_state = EngineState::Exhausted;
        m_coord.report("\n*** Maximum number of iterations reached without convergence ***");
    }
    m_state = EngineState::Done;

    summary.lastIteration = it;
    summary.converged = m_converged;
    summary.mu = m_lattice->chemicalPotential();
    m_coord.barrier();
    return summary;
}


std::string SelfConsistencyEngine::tablePath() const {
    return (std::filesystem::path(m_cfg.seedname).parent_path() / "iterations.txt").string();
}

void SelfConsistencyEngine::writeTableHeader() const {
    if (!m_coord.isCoordinator()) return;
    std::ofstream out(tablePath(), std::ios::trunc);
    if (!out) {
        m_coord.warn("Cannot write " + tablePath());
        return;
    }
    out << std::setw(6) << "it" << std::setw(16) << "mu" << std::setw(16) << "n_tot";
    for (std::size_t s = 0; s < m_sites.size(); ++s) out << std::setw(16) << "n_imp_" + std::to_string(s) << std::setw(16) << "d_Sigma_" + std::to_string(s);
    out << std::setw(6) << "conv" << std::endl;
}

void SelfConsistencyEngine::appendTableRow(const int it) const {
    if (!m_coord.isCoordinator()) return;
    std::ofstream out(tablePath(), std::ios::app);
    if (!out) return;
    out << std::setw(6) << it << std::setw(16) << m_lattice->chemicalPotential() << std::setw(16) << m_ntot;
    for (std::size_t s = 0; s < m_sites.size(); ++s) {
        out << std::setw(16) << blockTrace(m_densPost[s]) << std::setw(16) << m_monitor->latest(s, "d_Sigma");
    }
    out << std::setw(6) << m_converged << std::endl;
}
