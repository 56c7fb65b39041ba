//
//  initial_sigma.cpp
//  dmft-scf
//

#include <sstream>
#include "initial_sigma.hpp"
#include "noise.hpp"


std::string initialSigmaSourceName(const InitialSigmaSource src) {
    switch (src) {
        case InitialSigmaSource::Resume: return "resume";
        case InitialSigmaSource::LoadExternal: return "load_external";
        case InitialSigmaSource::ColdStartWithDC: return "cold_start_with_dc";
        default: return "cold_start_no_dc";
    }
}

InitialSigmaSource selectInitialSigmaSource(const int iterationCount, const std::string& loadSigma, const bool dc) {
    if (iterationCount > 0) return InitialSigmaSource::Resume;
    if (!loadSigma.empty()) return InitialSigmaSource::LoadExternal;
    return dc ? InitialSigmaSource::ColdStartWithDC : InitialSigmaSource::ColdStartNoDC;
}


void broadcastDoubleCounting(DoubleCountingState& dc, const Eigen::Index isite, const BlockStructure& blocks, std::shared_ptr<const FrequencyMesh> mesh,
                             const Coordinator& coord) {
    coord.broadcast(dc.potential);
    coord.broadcast(dc.energy);
    bool dyn = dc.dynamic.has_value();
    coord.broadcast(dyn);
    if (dyn) {
        if (!dc.dynamic) dc.dynamic = blocks.createGf(isite, GfSpace::Lattice, mesh);
        coord.broadcast(*dc.dynamic);
    }
    else dc.dynamic.reset();
}


IterationSnapshot readIterationSnapshot(const CheckpointStore& store, const std::string& group, const BlockStructure& blocks,
                                        std::shared_ptr<const FrequencyMesh> mesh) {
    if (!store.exists(group)) throw ConfigurationError("Archive " + store.filename() + " has no iteration record " + group);
    IterationSnapshot snap;
    snap.mu = store.readScalar(group + "/chemical_potential_post");
    for (Eigen::Index s = 0; s < blocks.nSites(); ++s) {
        const std::string is = std::to_string(s);
        const BlockGf ref = blocks.createGf(s, GfSpace::Solver, mesh);
        snap.sigma.push_back(store.readBlockGf(group + "/Sigma_freq_" + is, mesh));
        snap.weiss.push_back(store.readBlockGf(group + "/G0_freq_" + is, mesh));
        if (!snap.sigma.back().sameStructure(ref) || !snap.weiss.back().sameStructure(ref))
            throw InconsistentStateError("Stored self-energy or Weiss field of site " + is + " in " + group + " does not match the block structure");
        snap.densityPost.push_back(store.readBlockMatrix(group + "/dens_mat_post_" + is));

        DoubleCountingState dc;
        dc.potential = store.readBlockMatrix(group + "/DC_pot_" + is);
        dc.energy = store.readScalar(group + "/DC_energ_" + is);
        if (store.exists(group + "/DC_dyn_" + is)) dc.dynamic = store.readBlockGf(group + "/DC_dyn_" + is, mesh);
        snap.dc.push_back(dc);
    }
    return snap;
}


bool correctLoadedSigma(std::vector<BlockGf>& sigma, const std::vector<DoubleCountingState>& oldDC, const std::vector<DoubleCountingState>& newDC,
                        LatticeEmbedding& lattice, const double atol) {
    const BlockStructure& blocks = lattice.blockStructure();
    if (oldDC.size() != sigma.size() || newDC.size() != sigma.size())
        throw InconsistentStateError("Loaded double counting has a different number of sites than the current calculation");

    bool changed = false;
    for (std::size_t s = 0; s < sigma.size(); ++s) {
        const BlockMatrix& vold = oldDC[s].potential;
        const BlockMatrix& vnew = newDC[s].potential;
        if (vold.size() != vnew.size()) throw InconsistentStateError("Loaded double counting has a different block structure than the current calculation");
        DoubleCountingState delta;
        bool differ = false;
        for (const auto& [label, v] : vold) {
            const auto it = vnew.find(label);
            if (it == vnew.end() || it->second.rows() != v.rows())
                throw InconsistentStateError("Loaded double counting has a different block structure than the current calculation");
            delta.potential[label] = v - it->second;
            if (v.size() > 0 && delta.potential[label].cwiseAbs().maxCoeff() > atol) differ = true;
        }
        if (!differ) continue;
        changed = true;

        // Swap the difference in as the site's double counting and subtract it
        const DoubleCountingState saved = lattice.doubleCounting(s);
        BlockGf siglat = blocks.convert(sigma[s], GfSpace::Solver, GfSpace::Lattice, s);
        lattice.setDoubleCounting(s, delta);
        try {
            lattice.addDoubleCounting(siglat, s, -1.0);
        }
        catch (const std::exception&) {
            lattice.setDoubleCounting(s, saved);
            throw;
        }
        lattice.setDoubleCounting(s, saved);
        sigma[s] = blocks.convert(siglat, GfSpace::Lattice, GfSpace::Solver, s);
    }
    return changed;
}


void addMagneticBias(BlockGf& sigma, const Eigen::Index isite, const double magmom, const BlockStructure& blocks) {
    BlockMatrix bias;
    for (const auto& sb : blocks.site(isite).solver) {
        bias[sb.label] = Eigen::MatrixXcd::Zero(sb.dim(), sb.dim());
        if (sb.spin == SpinChannel::Up) bias[sb.label].diagonal().setConstant(-magmom);
        else if (sb.spin == SpinChannel::Down) bias[sb.label].diagonal().setConstant(magmom);
    }
    sigma.addStatic(bias);
}


InitialState determineInitialSigma(const InitialSigmaOptions& opts, const int iterationCount, CheckpointStore* store, const std::vector<BlockMatrix>& refdens,
                                   const DCFunction& computeDC, LatticeEmbedding& lattice, const Coordinator& coord) {
    const BlockStructure& blocks = lattice.blockStructure();
    const std::shared_ptr<const FrequencyMesh> mesh = lattice.meshPtr();
    const Eigen::Index nsites = blocks.nSites();
    const bool bias = opts.magnetic && !blocks.spinOrbit() && !opts.magmom.empty();
    if (bias && static_cast<Eigen::Index>(opts.magmom.size()) != nsites) throw ConfigurationError("magmom needs one value per inequivalent site");

    InitialState st;
    st.source = selectInitialSigmaSource(iterationCount, opts.loadSigma, opts.dc);
    for (Eigen::Index s = 0; s < nsites; ++s) {
        st.sigma.push_back(blocks.createGf(s, GfSpace::Solver, mesh));
        DoubleCountingState dc;
        dc.potential = blocks.createMatrix(s, GfSpace::Lattice);
        st.dc.push_back(dc);
    }
    double mu = 0.0;

    coord.broadcastStatus([&]() {
        std::ostringstream ss;
        if (st.source == InitialSigmaSource::Resume) {
            if (!store) throw std::logic_error("Resuming needs the archive on the coordinator!");
            IterationSnapshot snap = readIterationSnapshot(*store, CheckpointStore::lastIterGroup(), blocks, mesh);
            st.sigma = snap.sigma;
            st.dc = snap.dc;
            st.lastWeiss = snap.weiss;
            st.lastDensity = snap.densityPost;
            mu = snap.mu;
            // Stored DC already belongs to the stored density (dens_mat_post with dc_dmft, the lattice reference otherwise).
            // It would need recomputing only if the lattice density changed between the runs, which the fixed lattice never does.
            ss << "From previous calculation: loaded Sigma, DC and G0 of iteration " << iterationCount;
        }
        else if (st.source == InitialSigmaSource::LoadExternal) {
            const CheckpointStore ext(opts.loadSigma, true);
            const std::string group = opts.loadSigmaIter < 0 ? CheckpointStore::lastIterGroup() : CheckpointStore::iterationGroup(opts.loadSigmaIter);
            IterationSnapshot snap = readIterationSnapshot(ext, group, blocks, mesh);
            // Recalculated in case U, J or the double-counting formula changed
            if (opts.dc) {
                for (Eigen::Index s = 0; s < nsites; ++s)
                    st.dc[s] = computeDC(s, opts.dcDmft ? blocks.convert(snap.densityPost[s], GfSpace::Solver, GfSpace::Lattice, s) : refdens.at(s));
            }
            st.sigma = snap.sigma;
            const std::string first = st.sigma[0].labels().front();
            const std::complex<double> before = st.sigma[0][first](0, 0, 0);
            if (correctLoadedSigma(st.sigma, snap.dc, st.dc, lattice)) {
                ss << "From " << opts.loadSigma << ": DC changed, initial Sigma is the loaded Sigma with corrected Hartree shift" << std::endl
                   << "    Sigma for imp0, block " << first << ", orbital 0 shifted from " << before.real() << " to " << st.sigma[0][first](0, 0, 0).real();
            }
            else ss << "From " << opts.loadSigma << ": DC remained the same, using loaded Sigma as initial Sigma";
        }
        else {
            for (Eigen::Index s = 0; s < nsites; ++s) {
                if (st.source == InitialSigmaSource::ColdStartWithDC) {
                    st.dc[s] = computeDC(s, refdens.at(s));
                    st.sigma[s].setStatic(blocks.convert(st.dc[s].potential, GfSpace::Lattice, GfSpace::Solver, s));
                }
                if (bias) addMagneticBias(st.sigma[s], s, opts.magmom[s], blocks);
            }
            ss << "Initial Sigma: " << (st.source == InitialSigmaSource::ColdStartWithDC ? "double-counting potential" : "zero")
               << (bias ? " with magnetic bias" : "");
        }
        std::cout << ss.str() << std::endl;
    });

    for (Eigen::Index s = 0; s < nsites; ++s) {
        coord.broadcast(st.sigma[s]);
        broadcastDoubleCounting(st.dc[s], s, blocks, mesh, coord);
    }
    if (st.source == InitialSigmaSource::Resume) {
        if (!coord.isCoordinator()) {
            for (Eigen::Index s = 0; s < nsites; ++s) {
                st.lastWeiss.push_back(blocks.createGf(s, GfSpace::Solver, mesh));
                st.lastDensity.push_back(blocks.createMatrix(s, GfSpace::Solver));
            }
        }
        for (auto& g0 : st.lastWeiss) coord.broadcast(g0);
        for (auto& n : st.lastDensity) coord.broadcast(n);
        coord.broadcast(mu);
        st.mu = mu;
    }

    // Only a cold start gets noise
    if ((st.source == InitialSigmaSource::ColdStartWithDC || st.source == InitialSigmaSource::ColdStartNoDC) && opts.noiseLevel > 0.0) {
        NoiseInjector noise(opts.noiseSeed, coord);
        for (auto& sig : st.sigma) noise.inject(sig, opts.noiseLevel);
        coord.report("Added noise of level " + std::to_string(opts.noiseLevel) + " to the initial Sigma");
    }
    return st;
}
