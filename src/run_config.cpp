//
//  run_config.cpp
//  dmft-scf
//

#include <algorithm>
#include <set>
#include <sstream>
#include "input.hpp"
#include "run_config.hpp"


// Hopping terms <t R="1 0" orb="0 1" im="0.0">-1.0</t> under lattice/hopping, read on the coordinator
static std::vector<HoppingTerm> readHoppings(const pugi::xml_node& docroot, const int dim, const Coordinator& coord) {
    // Flattened as R, a, b, Re t, Im t
    std::vector<double> flat;
    coord.broadcastStatus([&]() {
        const std::string path = "lattice/hopping/t";
        std::size_t n = 0;
        for (pugi::xml_node t = docroot.child("lattice").child("hopping").child("t"); t; t = t.next_sibling("t")) {
            const std::vector<long> R = parseList<long>(t.attribute("R").value(), path + ".R");
            const std::vector<long> orb = parseList<long>(t.attribute("orb").value(), path + ".orb");
            if (static_cast<int>(R.size()) != dim) throw ConfigurationError("Hopping term " + std::to_string(n) + " needs a lattice vector R of dimension " + std::to_string(dim));
            if (orb.size() != 2) throw ConfigurationError("Hopping term " + std::to_string(n) + " needs exactly two orbital indices");
            for (const long r : R) flat.push_back(static_cast<double>(r));
            flat.push_back(static_cast<double>(orb[0]));
            flat.push_back(static_cast<double>(orb[1]));
            flat.push_back(parseValue<double>(t.child_value(), path));
            flat.push_back(t.attribute("im") ? parseValue<double>(t.attribute("im").value(), path + ".im") : 0.0);
            ++n;
        }
        std::cout << "Input lattice/hopping has " << n << " terms" << std::endl;
    });
    coord.broadcast(flat);

    const std::size_t stride = dim + 4;
    std::vector<HoppingTerm> terms;
    for (std::size_t i = 0; i + stride <= flat.size(); i += stride) {
        HoppingTerm term;
        term.R.resize(dim);
        for (int d = 0; d < dim; ++d) term.R(d) = static_cast<int>(flat[i + d]);
        term.a = static_cast<Eigen::Index>(flat[i + dim]);
        term.b = static_cast<Eigen::Index>(flat[i + dim + 1]);
        term.t = std::complex<double>(flat[i + dim + 2], flat[i + dim + 3]);
        terms.push_back(term);
    }
    return terms;
}


// Manual solver blocks <site index="0"><block label="up_0">0 1</block></site> under general/pick_solver_struct
static BlockSelection readBlockSelection(const pugi::xml_node& docroot, const Coordinator& coord) {
    // One line per block: site, label, kept indices
    std::string flat;
    coord.broadcastStatus([&]() {
        const std::string path = "general/pick_solver_struct/site";
        std::ostringstream ss;
        for (pugi::xml_node site = docroot.child("general").child("pick_solver_struct").child("site"); site; site = site.next_sibling("site")) {
            const long s = parseValue<long>(site.attribute("index").value(), path + ".index");
            for (pugi::xml_node b = site.child("block"); b; b = b.next_sibling("block")) {
                const std::string label = b.attribute("label").value();
                if (label.empty() || label.find_first_of(" \t\n") != std::string::npos)
                    throw ConfigurationError("Every block of " + path + " needs a label without whitespace");
                const std::vector<long> idx = parseList<long>(b.child_value(), path + "/block");
                if (idx.empty()) throw ConfigurationError("Block " + label + " of " + path + " keeps no orbital");
                ss << s << ' ' << label;
                for (const long i : idx) ss << ' ' << i;
                ss << '\n';
            }
        }
        flat = ss.str();
        if (!flat.empty()) std::cout << "Input general/pick_solver_struct is\n" << flat << std::flush;
    });
    coord.broadcast(flat);

    BlockSelection selection;
    std::istringstream lines(flat);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream ls(line);
        long s, i;
        std::string label;
        ls >> s >> label;
        std::vector<Eigen::Index>& idx = selection[s][label];
        while (ls >> i) idx.push_back(i);
    }
    return selection;
}

// Degenerate solver blocks <site index="0"><group>up_0 up_1</group></site> under general/mapped_solver_struct_degeneracies
static DegeneracyMap readDegeneracyMap(const pugi::xml_node& docroot, const Coordinator& coord) {
    // One line per group: site, labels
    std::string flat;
    coord.broadcastStatus([&]() {
        const std::string path = "general/mapped_solver_struct_degeneracies/site";
        std::ostringstream ss;
        for (pugi::xml_node site = docroot.child("general").child("mapped_solver_struct_degeneracies").child("site"); site; site = site.next_sibling("site")) {
            const long s = parseValue<long>(site.attribute("index").value(), path + ".index");
            for (pugi::xml_node g = site.child("group"); g; g = g.next_sibling("group")) {
                const std::vector<std::string> labels = parseList<std::string>(g.child_value(), path + "/group");
                if (labels.size() < 2) throw ConfigurationError("Every group of " + path + " needs at least two block labels");
                ss << s;
                for (const auto& label : labels) ss << ' ' << label;
                ss << '\n';
            }
        }
        flat = ss.str();
        if (!flat.empty()) std::cout << "Input general/mapped_solver_struct_degeneracies is\n" << flat << std::flush;
    });
    coord.broadcast(flat);

    DegeneracyMap degs;
    std::istringstream lines(flat);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream ls(line);
        long s;
        ls >> s;
        std::vector<std::string> group;
        std::string label;
        while (ls >> label) group.push_back(label);
        degs[s].push_back(group);
    }
    return degs;
}


RunConfig RunConfig::load(const std::string& filename, const Coordinator& coord) {
    pugi::xml_document doc;
    std::string text;
    coord.broadcastStatus([&]() {
        const pugi::xml_parse_result res = doc.load_file(filename.c_str());
        if (!res) throw ConfigurationError("Cannot load input file " + filename + ": " + res.description());
        std::ostringstream ss;
        doc.save(ss);
        text = ss.str();
    });
    return parse(doc, text, coord);
}

RunConfig RunConfig::fromString(const std::string& xml, const Coordinator& coord) {
    pugi::xml_document doc;
    coord.broadcastStatus([&]() {
        const pugi::xml_parse_result res = doc.load_string(xml.c_str());
        if (!res) throw ConfigurationError(std::string("Cannot parse input: ") + res.description());
    });
    return parse(doc, xml, coord);
}

RunConfig RunConfig::parse(const pugi::xml_document& doc, const std::string& text, const Coordinator& coord) {
    const pugi::xml_node docroot = doc.child("input");
    coord.broadcastStatus([&]() {
        if (!docroot) throw ConfigurationError("Input has no <input> root element");
    });

    RunConfig cfg;
    if (coord.isCoordinator()) cfg.inputText = text;
    std::string mumethod = "dichotomy";

    readxml_bcast(cfg.seedname, docroot, "general/seedname", coord);
    readxml_bcast(cfg.beta, docroot, "general/beta", coord);
    readxml_bcast(cfg.nIw, docroot, "general/n_iw", coord);
    readxml_bcast(cfg.nIter, docroot, "general/n_iter_dmft", coord);
    readxml_bcast(cfg.samplingIterations, docroot, "general/sampling_iterations", coord);
    readxml_bcast(cfg.samplingSaveFreq, docroot, "general/sampling_h5_save_freq", coord);
    readxml_bcast(cfg.mu.precision, docroot, "general/prec_mu", coord);
    readxml_bcast(cfg.mu.initialGuess, docroot, "general/mu_initial_guess", coord);
    readxml_bcast(cfg.mu.fixedValue, docroot, "general/fixed_mu_value", coord);
    readxml_bcast(cfg.mu.updateFreq, docroot, "general/mu_update_freq", coord);
    readxml_bcast(mumethod, docroot, "general/mu_method", coord);
    readxml_bcast(cfg.mu.target, docroot, "general/density_target", coord);
    readxml_bcast(cfg.magnetic, docroot, "general/magnetic", coord);
    readxml_bcast(cfg.magmom, docroot, "general/magmom", coord);
    readxml_bcast(cfg.afmOrder, docroot, "general/afm_order", coord);
    readxml_bcast(cfg.noiseLevel, docroot, "general/noise_level_initial_sigma", coord);
    readxml_bcast(cfg.noiseSeed, docroot, "general/noise_seed", coord);
    readxml_bcast(cfg.loadSigma, docroot, "general/load_sigma", coord);
    readxml_bcast(cfg.loadSigmaIter, docroot, "general/load_sigma_iter", coord);
    readxml_bcast(cfg.blockThreshold, docroot, "general/block_threshold", coord);
    readxml_bcast(cfg.setRot, docroot, "general/set_rot", coord);
    readxml_bcast(cfg.enforceOffDiag, docroot, "general/enforce_off_diag", coord);
    cfg.pickSolverStruct = readBlockSelection(docroot, coord);
    cfg.solverStructDegeneracies = readDegeneracyMap(docroot, coord);
    readxml_bcast(cfg.hField, docroot, "general/h_field", coord);
    readxml_bcast(cfg.hFieldIt, docroot, "general/h_field_it", coord);
    readxml_bcast(cfg.dc, docroot, "general/dc", coord);
    readxml_bcast(cfg.dcType, docroot, "general/dc_type", coord);
    readxml_bcast(cfg.dcDmft, docroot, "general/dc_dmft", coord);
    readxml_bcast(cfg.dcU, docroot, "general/dc_U", coord);
    readxml_bcast(cfg.dcJ, docroot, "general/dc_J", coord);
    readxml_bcast(cfg.dcFixedValue, docroot, "general/dc_fixed_value", coord);
    readxml_bcast(cfg.dcFixedOcc, docroot, "general/dc_fixed_occ", coord);
    readxml_bcast(cfg.dcNominal, docroot, "general/dc_nominal", coord);
    readxml_bcast(cfg.dcFactor, docroot, "general/dc_factor", coord);
    readxml_bcast(cfg.dcOrbShift, docroot, "general/dc_orb_shift", coord);
    readxml_bcast(cfg.calcEnergies, docroot, "general/calc_energies", coord);
    readxml_bcast(cfg.saveFreq, docroot, "general/h5_save_freq", coord);
    readxml_bcast(cfg.storeSolver, docroot, "general/store_solver", coord);
    cfg.mu.method = muMethodFromString(mumethod);

    readxml_bcast(cfg.g0Mix, docroot, "mixing/g0_mix", coord);
    readxml_bcast(cfg.g0MixType, docroot, "mixing/g0_mix_type", coord);
    readxml_bcast(cfg.sigmaMix, docroot, "mixing/sigma_mix", coord);
    readxml_bcast(cfg.broyMaxIt, docroot, "mixing/broy_max_it", coord);

    readxml_bcast(cfg.occConvCrit, docroot, "convergence/occ_conv_crit", coord);
    readxml_bcast(cfg.impOccConvCrit, docroot, "convergence/imp_occ_conv_crit", coord);
    readxml_bcast(cfg.gimpConvCrit, docroot, "convergence/gimp_conv_crit", coord);
    readxml_bcast(cfg.g0ConvCrit, docroot, "convergence/g0_conv_crit", coord);
    readxml_bcast(cfg.sigmaConvCrit, docroot, "convergence/sigma_conv_crit", coord);
    readxml_bcast(cfg.muConvCrit, docroot, "convergence/mu_conv_crit", coord);
    readxml_bcast(cfg.convWindow, docroot, "convergence/conv_window", coord);
    readxml_bcast(cfg.convMode, docroot, "convergence/conv_mode", coord);

    readxml_bcast(cfg.solverType, docroot, "solver/type", coord);
    readxml_bcast(cfg.U, docroot, "solver/U", coord);
    readxml_bcast(cfg.J, docroot, "solver/J", coord);
    readxml_bcast(cfg.hartreeMaxIter, docroot, "solver/hartree_max_iter", coord);
    readxml_bcast(cfg.hartreeTol, docroot, "solver/hartree_tol", coord);
    readxml_bcast(cfg.measureChi, docroot, "solver/measure_chi", coord);

    readxml_bcast(cfg.lattice.dim, docroot, "lattice/dim", coord);
    readxml_bcast(cfg.lattice.nk, docroot, "lattice/nk", coord);
    readxml_bcast(cfg.lattice.norb, docroot, "lattice/norb", coord);
    readxml_bcast(cfg.lattice.shellSite, docroot, "lattice/shell_site", coord);
    readxml_bcast(cfg.lattice.onsite, docroot, "lattice/onsite", coord);
    readxml_bcast(cfg.lattice.broadening, docroot, "lattice/broadening", coord);
    readxml_bcast(cfg.lattice.spinOrbit, docroot, "lattice/spin_orbit", coord);
    if (cfg.lattice.dim < 1 || cfg.lattice.dim > 3) throw ConfigurationError("lattice/dim must be 1, 2 or 3");
    cfg.lattice.hoppings = readHoppings(docroot, cfg.lattice.dim, coord);

    if (cfg.lattice.shellSite.empty()) {
        for (std::size_t ish = 0; ish < cfg.lattice.norb.size(); ++ish) cfg.lattice.shellSite.push_back(static_cast<long>(ish));
    }
    cfg.validate();
    return cfg;
}


Eigen::Index RunConfig::nSites() const {
    if (lattice.shellSite.empty()) return 0;
    return static_cast<Eigen::Index>(*std::max_element(lattice.shellSite.begin(), lattice.shellSite.end())) + 1;
}

std::vector<Site> RunConfig::sites() const {
    const Eigen::Index n = nSites();
    const std::vector<std::string> types = solverType.expand(n, "solver/type");
    const std::vector<double> us = U.expand(n, "solver/U");
    const std::vector<double> js = J.expand(n, "solver/J");
    std::vector<Site> sites(n);
    for (Eigen::Index s = 0; s < n; ++s) {
        sites[s].index = static_cast<int>(s);
        sites[s].multiplicity = 0;
        sites[s].solver = solverKindFromString(types[s]);
        sites[s].U = us[s];
        sites[s].J = js[s];
    }
    for (std::size_t ish = 0; ish < lattice.shellSite.size(); ++ish) {
        Site& st = sites.at(lattice.shellSite[ish]);
        st.norb = lattice.norb[ish];
        ++st.multiplicity;
    }
    return sites;
}

std::vector<CorrelatedShell> RunConfig::shells() const {
    std::vector<CorrelatedShell> shells;
    for (std::size_t ish = 0; ish < lattice.norb.size(); ++ish) shells.push_back({lattice.norb[ish], lattice.shellSite[ish]});
    return shells;
}

DCOptions RunConfig::dcOptions() const {
    const Eigen::Index n = nSites();
    DCOptions opts;
    for (const auto& t : dcType.expand(n, "general/dc_type")) opts.formula.push_back(dcFormulaFromString(t));
    opts.U = dcU.empty() ? U.expand(n, "solver/U") : dcU.expand(n, "general/dc_U");
    opts.J = dcJ.empty() ? J.expand(n, "solver/J") : dcJ.expand(n, "general/dc_J");
    opts.fixedValue = dcFixedValue;
    if (!dcFixedOcc.empty()) {
        for (const double occ : dcFixedOcc.expand(n, "general/dc_fixed_occ")) opts.fixedOcc.push_back(occ);
    }
    opts.nominal = dcNominal;
    opts.factor = dcFactor;
    opts.orbShift = dcOrbShift;
    return opts;
}

ConvOptions RunConfig::convOptions() const {
    ConvOptions opts;
    if (muConvCrit) opts.criteria.push_back({"d_mu", *muConvCrit});
    if (occConvCrit) opts.criteria.push_back({"d_orb_occ", *occConvCrit});
    if (impOccConvCrit) opts.criteria.push_back({"d_imp_occ", *impOccConvCrit});
    if (gimpConvCrit) opts.criteria.push_back({"d_Gimp", *gimpConvCrit});
    if (g0ConvCrit) opts.criteria.push_back({"d_G0", *g0ConvCrit});
    if (sigmaConvCrit) opts.criteria.push_back({"d_Sigma", *sigmaConvCrit});
    opts.window = static_cast<std::size_t>(convWindow);
    opts.mode = convModeFromString(convMode);
    return opts;
}

InitialSigmaOptions RunConfig::initialSigmaOptions() const {
    InitialSigmaOptions opts;
    opts.dc = dc;
    opts.dcDmft = dcDmft;
    opts.magnetic = magnetic;
    opts.magmom = magmom;
    opts.noiseLevel = noiseLevel;
    opts.noiseSeed = static_cast<unsigned int>(noiseSeed);
    opts.loadSigma = loadSigma;
    opts.loadSigmaIter = loadSigmaIter;
    return opts;
}


void RunConfig::validate() const {
    if (beta <= 0.0 || nIw < 1) throw ConfigurationError("general/beta and general/n_iw must be positive");
    if (nIter < 0 || samplingIterations < 0) throw ConfigurationError("Iteration counts must be non-negative");
    if (saveFreq < 1 || samplingSaveFreq < 1) throw ConfigurationError("Archive save frequencies must be positive");
    if (g0Mix <= 0.0 || g0Mix > 1.0 || sigmaMix <= 0.0 || sigmaMix > 1.0) throw ConfigurationError("Mixing parameters must lie in (0, 1]");
    mixTypeFromString(g0MixType);
    if (broyMaxIt < 1) throw ConfigurationError("mixing/broy_max_it must be positive");
    if (convWindow < 1) throw ConfigurationError("convergence/conv_window must be positive");
    convModeFromString(convMode);
    if (noiseLevel < 0.0) throw ConfigurationError("general/noise_level_initial_sigma must be non-negative");
    if (setRot != "none" && setRot != "den" && setRot != "hloc") throw ConfigurationError("general/set_rot must be none, den or hloc");
    if (blockThreshold <= 0.0) throw ConfigurationError("general/block_threshold must be positive");
    if (!mu.fixedValue && mu.target <= 0.0) throw ConfigurationError("general/density_target is needed unless general/fixed_mu_value is given");
    if (hFieldIt < 0) throw ConfigurationError("general/h_field_it must be non-negative");

    if (lattice.norb.empty()) throw ConfigurationError("lattice/norb must list the orbital dimension of every correlated shell");
    if (lattice.shellSite.size() != lattice.norb.size()) throw ConfigurationError("lattice/shell_site needs one entry per correlated shell");
    if (static_cast<int>(lattice.nk.size()) != lattice.dim) throw ConfigurationError("lattice/nk needs one entry per dimension");
    for (const long n : lattice.norb) if (n < 1) throw ConfigurationError("Orbital dimensions must be positive");
    const Eigen::Index n = nSites();
    std::vector<long> siteNorb(n, 0);
    for (std::size_t ish = 0; ish < lattice.shellSite.size(); ++ish) {
        const long s = lattice.shellSite[ish];
        if (s < 0) throw ConfigurationError("lattice/shell_site entries must be non-negative");
        if (siteNorb[s] != 0 && siteNorb[s] != lattice.norb[ish])
            throw ConfigurationError("Correlated shells of site " + std::to_string(s) + " have different orbital dimensions");
        siteNorb[s] = lattice.norb[ish];
    }
    for (Eigen::Index s = 0; s < n; ++s) if (siteNorb[s] == 0) throw ConfigurationError("Site " + std::to_string(s) + " has no correlated shell");

    // Expansion checks the per-site list lengths
    const std::vector<Site> st = sites();
    enforceOffDiag.expand(n, "general/enforce_off_diag");
    for (const auto& [s, blocks] : pickSolverStruct) {
        if (s < 0 || s >= n) throw ConfigurationError("general/pick_solver_struct names site " + std::to_string(s) + " of " + std::to_string(n));
        for (const auto& [label, idx] : blocks) {
            for (const auto i : idx) if (i < 0) throw ConfigurationError("general/pick_solver_struct has a negative index in block " + label);
        }
    }
    for (const auto& kv : solverStructDegeneracies) {
        if (kv.first < 0 || kv.first >= n)
            throw ConfigurationError("general/mapped_solver_struct_degeneracies names site " + std::to_string(kv.first) + " of " + std::to_string(n));
    }
    dcOptions();
    if (!magmom.empty() && static_cast<Eigen::Index>(magmom.size()) != n) throw ConfigurationError("general/magmom needs one value per inequivalent site");
    if (afmOrder && !magnetic) throw ConfigurationError("general/afm_order needs a magnetic calculation");
    if (afmOrder && magmom.empty()) throw ConfigurationError("general/afm_order needs general/magmom");
    if (afmOrder && lattice.spinOrbit) throw ConfigurationError("general/afm_order cannot be used with spin-orbit coupling");
    for (const auto& site : st) {
        if (site.solver == SolverKind::Hartree && measureChi) throw ConfigurationError("The hartree solver cannot measure chi");
    }
}


std::shared_ptr<TightBindingLattice> makeLattice(const RunConfig& cfg, const MPI_Comm& comm) {
    auto mesh = std::make_shared<const FrequencyMesh>(FrequencyMesh::matsubara(cfg.beta, cfg.nIw));
    std::vector<Eigen::Index> norbs;
    for (const auto& site : cfg.sites()) norbs.push_back(site.norb);
    const BlockStructure blocks(norbs, cfg.lattice.spinOrbit);

    auto lattice = std::make_shared<TightBindingLattice>(mesh, blocks, cfg.shells(), comm);
    lattice->primVecs(Eigen::MatrixXd::Identity(cfg.lattice.dim, cfg.lattice.dim));
    lattice->kGridSizes(std::vector<Eigen::Index>(cfg.lattice.nk.begin(), cfg.lattice.nk.end()));
    if (!cfg.lattice.onsite.empty()) lattice->onsiteEnergies(Eigen::Map<const Eigen::VectorXd>(cfg.lattice.onsite.data(), cfg.lattice.onsite.size()));
    for (const auto& term : cfg.lattice.hoppings) lattice->addHopping(term);
    lattice->setHField(cfg.hField);
    return lattice;
}
