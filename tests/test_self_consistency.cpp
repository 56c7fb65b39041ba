//
//  test_self_consistency.cpp
//  dmft-scf
//

#include <cmath>
#include "catch2/catch.hpp"
#include "test_common.hpp"
#include "self_consistency.hpp"


// Static self-energy 0.5 (1 + 2^-it) if decaying, else a constant 0.5
class StaticSigmaBackend : public SamplingBackend {
public:
    explicit StaticSigmaBackend(const bool decaying) : m_decaying(decaying) {}
    SamplingOutput run(const SamplingInput& in) override {
        SamplingOutput out;
        out.selfEnergy = in.weissField->zeroLike();
        fillStatic(out.selfEnergy, m_decaying ? 0.5 * (1.0 + std::pow(2.0, -in.iteration)) : 0.5);
        return out;
    }

private:
    bool m_decaying;
};

// Half-filled single-orbital chain solved by the sampling backend
static std::string chainInput(const std::string& seedname, const int niter, const std::string& extra = "", const std::string& convergence = "",
                              const std::string& mixing = "") {
    return "<input><general><seedname>" + seedname + "</seedname><beta>10</beta><n_iw>64</n_iw><n_iter_dmft>" + std::to_string(niter)
           + "</n_iter_dmft><density_target>1.0</density_target><prec_mu>0.001</prec_mu><dc>false</dc>" + extra
           + "</general><mixing>" + mixing + "</mixing><convergence>" + convergence + "</convergence><solver><type>sampling</type><U>2.0</U></solver>"
           + "<lattice><dim>1</dim><nk>32</nk><norb>1</norb><hopping><t R=\"1\" orb=\"0 0\">-1.0</t></hopping></lattice></input>";
}

static RunSummary runChain(const RunConfig& cfg, const Coordinator& coord, const bool decaying, int* offset = nullptr) {
    SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(decaying));
    const RunSummary summary = engine.run();
    if (offset) *offset = engine.iterationOffset();
    return summary;
}


TEST_CASE("Iterations are archived until the budget is used", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_plain_" + std::to_string(coord.rank()));
    const RunConfig cfg = RunConfig::fromString(chainInput(dir.file("chain"), 3), coord);

    SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(true));
    CHECK(engine.state() == EngineState::Setup);
    CHECK_THROWS_AS(engine.iterate(1), std::logic_error);
    const RunSummary summary = engine.run();
    CHECK(engine.state() == EngineState::Done);
    CHECK(engine.initialSource() == InitialSigmaSource::ColdStartNoDC);
    CHECK(summary.iterations == 3);
    CHECK(summary.lastIteration == 3);
    CHECK_FALSE(summary.converged);
    CHECK(engine.totalDensity() == Approx(1.0).margin(2e-3));
    CHECK(engine.selfEnergy(0)["up_0"](5, 0, 0).real() == Approx(0.5625));
    CHECK(engine.monitor().history(0, "d_Sigma").size() == 3);
    CHECK(engine.monitor().history(0, "d_G0").size() == 2);
    CHECK_THROWS_AS(engine.run(), std::logic_error);

    if (coord.isCoordinator()) {
        const CheckpointStore store(cfg.archiveName(), true);
        CHECK(store.iterationCount() == 3);
        for (int it = 1; it <= 3; ++it) CHECK(store.exists(CheckpointStore::iterationGroup(it) + "/Sigma_freq_0"));
        CHECK(store.exists("DMFT_input/block_structure"));
        CHECK(store.readString("DMFT_input/params/input_xml") == cfg.inputText);
        CHECK(store.readString("DMFT_input/params/initial_sigma") == "cold_start_no_dc");
        CHECK(store.readVector("DMFT_results/observables/mu").size() == 3);
        CHECK(store.readScalar("DMFT_results/last_iter/chemical_potential_post") == Approx(summary.mu));
        CHECK(store.readVector("DMFT_results/convergence_obs/d_Sigma_0").size() == 3);
    }
}

TEST_CASE("Three-site ring with static double counting", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_ring_" + std::to_string(coord.rank()));
    const std::string xml = "<input><general><seedname>" + dir.file("ring") + "</seedname><beta>10</beta><n_iw>64</n_iw>"
        "<n_iter_dmft>5</n_iter_dmft><density_target>3.0</density_target><prec_mu>0.01</prec_mu><mu_initial_guess>6.0</mu_initial_guess>"
        "<dc>true</dc><dc_type>fll</dc_type></general><mixing><sigma_mix>0.6</sigma_mix></mixing>"
        "<solver><type>sampling</type><U>4.0</U><J>0.8</J></solver>"
        "<lattice><dim>1</dim><nk>32</nk><norb>1 1 1</norb><hopping>"
        "<t R=\"0\" orb=\"0 1\">-1.0</t><t R=\"0\" orb=\"1 2\">-1.0</t><t R=\"1\" orb=\"2 0\">-1.0</t>"
        "</hopping></lattice></input>";
    const RunConfig cfg = RunConfig::fromString(xml, coord);
    SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(true));
    const RunSummary summary = engine.run();

    CHECK(engine.initialSource() == InitialSigmaSource::ColdStartWithDC);
    CHECK(summary.iterations == 5);
    CHECK_FALSE(summary.converged);
    CHECK(std::abs(engine.totalDensity() - 3.0) < 0.01);
    for (Eigen::Index s = 0; s < 3; ++s) {
        const std::vector<double> d = engine.monitor().history(s, "d_Sigma");
        REQUIRE(d.size() == 5);
        // Mixed sequence 0.75, 0.675, 0.6075, ... of the decaying backend
        CHECK(d[2] / d[1] == Approx(0.9));
        for (std::size_t i = 2; i < d.size(); ++i) CHECK(d[i] <= d[i - 1]);
        CHECK(engine.selfEnergy(s)["up_0"](0, 0, 0).real() == Approx(0.534075));
    }

    if (coord.isCoordinator()) {
        const CheckpointStore store(cfg.archiveName(), true);
        CHECK(store.iterationCount() == 5);
        for (int it = 1; it <= 5; ++it) CHECK(store.exists(CheckpointStore::iterationGroup(it)));
        CHECK_FALSE(store.exists(CheckpointStore::iterationGroup(6)));
        // Static double counting of a singly occupied orbital, U (N - 1/2) - J (N/2 - 1/2)
        CHECK(store.readBlockMatrix("DMFT_results/last_iter/DC_pot_1").at("up")(0, 0).real() == Approx(2.0).margin(0.05));
    }
}

TEST_CASE("Resumed run continues the archived iterations", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_resume_" + std::to_string(coord.rank()));
    const std::string straight = dir.file("straight"), split = dir.file("split");

    runChain(RunConfig::fromString(chainInput(straight, 3), coord), coord, true);
    runChain(RunConfig::fromString(chainInput(split, 2), coord), coord, true);
    int offset = -1;
    const RunSummary resumed = runChain(RunConfig::fromString(chainInput(split, 1), coord), coord, true, &offset);
    CHECK(offset == 2);
    CHECK(resumed.iterations == 1);
    CHECK(resumed.lastIteration == 3);

    if (coord.isCoordinator()) {
        const CheckpointStore a(straight + ".h5", true), b(split + ".h5", true);
        CHECK(b.iterationCount() == 3);
        const std::string grp = CheckpointStore::iterationGroup(3);
        CHECK(a.readScalar(grp + "/chemical_potential_post") == b.readScalar(grp + "/chemical_potential_post"));
        const auto mesh = std::make_shared<const FrequencyMesh>(a.readMesh("DMFT_input/mesh"));
        CHECK(maxAbsDiff(a.readBlockGf(grp + "/Sigma_freq_0", mesh), b.readBlockGf(grp + "/Sigma_freq_0", mesh)) == 0.0);
        CHECK(maxAbsDiff(a.readBlockGf(grp + "/G0_freq_0", mesh), b.readBlockGf(grp + "/G0_freq_0", mesh)) == 0.0);
        CHECK(a.readVector("DMFT_results/convergence_obs/d_Sigma_0") == b.readVector("DMFT_results/convergence_obs/d_Sigma_0"));
        CHECK(b.readVector("DMFT_results/observables/iteration") == std::vector<double>{1.0, 2.0, 3.0});
    }
}

TEST_CASE("Resume without iterations leaves the archive untouched", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_resume_zero_" + std::to_string(coord.rank()));
    const std::string seed = dir.file("zero");
    const std::string grp = CheckpointStore::iterationGroup(2);
    runChain(RunConfig::fromString(chainInput(seed, 2), coord), coord, true);

    double mu = 0.0, dcEnergy = 0.0;
    BlockGf sigma;
    BlockMatrix dcPot;
    std::shared_ptr<const FrequencyMesh> mesh;
    if (coord.isCoordinator()) {
        const CheckpointStore store(seed + ".h5", true);
        mesh = std::make_shared<const FrequencyMesh>(store.readMesh("DMFT_input/mesh"));
        mu = store.readScalar(grp + "/chemical_potential_post");
        sigma = store.readBlockGf(grp + "/Sigma_freq_0", mesh);
        dcPot = store.readBlockMatrix(grp + "/DC_pot_0");
        dcEnergy = store.readScalar(grp + "/DC_energ_0");
    }

    const RunConfig cfg = RunConfig::fromString(chainInput(seed, 0), coord);
    int offset = -1;
    {
        SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(true));
        const RunSummary summary = engine.run();
        offset = engine.iterationOffset();
        CHECK(engine.initialSource() == InitialSigmaSource::Resume);
        CHECK(engine.state() == EngineState::Done);
        CHECK(summary.iterations == 0);
        CHECK(summary.lastIteration == 2);
        CHECK_FALSE(summary.converged);
        CHECK(engine.selfEnergy(0)["up_0"](5, 0, 0).real() == Approx(0.625));
    }
    CHECK(offset == 2);

    if (coord.isCoordinator()) {
        const CheckpointStore store(seed + ".h5", true);
        CHECK(store.iterationCount() == 2);
        CHECK_FALSE(store.exists(CheckpointStore::iterationGroup(3)));
        CHECK(store.readScalar(grp + "/chemical_potential_post") == mu);
        CHECK(maxAbsDiff(store.readBlockGf(grp + "/Sigma_freq_0", mesh), sigma) == 0.0);
        const BlockMatrix pot = store.readBlockMatrix(grp + "/DC_pot_0");
        for (const auto& [label, m] : dcPot) CHECK((pot.at(label) - m).cwiseAbs().maxCoeff() == 0.0);
        CHECK(store.readScalar(grp + "/DC_energ_0") == dcEnergy);
        CHECK(store.readVector("DMFT_results/observables/mu").size() == 2);
    }
}

TEST_CASE("Broyden mixing resumes from the archived history", "[scf][mixing]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_broyden_" + std::to_string(coord.rank()));
    const std::string straight = dir.file("straight"), split = dir.file("split");
    const std::string mixing = "<g0_mix_type>broyden</g0_mix_type><g0_mix>0.5</g0_mix><broy_max_it>3</broy_max_it>";

    runChain(RunConfig::fromString(chainInput(straight, 4, "", "", mixing), coord), coord, true);
    runChain(RunConfig::fromString(chainInput(split, 2, "", "", mixing), coord), coord, true);
    int offset = -1;
    const RunSummary resumed = runChain(RunConfig::fromString(chainInput(split, 2, "", "", mixing), coord), coord, true, &offset);
    CHECK(offset == 2);
    CHECK(resumed.lastIteration == 4);

    if (coord.isCoordinator()) {
        const CheckpointStore a(straight + ".h5", true), b(split + ".h5", true);
        CHECK(b.iterationCount() == 4);
        CHECK(b.exists(CheckpointStore::iterationGroup(2) + "/broyden/site_0"));
        const std::string grp = CheckpointStore::iterationGroup(4);
        CHECK(a.readScalar(grp + "/chemical_potential_post") == b.readScalar(grp + "/chemical_potential_post"));
        const auto mesh = std::make_shared<const FrequencyMesh>(a.readMesh("DMFT_input/mesh"));
        CHECK(maxAbsDiff(a.readBlockGf(grp + "/Sigma_freq_0", mesh), b.readBlockGf(grp + "/Sigma_freq_0", mesh)) == 0.0);
        CHECK(maxAbsDiff(a.readBlockGf(grp + "/G0_freq_0", mesh), b.readBlockGf(grp + "/G0_freq_0", mesh)) == 0.0);
        CHECK(a.readVector("DMFT_results/convergence_obs/d_G0_0") == b.readVector("DMFT_results/convergence_obs/d_G0_0"));
    }
}

TEST_CASE("Convergence is sticky and followed by sampling", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_sticky_" + std::to_string(coord.rank()));
    const std::string conv = "<sigma_conv_crit>1e-8</sigma_conv_crit><conv_window>1</conv_window>";

    SECTION("iterations after convergence keep the flag") {
        const RunConfig cfg = RunConfig::fromString(chainInput(dir.file("manual"), 10, "", conv), coord);
        SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(false));
        engine.setup();
        CHECK(engine.state() == EngineState::Iterating);
        CHECK_FALSE(engine.iterate(1));
        CHECK(engine.iterate(2));
        CHECK(engine.iterate(3));
        CHECK(engine.converged());
    }
    SECTION("converged run samples more iterations") {
        const RunConfig cfg = RunConfig::fromString(
            chainInput(dir.file("sampled"), 10, "<sampling_iterations>2</sampling_iterations><sampling_h5_save_freq>1</sampling_h5_save_freq>", conv), coord);
        const RunSummary summary = runChain(cfg, coord, false);
        CHECK(summary.converged);
        CHECK(summary.iterations == 4);
        CHECK(summary.lastIteration == 4);
        if (coord.isCoordinator()) {
            const CheckpointStore store(cfg.archiveName(), true);
            CHECK(store.readInt(CheckpointStore::iterationGroup(2) + "/is_sampling") == 0);
            CHECK(store.readInt(CheckpointStore::iterationGroup(3) + "/is_sampling") == 1);
            CHECK(store.readInt(CheckpointStore::iterationGroup(4) + "/is_sampling") == 1);
            CHECK(store.readVector("DMFT_results/observables/is_sampling") == std::vector<double>{0.0, 0.0, 1.0, 1.0});
        }
    }
}

TEST_CASE("Engine rejects a lattice that does not match the input", "[scf]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_mismatch_" + std::to_string(coord.rank()));
    const RunConfig cfg = RunConfig::fromString(chainInput(dir.file("mismatch"), 1), coord);
    CHECK_THROWS_AS(SelfConsistencyEngine(cfg, nullptr, coord), std::invalid_argument);
    SelfConsistencyEngine engine(cfg, makeChain(2, 10.0, 64, 8), coord, std::make_shared<StaticSigmaBackend>(false));
    CHECK_THROWS_AS(engine.setup(), ConfigurationError);
}


static std::string flipSpin(const std::string& label) {
    if (label.rfind("up", 0) == 0) return "down" + label.substr(2);
    if (label.rfind("down", 0) == 0) return "up" + label.substr(4);
    return label;
}

TEST_CASE("Antiferromagnetic partner copies the spin-flipped solution", "[scf][afm]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_afm_" + std::to_string(coord.rank()));
    const std::string xml = "<input><general><seedname>" + dir.file("afm") + "</seedname><beta>10</beta><n_iw>128</n_iw>"
        "<n_iter_dmft>2</n_iter_dmft><density_target>4.0</density_target><magnetic>true</magnetic><magmom>0.3 -0.3</magmom>"
        "<afm_order>true</afm_order></general>"
        "<solver><type>hartree</type><U>2.0</U><J>0.3</J><hartree_max_iter>500</hartree_max_iter><hartree_tol>1e-8</hartree_tol></solver>"
        "<lattice><dim>1</dim><nk>16</nk><norb>2 2</norb><hopping>"
        "<t R=\"0\" orb=\"0 2\">-1.0</t><t R=\"0\" orb=\"1 3\">-0.8</t><t R=\"1\" orb=\"2 0\">-1.0</t><t R=\"1\" orb=\"3 1\">-0.8</t>"
        "</hopping></lattice></input>";
    const RunConfig cfg = RunConfig::fromString(xml, coord);
    SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord);
    engine.run();

    REQUIRE(engine.afm().isMapped(1));
    CHECK(engine.afm().at(1).source == 0);
    CHECK(engine.afm().at(1).flip);
    const BlockGf& sigma0 = engine.selfEnergy(0);
    const BlockGf& sigma1 = engine.selfEnergy(1);
    for (const auto& [label, arr] : sigma0) {
        CHECK((sigma1[flipSpin(label)]() - arr()).cwiseAbs().maxCoeff() < 1e-12);
    }
    // The initial moments survive as a polarization of site 0
    const BlockMatrix& n0 = engine.impurityDensity(0);
    CHECK(blockTrace(n0) == Approx(blockTrace(engine.impurityDensity(1))).margin(1e-10));
}


// Two-orbital chain without inter-orbital hopping, so the density splits into one block per orbital
static std::string twoOrbitalInput(const std::string& seedname, const int niter, const std::string& extra = "") {
    return "<input><general><seedname>" + seedname + "</seedname><beta>10</beta><n_iw>64</n_iw><n_iter_dmft>" + std::to_string(niter)
           + "</n_iter_dmft><density_target>2.0</density_target><prec_mu>0.001</prec_mu><dc>false</dc>" + extra
           + "</general><solver><type>sampling</type><U>2.0</U></solver>"
           + "<lattice><dim>1</dim><nk>16</nk><norb>2</norb><onsite>0.0 0.3</onsite><hopping>"
           + "<t R=\"1\" orb=\"0 0\">-1.0</t><t R=\"1\" orb=\"1 1\">-1.0</t></hopping></lattice></input>";
}

// Block structure the engine archives during setup
static BlockStructure setupBlocks(const RunConfig& cfg, const Coordinator& coord) {
    {
        SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(false));
        engine.setup();
    }
    BlockStructure blocks;
    if (coord.isCoordinator()) blocks = BlockStructure::read(CheckpointStore(cfg.archiveName(), true), "DMFT_input/block_structure");
    blocks.broadcast(coord);
    return blocks;
}

static std::vector<std::string> solverLabels(const BlockStructure& blocks, const Eigen::Index isite) {
    std::vector<std::string> labels;
    for (const auto& sb : blocks.site(isite).solver) labels.push_back(sb.label);
    return labels;
}

TEST_CASE("Manual block structure settings shape the solver blocks", "[scf][blocks]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_blocks_" + std::to_string(coord.rank()));

    SECTION("automatic partition") {
        const BlockStructure blocks = setupBlocks(RunConfig::fromString(twoOrbitalInput(dir.file("auto"), 1), coord), coord);
        CHECK(solverLabels(blocks, 0) == std::vector<std::string>{"up_0", "up_1", "down_0", "down_1"});
        CHECK(blocks.site(0).degGroups == std::vector<std::vector<std::string> >{{"up_0", "down_0"}, {"up_1", "down_1"}});
    }
    SECTION("picked blocks drop the rest") {
        const std::string pick = "<pick_solver_struct><site index=\"0\"><block label=\"up_0\">0</block><block label=\"down_0\">0</block></site></pick_solver_struct>";
        const BlockStructure blocks = setupBlocks(RunConfig::fromString(twoOrbitalInput(dir.file("pick"), 1, pick), coord), coord);
        CHECK(solverLabels(blocks, 0) == std::vector<std::string>{"up_0", "down_0"});
        CHECK(blocks.site(0).solver[0].indices == std::vector<Eigen::Index>{0});
        CHECK(blocks.site(0).degGroups == std::vector<std::vector<std::string> >{{"up_0", "down_0"}});
    }
    SECTION("forced off-diagonal site keeps full blocks") {
        const BlockStructure blocks = setupBlocks(RunConfig::fromString(twoOrbitalInput(dir.file("full"), 1, "<enforce_off_diag>true</enforce_off_diag>"), coord), coord);
        CHECK(solverLabels(blocks, 0) == std::vector<std::string>{"up_0", "down_0"});
        CHECK(blocks.site(0).solver[0].dim() == 2);
        CHECK(blocks.site(0).degGroups.empty());
    }
    SECTION("degeneracy map replaces the detected groups") {
        const std::string degs = "<mapped_solver_struct_degeneracies><site index=\"0\"><group>up_0 up_1</group><group>down_0 down_1</group></site>"
                                 "</mapped_solver_struct_degeneracies>";
        const BlockStructure blocks = setupBlocks(RunConfig::fromString(twoOrbitalInput(dir.file("degs"), 1, degs), coord), coord);
        CHECK(blocks.site(0).degGroups == std::vector<std::vector<std::string> >{{"up_0", "up_1"}, {"down_0", "down_1"}});
    }
    SECTION("unknown block label") {
        const std::string pick = "<pick_solver_struct><site index=\"0\"><block label=\"ud_0\">0</block></site></pick_solver_struct>";
        const RunConfig cfg = RunConfig::fromString(twoOrbitalInput(dir.file("unknown"), 1, pick), coord);
        SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(false));
        CHECK_THROWS_AS(engine.setup(), ConfigurationError);
    }
}

TEST_CASE("Resume checks the archived block structure", "[scf][blocks]") {
    const Coordinator coord(MPI_COMM_WORLD);
    ScratchDir dir("scf_blocks_resume_" + std::to_string(coord.rank()));

    SECTION("a different partition is fatal") {
        const std::string seed = dir.file("partition");
        runChain(RunConfig::fromString(twoOrbitalInput(seed, 1), coord), coord, false);
        const RunConfig cfg = RunConfig::fromString(twoOrbitalInput(seed, 1, "<enforce_off_diag>true</enforce_off_diag>"), coord);
        SelfConsistencyEngine engine(cfg, makeLattice(cfg), coord, std::make_shared<StaticSigmaBackend>(false));
        CHECK_THROWS_AS(engine.setup(), InconsistentStateError);
    }
    SECTION("different rotations are replaced by the stored ones") {
        const std::string seed = dir.file("rotation");
        runChain(RunConfig::fromString(chainInput(seed, 1), coord), coord, false);
        if (coord.isCoordinator()) {
            CheckpointStore store(seed + ".h5");
            BlockStructure stored = BlockStructure::read(store, "DMFT_input/block_structure");
            stored.setRotation(0, -Eigen::MatrixXcd::Identity(1, 1));
            stored.write(store, "DMFT_input/block_structure");
        }
        coord.barrier();
        const RunConfig cfg = RunConfig::fromString(chainInput(seed, 1), coord);
        auto lattice = makeLattice(cfg);
        SelfConsistencyEngine engine(cfg, lattice, coord, std::make_shared<StaticSigmaBackend>(false));
        const RunSummary summary = engine.run();
        CHECK(summary.lastIteration == 2);
        CHECK(lattice->blockStructure().site(0).rotation(0, 0).real() == -1.0);
    }
}
