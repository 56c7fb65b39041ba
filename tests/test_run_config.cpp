//
//  test_run_config.cpp
//  dmft-scf
//

#include "catch2/catch.hpp"
#include "test_common.hpp"
#include "run_config.hpp"


static const std::string chainInput = R"(<?xml version="1.0"?>
<input>
    <general>
        <seedname>chain</seedname>
        <beta>20</beta>
        <n_iw>64</n_iw>
        <n_iter_dmft>4</n_iter_dmft>
        <density_target>4.0</density_target>
        <mu_method>secant</mu_method>
        <magnetic>true</magnetic>
        <magmom>0.3, -0.3</magmom>
        <afm_order>true</afm_order>
        <dc_type>held</dc_type>
        <dc_U>2.5 2.0</dc_U>
        <dc_orb_shift>0.1 0.0 0.0 -0.1</dc_orb_shift>
        <enforce_off_diag>false true</enforce_off_diag>
        <pick_solver_struct>
            <site index="1">
                <block label="up_0">0 1</block>
                <block label="down_0">1</block>
            </site>
        </pick_solver_struct>
        <mapped_solver_struct_degeneracies>
            <site index="0">
                <group>up_0 down_0</group>
            </site>
        </mapped_solver_struct_degeneracies>
    </general>
    <mixing>
        <g0_mix>0.5</g0_mix>
        <g0_mix_type>broyden</g0_mix_type>
    </mixing>
    <convergence>
        <sigma_conv_crit>1e-4</sigma_conv_crit>
        <occ_conv_crit>1e-3</occ_conv_crit>
        <mu_conv_crit>1e-2</mu_conv_crit>
        <conv_mode>window_std</conv_mode>
    </convergence>
    <solver>
        <type>hartree</type>
        <U>3.0</U>
        <J>0.5 0.4</J>
    </solver>
    <lattice>
        <dim>1</dim>
        <nk>16</nk>
        <norb>2 2</norb>
        <onsite>0.0 0.2 0.0 0.2</onsite>
        <hopping>
            <t R="0" orb="0 2">-1.0</t>
            <t R="1" orb="2 0" im="0.25">-1.0</t>
        </hopping>
    </lattice>
</input>
)";

// Smallest accepted input with the given replacement of the general section
static std::string minimalInput(const std::string& general, const std::string& lattice = "<dim>1</dim><nk>8</nk><norb>1</norb>",
                                const std::string& solver = "") {
    return "<input><general><density_target>1.0</density_target>" + general + "</general><solver>" + solver
           + "</solver><lattice>" + lattice + "</lattice></input>";
}


TEST_CASE("Complete input is read", "[config]") {
    const Coordinator coord(MPI_COMM_WORLD);
    const RunConfig cfg = RunConfig::fromString(chainInput, coord);
    CHECK(cfg.seedname == "chain");
    CHECK(cfg.archiveName() == "chain.h5");
    CHECK(cfg.beta == 20.0);
    CHECK(cfg.nIw == 64);
    CHECK(cfg.nIter == 4);
    CHECK(cfg.mu.method == MuMethod::Secant);
    CHECK(cfg.magmom == std::vector<double>{0.3, -0.3});
    CHECK(cfg.afmOrder);
    CHECK(cfg.g0MixType == "broyden");
    // Defaults of absent parameters
    CHECK(cfg.sigmaMix == 1.0);
    CHECK(cfg.saveFreq == 1);
    CHECK_FALSE(cfg.mu.fixedValue.has_value());
    if (coord.isCoordinator()) CHECK(cfg.inputText == chainInput);

    REQUIRE(cfg.nSites() == 2);
    const std::vector<Site> sites = cfg.sites();
    CHECK(sites[1].index == 1);
    CHECK(sites[1].norb == 2);
    CHECK(sites[1].multiplicity == 1);
    CHECK(sites[0].solver == SolverKind::Hartree);
    CHECK(sites[1].U == 3.0);
    CHECK(sites[1].J == 0.4);

    REQUIRE(cfg.lattice.hoppings.size() == 2);
    const HoppingTerm& t = cfg.lattice.hoppings[1];
    CHECK(t.R(0) == 1);
    CHECK(t.a == 2);
    CHECK(t.b == 0);
    CHECK(t.t == std::complex<double>(-1.0, 0.25));

    CHECK(cfg.enforceOffDiag.expand(2, "enforce_off_diag") == std::vector<bool>{false, true});
    REQUIRE(cfg.pickSolverStruct.size() == 1);
    CHECK(cfg.pickSolverStruct.at(1).at("up_0") == std::vector<Eigen::Index>{0, 1});
    CHECK(cfg.pickSolverStruct.at(1).at("down_0") == std::vector<Eigen::Index>{1});
    REQUIRE(cfg.solverStructDegeneracies.count(0) == 1);
    CHECK(cfg.solverStructDegeneracies.at(0) == std::vector<std::vector<std::string> >{{"up_0", "down_0"}});

    const DCOptions dc = cfg.dcOptions();
    CHECK(dc.formula == std::vector<DCFormula>(2, DCFormula::Held));
    CHECK(dc.U == std::vector<double>{2.5, 2.0});
    CHECK(dc.J == std::vector<double>{0.5, 0.4});
    CHECK(dc.orbShift.size() == 4);

    const ConvOptions conv = cfg.convOptions();
    CHECK(conv.mode == ConvMode::WindowStd);
    REQUIRE(conv.criteria.size() == 3);
    CHECK(conv.criteria[0].observable == "d_mu");
    CHECK(conv.criteria[1].observable == "d_orb_occ");
    CHECK(conv.criteria[2].observable == "d_Sigma");
    CHECK(conv.criteria[2].threshold == 1e-4);

    const InitialSigmaOptions init = cfg.initialSigmaOptions();
    CHECK(init.magnetic);
    CHECK(init.loadSigmaIter == -1);
}

TEST_CASE("Equivalent shells share one site", "[config]") {
    const Coordinator coord(MPI_COMM_WORLD);
    const RunConfig cfg = RunConfig::fromString(minimalInput("", "<dim>1</dim><nk>8</nk><norb>1 1</norb><shell_site>0 0</shell_site>"), coord);
    REQUIRE(cfg.nSites() == 1);
    CHECK(cfg.sites()[0].multiplicity == 2);
    CHECK(cfg.shells().size() == 2);
    CHECK(cfg.shells()[1].site == 0);

    auto lattice = makeLattice(cfg);
    CHECK(lattice->hamiltonianDim() == 2);
    CHECK(lattice->multiplicity(0) == 2);
}

TEST_CASE("Invalid inputs are rejected", "[config]") {
    const Coordinator coord(MPI_COMM_WORLD);
    CHECK_NOTHROW(RunConfig::fromString(minimalInput(""), coord));
    CHECK_THROWS_AS(RunConfig::fromString("<input>", coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString("<other/>", coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("", "<dim>4</dim><nk>8</nk><norb>1</norb>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("", "<dim>2</dim><nk>8</nk><norb>1</norb>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<magmom>0.1 0.2</magmom>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<magmom>0.1</magmom><afm_order>true</afm_order>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<magnetic>maybe</magnetic>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<dc_type>fll amf</dc_type>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<set_rot>random</set_rot>"), coord), ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("", "<dim>1</dim><nk>8</nk><norb>1</norb>", "<measure_chi>true</measure_chi>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("", "<dim>1</dim><nk>8</nk><norb>1 2</norb><shell_site>0 0</shell_site>"), coord),
                    ConfigurationError);
}

TEST_CASE("Manual block structure settings are checked", "[config]") {
    const Coordinator coord(MPI_COMM_WORLD);
    const RunConfig plain = RunConfig::fromString(minimalInput(""), coord);
    CHECK(plain.pickSolverStruct.empty());
    CHECK(plain.solverStructDegeneracies.empty());
    CHECK(plain.enforceOffDiag.expand(1, "enforce_off_diag") == std::vector<bool>{false});

    CHECK_NOTHROW(RunConfig::fromString(minimalInput("<pick_solver_struct><site index=\"0\"><block label=\"up_0\">0</block></site></pick_solver_struct>"), coord));
    // Site outside the lattice
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<pick_solver_struct><site index=\"2\"><block label=\"up_0\">0</block></site></pick_solver_struct>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<pick_solver_struct><site><block label=\"up_0\">0</block></site></pick_solver_struct>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<pick_solver_struct><site index=\"0\"><block label=\"up_0\"></block></site></pick_solver_struct>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<pick_solver_struct><site index=\"0\"><block>0</block></site></pick_solver_struct>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<pick_solver_struct><site index=\"0\"><block label=\"up_0\">-1</block></site></pick_solver_struct>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<mapped_solver_struct_degeneracies><site index=\"0\"><group>up_0</group></site></mapped_solver_struct_degeneracies>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<mapped_solver_struct_degeneracies><site index=\"1\"><group>up_0 down_0</group></site></mapped_solver_struct_degeneracies>"), coord),
                    ConfigurationError);
    CHECK_THROWS_AS(RunConfig::fromString(minimalInput("<enforce_off_diag>true false</enforce_off_diag>"), coord), ConfigurationError);
}
