//
//  test_lattice.cpp
//  dmft-scf
//

#include <cmath>
#include "catch2/catch.hpp"
#include "test_common.hpp"
#include "chemical_potential.hpp"


TEST_CASE("Half-filled chain", "[lattice]") {
    auto lattice = makeChain(1, 10.0, 128, 16);
    CHECK(lattice->hamiltonianDim() == 1);
    CHECK(lattice->nkTotal() == 16);
    CHECK(lattice->multiplicity(0) == 1);
    // Particle-hole symmetric band, one electron over both spin channels
    CHECK(lattice->totalDensity(0.0) == Approx(1.0).margin(1e-6));
    CHECK(lattice->totalDensity(0.5) > lattice->totalDensity(0.0));
}

TEST_CASE("Local Green's function is the k average", "[lattice]") {
    const Eigen::Index nk = 8;
    auto lattice = makeChain(1, 10.0, 16, nk);
    lattice->setChemicalPotential(0.2);
    const std::vector<BlockGf> gloc = lattice->extractLocalGreenFunction();
    REQUIRE(gloc.size() == 1);
    const FrequencyMesh& mesh = lattice->mesh();
    for (const Eigen::Index i : {Eigen::Index(0), Eigen::Index(9), mesh.size() - 1}) {
        std::complex<double> expect = 0.0;
        for (Eigen::Index ik = 0; ik < nk; ++ik) expect += 1.0 / (mesh(i) + 0.2 + 2.0 * std::cos(2.0 * M_PI * ik / nk));
        expect /= static_cast<double>(nk);
        CHECK(std::abs(gloc[0]["up"](i, 0, 0) - expect) < 1e-12);
        CHECK(std::abs(gloc[0]["down"](i, 0, 0) - expect) < 1e-12);
    }
}

TEST_CASE("Self-energy and double counting enter the lattice", "[lattice]") {
    auto lattice = makeChain(1, 10.0, 128, 16);
    const BlockStructure& blocks = lattice->blockStructure();
    const double n0 = lattice->totalDensity(0.0);
    BlockGf sigma = blocks.createGf(0, GfSpace::Lattice, lattice->meshPtr());
    fillStatic(sigma, 0.5);
    lattice->setSelfEnergy(0, sigma);

    SECTION("static self-energy shifts the band") {
        CHECK(lattice->totalDensity(0.5) == Approx(n0).margin(1e-10));
    }
    SECTION("matching double counting cancels it") {
        DoubleCountingState dc;
        dc.potential = blocks.createMatrix(0, GfSpace::Lattice);
        for (auto& [label, v] : dc.potential) v(0, 0) = 0.5;
        dc.energy = 1.25;
        lattice->setDoubleCounting(0, dc);
        CHECK(lattice->totalDensity(0.0) == Approx(n0).margin(1e-10));
        CHECK(lattice->totalDCEnergy() == 1.25);
        BlockGf s = sigma;
        lattice->addDoubleCounting(s, 0, -1.0);
        CHECK(s.norm() == Approx(0.0).margin(1e-14));
    }
    SECTION("structure checks") {
        CHECK_THROWS_AS(lattice->setSelfEnergy(0, blocks.createGf(0, GfSpace::Solver, lattice->meshPtr())), std::invalid_argument);
        DoubleCountingState dc;
        CHECK_THROWS_AS(lattice->setDoubleCounting(0, dc), std::invalid_argument);
    }
}

TEST_CASE("Magnetic field polarizes the chain", "[lattice]") {
    auto lattice = makeChain(1, 10.0, 128, 16);
    lattice->setHField(0.2);
    const std::vector<BlockGf> gloc = lattice->extractLocalGreenFunction();
    const BlockMatrix n = gloc[0].density();
    CHECK(n.at("up")(0, 0).real() > n.at("down")(0, 0).real());
    CHECK(n.at("up")(0, 0).real() + n.at("down")(0, 0).real() == Approx(1.0).margin(1e-6));
}

TEST_CASE("Effective atomic levels follow mu and the field", "[lattice]") {
    auto lattice = makeChain(2, 10.0, 16, 4);
    Eigen::VectorXd onsite(2);
    onsite << 0.3, -0.1;
    lattice->onsiteEnergies(onsite);
    lattice->setChemicalPotential(0.5);
    CHECK(lattice->effectiveAtomicLevels(0).at("up")(0, 0).real() == Approx(-0.2));
    CHECK(lattice->effectiveAtomicLevels(1).at("down")(0, 0).real() == Approx(-0.6));
    lattice->setChemicalPotential(0.0);
    CHECK(lattice->effectiveAtomicLevels(0).at("up")(0, 0).real() == Approx(0.3));
    lattice->setHField(0.1);
    CHECK(lattice->effectiveAtomicLevels(0).at("up")(0, 0).real() == Approx(0.2));
    CHECK(lattice->effectiveAtomicLevels(0).at("down")(0, 0).real() == Approx(0.4));

    CHECK_THROWS_AS(lattice->onsiteEnergies(Eigen::VectorXd::Zero(3)), std::invalid_argument);
    CHECK_THROWS_AS(lattice->addHopping({Eigen::VectorXi::Zero(1), 0, 2, -1.0}), std::invalid_argument);
    CHECK_THROWS_AS(lattice->addHopping({Eigen::VectorXi::Zero(2), 0, 1, -1.0}), std::invalid_argument);
    CHECK_THROWS_AS(lattice->kGridSizes({4, 4}), std::invalid_argument);
}

TEST_CASE("Density correction of the lattice", "[lattice]") {
    auto lattice = makeChain(1, 10.0, 128, 16);
    const DensityCorrection corr = lattice->densityCorrection("model");
    REQUIRE(corr.correction.size() == 1);
    // No self-energy, no correction
    CHECK(corr.correction[0].at("up").cwiseAbs().maxCoeff() < 1e-12);
    CHECK(corr.totalDensity == Approx(1.0).margin(1e-6));
    // Filled lower half of the cosine band: 2 * (-2 / pi) over a finite grid at finite temperature
    CHECK(corr.bandEnergy < -1.0);
    CHECK_THROWS_AS(lattice->densityCorrection("vasp"), ConfigurationError);
}


TEST_CASE("Chemical potential search", "[mu]") {
    auto lattice = makeChain(1, 10.0, 128, 256);

    SECTION("dichotomy") {
        const double mu = lattice->solveChemicalPotential(1.4, 1e-4, MuMethod::Dichotomy);
        CHECK(mu > 0.0);
        CHECK(lattice->chemicalPotential() == mu);
        CHECK(lattice->totalDensity(mu) == Approx(1.4).margin(1e-4));
    }
    SECTION("secant") {
        const double mu = lattice->solveChemicalPotential(0.6, 1e-4, MuMethod::Secant);
        CHECK(mu < 0.0);
        CHECK(lattice->totalDensity(mu) == Approx(0.6).margin(1e-4));
    }
    SECTION("unreachable density keeps mu") {
        lattice->setChemicalPotential(0.3);
        CHECK_THROWS_AS(lattice->solveChemicalPotential(10.0, 1e-4, MuMethod::Dichotomy, 0.5, 5), NumericalDivergenceWarning);
        CHECK(lattice->chemicalPotential() == 0.3);
    }
    CHECK(muMethodFromString("secant") == MuMethod::Secant);
    CHECK_THROWS_AS(muMethodFromString("newton"), ConfigurationError);
}

TEST_CASE("Chemical potential update policy", "[mu]") {
    const Coordinator coord(MPI_COMM_WORLD);
    auto lattice = makeChain(1, 10.0, 128, 256);
    MuOptions opts;
    opts.target = 1.4;
    opts.precision = 1e-4;

    SECTION("searched every second iteration") {
        opts.updateFreq = 2;
        const ChemicalPotentialSolver solver(opts, coord);
        CHECK_FALSE(solver.updatesAt(1));
        CHECK(solver.updatesAt(2));
        CHECK(solver.update(*lattice, 1) == 0.0);
        const double mu = solver.update(*lattice, 2);
        CHECK(lattice->totalDensity(mu) == Approx(1.4).margin(1e-4));
    }
    SECTION("initial guess") {
        opts.initialGuess = 0.7;
        const ChemicalPotentialSolver solver(opts, coord);
        const double mu = solver.initialize(*lattice);
        CHECK(lattice->totalDensity(mu) == Approx(1.4).margin(1e-4));
    }
    SECTION("fixed value") {
        opts.fixedValue = -0.25;
        opts.target = 0.0;
        const ChemicalPotentialSolver solver(opts, coord);
        CHECK_FALSE(solver.updatesAt(1));
        CHECK(solver.initialize(*lattice) == -0.25);
        lattice->setChemicalPotential(1.0);
        CHECK(solver.update(*lattice, 4) == -0.25);
        CHECK(lattice->chemicalPotential() == -0.25);
    }
    SECTION("failed search keeps the last mu") {
        opts.target = 10.0;
        opts.maxIter = 5;
        const ChemicalPotentialSolver solver(opts, coord);
        lattice->setChemicalPotential(0.3);
        CHECK(solver.update(*lattice, 1) == 0.3);
        CHECK(lattice->chemicalPotential() == 0.3);
    }
    SECTION("invalid options") {
        opts.updateFreq = 0;
        CHECK_THROWS_AS(ChemicalPotentialSolver(opts, coord), ConfigurationError);
        opts.updateFreq = 1;
        opts.precision = 0.0;
        CHECK_THROWS_AS(ChemicalPotentialSolver(opts, coord), ConfigurationError);
        opts.precision = 0.01;
        opts.target = 0.0;
        CHECK_THROWS_AS(ChemicalPotentialSolver(opts, coord), ConfigurationError);
    }
}
