//
//  test_double_counting.cpp
//  dmft-scf
//

#include "catch2/catch.hpp"
#include "test_common.hpp"
#include "double_counting.hpp"


static std::vector<Site> twoOrbitalSites(const Eigen::Index nsites, const SolverKind solver = SolverKind::Sampling) {
    std::vector<Site> sites;
    for (Eigen::Index s = 0; s < nsites; ++s) sites.push_back({static_cast<int>(s), 2, 1, solver, 4.0, 1.0});
    return sites;
}

static DCOptions options(const DCFormula f, const Eigen::Index nsites = 1) {
    DCOptions opts;
    opts.formula.assign(nsites, f);
    opts.U.assign(nsites, 4.0);
    opts.J.assign(nsites, 1.0);
    return opts;
}

// Quarter filling in each spin channel of two orbitals
static BlockMatrix halfFilledDensity() {
    BlockMatrix n;
    n["up"] = 0.5 * Eigen::MatrixXcd::Identity(2, 2);
    n["down"] = 0.5 * Eigen::MatrixXcd::Identity(2, 2);
    return n;
}


TEST_CASE("Standard double-counting functionals", "[dc]") {
    const BlockMatrix n = halfFilledDensity();
    BlockMatrix pot;
    double energy;

    SECTION("fully localized limit") {
        DoubleCountingCalculator::standardFormula(FLL, 4.0, 1.0, 2, n, pot, energy);
        CHECK(pot.at("up")(0, 0).real() == Approx(5.5));
        CHECK(pot.at("down")(1, 1).real() == Approx(5.5));
        CHECK(std::abs(pot.at("up")(0, 1)) == 0.0);
        CHECK(energy == Approx(4.0));
    }
    SECTION("Held") {
        DoubleCountingCalculator::standardFormula(Held, 4.0, 1.0, 2, n, pot, energy);
        CHECK(pot.at("up")(0, 0).real() == Approx(3.5));
        CHECK(energy == Approx(7.0 / 3.0));
    }
    SECTION("around mean field") {
        DoubleCountingCalculator::standardFormula(AMF, 4.0, 1.0, 2, n, pot, energy);
        CHECK(pot.at("up")(0, 0).real() == Approx(5.5));
        CHECK(energy == Approx(5.5));
    }
    SECTION("fully localized limit with e_g parameters") {
        DoubleCountingCalculator::standardFormula(FLLeg, 4.0, 1.0, 2, n, pot, energy);
        CHECK(pot.at("up")(0, 0).real() == Approx(3.5));
        CHECK(energy == Approx(3.0));
    }
    SECTION("spin-orbit coupled block counts half the density per spin") {
        BlockMatrix nso;
        nso["ud"] = 0.5 * Eigen::MatrixXcd::Identity(4, 4);
        DoubleCountingCalculator::standardFormula(FLL, 4.0, 1.0, 2, nso, pot, energy);
        CHECK(pot.at("ud")(3, 3).real() == Approx(5.5));
        CHECK(energy == Approx(4.0));
    }
    SECTION("spin polarized densities give spin dependent potentials") {
        BlockMatrix np = n;
        np["up"] *= 1.5;
        np["down"] *= 0.5;
        DoubleCountingCalculator::standardFormula(FLL, 4.0, 1.0, 2, np, pot, energy);
        // N = 2, N_up = 1.5, N_down = 0.5
        CHECK(pot.at("up")(0, 0).real() == Approx(4.0 * 1.5 - 1.0));
        CHECK(pot.at("down")(0, 0).real() == Approx(4.0 * 1.5));
        CHECK(energy == Approx(4.0 - 0.5 * 1.5 * 0.5 + 0.5 * 0.5 * 0.5));
    }
    CHECK_THROWS_AS(DoubleCountingCalculator::standardFormula(CrpaStatic, 4.0, 1.0, 2, n, pot, energy), std::invalid_argument);
}

TEST_CASE("Formula names from input", "[dc]") {
    CHECK(dcFormulaFromString("fll") == FLL);
    CHECK(dcFormulaFromString("1") == Held);
    CHECK(dcFormulaFromString("amf") == AMF);
    CHECK(dcFormulaFromString("fll_eg") == FLLeg);
    CHECK(dcFormulaFromString("crpa_dynamic") == CrpaDynamic);
    CHECK_THROWS_AS(dcFormulaFromString("bogus"), ConfigurationError);
    CHECK(isDynamicFormula(CrpaStaticQp));
    CHECK_FALSE(isDynamicFormula(AMF));
}

TEST_CASE("Double counting hooks", "[dc]") {
    const BlockMatrix n = halfFilledDensity();
    const auto sites = twoOrbitalSites(1);

    SECTION("solver-owned double counting is zero") {
        const DoubleCountingCalculator calc(options(FLL), sites, false);
        const DoubleCountingState dc = calc.compute(0, n, true);
        CHECK(dc.potential.at("up").cwiseAbs().maxCoeff() == 0.0);
        CHECK(dc.energy == 0.0);
    }
    SECTION("fixed value") {
        DCOptions opts = options(FLL);
        opts.fixedValue = 2.0;
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false);
        CHECK(dc.potential.at("down")(1, 1).real() == Approx(2.0));
        CHECK(dc.energy == Approx(4.0));
    }
    SECTION("fixed occupation") {
        DCOptions opts = options(FLL);
        opts.fixedOcc = {3.0};
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false);
        CHECK(dc.potential.at("up")(0, 0).real() == Approx(9.0));
    }
    SECTION("nominal energy uses the true density") {
        DCOptions opts = options(FLL);
        opts.fixedOcc = {3.0};
        opts.nominal = true;
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false);
        CHECK(dc.potential.at("up")(0, 0).real() == Approx(9.0));
        CHECK(dc.energy == Approx(18.0));
    }
    SECTION("scaling factor") {
        DCOptions opts = options(FLL);
        opts.factor = 0.5;
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false);
        CHECK(dc.potential.at("up")(0, 0).real() == Approx(2.75));
        CHECK(dc.energy == Approx(2.0));
    }
    SECTION("orbital shifts") {
        DCOptions opts = options(FLL);
        opts.orbShift = {0.1, -0.1};
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false);
        CHECK(dc.potential.at("up")(0, 0).real() == Approx(5.6));
        CHECK(dc.potential.at("down")(1, 1).real() == Approx(5.4));
    }
    CHECK_THROWS_AS(DoubleCountingCalculator(options(FLL), sites, false).compute(1, n, false), std::range_error);
}

TEST_CASE("Invalid double-counting option combinations", "[dc]") {
    const auto hartree = twoOrbitalSites(1, SolverKind::Hartree);

    DCOptions nominal = options(FLL);
    nominal.nominal = true;
    CHECK_THROWS_AS(DoubleCountingCalculator(nominal, hartree, false), NotImplementedCombinationError);

    DCOptions shifted = options(FLL);
    shifted.orbShift = {0.1, 0.2};
    CHECK_THROWS_AS(DoubleCountingCalculator(shifted, hartree, false), NotImplementedCombinationError);

    // Two sites with two orbitals need four shifts
    shifted = options(FLL, 2);
    shifted.orbShift = {0.1, 0.2, 0.3};
    CHECK_THROWS_AS(DoubleCountingCalculator(shifted, twoOrbitalSites(2), false), ShiftCountMismatchError);
    shifted.orbShift = {0.1, 0.2, 0.3, 0.4};
    CHECK_NOTHROW(DoubleCountingCalculator(shifted, twoOrbitalSites(2), false));
    // With spin-orbit coupling every spin-orbital has its own shift
    CHECK_THROWS_AS(DoubleCountingCalculator(shifted, twoOrbitalSites(2), true), ShiftCountMismatchError);

    CHECK_THROWS_AS(DoubleCountingCalculator(options(FLL, 2), twoOrbitalSites(1), false), ConfigurationError);
}

TEST_CASE("Screened-interaction double counting", "[dc]") {
    const BlockMatrix n = halfFilledDensity();
    const auto sites = twoOrbitalSites(1);

    SECTION("missing kernel is a configuration error") {
        const DoubleCountingCalculator calc(options(CrpaStatic), sites, false);
        CHECK_THROWS_AS(calc.compute(0, n, false), ConfigurationError);
    }
    SECTION("static potential is the sum of Hartree and exchange parts") {
        ScreenedInteractionKernel kernel;
        for (const auto& label : {"up", "down"}) {
            kernel.hartree[label] = Eigen::MatrixXcd::Identity(2, 2);
            kernel.exchange[label] = -0.2 * Eigen::MatrixXcd::Identity(2, 2);
        }
        const DoubleCountingCalculator calc(options(CrpaStatic), sites, false);
        const DoubleCountingState dc = calc.compute(0, n, false, &kernel);
        CHECK(dc.potential.at("up")(1, 1).real() == Approx(0.8));
        CHECK_FALSE(dc.dynamic);
        // Two blocks of 0.5 * Tr(0.8 * 0.5 * I)
        CHECK(dc.energy == Approx(0.8));
    }
    SECTION("dynamic remainder is carried along") {
        auto mesh = matsubaraMesh(10.0, 8);
        ScreenedInteractionKernel kernel;
        kernel.dynamic = BlockGf(mesh, {{"up", 2}, {"down", 2}});
        fillStatic(kernel.dynamic, 0.1);
        for (const auto& label : {"up", "down"}) {
            kernel.hartree[label] = Eigen::MatrixXcd::Identity(2, 2);
            kernel.exchange[label] = Eigen::MatrixXcd::Zero(2, 2);
        }
        DCOptions opts = options(CrpaDynamic);
        opts.factor = 2.0;
        const DoubleCountingState dc = DoubleCountingCalculator(opts, sites, false).compute(0, n, false, &kernel);
        REQUIRE(dc.dynamic);
        CHECK((*dc.dynamic)["up"](3, 0, 0).real() == Approx(0.2));
        CHECK(dc.potential.at("up")(0, 0).real() == Approx(2.0));
    }
}

TEST_CASE("Per-site parameters", "[dc]") {
    const auto single = PerSite<std::string>::single("fll");
    CHECK(single.expand(3, "dc_type") == std::vector<std::string>(3, "fll"));
    const auto list = PerSite<double>::list({1.0, 2.0});
    CHECK(list.expand(2, "dc_U") == std::vector<double>{1.0, 2.0});
    CHECK_THROWS_AS(list.expand(3, "dc_U"), ConfigurationError);
}
