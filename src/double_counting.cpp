//
//  double_counting.cpp
//  dmft-scf
//

#include <algorithm>
#include <stdexcept>
#include "double_counting.hpp"
#include "pade.hpp"


DCFormula dcFormulaFromString(const std::string& s) {
    if (s == "0" || s == "fll") return FLL;
    else if (s == "1" || s == "held") return Held;
    else if (s == "2" || s == "amf") return AMF;
    else if (s == "3" || s == "fll_eg") return FLLeg;
    else if (s == "crpa_static") return CrpaStatic;
    else if (s == "crpa_static_qp") return CrpaStaticQp;
    else if (s == "crpa_dynamic") return CrpaDynamic;
    throw ConfigurationError("Unknown double counting type " + s);
}

std::string dcFormulaName(const DCFormula f) {
    switch (f) {
        case FLL: return "FLL";
        case Held: return "Held";
        case AMF: return "AMF";
        case FLLeg: return "FLL_eg";
        case CrpaStatic: return "crpa_static";
        case CrpaStaticQp: return "crpa_static_qp";
        case CrpaDynamic: return "crpa_dynamic";
        default: return "unknown";
    }
}


DoubleCountingCalculator::DoubleCountingCalculator(const DCOptions& opts, const std::vector<Site>& sites, const bool spinOrbit)
: m_opts(opts), m_sites(sites), m_spinOrbit(spinOrbit) {
    const std::size_t nsites = sites.size();
    if (m_opts.formula.size() != nsites || m_opts.U.size() != nsites || m_opts.J.size() != nsites)
        throw ConfigurationError("Double counting needs a formula, U and J for every site");
    if (m_opts.fixedOcc.empty()) m_opts.fixedOcc.resize(nsites);
    else if (m_opts.fixedOcc.size() != nsites) throw ConfigurationError("dc_fixed_occ needs one entry per site");

    const bool anyHartree = std::any_of(sites.begin(), sites.end(), [](const Site& s) {return s.solver == SolverKind::Hartree;});
    if (m_opts.nominal && anyHartree) throw NotImplementedCombinationError("dc_nominal is not implemented in presence of the hartree solver");
    if (!m_opts.orbShift.empty() && anyHartree) throw NotImplementedCombinationError("dc_orb_shift is not implemented in presence of the hartree solver");

    Eigen::Index offset = 0;
    for (const auto& s : sites) {
        m_shiftOffsets.push_back(offset);
        offset += spinOrbit ? 2 * s.norb : s.norb;
    }
    if (!m_opts.orbShift.empty() && static_cast<Eigen::Index>(m_opts.orbShift.size()) != offset)
        throw ShiftCountMismatchError("dc_orb_shift has " + std::to_string(m_opts.orbShift.size()) + " entries but the sites have "
                                      + std::to_string(offset) + " orbitals in total");
}

DoubleCountingState DoubleCountingCalculator::compute(const Eigen::Index isite, const BlockMatrix& dens, const bool solverOwnsDC,
                                                      const ScreenedInteractionKernel* kernel) const {
    if (isite < 0 || isite >= static_cast<Eigen::Index>(m_sites.size())) throw std::range_error("Double counting site index is out of range!");
    const Site& site = m_sites[isite];
    DoubleCountingState dc;
    for (const auto& [label, n] : dens) dc.potential[label] = Eigen::MatrixXcd::Zero(n.rows(), n.cols());

    // The solver folds its own double counting into the mean-field step
    if (solverOwnsDC) return dc;

    const double ntrue = blockTrace(dens);
    if (m_opts.fixedValue) {
        for (auto& [label, v] : dc.potential) v.diagonal().setConstant(*m_opts.fixedValue);
        dc.energy = *m_opts.fixedValue * ntrue;
        return dc;
    }

    BlockMatrix densDC(dens);
    if (m_opts.fixedOcc[isite]) {
        const double orbocc = *m_opts.fixedOcc[isite] / (2.0 * site.norb);
        for (auto& [label, n] : densDC) {
            n.setZero();
            n.diagonal().setConstant(orbocc);
        }
    }

    const DCFormula f = m_opts.formula[isite];
    if (isDynamicFormula(f)) {
        if (!kernel) throw ConfigurationError("Double counting type " + dcFormulaName(f) + " of site " + std::to_string(isite)
                                              + " needs a screened interaction kernel");
        dynamicFormula(f, *kernel, densDC, dc);
    }
    else standardFormula(f, m_opts.U[isite], m_opts.J[isite], site.norb, densDC, dc.potential, dc.energy);

    // Potential from the forced occupation but energy from the true density
    if (m_opts.nominal) {
        dc.energy = 0.0;
        for (const auto& [label, v] : dc.potential) dc.energy += ntrue * v(0, 0).real();
        dc.energy /= static_cast<double>(dc.potential.size());
    }

    if (m_opts.factor != 1.0) {
        for (auto& [label, v] : dc.potential) v *= m_opts.factor;
        dc.energy *= m_opts.factor;
        if (dc.dynamic) *dc.dynamic *= m_opts.factor;
    }

    if (!m_opts.orbShift.empty()) {
        const Eigen::Index nshift = m_spinOrbit ? 2 * site.norb : site.norb;
        const Eigen::Map<const Eigen::VectorXd> shift(m_opts.orbShift.data() + m_shiftOffsets[isite], nshift);
        for (auto& [label, v] : dc.potential) {
            if (v.rows() != nshift) throw std::invalid_argument("Orbital shift does not match block " + label + " of site " + std::to_string(isite));
            v.diagonal() += shift.cast<std::complex<double> >();
        }
    }
    return dc;
}

void DoubleCountingCalculator::standardFormula(const DCFormula f, const double U, const double J, const Eigen::Index norb, const BlockMatrix& dens,
                                               BlockMatrix& pot, double& energy) {
    if (isDynamicFormula(f)) throw std::invalid_argument("standardFormula: " + dcFormulaName(f) + " is not a standard functional!");
    if (dens.empty()) throw std::invalid_argument("standardFormula: empty density matrix!");
    const double N = blockTrace(dens);
    const double M = static_cast<double>(norb);

    // Spin resolved occupations; a single spin-orbit coupled block holds two equally filled channels
    std::vector<double> Ns;
    if (dens.size() == 1) Ns = {0.5 * N, 0.5 * N};
    else for (const auto& [label, n] : dens) Ns.push_back(n.trace().real());

    double Ueff = U, Jeff = J;
    if (f == FLLeg) {
        Ueff = U - J;
        Jeff = 2.0 * J;
    }
    const double Uavg = (U + (M - 1.0) * (U - 2.0 * J) + (M - 1.0) * (U - 3.0 * J)) / (2.0 * M - 1.0);

    auto channelPot = [&](const double ns) {
        switch (f) {
            case Held: return Uavg * (N - 0.5);
            case AMF: return U * (N - ns / M) - J * (ns - ns / M);
            default: return Ueff * (N - 0.5) - Jeff * (ns - 0.5);
        }
    };

    switch (f) {
        case Held:
            energy = 0.5 * Uavg * N * (N - 1.0);
            break;
        case AMF:
            energy = 0.5 * U * N * N;
            for (const auto ns : Ns) energy -= 0.5 * (U + (M - 1.0) * J) / M * ns * ns;
            break;
        default:
            energy = 0.5 * Ueff * N * (N - 1.0);
            for (const auto ns : Ns) energy -= 0.5 * Jeff * ns * (ns - 1.0);
            break;
    }

    pot.clear();
    std::size_t is = 0;
    for (const auto& [label, n] : dens) {
        pot[label] = Eigen::MatrixXcd::Zero(n.rows(), n.cols());
        pot[label].diagonal().setConstant(channelPot(Ns[is]));
        ++is;
    }
}

void DoubleCountingCalculator::dynamicFormula(const DCFormula f, const ScreenedInteractionKernel& kernel, const BlockMatrix& dens, DoubleCountingState& dc) {
    dc.potential.clear();
    dc.dynamic.reset();
    for (const auto& [label, n] : dens) {
        const auto ith = kernel.hartree.find(label);
        const auto itx = kernel.exchange.find(label);
        if (ith == kernel.hartree.end() || itx == kernel.exchange.end() || ith->second.rows() != n.rows())
            throw std::invalid_argument("Screened interaction kernel does not match block " + label);
        dc.potential[label] = ith->second + itx->second;
    }

    if (f == CrpaStaticQp) {
        // Zero-frequency value of the full double-counting self-energy continued from the lowest Matsubara points
        const FrequencyMesh& mesh = kernel.dynamic.mesh();
        const Eigen::Index npoints = std::max<Eigen::Index>(2, mesh.nIw() / 5);
        const Eigen::Index ncoeffs = npoints - npoints % 2;
        for (auto& [label, v] : dc.potential) {
            MatFreqArray full = kernel.dynamic[label];
            const Eigen::MatrixXcd stat = v.real().cast<std::complex<double> >();
            for (Eigen::Index i = 0; i < full.nfreq(); ++i) full[i] += stat;
            const Eigen::MatrixXcd w0 = PadeApproximant(full, mesh, npoints, ncoeffs)(std::complex<double>(0.0, 1e-4));
            v = (0.5 * (w0 + w0.adjoint())).real().cast<std::complex<double> >();
        }
    }
    else if (f == CrpaDynamic) dc.dynamic = kernel.dynamic;

    dc.energy = 0.0;
    for (const auto& [label, n] : dens) dc.energy += 0.5 * (dc.potential[label] * n).trace().real();
}
