//
//  bare_hamiltonian.cpp
//  dmft-scf
//

#include <cmath>
#include <iostream>
#include "bare_hamiltonian.hpp"


TightBindingLattice::TightBindingLattice(std::shared_ptr<const FrequencyMesh> mesh, const BlockStructure& blocks, const std::vector<CorrelatedShell>& shells,
                                         const MPI_Comm& comm) : LatticeEmbedding(mesh, blocks, comm), m_shells(shells), m_dim(0) {
    if (shells.empty()) throw std::invalid_argument("Tight-binding lattice needs at least one correlated shell!");
    std::vector<bool> covered(blocks.nSites(), false);
    for (std::size_t ish = 0; ish < shells.size(); ++ish) {
        if (shells[ish].site < 0 || shells[ish].site >= blocks.nSites()) throw std::invalid_argument("Shell " + std::to_string(ish) + " maps to a nonexistent site!");
        if (shells[ish].norb != blocks.site(shells[ish].site).norb)
            throw std::invalid_argument("Shell " + std::to_string(ish) + " and its site have different orbital dimensions!");
        covered[shells[ish].site] = true;
        m_shellOffsets.push_back(m_dim);
        m_dim += shellDim(ish);
    }
    for (Eigen::Index s = 0; s < blocks.nSites(); ++s) if (!covered[s]) throw std::invalid_argument("Site " + std::to_string(s) + " has no correlated shell!");
    m_onsite = Eigen::VectorXd::Zero(m_dim);
    primVecs(Eigen::MatrixXd::Identity(1, 1));
}

void TightBindingLattice::kGridSizes(const std::vector<Eigen::Index>& nk) {
    if (static_cast<Eigen::Index>(nk.size()) != m_a.cols()) throw std::invalid_argument( "Space dimension of input k-point numbers did not match that of primative vectors!" );
    for (const auto n : nk) if (n < 1) throw std::invalid_argument("Number of k-points must be positive!");
    m_nk = nk;
}

Eigen::Index TightBindingLattice::nkTotal() const {
    Eigen::Index n = 1;
    for (const auto nki : m_nk) n *= nki;
    return n;
}

void TightBindingLattice::kVecAtIndex(Eigen::Index ik, Eigen::VectorXd& k) const {
    Eigen::VectorXd kfrac(m_K.cols());
    Eigen::Index nkv = nkTotal();
    for (Eigen::Index n = 0; n < m_K.cols(); ++n) {
        nkv /= m_nk[n];
        kfrac(n) = static_cast<double>(ik / nkv) / m_nk[n];
        ik %= nkv;
    }
    k = m_K * kfrac;
}

void TightBindingLattice::onsiteEnergies(const Eigen::VectorXd& e) {
    if (e.size() != m_dim) throw std::invalid_argument("Number of onsite energies does not match the Hamiltonian dimension " + std::to_string(m_dim) + "!");
    m_onsite = e;
}

void TightBindingLattice::addHopping(const HoppingTerm& term) {
    if (term.R.size() != m_a.cols()) throw std::invalid_argument("Hopping vector dimension does not match the lattice dimension!");
    if (term.a < 0 || term.a >= m_dim || term.b < 0 || term.b >= m_dim) throw std::invalid_argument("Hopping orbital index is out of range!");
    const bool diag = term.R.isZero() && term.a == term.b;
    if (diag && term.t.imag() != 0.0) throw std::invalid_argument("Onsite hopping term must be real!");
    m_hoppings.push_back(term);
    if (!diag) m_hoppings.push_back({-term.R, term.b, term.a, std::conj(term.t)});
}

Eigen::Index TightBindingLattice::multiplicity(const Eigen::Index isite) const {
    Eigen::Index m = 0;
    for (const auto& sh : m_shells) if (sh.site == isite) ++m;
    return m;
}

void TightBindingLattice::addZeeman(const int ispin, Eigen::MatrixXcd& H) const {
    if (m_hfield == 0.0) return;
    if (!m_blocks.spinOrbit()) {
        H.diagonal().array() += ispin == 0 ? -m_hfield : m_hfield;
        return;
    }
    for (std::size_t ish = 0; ish < m_shells.size(); ++ish) {
        const Eigen::Index norb = m_shells[ish].norb;
        H.diagonal().segment(m_shellOffsets[ish], norb).array() -= m_hfield;
        H.diagonal().segment(m_shellOffsets[ish] + norb, norb).array() += m_hfield;
    }
}

void TightBindingLattice::constructHamiltonian(const Eigen::VectorXd& k, const int ispin, Eigen::MatrixXcd& H) const {
    H = m_onsite.cast<std::complex<double> >().asDiagonal();
    for (const auto& hop : m_hoppings) H(hop.a, hop.b) += hop.t * std::exp(1i * k.dot(m_a * hop.R.cast<double>()));
    addZeeman(ispin, H);
}

BlockMatrix TightBindingLattice::localHamiltonian(const Eigen::Index isite) const {
    // Only the home cell terms survive the k average over the full grid
    Eigen::MatrixXcd Hloc;
    std::vector<Eigen::MatrixXcd> Hs;
    for (int ispin = 0; ispin < nSpinChannels(); ++ispin) {
        Hloc = m_onsite.cast<std::complex<double> >().asDiagonal();
        for (const auto& hop : m_hoppings) if (hop.R.isZero()) Hloc(hop.a, hop.b) += hop.t;
        addZeeman(ispin, Hloc);
        Hs.push_back(Hloc);
    }

    const SiteBlockStructure& st = m_blocks.site(isite);
    BlockMatrix h = m_blocks.createMatrix(isite, GfSpace::Lattice);
    const double mult = static_cast<double>(multiplicity(isite));
    for (std::size_t ish = 0; ish < m_shells.size(); ++ish) {
        if (m_shells[ish].site != isite) continue;
        const Eigen::Index d = shellDim(ish);
        for (int ispin = 0; ispin < nSpinChannels(); ++ispin) {
            h[st.lattice[ispin].label] += Hs[ispin].block(m_shellOffsets[ish], m_shellOffsets[ish], d, d) / mult;
        }
    }
    return h;
}

std::complex<double> TightBindingLattice::evalPoint(const Eigen::Index i, const double broadening) const {
    if (m_mesh->kind() == MeshKind::RealFreq && broadening > 0.0) return std::complex<double>((*m_mesh)(i).real(), broadening);
    return (*m_mesh)(i);
}

std::vector<MatFreqArray> TightBindingLattice::embeddedSelfEnergyFull() const {
    const int nch = nSpinChannels();
    std::vector<MatFreqArray> sig(nch, MatFreqArray(m_mesh->size(), m_dim));
    std::vector<BlockGf> emb;
    for (Eigen::Index s = 0; s < nSites(); ++s) emb.push_back(embeddedSelfEnergy(s));
    for (std::size_t ish = 0; ish < m_shells.size(); ++ish) {
        const SiteBlockStructure& st = m_blocks.site(m_shells[ish].site);
        const Eigen::Index off = m_shellOffsets[ish];
        const Eigen::Index d = shellDim(ish);
        for (int ispin = 0; ispin < nch; ++ispin) {
            const MatFreqArray& src = emb[m_shells[ish].site][st.lattice[ispin].label];
            for (Eigen::Index i = 0; i < m_mesh->size(); ++i) sig[ispin][i].block(off, off, d, d) = src[i];
        }
    }
    return sig;
}

std::vector<MatFreqArray> TightBindingLattice::localFull(const double mu, const double broadening, const bool interacting) const {
    const int nch = nSpinChannels();
    const Eigen::Index nk = nkTotal();
    const Eigen::Index nfreq = m_mesh->size();
    Eigen::Index klocalsize, klocalstart;
    mostEvenPart(nk, m_psize, m_prank, klocalsize, klocalstart);

    std::vector<MatFreqArray> sig;
    if (interacting) sig = embeddedSelfEnergyFull();
    std::vector<MatFreqArray> gfull(nch, MatFreqArray(nfreq, m_dim));
    const Eigen::MatrixXcd id = Eigen::MatrixXcd::Identity(m_dim, m_dim);
    Eigen::VectorXd k;
    Eigen::MatrixXcd H, A;
    for (Eigen::Index ik = klocalstart; ik < klocalstart + klocalsize; ++ik) {
        kVecAtIndex(ik, k);
        for (int ispin = 0; ispin < nch; ++ispin) {
            constructHamiltonian(k, ispin, H);
            for (Eigen::Index i = 0; i < nfreq; ++i) {
                A = (evalPoint(i, broadening) + mu) * id - H;
                if (interacting) A -= sig[ispin][i];
                gfull[ispin][i] += A.partialPivLu().inverse();
            }
        }
    }
    for (auto& g : gfull) {
        g() /= static_cast<double>(nk);
        g.allSum(m_comm);
    }
    return gfull;
}

std::vector<BlockGf> TightBindingLattice::projectToSites(const std::vector<MatFreqArray>& full) const {
    std::vector<BlockGf> gloc;
    for (Eigen::Index s = 0; s < nSites(); ++s) gloc.push_back(m_blocks.createGf(s, GfSpace::Lattice, m_mesh));
    for (std::size_t ish = 0; ish < m_shells.size(); ++ish) {
        const Eigen::Index s = m_shells[ish].site;
        const SiteBlockStructure& st = m_blocks.site(s);
        const Eigen::Index off = m_shellOffsets[ish];
        const Eigen::Index d = shellDim(ish);
        const double mult = static_cast<double>(multiplicity(s));
        for (int ispin = 0; ispin < nSpinChannels(); ++ispin) {
            MatFreqArray& dst = gloc[s][st.lattice[ispin].label];
            for (Eigen::Index i = 0; i < m_mesh->size(); ++i) dst[i] += full[ispin][i].block(off, off, d, d) / mult;
        }
    }
    return gloc;
}

std::vector<BlockGf> TightBindingLattice::extractLocalGreenFunction(const double broadening) const {
    return projectToSites(localFull(m_mu, broadening, true));
}

double TightBindingLattice::totalDensity(const double mu) const {
    const std::vector<MatFreqArray> full = localFull(mu, 0.0, true);
    double n = 0.0;
    for (const auto& g : full) {
        if (m_mesh->kind() == MeshKind::Matsubara) n += matsubaraDensity(g, *m_mesh).trace().real();
        else n += realFreqDensity(g, *m_mesh).trace().real();
    }
    return n;
}

DensityCorrection TightBindingLattice::densityCorrection(const std::string& dmType) const {
    if (dmType != "model") throw ConfigurationError("Density correction type " + dmType + " is not supported by the tight-binding lattice");
    if (m_mesh->kind() != MeshKind::Matsubara) throw std::invalid_argument("Density correction needs a Matsubara mesh!");

    DensityCorrection corr;
    const std::vector<MatFreqArray> fullint = localFull(m_mu, 0.0, true);
    const std::vector<BlockGf> gint = projectToSites(fullint);
    const std::vector<BlockGf> gnon = projectToSites(localFull(m_mu, 0.0, false));
    for (Eigen::Index s = 0; s < nSites(); ++s) {
        BlockMatrix nint = gint[s].density();
        const BlockMatrix nnon = gnon[s].density();
        for (auto& [label, m] : nint) m -= nnon.at(label);
        corr.correction.push_back(nint);
    }
    for (const auto& g : fullint) corr.totalDensity += matsubaraDensity(g, *m_mesh).trace().real();

    // Band energy 1/Nk sum_k Tr[H(k) n(k)] of the interacting lattice
    const int nch = nSpinChannels();
    const Eigen::Index nk = nkTotal();
    const Eigen::Index nfreq = m_mesh->size();
    Eigen::Index klocalsize, klocalstart;
    mostEvenPart(nk, m_psize, m_prank, klocalsize, klocalstart);
    const std::vector<MatFreqArray> sig = embeddedSelfEnergyFull();
    const Eigen::MatrixXcd id = Eigen::MatrixXcd::Identity(m_dim, m_dim);
    MatFreqArray gk(nfreq, m_dim);
    Eigen::VectorXd k;
    Eigen::MatrixXcd H;
    double eband = 0.0;
    for (Eigen::Index ik = klocalstart; ik < klocalstart + klocalsize; ++ik) {
        kVecAtIndex(ik, k);
        for (int ispin = 0; ispin < nch; ++ispin) {
            constructHamiltonian(k, ispin, H);
            for (Eigen::Index i = 0; i < nfreq; ++i) gk[i] = (((*m_mesh)(i) + m_mu) * id - H - sig[ispin][i]).partialPivLu().inverse();
            eband += (H * matsubaraDensity(gk, *m_mesh)).trace().real();
        }
    }
    MPI_Allreduce(MPI_IN_PLACE, &eband, 1, MPI_DOUBLE, MPI_SUM, m_comm);
    corr.bandEnergy = eband / nk;
    return corr;
}
