//
//  block_structure.cpp
//  dmft-scf
//

#include <algorithm>
#include <functional>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <Eigen/Eigenvalues>
#include "block_structure.hpp"
#include "checkpoint_store.hpp"
#include "coordinator.hpp"
#include "errors.hpp"


std::string spinChannelName(const SpinChannel s) {
    switch (s) {
        case SpinChannel::Up: return "up";
        case SpinChannel::Down: return "down";
        default: return "mixed";
    }
}

SpinChannel spinChannelFromName(const std::string& name) {
    if (name == "up") return SpinChannel::Up;
    else if (name == "down") return SpinChannel::Down;
    else if (name == "mixed") return SpinChannel::Mixed;
    throw std::invalid_argument("Unknown spin channel " + name);
}


const SolverBlock& SiteBlockStructure::solverBlock(const std::string& label) const {
    for (const auto& sb : solver) if (sb.label == label) return sb;
    throw std::out_of_range("No solver block " + label);
}

const LatticeBlock& SiteBlockStructure::latticeBlock(const std::string& label) const {
    for (const auto& lb : lattice) if (lb.label == label) return lb;
    throw std::out_of_range("No lattice block " + label);
}

Eigen::Index SiteBlockStructure::latticeDim() const {
    Eigen::Index d = 0;
    for (const auto& lb : lattice) d += lb.dim;
    return d;
}

Eigen::Index SiteBlockStructure::solverDim() const {
    Eigen::Index d = 0;
    for (const auto& sb : solver) d += sb.dim();
    return d;
}


BlockStructure::BlockStructure(const std::vector<Eigen::Index>& norbs, const bool spinOrbit) : m_spinOrbit(spinOrbit) {
    for (const auto norb : norbs) {
        if (norb <= 0) throw std::invalid_argument("Orbital dimension of a site must be positive!");
        SiteBlockStructure st;
        st.norb = norb;
        if (spinOrbit) st.lattice.push_back({"ud", 2 * norb, SpinChannel::Mixed});
        else {
            st.lattice.push_back({"up", norb, SpinChannel::Up});
            st.lattice.push_back({"down", norb, SpinChannel::Down});
        }
        st.rotation = Eigen::MatrixXcd::Identity(st.lattice[0].dim, st.lattice[0].dim);
        setFullBlocks(st);
        m_sites.push_back(st);
    }
}

void BlockStructure::setFullBlocks(SiteBlockStructure& st) const {
    st.solver.clear();
    st.degGroups.clear();
    for (const auto& lb : st.lattice) {
        SolverBlock sb;
        sb.label = lb.label + "_0";
        sb.spin = lb.spin;
        sb.latticeBlock = lb.label;
        sb.indices.resize(lb.dim);
        std::iota(sb.indices.begin(), sb.indices.end(), 0);
        st.solver.push_back(sb);
    }
}

void BlockStructure::checkSite(const Eigen::Index isite) const {
    if (isite < 0 || isite >= nSites()) throw std::range_error("Site index " + std::to_string(isite) + " is out of range!");
}

const SiteBlockStructure& BlockStructure::site(const Eigen::Index isite) const {
    checkSite(isite);
    return m_sites[isite];
}

std::vector<std::pair<std::string, Eigen::Index> > BlockStructure::blockDims(const Eigen::Index isite, const GfSpace space) const {
    checkSite(isite);
    std::vector<std::pair<std::string, Eigen::Index> > dims;
    if (space == GfSpace::Lattice) for (const auto& lb : m_sites[isite].lattice) dims.emplace_back(lb.label, lb.dim);
    else for (const auto& sb : m_sites[isite].solver) dims.emplace_back(sb.label, sb.dim());
    return dims;
}

BlockGf BlockStructure::createGf(const Eigen::Index isite, const GfSpace space, std::shared_ptr<const FrequencyMesh> mesh) const {
    return BlockGf(mesh, blockDims(isite, space));
}

BlockMatrix BlockStructure::createMatrix(const Eigen::Index isite, const GfSpace space) const {
    BlockMatrix m;
    for (const auto& [label, dim] : blockDims(isite, space)) m[label] = Eigen::MatrixXcd::Zero(dim, dim);
    return m;
}

std::map<std::string, std::vector<OrbitalRef> > BlockStructure::orbitalMap(const Eigen::Index isite) const {
    checkSite(isite);
    const SiteBlockStructure& st = m_sites[isite];
    std::map<std::string, std::vector<OrbitalRef> > omap;
    for (const auto& sb : st.solver) {
        auto& refs = omap[sb.label];
        for (const auto idx : sb.indices) {
            // With spin-orbit coupling the ud block holds all up orbitals followed by all down orbitals
            if (sb.spin == SpinChannel::Mixed) refs.push_back({idx % st.norb, idx < st.norb ? SpinChannel::Up : SpinChannel::Down});
            else refs.push_back({idx, sb.spin});
        }
    }
    return omap;
}


void BlockStructure::determine(const std::vector<BlockMatrix>& refdens, const double threshold, const std::vector<bool>& includeSites) {
    if (static_cast<Eigen::Index>(refdens.size()) != nSites() || static_cast<Eigen::Index>(includeSites.size()) != nSites())
        throw std::invalid_argument("determine: need one reference density and one include flag per site!");
    for (Eigen::Index s = 0; s < nSites(); ++s) {
        SiteBlockStructure& st = m_sites[s];
        setFullBlocks(st);
        if (!includeSites[s]) continue;

        const BlockMatrix local = rotate(refdens[s], s, RotDirection::ToLocal);
        st.solver.clear();
        for (const auto& lb : st.lattice) {
            const Eigen::MatrixXcd& n = local.at(lb.label);
            if (n.rows() != lb.dim) throw std::invalid_argument("determine: reference density of block " + lb.label + " has a wrong dimension!");
            if ((n - n.adjoint()).cwiseAbs().maxCoeff() > threshold)
                throw InconsistentDensityError("Reference density of site " + std::to_string(s) + " block " + lb.label + " is not hermitian");
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> es(0.5 * (n + n.adjoint()), Eigen::EigenvaluesOnly);
            if (es.eigenvalues().minCoeff() < -threshold)
                throw InconsistentDensityError("Reference density of site " + std::to_string(s) + " block " + lb.label + " is not positive semi-definite");

            // Connected components of the graph |n_ij| > threshold
            std::vector<Eigen::Index> comp(lb.dim);
            std::iota(comp.begin(), comp.end(), 0);
            std::function<Eigen::Index(Eigen::Index)> root = [&](Eigen::Index i) {return comp[i] == i ? i : (comp[i] = root(comp[i]));};
            for (Eigen::Index i = 0; i < lb.dim; ++i) {
                for (Eigen::Index j = i + 1; j < lb.dim; ++j) {
                    if (std::abs(n(i, j)) > threshold) {
                        const Eigen::Index ri = root(i), rj = root(j);
                        comp[std::max(ri, rj)] = std::min(ri, rj);
                    }
                }
            }
            std::map<Eigen::Index, std::vector<Eigen::Index> > groups;   // Ordered by smallest member
            for (Eigen::Index i = 0; i < lb.dim; ++i) groups[root(i)].push_back(i);
            int k = 0;
            for (const auto& kv : groups) {
                SolverBlock sb;
                sb.label = lb.label + "_" + std::to_string(k++);
                sb.spin = lb.spin;
                sb.latticeBlock = lb.label;
                sb.indices = kv.second;
                st.solver.push_back(sb);
            }
        }

        // Blocks with identical density matrices are degenerate
        std::vector<bool> assigned(st.solver.size(), false);
        for (std::size_t a = 0; a < st.solver.size(); ++a) {
            if (assigned[a]) continue;
            std::vector<std::string> group{st.solver[a].label};
            const Eigen::MatrixXcd na = local.at(st.solver[a].latticeBlock)(st.solver[a].indices, st.solver[a].indices);
            for (std::size_t b = a + 1; b < st.solver.size(); ++b) {
                if (assigned[b] || st.solver[b].dim() != st.solver[a].dim()) continue;
                const Eigen::MatrixXcd nb = local.at(st.solver[b].latticeBlock)(st.solver[b].indices, st.solver[b].indices);
                if ((na - nb).cwiseAbs().maxCoeff() < threshold) {
                    group.push_back(st.solver[b].label);
                    assigned[b] = true;
                }
            }
            if (group.size() > 1) st.degGroups.push_back(group);
        }
    }
}

void BlockStructure::applyManualOverride(const BlockSelection& selection) {
    for (const auto& [s, blocks] : selection) {
        checkSite(s);
        SiteBlockStructure& st = m_sites[s];
        std::vector<SolverBlock> kept;
        for (const auto& [label, idx] : blocks) {
            const SolverBlock& old = st.solverBlock(label);
            if (idx.empty()) throw ConfigurationError("Manual block selection for " + label + " of site " + std::to_string(s) + " is empty");
            SolverBlock sb = old;
            sb.indices.clear();
            for (const auto i : idx) {
                if (i < 0 || i >= old.dim()) throw ConfigurationError("Manual block selection index out of range in block " + label);
                sb.indices.push_back(old.indices[i]);
            }
            kept.push_back(sb);
        }
        // Keep the previous block order
        std::vector<SolverBlock> ordered;
        for (const auto& sb : st.solver) {
            for (const auto& k : kept) if (k.label == sb.label) ordered.push_back(k);
        }
        st.solver = ordered;

        std::vector<std::vector<std::string> > groups;
        for (const auto& g : st.degGroups) {
            bool valid = true;
            Eigen::Index dim = -1;
            for (const auto& label : g) {
                const auto it = std::find_if(st.solver.begin(), st.solver.end(), [&](const SolverBlock& sb) {return sb.label == label;});
                if (it == st.solver.end() || (dim >= 0 && it->dim() != dim)) valid = false;
                else dim = it->dim();
            }
            if (valid) groups.push_back(g);
        }
        st.degGroups = groups;
    }
}

void BlockStructure::applyDegeneracyMap(const DegeneracyMap& degs) {
    for (const auto& [s, groups] : degs) {
        checkSite(s);
        SiteBlockStructure& st = m_sites[s];
        std::vector<std::string> seen;
        for (const auto& g : groups) {
            Eigen::Index dim = -1;
            for (const auto& label : g) {
                const SolverBlock& sb = st.solverBlock(label);
                if (dim >= 0 && sb.dim() != dim) throw ConfigurationError("Degenerate blocks of site " + std::to_string(s) + " differ in dimension");
                dim = sb.dim();
                if (std::find(seen.begin(), seen.end(), label) != seen.end())
                    throw ConfigurationError("Block " + label + " of site " + std::to_string(s) + " is in two degeneracy groups");
                seen.push_back(label);
            }
        }
        st.degGroups = groups;
    }
}

void BlockStructure::stripDegeneracies(const bool magnetic) {
    for (auto& st : m_sites) {
        if (m_spinOrbit) {
            st.degGroups.clear();
            continue;
        }
        if (!magnetic) continue;
        std::vector<std::vector<std::string> > groups;
        for (const auto& g : st.degGroups) {
            std::map<SpinChannel, std::vector<std::string> > split;
            for (const auto& label : g) split[st.solverBlock(label).spin].push_back(label);
            for (const auto& kv : split) if (kv.second.size() > 1) groups.push_back(kv.second);
        }
        st.degGroups = groups;
    }
}


BlockGf BlockStructure::rotate(const BlockGf& q, const Eigen::Index isite, const RotDirection dir) const {
    checkSite(isite);
    const Eigen::MatrixXcd& R = m_sites[isite].rotation;
    BlockGf out(q);
    if (R.isIdentity(1e-14)) return out;
    for (auto& [label, arr] : out) {
        if (arr.dim() != R.rows()) throw std::invalid_argument("rotate: block " + label + " does not match the rotation dimension!");
        for (Eigen::Index i = 0; i < arr.nfreq(); ++i) {
            if (dir == RotDirection::ToLocal) arr[i] = R.adjoint() * q[label][i] * R;
            else arr[i] = R * q[label][i] * R.adjoint();
        }
    }
    return out;
}

BlockMatrix BlockStructure::rotate(const BlockMatrix& q, const Eigen::Index isite, const RotDirection dir) const {
    checkSite(isite);
    const Eigen::MatrixXcd& R = m_sites[isite].rotation;
    BlockMatrix out(q);
    for (auto& [label, mat] : out) {
        if (mat.rows() != R.rows()) throw std::invalid_argument("rotate: block " + label + " does not match the rotation dimension!");
        if (dir == RotDirection::ToLocal) mat = R.adjoint() * q.at(label) * R;
        else mat = R * q.at(label) * R.adjoint();
    }
    return out;
}

BlockGf BlockStructure::convert(const BlockGf& q, const GfSpace from, const GfSpace to, const Eigen::Index isite) const {
    checkSite(isite);
    if (from == to) return q;
    const SiteBlockStructure& st = m_sites[isite];
    if (from == GfSpace::Lattice) {
        const BlockGf local = rotate(q, isite, RotDirection::ToLocal);
        BlockGf out = createGf(isite, GfSpace::Solver, q.meshPtr());
        for (const auto& sb : st.solver) {
            const MatFreqArray& src = local[sb.latticeBlock];
            MatFreqArray& dst = out[sb.label];
            for (Eigen::Index i = 0; i < dst.nfreq(); ++i) {
                for (Eigen::Index a = 0; a < sb.dim(); ++a) {
                    for (Eigen::Index b = 0; b < sb.dim(); ++b) dst(i, a, b) = src(i, sb.indices[a], sb.indices[b]);
                }
            }
        }
        return out;
    }
    BlockGf scattered = createGf(isite, GfSpace::Lattice, q.meshPtr());
    for (const auto& sb : st.solver) {
        const MatFreqArray& src = q[sb.label];
        MatFreqArray& dst = scattered[sb.latticeBlock];
        for (Eigen::Index i = 0; i < src.nfreq(); ++i) {
            for (Eigen::Index a = 0; a < sb.dim(); ++a) {
                for (Eigen::Index b = 0; b < sb.dim(); ++b) dst(i, sb.indices[a], sb.indices[b]) = src(i, a, b);
            }
        }
    }
    return rotate(scattered, isite, RotDirection::ToGlobal);
}

BlockMatrix BlockStructure::convert(const BlockMatrix& q, const GfSpace from, const GfSpace to, const Eigen::Index isite) const {
    checkSite(isite);
    if (from == to) return q;
    const SiteBlockStructure& st = m_sites[isite];
    if (from == GfSpace::Lattice) {
        const BlockMatrix local = rotate(q, isite, RotDirection::ToLocal);
        BlockMatrix out;
        for (const auto& sb : st.solver) out[sb.label] = local.at(sb.latticeBlock)(sb.indices, sb.indices);
        return out;
    }
    BlockMatrix scattered = createMatrix(isite, GfSpace::Lattice);
    for (const auto& sb : st.solver) {
        const Eigen::MatrixXcd& src = q.at(sb.label);
        Eigen::MatrixXcd& dst = scattered[sb.latticeBlock];
        for (Eigen::Index a = 0; a < sb.dim(); ++a) {
            for (Eigen::Index b = 0; b < sb.dim(); ++b) dst(sb.indices[a], sb.indices[b]) = src(a, b);
        }
    }
    return rotate(scattered, isite, RotDirection::ToGlobal);
}

void BlockStructure::symmetrize(BlockGf& q, const Eigen::Index isite) const {
    checkSite(isite);
    for (const auto& g : m_sites[isite].degGroups) {
        Eigen::MatrixXcd avg = q[g[0]]();
        for (std::size_t k = 1; k < g.size(); ++k) {
            if (q[g[k]]().cols() != avg.cols()) throw std::invalid_argument("symmetrize: degenerate blocks differ in size!");
            avg += q[g[k]]();
        }
        avg /= static_cast<double>(g.size());
        for (const auto& label : g) q[label]() = avg;
    }
}

void BlockStructure::symmetrize(BlockMatrix& q, const Eigen::Index isite) const {
    checkSite(isite);
    for (const auto& g : m_sites[isite].degGroups) {
        Eigen::MatrixXcd avg = q.at(g[0]);
        for (std::size_t k = 1; k < g.size(); ++k) avg += q.at(g[k]);
        avg /= static_cast<double>(g.size());
        for (const auto& label : g) q[label] = avg;
    }
}


void BlockStructure::setRotation(const Eigen::Index isite, const Eigen::MatrixXcd& rot) {
    checkSite(isite);
    SiteBlockStructure& st = m_sites[isite];
    if (rot.rows() != st.lattice[0].dim || rot.cols() != st.lattice[0].dim)
        throw std::invalid_argument("Rotation matrix of site " + std::to_string(isite) + " has a wrong dimension!");
    if (!(rot.adjoint() * rot).isIdentity(1e-8)) throw std::invalid_argument("Rotation matrix of site " + std::to_string(isite) + " is not unitary!");
    st.rotation = rot;
}

Eigen::MatrixXcd BlockStructure::calculateRotation(const Eigen::MatrixXcd& herm) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> es(0.5 * (herm + herm.adjoint()));
    if (es.info() != Eigen::Success) throw std::runtime_error("calculateRotation: eigen decomposition failed!");
    Eigen::MatrixXcd R = es.eigenvectors();
    // Fix the gauge so that the largest component of each basis vector is real positive
    Eigen::Index imax;
    for (Eigen::Index j = 0; j < R.cols(); ++j) {
        R.col(j).cwiseAbs().maxCoeff(&imax);
        R.col(j) *= std::abs(R(imax, j)) / R(imax, j);
    }
    return R;
}

void BlockStructure::compare(const BlockStructure& other) const {
    if (nSites() != other.nSites() || m_spinOrbit != other.m_spinOrbit) throw InconsistentStateError("Block structures differ in number of sites or spin-orbit coupling");
    bool rotdiff = false;
    for (Eigen::Index s = 0; s < nSites(); ++s) {
        const SiteBlockStructure& a = m_sites[s];
        const SiteBlockStructure& b = other.m_sites[s];
        if (a.norb != b.norb || a.solver != b.solver)
            throw InconsistentStateError("Block partition of site " + std::to_string(s) + " differs from the stored one");
        if (a.degGroups != b.degGroups) throw InconsistentStateError("Degeneracy groups of site " + std::to_string(s) + " differ from the stored ones");
        if (a.rotation.rows() != b.rotation.rows() || (a.rotation - b.rotation).cwiseAbs().maxCoeff() > 1e-8) rotdiff = true;
    }
    if (rotdiff) throw RotationMismatch("Rotation matrices differ from the stored ones");
}


std::string BlockStructure::layout() const {
    std::ostringstream ss;
    ss << "sites " << nSites() << " spin_orbit " << (m_spinOrbit ? 1 : 0) << "\n";
    for (Eigen::Index s = 0; s < nSites(); ++s) {
        const SiteBlockStructure& st = m_sites[s];
        ss << "site " << s << " norb " << st.norb << "\n";
        for (const auto& sb : st.solver) {
            ss << "block " << sb.label << " " << spinChannelName(sb.spin) << " " << sb.latticeBlock;
            for (const auto i : sb.indices) ss << " " << i;
            ss << "\n";
        }
        for (const auto& g : st.degGroups) {
            ss << "deg";
            for (const auto& label : g) ss << " " << label;
            ss << "\n";
        }
    }
    return ss.str();
}

BlockStructure BlockStructure::fromLayout(const std::string& text) {
    std::istringstream ss(text);
    std::string line, key, word;
    Eigen::Index nsites = 0;
    int so = 0;
    if (!std::getline(ss, line)) throw std::invalid_argument("Empty block structure layout!");
    std::istringstream head(line);
    head >> key >> nsites >> word >> so;
    if (key != "sites" || !head) throw std::invalid_argument("Malformed block structure layout header: " + line);

    std::vector<std::pair<Eigen::Index, std::vector<std::string> > > siteLines;
    while (std::getline(ss, line)) {
        if (line.empty()) continue;
        std::istringstream ls(line);
        ls >> key;
        if (key == "site") {
            Eigen::Index s, norb;
            ls >> s >> word >> norb;
            siteLines.push_back({norb, {}});
        }
        else if (siteLines.empty()) throw std::invalid_argument("Malformed block structure layout line: " + line);
        else siteLines.back().second.push_back(line);
    }
    if (static_cast<Eigen::Index>(siteLines.size()) != nsites) throw std::invalid_argument("Block structure layout has a wrong number of sites!");

    std::vector<Eigen::Index> norbs;
    for (const auto& sl : siteLines) norbs.push_back(sl.first);
    BlockStructure bs(norbs, so != 0);
    for (Eigen::Index s = 0; s < nsites; ++s) {
        SiteBlockStructure& st = bs.m_sites[s];
        st.solver.clear();
        for (const auto& l : siteLines[s].second) {
            std::istringstream ls(l);
            ls >> key;
            if (key == "block") {
                SolverBlock sb;
                std::string spin;
                Eigen::Index idx;
                ls >> sb.label >> spin >> sb.latticeBlock;
                sb.spin = spinChannelFromName(spin);
                while (ls >> idx) sb.indices.push_back(idx);
                st.latticeBlock(sb.latticeBlock);
                st.solver.push_back(sb);
            }
            else if (key == "deg") {
                std::vector<std::string> g;
                while (ls >> word) g.push_back(word);
                st.degGroups.push_back(g);
            }
            else throw std::invalid_argument("Malformed block structure layout line: " + l);
        }
    }
    return bs;
}

void BlockStructure::write(CheckpointStore& store, const std::string& path) const {
    store.remove(path);
    store.createGroup(path);
    store.writeString(path + "/layout", layout());
    for (Eigen::Index s = 0; s < nSites(); ++s) store.writeMatrix(path + "/rot_mat_" + std::to_string(s), m_sites[s].rotation);
}

BlockStructure BlockStructure::read(const CheckpointStore& store, const std::string& path) {
    if (!store.exists(path + "/layout")) throw ArchiveError("Archive " + store.filename() + " holds no block structure at " + path);
    BlockStructure bs = fromLayout(store.readString(path + "/layout"));
    for (Eigen::Index s = 0; s < bs.nSites(); ++s) bs.setRotation(s, store.readMatrix(path + "/rot_mat_" + std::to_string(s)));
    return bs;
}

void BlockStructure::broadcast(const Coordinator& coord) {
    std::string text;
    if (coord.isCoordinator()) text = layout();
    coord.broadcast(text);
    if (!coord.isCoordinator()) *this = fromLayout(text);
    for (auto& st : m_sites) coord.broadcast(st.rotation);
}


std::ostream& operator<<(std::ostream& os, const BlockStructure& bs) {
    for (Eigen::Index s = 0; s < bs.nSites(); ++s) {
        const SiteBlockStructure& st = bs.site(s);
        os << "    Site " << s << ": solver blocks";
        for (const auto& sb : st.solver) os << " " << sb.label << "(" << sb.dim() << ")";
        if (!st.degGroups.empty()) {
            os << ", degenerate";
            for (const auto& g : st.degGroups) {
                os << " [";
                for (std::size_t k = 0; k < g.size(); ++k) os << (k > 0 ? " " : "") << g[k];
                os << "]";
            }
        }
        os << std::endl;
    }
    return os;
}
