//
//  afm_mapping.cpp
//  dmft-scf
//

#include <cmath>
#include "afm_mapping.hpp"


std::vector<AFMMap> AFMShortcut::determineMapping(const std::vector<double>& magmom, const double tol) {
    std::vector<AFMMap> map(magmom.size());
    for (std::size_t i = 0; i < magmom.size(); ++i) {
        if (std::abs(magmom[i]) < tol) continue;
        for (std::size_t j = 0; j < i; ++j) {
            if (map[j].mapped) continue;
            if (std::abs(magmom[i] + magmom[j]) < tol) map[i] = {true, static_cast<Eigen::Index>(j), true};
            else if (std::abs(magmom[i] - magmom[j]) < tol) map[i] = {true, static_cast<Eigen::Index>(j), false};
            if (map[i].mapped) break;
        }
    }
    return map;
}

// Solver blocks of one spin channel in structure order
static std::vector<std::string> channelBlocks(const SiteBlockStructure& st, const SpinChannel spin) {
    std::vector<std::string> labels;
    for (const auto& sb : st.solver) {
        if (sb.spin == SpinChannel::Mixed) throw ConfigurationError("AFM mapping needs spin resolved solver blocks");
        if (sb.spin == spin) labels.push_back(sb.label);
    }
    return labels;
}

BlockGf AFMShortcut::mapGf(const BlockGf& src, const Eigen::Index isrc, const Eigen::Index itgt, const bool flip, const BlockStructure& blocks) {
    const SiteBlockStructure& ss = blocks.site(isrc);
    const SiteBlockStructure& ts = blocks.site(itgt);
    BlockGf tgt = blocks.createGf(itgt, GfSpace::Solver, src.meshPtr());
    for (const SpinChannel spin : {SpinChannel::Up, SpinChannel::Down}) {
        const SpinChannel from = flip ? (spin == SpinChannel::Up ? SpinChannel::Down : SpinChannel::Up) : spin;
        const std::vector<std::string> tl = channelBlocks(ts, spin);
        const std::vector<std::string> sl = channelBlocks(ss, from);
        if (tl.size() != sl.size())
            throw InconsistentStateError("AFM mapping from site " + std::to_string(isrc) + " to site " + std::to_string(itgt) + ": block structures do not match");
        for (std::size_t b = 0; b < tl.size(); ++b) {
            if (tgt[tl[b]].dim() != src[sl[b]].dim())
                throw InconsistentStateError("AFM mapping: block " + sl[b] + " and block " + tl[b] + " differ in dimension");
            tgt[tl[b]] = src[sl[b]];
        }
    }
    return tgt;
}

void AFMShortcut::apply(ImpuritySolver& target, const ImpuritySolver& source, const bool flip, const BlockStructure& blocks) {
    const Eigen::Index isrc = source.siteIndex(), itgt = target.siteIndex();
    target.setSelfEnergy(mapGf(source.selfEnergy(), isrc, itgt, flip, blocks));
    target.setGreenFunction(mapGf(source.greenFunction(), isrc, itgt, flip, blocks));
}
