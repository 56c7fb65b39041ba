//
//  afm_mapping.hpp
//  dmft-scf
//

#ifndef afm_mapping_hpp
#define afm_mapping_hpp

#include <vector>
#include "impurity_solver.hpp"


struct AFMMap {
    bool mapped = false;
    Eigen::Index source = -1;
    bool flip = false;
};


// Sites whose initial moment equals (or is opposite to) the moment of an earlier site copy that site's solution
// instead of solving
class AFMShortcut {
public:
    AFMShortcut() = default;
    explicit AFMShortcut(const std::vector<double>& magmom) : m_map(determineMapping(magmom)) {}

    static std::vector<AFMMap> determineMapping(const std::vector<double>& magmom, const double tol = 1e-8);

    const std::vector<AFMMap>& mapping() const {return m_map;}
    const AFMMap& at(const Eigen::Index isite) const {return m_map.at(isite);}
    bool isMapped(const Eigen::Index isite) const {return isite < static_cast<Eigen::Index>(m_map.size()) && m_map[isite].mapped;}

    // Copy Sigma and G of the source into the target solver, exchanging the up and down channels if flip
    static void apply(ImpuritySolver& target, const ImpuritySolver& source, const bool flip, const BlockStructure& blocks);
    // target solver-space quantity from the source site's one
    static BlockGf mapGf(const BlockGf& src, const Eigen::Index isrc, const Eigen::Index itgt, const bool flip, const BlockStructure& blocks);

private:
    std::vector<AFMMap> m_map;
};

#endif /* afm_mapping_hpp */
