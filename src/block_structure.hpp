//
//  block_structure.hpp
//  dmft-scf
//

#ifndef block_structure_hpp
#define block_structure_hpp

#include <map>
#include <string>
#include <vector>
#include <Eigen/Core>
#include "gf_data_wrapper.hpp"

class CheckpointStore;
class Coordinator;


enum class SpinChannel : int {Up = 0, Down = 1, Mixed = 2};
enum class GfSpace : int {Lattice = 0, Solver = 1};
enum class RotDirection : int {ToLocal = 0, ToGlobal = 1};

std::string spinChannelName(const SpinChannel s);
SpinChannel spinChannelFromName(const std::string& name);

struct LatticeBlock {
    std::string label;
    Eigen::Index dim;
    SpinChannel spin;
};

struct SolverBlock {
    std::string label;
    SpinChannel spin;
    // Lattice block this block is projected from, and the kept orbital indices within it
    std::string latticeBlock;
    std::vector<Eigen::Index> indices;

    Eigen::Index dim() const {return static_cast<Eigen::Index>(indices.size());}
    bool operator==(const SolverBlock& other) const {
        return label == other.label && spin == other.spin && latticeBlock == other.latticeBlock && indices == other.indices;
    }
};

// Lattice orbital of a solver block entry, used by solvers that need the spin-orbital layout
struct OrbitalRef {
    Eigen::Index orbital;
    SpinChannel spin;
};

struct SiteBlockStructure {
    Eigen::Index norb;
    std::vector<LatticeBlock> lattice;
    std::vector<SolverBlock> solver;
    // Columns are the local basis vectors in the global frame (dimension of one lattice block)
    Eigen::MatrixXcd rotation;
    std::vector<std::vector<std::string> > degGroups;

    const SolverBlock& solverBlock(const std::string& label) const;
    const LatticeBlock& latticeBlock(const std::string& label) const;
    Eigen::Index latticeDim() const;
    Eigen::Index solverDim() const;
};


// Per site: solver block label -> kept indices within that block
typedef std::map<Eigen::Index, std::map<std::string, std::vector<Eigen::Index> > > BlockSelection;
// Per site: groups of solver block labels forced to be degenerate
typedef std::map<Eigen::Index, std::vector<std::vector<std::string> > > DegeneracyMap;


// Partition of every inequivalent site's orbital space into solver blocks, with the basis rotation and the
// degeneracy groups. Lattice space holds the blocks "up"/"down" (or "ud" with spin-orbit coupling) in the global frame;
// solver space holds the blocks "<lattice block>_<k>" in the local frame.
class BlockStructure {
public:
    BlockStructure() : m_spinOrbit(false) {}
    BlockStructure(const std::vector<Eigen::Index>& norbs, const bool spinOrbit);

    Eigen::Index nSites() const {return static_cast<Eigen::Index>(m_sites.size());}
    bool spinOrbit() const {return m_spinOrbit;}
    const SiteBlockStructure& site(const Eigen::Index isite) const;

    std::vector<std::pair<std::string, Eigen::Index> > blockDims(const Eigen::Index isite, const GfSpace space) const;
    BlockGf createGf(const Eigen::Index isite, const GfSpace space, std::shared_ptr<const FrequencyMesh> mesh) const;
    BlockMatrix createMatrix(const Eigen::Index isite, const GfSpace space) const;
    // Spin-orbital of every entry of every solver block
    std::map<std::string, std::vector<OrbitalRef> > orbitalMap(const Eigen::Index isite) const;

    void determine(const std::vector<BlockMatrix>& refdens, const double threshold, const std::vector<bool>& includeSites);
    // Sites without a selection keep their blocks; blocks missing from a site's selection are dropped
    void applyManualOverride(const BlockSelection& selection);
    void applyDegeneracyMap(const DegeneracyMap& degs);
    void stripDegeneracies(const bool magnetic);

    BlockGf convert(const BlockGf& q, const GfSpace from, const GfSpace to, const Eigen::Index isite) const;
    BlockMatrix convert(const BlockMatrix& q, const GfSpace from, const GfSpace to, const Eigen::Index isite) const;
    // Only lattice-space quantities are rotated
    BlockGf rotate(const BlockGf& q, const Eigen::Index isite, const RotDirection dir) const;
    BlockMatrix rotate(const BlockMatrix& q, const Eigen::Index isite, const RotDirection dir) const;
    // Average solver-space quantities over each degeneracy group
    void symmetrize(BlockGf& q, const Eigen::Index isite) const;
    void symmetrize(BlockMatrix& q, const Eigen::Index isite) const;

    void setRotation(const Eigen::Index isite, const Eigen::MatrixXcd& rot);
    static Eigen::MatrixXcd calculateRotation(const Eigen::MatrixXcd& herm);

    void compare(const BlockStructure& other) const;

    // Plain text description of the partition and degeneracies, rotations excluded
    std::string layout() const;
    static BlockStructure fromLayout(const std::string& text);

    void write(CheckpointStore& store, const std::string& path) const;
    static BlockStructure read(const CheckpointStore& store, const std::string& path);
    // Replace the structure on every process by the coordinator's
    void broadcast(const Coordinator& coord);

private:
    std::vector<SiteBlockStructure> m_sites;
    bool m_spinOrbit;

    void setFullBlocks(SiteBlockStructure& st) const;
    void checkSite(const Eigen::Index isite) const;
};

std::ostream& operator<<(std::ostream& os, const BlockStructure& bs);

#endif /* block_structure_hpp */
