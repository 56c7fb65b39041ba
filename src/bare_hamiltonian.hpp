//
//  bare_hamiltonian.hpp
//  dmft-scf
//

#ifndef bare_hamiltonian_hpp
#define bare_hamiltonian_hpp

#include <Eigen/Geometry>
#include "lattice_embedding.hpp"


// Correlated shell of the unit cell, mapped to an inequivalent site
struct CorrelatedShell {
    Eigen::Index norb;
    Eigen::Index site;
};

// Hopping t from orbital b in cell R to orbital a in the home cell. Orbital indices run over the whole Hamiltonian space:
// the shells are stacked in order, each with norb orbitals (2 * norb spin-orbitals, up ones first, with spin-orbit coupling).
struct HoppingTerm {
    Eigen::VectorXi R;
    Eigen::Index a, b;
    std::complex<double> t;
};


// Tight-binding lattice whose orbitals are all correlated. Without spin-orbit coupling H(k) is spin independent apart from
// the Zeeman term -h (up) / +h (down). k-points are distributed over processes and the lattice sums all-reduced.
class TightBindingLattice : public LatticeEmbedding {
public:
    TightBindingLattice(std::shared_ptr<const FrequencyMesh> mesh, const BlockStructure& blocks, const std::vector<CorrelatedShell>& shells,
                        const MPI_Comm& comm = MPI_COMM_WORLD);

    template <typename Derived>
    void primVecs(const Eigen::MatrixBase<Derived>& a);   // Set primative vectors
    const Eigen::MatrixXd& primVecs() const {return m_a;}
    const Eigen::MatrixXd& kPrimVecs() const {return m_K;}

    void kGridSizes(const std::vector<Eigen::Index>& nk);
    const std::vector<Eigen::Index>& kGridSizes() const {return m_nk;}
    Eigen::Index nkTotal() const;
    void kVecAtIndex(Eigen::Index ik, Eigen::VectorXd& k) const;  // Calculate the ik-th k vector

    void onsiteEnergies(const Eigen::VectorXd& e);
    // The hermitian partner of every term is added automatically
    void addHopping(const HoppingTerm& term);

    Eigen::Index hamiltonianDim() const {return m_dim;}
    Eigen::Index multiplicity(const Eigen::Index isite) const;
    const std::vector<CorrelatedShell>& shells() const {return m_shells;}

    // Hamiltonian of spin channel ispin (ignored with spin-orbit coupling) at k
    void constructHamiltonian(const Eigen::VectorXd& k, const int ispin, Eigen::MatrixXcd& H) const;

    std::vector<BlockGf> extractLocalGreenFunction(const double broadening = 0.0) const override;
    double totalDensity(const double mu) const override;
    DensityCorrection densityCorrection(const std::string& dmType) const override;

protected:
    BlockMatrix localHamiltonian(const Eigen::Index isite) const override;

private:
    std::vector<CorrelatedShell> m_shells;
    std::vector<Eigen::Index> m_shellOffsets;
    Eigen::Index m_dim;
    Eigen::MatrixXd m_a;  // Stores primative vectors in columns
    Eigen::MatrixXd m_K;  // Stores reciprocal primative vectors in columns
    std::vector<Eigen::Index> m_nk;
    Eigen::VectorXd m_onsite;
    std::vector<HoppingTerm> m_hoppings;

    int nSpinChannels() const {return m_blocks.spinOrbit() ? 1 : 2;}
    Eigen::Index shellDim(const std::size_t ish) const {return m_blocks.spinOrbit() ? 2 * m_shells[ish].norb : m_shells[ish].norb;}
    void addZeeman(const int ispin, Eigen::MatrixXcd& H) const;
    // Sigma - DC of all shells on the whole Hamiltonian space, per spin channel
    std::vector<MatFreqArray> embeddedSelfEnergyFull() const;
    // 1/Nk sum_k [(z + mu) - H(k) - Sigma]^-1 on the whole Hamiltonian space, per spin channel, summed over processes
    std::vector<MatFreqArray> localFull(const double mu, const double broadening, const bool interacting) const;
    std::vector<BlockGf> projectToSites(const std::vector<MatFreqArray>& full) const;
    std::complex<double> evalPoint(const Eigen::Index i, const double broadening) const;
};


// Set unit cell vectors and the reciprocal ones
template <typename Derived>
void TightBindingLattice::primVecs(const Eigen::MatrixBase<Derived>& a) {
    if (a.rows() != a.cols()) {
        throw std::invalid_argument( "The dimension and number of primative vectors do not match!" );
    }
    else if (a.cols() == 0 || a.cols() > 3) {
        throw std::invalid_argument( "Primative vectors can only be of 1D, 2D, or 3D!" );
    }

    m_a = a;
    m_K.resize(m_a.cols(), m_a.cols());
    if (m_a.cols() == 1) {
        m_K(0, 0) = 2 * M_PI / m_a(0, 0);
    }
    else if (m_a.cols() == 2) {
        Eigen::Rotation2Dd rot90(M_PI / 2);
        Eigen::VectorXd tmp(2);
        tmp.noalias() = rot90 * m_a.col(1);
        m_K.col(0) = (2 * M_PI) * tmp / m_a.col(0).dot(tmp);
        tmp.noalias() = rot90 * m_a.col(0);
        m_K.col(1) = (2 * M_PI) * tmp / m_a.col(1).dot(tmp);
    }
    else {
        Eigen::Matrix3d ar = m_a;  // Cast dynamic-sized a to static 3*3 matrix to allow cross product
        const double v0 = ar.col(0).dot(ar.col(1).cross(ar.col(2)));
        m_K.col(0).noalias() = (2 * M_PI / v0) * ar.col(1).cross(ar.col(2));
        m_K.col(1).noalias() = (2 * M_PI / v0) * ar.col(2).cross(ar.col(0));
        m_K.col(2).noalias() = (2 * M_PI / v0) * ar.col(0).cross(ar.col(1));
    }
    m_nk.assign(m_a.cols(), 1);
}

#endif /* bare_hamiltonian_hpp */
