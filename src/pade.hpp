//
//  pade.hpp
//  dmft-scf
//

#ifndef pade_hpp
#define pade_hpp

#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>
#include <Eigen/SVD>
#include "gf_data_wrapper.hpp"


// Rational approximant f(z) = (a_0 + ... + a_{r-1} z^{r-1}) / (b_0 + ... + b_{r-1} z^{r-1} + z^r) fitted to matrix-valued
// data on the non-negative Matsubara frequencies, elementwise, by linear least squares. N = 2r coefficients per element.
class PadeApproximant {
public:
    PadeApproximant() : m_dim(0) {}
    PadeApproximant(const MatFreqArray& data, const FrequencyMesh& mesh, const Eigen::Index npoints, const Eigen::Index ncoeffs) {
        build(data, mesh, npoints, ncoeffs);
    }

    PadeApproximant& build(const MatFreqArray& data, const FrequencyMesh& mesh, const Eigen::Index npoints, const Eigen::Index ncoeffs);

    Eigen::MatrixXcd operator()(const std::complex<double> z) const;

private:
    Eigen::Index m_dim;
    // Column-major element order
    std::vector<Eigen::VectorXcd> m_coeffs;
};


inline PadeApproximant& PadeApproximant::build(const MatFreqArray& data, const FrequencyMesh& mesh, const Eigen::Index npoints, const Eigen::Index ncoeffs) {
    if (mesh.kind() != MeshKind::Matsubara) throw std::invalid_argument("Pade approximant needs data on a Matsubara mesh!");
    if (ncoeffs % 2 != 0) throw std::invalid_argument("The number of Pade coefficients must be even!");
    if (ncoeffs < 2 || ncoeffs > npoints) throw std::invalid_argument("The number of Pade coefficients must be between 2 and the data length!");
    if (mesh.zeroIndex() + npoints > mesh.size()) throw std::range_error("Required data length exceeds the mesh for building Pade approximant!");

    m_dim = data.dim();
    const Eigen::Index r = ncoeffs / 2;
    Eigen::VectorXcd zs(npoints), f(npoints), b;
    for (Eigen::Index iz = 0; iz < npoints; ++iz) zs(iz) = mesh(mesh.zeroIndex() + iz);

    // Left-half columns of the least square system are the powers of z
    Eigen::MatrixXcd A = Eigen::MatrixXcd::Ones(npoints, ncoeffs);
    for (Eigen::Index ir = 1; ir < r; ++ir) A.col(ir) = A.col(ir - 1).cwiseProduct(zs);
    const Eigen::MatrixXcd powers = A.leftCols(r);
    const Eigen::VectorXcd zr = powers.col(r - 1).cwiseProduct(zs);

    Eigen::BDCSVD<Eigen::MatrixXcd> lssolver;
    m_coeffs.clear();
    for (Eigen::Index x1 = 0; x1 < m_dim; ++x1) {
        for (Eigen::Index x0 = 0; x0 < m_dim; ++x0) {
            for (Eigen::Index iz = 0; iz < npoints; ++iz) f(iz) = data(mesh.zeroIndex() + iz, x0, x1);
            A.rightCols(r).noalias() = f.asDiagonal() * (-powers);
            b = f.cwiseProduct(zr);
            m_coeffs.push_back(lssolver.compute(A, Eigen::ComputeThinU | Eigen::ComputeThinV).solve(b));
        }
    }
    return *this;
}

inline Eigen::MatrixXcd PadeApproximant::operator()(const std::complex<double> z) const {
    if (m_coeffs.empty()) throw std::logic_error("Pade approximant has not been built!");
    Eigen::MatrixXcd val(m_dim, m_dim);
    std::complex<double> num, den, zp;
    Eigen::Index r;
    for (Eigen::Index x1 = 0; x1 < m_dim; ++x1) {
        for (Eigen::Index x0 = 0; x0 < m_dim; ++x0) {
            const Eigen::VectorXcd& c = m_coeffs[x1 * m_dim + x0];
            r = c.size() / 2;
            num = 0.0;
            den = 0.0;
            zp = 1.0;
            for (Eigen::Index ir = 0; ir < r; ++ir) {
                num += c(ir) * zp;
                den += c(r + ir) * zp;
                zp *= z;
            }
            den += zp;
            val(x0, x1) = num / den;
        }
    }
    return val;
}

#endif /* pade_hpp */
