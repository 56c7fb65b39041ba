//
//  noise.cpp
//  dmft-scf
//

#include "noise.hpp"


Eigen::MatrixXcd NoiseInjector::sample(const Eigen::Index dim, const double level) {
    std::normal_distribution<double> nd(0.0, level);
    Eigen::MatrixXcd n(dim, dim);
    for (Eigen::Index j = 0; j < dim; ++j) {
        for (Eigen::Index i = 0; i < dim; ++i) n(i, j) = nd(m_reng);
    }
    return 0.5 * (n + n.transpose());
}

void NoiseInjector::inject(BlockGf& g, const double level) {
    if (level < 0.0) throw std::invalid_argument("Noise level must be non-negative!");
    if (level == 0.0) return;
    // One frequency independent matrix per block
    BlockMatrix noise;
    for (const auto& [label, arr] : g) noise[label] = Eigen::MatrixXcd::Zero(arr.dim(), arr.dim());
    inject(noise, level);
    g.addStatic(noise);
}

void NoiseInjector::inject(BlockMatrix& m, const double level) {
    if (level < 0.0) throw std::invalid_argument("Noise level must be non-negative!");
    if (level == 0.0) return;
    for (auto& [label, mat] : m) {
        Eigen::MatrixXcd noise;
        if (m_coord.isCoordinator()) noise = sample(mat.rows(), level);
        m_coord.broadcast(noise);
        mat += noise;
    }
}
