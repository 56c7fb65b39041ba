//
//  noise.hpp
//  dmft-scf
//

#ifndef noise_hpp
#define noise_hpp

#include <random>
#include "coordinator.hpp"


// Frequency independent hermitian Gaussian perturbations 0.5 * (N + N^T) breaking accidental degeneracies of a cold-start self-energy. The
// random numbers are drawn on the coordinator and broadcast.
class NoiseInjector {
public:
    NoiseInjector(const unsigned int seed, const Coordinator& coord) : m_reng(seed), m_coord(coord) {}

    void inject(BlockGf& g, const double level);
    void inject(BlockMatrix& m, const double level);

private:
    std::mt19937 m_reng;
    const Coordinator& m_coord;

    Eigen::MatrixXcd sample(const Eigen::Index dim, const double level);
};

#endif /* noise_hpp */
