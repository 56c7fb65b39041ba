//
//  main.cpp
//  dmft-scf
//

#include <chrono>
#include <iomanip>
#include "self_consistency.hpp"



int main(int argc, char * argv[]) {
    // Get starting timepoint
    auto start = std::chrono::high_resolution_clock::now();

    int prank;
    MPI_Init(&argc, &argv);
    MPI_Comm_rank(MPI_COMM_WORLD, &prank);
    int status = 0;
    {
        const Coordinator coord(MPI_COMM_WORLD);
        const std::string inputfile = argc > 1 ? argv[1] : "input.xml";
        try {
            const RunConfig cfg = RunConfig::load(inputfile, coord);
            auto lattice = makeLattice(cfg, coord.comm());
            if (coord.isCoordinator()) {
                std::cout << "Tight-binding lattice with " << lattice->hamiltonianDim() << " orbitals per spin channel, "
                          << lattice->nkTotal() << " k-points, " << cfg.nSites() << " inequivalent sites" << std::endl;
            }

            // No sampling backend is linked into the executable; sites need the hartree solver
            SelfConsistencyEngine engine(cfg, lattice, coord);
            const RunSummary summary = engine.run();
            if (coord.isCoordinator()) {
                std::cout << std::endl << "Done " << summary.iterations << " iterations, last one is " << summary.lastIteration
                          << (summary.converged ? ", converged" : ", not converged") << std::endl;
                std::cout << std::setprecision(10) << "Final chemical potential: " << summary.mu << std::endl;
            }
        }
        catch (const std::exception& e) {
            // Every process holds the same error; only the coordinator prints it
            if (coord.isCoordinator()) std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }

    MPI_Finalize();
    auto stop = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::ratio<60> > duration = stop - start;   // Unit is minutes
    if (status == 0 && prank == 0) std::cout << "Execution time: " << duration.count() << " minutes" << std::endl;
    return status;
}
