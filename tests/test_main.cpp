//
//  test_main.cpp
//  dmft-scf
//

#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"
#include <mpi.h>


// All tests run on MPI_COMM_WORLD
int main(int argc, char * argv[]) {
    MPI_Init(&argc, &argv);
    const int result = Catch::Session().run(argc, argv);
    MPI_Finalize();
    return result;
}
