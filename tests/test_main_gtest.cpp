/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for the QWRAP GTest suite
 *
 * Labelled arrays hold PETSc vectors, so PETSc (and through it MPI) is
 * initialised before any test runs. Vectors live on PETSC_COMM_SELF, so
 * `mpiexec -n N ./qwrap_tests` runs an independent copy of the suite on
 * every rank; only rank 0 reports.
 */

#include <gtest/gtest.h>
#include <petsc.h>

static char help[] = "QWRAP unit tests\n";

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, help);
    if (ierr) return static_cast<int>(ierr);

    PetscMPIInt rank = 0;
    MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    ierr = PetscFinalize();
    return ierr ? static_cast<int>(ierr) : result;
}
