//==============================================================================
// main.cpp
// Entry point for running a thin-film convergence study.
//   thinfilm_study [study.json]
// Loads a StudyConfig (default data/study.json), sweeps the collocation
// solver over the configured truncation lengths, mesh sizes and
// regularizations, and prints a summary table plus a truncation-independence
// check of h' on the smallest common domain.
//
// Parallel backend (compile-time):
//   USE_OPENMP : configurations are solved concurrently
//==============================================================================

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "ConvergenceStudy.hpp"

int main(int argc, char* argv[])
{
    std::string inputPath{"data/study.json"};

    if (argc > 1)
    {
        inputPath = std::string(argv[1]);
    }

    try
    {
        // Fail fast if file does not exist
        if (!std::filesystem::exists(inputPath))
        {
            throw std::invalid_argument("Invalid study input path: " + inputPath);
        }

        StudyConfig studyConfig = StudyConfig::loadFromJson(inputPath);

        #ifdef USE_OPENMP
        std::cout << "Starting convergence study with " << omp_get_max_threads() << " threads.\n\n";
        #else
        std::cout << "Starting convergence study.\n\n";
        #endif

        if (studyConfig.base.Verbose) studyConfig.base.print_config();

        ConvergenceStudy study(studyConfig);

        auto toc = std::chrono::high_resolution_clock::now();
        std::vector<ConvergenceRecord> records = study.run();
        auto tic = std::chrono::high_resolution_clock::now();

        std::cout << std::endl;
        ConvergenceStudy::printSummary(records);

        //----------------------------------------------------------------------
        // Truncation-independence check: compare h' of every converged record
        // against the first converged one on [0, min L].
        //----------------------------------------------------------------------
        const ConvergenceRecord* reference = nullptr;
        real_t xMax = std::numeric_limits<real_t>::infinity();
        for (const auto& r : records)
        {
            if (!r.converged) continue;
            if (!reference) reference = &r;
            xMax = std::min(xMax, r.L);
        }

        if (reference)
        {
            std::cout << std::endl << "Max relative deviation of h' on [0, " << xMax << "] vs. L = "
                      << reference->L << ", N = " << reference->N << ":" << std::endl;
            for (const auto& r : records)
            {
                if (!r.converged || &r == reference) continue;
                std::cout << "  L = " << r.L << ", N = " << r.N << ", eps = " << r.Eps << ": "
                          << ConvergenceStudy::maxRelativeDeviation(r.solution, reference->solution, xMax)
                          << std::endl;
            }
        }
        else
        {
            std::cerr << "No configuration converged." << std::endl;
        }

        std::cout << std::endl << "Study finished in "
                  << static_cast<real_t>((tic-toc).count()) / 1e9 << " s.\n\n";

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return 1;
    }
}
