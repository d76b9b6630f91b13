#pragma once
/**
 * @file ConvergenceStudy.hpp
 * @brief Sweeps of the collocation solver over truncation length, initial
 *        mesh density and regularization.
 *
 * @details
 * A study is a base SolverConfig plus the grids to sweep. Each configuration
 * (L, N, ε) is solved independently and summarized in a ConvergenceRecord;
 * records come out in configuration order (L outermost, ε innermost).
 *
 * The sweep is exposed as a lazy, restartable Cursor. run() drains a cursor;
 * with USE_OPENMP and warm starts disabled the configurations are solved
 * concurrently into pre-sized storage, which keeps the order.
 */

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "CollocationSolver.hpp"
#include "Solution.hpp"

#include <map>

/**
 * @struct ConvergenceRecord
 * @brief Outcome of one configuration of a sweep.
 */
struct ConvergenceRecord
{
    real_t L = 0.0;
    size_t N = 0;
    real_t Eps = 0.0;
    real_t Tolerance = 0.0;
    GuessStrategy Guess = GuessStrategy::Linear;
    bool WarmStarted = false;   ///< Guess taken from the previous solution with the same L.

    bool converged = false;
    SolveStatus status = SolveStatus::IterationCapReached;
    real_t maxResidual = 0.0;
    real_t maxBcResidual = 0.0;
    size_t nodeCount = 0;
    size_t refinements = 0;
    bool singularityWarning = false;

    vec_real x;         ///< Evaluation grid (points of the study grid inside [0, L]).
    mat_real y;         ///< (h, h', h'') sampled on x, 3 rows.
    Solution solution;  ///< Full interpolated solution.

    /// Plain arrays and diagnostics for the presentation layer.
    json toJson() const;
};

/**
 * @class ConvergenceStudy
 * @brief Repeated CollocationSolver runs over a configuration grid.
 */
class ConvergenceStudy
{
  private:
    StudyConfig study;

    /// One fully specified solve of the sweep.
    struct Task
    {
        SolverConfig config;
    };

    /// Validated task list, L outermost, ε innermost.
    std::vector<Task> buildTasks(const vec_real& Ls, const std::vector<size_t>& Ns,
                                 const vec_real& Eps, real_t tol) const;

    /// Evaluation grid of one record.
    vec_real evaluationGrid(const SolverConfig& config) const;

    /// Solve one task, optionally starting from a previous solution.
    ConvergenceRecord solveTask(const Task& task, const Solution* warm) const;

  public:
    /**
     * @class Cursor
     * @brief Lazy, finite, restartable sequence of ConvergenceRecords.
     *
     * Each call to next() performs one solve. reset() rewinds to the first
     * configuration and forgets warm-start data, so a second pass reproduces
     * the first. The cursor shares a snapshot of the study, so it may outlive
     * the ConvergenceStudy that created it.
     */
    class Cursor
    {
      private:
        std::shared_ptr<const ConvergenceStudy> owner;
        std::vector<Task> tasks;
        size_t position = 0;
        std::map<real_t, Solution> previous;   ///< Last converged solution per L.

        friend class ConvergenceStudy;
        Cursor(std::shared_ptr<const ConvergenceStudy> owner_, std::vector<Task> tasks_);

      public:
        /**
         * @brief Produce the next record.
         * @return false once the sweep is exhausted (out is untouched).
         */
        bool next(ConvergenceRecord& out);

        /// Rewind to the first configuration.
        void reset();

        /// Total number of configurations.
        size_t size() const { return tasks.size(); }

        /// Number of records produced since construction or the last reset.
        size_t produced() const { return position; }
    };

    /// Sweep definition from a base configuration (grids empty).
    explicit ConvergenceStudy(const SolverConfig& base, bool warmStart = false, vec_real evalGrid = {});

    explicit ConvergenceStudy(StudyConfig studyIn);

    const StudyConfig& getStudyConfig() const { return study; }

    /**
     * @brief Cursor over L × N at the base ε.
     * @throws ConfigurationError if any configuration is invalid (checked
     *         before the first solve).
     */
    Cursor sweep(const vec_real& Ls, const std::vector<size_t>& Ns, real_t tol) const;

    /// Cursor over L × N × ε.
    Cursor sweep(const vec_real& Ls, const std::vector<size_t>& Ns,
                 const vec_real& Eps, real_t tol) const;

    /// All records of the L × N sweep, in configuration order.
    std::vector<ConvergenceRecord> run(const vec_real& Ls, const std::vector<size_t>& Ns, real_t tol) const;

    /// All records of the L × N × ε sweep, in configuration order.
    std::vector<ConvergenceRecord> run(const vec_real& Ls, const std::vector<size_t>& Ns,
                                       const vec_real& Eps, real_t tol) const;

    /// Sweep over the grids stored in the StudyConfig at the base tolerance.
    std::vector<ConvergenceRecord> run() const;

    /**
     * @brief max |a_c(x) - b_c(x)| / max(|b_c(x)|, floor) over x ∈ [0, xMax].
     *
     * Used to check that h' does not depend on the truncation length on a
     * common sub-domain.
     *
     * @param component 0 = h, 1 = h', 2 = h''.
     * @param samples   Number of uniformly spaced comparison points.
     * @throws std::out_of_range if xMax exceeds either solution's domain.
     */
    static real_t maxRelativeDeviation(const Solution& a, const Solution& b, real_t xMax,
                                       size_t component = 1, size_t samples = 501);

    /// Print a table of the sweep outcome.
    static void printSummary(const std::vector<ConvergenceRecord>& records, std::ostream& os = std::cout);
};
