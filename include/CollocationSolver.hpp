#pragma once
/**
 * @file CollocationSolver.hpp
 * @brief Adaptive-mesh collocation solver for the truncated thin-film
 *        boundary value problem.
 *
 * @details
 * Fourth-order collocation with a C¹ cubic per mesh interval (three-point
 * Lobatto / Simpson form). On interval i with length h_i the unknown nodal
 * states y_i, y_{i+1} are coupled through
 *
 *   y_mid = (y_i + y_{i+1})/2 - h_i/8 (f_{i+1} - f_i)
 *   Φ_i   = y_{i+1} - y_i - h_i/6 (f_i + 4 f(y_mid) + f_{i+1}) = 0
 *
 * which, together with the three boundary residuals, forms a nonlinear system
 * of 3·m equations in 3·m unknowns. It is solved by a damped Newton iteration
 * (Armijo backtracking, Jacobian reuse after full steps) on a banded LAPACK
 * factorization.
 *
 * After every Newton solve the RMS of the relative residual
 * (S'(x) - f(x, S(x))) / (1 + |f|) is estimated per interval with a
 * five-point Lobatto rule; intervals above tolerance are halved. The loop
 *
 *   Unsolved → Refining (fit → evaluate residual → refine mesh)
 *            → { Converged | NodeBudgetExhausted | ... }
 *
 * is internal to a single solve() call. solve() never throws for numerical
 * failure; it returns the best available Solution tagged with its status.
 *
 * Known fragility: the denominator h² + h + ε is smallest where h → 0. ε
 * bounds the right-hand side but not the conditioning of the Newton system.
 * The smallest denominator seen by accepted iterates is reported on the
 * Solution and raises `singularityWarning` below the configured threshold.
 */

#include "common.hpp"
#include "ProblemModel.hpp"
#include "BoundaryConditions.hpp"
#include "InitialGuessBuilder.hpp"
#include "BandedSystem.hpp"
#include "SimulationConfig.hpp"
#include "Solution.hpp"

/**
 * @class CollocationSolver
 * @brief Newton collocation with residual-driven mesh halving.
 *
 * @section workflow Workflow
 * - Construct from a SolverConfig (model, boundary variant, guess strategy,
 *   iteration caps and diagnostics thresholds are taken from it).
 * - Call solve(mesh, guess, tol, maxNodes) with explicit starting data, or
 *   solve() to build mesh and guess from the configuration.
 *
 * The solver holds no mutable state; concurrent solve() calls on one
 * instance are safe.
 */
class CollocationSolver
{
  private:
    SolverConfig config;         ///< Iteration caps, thresholds, verbosity.
    ProblemModel model;          ///< Right-hand side f(x, y).
    BoundaryConditions bc;       ///< Boundary residuals.
    InitialGuessBuilder guessBuilder; ///< Starting data for solve().

    // ===== Newton parameters =====
    static constexpr int    MaxJacobianEvals = 4;   ///< Jacobian factorizations per Newton solve.
    static constexpr int    MaxBacktracks = 4;      ///< Step halvings per Newton iteration.
    static constexpr real_t ArmijoSigma = 0.2;      ///< Sufficient decrease constant.
    static constexpr real_t BacktrackFactor = 0.5;  ///< Step reduction per backtrack.

    /// Per-mesh collocation quantities.
    struct CollocationData
    {
        vec_real h;       ///< Interval lengths (m-1).
        mat_real f;       ///< f at nodes (3 x m).
        mat_real yMid;    ///< State at interval midpoints (3 x (m-1)).
        mat_real fMid;    ///< f at midpoints (3 x (m-1)).
        mat_real colRes;  ///< Collocation residuals Φ (3 x (m-1)).
        state_t  bcRes{}; ///< Boundary residuals.
    };

    /// Result of one Newton solve on a fixed mesh.
    enum class NewtonOutcome { Solved, NotConverged, Singular, Diverged };

    /// Fill all collocation quantities for state y on mesh x.
    void collocationResiduals(const vec_real& x, const mat_real& y, CollocationData& d) const;

    /// Stack boundary and collocation residuals in banded row order.
    void packResidual(const CollocationData& d, size_t m, vec_real& res) const;

    /// Assemble ∂(residual)/∂y into the banded matrix.
    void assembleJacobian(const vec_real& x, const mat_real& y,
                          const CollocationData& d, BandedSystem& J) const;

    /// Newton tolerance test on collocation and boundary residuals.
    bool residualsWithinTolerance(const CollocationData& d, real_t tol) const;

    /**
     * @brief Damped Newton iteration on a fixed mesh.
     * @param x Mesh.
     * @param[in,out] y State, replaced by the last accepted iterate.
     * @param tol Collocation tolerance.
     * @param[in,out] newtonIts Accumulated Newton iteration count.
     * @param[in,out] minDen Smallest |h² + h + ε| over accepted iterates.
     */
    NewtonOutcome solveNewton(const vec_real& x, mat_real& y, real_t tol,
                              size_t& newtonIts, real_t& minDen) const;

    /// RMS relative residual per interval (length m-1).
    vec_real estimateResiduals(const vec_real& x, const mat_real& y,
                               const CollocationData& d) const;

    /**
     * @brief Halve every interval whose residual estimate exceeds tol.
     * @return Number of inserted nodes.
     */
    size_t refineMesh(vec_real& x, mat_real& y, const mat_real& f,
                      const vec_real& rms, real_t tol) const;

    /// Count intervals that refineMesh would halve.
    static size_t countFlagged(const vec_real& rms, real_t tol);

    /// Band widths implied by the boundary row split.
    size_t lowerBandwidth() const;
    size_t upperBandwidth() const;

  public:
    /**
     * @brief Construct from a validated configuration.
     * @throws ConfigurationError if the configuration is invalid.
     */
    explicit CollocationSolver(const SolverConfig& configIn);

    const SolverConfig& getConfig() const { return config; }
    const ProblemModel& getModel() const { return model; }
    const BoundaryConditions& getBoundaryConditions() const { return bc; }

    /**
     * @brief Solve from explicit starting data.
     * @param mesh     Strictly increasing mesh over [0, L], at least 2 points.
     * @param guess    State guess, 3 rows x mesh size.
     * @param tol      Residual tolerance, > 0.
     * @param maxNodes Node budget, >= mesh size.
     * @return Solution tagged with convergence status; never throws for
     *         numerical failure.
     * @throws ConfigurationError for malformed input.
     */
    Solution solve(const vec_real& mesh, const mat_real& guess, real_t tol, size_t maxNodes) const;

    /**
     * @brief Solve with the configured L, N, guess strategy, tolerance and budget.
     */
    Solution solve() const;
};
