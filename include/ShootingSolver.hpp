#pragma once
/**
 * @file ShootingSolver.hpp
 * @brief Shooting method for the truncated thin-film problem, used as an
 *        independent cross-check of the collocation solver.
 *
 * @details
 * The ShootingSolver integrates the initial value problem
 *
 *   h(0) = 0,  h'(0) = 1,  h''(0) = s
 *
 * from x = 0 to x = L with ODEStepper on a geometrically graded grid (fine
 * steps where the right-hand side varies on the scale ε, coarse steps in the
 * far field). For the far-field variant the unknown curvature s is adjusted
 * by a finite-difference Newton iteration on the mismatch h''(L; s) - c.
 *
 * Responsibilities:
 *  - Build the integration grid and the starting curvature.
 *  - Integrate the state across the grid with ODEStepper.
 *  - Drive the far-field mismatch to zero.
 *  - Return a Solution (Hermite interpolant plus diagnostics).
 */

#include "common.hpp"
#include "ProblemModel.hpp"
#include "BoundaryConditions.hpp"
#include "ODEStepper.hpp"
#include "SimulationConfig.hpp"
#include "Solution.hpp"

/**
 * @class ShootingSolver
 * @brief Single-parameter shooting on h''(0).
 *
 * @section workflow Workflow
 * - Construct from a SolverConfig (model, boundary variant, IRK scheme and
 *   shooting parameters are taken from it).
 * - solve(L) for the configured boundary variant, or integrate(s, L) for a
 *   plain initial value problem with prescribed curvature s.
 *
 * Numerical failure (stage solve not converging, non-finite state) is
 * reported through the Solution status, never thrown.
 */
class ShootingSolver
{
  private:
    SolverConfig config;                 ///< Shooting and IRK parameters.
    ProblemModel model;                  ///< Right-hand side and Jacobian.
    BoundaryConditions bc;               ///< Boundary variant and prescribed values.
    std::unique_ptr<ODEStepper> stepper; ///< ODE integrator (IRK scheme).

    /// x = 0 followed by a geometric grid from ShootingFirstStep to L.
    vec_real generateGrid(real_t L) const;

    /**
     * @brief Integrate the IVP with curvature s across the grid.
     * @param s        Initial curvature h''(0).
     * @param xGrid    Integration grid, xGrid[0] = 0.
     * @param[out] Y   Nodal states, 3 x grid size (filled up to the failure point).
     * @return false if a step failed to converge or produced a non-finite state.
     */
    bool integrateToEnd(real_t s, const vec_real& xGrid, mat_real& Y) const;

    /// ∫₀ᴸ k / (x² + x + ε) dx on the grid (trapezoidal rule).
    real_t curvatureEstimate(const vec_real& xGrid) const;

    /// Assemble the Solution and its diagnostics from nodal states.
    Solution finalize(const vec_real& xGrid, const mat_real& Y, real_t s,
                      SolveStatus status, real_t bcResidual, size_t its) const;

  public:
    /**
     * @brief Construct from a validated configuration.
     * @throws ConfigurationError if the configuration is invalid.
     */
    explicit ShootingSolver(const SolverConfig& configIn);

    ShootingSolver(const ShootingSolver&) = delete;
    ShootingSolver& operator=(const ShootingSolver&) = delete;

    const SolverConfig& getConfig() const { return config; }

    /**
     * @brief Solve the boundary problem of the configured variant on [0, L].
     * @throws ConfigurationError if L <= ShootingFirstStep.
     */
    Solution solve(real_t L) const;

    /// Solve on [0, config.L].
    Solution solve() const { return solve(config.L); }

    /**
     * @brief Plain initial value problem with h''(0) = s on [0, L].
     * @throws ConfigurationError if L <= ShootingFirstStep.
     */
    Solution integrate(real_t s, real_t L) const;
};
