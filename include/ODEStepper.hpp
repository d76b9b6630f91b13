#pragma once
/**
 * @file ODEStepper.hpp
 * @brief Implicit Runge–Kutta (IRK) integrator for the thin-film ODE system.
 *
 * @details
 * The ODEStepper advances the state (h, h', h'') across one step of the
 * x-grid with a Gauss–Legendre implicit Runge–Kutta scheme. Supported
 * methods are IRK1, IRK2, IRK3 (orders 2, 4, 6).
 *
 * Near h = 0 the system is stiff (∂h'''/∂h ~ k/ε²), so the stage equations
 * are solved with a Newton iteration on the stacked stage increments using a
 * dense LAPACK solve, not by fixed-point iteration.
 *
 * Responsibilities:
 *  - Hold Butcher tableau coefficients (a,b,c) for selected IRK scheme.
 *  - Evaluate the right-hand side and its Jacobian via ProblemModel.
 *  - Perform the nonlinear stage solve at each step.
 *  - Report convergence status and number of iterations used.
 */

#include "common.hpp"
#include "ProblemModel.hpp"

/**
 * @class ODEStepper
 * @brief Implicit Runge–Kutta solver for advancing the thin-film state.
 *
 * @section usage Usage
 * - Construct with precision, scheme, and a reference to a ProblemModel.
 * - Call integrate() to advance Y from X_in → X_out.
 *
 * @section notes Notes
 * - Precision parameter controls the Newton tolerance inside each IRK step.
 * - Supported schemes: IRK1 (implicit midpoint), IRK2, IRK3 (higher order).
 */
class ODEStepper
{
  private:
    real_t precision;            ///< Tolerance for Newton solve inside IRK.
    Scheme scheme;               ///< Selected implicit Runge–Kutta scheme.
    const ProblemModel& model;   ///< Right-hand side and Jacobian.

    mat_real a; ///< IRK Butcher tableau coefficients (matrix).
    vec_real b; ///< IRK weights.
    vec_real c; ///< IRK nodes.

    /**
     * @brief Perform one IRK step between Xin and Xout.
     * @param[in]  Yin        Input state vector at Xin.
     * @param[out] Yout       Output state vector at Xout.
     * @param[in]  Xin        Start location.
     * @param[in]  Xout       End location.
     * @param[out] itsReached Number of Newton iterations performed.
     * @param[out] converged  True if nonlinear solver converged.
     * @param[in]  maxIts     Maximum Newton iterations allowed.
     *
     * @details
     * Unknowns are the stage increments Z_i = Y_i - y. The residual
     *   G_i(Z) = Z_i - dx Σ_j a_ij f(y + Z_j)
     * has Jacobian I - dx a_ij ∂f/∂y(y + Z_j), solved with LAPACKE_dgesv.
     */
    void stepIRK(const state_t& Yin, state_t& Yout,
                 real_t Xin, real_t Xout, int& itsReached,
                 bool& converged, int maxIts) const;

  public:
    /**
     * @brief Construct ODEStepper with given parameters.
     * @param precision Tolerance for IRK Newton solve.
     * @param method    Selected IRK scheme (IRK1/2/3).
     * @param model     Reference to the ProblemModel (must outlive the stepper).
     */
    ODEStepper(real_t precision, Scheme method, const ProblemModel& model);

    /// Number of stages of the selected scheme.
    size_t stages() const { return b.size(); }

    /**
     * @brief Integrate ODE system from Xin → Xout in one step.
     * @param[in]  Yin        Input state vector at Xin.
     * @param[out] Yout       Output state vector at Xout.
     * @param[in]  Xin        Start location.
     * @param[in]  Xout       End location.
     * @param[out] converged  True if the stage solve converged.
     * @param[out] itsReached Number of Newton iterations used.
     * @param[in]  maxIts     Maximum Newton iterations per step.
     */
    void integrate(const state_t& Yin, state_t& Yout,
                   real_t Xin, real_t Xout,
                   bool& converged, int& itsReached,
                   int maxIts) const;
};
