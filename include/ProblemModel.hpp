#pragma once
/**
 * @file ProblemModel.hpp
 * @brief First-order form of the regularized thin-film equation
 *        h''' = -k / (h² + h + ε).
 *
 * @details
 * With y = (h, h', h'') the system reads
 *   y0' = y1,  y1' = y2,  y2' = -k / (y0² + y0 + ε).
 *
 * The model is a pure function of (x, y, ε, k): no state is modified by any
 * evaluation, so one instance can be shared by concurrent solves.
 *
 * ε must be strictly positive. With ε = 0 the right-hand side is unbounded at
 * h = 0, which is exactly the boundary value h(0) = 0; the constructor
 * rejects it.
 */

#include "common.hpp"

/**
 * @class ProblemModel
 * @brief Right-hand side and Jacobian of the thin-film ODE system.
 *
 * @section usage Usage
 * - `rhs(x, Y, F)`   : mesh-wide evaluation on a 3 x m state array.
 * - `rhs(x, y)`      : single point evaluation.
 * - `jacobian(x, y)` : ∂f/∂y at a single point (row-major 3x3).
 */
class ProblemModel
{
  private:
    real_t k;   ///< ODE coefficient.
    real_t eps; ///< Regularization of the denominator.

  public:
    /**
     * @brief Construct the model.
     * @param k_   ODE coefficient (physical default 0.01).
     * @param eps_ Regularization, must be > 0.
     * @throws ConfigurationError if k_ <= 0 or eps_ <= 0.
     */
    ProblemModel(real_t k_, real_t eps_);

    real_t coefficient() const { return k; }
    real_t regularization() const { return eps; }

    /// Regularized denominator h² + h + ε.
    real_t denominator(real_t h) const { return h*h + h + eps; }

    /// Third derivative h''' = -k / (h² + h + ε).
    real_t thirdDerivative(real_t h) const { return -k / denominator(h); }

    /**
     * @brief Evaluate dy/dx on a whole mesh.
     * @param x  Mesh points (length m).
     * @param Y  State, 3 rows x m columns.
     * @param[out] F Derivative, resized to 3 x m.
     * @throws ConfigurationError on shape mismatch.
     */
    void rhs(const vec_real& x, const mat_real& Y, mat_real& F) const;

    /// Pointwise dy/dx.
    state_t rhs(real_t x, const state_t& y) const;

    /**
     * @brief Pointwise Jacobian ∂f/∂y.
     * @return Row-major 3x3 entries J[3*i + j] = ∂f_i/∂y_j.
     */
    std::array<real_t, 9> jacobian(real_t x, const state_t& y) const;

    /**
     * @brief Smallest |h² + h + ε| over the h-row of a state array.
     */
    real_t minDenominator(const mat_real& Y) const;
};
