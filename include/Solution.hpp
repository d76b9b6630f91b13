#pragma once
/**
 * @file Solution.hpp
 * @brief Result of a boundary value solve: a C¹ piecewise-cubic interpolant
 *        of (h, h', h'') on [0, L] plus convergence metadata.
 *
 * @details
 * On every mesh interval [x_i, x_{i+1}] each component is the cubic Hermite
 * polynomial matching the nodal state y_i, y_{i+1} and the nodal slopes
 * f_i = f(x_i, y_i), f_{i+1}. This is the natural continuous extension of the
 * collocation solution and of an implicit Runge–Kutta trajectory alike.
 *
 * A Solution is produced once per solve and not modified afterwards. Failed
 * solves still carry their best available arrays; `converged` and `status`
 * tell callers whether to trust them.
 */

#include "common.hpp"

/**
 * @class Solution
 * @brief Interpolated state over [0, L] with solve diagnostics.
 */
class Solution
{
  private:
    vec_real mesh;   ///< Final mesh (strictly increasing).
    mat_real Y;      ///< Nodal state, 3 x m.
    mat_real F;      ///< Nodal derivative dy/dx, 3 x m.

    /// Index i with mesh[i] <= x <= mesh[i+1] (clamped to the end intervals).
    size_t locate(real_t x) const;

  public:
    // ===== Metadata =====
    bool converged = false;                  ///< True iff status == Converged.
    SolveStatus status = SolveStatus::IterationCapReached;
    real_t maxResidual = std::numeric_limits<real_t>::infinity();   ///< Max RMS relative collocation residual.
    real_t maxBcResidual = std::numeric_limits<real_t>::infinity(); ///< Max |boundary residual|.
    size_t refinements = 0;                  ///< Refinement iterations performed.
    size_t newtonIterations = 0;             ///< Total Newton iterations.
    std::vector<size_t> nodeHistory;         ///< Node count per refinement iteration.
    real_t minDenominator = std::numeric_limits<real_t>::infinity(); ///< Min |h² + h + ε| observed.
    bool singularityWarning = false;         ///< minDenominator below the diagnostic threshold.
    real_t initialCurvature = std::numeric_limits<real_t>::quiet_NaN(); ///< h''(0) of shooting solves.

    Solution() = default;

    /**
     * @brief Build the interpolant from nodal data.
     * @throws ConfigurationError on shape mismatch or invalid mesh.
     */
    Solution(vec_real mesh_, mat_real Y_, mat_real F_);

    /// Number of mesh nodes.
    size_t nodeCount() const { return mesh.size(); }

    /// Right end of the domain.
    real_t length() const { return mesh.empty() ? 0.0 : mesh.back(); }

    const vec_real& getMesh() const { return mesh; }
    const mat_real& getNodalState() const { return Y; }
    const mat_real& getNodalDerivative() const { return F; }

    /// Nodal state at the first/last mesh point.
    state_t leftState() const;
    state_t rightState() const;

    /**
     * @brief Evaluate (h, h', h'') at x.
     * @throws std::out_of_range if x lies outside [0, L] or the solution is empty.
     */
    state_t evaluate(real_t x) const;

    /// Evaluate d/dx of the interpolant at x.
    state_t derivative(real_t x) const;

    /**
     * @brief Sample all three components on a caller grid.
     * @return 3 rows x grid size.
     */
    mat_real sample(const vec_real& grid) const;

    /**
     * @brief Plain arrays plus metadata for the presentation layer.
     * @param grid Evaluation grid; if empty, the mesh itself is used.
     */
    json toJson(const vec_real& grid = {}) const;
};
