#pragma once
/**
 * @file InitialGuessBuilder.hpp
 * @brief Construction of starting meshes and state guesses for the
 *        collocation solver.
 *
 * @details
 * Two guess families are provided:
 *  - Linear:     h = x, h' = 1, h'' = 0.
 *  - ShapeAware: h = x - (x/L)³, with h' and h'' obtained by finite
 *                differences of the guess on the supplied mesh (second order
 *                in the interior, first order at the ends).
 *
 * The guesses satisfy the boundary conditions only approximately; the solver
 * enforces them.
 */

#include "common.hpp"

/**
 * @class InitialGuessBuilder
 * @brief Mesh and guess factory parameterized by a GuessStrategy.
 */
class InitialGuessBuilder
{
  private:
    GuessStrategy strategy;

  public:
    explicit InitialGuessBuilder(GuessStrategy strategy_ = GuessStrategy::Linear)
        : strategy(strategy_) {}

    GuessStrategy getStrategy() const { return strategy; }

    /**
     * @brief Uniform mesh of N points over [0, L].
     * @throws ConfigurationError if N < 2 or L <= 0.
     */
    static vec_real uniformMesh(real_t L, size_t N);

    /**
     * @brief Check that a mesh is strictly increasing with at least 2 points.
     * @throws ConfigurationError otherwise.
     */
    static void validateMesh(const vec_real& mesh);

    /**
     * @brief Build the guess on a mesh.
     * @param mesh Strictly increasing mesh over [0, L].
     * @param L    Domain length used by the shape-aware correction.
     * @return State array, 3 rows x mesh size.
     */
    mat_real build(const vec_real& mesh, real_t L) const;

    /**
     * @brief Non-uniform finite-difference derivative of samples f on x.
     *
     * Central second-order formula in the interior, one-sided first-order
     * differences at both ends.
     */
    static vec_real gradient(const vec_real& f, const vec_real& x);
};
