#pragma once
/**
 * @file BoundaryConditions.hpp
 * @brief Two-point boundary residuals for the truncated thin-film problem.
 *
 * @details
 * Given the state at the first mesh point (ya) and at the last mesh point
 * (yb), the residual vector is
 *
 *   FarFieldCurvature:  r = ( h(0), h'(0) - 1, h''(L) )
 *   InitialCurvature:   r = ( h(0), h'(0) - 1, h''(0) )
 *
 * All conditions are separated: every component depends on ya only or on yb
 * only. The collocation solver relies on this to keep its Newton matrix
 * banded (left rows first, right rows last).
 */

#include "common.hpp"

/**
 * @class BoundaryConditions
 * @brief Residuals and constant Jacobians of the boundary conditions.
 */
class BoundaryConditions
{
  private:
    BoundaryVariant variant;
    real_t h0;        ///< Prescribed h(0).
    real_t slope0;    ///< Prescribed h'(0).
    real_t curvature; ///< Prescribed h'' at the far end (or at 0).

  public:
    explicit BoundaryConditions(BoundaryVariant variant_ = BoundaryVariant::FarFieldCurvature,
                                real_t h0_ = 0.0, real_t slope0_ = 1.0, real_t curvature_ = 0.0);

    BoundaryVariant getVariant() const { return variant; }

    /// Residual r(ya, yb).
    state_t residual(const state_t& ya, const state_t& yb) const;

    /// Max-norm of residual(ya, yb).
    real_t residualNorm(const state_t& ya, const state_t& yb) const;

    /// ∂r/∂ya (row-major 3x3).
    std::array<real_t, 9> jacobianLeft() const;

    /// ∂r/∂yb (row-major 3x3).
    std::array<real_t, 9> jacobianRight() const;

    /// Residual components that depend on ya (ordered).
    std::vector<size_t> leftRows() const;

    /// Residual components that depend on yb (ordered).
    std::vector<size_t> rightRows() const;

    /**
     * @brief Pointwise state consistent with the conditions at x = 0.
     *
     * Used as the starting value of an initial-value integration:
     * h = h0, h' = slope0, h'' = initial curvature.
     */
    state_t leftState(real_t initialCurvature) const { return {h0, slope0, initialCurvature}; }

    /// Prescribed curvature value (at L or at 0 depending on the variant).
    real_t prescribedCurvature() const { return curvature; }
};
