//==============================================================================
// BoundaryConditions.cpp
// Residuals of h(0) = h0, h'(0) = slope0 and the curvature condition, either
// at the truncated far end (h''(L) = 0) or at the origin (h''(0) = 0).
//==============================================================================

#include "BoundaryConditions.hpp"

BoundaryConditions::BoundaryConditions(BoundaryVariant variant_, real_t h0_, real_t slope0_, real_t curvature_)
    : variant(variant_), h0(h0_), slope0(slope0_), curvature(curvature_) {}

state_t BoundaryConditions::residual(const state_t& ya, const state_t& yb) const
{
    const real_t r2 = (variant == BoundaryVariant::FarFieldCurvature) ? yb[2] - curvature
                                                                      : ya[2] - curvature;
    return {ya[0] - h0, ya[1] - slope0, r2};
}

real_t BoundaryConditions::residualNorm(const state_t& ya, const state_t& yb) const
{
    state_t r = residual(ya, yb);
    return std::max({std::abs(r[0]), std::abs(r[1]), std::abs(r[2])});
}

std::array<real_t, 9> BoundaryConditions::jacobianLeft() const
{
    if (variant == BoundaryVariant::FarFieldCurvature)
    {
        return {1.0, 0.0, 0.0,
                0.0, 1.0, 0.0,
                0.0, 0.0, 0.0};
    }
    return {1.0, 0.0, 0.0,
            0.0, 1.0, 0.0,
            0.0, 0.0, 1.0};
}

std::array<real_t, 9> BoundaryConditions::jacobianRight() const
{
    if (variant == BoundaryVariant::FarFieldCurvature)
    {
        return {0.0, 0.0, 0.0,
                0.0, 0.0, 0.0,
                0.0, 0.0, 1.0};
    }
    return {0.0, 0.0, 0.0,
            0.0, 0.0, 0.0,
            0.0, 0.0, 0.0};
}

std::vector<size_t> BoundaryConditions::leftRows() const
{
    if (variant == BoundaryVariant::FarFieldCurvature) return {0, 1};
    return {0, 1, 2};
}

std::vector<size_t> BoundaryConditions::rightRows() const
{
    if (variant == BoundaryVariant::FarFieldCurvature) return {2};
    return {};
}
