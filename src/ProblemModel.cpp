//==============================================================================
// ProblemModel.cpp
// Right-hand side of the regularized third-order thin-film equation written
// as a first-order system in (h, h', h'').
//==============================================================================

#include "ProblemModel.hpp"

ProblemModel::ProblemModel(real_t k_, real_t eps_)
    : k(k_), eps(eps_)
{
    if (!(k > 0.0))
    {
        throw ConfigurationError("ODE coefficient k must be positive");
    }
    if (!(eps > 0.0))
    {
        throw ConfigurationError("Regularization eps must be strictly positive");
    }
}

//------------------------------------------------------------------------------
// Mesh-wide evaluation. The loop body is branch free so the compiler can
// vectorize it over the mesh.
//------------------------------------------------------------------------------
void ProblemModel::rhs(const vec_real& x, const mat_real& Y, mat_real& F) const
{
    if (Y.size() != NumStates || Y[0].size() != x.size() ||
        Y[1].size() != x.size() || Y[2].size() != x.size())
    {
        throw ConfigurationError("State array must have shape 3 x mesh size");
    }

    const size_t m = x.size();
    F.assign(NumStates, vec_real(m));

    const real_t* h   = Y[0].data();
    const real_t* dh  = Y[1].data();
    const real_t* d2h = Y[2].data();
    real_t* f0 = F[0].data();
    real_t* f1 = F[1].data();
    real_t* f2 = F[2].data();

    for (size_t i=0; i<m; ++i)
    {
        f0[i] = dh[i];
        f1[i] = d2h[i];
        f2[i] = -k / (h[i]*h[i] + h[i] + eps);
    }
}

state_t ProblemModel::rhs(real_t /*x*/, const state_t& y) const
{
    return {y[1], y[2], thirdDerivative(y[0])};
}

//------------------------------------------------------------------------------
// Only the last row depends on the state:
//   ∂/∂h [-k / (h² + h + ε)] = k (2h + 1) / (h² + h + ε)²
//------------------------------------------------------------------------------
std::array<real_t, 9> ProblemModel::jacobian(real_t /*x*/, const state_t& y) const
{
    const real_t den = denominator(y[0]);

    return {0.0, 1.0, 0.0,
            0.0, 0.0, 1.0,
            k * (2.0*y[0] + 1.0) / (den*den), 0.0, 0.0};
}

real_t ProblemModel::minDenominator(const mat_real& Y) const
{
    real_t minDen = std::numeric_limits<real_t>::infinity();
    for (const auto& h : Y[0])
    {
        minDen = std::min(minDen, std::abs(denominator(h)));
    }
    return minDen;
}
