//==============================================================================
// common.cpp
// Utility functions: enum <-> string conversions for the configuration layer,
// approximate equality, grid builders and norms.
//==============================================================================

#include "common.hpp"

//------------------------------------------------------------------------------
// Enum names as they appear in JSON configuration and result dictionaries.
//------------------------------------------------------------------------------
std::string to_string(GuessStrategy strategy)
{
    switch (strategy)
    {
        case GuessStrategy::Linear:     return "linear";
        case GuessStrategy::ShapeAware: return "shape-aware";
    }
    return "unknown";
}

std::string to_string(BoundaryVariant variant)
{
    switch (variant)
    {
        case BoundaryVariant::FarFieldCurvature: return "far-field-curvature";
        case BoundaryVariant::InitialCurvature:  return "initial-curvature";
    }
    return "unknown";
}

std::string to_string(SolveStatus status)
{
    switch (status)
    {
        case SolveStatus::Converged:              return "converged";
        case SolveStatus::NodeBudgetExhausted:    return "node-budget-exhausted";
        case SolveStatus::IterationCapReached:    return "iteration-cap-reached";
        case SolveStatus::SingularJacobian:       return "singular-jacobian";
        case SolveStatus::Diverged:               return "diverged";
        case SolveStatus::TruncationInadmissible: return "truncation-inadmissible";
    }
    return "unknown";
}

GuessStrategy parseGuessStrategy(const std::string& name)
{
    if (name == "linear") return GuessStrategy::Linear;
    if (name == "shape-aware") return GuessStrategy::ShapeAware;
    throw ConfigurationError("Unknown guess strategy: '" + name + "'");
}

BoundaryVariant parseBoundaryVariant(const std::string& name)
{
    if (name == "far-field-curvature") return BoundaryVariant::FarFieldCurvature;
    if (name == "initial-curvature") return BoundaryVariant::InitialCurvature;
    throw ConfigurationError("Unknown boundary variant: '" + name + "'");
}

Scheme parseScheme(int stages)
{
    switch (stages)
    {
        case 1: return Scheme::IRK1;
        case 2: return Scheme::IRK2;
        case 3: return Scheme::IRK3;
        default: throw ConfigurationError("Wrong IRK Scheme stage supplied!");
    }
}

//------------------------------------------------------------------------------
// Return true if |a - b| < tol (absolute tolerance).
//------------------------------------------------------------------------------
bool almost_equal(double a, double b, double tol)
{
    return std::abs(a - b) < tol;
}

//------------------------------------------------------------------------------
// Uniform grid; the last point is set to b exactly so meshes end on L.
//------------------------------------------------------------------------------
vec_real linspace(real_t a, real_t b, size_t n)
{
    if (n < 2 || !(b > a))
    {
        throw ConfigurationError("linspace requires n >= 2 and b > a");
    }

    vec_real grid(n);
    const real_t dx = (b - a) / static_cast<real_t>(n - 1);
    for (size_t i=0; i<n; ++i)
    {
        grid[i] = a + dx * static_cast<real_t>(i);
    }
    grid[n-1] = b;

    return grid;
}

//------------------------------------------------------------------------------
// Logarithmic grid a·(b/a)^(i/(n-1)); used for log-log sampling of tails.
//------------------------------------------------------------------------------
vec_real logspace(real_t a, real_t b, size_t n)
{
    if (n < 2 || !(a > 0.0) || !(b > a))
    {
        throw ConfigurationError("logspace requires n >= 2 and 0 < a < b");
    }

    vec_real grid(n);
    const real_t ratio = std::log(b / a) / static_cast<real_t>(n - 1);
    for (size_t i=0; i<n; ++i)
    {
        grid[i] = a * std::exp(ratio * static_cast<real_t>(i));
    }
    grid[0] = a;
    grid[n-1] = b;

    return grid;
}

real_t computeL2Norm(const vec_real& vc)
{
    if (vc.empty()) return 0.0;
    real_t sum = std::transform_reduce(vc.cbegin(), vc.cend(), 0.0, std::plus{},
                                       [](auto x){return x*x;});
    return std::sqrt(sum / static_cast<real_t>(vc.size()));
}

real_t computeMaxNorm(const vec_real& vc)
{
    real_t norm = 0.0;
    for (const auto& v : vc)
    {
        norm = std::max(norm, std::abs(v));
    }
    return norm;
}

bool all_finite(const vec_real& vc)
{
    return std::all_of(vc.begin(), vc.end(), [](real_t v){ return std::isfinite(v); });
}
