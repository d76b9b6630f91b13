//==============================================================================
// Solution.cpp
// Piecewise cubic Hermite evaluation of a solved state and JSON export of the
// sampled arrays and diagnostics.
//==============================================================================

#include "Solution.hpp"

Solution::Solution(vec_real mesh_, mat_real Y_, mat_real F_)
    : mesh(std::move(mesh_)), Y(std::move(Y_)), F(std::move(F_))
{
    if (mesh.size() < 2)
    {
        throw ConfigurationError("Solution needs at least 2 mesh points");
    }
    if (Y.size() != NumStates || F.size() != NumStates)
    {
        throw ConfigurationError("Solution arrays must have 3 rows");
    }
    for (size_t c=0; c<NumStates; ++c)
    {
        if (Y[c].size() != mesh.size() || F[c].size() != mesh.size())
        {
            throw ConfigurationError("Solution arrays must match the mesh size");
        }
    }
}

size_t Solution::locate(real_t x) const
{
    auto it = std::upper_bound(mesh.begin(), mesh.end(), x);
    size_t i = static_cast<size_t>(std::distance(mesh.begin(), it));
    i = (i == 0) ? 0 : i - 1;
    return std::min(i, mesh.size() - 2);
}

state_t Solution::leftState() const
{
    return {Y[0].front(), Y[1].front(), Y[2].front()};
}

state_t Solution::rightState() const
{
    return {Y[0].back(), Y[1].back(), Y[2].back()};
}

//------------------------------------------------------------------------------
// Cubic Hermite basis on t = (x - x_i)/h:
//   h00 = 2t³ - 3t² + 1,  h10 = t³ - 2t² + t,
//   h01 = -2t³ + 3t²,     h11 = t³ - t².
//------------------------------------------------------------------------------
state_t Solution::evaluate(real_t x) const
{
    if (mesh.empty() || x < mesh.front() || x > mesh.back())
    {
        throw std::out_of_range("Solution::evaluate: x = " + std::to_string(x) + " outside [0, L]");
    }

    const size_t i = locate(x);
    const real_t h = mesh[i+1] - mesh[i];
    const real_t t = (x - mesh[i]) / h;
    const real_t t2 = t*t, t3 = t2*t;

    const real_t h00 = 2.0*t3 - 3.0*t2 + 1.0;
    const real_t h10 = t3 - 2.0*t2 + t;
    const real_t h01 = -2.0*t3 + 3.0*t2;
    const real_t h11 = t3 - t2;

    state_t y{};
    for (size_t c=0; c<NumStates; ++c)
    {
        y[c] = h00*Y[c][i] + h*h10*F[c][i] + h01*Y[c][i+1] + h*h11*F[c][i+1];
    }
    return y;
}

state_t Solution::derivative(real_t x) const
{
    if (mesh.empty() || x < mesh.front() || x > mesh.back())
    {
        throw std::out_of_range("Solution::derivative: x = " + std::to_string(x) + " outside [0, L]");
    }

    const size_t i = locate(x);
    const real_t h = mesh[i+1] - mesh[i];
    const real_t t = (x - mesh[i]) / h;
    const real_t t2 = t*t;

    const real_t d00 = (6.0*t2 - 6.0*t) / h;
    const real_t d10 = 3.0*t2 - 4.0*t + 1.0;
    const real_t d01 = (-6.0*t2 + 6.0*t) / h;
    const real_t d11 = 3.0*t2 - 2.0*t;

    state_t dy{};
    for (size_t c=0; c<NumStates; ++c)
    {
        dy[c] = d00*Y[c][i] + d10*F[c][i] + d01*Y[c][i+1] + d11*F[c][i+1];
    }
    return dy;
}

mat_real Solution::sample(const vec_real& grid) const
{
    mat_real out(NumStates, vec_real(grid.size()));
    for (size_t j=0; j<grid.size(); ++j)
    {
        state_t y = evaluate(grid[j]);
        for (size_t c=0; c<NumStates; ++c)
        {
            out[c][j] = y[c];
        }
    }
    return out;
}

json Solution::toJson(const vec_real& grid) const
{
    json result;
    const vec_real& x = grid.empty() ? mesh : grid;
    mat_real values = grid.empty() ? Y : sample(grid);

    result["x"]   = x;
    result["h"]   = values[0];
    result["dh"]  = values[1];
    result["d2h"] = values[2];

    result["Converged"] = converged;
    result["Status"] = to_string(status);
    result["MaxResidual"] = maxResidual;
    result["MaxBcResidual"] = maxBcResidual;
    result["NodeCount"] = nodeCount();
    result["Refinements"] = refinements;
    result["NewtonIterations"] = newtonIterations;
    result["NodeHistory"] = nodeHistory;
    result["MinDenominator"] = minDenominator;
    result["SingularityWarning"] = singularityWarning;
    if (!std::isnan(initialCurvature))
    {
        result["InitialCurvature"] = initialCurvature;
    }

    return result;
}
