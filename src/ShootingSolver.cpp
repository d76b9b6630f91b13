//==============================================================================
// ShootingSolver.cpp
// Initial value integration of the thin-film ODE from x = 0 and a scalar
// finite-difference Newton iteration on h''(0) for the far-field condition.
//==============================================================================

#include "ShootingSolver.hpp"

ShootingSolver::ShootingSolver(const SolverConfig& configIn)
    : config(configIn), model(configIn.K, configIn.Eps), bc(configIn.Boundary)
{
    config.validate();
    stepper = std::make_unique<ODEStepper>(config.PrecisionIRK, config.SchemeIRK, model);
}

//------------------------------------------------------------------------------
// generateGrid
// [0, x1, ..., L] with x1 = ShootingFirstStep and constant ratio x_{i+1}/x_i.
//------------------------------------------------------------------------------
vec_real ShootingSolver::generateGrid(real_t L) const
{
    if (!(L > config.ShootingFirstStep))
    {
        throw ConfigurationError("Shooting interval must extend beyond ShootingFirstStep");
    }

    vec_real xGrid = logspace(config.ShootingFirstStep, L, config.ShootingSteps - 1);
    xGrid.insert(xGrid.begin(), 0.0);
    xGrid.back() = L;

    return xGrid;
}

real_t ShootingSolver::curvatureEstimate(const vec_real& xGrid) const
{
    real_t sum = 0.0;
    for (size_t i=0; i+1<xGrid.size(); ++i)
    {
        sum += 0.5 * (xGrid[i+1] - xGrid[i])
                   * (model.coefficient() / model.denominator(xGrid[i])
                    + model.coefficient() / model.denominator(xGrid[i+1]));
    }
    return sum;
}

//------------------------------------------------------------------------------
// integrateToEnd
// March the state across the grid. Y is always sized to the full grid; on
// failure the trailing columns are left at NaN.
//------------------------------------------------------------------------------
bool ShootingSolver::integrateToEnd(real_t s, const vec_real& xGrid, mat_real& Y) const
{
    const size_t n = xGrid.size();
    Y.assign(NumStates, vec_real(n, std::numeric_limits<real_t>::quiet_NaN()));

    state_t Y1 = bc.leftState(s), Y2{};
    bool converged = false;
    int itsReached = 0;

    for (size_t c=0; c<NumStates; ++c) Y[c][0] = Y1[c];

    for (size_t i=0; i+1<n; ++i)
    {
        stepper->integrate(Y1, Y2, xGrid[i], xGrid[i+1], converged, itsReached, config.MaxIterIRK);

        if (!converged)
        {
            if (config.Verbose)
            {
                std::cerr << "ERROR: No convergence between grid point " << xGrid[i] << " (" << i << ") ";
                std::cerr << " and " << xGrid[i+1] << " (" << i+1 << ") " << std::endl;
            }
            return false;
        }

        for (size_t c=0; c<NumStates; ++c) Y[c][i+1] = Y2[c];
        Y1 = Y2;
    }

    return true;
}

Solution ShootingSolver::finalize(const vec_real& xGrid, const mat_real& Y, real_t s,
                                  SolveStatus status, real_t bcResidual, size_t its) const
{
    mat_real F(NumStates, vec_real(xGrid.size()));
    model.rhs(xGrid, Y, F);

    Solution sol(xGrid, Y, F);
    sol.status = status;
    sol.converged = (status == SolveStatus::Converged);
    sol.maxResidual = sol.converged ? config.PrecisionIRK : std::numeric_limits<real_t>::infinity();
    sol.maxBcResidual = bcResidual;
    sol.newtonIterations = its;
    sol.nodeHistory = {xGrid.size()};
    sol.minDenominator = model.minDenominator(Y);
    sol.singularityWarning = (sol.minDenominator < config.singularityThreshold());
    sol.initialCurvature = s;

    if (config.Verbose)
    {
        if (sol.converged)
        {
            std::cout << "Shooting converged with h''(0) = " << std::setprecision(10) << s
                      << " after " << its << " iterations." << std::endl;
        }
        else
        {
            std::cerr << "Shooting did not converge: " << to_string(status)
                      << " (h''(0) = " << s << ")" << std::endl;
        }
    }

    return sol;
}

Solution ShootingSolver::integrate(real_t s, real_t L) const
{
    const vec_real xGrid = generateGrid(L);
    mat_real Y;

    const bool ok = integrateToEnd(s, xGrid, Y);
    const SolveStatus status = ok ? SolveStatus::Converged : SolveStatus::Diverged;
    const real_t bcResidual = ok ? 0.0 : std::numeric_limits<real_t>::infinity();

    return finalize(xGrid, Y, s, status, bcResidual, 0);
}

//------------------------------------------------------------------------------
// solve
// InitialCurvature: one IVP with the prescribed h''(0).
// FarFieldCurvature: Newton on g(s) = h''(L; s) - c with the forward
// difference g'(s) ≈ (g(s + δ) - g(s)) / δ. A step that makes the
// integration fail is halved up to four times.
//------------------------------------------------------------------------------
Solution ShootingSolver::solve(real_t L) const
{
    if (bc.getVariant() == BoundaryVariant::InitialCurvature)
    {
        return integrate(bc.prescribedCurvature(), L);
    }

    const vec_real xGrid = generateGrid(L);
    const real_t target = bc.prescribedCurvature();
    const real_t delta = config.EpsShooting;

    real_t s = curvatureEstimate(xGrid);
    mat_real Y, Ytrial;
    size_t its = 0;

    if (!integrateToEnd(s, xGrid, Y))
    {
        return finalize(xGrid, Y, s, SolveStatus::Diverged, std::numeric_limits<real_t>::infinity(), its);
    }
    real_t g = Y[2].back() - target;

    for (int iter=0; iter<config.MaxIterShooting; ++iter)
    {
        if (std::abs(g) < config.BcTolerance)
        {
            SolveStatus status = SolveStatus::Converged;
            if (config.FarFieldCheck && Y[0].back() < config.FarFieldMinThickness)
            {
                status = SolveStatus::TruncationInadmissible;
            }
            return finalize(xGrid, Y, s, status, std::abs(g), its);
        }

        ++its;

        if (!integrateToEnd(s + delta, xGrid, Ytrial))
        {
            return finalize(xGrid, Y, s, SolveStatus::Diverged, std::abs(g), its);
        }
        const real_t dg = (Ytrial[2].back() - target - g) / delta;
        if (!std::isfinite(dg) || dg == 0.0)
        {
            return finalize(xGrid, Y, s, SolveStatus::SingularJacobian, std::abs(g), its);
        }

        real_t step = -g / dg;
        bool accepted = false;
        for (int k=0; k<=4; ++k)
        {
            if (integrateToEnd(s + step, xGrid, Ytrial) && std::isfinite(Ytrial[2].back()))
            {
                accepted = true;
                break;
            }
            step *= 0.5;
        }
        if (!accepted)
        {
            return finalize(xGrid, Y, s, SolveStatus::Diverged, std::abs(g), its);
        }

        s += step;
        Y.swap(Ytrial);
        g = Y[2].back() - target;

        if (config.Verbose)
        {
            std::cout << "Shooting iteration: " << its << ", h''(0) = " << s
                      << ", mismatch: " << g << std::endl;
        }
    }

    if (std::abs(g) < config.BcTolerance)
    {
        SolveStatus status = SolveStatus::Converged;
        if (config.FarFieldCheck && Y[0].back() < config.FarFieldMinThickness)
        {
            status = SolveStatus::TruncationInadmissible;
        }
        return finalize(xGrid, Y, s, status, std::abs(g), its);
    }

    return finalize(xGrid, Y, s, SolveStatus::IterationCapReached, std::abs(g), its);
}
