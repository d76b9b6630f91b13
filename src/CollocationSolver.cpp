//==============================================================================
// CollocationSolver.cpp
// Adaptive collocation solver for h''' = -k/(h² + h + ε) on [0, L].
// Responsibilities:
//   • Evaluate the cubic collocation residuals Φ_i and boundary residuals.
//   • Assemble the banded Newton matrix (left BC rows, 3 rows per interval,
//     right BC rows) and factorize it with LAPACK dgbtrf.
//   • Damped Newton with Armijo backtracking, reusing the factorization after
//     full steps.
//   • Estimate the RMS relative residual per interval and halve flagged
//     intervals until tolerance, node budget or iteration cap is reached.
//==============================================================================

#include "CollocationSolver.hpp"

namespace
{
    // 3x3 row-major helpers for Jacobian blocks
    using block_t = std::array<real_t, 9>;

    block_t matmul(const block_t& A, const block_t& B)
    {
        block_t C{};
        for (size_t i=0; i<3; ++i)
        {
            for (size_t j=0; j<3; ++j)
            {
                real_t s = 0.0;
                for (size_t k=0; k<3; ++k)
                {
                    s += A[3*i+k] * B[3*k+j];
                }
                C[3*i+j] = s;
            }
        }
        return C;
    }

    state_t column(const mat_real& Y, size_t i)
    {
        return {Y[0][i], Y[1][i], Y[2][i]};
    }

    real_t dot(const vec_real& a, const vec_real& b)
    {
        return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
    }
}

//------------------------------------------------------------------------------
// Ctor: the configuration is validated once; model and boundary conditions
// are built from it.
//------------------------------------------------------------------------------
CollocationSolver::CollocationSolver(const SolverConfig& configIn)
    : config(configIn), model(configIn.K, configIn.Eps), bc(configIn.Boundary),
      guessBuilder(configIn.Guess)
{
    config.validate();
}

size_t CollocationSolver::lowerBandwidth() const
{
    return bc.leftRows().size() + 2;
}

size_t CollocationSolver::upperBandwidth() const
{
    const size_t nLeft = bc.leftRows().size();
    return std::max<size_t>(5 - nLeft, 2);
}

//------------------------------------------------------------------------------
// collocationResiduals
//   y_mid = (y_i + y_{i+1})/2 - h/8 (f_{i+1} - f_i)
//   Φ_i   = y_{i+1} - y_i - h/6 (f_i + 4 f_mid + f_{i+1})
//------------------------------------------------------------------------------
void CollocationSolver::collocationResiduals(const vec_real& x, const mat_real& y, CollocationData& d) const
{
    const size_t m = x.size();

    d.h.resize(m-1);
    vec_real xMid(m-1);
    for (size_t i=0; i+1<m; ++i)
    {
        d.h[i] = x[i+1] - x[i];
        xMid[i] = x[i] + 0.5*d.h[i];
    }

    model.rhs(x, y, d.f);

    d.yMid.assign(NumStates, vec_real(m-1));
    for (size_t c=0; c<NumStates; ++c)
    {
        for (size_t i=0; i+1<m; ++i)
        {
            d.yMid[c][i] = 0.5*(y[c][i+1] + y[c][i]) - 0.125*d.h[i]*(d.f[c][i+1] - d.f[c][i]);
        }
    }

    model.rhs(xMid, d.yMid, d.fMid);

    d.colRes.assign(NumStates, vec_real(m-1));
    for (size_t c=0; c<NumStates; ++c)
    {
        for (size_t i=0; i+1<m; ++i)
        {
            d.colRes[c][i] = y[c][i+1] - y[c][i]
                             - d.h[i]/6.0 * (d.f[c][i] + d.f[c][i+1] + 4.0*d.fMid[c][i]);
        }
    }

    d.bcRes = bc.residual(column(y, 0), column(y, m-1));
}

//------------------------------------------------------------------------------
// Row order: [left BC rows | Φ_0 | Φ_1 | ... | Φ_{m-2} | right BC rows]
//------------------------------------------------------------------------------
void CollocationSolver::packResidual(const CollocationData& d, size_t m, vec_real& res) const
{
    const std::vector<size_t> leftRows = bc.leftRows();
    const std::vector<size_t> rightRows = bc.rightRows();
    const size_t nLeft = leftRows.size();

    res.assign(NumStates*m, 0.0);

    for (size_t k=0; k<nLeft; ++k)
    {
        res[k] = d.bcRes[leftRows[k]];
    }
    for (size_t i=0; i+1<m; ++i)
    {
        for (size_t c=0; c<NumStates; ++c)
        {
            res[nLeft + NumStates*i + c] = d.colRes[c][i];
        }
    }
    for (size_t k=0; k<rightRows.size(); ++k)
    {
        res[nLeft + NumStates*(m-1) + k] = d.bcRes[rightRows[k]];
    }
}

//------------------------------------------------------------------------------
// assembleJacobian
// With J_i = ∂f/∂y at node i and M_i = ∂f/∂y at the midpoint:
//   ∂Φ_i/∂y_i     = -I - h/6 (J_i + 2 M_i) - h²/12 M_i J_i
//   ∂Φ_i/∂y_{i+1} =  I - h/6 (J_{i+1} + 2 M_i) + h²/12 M_i J_{i+1}
// Column index of component c at node i is 3i + c.
//------------------------------------------------------------------------------
void CollocationSolver::assembleJacobian(const vec_real& x, const mat_real& y,
                                         const CollocationData& d, BandedSystem& J) const
{
    const size_t m = x.size();
    const std::vector<size_t> leftRows = bc.leftRows();
    const std::vector<size_t> rightRows = bc.rightRows();
    const size_t nLeft = leftRows.size();

    // Boundary rows
    const block_t JL = bc.jacobianLeft();
    for (size_t k=0; k<nLeft; ++k)
    {
        for (size_t c=0; c<NumStates; ++c)
        {
            if (JL[3*leftRows[k] + c] != 0.0)
            {
                J.add(k, c, JL[3*leftRows[k] + c]);
            }
        }
    }

    const block_t JR = bc.jacobianRight();
    for (size_t k=0; k<rightRows.size(); ++k)
    {
        for (size_t c=0; c<NumStates; ++c)
        {
            if (JR[3*rightRows[k] + c] != 0.0)
            {
                J.add(nLeft + NumStates*(m-1) + k, NumStates*(m-1) + c, JR[3*rightRows[k] + c]);
            }
        }
    }

    // Node Jacobians are shared by neighbouring intervals
    std::vector<block_t> nodeJac(m);
    for (size_t i=0; i<m; ++i)
    {
        nodeJac[i] = model.jacobian(x[i], column(y, i));
    }

    for (size_t i=0; i+1<m; ++i)
    {
        const real_t h = d.h[i];
        const block_t Mi = model.jacobian(x[i] + 0.5*h, column(d.yMid, i));
        const block_t MJ0 = matmul(Mi, nodeJac[i]);
        const block_t MJ1 = matmul(Mi, nodeJac[i+1]);

        const size_t row0 = nLeft + NumStates*i;
        const size_t col0 = NumStates*i;

        for (size_t a=0; a<NumStates; ++a)
        {
            for (size_t b=0; b<NumStates; ++b)
            {
                const real_t delta = (a == b) ? 1.0 : 0.0;
                const size_t ab = 3*a + b;

                const real_t dPhi0 = -delta - h/6.0*(nodeJac[i][ab] + 2.0*Mi[ab]) - h*h/12.0*MJ0[ab];
                const real_t dPhi1 =  delta - h/6.0*(nodeJac[i+1][ab] + 2.0*Mi[ab]) + h*h/12.0*MJ1[ab];

                J.add(row0 + a, col0 + b, dPhi0);
                J.add(row0 + a, col0 + NumStates + b, dPhi1);
            }
        }
    }
}

//------------------------------------------------------------------------------
// Newton stopping test: |Φ_i| < tol_r,i (1 + |f_mid|) with
// tol_r,i = 2/3 · h_i · 0.05 · tol, and all boundary residuals below BcTolerance.
//------------------------------------------------------------------------------
bool CollocationSolver::residualsWithinTolerance(const CollocationData& d, real_t tol) const
{
    for (size_t i=0; i<d.h.size(); ++i)
    {
        const real_t tolR = 2.0/3.0 * d.h[i] * 5e-2 * tol;
        for (size_t c=0; c<NumStates; ++c)
        {
            if (!(std::abs(d.colRes[c][i]) < tolR * (1.0 + std::abs(d.fMid[c][i]))))
            {
                return false;
            }
        }
    }

    for (const auto& r : d.bcRes)
    {
        if (!(std::abs(r) < config.BcTolerance))
        {
            return false;
        }
    }

    return true;
}

//------------------------------------------------------------------------------
// solveNewton
// Solve J·step = res, y ← y - α·step. The trial α = 1, 1/2, ... is accepted
// once ‖J⁻¹ res(y_new)‖² < (1 - 2ασ) ‖step‖². After a full step the old
// factorization is reused for the next iteration; otherwise J is rebuilt.
// At most MaxJacobianEvals factorizations per call.
//------------------------------------------------------------------------------
CollocationSolver::NewtonOutcome CollocationSolver::solveNewton(const vec_real& x, mat_real& y, real_t tol,
                                                                size_t& newtonIts, real_t& minDen) const
{
    const size_t m = x.size();
    const size_t n = NumStates*m;

    CollocationData d, dNew;
    vec_real res, resNew, step, stepNew;

    collocationResiduals(x, y, d);
    packResidual(d, m, res);
    if (!all_finite(res))
    {
        return NewtonOutcome::Diverged;
    }

    BandedSystem J(n, lowerBandwidth(), upperBandwidth());
    int jacobianEvals = 0;
    bool recomputeJacobian = true;
    real_t cost = 0.0;

    for (int its=0; its<config.MaxNewtonIterations; ++its)
    {
        ++newtonIts;

        if (recomputeJacobian)
        {
            J.clear();
            assembleJacobian(x, y, d, J);
            ++jacobianEvals;

            if (!J.factorize())
            {
                return NewtonOutcome::Singular;
            }

            step = res;
            J.solve(step);
            cost = dot(step, step);
        }

        real_t alpha = 1.0;
        real_t costNew = std::numeric_limits<real_t>::infinity();
        mat_real yNew(NumStates, vec_real(m));

        for (int trial=0; trial<=MaxBacktracks; ++trial)
        {
            for (size_t c=0; c<NumStates; ++c)
            {
                for (size_t i=0; i<m; ++i)
                {
                    yNew[c][i] = y[c][i] - alpha * step[NumStates*i + c];
                }
            }

            collocationResiduals(x, yNew, dNew);
            packResidual(dNew, m, resNew);

            if (all_finite(resNew))
            {
                stepNew = resNew;
                J.solve(stepNew);
                costNew = dot(stepNew, stepNew);
            }
            else
            {
                costNew = std::numeric_limits<real_t>::infinity();
            }

            if (costNew < (1.0 - 2.0*alpha*ArmijoSigma) * cost)
            {
                break;
            }

            if (trial < MaxBacktracks)
            {
                alpha *= BacktrackFactor;
            }
        }

        // Every trial left the finite range: keep the last accepted iterate
        if (!std::isfinite(costNew))
        {
            return NewtonOutcome::Diverged;
        }

        y = yNew;
        d = dNew;
        res = resNew;
        minDen = std::min({minDen, model.minDenominator(y), model.minDenominator(d.yMid)});

        if (residualsWithinTolerance(d, tol))
        {
            return NewtonOutcome::Solved;
        }

        if (jacobianEvals == MaxJacobianEvals)
        {
            break;
        }

        if (alpha == 1.0)
        {
            step = stepNew;
            cost = costNew;
            recomputeJacobian = false;
        }
        else
        {
            recomputeJacobian = true;
        }
    }

    return NewtonOutcome::NotConverged;
}

//------------------------------------------------------------------------------
// estimateResiduals
// Relative residual r(x) = (S'(x) - f(x, S(x))) / (1 + |f(x, S(x))|) of the
// cubic interpolant S, integrated over each interval with the 5-point Lobatto
// rule. The end nodes contribute nothing (S' = f there), the midpoint value is
// 1.5 Φ_i / h_i, and the remaining nodes sit at x_mid ± h/2 √(3/7).
//------------------------------------------------------------------------------
vec_real CollocationSolver::estimateResiduals(const vec_real& x, const mat_real& y,
                                              const CollocationData& d) const
{
    const size_t m = x.size();
    const Solution spline(x, y, d.f);
    const real_t offset = 0.5 * std::sqrt(3.0/7.0);

    vec_real rms(m-1);
    for (size_t i=0; i+1<m; ++i)
    {
        const real_t h = d.h[i];
        const real_t xMid = x[i] + 0.5*h;

        real_t rMid = 0.0;
        for (size_t c=0; c<NumStates; ++c)
        {
            const real_t r = 1.5 * d.colRes[c][i] / h / (1.0 + std::abs(d.fMid[c][i]));
            rMid += r*r;
        }

        real_t rSides = 0.0;
        for (const real_t xs : {xMid - offset*h, xMid + offset*h})
        {
            const state_t S = spline.evaluate(xs);
            const state_t dS = spline.derivative(xs);
            const state_t fs = model.rhs(xs, S);
            for (size_t c=0; c<NumStates; ++c)
            {
                const real_t r = (dS[c] - fs[c]) / (1.0 + std::abs(fs[c]));
                rSides += r*r;
            }
        }

        rms[i] = std::sqrt(0.5 * (32.0/45.0 * rMid + 49.0/90.0 * rSides));
    }

    return rms;
}

size_t CollocationSolver::countFlagged(const vec_real& rms, real_t tol)
{
    return static_cast<size_t>(std::count_if(rms.begin(), rms.end(),
                                             [tol](real_t r){ return !(r <= tol); }));
}

//------------------------------------------------------------------------------
// refineMesh
// Insert the midpoint of every flagged interval. Existing nodes keep their
// values; inserted nodes take the cubic interpolant's value.
//------------------------------------------------------------------------------
size_t CollocationSolver::refineMesh(vec_real& x, mat_real& y, const mat_real& f,
                                     const vec_real& rms, real_t tol) const
{
    const Solution spline(x, y, f);
    const size_t m = x.size();

    vec_real xNew;
    mat_real yNew(NumStates);
    xNew.reserve(m + rms.size());

    size_t added = 0;
    for (size_t i=0; i<m; ++i)
    {
        xNew.push_back(x[i]);
        for (size_t c=0; c<NumStates; ++c)
        {
            yNew[c].push_back(y[c][i]);
        }

        if (i+1 < m && !(rms[i] <= tol))
        {
            const real_t xm = 0.5*(x[i] + x[i+1]);
            const state_t ym = spline.evaluate(xm);
            xNew.push_back(xm);
            for (size_t c=0; c<NumStates; ++c)
            {
                yNew[c].push_back(ym[c]);
            }
            ++added;
        }
    }

    x = std::move(xNew);
    y = std::move(yNew);

    return added;
}

//------------------------------------------------------------------------------
// solve
// Fail fast on malformed input, then iterate
//   Newton on current mesh → residual estimate → halve flagged intervals
// until no interval is flagged and the boundary residuals are met, the next
// refinement would exceed maxNodes, or MaxRefinements passes are spent.
//------------------------------------------------------------------------------
Solution CollocationSolver::solve(const vec_real& mesh, const mat_real& guess, real_t tol, size_t maxNodes) const
{
    InitialGuessBuilder::validateMesh(mesh);
    if (guess.size() != NumStates)
    {
        throw ConfigurationError("Guess must have 3 rows (h, h', h'')");
    }
    for (const auto& row : guess)
    {
        if (row.size() != mesh.size())
        {
            throw ConfigurationError("Guess shape does not match the mesh");
        }
    }
    if (!(tol > 0.0))
    {
        throw ConfigurationError("Tolerance must be positive");
    }
    if (maxNodes < mesh.size())
    {
        throw ConfigurationError("maxNodes must be at least the initial mesh size");
    }

    vec_real x = mesh;
    mat_real y = guess;

    SolveStatus status = SolveStatus::IterationCapReached;
    size_t newtonIts = 0;
    size_t refinements = 0;
    real_t minDen = model.minDenominator(y);
    real_t maxRms = std::numeric_limits<real_t>::infinity();
    real_t bcNorm = std::numeric_limits<real_t>::infinity();
    std::vector<size_t> nodeHistory;
    CollocationData d;

    for (int iteration=0; iteration<config.MaxRefinements; ++iteration)
    {
        nodeHistory.push_back(x.size());

        NewtonOutcome outcome = solveNewton(x, y, tol, newtonIts, minDen);
        ++refinements;

        collocationResiduals(x, y, d);
        bcNorm = bc.residualNorm(column(y, 0), column(y, x.size()-1));

        if (outcome == NewtonOutcome::Singular)
        {
            status = SolveStatus::SingularJacobian;
            break;
        }
        if (outcome == NewtonOutcome::Diverged)
        {
            status = SolveStatus::Diverged;
            break;
        }

        vec_real rms = estimateResiduals(x, y, d);
        maxRms = all_finite(rms) ? *std::max_element(rms.begin(), rms.end())
                                 : std::numeric_limits<real_t>::infinity();
        const size_t flagged = countFlagged(rms, tol);

        if (config.Verbose)
        {
            std::cout << "Refinement iteration: " << iteration+1
                      << ", nodes: " << x.size()
                      << ", max residual: " << maxRms
                      << ", max BC residual: " << bcNorm
                      << ", intervals to refine: " << flagged << std::endl;
        }

        if (x.size() + flagged > maxNodes)
        {
            status = SolveStatus::NodeBudgetExhausted;
            break;
        }

        if (flagged > 0)
        {
            // No Newton pass would follow; keep the mesh the diagnostics describe.
            if (iteration+1 == config.MaxRefinements) break;
            refineMesh(x, y, d.f, rms, tol);
        }
        else if (bcNorm <= config.BcTolerance)
        {
            status = SolveStatus::Converged;
            break;
        }
    }

    // Final arrays are consistent with the final mesh
    collocationResiduals(x, y, d);

    // Decay condition only models x → ∞ once the profile has left the inner
    // region (h < 1) where h dominates h² in the denominator.
    if (status == SolveStatus::Converged && config.FarFieldCheck &&
        bc.getVariant() == BoundaryVariant::FarFieldCurvature &&
        y[0].back() < config.FarFieldMinThickness)
    {
        status = SolveStatus::TruncationInadmissible;
    }

    Solution sol(x, y, d.f);
    sol.status = status;
    sol.converged = (status == SolveStatus::Converged);
    sol.maxResidual = maxRms;
    sol.maxBcResidual = bcNorm;
    sol.refinements = refinements;
    sol.newtonIterations = newtonIts;
    sol.nodeHistory = nodeHistory;
    sol.minDenominator = minDen;
    sol.singularityWarning = (minDen < config.singularityThreshold());

    if (config.Verbose)
    {
        if (sol.converged)
        {
            std::cout << "The solution has converged on " << x.size() << " nodes!" << std::endl;
        }
        else
        {
            std::cerr << "Collocation solve did not converge: " << to_string(status)
                      << " (L = " << x.back() << ", nodes = " << x.size() << ")" << std::endl;
        }
        if (sol.singularityWarning)
        {
            std::cerr << "Singularity risk: min |h^2 + h + eps| = " << minDen << std::endl;
        }
    }

    return sol;
}

Solution CollocationSolver::solve() const
{
    vec_real mesh = InitialGuessBuilder::uniformMesh(config.L, config.N);
    mat_real guess = guessBuilder.build(mesh, config.L);

    return solve(mesh, guess, config.Tolerance, config.MaxNodes);
}
