//==============================================================================
// test_collocation.cpp
// End-to-end behaviour of the adaptive collocation solver:
//   - reference solve at L = 50 (boundary values met, metadata consistent)
//   - degenerate truncation L = 0.01 reports non-convergence
//   - linear vs. shape-aware guess at L = 5000
//   - repeatability, node budget, malformed input
//==============================================================================

#include "CollocationSolver.hpp"

#include <cassert>

namespace
{
    SolverConfig referenceConfig()
    {
        SolverConfig config;
        config.K = 0.01;
        config.Eps = 1e-6;
        config.L = 50.0;
        config.N = 500;
        config.Guess = GuessStrategy::Linear;
        config.Tolerance = 1e-4;
        config.BcTolerance = 1e-4;
        config.MaxNodes = 20000;
        return config;
    }

    template <typename Fn>
    bool throwsConfigurationError(Fn&& fn)
    {
        try { fn(); }
        catch (const ConfigurationError&) { return true; }
        return false;
    }
}

int main()
{
    //--------------------------------------------------------------------------
    // L = 50, N = 500, linear guess, tol = 1e-4
    //--------------------------------------------------------------------------
    const SolverConfig config = referenceConfig();
    CollocationSolver solver(config);
    Solution sol = solver.solve();

    assert(sol.converged);
    assert(sol.status == SolveStatus::Converged);
    assert(sol.maxResidual <= config.Tolerance);
    assert(sol.nodeCount() <= config.MaxNodes);
    assert(sol.length() == config.L);

    const state_t left = sol.evaluate(0.0);
    const state_t right = sol.evaluate(config.L);
    assert(std::abs(left[0]) < config.Tolerance);
    assert(std::abs(left[1] - 1.0) < config.Tolerance);
    assert(std::abs(right[2]) < config.Tolerance);

    // Converged implies the boundary residual at the endpoints is within tolerance
    assert(solver.getBoundaryConditions().residualNorm(sol.leftState(), sol.rightState()) <= config.BcTolerance);
    assert(sol.maxBcResidual <= config.BcTolerance);

    // Thin film thickens and the slope grows monotonically from 1
    assert(right[0] > 1.0);
    assert(right[1] > 1.0);
    assert(sol.evaluate(10.0)[1] > left[1]);

    // h(0) = 0 is exactly where the denominator is smallest
    assert(sol.minDenominator <= config.Eps * (1.0 + 1e-3));
    assert(sol.singularityWarning == (sol.minDenominator < config.singularityThreshold()));

    // Node history is non-decreasing and ends at the final mesh size
    assert(!sol.nodeHistory.empty());
    assert(sol.nodeHistory.front() == config.N);
    assert(std::is_sorted(sol.nodeHistory.begin(), sol.nodeHistory.end()));
    assert(sol.nodeHistory.back() == sol.nodeCount());
    assert(sol.refinements == sol.nodeHistory.size());
    assert(sol.newtonIterations >= sol.refinements);

    // Interpolant derivative matches the ODE at an off-node point
    {
        const real_t x = 7.3;
        const state_t y = sol.evaluate(x);
        const state_t dy = sol.derivative(x);
        const state_t f = solver.getModel().rhs(x, y);
        for (size_t c=0; c<NumStates; ++c)
        {
            assert(std::abs(dy[c] - f[c]) < 10.0 * config.Tolerance * (1.0 + std::abs(f[c])));
        }
    }

    // Sampling and JSON hand-off
    vec_real grid = linspace(0.0, config.L, config.EvalPoints);
    mat_real sampled = sol.sample(grid);
    assert(sampled.size() == NumStates && sampled[1].size() == grid.size());
    json out = sol.toJson(grid);
    assert(out["Converged"].get<bool>());
    assert(out["Status"].get<std::string>() == "converged");
    assert(out["dh"].size() == grid.size());
    assert(!out.contains("InitialCurvature"));

    // Evaluation outside [0, L] is rejected
    bool thrown = false;
    try { sol.evaluate(config.L + 1.0); }
    catch (const std::out_of_range&) { thrown = true; }
    assert(thrown);

    //--------------------------------------------------------------------------
    // Repeatability: identical input gives identical output
    //--------------------------------------------------------------------------
    Solution again = solver.solve();
    assert(again.getMesh() == sol.getMesh());
    assert(again.getNodalState() == sol.getNodalState());
    assert(again.status == sol.status);
    assert(again.maxResidual == sol.maxResidual);

    //--------------------------------------------------------------------------
    // L = 0.01: the far-field condition sits inside the boundary layer
    //--------------------------------------------------------------------------
    {
        SolverConfig shortConfig = referenceConfig();
        shortConfig.L = 0.01;
        CollocationSolver shortSolver(shortConfig);
        Solution shortSol = shortSolver.solve();

        assert(!shortSol.converged);
        assert(shortSol.status != SolveStatus::Converged);
        assert(shortSol.nodeCount() >= 2);
        assert(shortSol.getNodalState()[0].size() == shortSol.nodeCount());

        // Disabling the admissibility test exposes the raw collocation outcome
        shortConfig.FarFieldCheck = false;
        Solution raw = CollocationSolver(shortConfig).solve();
        assert(raw.status != SolveStatus::TruncationInadmissible);
    }

    //--------------------------------------------------------------------------
    // Linear vs. shape-aware guess at L = 5000
    //--------------------------------------------------------------------------
    {
        SolverConfig farConfig = referenceConfig();
        farConfig.L = 5000.0;

        farConfig.Guess = GuessStrategy::Linear;
        Solution linear = CollocationSolver(farConfig).solve();

        farConfig.Guess = GuessStrategy::ShapeAware;
        Solution shape = CollocationSolver(farConfig).solve();

        // Far out the cubic correction x - (x/L)^3 is tiny on most of the
        // domain, so both guesses can need the same number of passes.
        assert(shape.converged);
        assert(!linear.converged || shape.refinements <= linear.refinements);
        assert(std::abs(shape.evaluate(farConfig.L)[2]) < farConfig.Tolerance);
    }

    //--------------------------------------------------------------------------
    // Node budget: never exceeded, mesh never shrinks
    //--------------------------------------------------------------------------
    {
        SolverConfig tight = referenceConfig();
        tight.N = 20;
        tight.MaxNodes = 40;
        Solution budget = CollocationSolver(tight).solve();

        assert(budget.nodeCount() <= tight.MaxNodes);
        assert(std::is_sorted(budget.nodeHistory.begin(), budget.nodeHistory.end()));
        for (size_t n : budget.nodeHistory) assert(n <= tight.MaxNodes);
        if (!budget.converged)
        {
            assert(budget.status != SolveStatus::Converged);
        }
    }

    //--------------------------------------------------------------------------
    // Refinement cap: the returned mesh is the one the diagnostics describe
    //--------------------------------------------------------------------------
    {
        SolverConfig capped = referenceConfig();
        capped.N = 10;
        capped.MaxRefinements = 1;
        Solution s = CollocationSolver(capped).solve();

        assert(!s.converged);
        assert(s.status == SolveStatus::IterationCapReached);
        assert(s.nodeCount() == capped.N);
        assert(s.nodeHistory.back() == s.nodeCount());
        assert(s.refinements == 1);

        capped.MaxRefinements = 3;
        Solution s3 = CollocationSolver(capped).solve();
        assert(s3.nodeHistory.back() == s3.nodeCount());
        assert(s3.refinements == s3.nodeHistory.size());
    }

    //--------------------------------------------------------------------------
    // Tiny positive L is a valid request, reported as not converged
    //--------------------------------------------------------------------------
    {
        SolverConfig tiny = referenceConfig();
        tiny.N = 10;
        tiny.L = 1e-9;
        Solution s = CollocationSolver(tiny).solve();
        assert(!s.converged);
        assert(s.nodeCount() >= tiny.N);
    }

    //--------------------------------------------------------------------------
    // Small ε: the warning threshold follows ε, h(0) = 0 alone does not warn
    //--------------------------------------------------------------------------
    {
        SolverConfig smallEps = referenceConfig();
        smallEps.Eps = 1e-10;
        Solution s = CollocationSolver(smallEps).solve();
        assert(s.converged);
        assert(s.singularityWarning == (s.minDenominator < 0.5 * smallEps.Eps));
        assert(!s.singularityWarning);
    }

    //--------------------------------------------------------------------------
    // Malformed input fails before any solve
    //--------------------------------------------------------------------------
    InitialGuessBuilder builder;
    vec_real mesh = InitialGuessBuilder::uniformMesh(config.L, 50);
    mat_real guess = builder.build(mesh, config.L);

    assert(throwsConfigurationError([&]{ solver.solve(mesh, guess, 0.0, 1000); }));
    assert(throwsConfigurationError([&]{ solver.solve(mesh, guess, 1e-4, 10); }));

    mat_real shortGuess = guess;
    shortGuess[1].pop_back();
    assert(throwsConfigurationError([&]{ solver.solve(mesh, shortGuess, 1e-4, 1000); }));

    vec_real badMesh = mesh;
    std::swap(badMesh[3], badMesh[4]);
    assert(throwsConfigurationError([&]{ solver.solve(badMesh, guess, 1e-4, 1000); }));

    assert(throwsConfigurationError([&]{
        SolverConfig bad = referenceConfig();
        bad.Eps = 0.0;
        CollocationSolver s(bad);
    }));
    assert(throwsConfigurationError([&]{
        SolverConfig bad = referenceConfig();
        bad.L = -5.0;
        CollocationSolver s(bad);
    }));

    //--------------------------------------------------------------------------
    // Initial-curvature variant: h''(0) = 0 imposed at the origin
    //--------------------------------------------------------------------------
    {
        SolverConfig ivp = referenceConfig();
        ivp.L = 2.0;
        ivp.N = 100;
        ivp.Boundary = BoundaryVariant::InitialCurvature;
        Solution s = CollocationSolver(ivp).solve();

        assert(s.converged);
        assert(std::abs(s.evaluate(0.0)[2]) < ivp.Tolerance);
        assert(s.evaluate(2.0)[2] < 0.0);
    }

    std::cout << "test_collocation passed." << std::endl;
    return 0;
}
