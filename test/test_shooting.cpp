//==============================================================================
// test_shooting.cpp
// Shooting on h''(0) with the implicit Runge–Kutta stepper, cross-checked
// against the collocation solver for both boundary-condition variants.
//==============================================================================

#include "ShootingSolver.hpp"
#include "CollocationSolver.hpp"

#include <cassert>

int main()
{
    SolverConfig config;
    config.L = 50.0;
    config.N = 500;
    config.Tolerance = 1e-4;
    config.BcTolerance = 1e-4;
    config.MaxNodes = 20000;

    //--------------------------------------------------------------------------
    // Single IRK step on h''' = -k/(h² + h + ε) away from the boundary layer:
    // all three schemes agree with each other
    //--------------------------------------------------------------------------
    {
        ProblemModel model(config.K, config.Eps);
        state_t y0{1.0, 1.0, 0.05}, y1{}, y2{}, y3{};
        bool converged = false;
        int its = 0;

        ODEStepper irk1(1e-13, Scheme::IRK1, model);
        ODEStepper irk2(1e-13, Scheme::IRK2, model);
        ODEStepper irk3(1e-13, Scheme::IRK3, model);
        assert(irk1.stages() == 1 && irk2.stages() == 2 && irk3.stages() == 3);

        irk3.integrate(y0, y3, 1.0, 1.01, converged, its, 20);
        assert(converged && its >= 1);
        irk2.integrate(y0, y2, 1.0, 1.01, converged, its, 20);
        assert(converged);
        irk1.integrate(y0, y1, 1.0, 1.01, converged, its, 20);
        assert(converged);

        for (size_t c=0; c<NumStates; ++c)
        {
            assert(std::abs(y3[c] - y2[c]) < 1e-10);
            assert(std::abs(y3[c] - y1[c]) < 1e-7);
        }
        // h' grows by roughly h''·dx over the step
        assert(std::abs(y3[1] - (1.0 + 0.05*0.01)) < 1e-5);
    }

    //--------------------------------------------------------------------------
    // Far-field variant: Newton on h''(0) until h''(L) = 0
    //--------------------------------------------------------------------------
    {
        ShootingSolver shooter(config);
        Solution shot = shooter.solve();

        assert(shot.converged);
        assert(shot.status == SolveStatus::Converged);
        assert(std::isfinite(shot.initialCurvature));
        assert(shot.initialCurvature > 0.0);
        assert(shot.nodeCount() == config.ShootingSteps);
        assert(shot.length() == config.L);
        assert(std::abs(shot.rightState()[2]) < config.BcTolerance);
        assert(shot.leftState()[0] == 0.0 && shot.leftState()[1] == 1.0);

        json j = shot.toJson();
        assert(j.contains("InitialCurvature"));

        // Cross-check against collocation on the same truncation
        Solution colloc = CollocationSolver(config).solve();
        assert(colloc.converged);

        const real_t slopeShot = shot.evaluate(10.0)[1];
        const real_t slopeColloc = colloc.evaluate(10.0)[1];
        assert(std::abs(slopeShot - slopeColloc) < 1e-2 * std::abs(slopeColloc));

        const real_t hShot = shot.evaluate(config.L)[0];
        const real_t hColloc = colloc.evaluate(config.L)[0];
        assert(std::abs(hShot - hColloc) < 1e-2 * hColloc);

        const real_t curvColloc = colloc.leftState()[2];
        assert(std::abs(shot.initialCurvature - curvColloc) < 5e-2 * std::abs(curvColloc));
    }

    //--------------------------------------------------------------------------
    // Initial-curvature variant: a single initial value problem
    //--------------------------------------------------------------------------
    {
        SolverConfig ivp = config;
        ivp.L = 2.0;
        ivp.N = 100;
        ivp.Boundary = BoundaryVariant::InitialCurvature;

        ShootingSolver shooter(ivp);
        Solution shot = shooter.solve();
        assert(shot.converged);
        assert(shot.initialCurvature == 0.0);
        assert(shot.newtonIterations == 0);

        // Same as the explicit initial value problem
        Solution direct = shooter.integrate(0.0, ivp.L);
        assert(direct.getNodalState() == shot.getNodalState());

        // Curvature turns negative immediately and stays so
        assert(shot.evaluate(1.0)[2] < 0.0);
        assert(shot.evaluate(2.0)[2] < shot.evaluate(1.0)[2]);

        Solution colloc = CollocationSolver(ivp).solve();
        assert(colloc.converged);
        const state_t a = shot.evaluate(2.0);
        const state_t b = colloc.evaluate(2.0);
        assert(std::abs(a[0] - b[0]) < 1e-2 * std::abs(b[0]));
        assert(std::abs(a[1] - b[1]) < 1e-2 * std::abs(b[1]));

        // Lower-order schemes on the same grid stay close
        ivp.SchemeIRK = Scheme::IRK1;
        Solution low = ShootingSolver(ivp).solve();
        assert(low.converged);
        assert(std::abs(low.evaluate(2.0)[0] - a[0]) < 1e-3 * std::abs(a[0]));
    }

    //--------------------------------------------------------------------------
    // The interval must extend beyond the first grid step
    //--------------------------------------------------------------------------
    {
        ShootingSolver shooter(config);
        bool thrown = false;
        try { shooter.solve(config.ShootingFirstStep / 2.0); }
        catch (const ConfigurationError&) { thrown = true; }
        assert(thrown);
    }

    std::cout << "test_shooting passed." << std::endl;
    return 0;
}
