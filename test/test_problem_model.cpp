//==============================================================================
// test_problem_model.cpp
// Right-hand side, Jacobian and regularization behaviour of ProblemModel.
//==============================================================================

#include "ProblemModel.hpp"

#include <cassert>

int main()
{
    const real_t k = 0.01;
    ProblemModel model(k, 1e-6);

    assert(model.coefficient() == k);
    assert(model.regularization() == 1e-6);

    //--------------------------------------------------------------------------
    // Pointwise evaluation: (h', h'', -k / (h² + h + ε))
    //--------------------------------------------------------------------------
    state_t y{2.0, 0.5, -0.25};
    state_t f = model.rhs(0.0, y);
    assert(f[0] == 0.5);
    assert(f[1] == -0.25);
    assert(almost_equal(f[2], -k / (4.0 + 2.0 + 1e-6), 1e-15));

    // At h = 0 the regularization bounds the right-hand side
    assert(almost_equal(model.thirdDerivative(0.0), -k / 1e-6, 1e-6));

    //--------------------------------------------------------------------------
    // Mesh-wide evaluation matches the pointwise one
    //--------------------------------------------------------------------------
    vec_real x = linspace(0.0, 5.0, 11);
    mat_real Y(NumStates, vec_real(x.size()));
    for (size_t i=0; i<x.size(); ++i)
    {
        Y[0][i] = x[i];
        Y[1][i] = 1.0;
        Y[2][i] = -0.1 * x[i];
    }
    mat_real F;
    model.rhs(x, Y, F);
    assert(F.size() == NumStates && F[0].size() == x.size());
    for (size_t i=0; i<x.size(); ++i)
    {
        state_t fi = model.rhs(x[i], {Y[0][i], Y[1][i], Y[2][i]});
        for (size_t c=0; c<NumStates; ++c) assert(std::abs(F[c][i] - fi[c]) <= 1e-15 * std::abs(fi[c]));
    }

    // Shape mismatch is a configuration error
    bool thrown = false;
    mat_real bad(2, vec_real(x.size()));
    try { model.rhs(x, bad, F); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    //--------------------------------------------------------------------------
    // Jacobian against a central difference in h
    //--------------------------------------------------------------------------
    for (real_t h : {1e-4, 0.3, 2.0})
    {
        auto J = model.jacobian(0.0, {h, 1.0, 0.0});
        const real_t d = 1e-8;
        const real_t fd = (model.thirdDerivative(h + d) - model.thirdDerivative(h - d)) / (2*d);
        assert(std::abs(J[6] - fd) <= 1e-5 * std::abs(fd));
        assert(J[1] == 1.0 && J[5] == 1.0);
        assert(J[0] == 0.0 && J[4] == 0.0 && J[8] == 0.0);
    }

    //--------------------------------------------------------------------------
    // Monotonic damping: larger ε gives a strictly smaller |RHS| near h = 0
    //--------------------------------------------------------------------------
    vec_real eps = {1e-10, 1e-8, 1e-6, 1e-4};
    for (real_t h : {0.0, 1e-9, 1e-7})
    {
        for (size_t i=0; i+1<eps.size(); ++i)
        {
            ProblemModel weak(k, eps[i]);
            ProblemModel strong(k, eps[i+1]);
            assert(std::abs(strong.thirdDerivative(h)) < std::abs(weak.thirdDerivative(h)));
        }
    }

    //--------------------------------------------------------------------------
    // ε = 0 reintroduces the singularity and is rejected, as is k <= 0
    //--------------------------------------------------------------------------
    thrown = false;
    try { ProblemModel singular(k, 0.0); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { ProblemModel negative(k, -1e-6); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { ProblemModel noCoefficient(0.0, 1e-6); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    //--------------------------------------------------------------------------
    // minDenominator picks the smallest |h² + h + ε|
    //--------------------------------------------------------------------------
    Y[0][3] = 0.0;
    assert(almost_equal(model.minDenominator(Y), 1e-6, 1e-18));

    std::cout << "test_problem_model passed." << std::endl;
    return 0;
}
