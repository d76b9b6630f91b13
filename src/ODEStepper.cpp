//==============================================================================
// ODEStepper.cpp
// Implicit Runge–Kutta (Gauss–Legendre) stepper for the first-order form of
// h''' = -k/(h² + h + ε). Supports IRK1/IRK2/IRK3 collocation.
// Responsibilities:
//   • Hold Butcher tableau (a,b,c) for chosen IRK scheme.
//   • Do one IRK step with a Newton iteration on the stage increments.
//==============================================================================

#include "ODEStepper.hpp"

//------------------------------------------------------------------------------
// Ctor: choose IRK scheme and build its Butcher tableau.
//  - IRK1: 1-stage Gauss (midpoint)
//  - IRK2: 2-stage Gauss (order 4)
//  - IRK3: 3-stage Gauss (order 6)
//------------------------------------------------------------------------------
ODEStepper::ODEStepper(real_t precision_, Scheme method_, const ProblemModel& model_)
    : precision(precision_), scheme(method_), model(model_)
{
    size_t stage {};

    switch (scheme)
    {
        case Scheme::IRK1:
            stage = 1;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=1
            a[0][0] = 0.5;
            b[0]    = 1.0;
            c[0]    = 0.5;
            break;

        case Scheme::IRK2:
            stage = 2;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=2
            a[0][0] = 0.25;
            a[0][1] = 0.25 - 0.5 / std::sqrt(3.0);
            a[1][0] = 0.25 + 0.5 / std::sqrt(3.0);
            a[1][1] = 0.25;
            b[0] = b[1] = 0.5;
            c[0] = 0.5 - 0.5 / std::sqrt(3.0);
            c[1] = 0.5 + 0.5 / std::sqrt(3.0);
            break;

        case Scheme::IRK3:
            stage = 3;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=3
            a[0][0] = 5.0 / 36.0;
            a[0][1] = 2.0 / 9.0 - 1.0 / std::sqrt(15.0);
            a[0][2] = 5.0 / 36.0 - 0.5 / std::sqrt(15.0);
            a[1][0] = 5.0 / 36.0 + std::sqrt(15.0) / 24.0;
            a[1][1] = 2.0 / 9.0;
            a[1][2] = 5.0 / 36.0 - std::sqrt(15.0) / 24.0;
            a[2][0] = 5.0 / 36.0 + 0.5 / std::sqrt(15.0);
            a[2][1] = 2.0 / 9.0 + 1.0 / std::sqrt(15.0);
            a[2][2] = 5.0 / 36.0;
            b[0] = b[2] = 5.0 / 18.0;
            b[1]        = 4.0 / 9.0;
            c[0] = 0.5 - std::sqrt(15.0) / 10.0;
            c[1] = 0.5;
            c[2] = 0.5 + std::sqrt(15.0) / 10.0;
            break;
    }
}

//------------------------------------------------------------------------------
// integrate
// Single-step integration Yin@Xin → Yout@Xout using selected IRK scheme.
//------------------------------------------------------------------------------
void ODEStepper::integrate(const state_t& Yin, state_t& Yout,
                           real_t Xin, real_t Xout,
                           bool& converged, int& itsReached,
                           int maxIts) const
{
    stepIRK(Yin, Yout, Xin, Xout, itsReached, converged, maxIts);
}

//------------------------------------------------------------------------------
// stepIRK
// Perform one implicit Gauss–Legendre step with `stage = b.size()` collocation
// points. Newton iteration on the stacked increments Z (3·stage unknowns):
//   G_i = Z_i - dx Σ_k a_ik f(y + Z_k)
//   ∂G_i/∂Z_k = δ_ik I - dx a_ik J(y + Z_k)
// The update norm (RMS) is compared with `precision` scaled by (1 + |y|).
// After convergence: y_out = y + dx Σ_i b_i f(y + Z_i).
//------------------------------------------------------------------------------
void ODEStepper::stepIRK(const state_t& Yin, state_t& Yout,
                         real_t Xin, real_t Xout, int& itsReached,
                         bool& converged, int maxIts) const
{
    const real_t dx = Xout - Xin;
    const size_t stage = b.size();
    const size_t dim = NumStates * stage;

    vec_real x(stage);                        // stage abscissae
    vec_real Z(dim, 0.0);                     // stage increments
    std::vector<state_t> f(stage);            // RHS at each stage
    std::vector<std::array<real_t, 9>> J(stage);

    itsReached = 0;
    converged = false;

    const real_t scale = 1.0 + std::max({std::abs(Yin[0]), std::abs(Yin[1]), std::abs(Yin[2])});

    for (size_t i=0; i<stage; ++i)
    {
        x[i] = Xin + dx*c[i];
    }

    for (int its=0; its<maxIts; ++its)
    {
        ++itsReached;

        // Stage states, RHS and Jacobians at the current increments
        for (size_t i=0; i<stage; ++i)
        {
            state_t Yi{Yin[0] + Z[3*i], Yin[1] + Z[3*i+1], Yin[2] + Z[3*i+2]};
            f[i] = model.rhs(x[i], Yi);
            J[i] = model.jacobian(x[i], Yi);
        }

        // Residual G and Newton matrix (row-major)
        vec_real G(dim), A(dim*dim, 0.0);
        for (size_t i=0; i<stage; ++i)
        {
            for (size_t p=0; p<NumStates; ++p)
            {
                real_t tmp = Z[3*i+p];
                for (size_t k=0; k<stage; ++k)
                {
                    tmp -= dx * a[i][k] * f[k][p];
                }
                G[3*i+p] = -tmp;

                for (size_t k=0; k<stage; ++k)
                {
                    for (size_t q=0; q<NumStates; ++q)
                    {
                        real_t entry = -dx * a[i][k] * J[k][3*p+q];
                        if (i == k && p == q) entry += 1.0;
                        A[(3*i+p)*dim + 3*k+q] = entry;
                    }
                }
            }
        }

        if (!all_finite(G) || !all_finite(A))
        {
            break;
        }

        std::vector<lapack_int> ipiv(dim);
        lapack_int info = LAPACKE_dgesv(LAPACK_ROW_MAJOR, static_cast<lapack_int>(dim), 1, A.data(),
                                        static_cast<lapack_int>(dim), ipiv.data(), G.data(), 1);
        if (info < 0)
        {
            throw std::runtime_error("LAPACKE_dgesv failed with info = " + std::to_string(info));
        }
        if (info > 0)
        {
            break;
        }

        for (size_t j=0; j<dim; ++j)
        {
            Z[j] += G[j];
        }

        if (computeL2Norm(G) < precision * scale)
        {
            converged = true;
            break;
        }
    }

    // Final combination: y^{n+1} = y + dx * Σ_i b_i f_i
    for (size_t i=0; i<stage; ++i)
    {
        state_t Yi{Yin[0] + Z[3*i], Yin[1] + Z[3*i+1], Yin[2] + Z[3*i+2]};
        f[i] = model.rhs(x[i], Yi);
    }

    Yout = Yin;
    for (size_t i=0; i<stage; ++i)
    {
        for (size_t p=0; p<NumStates; ++p)
        {
            Yout[p] += dx * b[i] * f[i][p];
        }
    }

    if (!std::isfinite(Yout[0]) || !std::isfinite(Yout[1]) || !std::isfinite(Yout[2]))
    {
        converged = false;
    }
}
