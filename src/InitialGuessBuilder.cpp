//==============================================================================
// InitialGuessBuilder.cpp
// Starting data for the collocation solve: uniform meshes, the linear guess
// h = x and the cubic shape-aware guess h = x - (x/L)^3 whose curvature already
// trends to zero towards the far end.
//==============================================================================

#include "InitialGuessBuilder.hpp"

vec_real InitialGuessBuilder::uniformMesh(real_t L, size_t N)
{
    if (!(L > 0.0))
    {
        throw ConfigurationError("Truncation length L must be positive");
    }
    return linspace(0.0, L, N);
}

void InitialGuessBuilder::validateMesh(const vec_real& mesh)
{
    if (mesh.size() < 2)
    {
        throw ConfigurationError("Mesh needs at least 2 points");
    }
    for (size_t i=1; i<mesh.size(); ++i)
    {
        if (!(mesh[i] > mesh[i-1]))
        {
            throw ConfigurationError("Mesh must be strictly increasing (violated at index "
                                     + std::to_string(i) + ")");
        }
    }
}

mat_real InitialGuessBuilder::build(const vec_real& mesh, real_t L) const
{
    validateMesh(mesh);
    if (!(L > 0.0))
    {
        throw ConfigurationError("Truncation length L must be positive");
    }

    const size_t m = mesh.size();
    mat_real Y(NumStates, vec_real(m, 0.0));

    switch (strategy)
    {
        case GuessStrategy::Linear:
            for (size_t i=0; i<m; ++i)
            {
                Y[0][i] = mesh[i];
                Y[1][i] = 1.0;
                Y[2][i] = 0.0;
            }
            break;

        case GuessStrategy::ShapeAware:
            for (size_t i=0; i<m; ++i)
            {
                const real_t s = mesh[i] / L;
                Y[0][i] = mesh[i] - s*s*s;
            }
            Y[1] = gradient(Y[0], mesh);
            Y[2] = gradient(Y[1], mesh);
            break;
    }

    return Y;
}

//------------------------------------------------------------------------------
// gradient
// Interior: weighted central difference exact for quadratics on uneven
// spacing (hs = x_i - x_{i-1}, hd = x_{i+1} - x_i):
//   f'_i ≈ (hs² f_{i+1} + (hd² - hs²) f_i - hd² f_{i-1}) / (hs hd (hs + hd))
// Ends: forward/backward differences.
//------------------------------------------------------------------------------
vec_real InitialGuessBuilder::gradient(const vec_real& f, const vec_real& x)
{
    if (f.size() != x.size())
    {
        throw ConfigurationError("gradient: sample and mesh sizes differ");
    }
    validateMesh(x);

    const size_t m = x.size();
    vec_real df(m);

    df[0]   = (f[1] - f[0]) / (x[1] - x[0]);
    df[m-1] = (f[m-1] - f[m-2]) / (x[m-1] - x[m-2]);

    for (size_t i=1; i+1<m; ++i)
    {
        const real_t hs = x[i] - x[i-1];
        const real_t hd = x[i+1] - x[i];
        df[i] = (hs*hs*f[i+1] + (hd*hd - hs*hs)*f[i] - hd*hd*f[i-1]) / (hs*hd*(hs + hd));
    }

    return df;
}
