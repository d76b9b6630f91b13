//==============================================================================
// BandedSystem.cpp
// Thin wrapper over LAPACKE_dgbtrf / LAPACKE_dgbtrs in column-major band
// storage. Used for the global Newton system of the collocation solver.
//==============================================================================

#include "BandedSystem.hpp"

BandedSystem::BandedSystem(size_t n_, size_t kl_, size_t ku_)
    : n(static_cast<lapack_int>(n_)), kl(static_cast<lapack_int>(kl_)), ku(static_cast<lapack_int>(ku_)),
      ldab(static_cast<lapack_int>(2*kl_ + ku_ + 1))
{
    if (n_ == 0)
    {
        throw std::invalid_argument("BandedSystem requires a positive dimension");
    }
    ab.assign(static_cast<size_t>(ldab) * n_, 0.0);
    ipiv.assign(n_, 0);
}

void BandedSystem::clear()
{
    std::fill(ab.begin(), ab.end(), 0.0);
    factorized = false;
}

void BandedSystem::add(size_t i, size_t j, real_t v)
{
    const lapack_int ii = static_cast<lapack_int>(i);
    const lapack_int jj = static_cast<lapack_int>(j);
    if (ii >= n || jj >= n || ii - jj > kl || jj - ii > ku)
    {
        throw std::out_of_range("BandedSystem::add outside band at (" + std::to_string(i)
                                + ", " + std::to_string(j) + ")");
    }
    ab[static_cast<size_t>(kl + ku + ii - jj) + j * static_cast<size_t>(ldab)] += v;
}

real_t BandedSystem::get(size_t i, size_t j) const
{
    const lapack_int ii = static_cast<lapack_int>(i);
    const lapack_int jj = static_cast<lapack_int>(j);
    if (ii >= n || jj >= n || ii - jj > kl || jj - ii > ku)
    {
        return 0.0;
    }
    return ab[static_cast<size_t>(kl + ku + ii - jj) + j * static_cast<size_t>(ldab)];
}

bool BandedSystem::factorize()
{
    lapack_int info = LAPACKE_dgbtrf(LAPACK_COL_MAJOR, n, n, kl, ku, ab.data(), ldab, ipiv.data());

    // info < 0: i-th argument had an illegal value
    // info > 0: U(i,i) == 0, the matrix is singular
    if (info < 0)
    {
        throw std::runtime_error("LAPACKE_dgbtrf failed with info = " + std::to_string(info));
    }
    factorized = (info == 0);

    return factorized;
}

void BandedSystem::solve(vec_real& rhs) const
{
    if (!factorized)
    {
        throw std::runtime_error("BandedSystem::solve called without a valid factorization");
    }
    if (rhs.size() != static_cast<size_t>(n))
    {
        throw std::invalid_argument("BandedSystem::solve: right-hand side has wrong size");
    }

    lapack_int info = LAPACKE_dgbtrs(LAPACK_COL_MAJOR, 'N', n, kl, ku, 1, ab.data(), ldab,
                                     ipiv.data(), rhs.data(), n);
    if (info != 0)
    {
        throw std::runtime_error("LAPACKE_dgbtrs failed with info = " + std::to_string(info));
    }
}
