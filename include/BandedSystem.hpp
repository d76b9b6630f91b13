#pragma once
/**
 * @file BandedSystem.hpp
 * @brief Banded linear system A·x = b solved by LAPACK (dgbtrf/dgbtrs).
 *
 * @details
 * The matrix is stored in LAPACK general-band column-major layout with
 * 2·kl + ku + 1 rows so that the LU factorization with partial pivoting
 * fits in place. Entry A(i,j) lives at ab[(kl + ku + i - j) + j·ldab].
 *
 * The factorization is kept after factorize() so several right-hand sides
 * (Newton step and backtracking trial steps) reuse it.
 */

#include "common.hpp"

/**
 * @class BandedSystem
 * @brief Square banded matrix with in-place LU and repeated solves.
 */
class BandedSystem
{
  private:
    lapack_int n;    ///< Matrix dimension.
    lapack_int kl;   ///< Sub-diagonals.
    lapack_int ku;   ///< Super-diagonals.
    lapack_int ldab; ///< Leading dimension of the band storage.
    vec_real ab;                  ///< Band storage (column-major).
    std::vector<lapack_int> ipiv; ///< Pivot indices of the LU factorization.
    bool factorized = false;

  public:
    /**
     * @brief Allocate a zero n x n matrix with kl sub- and ku super-diagonals.
     * @throws std::invalid_argument for n == 0.
     */
    BandedSystem(size_t n_, size_t kl_, size_t ku_);

    size_t size() const { return static_cast<size_t>(n); }

    /// Reset all entries to zero and drop the factorization.
    void clear();

    /**
     * @brief Accumulate v into A(i, j).
     * @throws std::out_of_range if (i, j) lies outside the band.
     */
    void add(size_t i, size_t j, real_t v);

    /// Read A(i, j); zero outside the band. Only valid before factorize().
    real_t get(size_t i, size_t j) const;

    /**
     * @brief LU-factorize in place.
     * @return false if the matrix is exactly singular (LAPACK info > 0).
     * @throws std::runtime_error for illegal arguments (info < 0).
     */
    bool factorize();

    /**
     * @brief Solve A·x = rhs with the stored factorization (rhs overwritten).
     * @throws std::runtime_error if not factorized or on LAPACK failure.
     */
    void solve(vec_real& rhs) const;
};
