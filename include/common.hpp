#pragma once
/**
 * @file common.hpp
 * @brief Common type aliases, enums, utility functions, and third-party
 *        includes for the thin-film boundary value solver.
 *
 * @details
 * This header centralizes:
 *  - Standard library and third-party includes.
 *  - Type aliases for reals, vectors and matrices.
 *  - Enumerations shared between configuration and solvers, with
 *    string conversions used by the JSON configuration layer.
 *  - The ConfigurationError exception type.
 *  - Shared numerical utility functions (approximate equality, grids,
 *    norms).
 *
 * State arrays follow one convention throughout the project: a `mat_real`
 * with three rows (h, h', h'') and one column per mesh point.
 */

// ========== Standard Library ==========
#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>
#include <array>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <functional>
#include <memory>
#include <limits>
#include <string>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <chrono>

// ========== Third-Party Libraries ==========
#include <nlohmann/json.hpp> ///< JSON for Modern C++

// ========== LAPACK ==========
#include <lapacke.h>        ///< LAPACK C interface

// ========== Parallelism ==========
#ifdef USE_OPENMP
#include <omp.h>            ///< OpenMP parallelism
#endif

// ========== ENUM CLASSES ==========
/**
 * @enum Scheme
 * @brief Available implicit Runge–Kutta integration schemes.
 */
enum class Scheme { IRK1, IRK2, IRK3 };

/**
 * @enum GuessStrategy
 * @brief Initial guess families for the collocation solve.
 */
enum class GuessStrategy { Linear, ShapeAware };

/**
 * @enum BoundaryVariant
 * @brief Placement of the third boundary condition.
 *
 * - FarFieldCurvature : h''(L) = 0 (truncated decay condition).
 * - InitialCurvature  : h''(0) = 0 (initial-value / shooting variant).
 */
enum class BoundaryVariant { FarFieldCurvature, InitialCurvature };

/**
 * @enum SolveStatus
 * @brief Terminal state of a single solve.
 */
enum class SolveStatus
{
    Converged,
    NodeBudgetExhausted,
    IterationCapReached,
    SingularJacobian,
    Diverged,
    TruncationInadmissible
};

// ========== Aliases ===============
using real_t   = double;                            ///< Floating point type used globally.
using vec_real = std::vector<real_t>;               ///< Vector of real values.
using mat_real = std::vector<std::vector<real_t>>;  ///< Matrix of real values.
using state_t  = std::array<real_t, 3>;             ///< Pointwise state (h, h', h'').
using json     = nlohmann::json;                    ///< JSON type alias.

/// Number of components of the first-order system.
constexpr size_t NumStates = 3;

// ========== Exceptions ============
/**
 * @class ConfigurationError
 * @brief Malformed solver input detected before any numerical work starts.
 */
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// ============ Enum conversions =======

std::string to_string(GuessStrategy strategy);
std::string to_string(BoundaryVariant variant);
std::string to_string(SolveStatus status);

/**
 * @brief Parse a guess strategy name ("linear" or "shape-aware").
 * @throws ConfigurationError for unknown names.
 */
GuessStrategy parseGuessStrategy(const std::string& name);

/**
 * @brief Parse a boundary variant name ("far-field-curvature" or
 *        "initial-curvature").
 * @throws ConfigurationError for unknown names.
 */
BoundaryVariant parseBoundaryVariant(const std::string& name);

/**
 * @brief Map the integer stage count 1..3 to an IRK scheme.
 * @throws ConfigurationError for other values.
 */
Scheme parseScheme(int stages);

// ============ Common Functions =======

/**
 * @brief Check approximate equality of two real numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if |a-b| < tol.
 */
bool almost_equal(double a, double b, double tol = 1e-15);

/**
 * @brief Uniformly spaced grid of n points on [a, b], both ends included.
 * @throws ConfigurationError if n < 2 or b <= a.
 */
vec_real linspace(real_t a, real_t b, size_t n);

/**
 * @brief Logarithmically spaced grid of n points on [a, b], 0 < a < b.
 * @throws ConfigurationError for invalid bounds or n < 2.
 */
vec_real logspace(real_t a, real_t b, size_t n);

/**
 * @brief Root-mean-square norm sqrt(Σ vᵢ² / n).
 */
real_t computeL2Norm(const vec_real& vc);

/**
 * @brief Maximum absolute entry.
 */
real_t computeMaxNorm(const vec_real& vc);

/**
 * @brief True if every entry of the vector is finite.
 */
bool all_finite(const vec_real& vc);
