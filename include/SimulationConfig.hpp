#pragma once
/**
 * @file SimulationConfig.hpp
 * @brief Lightweight data structures for loading and organizing solver parameters.
 *
 * @details
 * - **SolverConfig**: POD-style container that initializes itself from a JSON object
 *   (or file) and exposes every parameter of a single boundary value solve
 *   (ODE coefficient, regularization, truncation, mesh, guess, tolerances, budgets).
 * - **StudyConfig**: a base SolverConfig plus the grids swept by the
 *   ConvergenceStudy (truncation lengths, mesh densities, regularizations).
 */

#include "common.hpp"

/**
 * @struct SolverConfig
 * @brief Single-solve configuration (one L, one N, one ε, ...).
 *
 * @section fields Key Fields
 * - `K`           : ODE coefficient in h''' = -K / (h² + h + ε).
 * - `Eps`         : Regularization ε > 0 of the singular denominator.
 * - `L`, `N`      : Truncation length and initial mesh size.
 * - `Guess`       : Initial guess strategy (linear / shape-aware).
 * - `Tolerance`   : Residual tolerance of the collocation solve.
 * - `BcTolerance` : Tolerance on the boundary residuals.
 * - `MaxNodes`    : Mesh size budget.
 * - `MaxNewtonIterations` / `MaxRefinements` : Iteration caps.
 * - `Boundary`    : Placement of the third boundary condition.
 * - `SingularityThreshold` : Diagnostic threshold on min |h² + h + ε|;
 *   negative means Eps / 2 (see singularityThreshold()).
 * - `FarFieldCheck` / `FarFieldMinThickness` : Truncation admissibility test.
 * - `EvalPoints`  : Default evaluation grid size for sampled output.
 * - Shooting: `ShootingSteps`, `ShootingFirstStep`, `SchemeIRK`,
 *   `PrecisionIRK`, `MaxIterIRK`, `MaxIterShooting`, `EpsShooting`.
 */
struct SolverConfig
{
    real_t K = 0.01;
    real_t Eps = 1e-6;
    real_t L = 50.0;
    size_t N = 500;
    GuessStrategy Guess = GuessStrategy::Linear;
    real_t Tolerance = 1e-4;
    real_t BcTolerance = 1e-4;
    size_t MaxNodes = 10000;
    int    MaxNewtonIterations = 8;
    int    MaxRefinements = 100;
    BoundaryVariant Boundary = BoundaryVariant::FarFieldCurvature;
    real_t SingularityThreshold = -1.0;
    bool   FarFieldCheck = true;
    real_t FarFieldMinThickness = 1.0;
    size_t EvalPoints = 1000;
    bool   Verbose = false;

    size_t ShootingSteps = 2000;
    real_t ShootingFirstStep = 1e-8;
    Scheme SchemeIRK = Scheme::IRK3;
    real_t PrecisionIRK = 1e-12;
    int    MaxIterIRK = 20;
    int    MaxIterShooting = 30;
    real_t EpsShooting = 1e-7;

    SolverConfig() = default;

    /// Effective threshold; follows Eps unless set explicitly.
    real_t singularityThreshold() const
    {
        return SingularityThreshold < 0.0 ? 0.5 * Eps : SingularityThreshold;
    }

    /**
     * @brief Construct from a JSON object; absent keys keep their defaults.
     *
     * `BcTolerance` falls back to `Tolerance` and `SingularityThreshold` to
     * `Eps / 2` when not given.
     *
     * @throws ConfigurationError on unknown enum names or invalid values.
     */
    explicit SolverConfig(const json& cfg)
    {
        K = cfg.value("K", K);
        Eps = cfg.value("Eps", Eps);
        L = cfg.value("L", L);
        N = cfg.value("N", N);
        Guess = parseGuessStrategy(cfg.value("Guess", to_string(Guess)));
        Tolerance = cfg.value("Tolerance", Tolerance);
        BcTolerance = cfg.value("BcTolerance", Tolerance);
        MaxNodes = cfg.value("MaxNodes", MaxNodes);
        MaxNewtonIterations = cfg.value("MaxNewtonIterations", MaxNewtonIterations);
        MaxRefinements = cfg.value("MaxRefinements", MaxRefinements);
        Boundary = parseBoundaryVariant(cfg.value("BoundaryVariant", to_string(Boundary)));
        SingularityThreshold = cfg.value("SingularityThreshold", SingularityThreshold);
        FarFieldCheck = cfg.value("FarFieldCheck", FarFieldCheck);
        FarFieldMinThickness = cfg.value("FarFieldMinThickness", FarFieldMinThickness);
        EvalPoints = cfg.value("EvalPoints", EvalPoints);
        Verbose = cfg.value("Verbose", Verbose);

        ShootingSteps = cfg.value("ShootingSteps", ShootingSteps);
        ShootingFirstStep = cfg.value("ShootingFirstStep", ShootingFirstStep);
        SchemeIRK = parseScheme(cfg.value("SchemeIRK", 3));
        PrecisionIRK = cfg.value("PrecisionIRK", PrecisionIRK);
        MaxIterIRK = cfg.value("MaxIterIRK", MaxIterIRK);
        MaxIterShooting = cfg.value("MaxIterShooting", MaxIterShooting);
        EpsShooting = cfg.value("EpsShooting", EpsShooting);

        validate();
    }

    /**
     * @brief Load configuration from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static SolverConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        json j;
        inFile >> j;

        return SolverConfig(j);
    }

    /**
     * @brief Reject malformed parameters before any solve attempt.
     * @throws ConfigurationError naming the offending field.
     */
    void validate() const
    {
        if (!(K > 0.0))         throw ConfigurationError("K must be positive");
        if (!(Eps > 0.0))       throw ConfigurationError("Eps must be strictly positive (Eps = 0 reintroduces the singularity at h = 0)");
        if (!(L > 0.0))         throw ConfigurationError("Truncation length L must be positive");
        if (!(Tolerance > 0.0)) throw ConfigurationError("Tolerance must be positive");
        if (!(BcTolerance > 0.0)) throw ConfigurationError("BcTolerance must be positive");
        if (N < 2)              throw ConfigurationError("Initial mesh needs at least 2 points");
        if (MaxNodes < N)       throw ConfigurationError("MaxNodes must not be smaller than the initial mesh");
        if (MaxNewtonIterations < 1) throw ConfigurationError("MaxNewtonIterations must be at least 1");
        if (MaxRefinements < 1) throw ConfigurationError("MaxRefinements must be at least 1");
        if (EvalPoints < 2)     throw ConfigurationError("EvalPoints must be at least 2");
        if (ShootingSteps < 3)  throw ConfigurationError("ShootingSteps must be at least 3");
        if (!(ShootingFirstStep > 0.0) || !(PrecisionIRK > 0.0) ||
            MaxIterIRK < 1 || MaxIterShooting < 1 || !(EpsShooting > 0.0))
        {
            throw ConfigurationError("Invalid shooting parameters");
        }
    }

    /// Serialize to the same key layout accepted by the JSON constructor.
    json toJson() const
    {
        json j;
        j["K"] = K;
        j["Eps"] = Eps;
        j["L"] = L;
        j["N"] = N;
        j["Guess"] = to_string(Guess);
        j["Tolerance"] = Tolerance;
        j["BcTolerance"] = BcTolerance;
        j["MaxNodes"] = MaxNodes;
        j["MaxNewtonIterations"] = MaxNewtonIterations;
        j["MaxRefinements"] = MaxRefinements;
        j["BoundaryVariant"] = to_string(Boundary);
        j["SingularityThreshold"] = SingularityThreshold;
        j["FarFieldCheck"] = FarFieldCheck;
        j["FarFieldMinThickness"] = FarFieldMinThickness;
        j["EvalPoints"] = EvalPoints;
        j["Verbose"] = Verbose;
        j["ShootingSteps"] = ShootingSteps;
        j["ShootingFirstStep"] = ShootingFirstStep;
        j["SchemeIRK"] = static_cast<int>(SchemeIRK) + 1;
        j["PrecisionIRK"] = PrecisionIRK;
        j["MaxIterIRK"] = MaxIterIRK;
        j["MaxIterShooting"] = MaxIterShooting;
        j["EpsShooting"] = EpsShooting;
        return j;
    }

    /// Print a human-readable configuration summary to stdout.
    void print_config() const
    {
        std::cout << "Solver configuration:" << std::endl;
        std::cout << "K: " << K << std::endl;
        std::cout << "Eps: " << Eps << std::endl;
        std::cout << "L: " << L << std::endl;
        std::cout << "N: " << N << std::endl;
        std::cout << "Guess: " << to_string(Guess) << std::endl;
        std::cout << "Tolerance: " << Tolerance << std::endl;
        std::cout << "BcTolerance: " << BcTolerance << std::endl;
        std::cout << "MaxNodes: " << MaxNodes << std::endl;
        std::cout << "MaxNewtonIterations: " << MaxNewtonIterations << std::endl;
        std::cout << "MaxRefinements: " << MaxRefinements << std::endl;
        std::cout << "BoundaryVariant: " << to_string(Boundary) << std::endl;
        std::cout << "SingularityThreshold: " << singularityThreshold() << std::endl;
        std::cout << "FarFieldCheck: " << FarFieldCheck << std::endl;
        std::cout << "FarFieldMinThickness: " << FarFieldMinThickness << std::endl;
        std::cout << "EvalPoints: " << EvalPoints << std::endl;
        std::cout << "SchemeIRK: " << int(SchemeIRK)+1 << std::endl;
    }
};

/**
 * @struct StudyConfig
 * @brief Sweep definition for the ConvergenceStudy.
 *
 * Typical JSON format:
 * ```
 * {
 *   "Solver":    { ... single SolverConfig JSON ... },
 *   "LValues":   [50, 500, 5000],
 *   "NValues":   [200],
 *   "EpsValues": [1e-6],          (optional, defaults to [Solver.Eps])
 *   "WarmStart": false,           (optional)
 *   "EvalGrid":  [0, 0.5, ...]    (optional fixed evaluation grid)
 * }
 * ```
 */
struct StudyConfig
{
    SolverConfig base;
    vec_real LValues;
    std::vector<size_t> NValues;
    vec_real EpsValues;
    bool WarmStart = false;
    vec_real EvalGrid;

    StudyConfig() = default;

    /**
     * @brief Construct from a JSON object.
     * @throws ConfigurationError if the L or N grids are missing or empty.
     */
    explicit StudyConfig(const json& cfg)
    {
        base = cfg.contains("Solver") ? SolverConfig(cfg["Solver"]) : SolverConfig();

        if (!cfg.contains("LValues") || !cfg.contains("NValues"))
        {
            throw ConfigurationError("Study configuration needs 'LValues' and 'NValues'");
        }
        LValues = cfg["LValues"].get<vec_real>();
        NValues = cfg["NValues"].get<std::vector<size_t>>();

        if (cfg.contains("EpsValues") && !cfg["EpsValues"].is_null())
        {
            EpsValues = cfg["EpsValues"].get<vec_real>();
        }
        else
        {
            EpsValues = {base.Eps};
        }

        WarmStart = cfg.value("WarmStart", false);

        if (cfg.contains("EvalGrid") && !cfg["EvalGrid"].is_null())
        {
            EvalGrid = cfg["EvalGrid"].get<vec_real>();
        }

        if (LValues.empty() || NValues.empty() || EpsValues.empty())
        {
            throw ConfigurationError("Study grids must not be empty");
        }
    }

    /**
     * @brief Load a study definition from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static StudyConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open study file: " + filename);
        }

        json j;
        inFile >> j;

        return StudyConfig(j);
    }
};
