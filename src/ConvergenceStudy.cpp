//==============================================================================
// ConvergenceStudy.cpp
// Sweep of the collocation solver over (L, N, ε) with ordered records,
// optional warm starts and optional OpenMP parallelism.
//==============================================================================

#include "ConvergenceStudy.hpp"

#include <exception>
#include <iterator>

json ConvergenceRecord::toJson() const
{
    json result;
    result["L"] = L;
    result["N"] = N;
    result["Eps"] = Eps;
    result["Tolerance"] = Tolerance;
    result["Guess"] = to_string(Guess);
    result["WarmStarted"] = WarmStarted;
    result["Converged"] = converged;
    result["Status"] = to_string(status);
    result["MaxResidual"] = maxResidual;
    result["MaxBcResidual"] = maxBcResidual;
    result["NodeCount"] = nodeCount;
    result["Refinements"] = refinements;
    result["SingularityWarning"] = singularityWarning;
    result["x"] = x;
    if (y.size() == NumStates)
    {
        result["h"] = y[0];
        result["dh"] = y[1];
        result["d2h"] = y[2];
    }
    return result;
}

ConvergenceStudy::ConvergenceStudy(const SolverConfig& base, bool warmStart, vec_real evalGrid)
{
    base.validate();
    study.base = base;
    study.EpsValues = {base.Eps};
    study.WarmStart = warmStart;
    study.EvalGrid = std::move(evalGrid);
}

ConvergenceStudy::ConvergenceStudy(StudyConfig studyIn)
    : study(std::move(studyIn))
{
    study.base.validate();
}

//------------------------------------------------------------------------------
// buildTasks
// Every configuration is validated up front so malformed sweeps fail before
// any solve. The singularity threshold follows ε when ε is swept.
//------------------------------------------------------------------------------
std::vector<ConvergenceStudy::Task> ConvergenceStudy::buildTasks(
    const vec_real& Ls, const std::vector<size_t>& Ns, const vec_real& Eps, real_t tol) const
{
    if (Ls.empty() || Ns.empty() || Eps.empty())
    {
        throw ConfigurationError("Sweep grids must not be empty");
    }
    if (!(tol > 0.0))
    {
        throw ConfigurationError("Tolerance must be positive");
    }

    std::vector<Task> tasks;
    tasks.reserve(Ls.size() * Ns.size() * Eps.size());

    for (real_t L : Ls)
    {
        for (size_t N : Ns)
        {
            for (real_t eps : Eps)
            {
                SolverConfig config = study.base;
                config.L = L;
                config.N = N;
                config.Eps = eps;
                config.Tolerance = tol;
                config.MaxNodes = std::max(config.MaxNodes, N);
                if (study.base.SingularityThreshold >= 0.0)
                {
                    config.SingularityThreshold = study.base.SingularityThreshold * (eps / study.base.Eps);
                }
                config.validate();

                tasks.push_back(Task{config});
            }
        }
    }

    return tasks;
}

vec_real ConvergenceStudy::evaluationGrid(const SolverConfig& config) const
{
    if (study.EvalGrid.empty())
    {
        return linspace(0.0, config.L, config.EvalPoints);
    }

    vec_real grid;
    std::copy_if(study.EvalGrid.begin(), study.EvalGrid.end(), std::back_inserter(grid),
                 [&config](real_t x){ return x >= 0.0 && x <= config.L; });
    return grid;
}

ConvergenceRecord ConvergenceStudy::solveTask(const Task& task, const Solution* warm) const
{
    const SolverConfig& config = task.config;
    CollocationSolver solver(config);

    vec_real mesh = InitialGuessBuilder::uniformMesh(config.L, config.N);
    mat_real guess = warm ? warm->sample(mesh)
                          : InitialGuessBuilder(config.Guess).build(mesh, config.L);

    ConvergenceRecord record;
    record.L = config.L;
    record.N = config.N;
    record.Eps = config.Eps;
    record.Tolerance = config.Tolerance;
    record.Guess = config.Guess;
    record.WarmStarted = (warm != nullptr);

    record.solution = solver.solve(mesh, guess, config.Tolerance, config.MaxNodes);

    record.converged = record.solution.converged;
    record.status = record.solution.status;
    record.maxResidual = record.solution.maxResidual;
    record.maxBcResidual = record.solution.maxBcResidual;
    record.nodeCount = record.solution.nodeCount();
    record.refinements = record.solution.refinements;
    record.singularityWarning = record.solution.singularityWarning;

    record.x = evaluationGrid(config);
    record.y = record.solution.sample(record.x);

    if (config.Verbose)
    {
        std::cout << "L = " << config.L << ", N = " << config.N << ", eps = " << config.Eps
                  << ": " << to_string(record.status) << std::endl;
    }

    return record;
}

//==============================================================================
// Cursor
//==============================================================================

ConvergenceStudy::Cursor::Cursor(std::shared_ptr<const ConvergenceStudy> owner_, std::vector<Task> tasks_)
    : owner(std::move(owner_)), tasks(std::move(tasks_))
{
}

bool ConvergenceStudy::Cursor::next(ConvergenceRecord& out)
{
    if (position >= tasks.size())
    {
        return false;
    }

    const Task& task = tasks[position];
    const Solution* warm = nullptr;

    if (owner->study.WarmStart)
    {
        auto it = previous.find(task.config.L);
        if (it != previous.end()) warm = &it->second;
    }

    out = owner->solveTask(task, warm);

    if (owner->study.WarmStart && out.converged)
    {
        previous[task.config.L] = out.solution;
    }

    ++position;
    return true;
}

void ConvergenceStudy::Cursor::reset()
{
    position = 0;
    previous.clear();
}

//==============================================================================
// Sweeps
//==============================================================================

ConvergenceStudy::Cursor ConvergenceStudy::sweep(
    const vec_real& Ls, const std::vector<size_t>& Ns, real_t tol) const
{
    return sweep(Ls, Ns, vec_real{study.base.Eps}, tol);
}

ConvergenceStudy::Cursor ConvergenceStudy::sweep(
    const vec_real& Ls, const std::vector<size_t>& Ns, const vec_real& Eps, real_t tol) const
{
    return Cursor(std::make_shared<const ConvergenceStudy>(*this), buildTasks(Ls, Ns, Eps, tol));
}

std::vector<ConvergenceRecord> ConvergenceStudy::run(
    const vec_real& Ls, const std::vector<size_t>& Ns, real_t tol) const
{
    return run(Ls, Ns, vec_real{study.base.Eps}, tol);
}

std::vector<ConvergenceRecord> ConvergenceStudy::run(
    const vec_real& Ls, const std::vector<size_t>& Ns, const vec_real& Eps, real_t tol) const
{
    #ifdef USE_OPENMP
    if (!study.WarmStart)
    {
        const std::vector<Task> tasks = buildTasks(Ls, Ns, Eps, tol);
        std::vector<ConvergenceRecord> records(tasks.size());
        std::exception_ptr failure = nullptr;

        // Independent solves; slot i always holds configuration i.
        #pragma omp parallel for schedule(dynamic)
        for (size_t i=0; i<tasks.size(); ++i)
        {
            try
            {
                records[i] = solveTask(tasks[i], nullptr);
            }
            catch (...)
            {
                #pragma omp critical
                {
                    if (!failure) failure = std::current_exception();
                }
            }
        }

        if (failure)
        {
            std::rethrow_exception(failure);
        }
        return records;
    }
    #endif

    Cursor cursor = sweep(Ls, Ns, Eps, tol);
    std::vector<ConvergenceRecord> records;
    records.reserve(cursor.size());

    ConvergenceRecord record;
    while (cursor.next(record))
    {
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<ConvergenceRecord> ConvergenceStudy::run() const
{
    return run(study.LValues, study.NValues, study.EpsValues, study.base.Tolerance);
}

//------------------------------------------------------------------------------
// maxRelativeDeviation
// The denominator is floored at 1e-12 so components passing through zero
// (h at x = 0, h'' far out) do not blow the ratio up.
//------------------------------------------------------------------------------
real_t ConvergenceStudy::maxRelativeDeviation(const Solution& a, const Solution& b, real_t xMax,
                                              size_t component, size_t samples)
{
    if (component >= NumStates)
    {
        throw ConfigurationError("Component index must be 0, 1 or 2");
    }
    if (!(xMax > 0.0) || samples < 2)
    {
        throw ConfigurationError("Comparison needs xMax > 0 and at least 2 samples");
    }
    if (xMax > a.length() || xMax > b.length())
    {
        throw std::out_of_range("Comparison interval exceeds a solution domain");
    }

    const vec_real grid = linspace(0.0, xMax, samples);
    real_t maxDev = 0.0;

    for (real_t x : grid)
    {
        const real_t va = a.evaluate(x)[component];
        const real_t vb = b.evaluate(x)[component];
        const real_t dev = std::abs(va - vb) / std::max(std::abs(vb), 1e-12);
        if (!std::isfinite(dev))
        {
            return std::numeric_limits<real_t>::infinity();
        }
        maxDev = std::max(maxDev, dev);
    }

    return maxDev;
}

void ConvergenceStudy::printSummary(const std::vector<ConvergenceRecord>& records, std::ostream& os)
{
    os << std::left
       << std::setw(12) << "L"
       << std::setw(8)  << "N"
       << std::setw(12) << "eps"
       << std::setw(24) << "status"
       << std::setw(14) << "max residual"
       << std::setw(14) << "max bc res."
       << std::setw(8)  << "nodes"
       << std::setw(8)  << "refine"
       << "warn" << std::endl;

    os << std::string(104, '-') << std::endl;

    for (const auto& r : records)
    {
        os << std::left
           << std::setw(12) << r.L
           << std::setw(8)  << r.N
           << std::setw(12) << r.Eps
           << std::setw(24) << to_string(r.status)
           << std::setw(14) << std::scientific << std::setprecision(3) << r.maxResidual
           << std::setw(14) << r.maxBcResidual
           << std::defaultfloat << std::setprecision(6)
           << std::setw(8)  << r.nodeCount
           << std::setw(8)  << r.refinements
           << (r.singularityWarning ? "yes" : "no") << std::endl;
    }
}
