//==============================================================================
// test_config.cpp
// JSON configuration: defaults, parsing, validation, round trip, study grids.
//==============================================================================

#include "SimulationConfig.hpp"

#include <cassert>
#include <cstdio>

namespace
{
    bool rejects(const json& cfg)
    {
        try { SolverConfig config(cfg); }
        catch (const ConfigurationError&) { return true; }
        return false;
    }
}

int main()
{
    //--------------------------------------------------------------------------
    // Defaults
    //--------------------------------------------------------------------------
    SolverConfig defaults(json::object());
    assert(defaults.K == 0.01);
    assert(defaults.Eps == 1e-6);
    assert(defaults.L == 50.0);
    assert(defaults.N == 500);
    assert(defaults.Guess == GuessStrategy::Linear);
    assert(defaults.Boundary == BoundaryVariant::FarFieldCurvature);
    assert(defaults.BcTolerance == defaults.Tolerance);
    assert(almost_equal(defaults.singularityThreshold(), 0.5e-6, 1e-20));

    // The threshold follows Eps when it is not set explicitly
    SolverConfig coded;
    coded.Eps = 1e-10;
    assert(almost_equal(coded.singularityThreshold(), 0.5e-10, 1e-24));
    coded.SingularityThreshold = 1e-3;
    assert(coded.singularityThreshold() == 1e-3);
    assert(defaults.SchemeIRK == Scheme::IRK3);

    //--------------------------------------------------------------------------
    // Explicit values and derived defaults
    //--------------------------------------------------------------------------
    json cfg = {
        {"Eps", 1e-8},
        {"L", 500.0},
        {"N", 200},
        {"Guess", "shape-aware"},
        {"Tolerance", 1e-3},
        {"MaxNodes", 20000},
        {"BoundaryVariant", "initial-curvature"},
        {"SchemeIRK", 2},
        {"Verbose", true}
    };
    SolverConfig config(cfg);
    assert(config.Eps == 1e-8);
    assert(config.L == 500.0);
    assert(config.N == 200);
    assert(config.Guess == GuessStrategy::ShapeAware);
    assert(config.Tolerance == 1e-3);
    assert(config.BcTolerance == 1e-3);
    assert(config.MaxNodes == 20000);
    assert(config.Boundary == BoundaryVariant::InitialCurvature);
    assert(almost_equal(config.singularityThreshold(), 0.5e-8, 1e-22));
    assert(config.SchemeIRK == Scheme::IRK2);
    assert(config.Verbose);

    // toJson reproduces the same configuration
    SolverConfig copy(config.toJson());
    assert(copy.toJson() == config.toJson());

    //--------------------------------------------------------------------------
    // Validation
    //--------------------------------------------------------------------------
    assert(rejects({{"Eps", 0.0}}));
    assert(rejects({{"Eps", -1e-6}}));
    assert(rejects({{"L", 0.0}}));
    assert(rejects({{"K", -0.01}}));
    assert(rejects({{"Tolerance", 0.0}}));
    assert(rejects({{"N", 1}}));
    assert(rejects({{"N", 600}, {"MaxNodes", 500}}));
    assert(rejects({{"EvalPoints", 1}}));
    assert(rejects({{"Guess", "quadratic"}}));
    assert(rejects({{"BoundaryVariant", "h''(0)"}}));
    assert(rejects({{"SchemeIRK", 4}}));
    assert(rejects({{"ShootingFirstStep", 0.0}}));

    // Tiny but positive truncation lengths are valid
    SolverConfig tiny(json{{"L", 1e-9}});
    assert(tiny.L == 1e-9);

    //--------------------------------------------------------------------------
    // File loading
    //--------------------------------------------------------------------------
    bool thrown = false;
    try { SolverConfig::loadFromJson("does/not/exist.json"); }
    catch (const std::runtime_error&) { thrown = true; }
    assert(thrown);

    const std::string path = "test_config_tmp.json";
    {
        std::ofstream out(path);
        out << json{{"L", 5000.0}, {"N", 200}}.dump(4);
    }
    SolverConfig fromFile = SolverConfig::loadFromJson(path);
    assert(fromFile.L == 5000.0 && fromFile.N == 200);
    std::remove(path.c_str());

    //--------------------------------------------------------------------------
    // Study grids
    //--------------------------------------------------------------------------
    json studyCfg = {
        {"Solver", {{"Eps", 1e-7}}},
        {"LValues", json::array({50.0, 500.0, 5000.0})},
        {"NValues", json::array({200})}
    };
    StudyConfig study(studyCfg);
    assert(study.base.Eps == 1e-7);
    assert(study.LValues.size() == 3);
    assert(study.NValues.size() == 1 && study.NValues[0] == 200);
    assert((study.EpsValues == vec_real{1e-7}));
    assert(!study.WarmStart);
    assert(study.EvalGrid.empty());

    thrown = false;
    try { StudyConfig missing(json{{"LValues", json::array({50.0})}}); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { StudyConfig empty(json{{"LValues", json::array()}, {"NValues", json::array({200})}}); }
    catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    //--------------------------------------------------------------------------
    // Enum names
    //--------------------------------------------------------------------------
    assert(parseGuessStrategy(to_string(GuessStrategy::ShapeAware)) == GuessStrategy::ShapeAware);
    assert(parseBoundaryVariant(to_string(BoundaryVariant::FarFieldCurvature)) == BoundaryVariant::FarFieldCurvature);
    assert(to_string(SolveStatus::NodeBudgetExhausted) == "node-budget-exhausted");

    //--------------------------------------------------------------------------
    // Grid helpers
    //--------------------------------------------------------------------------
    vec_real lin = linspace(0.0, 1.0, 5);
    assert(lin.size() == 5 && lin[2] == 0.5 && lin.back() == 1.0);
    vec_real lg = logspace(1e-8, 50.0, 10);
    assert(almost_equal(lg.front(), 1e-8, 1e-20) && lg.back() == 50.0);
    for (size_t i=1; i<lg.size(); ++i) assert(lg[i] > lg[i-1]);
    assert(computeMaxNorm({1.0, -3.0, 2.0}) == 3.0);
    assert(!all_finite({1.0, std::nan("")}));

    std::cout << "test_config passed." << std::endl;
    return 0;
}
