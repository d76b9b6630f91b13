//==============================================================================
// test_boundary_conditions.cpp
// Residuals, Jacobians and row split of both boundary-condition variants.
//==============================================================================

#include "BoundaryConditions.hpp"

#include <cassert>

int main()
{
    const state_t ya{0.1, 0.8, 0.3};
    const state_t yb{40.0, 1.2, -0.05};

    //--------------------------------------------------------------------------
    // Far-field variant: r = (h(0), h'(0) - 1, h''(L))
    //--------------------------------------------------------------------------
    BoundaryConditions farField;
    assert(farField.getVariant() == BoundaryVariant::FarFieldCurvature);

    state_t r = farField.residual(ya, yb);
    assert(almost_equal(r[0], 0.1));
    assert(almost_equal(r[1], -0.2, 1e-14));
    assert(almost_equal(r[2], -0.05));
    assert(almost_equal(farField.residualNorm(ya, yb), 0.2, 1e-14));

    assert((farField.leftRows() == std::vector<size_t>{0, 1}));
    assert((farField.rightRows() == std::vector<size_t>{2}));

    auto JL = farField.jacobianLeft();
    auto JR = farField.jacobianRight();
    assert(JL[0] == 1.0 && JL[4] == 1.0 && JL[8] == 0.0);
    assert(JR[8] == 1.0 && JR[0] == 0.0 && JR[4] == 0.0);

    // Exact boundary data gives a zero residual
    assert(farField.residualNorm({0.0, 1.0, 0.7}, {50.0, 1.3, 0.0}) == 0.0);

    //--------------------------------------------------------------------------
    // Initial-curvature variant: r = (h(0), h'(0) - 1, h''(0))
    //--------------------------------------------------------------------------
    BoundaryConditions initial(BoundaryVariant::InitialCurvature);
    r = initial.residual(ya, yb);
    assert(almost_equal(r[2], 0.3));
    assert((initial.leftRows() == std::vector<size_t>{0, 1, 2}));
    assert(initial.rightRows().empty());

    JL = initial.jacobianLeft();
    JR = initial.jacobianRight();
    assert(JL[8] == 1.0);
    assert(std::all_of(JR.begin(), JR.end(), [](real_t v){ return v == 0.0; }));

    //--------------------------------------------------------------------------
    // Prescribed values and the shooting start state
    //--------------------------------------------------------------------------
    BoundaryConditions shifted(BoundaryVariant::FarFieldCurvature, 0.0, 2.0, 0.1);
    assert(shifted.prescribedCurvature() == 0.1);
    state_t start = shifted.leftState(0.25);
    assert(start[0] == 0.0 && start[1] == 2.0 && start[2] == 0.25);
    assert(shifted.residualNorm(start, {1.0, 1.0, 0.1}) == 0.0);

    std::cout << "test_boundary_conditions passed." << std::endl;
    return 0;
}
