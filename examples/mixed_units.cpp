#include "branch_eqs.hpp"
#include "branch_eqs/example_systems.hpp"

#include <iostream>

using namespace branch_eqs;

int
main() {
    auto system = examples::define_mixed_units_system();
    system->solve();
    system->print_branches(std::cout);

    std::cout << "\ny = " << magnitude_in(system->get("y"), units::cm) << " cm"
              << " = " << magnitude_in(system->get("y"), units::inch) << " in" << std::endl;
    std::cout << "t = " << magnitude_in(system->get("t"), units::s) << " s" << std::endl;

    // Free fall from 20 m; the negative time root is discarded
    auto fall = examples::define_free_fall_system();
    fall->solve();
    std::cout << "\nFree fall from " << magnitude_in(fall->get("h"), units::m) << " m:\n";
    std::cout << "  " << fall->description("t") << ": " << magnitude_in(fall->get("t"), units::s) << " s\n";
    std::cout << "  " << fall->description("v") << ": " << magnitude_in(fall->get("v"), units::km / units::hour)
              << " km/h" << std::endl;

    // Comparing incompatible quantities is a contradiction
    EquationSystem bad({ "x" });
    bad.add_equation("length", [&bad] { return std::vector<Expression>{ bad.get("x"), 5.0 * units::m }; })
      .add_equation("duration", [&bad] { return std::vector<Expression>{ bad.get("x"), 5.0 * units::s }; });
    try {
        bad.solve();
    } catch (const UnsolvableSystemError &e) {
        std::cout << "\nExpected failure: " << e.what() << std::endl;
    }
    return 0;
}
