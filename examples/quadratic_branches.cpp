#include "branch_eqs.hpp"
#include "branch_eqs/example_systems.hpp"

#include <iostream>
#include <vector>

using namespace branch_eqs;

int
main() {
    // x^2 = 4 and y^2 = 16: every sign combination is a branch
    auto system = examples::define_two_quadratics_system();
    system->solve();

    std::cout << "Found " << system->branch_count() << " branches:\n";
    system->print_branches(std::cout);

    std::cout << "\nDistinct x values:";
    for (double value : system->numeric_values_across_branches("x")) { std::cout << " " << value; }
    std::cout << "\nDistinct y values:";
    for (double value : system->numeric_values_across_branches("y")) { std::cout << " " << value; }
    std::cout << std::endl;

    // The same system, declared inline, with a condition that keeps the positive root only
    EquationSystem positive({ "x" });
    positive.add_equation("square", [&positive] { return std::vector<Expression>{ pow(positive.get("x"), 2), 4.0 }; })
      .add_procedure("positive_root", [&positive] {
          if (solved({ positive.get("x") }) && to_double(positive.get("x")) < 0.0) { positive.delete_current_branch(); }
      });
    positive.solve();

    std::cout << "\nWith the positive-root procedure:\n";
    positive.print_branches(std::cout);
    return 0;
}
