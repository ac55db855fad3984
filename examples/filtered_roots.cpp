#include "branch_eqs.hpp"
#include "branch_eqs/example_systems.hpp"

#include <iostream>

using namespace branch_eqs;

int
main() {
    SolverOptions options;
    options.verbose = true;

    std::cout << "--- Linear system ---" << std::endl;
    auto linear = examples::define_linear_three_variable_system(options);
    linear->solve();
    linear->print_branches(std::cout);

    std::cout << "\n--- x^2 = 4, keep x >= 0, y = 3x ---" << std::endl;
    auto filtered = examples::define_negative_root_filter_system(options);
    filtered->solve();
    filtered->print_branches(std::cout);

    std::cout << "\n--- Parallel lines ---" << std::endl;
    auto parallel = examples::define_parallel_lines_system();
    try {
        parallel->solve();
    } catch (const UnsolvableSystemError &e) {
        std::cout << "Unsolvable: " << e.what() << std::endl;
    }
    return 0;
}
