#include "branch_eqs/example_systems.hpp"
#include "rational_function_operators.hpp"
#include "units.hpp"
#include "variable_operators.hpp"

namespace branch_eqs {
namespace examples {

std::unique_ptr<EquationSystem>
define_linear_three_variable_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(std::vector<std::string>{ "x", "y", "z" }, options);
    EquationSystem &s = *system;

    s.add_equation("sum", [&s] { return std::vector<Expression>{ s.get("x"), s.get("y") + s.get("z") }; })
      .add_equation("weighted", [&s] { return std::vector<Expression>{ 5.0 * s.get("x") + s.get("z"), -s.get("y") }; })
      .add_equation("offset",
                    [&s] { return std::vector<Expression>{ s.get("x") + s.get("y"), s.get("z") / 4.0 + 10.0 }; });

    return system;
}

std::unique_ptr<EquationSystem>
define_two_quadratics_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(std::vector<std::string>{ "x", "y" }, options);
    EquationSystem &s = *system;

    s.add_equation("x_squared", [&s] { return std::vector<Expression>{ pow(s.get("x"), 2), 4.0 }; })
      .add_equation("y_squared", [&s] { return std::vector<Expression>{ pow(s.get("y"), 2), 16.0 }; });

    return system;
}

std::unique_ptr<EquationSystem>
define_parallel_lines_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(std::vector<std::string>{ "x", "y" }, options);
    EquationSystem &s = *system;

    s.add_equation("first_line", [&s] { return std::vector<Expression>{ s.get("x") + s.get("y"), 1.0 }; })
      .add_equation("second_line", [&s] { return std::vector<Expression>{ s.get("x") + s.get("y"), 2.0 }; });

    return system;
}

std::unique_ptr<EquationSystem>
define_negative_root_filter_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(
      std::vector<std::string>{ "x", "y" }, std::map<std::string, std::string>{ { "y", "three times x" } }, options);
    EquationSystem &s = *system;

    s.add_equation("x_squared", [&s] { return std::vector<Expression>{ pow(s.get("x"), 2), 4.0 }; })
      .add_procedure("discard_negative_x",
                     [&s] {
                         if (solved({ s.get("x") }) && to_double(s.get("x")) < 0.0) { s.delete_current_branch(); }
                     })
      .add_procedure("triple_x", [&s] {
          // Throws UnresolvedValueError while x is unknown; the procedure is retried later
          s.set("y", 3.0 * to_double(s.get("x")));
      });

    return system;
}

std::unique_ptr<EquationSystem>
define_mixed_units_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(std::vector<std::string>{ "x", "y", "t" }, options);
    EquationSystem &s = *system;

    s.add_equation("x_value", [&s] { return std::vector<Expression>{ s.get("x"), 5.0 }; })
      .add_equation("length", [&s] { return std::vector<Expression>{ s.get("y"), 10.0 * units::cm * s.get("x") }; })
      .add_equation("travel_time", [&s] {
          return std::vector<Expression>{ s.get("t"), s.get("y") / (2.0 * units::m / units::s) };
      });

    return system;
}

std::unique_ptr<EquationSystem>
define_free_fall_system(SolverOptions options) {
    auto system = std::make_unique<EquationSystem>(
      std::vector<std::string>{ "h", "t", "v" },
      std::map<std::string, std::string>{ { "h", "drop height" }, { "t", "fall time" }, { "v", "impact speed" } },
      options);
    EquationSystem &s = *system;

    s.add_equation("height", [&s] { return std::vector<Expression>{ s.get("h"), 20.0 * units::m }; })
      .add_equation("distance",
                    [&s] {
                        return std::vector<Expression>{ s.get("h"),
                                                        units::standard_gravity * pow(s.get("t"), 2) / 2.0 };
                    })
      .add_equation("speed", [&s] { return std::vector<Expression>{ s.get("v"), units::standard_gravity * s.get("t") }; })
      .add_procedure("discard_negative_time", [&s] {
          if (solved({ s.get("t") }) && magnitude_in(s.get("t"), units::s) < 0.0) { s.delete_current_branch(); }
      });

    return system;
}

} // namespace examples
} // namespace branch_eqs
