#include <iostream>
#include <stdexcept>
#include "fa/func.hpp"
#include "fa/runtime_ast.hpp"

int main() {
  using namespace fa;

  // Partial Taylor series of exp, grown at run time
  RFunc x = identity();
  RFunc series = constant(1.0);
  double fact = 1.0;
  for (int k = 1; k <= 8; ++k) {
    fact *= k;
    series = series + constant(1.0 / fact) * power(x, double(k));
  }

  std::cout << "nodes: " << series.size() << ", root: " << kind_name(series.kind()) << "\n";
  std::cout << "series(1) = " << series(1.0) << ", exp(1) = " << exp(x)(1.0) << "\n";

  try {
    RFunc bad = nth_root(0.0, x);
    std::cout << "unexpected: " << bad(1.0) << "\n";
  } catch (const std::invalid_argument& e) {
    std::cout << "rejected: " << e.what() << "\n";
  }
  return 0;
}
