#include <iostream>
#include <vector>
#include "fa/func.hpp"
#include "fa/tape_backend.hpp"

int main() {
  using namespace fa;
  auto x = identity();
  auto f = asin(x * constant(0.5)) + sqrt(x);

  Tape tape = to_tape(f);

  std::vector<double> xs = {-1.0, 0.0, 1.0, 2.0, 3.0};
  std::vector<double> ys = tape.forward(xs);
  for (std::size_t i = 0; i < xs.size(); ++i) {
    std::cout << "f(" << xs[i] << ") = " << ys[i];
    int bad = tape.first_domain_violation(xs[i]);
    if (bad >= 0) std::cout << "  (domain violation at node " << bad << ": " << kind_name(tape.nodes[bad].kind) << ")";
    std::cout << "\n";
  }
  return 0;
}
