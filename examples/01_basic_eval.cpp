#include <iostream>
#include "fa/func.hpp"

int main() {
  using namespace fa;
  auto x = identity();
  auto f = sin(x) * x + power(x, 2.0);

  double val = evaluate(f, 2.4);
  std::cout << "f(2.4) = " << val << "\n";
  std::cout << "log2(8) = " << log_base(2.0, x)(8.0) << "\n";
  std::cout << "sqrt(9) = " << nth_root(2.0, x)(9.0) << "\n";
  return 0;
}
