#include <iostream>
#include "fa/func.hpp"
#include "fa/torch_jit_backend.hpp"

int main() {
#ifdef FA_WITH_TORCH
  using namespace fa;
  auto x = identity();
  auto f = sin(x) * x + log_base(2.0, x);
  TorchJITBackend JB;
  auto out = compile(f, JB);
  JB.g.registerOutput(out);
  std::cout << "Torch JIT graph:\n";
  JB.g.print(std::cout);
#else
  std::cout << "Rebuild with -DFA_WITH_TORCH=ON and libtorch installed to run this example.\n";
#endif
  return 0;
}
