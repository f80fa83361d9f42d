#include <cassert>
#include <vector>
#include <cmath>

#include "fa/func.hpp"
#include "fa/runtime_ast.hpp"
#include "fa/compile_runtime.hpp"
#include "fa/tape_backend.hpp"

using namespace fa;

int main() {
  auto x = identity();

  // Build an ET with a variety of ops to exercise compile_runtime and the tape backend
  auto f = power(sin(x) + cos(x), 2.0)
         + log(exp(x * constant(0.5)))
         + sqrt(x + constant(3.0))
         + nth_root(3.0, exp_base(2.0, x))
         + atan(tan(x)) * cbrt(x);

  // ET -> runtime
  RGraph g = compile_to_runtime(f);

  // runtime -> Tape via compile_runtime
  TapeBackend tb;
  int out = compile_runtime(g, tb);
  tb.tape.output_id = out;

  // ET -> Tape directly
  Tape direct = to_tape(f);
  assert(direct.nodes.size() == g.nodes.size());
  assert(tb.tape.nodes.size() == g.nodes.size());

  // All evaluators agree bit for bit
  for (double v = -0.9; v <= 1.4; v += 0.1) {
    double ref = f(v);
    assert(eval(g, v) == ref);
    assert(tb.tape.forward(v) == ref);
    assert(direct.forward(v) == ref);
  }

  // Batch evaluation
  {
    std::vector<double> xs = {0.0, 0.5, 1.0};
    std::vector<double> ys = direct.forward(xs);
    assert(ys.size() == xs.size());
    for (std::size_t i = 0; i < xs.size(); ++i)
      assert(ys[i] == f(xs[i]));
  }

  // Intermediate values end with the output
  {
    auto vals = direct.values(0.25);
    assert((int)vals.size() == (int)direct.nodes.size());
    assert(vals[direct.output_id] == f(0.25));
  }

  // Structural parameters survive the round trip through the tape
  {
    RFunc r = nth_root(5.0, log_base(2.0, RFunc(identity())));
    Tape t = to_tape(r);
    assert(t.nodes.size() == 3);
    assert(t.nodes[1].kind == NodeKind::LogBase && t.nodes[1].param == 2.0);
    assert(t.nodes[2].kind == NodeKind::NthRoot && t.nodes[2].param == 5.0);
    assert(t.forward(32.0) == r(32.0));
  }

  return 0;
}
