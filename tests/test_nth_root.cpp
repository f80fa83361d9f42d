#include <cassert>
#include <cmath>
#include <stdexcept>

#include "fa/func.hpp"
#include "fa/runtime_ast.hpp"

using namespace fa;

int main() {
  auto x = identity();

  // nth_root(n, f) is the same computation as power(f, 1/n)
  {
    auto f = exp(x) + constant(2.0);
    for (double n : {1.0, 2.0, 3.0, 5.0, -2.0, 0.5}) {
      auto r = nth_root(n, f);
      auto p = power(f, 1.0 / n);
      for (double v = -2.0; v <= 2.0; v += 0.25)
        assert(r(v) == p(v));
    }
  }

  // Degree zero refuses construction, ET layer
  {
    bool thrown = false;
    try {
      auto r = nth_root(0.0, x);
      (void)r;
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }

  // ... and negative zero is zero
  {
    bool thrown = false;
    try {
      NthRootOp op{-0.0};
      (void)op;
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }

  // Degree zero refuses construction, runtime layer
  {
    RFunc f = sin(x);
    bool thrown = false;
    try {
      RFunc r = nth_root(0.0, f);
      (void)r;
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
    RFunc ok = nth_root(3.0, f);
    assert(ok.kind() == NodeKind::NthRoot);
  }

  // Even root of a negative value is NaN, not an error
  {
    assert(std::isnan(nth_root(2.0, x)(-4.0)));
    assert(std::isnan(nth_root(3.0, x)(-8.0))); // pow with fractional exponent, unlike cbrt
  }

  // A hand-built zero-degree node evaluates without throwing
  {
    RGraph g;
    RNode id; id.kind = NodeKind::Ident;
    int c = g.add(id);
    RNode rt; rt.kind = NodeKind::NthRoot; rt.param = 0.0; rt.ch = {c};
    g.root = g.add(rt);
    bool thrown = false;
    double v = 0.0;
    try {
      v = eval(g, 2.0);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(!thrown);
    assert(std::isinf(v));          // 2^(1/0) = 2^inf
    assert(std::isinf(eval(g, -2.0)));  // |-2| > 1 raised to inf
    assert(eval(g, 1.0) == 1.0);    // 1^inf
  }

  return 0;
}
