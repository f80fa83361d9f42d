#include <cassert>
#include <cmath>

#include "fa/func.hpp"
#include "fa/runtime_ast.hpp"
#include "fa/tape_backend.hpp"

using namespace fa;

int main() {
  auto x = identity();

  // Domain violations evaluate to NaN or infinities
  {
    assert(std::isnan(sqrt(constant(-1.0))(123.0)));
    assert(std::isnan(asin(constant(2.0))(0.0)));
    assert(std::isnan(acos(constant(-1.5))(0.0)));
    assert(std::isnan(log(constant(-1.0))(0.0)));
    assert(std::isinf(log(x)(0.0)) && log(x)(0.0) < 0.0);
    assert(std::isnan(power(constant(-8.0), 1.0 / 3.0)(0.0)));
    assert(std::isnan(log_base(1.0, x)(1.0)));   // 0 / 0
    assert(std::isinf(log_base(1.0, x)(2.0)));
    assert(std::isnan(log_base(-2.0, x)(4.0)));
  }

  // NaN flows through the rest of the tree
  {
    auto f = sum(sin(sqrt(x)), constant(10.0)) * constant(2.0);
    assert(!std::isnan(f(4.0)));
    assert(std::isnan(f(-4.0)));

    RFunc rf = f;
    assert(std::isnan(rf(-4.0)));
  }

  // The tape locates the node that introduced the NaN
  {
    auto f = exp(asin(x * constant(0.5))) + constant(1.0);
    Tape t = to_tape(f);
    assert(t.first_domain_violation(1.0) == -1);
    int bad = t.first_domain_violation(4.0);
    assert(bad >= 0);
    assert(t.nodes[bad].kind == NodeKind::Asin);
    assert(std::isnan(t.forward(4.0)));
  }

  // NaN that is given, not produced, is not a violation
  {
    auto f = sin(x) + constant(NAN);
    Tape t = to_tape(f);
    assert(std::isnan(t.forward(0.3)));
    assert(t.first_domain_violation(0.3) == -1);
    Tape u = to_tape(sin(x));
    assert(u.first_domain_violation(NAN) == -1);
  }

  return 0;
}
