#include <cassert>
#include <cmath>
#include <algorithm>

#include "fa/func.hpp"

using namespace fa;

static bool approx(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps * (1.0 + std::max(std::fabs(a), std::fabs(b)));
}

int main() {
  auto x = identity();
  // Non-trivial child so every op is checked against the child result, not x
  auto u = x * constant(0.5) + constant(0.1);

  // Trigonometric family
  {
    for (double v = -1.5; v <= 1.5; v += 0.1) {
      double w = 0.5 * v + 0.1;
      assert(sin(u)(v) == std::sin(w));
      assert(cos(u)(v) == std::cos(w));
      assert(tan(u)(v) == std::tan(w));
      assert(asin(u)(v) == std::asin(w));
      assert(acos(u)(v) == std::acos(w));
      assert(atan(u)(v) == std::atan(w));
    }
  }

  // Exponentials and logarithms
  {
    for (double v = 0.5; v <= 8.0; v += 0.5) {
      double w = 0.5 * v + 0.1;
      assert(exp(u)(v) == std::exp(w));
      assert(exp_base(2.0, u)(v) == std::pow(2.0, w));
      assert(log(u)(v) == std::log(w));
      assert(approx(log_base(3.0, u)(v), std::log(w) / std::log(3.0)));
      assert(log_base(10.0, u)(v) == std::log10(w));
    }
    assert(log_base(10.0, x)(1000.0) == 3.0);
  }

  // The natural exponential applies to the child result
  {
    auto e = exp(constant(0.0));
    assert(e(5.0) == 1.0);
    auto e2 = exp(x * constant(2.0));
    assert(approx(e2(1.0), std::exp(2.0)));
  }

  // Round trip: log(exp(f)) == f
  {
    auto f = sin(x) * constant(3.0);
    auto rt = log(exp(f));
    for (double v = -3.0; v <= 3.0; v += 0.2)
      assert(approx(rt(v), f(v), 1e-12));
  }

  // Integer powers agree with repeated multiplication
  {
    auto f = cos(x) + constant(1.2);
    for (double v = -2.0; v <= 2.0; v += 0.25) {
      double fv = f(v);
      double acc = 1.0;
      for (int n = 1; n <= 6; ++n) {
        acc *= fv;
        assert(approx(power(f, double(n))(v), acc));
      }
    }
    assert(power(x, 0.0)(0.0) == 1.0);
    assert(power(x, -1.0)(4.0) == 0.25);
  }

  // Roots
  {
    assert(sqrt(x)(16.0) == 4.0);
    assert(approx(cbrt(x)(27.0), 3.0));
    assert(approx(cbrt(x)(-8.0), -2.0));
    assert(cbrt(x)(-5.0) == std::cbrt(-5.0));
    assert(approx(nth_root(4.0, x)(81.0), 3.0));
  }

  return 0;
}
