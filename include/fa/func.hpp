#pragma once
#include <tuple>
#include <type_traits>
#include <utility>
#include <cstddef>
#include <cmath>
#include <stdexcept>

namespace fa {

//===========================
// Core IR
//===========================
template <class T>
struct Ident {
  using value_type = T;
  constexpr value_type operator()(const T& x) const { return x; }
  constexpr value_type eval(const T& x) const { return x; }
};

template <class T>
struct Const {
  using value_type = T;
  T value;
  constexpr explicit Const(const T& v) : value(v) {}
  template <class X>
  constexpr value_type operator()(const X&) const { return value; }
  template <class X>
  constexpr value_type eval(const X&) const { return value; }
};

template <class T = double> constexpr auto identity() { return Ident<T>{}; }
// Constants are real-valued: integer arguments are promoted to double
template <class T> using real_t = std::common_type_t<T, double>;
template <class T> constexpr auto constant(T v) { return Const<real_t<T>>{static_cast<real_t<T>>(v)}; }

template <class T, class = void>
struct value_type_of { using type = T; };
template <class T>
struct value_type_of<T, std::void_t<typename T::value_type>> { using type = typename T::value_type; };
template <class T> using value_type_of_t = typename value_type_of<T>::type;

// Combinator node: owns its op (and with it any structural parameter) and
// its children by value.
template <class Op, class... Children>
struct Apply {
  using value_type = decltype(std::declval<const Op&>().eval(std::declval<value_type_of_t<Children>>()...));
  Op op;
  std::tuple<Children...> ch;

  // Only ops without a structural parameter may be default-built
  template <class O = Op, std::enable_if_t<std::is_empty<O>::value, int> = 0>
  constexpr explicit Apply(Children... c) : op{}, ch(std::move(c)...) {}
  constexpr Apply(Op o, Children... c) : op(std::move(o)), ch(std::move(c)...) {}

  template <class X, std::size_t... Is>
  constexpr value_type call(std::index_sequence<Is...>, const X& x) const {
    return op.eval(std::get<Is>(ch)(x)...);
  }
  template <class X>
  constexpr value_type operator()(const X& x) const {
    return call(std::make_index_sequence<sizeof...(Children)>{}, x);
  }
  template <class X>
  constexpr value_type eval(const X& x) const { return (*this)(x); }

  template <std::size_t I> constexpr const auto& child() const { return std::get<I>(ch); }
};

// Node detection
template <class T> struct is_node : std::false_type {};
template <class T> struct is_node<Ident<T>> : std::true_type {};
template <class T> struct is_node<Const<T>> : std::true_type {};
template <class Op, class... Ch> struct is_node<Apply<Op,Ch...>> : std::true_type {};

template <class T>
using is_node_t = is_node<std::decay_t<T>>;

//===========================
// Construction checks
//===========================

// A root of degree zero would need the exponent 1/0.
inline double checked_root_degree(double n) {
  if (n == 0.0)
    throw std::invalid_argument("nth_root: degree must be nonzero");
  return n;
}

//===========================
// Ops (tags) and sugar
//===========================
struct SumOp {
  static constexpr std::size_t arity = 2;
  template <class A, class B> constexpr auto eval(const A& a, const B& b) const { return a + b; }
};
struct ProdOp {
  static constexpr std::size_t arity = 2;
  template <class A, class B> constexpr auto eval(const A& a, const B& b) const { return a * b; }
};

// f(x)^n
struct PowOp {
  static constexpr std::size_t arity = 1;
  double n;
  template <class A> auto eval(const A& v) const { using std::pow; return pow(v, n); }
};
// a^f(x)
struct ExpBaseOp {
  static constexpr std::size_t arity = 1;
  double a;
  template <class A> auto eval(const A& v) const { using std::pow; return pow(a, v); }
};
struct ExpOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::exp; return exp(v); }
};
// log_b f(x)
struct LogBaseOp {
  static constexpr std::size_t arity = 1;
  double b;
  template <class A> auto eval(const A& v) const {
    using std::log; using std::log2; using std::log10;
    using R = decltype(log(v) / log(b));
    if (b == 2.0)  return static_cast<R>(log2(v));
    if (b == 10.0) return static_cast<R>(log10(v));
    return log(v) / log(b);
  }
};
struct LogOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::log; return log(v); }
};
struct SinOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::sin; return sin(v); }
};
struct CosOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::cos; return cos(v); }
};
struct TanOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::tan; return tan(v); }
};
struct AsinOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::asin; return asin(v); }
};
struct AcosOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::acos; return acos(v); }
};
struct AtanOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::atan; return atan(v); }
};
struct SqrtOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::sqrt; return sqrt(v); }
};
struct CbrtOp {
  static constexpr std::size_t arity = 1;
  template <class A> auto eval(const A& v) const { using std::cbrt; return cbrt(v); }
};
// f(x)^(1/n); same computation as PowOp with exponent 1/n
struct NthRootOp {
  static constexpr std::size_t arity = 1;
  double n;
  explicit NthRootOp(double degree) : n(checked_root_degree(degree)) {}
  template <class A> auto eval(const A& v) const { using std::pow; return pow(v, 1.0 / n); }
};

// Scalars next to an ET node are lifted into Const
template <class X>
constexpr auto as_node(X x) {
  if constexpr (is_node_t<X>::value) return x;
  else return constant(x);
}

template <class L, class R>
inline constexpr bool is_operand_pair_v =
    (is_node_t<L>::value && is_node_t<R>::value) ||
    (is_node_t<L>::value && std::is_arithmetic<std::decay_t<R>>::value) ||
    (std::is_arithmetic<std::decay_t<L>>::value && is_node_t<R>::value);

template <class L, class R,
          std::enable_if_t<is_node_t<L>::value && is_node_t<R>::value, int> = 0>
constexpr auto sum(L f, R g) { return Apply<SumOp, std::decay_t<L>, std::decay_t<R>>(std::move(f), std::move(g)); }

template <class L, class R,
          std::enable_if_t<is_node_t<L>::value && is_node_t<R>::value, int> = 0>
constexpr auto product(L f, R g) { return Apply<ProdOp, std::decay_t<L>, std::decay_t<R>>(std::move(f), std::move(g)); }

template <class L, class R, std::enable_if_t<is_operand_pair_v<L, R>, int> = 0>
constexpr auto operator+(L l, R r) { return sum(as_node(std::move(l)), as_node(std::move(r))); }

template <class L, class R, std::enable_if_t<is_operand_pair_v<L, R>, int> = 0>
constexpr auto operator*(L l, R r) { return product(as_node(std::move(l)), as_node(std::move(r))); }

// Parameterised unary combinators
template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
auto power(A f, double n) { return Apply<PowOp, std::decay_t<A>>(PowOp{n}, std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
auto exp_base(double a, A f) { return Apply<ExpBaseOp, std::decay_t<A>>(ExpBaseOp{a}, std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
auto log_base(double b, A f) { return Apply<LogBaseOp, std::decay_t<A>>(LogBaseOp{b}, std::move(f)); }

// Throws std::invalid_argument when n == 0; no node is built in that case.
template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
auto nth_root(double n, A f) { return Apply<NthRootOp, std::decay_t<A>>(NthRootOp{n}, std::move(f)); }

// ET math wrappers (only for ET nodes), avoids shadowing std::sin/cos for scalars
template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto exp(A f) { return Apply<ExpOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto log(A f) { return Apply<LogOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto sin(A f) { return Apply<SinOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto cos(A f) { return Apply<CosOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto tan(A f) { return Apply<TanOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto asin(A f) { return Apply<AsinOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto acos(A f) { return Apply<AcosOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto atan(A f) { return Apply<AtanOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto sqrt(A f) { return Apply<SqrtOp, std::decay_t<A>>(std::move(f)); }

template <class A, std::enable_if_t<is_node_t<A>::value, int> = 0>
constexpr auto cbrt(A f) { return Apply<CbrtOp, std::decay_t<A>>(std::move(f)); }

//===========================
// Evaluation helper
//===========================
template <class Expr, class X>
constexpr auto evaluate(const Expr& e, const X& x) {
  return e(x);
}

//===========================
// Backend visitor interface
//===========================
template <class Backend, class T>
auto compile(const Ident<T>& v, Backend& b) -> typename Backend::result_type {
  return b.template emitIdent<T>(v);
}
template <class Backend, class T>
auto compile(const Const<T>& c, Backend& b) -> typename Backend::result_type {
  return b.template emitConst<T>(c);
}
template <class Backend, class Op, class... Ch>
auto compile(const Apply<Op,Ch...>& a, Backend& b) -> typename Backend::result_type {
  return std::apply([&](const auto&... c){
    return b.emitApply(a.op, compile<Backend>(c, b)...);
  }, a.ch);
}

} // namespace fa
