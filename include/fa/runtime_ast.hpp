#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>
#include <cmath>

#include "fa/func.hpp"

namespace fa {

// Runtime AST kinds mirror ET Op tags
enum class NodeKind : uint8_t {
  Const, Ident,
  Sum, Prod,
  Pow, ExpBase, Exp, LogBase, Log,
  Sin, Cos, Tan, Asin, Acos, Atan,
  Sqrt, Cbrt, NthRoot
};

inline const char* kind_name(NodeKind k) {
  switch (k) {
    case NodeKind::Const:   return "const";
    case NodeKind::Ident:   return "ident";
    case NodeKind::Sum:     return "sum";
    case NodeKind::Prod:    return "prod";
    case NodeKind::Pow:     return "pow";
    case NodeKind::ExpBase: return "exp_base";
    case NodeKind::Exp:     return "exp";
    case NodeKind::LogBase: return "log_base";
    case NodeKind::Log:     return "log";
    case NodeKind::Sin:     return "sin";
    case NodeKind::Cos:     return "cos";
    case NodeKind::Tan:     return "tan";
    case NodeKind::Asin:    return "asin";
    case NodeKind::Acos:    return "acos";
    case NodeKind::Atan:    return "atan";
    case NodeKind::Sqrt:    return "sqrt";
    case NodeKind::Cbrt:    return "cbrt";
    case NodeKind::NthRoot: return "nth_root";
  }
  return "?";
}

inline std::size_t arity_of(NodeKind k) {
  switch (k) {
    case NodeKind::Const:
    case NodeKind::Ident: return 0;
    case NodeKind::Sum:
    case NodeKind::Prod:  return 2;
    default:              return 1;
  }
}

struct RNode {
  NodeKind kind{};
  std::vector<int> ch;     // children node ids
  double param = 0.0;      // constant value, exponent, base or root degree
};

// root == -1 marks an empty graph: eval gives NaN, compile_runtime rejects it.
struct RGraph {
  std::vector<RNode> nodes;
  int root = -1;

  bool empty() const { return root < 0; }

  int add(RNode n) {
    nodes.push_back(std::move(n));
    return (int)nodes.size() - 1;
  }
};

// Map ET op tag to NodeKind
template <class Op> struct nodekind_of;
template <> struct nodekind_of<SumOp>     { static constexpr NodeKind value = NodeKind::Sum; };
template <> struct nodekind_of<ProdOp>    { static constexpr NodeKind value = NodeKind::Prod; };
template <> struct nodekind_of<PowOp>     { static constexpr NodeKind value = NodeKind::Pow; };
template <> struct nodekind_of<ExpBaseOp> { static constexpr NodeKind value = NodeKind::ExpBase; };
template <> struct nodekind_of<ExpOp>     { static constexpr NodeKind value = NodeKind::Exp; };
template <> struct nodekind_of<LogBaseOp> { static constexpr NodeKind value = NodeKind::LogBase; };
template <> struct nodekind_of<LogOp>     { static constexpr NodeKind value = NodeKind::Log; };
template <> struct nodekind_of<SinOp>     { static constexpr NodeKind value = NodeKind::Sin; };
template <> struct nodekind_of<CosOp>     { static constexpr NodeKind value = NodeKind::Cos; };
template <> struct nodekind_of<TanOp>     { static constexpr NodeKind value = NodeKind::Tan; };
template <> struct nodekind_of<AsinOp>    { static constexpr NodeKind value = NodeKind::Asin; };
template <> struct nodekind_of<AcosOp>    { static constexpr NodeKind value = NodeKind::Acos; };
template <> struct nodekind_of<AtanOp>    { static constexpr NodeKind value = NodeKind::Atan; };
template <> struct nodekind_of<SqrtOp>    { static constexpr NodeKind value = NodeKind::Sqrt; };
template <> struct nodekind_of<CbrtOp>    { static constexpr NodeKind value = NodeKind::Cbrt; };
template <> struct nodekind_of<NthRootOp> { static constexpr NodeKind value = NodeKind::NthRoot; };

// Structural parameter carried by an op (0 for parameterless ops)
template <class Op> inline double param_of(const Op&) { return 0.0; }
inline double param_of(const PowOp& o)     { return o.n; }
inline double param_of(const ExpBaseOp& o) { return o.a; }
inline double param_of(const LogBaseOp& o) { return o.b; }
inline double param_of(const NthRootOp& o) { return o.n; }

// Transform of a single node applied to already evaluated child values.
// Every evaluator (runtime tree, tape) goes through here so that all of
// them produce identical bits.
inline double eval_node(NodeKind k, double param, double a, double b = 0.0) {
  switch (k) {
    case NodeKind::Const:   return param;
    case NodeKind::Ident:   return a;
    case NodeKind::Sum:     return SumOp{}.eval(a, b);
    case NodeKind::Prod:    return ProdOp{}.eval(a, b);
    case NodeKind::Pow:     return PowOp{param}.eval(a);
    case NodeKind::ExpBase: return ExpBaseOp{param}.eval(a);
    case NodeKind::Exp:     return ExpOp{}.eval(a);
    case NodeKind::LogBase: return LogBaseOp{param}.eval(a);
    case NodeKind::Log:     return LogOp{}.eval(a);
    case NodeKind::Sin:     return SinOp{}.eval(a);
    case NodeKind::Cos:     return CosOp{}.eval(a);
    case NodeKind::Tan:     return TanOp{}.eval(a);
    case NodeKind::Asin:    return AsinOp{}.eval(a);
    case NodeKind::Acos:    return AcosOp{}.eval(a);
    case NodeKind::Atan:    return AtanOp{}.eval(a);
    case NodeKind::Sqrt:    return SqrtOp{}.eval(a);
    case NodeKind::Cbrt:    return CbrtOp{}.eval(a);
    case NodeKind::NthRoot: return std::pow(a, 1.0 / param); // same as NthRootOp::eval, degree checked at construction
  }
  return std::nan("");
}

// Compile ET expression to runtime graph (returns node id)
template <class T>
inline int compile_to_runtime(const Ident<T>&, RGraph& g) {
  RNode n; n.kind = NodeKind::Ident; return g.add(std::move(n));
}
template <class T>
inline int compile_to_runtime(const Const<T>& c, RGraph& g) {
  RNode n; n.kind = NodeKind::Const; n.param = static_cast<double>(c.value); return g.add(std::move(n));
}
template <class Op, class... Ch>
inline int compile_to_runtime(const Apply<Op,Ch...>& a, RGraph& g) {
  RNode n; n.kind = nodekind_of<Op>::value; n.param = param_of(a.op);
  // Recurse over children
  constexpr std::size_t N = sizeof...(Ch);
  n.ch.reserve(N);
  std::apply([&](const auto&... c){ (n.ch.push_back(compile_to_runtime(c, g)), ...); }, a.ch);
  return g.add(std::move(n));
}

// Entry: end-to-end ET -> runtime graph
template <class Expr, std::enable_if_t<is_node_t<Expr>::value, int> = 0>
inline RGraph compile_to_runtime(const Expr& e) {
  RGraph g;
  g.root = compile_to_runtime(e, g);
  return g;
}

// Evaluate the subtree rooted at id
inline double eval(const RGraph& g, int id, double x) {
  const RNode& n = g.nodes[id];
  switch (arity_of(n.kind)) {
    case 0:
      return eval_node(n.kind, n.param, x);
    case 1:
      return eval_node(n.kind, n.param, eval(g, n.ch[0], x));
    default:
      return eval_node(n.kind, n.param, eval(g, n.ch[0], x), eval(g, n.ch[1], x));
  }
}

inline double eval(const RGraph& g, double x) {
  if (g.empty()) return std::nan("");
  return eval(g, g.root, x);
}

// Structural equality on subtrees
inline bool r_equal(const RGraph& ga, int a, const RGraph& gb, int b) {
  const RNode& na = ga.nodes[a];
  const RNode& nb = gb.nodes[b];
  if (na.kind != nb.kind) return false;
  if (na.param != nb.param) return false;
  if (na.ch.size() != nb.ch.size()) return false;
  for (std::size_t i = 0; i < na.ch.size(); ++i)
    if (!r_equal(ga, na.ch[i], gb, nb.ch[i])) return false;
  return true;
}

inline bool r_equal(const RGraph& g, int a, int b) { return a == b || r_equal(g, a, g, b); }

//===========================
// Owning runtime function value
//===========================

// Type-erased function tree. Built from an ET expression or from the
// runtime factories below; the arena always holds exactly one tree.
class RFunc {
 public:
  using value_type = double;

  template <class Expr, std::enable_if_t<is_node_t<Expr>::value, int> = 0>
  RFunc(const Expr& e) : g_(compile_to_runtime(e)) {}

  double operator()(double x) const { return fa::eval(g_, x); }
  double eval(double x) const { return fa::eval(g_, x); }

  NodeKind kind() const { return g_.nodes[g_.root].kind; }
  std::size_t size() const { return g_.nodes.size(); }
  const RGraph& graph() const { return g_; }

  friend RFunc sum(RFunc f, RFunc g);
  friend RFunc product(RFunc f, RFunc g);
  friend RFunc power(RFunc f, double n);
  friend RFunc exp_base(double a, RFunc f);
  friend RFunc log_base(double b, RFunc f);
  friend RFunc nth_root(double n, RFunc f);
  friend RFunc exp(RFunc f);
  friend RFunc log(RFunc f);
  friend RFunc sin(RFunc f);
  friend RFunc cos(RFunc f);
  friend RFunc tan(RFunc f);
  friend RFunc asin(RFunc f);
  friend RFunc acos(RFunc f);
  friend RFunc atan(RFunc f);
  friend RFunc sqrt(RFunc f);
  friend RFunc cbrt(RFunc f);

 private:
  explicit RFunc(RGraph g) : g_(std::move(g)) {}

  static RFunc unary(NodeKind k, double param, RFunc f) {
    RGraph g = std::move(f.g_);
    RNode n; n.kind = k; n.param = param; n.ch.push_back(g.root);
    g.root = g.add(std::move(n));
    return RFunc(std::move(g));
  }

  static RFunc binary(NodeKind k, RFunc f, RFunc h) {
    RGraph g = std::move(f.g_);
    const int lhs = g.root;
    const int rhs = splice(g, h.g_);
    RNode n; n.kind = k; n.ch = {lhs, rhs};
    g.root = g.add(std::move(n));
    return RFunc(std::move(g));
  }

  // Append src's nodes to dst, returns the id of src's root in dst
  static int splice(RGraph& dst, const RGraph& src) {
    const int off = (int)dst.nodes.size();
    dst.nodes.reserve(dst.nodes.size() + src.nodes.size());
    for (RNode n : src.nodes) {
      for (int& c : n.ch) c += off;
      dst.nodes.push_back(std::move(n));
    }
    return src.root + off;
  }

  RGraph g_;
};

inline bool r_equal(const RFunc& f, const RFunc& g) {
  return r_equal(f.graph(), f.graph().root, g.graph(), g.graph().root);
}

inline RFunc sum(RFunc f, RFunc g)     { return RFunc::binary(NodeKind::Sum, std::move(f), std::move(g)); }
inline RFunc product(RFunc f, RFunc g) { return RFunc::binary(NodeKind::Prod, std::move(f), std::move(g)); }

inline RFunc operator+(RFunc f, RFunc g) { return sum(std::move(f), std::move(g)); }
inline RFunc operator*(RFunc f, RFunc g) { return product(std::move(f), std::move(g)); }

inline RFunc power(RFunc f, double n)    { return RFunc::unary(NodeKind::Pow, n, std::move(f)); }
inline RFunc exp_base(double a, RFunc f) { return RFunc::unary(NodeKind::ExpBase, a, std::move(f)); }
inline RFunc log_base(double b, RFunc f) { return RFunc::unary(NodeKind::LogBase, b, std::move(f)); }
inline RFunc nth_root(double n, RFunc f) {
  return RFunc::unary(NodeKind::NthRoot, checked_root_degree(n), std::move(f));
}

inline RFunc exp(RFunc f)  { return RFunc::unary(NodeKind::Exp, 0.0, std::move(f)); }
inline RFunc log(RFunc f)  { return RFunc::unary(NodeKind::Log, 0.0, std::move(f)); }
inline RFunc sin(RFunc f)  { return RFunc::unary(NodeKind::Sin, 0.0, std::move(f)); }
inline RFunc cos(RFunc f)  { return RFunc::unary(NodeKind::Cos, 0.0, std::move(f)); }
inline RFunc tan(RFunc f)  { return RFunc::unary(NodeKind::Tan, 0.0, std::move(f)); }
inline RFunc asin(RFunc f) { return RFunc::unary(NodeKind::Asin, 0.0, std::move(f)); }
inline RFunc acos(RFunc f) { return RFunc::unary(NodeKind::Acos, 0.0, std::move(f)); }
inline RFunc atan(RFunc f) { return RFunc::unary(NodeKind::Atan, 0.0, std::move(f)); }
inline RFunc sqrt(RFunc f) { return RFunc::unary(NodeKind::Sqrt, 0.0, std::move(f)); }
inline RFunc cbrt(RFunc f) { return RFunc::unary(NodeKind::Cbrt, 0.0, std::move(f)); }

} // namespace fa
