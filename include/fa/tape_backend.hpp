#pragma once
#include <vector>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>

#include "fa/func.hpp"
#include "fa/runtime_ast.hpp"
#include "fa/compile_runtime.hpp"

namespace fa {

// Post-order evaluation program: every node only refers to earlier nodes.
struct Tape {
  struct Node {
    NodeKind kind{};
    int  a = -1;
    int  b = -1;
    double param = 0;
  };

  std::vector<Node> nodes;
  int output_id = -1;

  // Value of every node at x
  std::vector<double> values(double x) const {
    std::vector<double> val(nodes.size());
    for (int i = 0; i < (int)nodes.size(); ++i) {
      const auto& n = nodes[i];
      switch (arity_of(n.kind)) {
        case 0:  val[i] = eval_node(n.kind, n.param, x); break;
        case 1:  val[i] = eval_node(n.kind, n.param, val[n.a]); break;
        default: val[i] = eval_node(n.kind, n.param, val[n.a], val[n.b]); break;
      }
    }
    return val;
  }

  double forward(double x) const {
    return values(x)[output_id];
  }

  std::vector<double> forward(const std::vector<double>& xs) const {
    std::vector<double> out;
    out.reserve(xs.size());
    std::transform(xs.begin(), xs.end(), std::back_inserter(out),
                   [this](double x) { return forward(x); });
    return out;
  }

  // Index of the first node whose own transform turned non-NaN inputs into
  // NaN at x, or -1 when the evaluation is free of domain violations.
  int first_domain_violation(double x) const {
    const std::vector<double> val = values(x);
    for (int i = 0; i < (int)nodes.size(); ++i) {
      if (!std::isnan(val[i])) continue;
      const auto& n = nodes[i];
      bool nan_in = std::isnan(n.param);
      switch (n.kind) {
        case NodeKind::Const: nan_in = true; break;
        case NodeKind::Ident: nan_in = std::isnan(x); break;
        default:
          nan_in = nan_in || std::isnan(val[n.a]) || (n.b >= 0 && std::isnan(val[n.b]));
          break;
      }
      if (!nan_in) return i;
    }
    return -1;
  }
};

struct TapeBackend {
  using result_type = int;
  Tape tape;

  TapeBackend() { tape.nodes.reserve(64); }

  template <class T>
  result_type emitIdent(Ident<T>) {
    Tape::Node n; n.kind = NodeKind::Ident;
    tape.nodes.push_back(n);
    return (int)tape.nodes.size() - 1;
  }

  template <class T>
  result_type emitConst(Const<T> c) {
    Tape::Node n; n.kind = NodeKind::Const; n.param = static_cast<double>(c.value);
    tape.nodes.push_back(n);
    return (int)tape.nodes.size() - 1;
  }

  template <class Op>
  result_type emitApply(const Op& op, int a) {
    static_assert(Op::arity == 1, "Binary op emitted with one operand");
    Tape::Node n;
    n.kind = nodekind_of<Op>::value;
    n.param = param_of(op);
    n.a = a;
    tape.nodes.push_back(n);
    return (int)tape.nodes.size() - 1;
  }

  template <class Op>
  result_type emitApply(const Op&, int a, int b) {
    static_assert(Op::arity == 2, "Unary op emitted with two operands");
    Tape::Node n;
    n.kind = nodekind_of<Op>::value;
    n.a = a; n.b = b;
    tape.nodes.push_back(n);
    return (int)tape.nodes.size() - 1;
  }
};

// Flatten any ET expression or runtime function into a ready-to-run tape
template <class Expr, std::enable_if_t<is_node_t<Expr>::value, int> = 0>
inline Tape to_tape(const Expr& e) {
  TapeBackend tb;
  tb.tape.output_id = compile(e, tb);
  return std::move(tb.tape);
}

inline Tape to_tape(const RFunc& f) {
  TapeBackend tb;
  tb.tape.output_id = compile_runtime(f, tb);
  return std::move(tb.tape);
}

} // namespace fa
