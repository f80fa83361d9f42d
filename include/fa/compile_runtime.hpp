#pragma once
#include <vector>
#include <functional>
#include <type_traits>
#include <stdexcept>

#include "fa/runtime_ast.hpp"
#include "fa/func.hpp"

namespace fa {

// Compile a runtime AST (RGraph) into a Backend using Backend's emitIdent/emitConst/emitApply API.
// Op objects are rebuilt from the node tags, so the backend sees the same calls as compile(expr, b).
// Requires a non-empty graph; rebuilding an NthRootOp re-checks its degree.
template <class Backend>
inline auto compile_runtime(const RGraph& g, Backend& b) -> typename Backend::result_type {
  using R = typename Backend::result_type;

  std::function<R(int)> rec = [&](int id) -> R {
    const RNode& n = g.nodes[id];
    switch (n.kind) {
      case NodeKind::Const: {
        return b.template emitConst<double>(Const<double>{ n.param });
      }
      case NodeKind::Ident: {
        return b.template emitIdent<double>(Ident<double>{});
      }
      case NodeKind::Sum: {
        auto a = rec(n.ch[0]); auto c = rec(n.ch[1]);
        return b.emitApply(SumOp{}, a, c);
      }
      case NodeKind::Prod: {
        auto a = rec(n.ch[0]); auto c = rec(n.ch[1]);
        return b.emitApply(ProdOp{}, a, c);
      }
      case NodeKind::Pow:     { auto a = rec(n.ch[0]); return b.emitApply(PowOp{n.param}, a); }
      case NodeKind::ExpBase: { auto a = rec(n.ch[0]); return b.emitApply(ExpBaseOp{n.param}, a); }
      case NodeKind::Exp:     { auto a = rec(n.ch[0]); return b.emitApply(ExpOp{}, a); }
      case NodeKind::LogBase: { auto a = rec(n.ch[0]); return b.emitApply(LogBaseOp{n.param}, a); }
      case NodeKind::Log:     { auto a = rec(n.ch[0]); return b.emitApply(LogOp{}, a); }
      case NodeKind::Sin:     { auto a = rec(n.ch[0]); return b.emitApply(SinOp{}, a); }
      case NodeKind::Cos:     { auto a = rec(n.ch[0]); return b.emitApply(CosOp{}, a); }
      case NodeKind::Tan:     { auto a = rec(n.ch[0]); return b.emitApply(TanOp{}, a); }
      case NodeKind::Asin:    { auto a = rec(n.ch[0]); return b.emitApply(AsinOp{}, a); }
      case NodeKind::Acos:    { auto a = rec(n.ch[0]); return b.emitApply(AcosOp{}, a); }
      case NodeKind::Atan:    { auto a = rec(n.ch[0]); return b.emitApply(AtanOp{}, a); }
      case NodeKind::Sqrt:    { auto a = rec(n.ch[0]); return b.emitApply(SqrtOp{}, a); }
      case NodeKind::Cbrt:    { auto a = rec(n.ch[0]); return b.emitApply(CbrtOp{}, a); }
      case NodeKind::NthRoot: { auto a = rec(n.ch[0]); return b.emitApply(NthRootOp{n.param}, a); }
    }
    // Unreachable
    return b.template emitConst<double>(Const<double>{0.0});
  };

  if (g.empty())
    throw std::invalid_argument("compile_runtime: empty graph");
  return rec(g.root);
}

template <class Backend>
inline auto compile_runtime(const RFunc& f, Backend& b) -> typename Backend::result_type {
  return compile_runtime(f.graph(), b);
}

} // namespace fa
