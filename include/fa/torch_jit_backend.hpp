#pragma once

#ifdef FA_WITH_TORCH
  #include <torch/script.h>
  #include <type_traits>
  #include <initializer_list>
#endif

#include "fa/func.hpp"

namespace fa {

#ifdef FA_WITH_TORCH
// Lowers a function tree into a Torch JIT graph with a single input, the
// controlling variable. Structural parameters become prim::Constant nodes.
struct TorchJITBackend {
  using result_type = torch::jit::Value*;

  torch::jit::Graph g;
  torch::jit::Value* input = nullptr;

  TorchJITBackend() : input(g.addInput()) {}

  template <class T>
  result_type emitIdent(Ident<T>) { return input; }

  template <class T>
  result_type emitConst(Const<T> c) { return scalar(static_cast<double>(c.value)); }

  template <class Op>
  result_type emitApply(const Op& op, result_type a) {
    if constexpr      (std::is_same<Op, PowOp>::value)     return mk("aten::pow", {a, scalar(op.n)});
    else if constexpr (std::is_same<Op, ExpBaseOp>::value) return mk("aten::pow", {scalar(op.a), a});
    else if constexpr (std::is_same<Op, ExpOp>::value)     return mk("aten::exp", {a});
    else if constexpr (std::is_same<Op, LogBaseOp>::value) {
      // same base-2 / base-10 special cases as LogBaseOp::eval
      if (op.b == 2.0)  return mk("aten::log2", {a});
      if (op.b == 10.0) return mk("aten::log10", {a});
      return mk("aten::div", {mk("aten::log", {a}), mk("aten::log", {scalar(op.b)})});
    }
    else if constexpr (std::is_same<Op, LogOp>::value)     return mk("aten::log", {a});
    else if constexpr (std::is_same<Op, SinOp>::value)     return mk("aten::sin", {a});
    else if constexpr (std::is_same<Op, CosOp>::value)     return mk("aten::cos", {a});
    else if constexpr (std::is_same<Op, TanOp>::value)     return mk("aten::tan", {a});
    else if constexpr (std::is_same<Op, AsinOp>::value)    return mk("aten::asin", {a});
    else if constexpr (std::is_same<Op, AcosOp>::value)    return mk("aten::acos", {a});
    else if constexpr (std::is_same<Op, AtanOp>::value)    return mk("aten::atan", {a});
    else if constexpr (std::is_same<Op, SqrtOp>::value)    return mk("aten::sqrt", {a});
    else if constexpr (std::is_same<Op, CbrtOp>::value) {
      // real cube root: sign(v) * |v|^(1/3)
      auto mag = mk("aten::pow", {mk("aten::abs", {a}), scalar(1.0 / 3.0)});
      return mk("aten::mul", {mk("aten::sign", {a}), mag});
    }
    else if constexpr (std::is_same<Op, NthRootOp>::value) return mk("aten::pow", {a, scalar(1.0 / op.n)});
    else static_assert(!std::is_same<Op,Op>::value, "Unary op not mapped to Torch JIT");
  }

  template <class Op>
  result_type emitApply(const Op&, result_type a, result_type b) {
    if constexpr      (std::is_same<Op, SumOp>::value)  return mk("aten::add", {a, b});
    else if constexpr (std::is_same<Op, ProdOp>::value) return mk("aten::mul", {a, b});
    else static_assert(!std::is_same<Op,Op>::value, "Binary op not mapped to Torch JIT");
  }

 private:
  result_type mk(const char* q, std::initializer_list<result_type> args) {
    auto n = g.create(c10::Symbol::fromQualString(q), args);
    g.insertNode(n);
    return n->output();
  }

  result_type scalar(double v) {
    auto n = g.create(torch::jit::prim::Constant);
    n->output()->setType(c10::TensorType::get());
    n->t_(c10::Symbol::attr("value"), torch::tensor(v));
    g.insertNode(n);
    return n->output();
  }
};
#else
struct TorchJITBackend; // stub
#endif

} // namespace fa
