//===- deps.cpp - Dependencies between analysed API items -----------------===//

#include "bridgen/deps.h"

#include <variant>

namespace bridgen {

template <typename Range>
static void append(llvm::SmallVector<QualifiedName, 4> &out, const Range &r) {
  out.append(r.begin(), r.end());
}

/// Dependencies of every kind except Struct, whose analysis is per phase.
template <typename Variant>
static void commonDeps(const Variant &kind, llvm::SmallVector<QualifiedName, 4> &out) {
  if (auto *td = std::get_if<api::Typedef>(&kind)) {
    if (td->old_tyname)
      out.push_back(*td->old_tyname);
    append(out, td->analysis.deps);
  } else if (auto *fn = std::get_if<api::Function>(&kind)) {
    append(out, fn->analysis.deps);
  } else if (auto *sub = std::get_if<api::Subclass>(&kind)) {
    out.push_back(sub->superclass);
  } else if (auto *rsf = std::get_if<api::RustSubclassFn>(&kind)) {
    append(out, rsf->details.dependencies);
  }
}

llvm::SmallVector<QualifiedName, 4> deps(const Api<FnPrePhase> &item) {
  llvm::SmallVector<QualifiedName, 4> out;
  if (auto *s = std::get_if<api::Struct<FnPrePhase>>(&item.kind)) {
    // Opaque structs are only ever handled by pointer, so their fields do
    // not need to be declared first.
    if (s->analysis.kind == TypeKind::Pod)
      append(out, s->analysis.field_types);
    return out;
  }
  commonDeps(item.kind, out);
  return out;
}

llvm::SmallVector<QualifiedName, 4> deps(const Api<FnPhase> &item) {
  llvm::SmallVector<QualifiedName, 4> out;
  if (auto *s = std::get_if<api::Struct<FnPhase>>(&item.kind)) {
    if (s->analysis.pod.kind == TypeKind::Pod)
      append(out, s->analysis.pod.field_types);
    append(out, s->analysis.constructor_and_allocator_deps);
    return out;
  }
  commonDeps(item.kind, out);
  return out;
}

} // namespace bridgen
