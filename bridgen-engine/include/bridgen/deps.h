//===- deps.h - Dependencies between analysed API items ---------*- C++ -*-===//
//
// Which other items an Api refers to, so that the emitter can order output
// such that nothing is used before it is declared.
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_DEPS_H
#define BRIDGEN_DEPS_H

#include "bridgen/api.h"
#include "bridgen/qualified_name.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"

#include <map>
#include <set>
#include <string>

namespace bridgen {

/// Names this item depends on, in order. May contain duplicates.
llvm::SmallVector<QualifiedName, 4> deps(const Api<FnPrePhase> &item);
llvm::SmallVector<QualifiedName, 4> deps(const Api<FnPhase> &item);

template <typename Phase> const QualifiedName &name(const Api<Phase> &item) {
  return std::visit([](const auto &a) -> const QualifiedName & { return a.name; }, item.kind);
}

/// Comma-separated dependency list, for diagnostics.
template <typename Phase> std::string formatDeps(const Api<Phase> &item) {
  std::string out;
  for (const auto &d : deps(item)) {
    if (!out.empty())
      out += ",";
    out += d.toString();
  }
  return out;
}

using DependencyGraph = std::map<QualifiedName, std::set<QualifiedName>>;

/// Deduplicated dependency set per item. Every item gets an entry, even one
/// without dependencies.
template <typename Phase> DependencyGraph buildDependencyGraph(llvm::ArrayRef<Api<Phase>> apis) {
  DependencyGraph graph;
  for (const auto &a : apis) {
    auto &edges = graph[name(a)];
    for (auto &d : deps(a))
      edges.insert(std::move(d));
  }
  return graph;
}

} // namespace bridgen

#endif // BRIDGEN_DEPS_H
