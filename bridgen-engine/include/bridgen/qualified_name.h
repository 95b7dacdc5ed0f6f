//===- qualified_name.h - Namespaced identifiers for bridge items -*- C++ -*-===//
//
// A fully-scoped name for a type or function discovered in a foreign
// interface. Used as the node identity in the API dependency graph and as a
// key in the by-value checker's tables.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace bridgen {

class QualifiedName {
public:
  QualifiedName() = default;
  explicit QualifiedName(std::string name) : name_(std::move(name)) {}
  QualifiedName(std::vector<std::string> ns, std::string name)
      : ns_(std::move(ns)), name_(std::move(name)) {}

  /// Split "a::b::C" into namespace {a, b} and final name C. A leading "::"
  /// is ignored.
  static QualifiedName parse(llvm::StringRef text);

  const std::vector<std::string> &getNamespace() const { return ns_; }
  const std::string &getFinalItem() const { return name_; }
  bool isTopLevel() const { return ns_.empty(); }

  /// "a::b::C", or just "C" for a top-level name.
  std::string toString() const;

  bool operator==(const QualifiedName &other) const {
    return name_ == other.name_ && ns_ == other.ns_;
  }
  bool operator!=(const QualifiedName &other) const { return !(*this == other); }
  bool operator<(const QualifiedName &other) const {
    if (ns_ != other.ns_)
      return ns_ < other.ns_;
    return name_ < other.name_;
  }

private:
  std::vector<std::string> ns_;
  std::string name_;
};

struct QualifiedNameHash {
  std::size_t operator()(const QualifiedName &qn) const {
    std::size_t h = std::hash<std::string>{}(qn.getFinalItem());
    for (const auto &s : qn.getNamespace())
      h ^= std::hash<std::string>{}(s) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};

} // namespace bridgen

template <> struct std::hash<bridgen::QualifiedName> : bridgen::QualifiedNameHash {};
