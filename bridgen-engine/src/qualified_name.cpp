//===- qualified_name.cpp - Namespaced identifiers for bridge items -------===//

#include "bridgen/qualified_name.h"

#include "llvm/ADT/SmallVector.h"

namespace bridgen {

QualifiedName QualifiedName::parse(llvm::StringRef text) {
  text.consume_front("::");
  llvm::SmallVector<llvm::StringRef, 4> parts;
  text.split(parts, "::");
  std::vector<std::string> ns;
  for (size_t i = 0; i + 1 < parts.size(); ++i)
    ns.push_back(parts[i].str());
  return QualifiedName(std::move(ns), parts.empty() ? std::string() : parts.back().str());
}

std::string QualifiedName::toString() const {
  std::string out;
  for (const auto &seg : ns_) {
    out += seg;
    out += "::";
  }
  out += name_;
  return out;
}

} // namespace bridgen
