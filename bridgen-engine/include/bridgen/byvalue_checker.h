//===- byvalue_checker.h - Decide which structs can be passed by value -*- C++ -*-===//
//
// Records the field types of every struct the binding generator emitted and
// works out, for an explicit set of requests, whether each requested struct
// (and, transitively, every struct it contains) is safe to hold by value on
// both sides of the bridge. Anything not proven safe stays opaque.
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_BYVALUE_CHECKER_H
#define BRIDGEN_BYVALUE_CHECKER_H

#include "bridgen/ast_types.h"
#include "bridgen/qualified_name.h"

#include "llvm/ADT/ArrayRef.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridgen {

enum class TypeClassification { ValueSafe, Opaque };

/// Thrown by ByValueChecker::classify when a requested type cannot be proven
/// value-safe.
class PodCheckError : public std::runtime_error {
public:
  PodCheckError(QualifiedName offending, const std::string &reason)
      : std::runtime_error(reason), offending_(std::move(offending)) {}

  /// The first type found that could not be proven value-safe.
  const QualifiedName &getOffendingType() const { return offending_; }

private:
  QualifiedName offending_;
};

/// Verdicts for every ingested struct.
class Classification {
public:
  bool isPod(const QualifiedName &name) const {
    auto it = verdicts_.find(name);
    return it != verdicts_.end() && it->second == TypeClassification::ValueSafe;
  }

  std::optional<TypeClassification> lookup(const QualifiedName &name) const {
    auto it = verdicts_.find(name);
    if (it == verdicts_.end())
      return std::nullopt;
    return it->second;
  }

  const std::map<QualifiedName, TypeClassification> &verdicts() const { return verdicts_; }

private:
  friend class ByValueChecker;
  std::map<QualifiedName, TypeClassification> verdicts_;
};

class ByValueChecker {
public:
  ByValueChecker() = default;

  /// Record a struct's field dependencies. Nothing is validated until
  /// classify(); ingesting the same struct twice keeps the first record.
  void ingestStruct(const ast::ItemStruct &def);

  /// Decide which ingested structs are value-safe given the explicit
  /// \p requests. Every requested type and every struct it holds inline must
  /// be known and safe; types behind a pointer or reference need only be
  /// known and are not made value-safe. Otherwise throws PodCheckError naming
  /// the first offending type. Ingested structs not reached are Opaque.
  Classification classify(llvm::ArrayRef<QualifiedName> requests) const;

  /// Every type a single struct definition's fields mention, inline or behind
  /// a pointer, in field order.
  static std::vector<QualifiedName> getFieldTypes(const ast::ItemStruct &def);

private:
  struct StructDetails {
    /// Set when the struct can never be value-safe, whatever its fields.
    std::optional<std::string> unsafe_reason;
    /// Types held inline; each must itself be value-safe.
    std::vector<QualifiedName> inline_types;
    /// Types reached only through a pointer or reference; each must be known.
    std::vector<QualifiedName> pointee_types;
  };

  std::unordered_map<QualifiedName, StructDetails, QualifiedNameHash> structs_;
  /// Ingestion order, so verdict iteration and error reporting are stable.
  std::vector<QualifiedName> order_;
};

} // namespace bridgen

#endif // BRIDGEN_BYVALUE_CHECKER_H
