//===- known_types.h - Registry of well-known foreign types -----*- C++ -*-===//
//
// Static table of types the bridge understands natively: C++ standard library
// types that have a dedicated bridge representation, and the primitive
// scalars that are always safe to pass by value.
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_KNOWN_TYPES_H
#define BRIDGEN_KNOWN_TYPES_H

#include "bridgen/qualified_name.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <optional>

namespace bridgen {

struct KnownType {
  /// Identifier the binding generator emits for the type, e.g. "std_string".
  llvm::StringRef bindgen_name;
  /// Spelling on the C++ side, e.g. "std::string".
  llvm::StringRef cpp_name;
  /// Identifier the bridge layer uses instead, if any, e.g. "CxxString".
  std::optional<llvm::StringRef> bridge_replacement;
  /// Whether the type can be held by value inside a value-safe struct.
  bool by_value_safe;
};

/// All registry entries, in table order.
llvm::ArrayRef<KnownType> knownTypes();

/// Look up an entry by the generator's leaf identifier.
const KnownType *findKnownType(llvm::StringRef bindgenName);

/// The bridge-safe identifier to substitute for \p bindgenName, if any.
std::optional<llvm::StringRef> knownTypeReplacement(llvm::StringRef bindgenName);

/// Whether \p name refers to a registry entry. Primitive scalars are also
/// recognized under the raw-type namespaces the generator spells them in
/// (std::os::raw, core::ffi, libc).
const KnownType *findKnownType(const QualifiedName &name);

} // namespace bridgen

#endif // BRIDGEN_KNOWN_TYPES_H
