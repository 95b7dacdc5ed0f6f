//===- ast_helpers.h - Utility helpers for binding AST types ----*- C++ -*-===//
//
// Construction, cloning and attribute helpers for the types in ast_types.h.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bridgen/ast_types.h"
#include "bridgen/qualified_name.h"

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>
#include <vector>

namespace bridgen {
namespace ast {

/// Deep copy of a type expression (types own their children via unique_ptr).
Type cloneType(const Type &ty);

/// Build a path type from "a::b::C", optionally giving the last segment
/// generic type arguments.
Type pathType(llvm::StringRef path, std::vector<Type> genericArgs = {});
/// Single generic argument, e.g. pathType("UniquePtr", pathType("T")).
Type pathType(llvm::StringRef path, Type genericArg);

Type ptrType(bool isMutable, Type elem);
Type refType(bool isMutable, Type elem);

/// The qualified name of a path type's segments (generic arguments ignored),
/// or nullopt for any other type shape.
std::optional<QualifiedName> typeToTypeName(const Type &ty);
QualifiedName typeNameFromPath(const TypePath &path);

/// Remove every attribute whose path is exactly \p path.
std::vector<Attribute> stripAttr(std::vector<Attribute> attrs, llvm::StringRef path);

} // namespace ast
} // namespace bridgen
