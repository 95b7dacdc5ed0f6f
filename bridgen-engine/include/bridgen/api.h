//===- api.h - Analysed API items, parameterized by phase -------*- C++ -*-===//
//
// An Api is one item the bridge will expose (a struct, a function, a
// typedef...) together with what analysis has learnt about it so far. The
// phase tag selects the analysis payload for structs: before function
// analysis only field data exists; afterwards constructor and allocator
// dependencies are known as well.
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_API_H
#define BRIDGEN_API_H

#include "bridgen/qualified_name.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bridgen {

enum class TypeKind {
  Pod,    // passed by value
  NonPod, // opaque, behind UniquePtr or a reference
};

struct PodAnalysis {
  TypeKind kind = TypeKind::NonPod;
  std::vector<QualifiedName> bases;
  /// Types of the fields, for value-safe structs only.
  std::vector<QualifiedName> field_types;
};

struct PodAndDepAnalysis {
  PodAnalysis pod;
  std::vector<QualifiedName> constructor_and_allocator_deps;
};

struct TypedefAnalysis {
  std::vector<QualifiedName> deps;
};

struct FnAnalysis {
  std::string rust_name;
  std::vector<QualifiedName> deps;
};

struct RustSubclassFnDetails {
  std::vector<QualifiedName> dependencies;
};

/// Before function analysis has run.
struct FnPrePhase {
  using StructAnalysis = PodAnalysis;
};

/// After function analysis: allocator and constructor deps are available.
struct FnPhase {
  using StructAnalysis = PodAndDepAnalysis;
};

namespace api {

struct Typedef {
  QualifiedName name;
  std::optional<QualifiedName> old_tyname;
  TypedefAnalysis analysis;
};

template <typename Phase> struct Struct {
  QualifiedName name;
  typename Phase::StructAnalysis analysis;
};

struct Enum {
  QualifiedName name;
};

struct Function {
  QualifiedName name;
  FnAnalysis analysis;
};

struct Subclass {
  QualifiedName name;
  QualifiedName superclass;
};

/// A function generated to forward a virtual call into a Rust subclass.
struct RustSubclassFn {
  QualifiedName name;
  RustSubclassFnDetails details;
};

struct ForwardDeclaration {
  QualifiedName name;
};

/// A concrete instantiation of a template, e.g. std::vector<int>.
struct ConcreteType {
  QualifiedName name;
  std::string cpp_definition;
};

struct StringConstructor {
  QualifiedName name;
};

struct Const {
  QualifiedName name;
};

struct ExternCppType {
  QualifiedName name;
};

/// Something we could not bridge; kept so that the reason can be reported.
struct IgnoredItem {
  QualifiedName name;
  std::string reason;
};

} // namespace api

template <typename Phase> struct Api {
  std::variant<api::Typedef, api::Struct<Phase>, api::Enum, api::Function, api::Subclass,
               api::RustSubclassFn, api::ForwardDeclaration, api::ConcreteType,
               api::StringConstructor, api::Const, api::ExternCppType, api::IgnoredItem>
      kind;
};

} // namespace bridgen

#endif // BRIDGEN_API_H
