//===- ast_helpers.cpp - Utility helpers for binding AST types ------------===//

#include "bridgen/ast_helpers.h"

#include "llvm/ADT/SmallVector.h"

#include <type_traits>
#include <utility>

namespace bridgen {
namespace ast {

static std::unique_ptr<Type> clonePtr(const std::unique_ptr<Type> &ty) {
  if (!ty)
    return nullptr;
  return std::make_unique<Type>(cloneType(*ty));
}

static std::vector<Type> cloneVec(const std::vector<Type> &types) {
  std::vector<Type> out;
  out.reserve(types.size());
  for (const auto &t : types)
    out.push_back(cloneType(t));
  return out;
}

static PathSegment cloneSegment(const PathSegment &seg) {
  PathSegment out;
  out.ident = seg.ident;
  if (seg.generic_args) {
    std::vector<GenericArgument> args;
    for (const auto &arg : *seg.generic_args) {
      if (auto *t = std::get_if<GenericArgType>(&arg))
        args.push_back(GenericArgType{clonePtr(t->ty)});
      else if (auto *lt = std::get_if<GenericArgLifetime>(&arg))
        args.push_back(*lt);
      else
        args.push_back(std::get<GenericArgConst>(arg));
    }
    out.generic_args = std::move(args);
  }
  return out;
}

Type cloneType(const Type &ty) {
  return std::visit(
      [](const auto &k) -> Type {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, TypePath>) {
          TypePath p;
          p.leading_colon = k.leading_colon;
          for (const auto &seg : k.segments)
            p.segments.push_back(cloneSegment(seg));
          return Type{std::move(p)};
        } else if constexpr (std::is_same_v<T, TypePtr>) {
          return Type{TypePtr{k.is_mutable, clonePtr(k.elem)}};
        } else if constexpr (std::is_same_v<T, TypeReference>) {
          return Type{TypeReference{k.lifetime, k.is_mutable, clonePtr(k.elem)}};
        } else if constexpr (std::is_same_v<T, TypeArray>) {
          return Type{TypeArray{clonePtr(k.elem), k.len}};
        } else if constexpr (std::is_same_v<T, TypeSlice>) {
          return Type{TypeSlice{clonePtr(k.elem)}};
        } else if constexpr (std::is_same_v<T, TypeTuple>) {
          return Type{TypeTuple{cloneVec(k.elems)}};
        } else if constexpr (std::is_same_v<T, TypeBareFn>) {
          return Type{TypeBareFn{k.is_unsafe, k.abi, cloneVec(k.inputs), clonePtr(k.output)}};
        } else {
          return Type{TypeNever{}};
        }
      },
      ty.kind);
}

Type pathType(llvm::StringRef path, std::vector<Type> genericArgs) {
  TypePath p;
  p.leading_colon = path.consume_front("::");
  llvm::SmallVector<llvm::StringRef, 4> parts;
  path.split(parts, "::");
  for (auto part : parts)
    p.segments.push_back(PathSegment{part.str(), std::nullopt});
  if (!genericArgs.empty() && !p.segments.empty()) {
    std::vector<GenericArgument> args;
    for (auto &t : genericArgs)
      args.push_back(GenericArgType{std::make_unique<Type>(std::move(t))});
    p.segments.back().generic_args = std::move(args);
  }
  return Type{std::move(p)};
}

Type pathType(llvm::StringRef path, Type genericArg) {
  std::vector<Type> args;
  args.push_back(std::move(genericArg));
  return pathType(path, std::move(args));
}

Type ptrType(bool isMutable, Type elem) {
  return Type{TypePtr{isMutable, std::make_unique<Type>(std::move(elem))}};
}

Type refType(bool isMutable, Type elem) {
  return Type{TypeReference{std::nullopt, isMutable, std::make_unique<Type>(std::move(elem))}};
}

QualifiedName typeNameFromPath(const TypePath &path) {
  std::vector<std::string> ns;
  std::string last;
  for (size_t i = 0; i < path.segments.size(); ++i) {
    if (i + 1 == path.segments.size())
      last = path.segments[i].ident;
    else
      ns.push_back(path.segments[i].ident);
  }
  return QualifiedName(std::move(ns), std::move(last));
}

std::optional<QualifiedName> typeToTypeName(const Type &ty) {
  if (auto *p = std::get_if<TypePath>(&ty.kind))
    return typeNameFromPath(*p);
  return std::nullopt;
}

std::vector<Attribute> stripAttr(std::vector<Attribute> attrs, llvm::StringRef path) {
  std::vector<Attribute> out;
  out.reserve(attrs.size());
  for (auto &a : attrs)
    if (a.path != path)
      out.push_back(std::move(a));
  return out;
}

} // namespace ast
} // namespace bridgen
