//===- ast_types.h - C++ AST types for generated bindings (msgpack) -------===//
//
// Mirror of the subset of a Rust syn tree that the header-to-binding
// generator emits for a native interface. These types are deserialized from
// msgpack (via rmp_serde on the Rust side) and are also what the bridge
// converter produces.
//
// Serde serialization format (rmp_serde::to_vec_named):
//   - Structs → msgpack map with string keys
//   - Enums (externally tagged) → {"VariantName": payload}
//     - Struct variants → {"Variant": {"field1": ..., "field2": ...}}
//     - Newtype variants → {"Variant": value}
//     - Unit variants → "Variant"
//   - Option<T> → null or T
//   - Vec<T> → msgpack array
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bridgen {
namespace ast {

// ── Visibility ────────────────────────────────────────────────────────────

enum class Visibility : int {
  Inherited = 0,
  Public = 1,
  Crate = 2,
};

// ── Attributes ────────────────────────────────────────────────────────────

/// An outer attribute such as `#[repr(C)]` (path "repr", tokens "(C)") or
/// `#[link_name = "\u{1}_ZN5PointC1Ev"]`.
struct Attribute {
  std::string path;
  std::string tokens;
};

// Forward declarations
struct Type;

// ── Paths and generic arguments ───────────────────────────────────────────

struct GenericArgType {
  std::unique_ptr<Type> ty;
};
struct GenericArgLifetime {
  std::string name;
};
struct GenericArgConst {
  std::string expr;
};

using GenericArgument = std::variant<GenericArgType, GenericArgLifetime, GenericArgConst>;

struct PathSegment {
  std::string ident;
  /// nullopt for a bare segment, otherwise the `<...>` argument list.
  std::optional<std::vector<GenericArgument>> generic_args;
};

// ── Type expressions ──────────────────────────────────────────────────────

struct TypePath {
  bool leading_colon = false;
  std::vector<PathSegment> segments;
};
struct TypePtr {
  bool is_mutable;
  std::unique_ptr<Type> elem;
};
struct TypeReference {
  std::optional<std::string> lifetime;
  bool is_mutable;
  std::unique_ptr<Type> elem;
};
struct TypeArray {
  std::unique_ptr<Type> elem;
  std::string len;
};
struct TypeSlice {
  std::unique_ptr<Type> elem;
};
struct TypeTuple {
  std::vector<Type> elems; // empty for the unit type
};
struct TypeBareFn {
  bool is_unsafe = false;
  std::optional<std::string> abi;
  std::vector<Type> inputs;
  std::unique_ptr<Type> output; // nullptr for unit return
};
struct TypeNever {};

struct Type {
  std::variant<TypePath, TypePtr, TypeReference, TypeArray, TypeSlice, TypeTuple, TypeBareFn,
               TypeNever>
      kind;
};

// ── Function signatures ───────────────────────────────────────────────────

/// `self`, `&self` or `&mut self`.
struct FnArgReceiver {
  bool is_reference;
  bool is_mutable;
};

/// `pat: ty`. bindgen only ever emits identifier patterns, so the pattern is
/// kept as its identifier text ("_" for a wildcard).
struct FnArgTyped {
  std::vector<Attribute> attrs;
  std::string pat;
  Type ty;
};

using FnArg = std::variant<FnArgReceiver, FnArgTyped>;

struct Signature {
  bool is_unsafe = false;
  std::string ident;
  std::vector<FnArg> inputs;
  bool is_variadic = false;
  std::optional<Type> output; // nullopt for `-> ()`
};

// ── Foreign (extern block) items ──────────────────────────────────────────

struct ForeignItemFn {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  Signature sig;
};

/// `type Foo;` inside an extern block.
struct ForeignItemType {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  std::string ident;
};

struct ForeignItemStatic {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  bool is_mutable;
  std::string ident;
  Type ty;
};

/// A macro invocation such as `include!("foo.h");`.
struct ForeignItemMacro {
  std::string path;
  std::string tokens;
};

/// Anything else found in an extern block, kept as raw tokens.
struct ForeignItemVerbatim {
  std::string tokens;
};

using ForeignItem = std::variant<ForeignItemFn, ForeignItemType, ForeignItemStatic,
                                 ForeignItemMacro, ForeignItemVerbatim>;

// ── Expressions (impl method bodies) ──────────────────────────────────────

struct ExprCall {
  std::string func;
  std::vector<std::string> args;
};
struct ExprVerbatim {
  std::string tokens;
};

using Expr = std::variant<ExprCall, ExprVerbatim>;

struct Block {
  std::vector<Expr> stmts; // the last one is the tail expression
};

// ── Items ─────────────────────────────────────────────────────────────────

struct ItemForeignMod {
  std::vector<Attribute> attrs;
  bool is_unsafe = false;
  std::string abi; // "C", "C++"
  std::vector<ForeignItem> items;
};

enum class FieldsKind { Named, Unnamed, Unit };

struct Field {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  std::optional<std::string> ident; // nullopt for tuple-struct fields
  Type ty;
};

struct ItemStruct {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  std::string ident;
  std::vector<std::string> generic_params;
  FieldsKind fields_kind = FieldsKind::Named;
  std::vector<Field> fields;
};

struct Variant {
  std::vector<Attribute> attrs;
  std::string ident;
  std::optional<std::string> discriminant;
};

struct ItemEnum {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  std::string ident;
  std::vector<Variant> variants;
};

struct ImplItemMethod {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  Signature sig;
  Block block;
};

/// Associated consts, types and macros inside an impl, kept as raw tokens.
struct ImplItemVerbatim {
  std::string tokens;
};

using ImplItem = std::variant<ImplItemMethod, ImplItemVerbatim>;

struct ItemImpl {
  std::vector<Attribute> attrs;
  bool is_unsafe = false;
  std::vector<std::string> generic_params;
  std::optional<std::string> trait_; // path text of `impl Trait for`
  Type self_ty;
  std::vector<ImplItem> items;
};

/// Any item kind the converter passes through untouched (use, const, type
/// alias, free fn, ...). `kind` is the serde variant name it was read from.
struct ItemVerbatim {
  std::string kind;
  std::string tokens;
};

struct Item;

struct ItemMod {
  std::vector<Attribute> attrs;
  Visibility vis = Visibility::Inherited;
  std::string ident;
  /// False for `mod foo;` (a module declared without a body).
  bool has_content = true;
  std::vector<Item> content;
};

struct Item {
  std::variant<ItemForeignMod, ItemStruct, ItemEnum, ItemImpl, ItemMod, ItemVerbatim> kind;
};

} // namespace ast
} // namespace bridgen
