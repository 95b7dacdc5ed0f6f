//===- bridge_converter.h - Rewrite generated bindings into a bridge -*- C++ -*-===//
//
// Converts the raw bindings emitted by the header-to-binding generator into a
// module the bridge compiler accepts:
//   * replaces well-known types (std_unique_ptr → UniquePtr, ...)
//   * replaces raw pointers with references
//   * removes repr, derive and link_name attributes
//   * turns structs into either value types or opaque aliases
//   * replaces constructors with make_unique factories
//   * adds include! directives and wraps everything in a #[cxx::bridge] module
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_BRIDGE_CONVERTER_H
#define BRIDGEN_BRIDGE_CONVERTER_H

#include "bridgen/ast_types.h"
#include "bridgen/byvalue_checker.h"
#include "bridgen/qualified_name.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace bridgen {

/// Terminal failure of a conversion run. No partial output is produced.
class ConvertError : public std::runtime_error {
public:
  enum class Kind {
    NoContent,          // the input module has no body
    UnsafePodType,      // a requested by-value type cannot be proven safe
    UnknownForeignItem, // an extern block holds something other than a fn
  };

  ConvertError(Kind kind, std::string detail, const std::string &message)
      : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

  Kind getKind() const { return kind_; }
  /// The offending type name for UnsafePodType, the module or item
  /// description otherwise.
  const std::string &getDetail() const { return detail_; }

private:
  Kind kind_;
  std::string detail_;
};

enum class EncounteredTypeKind { Struct, Enum };

/// A type for which the converter already produced a bridge definition, so
/// the downstream generator must not emit its own.
struct EncounteredType {
  EncounteredTypeKind kind;
  QualifiedName name;

  bool operator==(const EncounteredType &other) const {
    return kind == other.kind && name == other.name;
  }
};

/// Request for a `std::unique_ptr<T> T_make_unique(args...)` helper on the
/// C++ side, standing in for an elided constructor.
struct MakeUnique {
  QualifiedName type;
  std::vector<ast::Type> constructor_args;
};

/// Extra C++ the native-helper generator must emit.
using AdditionalNeed = std::variant<MakeUnique>;

struct ConverterOptions {
  /// Headers to include!, in order.
  std::vector<std::string> include_list;
  /// Types the caller wants passed by value.
  std::vector<QualifiedName> pod_requests;
  /// Old bridge compilers cannot take `type X;` forward declarations for
  /// types that are also defined in the bridge.
  bool old_rust = false;
};

/// Results of a conversion.
struct BridgeConversion {
  std::vector<ast::Item> items;
  std::vector<EncounteredType> types_to_disable;
  std::vector<AdditionalNeed> additional_cpp_needs;
};

class BridgeConverter {
public:
  explicit BridgeConverter(ConverterOptions options);

  /// Convert one generated module. Throws ConvertError. Each call is
  /// independent: no state survives from one run to the next.
  BridgeConversion convert(ast::ItemMod bindings,
                           std::optional<std::string> extraInclusion = std::nullopt) const;

private:
  struct RunState;

  Classification findNestedPodTypes(const std::vector<ast::Item> &items) const;
  void appendCppDefinitionSquasher(std::vector<ast::Item> &out, const std::string &ident,
                                   ast::Item item) const;
  void generateTypeAlias(std::vector<ast::Item> &out, const std::string &ident) const;
  void convertImpl(RunState &state, ast::ItemImpl impl, std::vector<ast::Item> &allItems) const;
  void convertForeignModItems(RunState &state, std::vector<ast::ForeignItem> items,
                              std::vector<ast::ForeignItem> &out) const;
  std::optional<ast::ForeignItemFn> convertForeignFn(RunState &state,
                                                     ast::ForeignItemFn fun) const;

  ConverterOptions options_;
};

// ── Type & signature conversion ────────────────────────────────────────────

/// Rewrite a type for the bridge: known types get their bridge names, raw
/// pointers become references of the same mutability. Never fails.
ast::Type convertType(ast::Type ty);

/// Rewrite an optional return type (nullopt stays nullopt).
std::optional<ast::Type> convertReturnType(std::optional<ast::Type> rt);

/// Convert one argument. Returns true if it was the generator's `this`
/// parameter, which is renamed to `self`.
bool convertFnArg(ast::FnArg &arg);

/// Longest class name C in \p classNames such that \p fnName starts with
/// "C_" and has something after it.
std::optional<std::string> findClassPrefix(const llvm::StringSet<> &classNames,
                                           llvm::StringRef fnName);

} // namespace bridgen

#endif // BRIDGEN_BRIDGE_CONVERTER_H
