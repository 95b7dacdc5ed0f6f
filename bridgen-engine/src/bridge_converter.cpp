//===- bridge_converter.cpp - Rewrite generated bindings into a bridge ----===//
//
// One pass over the generated items, in order. Struct definitions are
// classified up front because whether a struct becomes a value type or an
// opaque alias decides how everything referring to it is emitted.
//
//===----------------------------------------------------------------------===//

#include "bridgen/bridge_converter.h"
#include "bridgen/ast_helpers.h"
#include "bridgen/known_types.h"

#include "llvm/ADT/STLExtras.h"

#include <set>
#include <utility>

namespace bridgen {

/// Accumulators for a single convert() call.
struct BridgeConverter::RunState {
  Classification classification;
  /// Every struct seen so far, in discovery order.
  std::vector<QualifiedName> types_found;
  /// Struct names used to strip "{Class}_" prefixes from method names.
  llvm::StringSet<> class_names;
  std::set<QualifiedName> encountered;
  /// Types with a MakeUnique need already recorded.
  std::set<QualifiedName> constructors;
  /// Types whose make_unique method has been synthesized.
  std::set<QualifiedName> factories;
  std::vector<AdditionalNeed> needs;
};

BridgeConverter::BridgeConverter(ConverterOptions options) : options_(std::move(options)) {}

// ── Classification ──────────────────────────────────────────────────────────

Classification BridgeConverter::findNestedPodTypes(const std::vector<ast::Item> &items) const {
  ByValueChecker checker;
  for (const auto &item : items)
    if (const auto *s = std::get_if<ast::ItemStruct>(&item.kind))
      checker.ingestStruct(*s);
  try {
    return checker.classify(options_.pod_requests);
  } catch (const PodCheckError &e) {
    throw ConvertError(ConvertError::Kind::UnsafePodType, e.getOffendingType().toString(),
                       std::string("unsafe POD type: ") + e.what());
  }
}

// ── Item synthesis ──────────────────────────────────────────────────────────

void BridgeConverter::appendCppDefinitionSquasher(std::vector<ast::Item> &out,
                                                  const std::string &ident,
                                                  ast::Item item) const {
  // Tell the bridge compiler the type is already defined on the C++ side so
  // it does not emit a second definition.
  if (!options_.old_rust) {
    ast::ItemForeignMod decl;
    decl.is_unsafe = true;
    decl.abi = "C++";
    decl.items.push_back(ast::ForeignItemType{{}, ast::Visibility::Inherited, ident});
    out.push_back(ast::Item{std::move(decl)});
  }
  out.push_back(std::move(item));
}

void BridgeConverter::generateTypeAlias(std::vector<ast::Item> &out,
                                        const std::string &ident) const {
  ast::ItemForeignMod alias;
  alias.abi = "C";
  alias.items.push_back(ast::ForeignItemType{{}, ast::Visibility::Inherited, ident});
  out.push_back(ast::Item{std::move(alias)});

  // The bridge compiler only accepts an opaque type it can see used somewhere
  // in the bridge, so give it a holder struct.
  ast::ItemStruct holder;
  holder.ident = ident + "ContainingStruct";
  ast::Field field;
  field.ident = "_0";
  field.ty = ast::pathType("UniquePtr", ast::pathType(ident));
  holder.fields.push_back(std::move(field));
  out.push_back(ast::Item{std::move(holder)});
}

static ast::Item convertStruct(ast::ItemStruct s) {
  s.attrs = ast::stripAttr(std::move(s.attrs), "repr");
  return ast::Item{std::move(s)};
}

static ast::Item convertEnum(ast::ItemEnum e) {
  e.attrs = ast::stripAttr(ast::stripAttr(std::move(e.attrs), "repr"), "derive");
  return ast::Item{std::move(e)};
}

/// Records the MakeUnique need for \p ty. An existing need is kept unless
/// \p overwrite is set, in which case its arguments are replaced.
static void recordMakeUnique(std::set<QualifiedName> &seen, std::vector<AdditionalNeed> &needs,
                             const QualifiedName &ty, std::vector<ast::Type> args,
                             bool overwrite = false) {
  if (seen.insert(ty).second) {
    needs.push_back(MakeUnique{ty, std::move(args)});
    return;
  }
  if (!overwrite)
    return;
  for (auto &need : needs) {
    auto *mu = std::get_if<MakeUnique>(&need);
    if (mu && mu->type == ty) {
      mu->constructor_args = std::move(args);
      return;
    }
  }
}

static void recordEncountered(std::set<QualifiedName> &seen, std::vector<EncounteredType> &out,
                              EncounteredTypeKind kind, const QualifiedName &name) {
  if (seen.insert(name).second)
    out.push_back(EncounteredType{kind, name});
}

// ── Constructors ────────────────────────────────────────────────────────────

void BridgeConverter::convertImpl(RunState &state, ast::ItemImpl impl,
                                  std::vector<ast::Item> &allItems) const {
  auto ty = ast::typeToTypeName(impl.self_ty);
  if (!ty)
    return;
  // Only constructors survive; every other method is reached through the
  // extern block instead.
  for (auto &implItem : impl.items) {
    auto *m = std::get_if<ast::ImplItemMethod>(&implItem);
    if (!m || m->sig.ident != "new")
      continue;
    if (!llvm::is_contained(state.types_found, *ty) || !state.factories.insert(*ty).second)
      continue;

    std::vector<ast::Type> argTypes;
    std::vector<std::string> argNames;
    std::vector<ast::FnArg> inputs;
    for (auto &in : m->sig.inputs) {
      auto *typed = std::get_if<ast::FnArgTyped>(&in);
      if (!typed)
        continue;
      typed->ty = convertType(std::move(typed->ty));
      argTypes.push_back(ast::cloneType(typed->ty));
      argNames.push_back(typed->pat);
      inputs.push_back(std::move(in));
    }
    // The factory's signature decides the helper's arguments, even when a
    // foreign constructor was seen first.
    recordMakeUnique(state.constructors, state.needs, *ty, std::move(argTypes), true);

    // Bob::make_unique(args) forwards to the C++ helper Bob_make_unique(args).
    const std::string typeName = ty->getFinalItem();
    ast::ImplItemMethod factory;
    factory.vis = m->vis;
    factory.sig.ident = "make_unique";
    factory.sig.is_unsafe = false;
    factory.sig.inputs = std::move(inputs);
    factory.sig.output = ast::pathType("UniquePtr", ast::pathType(typeName));
    factory.block.stmts.push_back(ast::ExprCall{typeName + "_make_unique", std::move(argNames)});

    ast::ItemImpl newImpl;
    newImpl.generic_params = impl.generic_params;
    newImpl.trait_ = impl.trait_;
    newImpl.self_ty = ast::cloneType(impl.self_ty);
    newImpl.items.push_back(std::move(factory));
    allItems.push_back(ast::Item{std::move(newImpl)});
  }
}

// ── Extern block contents ───────────────────────────────────────────────────

void BridgeConverter::convertForeignModItems(RunState &state,
                                             std::vector<ast::ForeignItem> items,
                                             std::vector<ast::ForeignItem> &out) const {
  for (auto &i : items) {
    auto *f = std::get_if<ast::ForeignItemFn>(&i);
    if (!f) {
      std::string what = std::holds_alternative<ast::ForeignItemType>(i)     ? "type"
                         : std::holds_alternative<ast::ForeignItemStatic>(i) ? "static"
                         : std::holds_alternative<ast::ForeignItemMacro>(i)  ? "macro"
                                                                             : "verbatim item";
      throw ConvertError(ConvertError::Kind::UnknownForeignItem, what,
                         "unsupported " + what + " in extern block");
    }
    if (auto converted = convertForeignFn(state, std::move(*f)))
      out.push_back(std::move(*converted));
  }
}

std::optional<ast::ForeignItemFn> BridgeConverter::convertForeignFn(RunState &state,
                                                                    ast::ForeignItemFn fun) const {
  const std::string oldName = fun.sig.ident;
  // Constructors are named {Class}_{Class}; they are replaced by the
  // make_unique factory produced from the impl block.
  for (const auto &ty : state.types_found) {
    if (oldName != ty.getFinalItem() + "_" + ty.getFinalItem())
      continue;
    std::vector<ast::Type> argTypes;
    for (const auto &in : fun.sig.inputs) {
      const auto *typed = std::get_if<ast::FnArgTyped>(&in);
      if (typed && typed->pat != "this")
        argTypes.push_back(convertType(ast::cloneType(typed->ty)));
    }
    recordMakeUnique(state.constructors, state.needs, ty, std::move(argTypes));
    return std::nullopt;
  }

  fun.sig.output = convertReturnType(std::move(fun.sig.output));
  bool isMethod = false;
  for (auto &in : fun.sig.inputs)
    isMethod |= convertFnArg(in);

  if (isMethod) {
    // Methods arrive flattened as {Class}_{method}; the bridge wants just
    // the method name.
    if (auto prefix = findClassPrefix(state.class_names, oldName))
      fun.sig.ident = oldName.substr(prefix->size() + 1);
  }
  fun.attrs = ast::stripAttr(std::move(fun.attrs), "link_name");
  return fun;
}

// ── Entry point ─────────────────────────────────────────────────────────────

BridgeConversion BridgeConverter::convert(ast::ItemMod bindings,
                                          std::optional<std::string> extraInclusion) const {
  if (!bindings.has_content)
    throw ConvertError(ConvertError::Kind::NoContent, bindings.ident,
                       "module '" + bindings.ident + "' has no content");

  RunState state;
  state.classification = findNestedPodTypes(bindings.content);

  BridgeConversion result;
  std::vector<ast::Item> bridgeItems;
  std::optional<ast::ItemForeignMod> externCMod;

  for (auto &item : bindings.content) {
    if (auto *fm = std::get_if<ast::ItemForeignMod>(&item.kind)) {
      if (!externCMod) {
        // The first extern block provides the attributes and ABI; the contents
        // of every extern block are merged into it.
        ast::ItemForeignMod merged;
        merged.attrs = fm->attrs;
        merged.is_unsafe = fm->is_unsafe;
        merged.abi = fm->abi;
        std::vector<std::string> fullIncludeList = options_.include_list;
        if (extraInclusion)
          fullIncludeList.push_back(*extraInclusion);
        for (const auto &inc : fullIncludeList)
          merged.items.push_back(ast::ForeignItemMacro{"include", "\"" + inc + "\""});
        externCMod = std::move(merged);
      }
      convertForeignModItems(state, std::move(fm->items), externCMod->items);
    } else if (auto *s = std::get_if<ast::ItemStruct>(&item.kind)) {
      QualifiedName tyname(s->ident);
      const std::string ident = s->ident;
      state.types_found.push_back(tyname);
      state.class_names.insert(ident);
      recordEncountered(state.encountered, result.types_to_disable, EncounteredTypeKind::Struct,
                        tyname);
      if (state.classification.isPod(tyname)) {
        // Full definition: both sides may access fields and pass by value.
        appendCppDefinitionSquasher(bridgeItems, ident, convertStruct(std::move(*s)));
      } else {
        // Opaque: reachable only through references and UniquePtr. This is
        // what lets self-referential types cross the bridge at all.
        generateTypeAlias(bridgeItems, ident);
      }
    } else if (auto *e = std::get_if<ast::ItemEnum>(&item.kind)) {
      const std::string ident = e->ident;
      recordEncountered(state.encountered, result.types_to_disable, EncounteredTypeKind::Enum,
                        QualifiedName(ident));
      appendCppDefinitionSquasher(bridgeItems, ident, convertEnum(std::move(*e)));
    } else if (auto *impl = std::get_if<ast::ItemImpl>(&item.kind)) {
      convertImpl(state, std::move(*impl), result.items);
    } else {
      result.items.push_back(std::move(item));
    }
  }

  result.additional_cpp_needs = std::move(state.needs);
  if (externCMod)
    bridgeItems.push_back(ast::Item{std::move(*externCMod)});

  ast::ItemMod bridge;
  bridge.attrs.push_back(ast::Attribute{"cxx::bridge", ""});
  bridge.vis = ast::Visibility::Public;
  bridge.ident = "cxxbridge";
  bridge.content = std::move(bridgeItems);
  result.items.push_back(ast::Item{std::move(bridge)});
  return result;
}

// ── Type & signature conversion ─────────────────────────────────────────────

static std::unique_ptr<ast::Type> convertBoxedType(std::unique_ptr<ast::Type> ty) {
  if (!ty)
    return ty;
  return std::make_unique<ast::Type>(convertType(std::move(*ty)));
}

static ast::TypePath convertTypePath(ast::TypePath typ) {
  for (auto &seg : typ.segments) {
    if (seg.generic_args) {
      for (auto &arg : *seg.generic_args)
        if (auto *t = std::get_if<ast::GenericArgType>(&arg))
          t->ty = convertBoxedType(std::move(t->ty));
    }
    if (auto replacement = knownTypeReplacement(seg.ident))
      seg.ident = replacement->str();
  }
  return typ;
}

ast::Type convertType(ast::Type ty) {
  if (auto *p = std::get_if<ast::TypePath>(&ty.kind))
    return ast::Type{convertTypePath(std::move(*p))};
  if (auto *ptr = std::get_if<ast::TypePtr>(&ty.kind)) {
    // No lifetime is inferred; the bridge compiler elides it.
    return ast::Type{
        ast::TypeReference{std::nullopt, ptr->is_mutable, convertBoxedType(std::move(ptr->elem))}};
  }
  if (auto *r = std::get_if<ast::TypeReference>(&ty.kind)) {
    r->elem = convertBoxedType(std::move(r->elem));
  } else if (auto *a = std::get_if<ast::TypeArray>(&ty.kind)) {
    a->elem = convertBoxedType(std::move(a->elem));
  } else if (auto *sl = std::get_if<ast::TypeSlice>(&ty.kind)) {
    sl->elem = convertBoxedType(std::move(sl->elem));
  } else if (auto *t = std::get_if<ast::TypeTuple>(&ty.kind)) {
    for (auto &e : t->elems)
      e = convertType(std::move(e));
  }
  return ty;
}

std::optional<ast::Type> convertReturnType(std::optional<ast::Type> rt) {
  if (!rt)
    return rt;
  return convertType(std::move(*rt));
}

bool convertFnArg(ast::FnArg &arg) {
  auto *typed = std::get_if<ast::FnArgTyped>(&arg);
  if (!typed)
    return false;
  typed->ty = convertType(std::move(typed->ty));
  if (typed->pat != "this")
    return false;
  typed->pat = "self";
  return true;
}

std::optional<std::string> findClassPrefix(const llvm::StringSet<> &classNames,
                                           llvm::StringRef fnName) {
  std::optional<std::string> best;
  for (const auto &entry : classNames) {
    llvm::StringRef cn = entry.getKey();
    if (fnName.size() <= cn.size() + 1 || fnName.substr(0, cn.size()) != cn ||
        fnName[cn.size()] != '_')
      continue;
    if (!best || cn.size() > best->size())
      best = cn.str();
  }
  return best;
}

} // namespace bridgen
