//===- msgpack_reader.cpp - Deserialize generated bindings ----------------===//
//
// Deserializes a binding module from msgpack bytes produced by Rust's
// rmp_serde::to_vec_named. The format uses maps with string keys for structs
// and externally-tagged representation for enums.
//
// Item kinds the converter never rewrites (use, const, type aliases, free
// functions...) are carried as their variant name plus raw tokens: the
// payload is either the token string or a map with a "tokens" key.
//
//===----------------------------------------------------------------------===//

#include "bridgen/msgpack_reader.h"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bridgen {

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void fail(const std::string &msg) {
  throw std::runtime_error("msgpack bindings parse error: " + msg);
}

// ── msgpack object helpers ──────────────────────────────────────────────────

/// Get a string from a msgpack object.
static std::string getString(const msgpack::object &obj) {
  if (obj.type != msgpack::type::STR)
    fail("expected string, got type " + std::to_string(obj.type));
  return std::string(obj.via.str.ptr, obj.via.str.size);
}

/// Get integer from msgpack object.
static int64_t getInt(const msgpack::object &obj) {
  if (obj.type == msgpack::type::POSITIVE_INTEGER) {
    if (obj.via.u64 > static_cast<uint64_t>(INT64_MAX))
      fail("unsigned value " + std::to_string(obj.via.u64) + " overflows int64_t");
    return static_cast<int64_t>(obj.via.u64);
  }
  if (obj.type == msgpack::type::NEGATIVE_INTEGER)
    return obj.via.i64;
  fail("expected integer, got type " + std::to_string(obj.type));
}

/// Get bool from msgpack object.
static bool getBool(const msgpack::object &obj) {
  if (obj.type == msgpack::type::BOOLEAN)
    return obj.via.boolean;
  fail("expected bool, got type " + std::to_string(obj.type));
}

/// Check if msgpack object is nil.
static bool isNil(const msgpack::object &obj) {
  return obj.type == msgpack::type::NIL;
}

/// Interpret a msgpack object as a map and find a key.
/// Returns nullptr if not found.
static const msgpack::object *mapGet(const msgpack::object &obj, std::string_view key) {
  if (obj.type != msgpack::type::MAP)
    fail("expected map, got type " + std::to_string(obj.type));
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR &&
        std::string_view(kv.key.via.str.ptr, kv.key.via.str.size) == key)
      return &kv.val;
  }
  return nullptr;
}

/// Interpret a msgpack object as a map and get a required key.
static const msgpack::object &mapReq(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    fail("missing required key: " + std::string(key));
  return *v;
}

/// Optional bool field: absent or nil reads as false.
static bool mapFlag(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  return v && !isNil(*v) && getBool(*v);
}

/// Get an array from a msgpack object.
static const msgpack::object *arrayData(const msgpack::object &obj, uint32_t &size) {
  if (obj.type != msgpack::type::ARRAY)
    fail("expected array, got type " + std::to_string(obj.type));
  size = obj.via.array.size;
  return obj.via.array.ptr;
}

/// Get the variant name from an externally-tagged enum.
/// Returns the variant name and a pointer to the payload.
/// For unit variants (encoded as bare string), payload is nullptr.
static std::pair<std::string, const msgpack::object *> getEnumVariant(const msgpack::object &obj) {
  // Unit variant: encoded as a bare string
  if (obj.type == msgpack::type::STR)
    return {getString(obj), nullptr};
  // Map with single entry: {"VariantName": payload}
  if (obj.type == msgpack::type::MAP && obj.via.map.size == 1) {
    const auto &kv = obj.via.map.ptr[0];
    return {getString(kv.key), &kv.val};
  }
  fail("expected enum variant (string or single-entry map), got type " + std::to_string(obj.type));
}

/// Payload of a non-unit variant.
static const msgpack::object &variantPayload(const std::string &name,
                                             const msgpack::object *payload) {
  if (!payload)
    fail("variant " + name + " requires a payload");
  return *payload;
}

// ── Optional helpers ────────────────────────────────────────────────────────

template <typename T, typename ParseFn>
static std::optional<T> parseOptional(const msgpack::object &obj, ParseFn parseFn) {
  if (isNil(obj))
    return std::nullopt;
  return parseFn(obj);
}

template <typename T, typename ParseFn>
static std::vector<T> parseVec(const msgpack::object &obj, ParseFn parseFn) {
  uint32_t size;
  const auto *arr = arrayData(obj, size);
  std::vector<T> result;
  result.reserve(size);
  for (uint32_t i = 0; i < size; ++i)
    result.push_back(parseFn(arr[i]));
  return result;
}

template <typename T, typename ParseFn>
static std::vector<T> parseOptVec(const msgpack::object *obj, ParseFn parseFn) {
  if (!obj || isNil(*obj))
    return {};
  return parseVec<T>(*obj, parseFn);
}

/// Optional string field: absent or nil reads as nullopt.
static std::optional<std::string> mapOptString(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    return std::nullopt;
  return parseOptional<std::string>(*v, getString);
}

/// Token text of a pass-through payload: a bare string or {"tokens": "..."}.
static std::string verbatimTokens(const std::string &kind, const msgpack::object *payload) {
  if (!payload || isNil(*payload))
    return kind;
  if (payload->type == msgpack::type::STR)
    return getString(*payload);
  return getString(mapReq(*payload, "tokens"));
}

// ── Forward declarations ────────────────────────────────────────────────────

static ast::Type parseType(const msgpack::object &obj);
static ast::Item parseItem(const msgpack::object &obj);

// ── Attributes & visibility ─────────────────────────────────────────────────

static ast::Attribute parseAttribute(const msgpack::object &obj) {
  ast::Attribute attr;
  attr.path = getString(mapReq(obj, "path"));
  attr.tokens = mapOptString(obj, "tokens").value_or("");
  return attr;
}

static std::vector<ast::Attribute> parseAttrs(const msgpack::object &obj) {
  return parseOptVec<ast::Attribute>(mapGet(obj, "attrs"), parseAttribute);
}

static ast::Visibility parseVisibility(const msgpack::object &obj) {
  const auto *v = mapGet(obj, "vis");
  if (!v || isNil(*v))
    return ast::Visibility::Inherited;
  auto s = getString(*v);
  if (s == "Inherited")
    return ast::Visibility::Inherited;
  if (s == "Public")
    return ast::Visibility::Public;
  if (s == "Crate")
    return ast::Visibility::Crate;
  fail("unknown Visibility: " + s);
}

// ── Types ───────────────────────────────────────────────────────────────────

static std::unique_ptr<ast::Type> parseTypePtr(const msgpack::object &obj) {
  return std::make_unique<ast::Type>(parseType(obj));
}

static ast::GenericArgument parseGenericArgument(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  const auto &p = variantPayload(name, payload);
  if (name == "Type")
    return ast::GenericArgType{parseTypePtr(p)};
  if (name == "Lifetime")
    return ast::GenericArgLifetime{getString(p)};
  if (name == "Const")
    return ast::GenericArgConst{getString(p)};
  fail("unknown GenericArgument variant: " + name);
}

static ast::PathSegment parsePathSegment(const msgpack::object &obj) {
  ast::PathSegment seg;
  seg.ident = getString(mapReq(obj, "ident"));
  if (const auto *args = mapGet(obj, "arguments"))
    seg.generic_args = parseOptional<std::vector<ast::GenericArgument>>(
        *args, [](const msgpack::object &o) {
          return parseVec<ast::GenericArgument>(o, parseGenericArgument);
        });
  return seg;
}

static ast::Type parseType(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  ast::Type ty;

  if (name == "Never") {
    ty.kind = ast::TypeNever{};
    return ty;
  }

  const auto &p = variantPayload(name, payload);
  if (name == "Path") {
    ast::TypePath path;
    path.leading_colon = mapFlag(p, "leading_colon");
    path.segments = parseVec<ast::PathSegment>(mapReq(p, "segments"), parsePathSegment);
    if (path.segments.empty())
      fail("Path type with no segments");
    ty.kind = std::move(path);
  } else if (name == "Ptr") {
    ty.kind = ast::TypePtr{mapFlag(p, "mutability"), parseTypePtr(mapReq(p, "elem"))};
  } else if (name == "Reference") {
    ty.kind = ast::TypeReference{mapOptString(p, "lifetime"), mapFlag(p, "mutability"),
                                 parseTypePtr(mapReq(p, "elem"))};
  } else if (name == "Array") {
    const auto &len = mapReq(p, "len");
    ty.kind = ast::TypeArray{parseTypePtr(mapReq(p, "elem")),
                             len.type == msgpack::type::STR ? getString(len)
                                                            : std::to_string(getInt(len))};
  } else if (name == "Slice") {
    ty.kind = ast::TypeSlice{parseTypePtr(mapReq(p, "elem"))};
  } else if (name == "Tuple") {
    ty.kind = ast::TypeTuple{parseVec<ast::Type>(p, parseType)};
  } else if (name == "BareFn") {
    ast::TypeBareFn fn;
    fn.is_unsafe = mapFlag(p, "unsafety");
    fn.abi = mapOptString(p, "abi");
    fn.inputs = parseVec<ast::Type>(mapReq(p, "inputs"), parseType);
    if (const auto *out = mapGet(p, "output"); out && !isNil(*out))
      fn.output = parseTypePtr(*out);
    ty.kind = std::move(fn);
  } else {
    fail("unknown Type variant: " + name);
  }
  return ty;
}

// ── Signatures ──────────────────────────────────────────────────────────────

static ast::FnArg parseFnArg(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  const auto &p = variantPayload(name, payload);
  if (name == "Receiver")
    return ast::FnArgReceiver{mapFlag(p, "reference"), mapFlag(p, "mutability")};
  if (name == "Typed")
    return ast::FnArgTyped{parseAttrs(p), getString(mapReq(p, "pat")),
                           parseType(mapReq(p, "ty"))};
  fail("unknown FnArg variant: " + name);
}

static ast::Signature parseSignature(const msgpack::object &obj) {
  ast::Signature sig;
  sig.is_unsafe = mapFlag(obj, "unsafety");
  sig.ident = getString(mapReq(obj, "ident"));
  sig.inputs = parseVec<ast::FnArg>(mapReq(obj, "inputs"), parseFnArg);
  sig.is_variadic = mapFlag(obj, "variadic");
  if (const auto *out = mapGet(obj, "output"))
    sig.output = parseOptional<ast::Type>(*out, parseType);
  return sig;
}

// ── Extern blocks ───────────────────────────────────────────────────────────

static ast::ForeignItem parseForeignItem(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  if (name == "Fn") {
    const auto &p = variantPayload(name, payload);
    return ast::ForeignItemFn{parseAttrs(p), parseVisibility(p), parseSignature(mapReq(p, "sig"))};
  }
  if (name == "Type") {
    const auto &p = variantPayload(name, payload);
    return ast::ForeignItemType{parseAttrs(p), parseVisibility(p), getString(mapReq(p, "ident"))};
  }
  if (name == "Static") {
    const auto &p = variantPayload(name, payload);
    return ast::ForeignItemStatic{parseAttrs(p), parseVisibility(p), mapFlag(p, "mutability"),
                                  getString(mapReq(p, "ident")), parseType(mapReq(p, "ty"))};
  }
  if (name == "Macro") {
    const auto &p = variantPayload(name, payload);
    return ast::ForeignItemMacro{getString(mapReq(p, "path")),
                                 mapOptString(p, "tokens").value_or("")};
  }
  // Left for the converter to reject with a proper diagnostic.
  return ast::ForeignItemVerbatim{verbatimTokens(name, payload)};
}

static ast::ItemForeignMod parseForeignMod(const msgpack::object &obj) {
  ast::ItemForeignMod fm;
  fm.attrs = parseAttrs(obj);
  fm.is_unsafe = mapFlag(obj, "unsafety");
  fm.abi = mapOptString(obj, "abi").value_or("C");
  fm.items = parseVec<ast::ForeignItem>(mapReq(obj, "items"), parseForeignItem);
  return fm;
}

// ── Structs & enums ─────────────────────────────────────────────────────────

static ast::Field parseField(const msgpack::object &obj) {
  ast::Field f;
  f.attrs = parseAttrs(obj);
  f.vis = parseVisibility(obj);
  f.ident = mapOptString(obj, "ident");
  f.ty = parseType(mapReq(obj, "ty"));
  return f;
}

static std::vector<std::string> parseGenerics(const msgpack::object &obj) {
  return parseOptVec<std::string>(mapGet(obj, "generics"), getString);
}

static ast::ItemStruct parseStruct(const msgpack::object &obj) {
  ast::ItemStruct s;
  s.attrs = parseAttrs(obj);
  s.vis = parseVisibility(obj);
  s.ident = getString(mapReq(obj, "ident"));
  s.generic_params = parseGenerics(obj);

  auto [kind, payload] = getEnumVariant(mapReq(obj, "fields"));
  if (kind == "Unit") {
    s.fields_kind = ast::FieldsKind::Unit;
  } else if (kind == "Named") {
    s.fields_kind = ast::FieldsKind::Named;
    s.fields = parseVec<ast::Field>(variantPayload(kind, payload), parseField);
  } else if (kind == "Unnamed") {
    s.fields_kind = ast::FieldsKind::Unnamed;
    s.fields = parseVec<ast::Field>(variantPayload(kind, payload), parseField);
  } else {
    fail("unknown Fields variant: " + kind);
  }
  return s;
}

static ast::Variant parseVariant(const msgpack::object &obj) {
  ast::Variant v;
  v.attrs = parseAttrs(obj);
  v.ident = getString(mapReq(obj, "ident"));
  if (const auto *d = mapGet(obj, "discriminant"); d && !isNil(*d))
    v.discriminant = d->type == msgpack::type::STR ? getString(*d) : std::to_string(getInt(*d));
  return v;
}

static ast::ItemEnum parseEnum(const msgpack::object &obj) {
  ast::ItemEnum e;
  e.attrs = parseAttrs(obj);
  e.vis = parseVisibility(obj);
  e.ident = getString(mapReq(obj, "ident"));
  e.variants = parseVec<ast::Variant>(mapReq(obj, "variants"), parseVariant);
  return e;
}

// ── Impl blocks ─────────────────────────────────────────────────────────────

static ast::Expr parseExpr(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  const auto &p = variantPayload(name, payload);
  if (name == "Call")
    return ast::ExprCall{getString(mapReq(p, "func")),
                         parseVec<std::string>(mapReq(p, "args"), getString)};
  if (name == "Verbatim")
    return ast::ExprVerbatim{getString(p)};
  fail("unknown Expr variant: " + name);
}

static ast::ImplItem parseImplItem(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  if (name == "Method") {
    const auto &p = variantPayload(name, payload);
    ast::ImplItemMethod m;
    m.attrs = parseAttrs(p);
    m.vis = parseVisibility(p);
    m.sig = parseSignature(mapReq(p, "sig"));
    m.block.stmts = parseOptVec<ast::Expr>(mapGet(p, "block"), parseExpr);
    return m;
  }
  return ast::ImplItemVerbatim{verbatimTokens(name, payload)};
}

static ast::ItemImpl parseImpl(const msgpack::object &obj) {
  ast::ItemImpl impl;
  impl.attrs = parseAttrs(obj);
  impl.is_unsafe = mapFlag(obj, "unsafety");
  impl.generic_params = parseGenerics(obj);
  impl.trait_ = mapOptString(obj, "trait_");
  impl.self_ty = parseType(mapReq(obj, "self_ty"));
  impl.items = parseVec<ast::ImplItem>(mapReq(obj, "items"), parseImplItem);
  return impl;
}

// ── Modules & items ─────────────────────────────────────────────────────────

static ast::ItemMod parseMod(const msgpack::object &obj) {
  ast::ItemMod m;
  m.attrs = parseAttrs(obj);
  m.vis = parseVisibility(obj);
  m.ident = getString(mapReq(obj, "ident"));
  const auto *content = mapGet(obj, "content");
  m.has_content = content && !isNil(*content);
  if (m.has_content)
    m.content = parseVec<ast::Item>(*content, parseItem);
  return m;
}

static ast::Item parseItem(const msgpack::object &obj) {
  auto [name, payload] = getEnumVariant(obj);
  ast::Item item;
  if (name == "ForeignMod")
    item.kind = parseForeignMod(variantPayload(name, payload));
  else if (name == "Struct")
    item.kind = parseStruct(variantPayload(name, payload));
  else if (name == "Enum")
    item.kind = parseEnum(variantPayload(name, payload));
  else if (name == "Impl")
    item.kind = parseImpl(variantPayload(name, payload));
  else if (name == "Mod")
    item.kind = parseMod(variantPayload(name, payload));
  else
    item.kind = ast::ItemVerbatim{name, verbatimTokens(name, payload)};
  return item;
}

// ── Public API ──────────────────────────────────────────────────────────────

ast::ItemMod parseMsgpackBindings(const uint8_t *data, size_t size) {
  msgpack::object_handle oh;
  try {
    oh = msgpack::unpack(reinterpret_cast<const char *>(data), size);
  } catch (const msgpack::unpack_error &e) {
    fail(std::string("malformed msgpack: ") + e.what());
  }
  return parseMod(oh.get());
}

ast::ItemMod parseJsonBindings(const uint8_t *data, size_t size) {
  // Parse JSON, convert to msgpack bytes, then reuse the existing parser.
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(data, data + size);
  } catch (const nlohmann::json::parse_error &e) {
    fail(std::string("malformed JSON: ") + e.what());
  }
  auto msgpackBytes = nlohmann::json::to_msgpack(j);
  return parseMsgpackBindings(msgpackBytes.data(), msgpackBytes.size());
}

} // namespace bridgen
