//===- test_msgpack_reader.cpp - Tests for the bindings reader ------------===//
//
// Feeds hand-written binding documents (JSON, plus one packed directly with
// msgpack-c) through the reader and checks the resulting AST.
//
//===----------------------------------------------------------------------===//

#include "bridgen/bridge_converter.h"
#include "bridgen/msgpack_reader.h"
#include "bridgen/printer.h"

#include <msgpack.hpp>

#include <cstdio>
#include <stdexcept>
#include <string>

using namespace bridgen;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

static ast::ItemMod parseJson(const std::string &text) {
  return parseJsonBindings(reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

/// Returns the reader's error message, or "" if parsing succeeded.
static std::string parseError(const std::string &text) {
  try {
    parseJson(text);
  } catch (const std::runtime_error &e) {
    return e.what();
  }
  return "";
}

// The generator's output for:
//   struct Point { int x; int y; Point(); int norm() const; };
static const char *kPointBindings = R"({
  "vis": "Public",
  "ident": "root",
  "content": [
    {"Use": "use std::os::raw;"},
    {"Struct": {
      "attrs": [{"path": "repr", "tokens": "(C)"}],
      "vis": "Public",
      "ident": "Point",
      "fields": {"Named": [
        {"vis": "Public", "ident": "x", "ty": {"Path": {"segments": [{"ident": "i32"}]}}},
        {"vis": "Public", "ident": "y", "ty": {"Path": {"segments": [{"ident": "i32"}]}}}
      ]}
    }},
    {"ForeignMod": {
      "abi": "C",
      "items": [
        {"Fn": {
          "attrs": [{"path": "link_name", "tokens": " = \"_ZN5PointC1Ev\""}],
          "vis": "Public",
          "sig": {
            "ident": "Point_Point",
            "inputs": [{"Typed": {"pat": "this", "ty": {"Ptr": {"mutability": true,
                        "elem": {"Path": {"segments": [{"ident": "Point"}]}}}}}}],
            "output": null
          }
        }},
        {"Fn": {
          "vis": "Public",
          "sig": {
            "ident": "Point_norm",
            "inputs": [{"Typed": {"pat": "this", "ty": {"Ptr": {"mutability": false,
                        "elem": {"Path": {"segments": [{"ident": "Point"}]}}}}}}],
            "output": {"Path": {"segments": [
              {"ident": "std"}, {"ident": "os"}, {"ident": "raw"}, {"ident": "c_int"}]}}
          }
        }}
      ]
    }}
  ]
})";

// ============================================================================
// Test: a complete module
// ============================================================================
static void test_read_point_module() {
  TEST(read_point_module);

  auto mod = parseJson(kPointBindings);
  if (mod.ident != "root" || mod.vis != ast::Visibility::Public || !mod.has_content ||
      mod.content.size() != 3) {
    FAIL("expected module root with three items");
    return;
  }
  const auto *use = std::get_if<ast::ItemVerbatim>(&mod.content[0].kind);
  if (!use || use->kind != "Use" || use->tokens != "use std::os::raw;") {
    FAIL("use should be read as a verbatim item");
    return;
  }
  const auto *s = std::get_if<ast::ItemStruct>(&mod.content[1].kind);
  if (!s || s->ident != "Point" || s->attrs.size() != 1 || s->attrs[0].path != "repr" ||
      s->fields_kind != ast::FieldsKind::Named || s->fields.size() != 2 ||
      typeToString(s->fields[1].ty) != "i32") {
    FAIL("unexpected Point struct");
    return;
  }
  const auto *fm = std::get_if<ast::ItemForeignMod>(&mod.content[2].kind);
  if (!fm || fm->abi != "C" || fm->items.size() != 2) {
    FAIL("expected extern block with two functions");
    return;
  }
  const auto *norm = std::get_if<ast::ForeignItemFn>(&fm->items[1]);
  if (!norm || norm->sig.ident != "Point_norm" || !norm->sig.output ||
      typeToString(*norm->sig.output) != "std::os::raw::c_int") {
    FAIL("unexpected Point_norm signature");
    return;
  }
  const auto *self = std::get_if<ast::FnArgTyped>(&norm->sig.inputs[0]);
  if (!self || self->pat != "this" || typeToString(self->ty) != "*const Point") {
    FAIL("expected this: *const Point");
    return;
  }

  PASS();
}

// ============================================================================
// Test: read and convert end to end
// ============================================================================
static void test_read_and_convert() {
  TEST(read_and_convert);

  ConverterOptions opts;
  opts.include_list = {"point.h"};
  opts.pod_requests = {QualifiedName("Point")};
  auto conv = BridgeConverter(opts).convert(parseJson(kPointBindings));

  std::string text;
  llvm::raw_string_ostream os(text);
  printItems(os, conv.items);
  os.flush();

  if (text.find("pub fn norm(self: &Point) -> std::os::raw::c_int;") == std::string::npos) {
    FAIL("expected converted norm method");
    return;
  }
  if (text.find("Point_Point") != std::string::npos || text.find("link_name") != std::string::npos) {
    FAIL("constructor and link_name should be gone");
    return;
  }
  if (text.rfind("use std::os::raw;\n\n#[cxx::bridge]\n", 0) != 0) {
    FAIL("pass-through items should precede the bridge module");
    return;
  }

  auto meta = conversionMetadataToJson(conv);
  if (meta["additional_cpp_needs"].size() != 1 ||
      meta["additional_cpp_needs"][0]["type"] != "Point" ||
      !meta["additional_cpp_needs"][0]["args"].empty()) {
    FAIL("expected MakeUnique need for Point");
    return;
  }

  PASS();
}

// ============================================================================
// Test: type shapes
// ============================================================================
static void test_read_type_shapes() {
  TEST(read_type_shapes);

  auto mod = parseJson(R"({
    "ident": "root",
    "content": [{"Struct": {"ident": "Shapes", "fields": {"Unnamed": [
      {"ty": {"Reference": {"lifetime": "a", "mutability": true,
                            "elem": {"Slice": {"elem": {"Path": {"segments": [{"ident": "u8"}]}}}}}}},
      {"ty": {"Array": {"elem": {"Path": {"segments": [{"ident": "f32"}]}}, "len": 3}}},
      {"ty": {"Tuple": []}},
      {"ty": {"BareFn": {"unsafety": true, "abi": "C",
                         "inputs": [{"Path": {"segments": [{"ident": "i32"}]}}],
                         "output": "Never"}}},
      {"ty": {"Path": {"leading_colon": true, "segments": [
        {"ident": "std_unique_ptr", "arguments": [
          {"Type": {"Path": {"segments": [{"ident": "Widget"}]}}}]}]}}}
    ]}}}]
  })");

  const auto *s = std::get_if<ast::ItemStruct>(&mod.content[0].kind);
  if (!s || s->fields_kind != ast::FieldsKind::Unnamed || s->fields.size() != 5) {
    FAIL("expected tuple struct with five fields");
    return;
  }
  const char *expected[] = {"&'a mut [u8]", "[f32; 3]", "()",
                            "unsafe extern \"C\" fn(i32) -> !", "::std_unique_ptr<Widget>"};
  for (int i = 0; i < 5; ++i) {
    auto got = typeToString(s->fields[i].ty);
    if (got != expected[i]) {
      FAIL(("unexpected type " + got).c_str());
      return;
    }
  }

  PASS();
}

// ============================================================================
// Test: impl blocks and enums
// ============================================================================
static void test_read_impl_and_enum() {
  TEST(read_impl_and_enum);

  auto mod = parseJson(R"({
    "ident": "root",
    "content": [
      {"Enum": {"attrs": [{"path": "repr", "tokens": "(u32)"}], "vis": "Public", "ident": "Colour",
                "variants": [{"ident": "Red", "discriminant": 0}, {"ident": "Blue", "discriminant": "4"}]}},
      {"Impl": {"self_ty": {"Path": {"segments": [{"ident": "Point"}]}},
                "items": [
                  {"Method": {"vis": "Public",
                              "sig": {"unsafety": true, "ident": "new", "inputs": [],
                                      "output": {"Path": {"segments": [{"ident": "Self"}]}}},
                              "block": [{"Verbatim": "let mut tmp = ::std::mem::MaybeUninit::uninit()"}]}},
                  {"Const": "const N: u32 = 1;"}
                ]}}
    ]
  })");

  const auto *e = std::get_if<ast::ItemEnum>(&mod.content[0].kind);
  if (!e || e->variants.size() != 2 || e->variants[0].discriminant != std::string("0") ||
      e->variants[1].discriminant != std::string("4")) {
    FAIL("unexpected enum");
    return;
  }
  const auto *impl = std::get_if<ast::ItemImpl>(&mod.content[1].kind);
  if (!impl || impl->items.size() != 2 || typeToString(impl->self_ty) != "Point") {
    FAIL("unexpected impl");
    return;
  }
  const auto *m = std::get_if<ast::ImplItemMethod>(&impl->items[0]);
  if (!m || m->sig.ident != "new" || !m->sig.is_unsafe || m->block.stmts.size() != 1) {
    FAIL("unexpected new method");
    return;
  }
  const auto *c = std::get_if<ast::ImplItemVerbatim>(&impl->items[1]);
  if (!c || c->tokens != "const N: u32 = 1;") {
    FAIL("associated const should be kept verbatim");
    return;
  }

  PASS();
}

// ============================================================================
// Test: nil content and unusual foreign items
// ============================================================================
static void test_nil_content() {
  TEST(nil_content);

  auto mod = parseJson(R"({"ident": "decl_only", "content": null})");
  if (mod.has_content) {
    FAIL("nil content should produce a module without a body");
    return;
  }
  try {
    BridgeConverter(ConverterOptions{}).convert(std::move(mod));
  } catch (const ConvertError &e) {
    if (e.getKind() == ConvertError::Kind::NoContent) {
      PASS();
      return;
    }
  }
  FAIL("converter should reject a module without a body");
}

static void test_unknown_foreign_item_kept_verbatim() {
  TEST(unknown_foreign_item_kept_verbatim);

  auto mod = parseJson(R"({
    "ident": "root",
    "content": [{"ForeignMod": {"abi": "C", "items": [{"Verbatim": "pub fn weird<T>();"}]}}]
  })");
  const auto *fm = std::get_if<ast::ItemForeignMod>(&mod.content[0].kind);
  const auto *v = fm ? std::get_if<ast::ForeignItemVerbatim>(&fm->items[0]) : nullptr;
  if (!v || v->tokens != "pub fn weird<T>();") {
    FAIL("unknown foreign items should be read, not rejected");
    return;
  }
  PASS();
}

// ============================================================================
// Test: malformed input
// ============================================================================
static void test_errors() {
  TEST(errors);

  auto missing = parseError(R"({"content": []})");
  if (missing.find("msgpack bindings parse error: missing required key: ident") != 0) {
    FAIL(("unexpected error: " + missing).c_str());
    return;
  }
  auto badType = parseError(R"({"ident": "root", "content": [
    {"Struct": {"ident": "S", "fields": {"Named": [{"ident": "f", "ty": {"Pointer": {}}}]}}}]})");
  if (badType.find("unknown Type variant: Pointer") == std::string::npos) {
    FAIL(("unexpected error: " + badType).c_str());
    return;
  }
  auto badVis = parseError(R"({"ident": "root", "vis": "Everywhere", "content": []})");
  if (badVis.find("unknown Visibility: Everywhere") == std::string::npos) {
    FAIL(("unexpected error: " + badVis).c_str());
    return;
  }
  auto badJson = parseError("{\"ident\": ");
  if (badJson.find("malformed JSON") == std::string::npos) {
    FAIL(("unexpected error: " + badJson).c_str());
    return;
  }

  PASS();
}

// ============================================================================
// Test: msgpack packed directly
// ============================================================================
static void test_packed_msgpack() {
  TEST(packed_msgpack);

  msgpack::sbuffer buf;
  msgpack::packer<msgpack::sbuffer> pk(&buf);
  // {"ident": "root", "content": [{"Enum": {"ident": "Mode", "variants": [{"ident": "On"}]}}]}
  pk.pack_map(2);
  pk.pack(std::string("ident"));
  pk.pack(std::string("root"));
  pk.pack(std::string("content"));
  pk.pack_array(1);
  pk.pack_map(1);
  pk.pack(std::string("Enum"));
  pk.pack_map(2);
  pk.pack(std::string("ident"));
  pk.pack(std::string("Mode"));
  pk.pack(std::string("variants"));
  pk.pack_array(1);
  pk.pack_map(1);
  pk.pack(std::string("ident"));
  pk.pack(std::string("On"));

  auto mod = parseMsgpackBindings(reinterpret_cast<const uint8_t *>(buf.data()), buf.size());
  const auto *e = mod.content.size() == 1 ? std::get_if<ast::ItemEnum>(&mod.content[0].kind)
                                          : nullptr;
  if (!e || e->ident != "Mode" || e->variants.size() != 1 || e->variants[0].discriminant) {
    FAIL("unexpected enum from packed msgpack");
    return;
  }

  PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
  printf("=== bridgen Bindings Reader Tests ===\n");

  test_read_point_module();
  test_read_and_convert();
  test_read_type_shapes();
  test_read_impl_and_enum();
  test_nil_content();
  test_unknown_foreign_item_kept_verbatim();
  test_errors();
  test_packed_msgpack();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
