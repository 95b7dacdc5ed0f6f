//===- test_byvalue_checker.cpp - Tests for by-value classification -------===//
//
// Exercises ByValueChecker and the known-type registry it consults.
//
//===----------------------------------------------------------------------===//

#include "bridgen/ast_helpers.h"
#include "bridgen/byvalue_checker.h"
#include "bridgen/known_types.h"

#include <cstdio>
#include <string>
#include <vector>

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

static ast::ItemStruct makeStruct(const std::string &name) {
  ast::ItemStruct s;
  s.ident = name;
  return s;
}

static void addField(ast::ItemStruct &s, const std::string &name, ast::Type ty) {
  ast::Field f;
  f.ident = name;
  f.ty = std::move(ty);
  s.fields.push_back(std::move(f));
}

static std::vector<QualifiedName> names(std::vector<std::string> list) {
  std::vector<QualifiedName> out;
  for (auto &n : list)
    out.push_back(QualifiedName::parse(n));
  return out;
}

/// Runs classify and returns the offending type name, or "" on success.
static std::string offendingType(const ByValueChecker &checker,
                                 const std::vector<QualifiedName> &requests) {
  try {
    checker.classify(requests);
  } catch (const PodCheckError &e) {
    return e.getOffendingType().toString();
  }
  return "";
}

// ============================================================================
// Classification
// ============================================================================

static void test_primitive_fields_are_pod() {
  TEST(primitive_fields_are_pod);

  ByValueChecker checker;
  auto point = makeStruct("Point");
  addField(point, "x", ast::pathType("i32"));
  addField(point, "y", ast::pathType("std::os::raw::c_int"));
  checker.ingestStruct(point);

  auto c = checker.classify(names({"Point"}));
  if (!c.isPod(QualifiedName("Point"))) {
    FAIL("Point should be value-safe");
    return;
  }
  PASS();
}

static void test_unrequested_struct_is_opaque() {
  TEST(unrequested_struct_is_opaque);

  ByValueChecker checker;
  auto point = makeStruct("Point");
  addField(point, "x", ast::pathType("i32"));
  checker.ingestStruct(point);
  checker.ingestStruct(makeStruct("Other"));

  auto c = checker.classify(names({"Point"}));
  if (c.lookup(QualifiedName("Other")) != TypeClassification::Opaque) {
    FAIL("Other was never requested and should be opaque");
    return;
  }
  if (c.verdicts().size() != 2) {
    FAIL("every ingested struct should get a verdict");
    return;
  }
  if (c.lookup(QualifiedName("Missing"))) {
    FAIL("no verdict for a struct that was never ingested");
    return;
  }
  PASS();
}

static void test_nested_pod_is_transitive() {
  TEST(nested_pod_is_transitive);

  ByValueChecker checker;
  // Outer arrives before Inner: ingestion order must not matter.
  auto outer = makeStruct("Outer");
  addField(outer, "inner", ast::pathType("Inner"));
  addField(outer, "pair", ast::Type{ast::TypeArray{
                              std::make_unique<ast::Type>(ast::pathType("u8")), "2"}});
  checker.ingestStruct(outer);
  auto inner = makeStruct("Inner");
  addField(inner, "v", ast::pathType("f64"));
  checker.ingestStruct(inner);

  auto c = checker.classify(names({"Outer"}));
  if (!c.isPod(QualifiedName("Outer")) || !c.isPod(QualifiedName("Inner"))) {
    FAIL("Inner should become value-safe because Outer contains it");
    return;
  }
  PASS();
}

static void test_never_seen_struct_fails() {
  TEST(never_seen_struct_fails);

  ByValueChecker checker;
  auto bad = makeStruct("Bad");
  addField(bad, "inner", ast::ptrType(true, ast::pathType("SelfRef")));
  checker.ingestStruct(bad);

  if (offendingType(checker, names({"Bad"})) != "SelfRef") {
    FAIL("expected SelfRef to be reported");
    return;
  }
  if (offendingType(checker, names({"Nope"})) != "Nope") {
    FAIL("a request for an unknown struct should fail");
    return;
  }
  PASS();
}

static void test_pointee_stays_opaque() {
  TEST(pointee_stays_opaque);

  ByValueChecker checker;
  auto holder = makeStruct("Holder");
  addField(holder, "w", ast::ptrType(true, ast::pathType("Widget")));
  addField(holder, "g", ast::refType(false, ast::pathType("Gadget")));
  checker.ingestStruct(holder);
  auto widget = makeStruct("Widget");
  addField(widget, "n", ast::pathType("i32"));
  checker.ingestStruct(widget);
  checker.ingestStruct(makeStruct("Gadget"));

  auto c = checker.classify(names({"Holder"}));
  if (!c.isPod(QualifiedName("Holder"))) {
    FAIL("Holder only holds pointers and should be value-safe");
    return;
  }
  if (c.lookup(QualifiedName("Widget")) != TypeClassification::Opaque ||
      c.lookup(QualifiedName("Gadget")) != TypeClassification::Opaque) {
    FAIL("a struct reached only through a pointer was not requested and stays opaque");
    return;
  }
  PASS();
}

static void test_pointee_need_not_be_safe() {
  TEST(pointee_need_not_be_safe);

  ByValueChecker checker;
  auto holder = makeStruct("Holder");
  addField(holder, "w", ast::ptrType(true, ast::pathType("Widget")));
  addField(holder, "s", ast::ptrType(false, ast::pathType("std_string")));
  checker.ingestStruct(holder);
  auto widget = makeStruct("Widget");
  addField(widget, "s", ast::pathType("std_string"));
  checker.ingestStruct(widget);
  auto base = makeStruct("Base");
  addField(base, "vtable_", ast::ptrType(false, ast::pathType("Base__bindgen_vtable")));
  checker.ingestStruct(base);
  auto user = makeStruct("User");
  addField(user, "b", ast::refType(true, ast::pathType("Base")));
  checker.ingestStruct(user);

  if (!offendingType(checker, names({"Holder", "User"})).empty()) {
    FAIL("pointers to unsafe types are still copyable");
    return;
  }
  PASS();
}

static void test_unsafe_known_type_fails() {
  TEST(unsafe_known_type_fails);

  ByValueChecker checker;
  auto holder = makeStruct("Holder");
  addField(holder, "name", ast::pathType("std_string"));
  checker.ingestStruct(holder);

  try {
    checker.classify(names({"Holder"}));
  } catch (const PodCheckError &e) {
    std::string msg = e.what();
    if (e.getOffendingType() != QualifiedName("std_string") ||
        msg.find("is not safe to be POD") == std::string::npos ||
        msg.find("required by field of Holder") == std::string::npos) {
      FAIL("expected std_string, required by Holder");
      return;
    }
    PASS();
    return;
  }
  FAIL("expected PodCheckError");
}

static void test_vtable_struct_fails() {
  TEST(vtable_struct_fails);

  ByValueChecker checker;
  auto base = makeStruct("Base");
  addField(base, "vtable_", ast::ptrType(false, ast::pathType("Base__bindgen_vtable")));
  checker.ingestStruct(base);

  if (offendingType(checker, names({"Base"})) != "Base") {
    FAIL("a struct with a vtable can never be value-safe");
    return;
  }
  PASS();
}

static void test_unique_ptr_argument_not_followed() {
  TEST(unique_ptr_argument_not_followed);

  ByValueChecker checker;
  auto owner = makeStruct("Owner");
  std::vector<ast::Type> args;
  args.push_back(ast::pathType("Unknown"));
  addField(owner, "p", ast::pathType("std_unique_ptr", std::move(args)));
  checker.ingestStruct(owner);

  if (!offendingType(checker, names({"Owner"})).empty()) {
    FAIL("the pointee of a unique_ptr need not be value-safe");
    return;
  }
  PASS();
}

static void test_field_types_cover_every_shape() {
  TEST(field_types_cover_every_shape);

  auto s = makeStruct("S");
  addField(s, "a", ast::pathType("ns::A"));
  addField(s, "b", ast::refType(false, ast::pathType("B")));
  std::vector<ast::Type> elems;
  elems.push_back(ast::pathType("C"));
  elems.push_back(ast::Type{ast::TypeSlice{std::make_unique<ast::Type>(ast::pathType("D"))}});
  addField(s, "cd", ast::Type{ast::TypeTuple{std::move(elems)}});
  ast::TypeBareFn callback;
  callback.inputs.push_back(ast::pathType("E"));
  addField(s, "cb", ast::Type{std::move(callback)});

  auto deps = ByValueChecker::getFieldTypes(s);
  if (deps != names({"ns::A", "B", "C", "D"})) {
    FAIL("expected ns::A, B, C, D (function pointers contribute nothing)");
    return;
  }
  PASS();
}

// ============================================================================
// Known types
// ============================================================================

static void test_known_type_lookup() {
  TEST(known_type_lookup);

  const auto *s = findKnownType("std_string");
  if (!s || s->cpp_name != "std::string" || s->by_value_safe) {
    FAIL("std_string should map to std::string and be unsafe by value");
    return;
  }
  if (knownTypeReplacement("std_unique_ptr") != llvm::StringRef("UniquePtr")) {
    FAIL("std_unique_ptr should be replaced by UniquePtr");
    return;
  }
  if (knownTypeReplacement("i32")) {
    FAIL("primitives keep their names");
    return;
  }
  if (!findKnownType(QualifiedName::parse("libc::c_long"))) {
    FAIL("raw C types should resolve under libc");
    return;
  }
  if (findKnownType(QualifiedName::parse("other::c_long")) ||
      findKnownType(QualifiedName::parse("libc::std_string"))) {
    FAIL("only scalars resolve under the raw namespaces");
    return;
  }
  PASS();
}

static void test_replacements_are_not_keys() {
  TEST(replacements_are_not_keys);

  for (const auto &kt : knownTypes()) {
    if (kt.bridge_replacement && findKnownType(*kt.bridge_replacement)) {
      FAIL(("replacement collides with a key: " + kt.bridge_replacement->str()).c_str());
      return;
    }
  }
  PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
  printf("=== bridgen ByValueChecker Tests ===\n");

  test_primitive_fields_are_pod();
  test_unrequested_struct_is_opaque();
  test_nested_pod_is_transitive();
  test_never_seen_struct_fails();
  test_pointee_stays_opaque();
  test_pointee_need_not_be_safe();
  test_unsafe_known_type_fails();
  test_vtable_struct_fails();
  test_unique_ptr_argument_not_followed();
  test_field_types_cover_every_shape();
  test_known_type_lookup();
  test_replacements_are_not_keys();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
