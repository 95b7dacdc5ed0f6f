//===- byvalue_checker.cpp - Decide which structs can be passed by value --===//
//
// A struct can be passed by value only if the bridge may copy its bytes
// without running a C++ copy or move constructor. That rules out structs with
// a vtable, and any struct containing something that is itself unsafe, such
// as std::string. The generator does not tell us about constructors, so
// value semantics are strictly opt-in.
//
//===----------------------------------------------------------------------===//

#include "bridgen/byvalue_checker.h"
#include "bridgen/ast_helpers.h"
#include "bridgen/known_types.h"

#include <set>
#include <type_traits>
#include <utility>

namespace bridgen {

// bindgen names the hidden vtable pointer of a polymorphic class "vtable_".
static constexpr const char *kVtableFieldName = "vtable_";

/// Splits the types a field mentions into those held inline (\p inline_deps)
/// and those only reached through a pointer or reference (\p pointees).
static void collectTypeDeps(const ast::Type &ty, std::vector<QualifiedName> &inline_deps,
                            std::vector<QualifiedName> &pointees, bool indirect) {
  std::visit(
      [&](const auto &k) {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, ast::TypePath>) {
          // Generic arguments are not followed: UniquePtr<T> owns its T on
          // the heap, so T's layout does not matter here.
          (indirect ? pointees : inline_deps).push_back(ast::typeNameFromPath(k));
        } else if constexpr (std::is_same_v<T, ast::TypePtr> ||
                             std::is_same_v<T, ast::TypeReference>) {
          if (k.elem)
            collectTypeDeps(*k.elem, inline_deps, pointees, true);
        } else if constexpr (std::is_same_v<T, ast::TypeArray> ||
                             std::is_same_v<T, ast::TypeSlice>) {
          if (k.elem)
            collectTypeDeps(*k.elem, inline_deps, pointees, indirect);
        } else if constexpr (std::is_same_v<T, ast::TypeTuple>) {
          for (const auto &e : k.elems)
            collectTypeDeps(e, inline_deps, pointees, indirect);
        }
        // Function pointers and ! contribute nothing.
      },
      ty.kind);
}

std::vector<QualifiedName> ByValueChecker::getFieldTypes(const ast::ItemStruct &def) {
  std::vector<QualifiedName> results;
  for (const auto &f : def.fields)
    collectTypeDeps(f.ty, results, results, false);
  return results;
}

void ByValueChecker::ingestStruct(const ast::ItemStruct &def) {
  QualifiedName tyname(def.ident);
  if (structs_.count(tyname))
    return;

  StructDetails details;
  for (const auto &f : def.fields)
    collectTypeDeps(f.ty, details.inline_types, details.pointee_types, false);
  for (const auto &f : def.fields) {
    if (f.ident && *f.ident == kVtableFieldName) {
      details.unsafe_reason = "Type " + tyname.toString() +
                              " could not be POD because it has virtual functions";
      break;
    }
  }
  order_.push_back(tyname);
  structs_.emplace(std::move(tyname), std::move(details));
}

Classification ByValueChecker::classify(llvm::ArrayRef<QualifiedName> requests) const {
  std::set<QualifiedName> pod;
  // Work list of (type, the struct that required it); the requester is empty
  // for an explicit request.
  std::vector<std::pair<QualifiedName, std::optional<QualifiedName>>> work;
  for (auto it = requests.rbegin(); it != requests.rend(); ++it)
    work.emplace_back(*it, std::nullopt);

  while (!work.empty()) {
    QualifiedName tyname = std::move(work.back().first);
    std::optional<QualifiedName> requester = std::move(work.back().second);
    work.pop_back();
    if (pod.count(tyname))
      continue;

    auto because = [&]() -> std::string {
      if (!requester)
        return {};
      return " (required by field of " + requester->toString() + ")";
    };

    if (const auto *kt = findKnownType(tyname)) {
      if (!kt->by_value_safe)
        throw PodCheckError(tyname, "Type " + tyname.toString() + " (" + kt->cpp_name.str() +
                                        ") is not safe to be POD" + because());
      continue;
    }

    auto found = structs_.find(tyname);
    if (found == structs_.end())
      throw PodCheckError(tyname, "Unable to make " + tyname.toString() +
                                      " POD because we never saw a struct definition" +
                                      because());
    const auto &details = found->second;
    if (details.unsafe_reason)
      throw PodCheckError(tyname, *details.unsafe_reason + because());

    // Pointees only have to exist; they are neither made value-safe nor walked.
    for (const auto &pointee : details.pointee_types) {
      if (!findKnownType(pointee) && !structs_.count(pointee))
        throw PodCheckError(pointee, "Unable to make " + tyname.toString() + " POD because " +
                                         pointee.toString() +
                                         ", which it points to, was never seen");
    }

    pod.insert(tyname);
    for (auto it = details.inline_types.rbegin(); it != details.inline_types.rend(); ++it)
      work.emplace_back(*it, tyname);
  }

  Classification result;
  for (const auto &name : order_)
    result.verdicts_[name] =
        pod.count(name) ? TypeClassification::ValueSafe : TypeClassification::Opaque;
  return result;
}

} // namespace bridgen
