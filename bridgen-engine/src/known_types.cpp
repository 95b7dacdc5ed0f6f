//===- known_types.cpp - Registry of well-known foreign types -------------===//

#include "bridgen/known_types.h"

#include "llvm/ADT/STLExtras.h"

#include <string>
#include <vector>

namespace bridgen {

namespace {

constexpr bool kSafe = true;
constexpr bool kUnsafe = false;

const KnownType kKnownTypes[] = {
    // std::string and std::vector may hold pointers into themselves
    // (small-buffer optimisation), so their bytes cannot be moved around.
    {"std_unique_ptr", "std::unique_ptr", llvm::StringRef("UniquePtr"), kSafe},
    {"std_string", "std::string", llvm::StringRef("CxxString"), kUnsafe},
    {"std_vector", "std::vector", llvm::StringRef("CxxVector"), kUnsafe},

    {"i8", "int8_t", std::nullopt, kSafe},
    {"u8", "uint8_t", std::nullopt, kSafe},
    {"i16", "int16_t", std::nullopt, kSafe},
    {"u16", "uint16_t", std::nullopt, kSafe},
    {"i32", "int32_t", std::nullopt, kSafe},
    {"u32", "uint32_t", std::nullopt, kSafe},
    {"i64", "int64_t", std::nullopt, kSafe},
    {"u64", "uint64_t", std::nullopt, kSafe},
    {"isize", "ptrdiff_t", std::nullopt, kSafe},
    {"usize", "size_t", std::nullopt, kSafe},
    {"f32", "float", std::nullopt, kSafe},
    {"f64", "double", std::nullopt, kSafe},
    {"bool", "bool", std::nullopt, kSafe},

    {"c_char", "char", std::nullopt, kSafe},
    {"c_schar", "signed char", std::nullopt, kSafe},
    {"c_uchar", "unsigned char", std::nullopt, kSafe},
    {"c_short", "short", std::nullopt, kSafe},
    {"c_ushort", "unsigned short", std::nullopt, kSafe},
    {"c_int", "int", std::nullopt, kSafe},
    {"c_uint", "unsigned int", std::nullopt, kSafe},
    {"c_long", "long", std::nullopt, kSafe},
    {"c_ulong", "unsigned long", std::nullopt, kSafe},
    {"c_longlong", "long long", std::nullopt, kSafe},
    {"c_ulonglong", "unsigned long long", std::nullopt, kSafe},
    {"c_float", "float", std::nullopt, kSafe},
    {"c_double", "double", std::nullopt, kSafe},
};

bool isRawTypeNamespace(const std::vector<std::string> &ns) {
  static const std::vector<std::vector<std::string>> rawNamespaces = {
      {"std", "os", "raw"},
      {"core", "ffi"},
      {"std", "ffi"},
      {"libc"},
  };
  return llvm::is_contained(rawNamespaces, ns);
}

} // namespace

llvm::ArrayRef<KnownType> knownTypes() {
  return kKnownTypes;
}

const KnownType *findKnownType(llvm::StringRef bindgenName) {
  for (const auto &kt : kKnownTypes)
    if (kt.bindgen_name == bindgenName)
      return &kt;
  return nullptr;
}

std::optional<llvm::StringRef> knownTypeReplacement(llvm::StringRef bindgenName) {
  if (const auto *kt = findKnownType(bindgenName))
    return kt->bridge_replacement;
  return std::nullopt;
}

const KnownType *findKnownType(const QualifiedName &name) {
  if (name.isTopLevel())
    return findKnownType(name.getFinalItem());
  if (!isRawTypeNamespace(name.getNamespace()))
    return nullptr;
  const auto *kt = findKnownType(name.getFinalItem());
  // Only scalars live in the raw-type namespaces.
  if (kt && kt->bridge_replacement)
    return nullptr;
  return kt;
}

} // namespace bridgen
