//===- printer.h - Render converted bindings as bridge source ---*- C++ -*-===//
//
// Text rendering of the binding AST (the input the bridge compiler expects)
// and JSON rendering of the side records the native-helper generator reads.
//
//===----------------------------------------------------------------------===//

#ifndef BRIDGEN_PRINTER_H
#define BRIDGEN_PRINTER_H

#include "bridgen/ast_types.h"
#include "bridgen/bridge_converter.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"

#include <nlohmann/json.hpp>

#include <string>

namespace bridgen {

/// Source text of a type expression, e.g. "&mut UniquePtr<Widget>".
std::string typeToString(const ast::Type &ty);

/// Print one item, indented by \p indent levels of four spaces.
void printItem(llvm::raw_ostream &os, const ast::Item &item, unsigned indent = 0);

/// Print items separated by blank lines.
void printItems(llvm::raw_ostream &os, llvm::ArrayRef<ast::Item> items);

/// {"encountered_types": [{kind, name}], "additional_cpp_needs": [...]}
nlohmann::json conversionMetadataToJson(const BridgeConversion &conversion);

} // namespace bridgen

#endif // BRIDGEN_PRINTER_H
