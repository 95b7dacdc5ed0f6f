//===- msgpack_reader.h - Deserialize generated bindings -------------------===//
//
// Reads a msgpack-encoded binding module (produced on the Rust side by
// rmp_serde::to_vec_named over the generator's syn tree) into the C++ AST
// types defined in ast_types.h.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bridgen/ast_types.h"
#include <cstddef>
#include <cstdint>

namespace bridgen {

/// Parse a msgpack-encoded binding module.
///
/// The top-level object is the module itself:
///   {"attrs": [...], "vis": "Public", "ident": "root", "content": [Item...]}
/// A nil "content" yields a module without a body.
///
/// Throws std::runtime_error on parse failures.
ast::ItemMod parseMsgpackBindings(const uint8_t *data, size_t size);

/// Parse a JSON-encoded binding module.
///
/// Converts the JSON to msgpack and runs it through parseMsgpackBindings, so
/// both formats share one schema. Handy for hand-written test inputs.
///
/// Throws std::runtime_error on parse failures.
ast::ItemMod parseJsonBindings(const uint8_t *data, size_t size);

} // namespace bridgen
