//===- bridgen_main.cpp - bridgen: generated bindings → bridge module -----===//
//
// Standalone tool. Reads a msgpack-encoded binding module from stdin or a
// file, rewrites it into a bridge module, and prints the result as source
// text. Optionally writes the encountered-type and native-helper records as
// JSON for the C++ side generator.
//
// This is the "pure conversion" entry point: it does NOT run the header
// parser that produced the bindings or the bridge compiler that consumes the
// output.
//
//===----------------------------------------------------------------------===//

#include "bridgen/bridge_converter.h"
#include "bridgen/msgpack_reader.h"
#include "bridgen/printer.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace {

struct Options {
  std::string input_file;
  std::string output_path;
  std::string metadata_path;
  bool input_json = false;
  bool verbose = false;
  bridgen::ConverterOptions converter;
  std::optional<std::string> extra_include;
};

void printUsage() {
  llvm::errs() << "Usage: bridgen [options] [bindings.msgpack]\n"
               << "  (no input file = read msgpack bindings from stdin)\n"
               << "\n"
               << "Options:\n"
               << "  --input-json            Read JSON input instead of msgpack\n"
               << "  --include <header>      Add an include! to the bridge (repeatable)\n"
               << "  --extra-include <hdr>   Include one more header after the others\n"
               << "  --pod <Type>            Pass Type by value (repeatable)\n"
               << "  --old-rust              Omit forward declarations of by-value types\n"
               << "  -o <path>               Output bridge source path (default: stdout)\n"
               << "  --metadata <path>       Write encountered types and C++ needs as JSON\n"
               << "  --verbose               Summarize the conversion on stderr\n"
               << "  --help                  Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> Options {
  Options opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  auto needValue = [&](size_t i) {
    if (i + 1 >= args.size()) {
      llvm::errs() << "Error: " << args[i] << " requires an argument\n";
      printUsage();
      std::exit(1);
    }
  };

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      printUsage();
      std::exit(0);
    } else if (args[i] == "--input-json") {
      opts.input_json = true;
    } else if (args[i] == "--old-rust") {
      opts.converter.old_rust = true;
    } else if (args[i] == "--verbose") {
      opts.verbose = true;
    } else if (args[i] == "--include") {
      needValue(i);
      opts.converter.include_list.push_back(args[++i]);
    } else if (args[i] == "--extra-include") {
      needValue(i);
      opts.extra_include = args[++i];
    } else if (args[i] == "--pod") {
      needValue(i);
      opts.converter.pod_requests.push_back(bridgen::QualifiedName::parse(args[++i]));
    } else if (args[i] == "--metadata") {
      needValue(i);
      opts.metadata_path = args[++i];
    } else if (args[i] == "-o") {
      needValue(i);
      opts.output_path = args[++i];
    } else if (!args[i].empty() && args[i][0] != '-') {
      opts.input_file = args[i];
    } else {
      llvm::errs() << "Unknown option: " << args[i] << "\n";
      printUsage();
      std::exit(1);
    }
  }

  return opts;
}

/// Write \p text to \p path, or to stdout when the path is empty.
bool writeOutput(const std::string &path, const std::string &text) {
  if (path.empty()) {
    llvm::outs() << text;
    llvm::outs().flush();
    return true;
  }
  std::error_code ec;
  llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
  if (ec) {
    llvm::errs() << "Error: could not open " << path << ": " << ec.message() << "\n";
    return false;
  }
  out << text;
  out.close();
  if (out.has_error()) {
    llvm::errs() << "Error: failed writing " << path << ": " << out.error().message() << "\n";
    out.clear_error();
    return false;
  }
  return true;
}

void printSummary(const bridgen::BridgeConversion &conv) {
  size_t structs = 0;
  for (const auto &et : conv.types_to_disable)
    if (et.kind == bridgen::EncounteredTypeKind::Struct)
      ++structs;
  llvm::errs() << "bridgen: " << conv.items.size() << " items, " << structs << " structs and "
               << conv.types_to_disable.size() - structs << " enums encountered, "
               << conv.additional_cpp_needs.size() << " make_unique helpers needed\n";
  for (const auto &need : conv.additional_cpp_needs)
    if (auto *mu = std::get_if<bridgen::MakeUnique>(&need))
      llvm::errs() << "  make_unique: " << mu->type.toString() << " ("
                   << mu->constructor_args.size() << " args)\n";
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  auto opts = parse_args(argc, argv);

  // Read input from stdin or file
  std::vector<uint8_t> inputData;
  if (!opts.input_file.empty()) {
    std::ifstream f(opts.input_file, std::ios::binary);
    if (!f) {
      llvm::errs() << "Error: could not open file: " << opts.input_file << "\n";
      return 1;
    }
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
  } else {
#ifdef _WIN32
    // Windows opens stdin in text mode by default, which translates \r\n → \n
    // and treats 0x1a (Ctrl-Z) as EOF, both of which corrupt binary msgpack data.
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(std::cin), {});
  }

  if (inputData.empty()) {
    llvm::errs() << "Error: no input data\n";
    return 1;
  }

  // Parse bindings (msgpack by default, JSON with --input-json)
  bridgen::ast::ItemMod bindings;
  try {
    if (opts.input_json) {
      bindings = bridgen::parseJsonBindings(inputData.data(), inputData.size());
    } else {
      bindings = bridgen::parseMsgpackBindings(inputData.data(), inputData.size());
    }
  } catch (const std::exception &e) {
    llvm::errs() << "Error: " << e.what() << "\n";
    return 1;
  }

  bridgen::BridgeConversion conversion;
  try {
    bridgen::BridgeConverter converter(opts.converter);
    conversion = converter.convert(std::move(bindings), opts.extra_include);
  } catch (const bridgen::ConvertError &e) {
    llvm::errs() << "Error: " << e.what() << "\n";
    return 1;
  }

  if (opts.verbose)
    printSummary(conversion);

  std::string source;
  llvm::raw_string_ostream sourceStream(source);
  bridgen::printItems(sourceStream, conversion.items);
  sourceStream.flush();
  if (!writeOutput(opts.output_path, source))
    return 1;

  if (!opts.metadata_path.empty()) {
    auto metadata = bridgen::conversionMetadataToJson(conversion);
    if (!writeOutput(opts.metadata_path, metadata.dump(2) + "\n"))
      return 1;
  }

  return 0;
}
