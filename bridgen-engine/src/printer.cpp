//===- printer.cpp - Render converted bindings as bridge source -----------===//

#include "bridgen/printer.h"

#include "llvm/ADT/STLExtras.h"

#include <variant>

namespace bridgen {

// ── Types ───────────────────────────────────────────────────────────────────

static void printType(llvm::raw_ostream &os, const ast::Type &ty);

static void printLifetime(llvm::raw_ostream &os, llvm::StringRef name) {
  if (name.empty() || name[0] != '\'')
    os << '\'';
  os << name;
}

static void printGenericArg(llvm::raw_ostream &os, const ast::GenericArgument &arg) {
  if (auto *t = std::get_if<ast::GenericArgType>(&arg)) {
    printType(os, *t->ty);
  } else if (auto *l = std::get_if<ast::GenericArgLifetime>(&arg)) {
    printLifetime(os, l->name);
  } else if (auto *c = std::get_if<ast::GenericArgConst>(&arg)) {
    os << c->expr;
  }
}

static void printPath(llvm::raw_ostream &os, const ast::TypePath &p) {
  if (p.leading_colon)
    os << "::";
  llvm::interleave(
      p.segments, os,
      [&](const ast::PathSegment &seg) {
        os << seg.ident;
        if (!seg.generic_args)
          return;
        os << '<';
        llvm::interleaveComma(*seg.generic_args, os,
                              [&](const ast::GenericArgument &a) { printGenericArg(os, a); });
        os << '>';
      },
      "::");
}

static void printType(llvm::raw_ostream &os, const ast::Type &ty) {
  const auto &k = ty.kind;
  if (auto *p = std::get_if<ast::TypePath>(&k)) {
    printPath(os, *p);
  } else if (auto *ptr = std::get_if<ast::TypePtr>(&k)) {
    os << (ptr->is_mutable ? "*mut " : "*const ");
    printType(os, *ptr->elem);
  } else if (auto *r = std::get_if<ast::TypeReference>(&k)) {
    os << '&';
    if (r->lifetime) {
      printLifetime(os, *r->lifetime);
      os << ' ';
    }
    if (r->is_mutable)
      os << "mut ";
    printType(os, *r->elem);
  } else if (auto *a = std::get_if<ast::TypeArray>(&k)) {
    os << '[';
    printType(os, *a->elem);
    os << "; " << a->len << ']';
  } else if (auto *s = std::get_if<ast::TypeSlice>(&k)) {
    os << '[';
    printType(os, *s->elem);
    os << ']';
  } else if (auto *t = std::get_if<ast::TypeTuple>(&k)) {
    os << '(';
    llvm::interleaveComma(t->elems, os, [&](const ast::Type &e) { printType(os, e); });
    if (t->elems.size() == 1)
      os << ',';
    os << ')';
  } else if (auto *f = std::get_if<ast::TypeBareFn>(&k)) {
    if (f->is_unsafe)
      os << "unsafe ";
    if (f->abi)
      os << "extern \"" << *f->abi << "\" ";
    os << "fn(";
    llvm::interleaveComma(f->inputs, os, [&](const ast::Type &e) { printType(os, e); });
    os << ')';
    if (f->output) {
      os << " -> ";
      printType(os, *f->output);
    }
  } else if (std::holds_alternative<ast::TypeNever>(k)) {
    os << '!';
  }
}

std::string typeToString(const ast::Type &ty) {
  std::string out;
  llvm::raw_string_ostream os(out);
  printType(os, ty);
  os.flush();
  return out;
}

// ── Items ───────────────────────────────────────────────────────────────────

namespace {

class ItemPrinter {
public:
  ItemPrinter(llvm::raw_ostream &os, unsigned indent) : os_(os), indent_(indent) {}

  void print(const ast::Item &item) {
    const auto &k = item.kind;
    if (auto *fm = std::get_if<ast::ItemForeignMod>(&k))
      printForeignMod(*fm);
    else if (auto *s = std::get_if<ast::ItemStruct>(&k))
      printStruct(*s);
    else if (auto *e = std::get_if<ast::ItemEnum>(&k))
      printEnum(*e);
    else if (auto *impl = std::get_if<ast::ItemImpl>(&k))
      printImpl(*impl);
    else if (auto *m = std::get_if<ast::ItemMod>(&k))
      printMod(*m);
    else if (auto *v = std::get_if<ast::ItemVerbatim>(&k))
      line() << v->tokens << '\n';
  }

private:
  llvm::raw_ostream &line() { return os_.indent(indent_ * 4); }

  void printAttrs(const std::vector<ast::Attribute> &attrs) {
    for (const auto &a : attrs)
      line() << "#[" << a.path << a.tokens << "]\n";
  }

  static llvm::StringRef visText(ast::Visibility vis) {
    switch (vis) {
    case ast::Visibility::Public:
      return "pub ";
    case ast::Visibility::Crate:
      return "pub(crate) ";
    case ast::Visibility::Inherited:
      return "";
    }
    return "";
  }

  void printFnArg(const ast::FnArg &arg) {
    if (auto *r = std::get_if<ast::FnArgReceiver>(&arg)) {
      if (r->is_reference)
        os_ << (r->is_mutable ? "&mut " : "&");
      else if (r->is_mutable)
        os_ << "mut ";
      os_ << "self";
    } else if (auto *t = std::get_if<ast::FnArgTyped>(&arg)) {
      os_ << t->pat << ": ";
      printType(os_, t->ty);
    }
  }

  void printSignature(const ast::Signature &sig) {
    if (sig.is_unsafe)
      os_ << "unsafe ";
    os_ << "fn " << sig.ident << '(';
    llvm::interleaveComma(sig.inputs, os_, [&](const ast::FnArg &a) { printFnArg(a); });
    if (sig.is_variadic)
      os_ << (sig.inputs.empty() ? "..." : ", ...");
    os_ << ')';
    if (sig.output) {
      os_ << " -> ";
      printType(os_, *sig.output);
    }
  }

  void printForeignItem(const ast::ForeignItem &fi) {
    if (auto *f = std::get_if<ast::ForeignItemFn>(&fi)) {
      printAttrs(f->attrs);
      line() << visText(f->vis);
      printSignature(f->sig);
      os_ << ";\n";
    } else if (auto *t = std::get_if<ast::ForeignItemType>(&fi)) {
      printAttrs(t->attrs);
      line() << visText(t->vis) << "type " << t->ident << ";\n";
    } else if (auto *s = std::get_if<ast::ForeignItemStatic>(&fi)) {
      printAttrs(s->attrs);
      line() << visText(s->vis) << "static " << (s->is_mutable ? "mut " : "") << s->ident
             << ": ";
      printType(os_, s->ty);
      os_ << ";\n";
    } else if (auto *m = std::get_if<ast::ForeignItemMacro>(&fi)) {
      line() << m->path << "!(" << m->tokens << ");\n";
    } else if (auto *v = std::get_if<ast::ForeignItemVerbatim>(&fi)) {
      line() << v->tokens << '\n';
    }
  }

  void printForeignMod(const ast::ItemForeignMod &fm) {
    printAttrs(fm.attrs);
    line() << (fm.is_unsafe ? "unsafe " : "") << "extern \"" << fm.abi << "\" {\n";
    ++indent_;
    for (const auto &fi : fm.items)
      printForeignItem(fi);
    --indent_;
    line() << "}\n";
  }

  void printGenerics(const std::vector<std::string> &params) {
    if (params.empty())
      return;
    os_ << '<';
    llvm::interleaveComma(params, os_);
    os_ << '>';
  }

  void printStruct(const ast::ItemStruct &s) {
    printAttrs(s.attrs);
    line() << visText(s.vis) << "struct " << s.ident;
    printGenerics(s.generic_params);
    switch (s.fields_kind) {
    case ast::FieldsKind::Unit:
      os_ << ";\n";
      return;
    case ast::FieldsKind::Unnamed:
      os_ << '(';
      llvm::interleaveComma(s.fields, os_, [&](const ast::Field &f) {
        os_ << visText(f.vis);
        printType(os_, f.ty);
      });
      os_ << ");\n";
      return;
    case ast::FieldsKind::Named:
      break;
    }
    os_ << " {\n";
    ++indent_;
    for (const auto &f : s.fields) {
      printAttrs(f.attrs);
      line() << visText(f.vis) << f.ident.value_or("_") << ": ";
      printType(os_, f.ty);
      os_ << ",\n";
    }
    --indent_;
    line() << "}\n";
  }

  void printEnum(const ast::ItemEnum &e) {
    printAttrs(e.attrs);
    line() << visText(e.vis) << "enum " << e.ident << " {\n";
    ++indent_;
    for (const auto &v : e.variants) {
      printAttrs(v.attrs);
      line() << v.ident;
      if (v.discriminant)
        os_ << " = " << *v.discriminant;
      os_ << ",\n";
    }
    --indent_;
    line() << "}\n";
  }

  void printExpr(const ast::Expr &expr) {
    if (auto *call = std::get_if<ast::ExprCall>(&expr)) {
      os_ << call->func << '(';
      llvm::interleaveComma(call->args, os_);
      os_ << ')';
    } else if (auto *v = std::get_if<ast::ExprVerbatim>(&expr)) {
      os_ << v->tokens;
    }
  }

  void printImpl(const ast::ItemImpl &impl) {
    printAttrs(impl.attrs);
    line() << (impl.is_unsafe ? "unsafe " : "") << "impl";
    printGenerics(impl.generic_params);
    os_ << ' ';
    if (impl.trait_)
      os_ << *impl.trait_ << " for ";
    printType(os_, impl.self_ty);
    os_ << " {\n";
    ++indent_;
    for (const auto &ii : impl.items) {
      if (auto *m = std::get_if<ast::ImplItemMethod>(&ii)) {
        printAttrs(m->attrs);
        line() << visText(m->vis);
        printSignature(m->sig);
        os_ << " {\n";
        ++indent_;
        for (size_t i = 0; i < m->block.stmts.size(); ++i) {
          line();
          printExpr(m->block.stmts[i]);
          os_ << (i + 1 == m->block.stmts.size() ? "\n" : ";\n");
        }
        --indent_;
        line() << "}\n";
      } else if (auto *v = std::get_if<ast::ImplItemVerbatim>(&ii)) {
        line() << v->tokens << '\n';
      }
    }
    --indent_;
    line() << "}\n";
  }

  void printMod(const ast::ItemMod &m) {
    printAttrs(m.attrs);
    line() << visText(m.vis) << "mod " << m.ident;
    if (!m.has_content) {
      os_ << ";\n";
      return;
    }
    os_ << " {\n";
    ++indent_;
    for (const auto &item : m.content)
      print(item);
    --indent_;
    line() << "}\n";
  }

  llvm::raw_ostream &os_;
  unsigned indent_;
};

} // namespace

void printItem(llvm::raw_ostream &os, const ast::Item &item, unsigned indent) {
  ItemPrinter(os, indent).print(item);
}

void printItems(llvm::raw_ostream &os, llvm::ArrayRef<ast::Item> items) {
  llvm::interleave(
      items, os, [&](const ast::Item &item) { printItem(os, item); }, "\n");
}

// ── Metadata ────────────────────────────────────────────────────────────────

nlohmann::json conversionMetadataToJson(const BridgeConversion &conversion) {
  nlohmann::json encountered = nlohmann::json::array();
  for (const auto &et : conversion.types_to_disable) {
    encountered.push_back({
        {"kind", et.kind == EncounteredTypeKind::Struct ? "Struct" : "Enum"},
        {"name", et.name.toString()},
    });
  }

  nlohmann::json needs = nlohmann::json::array();
  for (const auto &need : conversion.additional_cpp_needs) {
    if (auto *mu = std::get_if<MakeUnique>(&need)) {
      nlohmann::json args = nlohmann::json::array();
      for (const auto &a : mu->constructor_args)
        args.push_back(typeToString(a));
      needs.push_back({{"kind", "MakeUnique"}, {"type", mu->type.toString()}, {"args", args}});
    }
  }

  return {{"encountered_types", encountered}, {"additional_cpp_needs", needs}};
}

} // namespace bridgen
