#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/printer.h — Canonical GraphQL printing
// ═══════════════════════════════════════════════════════════════════
//
//  The printed form is what operation ids are computed from, so two
//  documents that differ only in ignored tokens (whitespace, commas,
//  comments) print identically. Layout follows the reference GraphQL
//  printer: two-space indentation, ", " between arguments, strings
//  escaped like JSON.stringify.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "type_ref.h"
#include <string>

namespace gqlir {

std::string print(const ast::Value& value);
std::string print(const TypeRef& type);
std::string print(const ast::Directive& directive);
std::string print(const ast::Selection& selection);
std::string print(const ast::OperationDefinition& operation);
std::string print(const ast::FragmentDefinition& fragment);
// Operations first, then fragments, separated by blank lines.
std::string print(const ast::Document& document);

} // namespace gqlir
