// codesynth/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format. Synthesis diagnostics carry no
// source positions, so the location line names the declaration instead.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "codesynth/basic/diagnostic.hpp"

namespace codesynth
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E006]: I don't know how to implement a generator for Time.Posix
 *     --> decodeEvent
 *      |
 *      = note: while composing field 'at'
 *      = help: register a resolver for Time.Posix or supply a provider
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /// Print all diagnostics from a DiagnosticBag, in insertion order.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace codesynth
