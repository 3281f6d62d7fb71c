// codesynth/basic/result.cpp - Error code table
#include "codesynth/basic/result.hpp"

namespace codesynth
{

const char * error_code(GenErrorKind kind) noexcept
{
  switch (kind) {
    case GenErrorKind::GenericVariable:
      return "E001";
    case GenErrorKind::FunctionType:
      return "E002";
    case GenErrorKind::GenericAlias:
      return "E003";
    case GenErrorKind::GenericCustomType:
      return "E004";
    case GenErrorKind::IllegalTupleArity:
      return "E005";
    case GenErrorKind::NoMatchingResolver:
      return "E006";
    case GenErrorKind::UnsupportedShape:
      return "E007";
    case GenErrorKind::EagerRecursion:
      return "E008";
    case GenErrorKind::NoGenerator:
      return "E009";
    case GenErrorKind::InvalidInput:
      return "E010";
  }
  return "E007";
}

}  // namespace codesynth
