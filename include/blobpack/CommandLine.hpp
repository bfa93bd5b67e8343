#ifndef _BLOBPACK_API_COMMAND_LINE_H
#define _BLOBPACK_API_COMMAND_LINE_H

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "blobpack/Common.hpp"
#include "blobpack/Defs.hpp"

namespace blobpack
{

struct Command
{
  enum class Kind
  {
    Merge,
    Split
  };

  Kind kind;
  std::vector<std::string> sources; // Merge: files to pack; Split: the container
  std::string output;               // Merge: container path; Split: target directory
  MergeOptions mergeOptions;
};

struct ParseResult
{
  boost::optional<Command> command; // empty: usage error, print help and fail
  std::string error;
};

BLOBPACK_API_DECL ParseResult ParseCommandLine(int argc, char const * const * argv);
BLOBPACK_API_DECL std::string UsageText(const char * programName);

}

#endif
