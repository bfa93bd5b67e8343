#include "blobpack/CommandLine.hpp"
#include <cstring>

namespace blobpack
{

namespace
{
  const int MinMergeSources = 2;

  bool Equals(const char * arg, const char * expected)
  {
    return std::strcmp(arg, expected) == 0;
  }

  ParseResult Error(std::string const & text)
  {
    ParseResult result;
    result.error = text;
    return result;
  }

  // <prog> -m [--no-footer] <file1> <file2> [...] -o <output>
  ParseResult ParseMerge(int argc, char const * const * argv)
  {
    Command command;
    command.kind = Command::Kind::Merge;

    int first = 2;
    if (first < argc && Equals(argv[first], "--no-footer"))
    {
      command.mergeOptions.noFooter = true;
      ++first;
    }

    int const last = argc - 2; // position of "-o"
    if (last - first < MinMergeSources)
      return Error("merge: at least " + std::to_string(MinMergeSources) + " files required");
    if (!Equals(argv[last], "-o"))
      return Error("merge: '-o <output>' expected at the end");

    command.sources.assign(argv + first, argv + last);
    command.output = argv[last + 1];

    ParseResult result;
    result.command = command;
    return result;
  }

  // <prog> -s <input> -o <output_dir>
  ParseResult ParseSplit(int argc, char const * const * argv)
  {
    if (argc != 5 || !Equals(argv[3], "-o"))
      return Error("split: expected '-s <input> -o <output_dir>'");

    Command command;
    command.kind = Command::Kind::Split;
    command.sources.push_back(argv[2]);
    command.output = argv[4];

    ParseResult result;
    result.command = command;
    return result;
  }
}

ParseResult ParseCommandLine(int argc, char const * const * argv)
{
  if (argc < 2)
    return Error("");

  // -h, --help and anything else unrecognised end up in the usage text
  if (Equals(argv[1], "-h") || Equals(argv[1], "--help"))
    return Error("");
  if (Equals(argv[1], "-m"))
    return ParseMerge(argc, argv);
  if (Equals(argv[1], "-s"))
    return ParseSplit(argc, argv);

  return Error(std::string("unknown command '") + argv[1] + "'");
}

std::string UsageText(const char * programName)
{
  std::string const name(programName);
  return
    "blobpack: packs files into a single container and restores them\n"
    "\n"
    " Usage:\n"
    "  * Merge\n"
    "    " + name + " -m [--no-footer] FILE_1 FILE_2 [FILE_3 ...] -o FILE_OUTPUT\n"
    "\n"
    "  * Split\n"
    "    " + name + " -s FILE_INPUT -o PATH_OUTPUT\n"
    "\n"
    " Examples:\n"
    "    " + name + " -m photo.jpg notes.txt backup.zip -o bundle.bin\n"
    "    " + name + " -s bundle.bin -o restored/\n"
    "\n"
    " Set SPDLOG_LEVEL=debug for a per-file trace.\n";
}

}
