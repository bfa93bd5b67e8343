#include <exception>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include "blobpack/CommandLine.hpp"
#include "blobpack/ContainerError.hpp"
#include "blobpack/Merger.hpp"
#include "blobpack/Splitter.hpp"

int main(int argc, char ** argv)
{
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::warn);
  spdlog::cfg::load_env_levels();

  blobpack::ParseResult const parsed = blobpack::ParseCommandLine(argc, argv);
  if (!parsed.command)
  {
    if (!parsed.error.empty())
      std::cerr << parsed.error << "\n\n";
    std::cout << blobpack::UsageText(argc > 0 ? argv[0] : "blobpack");
    return 1;
  }

  blobpack::Command const & command = *parsed.command;
  try
  {
    switch (command.kind)
    {
    case blobpack::Command::Kind::Merge:
      blobpack::Merge(command.sources, command.output.c_str(), command.mergeOptions);
      break;
    case blobpack::Command::Kind::Split:
      blobpack::Split(command.sources.front().c_str(), command.output.c_str());
      break;
    }
  }
  catch (blobpack::ContainerError const & e)
  {
    spdlog::error("{}: {}", blobpack::ErrorCodeName(e.code()), e.message());
    return 1;
  }
  catch (std::exception const & e)
  {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
