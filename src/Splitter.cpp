#include "blobpack/Splitter.hpp"
#include <memory>
#include <boost/filesystem.hpp>
#include <spdlog/spdlog.h>
#include "blobpack/FileStorage.hpp"
#include "ContainerReader.hpp"
#include "util/Assert.hpp"
#include "util/CopyRange.hpp"
#include "util/Directories.hpp"

namespace blobpack
{

namespace fs = boost::filesystem;

void Split(const char * containerPath, const char * targetDirectory)
{
  // Pipes and devices can't be seeked to reach the footer
  boost::system::error_code ec;
  fs::file_status const status = fs::status(containerPath, ec);
  if (fs::exists(status) && !fs::is_directory(status) && !fs::is_regular_file(status))
    ThrowContainerError(ErrorCode::InvalidContainer,
      std::string("Container is not a seekable file: ") + containerPath);

  std::unique_ptr<IStorage> container = OpenFileStorage(containerPath, OpenMode::ReadOnly);
  std::vector<ContainerEntry> const entries = ReadContainerIndex(*container);

  fs::path const targetPath(targetDirectory);
  util::CreateDirectories(targetPath);

  for (auto const & entry : entries)
  {
    fs::path const outputPath = targetPath / entry.fileName;
    spdlog::debug("[split] {} ({} bytes) from offset {}", outputPath.string(), entry.size, entry.offset);

    std::unique_ptr<IStorage> output = OpenFileStorage(outputPath.c_str(), OpenMode::Create);
    util::CopyRange(*container, entry.offset, entry.size, *output, 0);
    output->flush();
  }

  spdlog::info("[split] {} files restored from {} into {}", entries.size(), containerPath, targetDirectory);
}

}
