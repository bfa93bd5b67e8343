#include "blobpack/Merger.hpp"
#include <memory>
#include <utility>
#include <boost/filesystem.hpp>
#include <spdlog/spdlog.h>
#include "blobpack/FileStorage.hpp"
#include "ContainerWriter.hpp"
#include "RecordCodec.hpp"
#include "util/Assert.hpp"
#include "util/Directories.hpp"

namespace blobpack
{

namespace fs = boost::filesystem;

namespace
{
  struct Source
  {
    std::string path;
    std::unique_ptr<IStorage> storage;
    uint64_t size;
  };

  // Retries exactly once after creating missing parent directories
  std::unique_ptr<IStorage> CreateTarget(fs::path const & target)
  {
    fs::path const parent = target.parent_path();
    try
    {
      return OpenFileStorage(target.c_str(), OpenMode::Create);
    }
    catch (ContainerError const & e)
    {
      boost::system::error_code ec;
      if (e.code() != ErrorCode::DestinationWriteError || parent.empty() || fs::exists(parent, ec))
        throw;
    }

    spdlog::debug("[merge] creating directory {}", parent.string());
    util::CreateDirectories(parent);
    return OpenFileStorage(target.c_str(), OpenMode::Create);
  }
}

void Merge(std::vector<std::string> const & sourcePaths, const char * targetPath, MergeOptions const & options)
{
  if (sourcePaths.empty())
    ThrowContainerError(ErrorCode::InvalidArgument, "No files to merge");

  // All sources are opened and described before the target is touched
  std::vector<Source> sources;
  std::vector<format::RecordBytes> records;
  sources.reserve(sourcePaths.size());
  records.reserve(sourcePaths.size());
  for (auto const & path : sourcePaths)
  {
    Source source;
    source.path = path;
    source.storage = OpenFileStorage(path.c_str(), OpenMode::ReadOnly);
    source.size = source.storage->size();

    FileNameParts const parts = SplitFileName(fs::path(path).filename().string());
    FileRecord record;
    record.size = source.size;
    record.name = parts.name;
    record.extension = parts.extension;
    if (record.name.size() > MaxNameSize || record.extension.size() > MaxExtensionSize)
      spdlog::debug("[merge] file name of {} is truncated", path);
    records.push_back(EncodeRecord(record));

    sources.push_back(std::move(source));
  }

  // Creating the target truncates it, so it must not be one of the inputs
  boost::system::error_code ec;
  if (fs::exists(targetPath, ec))
  {
    for (auto const & source : sources)
    {
      if (fs::equivalent(source.path, targetPath, ec))
        ThrowContainerError(ErrorCode::InvalidArgument,
          std::string("Target is one of the merged files: ") + targetPath);
    }
  }

  std::unique_ptr<IStorage> target = CreateTarget(targetPath);
  ContainerWriter writer(*target);
  for (auto const & source : sources)
  {
    spdlog::debug("[merge] {} ({} bytes) at offset {}", source.path, source.size, writer.position());
    writer.appendPayload(*source.storage, source.size);
  }

  if (!options.noFooter)
    writer.appendFooter(records);

  target->flush();
  spdlog::info("[merge] {} files merged into {} ({} bytes)", sources.size(), targetPath, writer.position());
}

}
