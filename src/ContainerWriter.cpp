#include "ContainerWriter.hpp"
#include "RecordCodec.hpp"
#include "util/CopyRange.hpp"

namespace blobpack
{

ContainerWriter::ContainerWriter(IStorage & target)
  : m_target(target)
  , m_position(target.size())
{
}

void ContainerWriter::appendPayload(IStorage const & source, uint64_t size)
{
  util::CopyRange(source, 0, size, m_target, m_position);
  m_position += size;
}

void ContainerWriter::appendFooter(std::vector<format::RecordBytes> const & records)
{
  for (auto const & record : records)
  {
    m_target.write(m_position, record.size(), record.data());
    m_position += record.size();
  }

  format::CountBytes const count = EncodeCount(records.size());
  m_target.write(m_position, count.size(), count.data());
  m_position += count.size();
}

}
