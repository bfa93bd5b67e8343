#pragma once

#include <array>
#include <cstdint>
#include <stddef.h>
#include "blobpack/Common.hpp"

namespace blobpack { namespace format 
{

// Container layout:
//   payload of file 0 .. payload of file N-1
//   record of file 0 .. record of file N-1
//   record count (u64, big endian)
//
// Record layout (264 bytes, no padding, independent of host alignment):
//   [0, 8)     payload size, u64 big endian
//   [8, 256)   name, zero terminated
//   [256, 264) extension including '.', zero terminated

static const size_t SizeFieldOffset = 0;
static const size_t SizeFieldSize = 8;
static const size_t NameFieldOffset = 8;
static const size_t NameFieldSize = 248;
static const size_t ExtensionFieldOffset = 256;
static const size_t ExtensionFieldSize = 8;
static const size_t RecordSize = 264;

static const size_t CountFieldSize = 8;

static const unsigned char Sentinel = 0;

typedef std::array<unsigned char, RecordSize> RecordBytes;
typedef std::array<unsigned char, CountFieldSize> CountBytes;

static_assert(SizeFieldOffset + SizeFieldSize == NameFieldOffset, "");
static_assert(NameFieldOffset + NameFieldSize == ExtensionFieldOffset, "");
static_assert(ExtensionFieldOffset + ExtensionFieldSize == RecordSize, "");
static_assert(MaxNameSize + 1 == NameFieldSize, "");
static_assert(MaxExtensionSize + 1 == ExtensionFieldSize, "");

}}
