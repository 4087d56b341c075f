#pragma once
#include "ChaseFormat.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dat_toolkit {

constexpr std::size_t kNodesHeaderSize = 20;
constexpr std::size_t kNodeRecordSize  = 24;

// Values applied to every record of one conversion run.
struct ConversionParameters {
    double        multiplier = 8.0;
    std::uint16_t areaId     = 0;
    std::uint16_t width      = 0;
    std::uint8_t  nodeType   = 0;
    std::uint8_t  flags      = 0;
};

// 24 bytes on disk. The always-zero spare field after the address
// placeholder is 16 bits wide so the record keeps its 24-byte stride.
struct NodeRecord {
    std::uint32_t memAddress = 0;
    std::uint16_t unused     = 0;
    std::int16_t  x = 0, y = 0, z = 0;
    std::uint16_t marker     = 0;
    std::uint16_t linkOffset = 0;
    std::uint16_t areaId     = 0;
    std::uint16_t nodeId     = 0;
    std::uint16_t width      = 0;
    std::uint8_t  nodeType   = 0;
    std::uint8_t  flags      = 0;
};

struct NodesFile {
    std::uint32_t           totalNodeCount = 0;
    std::uint32_t           reserved[4]    = {0, 0, 0, 0};
    std::vector<NodeRecord> records;
};

struct EncodeResult {
    std::vector<char>        bytes;       // header + records
    std::vector<std::string> traceLines;  // one per record
    std::uint32_t            clippedCount = 0;
};

// Scales every position by params.multiplier, rounds half-to-even and clamps
// each axis to int16. clippedCount grows once per position that needed any
// clamping. Throws ConversionError(MalformedInput) on non-finite coordinates.
EncodeResult encodeNodes(const std::vector<Position>& positions,
                         const ConversionParameters& params);

// Inverse of the byte layout written by encodeNodes. Throws
// ConversionError(MalformedInput) if the length disagrees with the header.
NodesFile parseNodes(const std::vector<char>& data);

std::size_t nodesFileSize(std::size_t nodeCount);

} // namespace dat_toolkit
