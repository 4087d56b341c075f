/*============================================================================
  NodesFormat.cpp  –  part of dat_toolkit
  --------------------------------------------------------------------------
  nodes.dat writer/reader.

    header   20 B : uint32 total_node_count, uint32 reserved[4] (= 0)
    record   24 B : uint32 mem_address (0), uint16 unused (0),
                    int16 x, y, z, uint16 marker (0), uint16 link_offset (0),
                    uint16 area_id, uint16 node_id, uint16 width,
                    uint8 node_type, uint8 flags

  Coordinates are float chase positions scaled by the multiplier, rounded
  half-to-even and clamped to int16.
============================================================================*/

#include "dat_toolkit/NodesFormat.hpp"
#include "dat_toolkit/ConversionError.hpp"
#include "LittleEndian.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace dat_toolkit {

// ──────────────────────── coordinate helpers ───────────────────────────────
static double roundHalfEven(double v)
{
    double r = std::round(v);                      // half away from zero
    if (std::fabs(v - std::trunc(v)) == 0.5)
        r = 2.0 * std::round(v / 2.0);            // tie → even neighbour
    return r;
}

// rounds and clamps one axis; returns true if clamping was needed
static bool toNodeCoord(float value, double multiplier, std::size_t index,
                        std::int16_t& out)
{
    constexpr double lo = std::numeric_limits<std::int16_t>::min();
    constexpr double hi = std::numeric_limits<std::int16_t>::max();

    const double scaled = roundHalfEven(static_cast<double>(value) * multiplier);
    if (!std::isfinite(scaled))
        throw ConversionError(ErrorKind::MalformedInput,
                              "non-finite coordinate in record " + std::to_string(index));

    if (scaled < lo) { out = std::numeric_limits<std::int16_t>::min(); return true; }
    if (scaled > hi) { out = std::numeric_limits<std::int16_t>::max(); return true; }
    out = static_cast<std::int16_t>(scaled);
    return false;
}

std::size_t nodesFileSize(std::size_t nodeCount)
{
    return kNodesHeaderSize + kNodeRecordSize * nodeCount;
}

// ───────────────────────────── encode ──────────────────────────────────────
EncodeResult encodeNodes(const std::vector<Position>& positions,
                         const ConversionParameters& params)
{
    EncodeResult res;
    res.bytes.reserve(nodesFileSize(positions.size()));
    res.traceLines.reserve(positions.size());

    le::putU32(res.bytes, static_cast<std::uint32_t>(positions.size()));
    for (int i = 0; i < 4; ++i) le::putU32(res.bytes, 0);

    for (std::size_t i = 0; i < positions.size(); ++i) {
        const Position& p = positions[i];

        NodeRecord rec;
        bool clipped = false;
        clipped |= toNodeCoord(p.x, params.multiplier, i, rec.x);
        clipped |= toNodeCoord(p.y, params.multiplier, i, rec.y);
        clipped |= toNodeCoord(p.z, params.multiplier, i, rec.z);
        if (clipped) ++res.clippedCount;

        rec.areaId   = params.areaId;
        rec.nodeId   = static_cast<std::uint16_t>(i & 0xFFFF);
        rec.width    = params.width;
        rec.nodeType = params.nodeType;
        rec.flags    = params.flags;

        le::putU32(res.bytes, rec.memAddress);
        le::putU16(res.bytes, rec.unused);
        le::putI16(res.bytes, rec.x);
        le::putI16(res.bytes, rec.y);
        le::putI16(res.bytes, rec.z);
        le::putU16(res.bytes, rec.marker);
        le::putU16(res.bytes, rec.linkOffset);
        le::putU16(res.bytes, rec.areaId);
        le::putU16(res.bytes, rec.nodeId);
        le::putU16(res.bytes, rec.width);
        le::putU8 (res.bytes, rec.nodeType);
        le::putU8 (res.bytes, rec.flags);

        std::ostringstream line;
        line << i << ": pos=(" << std::fixed << std::setprecision(3)
             << p.x << ',' << p.y << ',' << p.z << ") -> nodePos=("
             << rec.x << ',' << rec.y << ',' << rec.z << ") id=" << rec.nodeId;
        res.traceLines.push_back(line.str());
    }
    return res;
}

// ───────────────────────────── parse ───────────────────────────────────────
NodesFile parseNodes(const std::vector<char>& data)
{
    if (data.size() < kNodesHeaderSize)
        throw ConversionError(ErrorKind::MalformedInput,
                              "nodes file shorter than its 20-byte header");

    NodesFile f;
    f.totalNodeCount = le::readU32(data.data());
    for (int i = 0; i < 4; ++i)
        f.reserved[i] = le::readU32(data.data() + 4 * (i + 1));

    if (data.size() != nodesFileSize(f.totalNodeCount))
        throw ConversionError(ErrorKind::MalformedInput,
                              "header announces " + std::to_string(f.totalNodeCount)
                              + " nodes but file has " + std::to_string(data.size()) + " bytes");

    f.records.reserve(f.totalNodeCount);
    for (std::uint32_t i = 0; i < f.totalNodeCount; ++i) {
        const char* p = data.data() + kNodesHeaderSize + kNodeRecordSize * i;
        NodeRecord r;
        r.memAddress = le::readU32(p);
        r.unused     = le::readU16(p + 4);
        r.x          = le::readI16(p + 6);
        r.y          = le::readI16(p + 8);
        r.z          = le::readI16(p + 10);
        r.marker     = le::readU16(p + 12);
        r.linkOffset = le::readU16(p + 14);
        r.areaId     = le::readU16(p + 16);
        r.nodeId     = le::readU16(p + 18);
        r.width      = le::readU16(p + 20);
        r.nodeType   = static_cast<std::uint8_t>(p[22]);
        r.flags      = static_cast<std::uint8_t>(p[23]);
        f.records.push_back(r);
    }
    return f;
}

} // namespace dat_toolkit
