#include "dat_toolkit/Inspector.hpp"
#include "dat_toolkit/ConversionError.hpp"
#include "dat_toolkit/FileStream.hpp"
#include "LittleEndian.hpp"

#include <algorithm>
#include <sstream>

namespace dat_toolkit {

InspectReport inspectFile(const std::filesystem::path& path, std::size_t maxPreview)
{
    InspectReport r;
    r.path = path;

    std::vector<char> data;
    try {
        data = FileReader::readAll(path.string());
    } catch (const std::exception& e) {
        r.kind   = FileKind::Error;
        r.status = std::string("Err: ") + e.what();
        return r;
    }

    // A consistent nodes header wins: nodes files with a multiple of five
    // records would otherwise pass for 20-byte chase data.
    if (data.size() >= kNodesHeaderSize
        && data.size() == nodesFileSize(le::readU32(data.data()))) {
        NodesFile nodes = parseNodes(data);
        r.kind    = FileKind::Nodes;
        r.entries = nodes.totalNodeCount;
        r.status  = "OK";
        const std::size_t n = std::min(maxPreview, nodes.records.size());
        r.nodePreview.assign(nodes.records.begin(), nodes.records.begin() + static_cast<std::ptrdiff_t>(n));
        return r;
    }

    if (auto variant = detectVariant(data)) {
        std::vector<Position> positions = decodePositions(data, *variant);
        r.kind    = FileKind::Chase;
        r.variant = variant;
        r.entries = static_cast<std::uint32_t>(positions.size());
        r.status  = "OK";
        positions.resize(std::min(maxPreview, positions.size()));
        r.chasePreview = std::move(positions);
        return r;
    }

    if (data.size() >= kNodesHeaderSize) {
        r.kind    = FileKind::NodesLike;
        r.entries = le::readU32(data.data());
        r.status  = "NodeFile?";
        return r;
    }

    r.kind   = FileKind::TooSmall;
    r.status = "Too small";
    return r;
}

std::string describe(const InspectReport& r)
{
    std::ostringstream os;
    os << r.path.filename().string() << ": ";
    switch (r.kind) {
    case FileKind::Chase:
        os << "variant=" << recordSize(*r.variant) << ", entries=" << r.entries;
        break;
    case FileKind::Nodes:
        os << "nodes.dat, total_nodes=" << r.entries;
        break;
    case FileKind::NodesLike:
        os << "looks like nodes.dat (header total_nodes=" << r.entries << ")";
        break;
    case FileKind::TooSmall:
        os << "too small";
        break;
    case FileKind::Error:
        os << r.status;
        break;
    }
    return os.str();
}

} // namespace dat_toolkit
