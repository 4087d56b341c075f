#pragma once
#include "ChaseFormat.hpp"
#include "NodesFormat.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dat_toolkit {

enum class FileKind {
    Chase,       // length matches one chase variant
    Nodes,       // header count agrees with the file length
    NodesLike,   // ≥ 20 bytes but neither of the above
    TooSmall,
    Error        // could not be read
};

struct InspectReport {
    std::filesystem::path        path;
    FileKind                     kind = FileKind::Error;
    std::optional<RecordVariant> variant;      // Chase only
    std::uint32_t                entries = 0;  // records, or header count
    std::string                  status;       // "OK", "NodeFile?", "Too small", "Err: ..."

    // first maxPreview entries, for display
    std::vector<Position>   chasePreview;
    std::vector<NodeRecord> nodePreview;
};

InspectReport inspectFile(const std::filesystem::path& path, std::size_t maxPreview);

// "<name>: variant=28, entries=12" style summary line
std::string describe(const InspectReport& report);

} // namespace dat_toolkit
