#pragma once
#include "ChaseFormat.hpp"
#include "ConversionError.hpp"
#include "NodesFormat.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dat_toolkit {

struct ConversionOutcome {
    bool          success      = false;
    std::string   message;
    std::uint32_t entriesCount = 0;
    std::uint32_t clippedCount = 0;
    std::optional<std::filesystem::path> logPath;

    std::filesystem::path        source;
    std::filesystem::path        destination;
    std::optional<ErrorKind>     error;     // set when !success
    std::optional<RecordVariant> variant;
};

// a_nodes.dat → a_nodes.dat.bak
std::filesystem::path backupPathFor(const std::filesystem::path& destination);

// a_nodes.dat → a_nodes_chase_to_nodes_log.txt
std::filesystem::path logPathFor(const std::filesystem::path& destination);

// chase.dat → chase_nodes.dat in the same folder
std::filesystem::path defaultOutputPath(const std::filesystem::path& source);

// Full round trip for one file. Never throws: every failure is reported
// through the returned outcome.
ConversionOutcome convertFile(const std::filesystem::path& source,
                              const std::filesystem::path& destination,
                              const ConversionParameters&  params,
                              bool                         backupEnabled);

} // namespace dat_toolkit
