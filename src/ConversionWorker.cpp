/*============================================================================
  ConversionWorker.cpp  –  part of dat_toolkit
  --------------------------------------------------------------------------
  One chase.dat → nodes.dat round trip:
    read → detect variant → decode → encode → mkdir → backup → write → log
  Safe to run concurrently for distinct destinations; nothing is shared.
============================================================================*/

#include "dat_toolkit/ConversionWorker.hpp"
#include "dat_toolkit/FileStream.hpp"

#include <ctime>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace dat_toolkit {

static std::string utcNow()
{
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
#ifdef _WIN32
    gmtime_s(&tmv, &t);
#else
    gmtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return buf;
}

fs::path backupPathFor(const fs::path& destination)
{
    fs::path bak = destination;
    bak.replace_extension(destination.extension().string() + ".bak");
    return bak;
}

fs::path logPathFor(const fs::path& destination)
{
    return destination.parent_path()
         / (destination.stem().string() + "_chase_to_nodes_log.txt");
}

fs::path defaultOutputPath(const fs::path& source)
{
    return source.parent_path() / (source.stem().string() + "_nodes.dat");
}

// ───────────────────────── side-effect steps ───────────────────────────────
static void ensureParentDir(const fs::path& destination)
{
    const fs::path dir = destination.parent_path();
    if (dir.empty()) return;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw ConversionError(ErrorKind::UnwritableDestination,
                              "cannot create " + dir.string() + ": " + ec.message());
}

// copy keeps mtime and permission bits of the previous output
static void backupExisting(const fs::path& destination)
{
    const fs::path bak = backupPathFor(destination);
    std::error_code ec;
    fs::copy_file(destination, bak, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        const auto mtime = fs::last_write_time(destination, ec);
        if (!ec) fs::last_write_time(bak, mtime, ec);
    }
    if (!ec) {
        const fs::file_status st = fs::status(destination, ec);
        if (!ec) fs::permissions(bak, st.permissions(), ec);
    }
    if (ec)
        throw ConversionError(ErrorKind::BackupFailed,
                              "cannot back up " + destination.string() + " to "
                              + bak.string() + ": " + ec.message());
}

static void writeLog(const fs::path& logPath, const fs::path& source,
                     RecordVariant variant, const std::string& start,
                     const EncodeResult& enc, std::size_t entries)
{
    std::ofstream L(logPath, std::ios::trunc);
    if (!L)
        throw ConversionError(ErrorKind::UnwritableLog,
                              "cannot open log " + logPath.string());

    L << "Converted: " << source.string() << '\n'
      << "Variant: " << recordSize(variant) << "-byte entries\n"
      << "Time (UTC): " << start << '\n'
      << "Entries: " << entries << '\n'
      << "Clipped: " << enc.clippedCount << "\n\n";
    for (std::size_t i = 0; i < enc.traceLines.size(); ++i) {
        if (i) L << '\n';
        L << enc.traceLines[i];
    }
    L.flush();
    if (!L)
        throw ConversionError(ErrorKind::UnwritableLog,
                              "write failed for log " + logPath.string());
}

// ─────────────────────────── convertFile() ─────────────────────────────────
ConversionOutcome convertFile(const fs::path& source,
                              const fs::path& destination,
                              const ConversionParameters& params,
                              bool backupEnabled)
{
    ConversionOutcome out;
    out.source      = source;
    out.destination = destination;
    const std::string name  = source.filename().string();
    const std::string start = utcNow();

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        out.success      = false;
        out.error        = kind;
        out.message      = msg;
        out.entriesCount = 0;
        out.clippedCount = 0;
        out.logPath.reset();
        return out;
    };

    try {
        const std::vector<char> data = FileReader::readAll(source.string());

        const auto variant = detectVariant(data);
        if (!variant)
            return fail(ErrorKind::UnknownVariant, "Unknown variant for " + name);
        out.variant = variant;

        const std::vector<Position> positions = decodePositions(data, *variant);
        const EncodeResult enc = encodeNodes(positions, params);

        ensureParentDir(destination);
        if (backupEnabled && fs::exists(destination))
            backupExisting(destination);

        FileWriter::writeAll(destination.string(), enc.bytes);

        const fs::path logPath = logPathFor(destination);
        writeLog(logPath, source, *variant, start, enc, positions.size());

        out.success      = true;
        out.entriesCount = static_cast<std::uint32_t>(positions.size());
        out.clippedCount = enc.clippedCount;
        out.logPath      = logPath;
        out.message      = "Converted " + name + " (" + std::to_string(positions.size())
                         + " entries, clipped=" + std::to_string(enc.clippedCount) + ")";
        return out;
    }
    catch (const ConversionError& e) {
        return fail(e.kind(), "Error converting " + name + ": " + e.what());
    }
    catch (const fs::filesystem_error& e) {
        return fail(ErrorKind::UnwritableDestination, "Error converting " + name + ": " + e.what());
    }
    catch (const std::exception& e) {
        return fail(ErrorKind::MalformedInput, "Error converting " + name + ": " + e.what());
    }
}

} // namespace dat_toolkit
