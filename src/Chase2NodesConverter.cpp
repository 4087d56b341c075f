#include "dat_toolkit/Chase2NodesConverter.hpp"
#include "dat_toolkit/ConversionWorker.hpp"
#include "dat_toolkit/ToolSettings.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace dat_toolkit {

void Chase2NodesConverter::convert(const std::string& inPath,
                                   const std::string& outPath,
                                   const Options&     opts)
{
    const ToolSettings settings = ToolSettings::fromOptions(opts);

    const std::filesystem::path out = outPath.empty()
        ? defaultOutputPath(inPath)
        : std::filesystem::path(outPath);

    ConversionOutcome res = convertFile(inPath, out, settings.params, settings.backup);
    if (!res.success)
        throw std::runtime_error(res.message);

    std::cout << "[chase2nodes] " << res.message << '\n';
    if (res.logPath)
        std::cout << "[chase2nodes] log: " << res.logPath->string() << '\n';
}

} // namespace dat_toolkit
