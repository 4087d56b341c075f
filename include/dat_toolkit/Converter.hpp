#pragma once
#include <string>
#include <unordered_map>

namespace dat_toolkit {

// --key value pairs from the command line, passed unchanged to every step
struct Options {
    std::unordered_map<std::string, std::string> params;
};

class IConverter {
public:
    virtual ~IConverter() = default;
    // inputPath → outputPath; throws on failure
    virtual void convert(const std::string& inputPath,
                         const std::string& outputPath,
                         const Options& opts) = 0;
};

} // namespace dat_toolkit
