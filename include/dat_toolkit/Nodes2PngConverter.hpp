#pragma once
#include "Converter.hpp"

namespace dat_toolkit {

// Top-down (x/y) preview of a nodes.dat path as a PNG.
class Nodes2PngConverter final : public IConverter {
public:
    void convert(const std::string& inputPath,
                 const std::string& outputPath,
                 const Options&     opts) override;
};

} // namespace dat_toolkit
