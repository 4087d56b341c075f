#pragma once
#include "Converter.hpp"

namespace dat_toolkit {

class Chase2NodesConverter final : public IConverter {
public:
    void convert(const std::string& inputPath,
                 const std::string& outputPath,
                 const Options&     opts) override;
};

} // namespace dat_toolkit
