#pragma once
#include "Converter.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dat_toolkit {

class ConverterFactory {
public:
    // creates a converter by key, e.g. "chase2nodes"
    static std::unique_ptr<IConverter> create(const std::string& converterId);

    static std::vector<std::string> available();
};

} // namespace dat_toolkit
