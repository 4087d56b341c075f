#include "dat_toolkit/ConverterFactory.hpp"
#include "dat_toolkit/Chase2NodesConverter.hpp"
#include "dat_toolkit/Nodes2PngConverter.hpp"
#include <stdexcept>

namespace dat_toolkit {

std::unique_ptr<IConverter> ConverterFactory::create(const std::string& id) {
    if (id == "chase2nodes") return std::make_unique<Chase2NodesConverter>();
    if (id == "nodes2png")   return std::make_unique<Nodes2PngConverter>();
    throw std::invalid_argument("Unknown converter: " + id);
}

std::vector<std::string> ConverterFactory::available() {
    return { "chase2nodes", "nodes2png" };
}

} // namespace dat_toolkit
