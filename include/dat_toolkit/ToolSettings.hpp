#pragma once
#include "Converter.hpp"
#include "NodesFormat.hpp"

#include <cstddef>

namespace dat_toolkit {

// Built once from the option map and handed down by value/reference.
struct ToolSettings {
    ConversionParameters params;
    bool        backup     = true;
    int         threads    = 4;
    std::size_t maxPreview = 200;

    // Recognised keys: multiplier, area_id, width, node_type, flags,
    // backup, threads, max_preview. Throws std::invalid_argument on values
    // that do not parse or do not fit their field.
    static ToolSettings fromOptions(const Options& opts);
};

} // namespace dat_toolkit
