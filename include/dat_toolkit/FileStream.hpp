#pragma once
#include <string>
#include <vector>

namespace dat_toolkit {

// Whole-file helpers. Both throw ConversionError
// (UnreadableSource / UnwritableDestination) on I/O failure.
class FileReader {
public:
    static std::vector<char> readAll(const std::string& path);
};

class FileWriter {
public:
    static void writeAll(const std::string& path, const std::vector<char>& data);
};

} // namespace dat_toolkit
