#include "dat_toolkit/FileStream.hpp"
#include "dat_toolkit/ConversionError.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <ios>
#include <iterator>

namespace dat_toolkit {

static std::string reason()
{
    return errno ? std::strerror(errno) : "I/O error";
}

std::vector<char> FileReader::readAll(const std::string& path)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ConversionError(ErrorKind::UnreadableSource,
                              "cannot open " + path + ": " + reason());

    std::vector<char> data;
    try {
        data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        // libstdc++ reports underflow errors (e.g. reading a directory) by throwing
        throw ConversionError(ErrorKind::UnreadableSource,
                              "read failed for " + path + ": " + e.what());
    }
    if (in.bad())
        throw ConversionError(ErrorKind::UnreadableSource,
                              "read failed for " + path + ": " + reason());
    return data;
}

void FileWriter::writeAll(const std::string& path, const std::vector<char>& data)
{
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw ConversionError(ErrorKind::UnwritableDestination,
                              "cannot open " + path + " for write: " + reason());

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
        throw ConversionError(ErrorKind::UnwritableDestination,
                              "write failed for " + path + ": " + reason());
}

} // namespace dat_toolkit
