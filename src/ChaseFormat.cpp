#include "dat_toolkit/ChaseFormat.hpp"
#include "dat_toolkit/ConversionError.hpp"
#include "LittleEndian.hpp"

#include <string>

namespace dat_toolkit {

std::size_t recordSize(RecordVariant v)
{
    return v == RecordVariant::TwentyEight ? 28 : 20;
}

std::size_t positionOffset(RecordVariant v)
{
    // 3 x int16 + 10 x int8 precede the floats in the 28-byte layout
    return v == RecordVariant::TwentyEight ? 16 : 0;
}

std::optional<RecordVariant> detectVariant(std::size_t n)
{
    if (n == 0) return std::nullopt;
    const bool by28 = n % 28 == 0;
    const bool by20 = n % 20 == 0;
    if (by28 && by20) return std::nullopt;   // multiple of 140: ambiguous
    if (by28) return RecordVariant::TwentyEight;
    if (by20) return RecordVariant::Twenty;
    return std::nullopt;
}

std::vector<Position> decodePositions(const std::vector<char>& data, RecordVariant v)
{
    const std::size_t size = recordSize(v);
    if (data.size() % size != 0)
        throw ConversionError(ErrorKind::MalformedInput,
                              std::to_string(data.size()) + " bytes is not a multiple of the "
                              + std::to_string(size) + "-byte record size");

    const std::size_t count  = data.size() / size;
    const std::size_t offset = positionOffset(v);

    std::vector<Position> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const char* p = data.data() + i * size + offset;
        out.push_back({ le::readF32(p), le::readF32(p + 4), le::readF32(p + 8) });
    }
    return out;
}

} // namespace dat_toolkit
