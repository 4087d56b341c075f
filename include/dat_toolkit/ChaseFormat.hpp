#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace dat_toolkit {

// The two historical chase record layouts, named after their size in bytes.
//   TwentyEight: int16 x3, int8 x10, float x3   (position = trailing floats)
//   Twenty:      float x3, int16 x4             (position = leading floats)
// All fields little-endian, no padding.
enum class RecordVariant {
    TwentyEight,
    Twenty
};

struct Position {
    float x, y, z;
};

std::size_t recordSize(RecordVariant v);

// byte offset of the float triple inside one record
std::size_t positionOffset(RecordVariant v);

// 28 is checked before 20. Empty buffers and common multiples of both
// sizes are ambiguous and yield std::nullopt, as do all other lengths.
std::optional<RecordVariant> detectVariant(std::size_t byteLength);

inline std::optional<RecordVariant> detectVariant(const std::vector<char>& data) {
    return detectVariant(data.size());
}

// Throws ConversionError(MalformedInput) when the length is not an exact
// multiple of the record size.
std::vector<Position> decodePositions(const std::vector<char>& data, RecordVariant v);

} // namespace dat_toolkit
