#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace sciencefund {
namespace utils {

// Big-endian fixed ints, varint-prefixed strings.
class ByteWriter {
public:
    ByteWriter() = default;

    void writeUint8(uint8_t value);
    void writeUint64(uint64_t value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeStringList(const std::vector<std::string>& values);

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> take() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

// Every read returns false on truncated or malformed input and leaves the
// output untouched.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

    bool readUint8(uint8_t& out);
    bool readUint64(uint64_t& out);
    bool readBool(bool& out);
    bool readVarInt(uint64_t& out);
    bool readString(std::string& out);
    bool readStringList(std::vector<std::string>& out);

    size_t remaining() const { return data_.size() - readPos_; }
    bool atEnd() const { return readPos_ == data_.size(); }

private:
    bool canRead(uint64_t bytes) const;

    const std::vector<uint8_t>& data_;
    size_t readPos_;
};

std::vector<uint8_t> encodeU64(uint64_t value);
bool decodeU64(const std::vector<uint8_t>& data, uint64_t& out);

}
}
