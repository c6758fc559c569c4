#include "utils/serialize.h"

namespace sciencefund {
namespace utils {

static constexpr uint64_t MAX_LIST_ITEMS = 1u << 20;

void ByteWriter::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteWriter::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteWriter::writeBool(bool value) {
    writeUint8(value ? 1 : 0);
}

void ByteWriter::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::writeString(const std::string& value) {
    writeVarInt(value.length());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteWriter::writeStringList(const std::vector<std::string>& values) {
    writeVarInt(values.size());
    for (const auto& v : values) writeString(v);
}

bool ByteReader::canRead(uint64_t bytes) const {
    return bytes <= data_.size() - readPos_;
}

bool ByteReader::readUint8(uint8_t& out) {
    if (!canRead(1)) return false;
    out = data_[readPos_++];
    return true;
}

bool ByteReader::readUint64(uint64_t& out) {
    if (!canRead(8)) return false;
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | static_cast<uint64_t>(data_[readPos_ + i]);
    }
    readPos_ += 8;
    out = value;
    return true;
}

bool ByteReader::readBool(bool& out) {
    uint8_t b = 0;
    if (!readUint8(b) || b > 1) return false;
    out = b != 0;
    return true;
}

bool ByteReader::readVarInt(uint64_t& out) {
    uint64_t value = 0;
    int shift = 0;
    size_t pos = readPos_;

    while (true) {
        if (pos >= data_.size()) return false;
        uint8_t byte = data_[pos++];
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;

        if ((byte & 0x80) == 0) break;
        shift += 7;

        if (shift >= 64) return false;
    }

    readPos_ = pos;
    out = value;
    return true;
}

bool ByteReader::readString(std::string& out) {
    size_t start = readPos_;
    uint64_t length = 0;
    if (!readVarInt(length)) return false;
    if (!canRead(length)) {
        readPos_ = start;
        return false;
    }

    out.assign(reinterpret_cast<const char*>(data_.data() + readPos_), static_cast<size_t>(length));
    readPos_ += static_cast<size_t>(length);
    return true;
}

bool ByteReader::readStringList(std::vector<std::string>& out) {
    size_t start = readPos_;
    uint64_t count = 0;
    if (!readVarInt(count) || count > MAX_LIST_ITEMS) {
        readPos_ = start;
        return false;
    }
    std::vector<std::string> items;
    items.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; i++) {
        std::string s;
        if (!readString(s)) {
            readPos_ = start;
            return false;
        }
        items.push_back(std::move(s));
    }
    out = std::move(items);
    return true;
}

std::vector<uint8_t> encodeU64(uint64_t value) {
    ByteWriter w;
    w.writeUint64(value);
    return w.take();
}

bool decodeU64(const std::vector<uint8_t>& data, uint64_t& out) {
    if (data.size() != 8) return false;
    ByteReader r(data);
    return r.readUint64(out);
}

}
}
