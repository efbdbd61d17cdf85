#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "metaconf/mem/bytes.h"
#include "metaconf/mem/endianness.h"

namespace metaconf {
/*
 * Abstract base class to read from a source of bytes like a traditional
 * C++ istream but simpler and with a more binary-oriented API.
 *
 * Subclasses must implement the rd_operation virtual method
 * to handle the real reads from "the source" including
 * the correct update of the rd pointer.
 *
 * IOBase has no assumption of what "the source" can be: it could
 * be a buffer in memory, a file or other. The only requirement
 * is that the source cannot change its size (neither grow nor shrink).
 *
 * Writing is not supported: encoders write into a growable Writer
 * (see metaconf/codec/writer.h).
 * */
class IOBase {
public:
    explicit IOBase(const uint32_t src_sz);

    /*
     * Read exactly exact_sz bytes. If there are not enough bytes
     * left, throw NotEnoughRoom and leave the rd pointer untouched.
     *
     * When a raw pointer is given, it is the caller's responsibility
     * to ensure that it points to an allocated memory large enough.
     * */
    void readall(char* data, const uint32_t exact_sz) { rd_operation_exact_sz(data, exact_sz); }

    void readall(bytes_t& data, const uint32_t exact_sz = uint32_t(-1)) {
        const uint32_t reserve_sz = exact_sz == uint32_t(-1) ? remain_rd() : exact_sz;
        if (data.size() < reserve_sz) {
            data.resize(reserve_sz);
        }
        rd_operation_exact_sz(reinterpret_cast<char*>(data.data()), reserve_sz);
    }

    uint32_t readsome(char* data, const uint32_t max_sz) { return rd_operation(data, max_sz); }

    /*
     * hexdump() return a hexadecimal string representation of the content of the io object
     * reading from it at the given <at> point and up to <len> bytes.
     * dump() does the same but returns the raw bytes (no hexdump).
     *
     * The <rd> pointer is ignored and restored at the end of the call.
     * */
    std::string hexdump(uint32_t at = 0, uint32_t len = uint32_t(-1));
    bytes_t dump(uint32_t at = 0, uint32_t len = uint32_t(-1));

    uint32_t tell_rd() const { return rd; }

    enum Seekdir { beg = 0, end = 1, fwd = 2, bwd = 3 };

    void seek_rd(uint32_t pos, Seekdir way = Seekdir::beg) { rd = calc_seek(pos, rd, way); }

    uint32_t remain_rd() const { return src_sz - rd; }

    uint32_t src_size() const { return src_sz; }

    uint8_t read_u8_from_le() {
        uint8_t num = 0;
        readall(reinterpret_cast<char*>(&num), sizeof(num));

        return u8_from_le(num);
    }

    uint16_t read_u16_from_le() {
        uint16_t num = 0;
        readall(reinterpret_cast<char*>(&num), sizeof(num));

        return u16_from_le(num);
    }

    uint32_t read_u32_from_le() {
        uint32_t num = 0;
        readall(reinterpret_cast<char*>(&num), sizeof(num));

        return u32_from_le(num);
    }

    uint64_t read_u64_from_le() {
        uint64_t num = 0;
        readall(reinterpret_cast<char*>(&num), sizeof(num));

        return u64_from_le(num);
    }

    class RewindGuard {
    private:
        IOBase& io;
        uint32_t rd;
        bool disabled;

    public:
        explicit RewindGuard(IOBase& io): io(io), rd(io.tell_rd()), disabled(false) {}
        ~RewindGuard() {
            if (not disabled) {
                io.seek_rd(rd);
            }
        }

        void dont_rewind() { disabled = true; }

        RewindGuard(const RewindGuard&) = delete;
        RewindGuard& operator=(const RewindGuard&) = delete;
    };

    /*
     * Create a RAII object that will rewind the read pointer
     * to its value at the moment of this call.
     *
     * The object has a dont_rewind() method that if called it will
     * disable the rewind.
     * */
    RewindGuard auto_rewind() { return RewindGuard(*this); }

    virtual ~IOBase() {}

protected:
    /*
     * The given buffer must have enough space to hold max_data_sz bytes. The operation
     * will read up to max_data_sz bytes but it may less.
     *
     * The count of bytes read is returned.
     * */
    virtual uint32_t rd_operation(char* data, const uint32_t data_sz) = 0;

private:
    const uint32_t src_sz;

protected:
    uint32_t rd;

    /*
     * If the source has N remaining unread bytes such N is less than exact_sz,
     * then the method will throw.
     *
     * If after the operation execution the read bytes is different
     * than exact_sz, also it throws.
     * */
    void rd_operation_exact_sz(char* data, const uint32_t exact_sz);

    /*
     * Return the new read pointer with initial value <cur> as it is were updating
     * to the new position <pos> where this position can be interpreted as:
     *  - absolute position (way == Seekdir::beg)
     *  - absolute backward position (way == Seekdir::end)
     *  - relative to cur position in forward direction (way == Seekdir::fwd)
     *  - relative to cur position in backward direction (way == Seekdir::bwd)
     *
     * If the calculated position goes beyond the source the returned position is
     * clamp to nearest extreme.
     **/
    uint32_t calc_seek(uint32_t pos, uint32_t cur, Seekdir way = Seekdir::beg) const;
};
}  // namespace metaconf
