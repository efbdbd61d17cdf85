#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "metaconf/codec/writer.h"
#include "metaconf/io/iobase.h"
#include "metaconf/mem/bytes.h"

/*
 * Readers (and a few writers) of the SCALE-style building blocks shared
 * by the metadata bodies and the dynamic value codec.
 *
 * All the readers throw DecodeError on malformed input, including
 * inputs that are shorter than what the encoding announces.
 * */
namespace metaconf::scale {
// Like IOBase::read_u8_from_le but throwing DecodeError
uint8_t read_u8(IOBase& io);
uint32_t read_u32(IOBase& io);

[[noreturn]] void throw_count_too_large(const IOBase& io, uint32_t cnt);
[[noreturn]] void throw_bad_option_flag(uint32_t at, uint8_t flag);

/*
 * Read a compact-encoded unsigned integer and return its
 * little endian magnitude (no trailing zeros; zero is an empty vector).
 * */
bytes_t read_compact_magnitude(IOBase& io);

uint64_t read_compact_u64(IOBase& io);
uint32_t read_compact_u32(IOBase& io);

bool read_bool(IOBase& io);

// Compact length prefix followed by the raw bytes / UTF-8 text
bytes_t read_bytes(IOBase& io);
std::string read_text(IOBase& io);

/*
 * Read a Vec<T>: a compact count followed by the elements, each
 * read with the given function.
 * */
template <typename T>
std::vector<T> read_vec(IOBase& io, const std::function<T(IOBase&)>& read_elem) {
    const uint32_t cnt = read_compact_u32(io);

    // Each element takes at least one byte: a larger count can only
    // be a corruption and we don't want to reserve a huge vector for it
    if (cnt > io.remain_rd()) {
        throw_count_too_large(io, cnt);
    }

    std::vector<T> elems;
    elems.reserve(cnt);
    for (uint32_t i = 0; i < cnt; ++i) {
        elems.push_back(read_elem(io));
    }
    return elems;
}

template <typename T>
std::optional<T> read_option(IOBase& io, const std::function<T(IOBase&)>& read_elem) {
    const uint32_t at = io.tell_rd();
    const uint8_t flag = read_u8(io);
    if (flag == 0) {
        return std::nullopt;
    }
    if (flag != 1) {
        throw_bad_option_flag(at, flag);
    }
    return read_elem(io);
}

std::vector<std::string> read_text_vec(IOBase& io);

template <typename T>
void write_vec(Writer& wr, const std::vector<T>& elems, const std::function<void(Writer&, const T&)>& write_elem) {
    wr.write_compact(uint64_t(elems.size()));
    for (const auto& elem: elems) {
        write_elem(wr, elem);
    }
}

template <typename T>
void write_option(Writer& wr, const std::optional<T>& val, const std::function<void(Writer&, const T&)>& write_elem) {
    if (not val) {
        wr.write_u8_to_le(0);
        return;
    }
    wr.write_u8_to_le(1);
    write_elem(wr, *val);
}

void write_text_vec(Writer& wr, const std::vector<std::string>& texts);
}  // namespace metaconf::scale
