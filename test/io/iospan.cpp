#include "metaconf/io/iospan.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/mem/bytes.h"

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "test/testing_metaconf.h"

#include <numeric>
#include <vector>

using ::testing::HasSubstr;
using ::testing::ThrowsMessage;
using ::testing::AllOf;

using ::testing_metaconf::helpers::hexdump;

using namespace ::metaconf;

#define METACONF_EXPECT_BUFFER_SERIALIZATION(buf, at, len, data) do {      \
    EXPECT_EQ(hexdump((buf), (at), (len)), (data));                        \
} while (0)

namespace {
    TEST(IOSpanTest, SmallChunk) {
        bytes_t buf = {'A', 'B', 'C', 'D', 0, 0, 0, 0};
        bytes_t rdbuf;

        IOSpan iospan(buf);
        iospan.readall(rdbuf, 4);

        EXPECT_EQ(rdbuf.size(), (size_t)4);
        EXPECT_EQ(iospan.remain_rd(), uint32_t(8 - 4));
        EXPECT_EQ(iospan.tell_rd(), uint32_t(4));
        METACONF_EXPECT_BUFFER_SERIALIZATION(rdbuf, 0, -1, "4142 4344");

        // the rest
        iospan.readall(rdbuf);
        EXPECT_EQ(iospan.remain_rd(), uint32_t(0));
        METACONF_EXPECT_BUFFER_SERIALIZATION(rdbuf, 0, -1, "0000 0000");
    }

    TEST(IOSpanTest, Full) {
        bytes_t buf(64);
        std::iota(std::begin(buf), std::end(buf), 0); // fill with 0..64

        IOSpan iospan(buf);
        EXPECT_EQ(iospan.src_size(), uint32_t(64));
        EXPECT_EQ(iospan.hexdump(),
                "0001 0203 0405 0607 0809 0a0b 0c0d 0e0f 1011 1213 1415 1617 1819 1a1b 1c1d 1e1f "
                "2021 2223 2425 2627 2829 2a2b 2c2d 2e2f 3031 3233 3435 3637 3839 3a3b 3c3d 3e3f"
                );

        // hexdump does not move the rd pointer
        EXPECT_EQ(iospan.tell_rd(), uint32_t(0));
        EXPECT_EQ(iospan.hexdump(60, 8), "3c3d 3e3f");

        EXPECT_EQ(iospan.read_u8_from_le(), uint8_t(0x00));
        EXPECT_EQ(iospan.read_u8_from_le(), uint8_t(0x01));
        EXPECT_EQ(iospan.read_u16_from_le(), uint16_t(0x0302));
        EXPECT_EQ(iospan.read_u32_from_le(), uint32_t(0x07060504));
        EXPECT_EQ(iospan.read_u64_from_le(), uint64_t(0x0f0e0d0c0b0a0908));
        EXPECT_EQ(iospan.tell_rd(), uint32_t(16));
    }

    TEST(IOSpanTest, NotEnoughRoom) {
        bytes_t buf = {1, 2, 3};
        bytes_t rdbuf;

        IOSpan iospan(buf);
        iospan.seek_rd(1);

        EXPECT_THAT(
            [&]() { iospan.readall(rdbuf, 4); },
            ThrowsMessage<NotEnoughRoom>(
                AllOf(
                    HasSubstr("Requested 4 bytes at position 1 but only 2 bytes are available. "),
                    HasSubstr("Detected before the read.")
                    )
                )
        );

        // the failed read did not move the pointer
        EXPECT_EQ(iospan.tell_rd(), uint32_t(1));
        EXPECT_EQ(iospan.read_u16_from_le(), uint16_t(0x0302));

        EXPECT_THAT(
            [&]() { iospan.read_u8_from_le(); },
            ThrowsMessage<NotEnoughRoom>(HasSubstr("Requested 1 bytes at position 3 but only 0 bytes are available. "))
        );
    }

    TEST(IOSpanTest, Seek) {
        bytes_t buf(10);
        IOSpan iospan(buf);

        iospan.seek_rd(4);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(4));

        iospan.seek_rd(2, IOBase::Seekdir::fwd);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(6));

        iospan.seek_rd(3, IOBase::Seekdir::bwd);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(3));

        iospan.seek_rd(1, IOBase::Seekdir::end);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(9));

        // clamped to the extremes
        iospan.seek_rd(100, IOBase::Seekdir::fwd);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(10));

        iospan.seek_rd(100, IOBase::Seekdir::bwd);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(0));

        iospan.seek_rd(100);
        EXPECT_EQ(iospan.tell_rd(), uint32_t(10));
    }

    TEST(IOSpanTest, AutoRewind) {
        bytes_t buf = {1, 2, 3, 4};
        IOSpan iospan(buf);

        {
            auto guard = iospan.auto_rewind();
            iospan.read_u16_from_le();
            EXPECT_EQ(iospan.tell_rd(), uint32_t(2));
        }
        EXPECT_EQ(iospan.tell_rd(), uint32_t(0));

        {
            auto guard = iospan.auto_rewind();
            iospan.read_u16_from_le();
            guard.dont_rewind();
        }
        EXPECT_EQ(iospan.tell_rd(), uint32_t(2));
    }

    TEST(HexTest, ToAndFromHex) {
        EXPECT_EQ(to_hex({}), "0x");
        EXPECT_EQ(to_hex({0x6d, 0x65, 0x74, 0x61, 0x0e}), "0x6d6574610e");

        EXPECT_EQ(from_hex("0x6d6574610e"), (bytes_t{0x6d, 0x65, 0x74, 0x61, 0x0e}));
        EXPECT_EQ(from_hex("6D6574610E"), (bytes_t{0x6d, 0x65, 0x74, 0x61, 0x0e}));
        EXPECT_EQ(from_hex("0x"), bytes_t{});
        EXPECT_EQ(from_hex(""), bytes_t{});

        // blobs split in lines
        EXPECT_EQ(from_hex("\n  0x6d65\n  7461\n"), (bytes_t{0x6d, 0x65, 0x74, 0x61}));
    }

    TEST(HexTest, InvalidHex) {
        EXPECT_THAT(
            []() { from_hex("0x123"); },
            ThrowsMessage<DecodeError>(HasSubstr("Hexadecimal string has an odd count of digits."))
        );

        EXPECT_THAT(
            []() { from_hex("0x12zz"); },
            ThrowsMessage<DecodeError>(HasSubstr("Invalid hexadecimal character 'z' at position 2."))
        );
    }
}
