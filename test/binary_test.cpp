#include "cfigen/binary.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/error.hpp"
#include <gtest/gtest.h>

using namespace cfigen;

TEST(Writer, Leb128) {
  std::vector<uint8_t> bytes;
  Writer w(bytes);
  w.write_uleb(624485);
  w.write_sleb(-123456);
  w.write_sleb(-8);
  std::vector<uint8_t> expected = {0xe5, 0x8e, 0x26, 0xc0, 0xbb, 0x78, 0x78};
  EXPECT_EQ(bytes, expected);
}

TEST(Writer, PatchOutOfRange) {
  std::vector<uint8_t> bytes;
  Writer w(bytes);
  w.write(uint16_t{0});
  EXPECT_THROW(w.patch(0, uint32_t{1}), precondition_error);
  w.patch(0, uint16_t{0x1234});
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x34, 0x12}));
}

TEST(Reader, ConsumesInOrder) {
  std::vector<uint8_t> bytes = {0x01, 0x02, 0x00, 'a', 'b', 0, 0xe5, 0x8e, 0x26, 0x7f};
  Reader r(bytes);
  EXPECT_EQ(r.consume<uint8_t>(), 1);
  EXPECT_EQ(r.consume<uint16_t>(), 2);
  EXPECT_EQ(r.consume_cstr(), "ab");
  EXPECT_EQ(r.consume_uleb(), 624485u);
  EXPECT_EQ(r.consume_sleb(), -1);
  EXPECT_TRUE(r.empty());
  EXPECT_EQ(r.bytes_read, bytes.size());
}

TEST(Reader, ErrorsPastTheEnd) {
  std::vector<uint8_t> bytes = {0x80, 'x'};
  Reader r(bytes);
  EXPECT_THROW(r.consume<uint32_t>(), read_error);
  EXPECT_THROW(r.subspan(3), read_error);
  EXPECT_THROW(Reader(std::span(bytes).first(1)).consume_uleb(), read_error);
  r.increment(1);
  EXPECT_THROW(r.consume_cstr(), read_error);
}

TEST(Cast, Checked) {
  EXPECT_EQ(cast<uint8_t>(255), 255);
  EXPECT_THROW(cast<uint8_t>(256), precondition_error);
  EXPECT_THROW(cast<uint32_t>(-1), precondition_error);
  EXPECT_EQ(cast<int64_t>(uint32_t{7}), 7);
}
