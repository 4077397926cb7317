#include <catch2/catch.hpp>

#include <xorname/xor_name.hpp>

#include <fmt/format.h>

#include <numeric>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <unordered_map>

using xorname::XOR_NAME_BITS;
using xorname::XOR_NAME_LEN;
using xorname::XorName;

using Array = XorName::Data;

static Array
fill(byte_t val)
{
  Array arr;
  arr.fill(val);
  return arr;
}

static Array
sequence()
{
  Array arr;
  std::iota(arr.begin(), arr.end(), 0);
  return arr;
}

TEST_CASE("XorName sizes", "[name]")
{
  static_assert(XOR_NAME_LEN == 64);
  static_assert(XOR_NAME_BITS == 512);
  static_assert(XorName::SIZE == XOR_NAME_LEN);
  static_assert(std::is_nothrow_move_constructible_v<XorName>);
  static_assert(std::is_copy_assignable_v<XorName>);
  CHECK(XorName{}.size() == XOR_NAME_LEN);
}

TEST_CASE("XorName constructors", "[name]")
{
  const auto seq = sequence();

  XorName a{seq};
  XorName b{seq.data()};
  XorName zero;

  REQUIRE(a == b);
  REQUIRE(zero.IsZero());
  REQUIRE(a != zero);
  REQUIRE(a.raw_bytes() == seq);
  REQUIRE(a.as_array() == seq);
}

TEST_CASE("XorName from runtime sized bytes", "[name]")
{
  const auto seq = sequence();

  SECTION("exact size")
  {
    const auto name = XorName::from_bytes(xorname::ustring_view{seq.data(), seq.size()});
    CHECK(name == XorName{seq});

    const auto same = XorName::from_bytes(name.ToView());
    CHECK(same == name);
  }

  SECTION("wrong size")
  {
    for (std::size_t len : {std::size_t{0}, XOR_NAME_LEN - 1, XOR_NAME_LEN + 1})
    {
      std::string bytes(len, '\x01');
      try
      {
        XorName::from_bytes(bytes);
        FAIL("expected DecodeError for length " << len);
      }
      catch (const xorname::DecodeError& e)
      {
        CHECK(e.kind() == xorname::DecodeError::Kind::InvalidLength);
      }
    }
  }
}

TEST_CASE("XorName equality", "[name]")
{
  const auto type1 = XorName::random();
  const auto type1_clone = type1;
  const auto type2 = XorName::random();

  REQUIRE(type1 == type1_clone);
  REQUIRE_FALSE(type1 != type1_clone);
  REQUIRE(type1 != type2);
  REQUIRE_FALSE(type1.IsZero());
}

TEST_CASE("XorName total order", "[name]")
{
  const XorName zero;
  const XorName one{fill(1)};
  const XorName seq{sequence()};
  const XorName full{fill(0xff)};

  CHECK(zero < seq);
  CHECK(seq < one);
  CHECK(one < full);
  CHECK(full > zero);
  CHECK(one <= one);
  CHECK(one >= one);
  CHECK_FALSE(full < one);

  CHECK(xorname::compare(zero, one) == xorname::Ordering::less);
  CHECK(xorname::compare(full, one) == xorname::Ordering::greater);
  CHECK(xorname::compare(seq, XorName{sequence()}) == xorname::Ordering::equal);

  SECTION("last byte decides when the rest agree")
  {
    auto arr = fill(0x10);
    arr.back() = 0x11;
    CHECK(XorName{fill(0x10)} < XorName{arr});
  }

  SECTION("ordering is numeric, first byte dominates")
  {
    auto small = fill(0xff);
    small[0] = 0x00;
    auto big = fill(0x00);
    big[0] = 0x01;
    CHECK(XorName{small} < XorName{big});
  }
}

TEST_CASE("XorName hashing", "[name]")
{
  const auto k = XorName::random();
  const auto other_k = XorName::random();

  std::unordered_map<XorName, int> m;
  CHECK(m.emplace(k, 1).second);
  CHECK_FALSE(m.emplace(XorName{k.raw_bytes()}, 2).second);
  CHECK(m.at(k) == 1);
  CHECK(m.find(other_k) == m.end());

  CHECK(std::hash<XorName>{}(k) == std::hash<XorName>{}(XorName{k.raw_bytes()}));

  SECTION("names differing only in the last byte are distinct keys")
  {
    auto a = fill(0);
    auto b = fill(0);
    b.back() = 1;

    std::unordered_map<XorName, int> prefixed;
    CHECK(prefixed.emplace(XorName{a}, 1).second);
    CHECK(prefixed.emplace(XorName{b}, 2).second);
    CHECK(prefixed.size() == 2);
    CHECK(prefixed.at(XorName{a}) == 1);
    CHECK(prefixed.at(XorName{b}) == 2);
  }
}

TEST_CASE("XorName byte slices", "[name]")
{
  const XorName name{sequence()};

  SECTION("full")
  {
    auto s = name.byte_slice();
    REQUIRE(s.size() == XOR_NAME_LEN);
    CHECK(s.data() == name.data());
  }

  SECTION("prefix")
  {
    auto s = name.prefix(5);
    REQUIRE(s.size() == 5);
    CHECK(s[0] == 0);
    CHECK(s[4] == 4);
    CHECK(s.data() == name.data());
    CHECK(name.prefix(0).empty());
  }

  SECTION("suffix")
  {
    auto s = name.suffix(60);
    REQUIRE(s.size() == 4);
    CHECK(s[0] == 60);
    CHECK(s[3] == 63);
    CHECK(name.suffix(XOR_NAME_LEN).empty());
  }

  SECTION("range")
  {
    auto s = name.byte_slice(10, 20);
    REQUIRE(s.size() == 10);
    CHECK(s.front() == 10);
    CHECK(s.back() == 19);
    CHECK(s.data() == name.data() + 10);
  }

  SECTION("out of range")
  {
    CHECK_THROWS_AS(name.prefix(XOR_NAME_LEN + 1), std::out_of_range);
    CHECK_THROWS_AS(name.suffix(XOR_NAME_LEN + 1), std::out_of_range);
    CHECK_THROWS_AS(name.byte_slice(20, 10), std::out_of_range);
    CHECK_THROWS_AS(name.byte_slice(0, XOR_NAME_LEN + 1), std::out_of_range);
  }
}

TEST_CASE("XorName short form of random names", "[name][format]")
{
  for (int i = 0; i < 5; ++i)
  {
    const auto my_name = XorName::random();
    const auto debug_id = my_name.ToString();
    const auto full_id = my_name.ToHex();

    REQUIRE(debug_id.size() == 14);
    REQUIRE(full_id.size() == 2 * XOR_NAME_LEN);
    CHECK(debug_id.substr(0, 6) == full_id.substr(0, 6));
    CHECK(debug_id.substr(8, 6) == full_id.substr(2 * XOR_NAME_LEN - 6, 6));
    CHECK(debug_id.substr(6, 2) == "..");
  }
}

TEST_CASE("XorName short form of fixed low bytes", "[name][format]")
{
  const XorName my_low_char_name{fill(1)};
  const auto debug_id = my_low_char_name.ToString();
  const auto full_id = my_low_char_name.ToHex();

  std::string expected_hex;
  for (std::size_t i = 0; i < XOR_NAME_LEN; ++i)
    expected_hex += "01";

  CHECK(full_id == expected_hex);
  CHECK(debug_id == "010101..010101");
  CHECK(debug_id.substr(0, 6) == full_id.substr(0, 6));
  CHECK(debug_id.substr(8, 6) == full_id.substr(2 * XOR_NAME_LEN - 6, 6));
}

TEST_CASE("XorName output", "[name][format]")
{
  const XorName name{sequence()};

  CHECK(name.ToString() == "000102..3d3e3f");
  CHECK(fmt::format("{}", name) == "000102..3d3e3f");
  CHECK(fmt::format("<{}>", xorname::Ordering::less) == "<less>");

  std::ostringstream out;
  out << name;
  CHECK(out.str() == "000102..3d3e3f");
}

TEST_CASE("XorName is shareable between threads", "[name]")
{
  const XorName name{sequence()};
  std::size_t from_thread = 0;

  std::thread t{[name, &from_thread] { from_thread = name.common_prefix_length(XorName{}); }};
  t.join();

  CHECK(from_thread == name.common_prefix_length(XorName{}));
}
