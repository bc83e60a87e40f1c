#include "base32.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <string>

namespace {
	namespace base32 = ulidgen::base32;
	using ulidgen::payload_t;

	TEST(Base32, AlphabetExcludesAmbiguousLetters){
		const std::string alphabet(base32::ENCODING, 32);
		EXPECT_EQ(alphabet, "0123456789ABCDEFGHJKMNPQRSTVWXYZ");
		for(char c : {'I', 'L', 'O', 'U'}){
			EXPECT_EQ(alphabet.find(c), std::string::npos);
		}
	}

	TEST(Base32, DerivedSizes){
		static_assert(base32::TIMESTAMP_CHARS == 10);
		static_assert(base32::RANDOM_CHARS == 16);
		static_assert(base32::ULID_CHARS == 26);
		static_assert(base32::BITS_PER_CHAR == 5);
		static_assert(base32::MAX_TIMESTAMP == 0xFFFFFFFFFFFFULL);
		SUCCEED();
	}

	TEST(Base32, DecodeCharIsInverseOfAlphabet){
		for(std::size_t i = 0; i < 32; ++i){
			const char upper = base32::ENCODING[i];
			ASSERT_EQ(base32::decode_char(upper), std::optional<ulidgen::byte>{static_cast<ulidgen::byte>(i)}) << upper;
			if(upper >= 'A'){
				const char lower = static_cast<char>(upper - 'A' + 'a');
				EXPECT_EQ(base32::decode_char(lower), std::optional<ulidgen::byte>{static_cast<ulidgen::byte>(i)}) << lower;
			}
		}
		for(char c : {'I', 'L', 'O', 'U', 'i', 'l', 'o', 'u', '-', ' ', '\0', '\x80'}){
			EXPECT_FALSE(base32::decode_char(c).has_value()) << static_cast<int>(c);
		}
	}

	TEST(Base32, EncodesZero){
		EXPECT_EQ(base32::encode(0, payload_t{}), "00000000000000000000000000");
		EXPECT_EQ(base32::decode_timestamp("00000000000000000000000000"), std::optional<std::uint64_t>{0});
	}

	TEST(Base32, EncodesMaximum){
		payload_t ones{};
		ones.fill(0xFF);
		const auto s = base32::encode(base32::MAX_TIMESTAMP, ones);
		EXPECT_EQ(s, "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
		EXPECT_EQ(base32::decode_timestamp(s), std::optional<std::uint64_t>{base32::MAX_TIMESTAMP});
		EXPECT_EQ(base32::decode_random(s), std::optional<payload_t>{ones});
	}

	TEST(Base32, EncodeTimestampTruncatesAbove48Bits){
		EXPECT_EQ(base32::encode_timestamp(base32::MAX_TIMESTAMP + 1), "0000000000");
		EXPECT_EQ(base32::encode_timestamp(0xFFFF000000000001ULL), "0000000001");
	}

	TEST(Base32, KnownVectors){
		EXPECT_EQ(base32::encode_timestamp(1469922850259ULL), "01ARZ3NDEK");
		EXPECT_EQ(base32::encode_timestamp(0x000102030405ULL), "0004106105");

		const payload_t pattern{0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99};
		EXPECT_EQ(base32::encode_random(pattern), "008J4CT4ANK7F24S");

		payload_t one{};
		one[9] = 1;
		EXPECT_EQ(base32::encode_random(one), "0000000000000001");

		payload_t two_fifty_six{};
		two_fifty_six[8] = 1;
		EXPECT_EQ(base32::encode_random(two_fifty_six), "0000000000000080");
	}

	TEST(Base32, DecodeRandomKnownVector){
		const payload_t expected{0xD6, 0x76, 0x4C, 0x61, 0xEF, 0xB9, 0x93, 0x02, 0xBD, 0x5B};
		EXPECT_EQ(base32::decode_random("01ARZ3NDEKTSV4RRFFQ69G5FAV"), std::optional<payload_t>{expected});
	}

	TEST(Base32, TimestampRoundtripAcrossRange){
		// walk every bit position plus a spread of random values
		for(unsigned bit = 0; bit < 48; ++bit){
			const std::uint64_t ts = std::uint64_t{1} << bit;
			const auto s = base32::encode(ts, payload_t{});
			ASSERT_EQ(base32::decode_timestamp(s), std::optional<std::uint64_t>{ts}) << s;
		}
		std::mt19937_64 rng{2024};
		std::uniform_int_distribution<std::uint64_t> dist(0, base32::MAX_TIMESTAMP);
		for(int i = 0; i < 1000; ++i){
			const std::uint64_t ts = dist(rng);
			payload_t payload{};
			for(auto& b : payload){
				b = static_cast<ulidgen::byte>(rng());
			}
			const auto s = base32::encode(ts, payload);
			ASSERT_EQ(base32::decode_timestamp(s), std::optional<std::uint64_t>{ts}) << s;
			ASSERT_EQ(base32::decode_random(s), std::optional<payload_t>{payload}) << s;
		}
	}

	TEST(Base32, TimestampTextOrderMatchesNumericOrder){
		std::mt19937_64 rng{7};
		std::uniform_int_distribution<std::uint64_t> dist(0, base32::MAX_TIMESTAMP);
		for(int i = 0; i < 1000; ++i){
			const auto a = dist(rng);
			const auto b = dist(rng);
			EXPECT_EQ(a < b, base32::encode_timestamp(a) < base32::encode_timestamp(b));
		}
	}

	TEST(Base32, IsValid){
		EXPECT_TRUE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
		EXPECT_TRUE(base32::is_valid("01arz3ndektsv4rrffq69g5fav"));
		EXPECT_FALSE(base32::is_valid(""));
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FA"));   // 25
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAVV")); // 27
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAI"));
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAL"));
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAO"));
		EXPECT_FALSE(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAU"));
		EXPECT_FALSE(base32::is_valid("80000000000000000000000000")); // timestamp overflow
		EXPECT_FALSE(base32::decode_timestamp("8ZZZZZZZZZZZZZZZZZZZZZZZZZ").has_value());
	}

	TEST(Base32, CompileTimeEvaluation){
		static_assert(base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
		static_assert(!base32::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAU"));
		static_assert(*base32::decode_timestamp("01ARZ3NDEKTSV4RRFFQ69G5FAV") == 1469922850259ULL);
		SUCCEED();
	}

} // namespace
