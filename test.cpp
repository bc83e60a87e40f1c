#include "ulid.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <compare>
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace {
	using ulidgen::ulid_t;
	using ulidgen::format_error;

	//helper
	// Crockford Base32 alphabet:
		// 0123456789ABCDEFGHJKMNPQRSTVWXYZ
	constexpr static bool is_crockford_char(char c) noexcept{
		switch(c){
		case '0': case '1': case '2': case '3': case '4':
		case '5': case '6': case '7': case '8': case '9':
		case 'A': case 'B': case 'C': case 'D': case 'E':
		case 'F': case 'G': case 'H': case 'J': case 'K':
		case 'M': case 'N': case 'P': case 'Q': case 'R':
		case 'S': case 'T': case 'V': case 'W': case 'X':
		case 'Y': case 'Z':
			return true;
		default:
			return false;
		}
	};

	// Helper: construct a ULID byte array from a 48-bit timestamp
	// Timestamp is encoded big-endian in bytes[0..5], rest of the bytes are set to 0.
	static std::array<ulid_t::byte, 16> make_bytes_from_timestamp(std::uint64_t ts) noexcept{
		std::array<ulid_t::byte, 16> bytes{};
		for(int i = 0; i < 6; ++i){
			bytes[i] = static_cast<ulid_t::byte>(
				(ts >> ((5 - i) * 8)) & 0xFFu
				);
		}
		return bytes;
	}

	TEST(Ulid, AllZeroBytesRoundtrip){
		ulid_t zero{}; // default-initialized, all bytes zero
		auto str = zero.to_string();
		EXPECT_EQ(str, "00000000000000000000000000");

		auto parsed_opt = ulid_t::from_string(str);
		ASSERT_TRUE(parsed_opt.has_value());
		EXPECT_EQ(*parsed_opt, zero);
		EXPECT_EQ(parsed_opt->timestamp_ms(), 0u);
	}

	TEST(Ulid, MaximalUlidRoundtrip){
		const std::string max = "7ZZZZZZZZZZZZZZZZZZZZZZZZZ";
		const auto id = ulid_t::parse(max);

		EXPECT_EQ(id.timestamp_ms(), (std::uint64_t{1} << 48) - 1);
		EXPECT_EQ(id.to_string(), max);
		for(auto b : id.to_bytes()){
			EXPECT_EQ(b, 0xFF);
		}
	}

	TEST(Ulid, ToStringHasCorrectLengthAndAlphabet){
		for(int i = 0; i < 1000; ++i){
			auto s = ulid_t::generate().to_string();
			ASSERT_EQ(s.size(), 26u);
			for(char c : s){
				ASSERT_TRUE(is_crockford_char(c))
					<< "Unexpected character in ULID string: " << c;
			}
		}
	}

	TEST(Ulid, RoundtripGenerate){
		// generate -> to_string -> from_string is identity.
		for(int i = 0; i < 1000; ++i){
			auto id = ulid_t::generate();
			auto str = id.to_string();

			auto parsed_opt = ulid_t::from_string(str);
			ASSERT_TRUE(parsed_opt.has_value()) << "Failed to parse: " << str;
			EXPECT_EQ(*parsed_opt, id);
		}
	}

	TEST(Ulid, GenerateWithTimestampKeepsTimestamp){
		const std::uint64_t ts = 1469922850259ULL;
		const auto id = ulid_t::generate(ts);
		EXPECT_EQ(id.timestamp_ms(), ts);
		EXPECT_EQ(id.to_string().substr(0, 10), "01ARZ3NDEK");
	}

	TEST(Ulid, GenerateTruncatesTimestampTo48Bits){
		const std::uint64_t ts = (std::uint64_t{0xABCD} << 48) | 0x000102030405ULL;
		const auto id = ulid_t::generate(ts);
		EXPECT_EQ(id.timestamp_ms(), 0x000102030405ULL);
	}

	TEST(Ulid, ConsecutiveGenerationIsStrictlyIncreasing){
		// default_generator() is monotonic, so even same-millisecond ids ascend
		constexpr int N = 512;
		std::array<ulid_t, N> ids{};

		for(int i = 0; i < N; ++i){
			ids[i] = ulid_t::generate();
		}

		for(int i = 1; i < N; ++i){
			EXPECT_LT(ids[i - 1], ids[i])
				<< "Non-monotonic at index " << i;
		}
	}

	TEST(Ulid, RepeatedForcedTimestampNeverCollides){
		const std::uint64_t ts = 1700000000000ULL;
		for(int i = 0; i < 100'000; ++i){
			const auto a = ulid_t::generate(ts);
			const auto b = ulid_t::generate(ts);
			ASSERT_NE(a, b) << "collision at iteration " << i;
			ASSERT_LT(a, b);
		}
	}

	TEST(Ulid, GenerateProducesUniqueIds){
		constexpr std::size_t N = 100'000;
		std::unordered_set<ulid_t> s;
		s.reserve(N);

		for(std::size_t i = 0; i < N; ++i){
			s.insert(ulid_t::generate());
		}
		EXPECT_EQ(s.size(), N);
	}

	TEST(Ulid, FromStringRejectsInvalidLength){
		EXPECT_FALSE(ulid_t::from_string("123").has_value());
		EXPECT_FALSE(ulid_t::from_string(std::string(30, 'A')).has_value());
		EXPECT_FALSE(ulid_t::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAVA").has_value()); // 27
		EXPECT_FALSE(ulid_t::from_string("").has_value());
	}

	TEST(Ulid, FromStringRejectsInvalidCharacters){
		// Contains '!' which is not in Crockford Base32
		EXPECT_FALSE(ulid_t::from_string("01ARZ3NDEKTSV4RRFFQ69G5FA!").has_value());
	}

	TEST(Ulid, RejectsAmbiguousLetters){
		const std::string canonical = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
		for(char bad : {'I', 'L', 'O', 'U', 'i', 'l', 'o', 'u'}){
			std::string s = canonical;
			s[12] = bad;
			EXPECT_FALSE(ulid_t::is_valid(s)) << "accepted '" << bad << "'";
			EXPECT_FALSE(ulid_t::from_string(s).has_value());
			EXPECT_THROW((void)ulid_t::parse(s), format_error);
		}
	}

	TEST(Ulid, RejectsNullInput){
		const char* nothing = nullptr;
		EXPECT_FALSE(ulid_t::is_valid(nothing));
		EXPECT_FALSE(ulid_t::from_string(nothing).has_value());
		EXPECT_THROW((void)ulid_t::parse(nothing), format_error);
		EXPECT_THROW((void)ulidgen::timestamp_of(nothing), format_error);
	}

	TEST(Ulid, FromStringRejectsNonCanonicalHighBits){
		// First digit '8' => value 8 (0b01000), which sets the top bits non-zero
		std::string non_canonical = "8" + std::string(25, '0');

		EXPECT_FALSE(ulid_t::from_string(non_canonical).has_value());
		EXPECT_FALSE(ulid_t::is_valid(non_canonical));
		EXPECT_THROW((void)ulid_t::parse(non_canonical), format_error);
	}

	TEST(Ulid, ParseErrorNamesTheProblem){
		try{
			(void)ulid_t::parse("01ARZ3NDEKTSV4RRFFQ69G5FAVA");
			FAIL() << "expected format_error";
		} catch(const format_error& e){
			EXPECT_NE(std::string(e.what()).find("26"), std::string::npos) << e.what();
		}
		try{
			(void)ulid_t::parse("01ARZ3NDEKTSV4RRFFQ69G5FUV");
			FAIL() << "expected format_error";
		} catch(const format_error& e){
			EXPECT_NE(std::string(e.what()).find("position 24"), std::string::npos) << e.what();
		}
	}

	TEST(Ulid, FormatErrorIsAnInvalidArgument){
		EXPECT_THROW((void)ulid_t::parse("nope"), std::invalid_argument);
	}

	TEST(Ulid, AcceptsLowercaseAndCanonicalizesToUppercase){
		const std::string canonical = "01ARZ3NDEKTSV4RRFFQ69G5FAV";

		std::string lower = canonical;
		std::ranges::transform(lower, lower.begin(),
			[](unsigned char c){ return static_cast<char>(std::tolower(c)); });

		EXPECT_TRUE(ulid_t::is_valid(lower));
		const auto parsed = ulid_t::parse(lower);
		EXPECT_EQ(parsed, ulid_t::parse(canonical));
		EXPECT_EQ(parsed.to_string(), canonical);
	}

	TEST(Ulid, KnownExampleDecodes){
		const std::string example = "01ARZ3NDEKTSV4RRFFQ69G5FAV";

		const auto parsed = ulid_t::parse(example);
		EXPECT_EQ(parsed.to_string(), example);
		EXPECT_EQ(parsed.timestamp_ms(), 1469922850259ULL);

		const ulidgen::payload_t expected{0xD6, 0x76, 0x4C, 0x61, 0xEF, 0xB9, 0x93, 0x02, 0xBD, 0x5B};
		EXPECT_EQ(parsed.payload(), expected);
	}

	TEST(Ulid, TimestampOfReadsTextDirectly){
		EXPECT_EQ(ulidgen::timestamp_of("01ARZ3NDEKTSV4RRFFQ69G5FAV"), 1469922850259ULL);
		EXPECT_EQ(ulidgen::timestamp_of(std::string(26, '0')), 0u);
		EXPECT_THROW((void)ulidgen::timestamp_of("01ARZ3NDEK"), format_error);
	}

	TEST(Ulid, TimestampAsTimePoint){
		using namespace std::chrono;
		const auto id = ulid_t::generate(1469922850259ULL);
		EXPECT_EQ(id.timestamp().time_since_epoch(), milliseconds{1469922850259LL});

		const auto before = time_point_cast<milliseconds>(system_clock::now());
		const auto now_id = ulid_t::generate();
		const auto after = time_point_cast<milliseconds>(system_clock::now());
		EXPECT_GE(now_id.timestamp(), before);
		EXPECT_LE(now_id.timestamp(), after);
	}

	TEST(Ulid, MonotonicExampleOrderingMatchesComparison){
		// two values in the same millisecond where the random part is incremented
		const std::string s1 = "01BX5ZZKBKACTAV9WEVGEMMVRZ";
		const std::string s2 = "01BX5ZZKBKACTAV9WEVGEMMVS0";

		auto u1 = ulid_t::parse(s1);
		auto u2 = ulid_t::parse(s2);

		EXPECT_LT(s1, s2);
		EXPECT_LT(u1, u2);
		EXPECT_EQ(u1.timestamp_ms(), u2.timestamp_ms());

		auto bumped = u1.payload();
		ulidgen::increment_payload(bumped);
		EXPECT_EQ(bumped, u2.payload());

		EXPECT_EQ(u1.to_string(), s1);
		EXPECT_EQ(u2.to_string(), s2);
	}

	TEST(Ulid, EarlierTimestampSortsFirstRegardlessOfPayload){
		ulidgen::monotonic_generator<> gen;
		for(std::uint64_t ts = 1; ts < 200; ++ts){
			const auto earlier = ulid_t::generate(gen, ts);
			const auto later = ulid_t::generate(gen, ts + 1);
			EXPECT_LT(earlier, later);
			EXPECT_LT(earlier.to_string(), later.to_string());
		}
		// all-ones payload at t still sorts before all-zeros payload at t + 1
		std::array<ulid_t::byte, 16> hi = make_bytes_from_timestamp(41);
		std::array<ulid_t::byte, 16> lo = make_bytes_from_timestamp(42);
		for(std::size_t i = 6; i < 16; ++i){
			hi[i] = 0xFF;
		}
		EXPECT_LT(ulid_t::from_bytes(hi), ulid_t::from_bytes(lo));
	}

	TEST(Ulid, EqualityAndThreeWayComparison){
		const std::string s = "01ARZ3NDEKTSV4RRFFQ69G5FAV";

		auto a = ulid_t::parse(s);
		auto b = ulid_t::parse(s);

		EXPECT_EQ(a, b);
		EXPECT_FALSE(a < b);
		EXPECT_FALSE(b < a);
		EXPECT_EQ(a <=> b, std::strong_ordering::equal);
		EXPECT_EQ(std::hash<ulid_t>{}(a), std::hash<ulid_t>{}(b));
	}

	TEST(Ulid, SortingByValueMatchesSortingByString){
		constexpr int N = 128;
		std::array<ulid_t, N> ids{};

		ulidgen::monotonic_generator<> gen;
		for(int i = 0; i < N; ++i){
			ids[i] = ulid_t::generate(gen, 1000 + (i % 7)); // mix of shared and distinct ticks
		}

		// Shuffle to avoid relying on generation order
		std::mt19937 rng{12345};
		std::shuffle(ids.begin(), ids.end(), rng);

		auto ids_sorted = ids;
		std::sort(ids_sorted.begin(), ids_sorted.end());

		std::vector<std::string> strings;
		strings.reserve(N);
		for(const auto& id : ids){
			strings.push_back(id.to_string());
		}
		std::sort(strings.begin(), strings.end());

		for(int i = 0; i < N; ++i){
			EXPECT_EQ(ids_sorted[i].to_string(), strings[i]);
		}
	}

	TEST(Ulid, StreamsCanonicalString){
		const auto id = ulid_t::generate();

		std::ostringstream oss;
		oss << id;

		EXPECT_EQ(oss.str(), id.to_string());
		EXPECT_EQ(static_cast<std::string>(id), id.to_string());
	}

	TEST(Ulid, ExtractsTimestampFromBytes){
		// ts = 0x00 01 02 03 04 05
		const std::uint64_t ts = 0x000102030405ULL;
		const auto bytes = make_bytes_from_timestamp(ts);

		const auto id = ulid_t::from_bytes(std::span<const ulid_t::byte, 16>{bytes});
		EXPECT_EQ(id.timestamp_ms(), ts);
		EXPECT_EQ(id.to_string(), "0004106105" + std::string(16, '0'));
	}

	TEST(Ulid, ToBytesFromBytesRoundTrip){
		// Fill with a recognisable pattern so we catch byte-order mistakes.
		std::array<ulid_t::byte, 16> original{};
		for(std::size_t i = 0; i < original.size(); ++i){
			original[i] = static_cast<ulid_t::byte>(i * 7);
		}
		const auto id = ulid_t::from_bytes(std::span<const ulid_t::byte, 16>{original});
		EXPECT_EQ(id.to_bytes(), original);

		// and through text
		const auto reparsed = ulid_t::parse(id.to_string());
		EXPECT_EQ(reparsed.to_bytes(), original);
	}

	TEST(Ulid, UsableInOrderedAndHashedContainers){
		std::set<ulid_t> ordered;
		std::unordered_set<ulid_t> hashed;
		const auto a = ulid_t::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV");
		const auto b = ulid_t::parse("01arz3ndektsv4rrffq69g5fav");
		ordered.insert(a);
		ordered.insert(b);
		hashed.insert(a);
		hashed.insert(b);
		EXPECT_EQ(ordered.size(), 1u);
		EXPECT_EQ(hashed.size(), 1u);
	}

} // namespace
