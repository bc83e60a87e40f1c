#pragma once
#include "base32.hpp"
#include "monotonic.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

// ULID (Universally Unique Lexicographically Sortable Identifier) is fundamentally:
// - a 128-bit unsigned integer
// - serialized to 16 numeric bytes
// - encoded using Crockford base32
//
// The 128-bit are laid out thusly:
//   - 48 bits: millisecond timestamp since Unix epoch
//   - 80 bits: randomness
//
// Encoded in Crockford Base32 it becomes a 26 character string that is
// lexicographically sortable in the same order as its timestamp.
//
// This header provides:
//
//   - ulid_t::generate()
//       Generates a ULID for the current time from the process-wide
//       default_generator(). IDs minted in the same millisecond are strictly
//       increasing, across all threads sharing that generator.
//
//   - ulid_t::generate(source, ts)
//       Same, but with a caller-owned payload_source (usually a
//       monotonic_generator) and/or an explicit timestamp.
//
//   - ulid_t::parse() / ulid_t::from_string() / ulid_t::is_valid()
//       Strict parsing of the 26 character text. Lower case is accepted,
//       I, L, O and U are not. parse() throws format_error, from_string()
//       returns std::nullopt, is_valid() returns false.
//
//   - ulid_t::to_string()
//       Canonical upper case text.
//
//   - ulid_t::timestamp_ms() / ulid_t::timestamp() / timestamp_of()
//       Read the creation time back.
//
// The canonical in-memory form is the 16 raw bytes; text is produced on demand.
// Comparing bytes gives the same order as comparing canonical strings.

namespace ulidgen{

	// Thrown by the throwing parse paths when the text is not a ULID.
	class format_error final : public std::invalid_argument{
	public:
		using std::invalid_argument::invalid_argument;
	};

	class ulid_t final{
	public:
		using byte = ulidgen::byte;
		using time_point = std::chrono::sys_time<std::chrono::milliseconds>;

		// Timestamps are truncated to their low 48 bits, see base32::encode_timestamp().
		[[nodiscard]] static ulid_t generate(){
			return generate(default_generator(), now_ms());
		}

		[[nodiscard]] static ulid_t generate(std::uint64_t ts){
			return generate(default_generator(), ts);
		}

		template<payload_source S>
		[[nodiscard]] static ulid_t generate(S& source){
			return generate(source, now_ms());
		}

		template<payload_source S>
		[[nodiscard]] static ulid_t generate(S& source, std::uint64_t ts){
			ts &= base32::MAX_TIMESTAMP; // truncate before the generator sees it, so equal ids share a tick
			ulid_t ulid{};
			write_big_endian<6>(ts, ulid.timestamp_bytes());
			const payload_t payload = source.next(ts);
			auto out = ulid.random_bytes();
			for(std::size_t i = 0; i < payload.size(); ++i){
				out[i] = payload[i];
			}
			return ulid;
		}

		[[nodiscard]] constexpr static bool is_valid(std::string_view s) noexcept{
			return base32::is_valid(s);
		}

		[[nodiscard]] constexpr static bool is_valid(const char* s) noexcept{
			return s != nullptr && is_valid(std::string_view{s});
		}

		[[nodiscard]] constexpr static std::optional<ulid_t> from_string(std::string_view s) noexcept{
			const auto ts = base32::decode_timestamp(s);
			const auto payload = base32::decode_random(s);
			if(!ts || !payload){
				return std::nullopt;
			}
			ulid_t ulid{};
			write_big_endian<6>(*ts, ulid.timestamp_bytes());
			auto out = ulid.random_bytes();
			for(std::size_t i = 0; i < payload->size(); ++i){
				out[i] = (*payload)[i];
			}
			return ulid;
		}

		[[nodiscard]] constexpr static std::optional<ulid_t> from_string(const char* s) noexcept{
			if(s == nullptr){
				return std::nullopt;
			}
			return from_string(std::string_view{s});
		}

		// Like from_string(), but reports why the text was rejected.
		[[nodiscard]] static ulid_t parse(std::string_view s){
			if(s.size() != base32::ULID_CHARS){
				throw format_error("invalid ULID: expected 26 characters, got " + std::to_string(s.size()));
			}
			for(std::size_t i = 0; i < s.size(); ++i){
				if(!base32::decode_char(s[i])){
					throw format_error("invalid ULID: character '" + std::string(1, s[i])
						+ "' at position " + std::to_string(i) + " is not in the Crockford alphabet");
				}
			}
			auto ulid = from_string(s);
			if(!ulid){ // alphabet and length are fine, so only the leading symbol can be at fault
				throw format_error("invalid ULID: timestamp exceeds 48 bits (leading character '"
					+ std::string(1, s.front()) + "' > '7')");
			}
			return *ulid;
		}

		[[nodiscard]] static ulid_t parse(const char* s){
			if(s == nullptr){
				throw format_error("invalid ULID: null input");
			}
			return parse(std::string_view{s});
		}

		[[nodiscard]] constexpr static ulid_t from_bytes(std::span<const byte, 16> bytes) noexcept{
			ulid_t ulid{};
			for(std::size_t i = 0; i < bytes.size(); ++i){
				ulid.data[i] = bytes[i];
			}
			return ulid;
		}

		[[nodiscard]] std::string to_string() const{
			return base32::encode(timestamp_ms(), payload());
		}

		[[nodiscard]] explicit operator std::string() const{
			return to_string();
		}

		[[nodiscard]] constexpr std::array<byte, 16> to_bytes() const noexcept{
			return data;
		}

		[[nodiscard]] constexpr std::span<const byte, 16> as_bytes() const noexcept{
			return std::span<const byte, 16>(data);
		}

		[[nodiscard]] constexpr std::uint64_t timestamp_ms() const noexcept{
			std::uint64_t ts = 0;
			for(const byte b : timestamp_bytes()){
				ts = (ts << 8) | static_cast<std::uint64_t>(b);
			}
			return ts;
		}

		[[nodiscard]] constexpr time_point timestamp() const noexcept{
			return time_point{std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(timestamp_ms())}};
		}

		[[nodiscard]] constexpr payload_t payload() const noexcept{
			payload_t p{};
			const auto in = random_bytes();
			for(std::size_t i = 0; i < p.size(); ++i){
				p[i] = in[i];
			}
			return p;
		}

		constexpr auto operator<=>(const ulid_t&) const = default;

	private:
		std::array<byte, 16> data{};

		constexpr std::span<byte, 6> timestamp_bytes() noexcept{
			return std::span<byte, 6>{data.begin(), 6};
		}
		constexpr std::span<const byte, 6> timestamp_bytes() const noexcept{
			return std::span<const byte, 6>{data.cbegin(), 6};
		}
		constexpr std::span<byte, 10> random_bytes() noexcept{
			return std::span<byte, 10>{data.begin() + 6, 10};
		}
		constexpr std::span<const byte, 10> random_bytes() const noexcept{
			return std::span<const byte, 10>{data.cbegin() + 6, 10};
		}

		static std::uint64_t now_ms() noexcept{
			using namespace std::chrono;
			return static_cast<std::uint64_t>(
				duration_cast<milliseconds>(
					system_clock::now().time_since_epoch()
				).count()
				);
		}

		//helper for writing bytes in big-endian order
		template<std::size_t N>
		constexpr static void write_big_endian(std::uint64_t value, std::span<byte, N> out) noexcept{
			static_assert(N <= 8);
			for(std::size_t i = 0; i < N; ++i){
				out[i] = static_cast<byte>((value >> ((N - 1 - i) * 8)) & 0xFF);
			}
		}
	};

	// Decodes the timestamp straight from text. Throws format_error on invalid input.
	[[nodiscard]] inline std::uint64_t timestamp_of(std::string_view s){
		return ulid_t::parse(s).timestamp_ms();
	}

	[[nodiscard]] inline std::uint64_t timestamp_of(const char* s){
		return ulid_t::parse(s).timestamp_ms();
	}

	inline std::ostream& operator<<(std::ostream& os, const ulid_t& id){
		return os << id.to_string();
	}
} //namespace ulidgen

namespace std{
	template<>
	struct hash<ulidgen::ulid_t>{
		std::size_t operator()(const ulidgen::ulid_t& id) const noexcept{
			std::uint64_t hi = 0;
			std::uint64_t lo = 0;
			const auto bytes = id.as_bytes();
			for(std::size_t i = 0; i < 8; ++i){
				hi = (hi << 8) | bytes[i];
				lo = (lo << 8) | bytes[i + 8];
			}
			const std::size_t h = std::hash<std::uint64_t>{}(hi);
			return h ^ (std::hash<std::uint64_t>{}(lo) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
		}
	};
} //namespace std
