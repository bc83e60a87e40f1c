#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// Crockford Base32 codec for ULIDs.
//
// A ULID renders as 26 symbols from the alphabet 0123456789ABCDEFGHJKMNPQRSTVWXYZ,
// five bits per symbol, most significant first:
//   - 10 symbols for the 48-bit millisecond timestamp (the top 2 bits are always zero)
//   - 16 symbols for the 80-bit random payload
//
// Encoding the two parts separately and concatenating them is bit-for-bit the same
// as encoding the whole 128-bit value as one 130-bit number.
//
// Decoding accepts upper and lower case, but is otherwise strict: the letters
// I, L, O and U are rejected instead of being read as 1 and 0.

namespace ulidgen{

	using byte = std::uint8_t;
	using payload_t = std::array<byte, 10>; // 80-bit random payload, big-endian

	namespace base32{

		inline constexpr std::size_t BITS_PER_CHAR = 5;
		inline constexpr std::size_t TIMESTAMP_CHARS = 10;
		inline constexpr std::size_t RANDOM_CHARS = 16;
		inline constexpr std::size_t ULID_CHARS = TIMESTAMP_CHARS + RANDOM_CHARS;
		inline constexpr std::uint64_t MAX_TIMESTAMP = (std::uint64_t{1} << 48) - 1;

		inline constexpr char ENCODING[32] = {
			'0','1','2','3','4','5','6','7','8','9',
			'A','B','C','D','E','F','G','H','J','K',
			'M','N','P','Q','R','S','T','V','W','X',
			'Y','Z'
		};

		namespace detail{
			inline constexpr byte INVALID = 0xFF;

			// 256-entry reverse lookup, indexed by the unsigned value of a char.
			constexpr std::array<byte, 256> make_decoding_table() noexcept{
				std::array<byte, 256> table{};
				for(auto& v : table){
					v = INVALID;
				}
				for(std::size_t i = 0; i < 32; ++i){
					const char c = ENCODING[i];
					table[static_cast<unsigned char>(c)] = static_cast<byte>(i);
					if(c >= 'A' && c <= 'Z'){
						table[static_cast<unsigned char>(c - 'A' + 'a')] = static_cast<byte>(i);
					}
				}
				return table;
			}

			inline constexpr std::array<byte, 256> DECODING = make_decoding_table();

			// digit `index` (0 = most significant) of the 80-bit value (hi << 64) | lo, where hi holds 16 bits
			constexpr std::uint32_t extract_random_digit(std::uint64_t hi, std::uint64_t lo, std::size_t index) noexcept{
				const std::size_t shift = 75 - (BITS_PER_CHAR * index); // bit index of the LSB of this digit
				if(shift == 0){
					return static_cast<std::uint32_t>(lo & 0x1Fu);
				} else if(shift < 64){ // may straddle hi/lo
					const std::uint64_t part = (hi << (64 - shift)) | (lo >> shift);
					return static_cast<std::uint32_t>(part & 0x1Fu);
				}
				return static_cast<std::uint32_t>((hi >> (shift - 64)) & 0x1Fu);
			}
		} // namespace detail

		[[nodiscard]] constexpr std::optional<byte> decode_char(char c) noexcept{
			const byte v = detail::DECODING[static_cast<unsigned char>(c)];
			if(v == detail::INVALID){
				return std::nullopt;
			}
			return v;
		}

		// Writes the low 48 bits of ts as 10 symbols.
		// Bits above 47 are truncated, so callers must range-check if they care.
		constexpr void encode_timestamp(std::uint64_t ts, std::span<char, TIMESTAMP_CHARS> out) noexcept{
			ts &= MAX_TIMESTAMP;
			for(std::size_t i = TIMESTAMP_CHARS; i-- > 0;){
				out[i] = ENCODING[ts & 0x1Fu];
				ts >>= BITS_PER_CHAR;
			}
		}

		constexpr void encode_random(const payload_t& payload, std::span<char, RANDOM_CHARS> out) noexcept{
			const std::uint64_t hi = (std::uint64_t{payload[0]} << 8) | payload[1];
			std::uint64_t lo = 0;
			for(std::size_t i = 2; i < payload.size(); ++i){
				lo = (lo << 8) | payload[i];
			}
			for(std::size_t i = 0; i < RANDOM_CHARS; ++i){
				out[i] = ENCODING[detail::extract_random_digit(hi, lo, i)];
			}
		}

		[[nodiscard]] inline std::string encode_timestamp(std::uint64_t ts){
			std::string out(TIMESTAMP_CHARS, '0');
			encode_timestamp(ts, std::span<char, TIMESTAMP_CHARS>{out.data(), TIMESTAMP_CHARS});
			return out;
		}

		[[nodiscard]] inline std::string encode_random(const payload_t& payload){
			std::string out(RANDOM_CHARS, '0');
			encode_random(payload, std::span<char, RANDOM_CHARS>{out.data(), RANDOM_CHARS});
			return out;
		}

		// Full 26-symbol ULID text. The timestamp is truncated to 48 bits, see encode_timestamp().
		[[nodiscard]] inline std::string encode(std::uint64_t ts, const payload_t& payload){
			std::string out(ULID_CHARS, '0');
			encode_timestamp(ts, std::span<char, TIMESTAMP_CHARS>{out.data(), TIMESTAMP_CHARS});
			encode_random(payload, std::span<char, RANDOM_CHARS>{out.data() + TIMESTAMP_CHARS, RANDOM_CHARS});
			return out;
		}

		// True if s is exactly 26 alphabet symbols (any case) and the first symbol
		// is 0..7, i.e. the timestamp fits in 48 bits.
		[[nodiscard]] constexpr bool is_valid(std::string_view s) noexcept{
			if(s.size() != ULID_CHARS){
				return false;
			}
			for(const char c : s){
				if(!decode_char(c)){
					return false;
				}
			}
			return *decode_char(s.front()) <= 7;
		}

		[[nodiscard]] constexpr std::optional<std::uint64_t> decode_timestamp(std::string_view s) noexcept{
			if(!is_valid(s)){
				return std::nullopt;
			}
			std::uint64_t ts = 0;
			for(std::size_t i = 0; i < TIMESTAMP_CHARS; ++i){
				ts = (ts << BITS_PER_CHAR) | *decode_char(s[i]);
			}
			return ts;
		}

		[[nodiscard]] constexpr std::optional<payload_t> decode_random(std::string_view s) noexcept{
			if(!is_valid(s)){
				return std::nullopt;
			}
			std::uint64_t hi = 0; // top 16 bits
			std::uint64_t lo = 0; // low 64 bits
			for(std::size_t i = TIMESTAMP_CHARS; i < ULID_CHARS; ++i){
				hi = (hi << BITS_PER_CHAR) | (lo >> (64 - BITS_PER_CHAR));
				lo = (lo << BITS_PER_CHAR) | *decode_char(s[i]);
			}
			payload_t payload{};
			payload[0] = static_cast<byte>((hi >> 8) & 0xFFu);
			payload[1] = static_cast<byte>(hi & 0xFFu);
			for(std::size_t i = 0; i < 8; ++i){
				payload[2 + i] = static_cast<byte>((lo >> ((7 - i) * 8)) & 0xFFu);
			}
			return payload;
		}

	} // namespace base32
} // namespace ulidgen
