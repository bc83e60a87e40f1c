#pragma once
#include "base32.hpp"
#include "entropy.hpp"
#include <concepts>
#include <cstdint>
#include <mutex>
#include <type_traits>
#include <utility>

// Monotonic payload generation.
//
// A monotonic_generator remembers the last timestamp it served and the payload it
// handed out. A call with a new timestamp draws 80 fresh random bits; a call with
// the same timestamp returns the previous payload plus one. Within one generator,
// ids minted in the same millisecond are therefore strictly increasing.
//
// Overflow policy: wrap. Incrementing the all-ones payload yields all zeros, and
// ordering is broken for the rest of that millisecond. No error is raised, and
// every code path uses this same policy.
//
// Thread safety: last timestamp and last payload are guarded by a single mutex and
// are only ever written together. The entropy draw runs outside the lock; if
// another caller opened the same millisecond meanwhile, the draw is discarded and
// that caller's payload is incremented instead.

namespace ulidgen{

	// Anything that can hand out a payload for a timestamp. ulid_t::generate() accepts
	// any payload_source, so tests and callers can substitute their own.
	template<typename S>
	concept payload_source = requires(S& s, std::uint64_t ts){
		{ s.next(ts) } -> std::same_as<payload_t>;
	};

	// Adds one to the payload, read as an unsigned 80-bit big-endian integer.
	// All ones wraps around to all zeros.
	constexpr void increment_payload(payload_t& payload) noexcept{
		for(auto it = payload.rbegin(); it != payload.rend(); ++it){ // least significant byte is at the back
			if(*it != 0xFF){
				++(*it);
				return;
			}
			*it = 0;
		}
	}

	template<entropy_source E = system_entropy>
	class monotonic_generator final{
	public:
		using entropy_type = E;

		monotonic_generator() = default;
		explicit monotonic_generator(E entropy) noexcept(std::is_nothrow_move_constructible_v<E>)
			: _entropy(std::move(entropy)){}

		monotonic_generator(const monotonic_generator&) = delete;
		monotonic_generator& operator=(const monotonic_generator&) = delete;

		[[nodiscard]] payload_t next(std::uint64_t ts){
			{
				std::lock_guard<std::mutex> lock(_mutex);
				if(_have_last && ts == _last_ts){
					return bump();
				}
			}
			payload_t fresh{};
			_entropy.fill(fresh);

			std::lock_guard<std::mutex> lock(_mutex);
			if(_have_last && ts == _last_ts){ // someone else opened this millisecond while we were drawing
				return bump();
			}
			_last_ts = ts;
			_last = fresh;
			_have_last = true;
			return fresh;
		}

		[[nodiscard]] E& entropy() noexcept{
			return _entropy;
		}

	private:
		E _entropy{};
		std::mutex _mutex;
		std::uint64_t _last_ts = 0;
		payload_t _last{};
		bool _have_last = false;

		// caller holds _mutex
		payload_t bump() noexcept{
			increment_payload(_last);
			return _last;
		}
	};

	static_assert(payload_source<monotonic_generator<>>);

	// Process-wide generator behind the convenience overloads of ulid_t::generate().
	// Constructed on first use. Prefer owning a monotonic_generator where isolation matters.
	inline monotonic_generator<>& default_generator(){
		static monotonic_generator<> generator;
		return generator;
	}

} // namespace ulidgen
