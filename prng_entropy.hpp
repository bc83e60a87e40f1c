#pragma once
#include "entropy.hpp"
#include "random.hpp" //grab from: https://github.com/ulfben/cpp_prngs/
#include "romuduojr.hpp" //grab from: https://github.com/ulfben/cpp_prngs/
#include <cstdint>
#include <random>
#include <span>

namespace ulidgen{

	// A fast, non-cryptographic entropy source for callers that want throughput
	// over unpredictability (log correlation ids, test fixtures, ...).
	// Each thread owns its own engine, so fill() needs no locking.
	//
	// Feel free to replace RomuDuoJr with any engine rnd::Random accepts (e.g. PCG32).
	// RomuDuoJr is tiny, extremely fast and statistically solid, but it is NOT a CSPRNG:
	// use system_entropy when ids must not be guessable.
	class prng_entropy final{
	public:
		using PRNG = rnd::Random<RomuDuoJr>;

		void fill(std::span<byte, 10> out){
			static thread_local auto rng = PRNG{salted_seed()};
			for(auto& b : out){
				b = rng.bits_as<byte>(); // uniformly distributed byte, far cheaper than std::uniform_int_distribution
			}
		}

	private:
		// one random_device draw per thread, mixed with a per-thread address so
		// threads seeded in the same instant still get distinct streams
		static std::uint64_t salted_seed(){
			static thread_local std::uint64_t dummy{};
			std::random_device rd;
			const auto seed = (std::uint64_t{rd()} << 32) | rd();
			return seed ^ static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(&dummy));
		}
	};

	static_assert(entropy_source<prng_entropy>);

} // namespace ulidgen
