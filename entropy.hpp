#pragma once
#include "base32.hpp"
#include <concepts>
#include <cstddef>
#include <random>
#include <span>

namespace ulidgen{

	// An entropy source fills an 80-bit payload with fresh random bits.
	// monotonic_generator calls fill() outside of its lock, so a source must
	// tolerate concurrent calls on the same object.
	template<typename E>
	concept entropy_source = requires(E& e, std::span<byte, 10> out){
		{ e.fill(out) } -> std::same_as<void>;
	};

	// The default source: std::random_device, one per thread.
	// On Linux this reads the kernel CSPRNG (getrandom / /dev/urandom) or the CPU's
	// hardware generator, and does not block once the kernel pool is initialised.
	// Throws std::runtime_error if the device cannot be opened.
	class system_entropy final{
	public:
		void fill(std::span<byte, 10> out){
			static thread_local std::random_device rd;
			using word = std::random_device::result_type;
			std::size_t i = 0;
			while(i < out.size()){
				word w = rd();
				for(std::size_t k = 0; k < sizeof(word) && i < out.size(); ++k, ++i){
					out[i] = static_cast<byte>(w & 0xFFu);
					w >>= 8;
				}
			}
		}
	};

	static_assert(entropy_source<system_entropy>);

} // namespace ulidgen
