#include "prng_entropy.hpp"
#include "monotonic.hpp"
#include "ulid.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {
	using ulidgen::monotonic_generator;
	using ulidgen::prng_entropy;
	using ulidgen::ulid_t;

	TEST(PrngEntropy, FillsDistinctPayloads){
		prng_entropy e;
		std::set<ulidgen::payload_t> seen;
		for(int i = 0; i < 10'000; ++i){
			ulidgen::payload_t p{};
			e.fill(p);
			seen.insert(p);
		}
		EXPECT_EQ(seen.size(), 10'000u);
	}

	TEST(PrngEntropy, ThreadsGetIndependentStreams){
		std::vector<ulidgen::payload_t> firsts(4);
		std::vector<std::thread> workers;
		for(std::size_t t = 0; t < firsts.size(); ++t){
			workers.emplace_back([&firsts, t]{
				prng_entropy e;
				e.fill(firsts[t]);
			});
		}
		for(auto& w : workers){
			w.join();
		}
		const std::set<ulidgen::payload_t> unique(firsts.begin(), firsts.end());
		EXPECT_EQ(unique.size(), firsts.size());
	}

	TEST(PrngEntropy, DrivesMonotonicGenerator){
		monotonic_generator<prng_entropy> gen;
		constexpr int N = 2'000;
		std::vector<ulid_t> ids;
		ids.reserve(N);
		for(int i = 0; i < N; ++i){
			ids.push_back(ulid_t::generate(gen, 123456789));
		}
		for(int i = 1; i < N; ++i){
			EXPECT_LT(ids[i - 1], ids[i]) << "Non-monotonic at index " << i;
		}
		EXPECT_EQ(ids.front().to_string().substr(0, 10), ids.back().to_string().substr(0, 10));
	}

} // namespace
