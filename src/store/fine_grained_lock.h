#ifndef ESTUARY_SRC_STORE_FINE_GRAINED_LOCK_H_
#define ESTUARY_SRC_STORE_FINE_GRAINED_LOCK_H_

#include <array>
#include <cstddef>
#include <mutex>

#include "absl/hash/hash.h"

namespace Estuary {

// Fixed pool of mutexes picked by key hash. Two keys may share a stripe, so a
// holder must never call back into code that takes another stripe of the same
// pool.
template <typename Key, size_t NumStripes = 64>
class StripedLock {
	public:
		StripedLock() = default;
		StripedLock(const StripedLock&) = delete;
		StripedLock& operator=(const StripedLock&) = delete;

		size_t StripeOf(const Key& key) const {
			return absl::Hash<Key>{}(key) % NumStripes;
		}

		std::mutex& MutexFor(const Key& key) {
			return stripes_[StripeOf(key)].mutex;
		}

		class Guard {
			public:
				Guard(StripedLock& striped, const Key& key) : lock_(striped.MutexFor(key)) {}

			private:
				std::lock_guard<std::mutex> lock_;
		};

	private:
		struct alignas(64) Stripe {
			std::mutex mutex;
		};
		std::array<Stripe, NumStripes> stripes_;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_STORE_FINE_GRAINED_LOCK_H_
