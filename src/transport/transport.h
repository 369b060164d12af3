#ifndef ESTUARY_SRC_TRANSPORT_TRANSPORT_H_
#define ESTUARY_SRC_TRANSPORT_TRANSPORT_H_

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"

#include "record/record.h"

namespace Estuary {

class RecordChannel;

enum class CachePolicy {
	kCacheOnly,	// local cache, then end of stream
	kNetworkOnly,	// live records only
	kCacheThenNetwork,	// cached records first, then live
};

std::optional<CachePolicy> ParseCachePolicy(const std::string& name);
const char* CachePolicyName(CachePolicy policy);

/**
 * Subscription filter. Empty sets match anything. Tag constraints map a tag
 * key to the accepted values; a record matches when any of its groups with
 * that key carries one of them.
 */
struct Filter {
	absl::btree_set<std::string> authors;
	absl::btree_set<int> kinds;
	absl::btree_map<std::string, absl::btree_set<std::string>> tags;

	// Canonical text form (sorted), used as the subscription registry key.
	std::string Signature() const;

	bool Matches(const Record& record) const;
};

/**
 * Connection to the relay pool. Implementations own caching, relay selection
 * and signature verification.
 */
class ITransport {
	public:
		virtual ~ITransport() = default;

		/**
		 * Opens a stream of records matching `filter`. Throws TransportUnavailable
		 * when the stream cannot be opened.
		 */
		virtual std::shared_ptr<RecordChannel> Subscribe(const Filter& filter, CachePolicy policy) = 0;

		// Records currently available for `filter`, waiting at most timeout_ms.
		virtual std::vector<Record> CollectOnce(const Filter& filter, int timeout_ms, CachePolicy policy) = 0;

		// Relays that acknowledged the record. Throws TransportUnavailable when none did.
		virtual std::set<std::string> Publish(const Record& record) = 0;
};

// Fills in id (and signature) of an unsigned record.
class ISigner {
	public:
		virtual ~ISigner() = default;
		virtual Record Sign(const Record& unsigned_record) = 0;
		virtual std::string PublicKey() const = 0;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_TRANSPORT_TRANSPORT_H_
