#ifndef ESTUARY_SRC_TRANSPORT_RECORD_CHANNEL_H_
#define ESTUARY_SRC_TRANSPORT_RECORD_CHANNEL_H_

#include <chrono>
#include <deque>
#include <functional>
#include <string>

#include "absl/synchronization/mutex.h"

#include "record/record.h"

namespace Estuary {

enum class StreamStatus {
	kRecord,	// `out` holds the next record
	kClosed,	// closed by the consumer or end of a cache-only stream
	kFailed,	// the transport reported an error, see error()
	kTimeout,
};

/**
 * Blocking multi-producer, single-consumer stream of records for one transport
 * subscription. The producer side (transport) pushes records, fails or ends
 * the stream; the consumer side (subscription worker) blocks on Next().
 * Close() is idempotent and wakes a blocked consumer.
 */
class RecordChannel {
	public:
		explicit RecordChannel(std::function<void()> on_release = nullptr);
		~RecordChannel();

		RecordChannel(const RecordChannel&) = delete;
		RecordChannel& operator=(const RecordChannel&) = delete;

		// Producer side. Ignored once the channel is closed or failed.
		bool Push(Record record);
		void Fail(const std::string& error);
		// Ends the stream after the queued records are drained.
		void Finish();

		// Consumer side. Discards queued records and releases the transport stream.
		void Close();

		StreamStatus Next(Record& out);
		StreamStatus NextUntil(Record& out, std::chrono::steady_clock::time_point deadline);

		bool closed() const;
		std::string error() const;

	private:
		StreamStatus NextLocked(Record& out) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		bool Ready() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

		mutable absl::Mutex mu_;
		std::deque<Record> queue_ ABSL_GUARDED_BY(mu_);
		bool closed_ ABSL_GUARDED_BY(mu_) = false;
		bool finished_ ABSL_GUARDED_BY(mu_) = false;
		bool failed_ ABSL_GUARDED_BY(mu_) = false;
		std::string error_ ABSL_GUARDED_BY(mu_);

		std::function<void()> on_release_;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_TRANSPORT_RECORD_CHANNEL_H_
