#ifndef ESTUARY_SRC_COMMON_ERRORS_H_
#define ESTUARY_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Estuary {

/**
 * Base class for failures at the transport boundary (subscribe, publish,
 * collect). Parsing and merging never throw.
 */
class TransportError : public std::runtime_error {
	public:
		explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// No client or signer bound. Fatal to the requested operation.
class TransportNotConfigured : public TransportError {
	public:
		explicit TransportNotConfigured(const std::string& what) : TransportError(what) {}
};

// Subscribe/publish failed. Recoverable, the caller may retry.
class TransportUnavailable : public TransportError {
	public:
		explicit TransportUnavailable(const std::string& what) : TransportError(what) {}
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_COMMON_ERRORS_H_
