#ifndef SEGMENT_LEDGER_H

#define SEGMENT_LEDGER_H

#include <cstddef>
#include <string>
#include <unordered_set>

// Identities of the segments dispatched for download during the lifetime of
// the process.
class segment_ledger {
		std::unordered_set<std::string> identities;

	public:
		// Returns true and records the identity if it has not been seen before.
		bool should_download(const std::string& identity);

		size_t size() const noexcept
		{
			return identities.size();
		}
};

#endif // SEGMENT_LEDGER_H
