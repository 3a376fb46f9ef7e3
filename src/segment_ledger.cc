#include "segment_ledger.h"

bool segment_ledger::should_download(const std::string& identity)
{
	return identities.insert(identity).second;
}
