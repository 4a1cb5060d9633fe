#pragma once
// Finds rows sharing (url, username, password) and optionally removes them.
//
// Within a group rows rank by ascending id; the lowest id is the retained
// representative. Read-only mode reports every other row. Remove mode runs
// identification and deletion in one transaction with the entries table
// locked against concurrent writers, so either every reported row is
// deleted or none is.
#include "ingest_result.hpp"
#include "../store/credential_store.hpp"

namespace credingest {

class DuplicateResolver {
public:
    explicit DuplicateResolver(CredentialStore& store) : store_(store) {}

    DuplicateReport resolve(bool remove);

private:
    DuplicateReport find_only();
    DuplicateReport find_and_remove();

    CredentialStore& store_;
};

} // namespace credingest
