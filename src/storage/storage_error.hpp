#pragma once

#include <stdexcept>
#include <string>

namespace tsync {

// Backend transaction or connectivity failure.  Always fatal to the current
// request; the backend has rolled the transaction back before throwing.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tsync
