#pragma once
#include <stdexcept>
#include <string>

// No daemon is listening on the control socket.
class DaemonUnreachable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A whole machine file is refused (unknown format_version, broken header).
class CorruptFile : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateInstance : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ReplicationRootUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad input on the control socket; only the single request is rejected.
class MalformedRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The machine's own journal cannot be written. Fatal for the daemon.
class StorageFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
