#pragma once
#include <stdexcept>
#include <string>

// Everything SpfServer::process() turns into a verdict derives from SpfError.
class SpfError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// DNS-layer failure -> temperror
class SpfDnsError : public SpfError {
public:
    using SpfError::SpfError;
};

class SpfDnsTimeoutError : public SpfDnsError {
public:
    using SpfDnsError::SpfDnsError;
};

// -> none
class SpfNoAcceptableRecordError : public SpfError {
public:
    using SpfError::SpfError;
};

// -> permerror
class SpfRedundantAcceptableRecordsError : public SpfError {
public:
    using SpfError::SpfError;
};

class SpfSyntaxError : public SpfError {
public:
    using SpfError::SpfError;
};

class SpfProcessingLimitExceededError : public SpfError {
public:
    using SpfError::SpfError;
};

// Text is not tagged for the version being parsed. Only ever seen by the
// record selector, which tries the next version.
class SpfInvalidRecordVersionError : public SpfError {
public:
    using SpfError::SpfError;
};
