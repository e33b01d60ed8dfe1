#pragma once

#include <stdexcept>
#include <string>

// Upstream said "try again later": timeout, throttled, 5xx, connection reset.
class TransientFetchError : public std::runtime_error {
public:
    explicit TransientFetchError(const std::string& msg) : std::runtime_error(msg) {}
};

// Upstream rejected the request for good: unknown instrument, bad params, auth.
class PermanentFetchError : public std::runtime_error {
public:
    explicit PermanentFetchError(const std::string& msg) : std::runtime_error(msg) {}
};

class StorageIntegrityError : public std::runtime_error {
public:
    explicit StorageIntegrityError(const std::string& msg) : std::runtime_error(msg) {}
};

class StoreVersionError : public std::runtime_error {
public:
    explicit StoreVersionError(const std::string& msg) : std::runtime_error(msg) {}
};

class StoreMigrationError : public std::runtime_error {
public:
    explicit StoreMigrationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A write that would break dataset ordering or coverage rules.
class StoreWriteError : public std::runtime_error {
public:
    explicit StoreWriteError(const std::string& msg) : std::runtime_error(msg) {}
};

class TargetWriteError : public std::runtime_error {
public:
    explicit TargetWriteError(const std::string& msg) : std::runtime_error(msg) {}
};
