/**
 * sqorm/errors.hpp - Error kinds raised by schema registration and records
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Every local validation failure has its own type so callers can branch on
 * the cause. Driver I/O failures are not wrapped: they reach the caller as
 * whatever the driver threw.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sqorm {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Schema Registration
// ============================================================================

class SchemaError : public Error {
public:
    using Error::Error;
};

class DuplicatePrimaryKey : public SchemaError {
public:
    using SchemaError::SchemaError;
};

class NoPrimaryKey : public SchemaError {
public:
    using SchemaError::SchemaError;
};

class InvalidFieldType : public SchemaError {
public:
    using SchemaError::SchemaError;
};

class DuplicateFieldName : public SchemaError {
public:
    using SchemaError::SchemaError;
};

// Assignment on a class whose table is already registered
class SchemaFrozenError : public Error {
public:
    using Error::Error;
};

// ============================================================================
// Lookup and Records
// ============================================================================

class UnknownFieldError : public Error {
public:
    using Error::Error;
};

class AttributeUnknown : public Error {
public:
    using Error::Error;
};

class ImmutablePrimaryKeyError : public Error {
public:
    using Error::Error;
};

class RemoveWithoutKeyError : public Error {
public:
    using Error::Error;
};

// ============================================================================
// Values and Decoding
// ============================================================================

class ValueError : public Error {
public:
    using Error::Error;
};

class DecodeError : public ValueError {
public:
    using ValueError::ValueError;
};

// Table operation requested without a bound driver
class NotBoundError : public Error {
public:
    using Error::Error;
};

} // namespace sqorm
