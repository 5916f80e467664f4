#pragma once
#include <stdexcept>
#include <string>

struct EchoplotError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// sample level, the averager swallows these and keeps polling
struct FormatError : EchoplotError { using EchoplotError::EchoplotError; };
struct ParseError : EchoplotError { using EchoplotError::EchoplotError; };
struct RangeError : EchoplotError { using EchoplotError::EchoplotError; };

struct DegenerateGeometryError : EchoplotError { using EchoplotError::EchoplotError; };
struct AcquisitionStall : EchoplotError { using EchoplotError::EchoplotError; };
struct AcquisitionCancelled : EchoplotError { using EchoplotError::EchoplotError; };
struct FileError : EchoplotError { using EchoplotError::EchoplotError; };
