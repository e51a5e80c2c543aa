#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        NotFound,
        NotSupported,
        InvalidArgument,
        NullPointer,
        TransportFailure,
        ProtocolViolation,
        AlreadyFinalized,
        ValidationFailed,
        Poisoned,
        HandleError,
        NotEnoughData,
        TooMuchData,
        Value
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::NullPointer:
        return "null_pointer";
    case Error::Code::TransportFailure:
        return "transport_failure";
    case Error::Code::ProtocolViolation:
        return "protocol_violation";
    case Error::Code::AlreadyFinalized:
        return "already_finalized";
    case Error::Code::ValidationFailed:
        return "validation_failed";
    case Error::Code::Poisoned:
        return "poisoned";
    case Error::Code::HandleError:
        return "handle_error";
    case Error::Code::NotEnoughData:
        return "not_enough_data";
    case Error::Code::TooMuchData:
        return "too_much_data";
    case Error::Code::Value:
        return "value";
    }
    return "unknown_error";
}

// One line of prose per code, in terms of the device stack.
[[nodiscard]] inline auto errorSummary(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "error was never set";
    case Error::Code::UnknownError:
        return "backend failed unexpectedly";
    case Error::Code::MalformedInput:
        return "heuristics file is malformed";
    case Error::Code::NotFound:
        return "file or device not found";
    case Error::Code::NotSupported:
        return "no tablet support on this window system";
    case Error::Code::InvalidArgument:
        return "driver passed an out of range count";
    case Error::Code::NullPointer:
        return "driver passed a null buffer";
    case Error::Code::TransportFailure:
        return "lost the window system connection";
    case Error::Code::ProtocolViolation:
        return "packet description does not match the tablet";
    case Error::Code::AlreadyFinalized:
        return "device described again after it was done";
    case Error::Code::ValidationFailed:
        return "device description is incomplete";
    case Error::Code::Poisoned:
        return "stylus callbacks out of step with the tablet list";
    case Error::Code::HandleError:
        return "window handle is unusable";
    case Error::Code::NotEnoughData:
        return "packet is shorter than its description";
    case Error::Code::TooMuchData:
        return "packet is longer than its description";
    case Error::Code::Value:
        return "packet or axis value out of range";
    }
    return "backend failed unexpectedly";
}

// "<summary> (<label>): <message>" on a single line. Driver and server
// strings may carry line breaks; they become spaces.
[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    std::string text{errorSummary(error.code)};
    text += " (";
    text += errorCodeToString(error.code);
    text += ')';
    if (!error.message || error.message->empty())
        return text;
    text += ": ";
    for (char const c : *error.message)
        text += (c == '\n' || c == '\r') ? ' ' : c;
    return text;
}

} // namespace TS
