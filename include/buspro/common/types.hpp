#pragma once

#include <variant>
#include <string>

namespace buspro {

enum class Error
{
    ENCODE_ERROR,
    MALFORMED_FRAME,
    FRAME_TOO_SHORT,
    CHECKSUM_MISMATCH,
    TRANSPORT_ERROR,
    PORT_ERROR,
    SEND_FAILED,
    TIMEOUT,
    CANCELLED,
    NOT_RUNNING,
    INVALID_RESPONSE,
    PARSE_ERROR,
    FILE_ERROR
};

const char* error_to_string(Error error);

template<typename T> 
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    T& value()
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    Error error() const
    {
        return std::get<Error>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(error);
    }

private:
    std::variant<T, Error> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(error) {}
};

} // namespace buspro
