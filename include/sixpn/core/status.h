#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sixpn {

enum class StatusCode {
    ok = 0,
    invalid_argument,
    not_found,
    unknown_service,
    timeout,
    unavailable,
    cancelled,
    transport_error,
    internal_error,
};

std::string_view ToString(StatusCode code);

class Status {
public:
    Status() : code_(StatusCode::ok) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}
    Status(StatusCode code, std::string message, std::vector<std::string> details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    static Status Ok() { return Status(); }

    bool ok() const { return code_ == StatusCode::ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // Subjects of the error, e.g. the names a registration could not find.
    const std::vector<std::string>& details() const { return details_; }

    std::string ToString() const;

private:
    StatusCode code_;
    std::string message_;
    std::vector<std::string> details_;
};

template <class T>
class Result {
public:
    Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}

    bool ok() const { return status_.ok(); }
    const Status& status() const { return status_; }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

private:
    Status status_;
    std::optional<T> value_;
};

} // namespace sixpn
