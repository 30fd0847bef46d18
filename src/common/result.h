#pragma once

#include "errors.h"
#include <string>
#include <utility>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Uniform result envelope returned by every facade operation.
//
// success == false means the call itself failed (transport, protocol,
// validation, illegal simulated transition). A daemon-side business rejection
// is a successful call whose payload carries the rejection.
// ---------------------------------------------------------------------------
template <typename T>
struct Result {
    bool success = false;
    T data{};
    std::string error;
    ErrorKind error_kind = ErrorKind::None;

    static Result ok(T value) {
        Result r;
        r.success = true;
        r.data = std::move(value);
        return r;
    }

    static Result fail(ErrorKind kind, std::string message) {
        Result r;
        r.success = false;
        r.error_kind = kind;
        r.error = std::move(message);
        return r;
    }

    static Result fail(const ClientError& e) { return fail(e.kind(), e.what()); }

    explicit operator bool() const { return success; }
};

// Payload for operations with nothing to return.
struct Empty {};

} // namespace darwin::client
