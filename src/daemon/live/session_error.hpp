#pragma once

#include <string>
#include <string_view>

struct SessionError {
    enum class Kind {
        TransportFailure, // connect refused, read/write fault, unexpected close
        SetupTimeout,
        ProviderError,    // application-level error payload from the provider
        DecodeFailure,
        Cancelled,
    };

    Kind kind = Kind::TransportFailure;
    std::string detail;

    // Transport faults and setup timeouts are worth another reconnect attempt.
    bool is_transient() const {
        return kind == Kind::TransportFailure || kind == Kind::SetupTimeout;
    }

    std::string describe() const {
        return std::string(kind_name(kind)) + ": " + detail;
    }

    static constexpr std::string_view kind_name(Kind k) {
        switch (k) {
            case Kind::TransportFailure: return "transport failure";
            case Kind::SetupTimeout: return "setup timeout";
            case Kind::ProviderError: return "provider error";
            case Kind::DecodeFailure: return "decode failure";
            case Kind::Cancelled: return "cancelled";
        }
        return "unknown";
    }
};
