#pragma once
#include <string>
#include <system_error>

namespace photolink {

enum class TransferErrc {
    decode_error = 1,        // source image unreadable (sender)
    capture_error,           // no image came out of the capture source
    connect_error,           // resolve/connect failed (sender)
    transfer_incomplete,     // EOF or reset before the declared bytes arrived
    protocol_violation,      // implausible length field (receiver)
    io_error,                // persisting the payload failed (receiver)
    invalid_destination,     // empty host, rejected before any network action
    bad_acknowledgement,     // two bytes arrived but not the ack sentinel
    busy                     // a transfer is already in flight on this sender
};

const std::error_category& transfer_category();

std::error_code make_error_code(TransferErrc e);

} // namespace photolink

namespace std {
template <> struct is_error_code_enum<photolink::TransferErrc> : true_type {};
} // namespace std
