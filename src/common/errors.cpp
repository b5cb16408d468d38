#include "errors.hpp"

namespace photolink {

namespace {

class TransferCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "photolink"; }
  std::string message(int ev) const override {
    switch (static_cast<TransferErrc>(ev)) {
    case TransferErrc::decode_error:
      return "image could not be decoded";
    case TransferErrc::capture_error:
      return "photo capture failed";
    case TransferErrc::connect_error:
      return "could not connect to server";
    case TransferErrc::transfer_incomplete:
      return "connection closed before transfer completed";
    case TransferErrc::protocol_violation:
      return "declared length is invalid";
    case TransferErrc::io_error:
      return "could not persist photo";
    case TransferErrc::invalid_destination:
      return "server address cannot be empty";
    case TransferErrc::bad_acknowledgement:
      return "unexpected acknowledgement";
    case TransferErrc::busy:
      return "a transfer is already in progress";
    }
    return "unknown photolink error";
  }
};

} // namespace

const std::error_category &transfer_category() {
  static TransferCategory cat;
  return cat;
}

std::error_code make_error_code(TransferErrc e) {
  return {static_cast<int>(e), transfer_category()};
}

} // namespace photolink
