#pragma once

#include <string_view>

#include "domain/Address.hpp"

namespace shielded::recv::application::ports
{

// Text <-> native address. The encoding itself belongs to the host chain.
struct IAddressCodec
{
  virtual ~IAddressCodec() = default;

  // Throws domain::AddressError when the text is not an address of this chain.
  virtual domain::Address decode(std::string_view text) const = 0;

  virtual domain::Address encode(const domain::Address::Payload& payload) const = 0;
};

}  // namespace shielded::recv::application::ports
