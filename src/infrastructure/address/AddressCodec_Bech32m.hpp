#pragma once

#include <string>
#include <string_view>

#include "application/ports/IAddressCodec.hpp"

namespace shielded::recv::infrastructure::address
{

// Bech32m (BIP-350) text form of native addresses: `<hrp>1<data><checksum>`,
// the data carrying the 21-byte address payload.
class AddressCodec_Bech32m final : public shielded::recv::application::ports::IAddressCodec
{
 public:
  explicit AddressCodec_Bech32m(std::string hrp);

  shielded::recv::domain::Address decode(std::string_view text) const override;

  shielded::recv::domain::Address encode(
      const shielded::recv::domain::Address::Payload& payload) const override;

  const std::string& hrp() const noexcept { return hrp_; }

 private:
  std::string hrp_;
};

}  // namespace shielded::recv::infrastructure::address
