#pragma once

#include <string>

namespace shielded::recv::domain
{

struct Settings
{
  struct Chain
  {
    std::string addressPrefix{"tnam"};
    // Shielded pool (MASP) address; receivers of shielded_recv packets must match it.
    std::string maspAddress{"tnam1pcqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqzmefah"};
    // Internal account minting IBC vouchers and holding escrow.
    std::string ibcAddress{"tnam1pvqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqn5xc0x"};
    std::string relayer{"tnam1qqg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyznre5j"};
  } chain;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{true};
  bool savePacketLog{true};
  std::string logLevel{"info"};
  std::string logsDir{"logs"};
  std::string appLogFilename{"shielded_recv_app.log"};
  std::string packetLogFilename{"shielded_recv_packet.log"};
  std::string configPath{"shielded-recv.toml"};
};

}  // namespace shielded::recv::domain
