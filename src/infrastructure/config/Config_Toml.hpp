#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace shielded::recv::infrastructure::config
{

class Config_Toml : public shielded::recv::application::ports::IConfigProvider
{
 public:
  shielded::recv::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, shielded::recv::domain::Settings& s);
};

}  // namespace shielded::recv::infrastructure::config
