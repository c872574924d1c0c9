#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace shielded::recv::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual shielded::recv::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace shielded::recv::application::ports
