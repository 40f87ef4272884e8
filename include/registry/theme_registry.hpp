#pragma once

#include "store/parameter_store.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace sysupdate {

// Installed themes, kept in the cms::theme.history parameter as
// {code: directory}.
class ThemeRegistry {
  public:
    explicit ThemeRegistry(ParameterStore& params) : params_(params) {}

    Result IsInstalled(const std::string& code, bool& installed);
    Result SetInstalled(const std::string& code, const std::string& dir_name);
    Result Installed(std::vector<std::string>& codes);

  private:
    Result Load(nlohmann::json& history);

    ParameterStore& params_;
};

} // namespace sysupdate
