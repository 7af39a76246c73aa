#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config/ClientConfig.h"

namespace json
{
struct JsonValue;
}

struct ClientConfigLoadError
{
    std::string file;
    std::string message;
};

struct ClientConfigLoadResult
{
    ClientConfig config;
    bool success = false;
    std::vector<ClientConfigLoadError> errors;
};

class ClientConfigLoader
{
  public:
    using KeyValidator = std::function<bool(const std::string &)>;

    explicit ClientConfigLoader(std::filesystem::path configRoot);

    const std::filesystem::path &configRoot() const { return m_configRoot; }

    /// Key names are checked with the validator when one is set; the SDL front end supplies it.
    void setKeyValidator(KeyValidator validator) { m_keyValidator = std::move(validator); }

    ClientConfigLoadResult load() const;

  private:
    std::filesystem::path m_configRoot;
    KeyValidator m_keyValidator;
};
