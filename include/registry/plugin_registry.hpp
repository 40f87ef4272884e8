#pragma once

#include "migration/migration.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace sysupdate {

struct PluginVersion {
    std::string version;
    std::vector<std::string> notes;
    // Script names, in the order they run.
    std::vector<std::string> scripts;
};

class IPlugin {
  public:
    virtual ~IPlugin() = default;

    // Dotted "Author.Name" code.
    virtual std::string Identifier() const = 0;
    virtual std::string Name() const = 0;
    virtual std::string Icon() const = 0;
    virtual bool IsDisabled() const = 0;

    // Ascending by version.
    virtual const std::vector<PluginVersion>& Versions() const = 0;

    // Migration behind a script named in Versions().
    virtual Result LoadMigration(const std::string& script, std::shared_ptr<IMigration>& out) const = 0;
};

/**
 * @brief Parse an updates/version.json document.
 *
 * Each key is a version, each value a note string or a list mixing notes
 * and script names (entries ending in ".sql"). The result is sorted by
 * version.
 */
std::expected<std::vector<PluginVersion>, std::string> ParseVersionFile(const nlohmann::ordered_json& j);

// Plugin installed at plugins/<author>/<name>, described by
// updates/version.json and an optional plugin.json {name, icon, disabled}.
class DirectoryPlugin final : public IPlugin {
  public:
    static Result Load(const std::string& identifier,
                       const std::string& plugin_dir,
                       std::unique_ptr<DirectoryPlugin>& out);

    std::string Identifier() const override { return identifier_; }
    std::string Name() const override { return name_; }
    std::string Icon() const override { return icon_; }
    bool IsDisabled() const override { return disabled_; }
    const std::vector<PluginVersion>& Versions() const override { return versions_; }
    Result LoadMigration(const std::string& script, std::shared_ptr<IMigration>& out) const override;

  private:
    std::string identifier_;
    std::string name_;
    std::string icon_;
    bool disabled_ = false;
    std::string updates_dir_;
    std::vector<PluginVersion> versions_;
};

// Registered plugins in registration order.
class PluginRegistry {
  public:
    Result Register(std::unique_ptr<IPlugin> plugin);

    // Case-insensitive lookup; nullptr when unknown.
    IPlugin* FindByIdentifier(const std::string& identifier) const;

    std::vector<IPlugin*> GetPlugins() const;

    // Registers every plugins/<author>/<name> holding updates/version.json,
    // sorted by path.
    Result DiscoverDirectory(const std::string& plugins_dir);

  private:
    std::vector<std::unique_ptr<IPlugin>> plugins_;
};

} // namespace sysupdate
