#pragma once

#include "store/database.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace sysupdate {

class IMigration {
  public:
    virtual ~IMigration() = default;

    // Unique within its unit; pending migrations run in ascending name order.
    virtual std::string Name() const = 0;

    // `notices` collects messages the migration wants shown to the operator.
    virtual Result Up(Database& db, std::vector<std::string>& notices) = 0;
    virtual Result Down(Database& db) = 0;
};

class ISeeder {
  public:
    virtual ~ISeeder() = default;

    virtual std::string Name() const = 0;
    virtual Result Seed(Database& db, std::vector<std::string>& messages) = 0;
};

} // namespace sysupdate
