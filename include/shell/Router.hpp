#pragma once

#include "shell/types.hpp"

#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace km::maintenance { class Maintenance; }
namespace km::types { struct CallerContext; }

namespace km::shell {

class Router {
public:
    void registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler);

    [[nodiscard]] CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string usage() const;

private:
    std::map<std::string, CommandInfo> commands_;

    static std::string normalize(const std::string& s);
    [[nodiscard]] CommandResult invalid(const std::string& msg) const;
};

// Registers every maintenance command; passwords are read line by line from in.
void registerMaintenanceCommands(Router& router,
                                 std::shared_ptr<maintenance::Maintenance> authority,
                                 const types::CallerContext& caller,
                                 std::istream& in);

} // namespace km::shell
