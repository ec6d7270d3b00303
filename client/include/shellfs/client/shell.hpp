#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "shellfs/client/connection.hpp"
#include "shellfs/client/logger.hpp"

namespace shellfs::client
{

    /// Line-oriented command loop over a Connection.
    class Shell
    {
    public:
        Shell(Connection &connection, Logger &logger, std::ostream &out, std::ostream &err);

        /// Reads commands until `exit` or end of input. Returns the number of failed commands.
        int run(std::istream &in, bool interactive);

        /// Executes one line. Returns false when the shell should stop.
        bool execute(const std::string &line);

        int failures() const noexcept { return failures_; }

    private:
        void dispatch(const std::string &command, const std::vector<std::string> &args);
        void print_help() const;
        void print_listing(const shellfs::protocol::Listing &listing) const;
        void update_prompt_path(const std::string &target);

        Connection &connection_;
        Logger &logger_;
        std::ostream &out_;
        std::ostream &err_;
        std::vector<std::string> remote_cwd_;
        int failures_{0};
    };

} // namespace shellfs::client
