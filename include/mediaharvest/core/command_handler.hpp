#pragma once

#include "mediaharvest/storage/harvest_settings.hpp"
#include <string>
#include <vector>

namespace mediaharvest::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    // Settings from the global Config, including command-line overrides.
    static storage::HarvestSettings current_settings();
};

class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download the tasks listed in a TSV file"; }
    std::string get_usage() const override { return "mediaharvest fetch <tasks.tsv>"; }
};

class RetryCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Re-run downloads recorded in .failed sidecars"; }
    std::string get_usage() const override { return "mediaharvest retry [dir]"; }
};

class ExportCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Export the dedup index as JSON or CSV files"; }
    std::string get_usage() const override { return "mediaharvest [--format json|csv] export <outdir>"; }
};

class MarkHtmlCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Turn saved HTML pages into retryable failures"; }
    std::string get_usage() const override { return "mediaharvest mark-html [dir]"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show index contents and pending failures"; }
    std::string get_usage() const override { return "mediaharvest status"; }
};

} // namespace mediaharvest::core
